#include <mica/sema.hh>
#include <mica/sema/operators.hh>

namespace mica::sema {
namespace {
auto Builtin(std::string name, Arity arity, i32 precedence, Associativity assoc, Type type) -> OperatorDef {
    OperatorDef op{};
    op.id = OperatorId(name, arity);
    op.name = std::move(name);
    op.arity = arity;
    op.precedence = precedence;
    op.associativity = assoc;
    op.type = std::move(type);
    op.builtin = true;
    return op;
}

auto MakeBuiltins() -> std::vector<OperatorDef> {
    using enum Associativity;
    const auto Int = Type::Int();
    const auto Bool = Type::Bool();
    const auto IntOp = Type::Function({Int, Int}, Int);
    const auto IntCmp = Type::Function({Int, Int}, Bool);
    const auto Equality = Type::Function({Type::Variable(0), Type::Variable(0)}, Bool);
    const auto Logical = Type::Function({Bool, Bool}, Bool);

    return {
        Builtin("*", Arity::Binary, 80, Left, IntOp),
        Builtin("/", Arity::Binary, 80, Left, IntOp),
        Builtin("%", Arity::Binary, 80, Left, IntOp),
        Builtin("+", Arity::Binary, 60, Left, IntOp),
        Builtin("-", Arity::Binary, 60, Left, IntOp),
        Builtin("<<", Arity::Binary, 55, Left, IntOp),
        Builtin(">>", Arity::Binary, 55, Left, IntOp),
        Builtin("==", Arity::Binary, 50, Left, Equality),
        Builtin("!=", Arity::Binary, 50, Left, Equality),
        Builtin("<", Arity::Binary, 50, Left, IntCmp),
        Builtin(">", Arity::Binary, 50, Left, IntCmp),
        Builtin("<=", Arity::Binary, 50, Left, IntCmp),
        Builtin(">=", Arity::Binary, 50, Left, IntCmp),
        Builtin("and", Arity::Binary, 40, Left, Logical),
        Builtin("or", Arity::Binary, 30, Left, Logical),
        Builtin("-", Arity::Unary, 95, Right, Type::Function({Int}, Int)),
        Builtin("+", Arity::Unary, 95, Right, Type::Function({Int}, Int)),
        Builtin("not", Arity::Unary, 95, Right, Type::Function({Bool}, Bool)),
    };
}
} // namespace

auto BuiltinOperators() -> const std::vector<OperatorDef>& {
    static const auto builtins = MakeBuiltins();
    return builtins;
}

auto OperatorId(std::string_view name, Arity arity) -> std::string {
    return fmt::format("{}/{}", name, std::to_underlying(arity));
}

OperatorTable::OperatorTable(const Module& mod) {
    for (const auto& m : mod.members) {
        if (not m.is<OperatorDef>()) continue;
        const auto& op = m.as<OperatorDef>();
        auto& entry = entries[op.name];
        auto& slot = op.arity == Arity::Unary ? entry.prefix : entry.infix;
        if (not slot) slot = &op;
    }
}

auto OperatorTable::prefix(std::string_view name) const -> const OperatorDef* {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : it->second.prefix;
}

auto OperatorTable::infix(std::string_view name) const -> const OperatorDef* {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : it->second.infix;
}

auto RegisterOperators(const Module& mod) -> StageResult {
    std::vector<SemanticError> errors;
    std::vector<Member> members;

    /// Hoist protocol operators. The protocol itself stays as a
    /// marker without operators.
    for (const auto& m : mod.members) {
        if (not m.is<Protocol>()) {
            members.push_back(m);
            continue;
        }

        auto proto = m.as<Protocol>();
        auto ops = std::move(proto.operators);
        proto.operators.clear();
        members.emplace_back(std::move(proto));
        for (auto& op : ops) members.emplace_back(std::move(op));
    }

    /// An operator name and arity must map to exactly one fixity.
    StringMap<const OperatorDef*> declared;
    for (const auto& m : members) {
        if (not m.is<OperatorDef>()) continue;
        const auto& op = m.as<OperatorDef>();
        auto [it, inserted] = declared.try_emplace(OperatorId(op.name, op.arity), &op);
        if (not inserted and not it->second->same_fixity(op)) errors.push_back(
            {DuplicateName{op.name, it->second->location, op.location}, Stage::OperatorRegistry}
        );
    }

    /// Merge with the builtins. A user operator that only restates a
    /// builtin's fixity is dropped in favour of the builtin.
    std::vector<Member> injected;
    StringMap<bool> drop_declaration;
    for (const auto& builtin : BuiltinOperators()) {
        auto it = declared.find(builtin.id);
        if (it == declared.end()) {
            injected.emplace_back(builtin);
            continue;
        }

        const auto* op = it->second;
        if (op->builtin) continue;
        if (not op->same_fixity(builtin)) {
            errors.push_back({DuplicateName{op->name, Location{}, op->location}, Stage::OperatorRegistry});
            continue;
        }

        if (not op->body) {
            injected.emplace_back(builtin);
            drop_declaration[builtin.id] = true;
        }
    }

    if (not errors.empty()) return errors;

    Module out{mod.name, mod.visibility, std::move(injected), mod.source_path};
    for (auto& m : members) {
        if (m.is<OperatorDef>()) {
            const auto& op = m.as<OperatorDef>();
            if (not op.builtin and drop_declaration.contains(OperatorId(op.name, op.arity))) continue;
        }
        out.members.push_back(std::move(m));
    }
    return out;
}
} // namespace mica::sema
