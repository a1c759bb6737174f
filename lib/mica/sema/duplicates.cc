#include <mica/sema.hh>
#include <mica/sema/operators.hh>

namespace mica::sema {
namespace {
class DuplicateChecker {
    std::vector<SemanticError> errors;

    /// Functions and bindings.
    StringMap<Location> values;

    /// Operators by name and by name and arity.
    StringMap<Location> operator_names;
    StringMap<Location> operators;

    StringMap<Location> types;

public:
    static auto Check(const Module& mod) -> std::vector<SemanticError> {
        DuplicateChecker c;
        for (const auto& m : mod.members) c.CheckMember(m);
        return std::move(c.errors);
    }

private:
    void Duplicate(std::string_view name, Location first, Location dup) {
        errors.push_back({DuplicateName{std::string{name}, first, dup}, Stage::DuplicateNames});
    }

    /// Record a name, or report it if it is already taken.
    ///
    /// \return False if the name was taken.
    bool Declare(StringMap<Location>& scope, std::string_view name, Location where) {
        auto [it, inserted] = scope.try_emplace(std::string{name}, where);
        if (not inserted) Duplicate(name, it->second, where);
        return inserted;
    }

    void CheckValue(std::string_view name, Location where) {
        if (not Declare(values, name, where)) return;
        if (auto op = operator_names.find(name); op != operator_names.end()) Duplicate(name, op->second, where);
    }

    void CheckParams(const std::vector<Param>& params) {
        StringMap<Location> seen;
        for (const auto& p : params) Declare(seen, p.name, p.location);
    }

    void CheckMember(const Member& m) {
        std::visit(
            Overloaded{
                [&](const FnDef& f) {
                    CheckValue(f.name, f.location);
                    CheckParams(f.params);
                    CheckExpr(f.body);
                },
                [&](const Binding& b) {
                    CheckValue(b.name, b.location);
                    CheckExpr(b.value);
                },
                [&](const OperatorDef& o) {
                    if (Declare(operators, OperatorId(o.name, o.arity), o.location)) {
                        if (auto v = values.find(o.name); v != values.end()) Duplicate(o.name, v->second, o.location);
                    }
                    operator_names.try_emplace(o.name, o.location);
                    CheckParams(o.params);
                    if (o.body) CheckExpr(*o.body);
                },
                [&](const TypeDef& t) { Declare(types, t.name, t.location); },
                [](const Protocol&) {},
                [](const Comment&) {},
                [](const MemberError&) {},
            },
            m.node
        );
    }

    /// Only parameter lists are checked below the top level. Local
    /// bindings are checked by the resolver.
    void CheckExpr(const Expr& e) {
        for (const auto& t : e.terms) CheckTerm(t);
    }

    void CheckTerm(const Term& t) {
        std::visit(
            Overloaded{
                [&](const Expr& e) { CheckExpr(e); },
                [&](const App& a) {
                    CheckTerm(*a.fn);
                    CheckTerm(*a.arg);
                },
                [&](const Cond& c) {
                    CheckExpr(c.cond);
                    CheckExpr(c.if_true);
                    CheckExpr(c.if_false);
                },
                [&](const Lambda& l) {
                    CheckParams(l.params);
                    CheckExpr(l.body);
                },
                [&](const Block& b) {
                    for (const auto& let : b.bindings) CheckExpr(let.value);
                    CheckExpr(b.result);
                },
                [](const Ref&) {},
                [](const Literal&) {},
                [](const Hole&) {},
            },
            t.node
        );
    }
};
} // namespace

auto CheckDuplicateNames(const Module& mod) -> StageResult {
    auto errors = DuplicateChecker::Check(mod);
    if (not errors.empty()) return errors;
    return mod;
}
} // namespace mica::sema
