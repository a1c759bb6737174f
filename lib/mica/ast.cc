#include <mica/ast.hh>
#include <mica/utils/ast_printer.hh>

#include <fmt/ranges.h>

namespace mica {
auto Term::location() const -> Location {
    return std::visit([](const auto& n) { return n.location; }, node);
}

auto Term::type() const -> const std::optional<Type>& {
    return std::visit([](const auto& n) -> const std::optional<Type>& { return n.type; }, node);
}

auto Term::with_location(Location loc) const -> Term {
    auto copy = *this;
    std::visit([&](auto& n) { n.location = loc; }, copy.node);
    return copy;
}

auto Term::with_type(Type t) const -> Term {
    auto copy = *this;
    std::visit([&](auto& n) { n.type = std::move(t); }, copy.node);
    return copy;
}

auto Member::location() const -> Location {
    return std::visit([](const auto& n) { return n.location; }, node);
}

auto Member::name() const -> std::optional<std::string_view> {
    using Name = std::optional<std::string_view>;
    return std::visit(
        Overloaded{
            [](const FnDef& f) -> Name { return f.name; },
            [](const Binding& b) -> Name { return b.name; },
            [](const OperatorDef& o) -> Name { return o.name; },
            [](const Protocol& p) -> Name { return p.name; },
            [](const TypeDef& t) -> Name { return t.name; },
            [](const Comment&) -> Name { return std::nullopt; },
            [](const MemberError&) -> Name { return std::nullopt; },
        },
        node
    );
}

auto Module::find(std::string_view name) const -> const Member* {
    for (const auto& m : members) {
        if (not m.is<FnDef>() and not m.is<Binding>()) continue;
        if (m.name() == name) return &m;
    }
    return nullptr;
}

/// ===========================================================================
///  S-expressions
/// ===========================================================================
namespace {
auto LiteralSexpr(const Literal& l) -> std::string {
    return std::visit(
        Overloaded{
            [](std::monostate) -> std::string { return "(unit)"; },
            [](bool b) { return fmt::format("(bool {})", b); },
            [](i64 i) { return fmt::format("(int {})", i); },
            [](f64 f) { return fmt::format("(float {})", f); },
            [](const std::string& s) { return fmt::format("(str \"{}\")", s); },
        },
        l.value
    );
}

auto ParamNames(const std::vector<Param>& params) -> std::string {
    std::vector<std::string_view> names;
    for (const auto& p : params) names.push_back(p.name);
    return fmt::format("({})", fmt::join(names, " "));
}
} // namespace

auto Sexpr(const Expr& e) -> std::string {
    std::string out{"(expr"};
    for (const auto& t : e.terms) out += fmt::format(" {}", Sexpr(t));
    return out + ")";
}

auto Sexpr(const Term& t) -> std::string {
    return std::visit(
        Overloaded{
            [](const Ref& r) { return fmt::format("(ref {})", r.name); },
            [](const Literal& l) { return LiteralSexpr(l); },
            [](const Hole&) -> std::string { return "(hole)"; },
            [](const Expr& e) { return Sexpr(e); },
            [](const App& a) { return fmt::format("(app {} {})", Sexpr(*a.fn), Sexpr(*a.arg)); },
            [](const Cond& c) {
                return fmt::format("(cond {} {} {})", Sexpr(c.cond), Sexpr(c.if_true), Sexpr(c.if_false));
            },
            [](const Lambda& l) { return fmt::format("(lambda {} {})", ParamNames(l.params), Sexpr(l.body)); },
            [](const Block& b) {
                std::string out{"(block"};
                for (const auto& let : b.bindings) out += fmt::format(" (let {} {})", let.name, Sexpr(let.value));
                return out + fmt::format(" {})", Sexpr(b.result));
            },
        },
        t.node
    );
}

/// ===========================================================================
///  Tree printer
/// ===========================================================================
namespace {
struct ModulePrinter : utils::ASTPrinter<ModulePrinter> {
    using Child = std::variant<const Member*, const Term*, const Expr*, const LocalBinding*, const Param*>;

    static constexpr utils::Colour id_colour{utils::Colour::Magenta};
    static constexpr utils::Colour value_colour{utils::Colour::Yellow};

    using ASTPrinter::ASTPrinter;

    auto Id(std::string_view id) -> std::string {
        if (id.empty()) return "";
        return fmt::format(" {}#{}", C(id_colour), id);
    }

    void PrintParamsAndBody(const std::vector<Param>& params, const Expr* body, std::string leading_text) {
        std::vector<Child> children;
        for (const auto& p : params) children.emplace_back(&p);
        if (body) children.emplace_back(body);
        PrintChildren(children, std::move(leading_text));
    }

    void PrintMember(const Member& m, std::string leading_text) {
        std::visit(
            Overloaded{
                [&](const FnDef& f) {
                    PrintBasicHeader(fmt::format("FnDef {}", f.name), f.location);
                    out += Id(f.id);
                    PrintType(f.type);
                    PrintParamsAndBody(f.params, &f.body, leading_text);
                },
                [&](const Binding& b) {
                    PrintBasicHeader(fmt::format("Binding {}", b.name), b.location);
                    out += Id(b.id);
                    PrintType(b.type);
                    std::vector<Child> children{&b.value};
                    PrintChildren(children, leading_text);
                },
                [&](const OperatorDef& o) {
                    PrintBasicHeader(
                        fmt::format("OperatorDef {} {} {} {}", o.name, o.arity, o.precedence, o.associativity),
                        o.location
                    );
                    out += Id(o.id);
                    PrintType(o.type);
                    PrintParamsAndBody(o.params, o.body ? &*o.body : nullptr, leading_text);
                },
                [&](const Protocol& p) {
                    PrintBasicHeader(fmt::format("{} {}", p.instance ? "Instance" : "Protocol", p.name), p.location);
                    out += fmt::format("{}\n", C(Reset));
                },
                [&](const TypeDef& t) {
                    PrintBasicHeader(fmt::format("TypeDef {}", t.name), t.location);
                    out += std::visit(
                        Overloaded{
                            [&](const NativePrimitive& n) { return fmt::format(" {}{}", C(value_colour), n.spelling); },
                            [&](const NativePointer& n) { return fmt::format(" {}ptr {}", C(value_colour), n.pointee); },
                            [&](const NativeStruct& n) {
                                std::vector<std::string> fields;
                                for (const auto& f : n.fields) fields.push_back(fmt::format("{}: {}", f.name, f.type_name));
                                return fmt::format(" {}{{ {} }}", C(value_colour), fmt::join(fields, ", "));
                            },
                        },
                        t.native
                    );
                    out += fmt::format("{}\n", C(Reset));
                },
                [&](const Comment& c) {
                    PrintBasicHeader("Comment", c.location);
                    out += fmt::format(" {}{}{}\n", C(Faint), c.text, C(Reset));
                },
                [&](const MemberError& e) {
                    PrintBasicHeader("MemberError", e.location);
                    out += fmt::format(" {}{}{}\n", C(Red), e.message, C(Reset));
                },
            },
            m.node
        );
    }

    void PrintTerm(const Term& t, std::string leading_text) {
        std::visit(
            Overloaded{
                [&](const Ref& r) {
                    PrintBasicHeader(fmt::format("Ref {}", r.name), r.location);
                    if (r.target) out += fmt::format(" {}-> {} #{}", C(id_colour), r.target->kind, r.target->id);
                    PrintType(r.type);
                },
                [&](const Literal& l) {
                    PrintBasicHeader(fmt::format("Literal {}{}", C(value_colour), LiteralSexpr(l)), l.location);
                    PrintType(l.type);
                },
                [&](const Hole& h) {
                    PrintBasicHeader("Hole", h.location);
                    PrintType(h.type);
                },
                [&](const Expr& e) { PrintExpr(e, std::move(leading_text)); },
                [&](const App& a) {
                    PrintBasicHeader("App", a.location);
                    PrintType(a.type);
                    std::vector<Child> children{a.fn.get(), a.arg.get()};
                    PrintChildren(children, leading_text);
                },
                [&](const Cond& c) {
                    PrintBasicHeader("Cond", c.location);
                    PrintType(c.type);
                    std::vector<Child> children{&c.cond, &c.if_true, &c.if_false};
                    PrintChildren(children, leading_text);
                },
                [&](const Lambda& l) {
                    PrintBasicHeader("Lambda", l.location);
                    PrintType(l.type);
                    PrintParamsAndBody(l.params, &l.body, leading_text);
                },
                [&](const Block& b) {
                    PrintBasicHeader("Block", b.location);
                    PrintType(b.type);
                    std::vector<Child> children;
                    for (const auto& let : b.bindings) children.emplace_back(&let);
                    children.emplace_back(&b.result);
                    PrintChildren(children, leading_text);
                },
            },
            t.node
        );
    }

    void PrintExpr(const Expr& e, std::string leading_text) {
        PrintBasicNode("Expr", e.location, e.type);
        std::vector<Child> children;
        for (const auto& t : e.terms) children.emplace_back(&t);
        PrintChildren(children, std::move(leading_text));
    }

    void operator()(const Child& child, std::string leading_text) {
        std::visit(
            Overloaded{
                [&](const Member* m) { PrintMember(*m, std::move(leading_text)); },
                [&](const Term* t) { PrintTerm(*t, std::move(leading_text)); },
                [&](const Expr* e) { PrintExpr(*e, std::move(leading_text)); },
                [&](const LocalBinding* let) {
                    PrintBasicHeader(fmt::format("Let {}", let->name), let->location);
                    out += Id(let->id);
                    PrintType(let->value.type);
                    std::vector<Child> children{&let->value};
                    PrintChildren(children, std::move(leading_text));
                },
                [&](const Param* p) {
                    PrintBasicHeader(fmt::format("Param {}", p->name), p->location);
                    out += Id(p->id);
                    PrintType(p->annotation);
                },
            },
            child
        );
    }

    void print(const Module& mod) {
        out += fmt::format("{}Module {}{}\n", C(Bold), mod.name, C(Reset));
        std::vector<Child> children;
        for (const auto& m : mod.members) children.emplace_back(&m);
        PrintChildren(children, "");
    }
};
} // namespace

auto Module::tree(bool use_colour) const -> std::string {
    ModulePrinter p{use_colour};
    p.print(*this);
    return std::move(p.out);
}
} // namespace mica
