#include <mica/sema.hh>

namespace mica::sema {
namespace {
auto SimplifyExpr(const Expr& e) -> Expr;

/// Replace a single-term expression with its term. The term takes over
/// the span of the wrapper, and its type if it has none.
auto SimplifyTerm(const Term& t) -> Term {
    return std::visit(
        Overloaded{
            [](const Expr& e) -> Term {
                auto simplified = SimplifyExpr(e);
                if (simplified.terms.size() != 1) return simplified;
                auto inner = std::move(simplified.terms.front());
                inner = inner.with_location(Location{simplified.location, inner.location()});
                if (not inner.type() and simplified.type) inner = inner.with_type(*simplified.type);
                return inner;
            },
            [](App a) -> Term {
                a.fn = std::make_shared<const Term>(SimplifyTerm(*a.fn));
                a.arg = std::make_shared<const Term>(SimplifyTerm(*a.arg));
                return a;
            },
            [](Cond c) -> Term {
                c.cond = SimplifyExpr(c.cond);
                c.if_true = SimplifyExpr(c.if_true);
                c.if_false = SimplifyExpr(c.if_false);
                return c;
            },
            [](Lambda l) -> Term {
                l.body = SimplifyExpr(l.body);
                return l;
            },
            [](Block b) -> Term {
                for (auto& let : b.bindings) let.value = SimplifyExpr(let.value);
                b.result = SimplifyExpr(b.result);
                return b;
            },
            [](const Ref& r) -> Term { return r; },
            [](const Literal& l) -> Term { return l; },
            [](const Hole& h) -> Term { return h; },
        },
        t.node
    );
}

/// Expressions in expression slots stay, but an expression that only
/// holds another expression is flattened.
auto SimplifyExpr(const Expr& e) -> Expr {
    Expr out{e.location, {}, e.type};
    for (const auto& t : e.terms) out.terms.push_back(SimplifyTerm(t));
    while (out.terms.size() == 1 and out.terms.front().is<Expr>()) {
        auto inner = std::move(out.terms.front().as<Expr>());
        out.terms = std::move(inner.terms);
        if (not out.type) out.type = inner.type;
    }
    return out;
}

auto SimplifyMember(const Member& m) -> Member {
    return std::visit(
        Overloaded{
            [](FnDef f) -> Member {
                f.body = SimplifyExpr(f.body);
                return f;
            },
            [](Binding b) -> Member {
                b.value = SimplifyExpr(b.value);
                return b;
            },
            [](OperatorDef o) -> Member {
                if (o.body) o.body = SimplifyExpr(*o.body);
                return o;
            },
            [](const auto& other) -> Member { return other; },
        },
        m.node
    );
}
} // namespace

auto Simplify(const Module& mod) -> StageResult {
    Module out{mod.name, mod.visibility, {}, mod.source_path};
    for (const auto& m : mod.members) out.members.push_back(SimplifyMember(m));
    return out;
}

auto CheckMemberErrors(const Module& mod) -> StageResult {
    for (const auto& m : mod.members) {
        if (not m.is<MemberError>()) continue;
        const auto& e = m.as<MemberError>();
        return std::vector<SemanticError>{
            {MemberErrorPresent{e.location, e.message, e.failed_source}, Stage::MemberErrors},
        };
    }
    return mod;
}
} // namespace mica::sema
