#include <mica/sema.hh>
#include <mica/detail/defer.hh>
#include <mica/sema/operators.hh>

namespace mica::sema {
namespace {
/// A declaration visible in some scope.
struct Visible {
    Resolution target;
    Location location;
};

class Resolver {
    using Scope = StringMap<Visible>;

    std::vector<SemanticError> errors;

    /// Innermost scope last. The first scope is the module scope.
    std::vector<Scope> scopes;

    /// Counter for local declaration ids.
    usz local_counter = 0;

public:
    static auto Resolve(const Module& mod) -> StageResult {
        Resolver r;
        auto out = r.ResolveModule(mod);
        if (not r.errors.empty()) return std::move(r.errors);
        return out;
    }

private:
    auto LocalId(std::string_view name) -> std::string {
        return fmt::format("{}.{}", name, local_counter++);
    }

    auto Lookup(std::string_view name) const -> std::optional<Resolution> {
        for (const auto& scope : scopes | vws::reverse) {
            if (auto it = scope.find(name); it != scope.end()) return it->second.target;
        }
        return std::nullopt;
    }

    /// Enter a scope for the duration of a callback.
    template <typename Callback>
    auto Scoped(Callback cb) {
        scopes.emplace_back();
        defer { scopes.pop_back(); };
        return cb();
    }

    /// Declare a name in the innermost scope. Redeclaring a name in the
    /// same local scope is an error.
    void Declare(std::string_view name, Resolution target, Location where) {
        auto [it, inserted] = scopes.back().try_emplace(std::string{name}, Visible{std::move(target), where});
        if (not inserted) errors.push_back(
            {DuplicateName{std::string{name}, it->second.location, where}, Stage::ReferenceResolver}
        );
    }

    auto DeclareParams(const std::vector<Param>& params) -> std::vector<Param> {
        std::vector<Param> out;
        for (auto p : params) {
            p.id = LocalId(p.name);
            scopes.back().try_emplace(p.name, Visible{{Resolution::Kind::Parameter, p.id}, p.location});
            out.push_back(std::move(p));
        }
        return out;
    }

    auto ResolveModule(const Module& mod) -> Module {
        scopes.emplace_back();

        /// Module scope is visible everywhere in the module, regardless
        /// of declaration order. Operators resolve by name; the rewriter
        /// picks the prefix or infix declaration.
        for (const auto& m : mod.members) {
            if (m.is<FnDef>()) {
                const auto& f = m.as<FnDef>();
                scopes.front().try_emplace(f.name, Visible{{Resolution::Kind::Function, f.name}, f.location});
            } else if (m.is<Binding>()) {
                const auto& b = m.as<Binding>();
                scopes.front().try_emplace(b.name, Visible{{Resolution::Kind::Binding, b.name}, b.location});
            } else if (m.is<OperatorDef>()) {
                const auto& o = m.as<OperatorDef>();
                scopes.front().try_emplace(o.name, Visible{{Resolution::Kind::Operator, o.name}, o.location});
            }
        }

        Module out{mod.name, mod.visibility, {}, mod.source_path};
        for (const auto& m : mod.members) out.members.push_back(ResolveMember(m));
        return out;
    }

    auto ResolveMember(const Member& m) -> Member {
        return std::visit(
            Overloaded{
                [&](FnDef f) -> Member {
                    f.id = f.name;
                    Scoped([&] {
                        f.params = DeclareParams(f.params);
                        f.body = ResolveExpr(f.body);
                    });
                    return f;
                },
                [&](Binding b) -> Member {
                    b.id = b.name;
                    b.value = ResolveExpr(b.value);
                    return b;
                },
                [&](OperatorDef o) -> Member {
                    o.id = OperatorId(o.name, o.arity);
                    Scoped([&] {
                        o.params = DeclareParams(o.params);
                        if (o.body) o.body = ResolveExpr(*o.body);
                    });
                    return o;
                },
                [](Protocol p) -> Member { return p; },
                [](TypeDef t) -> Member { return t; },
                [](Comment c) -> Member { return c; },
                [](MemberError e) -> Member { return e; },
            },
            m.node
        );
    }

    auto ResolveExpr(const Expr& e) -> Expr {
        Expr out{e.location, {}, e.type};
        for (const auto& t : e.terms) out.terms.push_back(ResolveTerm(t));
        return out;
    }

    auto ResolveTerm(const Term& t) -> Term {
        return std::visit(
            Overloaded{
                [&](Ref r) -> Term {
                    r.target = Lookup(r.name);
                    if (not r.target) errors.push_back({UnresolvedRef{r.name, r.location}, Stage::ReferenceResolver});
                    return r;
                },
                [&](Expr e) -> Term { return ResolveExpr(e); },
                [&](App a) -> Term {
                    a.fn = std::make_shared<const Term>(ResolveTerm(*a.fn));
                    a.arg = std::make_shared<const Term>(ResolveTerm(*a.arg));
                    return a;
                },
                [&](Cond c) -> Term {
                    c.cond = ResolveExpr(c.cond);
                    c.if_true = ResolveExpr(c.if_true);
                    c.if_false = ResolveExpr(c.if_false);
                    return c;
                },
                [&](Lambda l) -> Term {
                    Scoped([&] {
                        l.params = DeclareParams(l.params);
                        l.body = ResolveExpr(l.body);
                    });
                    return l;
                },
                [&](Block b) -> Term {
                    /// A binding sees the bindings before it, but not itself.
                    Scoped([&] {
                        for (auto& let : b.bindings) {
                            let.value = ResolveExpr(let.value);
                            let.id = LocalId(let.name);
                            Declare(let.name, {Resolution::Kind::Local, let.id}, let.location);
                        }
                        b.result = ResolveExpr(b.result);
                    });
                    return b;
                },
                [](Literal l) -> Term { return l; },
                [](Hole h) -> Term { return h; },
            },
            t.node
        );
    }
};
} // namespace

auto ResolveReferences(const Module& mod) -> StageResult {
    return Resolver::Resolve(mod);
}
} // namespace mica::sema
