#include <mica/sema.hh>

#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace mica::sema {
namespace {
class TypeResolver {
    enum struct State {
        Pending,
        InProgress,
        Done,
    };

    /// A top-level binding. Bindings are inferred when they are first
    /// referenced, or in declaration order otherwise.
    struct BindingInfo {
        usz index;
        State state = State::Pending;
    };

    const Module& mod;
    std::vector<SemanticError> errors;

    /// Typed members, by index.
    std::vector<std::optional<Member>> typed;

    /// Types of all declarations, by id.
    StringMap<Type> declarations;

    /// Ids of declarations whose type variables are instantiated
    /// afresh at every reference.
    std::unordered_set<std::string, detail::StringHash, std::equal_to<>> generic;

    StringMap<BindingInfo> bindings;

    /// Names that may appear in annotations.
    std::unordered_set<std::string, detail::StringHash, std::equal_to<>> known_types{"Int", "Float", "String", "Bool", "Unit"};

    std::unordered_map<usz, Type> substitution;
    usz next_variable = 0;

    explicit TypeResolver(const Module& m) : mod(m), typed(m.members.size()) {
        for (const auto& member : m.members)
            if (member.is<TypeDef>()) known_types.insert(member.as<TypeDef>().name);
    }

public:
    static auto Resolve(const Module& mod) -> StageResult {
        TypeResolver r{mod};
        r.Seed();
        for (usz i = 0; i < mod.members.size(); i++) r.CheckMember(i);
        if (not r.errors.empty()) return std::move(r.errors);

        Module out{mod.name, mod.visibility, {}, mod.source_path};
        for (auto& m : r.typed) out.members.push_back(r.ZonkMember(*m));
        return out;
    }

private:
    /// =======================================================================
    ///  Unification
    /// =======================================================================
    auto Fresh() -> Type { return Type::Variable(next_variable++); }

    /// Follow variable bindings at the top level of a type.
    auto Prune(const Type& t) const -> Type {
        auto cur = t;
        while (cur.is_variable()) {
            auto it = substitution.find(cur.variable());
            if (it == substitution.end()) break;
            cur = it->second;
        }
        return cur;
    }

    /// Substitute all bound variables in a type.
    auto Apply(const Type& t) const -> Type {
        auto p = Prune(t);
        if (not p.is_function()) return p;
        std::vector<Type> params;
        for (const auto& param : p.params()) params.push_back(Apply(param));
        return Type::Function(std::move(params), Apply(p.result()));
    }

    auto Bind(usz variable, const Type& t) -> bool {
        if (t.is_variable() and t.variable() == variable) return true;
        if (Apply(t).mentions(variable)) return false;
        substitution.insert_or_assign(variable, t);
        return true;
    }

    /// Function types are compared one parameter at a time, so that
    /// (A, B) -> R and A -> (B -> R) are the same type.
    auto Unify(const Type& a, const Type& b) -> bool {
        auto x = Prune(a);
        auto y = Prune(b);
        if (x.is_variable()) return Bind(x.variable(), y);
        if (y.is_variable()) return Bind(y.variable(), x);
        if (x.is_named() and y.is_named()) return x.name() == y.name();
        if (x.is_function() and y.is_function()) {
            return Unify(x.params().front(), y.params().front()) and Unify(x.applied(), y.applied());
        }
        return false;
    }

    /// Replace the type variables of a generic signature with fresh ones.
    auto Instantiate(const Type& t) -> Type {
        std::unordered_map<usz, Type> fresh;
        const auto Go = [&](const auto& self, const Type& ty) -> Type {
            if (ty.is_variable()) {
                if (auto it = fresh.find(ty.variable()); it != fresh.end()) return it->second;
                auto v = Fresh();
                fresh.insert_or_assign(ty.variable(), v);
                return v;
            }
            if (not ty.is_function()) return ty;
            std::vector<Type> params;
            for (const auto& p : ty.params()) params.push_back(self(self, p));
            return Type::Function(std::move(params), self(self, ty.result()));
        };
        return Go(Go, t);
    }

    void Error(TypeError err) {
        errors.push_back({TypeCheckingError{std::move(err)}, Stage::TypeResolver});
    }

    /// Require \p actual to be \p expected.
    void Expect(const Type& expected, const Type& actual, Location where) {
        if (not Unify(expected, actual)) Error(TypeMismatch{where, Apply(expected), Apply(actual)});
    }

    /// =======================================================================
    ///  Declarations
    /// =======================================================================
    /// Report every name in an annotation that does not denote a type.
    void CheckAnnotation(const std::optional<Type>& annotation, Location where) {
        if (not annotation) return;
        const auto Go = [&](const auto& self, const Type& t) -> void {
            if (t.is_named() and not known_types.contains(t.name())) Error(UndefinedType{where, t.name()});
            if (not t.is_function()) return;
            for (const auto& p : t.params()) self(self, p);
            self(self, t.result());
        };
        Go(Go, *annotation);
    }

    /// Build a signature from parameters and a return type, and record
    /// the parameter types.
    auto Signature(const std::vector<Param>& params, const std::optional<Type>& return_type, Location where) -> Type {
        CheckAnnotation(return_type, where);
        std::vector<Type> param_types;
        for (const auto& p : params) {
            CheckAnnotation(p.annotation, p.location);
            auto t = p.annotation ? *p.annotation : Fresh();
            declarations.insert_or_assign(p.id, t);
            param_types.push_back(std::move(t));
        }

        /// A function without parameters takes unit.
        if (param_types.empty()) param_types.push_back(Type::Unit());
        return Type::Function(std::move(param_types), return_type ? *return_type : Fresh());
    }

    void Seed() {
        for (usz i = 0; i < mod.members.size(); i++) {
            const auto& m = mod.members[i];
            if (m.is<FnDef>()) {
                const auto& f = m.as<FnDef>();
                declarations.insert_or_assign(f.id, Signature(f.params, f.return_type, f.location));
            } else if (m.is<Binding>()) {
                const auto& b = m.as<Binding>();
                bindings.insert_or_assign(b.id, BindingInfo{i});
                CheckAnnotation(b.annotation, b.location);
                if (b.annotation) declarations.insert_or_assign(b.id, *b.annotation);
            } else if (m.is<OperatorDef>()) {
                const auto& o = m.as<OperatorDef>();
                if (o.builtin or (o.type and o.params.empty())) {
                    declarations.insert_or_assign(o.id, *o.type);
                    generic.insert(o.id);
                } else if (o.params.empty()) {
                    /// A declaration without parameters only fixes the arity.
                    std::vector<Type> params;
                    for (int n = 0; n < std::to_underlying(o.arity); n++) params.push_back(Fresh());
                    declarations.insert_or_assign(o.id, Type::Function(std::move(params), Fresh()));
                } else {
                    declarations.insert_or_assign(o.id, Signature(o.params, o.return_type, o.location));
                }
            }
        }
    }

    /// Get the type of a top-level binding, inferring it if need be.
    auto BindingType(const std::string& id, Location where) -> Type {
        auto it = bindings.find(id);
        if (it == bindings.end()) return Fresh();
        switch (it->second.state) {
            case State::Done: return declarations.at(id);
            case State::Pending:
                InferBinding(it->second);
                return declarations.at(id);
            case State::InProgress:
                if (auto decl = declarations.find(id); decl != declarations.end()) return decl->second;
                Error(UnresolvableType{where, fmt::format("binding '{}', which depends on itself", id)});
                return Fresh();
        }
        MICA_UNREACHABLE();
    }

    void InferBinding(BindingInfo& info) {
        auto b = mod.members[info.index].as<Binding>();
        info.state = State::InProgress;
        b.value = InferExpr(b.value, b.annotation);
        if (b.annotation) Expect(*b.annotation, *b.value.type, b.value.location);
        else declarations.insert_or_assign(b.id, *b.value.type);
        b.type = declarations.at(b.id);
        typed[info.index] = std::move(b);
        info.state = State::Done;
    }

    void CheckMember(usz index) {
        if (typed[index]) return;
        const auto& m = mod.members[index];
        std::visit(
            Overloaded{
                [&](FnDef f) {
                    f.type = declarations.at(f.id);
                    const auto ret = f.type->result();
                    f.body = InferExpr(f.body, Apply(ret));
                    Expect(ret, *f.body.type, f.body.location);
                    typed[index] = std::move(f);
                },
                [&](const Binding& b) { InferBinding(bindings.at(b.id)); },
                [&](OperatorDef o) {
                    o.type = declarations.at(o.id);
                    if (o.body) {
                        const auto ret = o.type->result();
                        o.body = InferExpr(*o.body, Apply(ret));
                        Expect(ret, *o.body->type, o.body->location);
                    }
                    typed[index] = std::move(o);
                },
                [&](const Protocol& p) { typed[index] = p; },
                [&](const TypeDef& t) { typed[index] = t; },
                [&](const Comment& c) { typed[index] = c; },
                [&](const MemberError& e) { typed[index] = e; },
            },
            m.node
        );
    }

    /// =======================================================================
    ///  Inference
    /// =======================================================================
    auto InferExpr(const Expr& e, const std::optional<Type>& expected) -> Expr {
        Expr out{e.location, {}, e.type};
        for (usz i = 0; i < e.terms.size(); i++) {
            const bool last = i == e.terms.size() - 1;
            out.terms.push_back(Infer(e.terms[i], last ? expected : std::nullopt));
        }
        out.type = out.terms.empty() ? Type::Unit() : *out.terms.back().type();
        return out;
    }

    /// Strip single-term wrappers to find the term that is applied.
    static auto Callee(const Term& t) -> const Term& {
        if (t.is<Expr>() and t.as<Expr>().terms.size() == 1) return Callee(t.as<Expr>().terms.front());
        return t;
    }

    auto Infer(const Term& t, const std::optional<Type>& expected) -> Term {
        return std::visit(
            Overloaded{
                [&](Ref r) -> Term {
                    if (not r.target) {
                        r.type = Fresh();
                        return r;
                    }

                    if (r.target->kind == Resolution::Kind::Binding) {
                        r.type = BindingType(r.target->id, r.location);
                        return r;
                    }

                    auto decl = declarations.find(r.target->id);
                    if (decl == declarations.end()) r.type = Fresh();
                    else if (generic.contains(r.target->id)) r.type = Instantiate(decl->second);
                    else r.type = decl->second;
                    return r;
                },
                [&](Literal l) -> Term {
                    switch (l.kind()) {
                        case Literal::Kind::Unit: l.type = Type::Unit(); break;
                        case Literal::Kind::Bool: l.type = Type::Bool(); break;
                        case Literal::Kind::Int: l.type = Type::Int(); break;
                        case Literal::Kind::Float: l.type = Type::Float(); break;
                        case Literal::Kind::String: l.type = Type::String(); break;
                    }
                    return l;
                },
                [&](Hole h) -> Term {
                    /// A bare type variable is what an unannotated return
                    /// or parameter contributes; it determines nothing.
                    if (expected and not Prune(*expected).is_variable()) {
                        h.type = Apply(*expected);
                    } else {
                        Error(UnresolvableType{h.location, "hole"});
                        h.type = Fresh();
                    }
                    return h;
                },
                [&](const Expr& e) -> Term { return InferExpr(e, expected); },
                [&](App a) -> Term {
                    auto fn = Infer(*a.fn, std::nullopt);
                    auto fn_type = Prune(*fn.type());
                    Type result = Fresh();

                    if (fn_type.is_function()) {
                        auto arg = Infer(*a.arg, Apply(fn_type.params().front()));
                        Expect(fn_type.params().front(), *arg.type(), arg.location());
                        result = fn_type.applied();
                        a.arg = std::make_shared<const Term>(std::move(arg));
                    } else if (fn_type.is_variable()) {
                        auto arg = Infer(*a.arg, std::nullopt);
                        auto applied_as = Type::Function({*arg.type()}, result);
                        if (not Unify(fn_type, applied_as)) {
                            Error(TypeMismatch{Callee(fn).location(), Apply(fn_type), Apply(applied_as)});
                        }
                        a.arg = std::make_shared<const Term>(std::move(arg));
                    } else {
                        const auto& callee = Callee(fn);
                        const bool named = callee.is<Ref>();
                        Error(InvalidApplication{
                            callee.location(),
                            InvalidApplication::Reason::NotAFunction,
                            named ? callee.as<Ref>().name : Sexpr(callee),
                            named,
                            Apply(fn_type),
                        });
                        a.arg = std::make_shared<const Term>(Infer(*a.arg, std::nullopt));
                    }

                    a.fn = std::make_shared<const Term>(std::move(fn));
                    a.type = result;
                    return a;
                },
                [&](Cond c) -> Term {
                    c.cond = InferExpr(c.cond, Type::Bool());
                    Expect(Type::Bool(), *c.cond.type, c.cond.location);
                    c.if_true = InferExpr(c.if_true, expected);
                    c.if_false = InferExpr(c.if_false, expected ? expected : c.if_true.type);
                    if (not Unify(*c.if_true.type, *c.if_false.type)) {
                        Error(ConditionalBranchMismatch{c.location, Apply(*c.if_true.type), Apply(*c.if_false.type)});
                    }
                    c.type = c.if_true.type;
                    return c;
                },
                [&](Lambda l) -> Term {
                    auto sig = Signature(l.params, std::nullopt, l.location);
                    l.body = InferExpr(l.body, std::nullopt);
                    Expect(sig.result(), *l.body.type, l.body.location);
                    l.type = sig;
                    return l;
                },
                [&](Block b) -> Term {
                    for (auto& let : b.bindings) {
                        CheckAnnotation(let.annotation, let.location);
                        let.value = InferExpr(let.value, let.annotation);
                        if (let.annotation) Expect(*let.annotation, *let.value.type, let.value.location);
                        declarations.insert_or_assign(let.id, let.annotation ? *let.annotation : *let.value.type);
                    }
                    b.result = InferExpr(b.result, expected);
                    b.type = b.result.type;
                    return b;
                },
            },
            t.node
        );
    }

    /// =======================================================================
    ///  Substitution
    /// =======================================================================
    void ZonkType(std::optional<Type>& t) {
        if (t) t = Apply(*t);
    }

    auto ZonkExpr(Expr e) -> Expr {
        ZonkType(e.type);
        for (auto& t : e.terms) t = ZonkTerm(t);
        return e;
    }

    auto ZonkTerm(const Term& term) -> Term {
        auto t = term;
        std::visit(
            Overloaded{
                [&](Expr& e) { e = ZonkExpr(std::move(e)); },
                [&](App& a) {
                    ZonkType(a.type);
                    a.fn = std::make_shared<const Term>(ZonkTerm(*a.fn));
                    a.arg = std::make_shared<const Term>(ZonkTerm(*a.arg));
                },
                [&](Cond& c) {
                    ZonkType(c.type);
                    c.cond = ZonkExpr(std::move(c.cond));
                    c.if_true = ZonkExpr(std::move(c.if_true));
                    c.if_false = ZonkExpr(std::move(c.if_false));
                },
                [&](Lambda& l) {
                    ZonkType(l.type);
                    l.body = ZonkExpr(std::move(l.body));
                },
                [&](Block& b) {
                    ZonkType(b.type);
                    for (auto& let : b.bindings) let.value = ZonkExpr(std::move(let.value));
                    b.result = ZonkExpr(std::move(b.result));
                },
                [&](auto& leaf) { ZonkType(leaf.type); },
            },
            t.node
        );
        return t;
    }

    auto ZonkMember(Member m) -> Member {
        std::visit(
            Overloaded{
                [&](FnDef& f) {
                    ZonkType(f.type);
                    f.body = ZonkExpr(std::move(f.body));
                },
                [&](Binding& b) {
                    ZonkType(b.type);
                    b.value = ZonkExpr(std::move(b.value));
                },
                [&](OperatorDef& o) {
                    if (o.builtin) return;
                    ZonkType(o.type);
                    if (o.body) o.body = ZonkExpr(std::move(*o.body));
                },
                [](auto&) {},
            },
            m.node
        );
        return m;
    }
};
} // namespace

auto ResolveTypes(const Module& mod) -> StageResult {
    return TypeResolver::Resolve(mod);
}
} // namespace mica::sema
