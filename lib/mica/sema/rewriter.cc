#include <mica/sema.hh>
#include <mica/sema/operators.hh>

#include <limits>

namespace mica::sema {
namespace {
class Rewriter {
    const OperatorTable operators;

    /// Number of parameters of each function, by id.
    StringMap<usz> function_arity;

    std::vector<SemanticError> errors;

    explicit Rewriter(const Module& mod) : operators(mod) {
        for (const auto& m : mod.members) {
            if (not m.is<FnDef>()) continue;
            const auto& f = m.as<FnDef>();
            function_arity[f.id.empty() ? f.name : f.id] = f.params.size();
        }
    }

public:
    static auto Rewrite(const Module& mod) -> StageResult {
        Rewriter r{mod};
        Module out{mod.name, mod.visibility, {}, mod.source_path};
        for (const auto& m : mod.members) out.members.push_back(r.RewriteMember(m));
        if (not r.errors.empty()) return std::move(r.errors);
        return out;
    }

private:
    /// Precedence climbing over the terms of a single expression.
    class Climber {
        Rewriter& rw;
        std::span<const Term> terms;

    public:
        usz pos = 0;

        Climber(Rewriter& r, std::span<const Term> t) : rw(r), terms(t) {}

        [[nodiscard]] bool at_end() const { return pos >= terms.size(); }
        [[nodiscard]] auto current() const -> const Term& { return terms[pos]; }

        /// Parse operands joined by infix operators whose precedence is
        /// at least \p min_precedence.
        ///
        /// The right operand of a left-associative operator only takes
        /// operators that bind strictly tighter, so equal precedence
        /// groups to the left. A right-associative operator lets its
        /// right operand continue at the same precedence.
        auto ParseExpr(i64 min_precedence = std::numeric_limits<i64>::min()) -> Term {
            auto lhs = ParseOperand();

            while (not at_end()) {
                auto name = rw.OperatorName(current());
                if (not name) break;
                const auto* op = rw.operators.infix(*name);
                if (not op or op->precedence < min_precedence) break;

                const auto& op_term = terms[pos++];
                if (at_end()) {
                    rw.Error(InvalidApplication::Reason::MissingOperand, op_term);
                    return lhs;
                }

                const bool left = op->associativity == Associativity::Left;
                auto rhs = ParseExpr(left ? i64(op->precedence) + 1 : i64(op->precedence));
                lhs = rw.ApplyOperator(*op, op_term, {std::move(lhs), std::move(rhs)});
            }

            return lhs;
        }

        /// Parse a prefix operator application or a chain of function
        /// applications. Application binds tighter than any operator.
        auto ParseOperand() -> Term {
            if (auto name = rw.OperatorName(current())) {
                const auto& op_term = terms[pos++];
                const auto* op = rw.operators.prefix(*name);
                if (not op) {
                    rw.Error(InvalidApplication::Reason::MisplacedOperator, op_term);
                    return at_end() ? op_term : ParseOperand();
                }

                if (at_end()) {
                    rw.Error(InvalidApplication::Reason::MissingOperand, op_term);
                    return op_term;
                }

                auto operand = ParseOperand();
                return rw.ApplyOperator(*op, op_term, {std::move(operand)});
            }

            auto head = terms[pos++];
            bool applied = false;
            while (not at_end() and not rw.OperatorName(current())) {
                if (not applied and (head.is<Literal>() or head.is<Hole>())) {
                    rw.Error(InvalidApplication::Reason::LiteralApplied, head);
                }

                auto arg = rw.AutoApply(terms[pos++]);
                auto loc = Location{head.location(), arg.location()};
                head = App{loc, std::make_shared<const Term>(std::move(head)), Wrap(std::move(arg))};
                applied = true;
            }

            return applied ? head : rw.AutoApply(std::move(head));
        }
    };

    void Error(InvalidApplication::Reason reason, const Term& at) {
        const bool is_ref = at.is<Ref>();
        errors.push_back({
            TypeCheckingError{InvalidApplication{
                at.location(),
                reason,
                is_ref ? at.as<Ref>().name : Sexpr(at),
                is_ref,
            }},
            Stage::ExpressionRewriter,
        });
    }

    /// Get the operator name of a term, if it refers to an operator.
    auto OperatorName(const Term& t) const -> std::optional<std::string_view> {
        if (not t.is<Ref>()) return std::nullopt;
        const auto& r = t.as<Ref>();
        if (r.target) {
            if (r.target->kind != Resolution::Kind::Operator) return std::nullopt;
        } else if (not operators.contains(r.name)) {
            return std::nullopt;
        }
        return r.name;
    }

    /// Operands are wrapped in an expression; the simplifier removes
    /// the wrapper again.
    static auto Wrap(Term t) -> std::shared_ptr<const Term> {
        if (t.is<Expr>()) return std::make_shared<const Term>(std::move(t));
        auto loc = t.location();
        return std::make_shared<const Term>(Expr{loc, {std::move(t)}});
    }

    /// Apply a reference to a function without parameters to unit.
    auto AutoApply(Term t) const -> Term {
        if (not t.is<Ref>()) return t;
        const auto& r = t.as<Ref>();
        if (not r.target or r.target->kind != Resolution::Kind::Function) return t;
        auto it = function_arity.find(r.target->id);
        if (it == function_arity.end() or it->second != 0) return t;

        auto loc = r.location;
        Term unit = Literal{loc, std::monostate{}};
        return App{loc, std::make_shared<const Term>(std::move(t)), Wrap(std::move(unit))};
    }

    /// Build (op a) or ((op a) b), binding the reference to the
    /// declaration with the right arity.
    auto ApplyOperator(const OperatorDef& op, const Term& op_term, std::vector<Term> operands) -> Term {
        auto ref = op_term.as<Ref>();
        ref.target = Resolution{Resolution::Kind::Operator, op.id.empty() ? OperatorId(op.name, op.arity) : op.id};

        Term result = std::move(ref);
        for (auto& operand : operands) {
            auto loc = Location{result.location(), operand.location()};
            result = App{loc, std::make_shared<const Term>(std::move(result)), Wrap(std::move(operand))};
        }
        return result;
    }

    auto RewriteMember(const Member& m) -> Member {
        return std::visit(
            Overloaded{
                [&](FnDef f) -> Member {
                    f.body = RewriteExpr(f.body);
                    return f;
                },
                [&](Binding b) -> Member {
                    b.value = RewriteExpr(b.value);
                    return b;
                },
                [&](OperatorDef o) -> Member {
                    if (o.body) o.body = RewriteExpr(*o.body);
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

    auto RewriteExpr(const Expr& e) -> Expr {
        std::vector<Term> terms;
        for (const auto& t : e.terms) terms.push_back(RewriteNested(t));
        if (terms.empty()) return Expr{e.location, {}, e.type};

        Climber c{*this, terms};
        auto result = c.ParseExpr();

        /// Whatever is left starts with an operator that cannot continue
        /// the expression. Keep parsing to report errors in the rest.
        while (not c.at_end()) {
            Error(InvalidApplication::Reason::MisplacedOperator, c.current());
            c.pos++;
            if (not c.at_end()) (void) c.ParseExpr();
        }

        Expr out{e.location, {}, e.type};
        out.terms.push_back(std::move(result));
        return out;
    }

    /// Rewrite the expressions inside a term; the term itself is an
    /// opaque operand to the enclosing expression.
    auto RewriteNested(const Term& t) -> Term {
        return std::visit(
            Overloaded{
                [&](const Expr& e) -> Term { return RewriteExpr(e); },
                [&](App a) -> Term {
                    a.fn = std::make_shared<const Term>(RewriteNested(*a.fn));
                    a.arg = std::make_shared<const Term>(RewriteNested(*a.arg));
                    return a;
                },
                [&](Cond c) -> Term {
                    c.cond = RewriteExpr(c.cond);
                    c.if_true = RewriteExpr(c.if_true);
                    c.if_false = RewriteExpr(c.if_false);
                    return c;
                },
                [&](Lambda l) -> Term {
                    l.body = RewriteExpr(l.body);
                    return l;
                },
                [&](Block b) -> Term {
                    for (auto& let : b.bindings) let.value = RewriteExpr(let.value);
                    b.result = RewriteExpr(b.result);
                    return b;
                },
                [](const Ref& r) -> Term { return r; },
                [](const Literal& l) -> Term { return l; },
                [](const Hole& h) -> Term { return h; },
            },
            t.node
        );
    }
};
} // namespace

auto RewriteExpressions(const Module& mod) -> StageResult {
    return Rewriter::Rewrite(mod);
}
} // namespace mica::sema
