#include <mica/ast.hh>
#include <mica/context.hh>
#include <mica/sema.hh>
#include <mica/target.hh>

#include <fmt/format.h>

#include "../test.hh"

using namespace mica;
using namespace mica::sema;
using mica::test::Builder;
using mica::test::Check;
using mica::test::Run;
using mica::test::Same;

namespace {
auto Messages(const std::vector<SemanticError>& errors) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& e : errors) out.push_back(Message(e));
    return out;
}

/// Check that nothing in a resolved term is left unresolved.
bool FullyResolved(const Term& t) {
    if (not t.type()) return false;
    return std::visit(
        Overloaded{
            [](const Ref& r) { return r.target.has_value(); },
            [](const App& a) { return FullyResolved(*a.fn) and FullyResolved(*a.arg); },
            [](const Expr& e) { return rgs::all_of(e.terms, FullyResolved); },
            [](const auto&) { return true; },
        },
        t.node
    );
}
} // namespace

int main() {
    Run("Pipeline: Binding With Addition", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "let xs = 1 + 2;"};
        auto res = Analyse(Builder::module({b.binding("xs", {b.num("1"), b.ref("+"), b.num("2")})}));
        if (res.is_diag()) {
            test::Dump(res.diag());
            return false;
        }

        const auto& value = test::BindingValue(*res, "xs");
        return Same(test::BindingSexpr(*res, "xs"), "(app (app (ref +) (int 1)) (int 2))")
           and Same(*res->find("xs")->as<Binding>().type, Type::Int())
           and Check(FullyResolved(value.terms[0]), "Term left unresolved")
           and Check(value.terms[0].location() == b.at("1 + 2"), "Expression span lost");
    });

    Run("Pipeline: Every Unknown Name Is Reported In Order", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "let a = foo; let b = bar;"};
        auto mod = Builder::module({b.binding("b", {b.ref("bar")}), b.binding("a", {b.ref("foo")})});
        auto res = Analyse(mod);
        if (not Check(res.is_diag(), "Analysis succeeded")) return false;
        auto errors = res.diag();
        return Same(Messages(errors).size(), 2zu)
           and Same(Messages(errors)[0], "Unknown name 'foo'")
           and Same(Messages(errors)[1], "Unknown name 'bar'")
           and Check(rgs::all_of(errors, [](const SemanticError& e) { return e.stage == Stage::ReferenceResolver; }), "Wrong stage");
    });

    Run("Pipeline: A Failing Stage Stops The Run", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "let x = 1; let x = nope;"};
        auto mod = Builder::module({
            b.binding("x", {b.num("1")}, std::nullopt, 0),
            b.binding("x", {b.ref("nope")}, std::nullopt, 1),
        });
        auto res = Analyse(mod);
        if (not Check(res.is_diag(), "Analysis succeeded")) return false;
        auto errors = res.diag();
        return Same(errors.size(), 1zu)
           and Check(errors[0].is<DuplicateName>(), "Expected only the duplicate");
    });

    Run("Pipeline: Function Application And Operators", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "def twice v = v * 2; let r = twice 3 + 1 > 6 and true;"};
        auto mod = Builder::module({
            b.fn("twice", {b.param("v")}, {b.ref("v", 1), b.ref("*"), b.num("2")}),
            b.binding("r", {
                b.ref("twice", 1), b.num("3"), b.ref("+"), b.num("1"),
                b.ref(">"), b.num("6"), b.ref("and"), b.boolean("true"),
            }),
        });
        auto res = Analyse(mod);
        if (res.is_diag()) {
            test::Dump(res.diag());
            return false;
        }

        return Same(
                   test::BindingSexpr(*res, "r"),
                   "(app (app (ref and) (app (app (ref >) (app (app (ref +) (app (ref twice) (int 3))) (int 1))) (int 6))) (bool true))"
               )
           and Same(*res->find("r")->as<Binding>().type, Type::Bool())
           and Same(*res->find("twice")->as<FnDef>().type, Type::Function({Type::Int()}, Type::Int()));
    });

    Run("Pipeline: Independent Type Errors Are All Reported", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "let f = 1; let g = f 2; let h : Bool = 3;"};
        auto mod = Builder::module({
            b.binding("f", {b.num("1")}),
            b.binding("g", {b.ref("f", 1), b.num("2")}),
            b.binding("h", {b.num("3")}, Type::Bool()),
        });
        auto res = Analyse(mod);
        if (not Check(res.is_diag(), "Analysis succeeded")) return false;
        auto errors = res.diag();
        return Same(errors.size(), 2zu)
           and Check(errors[0].is_type_error<InvalidApplication>(), "First error is not the application")
           and Check(errors[1].is_type_error<TypeMismatch>(), "Second error is not the mismatch");
    });

    Run("Pipeline: Invalid Members Stop Code Generation", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "let ok = 1; garbage"};
        auto mod = Builder::module({
            b.binding("ok", {b.num("1")}),
            MemberError{b.at("garbage"), "unexpected token", "garbage"},
        });
        auto res = Analyse(mod);
        if (not Check(res.is_diag(), "Analysis succeeded")) return false;
        auto errors = res.diag();
        return Same(errors.size(), 1zu)
           and Check(errors[0].is<MemberErrorPresent>(), "Expected MemberErrorPresent");
    });

    Run("Pipeline: Protocol Operators Take Part In Rewriting", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "protocol Join { infixr <> 65 } let j = 1 <> 2 + 3;"};
        Protocol proto{b.at("Join"), "Join"};
        proto.operators.push_back(b.op("<>", Arity::Binary, 65, Associativity::Right, 0));
        proto.operators.back().type = Type::Function({Type::Int(), Type::Int()}, Type::Int());
        auto mod = Builder::module({
            proto,
            b.binding("j", {b.num("1"), b.ref("<>", 1), b.num("2"), b.ref("+"), b.num("3")}),
        });
        auto res = Analyse(mod);
        if (res.is_diag()) {
            test::Dump(res.diag());
            return false;
        }
        return Same(test::BindingSexpr(*res, "j"), "(app (app (ref +) (app (app (ref <>) (int 1)) (int 2))) (int 3))");
    });

    Run("Pipeline: Resolved Module Can Be Printed", [] {
        Context ctx{Target::generic, test::DefaultOptions()};
        Builder b{ctx, "let xs = 1 + 2;"};
        auto res = Sema::Analyse(&ctx, Builder::module({b.binding("xs", {b.num("1"), b.ref("+"), b.num("2")})}));
        if (not Check(res.has_value(), "Analysis failed")) return false;
        auto tree = res->tree(false);
        return Check(tree.starts_with("Module test"), "Tree has no module header")
           and Check(tree.contains("Binding xs"), "Tree does not show the binding")
           and Check(tree.contains("App"), "Tree does not show the application");
    });

    return test::ExitCode();
}
