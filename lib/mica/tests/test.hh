#ifndef MICA_TESTS_TEST_HH
#define MICA_TESTS_TEST_HH

#include <mica/ast.hh>
#include <mica/context.hh>
#include <mica/sema/errors.hh>
#include <mica/utils.hh>

#include <fmt/format.h>

#include <string>

namespace mica::test {
inline int failed_tests = 0;

/// Run a test case and print whether it passed.
template <typename Callable>
void Run(std::string_view name, Callable test) {
    if (test()) fmt::print("PASSED: ");
    else {
        fmt::print("FAILED: ");
        failed_tests++;
    }
    fmt::print("{}\n", name);
}

/// Exit code of a test executable.
inline auto ExitCode() -> int { return failed_tests == 0 ? 0 : 1; }

template <typename Got, typename Expected>
[[nodiscard]] bool Same(const Got& got, const Expected& expected) {
    if (got == expected) return true;
    fmt::print(
        "  Result does not match expected...\n"
        "    GOT {}\n"
        "    EXPECTED {}\n",
        got,
        expected
    );
    return false;
}

[[nodiscard]] inline bool Check(bool condition, std::string_view what) {
    if (not condition) fmt::print("  {}\n", what);
    return condition;
}

/// Print the messages of a list of errors.
inline void Dump(const std::vector<sema::SemanticError>& errors) {
    for (const auto& e : errors) fmt::print("    [{}] {}\n", StringifyEnum(e.stage), sema::Message(e));
}

/// Builds AST nodes whose locations point into a source text.
///
/// There is no parser here, so each node is located by looking up its
/// spelling in the source.
class Builder {
    const File* file;

public:
    Builder(Context& ctx, std::string_view source)
        : file(&ctx.create_file("test.mica", source)) {}

    /// Location of the \p nth occurrence of \p text in the source.
    [[nodiscard]] auto at(std::string_view text, usz nth = 0) const -> Location {
        const std::string_view src{file->data(), file->size()};
        auto pos = src.find(text);
        for (usz i = 0; i < nth and pos != std::string_view::npos; i++) pos = src.find(text, pos + 1);
        MICA_ASSERT(pos != std::string_view::npos, "'{}' does not occur in the test source", text);
        return Location{u32(pos), u16(text.size()), file->file_id()};
    }

    [[nodiscard]] auto ref(std::string_view name, usz nth = 0) const -> Term {
        return Ref{at(name, nth), std::string{name}};
    }

    [[nodiscard]] auto num(std::string_view text, usz nth = 0) const -> Term {
        return Literal{at(text, nth), i64(std::stoll(std::string{text}))};
    }

    [[nodiscard]] auto str(std::string_view quoted, usz nth = 0) const -> Term {
        return Literal{at(quoted, nth), std::string{quoted.substr(1, quoted.size() - 2)}};
    }

    [[nodiscard]] auto boolean(std::string_view text, usz nth = 0) const -> Term {
        return Literal{at(text, nth), text == "true"};
    }

    [[nodiscard]] auto hole(usz nth = 0) const -> Term {
        return Hole{at("???", nth)};
    }

    [[nodiscard]] auto param(std::string_view name, usz nth = 0) const -> Param {
        return Param{at(name, nth), std::string{name}};
    }

    [[nodiscard]] static auto expr(std::vector<Term> terms) -> Expr {
        auto loc = terms.empty() ? Location{} : Location{terms.front().location(), terms.back().location()};
        return Expr{loc, std::move(terms)};
    }

    [[nodiscard]] auto binding(
        std::string_view name,
        std::vector<Term> value,
        std::optional<Type> annotation = std::nullopt,
        usz nth = 0
    ) const -> Member {
        Binding b{at(name, nth), std::string{name}, expr(std::move(value))};
        b.annotation = std::move(annotation);
        return b;
    }

    [[nodiscard]] auto fn(
        std::string_view name,
        std::vector<Param> params,
        std::vector<Term> body,
        usz nth = 0
    ) const -> Member {
        return FnDef{at(name, nth), std::string{name}, std::move(params), expr(std::move(body))};
    }

    [[nodiscard]] auto op(
        std::string_view name,
        Arity arity,
        i32 precedence,
        Associativity assoc,
        usz nth = 0
    ) const -> OperatorDef {
        OperatorDef o{};
        o.location = at(name, nth);
        o.name = std::string{name};
        o.arity = arity;
        o.precedence = precedence;
        o.associativity = assoc;
        return o;
    }

    [[nodiscard]] static auto module(std::vector<Member> members) -> Module {
        return Module{"test", Visibility::Public, std::move(members)};
    }
};

/// Get the value of a binding in a module.
[[nodiscard]] inline auto BindingValue(const Module& mod, std::string_view name) -> const Expr& {
    const auto* m = mod.find(name);
    MICA_ASSERT(m and m->is<Binding>(), "No binding '{}'", name);
    return m->as<Binding>().value;
}

/// Render the single term of a binding's value.
[[nodiscard]] inline auto BindingSexpr(const Module& mod, std::string_view name) -> std::string {
    const auto& value = BindingValue(mod, name);
    if (value.terms.size() != 1) return Sexpr(value);
    return Sexpr(value.terms.front());
}

[[nodiscard]] inline auto DefaultOptions() -> Context::Options {
    return {Context::DoNotUseColour, Context::DoNotPrintAST, Context::DoNotWarnOpaqueLayout};
}
} // namespace mica::test

#endif // MICA_TESTS_TEST_HH
