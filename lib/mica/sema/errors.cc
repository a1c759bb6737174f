#include <mica/context.hh>
#include <mica/diags.hh>
#include <mica/sema/errors.hh>

namespace mica::sema {
namespace {
auto TypeErrorLocation(const TypeError& e) -> Location {
    return std::visit([](const auto& err) { return err.location; }, e);
}
} // namespace

auto SemanticError::location() const -> Location {
    return std::visit(
        Overloaded{
            [](const DuplicateName& d) { return d.duplicate; },
            [](const UnresolvedRef& u) { return u.location; },
            [](const MemberErrorPresent& m) { return m.location; },
            [](const TypeCheckingError& t) { return TypeErrorLocation(t.error); },
        },
        error
    );
}

auto Message(const TypeError& e) -> std::string {
    using Reason = InvalidApplication::Reason;
    return std::visit(
        Overloaded{
            [](const UnresolvableType& u) {
                if (u.expected) return fmt::format("Cannot determine the type of {} (expected {})", u.what, *u.expected);
                return fmt::format("Cannot determine the type of {}", u.what);
            },
            [](const InvalidApplication& a) -> std::string {
                switch (a.reason) {
                    case Reason::NotAFunction:
                        if (a.subject_is_name and a.subject_type) return fmt::format(
                            "Value '{}' of type {} is not a function and cannot be applied",
                            a.subject,
                            *a.subject_type
                        );
                        if (a.subject_is_name) return fmt::format(
                            "Value '{}' is not a function and cannot be applied",
                            a.subject
                        );
                        if (a.subject_type) return fmt::format(
                            "Expression of type {} is not a function and cannot be applied",
                            *a.subject_type
                        );
                        return "Expression is not a function and cannot be applied";

                    case Reason::MisplacedOperator:
                        return fmt::format("Operator '{}' cannot be applied in this position", a.subject);

                    case Reason::MissingOperand:
                        return fmt::format("Operator '{}' is missing its right-hand operand", a.subject);

                    case Reason::LiteralApplied:
                        return fmt::format("Literal {} cannot be applied to an argument", a.subject);
                }
                MICA_UNREACHABLE();
            },
            [](const TypeMismatch& m) {
                return fmt::format("Type mismatch: expected {}, but got {}", m.expected, m.actual);
            },
            [](const ConditionalBranchMismatch& m) {
                return fmt::format(
                    "Branches of conditional have different types: {} and {}",
                    m.if_true,
                    m.if_false
                );
            },
            [](const UndefinedType& u) { return fmt::format("Unknown type '{}'", u.name); },
        },
        e
    );
}

auto Message(const SemanticError& e) -> std::string {
    return std::visit(
        Overloaded{
            [](const DuplicateName& d) { return fmt::format("Duplicate declaration of '{}'", d.name); },
            [](const UnresolvedRef& u) { return fmt::format("Unknown name '{}'", u.name); },
            [](const MemberErrorPresent& m) {
                if (m.failed_source) return fmt::format("Invalid member: {} (in '{}')", m.message, *m.failed_source);
                return fmt::format("Invalid member: {}", m.message);
            },
            [](const TypeCheckingError& t) { return Message(t.error); },
        },
        e.error
    );
}

void SortDiagnostics(std::vector<SemanticError>& errors) {
    rgs::stable_sort(errors, [](const SemanticError& a, const SemanticError& b) {
        return a.location().precedes(b.location());
    });
}

void Report(const Context* ctx, const std::vector<SemanticError>& errors) {
    for (const auto& e : errors) {
        auto diag = Diag::Error(ctx, e.location(), "{}", Message(e));
        if (e.is<DuplicateName>()) {
            const auto& dup = e.as<DuplicateName>();
            if (dup.first.is_valid()) diag.attach(Diag::Note(ctx, dup.first, "'{}' was first declared here", dup.name));
            else diag.attach(Diag::Note(ctx, {}, "'{}' is a builtin", dup.name));
        }
    }
}
} // namespace mica::sema
