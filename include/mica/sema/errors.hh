#ifndef MICA_SEMA_ERRORS_HH
#define MICA_SEMA_ERRORS_HH

#include <mica/ast.hh>
#include <mica/forward.hh>
#include <mica/location.hh>
#include <mica/type.hh>
#include <mica/utils.hh>
#include <mica/utils/result.hh>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mica::sema {
/// The stage that produced a diagnostic.
enum struct Stage {
    OperatorRegistry,
    DuplicateNames,
    ReferenceResolver,
    ExpressionRewriter,
    TypeResolver,
    Simplifier,
    MemberErrors,
};

/// The type of an expression could not be determined.
struct UnresolvableType {
    Location location;

    /// What could not be typed, e.g. "hole" or "binding 'x'".
    std::string what;
    std::optional<Type> expected{};
};

/// Something that is not a function is applied, or an operator is
/// used without its operands.
struct InvalidApplication {
    enum struct Reason {
        /// A value that is not a function is applied to an argument.
        NotAFunction,

        /// An operator appears where it cannot be applied, e.g. an infix
        /// operator where an operand is expected.
        MisplacedOperator,

        /// An infix operator is missing its right-hand operand.
        MissingOperand,

        /// A literal or hole is followed by an argument.
        LiteralApplied,
    };

    Location location;
    Reason reason;

    /// Name of the value or operator, or a rendering of the term.
    std::string subject;

    /// Whether \c subject names a value rather than an expression.
    bool subject_is_name = false;
    std::optional<Type> subject_type{};
};

struct TypeMismatch {
    Location location;
    Type expected;
    Type actual;
};

struct ConditionalBranchMismatch {
    Location location;
    Type if_true;
    Type if_false;
};

/// An annotation names a type that is neither built in nor declared
/// in the module.
struct UndefinedType {
    Location location;
    std::string name;
};

using TypeError = std::variant<UnresolvableType, InvalidApplication, TypeMismatch, ConditionalBranchMismatch, UndefinedType>;

struct DuplicateName {
    std::string name;
    Location first;
    Location duplicate;
};

struct UnresolvedRef {
    std::string name;
    Location location;
};

struct MemberErrorPresent {
    Location location;
    std::string message;
    std::optional<std::string> failed_source{};
};

struct TypeCheckingError {
    TypeError error;
};

/// A diagnostic produced by a semantic stage.
///
/// These are plain values. Nothing is printed until they are handed
/// to Report().
struct SemanticError {
    using Node = std::variant<DuplicateName, UnresolvedRef, MemberErrorPresent, TypeCheckingError>;
    Node error;
    Stage stage;

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(error); }

    template <typename T>
    [[nodiscard]] auto as() const -> const T& { return std::get<T>(error); }

    /// Check if this wraps a type error of kind \c T.
    template <typename T>
    [[nodiscard]] bool is_type_error() const {
        return is<TypeCheckingError>() and std::holds_alternative<T>(as<TypeCheckingError>().error);
    }

    template <typename T>
    [[nodiscard]] auto as_type_error() const -> const T& {
        return std::get<T>(as<TypeCheckingError>().error);
    }

    /// The location the diagnostic is anchored at.
    [[nodiscard]] auto location() const -> Location;
};

/// The result of a stage: the new module, or every error it found.
using StageResult = Result<Module, std::vector<SemanticError>>;

/// Get the message text of an error.
auto Message(const SemanticError& e) -> std::string;
auto Message(const TypeError& e) -> std::string;

/// Sort diagnostics by location; invalid locations go last.
void SortDiagnostics(std::vector<SemanticError>& errors);

/// Issue a Diag for every error.
void Report(const Context* ctx, const std::vector<SemanticError>& errors);

[[nodiscard]] constexpr auto StringifyEnum(Stage s) -> std::string_view {
    switch (s) {
        case Stage::OperatorRegistry: return "operator registry";
        case Stage::DuplicateNames: return "duplicate name checker";
        case Stage::ReferenceResolver: return "reference resolver";
        case Stage::ExpressionRewriter: return "expression rewriter";
        case Stage::TypeResolver: return "type resolver";
        case Stage::Simplifier: return "simplifier";
        case Stage::MemberErrors: return "member error checker";
    }
    MICA_UNREACHABLE();
}

[[nodiscard]] constexpr auto StringifyEnum(InvalidApplication::Reason r) -> std::string_view {
    switch (r) {
        case InvalidApplication::Reason::NotAFunction: return "not a function";
        case InvalidApplication::Reason::MisplacedOperator: return "misplaced operator";
        case InvalidApplication::Reason::MissingOperand: return "missing operand";
        case InvalidApplication::Reason::LiteralApplied: return "literal applied";
    }
    MICA_UNREACHABLE();
}
} // namespace mica::sema

#endif // MICA_SEMA_ERRORS_HH
