#ifndef MICA_AST_HH
#define MICA_AST_HH

#include <mica/forward.hh>
#include <mica/location.hh>
#include <mica/type.hh>
#include <mica/utils.hh>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mica {
enum struct Visibility {
    Public,
    Protected,
    Private,
};

enum struct Associativity {
    Left,
    Right,
};

enum struct Arity {
    Unary = 1,
    Binary = 2,
};

/// The declaration a reference was bound to.
struct Resolution {
    enum struct Kind {
        Function,
        Binding,
        Operator,
        Parameter,
        Local,
    };

    Kind kind;

    /// Unique id of the declaration within its module.
    std::string id;

    bool operator==(const Resolution&) const = default;
};

/// A name occurrence.
struct Ref {
    Location location;
    std::string name;
    std::optional<Resolution> target{};
    std::optional<Type> type{};
};

struct Literal {
    enum struct Kind {
        Unit,
        Bool,
        Int,
        Float,
        String,
    };

    Location location;
    std::variant<std::monostate, bool, i64, f64, std::string> value{};
    std::optional<Type> type{};

    [[nodiscard]] auto kind() const -> Kind { return Kind(value.index()); }
};

/// '???'.
struct Hole {
    Location location;
    std::optional<Type> type{};
};

struct Term;

/// An ordered sequence of terms.
///
/// Before rewriting, the terms are a flat mix of operands and operator
/// references. After rewriting, an expression holds exactly one term.
struct Expr {
    Location location;
    std::vector<Term> terms;
    std::optional<Type> type{};
};

/// Application of a function to a single argument.
struct App {
    Location location;
    std::shared_ptr<const Term> fn;
    std::shared_ptr<const Term> arg;
    std::optional<Type> type{};
};

struct Cond {
    Location location;
    Expr cond;
    Expr if_true;
    Expr if_false;
    std::optional<Type> type{};
};

struct Param {
    Location location;
    std::string name;
    std::optional<Type> annotation{};
    std::string id{};
};

struct Lambda {
    Location location;
    std::vector<Param> params;
    Expr body;
    std::optional<Type> type{};
};

/// A 'let' inside a block.
struct LocalBinding {
    Location location;
    std::string name;
    Expr value;
    std::optional<Type> annotation{};
    std::string id{};
};

struct Block {
    Location location;
    std::vector<LocalBinding> bindings;
    Expr result;
    std::optional<Type> type{};
};

struct Term {
    using Node = std::variant<Ref, Literal, Hole, Expr, App, Cond, Lambda, Block>;
    Node node;

    template <typename T>
    requires (not std::is_same_v<std::remove_cvref_t<T>, Term> and std::is_constructible_v<Node, T>)
    Term(T&& t) : node(std::forward<T>(t)) {}

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(node); }

    template <typename T>
    [[nodiscard]] auto as() const -> const T& { return std::get<T>(node); }

    template <typename T>
    [[nodiscard]] auto as() -> T& { return std::get<T>(node); }

    [[nodiscard]] auto location() const -> Location;
    [[nodiscard]] auto type() const -> const std::optional<Type>&;

    /// Get a copy of this term with a different location.
    [[nodiscard]] auto with_location(Location loc) const -> Term;

    /// Get a copy of this term with a different type.
    [[nodiscard]] auto with_type(Type t) const -> Term;
};

struct FnDef {
    Location location;
    std::string name;
    std::vector<Param> params;
    Expr body;
    std::optional<Type> return_type{};
    Visibility visibility = Visibility::Public;
    std::string id{};
    std::optional<Type> type{};
};

struct Binding {
    Location location;
    std::string name;
    Expr value;
    std::optional<Type> annotation{};
    Visibility visibility = Visibility::Public;
    std::string id{};
    std::optional<Type> type{};
};

/// A prefix or infix operator.
///
/// Built-in operators have no body and carry their signature in
/// \c type. User operators take their signature from their annotated
/// parameters and return type.
struct OperatorDef {
    Location location;
    std::string name;
    Arity arity = Arity::Binary;
    i32 precedence{};
    Associativity associativity = Associativity::Left;
    std::vector<Param> params{};
    std::optional<Expr> body{};
    std::optional<Type> return_type{};
    std::string id{};
    std::optional<Type> type{};
    bool builtin = false;

    /// Check if two operators agree on precedence and associativity.
    [[nodiscard]] bool same_fixity(const OperatorDef& other) const {
        return precedence == other.precedence and associativity == other.associativity;
    }
};

/// A 'protocol' or 'instance' block.
struct Protocol {
    Location location;
    std::string name;
    bool instance = false;
    std::vector<OperatorDef> operators{};
};

struct NativePrimitive {
    std::string spelling;
};

struct NativePointer {
    std::string pointee;
};

struct NativeField {
    std::string name;

    /// Name of the TypeDef of this field.
    std::string type_name;
};

struct NativeStruct {
    std::vector<NativeField> fields;
};

/// A type declaration backed by a native representation.
struct TypeDef {
    Location location;
    std::string name;
    std::variant<NativePrimitive, NativePointer, NativeStruct> native;
};

struct Comment {
    Location location;
    std::string text;
};

/// Placeholder for a member that could not be parsed or validated.
struct MemberError {
    Location location;
    std::string message;
    std::optional<std::string> failed_source{};
};

struct Member {
    using Node = std::variant<FnDef, Binding, OperatorDef, Protocol, TypeDef, Comment, MemberError>;
    Node node;

    template <typename T>
    requires (not std::is_same_v<std::remove_cvref_t<T>, Member> and std::is_constructible_v<Node, T>)
    Member(T&& t) : node(std::forward<T>(t)) {}

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(node); }

    template <typename T>
    [[nodiscard]] auto as() const -> const T& { return std::get<T>(node); }

    template <typename T>
    [[nodiscard]] auto as() -> T& { return std::get<T>(node); }

    [[nodiscard]] auto location() const -> Location;

    /// Name the member declares in module scope, if any.
    [[nodiscard]] auto name() const -> std::optional<std::string_view>;
};

struct Module {
    std::string name;
    Visibility visibility = Visibility::Public;
    std::vector<Member> members{};
    fs::path source_path{};

    /// Find a top-level function or binding by name.
    [[nodiscard]] auto find(std::string_view name) const -> const Member*;

    /// Render this module as an indented tree.
    [[nodiscard]] auto tree(bool use_colour) const -> std::string;
};

/// Render a term as an S-expression.
///
/// \code
///     (app (app (ref +) (int 1)) (int 2))
/// \endcode
auto Sexpr(const Term& t) -> std::string;
auto Sexpr(const Expr& e) -> std::string;

[[nodiscard]] constexpr auto StringifyEnum(Visibility v) -> std::string_view {
    switch (v) {
        case Visibility::Public: return "public";
        case Visibility::Protected: return "protected";
        case Visibility::Private: return "private";
    }
    MICA_UNREACHABLE();
}

[[nodiscard]] constexpr auto StringifyEnum(Associativity a) -> std::string_view {
    switch (a) {
        case Associativity::Left: return "left";
        case Associativity::Right: return "right";
    }
    MICA_UNREACHABLE();
}

[[nodiscard]] constexpr auto StringifyEnum(Arity a) -> std::string_view {
    switch (a) {
        case Arity::Unary: return "unary";
        case Arity::Binary: return "binary";
    }
    MICA_UNREACHABLE();
}

[[nodiscard]] constexpr auto StringifyEnum(Resolution::Kind k) -> std::string_view {
    switch (k) {
        case Resolution::Kind::Function: return "function";
        case Resolution::Kind::Binding: return "binding";
        case Resolution::Kind::Operator: return "operator";
        case Resolution::Kind::Parameter: return "parameter";
        case Resolution::Kind::Local: return "local";
    }
    MICA_UNREACHABLE();
}
} // namespace mica

#endif // MICA_AST_HH
