#ifndef MICA_TYPE_HH
#define MICA_TYPE_HH

#include <mica/forward.hh>
#include <mica/utils.hh>

#include <string>
#include <vector>

namespace mica {
/// A type of the source language.
///
/// Types are small immutable values. A function type is curried: it
/// holds its parameter types in order followed by its result type.
class Type {
public:
    enum struct Kind {
        Named,
        Function,
        Variable,
    };

private:
    Kind _kind;

    /// Name of a named type.
    std::string _name;

    /// Parameter types followed by the result type.
    std::vector<Type> _children;

    /// Number of a type variable.
    usz _variable{};

    Type(Kind kind, std::string name, std::vector<Type> children, usz variable)
        : _kind(kind), _name(std::move(name)), _children(std::move(children)), _variable(variable) {}

public:
    /// Builtin types.
    static auto Int() -> Type { return Named("Int"); }
    static auto Float() -> Type { return Named("Float"); }
    static auto String() -> Type { return Named("String"); }
    static auto Bool() -> Type { return Named("Bool"); }
    static auto Unit() -> Type { return Named("Unit"); }

    static auto Named(std::string name) -> Type {
        return Type{Kind::Named, std::move(name), {}, 0};
    }

    /// Create a function type. \p params must not be empty.
    static auto Function(std::vector<Type> params, Type result) -> Type;

    static auto Variable(usz number) -> Type {
        return Type{Kind::Variable, {}, {}, number};
    }

    [[nodiscard]] auto kind() const -> Kind { return _kind; }
    [[nodiscard]] bool is_named() const { return _kind == Kind::Named; }
    [[nodiscard]] bool is_function() const { return _kind == Kind::Function; }
    [[nodiscard]] bool is_variable() const { return _kind == Kind::Variable; }

    /// Check whether this is the named type \p name.
    [[nodiscard]] bool is(std::string_view name) const {
        return is_named() and _name == name;
    }

    [[nodiscard]] auto name() const -> const std::string& {
        MICA_ASSERT(is_named());
        return _name;
    }

    [[nodiscard]] auto variable() const -> usz {
        MICA_ASSERT(is_variable());
        return _variable;
    }

    /// Parameter types of a function type.
    [[nodiscard]] auto params() const -> std::span<const Type> {
        MICA_ASSERT(is_function());
        return std::span{_children}.first(_children.size() - 1);
    }

    /// Result type of a function type.
    [[nodiscard]] auto result() const -> const Type& {
        MICA_ASSERT(is_function());
        return _children.back();
    }

    /// The type left after applying a function to one argument.
    [[nodiscard]] auto applied() const -> Type;

    /// Check if this type mentions type variable \p number.
    [[nodiscard]] bool mentions(usz number) const;

    /// Get a string representation of this type.
    [[nodiscard]] auto string() const -> std::string;

    friend bool operator==(const Type& a, const Type& b);
};

bool operator==(const Type& a, const Type& b);

[[nodiscard]] constexpr auto StringifyEnum(Type::Kind kind) -> std::string_view {
    switch (kind) {
        case Type::Kind::Named: return "named";
        case Type::Kind::Function: return "function";
        case Type::Kind::Variable: return "variable";
    }
    MICA_UNREACHABLE();
}
} // namespace mica

template <>
struct fmt::formatter<mica::Type> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const mica::Type& t, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(t.string(), ctx);
    }
};

#endif // MICA_TYPE_HH
