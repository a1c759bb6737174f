#ifndef MICA_RESULT_HH
#define MICA_RESULT_HH

#include <mica/diags.hh>
#include <mica/utils.hh>

#include <variant>

namespace mica {
/// Result type that can hold either a value or a diagnostic.
///
/// The diagnostic type defaults to \c Diag, in which case an unhandled
/// diagnostic is issued in the destructor, as it usually would be.
/// Semantic stages use a list of \c SemanticError instead, which is
/// plain data and is only reported when the caller decides to.
template <typename Type, typename Error = Diag>
requires (not std::is_reference_v<Type>)
class [[nodiscard]] Result {
    using ValueType = std::conditional_t<std::is_void_v<Type>, std::monostate, Type>;
    std::variant<ValueType, Error> data;

    template <typename T>
    struct make_result {
        using type = Result<T, Error>;
    };

    template <typename T, typename E>
    struct make_result<Result<T, E>> {
        using type = Result<T, E>;
    };

    template <typename T>
    using make_result_t = typename make_result<T>::type;

public:
    /// Create a result that holds a value.
    Result(ValueType value)
    requires (not std::is_void_v<Type>)
        : data(std::move(value)) {}

    /// Create a result that holds a diagnostic.
    Result(Error diag) : data(std::move(diag)) {}

    /// Get the diagnostic.
    ///
    /// This returns a && to simplify the `return res.diag()` pattern.
    [[nodiscard]] auto diag() -> Error&& { return std::move(std::get<Error>(data)); }

    /// Check if the result holds a diagnostic.
    [[nodiscard]] bool is_diag() const { return std::holds_alternative<Error>(data); }

    /// Check if the result holds a value.
    [[nodiscard]] bool is_value() const { return std::holds_alternative<ValueType>(data); }

    /// Get the value.
    [[nodiscard]] auto value() -> ValueType&
    requires (not std::is_void_v<Type>)
    { return std::get<ValueType>(data); }

    /// Check if this has a value.
    explicit operator bool() const { return is_value(); }

    /// Access the underlying value.
    [[nodiscard]] auto operator*() -> ValueType& { return value(); }

    /// Access the underlying value.
    [[nodiscard]] auto operator->() -> ValueType* { return &value(); }

    /// \brief Monad bind operator for results.
    ///
    /// If this holds a diagnostic, return it; otherwise pass the value
    /// to \c cb and return the result of that call. The operator is
    /// right-associative, so chains need parentheses:
    ///
    /// \code{.cpp}
    ///     return (RegisterOperators(m) >>= CheckDuplicateNames) >>= ResolveReferences;
    /// \endcode
    ///
    /// \param cb A callable that takes in a \c ValueType& and returns
    ///     a \c Result or a plain value.
    template <typename Callable>
    [[nodiscard]] auto operator>>=(Callable&& cb) -> make_result_t<std::invoke_result_t<Callable, ValueType&>> {
        using ResultType = make_result_t<std::invoke_result_t<Callable, ValueType&>>;
        if (is_diag()) return ResultType{diag()};
        return ResultType{std::invoke(std::forward<Callable>(cb), value())};
    }
};
} // namespace mica

#endif // MICA_RESULT_HH
