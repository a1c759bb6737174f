#ifndef MICA_NATIVE_TYPE_HH
#define MICA_NATIVE_TYPE_HH

#include <mica/forward.hh>
#include <mica/utils.hh>

#include <optional>
#include <string>
#include <vector>

namespace mica {
/// A type as it crosses a call boundary.
///
/// These are spelled the way LLVM IR spells them: `i64`, `ptr`,
/// `%struct.Point`, `[2 x i64]`.
class NativeType {
public:
    enum struct Kind {
        Void,
        Integer,
        Float,
        Double,
        Pointer,
        Struct,
        Array,
    };

private:
    Kind _kind;

    /// Bit width of an integer, or element count of an array.
    usz _width{};

    /// Name of a struct, without the `%struct.` prefix.
    std::string _name;

    /// Element type of an array.
    std::vector<NativeType> _element;

    NativeType(Kind kind, usz width = 0, std::string name = {}, std::vector<NativeType> element = {})
        : _kind(kind), _width(width), _name(std::move(name)), _element(std::move(element)) {}

public:
    static auto Void() -> NativeType { return NativeType{Kind::Void}; }
    static auto Integer(usz bits) -> NativeType { return NativeType{Kind::Integer, bits}; }
    static auto I1() -> NativeType { return Integer(1); }
    static auto I8() -> NativeType { return Integer(8); }
    static auto I16() -> NativeType { return Integer(16); }
    static auto I32() -> NativeType { return Integer(32); }
    static auto I64() -> NativeType { return Integer(64); }
    static auto Float() -> NativeType { return NativeType{Kind::Float}; }
    static auto Double() -> NativeType { return NativeType{Kind::Double}; }
    static auto Pointer() -> NativeType { return NativeType{Kind::Pointer}; }
    static auto Struct(std::string name) -> NativeType { return NativeType{Kind::Struct, 0, std::move(name)}; }
    static auto Array(usz count, NativeType element) -> NativeType {
        return NativeType{Kind::Array, count, {}, {std::move(element)}};
    }

    /// Parse a primitive spelling such as `i32`, `double` or `ptr`.
    static auto Parse(std::string_view spelling) -> std::optional<NativeType>;

    [[nodiscard]] auto kind() const -> Kind { return _kind; }
    [[nodiscard]] bool is_void() const { return _kind == Kind::Void; }
    [[nodiscard]] bool is_integer() const { return _kind == Kind::Integer; }
    [[nodiscard]] bool is_pointer() const { return _kind == Kind::Pointer; }
    [[nodiscard]] bool is_struct() const { return _kind == Kind::Struct; }
    [[nodiscard]] bool is_array() const { return _kind == Kind::Array; }

    /// Check if this is an integer of the given width.
    [[nodiscard]] bool is_integer(usz bits) const { return is_integer() and _width == bits; }

    [[nodiscard]] auto bits() const -> usz {
        MICA_ASSERT(is_integer());
        return _width;
    }

    [[nodiscard]] auto count() const -> usz {
        MICA_ASSERT(is_array());
        return _width;
    }

    [[nodiscard]] auto element() const -> const NativeType& {
        MICA_ASSERT(is_array());
        return _element.front();
    }

    [[nodiscard]] auto struct_name() const -> const std::string& {
        MICA_ASSERT(is_struct());
        return _name;
    }

    /// Size in bytes. Structs have no size by themselves; ask the
    /// StructLayoutTable instead.
    [[nodiscard]] auto bytes() const -> usz;

    /// Alignment in bytes.
    [[nodiscard]] auto align() const -> usz;

    [[nodiscard]] auto string() const -> std::string;

    friend bool operator==(const NativeType& a, const NativeType& b);
};

bool operator==(const NativeType& a, const NativeType& b);

[[nodiscard]] constexpr auto StringifyEnum(NativeType::Kind kind) -> std::string_view {
    switch (kind) {
        case NativeType::Kind::Void: return "void";
        case NativeType::Kind::Integer: return "integer";
        case NativeType::Kind::Float: return "float";
        case NativeType::Kind::Double: return "double";
        case NativeType::Kind::Pointer: return "pointer";
        case NativeType::Kind::Struct: return "struct";
        case NativeType::Kind::Array: return "array";
    }
    MICA_UNREACHABLE();
}
} // namespace mica

template <>
struct fmt::formatter<mica::NativeType> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const mica::NativeType& t, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(t.string(), ctx);
    }
};

#endif // MICA_NATIVE_TYPE_HH
