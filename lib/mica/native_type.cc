#include <mica/diags.hh>
#include <mica/native_type.hh>

#include <charconv>

namespace mica {
auto NativeType::Parse(std::string_view spelling) -> std::optional<NativeType> {
    if (spelling == "void") return Void();
    if (spelling == "float") return Float();
    if (spelling == "double") return Double();
    if (spelling == "ptr") return Pointer();
    if (spelling.starts_with("%struct.")) return Struct(std::string{spelling.substr("%struct."sv.size())});

    if (spelling.starts_with("i") and spelling.size() > 1) {
        usz bits{};
        auto digits = spelling.substr(1);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), bits);
        if (ec != std::errc{} or ptr != digits.data() + digits.size() or bits == 0) return std::nullopt;
        return Integer(bits);
    }

    return std::nullopt;
}

auto NativeType::bytes() const -> usz {
    switch (_kind) {
        case Kind::Void: return 0;
        case Kind::Integer: return utils::AlignTo<usz>(_width, 8) / 8;
        case Kind::Float: return 4;
        case Kind::Double: return 8;
        case Kind::Pointer: return 8;
        case Kind::Array: return _width * element().bytes();
        case Kind::Struct: Diag::ICE("Size of struct {} must be queried from the layout table", string());
    }
    MICA_UNREACHABLE();
}

auto NativeType::align() const -> usz {
    switch (_kind) {
        case Kind::Void: return 1;
        case Kind::Array: return element().align();
        case Kind::Struct: Diag::ICE("Alignment of struct {} must be queried from the layout table", string());
        default: return std::max<usz>(bytes(), 1);
    }
}

auto NativeType::string() const -> std::string {
    switch (_kind) {
        case Kind::Void: return "void";
        case Kind::Integer: return fmt::format("i{}", _width);
        case Kind::Float: return "float";
        case Kind::Double: return "double";
        case Kind::Pointer: return "ptr";
        case Kind::Struct: return fmt::format("%struct.{}", _name);
        case Kind::Array: return fmt::format("[{} x {}]", _width, element().string());
    }
    MICA_UNREACHABLE();
}

bool operator==(const NativeType& a, const NativeType& b) {
    if (a._kind != b._kind) return false;
    switch (a._kind) {
        case NativeType::Kind::Integer: return a._width == b._width;
        case NativeType::Kind::Struct: return a._name == b._name;
        case NativeType::Kind::Array: return a._width == b._width and a.element() == b.element();
        default: return true;
    }
}
} // namespace mica
