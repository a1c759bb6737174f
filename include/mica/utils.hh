#ifndef MICA_UTILS_HH
#define MICA_UTILS_HH

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace mica {
using namespace std::literals;

namespace fs = std::filesystem;
namespace rgs = std::ranges;
namespace vws = std::ranges::views;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using usz = size_t;

using i8 = int8_t;
using i32 = int32_t;
using i64 = int64_t;

using f64 = double;

#define MICA_CAT_(X, Y) X##Y
#define MICA_CAT(X, Y)  MICA_CAT_(X, Y)

/// Check an internal invariant. A failure is a compiler bug, never a
/// problem with the program being compiled.
// clang-format off
#define MICA_ASSERT(cond, ...) ((cond) ? void(0) :                \
    ::mica::detail::AssertFail(                                   \
        fmt::format(                                              \
            "Invariant \"" #cond "\" violated in {}:{}"           \
            __VA_OPT__(": {}"), __FILE__, __LINE__                \
            __VA_OPT__(, fmt::format(__VA_ARGS__))                \
        )                                                         \
    )                                                             \
)
// clang-format on

#define MICA_UNREACHABLE() MICA_ASSERT(false, "Reached unreachable code")

/// Visitor built from a set of lambdas.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
} // namespace mica

namespace mica::detail {
[[noreturn]] void AssertFail(std::string&& msg);

struct StringHash {
    using is_transparent = void;
    [[nodiscard]] usz operator()(std::string_view s) const { return std::hash<std::string_view>{}(s); }
};

template <typename T>
concept FormattableEnum = std::is_enum_v<T> and requires (T t) {
    { StringifyEnum(t) } -> std::convertible_to<std::string_view>;
};
} // namespace mica::detail

namespace mica {
/// Map keyed by name that can be queried with a string_view.
template <typename Value>
using StringMap = std::unordered_map<std::string, Value, detail::StringHash, std::equal_to<>>;
} // namespace mica

namespace mica::utils {
/// SGR codes used in coloured output.
enum struct Colour : u8 {
    Reset = 0,
    Bold = 1,
    Faint = 2,
    Red = 31,
    Green = 32,
    Yellow = 33,
    Magenta = 35,
    Cyan = 36,
    White = 37,
    Default = 39,
};

/// Escape sequences that turn into nothing when colours are disabled.
///
/// \code{.cpp}
///     utils::Colours C{ctx->use_colour()};
///     out += fmt::format("{}{}{}", C(Colour::Green), name, C(Colour::Reset));
/// \endcode
class Colours {
    static constexpr std::array<std::string_view, 40> sequences = [] {
        std::array<std::string_view, 40> seqs{};
        seqs[usz(Colour::Reset)] = "\033[m";
        seqs[usz(Colour::Bold)] = "\033[1m";
        seqs[usz(Colour::Faint)] = "\033[2m";
        seqs[usz(Colour::Red)] = "\033[31m";
        seqs[usz(Colour::Green)] = "\033[32m";
        seqs[usz(Colour::Yellow)] = "\033[33m";
        seqs[usz(Colour::Magenta)] = "\033[35m";
        seqs[usz(Colour::Cyan)] = "\033[36m";
        seqs[usz(Colour::White)] = "\033[37m";
        seqs[usz(Colour::Default)] = "\033[39m";
        return seqs;
    }();

    bool enabled;

public:
    constexpr Colours(bool use_colours) : enabled{use_colours} {}

    constexpr auto operator()(Colour c) const -> std::string_view {
        return enabled ? sequences[usz(c)] : ""sv;
    }
};

/// Round \p value up to a multiple of \p align.
template <typename T = usz>
constexpr T AlignTo(T value, T align) {
    MICA_ASSERT(align != 0, "Alignment of zero");
    return (value + align - 1) / align * align;
}

/// Number of digits needed to print \p number.
auto NumberWidth(usz number, usz base = 10) -> usz;

/// Replace every occurrence of \p from in \p str.
void ReplaceAll(std::string& str, std::string_view from, std::string_view to);
} // namespace mica::utils

template <mica::detail::FormattableEnum T>
struct fmt::formatter<T> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(T t, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(StringifyEnum(t), ctx);
    }
};

#endif // MICA_UTILS_HH
