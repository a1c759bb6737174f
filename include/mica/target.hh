#ifndef MICA_TARGET_HH
#define MICA_TARGET_HH

#include <mica/utils.hh>

namespace mica {
namespace detail {
struct Targets;
}

/// Information about a target.
///
/// There is one instance of \c Target for each supported target, and
/// no-one can create targets at runtime.
///
/// All type sizes and alignments are in *bits*.
class Target {
    friend mica::detail::Targets;
    constexpr Target() = default;

public:
    enum struct Arch {
        Unknown,
        X86_64,
        AArch64,
    };

    /// Create a copy of a target but change a few things.
    template <typename Callable>
    consteval auto with(Callable c) const -> Target { return c(Target{*this}); }

    /// Available targets.
    static const Target* const x86_64_linux;
    static const Target* const aarch64_linux;
    static const Target* const aarch64_macos;

    /// Architecture-neutral target. No aggregate is lowered.
    static const Target* const generic;

    /// Select a target from a target triple or architecture name.
    ///
    /// `x86_64` and `amd64` select x86_64, `aarch64` and `arm64` select
    /// AArch64 (case-insensitive, anywhere in the hint). Anything else,
    /// including no hint at all, selects the generic target.
    static auto FromHint(std::optional<std::string_view> hint) -> const Target*;

    std::string_view name;
    Arch arch;

    usz size_of_pointer;
    usz align_of_pointer;

    [[nodiscard]]
    bool is_arch_x86_64() const { return arch == Arch::X86_64; }

    [[nodiscard]]
    bool is_arch_aarch64() const { return arch == Arch::AArch64; }
};

[[nodiscard]] constexpr auto StringifyEnum(Target::Arch arch) -> std::string_view {
    switch (arch) {
        case Target::Arch::Unknown: return "unknown";
        case Target::Arch::X86_64: return "x86_64";
        case Target::Arch::AArch64: return "aarch64";
    }
    MICA_UNREACHABLE();
}

namespace detail {
struct Targets {
    static constexpr Target x86_64_linux = [] {
        Target t{};
        t.name = "x86_64-linux";
        t.arch = Target::Arch::X86_64;
        t.size_of_pointer = 64;
        t.align_of_pointer = 64;
        return t;
    }();

    static constexpr Target aarch64_linux = x86_64_linux.with([](Target t) {
        t.name = "aarch64-linux";
        t.arch = Target::Arch::AArch64;
        return t;
    });

    static constexpr Target aarch64_macos = aarch64_linux.with([](Target t) {
        t.name = "arm64-apple-darwin";
        return t;
    });

    static constexpr Target generic = x86_64_linux.with([](Target t) {
        t.name = "generic";
        t.arch = Target::Arch::Unknown;
        return t;
    });
};
} // namespace detail

constexpr inline const Target* const Target::x86_64_linux = &detail::Targets::x86_64_linux;
constexpr inline const Target* const Target::aarch64_linux = &detail::Targets::aarch64_linux;
constexpr inline const Target* const Target::aarch64_macos = &detail::Targets::aarch64_macos;
constexpr inline const Target* const Target::generic = &detail::Targets::generic;

} // namespace mica

#endif // MICA_TARGET_HH
