#include <mica/target.hh>

#include <cctype>

auto mica::Target::FromHint(std::optional<std::string_view> hint) -> const Target* {
    if (not hint) return generic;

    std::string lower{*hint};
    rgs::transform(lower, lower.begin(), [](unsigned char c) { return char(std::tolower(c)); });

    if (lower.contains("x86_64") or lower.contains("amd64")) return x86_64_linux;
    if (lower.contains("aarch64") or lower.contains("arm64")) {
        if (lower.contains("apple") or lower.contains("darwin")) return aarch64_macos;
        return aarch64_linux;
    }
    return generic;
}
