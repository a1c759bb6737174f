#include <mica/utils.hh>

auto mica::utils::NumberWidth(usz number, usz base) -> usz {
    MICA_ASSERT(base > 1);
    usz width = 1;
    while (number >= base) {
        number /= base;
        ++width;
    }
    return width;
}

void mica::utils::ReplaceAll(
    std::string& str,
    std::string_view from,
    std::string_view to
) {
    if (from.empty()) return;
    for (usz i = 0; (i = str.find(from, i)) != std::string::npos; i += to.size())
        str.replace(i, from.size(), to);
}
