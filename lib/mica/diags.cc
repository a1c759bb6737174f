#include <mica/context.hh>
#include <mica/diags.hh>
#include <mica/utils/platform.hh>

#include <algorithm>
#include <cstdlib>
#include <string>
#include <string_view>

using Kind = mica::Diag::Kind;
using mica::utils::Colour;

namespace {
constexpr auto KindColour(Kind kind) -> Colour {
    switch (kind) {
        case Kind::None: return Colour::Reset;
        case Kind::Note: return Colour::Green;
        case Kind::Warning: return Colour::Yellow;
        case Kind::Error:
        case Kind::FError: return Colour::Red;
        case Kind::ICError: return Colour::Magenta;
    }
    MICA_UNREACHABLE();
}

/// Expand tabs so that the underline lines up with the excerpt.
auto Untab(const char* begin, const char* end) -> std::string {
    std::string s{begin, end};
    mica::utils::ReplaceAll(s, "\t", "    ");
    return s;
}
} // namespace

void mica::detail::AssertFail(std::string&& msg) {
    Diag::ICE("{}", msg);
}

bool mica::Diag::colour() const {
    return context ? context->option_use_colour() : platform::StderrIsTerminal();
}

void mica::Diag::exit_if_fatal() const {
    switch (kind) {
        case Kind::ICError:
            platform::PrintBacktrace();
            std::exit(ICE_EXIT_CODE);
        case Kind::FError:
            std::exit(FATAL_EXIT_CODE);
        default:
            return;
    }
}

/// Print '<file>:<line>:<col>: <Kind>: <message>', leaving out what
/// the location cannot tell us.
void mica::Diag::print_header() const {
    utils::Colours C{colour()};
    if (context and where.seekable(context)) {
        const auto [line, col] = where.seek_line_column(context);
        fmt::print(stderr, "{}{}:{}:{}: ", C(Colour::Bold), context->files()[where.file_id]->path().string(), line, col);
    } else if (context and where.is_valid() and where.file_id < context->files().size()) {
        fmt::print(stderr, "{}{}: ", C(Colour::Bold), context->files()[where.file_id]->path().string());
    }

    fmt::print(stderr, "{}{}{}: {}{}\n", C(Colour::Bold), C(KindColour(kind)), kind, C(Colour::Reset), message);
}

/// Print the source line with the range highlighted and underlined.
void mica::Diag::print_excerpt() const {
    if (not context or not where.seekable(context)) return;

    utils::Colours C{colour()};
    const auto loc = where.seek(context);
    const char* range_begin = loc.line_start + (loc.col - 1);
    const char* range_end = std::min(range_begin + where.len, loc.line_end);

    const auto before = Untab(loc.line_start, range_begin);
    const auto range = Untab(range_begin, range_end);
    const auto after = Untab(range_end, loc.line_end);
    const auto highlight = fmt::format("{}{}", C(Colour::Bold), C(KindColour(kind)));

    fmt::print(stderr, " {} | {}{}{}{}{}\n", loc.line, before, highlight, range, C(Colour::Reset), after);

    // Ranges that cross a line break are highlighted but not underlined.
    if (std::find(loc.line_start, loc.line_end, '\n') != loc.line_end) return;
    const auto gutter = utils::NumberWidth(loc.line) + 4;
    fmt::print(
        stderr,
        "{}{}{}{}\n",
        std::string(gutter + before.size(), ' '),
        highlight,
        std::string(std::max<usz>(range.size(), 1), '~'),
        C(Colour::Reset)
    );
}

void mica::Diag::print() {
    if (kind == Kind::None) return;

    for (auto& a : attachments)
        if (a.before) a.diag->print();

    if (kind == Kind::Error and context) context->set_error();
    print_header();
    print_excerpt();

    for (auto& a : attachments)
        if (not a.before) a.diag->print();
    attachments.clear();

    exit_if_fatal();
    kind = Kind::None;
}
