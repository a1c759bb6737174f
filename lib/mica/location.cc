#include <mica/context.hh>
#include <mica/location.hh>
#include <mica/utils.hh>

namespace {
/// Count lines and columns up to (not including) an offset. Both are 1-based.
auto LineColumnAt(const char* data, mica::usz offset) -> mica::LocInfoShort {
    mica::LocInfoShort info{1, 1};
    for (const char* d = data; d < data + offset; ++d) {
        if (*d == '\n') {
            ++info.line;
            info.col = 1;
        } else ++info.col;
    }
    return info;
}
} // namespace

bool mica::Location::seekable(const mica::Context* ctx) const {
    auto& files = ctx->files();
    if (file_id >= files.size()) return false;
    const auto* f = files[file_id].get();
    return is_valid() and pos + len <= f->size();
}

/// Seek to a source location. The location must be valid.
auto mica::Location::seek(const mica::Context* ctx) const -> LocInfo {
    MICA_ASSERT(ctx);
    MICA_ASSERT(seekable(ctx), "Cannot seek Location that is not seekable");

    LocInfo info{};
    const auto* f = ctx->files().at(file_id).get();
    const char* const data = f->data();
    const char* const end = data + f->size();

    // A newline belongs to the line it ends, so a location that starts on
    // one collects the line before it.
    info.line_start = data + pos;
    if (info.line_start > data and *info.line_start == '\n')
        --info.line_start;
    while (info.line_start > data and *info.line_start != '\n')
        --info.line_start;
    if (*info.line_start == '\n') ++info.line_start;

    info.line_end = data + pos + len;
    while (info.line_end < end and *info.line_end != '\n')
        ++info.line_end;

    auto [line, col] = LineColumnAt(data, pos);
    info.line = line;
    info.col = col;
    return info;
}

auto mica::Location::seek_line_column(const mica::Context* ctx) const -> LocInfoShort {
    MICA_ASSERT(ctx);
    MICA_ASSERT(seekable(ctx), "Cannot seek Location that is not seekable");
    return LineColumnAt(ctx->files().at(file_id)->data(), pos);
}

auto mica::Location::seek_span(const mica::Context* ctx) const -> LocSpan {
    MICA_ASSERT(ctx);
    MICA_ASSERT(seekable(ctx), "Cannot seek Location that is not seekable");
    const char* data = ctx->files().at(file_id)->data();
    return {LineColumnAt(data, pos), LineColumnAt(data, pos + len - 1u)};
}
