#ifndef MICA_LOCATION_HH
#define MICA_LOCATION_HH

#include <mica/utils.hh>

#include <algorithm>

namespace mica {
class Context;

/// A decoded source location.
struct LocInfo {
    usz line{};
    usz col{};
    const char* line_start{};
    const char* line_end{};
};

/// A short decoded source location.
struct LocInfoShort {
    usz line{};
    usz col{};
};

/// Start and end of a decoded source range. The end is inclusive.
struct LocSpan {
    LocInfoShort start{};
    LocInfoShort end{};
};

/// A source range in a file.
///
/// A location with length zero is invalid; nodes injected by the
/// compiler (built-in operators, for instance) carry one.
struct Location {
    u32 pos{};
    u16 len{};

    /// Files are owned by the Context and identified with this number.
    u16 file_id{};

    Location() = default;
    Location(u32 position, u16 length, u16 file_id_)
        : pos(position), len(length), file_id(file_id_) {}

    /// Create a new location that spans two locations.
    Location(Location a, Location b) {
        if (not a.is_valid()) {
            *this = b;
            return;
        }

        *this = a;
        if (a.file_id != b.file_id or not b.is_valid()) return;
        pos = std::min<u32>(a.pos, b.pos);
        len = u16(std::max<u32>(a.pos + a.len, b.pos + b.len) - pos);
    }

    auto operator==(const Location other) const -> bool {
        return file_id == other.file_id and pos == other.pos and len == other.len;
    }

    /// Strict ordering by file, then position, then length. Invalid
    /// locations order after every valid one.
    [[nodiscard]]
    auto precedes(const Location other) const -> bool {
        if (is_valid() != other.is_valid()) return is_valid();
        if (file_id != other.file_id) return file_id < other.file_id;
        if (pos != other.pos) return pos < other.pos;
        return len < other.len;
    }

    /// Seek to a source location.
    [[nodiscard]]
    auto seek(const Context* ctx) const -> LocInfo;

    /// Seek to a source location, but only return the line and column.
    [[nodiscard]]
    auto seek_line_column(const Context* ctx) const -> LocInfoShort;

    /// Decode the start and end line and column of this range.
    [[nodiscard]]
    auto seek_span(const Context* ctx) const -> LocSpan;

    /// Check if the source location is seekable.
    [[nodiscard]]
    auto seekable(const Context* ctx) const -> bool;

    [[nodiscard]]
    auto is_valid() const -> bool { return len != 0; }
};
} // namespace mica

#endif // MICA_LOCATION_HH
