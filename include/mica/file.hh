#ifndef MICA_FILE_HH
#define MICA_FILE_HH

#include <mica/forward.hh>
#include <mica/utils.hh>

#include <vector>

namespace mica {
/// Source text handed to the compiler. Files are created and owned
/// by a Context and never change afterwards.
class File {
    friend Context;

    fs::path _path;
    std::vector<char> _bytes;
    u16 _id{};

    File(fs::path path, std::vector<char>&& bytes, u16 id)
        : _path(std::move(path)), _bytes(std::move(bytes)), _id(id) {}

public:
    File(const File&) = delete;
    auto operator=(const File&) -> File& = delete;

    [[nodiscard]] auto data() const -> const char* { return _bytes.data(); }
    [[nodiscard]] auto size() const -> usz { return _bytes.size(); }
    [[nodiscard]] auto path() const -> const fs::path& { return _path; }

    /// Index of this file in Context::files(); Location::file_id refers to it.
    [[nodiscard]] auto file_id() const -> u16 { return _id; }
};
} // namespace mica

#endif // MICA_FILE_HH
