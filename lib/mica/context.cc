#include <mica/context.hh>

#include <limits>

auto mica::Context::add_file(fs::path name, std::vector<char> contents) -> File& {
    MICA_ASSERT(_files.size() < std::numeric_limits<u16>::max(), "Too many source files");
    _files.emplace_back(new File{std::move(name), std::move(contents), u16(_files.size())});
    return *_files.back();
}
