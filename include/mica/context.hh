#ifndef MICA_CONTEXT_HH
#define MICA_CONTEXT_HH

#include <mica/file.hh>
#include <mica/forward.hh>
#include <mica/location.hh>
#include <mica/utils.hh>

namespace mica {
/// State shared by every stage of a compilation: source files, the
/// target, the options and the error flag.
class Context {
public:
    enum OptionColour : bool {
        DoNotUseColour,
        UseColour = true,
    };

    enum OptionPrintAST : bool {
        DoNotPrintAST,
        PrintAST = true,
    };

    /// Warn when an aggregate without a layout is passed as an opaque value.
    enum OptionWarnOpaqueLayout : bool {
        DoNotWarnOpaqueLayout,
        WarnOpaqueLayout = true,
    };

    struct Options {
        OptionColour colour;
        OptionPrintAST print_ast;
        OptionWarnOpaqueLayout warn_opaque_layout;
    };

private:
    std::vector<std::unique_ptr<File>> _files;
    const Target* _target;
    Options _options;

    /// Only ever goes from false to true. Diagnostics set it through
    /// a const Context.
    mutable bool _error = false;

public:
    Context(const Target* target, Options options)
        : _target(target), _options(options) {}

    Context(const Context&) = delete;
    auto operator=(const Context&) -> Context& = delete;

    /// Register a source file. \p contents is any range of chars.
    template <typename Range>
    auto create_file(fs::path name, Range&& contents) -> File& {
        return add_file(std::move(name), std::vector<char>(rgs::begin(contents), rgs::end(contents)));
    }

    [[nodiscard]] auto files() const -> const std::vector<std::unique_ptr<File>>& { return _files; }
    [[nodiscard]] auto target() const -> const Target* { return _target; }

    [[nodiscard]] bool has_error() const { return _error; }
    void set_error() const { _error = true; }

    [[nodiscard]] auto option_use_colour() const -> bool { return _options.colour; }
    [[nodiscard]] auto option_print_ast() const -> bool { return _options.print_ast; }
    [[nodiscard]] auto option_warn_opaque_layout() const -> bool { return _options.warn_opaque_layout; }

private:
    auto add_file(fs::path name, std::vector<char> contents) -> File&;
};
} // namespace mica

#endif // MICA_CONTEXT_HH
