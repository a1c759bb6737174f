#ifndef MICA_DIAGS_HH
#define MICA_DIAGS_HH

#include <mica/forward.hh>
#include <mica/location.hh>
#include <mica/utils.hh>

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mica {
/// A diagnostic.
///
/// Diagnostics are printed to stderr when they are destroyed, so the
/// usual way to report something is to create one and drop it. Call
/// suppress() to discard a diagnostic without printing it, or move it
/// elsewhere to delay printing.
///
/// Errors set the error flag of the context they belong to. Internal
/// compiler errors and fatal errors terminate the process after they
/// have been printed.
class Diag {
public:
    enum struct Kind {
        None,
        Note,
        Warning,
        Error,
        FError,  ///< Problem with the environment, not with the program.
        ICError, ///< Bug in the compiler.
    };

    static constexpr int ICE_EXIT_CODE = 17;
    static constexpr int FATAL_EXIT_CODE = 18;

private:
    struct Attachment {
        std::unique_ptr<Diag> diag;
        bool before;
    };

    Kind kind = Kind::None;
    const Context* context{};
    Location where{};
    std::string message{};
    std::vector<Attachment> attachments{};

    Diag(Kind k, const Context* ctx, Location loc, std::string msg)
        : kind(k), context(ctx), where(loc), message(std::move(msg)) {}

    template <typename... Args>
    static auto Make(Kind k, const Context* ctx, Location loc, fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag{k, ctx, loc, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    void print_header() const;
    void print_excerpt() const;
    void exit_if_fatal() const;
    [[nodiscard]] bool colour() const;

public:
    Diag() = default;
    Diag(const Diag&) = delete;
    auto operator=(const Diag&) -> Diag& = delete;

    Diag(Diag&& other) noexcept
        : kind(std::exchange(other.kind, Kind::None)),
          context(other.context),
          where(other.where),
          message(std::move(other.message)),
          attachments(std::move(other.attachments)) {}

    auto operator=(Diag&& other) noexcept -> Diag& {
        if (this != &other) {
            print();
            kind = std::exchange(other.kind, Kind::None);
            context = other.context;
            where = other.where;
            message = std::move(other.message);
            attachments = std::move(other.attachments);
        }
        return *this;
    }

    ~Diag() { print(); }

    /// Print \p diag together with this diagnostic.
    void attach(Diag&& diag, bool print_before = false) {
        attachments.push_back({std::make_unique<Diag>(std::move(diag)), print_before});
    }

    /// Print the diagnostic now instead of on destruction.
    void print();

    void suppress() { kind = Kind::None; }

    [[nodiscard]] auto severity() const -> Kind { return kind; }
    [[nodiscard]] auto text() const -> std::string_view { return message; }

    template <typename... Args>
    static auto Note(const Context* ctx, Location where, fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Make(Kind::Note, ctx, where, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static auto Warning(const Context* ctx, Location where, fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Make(Kind::Warning, ctx, where, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static auto Error(const Context* ctx, Location where, fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Make(Kind::Error, ctx, where, fmt, std::forward<Args>(args)...);
    }

    /// Report a compiler bug and exit with ICE_EXIT_CODE.
    template <typename... Args>
    [[noreturn]] static void ICE(fmt::format_string<Args...> fmt, Args&&... args) {
        Make(Kind::ICError, nullptr, {}, fmt, std::forward<Args>(args)...).print();
        std::exit(ICE_EXIT_CODE);
    }

    /// Report an unrecoverable problem and exit with FATAL_EXIT_CODE.
    template <typename... Args>
    [[noreturn]] static void Fatal(fmt::format_string<Args...> fmt, Args&&... args) {
        Make(Kind::FError, nullptr, {}, fmt, std::forward<Args>(args)...).print();
        std::exit(FATAL_EXIT_CODE);
    }
};

[[nodiscard]] constexpr auto StringifyEnum(Diag::Kind kind) -> std::string_view {
    switch (kind) {
        case Diag::Kind::None: return "Diagnostic";
        case Diag::Kind::Note: return "Note";
        case Diag::Kind::Warning: return "Warning";
        case Diag::Kind::Error: return "Error";
        case Diag::Kind::FError: return "Fatal Error";
        case Diag::Kind::ICError: return "Internal Compiler Error";
    }
    MICA_UNREACHABLE();
}
} // namespace mica

#endif // MICA_DIAGS_HH
