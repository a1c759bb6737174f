#ifndef MICA_AST_PRINTER_HH
#define MICA_AST_PRINTER_HH

#include <mica/location.hh>
#include <mica/type.hh>
#include <mica/utils.hh>

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mica::utils {
/// Tree printer base.
///
/// \c Derived must provide `operator()(const Child&, std::string leading_text)`
/// for every child type it passes to PrintChildren().
template <typename Derived>
struct ASTPrinter {
    using enum Colour;

    static constexpr Colour base_colour{White};
    static constexpr Colour name_colour{Reset};
    static constexpr Colour type_colour{Cyan};

    std::string out;
    bool use_colour = true;
    Colours C{use_colour};

    ASTPrinter(bool should_use_colour) : use_colour{should_use_colour}, C{should_use_colour} {}

    /// Print basic information about an AST node.
    void PrintBasicNode(
        std::string_view node_name,
        Location location,
        const std::optional<Type>& type,
        bool print_newline = true
    ) {
        PrintBasicHeader(node_name, location);
        PrintType(type, print_newline);
    }

    /// Print the type if there is one and end the header.
    void PrintType(const std::optional<Type>& type, bool print_newline = true) {
        if (type) out += fmt::format(" {}{}", C(type_colour), *type);
        out += fmt::format("{}", C(Reset));
        if (print_newline) out += "\n";
    }

    /// Print the start of the header of an AST node.
    /// Example: Cond <69>
    void PrintBasicHeader(std::string_view node_name, Location location) {
        out += fmt::format("{}{} {}", C(name_colour), node_name, C(base_colour));
        if (location.is_valid()) out += fmt::format("<{}>", location.pos);
        else out += "<builtin>";
    }

    /// Print the children of a node.
    template <typename Child>
    void PrintChildren(std::span<const Child> children, std::string leading_text) {
        for (usz i = 0; i < children.size(); i++) {
            const bool last = i == children.size() - 1;

            /// Print the leading text.
            out += fmt::format("{}{}{}", C(base_colour), leading_text, last ? "└─" : "├─");

            /// Print the child.
            static_cast<Derived*>(this)->operator()(children[i], leading_text + (last ? "  " : "│ "));
        }
    }

    template <typename Child>
    void PrintChildren(const std::vector<Child>& vec, std::string leading_text) {
        PrintChildren(std::span<const Child>{vec}, std::move(leading_text));
    }
};
} // namespace mica::utils

#endif // MICA_AST_PRINTER_HH
