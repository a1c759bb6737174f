#ifndef MICA_SEMA_OPERATORS_HH
#define MICA_SEMA_OPERATORS_HH

#include <mica/ast.hh>
#include <mica/utils.hh>

#include <vector>

namespace mica::sema {
/// The operators every module starts out with.
///
///   * / %                 80  left
///   + -                   60  left
///   << >>                 55  left
///   == != < > <= >=       50  left
///   and                   40  left
///   or                    30  left
///   prefix - + not        95  right
auto BuiltinOperators() -> const std::vector<OperatorDef>&;

/// Id of an operator declaration.
auto OperatorId(std::string_view name, Arity arity) -> std::string;

/// Fixity lookup for the operators declared in a module.
class OperatorTable {
    struct Entry {
        const OperatorDef* prefix{};
        const OperatorDef* infix{};
    };

    StringMap<Entry> entries;

public:
    /// Collect the top-level operators of a module. The table refers
    /// to the module, which must outlive it.
    explicit OperatorTable(const Module& mod);

    [[nodiscard]] auto prefix(std::string_view name) const -> const OperatorDef*;
    [[nodiscard]] auto infix(std::string_view name) const -> const OperatorDef*;
    [[nodiscard]] bool contains(std::string_view name) const { return entries.contains(name); }
};
} // namespace mica::sema

#endif // MICA_SEMA_OPERATORS_HH
