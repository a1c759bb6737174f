#ifndef MICA_SEMA_HH
#define MICA_SEMA_HH

#include <mica/ast.hh>
#include <mica/context.hh>
#include <mica/sema/errors.hh>
#include <mica/utils.hh>

#include <optional>

namespace mica::sema {
/// Inject the builtin operators and hoist the operators declared in
/// protocols and instances to the top level.
auto RegisterOperators(const Module& mod) -> StageResult;

/// Report colliding top-level names.
auto CheckDuplicateNames(const Module& mod) -> StageResult;

/// Bind every reference to its declaration and assign declaration ids.
auto ResolveReferences(const Module& mod) -> StageResult;

/// Turn flat term sequences into nested applications.
auto RewriteExpressions(const Module& mod) -> StageResult;

/// Assign a type to every expression and term.
auto ResolveTypes(const Module& mod) -> StageResult;

/// Remove single-term expression wrappers.
auto Simplify(const Module& mod) -> StageResult;

/// Fail if any member error placeholder survived.
auto CheckMemberErrors(const Module& mod) -> StageResult;

/// Run all stages in order.
///
/// On failure, the errors are sorted by location.
auto Analyse(const Module& mod) -> StageResult;
} // namespace mica::sema

namespace mica {
class Sema {
    Context* const context;

    Sema(Context* ctx) : context(ctx) {}

public:
    /// Analyse a module and report any errors as diagnostics.
    ///
    /// \return The resolved module, or nothing if there was an error.
    static auto Analyse(Context* ctx, const Module& mod) -> std::optional<Module>;

private:
    auto run(const Module& mod) -> std::optional<Module>;
};
} // namespace mica

#endif // MICA_SEMA_HH
