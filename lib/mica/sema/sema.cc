#include <mica/context.hh>
#include <mica/diags.hh>
#include <mica/sema.hh>

namespace mica::sema {
auto Analyse(const Module& mod) -> StageResult {
    auto res = RegisterOperators(mod);
    for (auto stage : {
             CheckDuplicateNames,
             ResolveReferences,
             RewriteExpressions,
             ResolveTypes,
             Simplify,
             CheckMemberErrors,
         }) res = res >>= stage;

    if (res.is_diag()) {
        auto errors = res.diag();
        SortDiagnostics(errors);
        return errors;
    }

    return res;
}
} // namespace mica::sema

auto mica::Sema::Analyse(Context* ctx, const Module& mod) -> std::optional<Module> {
    Sema s{ctx};
    return s.run(mod);
}

auto mica::Sema::run(const Module& mod) -> std::optional<Module> {
    auto res = sema::Analyse(mod);
    if (res.is_diag()) {
        sema::Report(context, res.diag());
        return std::nullopt;
    }

    if (context->option_print_ast()) fmt::print("{}", res->tree(context->option_use_colour()));
    return std::move(*res);
}
