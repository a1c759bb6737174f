#include <mica/calling_convention.hh>
#include <mica/calling_conventions/aapcs64.hh>
#include <mica/calling_conventions/sysv_x86_64.hh>
#include <mica/context.hh>
#include <mica/diags.hh>
#include <mica/target.hh>

namespace mica {
auto NativeParam::string() const -> std::string {
    switch (attribute) {
        case Attribute::None: return type.string();
        case Attribute::ByVal:
        case Attribute::SRet:
            MICA_ASSERT(pointee.has_value(), "{} parameter without pointee", StringifyEnum(attribute));
            return fmt::format("{} {}({}) align {}", type, StringifyEnum(attribute), *pointee, align);
    }
    MICA_UNREACHABLE();
}

auto NativeArg::string() const -> std::string {
    return fmt::format("{} {}", param.string(), value);
}

auto cconv::Spill(const NativeArg& arg, LoweringState& state) -> std::string {
    auto slot = state.take_register();
    state.emit(fmt::format("{} = alloca {}, align 8", slot, arg.param.type));
    state.emit(fmt::format("store {} {}, ptr {}, align 8", arg.param.type, arg.value, slot));
    return slot;
}

auto AbiStrategy::For(const Target* target) -> const AbiStrategy& {
    static const AbiStrategy x86_64{"x86_64", cconv::sysv::Rules()};
    static const AbiStrategy aarch64{"aarch64", cconv::aapcs64::Rules()};
    static const AbiStrategy generic{"generic", {}};
    if (target->is_arch_x86_64()) return x86_64;
    if (target->is_arch_aarch64()) return aarch64;
    return generic;
}

auto AbiStrategy::rule_for(
    const NativeType& type,
    const StructLayoutTable& layouts
) const -> const StructLoweringRule* {
    auto fields = layouts.fields(type);
    if (not fields or fields->empty()) return nullptr;
    auto it = rgs::find_if(rules, [&](const auto& r) { return r->applies(*fields); });
    return it == rules.end() ? nullptr : it->get();
}

auto AbiStrategy::lower_param_types(
    std::span<const NativeType> params,
    const StructLayoutTable& layouts
) const -> std::vector<NativeParam> {
    std::vector<NativeParam> lowered;
    for (const auto& p : params) {
        auto rule = rule_for(p, layouts);
        if (not rule) {
            lowered.push_back({p});
            continue;
        }

        rgs::move(rule->lower_param(p, *layouts.fields(p)), std::back_inserter(lowered));
    }
    return lowered;
}

auto AbiStrategy::lower_args(
    std::span<const NativeArg> args,
    const StructLayoutTable& layouts,
    LoweringState state
) const -> LoweredArgs {
    std::vector<NativeArg> lowered;
    for (const auto& a : args) {
        auto rule = rule_for(a.param.type, layouts);
        if (not rule) {
            lowered.push_back(a);
            continue;
        }

        auto res = rule->lower_arg(a, *layouts.fields(a.param.type), std::move(state));
        rgs::move(res.args, std::back_inserter(lowered));
        state = std::move(res.state);
    }
    return {std::move(lowered), std::move(state)};
}

bool AbiStrategy::needs_sret(const NativeType& type, const StructLayoutTable& layouts) const {
    auto rule = rule_for(type, layouts);
    return rule and rule->indirect_return();
}

auto AbiStrategy::lower_return_type(
    const NativeType& type,
    const StructLayoutTable& layouts
) const -> LoweredReturn {
    if (not needs_sret(type, layouts)) return {type};
    return {NativeType::Void(), NativeParam::SRet(type)};
}

auto AbiStrategy::emit_sret_call(
    std::string_view callee,
    const NativeType& return_type,
    std::span<const NativeArg> args,
    LoweringState state,
    const EmitCallCallback& emit_call
) const -> SretCall {
    auto slot = state.take_register();
    state.emit(fmt::format("{} = alloca {}, align 8", slot, return_type));

    std::vector<NativeArg> call_args;
    call_args.reserve(args.size() + 1);
    call_args.push_back({slot, NativeParam::SRet(return_type)});
    rgs::copy(args, std::back_inserter(call_args));
    state.emit(emit_call(callee, NativeType::Void(), call_args));

    auto result = state.take_register();
    state.emit(fmt::format("{} = load {}, ptr {}, align 8", result, return_type, slot));
    return {std::move(result), std::move(state)};
}

void WarnOpaqueAggregates(
    const Context* ctx,
    Location where,
    std::span<const NativeType> types,
    const StructLayoutTable& layouts
) {
    if (not ctx->option_warn_opaque_layout()) return;
    for (const auto& t : types) {
        if (not t.is_struct() or layouts.contains(t.struct_name())) continue;
        Diag::Warning(
            ctx,
            where,
            "No layout for struct '{}' on target {}; passing it as an opaque value",
            t.struct_name(),
            ctx->target()->name
        );
    }
}
} // namespace mica
