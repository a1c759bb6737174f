#include <mica/calling_conventions/sysv_x86_64.hh>

namespace mica::cconv::sysv {
bool FitsInRegisters(std::span<const NativeType> fields) {
    return StructLayoutTable::FieldBytes(fields) <= MaxRegisterAggregateBytes;
}

bool SplitSmallStructs::applies(std::span<const NativeType> fields) const {
    return not fields.empty() and FitsInRegisters(fields);
}

auto SplitSmallStructs::lower_param(const NativeType&, std::span<const NativeType> fields) const -> std::vector<NativeParam> {
    std::vector<NativeParam> params;
    for (const auto& f : fields) params.push_back({f});
    return params;
}

auto SplitSmallStructs::lower_arg(
    const NativeArg& arg,
    std::span<const NativeType> fields,
    LoweringState state
) const -> LoweredArgs {
    std::vector<NativeArg> args;
    for (usz i = 0; i < fields.size(); i++) {
        auto reg = state.take_register();
        state.emit(fmt::format("{} = extractvalue {} {}, {}", reg, arg.param.type, arg.value, i));
        args.push_back({std::move(reg), {fields[i]}});
    }
    return {std::move(args), std::move(state)};
}

bool LargeStructByval::applies(std::span<const NativeType> fields) const {
    return not fields.empty() and not FitsInRegisters(fields);
}

auto LargeStructByval::lower_param(const NativeType& type, std::span<const NativeType>) const -> std::vector<NativeParam> {
    return {NativeParam::ByVal(type)};
}

auto LargeStructByval::lower_arg(
    const NativeArg& arg,
    std::span<const NativeType>,
    LoweringState state
) const -> LoweredArgs {
    auto slot = Spill(arg, state);
    return {{{std::move(slot), NativeParam::ByVal(arg.param.type)}}, std::move(state)};
}

auto Rules() -> std::vector<std::unique_ptr<StructLoweringRule>> {
    std::vector<std::unique_ptr<StructLoweringRule>> rules;
    rules.push_back(std::make_unique<SplitSmallStructs>());
    rules.push_back(std::make_unique<LargeStructByval>());
    return rules;
}
} // namespace mica::cconv::sysv
