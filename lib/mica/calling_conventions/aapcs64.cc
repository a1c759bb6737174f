#include <mica/calling_conventions/aapcs64.hh>

namespace mica::cconv::aapcs64 {
auto PackedPairType() -> NativeType {
    return NativeType::Array(2, NativeType::I64());
}

bool IsPackable(std::span<const NativeType> fields) {
    return fields.size() == 2 and rgs::all_of(fields, [](const NativeType& t) {
        return t.is_integer(64) or t.is_pointer();
    });
}

bool IsLarge(std::span<const NativeType> fields) {
    return StructLayoutTable::FieldBytes(fields) > MaxDirectAggregateBytes and not IsPackable(fields);
}

auto PackTwoI64Structs::lower_param(const NativeType&, std::span<const NativeType>) const -> std::vector<NativeParam> {
    return {{PackedPairType()}};
}

auto PackTwoI64Structs::lower_arg(
    const NativeArg& arg,
    std::span<const NativeType> fields,
    LoweringState state
) const -> LoweredArgs {
    /// Extract both fields as i64.
    std::vector<std::string> words;
    for (usz i = 0; i < fields.size(); i++) {
        auto reg = state.take_register();
        state.emit(fmt::format("{} = extractvalue {} {}, {}", reg, arg.param.type, arg.value, i));
        if (fields[i].is_pointer()) {
            auto cast = state.take_register();
            state.emit(fmt::format("{} = ptrtoint ptr {} to i64", cast, reg));
            reg = std::move(cast);
        }
        words.push_back(std::move(reg));
    }

    /// Pack them into the array.
    const auto packed = PackedPairType();
    auto first = state.take_register();
    state.emit(fmt::format("{} = insertvalue {} undef, i64 {}, 0", first, packed, words[0]));
    auto second = state.take_register();
    state.emit(fmt::format("{} = insertvalue {} {}, i64 {}, 1", second, packed, first, words[1]));
    return {{{std::move(second), {packed}}}, std::move(state)};
}

auto LargeStructIndirect::lower_param(const NativeType&, std::span<const NativeType>) const -> std::vector<NativeParam> {
    return {{NativeType::Pointer()}};
}

auto LargeStructIndirect::lower_arg(
    const NativeArg& arg,
    std::span<const NativeType>,
    LoweringState state
) const -> LoweredArgs {
    auto slot = Spill(arg, state);
    return {{{std::move(slot), {NativeType::Pointer()}}}, std::move(state)};
}

auto Rules() -> std::vector<std::unique_ptr<StructLoweringRule>> {
    std::vector<std::unique_ptr<StructLoweringRule>> rules;
    rules.push_back(std::make_unique<PackTwoI64Structs>());
    rules.push_back(std::make_unique<LargeStructIndirect>());
    return rules;
}
} // namespace mica::cconv::aapcs64
