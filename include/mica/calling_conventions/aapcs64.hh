#ifndef MICA_CALLING_CONVENTION_AAPCS64_HH
#define MICA_CALLING_CONVENTION_AAPCS64_HH

#include <mica/calling_convention.hh>

namespace mica::cconv::aapcs64 {
/// Structs larger than this are passed indirectly, unless they can be
/// packed.
constexpr usz MaxDirectAggregateBytes = 16;

/// The type two 64-bit fields are packed into.
auto PackedPairType() -> NativeType;

/// Check if a struct consists of exactly two i64 or pointer fields.
bool IsPackable(std::span<const NativeType> fields);

/// Check if a struct is passed through a pointer.
bool IsLarge(std::span<const NativeType> fields);

/// Pass a struct of two 64-bit fields as `[2 x i64]`.
class PackTwoI64Structs final : public StructLoweringRule {
public:
    auto name() const -> std::string_view override { return "PackTwoI64Structs"; }
    bool applies(std::span<const NativeType> fields) const override { return IsPackable(fields); }
    auto lower_param(const NativeType& type, std::span<const NativeType> fields) const -> std::vector<NativeParam> override;
    auto lower_arg(const NativeArg& arg, std::span<const NativeType> fields, LoweringState state) const -> LoweredArgs override;
    bool indirect_return() const override { return false; }
};

/// Pass a large struct as a plain pointer to a copy.
class LargeStructIndirect final : public StructLoweringRule {
public:
    auto name() const -> std::string_view override { return "LargeStructIndirect"; }
    bool applies(std::span<const NativeType> fields) const override { return IsLarge(fields); }
    auto lower_param(const NativeType& type, std::span<const NativeType> fields) const -> std::vector<NativeParam> override;
    auto lower_arg(const NativeArg& arg, std::span<const NativeType> fields, LoweringState state) const -> LoweredArgs override;
    bool indirect_return() const override { return true; }
};

/// The rules of this convention, in the order they are tried.
auto Rules() -> std::vector<std::unique_ptr<StructLoweringRule>>;
} // namespace mica::cconv::aapcs64

#endif // MICA_CALLING_CONVENTION_AAPCS64_HH
