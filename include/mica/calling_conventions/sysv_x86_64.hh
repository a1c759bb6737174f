#ifndef MICA_CALLING_CONVENTION_SYSV_X86_64_HH
#define MICA_CALLING_CONVENTION_SYSV_X86_64_HH

#include <mica/calling_convention.hh>

namespace mica::cconv::sysv {
/// Structs whose fields add up to at most this many bytes are passed
/// in registers, one field at a time.
constexpr usz MaxRegisterAggregateBytes = 16;

/// Check if a struct with these fields is passed in registers.
bool FitsInRegisters(std::span<const NativeType> fields);

/// Pass a small struct as its fields.
class SplitSmallStructs final : public StructLoweringRule {
public:
    auto name() const -> std::string_view override { return "SplitSmallStructs"; }
    bool applies(std::span<const NativeType> fields) const override;
    auto lower_param(const NativeType& type, std::span<const NativeType> fields) const -> std::vector<NativeParam> override;
    auto lower_arg(const NativeArg& arg, std::span<const NativeType> fields, LoweringState state) const -> LoweredArgs override;
    bool indirect_return() const override { return false; }
};

/// Pass a large struct as a pointer to a copy on the caller's stack.
class LargeStructByval final : public StructLoweringRule {
public:
    auto name() const -> std::string_view override { return "LargeStructByval"; }
    bool applies(std::span<const NativeType> fields) const override;
    auto lower_param(const NativeType& type, std::span<const NativeType> fields) const -> std::vector<NativeParam> override;
    auto lower_arg(const NativeArg& arg, std::span<const NativeType> fields, LoweringState state) const -> LoweredArgs override;
    bool indirect_return() const override { return true; }
};

/// The rules of this convention, in the order they are tried.
auto Rules() -> std::vector<std::unique_ptr<StructLoweringRule>>;
} // namespace mica::cconv::sysv

#endif // MICA_CALLING_CONVENTION_SYSV_X86_64_HH
