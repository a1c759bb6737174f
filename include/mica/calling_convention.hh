#ifndef MICA_CALLING_CONVENTION_HH
#define MICA_CALLING_CONVENTION_HH

#include <mica/forward.hh>
#include <mica/location.hh>
#include <mica/native_type.hh>
#include <mica/struct_layout.hh>
#include <mica/utils.hh>

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mica {
/// A parameter of a lowered signature.
struct NativeParam {
    enum struct Attribute {
        None,

        /// Pointer to a copy of the argument made by the caller.
        ByVal,

        /// Hidden pointer to the memory the callee writes its result to.
        SRet,
    };

    NativeType type;
    Attribute attribute = Attribute::None;

    /// The struct a byval or sret pointer points to.
    std::optional<NativeType> pointee{};
    usz align{};

    static auto ByVal(NativeType pointee) -> NativeParam {
        return {NativeType::Pointer(), Attribute::ByVal, std::move(pointee), 8};
    }

    static auto SRet(NativeType pointee) -> NativeParam {
        return {NativeType::Pointer(), Attribute::SRet, std::move(pointee), 8};
    }

    /// E.g. `ptr byval(%struct.Big) align 8`.
    [[nodiscard]] auto string() const -> std::string;

    bool operator==(const NativeParam&) const = default;
};

/// A value passed at a call site.
struct NativeArg {
    std::string value;
    NativeParam param;

    /// E.g. `i64 %3`.
    [[nodiscard]] auto string() const -> std::string;
};

/// State threaded through lowering: the next free virtual register and
/// the instructions emitted so far.
///
/// Lowering operations take a state and return the updated one; they
/// never share one.
struct LoweringState {
    usz next_register{};
    std::vector<std::string> lines{};

    /// Take the next register, e.g. `%4`.
    auto take_register() -> std::string { return fmt::format("%{}", next_register++); }

    /// Append an instruction.
    void emit(std::string line) { lines.push_back(fmt::format("  {}", line)); }
};

struct LoweredArgs {
    std::vector<NativeArg> args;
    LoweringState state;
};

struct LoweredReturn {
    NativeType type;

    /// The hidden result pointer, if the value is returned indirectly.
    std::optional<NativeParam> sret{};
};

struct SretCall {
    /// Register holding the loaded result.
    std::string result;
    LoweringState state;
};

/// One way of passing a struct across a call boundary.
///
/// A rule sees the flattened field list of the struct. Strategies try
/// their rules in order and use the first one that applies.
class StructLoweringRule {
public:
    virtual ~StructLoweringRule() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Check whether this rule handles a struct with these fields.
    [[nodiscard]] virtual bool applies(std::span<const NativeType> fields) const = 0;

    /// Lower a struct parameter.
    [[nodiscard]] virtual auto lower_param(
        const NativeType& type,
        std::span<const NativeType> fields
    ) const -> std::vector<NativeParam> = 0;

    /// Lower a struct argument, emitting any instructions needed.
    [[nodiscard]] virtual auto lower_arg(
        const NativeArg& arg,
        std::span<const NativeType> fields,
        LoweringState state
    ) const -> LoweredArgs = 0;

    /// Whether a struct this rule applies to is returned through a
    /// hidden pointer.
    [[nodiscard]] virtual bool indirect_return() const = 0;
};

/// Emits a call instruction for emit_sret_call().
using EmitCallCallback = std::function<std::string(
    std::string_view callee,
    const NativeType& return_type,
    std::span<const NativeArg> args
)>;

/// The struct passing policy of an architecture.
class AbiStrategy {
    std::string_view _name;
    std::vector<std::unique_ptr<StructLoweringRule>> rules;

public:
    AbiStrategy(std::string_view name, std::vector<std::unique_ptr<StructLoweringRule>> rules_)
        : _name(name), rules(std::move(rules_)) {}

    /// Get the strategy for a target.
    static auto For(const Target* target) -> const AbiStrategy&;

    [[nodiscard]] auto name() const -> std::string_view { return _name; }

    /// Get the rule that handles a struct type, if any. Types without
    /// a layout are passed as they are.
    [[nodiscard]] auto rule_for(const NativeType& type, const StructLayoutTable& layouts) const -> const StructLoweringRule*;

    /// Lower the parameter types of a signature.
    [[nodiscard]] auto lower_param_types(
        std::span<const NativeType> params,
        const StructLayoutTable& layouts
    ) const -> std::vector<NativeParam>;

    /// Lower the arguments of a call.
    [[nodiscard]] auto lower_args(
        std::span<const NativeArg> args,
        const StructLayoutTable& layouts,
        LoweringState state
    ) const -> LoweredArgs;

    /// Check whether a value of this type is returned through a hidden
    /// result pointer.
    [[nodiscard]] bool needs_sret(const NativeType& type, const StructLayoutTable& layouts) const;

    /// Lower a return type: `void` plus an sret parameter if needed.
    [[nodiscard]] auto lower_return_type(const NativeType& type, const StructLayoutTable& layouts) const -> LoweredReturn;

    /// Emit a call to a function that returns through a hidden pointer:
    /// allocate the result, pass it first, call, and load the result.
    [[nodiscard]] auto emit_sret_call(
        std::string_view callee,
        const NativeType& return_type,
        std::span<const NativeArg> args,
        LoweringState state,
        const EmitCallCallback& emit_call
    ) const -> SretCall;
};

/// Warn about every struct type in a signature that has no layout and
/// will be passed as an opaque value. Does nothing unless enabled in
/// the context.
void WarnOpaqueAggregates(
    const Context* ctx,
    Location where,
    std::span<const NativeType> types,
    const StructLayoutTable& layouts
);

namespace cconv {
/// Copy an argument to a new stack slot.
///
/// \return The register holding the address of the slot.
auto Spill(const NativeArg& arg, LoweringState& state) -> std::string;
} // namespace cconv

[[nodiscard]] constexpr auto StringifyEnum(NativeParam::Attribute a) -> std::string_view {
    switch (a) {
        case NativeParam::Attribute::None: return "none";
        case NativeParam::Attribute::ByVal: return "byval";
        case NativeParam::Attribute::SRet: return "sret";
    }
    MICA_UNREACHABLE();
}
} // namespace mica

#endif // MICA_CALLING_CONVENTION_HH
