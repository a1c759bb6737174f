#include <mica/calling_convention.hh>
#include <mica/calling_conventions/aapcs64.hh>
#include <mica/calling_conventions/sysv_x86_64.hh>
#include <mica/context.hh>
#include <mica/struct_layout.hh>
#include <mica/target.hh>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "../test.hh"

using namespace mica;
using mica::test::Builder;
using mica::test::Check;
using mica::test::Run;
using mica::test::Same;

namespace {
auto Repeat(usz count, NativeType t) -> std::vector<NativeType> {
    return std::vector<NativeType>(count, t);
}

auto Layouts() -> StructLayoutTable {
    StructLayoutTable t;
    t.add("Pair", {NativeType::I64(), NativeType::I64()});
    t.add("Slice", {NativeType::I64(), NativeType::Pointer()});
    t.add("Small", {NativeType::I32(), NativeType::I32()});
    t.add("Triple", Repeat(3, NativeType::I64()));
    t.add("Five", Repeat(5, NativeType::I64()));
    t.add("Empty", {});
    return t;
}

auto Params(std::span<const NativeParam> params) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& p : params) out.push_back(p.string());
    return out;
}

auto Args(std::span<const NativeArg> args) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& a : args) out.push_back(a.string());
    return out;
}

auto Lines(const LoweringState& state) -> std::string {
    return fmt::format("{}", fmt::join(state.lines, "\n"));
}

auto StructArg(std::string value, std::string_view name) -> NativeArg {
    return {std::move(value), {NativeType::Struct(std::string{name})}};
}

const auto& X86_64 = AbiStrategy::For(Target::x86_64_linux);
const auto& AArch64 = AbiStrategy::For(Target::aarch64_linux);

/// ===========================================================================
///  Struct Layout Table
/// ===========================================================================
void LayoutTests() {
    Run("Layout: Builtin String", [] {
        StructLayoutTable t;
        auto fields = t.fields("String");
        return Check(fields.has_value(), "No layout for String")
           and Same(fields->size(), 2zu)
           and Same((*fields)[0], NativeType::I64())
           and Same((*fields)[1], NativeType::Pointer());
    });

    Run("Layout: Built From Type Declarations", [] {
        Context ctx{Target::x86_64_linux, test::DefaultOptions()};
        Builder b{ctx, "type Pair = { a : Int, b : RawPtr }; type Outer = { p : Pair, c : Int8 };"};
        auto mod = Builder::module({
            TypeDef{b.at("Pair"), "Pair", NativeStruct{{{"a", "Int"}, {"b", "RawPtr"}}}},
            TypeDef{b.at("Outer"), "Outer", NativeStruct{{{"p", "Pair"}, {"c", "Int8"}}}},
        });

        auto table = StructLayoutTable::Build(&ctx, mod);
        if (not Check(table.is_value(), "Building the table failed")) return false;
        auto outer = table->fields("Outer");
        return Check(outer.has_value(), "No layout for Outer")
           and Same(outer->size(), 3zu)
           and Same((*outer)[0], NativeType::I64())
           and Same((*outer)[1], NativeType::Pointer())
           and Same((*outer)[2], NativeType::I8())
           and Same(StructLayoutTable::FieldBytes(*outer), 17zu)
           and Same(table->size_of("Outer"), 24zu)
           and Same(table->align_of("Outer"), 8zu);
    });

    Run("Layout: Native Primitive Declarations", [] {
        Context ctx{Target::x86_64_linux, test::DefaultOptions()};
        Builder b{ctx, "type Word = native i32; type Wrap = { w : Word, d : Float };"};
        auto mod = Builder::module({
            TypeDef{b.at("Word"), "Word", NativePrimitive{"i32"}},
            TypeDef{b.at("Wrap"), "Wrap", NativeStruct{{{"w", "Word"}, {"d", "Float"}}}},
        });

        auto table = StructLayoutTable::Build(&ctx, mod);
        if (not Check(table.is_value(), "Building the table failed")) return false;
        auto wrap = table->fields("Wrap");
        return Check(wrap.has_value(), "No layout for Wrap")
           and Same((*wrap)[0], NativeType::I32())
           and Same((*wrap)[1], NativeType::Double())
           and Check(not table->contains("Word"), "A primitive got a struct layout");
    });

    Run("Layout: Struct Containing Itself", [] {
        Context ctx{Target::x86_64_linux, test::DefaultOptions()};
        Builder b{ctx, "type Loop = { next : Loop };"};
        auto mod = Builder::module({TypeDef{b.at("Loop"), "Loop", NativeStruct{{{"next", "Loop"}}}}});

        auto table = StructLayoutTable::Build(&ctx, mod);
        if (not Check(table.is_diag(), "Expected an error")) return false;
        auto diag = table.diag();
        const bool ok = Same(std::string{diag.text()}, "Struct 'Loop' contains itself");
        diag.suppress();
        return ok;
    });

    Run("Layout: Unknown Field Type", [] {
        Context ctx{Target::x86_64_linux, test::DefaultOptions()};
        Builder b{ctx, "type Bad = { x : Mystery };"};
        auto mod = Builder::module({TypeDef{b.at("Bad"), "Bad", NativeStruct{{{"x", "Mystery"}}}}});

        auto table = StructLayoutTable::Build(&ctx, mod);
        if (not Check(table.is_diag(), "Expected an error")) return false;
        auto diag = table.diag();
        const bool ok = Same(std::string{diag.text()}, "Unknown type 'Mystery' of field 'x' in struct 'Bad'");
        diag.suppress();
        return ok;
    });
}

/// ===========================================================================
///  x86_64 System V
/// ===========================================================================
void SysVTests() {
    Run("x86_64 SysV: Sixteen Bytes Are Split", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::Struct("Pair")};
        return Same(Params(X86_64.lower_param_types(params, t)), std::vector<std::string>{"i64", "i64"})
           and Check(not X86_64.needs_sret(NativeType::Struct("Pair"), t), "Sixteen bytes returned indirectly")
           and Same(X86_64.rule_for(NativeType::Struct("Pair"), t)->name(), "SplitSmallStructs");
    });

    Run("x86_64 SysV: Forty Bytes Are Passed Byval", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::Struct("Five")};
        return Same(
                   Params(X86_64.lower_param_types(params, t)),
                   std::vector<std::string>{"ptr byval(%struct.Five) align 8"}
               )
           and Check(X86_64.needs_sret(NativeType::Struct("Five"), t), "Forty bytes returned directly");
    });

    Run("x86_64 SysV: Threshold Is Sixteen Bytes", [] {
        bool ok = true;
        for (usz n = 1; n <= 6; n++) {
            StructLayoutTable t;
            t.add("S", Repeat(n, NativeType::I32()));
            const std::vector params{NativeType::Struct("S")};
            auto lowered = X86_64.lower_param_types(params, t);
            const bool split = n * 4 <= cconv::sysv::MaxRegisterAggregateBytes;
            ok = Same(lowered.size(), split ? n : 1zu) and ok;
            ok = Same(X86_64.needs_sret(NativeType::Struct("S"), t), not split) and ok;
        }
        return ok;
    });

    Run("x86_64 SysV: Splitting An Argument", [] {
        const auto t = Layouts();
        const std::vector args{StructArg("%v", "Pair")};
        auto res = X86_64.lower_args(args, t, LoweringState{3});
        return Same(Args(res.args), std::vector<std::string>{"i64 %3", "i64 %4"})
           and Same(
                   Lines(res.state),
                   "  %3 = extractvalue %struct.Pair %v, 0\n"
                   "  %4 = extractvalue %struct.Pair %v, 1"
               )
           and Same(res.state.next_register, 5zu);
    });

    Run("x86_64 SysV: Spilling A Byval Argument", [] {
        const auto t = Layouts();
        const std::vector args{StructArg("%big", "Five")};
        auto res = X86_64.lower_args(args, t, {});
        return Same(Args(res.args), std::vector<std::string>{"ptr byval(%struct.Five) align 8 %0"})
           and Same(
                   Lines(res.state),
                   "  %0 = alloca %struct.Five, align 8\n"
                   "  store %struct.Five %big, ptr %0, align 8"
               );
    });

    Run("x86_64 SysV: State Is Threaded Through Arguments", [] {
        const auto t = Layouts();
        const std::vector<NativeArg> args{
            StructArg("%a", "Pair"),
            {"%n", {NativeType::I32()}},
            StructArg("%b", "Five"),
        };
        auto res = X86_64.lower_args(args, t, {});
        return Same(
                   Args(res.args),
                   std::vector<std::string>{"i64 %0", "i64 %1", "i32 %n", "ptr byval(%struct.Five) align 8 %2"}
               )
           and Same(res.state.lines.size(), 4zu)
           and Same(res.state.next_register, 3zu);
    });
}

/// ===========================================================================
///  AArch64 AAPCS64
/// ===========================================================================
void AAPCS64Tests() {
    Run("AArch64: Two 64-Bit Fields Are Packed", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::Struct("Pair"), NativeType::Struct("Slice")};
        return Same(Params(AArch64.lower_param_types(params, t)), std::vector<std::string>{"[2 x i64]", "[2 x i64]"})
           and Check(not AArch64.needs_sret(NativeType::Struct("Slice"), t), "Packed struct returned indirectly");
    });

    Run("AArch64: Packing An Argument With A Pointer", [] {
        const auto t = Layouts();
        const std::vector args{StructArg("%s", "Slice")};
        auto res = AArch64.lower_args(args, t, {});
        return Same(Args(res.args), std::vector<std::string>{"[2 x i64] %4"})
           and Same(
                   Lines(res.state),
                   "  %0 = extractvalue %struct.Slice %s, 0\n"
                   "  %1 = extractvalue %struct.Slice %s, 1\n"
                   "  %2 = ptrtoint ptr %1 to i64\n"
                   "  %3 = insertvalue [2 x i64] undef, i64 %0, 0\n"
                   "  %4 = insertvalue [2 x i64] %3, i64 %2, 1"
               );
    });

    Run("AArch64: Large Structs Are Passed Indirectly", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::Struct("Triple")};
        const std::vector args{StructArg("%t", "Triple")};
        auto res = AArch64.lower_args(args, t, {});
        return Same(Params(AArch64.lower_param_types(params, t)), std::vector<std::string>{"ptr"})
           and Check(AArch64.needs_sret(NativeType::Struct("Triple"), t), "Large struct returned directly")
           and Same(Args(res.args), std::vector<std::string>{"ptr %0"})
           and Same(
                   Lines(res.state),
                   "  %0 = alloca %struct.Triple, align 8\n"
                   "  store %struct.Triple %t, ptr %0, align 8"
               );
    });

    Run("AArch64: Small Structs Pass Through", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::Struct("Small")};
        return Same(Params(AArch64.lower_param_types(params, t)), std::vector<std::string>{"%struct.Small"})
           and Check(AArch64.rule_for(NativeType::Struct("Small"), t) == nullptr, "A rule applied")
           and Check(not AArch64.needs_sret(NativeType::Struct("Small"), t), "Small struct returned indirectly");
    });

    Run("AArch64: Packable Check", [] {
        using cconv::aapcs64::IsPackable;
        const auto pair = Repeat(2, NativeType::I64());
        const std::vector mixed{NativeType::I64(), NativeType::Double()};
        const auto three = Repeat(3, NativeType::I64());
        return Check(IsPackable(pair), "Two i64 not packable")
           and Check(not IsPackable(mixed), "Double packed")
           and Check(not IsPackable(three), "Three fields packed");
    });
}

/// ===========================================================================
///  Opaque aggregates and non-aggregates
/// ===========================================================================
void PassThroughTests() {
    Run("Pass Through: Struct Without Layout", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::Struct("Unknown")};
        const std::vector args{StructArg("%u", "Unknown")};
        bool ok = true;
        for (const auto* abi : {&X86_64, &AArch64}) {
            auto res = abi->lower_args(args, t, {});
            ok = Same(Params(abi->lower_param_types(params, t)), std::vector<std::string>{"%struct.Unknown"}) and ok;
            ok = Same(Args(res.args), std::vector<std::string>{"%struct.Unknown %u"}) and ok;
            ok = Check(res.state.lines.empty(), "Instructions emitted for an opaque struct") and ok;
            ok = Check(not abi->needs_sret(NativeType::Struct("Unknown"), t), "Opaque struct returned indirectly") and ok;
        }
        return ok;
    });

    Run("Pass Through: Empty Struct", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::Struct("Empty")};
        return Same(Params(X86_64.lower_param_types(params, t)), std::vector<std::string>{"%struct.Empty"})
           and Same(Params(AArch64.lower_param_types(params, t)), std::vector<std::string>{"%struct.Empty"});
    });

    Run("Pass Through: Scalars", [] {
        const auto t = Layouts();
        const std::vector params{NativeType::I32(), NativeType::Double(), NativeType::Pointer()};
        return Same(Params(X86_64.lower_param_types(params, t)), std::vector<std::string>{"i32", "double", "ptr"})
           and Same(Params(AArch64.lower_param_types(params, t)), std::vector<std::string>{"i32", "double", "ptr"});
    });

    Run("Pass Through: Generic Target Lowers Nothing", [] {
        const auto t = Layouts();
        const auto& generic = AbiStrategy::For(Target::generic);
        const std::vector params{NativeType::Struct("Five")};
        return Same(generic.name(), "generic")
           and Same(Params(generic.lower_param_types(params, t)), std::vector<std::string>{"%struct.Five"})
           and Check(not generic.needs_sret(NativeType::Struct("Five"), t), "Generic target returns indirectly");
    });

    Run("Pass Through: Opaque Warning Is No Error", [] {
        Context ctx{Target::x86_64_linux, {Context::DoNotUseColour, Context::DoNotPrintAST, Context::WarnOpaqueLayout}};
        Builder b{ctx, "extern fn take(u : Unknown);"};
        const std::vector types{NativeType::Struct("Unknown"), NativeType::Struct("Pair"), NativeType::I64()};
        WarnOpaqueAggregates(&ctx, b.at("take"), types, Layouts());
        return Check(not ctx.has_error(), "Warning set the error flag");
    });
}

/// ===========================================================================
///  Returns
/// ===========================================================================
void ReturnTests() {
    Run("Returns: Large Struct Gets An Sret Parameter", [] {
        const auto t = Layouts();
        auto ret = X86_64.lower_return_type(NativeType::Struct("Five"), t);
        return Same(ret.type, NativeType::Void())
           and Check(ret.sret.has_value(), "No sret parameter")
           and Same(ret.sret->string(), "ptr sret(%struct.Five) align 8");
    });

    Run("Returns: Small Struct Is Returned Directly", [] {
        const auto t = Layouts();
        auto ret = X86_64.lower_return_type(NativeType::Struct("Pair"), t);
        return Same(ret.type, NativeType::Struct("Pair"))
           and Check(not ret.sret.has_value(), "Unexpected sret parameter");
    });

    Run("Returns: Sret Call", [] {
        const auto t = Layouts();
        std::optional<NativeType> seen_return;
        auto emit = [&](std::string_view callee, const NativeType& ret, std::span<const NativeArg> args) {
            seen_return = ret;
            return fmt::format("call {} @{}({})", ret, callee, fmt::join(Args(args), ", "));
        };

        const std::vector<NativeArg> args{{"%n", {NativeType::I64()}}};
        auto res = X86_64.emit_sret_call("make", NativeType::Struct("Five"), args, LoweringState{7}, emit);
        return Same(res.result, "%8")
           and Check(seen_return == NativeType::Void(), "Call does not return void")
           and Same(
                   Lines(res.state),
                   "  %7 = alloca %struct.Five, align 8\n"
                   "  call void @make(ptr sret(%struct.Five) align 8 %7, i64 %n)\n"
                   "  %8 = load %struct.Five, ptr %7, align 8"
               )
           and Same(res.state.next_register, 9zu);
    });
}

/// ===========================================================================
///  Targets
/// ===========================================================================
void TargetTests() {
    Run("Targets: Selected From Hints", [] {
        return Same(Target::FromHint("x86_64-unknown-linux-gnu")->name, Target::x86_64_linux->name)
           and Same(Target::FromHint("AMD64")->name, Target::x86_64_linux->name)
           and Same(Target::FromHint("aarch64-linux-gnu")->name, Target::aarch64_linux->name)
           and Same(Target::FromHint("arm64-apple-darwin")->name, Target::aarch64_macos->name)
           and Same(Target::FromHint("riscv64-linux")->name, Target::generic->name)
           and Same(Target::FromHint(std::nullopt)->name, Target::generic->name);
    });

    Run("Targets: Strategy Per Architecture", [] {
        return Same(AbiStrategy::For(Target::x86_64_linux).name(), "x86_64")
           and Same(AbiStrategy::For(Target::aarch64_linux).name(), "aarch64")
           and Same(AbiStrategy::For(Target::aarch64_macos).name(), "aarch64")
           and Same(AbiStrategy::For(Target::generic).name(), "generic");
    });
}
} // namespace

int main() {
    LayoutTests();
    SysVTests();
    AAPCS64Tests();
    PassThroughTests();
    ReturnTests();
    TargetTests();
    return test::ExitCode();
}
