#include <mica/context.hh>
#include <mica/diags.hh>
#include <mica/struct_layout.hh>

namespace mica {
namespace {
/// Native representation of the builtin language types.
auto BuiltinPrimitive(std::string_view name) -> std::optional<NativeType> {
    if (name == "Int" or name == "Int64" or name == "SizeT") return NativeType::I64();
    if (name == "Int32") return NativeType::I32();
    if (name == "Int16") return NativeType::I16();
    if (name == "Int8" or name == "Char") return NativeType::I8();
    if (name == "Bool") return NativeType::I1();
    if (name == "Float") return NativeType::Double();
    if (name == "Float32") return NativeType::Float();
    if (name == "CharPtr" or name == "RawPtr") return NativeType::Pointer();
    return NativeType::Parse(name);
}

class LayoutBuilder {
    const Context* ctx;
    StringMap<const TypeDef*> types;
    const StructLayoutTable& builtins;

    /// Types currently being flattened.
    std::vector<std::string_view> stack;

public:
    LayoutBuilder(const Context* c, const Module& mod, const StructLayoutTable& b) : ctx(c), builtins(b) {
        for (const auto& m : mod.members)
            if (m.is<TypeDef>()) types.try_emplace(m.as<TypeDef>().name, &m.as<TypeDef>());
    }

    auto Flatten(const TypeDef& t) -> Result<std::vector<NativeType>> {
        if (rgs::find(stack, t.name) != stack.end()) {
            return Diag::Error(ctx, t.location, "Struct '{}' contains itself", t.name);
        }

        stack.push_back(t.name);
        auto res = std::visit(
            Overloaded{
                [&](const NativePrimitive& p) -> Result<std::vector<NativeType>> {
                    auto native = NativeType::Parse(p.spelling);
                    if (not native) return Diag::Error(ctx, t.location, "Unknown native type '{}'", p.spelling);
                    return std::vector{*native};
                },
                [&](const NativePointer&) -> Result<std::vector<NativeType>> {
                    return std::vector{NativeType::Pointer()};
                },
                [&](const NativeStruct& s) -> Result<std::vector<NativeType>> {
                    std::vector<NativeType> fields;
                    for (const auto& f : s.fields) {
                        auto field = Field(t, f);
                        if (not field) return field.diag();
                        rgs::copy(*field, std::back_inserter(fields));
                    }
                    return fields;
                },
            },
            t.native
        );
        stack.pop_back();
        return res;
    }

private:
    auto Field(const TypeDef& owner, const NativeField& f) -> Result<std::vector<NativeType>> {
        if (auto it = types.find(f.type_name); it != types.end()) return Flatten(*it->second);
        if (auto fields = builtins.fields(f.type_name)) return std::vector<NativeType>{fields->begin(), fields->end()};
        if (auto native = BuiltinPrimitive(f.type_name)) return std::vector{*native};
        return Diag::Error(
            ctx,
            owner.location,
            "Unknown type '{}' of field '{}' in struct '{}'",
            f.type_name,
            f.name,
            owner.name
        );
    }
};
} // namespace

StructLayoutTable::StructLayoutTable() {
    add("String", {NativeType::I64(), NativeType::Pointer()});
}

auto StructLayoutTable::Build(const Context* ctx, const Module& mod) -> Result<StructLayoutTable> {
    StructLayoutTable table;
    LayoutBuilder builder{ctx, mod, table};
    std::vector<std::pair<std::string, std::vector<NativeType>>> structs;
    for (const auto& m : mod.members) {
        if (not m.is<TypeDef>()) continue;
        const auto& t = m.as<TypeDef>();
        if (not std::holds_alternative<NativeStruct>(t.native)) continue;
        auto fields = builder.Flatten(t);
        if (not fields) return fields.diag();
        structs.emplace_back(t.name, std::move(*fields));
    }

    for (auto& [name, fields] : structs) table.add(std::move(name), std::move(fields));
    return table;
}

void StructLayoutTable::add(std::string name, std::vector<NativeType> fields) {
    layouts.insert_or_assign(std::move(name), std::move(fields));
}

auto StructLayoutTable::fields(std::string_view name) const -> std::optional<std::span<const NativeType>> {
    auto it = layouts.find(name);
    if (it == layouts.end()) return std::nullopt;
    return std::span<const NativeType>{it->second};
}

auto StructLayoutTable::fields(const NativeType& type) const -> std::optional<std::span<const NativeType>> {
    if (not type.is_struct()) return std::nullopt;
    return fields(type.struct_name());
}

auto StructLayoutTable::align_of(std::string_view name) const -> usz {
    auto f = fields(name);
    MICA_ASSERT(f, "No layout for struct '{}'", name);
    usz align = 1;
    for (const auto& field : *f) align = std::max(align, field.align());
    return align;
}

auto StructLayoutTable::size_of(std::string_view name) const -> usz {
    auto f = fields(name);
    MICA_ASSERT(f, "No layout for struct '{}'", name);
    usz size = 0;
    for (const auto& field : *f) size = utils::AlignTo(size, field.align()) + field.bytes();
    return utils::AlignTo(size, align_of(name));
}

auto StructLayoutTable::FieldBytes(std::span<const NativeType> fields) -> usz {
    usz total = 0;
    for (const auto& f : fields) total += f.bytes();
    return total;
}
} // namespace mica
