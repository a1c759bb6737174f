#ifndef MICA_STRUCT_LAYOUT_HH
#define MICA_STRUCT_LAYOUT_HH

#include <mica/ast.hh>
#include <mica/native_type.hh>
#include <mica/utils.hh>
#include <mica/utils/result.hh>

#include <span>
#include <vector>

namespace mica {
/// Field types of the native structs of a module.
///
/// Fields are flattened: a struct nested in another contributes its own
/// fields in order. The table is filled before lowering starts and is
/// only read afterwards.
class StructLayoutTable {
    StringMap<std::vector<NativeType>> layouts;

public:
    /// Create a table that only knows the builtin structs.
    StructLayoutTable();

    /// Build the table from the type declarations of a module.
    static auto Build(const Context* ctx, const Module& mod) -> Result<StructLayoutTable>;

    /// Register a struct.
    void add(std::string name, std::vector<NativeType> fields);

    /// Get the fields of a struct, or nothing if it has no layout.
    [[nodiscard]] auto fields(std::string_view name) const -> std::optional<std::span<const NativeType>>;

    /// Get the fields of a struct type; every other type has none.
    [[nodiscard]] auto fields(const NativeType& type) const -> std::optional<std::span<const NativeType>>;

    [[nodiscard]] bool contains(std::string_view name) const { return layouts.contains(name); }

    /// Size of a struct in bytes, including padding.
    [[nodiscard]] auto size_of(std::string_view name) const -> usz;

    /// Alignment of a struct in bytes.
    [[nodiscard]] auto align_of(std::string_view name) const -> usz;

    /// Sum of the sizes of the fields, without padding.
    [[nodiscard]] static auto FieldBytes(std::span<const NativeType> fields) -> usz;
};
} // namespace mica

#endif // MICA_STRUCT_LAYOUT_HH
