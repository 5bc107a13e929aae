//! # Shapes
//!
//! Runtime type descriptors. A `Shape` tells the codec how a C++ type is
//! laid out: which kind of value it is, where its fields live, how to build
//! and destroy it in raw memory, and which hooks convert custom scalars.
//!
//! ## Shape Kinds
//!
//! | Kind | Typical C++ type | JSON form |
//! |------|------------------|-----------|
//! | `Scalar` | `int32_t`, `double`, `std::string` | number, string, bool |
//! | `Struct` | aggregate with named members | object |
//! | `Tuple` | `std::pair`, `std::tuple`, `std::array` | fixed-length array |
//! | `List` | `std::vector`, `std::set` | array |
//! | `Map` | `std::map`, `std::unordered_map` | object |
//! | `Option` | `std::optional` | value or `null` |
//! | `Enum` | `std::variant` | tagged per `EnumTagging` |
//! | `Transparent` | `std::unique_ptr`, newtypes | the inner value |
//!
//! Nested shapes are referenced through `ShapeFn` thunks so that recursive
//! types (through a pointer) are only materialized when reached.
//!
//! ## Example
//!
//! ```cpp
//! struct Point { int32_t x; int32_t y; };
//!
//! template <> struct prism::ShapeTraits<Point> {
//!     static auto make() -> Shape {
//!         return StructBuilder<Point>("Point")
//!             .field("x", &Point::x)
//!             .field("y", &Point::y)
//!             .build();
//!     }
//! };
//!
//! const Shape& shape = shape_of<Point>();
//! ```

#pragma once

#include "prism/common.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace prism {

struct Shape;

/// Lazily resolves a nested shape.
using ShapeFn = auto (*)() -> const Shape&;

// ============================================================================
// Kinds
// ============================================================================

enum class ShapeKind : uint8_t { Scalar, Struct, Tuple, List, Map, Option, Enum, Transparent };

enum class ScalarKind : uint8_t {
    Unit,
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    Char,    ///< One Unicode scalar value (`char32_t`)
    String,  ///< `std::string`
    StrView, ///< `std::string_view` borrowed from the input
    Custom   ///< Converted through `ScalarHooks`
};

[[nodiscard]] auto shape_kind_name(ShapeKind kind) -> const char*;
[[nodiscard]] auto scalar_kind_name(ScalarKind kind) -> const char*;

[[nodiscard]] constexpr auto is_signed_int(ScalarKind k) -> bool {
    return k == ScalarKind::I8 || k == ScalarKind::I16 || k == ScalarKind::I32 ||
           k == ScalarKind::I64;
}

[[nodiscard]] constexpr auto is_unsigned_int(ScalarKind k) -> bool {
    return k == ScalarKind::U8 || k == ScalarKind::U16 || k == ScalarKind::U32 ||
           k == ScalarKind::U64;
}

[[nodiscard]] constexpr auto is_float(ScalarKind k) -> bool {
    return k == ScalarKind::F32 || k == ScalarKind::F64;
}

// ============================================================================
// Layout and Value Operations
// ============================================================================

struct Layout {
    size_t size = 0;
    size_t align = 1;
};

/// Type-erased lifecycle operations on a value in raw memory.
struct ValueVTable {
    void (*drop)(void* value) = nullptr;
    void (*move_construct)(void* dst, void* src) = nullptr;
    /// Null when the type is not default constructible.
    void (*default_in_place)(void* dst) = nullptr;
};

/// Outcome of a conversion hook: `true`, or an error message.
using HookResult = Result<bool, std::string>;

/// Conversions for scalars that are not built-in primitives.
///
/// `from_*` hooks construct a value into uninitialized `dst` and must leave
/// `dst` uninitialized when they fail.
struct ScalarHooks {
    std::string (*to_text)(const void* value) = nullptr;
    HookResult (*from_text)(std::string_view text, void* dst) = nullptr;
    /// Returns a JSON number literal.
    std::string (*to_number)(const void* value) = nullptr;
    /// Receives the raw number literal.
    HookResult (*from_number)(std::string_view literal, void* dst) = nullptr;
};

// ============================================================================
// Structs
// ============================================================================

enum FieldFlags : uint8_t {
    FIELD_NONE = 0,
    FIELD_SKIP_IF_DEFAULT = 1 << 0, ///< Omitted on output when equal to its default
    FIELD_FLATTEN = 1 << 1,         ///< Struct whose fields live in the parent object
    FIELD_DEFAULT = 1 << 2,         ///< Missing field takes the type's default
};

struct Field {
    std::string_view name;
    std::string_view rename;
    ShapeFn shape = nullptr;
    size_t offset = 0;
    uint8_t flags = FIELD_NONE;
    /// Constructs the default into uninitialized memory.
    void (*default_fn)(void* dst) = nullptr;

    /// The key used in JSON.
    [[nodiscard]] auto json_name() const -> std::string_view {
        return rename.empty() ? name : rename;
    }

    [[nodiscard]] auto has(FieldFlags flag) const -> bool {
        return (flags & flag) != 0;
    }
};

struct StructDef {
    std::vector<Field> fields;
    bool deny_unknown_fields = false;
    /// Missing fields are taken from a default-constructed instance.
    bool default_all = false;
};

// ============================================================================
// Sequences and Maps
// ============================================================================

struct TupleDef {
    std::vector<ShapeFn> elements;
    /// Move-constructs the tuple from one initialized slot per element.
    void (*assemble)(void* dst, void* const* elements) = nullptr;
    const void* (*element)(const void* tuple, size_t index) = nullptr;
};

using ElementVisitor = std::function<bool(const void* element)>;
using EntryVisitor = std::function<bool(const void* key, const void* value)>;

struct ListDef {
    ShapeFn element = nullptr;
    void (*init_empty)(void* dst) = nullptr;
    /// Moves `element` into the list; the caller still drops the source.
    void (*push)(void* list, void* element) = nullptr;
    size_t (*len)(const void* list) = nullptr;
    /// Visits elements in order until the visitor returns false.
    void (*for_each)(const void* list, const ElementVisitor& visit) = nullptr;
};

struct MapDef {
    ShapeFn key = nullptr;
    ShapeFn value = nullptr;
    void (*init_empty)(void* dst) = nullptr;
    /// Inserts or replaces; moves from both sources.
    void (*insert)(void* map, void* key, void* value) = nullptr;
    size_t (*len)(const void* map) = nullptr;
    void (*for_each)(const void* map, const EntryVisitor& visit) = nullptr;
};

struct OptionDef {
    ShapeFn inner = nullptr;
    void (*init_none)(void* dst) = nullptr;
    void (*init_some)(void* dst, void* inner) = nullptr;
    /// Null when empty.
    const void* (*get)(const void* option) = nullptr;
};

// ============================================================================
// Enums
// ============================================================================

/// Picks a variant from the keys of an object that carries no tag.
using SelectFn = bool (*)(std::span<const std::string_view> keys);

enum class VariantKind : uint8_t { Unit, Newtype, Tuple, Struct };

struct Variant {
    std::string_view name;
    /// Alternative index inside the C++ variant.
    size_t index = 0;
    ShapeFn shape = nullptr;
    bool unit = false;
    SelectFn select = nullptr;

    [[nodiscard]] auto kind() const -> VariantKind;
};

enum class EnumTagging : uint8_t {
    External, ///< `"Unit"` or `{"Variant": payload}`
    Internal, ///< `{"<tag>": "Variant", ...payload fields}`
    Adjacent, ///< `{"<tag>": "Variant", "<content>": payload}`
    Untagged  ///< payload only
};

struct EnumDef {
    /// Declaration order, which is also the hook and untagged trial order.
    std::vector<Variant> variants;
    EnumTagging tagging = EnumTagging::External;
    std::string_view tag = "type";
    std::string_view content = "content";
    size_t (*index)(const void* value) = nullptr;
    const void* (*payload)(const void* value) = nullptr;
    /// Move-constructs alternative `index` from `payload`.
    void (*emplace)(void* dst, size_t index, void* payload) = nullptr;

    [[nodiscard]] auto find(std::string_view name) const -> const Variant*;
    [[nodiscard]] auto by_index(size_t index) const -> const Variant*;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
};

// ============================================================================
// Transparent Wrappers
// ============================================================================

struct TransparentDef {
    ShapeFn inner = nullptr;
    void (*wrap)(void* dst, void* inner) = nullptr;
    /// Null for an empty pointer.
    const void* (*get)(const void* value) = nullptr;
    /// Constructs an empty pointer from JSON `null`; null for newtypes.
    void (*init_null)(void* dst) = nullptr;
};

// ============================================================================
// Shape
// ============================================================================

/// A complete runtime description of one C++ type.
struct Shape {
    ShapeKind kind = ShapeKind::Scalar;
    std::string type_name;
    Layout layout;
    ValueVTable vtable;
    ScalarKind scalar = ScalarKind::Unit;
    ScalarHooks hooks;
    std::variant<std::monostate, StructDef, TupleDef, ListDef, MapDef, OptionDef, EnumDef,
                 TransparentDef>
        def;

    [[nodiscard]] auto as_struct() const -> const StructDef& {
        return std::get<StructDef>(def);
    }
    [[nodiscard]] auto as_tuple() const -> const TupleDef& {
        return std::get<TupleDef>(def);
    }
    [[nodiscard]] auto as_list() const -> const ListDef& {
        return std::get<ListDef>(def);
    }
    [[nodiscard]] auto as_map() const -> const MapDef& {
        return std::get<MapDef>(def);
    }
    [[nodiscard]] auto as_option() const -> const OptionDef& {
        return std::get<OptionDef>(def);
    }
    [[nodiscard]] auto as_enum() const -> const EnumDef& {
        return std::get<EnumDef>(def);
    }
    [[nodiscard]] auto as_transparent() const -> const TransparentDef& {
        return std::get<TransparentDef>(def);
    }

    [[nodiscard]] auto is_scalar(ScalarKind k) const -> bool {
        return kind == ShapeKind::Scalar && scalar == k;
    }
};

/// Structural equality of two live values of `shape`.
///
/// Scalars compare natively (custom scalars by their hook output),
/// aggregates member by member. Maps compare in iteration order.
[[nodiscard]] auto values_equal(const Shape& shape, const void* a, const void* b) -> bool;

// ============================================================================
// Shape Registry
// ============================================================================

/// Describes `T`. Specialize with a static `make() -> Shape`.
template <typename T, typename Enable = void> struct ShapeTraits;

/// The process-wide shape of `T`, built on first use.
template <typename T> auto shape_of() -> const Shape& {
    static const Shape shape = ShapeTraits<T>::make();
    return shape;
}

/// Lifecycle operations for `T`.
template <typename T> auto vtable_for() -> ValueVTable {
    ValueVTable vt;
    vt.drop = [](void* value) { std::destroy_at(static_cast<T*>(value)); };
    vt.move_construct = [](void* dst, void* src) {
        std::construct_at(static_cast<T*>(dst), std::move(*static_cast<T*>(src)));
    };
    if constexpr (std::is_default_constructible_v<T>) {
        vt.default_in_place = [](void* dst) { std::construct_at(static_cast<T*>(dst)); };
    }
    return vt;
}

/// A shape of `kind` with `T`'s layout and lifecycle filled in.
template <typename T> auto base_shape(ShapeKind kind, std::string type_name) -> Shape {
    Shape shape;
    shape.kind = kind;
    shape.type_name = std::move(type_name);
    shape.layout = Layout{sizeof(T), alignof(T)};
    shape.vtable = vtable_for<T>();
    return shape;
}

} // namespace prism
