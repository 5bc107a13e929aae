//! # Shape Utilities
//!
//! Kind names, enum lookups and structural equality over shapes.

#include "prism/shape/shape.hpp"

#include <utility>

namespace prism {

auto shape_kind_name(ShapeKind kind) -> const char* {
    switch (kind) {
    case ShapeKind::Scalar:
        return "scalar";
    case ShapeKind::Struct:
        return "struct";
    case ShapeKind::Tuple:
        return "tuple";
    case ShapeKind::List:
        return "list";
    case ShapeKind::Map:
        return "map";
    case ShapeKind::Option:
        return "option";
    case ShapeKind::Enum:
        return "enum";
    case ShapeKind::Transparent:
        return "transparent";
    }
    return "unknown";
}

auto scalar_kind_name(ScalarKind kind) -> const char* {
    switch (kind) {
    case ScalarKind::Unit:
        return "unit";
    case ScalarKind::Bool:
        return "bool";
    case ScalarKind::I8:
        return "i8";
    case ScalarKind::I16:
        return "i16";
    case ScalarKind::I32:
        return "i32";
    case ScalarKind::I64:
        return "i64";
    case ScalarKind::U8:
        return "u8";
    case ScalarKind::U16:
        return "u16";
    case ScalarKind::U32:
        return "u32";
    case ScalarKind::U64:
        return "u64";
    case ScalarKind::F32:
        return "f32";
    case ScalarKind::F64:
        return "f64";
    case ScalarKind::Char:
        return "char";
    case ScalarKind::String:
        return "string";
    case ScalarKind::StrView:
        return "borrowed string";
    case ScalarKind::Custom:
        return "custom";
    }
    return "unknown";
}

// ============================================================================
// Enums
// ============================================================================

auto Variant::kind() const -> VariantKind {
    if (unit) {
        return VariantKind::Unit;
    }
    switch (shape().kind) {
    case ShapeKind::Struct:
        return VariantKind::Struct;
    case ShapeKind::Tuple:
        return VariantKind::Tuple;
    default:
        return VariantKind::Newtype;
    }
}

auto EnumDef::find(std::string_view name) const -> const Variant* {
    for (const auto& v : variants) {
        if (v.name == name) {
            return &v;
        }
    }
    return nullptr;
}

auto EnumDef::by_index(size_t idx) const -> const Variant* {
    for (const auto& v : variants) {
        if (v.index == idx) {
            return &v;
        }
    }
    return nullptr;
}

auto EnumDef::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(variants.size());
    for (const auto& v : variants) {
        out.emplace_back(v.name);
    }
    return out;
}

// ============================================================================
// Equality
// ============================================================================

namespace {

template <typename T> auto typed_eq(const void* a, const void* b) -> bool {
    return *static_cast<const T*>(a) == *static_cast<const T*>(b);
}

auto scalars_equal(const Shape& shape, const void* a, const void* b) -> bool {
    switch (shape.scalar) {
    case ScalarKind::Unit:
        return true;
    case ScalarKind::Bool:
        return typed_eq<bool>(a, b);
    case ScalarKind::I8:
        return typed_eq<int8_t>(a, b);
    case ScalarKind::I16:
        return typed_eq<int16_t>(a, b);
    case ScalarKind::I32:
        return typed_eq<int32_t>(a, b);
    case ScalarKind::I64:
        return typed_eq<int64_t>(a, b);
    case ScalarKind::U8:
        return typed_eq<uint8_t>(a, b);
    case ScalarKind::U16:
        return typed_eq<uint16_t>(a, b);
    case ScalarKind::U32:
        return typed_eq<uint32_t>(a, b);
    case ScalarKind::U64:
        return typed_eq<uint64_t>(a, b);
    case ScalarKind::F32:
        return typed_eq<float>(a, b);
    case ScalarKind::F64:
        return typed_eq<double>(a, b);
    case ScalarKind::Char:
        return typed_eq<char32_t>(a, b);
    case ScalarKind::String:
        return typed_eq<std::string>(a, b);
    case ScalarKind::StrView:
        return typed_eq<std::string_view>(a, b);
    case ScalarKind::Custom:
        if (shape.hooks.to_text != nullptr) {
            return shape.hooks.to_text(a) == shape.hooks.to_text(b);
        }
        if (shape.hooks.to_number != nullptr) {
            return shape.hooks.to_number(a) == shape.hooks.to_number(b);
        }
        return false;
    }
    return false;
}

auto collect(const ListDef& def, const void* list) -> std::vector<const void*> {
    std::vector<const void*> out;
    out.reserve(def.len(list));
    def.for_each(list, [&out](const void* element) {
        out.push_back(element);
        return true;
    });
    return out;
}

auto collect(const MapDef& def, const void* map) -> std::vector<std::pair<const void*, const void*>> {
    std::vector<std::pair<const void*, const void*>> out;
    out.reserve(def.len(map));
    def.for_each(map, [&out](const void* key, const void* value) {
        out.emplace_back(key, value);
        return true;
    });
    return out;
}

auto nullable_equal(const Shape& inner, const void* a, const void* b) -> bool {
    if (a == nullptr || b == nullptr) {
        return a == b;
    }
    return values_equal(inner, a, b);
}

} // namespace

auto values_equal(const Shape& shape, const void* a, const void* b) -> bool {
    switch (shape.kind) {
    case ShapeKind::Scalar:
        return scalars_equal(shape, a, b);

    case ShapeKind::Struct: {
        for (const auto& field : shape.as_struct().fields) {
            const auto* fa = static_cast<const unsigned char*>(a) + field.offset;
            const auto* fb = static_cast<const unsigned char*>(b) + field.offset;
            if (!values_equal(field.shape(), fa, fb)) {
                return false;
            }
        }
        return true;
    }

    case ShapeKind::Tuple: {
        const auto& def = shape.as_tuple();
        for (size_t i = 0; i < def.elements.size(); ++i) {
            if (!values_equal(def.elements[i](), def.element(a, i), def.element(b, i))) {
                return false;
            }
        }
        return true;
    }

    case ShapeKind::List: {
        const auto& def = shape.as_list();
        if (def.len(a) != def.len(b)) {
            return false;
        }
        auto xs = collect(def, a);
        auto ys = collect(def, b);
        const Shape& element = def.element();
        for (size_t i = 0; i < xs.size(); ++i) {
            if (!values_equal(element, xs[i], ys[i])) {
                return false;
            }
        }
        return true;
    }

    case ShapeKind::Map: {
        const auto& def = shape.as_map();
        if (def.len(a) != def.len(b)) {
            return false;
        }
        auto xs = collect(def, a);
        auto ys = collect(def, b);
        const Shape& key = def.key();
        const Shape& value = def.value();
        for (size_t i = 0; i < xs.size(); ++i) {
            if (!values_equal(key, xs[i].first, ys[i].first) ||
                !values_equal(value, xs[i].second, ys[i].second)) {
                return false;
            }
        }
        return true;
    }

    case ShapeKind::Option: {
        const auto& def = shape.as_option();
        return nullable_equal(def.inner(), def.get(a), def.get(b));
    }

    case ShapeKind::Enum: {
        const auto& def = shape.as_enum();
        size_t index = def.index(a);
        if (index != def.index(b)) {
            return false;
        }
        const Variant* variant = def.by_index(index);
        if (variant == nullptr) {
            return false;
        }
        return values_equal(variant->shape(), def.payload(a), def.payload(b));
    }

    case ShapeKind::Transparent: {
        const auto& def = shape.as_transparent();
        return nullable_equal(def.inner(), def.get(a), def.get(b));
    }
    }
    return false;
}

} // namespace prism
