//! # Shape Builders
//!
//! Fluent helpers for describing user types. Builders only record `ShapeFn`
//! thunks for nested types and never call them, so a type may refer to
//! itself through `std::unique_ptr` or a container.
//!
//! ## Example
//!
//! ```cpp
//! struct Server {
//!     std::string host;
//!     uint16_t port;
//!     std::vector<std::string> tags;
//! };
//!
//! template <> struct prism::ShapeTraits<Server> {
//!     static auto make() -> Shape {
//!         return StructBuilder<Server>("Server")
//!             .field("host", &Server::host)
//!             .field("port", &Server::port, {.default_fn = default_value<uint16_t, 8080>})
//!             .field("tags", &Server::tags, {.flags = FIELD_SKIP_IF_DEFAULT})
//!             .deny_unknown_fields()
//!             .build();
//!     }
//! };
//! ```

#pragma once

#include "prism/shape/shape.hpp"

#include <utility>

namespace prism {

// ============================================================================
// Field Helpers
// ============================================================================

/// Byte offset of `member` inside `T`.
template <typename T, typename M> auto member_offset(M T::*member) -> size_t {
    union Probe {
        Probe() {}
        ~Probe() {}
        char none;
        T object;
    } probe;
    const auto* base = reinterpret_cast<const unsigned char*>(std::addressof(probe.object));
    const auto* at = reinterpret_cast<const unsigned char*>(std::addressof(probe.object.*member));
    return static_cast<size_t>(at - base);
}

/// Default constructor hook producing the constant `Value`.
template <typename M, auto Value> void default_value(void* dst) {
    std::construct_at(static_cast<M*>(dst), Value);
}

/// Default constructor hook calling `Fn`.
template <typename M, M (*Fn)()> void default_from(void* dst) {
    std::construct_at(static_cast<M*>(dst), Fn());
}

/// Per-field options for `StructBuilder::field`.
struct FieldAttrs {
    std::string_view rename;
    uint8_t flags = FIELD_NONE;
    void (*default_fn)(void* dst) = nullptr;
};

// ============================================================================
// Struct Builder
// ============================================================================

/// Describes an aggregate `T` field by field.
///
/// Fields are constructed in place one at a time during deserialization,
/// so `T` must be an aggregate whose members can be initialized separately.
template <typename T> class StructBuilder {
    static_assert(std::is_aggregate_v<T>, "struct shapes require an aggregate type");

public:
    explicit StructBuilder(std::string type_name)
        : shape_(base_shape<T>(ShapeKind::Struct, std::move(type_name))) {}

    template <typename M>
    auto field(std::string_view name, M T::*member, FieldAttrs attrs = {}) -> StructBuilder& {
        Field f;
        f.name = name;
        f.rename = attrs.rename;
        f.shape = &shape_of<M>;
        f.offset = member_offset(member);
        f.flags = attrs.flags;
        f.default_fn = attrs.default_fn;
        def_.fields.push_back(f);
        return *this;
    }

    /// Rejects keys that match no field.
    auto deny_unknown_fields() -> StructBuilder& {
        def_.deny_unknown_fields = true;
        return *this;
    }

    /// Fills every missing field from `T{}`.
    auto default_all() -> StructBuilder& {
        static_assert(std::is_default_constructible_v<T>,
                      "default_all requires a default constructible type");
        def_.default_all = true;
        return *this;
    }

    [[nodiscard]] auto build() -> Shape {
        shape_.def = std::move(def_);
        return std::move(shape_);
    }

private:
    Shape shape_;
    StructDef def_;
};

// ============================================================================
// Enum Builder
// ============================================================================

template <typename V> struct is_std_variant : std::false_type {};
template <typename... Ts> struct is_std_variant<std::variant<Ts...>> : std::true_type {};

namespace detail {

template <typename V, size_t... Is>
void emplace_alternative(void* dst, size_t index, void* payload, std::index_sequence<Is...>) {
    ((index == Is ? (void)std::construct_at(
                        static_cast<V*>(dst), std::in_place_index<Is>,
                        std::move(*static_cast<std::variant_alternative_t<Is, V>*>(payload)))
                  : (void)0),
     ...);
}

} // namespace detail

/// Describes a `std::variant` as a sum type with named variants.
///
/// Variants are registered in declaration order; that order is also the
/// order in which selection hooks and untagged trials run.
///
/// ```cpp
/// using Shape2D = std::variant<Circle, Rect, std::monostate>;
/// EnumBuilder<Shape2D>("Shape2D")
///     .variant<0>("Circle")
///     .variant<1>("Rect", [](auto keys) { return contains(keys, "w"); })
///     .unit<2>("Empty")
///     .internal("type")
///     .build();
/// ```
template <typename V> class EnumBuilder {
    static_assert(is_std_variant<V>::value, "enum shapes describe std::variant types");

public:
    explicit EnumBuilder(std::string type_name)
        : shape_(base_shape<V>(ShapeKind::Enum, std::move(type_name))) {
        def_.index = [](const void* value) -> size_t { return static_cast<const V*>(value)->index(); };
        def_.payload = [](const void* value) -> const void* {
            return std::visit([](const auto& alt) -> const void* { return std::addressof(alt); },
                              *static_cast<const V*>(value));
        };
        def_.emplace = [](void* dst, size_t index, void* payload) {
            detail::emplace_alternative<V>(dst, index, payload,
                                           std::make_index_sequence<std::variant_size_v<V>>{});
        };
    }

    /// Registers alternative `I` as a variant carrying a payload.
    template <size_t I>
    auto variant(std::string_view name, SelectFn select = nullptr) -> EnumBuilder& {
        def_.variants.push_back(
            Variant{name, I, &shape_of<std::variant_alternative_t<I, V>>, false, select});
        return *this;
    }

    /// Registers alternative `I` as a variant without payload.
    template <size_t I>
    auto unit(std::string_view name, SelectFn select = nullptr) -> EnumBuilder& {
        using Alt = std::variant_alternative_t<I, V>;
        static_assert(std::is_default_constructible_v<Alt>,
                      "unit variants must be default constructible");
        def_.variants.push_back(Variant{name, I, &shape_of<Alt>, true, select});
        return *this;
    }

    auto external() -> EnumBuilder& {
        def_.tagging = EnumTagging::External;
        return *this;
    }

    auto internal(std::string_view tag) -> EnumBuilder& {
        def_.tagging = EnumTagging::Internal;
        def_.tag = tag;
        return *this;
    }

    auto adjacent(std::string_view tag, std::string_view content) -> EnumBuilder& {
        def_.tagging = EnumTagging::Adjacent;
        def_.tag = tag;
        def_.content = content;
        return *this;
    }

    auto untagged() -> EnumBuilder& {
        def_.tagging = EnumTagging::Untagged;
        return *this;
    }

    [[nodiscard]] auto build() -> Shape {
        shape_.def = std::move(def_);
        return std::move(shape_);
    }

private:
    Shape shape_;
    EnumDef def_;
};

// ============================================================================
// Transparent and Custom Scalars
// ============================================================================

template <typename P> struct member_pointer_traits;
template <typename C, typename M> struct member_pointer_traits<M C::*> {
    using class_type = C;
    using member_type = M;
};

/// Shape for a single-member aggregate that reads and writes as its member.
template <auto Member> auto newtype_shape(std::string type_name) -> Shape {
    using T = typename member_pointer_traits<decltype(Member)>::class_type;
    using Inner = typename member_pointer_traits<decltype(Member)>::member_type;

    Shape shape = base_shape<T>(ShapeKind::Transparent, std::move(type_name));
    TransparentDef def;
    def.inner = &shape_of<Inner>;
    def.wrap = [](void* dst, void* inner) {
        std::construct_at(static_cast<T*>(dst), T{std::move(*static_cast<Inner*>(inner))});
    };
    def.get = [](const void* value) -> const void* {
        return std::addressof(static_cast<const T*>(value)->*Member);
    };
    shape.def = def;
    return shape;
}

/// Shape for a type converted entirely through `hooks`.
template <typename T> auto custom_scalar(std::string type_name, ScalarHooks hooks) -> Shape {
    Shape shape = base_shape<T>(ShapeKind::Scalar, std::move(type_name));
    shape.scalar = ScalarKind::Custom;
    shape.hooks = hooks;
    return shape;
}

} // namespace prism
