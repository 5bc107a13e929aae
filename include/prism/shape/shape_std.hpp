//! # Standard Library Shapes
//!
//! `ShapeTraits` specializations for primitives and the standard
//! containers, so user types only need to describe themselves.
//!
//! | C++ type | Shape |
//! |----------|-------|
//! | `bool`, integers, `float`, `double` | Scalar |
//! | `char32_t` | Scalar `Char` |
//! | `std::string`, `std::string_view` | Scalar `String`, `StrView` |
//! | `std::monostate` | Scalar `Unit` (JSON `null`) |
//! | `std::vector`, `std::deque`, `std::set`, `std::unordered_set` | List |
//! | `std::map`, `std::unordered_map` | Map |
//! | `std::optional` | Option |
//! | `std::unique_ptr`, `std::shared_ptr` | Transparent |
//! | `std::pair`, `std::tuple`, `std::array` | Tuple |

#pragma once

#include "prism/shape/shape.hpp"

#include <array>
#include <deque>
#include <map>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace prism {

// ============================================================================
// Primitives
// ============================================================================

namespace detail {

template <typename T> auto primitive_shape(ScalarKind kind, const char* name) -> Shape {
    Shape shape = base_shape<T>(ShapeKind::Scalar, name);
    shape.scalar = kind;
    return shape;
}

template <typename T> constexpr auto integer_kind() -> ScalarKind {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) {
            return ScalarKind::I8;
        } else if constexpr (sizeof(T) == 2) {
            return ScalarKind::I16;
        } else if constexpr (sizeof(T) == 4) {
            return ScalarKind::I32;
        } else {
            static_assert(sizeof(T) == 8, "unsupported integer width");
            return ScalarKind::I64;
        }
    } else {
        if constexpr (sizeof(T) == 1) {
            return ScalarKind::U8;
        } else if constexpr (sizeof(T) == 2) {
            return ScalarKind::U16;
        } else if constexpr (sizeof(T) == 4) {
            return ScalarKind::U32;
        } else {
            static_assert(sizeof(T) == 8, "unsupported integer width");
            return ScalarKind::U64;
        }
    }
}

template <typename T>
constexpr bool is_plain_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char32_t> &&
    !std::is_same_v<T, char16_t> && !std::is_same_v<T, char8_t> && !std::is_same_v<T, wchar_t>;

} // namespace detail

template <typename T> struct ShapeTraits<T, std::enable_if_t<detail::is_plain_integer_v<T>>> {
    static auto make() -> Shape {
        constexpr ScalarKind kind = detail::integer_kind<T>();
        return detail::primitive_shape<T>(kind, scalar_kind_name(kind));
    }
};

template <> struct ShapeTraits<bool> {
    static auto make() -> Shape {
        return detail::primitive_shape<bool>(ScalarKind::Bool, "bool");
    }
};

template <> struct ShapeTraits<float> {
    static auto make() -> Shape {
        return detail::primitive_shape<float>(ScalarKind::F32, "f32");
    }
};

template <> struct ShapeTraits<double> {
    static auto make() -> Shape {
        return detail::primitive_shape<double>(ScalarKind::F64, "f64");
    }
};

template <> struct ShapeTraits<char32_t> {
    static auto make() -> Shape {
        return detail::primitive_shape<char32_t>(ScalarKind::Char, "char");
    }
};

template <> struct ShapeTraits<std::string> {
    static auto make() -> Shape {
        return detail::primitive_shape<std::string>(ScalarKind::String, "string");
    }
};

template <> struct ShapeTraits<std::string_view> {
    static auto make() -> Shape {
        return detail::primitive_shape<std::string_view>(ScalarKind::StrView, "borrowed string");
    }
};

template <> struct ShapeTraits<std::monostate> {
    static auto make() -> Shape {
        return detail::primitive_shape<std::monostate>(ScalarKind::Unit, "unit");
    }
};

// ============================================================================
// Lists
// ============================================================================

namespace detail {

/// List shape for any container with `push_back`/`insert`, `size` and
/// forward iteration.
template <typename C, typename E> auto list_shape(const char* name) -> Shape {
    Shape shape = base_shape<C>(ShapeKind::List, name);
    ListDef def;
    def.element = &shape_of<E>;
    def.init_empty = [](void* dst) { std::construct_at(static_cast<C*>(dst)); };
    def.push = [](void* list, void* element) {
        auto& c = *static_cast<C*>(list);
        if constexpr (requires { c.push_back(std::move(*static_cast<E*>(element))); }) {
            c.push_back(std::move(*static_cast<E*>(element)));
        } else {
            c.insert(std::move(*static_cast<E*>(element)));
        }
    };
    def.len = [](const void* list) -> size_t { return static_cast<const C*>(list)->size(); };
    def.for_each = [](const void* list, const ElementVisitor& visit) {
        for (const auto& element : *static_cast<const C*>(list)) {
            if (!visit(std::addressof(element))) {
                return;
            }
        }
    };
    shape.def = def;
    return shape;
}

template <typename C, typename K, typename V> auto map_shape(const char* name) -> Shape {
    Shape shape = base_shape<C>(ShapeKind::Map, name);
    MapDef def;
    def.key = &shape_of<K>;
    def.value = &shape_of<V>;
    def.init_empty = [](void* dst) { std::construct_at(static_cast<C*>(dst)); };
    def.insert = [](void* map, void* key, void* value) {
        static_cast<C*>(map)->insert_or_assign(std::move(*static_cast<K*>(key)),
                                               std::move(*static_cast<V*>(value)));
    };
    def.len = [](const void* map) -> size_t { return static_cast<const C*>(map)->size(); };
    def.for_each = [](const void* map, const EntryVisitor& visit) {
        for (const auto& [key, value] : *static_cast<const C*>(map)) {
            if (!visit(std::addressof(key), std::addressof(value))) {
                return;
            }
        }
    };
    shape.def = def;
    return shape;
}

} // namespace detail

template <typename E, typename A> struct ShapeTraits<std::vector<E, A>> {
    static auto make() -> Shape {
        return detail::list_shape<std::vector<E, A>, E>("array");
    }
};

template <typename E, typename A> struct ShapeTraits<std::deque<E, A>> {
    static auto make() -> Shape {
        return detail::list_shape<std::deque<E, A>, E>("array");
    }
};

template <typename E, typename C, typename A> struct ShapeTraits<std::set<E, C, A>> {
    static auto make() -> Shape {
        return detail::list_shape<std::set<E, C, A>, E>("set");
    }
};

template <typename E, typename H, typename Eq, typename A>
struct ShapeTraits<std::unordered_set<E, H, Eq, A>> {
    static auto make() -> Shape {
        return detail::list_shape<std::unordered_set<E, H, Eq, A>, E>("set");
    }
};

// ============================================================================
// Maps
// ============================================================================

template <typename K, typename V, typename C, typename A>
struct ShapeTraits<std::map<K, V, C, A>> {
    static auto make() -> Shape {
        return detail::map_shape<std::map<K, V, C, A>, K, V>("map");
    }
};

template <typename K, typename V, typename H, typename Eq, typename A>
struct ShapeTraits<std::unordered_map<K, V, H, Eq, A>> {
    static auto make() -> Shape {
        return detail::map_shape<std::unordered_map<K, V, H, Eq, A>, K, V>("map");
    }
};

// ============================================================================
// Options and Pointers
// ============================================================================

template <typename T> struct ShapeTraits<std::optional<T>> {
    static auto make() -> Shape {
        using O = std::optional<T>;
        Shape shape = base_shape<O>(ShapeKind::Option, "option");
        OptionDef def;
        def.inner = &shape_of<T>;
        def.init_none = [](void* dst) { std::construct_at(static_cast<O*>(dst)); };
        def.init_some = [](void* dst, void* inner) {
            std::construct_at(static_cast<O*>(dst), std::move(*static_cast<T*>(inner)));
        };
        def.get = [](const void* option) -> const void* {
            const auto& o = *static_cast<const O*>(option);
            return o.has_value() ? std::addressof(*o) : nullptr;
        };
        shape.def = def;
        return shape;
    }
};

template <typename T> struct ShapeTraits<std::unique_ptr<T>> {
    static auto make() -> Shape {
        using P = std::unique_ptr<T>;
        Shape shape = base_shape<P>(ShapeKind::Transparent, "box");
        TransparentDef def;
        def.inner = &shape_of<T>;
        def.wrap = [](void* dst, void* inner) {
            std::construct_at(static_cast<P*>(dst),
                              std::make_unique<T>(std::move(*static_cast<T*>(inner))));
        };
        def.get = [](const void* value) -> const void* {
            return static_cast<const P*>(value)->get();
        };
        def.init_null = [](void* dst) { std::construct_at(static_cast<P*>(dst)); };
        shape.def = def;
        return shape;
    }
};

template <typename T> struct ShapeTraits<std::shared_ptr<T>> {
    static auto make() -> Shape {
        using P = std::shared_ptr<T>;
        Shape shape = base_shape<P>(ShapeKind::Transparent, "rc");
        TransparentDef def;
        def.inner = &shape_of<T>;
        def.wrap = [](void* dst, void* inner) {
            std::construct_at(static_cast<P*>(dst),
                              std::make_shared<T>(std::move(*static_cast<T*>(inner))));
        };
        def.get = [](const void* value) -> const void* {
            return static_cast<const P*>(value)->get();
        };
        def.init_null = [](void* dst) { std::construct_at(static_cast<P*>(dst)); };
        shape.def = def;
        return shape;
    }
};

// ============================================================================
// Tuples
// ============================================================================

namespace detail {

template <typename T, typename... Es, size_t... Is>
void assemble_tuple(void* dst, void* const* elements, std::index_sequence<Is...>) {
    std::construct_at(static_cast<T*>(dst), std::move(*static_cast<Es*>(elements[Is]))...);
}

template <typename T, typename... Es, size_t... Is>
auto tuple_element_ptr(const void* tuple, size_t index, std::index_sequence<Is...>) -> const void* {
    const void* found = nullptr;
    ((index == Is ? (void)(found = std::addressof(std::get<Is>(*static_cast<const T*>(tuple))))
                  : (void)0),
     ...);
    return found;
}

template <typename T, typename... Es> auto tuple_shape() -> Shape {
    Shape shape = base_shape<T>(ShapeKind::Tuple, "tuple");
    TupleDef def;
    def.elements = {&shape_of<Es>...};
    def.assemble = [](void* dst, void* const* elements) {
        assemble_tuple<T, Es...>(dst, elements, std::index_sequence_for<Es...>{});
    };
    def.element = [](const void* tuple, size_t index) -> const void* {
        return tuple_element_ptr<T, Es...>(tuple, index, std::index_sequence_for<Es...>{});
    };
    shape.def = def;
    return shape;
}

template <typename E, size_t N, size_t... Is>
void assemble_array(void* dst, void* const* elements, std::index_sequence<Is...>) {
    std::construct_at(static_cast<std::array<E, N>*>(dst),
                      std::array<E, N>{std::move(*static_cast<E*>(elements[Is]))...});
}

} // namespace detail

template <typename A, typename B> struct ShapeTraits<std::pair<A, B>> {
    static auto make() -> Shape {
        return detail::tuple_shape<std::pair<A, B>, A, B>();
    }
};

template <typename... Ts> struct ShapeTraits<std::tuple<Ts...>> {
    static auto make() -> Shape {
        return detail::tuple_shape<std::tuple<Ts...>, Ts...>();
    }
};

template <typename E, size_t N> struct ShapeTraits<std::array<E, N>> {
    static auto make() -> Shape {
        using T = std::array<E, N>;
        Shape shape = base_shape<T>(ShapeKind::Tuple, "array");
        TupleDef def;
        def.elements.assign(N, &shape_of<E>);
        def.assemble = [](void* dst, void* const* elements) {
            detail::assemble_array<E, N>(dst, elements, std::make_index_sequence<N>{});
        };
        def.element = [](const void* tuple, size_t index) -> const void* {
            return static_cast<const T*>(tuple)->data() + index;
        };
        shape.def = def;
        return shape;
    }
};

} // namespace prism
