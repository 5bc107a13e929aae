//! # Test Fixture Types
//!
//! Described types shared by the codec test suites.

#pragma once

#include "prism/json/json.hpp"

#include <compare>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fixtures {

inline auto contains(std::span<const std::string_view> keys, std::string_view key) -> bool {
    for (auto k : keys) {
        if (k == key) {
            return true;
        }
    }
    return false;
}

/// Rendered error of a failed result, for assertion messages.
template <typename T, typename E> auto error_text(const prism::Result<T, E>& result) -> std::string {
    return prism::is_err(result) ? prism::unwrap_err(result).to_string() : std::string();
}

// ============================================================================
// Structs
// ============================================================================

struct Person {
    std::string name;
    uint32_t age = 0;
};

struct Config {
    std::string name;
    uint16_t port = 0;
    std::optional<std::string> description;
    std::vector<std::string> tags;
};

struct Account {
    std::string user_name;
    int32_t score = 0;
};

struct Address {
    std::string city;
    std::string zip;
};

struct Customer {
    std::string name;
    Address address;
};

struct Settings {
    int32_t retries = 3;
    bool verbose = true;
    std::string mode = "fast";
};

struct Node {
    int32_t value = 0;
    std::vector<Node> children;
};

struct Link {
    int32_t value = 0;
    std::unique_ptr<Link> next;
};

struct Borrowed {
    std::string_view text;
};

struct Primitives {
    bool flag = false;
    int8_t i8 = 0;
    uint8_t u8 = 0;
    int64_t i64 = 0;
    uint64_t u64 = 0;
    float f32 = 0;
    double f64 = 0;
    char32_t ch = 0;
};

struct UserId {
    uint64_t value = 0;
};

// ============================================================================
// Custom Scalars
// ============================================================================

/// Counts live instances to check partial-value teardown.
struct Tracked {
    static inline int live = 0;

    int32_t value = 0;

    Tracked() {
        ++live;
    }
    explicit Tracked(int32_t v) : value(v) {
        ++live;
    }
    Tracked(const Tracked& other) : value(other.value) {
        ++live;
    }
    Tracked(Tracked&& other) noexcept : value(other.value) {
        ++live;
    }
    auto operator=(const Tracked&) -> Tracked& = default;
    auto operator=(Tracked&&) noexcept -> Tracked& = default;
    ~Tracked() {
        --live;
    }
};

/// An even integer; odd input is rejected by the hook.
struct Even {
    int64_t value = 0;
};

/// Semantic version written as "major.minor.patch".
struct Version {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;
};

struct Guarded {
    Tracked first;
    Tracked second;
    Even check;
};

// ============================================================================
// Enums
// ============================================================================

struct Circle {
    double radius = 0;
};

struct Rect {
    double w = 0;
    double h = 0;
};

struct NoShape {};

/// Externally tagged.
using Figure = std::variant<Circle, Rect, NoShape>;

struct TagNone {};

/// Internally tagged on "type".
using Tagged = std::variant<Circle, Rect, TagNone>;

struct AdjNone {};

/// Adjacently tagged on "t"/"c".
using Adjacent = std::variant<Circle, Rect, AdjNone, std::string>;

/// Untagged.
using Loose = std::variant<Rect, int64_t, std::string, std::monostate>;

struct Red {
    auto operator<=>(const Red&) const = default;
};
struct Green {
    auto operator<=>(const Green&) const = default;
};

/// Unit-only enum usable as a map key.
using Hue = std::variant<Red, Green>;

struct Drawing {
    std::string title;
    Tagged figure;
};

} // namespace fixtures

// ============================================================================
// Shapes
// ============================================================================

template <> struct prism::ShapeTraits<fixtures::Person> {
    static auto make() -> Shape {
        using fixtures::Person;
        return StructBuilder<Person>("Person")
            .field("name", &Person::name)
            .field("age", &Person::age)
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Config> {
    static auto make() -> Shape {
        using fixtures::Config;
        return StructBuilder<Config>("Config")
            .field("name", &Config::name)
            .field("port", &Config::port, {.default_fn = default_value<uint16_t, 8080>})
            .field("description", &Config::description, {.flags = FIELD_SKIP_IF_DEFAULT})
            .field("tags", &Config::tags, {.flags = FIELD_SKIP_IF_DEFAULT | FIELD_DEFAULT})
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Account> {
    static auto make() -> Shape {
        using fixtures::Account;
        return StructBuilder<Account>("Account")
            .field("user_name", &Account::user_name, {.rename = "userName"})
            .field("score", &Account::score)
            .deny_unknown_fields()
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Address> {
    static auto make() -> Shape {
        using fixtures::Address;
        return StructBuilder<Address>("Address")
            .field("city", &Address::city)
            .field("zip", &Address::zip)
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Customer> {
    static auto make() -> Shape {
        using fixtures::Customer;
        return StructBuilder<Customer>("Customer")
            .field("name", &Customer::name)
            .field("address", &Customer::address, {.flags = FIELD_FLATTEN})
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Settings> {
    static auto make() -> Shape {
        using fixtures::Settings;
        return StructBuilder<Settings>("Settings")
            .field("retries", &Settings::retries)
            .field("verbose", &Settings::verbose)
            .field("mode", &Settings::mode)
            .default_all()
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Node> {
    static auto make() -> Shape {
        using fixtures::Node;
        return StructBuilder<Node>("Node")
            .field("value", &Node::value)
            .field("children", &Node::children, {.flags = FIELD_DEFAULT | FIELD_SKIP_IF_DEFAULT})
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Link> {
    static auto make() -> Shape {
        using fixtures::Link;
        return StructBuilder<Link>("Link")
            .field("value", &Link::value)
            .field("next", &Link::next, {.flags = FIELD_DEFAULT})
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Borrowed> {
    static auto make() -> Shape {
        using fixtures::Borrowed;
        return StructBuilder<Borrowed>("Borrowed").field("text", &Borrowed::text).build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Primitives> {
    static auto make() -> Shape {
        using fixtures::Primitives;
        return StructBuilder<Primitives>("Primitives")
            .field("flag", &Primitives::flag)
            .field("i8", &Primitives::i8)
            .field("u8", &Primitives::u8)
            .field("i64", &Primitives::i64)
            .field("u64", &Primitives::u64)
            .field("f32", &Primitives::f32)
            .field("f64", &Primitives::f64)
            .field("ch", &Primitives::ch)
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::UserId> {
    static auto make() -> Shape {
        return newtype_shape<&fixtures::UserId::value>("UserId");
    }
};

template <> struct prism::ShapeTraits<fixtures::Tracked> {
    static auto make() -> Shape {
        using fixtures::Tracked;
        ScalarHooks hooks;
        hooks.to_number = [](const void* value) {
            return std::to_string(static_cast<const Tracked*>(value)->value);
        };
        hooks.from_number = [](std::string_view literal, void* dst) -> HookResult {
            auto parsed = json::parse_i64(literal);
            if (is_err(parsed)) {
                return std::string("not an integer");
            }
            std::construct_at(static_cast<Tracked*>(dst), static_cast<int32_t>(unwrap(parsed)));
            return true;
        };
        return custom_scalar<Tracked>("Tracked", hooks);
    }
};

template <> struct prism::ShapeTraits<fixtures::Even> {
    static auto make() -> Shape {
        using fixtures::Even;
        ScalarHooks hooks;
        hooks.to_number = [](const void* value) {
            return std::to_string(static_cast<const Even*>(value)->value);
        };
        hooks.from_number = [](std::string_view literal, void* dst) -> HookResult {
            auto parsed = json::parse_i64(literal);
            if (is_err(parsed) || unwrap(parsed) % 2 != 0) {
                return std::string("expected an even number");
            }
            std::construct_at(static_cast<Even*>(dst), Even{unwrap(parsed)});
            return true;
        };
        return custom_scalar<Even>("Even", hooks);
    }
};

template <> struct prism::ShapeTraits<fixtures::Version> {
    static auto make() -> Shape {
        using fixtures::Version;
        ScalarHooks hooks;
        hooks.to_text = [](const void* value) {
            const auto* v = static_cast<const Version*>(value);
            return std::to_string(v->major) + "." + std::to_string(v->minor) + "." +
                   std::to_string(v->patch);
        };
        hooks.from_text = [](std::string_view text, void* dst) -> HookResult {
            Version v;
            uint32_t* parts[] = {&v.major, &v.minor, &v.patch};
            size_t part = 0;
            bool has_digit = false;
            for (char c : text) {
                if (c == '.') {
                    if (!has_digit || ++part >= 3) {
                        return std::string("expected major.minor.patch");
                    }
                    has_digit = false;
                } else if (c >= '0' && c <= '9') {
                    *parts[part] = *parts[part] * 10 + static_cast<uint32_t>(c - '0');
                    has_digit = true;
                } else {
                    return std::string("expected major.minor.patch");
                }
            }
            if (part != 2 || !has_digit) {
                return std::string("expected major.minor.patch");
            }
            std::construct_at(static_cast<Version*>(dst), v);
            return true;
        };
        return custom_scalar<Version>("Version", hooks);
    }
};

template <> struct prism::ShapeTraits<fixtures::Guarded> {
    static auto make() -> Shape {
        using fixtures::Guarded;
        return StructBuilder<Guarded>("Guarded")
            .field("first", &Guarded::first)
            .field("second", &Guarded::second)
            .field("check", &Guarded::check)
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Circle> {
    static auto make() -> Shape {
        using fixtures::Circle;
        return StructBuilder<Circle>("Circle").field("radius", &Circle::radius).build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Rect> {
    static auto make() -> Shape {
        using fixtures::Rect;
        return StructBuilder<Rect>("Rect").field("w", &Rect::w).field("h", &Rect::h).build();
    }
};

template <> struct prism::ShapeTraits<fixtures::NoShape> {
    static auto make() -> Shape {
        return StructBuilder<fixtures::NoShape>("NoShape").build();
    }
};

template <> struct prism::ShapeTraits<fixtures::TagNone> {
    static auto make() -> Shape {
        return StructBuilder<fixtures::TagNone>("TagNone").build();
    }
};

template <> struct prism::ShapeTraits<fixtures::AdjNone> {
    static auto make() -> Shape {
        return StructBuilder<fixtures::AdjNone>("AdjNone").build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Red> {
    static auto make() -> Shape {
        return StructBuilder<fixtures::Red>("Red").build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Green> {
    static auto make() -> Shape {
        return StructBuilder<fixtures::Green>("Green").build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Figure> {
    static auto make() -> Shape {
        return EnumBuilder<fixtures::Figure>("Figure")
            .variant<0>("Circle")
            .variant<1>("Rect", [](std::span<const std::string_view> keys) {
                return fixtures::contains(keys, "w");
            })
            .unit<2>("None")
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Tagged> {
    static auto make() -> Shape {
        return EnumBuilder<fixtures::Tagged>("Tagged")
            .variant<0>("circle", [](std::span<const std::string_view> keys) {
                return fixtures::contains(keys, "radius");
            })
            .variant<1>("rect", [](std::span<const std::string_view> keys) {
                return fixtures::contains(keys, "w");
            })
            .unit<2>("none")
            .internal("type")
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Adjacent> {
    static auto make() -> Shape {
        return EnumBuilder<fixtures::Adjacent>("Adjacent")
            .variant<0>("Circle")
            .variant<1>("Rect")
            .unit<2>("None")
            .variant<3>("Label")
            .adjacent("t", "c")
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Loose> {
    static auto make() -> Shape {
        return EnumBuilder<fixtures::Loose>("Loose")
            .variant<0>("Rect")
            .variant<1>("Int")
            .variant<2>("Text")
            .unit<3>("Nothing")
            .untagged()
            .build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Hue> {
    static auto make() -> Shape {
        return EnumBuilder<fixtures::Hue>("Hue").unit<0>("red").unit<1>("green").build();
    }
};

template <> struct prism::ShapeTraits<fixtures::Drawing> {
    static auto make() -> Shape {
        using fixtures::Drawing;
        return StructBuilder<Drawing>("Drawing")
            .field("title", &Drawing::title)
            .field("figure", &Drawing::figure)
            .build();
    }
};
