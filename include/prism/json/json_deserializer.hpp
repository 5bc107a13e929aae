//! # JSON Deserializer
//!
//! Builds values of any described type directly from JSON text, walking the
//! type's `Shape` and pulling tokens as it goes. No intermediate document
//! tree is built.
//!
//! ## Features
//!
//! - **In-place construction**: Struct fields are constructed where they
//!   live; a failure drops exactly the fields already built
//! - **Coercion**: Numeric strings satisfy numeric targets and number
//!   literals satisfy string targets
//! - **Enum tagging**: External, internal, adjacent and untagged variants,
//!   with key-based selection hooks when no tag is present
//! - **Diagnostics**: Errors carry spans, a path and the source excerpt
//! - **Multiple documents**: `from_str_next` reads whitespace-separated
//!   values one at a time (JSON Lines)
//!
//! ## Example
//!
//! ```cpp
//! auto result = json::from_str<Config>(R"({"name": "api", "port": 8080})");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string();
//! }
//!
//! json::Cursor cursor;
//! while (true) {
//!     auto next = json::from_str_next<Event>(lines, cursor);
//!     if (is_err(next) || !unwrap(next)) break;
//! }
//! ```

#pragma once

#include "prism/common.hpp"
#include "prism/json/json_error.hpp"
#include "prism/json/json_tokenizer.hpp"
#include "prism/shape/partial.hpp"
#include "prism/shape/shape.hpp"

#include <optional>
#include <string_view>

namespace prism::json {

/// Per-call deserialization settings.
struct DeserializeOptions {
    /// Reject unknown keys in every struct, not only in those that ask.
    bool deny_unknown_fields = false;

    /// Maximum nesting of objects and arrays.
    size_t max_depth = 512;
};

/// Deserializes exactly one JSON value of `shape` into uninitialized `dst`.
///
/// A leading UTF-8 byte order mark is skipped; anything but whitespace
/// after the value is `TrailingCharacters`. On error `dst` is left
/// uninitialized and the error has its source context attached.
///
/// # Arguments
///
/// * `shape` - Shape of the value to build
/// * `input` - UTF-8 JSON text
/// * `dst` - Storage with the shape's size and alignment
/// * `options` - Unknown-field and depth settings
auto deserialize(const Shape& shape, std::string_view input, void* dst,
                 const DeserializeOptions& options = {}) -> Result<bool, DeserError>;

/// Deserializes the next value at `cursor.offset` into `dst`.
///
/// # Returns
///
/// `true` with the cursor moved just past the value, or `false` when only
/// whitespace remains. On error the cursor does not move.
auto deserialize_next(const Shape& shape, std::string_view input, Cursor& cursor, void* dst,
                      const DeserializeOptions& options = {}) -> Result<bool, DeserError>;

/// Parses one JSON document into a `T`.
template <typename T>
auto from_str(std::string_view input, const DeserializeOptions& options = {})
    -> Result<T, DeserError> {
    const Shape& shape = shape_of<T>();
    Slot slot(shape);
    auto result = deserialize(shape, input, slot.get(), options);
    if (is_err(result)) {
        return std::move(unwrap_err(result));
    }
    slot.mark_initialized();
    return T(std::move(*static_cast<T*>(slot.get())));
}

/// Parses the next document of a multi-document input.
///
/// # Returns
///
/// The value, or `std::nullopt` once only whitespace is left.
template <typename T>
auto from_str_next(std::string_view input, Cursor& cursor, const DeserializeOptions& options = {})
    -> Result<std::optional<T>, DeserError> {
    const Shape& shape = shape_of<T>();
    Slot slot(shape);
    auto result = deserialize_next(shape, input, cursor, slot.get(), options);
    if (is_err(result)) {
        return std::move(unwrap_err(result));
    }
    if (!unwrap(result)) {
        return std::optional<T>();
    }
    slot.mark_initialized();
    return std::optional<T>(std::move(*static_cast<T*>(slot.get())));
}

} // namespace prism::json
