//! # JSON Serializer
//!
//! Writes any described value as JSON by walking its `Shape`. Output is
//! appended to a caller-owned buffer.
//!
//! ## Features
//!
//! - **Compact or pretty**: `indent == 0` writes no whitespace; otherwise
//!   each member and element goes on its own line
//! - **Round trip**: Enum tagging, renames, flattening and skipped defaults
//!   mirror what the deserializer accepts
//! - **Checked**: Non-finite floats and map keys that cannot become JSON
//!   strings are reported instead of producing invalid output
//!
//! ## Example
//!
//! ```cpp
//! auto compact = json::to_string(config);        // {"name":"api","port":8080}
//! auto pretty = json::to_string_pretty(config);
//!
//! std::string out;
//! auto result = json::serialize(shape_of<Config>(), &config, out, {.indent = 4});
//! ```

#pragma once

#include "prism/common.hpp"
#include "prism/json/json_error.hpp"
#include "prism/shape/shape.hpp"

#include <string>

namespace prism::json {

/// Per-call serialization settings.
struct SerializeOptions {
    /// Spaces per nesting level; 0 for compact output.
    size_t indent = 0;
};

/// Appends `value`, a live value of `shape`, to `out` as JSON.
///
/// On error `out` may hold a partial document.
auto serialize(const Shape& shape, const void* value, std::string& out,
               const SerializeOptions& options = {}) -> Result<bool, SerError>;

/// Compact JSON for `value`.
template <typename T>
auto to_string(const T& value, const SerializeOptions& options = {}) -> Result<std::string, SerError> {
    std::string out;
    auto result = serialize(shape_of<T>(), &value, out, options);
    if (is_err(result)) {
        return std::move(unwrap_err(result));
    }
    return out;
}

/// JSON for `value` indented by two spaces per level.
template <typename T> auto to_string_pretty(const T& value) -> Result<std::string, SerError> {
    return to_string(value, SerializeOptions{.indent = 2});
}

} // namespace prism::json
