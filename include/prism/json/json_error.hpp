//! # JSON Error Types
//!
//! Structured errors for the codec. Every deserialization error carries the
//! byte span it refers to and the field/index path from the document root.
//!
//! ## Features
//!
//! - **Taxonomy**: An `ErrorKind` plus its `ErrorCategory`
//! - **Paths**: `$.servers[2].port` style locations inside the value
//! - **Display**: Source excerpt with an underline, clipped to a bounded
//!   window with `...` marking the clipped sides
//!
//! ## Example
//!
//! ```cpp
//! auto result = from_str<Config>("{}");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string();
//! }
//! // error[json::missing_field]: missing field `name`
//! //   --> 1:1
//! //    |
//! //  1 | {}
//! //    | ^^ object ended without field `name`
//! //    = path: $
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace prism::json {

/// A `[start, end)` byte range into the original input.
struct Span {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] static auto at(size_t pos, size_t len = 1) -> Span {
        return Span{pos, pos + len};
    }

    /// Smallest span covering both `a` and `b`.
    [[nodiscard]] static auto merge(Span a, Span b) -> Span {
        return Span{a.start < b.start ? a.start : b.start, a.end > b.end ? a.end : b.end};
    }

    [[nodiscard]] auto len() const -> size_t {
        return end - start;
    }

    [[nodiscard]] auto operator==(const Span& other) const -> bool = default;
};

// ============================================================================
// Taxonomy
// ============================================================================

enum class ErrorCategory : uint8_t {
    Syntax,       ///< Malformed token
    Structural,   ///< Wrong token where a structural one was expected
    Schema,       ///< Value does not fit the shape's fields or variants
    TypeMismatch, ///< Token kind or numeric value incompatible with the target
    Encoding      ///< Invalid UTF-8 or unpaired surrogate
};

enum class ErrorKind : uint8_t {
    UnexpectedCharacter,
    UnexpectedEndOfInput,
    InvalidNumber,
    InvalidEscape,
    TrailingCharacters,
    InvalidUtf8,
    UnexpectedToken,
    TrailingComma,
    DepthLimitExceeded,
    MissingField,
    UnknownField,
    UnknownVariant,
    UnrepresentableKey,
    TypeMismatch,
    NumberOutOfRange,
    InvalidValue,
    NonFiniteFloat
};

/// The category an error kind belongs to unless a producer overrides it.
[[nodiscard]] auto default_category(ErrorKind kind) -> ErrorCategory;

[[nodiscard]] auto category_name(ErrorCategory category) -> const char*;

/// Stable diagnostic code, e.g. `json::missing_field`.
[[nodiscard]] auto error_code(ErrorKind kind) -> const char*;

/// One step of a path: a field name or an element index.
using PathSegment = std::variant<std::string, size_t>;

/// Formats a path as `$`, `$.name`, `$.items[3].id`.
[[nodiscard]] auto format_path(const std::vector<PathSegment>& path) -> std::string;

/// The part of the input shown under a diagnostic.
struct SourceContext {
    std::string excerpt;       ///< Window of the offending line
    size_t line = 0;           ///< 1-based line of the span start
    size_t column = 0;         ///< 1-based column (in code points)
    size_t caret_offset = 0;   ///< Code points from excerpt start to the span
    size_t caret_len = 1;      ///< Code points underlined
    bool truncated_before = false;
    bool truncated_after = false;
};

/// Builds the display window for `span` inside `input`.
///
/// The window is restricted to the line containing `span.start` and to at
/// most `max_window` bytes, and never splits a UTF-8 sequence.
[[nodiscard]] auto make_source_context(std::string_view input, Span span, size_t max_window = 80)
    -> SourceContext;

// ============================================================================
// DeserError
// ============================================================================

/// An error produced while tokenizing or deserializing.
struct DeserError {
    ErrorKind kind = ErrorKind::UnexpectedToken;
    ErrorCategory category = ErrorCategory::Structural;
    Span span;

    /// Headline, e.g. "missing field `name`".
    std::string message;

    /// Root-to-failure path, outermost first.
    std::vector<PathSegment> path;

    /// Text printed next to the underline.
    std::string label;

    /// "did you mean" style hint, empty if none.
    std::string help;

    /// Secondary location, e.g. where an incomplete object started.
    std::optional<Span> related;
    std::string related_label;

    std::optional<SourceContext> context;
    std::optional<SourceContext> related_context;

    /// Creates an error with the kind's default category.
    [[nodiscard]] static auto make(ErrorKind kind, Span span, std::string message) -> DeserError;

    [[nodiscard]] static auto type_mismatch(std::string_view expected, std::string_view found,
                                            Span span) -> DeserError;

    [[nodiscard]] static auto missing_field(std::string_view name, Span object_span,
                                            Span open_span) -> DeserError;

    [[nodiscard]] static auto unknown_field(std::string_view name, Span span,
                                            const std::vector<std::string>& expected) -> DeserError;

    [[nodiscard]] static auto unknown_variant(std::string_view name, Span span,
                                              const std::vector<std::string>& expected)
        -> DeserError;

    [[nodiscard]] static auto out_of_range(std::string_view literal, std::string_view type_name,
                                           Span span) -> DeserError;

    /// Adds a path segment in front of the current path.
    void prepend_path(PathSegment segment);

    /// Resolves the span(s) against the input the error came from.
    void attach_source(std::string_view input, size_t max_window = 80);

    [[nodiscard]] auto code() const -> const char* {
        return error_code(kind);
    }

    [[nodiscard]] auto path_string() const -> std::string {
        return format_path(path);
    }

    /// Renders the error for humans (multi-line).
    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// SerError
// ============================================================================

/// An error produced while serializing a live value.
struct SerError {
    ErrorKind kind = ErrorKind::InvalidValue;
    ErrorCategory category = ErrorCategory::TypeMismatch;
    std::string message;
    std::vector<PathSegment> path;

    [[nodiscard]] static auto make(ErrorKind kind, std::string message) -> SerError;

    void prepend_path(PathSegment segment);

    [[nodiscard]] auto code() const -> const char* {
        return error_code(kind);
    }

    [[nodiscard]] auto path_string() const -> std::string {
        return format_path(path);
    }

    /// `error[json::unrepresentable_key]: ... at $.weights`
    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// Suggestions
// ============================================================================

/// Case-insensitive edit distance.
[[nodiscard]] auto levenshtein_distance(std::string_view a, std::string_view b) -> size_t;

/// Closest candidate within `max_distance` edits, or an empty string.
[[nodiscard]] auto find_similar(std::string_view input, const std::vector<std::string>& candidates,
                                size_t max_distance = 2) -> std::string;

} // namespace prism::json
