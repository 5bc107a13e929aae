//! # JSON Scalar Codec
//!
//! Character classification, number parsing and formatting, string escaping
//! and UTF-8 helpers shared by the tokenizer and both drivers.
//!
//! ## Features
//!
//! - **Lookup tables**: O(1) character classification and hex decoding
//! - **SWAR scanning**: 8 bytes per step when looking for bytes that end a
//!   clean string run
//! - **Exact numbers**: Overflow-checked integer accumulation, correctly
//!   rounded float parsing, shortest round-trip float formatting
//!
//! ## Example
//!
//! ```cpp
//! std::string out;
//! append_f64(out, 0.1);        // "0.1"
//! append_i64(out, INT64_MIN);  // "-9223372036854775808"
//! append_quoted(out, "a\"b");  // "\"a\\\"b\""
//! ```

#pragma once

#include "prism/common.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace prism::json {

// ============================================================================
// Character Classification
// ============================================================================

enum CharFlags : uint8_t {
    CHAR_NONE = 0,
    CHAR_WHITESPACE = 1 << 0, // ' ', '\t', '\n', '\r'
    CHAR_DIGIT = 1 << 1,      // '0'-'9'
    CHAR_HEX = 1 << 2,        // '0'-'9', 'a'-'f', 'A'-'F'
    CHAR_NUMBER = 1 << 3,     // '0'-'9', '-', '+', '.', 'e', 'E'
};

extern const std::array<uint8_t, 256> kCharFlags;

/// Hex digit values, 0xFF for non-hex bytes.
extern const std::array<uint8_t, 256> kHexValues;

inline auto is_whitespace(char c) -> bool {
    return (kCharFlags[static_cast<uint8_t>(c)] & CHAR_WHITESPACE) != 0;
}

inline auto is_digit(char c) -> bool {
    return (kCharFlags[static_cast<uint8_t>(c)] & CHAR_DIGIT) != 0;
}

/// Bytes that can appear inside a number literal.
inline auto is_number_char(char c) -> bool {
    return (kCharFlags[static_cast<uint8_t>(c)] & CHAR_NUMBER) != 0;
}

/// Decodes four hex digits. Returns -1 if any of them is not a hex digit.
inline auto parse_hex4(const char* p) -> int32_t {
    uint8_t v0 = kHexValues[static_cast<uint8_t>(p[0])];
    uint8_t v1 = kHexValues[static_cast<uint8_t>(p[1])];
    uint8_t v2 = kHexValues[static_cast<uint8_t>(p[2])];
    uint8_t v3 = kHexValues[static_cast<uint8_t>(p[3])];
    if ((v0 | v1 | v2 | v3) & 0xF0) {
        return -1;
    }
    return (v0 << 12) | (v1 << 8) | (v2 << 4) | v3;
}

// ============================================================================
// SWAR (SIMD Within A Register)
// ============================================================================

namespace swar {

constexpr uint64_t ONES = 0x0101010101010101ULL;
constexpr uint64_t HIGHS = 0x8080808080808080ULL;

inline auto load(const char* p) -> uint64_t {
    uint64_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

/// Non-zero iff some byte of `v` is below `n` (n <= 128).
constexpr auto has_less(uint64_t v, uint8_t n) -> uint64_t {
    return (v - ONES * n) & ~v & HIGHS;
}

/// Non-zero iff some byte of `v` equals `b`.
constexpr auto has_byte(uint64_t v, uint8_t b) -> uint64_t {
    uint64_t x = v ^ (ONES * b);
    return (x - ONES) & ~x & HIGHS;
}

/// Non-zero iff the 8 bytes contain a quote, a backslash or a control byte.
constexpr auto escape_mask(uint64_t v) -> uint64_t {
    return has_less(v, 0x20) | has_byte(v, '"') | has_byte(v, '\\');
}

} // namespace swar

/// First byte in `[p, end)` that is a quote, backslash, control byte or
/// non-ASCII byte; `end` if none.
auto find_string_special(const char* p, const char* end) -> const char*;

// ============================================================================
// UTF-8
// ============================================================================

/// Length of the valid UTF-8 sequence starting at `p`, or 0 if the bytes
/// are not valid UTF-8 (bad lead byte, truncated, overlong, surrogate,
/// beyond U+10FFFF).
auto utf8_sequence_length(const unsigned char* p, size_t avail) -> size_t;

/// Appends the UTF-8 encoding of `cp`.
void append_utf8(std::string& out, char32_t cp);

/// Decodes `s` if it holds exactly one code point.
auto decode_single_char(std::string_view s) -> std::optional<char32_t>;

// ============================================================================
// Numbers
// ============================================================================

/// Classification of a number literal, recorded by the tokenizer.
struct NumberInfo {
    bool negative = false;
    bool has_fraction = false;
    bool has_exponent = false;

    [[nodiscard]] auto is_integer() const -> bool {
        return !has_fraction && !has_exponent;
    }

    [[nodiscard]] auto operator==(const NumberInfo& other) const -> bool = default;
};

/// Result of scanning a number literal at some position.
struct NumberScan {
    bool ok = false;
    size_t end = 0; ///< One past the literal (or past the malformed run)
    NumberInfo info;
};

/// Scans a JSON number literal starting at `pos`.
///
/// On failure `end` extends over every following byte that could belong to
/// a number so the error covers the whole malformed literal.
auto scan_number(std::string_view text, size_t pos) -> NumberScan;

/// Classifies `text` if the whole string is one JSON number literal.
auto classify_number(std::string_view text) -> std::optional<NumberInfo>;

enum class NumberError : uint8_t {
    Invalid,    ///< Not an integer literal
    OutOfRange, ///< Does not fit the requested type
};

/// Parses an integer literal (optional `-`, digits) into the full i64 range.
auto parse_i64(std::string_view raw) -> Result<int64_t, NumberError>;

/// Parses an integer literal into the full u64 range; negative values
/// other than `-0` are out of range.
auto parse_u64(std::string_view raw) -> Result<uint64_t, NumberError>;

/// Correctly rounded parse. Magnitudes beyond the type's range are
/// out of range; magnitudes below its smallest subnormal become zero.
auto parse_f64(std::string_view raw) -> Result<double, NumberError>;

/// Like parse_f64 but rounds straight to float.
auto parse_f32(std::string_view raw) -> Result<float, NumberError>;

void append_i64(std::string& out, int64_t value);
void append_u64(std::string& out, uint64_t value);

/// Appends the shortest representation that parses back to `value`.
/// Returns false (and appends nothing) for NaN and infinities.
auto append_f64(std::string& out, double value) -> bool;
auto append_f32(std::string& out, float value) -> bool;

// ============================================================================
// Strings
// ============================================================================

/// Appends `s` with JSON escapes applied, without surrounding quotes.
void append_escaped(std::string& out, std::string_view s);

/// Appends `s` as a quoted JSON string.
inline void append_quoted(std::string& out, std::string_view s) {
    out += '"';
    append_escaped(out, s);
    out += '"';
}

} // namespace prism::json
