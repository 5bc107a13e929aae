//! # JSON Scalar Codec Implementation
//!
//! Lookup tables, SWAR scanning, UTF-8 validation and the exact
//! number routines.

#include "prism/json/json_scalar.hpp"

#include <algorithm>
#include <bit>
#include <charconv>
#include <cmath>
#include <limits>

namespace prism::json {

// ============================================================================
// Lookup Tables
// ============================================================================

namespace {

constexpr auto build_char_flags() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> table{};
    table[' '] = table['\t'] = table['\n'] = table['\r'] = CHAR_WHITESPACE;
    for (int c = '0'; c <= '9'; ++c) {
        table[c] = CHAR_DIGIT | CHAR_HEX | CHAR_NUMBER;
    }
    for (int c = 'a'; c <= 'f'; ++c) {
        table[c] |= CHAR_HEX;
        table[c - 'a' + 'A'] |= CHAR_HEX;
    }
    table['-'] |= CHAR_NUMBER;
    table['+'] |= CHAR_NUMBER;
    table['.'] |= CHAR_NUMBER;
    table['e'] |= CHAR_NUMBER;
    table['E'] |= CHAR_NUMBER;
    return table;
}

constexpr auto build_hex_values() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> table{};
    for (auto& v : table) {
        v = 0xFF;
    }
    for (int c = '0'; c <= '9'; ++c) {
        table[c] = static_cast<uint8_t>(c - '0');
    }
    for (int c = 'a'; c <= 'f'; ++c) {
        table[c] = static_cast<uint8_t>(c - 'a' + 10);
        table[c - 'a' + 'A'] = static_cast<uint8_t>(c - 'a' + 10);
    }
    return table;
}

} // namespace

const std::array<uint8_t, 256> kCharFlags = build_char_flags();
const std::array<uint8_t, 256> kHexValues = build_hex_values();

// ============================================================================
// String Scanning
// ============================================================================

auto find_string_special(const char* p, const char* end) -> const char* {
    while (end - p >= 8) {
        uint64_t v = swar::load(p);
        if ((swar::escape_mask(v) | (v & swar::HIGHS)) != 0) {
            break;
        }
        p += 8;
    }
    while (p < end) {
        auto c = static_cast<unsigned char>(*p);
        if (c == '"' || c == '\\' || c < 0x20 || c >= 0x80) {
            return p;
        }
        ++p;
    }
    return end;
}

// ============================================================================
// UTF-8
// ============================================================================

auto utf8_sequence_length(const unsigned char* p, size_t avail) -> size_t {
    if (avail == 0) {
        return 0;
    }
    unsigned char b0 = p[0];
    if (b0 < 0x80) {
        return 1;
    }

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 == 0xE0) {
        len = 3;
        lo = 0xA0; // overlong
    } else if (b0 == 0xED) {
        len = 3;
        hi = 0x9F; // surrogates
    } else if (b0 >= 0xE1 && b0 <= 0xEF) {
        len = 3;
    } else if (b0 == 0xF0) {
        len = 4;
        lo = 0x90; // overlong
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        len = 4;
    } else if (b0 == 0xF4) {
        len = 4;
        hi = 0x8F; // > U+10FFFF
    } else {
        return 0;
    }

    if (avail < len) {
        return 0;
    }
    if (p[1] < lo || p[1] > hi) {
        return 0;
    }
    for (size_t i = 2; i < len; ++i) {
        if ((p[i] & 0xC0) != 0x80) {
            return 0;
        }
    }
    return len;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto decode_single_char(std::string_view s) -> std::optional<char32_t> {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t len = utf8_sequence_length(p, s.size());
    if (len == 0 || len != s.size()) {
        return std::nullopt;
    }
    switch (len) {
    case 1:
        return static_cast<char32_t>(p[0]);
    case 2:
        return static_cast<char32_t>(((p[0] & 0x1F) << 6) | (p[1] & 0x3F));
    case 3:
        return static_cast<char32_t>(((p[0] & 0x0F) << 12) | ((p[1] & 0x3F) << 6) | (p[2] & 0x3F));
    default:
        return static_cast<char32_t>(((p[0] & 0x07) << 18) | ((p[1] & 0x3F) << 12) |
                                     ((p[2] & 0x3F) << 6) | (p[3] & 0x3F));
    }
}

// ============================================================================
// Number Scanning
// ============================================================================

auto scan_number(std::string_view text, size_t pos) -> NumberScan {
    NumberScan scan;
    const size_t n = text.size();
    size_t p = pos;

    auto fail = [&]() -> NumberScan {
        size_t e = p;
        while (e < n && is_number_char(text[e])) {
            ++e;
        }
        scan.ok = false;
        scan.end = e > pos ? e : pos + 1;
        return scan;
    };

    if (p < n && text[p] == '-') {
        scan.info.negative = true;
        ++p;
    }
    if (p >= n || !is_digit(text[p])) {
        return fail();
    }
    if (text[p] == '0') {
        ++p;
        if (p < n && is_digit(text[p])) {
            return fail();
        }
    } else {
        while (p < n && is_digit(text[p])) {
            ++p;
        }
    }

    if (p < n && text[p] == '.') {
        scan.info.has_fraction = true;
        ++p;
        if (p >= n || !is_digit(text[p])) {
            return fail();
        }
        while (p < n && is_digit(text[p])) {
            ++p;
        }
    }

    if (p < n && (text[p] == 'e' || text[p] == 'E')) {
        scan.info.has_exponent = true;
        ++p;
        if (p < n && (text[p] == '+' || text[p] == '-')) {
            ++p;
        }
        if (p >= n || !is_digit(text[p])) {
            return fail();
        }
        while (p < n && is_digit(text[p])) {
            ++p;
        }
    }

    scan.ok = true;
    scan.end = p;
    return scan;
}

auto classify_number(std::string_view text) -> std::optional<NumberInfo> {
    if (text.empty()) {
        return std::nullopt;
    }
    auto scan = scan_number(text, 0);
    if (!scan.ok || scan.end != text.size()) {
        return std::nullopt;
    }
    return scan.info;
}

// ============================================================================
// Integer Parsing
// ============================================================================

namespace {

/// Converts eight ASCII digits to their value (little-endian loads).
auto parse_eight_digits(const char* p) -> uint32_t {
    uint64_t val = swar::load(p);
    val = (val & 0x0F0F0F0F0F0F0F0FULL) * 2561 >> 8;
    val = (val & 0x00FF00FF00FF00FFULL) * 6553601 >> 16;
    return static_cast<uint32_t>((val & 0x0000FFFF0000FFFFULL) * 42949672960001ULL >> 32);
}

/// Accumulates a run of decimal digits. Returns false on overflow.
auto accumulate_digits(std::string_view digits, uint64_t& out) -> bool {
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    size_t i = 0;

    if constexpr (std::endian::native == std::endian::little) {
        while (digits.size() - i >= 8) {
            uint64_t chunk = parse_eight_digits(digits.data() + i);
            if (value > (MAX - chunk) / 100000000ULL) {
                return false;
            }
            value = value * 100000000ULL + chunk;
            i += 8;
        }
    }

    for (; i < digits.size(); ++i) {
        uint64_t d = static_cast<uint64_t>(digits[i] - '0');
        if (value > (MAX - d) / 10) {
            return false;
        }
        value = value * 10 + d;
    }

    out = value;
    return true;
}

/// Splits an integer literal into sign and digit run.
auto split_integer(std::string_view raw, bool& negative) -> std::optional<std::string_view> {
    negative = !raw.empty() && raw[0] == '-';
    std::string_view digits = negative ? raw.substr(1) : raw;
    if (digits.empty()) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (!is_digit(c)) {
            return std::nullopt;
        }
    }
    return digits;
}

/// True when an out-of-range float literal is tiny rather than huge.
///
/// Decided by the decimal exponent of the first significant digit, so
/// `1000e-2` and `0.001e5` are judged by their value, not their spelling.
auto is_underflow(std::string_view raw) -> bool {
    std::string_view body = raw.starts_with('-') ? raw.substr(1) : raw;
    size_t e = body.find_first_of("eE");
    std::string_view mantissa = body.substr(0, e);
    size_t dot = mantissa.find('.');
    std::string_view int_part = mantissa.substr(0, dot);
    std::string_view frac_part =
        dot == std::string_view::npos ? std::string_view() : mantissa.substr(dot + 1);

    int64_t exponent = 0;
    if (e != std::string_view::npos) {
        std::string_view exp_text = body.substr(e + 1);
        bool negative = !exp_text.empty() && exp_text[0] == '-';
        if (!exp_text.empty() && (exp_text[0] == '-' || exp_text[0] == '+')) {
            exp_text.remove_prefix(1);
        }
        constexpr int64_t CAP = int64_t{1} << 40;
        for (char c : exp_text) {
            exponent = std::min(exponent * 10 + (c - '0'), CAP);
        }
        if (negative) {
            exponent = -exponent;
        }
    }

    size_t lead = int_part.find_first_not_of('0');
    int64_t magnitude = 0;
    if (lead != std::string_view::npos) {
        magnitude = static_cast<int64_t>(int_part.size() - lead) - 1;
    } else {
        size_t first = frac_part.find_first_not_of('0');
        if (first == std::string_view::npos) {
            return true;
        }
        magnitude = -static_cast<int64_t>(first) - 1;
    }
    return magnitude + exponent < 0;
}

} // namespace

auto parse_u64(std::string_view raw) -> Result<uint64_t, NumberError> {
    bool negative = false;
    auto digits = split_integer(raw, negative);
    if (!digits) {
        return NumberError::Invalid;
    }
    uint64_t magnitude = 0;
    if (!accumulate_digits(*digits, magnitude)) {
        return NumberError::OutOfRange;
    }
    if (negative && magnitude != 0) {
        return NumberError::OutOfRange;
    }
    return magnitude;
}

auto parse_i64(std::string_view raw) -> Result<int64_t, NumberError> {
    bool negative = false;
    auto digits = split_integer(raw, negative);
    if (!digits) {
        return NumberError::Invalid;
    }
    uint64_t magnitude = 0;
    if (!accumulate_digits(*digits, magnitude)) {
        return NumberError::OutOfRange;
    }
    constexpr uint64_t MAX_POS = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (negative) {
        if (magnitude > MAX_POS + 1) {
            return NumberError::OutOfRange;
        }
        // Two's complement wrap gives INT64_MIN for 2^63.
        return static_cast<int64_t>(0 - magnitude);
    }
    if (magnitude > MAX_POS) {
        return NumberError::OutOfRange;
    }
    return static_cast<int64_t>(magnitude);
}

// ============================================================================
// Float Parsing
// ============================================================================

auto parse_f64(std::string_view raw) -> Result<double, NumberError> {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec == std::errc::result_out_of_range) {
        if (is_underflow(raw)) {
            return raw.starts_with('-') ? -0.0 : 0.0;
        }
        return NumberError::OutOfRange;
    }
    if (ec != std::errc() || ptr != raw.data() + raw.size()) {
        return NumberError::Invalid;
    }
    return value;
}

auto parse_f32(std::string_view raw) -> Result<float, NumberError> {
    float value = 0.0f;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec == std::errc::result_out_of_range) {
        if (is_underflow(raw)) {
            return raw.starts_with('-') ? -0.0f : 0.0f;
        }
        return NumberError::OutOfRange;
    }
    if (ec != std::errc() || ptr != raw.data() + raw.size()) {
        return NumberError::Invalid;
    }
    return value;
}

// ============================================================================
// Number Formatting
// ============================================================================

void append_i64(std::string& out, int64_t value) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(buf, ptr);
}

void append_u64(std::string& out, uint64_t value) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(buf, ptr);
}

namespace {

/// Keeps a float looking like a float: "100" becomes "100.0".
void append_float_text(std::string& out, const char* begin, const char* end) {
    out.append(begin, end);
    for (const char* p = begin; p != end; ++p) {
        if (*p == '.' || *p == 'e' || *p == 'E') {
            return;
        }
    }
    out += ".0";
}

} // namespace

auto append_f64(std::string& out, double value) -> bool {
    if (!std::isfinite(value)) {
        return false;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    append_float_text(out, buf, ptr);
    return true;
}

auto append_f32(std::string& out, float value) -> bool {
    if (!std::isfinite(value)) {
        return false;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    append_float_text(out, buf, ptr);
    return true;
}

// ============================================================================
// String Escaping
// ============================================================================

namespace {

void append_escape(std::string& out, unsigned char c) {
    switch (c) {
    case '"':
        out += "\\\"";
        break;
    case '\\':
        out += "\\\\";
        break;
    case '\b':
        out += "\\b";
        break;
    case '\f':
        out += "\\f";
        break;
    case '\n':
        out += "\\n";
        break;
    case '\r':
        out += "\\r";
        break;
    case '\t':
        out += "\\t";
        break;
    default: {
        constexpr char digits[] = "0123456789abcdef";
        out += "\\u00";
        out += digits[c >> 4];
        out += digits[c & 0xF];
        break;
    }
    }
}

auto needs_escape(unsigned char c) -> bool {
    return c < 0x20 || c == '"' || c == '\\';
}

} // namespace

void append_escaped(std::string& out, std::string_view s) {
    const char* p = s.data();
    const char* end = p + s.size();
    const char* run = p;

    while (p < end) {
        if (end - p >= 8 && swar::escape_mask(swar::load(p)) == 0) {
            p += 8;
            continue;
        }
        auto c = static_cast<unsigned char>(*p);
        if (needs_escape(c)) {
            out.append(run, p);
            append_escape(out, c);
            run = p + 1;
        }
        ++p;
    }
    out.append(run, end);
}

} // namespace prism::json
