//! # JSON Error Rendering
//!
//! Category/code tables, path formatting, source windows and the
//! "did you mean" helpers behind `DeserError` and `SerError`.

#include "prism/json/json_error.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace prism::json {

namespace {

auto is_continuation(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// Number of code points in `s`.
auto count_chars(std::string_view s) -> size_t {
    size_t n = 0;
    for (char c : s) {
        if (!is_continuation(c)) {
            ++n;
        }
    }
    return n;
}

auto quote_list(const std::vector<std::string>& names) -> std::string {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += "`" + names[i] + "`";
    }
    return out;
}

auto location(const SourceContext& ctx) -> std::string {
    return std::to_string(ctx.line) + ":" + std::to_string(ctx.column);
}

} // namespace

auto default_category(ErrorKind kind) -> ErrorCategory {
    switch (kind) {
    case ErrorKind::UnexpectedCharacter:
    case ErrorKind::UnexpectedEndOfInput:
    case ErrorKind::InvalidNumber:
    case ErrorKind::InvalidEscape:
    case ErrorKind::TrailingCharacters:
        return ErrorCategory::Syntax;
    case ErrorKind::InvalidUtf8:
        return ErrorCategory::Encoding;
    case ErrorKind::UnexpectedToken:
    case ErrorKind::TrailingComma:
    case ErrorKind::DepthLimitExceeded:
        return ErrorCategory::Structural;
    case ErrorKind::MissingField:
    case ErrorKind::UnknownField:
    case ErrorKind::UnknownVariant:
    case ErrorKind::UnrepresentableKey:
        return ErrorCategory::Schema;
    case ErrorKind::TypeMismatch:
    case ErrorKind::NumberOutOfRange:
    case ErrorKind::InvalidValue:
    case ErrorKind::NonFiniteFloat:
        return ErrorCategory::TypeMismatch;
    }
    return ErrorCategory::Syntax;
}

auto category_name(ErrorCategory category) -> const char* {
    switch (category) {
    case ErrorCategory::Syntax:
        return "syntax";
    case ErrorCategory::Structural:
        return "structural";
    case ErrorCategory::Schema:
        return "schema";
    case ErrorCategory::TypeMismatch:
        return "type mismatch";
    case ErrorCategory::Encoding:
        return "encoding";
    }
    return "unknown";
}

auto error_code(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::UnexpectedCharacter:
        return "json::unexpected_character";
    case ErrorKind::UnexpectedEndOfInput:
        return "json::unexpected_eof";
    case ErrorKind::InvalidNumber:
        return "json::invalid_number";
    case ErrorKind::InvalidEscape:
        return "json::invalid_escape";
    case ErrorKind::TrailingCharacters:
        return "json::trailing_characters";
    case ErrorKind::InvalidUtf8:
        return "json::invalid_utf8";
    case ErrorKind::UnexpectedToken:
        return "json::unexpected_token";
    case ErrorKind::TrailingComma:
        return "json::trailing_comma";
    case ErrorKind::DepthLimitExceeded:
        return "json::depth_limit";
    case ErrorKind::MissingField:
        return "json::missing_field";
    case ErrorKind::UnknownField:
        return "json::unknown_field";
    case ErrorKind::UnknownVariant:
        return "json::unknown_variant";
    case ErrorKind::UnrepresentableKey:
        return "json::unrepresentable_key";
    case ErrorKind::TypeMismatch:
        return "json::type_mismatch";
    case ErrorKind::NumberOutOfRange:
        return "json::number_out_of_range";
    case ErrorKind::InvalidValue:
        return "json::invalid_value";
    case ErrorKind::NonFiniteFloat:
        return "json::non_finite_float";
    }
    return "json::error";
}

auto format_path(const std::vector<PathSegment>& path) -> std::string {
    std::string out = "$";
    for (const auto& segment : path) {
        if (const auto* name = std::get_if<std::string>(&segment)) {
            out += '.';
            out += *name;
        } else {
            out += '[';
            out += std::to_string(std::get<size_t>(segment));
            out += ']';
        }
    }
    return out;
}

// ============================================================================
// Source Windows
// ============================================================================

auto make_source_context(std::string_view input, Span span, size_t max_window) -> SourceContext {
    SourceContext ctx;
    size_t start = std::min(span.start, input.size());
    size_t end = std::clamp(span.end, start, input.size());

    size_t line_start = start;
    while (line_start > 0 && input[line_start - 1] != '\n') {
        --line_start;
    }
    size_t line_end = input.find('\n', start);
    if (line_end == std::string_view::npos) {
        line_end = input.size();
    }

    ctx.line = static_cast<size_t>(std::count(input.begin(), input.begin() + start, '\n')) + 1;
    ctx.column = count_chars(input.substr(line_start, start - line_start)) + 1;

    size_t ws = line_start;
    size_t we = line_end;
    if (we - ws > max_window) {
        size_t lead = max_window / 4;
        ws = start - line_start > lead ? start - lead : line_start;
        we = std::min(line_end, ws + max_window);
        if (we - ws < max_window) {
            ws = we - line_start > max_window ? we - max_window : line_start;
        }
    }
    while (ws < start && ws < input.size() && is_continuation(input[ws])) {
        ++ws;
    }
    while (we > ws && we < input.size() && is_continuation(input[we])) {
        --we;
    }

    ctx.excerpt = std::string(input.substr(ws, we - ws));
    for (char& c : ctx.excerpt) {
        if (c == '\t' || c == '\r') {
            c = ' ';
        }
    }
    ctx.truncated_before = ws > line_start;
    ctx.truncated_after = we < line_end;

    ctx.caret_offset = count_chars(input.substr(ws, start - ws));
    size_t caret_end = std::min(end, we);
    if (caret_end > start) {
        ctx.caret_len = std::max<size_t>(1, count_chars(input.substr(start, caret_end - start)));
    }
    return ctx;
}

// ============================================================================
// DeserError
// ============================================================================

auto DeserError::make(ErrorKind kind, Span span, std::string message) -> DeserError {
    DeserError err;
    err.kind = kind;
    err.category = default_category(kind);
    err.span = span;
    err.message = std::move(message);
    return err;
}

auto DeserError::type_mismatch(std::string_view expected, std::string_view found, Span span)
    -> DeserError {
    auto err = make(ErrorKind::TypeMismatch, span,
                    "expected " + std::string(expected) + ", found " + std::string(found));
    err.label = "expected " + std::string(expected);
    return err;
}

auto DeserError::missing_field(std::string_view name, Span object_span, Span open_span)
    -> DeserError {
    auto err = make(ErrorKind::MissingField, object_span,
                    "missing field `" + std::string(name) + "`");
    err.label = "object ended without field `" + std::string(name) + "`";
    err.related = open_span;
    err.related_label = "object started here";
    return err;
}

auto DeserError::unknown_field(std::string_view name, Span span,
                               const std::vector<std::string>& expected) -> DeserError {
    auto err = make(ErrorKind::UnknownField, span, "unknown field `" + std::string(name) + "`");
    err.label = "unknown field";
    std::string similar = find_similar(name, expected);
    if (!similar.empty()) {
        err.help = "did you mean `" + similar + "`?";
    } else if (!expected.empty()) {
        err.help = "expected one of " + quote_list(expected);
    }
    return err;
}

auto DeserError::unknown_variant(std::string_view name, Span span,
                                 const std::vector<std::string>& expected) -> DeserError {
    auto err =
        make(ErrorKind::UnknownVariant, span, "unknown variant `" + std::string(name) + "`");
    err.label = "unknown variant";
    std::string similar = find_similar(name, expected);
    if (!similar.empty()) {
        err.help = "did you mean `" + similar + "`?";
    } else if (!expected.empty()) {
        err.help = "expected one of " + quote_list(expected);
    }
    return err;
}

auto DeserError::out_of_range(std::string_view literal, std::string_view type_name, Span span)
    -> DeserError {
    auto err = make(ErrorKind::NumberOutOfRange, span,
                    "number `" + std::string(literal) + "` out of range for " +
                        std::string(type_name));
    err.label = "out of range";
    return err;
}

void DeserError::prepend_path(PathSegment segment) {
    path.insert(path.begin(), std::move(segment));
}

void DeserError::attach_source(std::string_view input, size_t max_window) {
    context = make_source_context(input, span, max_window);
    if (related) {
        related_context = make_source_context(input, *related, max_window);
    }
}

auto DeserError::to_string() const -> std::string {
    std::ostringstream out;
    out << "error[" << code() << "]: " << message << "\n";

    if (!context) {
        out << "  --> bytes " << span.start << ".." << span.end << "\n";
        out << "   = path: " << path_string() << "\n";
        if (!help.empty()) {
            out << "   = help: " << help << "\n";
        }
        return out.str();
    }

    std::string line_no = std::to_string(context->line);
    std::string pad(line_no.size() + 1, ' ');
    std::string prefix = context->truncated_before ? "..." : "";

    out << pad << "--> " << location(*context) << "\n";
    out << pad << " |\n";
    out << " " << line_no << " | " << prefix << context->excerpt
        << (context->truncated_after ? "..." : "") << "\n";
    out << pad << " | " << std::string(prefix.size() + context->caret_offset, ' ')
        << std::string(context->caret_len, '^');
    if (!label.empty()) {
        out << " " << label;
    }
    out << "\n";
    out << pad << " = path: " << path_string() << "\n";
    if (related_context && !related_label.empty()) {
        out << pad << " = note: " << related_label << " at " << location(*related_context)
            << "\n";
    }
    if (!help.empty()) {
        out << pad << " = help: " << help << "\n";
    }
    return out.str();
}

// ============================================================================
// SerError
// ============================================================================

auto SerError::make(ErrorKind kind, std::string message) -> SerError {
    SerError err;
    err.kind = kind;
    err.category = default_category(kind);
    err.message = std::move(message);
    return err;
}

void SerError::prepend_path(PathSegment segment) {
    path.insert(path.begin(), std::move(segment));
}

auto SerError::to_string() const -> std::string {
    return "error[" + std::string(code()) + "]: " + message + " at " + format_path(path);
}

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

auto levenshtein_distance(std::string_view s1, std::string_view s2) -> size_t {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));
            size_t cost = (c1 == c2) ? 0 : 1;
            curr_row[j] = std::min({prev_row[j] + 1, curr_row[j - 1] + 1, prev_row[j - 1] + cost});
        }
        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

auto find_similar(std::string_view input, const std::vector<std::string>& candidates,
                  size_t max_distance) -> std::string {
    if (input.empty() || candidates.empty()) {
        return "";
    }

    std::string best_match;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best_match = candidate;
        }
    }

    return best_match;
}

} // namespace prism::json
