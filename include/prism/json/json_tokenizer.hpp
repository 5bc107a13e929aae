//! # JSON Tokenizer
//!
//! Converts UTF-8 input into span-tagged tokens, one at a time. The
//! tokenizer knows nothing about target types; the drivers pull tokens
//! from it as they walk a shape.
//!
//! ## Features
//!
//! - **Zero-copy strings**: A string without escapes borrows the input;
//!   the first escape switches the token to an owned, unescaped buffer
//! - **Absolute spans**: Every token and error carries `[start, end)` byte
//!   offsets into the original input, also when scanning starts mid-input
//! - **Number classification**: Sign, fraction and exponent presence are
//!   recorded so no re-scan is needed to pick an integer or float target
//! - **UTF-8 validation**: Invalid sequences are rejected with their span
//!
//! ## Token Types
//!
//! | Token | Example |
//! |-------|---------|
//! | `String` | `"hello"` |
//! | `Number` | `-12.5e3` |
//! | `True` / `False` / `Null` | `true` |
//! | `ObjectStart` / `ObjectEnd` | `{` `}` |
//! | `ArrayStart` / `ArrayEnd` | `[` `]` |
//! | `Colon` / `Comma` | `:` `,` |
//! | `EndOfInput` | (repeatable) |
//!
//! ## Example
//!
//! ```cpp
//! Tokenizer tokenizer(R"({"key": 42})");
//! while (true) {
//!     auto result = tokenizer.next_token();
//!     if (is_err(result)) break;
//!     const Token& tok = unwrap(result);
//!     if (tok.kind == TokenKind::EndOfInput) break;
//! }
//! ```

#pragma once

#include "prism/common.hpp"
#include "prism/json/json_error.hpp"
#include "prism/json/json_scalar.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace prism::json {

// ============================================================================
// Tokens
// ============================================================================

enum class TokenKind : uint8_t {
    String,
    Number,
    True,
    False,
    Null,
    ObjectStart,
    ObjectEnd,
    ArrayStart,
    ArrayEnd,
    Colon,
    Comma,
    EndOfInput
};

/// Human-readable token description for messages ("string", "`{`").
[[nodiscard]] auto token_kind_name(TokenKind kind) -> const char*;

/// Borrowed slice of the input or owned unescaped buffer.
using CowStr = std::variant<std::string_view, std::string>;

/// A token with its byte span.
///
/// For `String` tokens `text` holds the unescaped contents; for `Number`
/// tokens it borrows the raw literal.
struct Token {
    TokenKind kind = TokenKind::EndOfInput;
    Span span;
    CowStr text;
    NumberInfo number;

    [[nodiscard]] auto str() const -> std::string_view {
        if (const auto* view = std::get_if<std::string_view>(&text)) {
            return *view;
        }
        return std::get<std::string>(text);
    }

    /// True when `text` points into the input.
    [[nodiscard]] auto is_borrowed() const -> bool {
        return std::holds_alternative<std::string_view>(text);
    }

    /// Moves an owned buffer out, or copies a borrowed slice.
    [[nodiscard]] auto take_string() -> std::string {
        if (auto* owned = std::get_if<std::string>(&text)) {
            return std::move(*owned);
        }
        return std::string(std::get<std::string_view>(text));
    }
};

/// Resumption point for reading several documents from one input.
struct Cursor {
    size_t offset = 0;
};

// ============================================================================
// Tokenizer
// ============================================================================

/// Pull tokenizer over an in-memory UTF-8 buffer.
///
/// Copying a tokenizer copies its position, which the drivers use to look
/// ahead over a whole object and come back.
class Tokenizer {
public:
    /// Creates a tokenizer that starts reading at byte `offset`.
    explicit Tokenizer(std::string_view input, size_t offset = 0);

    /// Returns the next token and advances past it.
    ///
    /// After the input is exhausted every call returns `EndOfInput` with an
    /// empty span at the end of the input.
    auto next_token() -> Result<Token, DeserError>;

    /// Byte offset just after the last consumed token.
    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }

    [[nodiscard]] auto input() const -> std::string_view {
        return input_;
    }

    /// Advances past whitespace. Returns true if input remains.
    auto skip_whitespace() -> bool;

private:
    std::string_view input_;
    size_t pos_ = 0;

    auto make_token(TokenKind kind, size_t start) const -> Token;
    auto error(ErrorKind kind, size_t start, size_t end, std::string message) const -> DeserError;

    auto lex_string() -> Result<Token, DeserError>;
    auto lex_string_owned(size_t start, size_t clean_end) -> Result<Token, DeserError>;
    auto lex_escape(std::string& buffer) -> Result<bool, DeserError>;
    auto lex_number() -> Result<Token, DeserError>;
    auto lex_keyword() -> Result<Token, DeserError>;
    auto lex_unexpected() -> DeserError;
    auto invalid_utf8(size_t at) const -> DeserError;
};

} // namespace prism::json
