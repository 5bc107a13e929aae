//! # JSON Tokenizer Implementation
//!
//! String literals are scanned with the SWAR special-byte search. The
//! clean prefix of a string is never copied unless an escape shows up, at
//! which point the token switches to an owned buffer.

#include "prism/json/json_tokenizer.hpp"

#include "prism/log/log.hpp"

#include <algorithm>

namespace prism::json {

auto token_kind_name(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::String:
        return "string";
    case TokenKind::Number:
        return "number";
    case TokenKind::True:
    case TokenKind::False:
        return "boolean";
    case TokenKind::Null:
        return "null";
    case TokenKind::ObjectStart:
        return "`{`";
    case TokenKind::ObjectEnd:
        return "`}`";
    case TokenKind::ArrayStart:
        return "`[`";
    case TokenKind::ArrayEnd:
        return "`]`";
    case TokenKind::Colon:
        return "`:`";
    case TokenKind::Comma:
        return "`,`";
    case TokenKind::EndOfInput:
        return "end of input";
    }
    return "token";
}

Tokenizer::Tokenizer(std::string_view input, size_t offset)
    : input_(input), pos_(std::min(offset, input.size())) {}

auto Tokenizer::skip_whitespace() -> bool {
    while (pos_ < input_.size() && is_whitespace(input_[pos_])) {
        ++pos_;
    }
    return pos_ < input_.size();
}

auto Tokenizer::make_token(TokenKind kind, size_t start) const -> Token {
    Token tok;
    tok.kind = kind;
    tok.span = Span{start, pos_};
    return tok;
}

auto Tokenizer::error(ErrorKind kind, size_t start, size_t end, std::string message) const
    -> DeserError {
    PRISM_LOG_TRACE("tokenizer", error_code(kind) << " at " << start << ".." << end);
    return DeserError::make(kind, Span{start, end}, std::move(message));
}

auto Tokenizer::invalid_utf8(size_t at) const -> DeserError {
    size_t end = at + 1;
    while (end < input_.size() && end - at < 4 &&
           (static_cast<unsigned char>(input_[end]) & 0xC0) == 0x80) {
        ++end;
    }
    auto err = error(ErrorKind::InvalidUtf8, at, end, "invalid UTF-8 sequence");
    err.label = "not valid UTF-8";
    return err;
}

auto Tokenizer::next_token() -> Result<Token, DeserError> {
    if (!skip_whitespace()) {
        return make_token(TokenKind::EndOfInput, pos_);
    }

    size_t start = pos_;
    switch (input_[pos_]) {
    case '{':
        ++pos_;
        return make_token(TokenKind::ObjectStart, start);
    case '}':
        ++pos_;
        return make_token(TokenKind::ObjectEnd, start);
    case '[':
        ++pos_;
        return make_token(TokenKind::ArrayStart, start);
    case ']':
        ++pos_;
        return make_token(TokenKind::ArrayEnd, start);
    case ':':
        ++pos_;
        return make_token(TokenKind::Colon, start);
    case ',':
        ++pos_;
        return make_token(TokenKind::Comma, start);
    case '"':
        return lex_string();
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
        return lex_number();
    case 't':
    case 'f':
    case 'n':
        return lex_keyword();
    default:
        return lex_unexpected();
    }
}

// ============================================================================
// Strings
// ============================================================================

auto Tokenizer::lex_string() -> Result<Token, DeserError> {
    const size_t start = pos_;
    const char* base = input_.data();
    const char* end = base + input_.size();
    const char* p = base + start + 1;

    while (true) {
        p = find_string_special(p, end);
        if (p == end) {
            return error(ErrorKind::UnexpectedEndOfInput, start, input_.size(),
                         "unterminated string");
        }

        auto c = static_cast<unsigned char>(*p);
        if (c == '"') {
            pos_ = static_cast<size_t>(p - base) + 1;
            Token tok = make_token(TokenKind::String, start);
            tok.text = input_.substr(start + 1, static_cast<size_t>(p - base) - start - 1);
            return tok;
        }
        if (c == '\\') {
            return lex_string_owned(start, static_cast<size_t>(p - base));
        }
        if (c < 0x20) {
            size_t at = static_cast<size_t>(p - base);
            return error(ErrorKind::UnexpectedCharacter, at, at + 1,
                         "control character in string literal");
        }

        size_t len =
            utf8_sequence_length(reinterpret_cast<const unsigned char*>(p), static_cast<size_t>(end - p));
        if (len == 0) {
            return invalid_utf8(static_cast<size_t>(p - base));
        }
        p += len;
    }
}

auto Tokenizer::lex_string_owned(size_t start, size_t clean_end) -> Result<Token, DeserError> {
    const char* base = input_.data();
    const char* end = base + input_.size();

    std::string buffer(input_.substr(start + 1, clean_end - start - 1));
    pos_ = clean_end;

    while (true) {
        const char* p = find_string_special(base + pos_, end);
        buffer.append(base + pos_, p);
        pos_ = static_cast<size_t>(p - base);

        if (p == end) {
            return error(ErrorKind::UnexpectedEndOfInput, start, input_.size(),
                         "unterminated string");
        }

        auto c = static_cast<unsigned char>(*p);
        if (c == '"') {
            ++pos_;
            Token tok = make_token(TokenKind::String, start);
            tok.text = std::move(buffer);
            return tok;
        }
        if (c == '\\') {
            auto escaped = lex_escape(buffer);
            if (is_err(escaped)) {
                return std::move(unwrap_err(escaped));
            }
            continue;
        }
        if (c < 0x20) {
            return error(ErrorKind::UnexpectedCharacter, pos_, pos_ + 1,
                         "control character in string literal");
        }

        size_t len =
            utf8_sequence_length(reinterpret_cast<const unsigned char*>(p), static_cast<size_t>(end - p));
        if (len == 0) {
            return invalid_utf8(pos_);
        }
        buffer.append(p, len);
        pos_ += len;
    }
}

auto Tokenizer::lex_escape(std::string& buffer) -> Result<bool, DeserError> {
    const size_t esc = pos_;
    if (esc + 1 >= input_.size()) {
        return error(ErrorKind::UnexpectedEndOfInput, esc, input_.size(),
                     "unterminated escape sequence");
    }

    char kind = input_[esc + 1];
    switch (kind) {
    case '"':
        buffer += '"';
        break;
    case '\\':
        buffer += '\\';
        break;
    case '/':
        buffer += '/';
        break;
    case 'b':
        buffer += '\b';
        break;
    case 'f':
        buffer += '\f';
        break;
    case 'n':
        buffer += '\n';
        break;
    case 'r':
        buffer += '\r';
        break;
    case 't':
        buffer += '\t';
        break;
    case 'u': {
        if (esc + 6 > input_.size()) {
            return error(ErrorKind::InvalidEscape, esc, input_.size(),
                         "incomplete unicode escape");
        }
        int32_t unit = parse_hex4(input_.data() + esc + 2);
        if (unit < 0) {
            return error(ErrorKind::InvalidEscape, esc, esc + 6, "invalid unicode escape");
        }
        pos_ = esc + 6;

        if (unit >= 0xDC00 && unit <= 0xDFFF) {
            auto err = error(ErrorKind::InvalidEscape, esc, esc + 6,
                             "unexpected low surrogate without a preceding high surrogate");
            err.category = ErrorCategory::Encoding;
            err.label = "lone low surrogate";
            return err;
        }

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (pos_ + 6 <= input_.size() && input_[pos_] == '\\' && input_[pos_ + 1] == 'u') {
                int32_t low = parse_hex4(input_.data() + pos_ + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    char32_t cp = 0x10000 + ((static_cast<char32_t>(unit) - 0xD800) << 10) +
                                  (static_cast<char32_t>(low) - 0xDC00);
                    append_utf8(buffer, cp);
                    pos_ += 6;
                    return true;
                }
            }
            auto err = error(ErrorKind::InvalidEscape, esc, esc + 6,
                             "high surrogate not followed by a low surrogate");
            err.category = ErrorCategory::Encoding;
            err.label = "unpaired surrogate";
            return err;
        }

        append_utf8(buffer, static_cast<char32_t>(unit));
        return true;
    }
    default: {
        auto err = error(ErrorKind::InvalidEscape, esc, esc + 2,
                         std::string("invalid escape sequence `\\") + kind + "`");
        err.label = "invalid escape";
        return err;
    }
    }

    pos_ = esc + 2;
    return true;
}

// ============================================================================
// Numbers and Keywords
// ============================================================================

auto Tokenizer::lex_number() -> Result<Token, DeserError> {
    const size_t start = pos_;
    NumberScan scan = json::scan_number(input_, start);
    if (!scan.ok) {
        auto literal = input_.substr(start, scan.end - start);
        return error(ErrorKind::InvalidNumber, start, scan.end,
                     "invalid number `" + std::string(literal) + "`");
    }

    pos_ = scan.end;
    Token tok = make_token(TokenKind::Number, start);
    tok.text = input_.substr(start, scan.end - start);
    tok.number = scan.info;
    return tok;
}

auto Tokenizer::lex_keyword() -> Result<Token, DeserError> {
    struct Keyword {
        std::string_view text;
        TokenKind kind;
    };
    static constexpr Keyword keywords[] = {
        {"true", TokenKind::True}, {"false", TokenKind::False}, {"null", TokenKind::Null}};

    const size_t start = pos_;
    std::string_view rest = input_.substr(start);
    for (const auto& kw : keywords) {
        if (rest.starts_with(kw.text)) {
            pos_ += kw.text.size();
            return make_token(kw.kind, start);
        }
        if (kw.text.starts_with(rest)) {
            return error(ErrorKind::UnexpectedEndOfInput, start, input_.size(),
                         "unexpected end of input in `" + std::string(kw.text) + "`");
        }
    }
    return lex_unexpected();
}

auto Tokenizer::lex_unexpected() -> DeserError {
    const size_t at = pos_;
    auto c = static_cast<unsigned char>(input_[at]);
    if (c >= 0x80) {
        size_t len = utf8_sequence_length(reinterpret_cast<const unsigned char*>(input_.data() + at),
                                          input_.size() - at);
        if (len == 0) {
            return invalid_utf8(at);
        }
        auto err = error(ErrorKind::UnexpectedCharacter, at, at + len,
                         "unexpected character `" + std::string(input_.substr(at, len)) + "`");
        err.label = "expected a JSON value";
        return err;
    }

    std::string shown;
    if (c >= 0x20 && c < 0x7F) {
        shown = std::string(1, static_cast<char>(c));
    } else {
        constexpr char digits[] = "0123456789abcdef";
        shown = "\\u00";
        shown += digits[c >> 4];
        shown += digits[c & 0xF];
    }
    auto err = error(ErrorKind::UnexpectedCharacter, at, at + 1,
                     "unexpected character `" + shown + "`");
    err.label = "expected a JSON value";
    return err;
}

} // namespace prism::json
