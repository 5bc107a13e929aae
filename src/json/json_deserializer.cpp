//! # JSON Deserializer Implementation
//!
//! Recursive descent over the target shape with one token of lookahead.
//! Enum forms that need to see a whole object before choosing a variant
//! (internal tags, hooks, untagged trials) work on copies of the
//! deserializer, which are cheap: a tokenizer position and a token.

#include "prism/json/json_deserializer.hpp"

#include "prism/log/log.hpp"

#include <limits>
#include <memory>

namespace prism::json {

namespace {

constexpr std::string_view BOM = "\xEF\xBB\xBF";

/// What a shape expects, as shown in "expected X, found Y".
auto expected_name(const Shape& shape) -> std::string {
    switch (shape.kind) {
    case ShapeKind::Scalar:
        if (shape.scalar == ScalarKind::Unit) {
            return "null";
        }
        return shape.type_name;
    case ShapeKind::Struct:
    case ShapeKind::Map:
        return "object";
    case ShapeKind::List:
    case ShapeKind::Tuple:
        return "array";
    case ShapeKind::Option:
        return expected_name(shape.as_option().inner()) + " or null";
    case ShapeKind::Enum:
        return shape.type_name;
    case ShapeKind::Transparent:
        return expected_name(shape.as_transparent().inner());
    }
    return shape.type_name;
}

auto found_name(const Token& tok) -> std::string_view {
    switch (tok.kind) {
    case TokenKind::ObjectStart:
        return "object";
    case TokenKind::ArrayStart:
        return "array";
    case TokenKind::Number:
        return tok.number.is_integer() ? "integer" : "float";
    default:
        return token_kind_name(tok.kind);
    }
}

auto is_value_start(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::String:
    case TokenKind::Number:
    case TokenKind::True:
    case TokenKind::False:
    case TokenKind::Null:
    case TokenKind::ObjectStart:
    case TokenKind::ArrayStart:
        return true;
    default:
        return false;
    }
}

auto select_by_hooks(const EnumDef& def, const std::vector<std::string>& keys) -> const Variant* {
    std::vector<std::string_view> views(keys.begin(), keys.end());
    for (const auto& variant : def.variants) {
        if (variant.select != nullptr && variant.select(views)) {
            PRISM_LOG_TRACE("deser", "select hook chose variant " << variant.name);
            return &variant;
        }
    }
    return nullptr;
}

/// A tag key given twice in one object.
auto duplicate_tag(std::string_view tag, Span span, Span first) -> DeserError {
    auto err = DeserError::make(ErrorKind::InvalidValue, span,
                                "duplicate tag `" + std::string(tag) + "`");
    err.label = "tag given again here";
    err.related = first;
    err.related_label = "first tag";
    err.prepend_path(std::string(tag));
    return err;
}

class DepthGuard {
public:
    explicit DepthGuard(size_t& depth) : depth_(depth) {
        ++depth_;
    }
    ~DepthGuard() {
        --depth_;
    }
    DepthGuard(const DepthGuard&) = delete;
    auto operator=(const DepthGuard&) -> DepthGuard& = delete;

private:
    size_t& depth_;
};

/// Keys of an object and its tag value, gathered ahead of the real pass.
struct ObjectScan {
    std::vector<std::string> keys;
    std::optional<std::string> tag;
    Span tag_span;
    Span open;
    Span close;
};

/// Struct frames for a struct and its flattened members.
///
/// Node 0 is the outer struct; a flattened member's node follows its
/// parent, so children always have larger indexes.
class FrameTree {
public:
    struct Node {
        const Shape* shape;
        std::unique_ptr<StructFrame> frame;
        size_t parent;
        size_t parent_field;
    };

    struct Location {
        size_t node;
        size_t field;
    };

    FrameTree(const Shape& shape, void* base) {
        add(shape, base, SIZE_MAX, 0);
    }

    [[nodiscard]] auto find(std::string_view key) const -> std::optional<Location> {
        for (size_t n = 0; n < nodes_.size(); ++n) {
            const auto& fields = nodes_[n].frame->fields();
            for (size_t i = 0; i < fields.size(); ++i) {
                if (!is_flattened(fields[i]) && fields[i].json_name() == key) {
                    return Location{n, i};
                }
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto names() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& node : nodes_) {
            for (const auto& field : node.frame->fields()) {
                if (!is_flattened(field)) {
                    out.emplace_back(field.json_name());
                }
            }
        }
        return out;
    }

    [[nodiscard]] auto node(size_t index) -> Node& {
        return nodes_[index];
    }

    [[nodiscard]] auto size() const -> size_t {
        return nodes_.size();
    }

    static auto is_flattened(const Field& field) -> bool {
        return field.has(FIELD_FLATTEN) && field.shape().kind == ShapeKind::Struct;
    }

private:
    std::vector<Node> nodes_;

    void add(const Shape& shape, void* base, size_t parent, size_t parent_field) {
        size_t index = nodes_.size();
        nodes_.push_back(Node{&shape, std::make_unique<StructFrame>(shape, base), parent,
                              parent_field});
        const auto& fields = shape.as_struct().fields;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (is_flattened(fields[i])) {
                add(fields[i].shape(), nodes_[index].frame->field_ptr(i), index, i);
            }
        }
    }
};

// ============================================================================
// Deserializer
// ============================================================================

class Deserializer {
public:
    Deserializer(std::string_view input, size_t offset, const DeserializeOptions& options,
                 size_t depth = 0)
        : tokenizer_(input, offset), options_(&options), depth_(depth) {}

    auto value(const Shape& shape, void* dst) -> Result<bool, DeserError>;

    auto next() -> Result<Token, DeserError> {
        if (peeked_) {
            Token tok = std::move(*peeked_);
            peeked_.reset();
            return tok;
        }
        return tokenizer_.next_token();
    }

    auto peek() -> Result<const Token*, DeserError> {
        if (!peeked_) {
            auto result = tokenizer_.next_token();
            if (is_err(result)) {
                return std::move(unwrap_err(result));
            }
            peeked_ = std::move(unwrap(result));
        }
        return &*peeked_;
    }

    /// Offset of the first unconsumed byte.
    [[nodiscard]] auto offset() const -> size_t {
        return peeked_ ? peeked_->span.start : tokenizer_.position();
    }

    /// Offset of the next non-whitespace byte, if any.
    [[nodiscard]] auto remaining() const -> std::optional<size_t> {
        if (peeked_) {
            if (peeked_->kind == TokenKind::EndOfInput) {
                return std::nullopt;
            }
            return peeked_->span.start;
        }
        Tokenizer probe = tokenizer_;
        if (!probe.skip_whitespace()) {
            return std::nullopt;
        }
        return probe.position();
    }

private:
    Tokenizer tokenizer_;
    std::optional<Token> peeked_;
    const DeserializeOptions* options_;
    size_t depth_ = 0;

    // Errors
    auto unexpected(const Token& tok, std::string_view expected,
                    std::optional<Span> open = std::nullopt) const -> DeserError;
    auto mismatch(const Shape& shape, const Token& tok) const -> DeserError;
    auto depth_exceeded(const Token& open) const -> DeserError;
    static auto trailing_comma(Span comma) -> DeserError;

    // Containers
    template <typename F> auto for_each_entry(const Token& open, F&& on_entry) -> Result<Span, DeserError>;
    template <typename F> auto for_each_element(const Token& open, F&& on_element) -> Result<Span, DeserError>;
    auto skip_value() -> Result<bool, DeserError>;
    auto scan_object(std::optional<std::string_view> tag) -> Result<ObjectScan, DeserError>;

    // Shapes
    auto scalar(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto scalar_token(const Shape& shape, Token& tok, void* dst, bool is_key)
        -> Result<bool, DeserError>;
    auto number(const Shape& shape, std::string_view literal, NumberInfo info, Span span,
                void* dst) -> Result<bool, DeserError>;
    auto custom(const Shape& shape, const Token& tok, void* dst) -> Result<bool, DeserError>;
    auto structure(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto struct_body(const Shape& shape, void* dst, const Token& open,
                     std::optional<std::string_view> ignore_key) -> Result<bool, DeserError>;
    auto fill_missing(const Shape& shape, StructFrame& frame, Span object, Span open)
        -> Result<bool, DeserError>;
    auto tuple(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto list(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto map(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto map_key(const Shape& shape, Token& key, void* dst) -> Result<bool, DeserError>;
    auto option(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto transparent(const Shape& shape, void* dst) -> Result<bool, DeserError>;

    // Enums
    auto enumeration(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto external_enum(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto internal_enum(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto adjacent_enum(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto untagged_enum(const Shape& shape, void* dst) -> Result<bool, DeserError>;
    auto variant_content(const Variant& variant, Slot& payload) -> Result<bool, DeserError>;
    auto whole_object_variant(const EnumDef& def, const Variant& variant, void* dst)
        -> Result<bool, DeserError>;
};

// ============================================================================
// Errors
// ============================================================================

auto Deserializer::unexpected(const Token& tok, std::string_view expected,
                              std::optional<Span> open) const -> DeserError {
    DeserError err;
    if (tok.kind == TokenKind::EndOfInput) {
        err = DeserError::make(ErrorKind::UnexpectedEndOfInput, tok.span,
                               "unexpected end of input, expected " + std::string(expected));
        err.label = "input ends here";
    } else {
        err = DeserError::make(ErrorKind::UnexpectedToken, tok.span,
                               "expected " + std::string(expected) + ", found " +
                                   token_kind_name(tok.kind));
        err.label = "unexpected " + std::string(token_kind_name(tok.kind));
    }
    if (open) {
        err.related = *open;
        err.related_label = "container started here";
    }
    return err;
}

auto Deserializer::mismatch(const Shape& shape, const Token& tok) const -> DeserError {
    if (!is_value_start(tok.kind)) {
        return unexpected(tok, "a value");
    }
    return DeserError::type_mismatch(expected_name(shape), found_name(tok), tok.span);
}

auto Deserializer::depth_exceeded(const Token& open) const -> DeserError {
    auto err = DeserError::make(ErrorKind::DepthLimitExceeded, open.span,
                                "nesting deeper than " + std::to_string(options_->max_depth) +
                                    " levels");
    err.label = "too deeply nested";
    return err;
}

auto Deserializer::trailing_comma(Span comma) -> DeserError {
    auto err = DeserError::make(ErrorKind::TrailingComma, comma,
                                "trailing comma before closing delimiter");
    err.label = "remove this comma";
    return err;
}

// ============================================================================
// Containers
// ============================================================================

/// Walks the members of the object opened by `open`.
///
/// `on_entry(Token& key)` is called with the colon consumed and must
/// consume the member's value. Returns the span of the closing `}`.
template <typename F>
auto Deserializer::for_each_entry(const Token& open, F&& on_entry) -> Result<Span, DeserError> {
    auto first = next();
    if (is_err(first)) {
        return std::move(unwrap_err(first));
    }
    Token key = std::move(unwrap(first));
    if (key.kind == TokenKind::ObjectEnd) {
        return key.span;
    }

    while (true) {
        if (key.kind != TokenKind::String) {
            return unexpected(key, "a string key", open.span);
        }

        auto colon = next();
        if (is_err(colon)) {
            return std::move(unwrap_err(colon));
        }
        if (unwrap(colon).kind != TokenKind::Colon) {
            return unexpected(unwrap(colon), "`:`", open.span);
        }

        auto entry = on_entry(key);
        if (is_err(entry)) {
            return std::move(unwrap_err(entry));
        }

        auto sep = next();
        if (is_err(sep)) {
            return std::move(unwrap_err(sep));
        }
        const Token& sep_tok = unwrap(sep);
        if (sep_tok.kind == TokenKind::ObjectEnd) {
            return sep_tok.span;
        }
        if (sep_tok.kind != TokenKind::Comma) {
            return unexpected(sep_tok, "`,` or `}`", open.span);
        }

        auto after = next();
        if (is_err(after)) {
            return std::move(unwrap_err(after));
        }
        if (unwrap(after).kind == TokenKind::ObjectEnd) {
            return trailing_comma(sep_tok.span);
        }
        key = std::move(unwrap(after));
    }
}

/// Walks the elements of the array opened by `open`.
///
/// `on_element(size_t index)` must consume one value. Returns the span of
/// the closing `]`.
template <typename F>
auto Deserializer::for_each_element(const Token& open, F&& on_element)
    -> Result<Span, DeserError> {
    auto first = peek();
    if (is_err(first)) {
        return std::move(unwrap_err(first));
    }
    if (unwrap(first)->kind == TokenKind::ArrayEnd) {
        Span close = unwrap(first)->span;
        peeked_.reset();
        return close;
    }

    for (size_t index = 0;; ++index) {
        auto element = on_element(index);
        if (is_err(element)) {
            return std::move(unwrap_err(element));
        }

        auto sep = next();
        if (is_err(sep)) {
            return std::move(unwrap_err(sep));
        }
        const Token& sep_tok = unwrap(sep);
        if (sep_tok.kind == TokenKind::ArrayEnd) {
            return sep_tok.span;
        }
        if (sep_tok.kind != TokenKind::Comma) {
            return unexpected(sep_tok, "`,` or `]`", open.span);
        }

        auto after = peek();
        if (is_err(after)) {
            return std::move(unwrap_err(after));
        }
        if (unwrap(after)->kind == TokenKind::ArrayEnd) {
            return trailing_comma(sep_tok.span);
        }
    }
}

auto Deserializer::skip_value() -> Result<bool, DeserError> {
    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    const Token tok = std::move(unwrap(next_tok));

    switch (tok.kind) {
    case TokenKind::String:
    case TokenKind::Number:
    case TokenKind::True:
    case TokenKind::False:
    case TokenKind::Null:
        return true;
    case TokenKind::ObjectStart: {
        if (depth_ >= options_->max_depth) {
            return depth_exceeded(tok);
        }
        DepthGuard guard(depth_);
        auto closed = for_each_entry(tok, [this](Token&) { return skip_value(); });
        if (is_err(closed)) {
            return std::move(unwrap_err(closed));
        }
        return true;
    }
    case TokenKind::ArrayStart: {
        if (depth_ >= options_->max_depth) {
            return depth_exceeded(tok);
        }
        DepthGuard guard(depth_);
        auto closed = for_each_element(tok, [this](size_t) { return skip_value(); });
        if (is_err(closed)) {
            return std::move(unwrap_err(closed));
        }
        return true;
    }
    default:
        return unexpected(tok, "a value");
    }
}

/// Reads the object at the current position on a copy of this
/// deserializer, collecting its keys and the string value of `tag`.
auto Deserializer::scan_object(std::optional<std::string_view> tag)
    -> Result<ObjectScan, DeserError> {
    Deserializer scan(*this);
    ObjectScan out;

    auto open_tok = scan.next();
    if (is_err(open_tok)) {
        return std::move(unwrap_err(open_tok));
    }
    const Token open = std::move(unwrap(open_tok));
    out.open = open.span;

    auto closed = scan.for_each_entry(open, [&](Token& key) -> Result<bool, DeserError> {
        if (tag && key.str() == *tag) {
            auto value = scan.next();
            if (is_err(value)) {
                return std::move(unwrap_err(value));
            }
            Token& tag_tok = unwrap(value);
            if (out.tag) {
                return duplicate_tag(*tag, tag_tok.span, out.tag_span);
            }
            if (tag_tok.kind != TokenKind::String) {
                auto err = DeserError::type_mismatch("string", found_name(tag_tok), tag_tok.span);
                err.prepend_path(std::string(*tag));
                return err;
            }
            out.tag_span = tag_tok.span;
            out.tag = tag_tok.take_string();
            return true;
        }
        out.keys.push_back(key.take_string());
        return scan.skip_value();
    });
    if (is_err(closed)) {
        return std::move(unwrap_err(closed));
    }
    out.close = unwrap(closed);
    return out;
}

// ============================================================================
// Dispatch
// ============================================================================

auto Deserializer::value(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    switch (shape.kind) {
    case ShapeKind::Scalar:
        return scalar(shape, dst);
    case ShapeKind::Struct:
        return structure(shape, dst);
    case ShapeKind::Tuple:
        return tuple(shape, dst);
    case ShapeKind::List:
        return list(shape, dst);
    case ShapeKind::Map:
        return map(shape, dst);
    case ShapeKind::Option:
        return option(shape, dst);
    case ShapeKind::Enum:
        return enumeration(shape, dst);
    case ShapeKind::Transparent:
        return transparent(shape, dst);
    }
    return DeserError::make(ErrorKind::InvalidValue, Span::at(offset(), 0), "unsupported shape");
}

// ============================================================================
// Scalars
// ============================================================================

auto Deserializer::scalar(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    return scalar_token(shape, unwrap(next_tok), dst, false);
}

auto Deserializer::scalar_token(const Shape& shape, Token& tok, void* dst, bool is_key)
    -> Result<bool, DeserError> {
    switch (shape.scalar) {
    case ScalarKind::Unit:
        if (tok.kind == TokenKind::Null) {
            shape.vtable.default_in_place(dst);
            return true;
        }
        break;

    case ScalarKind::Bool:
        if (tok.kind == TokenKind::True || tok.kind == TokenKind::False) {
            std::construct_at(static_cast<bool*>(dst), tok.kind == TokenKind::True);
            return true;
        }
        if (is_key && tok.kind == TokenKind::String && (tok.str() == "true" || tok.str() == "false")) {
            std::construct_at(static_cast<bool*>(dst), tok.str() == "true");
            return true;
        }
        break;

    case ScalarKind::Char:
        if (tok.kind == TokenKind::String) {
            auto cp = decode_single_char(tok.str());
            if (!cp) {
                auto err = DeserError::make(ErrorKind::InvalidValue, tok.span,
                                            "expected a single character");
                err.label = "not exactly one character";
                return err;
            }
            std::construct_at(static_cast<char32_t*>(dst), *cp);
            return true;
        }
        break;

    case ScalarKind::String:
        if (tok.kind == TokenKind::String) {
            std::construct_at(static_cast<std::string*>(dst), tok.take_string());
            return true;
        }
        if (tok.kind == TokenKind::Number) {
            std::construct_at(static_cast<std::string*>(dst), tok.str());
            return true;
        }
        break;

    case ScalarKind::StrView:
        if (tok.kind == TokenKind::String || tok.kind == TokenKind::Number) {
            if (!tok.is_borrowed()) {
                auto err = DeserError::make(ErrorKind::InvalidValue, tok.span,
                                            "cannot borrow a string containing escape sequences");
                err.label = "escaped string";
                err.help = "use an owned string type for this field";
                return err;
            }
            std::construct_at(static_cast<std::string_view*>(dst), tok.str());
            return true;
        }
        break;

    case ScalarKind::Custom:
        return custom(shape, tok, dst);

    default:
        if (tok.kind == TokenKind::Number) {
            return number(shape, tok.str(), tok.number, tok.span, dst);
        }
        if (tok.kind == TokenKind::String) {
            if (auto info = classify_number(tok.str())) {
                return number(shape, tok.str(), *info, tok.span, dst);
            }
        }
        break;
    }
    return mismatch(shape, tok);
}

namespace {

template <typename T>
auto store_signed(const Shape& shape, std::string_view literal, Span span, void* dst)
    -> Result<bool, DeserError> {
    auto parsed = parse_i64(literal);
    if (is_err(parsed)) {
        if (unwrap_err(parsed) == NumberError::OutOfRange) {
            return DeserError::out_of_range(literal, shape.type_name, span);
        }
        return DeserError::type_mismatch(shape.type_name, "number", span);
    }
    int64_t value = unwrap(parsed);
    if (value < std::numeric_limits<T>::min() || value > std::numeric_limits<T>::max()) {
        return DeserError::out_of_range(literal, shape.type_name, span);
    }
    std::construct_at(static_cast<T*>(dst), static_cast<T>(value));
    return true;
}

template <typename T>
auto store_unsigned(const Shape& shape, std::string_view literal, Span span, void* dst)
    -> Result<bool, DeserError> {
    auto parsed = parse_u64(literal);
    if (is_err(parsed)) {
        if (unwrap_err(parsed) == NumberError::OutOfRange) {
            return DeserError::out_of_range(literal, shape.type_name, span);
        }
        return DeserError::type_mismatch(shape.type_name, "number", span);
    }
    uint64_t value = unwrap(parsed);
    if (value > std::numeric_limits<T>::max()) {
        return DeserError::out_of_range(literal, shape.type_name, span);
    }
    std::construct_at(static_cast<T*>(dst), static_cast<T>(value));
    return true;
}

template <typename T, typename Parse>
auto store_float(const Shape& shape, std::string_view literal, Span span, void* dst, Parse parse)
    -> Result<bool, DeserError> {
    auto parsed = parse(literal);
    if (is_err(parsed)) {
        if (unwrap_err(parsed) == NumberError::OutOfRange) {
            return DeserError::out_of_range(literal, shape.type_name, span);
        }
        return DeserError::type_mismatch(shape.type_name, "number", span);
    }
    std::construct_at(static_cast<T*>(dst), unwrap(parsed));
    return true;
}

} // namespace

auto Deserializer::number(const Shape& shape, std::string_view literal, NumberInfo info, Span span,
                          void* dst) -> Result<bool, DeserError> {
    const ScalarKind kind = shape.scalar;
    if ((is_signed_int(kind) || is_unsigned_int(kind)) && !info.is_integer()) {
        return DeserError::type_mismatch(shape.type_name, "float", span);
    }

    switch (kind) {
    case ScalarKind::I8:
        return store_signed<int8_t>(shape, literal, span, dst);
    case ScalarKind::I16:
        return store_signed<int16_t>(shape, literal, span, dst);
    case ScalarKind::I32:
        return store_signed<int32_t>(shape, literal, span, dst);
    case ScalarKind::I64:
        return store_signed<int64_t>(shape, literal, span, dst);
    case ScalarKind::U8:
        return store_unsigned<uint8_t>(shape, literal, span, dst);
    case ScalarKind::U16:
        return store_unsigned<uint16_t>(shape, literal, span, dst);
    case ScalarKind::U32:
        return store_unsigned<uint32_t>(shape, literal, span, dst);
    case ScalarKind::U64:
        return store_unsigned<uint64_t>(shape, literal, span, dst);
    case ScalarKind::F32:
        return store_float<float>(shape, literal, span, dst, parse_f32);
    case ScalarKind::F64:
        return store_float<double>(shape, literal, span, dst, parse_f64);
    default:
        return DeserError::type_mismatch(shape.type_name, "number", span);
    }
}

auto Deserializer::custom(const Shape& shape, const Token& tok, void* dst)
    -> Result<bool, DeserError> {
    const ScalarHooks& hooks = shape.hooks;
    HookResult (*hook)(std::string_view, void*) = nullptr;

    if (tok.kind == TokenKind::String) {
        if (hooks.from_text != nullptr) {
            hook = hooks.from_text;
        } else if (hooks.from_number != nullptr && classify_number(tok.str())) {
            hook = hooks.from_number;
        }
    } else if (tok.kind == TokenKind::Number) {
        hook = hooks.from_number;
    }
    if (hook == nullptr) {
        return mismatch(shape, tok);
    }

    auto converted = hook(tok.str(), dst);
    if (is_err(converted)) {
        auto err = DeserError::make(ErrorKind::InvalidValue, tok.span,
                                    "invalid " + shape.type_name + ": " + unwrap_err(converted));
        err.label = "rejected by " + shape.type_name;
        return err;
    }
    return true;
}

// ============================================================================
// Structs
// ============================================================================

auto Deserializer::structure(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    const Token& open = unwrap(next_tok);
    if (open.kind != TokenKind::ObjectStart) {
        return mismatch(shape, open);
    }
    return struct_body(shape, dst, open, std::nullopt);
}

/// Reads the members of an object already opened by `open` into the
/// struct at `dst`. A key equal to `ignore_key` is skipped (an internal
/// enum tag).
auto Deserializer::struct_body(const Shape& shape, void* dst, const Token& open,
                               std::optional<std::string_view> ignore_key)
    -> Result<bool, DeserError> {
    if (depth_ >= options_->max_depth) {
        return depth_exceeded(open);
    }
    DepthGuard depth(depth_);

    const bool deny = options_->deny_unknown_fields || shape.as_struct().deny_unknown_fields;
    FrameTree tree(shape, dst);

    auto closed = for_each_entry(open, [&](Token& key) -> Result<bool, DeserError> {
        std::string_view name = key.str();
        if (ignore_key && name == *ignore_key) {
            return skip_value();
        }

        auto location = tree.find(name);
        if (!location) {
            if (deny) {
                return DeserError::unknown_field(name, key.span, tree.names());
            }
            PRISM_LOG_TRACE("deser", "skipping unknown field " << name << " of " << shape.type_name);
            return skip_value();
        }

        StructFrame& frame = *tree.node(location->node).frame;
        const Field& field = frame.fields()[location->field];
        frame.unset(location->field);

        auto result = value(field.shape(), frame.field_ptr(location->field));
        if (is_err(result)) {
            unwrap_err(result).prepend_path(std::string(field.json_name()));
            return result;
        }
        frame.mark(location->field);
        return true;
    });
    if (is_err(closed)) {
        return std::move(unwrap_err(closed));
    }

    const Span object = Span::merge(open.span, unwrap(closed));
    for (size_t n = tree.size(); n-- > 0;) {
        auto& node = tree.node(n);
        auto filled = fill_missing(*node.shape, *node.frame, object, open.span);
        if (is_err(filled)) {
            return filled;
        }
        node.frame->commit();
        if (node.parent != SIZE_MAX) {
            tree.node(node.parent).frame->mark(node.parent_field);
        }
    }
    return true;
}

auto Deserializer::fill_missing(const Shape& shape, StructFrame& frame, Span object, Span open)
    -> Result<bool, DeserError> {
    const StructDef& def = shape.as_struct();
    std::unique_ptr<Slot> defaults;

    for (size_t i = 0; i < def.fields.size(); ++i) {
        const Field& field = def.fields[i];
        if (frame.is_set(i) || FrameTree::is_flattened(field)) {
            continue;
        }

        const Shape& field_shape = field.shape();
        void* ptr = frame.field_ptr(i);

        if (field.default_fn != nullptr) {
            field.default_fn(ptr);
        } else if (field.has(FIELD_DEFAULT) && field_shape.vtable.default_in_place != nullptr) {
            field_shape.vtable.default_in_place(ptr);
        } else if (def.default_all) {
            if (!defaults) {
                defaults = std::make_unique<Slot>(shape);
                shape.vtable.default_in_place(defaults->get());
                defaults->mark_initialized();
            }
            field_shape.vtable.move_construct(ptr,
                                              static_cast<unsigned char*>(defaults->get()) + field.offset);
        } else if (field_shape.kind == ShapeKind::Option) {
            field_shape.as_option().init_none(ptr);
        } else {
            return DeserError::missing_field(field.json_name(), object, open);
        }
        frame.mark(i);
    }
    return true;
}

// ============================================================================
// Sequences
// ============================================================================

auto Deserializer::tuple(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    const Token open = std::move(unwrap(next_tok));
    if (open.kind != TokenKind::ArrayStart) {
        return mismatch(shape, open);
    }
    if (depth_ >= options_->max_depth) {
        return depth_exceeded(open);
    }
    DepthGuard depth(depth_);

    const TupleDef& def = shape.as_tuple();
    const size_t expected = def.elements.size();
    std::vector<std::unique_ptr<Slot>> slots;
    slots.reserve(expected);

    auto closed = for_each_element(open, [&](size_t index) -> Result<bool, DeserError> {
        if (index >= expected) {
            auto extra = peek();
            if (is_err(extra)) {
                return std::move(unwrap_err(extra));
            }
            auto err = DeserError::make(ErrorKind::TypeMismatch, unwrap(extra)->span,
                                        "expected an array of " + std::to_string(expected) +
                                            " elements, found more");
            err.label = "unexpected element";
            return err;
        }
        const Shape& element = def.elements[index]();
        auto slot = std::make_unique<Slot>(element);
        auto result = value(element, slot->get());
        if (is_err(result)) {
            unwrap_err(result).prepend_path(index);
            return result;
        }
        slot->mark_initialized();
        slots.push_back(std::move(slot));
        return true;
    });
    if (is_err(closed)) {
        return std::move(unwrap_err(closed));
    }

    if (slots.size() != expected) {
        auto err = DeserError::make(ErrorKind::TypeMismatch, Span::merge(open.span, unwrap(closed)),
                                    "expected an array of " + std::to_string(expected) +
                                        " elements, found " + std::to_string(slots.size()));
        err.label = "wrong number of elements";
        return err;
    }

    std::vector<void*> elements;
    elements.reserve(expected);
    for (auto& slot : slots) {
        elements.push_back(slot->get());
    }
    def.assemble(dst, elements.data());
    return true;
}

auto Deserializer::list(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    const Token open = std::move(unwrap(next_tok));
    if (open.kind != TokenKind::ArrayStart) {
        return mismatch(shape, open);
    }
    if (depth_ >= options_->max_depth) {
        return depth_exceeded(open);
    }
    DepthGuard depth(depth_);

    const ListDef& def = shape.as_list();
    const Shape& element = def.element();
    def.init_empty(dst);
    ValueGuard guard(shape, dst);

    auto closed = for_each_element(open, [&](size_t index) -> Result<bool, DeserError> {
        Slot slot(element);
        auto result = value(element, slot.get());
        if (is_err(result)) {
            unwrap_err(result).prepend_path(index);
            return result;
        }
        slot.mark_initialized();
        def.push(dst, slot.get());
        return true;
    });
    if (is_err(closed)) {
        return std::move(unwrap_err(closed));
    }
    guard.release();
    return true;
}

auto Deserializer::map(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    const Token open = std::move(unwrap(next_tok));
    if (open.kind != TokenKind::ObjectStart) {
        return mismatch(shape, open);
    }
    if (depth_ >= options_->max_depth) {
        return depth_exceeded(open);
    }
    DepthGuard depth(depth_);

    const MapDef& def = shape.as_map();
    const Shape& key_shape = def.key();
    const Shape& value_shape = def.value();
    def.init_empty(dst);
    ValueGuard guard(shape, dst);

    auto closed = for_each_entry(open, [&](Token& key) -> Result<bool, DeserError> {
        std::string segment(key.str());
        Slot key_slot(key_shape);
        auto key_result = map_key(key_shape, key, key_slot.get());
        if (is_err(key_result)) {
            unwrap_err(key_result).prepend_path(segment);
            return key_result;
        }
        key_slot.mark_initialized();

        Slot value_slot(value_shape);
        auto value_result = value(value_shape, value_slot.get());
        if (is_err(value_result)) {
            unwrap_err(value_result).prepend_path(std::move(segment));
            return value_result;
        }
        value_slot.mark_initialized();
        def.insert(dst, key_slot.get(), value_slot.get());
        return true;
    });
    if (is_err(closed)) {
        return std::move(unwrap_err(closed));
    }
    guard.release();
    return true;
}

/// Converts an object key to the map's key shape.
auto Deserializer::map_key(const Shape& shape, Token& key, void* dst) -> Result<bool, DeserError> {
    switch (shape.kind) {
    case ShapeKind::Scalar:
        return scalar_token(shape, key, dst, true);

    case ShapeKind::Transparent: {
        const TransparentDef& def = shape.as_transparent();
        const Shape& inner = def.inner();
        Slot slot(inner);
        auto result = map_key(inner, key, slot.get());
        if (is_err(result)) {
            return result;
        }
        slot.mark_initialized();
        def.wrap(dst, slot.get());
        return true;
    }

    case ShapeKind::Enum: {
        const EnumDef& def = shape.as_enum();
        const Variant* variant = def.find(key.str());
        if (variant == nullptr || !variant->unit) {
            return DeserError::unknown_variant(key.str(), key.span, def.names());
        }
        Slot payload(variant->shape());
        variant->shape().vtable.default_in_place(payload.get());
        payload.mark_initialized();
        def.emplace(dst, variant->index, payload.get());
        return true;
    }

    default: {
        auto err = DeserError::make(ErrorKind::TypeMismatch, key.span,
                                    "map keys cannot be read as " + expected_name(shape));
        err.label = "object key";
        return err;
    }
    }
}

// ============================================================================
// Options and Wrappers
// ============================================================================

auto Deserializer::option(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    const OptionDef& def = shape.as_option();
    auto ahead = peek();
    if (is_err(ahead)) {
        return std::move(unwrap_err(ahead));
    }
    if (unwrap(ahead)->kind == TokenKind::Null) {
        peeked_.reset();
        def.init_none(dst);
        return true;
    }

    const Shape& inner = def.inner();
    Slot slot(inner);
    auto result = value(inner, slot.get());
    if (is_err(result)) {
        return result;
    }
    slot.mark_initialized();
    def.init_some(dst, slot.get());
    return true;
}

auto Deserializer::transparent(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    const TransparentDef& def = shape.as_transparent();
    if (def.init_null != nullptr) {
        auto ahead = peek();
        if (is_err(ahead)) {
            return std::move(unwrap_err(ahead));
        }
        if (unwrap(ahead)->kind == TokenKind::Null) {
            peeked_.reset();
            def.init_null(dst);
            return true;
        }
    }

    const Shape& inner = def.inner();
    Slot slot(inner);
    auto result = value(inner, slot.get());
    if (is_err(result)) {
        return result;
    }
    slot.mark_initialized();
    def.wrap(dst, slot.get());
    return true;
}

// ============================================================================
// Enums
// ============================================================================

auto Deserializer::enumeration(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    switch (shape.as_enum().tagging) {
    case EnumTagging::External:
        return external_enum(shape, dst);
    case EnumTagging::Internal:
        return internal_enum(shape, dst);
    case EnumTagging::Adjacent:
        return adjacent_enum(shape, dst);
    case EnumTagging::Untagged:
        return untagged_enum(shape, dst);
    }
    return untagged_enum(shape, dst);
}

/// Reads a variant's payload; a unit variant also accepts `null`.
auto Deserializer::variant_content(const Variant& variant, Slot& payload)
    -> Result<bool, DeserError> {
    const Shape& shape = variant.shape();
    if (variant.unit) {
        auto ahead = peek();
        if (is_err(ahead)) {
            return std::move(unwrap_err(ahead));
        }
        if (unwrap(ahead)->kind == TokenKind::Null) {
            peeked_.reset();
            shape.vtable.default_in_place(payload.get());
            payload.mark_initialized();
            return true;
        }
    }
    auto result = value(shape, payload.get());
    if (is_err(result)) {
        return result;
    }
    payload.mark_initialized();
    return true;
}

/// Reads the object at the current position as the payload of `variant`,
/// for variants chosen without a tag.
auto Deserializer::whole_object_variant(const EnumDef& def, const Variant& variant, void* dst)
    -> Result<bool, DeserError> {
    Slot payload(variant.shape());
    if (variant.unit) {
        auto skipped = skip_value();
        if (is_err(skipped)) {
            return skipped;
        }
        variant.shape().vtable.default_in_place(payload.get());
        payload.mark_initialized();
    } else {
        auto result = value(variant.shape(), payload.get());
        if (is_err(result)) {
            return result;
        }
        payload.mark_initialized();
    }
    def.emplace(dst, variant.index, payload.get());
    return true;
}

auto Deserializer::external_enum(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    const EnumDef& def = shape.as_enum();
    const Deserializer saved(*this);

    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    const Token open = std::move(unwrap(next_tok));

    if (open.kind == TokenKind::String) {
        const Variant* variant = def.find(open.str());
        if (variant == nullptr) {
            return DeserError::unknown_variant(open.str(), open.span, def.names());
        }
        if (!variant->unit) {
            return DeserError::type_mismatch("object for variant `" + std::string(variant->name) + "`",
                                             "string", open.span);
        }
        Slot payload(variant->shape());
        variant->shape().vtable.default_in_place(payload.get());
        payload.mark_initialized();
        def.emplace(dst, variant->index, payload.get());
        return true;
    }

    if (open.kind != TokenKind::ObjectStart) {
        return mismatch(shape, open);
    }
    if (depth_ >= options_->max_depth) {
        return depth_exceeded(open);
    }

    auto first = next();
    if (is_err(first)) {
        return std::move(unwrap_err(first));
    }
    const Token key = std::move(unwrap(first));
    const Variant* variant =
        key.kind == TokenKind::String ? def.find(key.str()) : nullptr;

    if (variant == nullptr) {
        // The object is not `{"Variant": ...}`: let the hooks look at it.
        *this = saved;
        auto scanned = scan_object(std::nullopt);
        if (is_err(scanned)) {
            return std::move(unwrap_err(scanned));
        }
        if (const Variant* chosen = select_by_hooks(def, unwrap(scanned).keys)) {
            return whole_object_variant(def, *chosen, dst);
        }
        if (key.kind == TokenKind::String) {
            return DeserError::unknown_variant(key.str(), key.span, def.names());
        }
        if (key.kind == TokenKind::ObjectEnd) {
            auto err = DeserError::make(ErrorKind::UnknownVariant, Span::merge(open.span, key.span),
                                        "expected a variant of " + shape.type_name +
                                            ", found empty object");
            err.label = "no variant name";
            return err;
        }
        return unexpected(key, "a variant name", open.span);
    }

    DepthGuard depth(depth_);
    auto colon = next();
    if (is_err(colon)) {
        return std::move(unwrap_err(colon));
    }
    if (unwrap(colon).kind != TokenKind::Colon) {
        return unexpected(unwrap(colon), "`:`", open.span);
    }

    Slot payload(variant->shape());
    auto content = variant_content(*variant, payload);
    if (is_err(content)) {
        unwrap_err(content).prepend_path(std::string(variant->name));
        return content;
    }

    auto close = next();
    if (is_err(close)) {
        return std::move(unwrap_err(close));
    }
    if (unwrap(close).kind != TokenKind::ObjectEnd) {
        return unexpected(unwrap(close), "`}` after the variant payload", open.span);
    }

    def.emplace(dst, variant->index, payload.get());
    return true;
}

auto Deserializer::internal_enum(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    const EnumDef& def = shape.as_enum();
    auto ahead = peek();
    if (is_err(ahead)) {
        return std::move(unwrap_err(ahead));
    }
    if (unwrap(ahead)->kind != TokenKind::ObjectStart) {
        return mismatch(shape, *unwrap(ahead));
    }

    auto scanned = scan_object(def.tag);
    if (is_err(scanned)) {
        return std::move(unwrap_err(scanned));
    }
    const ObjectScan& scan = unwrap(scanned);

    const Variant* variant = nullptr;
    if (scan.tag) {
        variant = def.find(*scan.tag);
        if (variant == nullptr) {
            auto err = DeserError::unknown_variant(*scan.tag, scan.tag_span, def.names());
            err.prepend_path(std::string(def.tag));
            return err;
        }
    } else {
        variant = select_by_hooks(def, scan.keys);
        if (variant == nullptr) {
            return DeserError::missing_field(def.tag, Span::merge(scan.open, scan.close), scan.open);
        }
    }

    Slot payload(variant->shape());
    switch (variant->kind()) {
    case VariantKind::Unit: {
        auto skipped = skip_value();
        if (is_err(skipped)) {
            return skipped;
        }
        variant->shape().vtable.default_in_place(payload.get());
        break;
    }
    case VariantKind::Struct: {
        auto next_tok = next();
        if (is_err(next_tok)) {
            return std::move(unwrap_err(next_tok));
        }
        auto body = struct_body(variant->shape(), payload.get(), unwrap(next_tok), def.tag);
        if (is_err(body)) {
            return body;
        }
        break;
    }
    default: {
        auto err = DeserError::make(ErrorKind::InvalidValue, scan.open,
                                    "internally tagged variant `" + std::string(variant->name) +
                                        "` must hold a struct");
        err.label = "tagged object";
        return err;
    }
    }
    payload.mark_initialized();
    def.emplace(dst, variant->index, payload.get());
    return true;
}

auto Deserializer::adjacent_enum(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    const EnumDef& def = shape.as_enum();
    auto next_tok = next();
    if (is_err(next_tok)) {
        return std::move(unwrap_err(next_tok));
    }
    const Token open = std::move(unwrap(next_tok));
    if (open.kind != TokenKind::ObjectStart) {
        return mismatch(shape, open);
    }
    if (depth_ >= options_->max_depth) {
        return depth_exceeded(open);
    }
    DepthGuard depth(depth_);

    const Variant* variant = nullptr;
    std::optional<Span> tag_span;
    std::unique_ptr<Slot> payload;
    std::optional<size_t> deferred;
    std::vector<std::string> keys;

    auto closed = for_each_entry(open, [&](Token& key) -> Result<bool, DeserError> {
        if (key.str() == def.tag) {
            auto tag_tok = next();
            if (is_err(tag_tok)) {
                return std::move(unwrap_err(tag_tok));
            }
            const Token& tag = unwrap(tag_tok);
            if (tag_span) {
                return duplicate_tag(def.tag, tag.span, *tag_span);
            }
            if (tag.kind != TokenKind::String) {
                auto err = DeserError::type_mismatch("string", found_name(tag), tag.span);
                err.prepend_path(std::string(def.tag));
                return err;
            }
            tag_span = tag.span;
            variant = def.find(tag.str());
            if (variant == nullptr) {
                auto err = DeserError::unknown_variant(tag.str(), tag.span, def.names());
                err.prepend_path(std::string(def.tag));
                return err;
            }
            return true;
        }

        if (key.str() == def.content) {
            keys.emplace_back(key.str());
            if (variant == nullptr) {
                // Tag not seen yet: read the content after the object.
                deferred = offset();
                return skip_value();
            }
            payload = std::make_unique<Slot>(variant->shape());
            auto content = variant_content(*variant, *payload);
            if (is_err(content)) {
                unwrap_err(content).prepend_path(std::string(def.content));
            }
            return content;
        }

        if (options_->deny_unknown_fields) {
            return DeserError::unknown_field(
                key.str(), key.span, {std::string(def.tag), std::string(def.content)});
        }
        keys.push_back(key.take_string());
        return skip_value();
    });
    if (is_err(closed)) {
        return std::move(unwrap_err(closed));
    }
    const Span object = Span::merge(open.span, unwrap(closed));

    if (variant == nullptr) {
        variant = select_by_hooks(def, keys);
        if (variant == nullptr) {
            return DeserError::missing_field(def.tag, object, open.span);
        }
    }

    if (!payload) {
        payload = std::make_unique<Slot>(variant->shape());
        if (deferred) {
            Deserializer sub(tokenizer_.input(), *deferred, *options_, depth_);
            auto content = sub.variant_content(*variant, *payload);
            if (is_err(content)) {
                unwrap_err(content).prepend_path(std::string(def.content));
                return content;
            }
        } else if (variant->unit) {
            variant->shape().vtable.default_in_place(payload->get());
            payload->mark_initialized();
        } else {
            return DeserError::missing_field(def.content, object, open.span);
        }
    }

    def.emplace(dst, variant->index, payload->get());
    return true;
}

auto Deserializer::untagged_enum(const Shape& shape, void* dst) -> Result<bool, DeserError> {
    const EnumDef& def = shape.as_enum();
    auto ahead = peek();
    if (is_err(ahead)) {
        return std::move(unwrap_err(ahead));
    }
    const Token first = *unwrap(ahead);
    if (!is_value_start(first.kind)) {
        return unexpected(first, "a value");
    }

    if (first.kind == TokenKind::ObjectStart) {
        auto scanned = scan_object(std::nullopt);
        if (is_err(scanned)) {
            return std::move(unwrap_err(scanned));
        }
        if (const Variant* chosen = select_by_hooks(def, unwrap(scanned).keys)) {
            return whole_object_variant(def, *chosen, dst);
        }
    }

    for (const auto& variant : def.variants) {
        Deserializer trial(*this);
        Slot payload(variant.shape());
        auto result = trial.variant_content(variant, payload);
        if (is_ok(result)) {
            *this = std::move(trial);
            def.emplace(dst, variant.index, payload.get());
            return true;
        }
        PRISM_LOG_TRACE("deser", "untagged variant " << variant.name
                                                      << " rejected: " << unwrap_err(result).message);
    }

    auto err = DeserError::type_mismatch(shape.type_name, found_name(first), first.span);
    err.message = "data did not match any variant of " + shape.type_name;
    return err;
}

} // namespace

// ============================================================================
// Entry Points
// ============================================================================

auto deserialize(const Shape& shape, std::string_view input, void* dst,
                 const DeserializeOptions& options) -> Result<bool, DeserError> {
    PRISM_LOG_DEBUG("deser", "deserializing " << shape.type_name << " from " << input.size()
                                              << " bytes");
    const size_t start = input.starts_with(BOM) ? BOM.size() : 0;
    Deserializer de(input, start, options);

    auto result = de.value(shape, dst);
    if (is_err(result)) {
        unwrap_err(result).attach_source(input);
        return result;
    }

    if (auto rest = de.remaining()) {
        shape.vtable.drop(dst);
        auto err = DeserError::make(ErrorKind::TrailingCharacters, Span{*rest, input.size()},
                                    "trailing characters after JSON value");
        err.label = "expected end of input";
        err.attach_source(input);
        return err;
    }
    return true;
}

auto deserialize_next(const Shape& shape, std::string_view input, Cursor& cursor, void* dst,
                      const DeserializeOptions& options) -> Result<bool, DeserError> {
    size_t start = cursor.offset;
    if (start == 0 && input.starts_with(BOM)) {
        start = BOM.size();
    }
    Deserializer de(input, start, options);
    if (!de.remaining()) {
        cursor.offset = input.size();
        return false;
    }

    auto result = de.value(shape, dst);
    if (is_err(result)) {
        unwrap_err(result).attach_source(input);
        return result;
    }
    cursor.offset = de.offset();
    PRISM_LOG_TRACE("deser", "document ends at byte " << cursor.offset);
    return true;
}

} // namespace prism::json
