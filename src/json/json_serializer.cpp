//! # JSON Serializer Implementation
//!
//! One recursive walk over the shape. Compact and pretty output share the
//! same code; pretty mode only adds a newline and indentation before each
//! member and before a closing bracket of a non-empty container.
//!
//! ## Enum Forms
//!
//! | Tagging | Unit variant | Payload variant |
//! |---------|--------------|-----------------|
//! | External | `"Name"` | `{"Name": payload}` |
//! | Internal | `{"type": "Name"}` | `{"type": "Name", ...fields}` |
//! | Adjacent | `{"type": "Name"}` | `{"type": "Name", "content": payload}` |
//! | Untagged | payload | payload |

#include "prism/json/json_serializer.hpp"

#include "prism/json/json_scalar.hpp"
#include "prism/log/log.hpp"
#include "prism/shape/partial.hpp"

#include <iomanip>
#include <sstream>

namespace prism::json {

namespace {

/// Encodes a char value, rejecting surrogates and values past U+10FFFF.
auto char_text(char32_t cp, std::string& text) -> Result<bool, SerError> {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        std::ostringstream oss;
        oss << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<uint32_t>(cp) << " is not a Unicode scalar value";
        return SerError::make(ErrorKind::InvalidValue, oss.str());
    }
    append_utf8(text, cp);
    return true;
}

auto unrepresentable_key(const Shape& shape) -> SerError {
    return SerError::make(ErrorKind::UnrepresentableKey,
                          "map key of type " + shape.type_name +
                              " cannot be written as a JSON string");
}

/// True when a skip-if-default field holds its default value.
auto holds_default(const Field& field, const Shape& shape, const void* value) -> bool {
    void (*make_default)(void*) = field.default_fn;
    if (make_default == nullptr) {
        make_default = shape.vtable.default_in_place;
    }
    if (make_default == nullptr) {
        return false;
    }
    Slot slot(shape);
    make_default(slot.get());
    slot.mark_initialized();
    return values_equal(shape, value, slot.get());
}

template <typename T> auto load(const void* value) -> T {
    return *static_cast<const T*>(value);
}

void append_integer(std::string& out, ScalarKind kind, const void* value) {
    switch (kind) {
    case ScalarKind::I8:
        append_i64(out, load<int8_t>(value));
        break;
    case ScalarKind::I16:
        append_i64(out, load<int16_t>(value));
        break;
    case ScalarKind::I32:
        append_i64(out, load<int32_t>(value));
        break;
    case ScalarKind::I64:
        append_i64(out, load<int64_t>(value));
        break;
    case ScalarKind::U8:
        append_u64(out, load<uint8_t>(value));
        break;
    case ScalarKind::U16:
        append_u64(out, load<uint16_t>(value));
        break;
    case ScalarKind::U32:
        append_u64(out, load<uint32_t>(value));
        break;
    case ScalarKind::U64:
        append_u64(out, load<uint64_t>(value));
        break;
    default:
        break;
    }
}

class Serializer {
public:
    Serializer(std::string& out, const SerializeOptions& options) : out_(out), options_(options) {}

    auto value(const Shape& shape, const void* ptr) -> Result<bool, SerError>;

private:
    std::string& out_;
    const SerializeOptions& options_;
    size_t level_ = 0;

    void newline() {
        if (options_.indent > 0) {
            out_ += '\n';
            out_.append(level_ * options_.indent, ' ');
        }
    }

    /// Writes the separator and key of the next member.
    void member(std::string_view key, bool& first) {
        if (!first) {
            out_ += ',';
        }
        first = false;
        newline();
        append_quoted(out_, key);
        out_ += options_.indent > 0 ? ": " : ":";
    }

    void element(bool& first) {
        if (!first) {
            out_ += ',';
        }
        first = false;
        newline();
    }

    void open(char bracket) {
        out_ += bracket;
        ++level_;
    }

    void close(char bracket, bool empty) {
        --level_;
        if (!empty) {
            newline();
        }
        out_ += bracket;
    }

    auto scalar(const Shape& shape, const void* ptr) -> Result<bool, SerError>;
    auto float_value(bool written) -> Result<bool, SerError>;
    auto struct_members(const Shape& shape, const void* ptr, bool& first)
        -> Result<bool, SerError>;
    auto tuple(const Shape& shape, const void* ptr) -> Result<bool, SerError>;
    auto list(const Shape& shape, const void* ptr) -> Result<bool, SerError>;
    auto map(const Shape& shape, const void* ptr) -> Result<bool, SerError>;
    auto key_text(const Shape& shape, const void* key, std::string& text) -> Result<bool, SerError>;
    auto enumeration(const Shape& shape, const void* ptr) -> Result<bool, SerError>;
};

auto Serializer::value(const Shape& shape, const void* ptr) -> Result<bool, SerError> {
    switch (shape.kind) {
    case ShapeKind::Scalar:
        return scalar(shape, ptr);

    case ShapeKind::Struct: {
        open('{');
        bool first = true;
        auto members = struct_members(shape, ptr, first);
        if (is_err(members)) {
            return members;
        }
        close('}', first);
        return true;
    }

    case ShapeKind::Tuple:
        return tuple(shape, ptr);

    case ShapeKind::List:
        return list(shape, ptr);

    case ShapeKind::Map:
        return map(shape, ptr);

    case ShapeKind::Option: {
        const OptionDef& def = shape.as_option();
        const void* inner = def.get(ptr);
        if (inner == nullptr) {
            out_ += "null";
            return true;
        }
        return value(def.inner(), inner);
    }

    case ShapeKind::Enum:
        return enumeration(shape, ptr);

    case ShapeKind::Transparent: {
        const TransparentDef& def = shape.as_transparent();
        const void* inner = def.get(ptr);
        if (inner == nullptr) {
            out_ += "null";
            return true;
        }
        return value(def.inner(), inner);
    }
    }
    return SerError::make(ErrorKind::InvalidValue, "unsupported shape " + shape.type_name);
}

// ============================================================================
// Scalars
// ============================================================================

auto Serializer::float_value(bool written) -> Result<bool, SerError> {
    if (!written) {
        return SerError::make(ErrorKind::NonFiniteFloat,
                              "NaN and infinite floats cannot be represented in JSON");
    }
    return true;
}

auto Serializer::scalar(const Shape& shape, const void* ptr) -> Result<bool, SerError> {
    switch (shape.scalar) {
    case ScalarKind::Unit:
        out_ += "null";
        return true;
    case ScalarKind::Bool:
        out_ += load<bool>(ptr) ? "true" : "false";
        return true;
    case ScalarKind::I8:
    case ScalarKind::I16:
    case ScalarKind::I32:
    case ScalarKind::I64:
    case ScalarKind::U8:
    case ScalarKind::U16:
    case ScalarKind::U32:
    case ScalarKind::U64:
        append_integer(out_, shape.scalar, ptr);
        return true;
    case ScalarKind::F32:
        return float_value(append_f32(out_, load<float>(ptr)));
    case ScalarKind::F64:
        return float_value(append_f64(out_, load<double>(ptr)));
    case ScalarKind::Char: {
        std::string text;
        auto encoded = char_text(load<char32_t>(ptr), text);
        if (is_err(encoded)) {
            return encoded;
        }
        append_quoted(out_, text);
        return true;
    }
    case ScalarKind::String:
        append_quoted(out_, *static_cast<const std::string*>(ptr));
        return true;
    case ScalarKind::StrView:
        append_quoted(out_, load<std::string_view>(ptr));
        return true;
    case ScalarKind::Custom:
        if (shape.hooks.to_text != nullptr) {
            append_quoted(out_, shape.hooks.to_text(ptr));
            return true;
        }
        if (shape.hooks.to_number != nullptr) {
            out_ += shape.hooks.to_number(ptr);
            return true;
        }
        return SerError::make(ErrorKind::InvalidValue,
                              shape.type_name + " has no output conversion");
    }
    return SerError::make(ErrorKind::InvalidValue, "unsupported scalar " + shape.type_name);
}

// ============================================================================
// Aggregates
// ============================================================================

/// Writes the members of a struct, inlining flattened ones.
auto Serializer::struct_members(const Shape& shape, const void* ptr, bool& first)
    -> Result<bool, SerError> {
    for (const auto& field : shape.as_struct().fields) {
        const Shape& field_shape = field.shape();
        const void* field_ptr = static_cast<const unsigned char*>(ptr) + field.offset;

        if (field.has(FIELD_SKIP_IF_DEFAULT) && holds_default(field, field_shape, field_ptr)) {
            continue;
        }

        if (field.has(FIELD_FLATTEN) && field_shape.kind == ShapeKind::Struct) {
            auto nested = struct_members(field_shape, field_ptr, first);
            if (is_err(nested)) {
                return nested;
            }
            continue;
        }

        member(field.json_name(), first);
        auto result = value(field_shape, field_ptr);
        if (is_err(result)) {
            unwrap_err(result).prepend_path(std::string(field.json_name()));
            return result;
        }
    }
    return true;
}

auto Serializer::tuple(const Shape& shape, const void* ptr) -> Result<bool, SerError> {
    const TupleDef& def = shape.as_tuple();
    open('[');
    bool first = true;
    for (size_t i = 0; i < def.elements.size(); ++i) {
        element(first);
        auto result = value(def.elements[i](), def.element(ptr, i));
        if (is_err(result)) {
            unwrap_err(result).prepend_path(i);
            return result;
        }
    }
    close(']', first);
    return true;
}

auto Serializer::list(const Shape& shape, const void* ptr) -> Result<bool, SerError> {
    const ListDef& def = shape.as_list();
    const Shape& element_shape = def.element();
    Result<bool, SerError> status = true;
    size_t index = 0;
    bool first = true;

    open('[');
    def.for_each(ptr, [&](const void* item) {
        element(first);
        status = value(element_shape, item);
        if (is_err(status)) {
            unwrap_err(status).prepend_path(index);
            return false;
        }
        ++index;
        return true;
    });
    if (is_err(status)) {
        return status;
    }
    close(']', first);
    return true;
}

auto Serializer::map(const Shape& shape, const void* ptr) -> Result<bool, SerError> {
    const MapDef& def = shape.as_map();
    const Shape& key_shape = def.key();
    const Shape& value_shape = def.value();
    Result<bool, SerError> status = true;
    bool first = true;

    open('{');
    def.for_each(ptr, [&](const void* key, const void* item) {
        std::string text;
        status = key_text(key_shape, key, text);
        if (is_err(status)) {
            return false;
        }
        member(text, first);
        status = value(value_shape, item);
        if (is_err(status)) {
            unwrap_err(status).prepend_path(std::move(text));
            return false;
        }
        return true;
    });
    if (is_err(status)) {
        return status;
    }
    close('}', first);
    return true;
}

/// Converts a map key to the text of its quoted JSON key.
auto Serializer::key_text(const Shape& shape, const void* key, std::string& text)
    -> Result<bool, SerError> {
    switch (shape.kind) {
    case ShapeKind::Scalar:
        switch (shape.scalar) {
        case ScalarKind::String:
            text = *static_cast<const std::string*>(key);
            return true;
        case ScalarKind::StrView:
            text = load<std::string_view>(key);
            return true;
        case ScalarKind::Char:
            return char_text(load<char32_t>(key), text);
        case ScalarKind::Bool:
            text = load<bool>(key) ? "true" : "false";
            return true;
        case ScalarKind::Custom:
            if (shape.hooks.to_text != nullptr) {
                text = shape.hooks.to_text(key);
                return true;
            }
            if (shape.hooks.to_number != nullptr) {
                text = shape.hooks.to_number(key);
                return true;
            }
            return unrepresentable_key(shape);
        case ScalarKind::Unit:
        case ScalarKind::F32:
        case ScalarKind::F64:
            return unrepresentable_key(shape);
        default:
            append_integer(text, shape.scalar, key);
            return true;
        }

    case ShapeKind::Transparent: {
        const TransparentDef& def = shape.as_transparent();
        const void* inner = def.get(key);
        if (inner == nullptr) {
            return unrepresentable_key(shape);
        }
        return key_text(def.inner(), inner, text);
    }

    case ShapeKind::Enum: {
        const EnumDef& def = shape.as_enum();
        const Variant* variant = def.by_index(def.index(key));
        if (variant == nullptr || !variant->unit) {
            return unrepresentable_key(shape);
        }
        text = variant->name;
        return true;
    }

    default:
        return unrepresentable_key(shape);
    }
}

// ============================================================================
// Enums
// ============================================================================

auto Serializer::enumeration(const Shape& shape, const void* ptr) -> Result<bool, SerError> {
    const EnumDef& def = shape.as_enum();
    const Variant* variant = def.by_index(def.index(ptr));
    if (variant == nullptr) {
        return SerError::make(ErrorKind::InvalidValue,
                              "active alternative of " + shape.type_name + " has no variant name");
    }
    const Shape& payload_shape = variant->shape();
    const void* payload = def.payload(ptr);

    auto write_payload = [&]() -> Result<bool, SerError> {
        auto result = value(payload_shape, payload);
        if (is_err(result)) {
            unwrap_err(result).prepend_path(std::string(variant->name));
        }
        return result;
    };

    bool first = true;
    switch (def.tagging) {
    case EnumTagging::External:
        if (variant->unit) {
            append_quoted(out_, variant->name);
            return true;
        }
        open('{');
        member(variant->name, first);
        if (auto result = write_payload(); is_err(result)) {
            return result;
        }
        close('}', false);
        return true;

    case EnumTagging::Internal:
        if (!variant->unit && payload_shape.kind != ShapeKind::Struct) {
            return SerError::make(ErrorKind::InvalidValue,
                                  "internally tagged variant `" + std::string(variant->name) +
                                      "` must hold a struct");
        }
        open('{');
        member(def.tag, first);
        append_quoted(out_, variant->name);
        if (!variant->unit) {
            auto members = struct_members(payload_shape, payload, first);
            if (is_err(members)) {
                return members;
            }
        }
        close('}', false);
        return true;

    case EnumTagging::Adjacent:
        open('{');
        member(def.tag, first);
        append_quoted(out_, variant->name);
        if (!variant->unit) {
            member(def.content, first);
            if (auto result = write_payload(); is_err(result)) {
                return result;
            }
        }
        close('}', false);
        return true;

    case EnumTagging::Untagged:
        return write_payload();
    }
    return write_payload();
}

} // namespace

auto serialize(const Shape& shape, const void* value, std::string& out,
               const SerializeOptions& options) -> Result<bool, SerError> {
    PRISM_LOG_DEBUG("ser", "serializing " << shape.type_name);
    Serializer serializer(out, options);
    auto result = serializer.value(shape, value);
    if (is_err(result)) {
        PRISM_LOG_TRACE("ser", "failed: " << unwrap_err(result).message);
    }
    return result;
}

} // namespace prism::json
