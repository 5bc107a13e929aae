//! # Deserialization Tests
//!
//! Structs, containers, scalar coercion, defaults, flattening and the
//! error reports the driver produces.

#include "test_types.hpp"

#include <array>
#include <gtest/gtest.h>
#include <limits>

using namespace prism;
using namespace prism::json;
using namespace fixtures;

// ============================================================================
// Structs
// ============================================================================

TEST(DeserializeStructTest, ReadsFields) {
    auto result = from_str<Person>(R"({"name": "Ada", "age": 36})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(unwrap(result).name, "Ada");
    EXPECT_EQ(unwrap(result).age, 36u);
}

TEST(DeserializeStructTest, FieldOrderDoesNotMatter) {
    auto result = from_str<Person>(R"({"age": 1, "name": "x"})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(unwrap(result).name, "x");
}

TEST(DeserializeStructTest, EmptyObjectReportsFirstMissingField) {
    auto result = from_str<Person>("{}");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::MissingField);
    EXPECT_EQ(err.category, ErrorCategory::Schema);
    EXPECT_EQ(err.message, "missing field `name`");
    EXPECT_EQ(err.span, (Span{0, 2}));
    ASSERT_TRUE(err.related.has_value());
    EXPECT_EQ(*err.related, (Span{0, 1}));
}

TEST(DeserializeStructTest, DuplicateKeyLastWins) {
    auto result = from_str<Person>(R"({"name": "a", "age": 1, "name": "b"})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(unwrap(result).name, "b");
}

TEST(DeserializeStructTest, UnknownFieldsSkippedByDefault) {
    auto result =
        from_str<Person>(R"({"name": "a", "extra": {"deep": [1, 2, {"x": null}]}, "age": 2})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(unwrap(result).age, 2u);
}

TEST(DeserializeStructTest, UnknownFieldsRejectedWhenAsked) {
    DeserializeOptions options;
    options.deny_unknown_fields = true;
    auto result = from_str<Person>(R"({"name": "a", "agee": 2})", options);
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::UnknownField);
    EXPECT_EQ(err.span, (Span{14, 20}));
    EXPECT_EQ(err.help, "did you mean `age`?");
}

TEST(DeserializeStructTest, RenamedFieldWithDenyUnknown) {
    auto ok = from_str<Account>(R"({"userName": "kim", "score": -3})");
    ASSERT_TRUE(is_ok(ok)) << error_text(ok);
    EXPECT_EQ(unwrap(ok).user_name, "kim");
    EXPECT_EQ(unwrap(ok).score, -3);

    auto bad = from_str<Account>(R"({"user_name": "kim", "score": 1})");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).kind, ErrorKind::UnknownField);
    EXPECT_EQ(unwrap_err(bad).help, "did you mean `userName`?");
}

TEST(DeserializeStructTest, NestedErrorCarriesPath) {
    auto result = from_str<Node>(R"({"value": 1, "children": [{"value": 2}, {"value": "x"}]})");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(err.message, "expected i32, found string");
    EXPECT_EQ(err.path_string(), "$.children[1].value");
}

TEST(DeserializeStructTest, RecursiveTypes) {
    auto result =
        from_str<Node>(R"({"value": 1, "children": [{"value": 2}, {"value": 3, "children": [{"value": 4}]}]})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const Node& root = unwrap(result);
    ASSERT_EQ(root.children.size(), 2u);
    EXPECT_TRUE(root.children[0].children.empty());
    ASSERT_EQ(root.children[1].children.size(), 1u);
    EXPECT_EQ(root.children[1].children[0].value, 4);
}

TEST(DeserializeStructTest, BoxedLinks) {
    auto result = from_str<Link>(R"({"value": 1, "next": {"value": 2, "next": null}})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const Link& head = unwrap(result);
    ASSERT_NE(head.next.get(), nullptr);
    EXPECT_EQ(head.next->value, 2);
    EXPECT_EQ(head.next->next.get(), nullptr);

    auto tail = from_str<Link>(R"({"value": 9})");
    ASSERT_TRUE(is_ok(tail)) << error_text(tail);
    EXPECT_EQ(unwrap(tail).next.get(), nullptr);
}

// ============================================================================
// Defaults and Flattening
// ============================================================================

TEST(DeserializeDefaultTest, FieldDefaults) {
    auto result = from_str<Config>(R"({"name": "svc"})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const Config& config = unwrap(result);
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.description.has_value());
    EXPECT_TRUE(config.tags.empty());
}

TEST(DeserializeDefaultTest, ExplicitValuesOverrideDefaults) {
    auto result = from_str<Config>(
        R"({"name": "svc", "port": 9000, "description": "main", "tags": ["a", "b"]})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const Config& config = unwrap(result);
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.description.value_or(""), "main");
    EXPECT_EQ(config.tags, (std::vector<std::string>{"a", "b"}));
}

TEST(DeserializeDefaultTest, NullForOptionalField) {
    auto result = from_str<Config>(R"({"name": "svc", "description": null})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_FALSE(unwrap(result).description.has_value());
}

TEST(DeserializeDefaultTest, ContainerDefaultFillsFromDefaultValue) {
    auto result = from_str<Settings>(R"({"retries": 5})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const Settings& settings = unwrap(result);
    EXPECT_EQ(settings.retries, 5);
    EXPECT_TRUE(settings.verbose);
    EXPECT_EQ(settings.mode, "fast");

    auto empty = from_str<Settings>("{}");
    ASSERT_TRUE(is_ok(empty)) << error_text(empty);
    EXPECT_EQ(unwrap(empty).retries, 3);
}

TEST(DeserializeFlattenTest, InlinedMembers) {
    auto result = from_str<Customer>(R"({"city": "Oslo", "name": "Ola", "zip": "0150"})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const Customer& customer = unwrap(result);
    EXPECT_EQ(customer.name, "Ola");
    EXPECT_EQ(customer.address.city, "Oslo");
    EXPECT_EQ(customer.address.zip, "0150");
}

TEST(DeserializeFlattenTest, MissingInlinedMember) {
    auto result = from_str<Customer>(R"({"name": "Ola", "city": "Oslo"})");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "missing field `zip`");
}

TEST(DeserializeFlattenTest, NestedObjectIsUnknown) {
    DeserializeOptions options;
    options.deny_unknown_fields = true;
    auto result = from_str<Customer>(R"({"name": "Ola", "address": {}})", options);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnknownField);
    EXPECT_EQ(unwrap_err(result).help, "expected one of `name`, `city`, `zip`");
}

// ============================================================================
// Scalars and Coercion
// ============================================================================

TEST(DeserializeScalarTest, Primitives) {
    auto result = from_str<Primitives>(
        R"({"flag": true, "i8": -128, "u8": 255, "i64": -9223372036854775808,
            "u64": 18446744073709551615, "f32": 1.5, "f64": 0.1, "ch": "é"})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const Primitives& p = unwrap(result);
    EXPECT_TRUE(p.flag);
    EXPECT_EQ(p.i8, -128);
    EXPECT_EQ(p.u8, 255);
    EXPECT_EQ(p.i64, std::numeric_limits<int64_t>::min());
    EXPECT_EQ(p.u64, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(p.f32, 1.5f);
    EXPECT_EQ(p.f64, 0.1);
    EXPECT_EQ(p.ch, U'é');
}

TEST(DeserializeScalarTest, NumericStringsCoerce) {
    auto i = from_str<int32_t>(R"("-12")");
    ASSERT_TRUE(is_ok(i)) << error_text(i);
    EXPECT_EQ(unwrap(i), -12);

    auto f = from_str<double>(R"("2.5")");
    ASSERT_TRUE(is_ok(f)) << error_text(f);
    EXPECT_EQ(unwrap(f), 2.5);

    auto s = from_str<std::string>("42");
    ASSERT_TRUE(is_ok(s)) << error_text(s);
    EXPECT_EQ(unwrap(s), "42");

    auto bad = from_str<int32_t>(R"("12abc")");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).kind, ErrorKind::TypeMismatch);
}

TEST(DeserializeScalarTest, FloatIntoIntegerIsMismatch) {
    auto result = from_str<int32_t>("1.5");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(unwrap_err(result).message, "expected i32, found float");

    auto exp = from_str<uint64_t>("1e3");
    ASSERT_TRUE(is_err(exp));
    EXPECT_EQ(unwrap_err(exp).kind, ErrorKind::TypeMismatch);
}

TEST(DeserializeScalarTest, OutOfRange) {
    auto byte = from_str<uint8_t>("256");
    ASSERT_TRUE(is_err(byte));
    EXPECT_EQ(unwrap_err(byte).kind, ErrorKind::NumberOutOfRange);
    EXPECT_EQ(unwrap_err(byte).category, ErrorCategory::TypeMismatch);
    EXPECT_EQ(unwrap_err(byte).message, "number `256` out of range for u8");

    auto negative = from_str<uint64_t>("-1");
    ASSERT_TRUE(is_err(negative));
    EXPECT_EQ(unwrap_err(negative).kind, ErrorKind::NumberOutOfRange);

    auto huge = from_str<double>("1e400");
    ASSERT_TRUE(is_err(huge));
    EXPECT_EQ(unwrap_err(huge).kind, ErrorKind::NumberOutOfRange);

    auto small = from_str<int8_t>("-129");
    ASSERT_TRUE(is_err(small));
    EXPECT_EQ(unwrap_err(small).kind, ErrorKind::NumberOutOfRange);
}

TEST(DeserializeScalarTest, BooleanNeedsLiteral) {
    auto result = from_str<bool>(R"("true")");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "expected bool, found string");

    auto number = from_str<int32_t>("true");
    ASSERT_TRUE(is_err(number));
    EXPECT_EQ(unwrap_err(number).message, "expected i32, found boolean");
}

TEST(DeserializeScalarTest, CharNeedsOneCodePoint) {
    auto emoji = from_str<char32_t>("\"\xF0\x9F\x98\x80\"");
    ASSERT_TRUE(is_ok(emoji)) << error_text(emoji);
    EXPECT_EQ(unwrap(emoji), U'\U0001F600');

    auto two = from_str<char32_t>(R"("ab")");
    ASSERT_TRUE(is_err(two));
    EXPECT_EQ(unwrap_err(two).kind, ErrorKind::InvalidValue);
}

TEST(DeserializeScalarTest, BorrowedStrings) {
    std::string input = R"({"text": "plain"})";
    auto result = from_str<Borrowed>(input);
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    std::string_view text = unwrap(result).text;
    EXPECT_EQ(text, "plain");
    EXPECT_EQ(text.data(), input.data() + 10);

    auto escaped = from_str<Borrowed>(R"({"text": "tab\there"})");
    ASSERT_TRUE(is_err(escaped));
    EXPECT_EQ(unwrap_err(escaped).kind, ErrorKind::InvalidValue);
    EXPECT_EQ(unwrap_err(escaped).path_string(), "$.text");
}

TEST(DeserializeScalarTest, Newtype) {
    auto result = from_str<UserId>("42");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(unwrap(result).value, 42u);
}

TEST(DeserializeScalarTest, CustomHooks) {
    auto version = from_str<Version>(R"("1.20.3")");
    ASSERT_TRUE(is_ok(version)) << error_text(version);
    EXPECT_EQ(unwrap(version).minor, 20u);

    auto malformed = from_str<Version>(R"("1.x")");
    ASSERT_TRUE(is_err(malformed));
    EXPECT_EQ(unwrap_err(malformed).kind, ErrorKind::InvalidValue);
    EXPECT_EQ(unwrap_err(malformed).message, "invalid Version: expected major.minor.patch");

    auto even = from_str<Even>(R"("6")");
    ASSERT_TRUE(is_ok(even)) << error_text(even);
    EXPECT_EQ(unwrap(even).value, 6);

    auto odd = from_str<Even>("7");
    ASSERT_TRUE(is_err(odd));
    EXPECT_EQ(unwrap_err(odd).message, "invalid Even: expected an even number");

    auto wrong = from_str<Version>("[]");
    ASSERT_TRUE(is_err(wrong));
    EXPECT_EQ(unwrap_err(wrong).kind, ErrorKind::TypeMismatch);
}

// ============================================================================
// Containers
// ============================================================================

TEST(DeserializeContainerTest, TrailingCommaInArray) {
    auto result = from_str<std::vector<int32_t>>("[1,2,]");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::TrailingComma);
    EXPECT_EQ(err.category, ErrorCategory::Structural);
    EXPECT_EQ(err.span.start, 4u);
}

TEST(DeserializeContainerTest, TrailingCommaInObject) {
    auto result = from_str<Person>(R"({"name": "a", "age": 1,})");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TrailingComma);
}

TEST(DeserializeContainerTest, IntegerKeyedMap) {
    auto result = from_str<std::map<uint32_t, int32_t>>(R"({"1": 10, "2": 20})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    const auto& map = unwrap(result);
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map.at(1), 10);
    EXPECT_EQ(map.at(2), 20);

    auto bad = from_str<std::map<uint32_t, int32_t>>(R"({"one": 1})");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(unwrap_err(bad).path_string(), "$.one");
}

TEST(DeserializeContainerTest, BoolAndEnumKeys) {
    auto flags = from_str<std::map<bool, int32_t>>(R"({"true": 1, "false": 0})");
    ASSERT_TRUE(is_ok(flags)) << error_text(flags);
    EXPECT_EQ(unwrap(flags).at(true), 1);

    auto hues = from_str<std::map<Hue, int32_t>>(R"({"green": 2})");
    ASSERT_TRUE(is_ok(hues)) << error_text(hues);
    EXPECT_EQ(unwrap(hues).begin()->first.index(), 1u);

    auto unknown = from_str<std::map<Hue, int32_t>>(R"({"blue": 2})");
    ASSERT_TRUE(is_err(unknown));
    EXPECT_EQ(unwrap_err(unknown).kind, ErrorKind::UnknownVariant);
}

TEST(DeserializeContainerTest, SetsAndUnorderedMaps) {
    auto set = from_str<std::set<int32_t>>("[3, 1, 2, 1]");
    ASSERT_TRUE(is_ok(set)) << error_text(set);
    EXPECT_EQ(unwrap(set), (std::set<int32_t>{1, 2, 3}));

    auto map = from_str<std::unordered_map<std::string, double>>(R"({"pi": 3.14})");
    ASSERT_TRUE(is_ok(map)) << error_text(map);
    EXPECT_EQ(unwrap(map).at("pi"), 3.14);
}

TEST(DeserializeContainerTest, Tuples) {
    auto pair = from_str<std::pair<int32_t, std::string>>(R"([7, "seven"])");
    ASSERT_TRUE(is_ok(pair)) << error_text(pair);
    EXPECT_EQ(unwrap(pair).second, "seven");

    auto short_pair = from_str<std::pair<int32_t, std::string>>("[7]");
    ASSERT_TRUE(is_err(short_pair));
    EXPECT_EQ(unwrap_err(short_pair).message, "expected an array of 2 elements, found 1");

    auto long_pair = from_str<std::pair<int32_t, std::string>>(R"([7, "a", 8])");
    ASSERT_TRUE(is_err(long_pair));
    EXPECT_EQ(unwrap_err(long_pair).message, "expected an array of 2 elements, found more");
    EXPECT_EQ(unwrap_err(long_pair).span, (Span{9, 10}));

    auto array = from_str<std::array<int32_t, 3>>("[1, 2, 3]");
    ASSERT_TRUE(is_ok(array)) << error_text(array);
    EXPECT_EQ(unwrap(array)[2], 3);
}

TEST(DeserializeContainerTest, Optionals) {
    auto none = from_str<std::optional<int32_t>>("null");
    ASSERT_TRUE(is_ok(none)) << error_text(none);
    EXPECT_FALSE(unwrap(none).has_value());

    auto some = from_str<std::optional<int32_t>>("5");
    ASSERT_TRUE(is_ok(some)) << error_text(some);
    EXPECT_EQ(unwrap(some).value_or(0), 5);

    auto wrong = from_str<std::optional<int32_t>>(R"({})");
    ASSERT_TRUE(is_err(wrong));
    EXPECT_EQ(unwrap_err(wrong).message, "expected i32, found object");
}

// ============================================================================
// Structural Errors and Limits
// ============================================================================

TEST(DeserializeErrorTest, MissingColon) {
    auto result = from_str<Person>(R"({"name" "a"})");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(unwrap_err(result).message, "expected `:`, found string");
}

TEST(DeserializeErrorTest, MissingSeparator) {
    auto result = from_str<std::vector<int32_t>>("[1 2]");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnexpectedToken);
    EXPECT_EQ(unwrap_err(result).span, (Span{3, 4}));
}

TEST(DeserializeErrorTest, EndOfInput) {
    auto empty = from_str<int32_t>("");
    ASSERT_TRUE(is_err(empty));
    EXPECT_EQ(unwrap_err(empty).kind, ErrorKind::UnexpectedEndOfInput);

    auto open = from_str<Person>(R"({"name": "a",)");
    ASSERT_TRUE(is_err(open));
    EXPECT_EQ(unwrap_err(open).kind, ErrorKind::UnexpectedEndOfInput);
}

TEST(DeserializeErrorTest, TrailingCharacters) {
    auto result = from_str<Person>(R"({"name":"a","age":1} x)");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::TrailingCharacters);
    EXPECT_EQ(err.category, ErrorCategory::Syntax);
    EXPECT_EQ(err.span, (Span{21, 22}));

    auto spaces = from_str<int32_t>("1 \n\t ");
    EXPECT_TRUE(is_ok(spaces));
}

TEST(DeserializeErrorTest, ByteOrderMarkSkipped) {
    auto result = from_str<Person>("\xEF\xBB\xBF{\"name\": \"a\", \"age\": 1}");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(unwrap(result).name, "a");
}

TEST(DeserializeErrorTest, DepthLimit) {
    DeserializeOptions options;
    options.max_depth = 1;
    auto nested = from_str<std::vector<std::vector<int32_t>>>("[[1]]", options);
    ASSERT_TRUE(is_err(nested));
    EXPECT_EQ(unwrap_err(nested).kind, ErrorKind::DepthLimitExceeded);
    EXPECT_EQ(unwrap_err(nested).span, (Span{1, 2}));

    options.max_depth = 3;
    auto skipped = from_str<Person>(R"({"x":[[[[[]]]]],"name":"a","age":1})", options);
    ASSERT_TRUE(is_err(skipped));
    EXPECT_EQ(unwrap_err(skipped).kind, ErrorKind::DepthLimitExceeded);
    EXPECT_EQ(unwrap_err(skipped).span, (Span{7, 8}));
}

TEST(DeserializeErrorTest, DeeplyNestedWithinDefaultLimit) {
    std::string input = std::string(100, '[') + std::string(100, ']');
    auto skipped = from_str<Person>(R"({"x":)" + input + R"(,"name":"a","age":1})");
    EXPECT_TRUE(is_ok(skipped)) << error_text(skipped);
}

TEST(DeserializeErrorTest, ErrorsCarrySourceContext) {
    auto result = from_str<Person>("{\n  \"name\": true,\n  \"age\": 1\n}");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    ASSERT_TRUE(err.context.has_value());
    EXPECT_EQ(err.context->line, 2u);
    EXPECT_EQ(err.context->column, 11u);
    std::string text = err.to_string();
    EXPECT_NE(text.find("error[json::type_mismatch]: expected string, found boolean"),
              std::string::npos);
    EXPECT_NE(text.find("--> 2:11"), std::string::npos);
    EXPECT_NE(text.find(" 2 |   \"name\": true,\n"), std::string::npos);
    EXPECT_EQ(text.find("..."), std::string::npos);
    EXPECT_NE(text.find("= path: $.name"), std::string::npos);
}
