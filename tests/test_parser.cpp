/**
 * @file test_parser.cpp
 * @brief Unit tests for document structure (GoogleTest)
 *
 * Covers:
 * - key/value pairs, bare/quoted/dotted keys
 * - [table] and [[array]] headers and their redefinition rules
 * - arrays and inline tables
 * - structural error kinds and their spans
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "boml/Parser.hpp"
#include "boml/Errors.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace boml;

namespace {

ParseError error_of(std::string_view src) {
    try {
        parse(src);
    } catch (const ParseError& e) {
        return e;
    }
    throw std::logic_error("expected a parse error");
}

ParseErrorKind kind_of(std::string_view src) {
    return error_of(src).kind();
}

} // namespace

// ============================================================================
// Basic documents
// ============================================================================

TEST(ParserBasic, EmptyDocument) {
    Document doc = parse("");
    EXPECT_TRUE(doc.empty());
    Document blank = parse("\n  # only a comment\n\r\n");
    EXPECT_TRUE(blank.empty());
}

TEST(ParserBasic, SourceIsKept) {
    const std::string src = "a = 1";
    Document doc = parse(src);
    EXPECT_EQ(doc.source().data(), src.data());
}

TEST(ParserBasic, InsertionOrder) {
    Document doc = parse("zeta = 1\nalpha = 2\nmid = 3");
    std::vector<std::string> keys;
    for (const auto& entry : doc) {
        keys.push_back(entry.key.str());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(ParserBasic, MixedValues) {
    Document doc = parse(R"(
# A small manifest
title = "TOML Example"   # trailing comment
count = 3
ratio = 0.5
enabled = true
born = 1979-05-27T07:32:00-08:00
)");
    EXPECT_EQ(doc.size(), 5u);
    EXPECT_EQ(doc.get_string("title"), "TOML Example");
    EXPECT_EQ(doc.get_integer("count"), 3);
    EXPECT_DOUBLE_EQ(doc.get_float("ratio"), 0.5);
    EXPECT_TRUE(doc.get_boolean("enabled"));
    EXPECT_EQ(doc.get("born")->kind(), ValueKind::OffsetDateTime);
}

TEST(ParserBasic, QuotedAndBareKeys) {
    Document doc = parse(R"(
bare_key = 1
bare-key = 2
1234 = 3
"127.0.0.1" = 4
"" = 5
'quoted "value"' = 6
)");
    EXPECT_EQ(doc.get_integer("bare_key"), 1);
    EXPECT_EQ(doc.get_integer("bare-key"), 2);
    EXPECT_EQ(doc.get_integer("1234"), 3);
    EXPECT_EQ(doc.get_integer("127.0.0.1"), 4);
    EXPECT_EQ(doc.get_integer(""), 5);
    EXPECT_EQ(doc.get_integer("quoted \"value\""), 6);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST(ParserScenario, BorrowedString) {
    const std::string src = "name = \"boml\"";
    Document doc = parse(src);
    EXPECT_EQ(doc.get_string("name"), "boml");
    EXPECT_TRUE(doc.get("name")->as_toml_string()->is_borrowed());
}

TEST(ParserScenario, OwnedString) {
    Document doc = parse("msg = \"a\\nb\"");
    EXPECT_EQ(doc.get_string("msg"), "a\nb");
    EXPECT_FALSE(doc.get("msg")->as_toml_string()->is_borrowed());
}

TEST(ParserScenario, DuplicateKeyInTable) {
    const std::string src = "[package]\nname = \"x\"\nname = \"y\"";
    ParseError e = error_of(src);
    EXPECT_EQ(e.kind(), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(e.span().start, src.rfind("name"));
    EXPECT_EQ(e.span().text(src), "name");
}

TEST(ParserScenario, IntegerArray) {
    Document doc = parse("nums = [1, 2, 3]");
    const Array& nums = doc.get_array("nums");
    ASSERT_EQ(nums.size(), 3u);
    EXPECT_EQ(nums[0].as_integer(), 1);
    EXPECT_EQ(nums[1].as_integer(), 2);
    EXPECT_EQ(nums[2].as_integer(), 3);
}

TEST(ParserScenario, ArrayOfTables) {
    Document doc = parse("[[servers]]\nip=\"a\"\n[[servers]]\nip=\"b\"");
    const Array& servers = doc.get_array("servers");
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_TRUE(doc.get("servers")->is_array_of_tables());
    EXPECT_EQ(servers[0].as_table()->get_string("ip"), "a");
    EXPECT_EQ(servers[1].as_table()->get_string("ip"), "b");
}

TEST(ParserScenario, DottedKeyCreatesTables) {
    Document doc = parse("a.b.c = 1");
    EXPECT_EQ(doc.get_table("a").get_table("b").get_integer("c"), 1);
}

// ============================================================================
// Dotted keys
// ============================================================================

TEST(ParserDotted, EquivalentToHeader) {
    Document dotted = parse("x.y = 1\nx.z = 2");
    Document header = parse("[x]\ny = 1\nz = 2");
    EXPECT_EQ(dotted, header);
}

TEST(ParserDotted, WhitespaceAroundDots) {
    Document doc = parse("fruit . color = \"yellow\"\n\"site\".'google.com' = true");
    EXPECT_EQ(doc.get_table("fruit").get_string("color"), "yellow");
    EXPECT_TRUE(doc.get_table("site").get_boolean("google.com"));
}

TEST(ParserDotted, ThroughScalarIsDuplicate) {
    const std::string src = "a = 1\na.b = 2";
    ParseError e = error_of(src);
    EXPECT_EQ(e.kind(), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(e.span(), Span(6, 7));
}

TEST(ParserDotted, CannotExtendHeaderTable) {
    EXPECT_EQ(kind_of("[a.b]\nc = 1\n[a]\nb.d = 2"), ParseErrorKind::DuplicateKey);
}

TEST(ParserDotted, CannotReopenWithHeader) {
    EXPECT_EQ(kind_of("a.b = 1\n[a]\nc = 2"), ParseErrorKind::DuplicateKey);
}

TEST(ParserDotted, HeaderMayDefineSubTable) {
    Document doc = parse("[fruit]\napple.color = \"red\"\n[fruit.apple.texture]\nsmooth = true");
    const Table& apple = doc.get_table("fruit").get_table("apple");
    EXPECT_EQ(apple.get_string("color"), "red");
    EXPECT_TRUE(apple.get_table("texture").get_boolean("smooth"));
}

// ============================================================================
// Table headers
// ============================================================================

TEST(ParserHeader, NestedAndImplicit) {
    Document doc = parse("[a.b.c]\nx = 1\n[a]\ny = 2");
    EXPECT_EQ(doc.get_table("a").get_integer("y"), 2);
    EXPECT_EQ(doc.get_table("a").get_table("b").get_table("c").get_integer("x"), 1);
}

TEST(ParserHeader, EmptyTable) {
    Document doc = parse("[empty]\n[other]\nk = 'v'");
    EXPECT_TRUE(doc.get_table("empty").empty());
}

TEST(ParserHeader, RedefinitionIsDuplicate) {
    const std::string src = "[a]\nx = 1\n[a]";
    ParseError e = error_of(src);
    EXPECT_EQ(e.kind(), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(e.span(), Span(11, 12));
}

TEST(ParserHeader, ImplicitTableDefinedTwice) {
    EXPECT_EQ(kind_of("[a.b]\n[a]\n[a]"), ParseErrorKind::DuplicateKey);
}

TEST(ParserHeader, OverScalarIsDuplicate) {
    EXPECT_EQ(kind_of("a = 1\n[a]"), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(kind_of("a = 1\n[a.b]"), ParseErrorKind::DuplicateKey);
}

TEST(ParserHeader, InlineTablesAreSealed) {
    EXPECT_EQ(kind_of("a = {x = 1}\n[a]"), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(kind_of("a = {x = 1}\n[a.b]"), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(kind_of("a = {x = 1}\na.y = 2"), ParseErrorKind::DuplicateKey);
}

TEST(ParserHeader, Unclosed) {
    EXPECT_EQ(kind_of("[a\nb = 1"), ParseErrorKind::UnclosedTableHeader);
    EXPECT_EQ(kind_of("[[a]\nb = 1"), ParseErrorKind::UnclosedTableHeader);
    EXPECT_EQ(kind_of("[a]]"), ParseErrorKind::UnclosedTableHeader);
}

TEST(ParserHeader, EmptyHeaderName) {
    EXPECT_EQ(kind_of("[]"), ParseErrorKind::ExpectedKey);
}

TEST(ParserHeader, TextAfterHeader) {
    EXPECT_EQ(kind_of("[a] b = 1"), ParseErrorKind::ExpectedNewline);
}

// ============================================================================
// Arrays of tables
// ============================================================================

TEST(ParserTableArray, SubTablesAttachToLastElement) {
    Document doc = parse(R"(
[[fruits]]
name = "apple"

[fruits.physical]
color = "red"

[[fruits.varieties]]
name = "red delicious"

[[fruits.varieties]]
name = "granny smith"

[[fruits]]
name = "banana"

[[fruits.varieties]]
name = "plantain"
)");
    const Array& fruits = doc.get_array("fruits");
    ASSERT_EQ(fruits.size(), 2u);

    const Table& apple = *fruits[0].as_table();
    EXPECT_EQ(apple.get_string("name"), "apple");
    EXPECT_EQ(apple.get_table("physical").get_string("color"), "red");
    ASSERT_EQ(apple.get_array("varieties").size(), 2u);
    EXPECT_EQ(apple.get_array("varieties")[1].as_table()->get_string("name"), "granny smith");

    const Table& banana = *fruits[1].as_table();
    ASSERT_EQ(banana.get_array("varieties").size(), 1u);
    EXPECT_FALSE(banana.contains("physical"));
}

TEST(ParserTableArray, StaticArrayCannotBeAppended) {
    EXPECT_EQ(kind_of("fruits = []\n[[fruits]]"), ParseErrorKind::DuplicateKey);
}

TEST(ParserTableArray, TableCannotBecomeArray) {
    EXPECT_EQ(kind_of("[fruit]\n[[fruit]]"), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(kind_of("[[fruit]]\n[fruit]"), ParseErrorKind::DuplicateKey);
}

TEST(ParserTableArray, EmptyElements) {
    Document doc = parse("[[a]]\n[[a]]\n[[a]]");
    EXPECT_EQ(doc.get_array("a").size(), 3u);
}

// ============================================================================
// Arrays
// ============================================================================

TEST(ParserArray, MultilineWithCommentsAndTrailingComma) {
    Document doc = parse(R"(
ports = [
  8000,  # first
  8001,
  # a comment line
  8002,
]
)");
    EXPECT_EQ(doc.get_array("ports").size(), 3u);
}

TEST(ParserArray, NestedAndMixed) {
    Document doc = parse(R"(data = [ [1, 2], ["a", 'b'], [1.5, true, {x = 1}] ])");
    const Array& data = doc.get_array("data");
    ASSERT_EQ(data.size(), 3u);
    EXPECT_EQ(data[0].as_array()->size(), 2u);
    EXPECT_EQ((*data[1].as_array())[1].as_string(), "b");
    EXPECT_EQ((*data[2].as_array())[2].as_table()->get_integer("x"), 1);
}

TEST(ParserArray, Empty) {
    Document doc = parse("e = []\nf = [\n]");
    EXPECT_TRUE(doc.get_array("e").empty());
    EXPECT_TRUE(doc.get_array("f").empty());
}

TEST(ParserArray, Errors) {
    EXPECT_EQ(kind_of("a = [1, 2"), ParseErrorKind::UnclosedArray);
    EXPECT_EQ(kind_of("a = [1 2]"), ParseErrorKind::ExpectedComma);
    EXPECT_EQ(kind_of("a = [,]"), ParseErrorKind::ExpectedValue);
    EXPECT_EQ(kind_of("a = [1,,2]"), ParseErrorKind::ExpectedValue);
}

TEST(ParserArray, UnclosedSpanStartsAtBracket) {
    ParseError e = error_of("a = [1, 2");
    EXPECT_EQ(e.span().start, 4u);
}

TEST(ParserArray, NestingLimit) {
    std::string deep = "a = " + std::string(300, '[') + std::string(300, ']');
    EXPECT_EQ(kind_of(deep), ParseErrorKind::NestingTooDeep);

    std::string ok = "a = " + std::string(100, '[') + std::string(100, ']');
    EXPECT_NO_THROW(parse(ok));
}

namespace {

// "a.a.a" with the given number of segments
std::string dotted(std::size_t segments) {
    std::string key = "a";
    for (std::size_t i = 1; i < segments; ++i) key += ".a";
    return key;
}

} // namespace

TEST(ParserNesting, DottedKeysCountTowardsLimit) {
    // The last segment names the value, every other one opens a table.
    const std::string ok = dotted(Parser::kMaxDepth + 1) + " = 1";
    EXPECT_NO_THROW({ Document doc = parse(ok); });

    const std::string deep = dotted(Parser::kMaxDepth + 2) + " = 1";
    ParseError e = error_of(deep);
    EXPECT_EQ(e.kind(), ParseErrorKind::NestingTooDeep);
    EXPECT_EQ(e.span().start, Parser::kMaxDepth * 2);
}

TEST(ParserNesting, VeryLongDottedKey) {
    EXPECT_EQ(kind_of(dotted(200000) + " = 1"), ParseErrorKind::NestingTooDeep);
}

TEST(ParserNesting, TableHeaders) {
    const std::string ok = "[" + dotted(Parser::kMaxDepth) + "]\n";
    EXPECT_NO_THROW({ Document doc = parse(ok); });

    ParseError e = error_of("[" + dotted(Parser::kMaxDepth + 1) + "]\n");
    EXPECT_EQ(e.kind(), ParseErrorKind::NestingTooDeep);
    EXPECT_EQ(e.span().start, 1 + Parser::kMaxDepth * 2);

    EXPECT_EQ(kind_of("[" + dotted(200000) + "]\n"), ParseErrorKind::NestingTooDeep);
}

TEST(ParserNesting, ArrayHeadersCountTheArray) {
    const std::string ok = "[[" + dotted(Parser::kMaxDepth - 1) + "]]\n";
    EXPECT_NO_THROW({ Document doc = parse(ok); });

    EXPECT_EQ(kind_of("[[" + dotted(Parser::kMaxDepth) + "]]\n"), ParseErrorKind::NestingTooDeep);
}

TEST(ParserNesting, ValuesInsideDeepTables) {
    const std::string header = "[" + dotted(Parser::kMaxDepth - 1) + "]\n";
    EXPECT_NO_THROW({ const std::string src = header + "x = [1]"; Document doc = parse(src); });
    EXPECT_EQ(kind_of(header + "x = [[1]]"), ParseErrorKind::NestingTooDeep);
    EXPECT_EQ(kind_of(header + "x.y = [1]"), ParseErrorKind::NestingTooDeep);
    EXPECT_NO_THROW({ const std::string src = header + "x = { y = 1 }"; Document doc = parse(src); });
    EXPECT_EQ(kind_of(header + "x = { y = [1] }"), ParseErrorKind::NestingTooDeep);
}

// ============================================================================
// Inline tables
// ============================================================================

TEST(ParserInline, Basic) {
    Document doc = parse(R"(point = { x = 1, y = 2 }
name = { first = "Tom", last = "Preston-Werner" }
empty = {})");
    EXPECT_EQ(doc.get_table("point").get_integer("y"), 2);
    EXPECT_EQ(doc.get_table("name").get_string("last"), "Preston-Werner");
    EXPECT_TRUE(doc.get_table("empty").empty());
}

TEST(ParserInline, DottedKeysInside) {
    Document doc = parse("animal = { type.name = \"pug\", type.size = 2 }");
    const Table& type = doc.get_table("animal").get_table("type");
    EXPECT_EQ(type.get_string("name"), "pug");
    EXPECT_EQ(type.get_integer("size"), 2);
}

TEST(ParserInline, Errors) {
    EXPECT_EQ(kind_of("a = {x = 1,}"), ParseErrorKind::ExpectedKey);
    EXPECT_EQ(kind_of("a = {x = 1\n}"), ParseErrorKind::UnclosedInlineTable);
    EXPECT_EQ(kind_of("a = {x = 1"), ParseErrorKind::UnclosedInlineTable);
    EXPECT_EQ(kind_of("a = {x = 1 y = 2}"), ParseErrorKind::ExpectedComma);
    EXPECT_EQ(kind_of("a = {x = 1, x = 2}"), ParseErrorKind::DuplicateKey);
    EXPECT_EQ(kind_of("a = {\nx = 1}"), ParseErrorKind::UnclosedInlineTable);
}

// ============================================================================
// Statement errors
// ============================================================================

TEST(ParserErrors, MissingEquals) {
    ParseError e = error_of("key \"value\"");
    EXPECT_EQ(e.kind(), ParseErrorKind::ExpectedEquals);
    EXPECT_EQ(e.span(), Span(4, 11));
}

TEST(ParserErrors, MissingValue) {
    ParseError at_newline = error_of("key = \nnext = 1");
    EXPECT_EQ(at_newline.kind(), ParseErrorKind::ExpectedValue);
    EXPECT_EQ(at_newline.span(), Span(6, 7));

    ParseError at_end = error_of("key =");
    EXPECT_EQ(at_end.kind(), ParseErrorKind::ExpectedValue);
    EXPECT_EQ(at_end.span(), Span(5, 5));
}

TEST(ParserErrors, TwoValuesOnOneLine) {
    ParseError e = error_of("a = 1 b = 2");
    EXPECT_EQ(e.kind(), ParseErrorKind::ExpectedNewline);
    EXPECT_EQ(e.span(), Span(6, 7));
}

TEST(ParserErrors, KeyCutShort) {
    EXPECT_EQ(kind_of("a."), ParseErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(kind_of("a. = 1"), ParseErrorKind::ExpectedKey);
    EXPECT_EQ(kind_of("= 1"), ParseErrorKind::ExpectedKey);
}

TEST(ParserErrors, MultilineKeyRejected) {
    // Only single-line strings are keys; this reads as "" followed by "key".
    EXPECT_EQ(kind_of("\"\"\"key\"\"\" = 1"), ParseErrorKind::ExpectedEquals);
}

TEST(ParserErrors, InvalidEncodingReportedFirst) {
    ParseError e = error_of("a = 1\nb = \"\xFF\"");
    EXPECT_EQ(e.kind(), ParseErrorKind::InvalidEncoding);
    EXPECT_EQ(e.span().start, 11u);
}

TEST(ParserErrors, FailFastIsDeterministic) {
    const std::string src = "a = 1\nb = [1, 2\nc = {";
    ParseError first = error_of(src);
    ParseError second = error_of(src);
    EXPECT_EQ(first.kind(), second.kind());
    EXPECT_EQ(first.span(), second.span());
}

TEST(ParserErrors, MessageNamesKind) {
    ParseError e = error_of("a = 1\na = 2");
    EXPECT_NE(std::string(e.what()).find("DuplicateKey"), std::string::npos);
    EXPECT_EQ(to_string(e.kind()), "DuplicateKey");
}

// ============================================================================
// Date/time placeholders
// ============================================================================

TEST(ParserDateTime, ShapesSelectKind) {
    Document doc = parse(R"(
odt1 = 1979-05-27T07:32:00Z
odt2 = 1979-05-27T00:32:00.999999-07:00
ldt = 1979-05-27T07:32:00
spaced = 1979-05-27 07:32:00
ld = 1979-05-27
lt = 00:32:00.999999
)");
    EXPECT_EQ(doc.get("odt1")->kind(), ValueKind::OffsetDateTime);
    EXPECT_EQ(doc.get("odt2")->kind(), ValueKind::OffsetDateTime);
    EXPECT_EQ(doc.get("ldt")->kind(), ValueKind::LocalDateTime);
    EXPECT_EQ(doc.get("spaced")->kind(), ValueKind::LocalDateTime);
    EXPECT_EQ(doc.get("ld")->kind(), ValueKind::LocalDate);
    EXPECT_EQ(doc.get("lt")->kind(), ValueKind::LocalTime);
    EXPECT_EQ(doc.get_datetime("spaced").text, "1979-05-27 07:32:00");
}

TEST(ParserDateTime, RangesAreNotChecked) {
    Document doc = parse("d = 2023-13-45");
    EXPECT_EQ(doc.get("d")->kind(), ValueKind::LocalDate);
}

TEST(ParserDateTime, MalformedShape) {
    EXPECT_EQ(kind_of("d = 1979-5-27"), ParseErrorKind::InvalidDateTime);
    EXPECT_EQ(kind_of("d = 07:32"), ParseErrorKind::InvalidDateTime);
    EXPECT_EQ(kind_of("d = 1979-05-27T07:32:00+0700"), ParseErrorKind::InvalidDateTime);
    EXPECT_EQ(kind_of("d = 1979-05-27X"), ParseErrorKind::InvalidDateTime);
}
