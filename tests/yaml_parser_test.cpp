#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "strata/yaml_parser.hpp"
#include "test_helpers.hpp"

using namespace strata;
using strata::test::RecordingSetter;
using Calls = std::vector<RecordingSetter::Call>;

namespace {

std::optional<Error> parseYaml(const std::string& text, RecordingSetter& rec, const std::string& delimiter = ".") {
    std::istringstream in(text);
    return YamlParser(delimiter)(in, rec.setter());
}

} // namespace

TEST(YamlParser, FlatDocument) {
    RecordingSetter rec;
    const std::string text =
        "s: foo\n"
        "i: 123\n"
        "f: 1.5\n"
        "b: yes\n"
        "d: 5s\n";
    ASSERT_FALSE(parseYaml(text, rec).has_value());
    EXPECT_EQ(rec.calls(), (Calls{{"s", "foo"}, {"i", "123"}, {"f", "1.5"}, {"b", "true"}, {"d", "5s"}}));
}

TEST(YamlParser, QuotedScalarsStayStrings) {
    RecordingSetter rec;
    ASSERT_FALSE(parseYaml("a: \"yes\"\nb: '007'\n", rec).has_value());
    EXPECT_EQ(rec.calls(), (Calls{{"a", "yes"}, {"b", "007"}}));
}

TEST(YamlParser, NestedKeysAndLists) {
    RecordingSetter rec;
    const std::string text =
        "server:\n"
        "  host: example.com\n"
        "  port: 8080\n"
        "xs:\n"
        "  - a\n"
        "  - b\n"
        "  - c\n";
    ASSERT_FALSE(parseYaml(text, rec).has_value());
    EXPECT_EQ(rec.calls(), (Calls{
                               {"server.host", "example.com"},
                               {"server.port", "8080"},
                               {"xs", "a"},
                               {"xs", "b"},
                               {"xs", "c"},
                           }));

    RecordingSetter dashed;
    ASSERT_FALSE(parseYaml("server:\n  port: 1\n", dashed, "-").has_value());
    EXPECT_EQ(dashed.calls(), (Calls{{"server-port", "1"}}));
}

TEST(YamlParser, EmptyDocumentSetsNothing) {
    RecordingSetter rec;
    EXPECT_FALSE(parseYaml("", rec).has_value());
    EXPECT_FALSE(parseYaml("# only a comment\n", rec).has_value());
    EXPECT_TRUE(rec.calls().empty());
}

TEST(YamlParser, NullValueIsConversionError) {
    RecordingSetter rec;
    const auto err = parseYaml("n: ~\n", rec);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::StringConversionError);
}

TEST(YamlParser, MalformedDocumentIsParseError) {
    RecordingSetter rec;
    const auto err = parseYaml("a: [1, 2\n", rec);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::ConfigParseError);
    EXPECT_NE(err->message().find("YAML"), std::string::npos);
}

TEST(YamlParser, ScalarRootIsParseError) {
    RecordingSetter rec;
    const auto err = parseYaml("just a string\n", rec);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::ConfigParseError);
}

TEST(YamlParser, DecodeBuildsTypedTree) {
    std::istringstream in("a: 1\nb: 2.5\nc: off\nd: text\n");
    Node root;
    ASSERT_FALSE(YamlParser::decode(in, root).has_value());
    ASSERT_EQ(root.kind(), Node::Kind::Mapping);
    ASSERT_EQ(root.entries().size(), 4u);
    EXPECT_EQ(root.entries()[0].second.kind(), Node::Kind::Int);
    EXPECT_EQ(root.entries()[1].second.kind(), Node::Kind::Float);
    EXPECT_EQ(root.entries()[2].second.kind(), Node::Kind::Bool);
    EXPECT_FALSE(root.entries()[2].second.asBool());
    EXPECT_EQ(root.entries()[3].second.kind(), Node::Kind::String);
}
