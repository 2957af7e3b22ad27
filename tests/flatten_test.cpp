#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "strata/flatten.hpp"
#include "test_helpers.hpp"

using namespace strata;
using strata::test::RecordingSetter;
using Calls = std::vector<RecordingSetter::Call>;

TEST(Flatten, ScalarsBecomeCanonicalText) {
    const Node doc = Node::mapping({
        {"s", Node::string("foo")},
        {"i", Node::integer(-123)},
        {"f", Node::floating(1.23)},
        {"b", Node::boolean(true)},
    });

    RecordingSetter rec;
    ASSERT_FALSE(flatten(doc, ".", rec.setter()).has_value());
    EXPECT_EQ(rec.calls(), (Calls{{"s", "foo"}, {"i", "-123"}, {"f", "1.23"}, {"b", "true"}}));
}

TEST(Flatten, SequenceCallsSetterPerElement) {
    const Node doc = Node::mapping({
        {"x", Node::sequence({Node::string("a"), Node::integer(1), Node::boolean(false)})},
    });

    RecordingSetter rec;
    ASSERT_FALSE(flatten(doc, ".", rec.setter()).has_value());
    EXPECT_EQ(rec.calls(), (Calls{{"x", "a"}, {"x", "1"}, {"x", "false"}}));
}

TEST(Flatten, NestedMappingsJoinWithDelimiter) {
    const Node doc = Node::mapping({
        {"m", Node::mapping({
                  {"s", Node::string("foo")},
                  {"m2", Node::mapping({{"i", Node::integer(7)}})},
              })},
    });

    RecordingSetter dotted;
    ASSERT_FALSE(flatten(doc, ".", dotted.setter()).has_value());
    EXPECT_EQ(dotted.calls(), (Calls{{"m.s", "foo"}, {"m.m2.i", "7"}}));

    RecordingSetter dashed;
    ASSERT_FALSE(flatten(doc, "-", dashed.setter()).has_value());
    EXPECT_EQ(dashed.calls(), (Calls{{"m-s", "foo"}, {"m-m2-i", "7"}}));
}

TEST(Flatten, NullValueIsStringConversionError) {
    const Node doc = Node::mapping({{"n", Node::null()}});
    RecordingSetter rec;
    const auto err = flatten(doc, ".", rec.setter());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::StringConversionError);
    EXPECT_NE(err->message().find("n:"), std::string::npos);
    EXPECT_TRUE(rec.calls().empty());
}

TEST(Flatten, NestedContainerInSequenceIsError) {
    const Node doc = Node::mapping({
        {"x", Node::sequence({Node::string("ok"), Node::mapping({{"k", Node::string("v")}})})},
    });
    RecordingSetter rec;
    const auto err = flatten(doc, ".", rec.setter());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::StringConversionError);
    EXPECT_EQ(rec.calls(), (Calls{{"x", "ok"}}));
}

TEST(Flatten, RootMustBeMappingOrEmpty) {
    RecordingSetter rec;
    EXPECT_FALSE(flatten(Node::null(), ".", rec.setter()).has_value());

    const auto err = flatten(Node::sequence({Node::integer(1)}), ".", rec.setter());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), ErrorKind::ConfigParseError);
}

TEST(Flatten, SetterErrorsStopTheWalk) {
    const Node doc = Node::mapping({{"a", Node::string("1")}, {"b", Node::string("2")}});
    int calls = 0;
    const auto err = flatten(doc, ".", [&](const std::string& name, const std::string&) -> std::optional<Error> {
        ++calls;
        return Error(ErrorKind::ConfigParseError, name + ": unknown flag");
    });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message(), "a: unknown flag");
    EXPECT_EQ(calls, 1);
}
