#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>

#include "strata/convert.hpp"

using namespace std::chrono_literals;
using strata::Duration;
namespace convert = strata::convert;

TEST(ConvertBool, AcceptsLiterals) {
    for (const char* s : {"1", "t", "T", "true", "True", "TRUE", "on", "yes"}) {
        bool v = false;
        EXPECT_TRUE(convert::parseBool(s, v)) << s;
        EXPECT_TRUE(v) << s;
    }
    for (const char* s : {"0", "f", "F", "false", "False", "FALSE", "off", "no"}) {
        bool v = true;
        EXPECT_TRUE(convert::parseBool(s, v)) << s;
        EXPECT_FALSE(v) << s;
    }
}

TEST(ConvertBool, RejectsOtherText) {
    bool v = false;
    EXPECT_FALSE(convert::parseBool("", v));
    EXPECT_FALSE(convert::parseBool("tru", v));
    EXPECT_FALSE(convert::parseBool("2", v));
    EXPECT_FALSE(convert::isBoolLiteral("hello"));
    EXPECT_TRUE(convert::isBoolLiteral("false"));
}

TEST(ConvertBool, FlagArgumentLiteralsAreNarrower) {
    for (const char* s : {"1", "t", "T", "true", "True", "TRUE", "0", "f", "F", "false", "False", "FALSE"}) {
        EXPECT_TRUE(convert::isBoolLiteral(s)) << s;
    }
    for (const char* s : {"on", "off", "yes", "no", " true"}) {
        EXPECT_FALSE(convert::isBoolLiteral(s)) << s;
    }
}

TEST(ConvertInt, BasePrefixesAndRange) {
    int v = 0;
    EXPECT_TRUE(convert::parse("0x1f", v));
    EXPECT_EQ(v, 31);
    EXPECT_TRUE(convert::parse("-42", v));
    EXPECT_EQ(v, -42);
    EXPECT_FALSE(convert::parse("12abc", v));
    EXPECT_FALSE(convert::parse("99999999999", v));

    std::int64_t big = 0;
    EXPECT_TRUE(convert::parse("99999999999", big));
    EXPECT_EQ(big, 99999999999LL);

    unsigned u = 0;
    EXPECT_FALSE(convert::parse("-1", u));
    EXPECT_TRUE(convert::parse("7", u));
    EXPECT_EQ(u, 7u);
}

TEST(ConvertFloat, ParsesAndFormatsShortest) {
    double v = 0;
    EXPECT_TRUE(convert::parse("3.14", v));
    EXPECT_DOUBLE_EQ(v, 3.14);
    EXPECT_FALSE(convert::parse("3.14x", v));

    EXPECT_EQ(convert::formatFloat(3.14), "3.14");
    EXPECT_EQ(convert::formatFloat(0.1), "0.1");
    EXPECT_EQ(convert::formatFloat(2.0), "2");
    EXPECT_EQ(convert::formatFloat(std::numeric_limits<double>::infinity()), "+Inf");
    EXPECT_EQ(convert::formatFloat(std::nan("")), "NaN");
}

TEST(ConvertDuration, ParsesGoSyntax) {
    Duration d{};
    EXPECT_TRUE(convert::parseDuration("300ms", d));
    EXPECT_EQ(d, 300ms);
    EXPECT_TRUE(convert::parseDuration("2h45m", d));
    EXPECT_EQ(d, 2h + 45min);
    EXPECT_TRUE(convert::parseDuration("-1.5h", d));
    EXPECT_EQ(d, -(1h + 30min));
    EXPECT_TRUE(convert::parseDuration("1us", d));
    EXPECT_EQ(d, 1us);
    EXPECT_TRUE(convert::parseDuration("0", d));
    EXPECT_EQ(d, Duration(0));
}

TEST(ConvertDuration, RejectsMalformed) {
    Duration d{};
    EXPECT_FALSE(convert::parseDuration("", d));
    EXPECT_FALSE(convert::parseDuration("10", d));
    EXPECT_FALSE(convert::parseDuration("5x", d));
    EXPECT_FALSE(convert::parseDuration("ms", d));
}

TEST(ConvertDuration, FormatsLikeGo) {
    EXPECT_EQ(convert::formatDuration(Duration(0)), "0s");
    EXPECT_EQ(convert::formatDuration(33ms), "33ms");
    EXPECT_EQ(convert::formatDuration(1500ns), "1.5\xc2\xb5s");
    EXPECT_EQ(convert::formatDuration(90s), "1m30s");
    EXPECT_EQ(convert::formatDuration(1h), "1h0m0s");
    EXPECT_EQ(convert::formatDuration(1500ms), "1.5s");
    EXPECT_EQ(convert::formatDuration(-5s), "-5s");
}

TEST(ConvertTypeName, NamesScalars) {
    EXPECT_EQ(convert::typeName<bool>(), "bool");
    EXPECT_EQ(convert::typeName<int>(), "int");
    EXPECT_EQ(convert::typeName<std::int64_t>(), "int64");
    EXPECT_EQ(convert::typeName<std::uint64_t>(), "uint64");
    EXPECT_EQ(convert::typeName<double>(), "float");
    EXPECT_EQ(convert::typeName<Duration>(), "duration");
}
