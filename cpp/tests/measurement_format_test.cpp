#include <gtest/gtest.h>
#include "floorplan/core/string_utils.h"
#include "floorplan/measure/measurement_format.h"

#include <limits>

using namespace floorplan;

TEST(MeasurementFormatTest, FormatsFeetInchesAndFractions) {
    EXPECT_EQ(formatEighths(604), "6'3½\"");
    EXPECT_EQ(formatEighths(576), "6'");
    EXPECT_EQ(formatEighths(4), "½\"");
    EXPECT_EQ(formatEighths(0), "0\"");
    EXPECT_EQ(formatEighths(8), "1\"");
    EXPECT_EQ(formatEighths(86), "10¾\"");
    EXPECT_EQ(formatEighths(97), "1'⅛\"");
}

TEST(MeasurementFormatTest, NegativeValuesKeepSign) {
    EXPECT_EQ(formatEighths(-604), "-6'3½\"");
    EXPECT_EQ(formatEighths(-4), "-½\"");
}

TEST(MeasurementFormatTest, HandlesIntRange) {
    EXPECT_EQ(formatEighths(std::numeric_limits<int>::min()), "-22369621'4\"");
    EXPECT_EQ(formatEighths(std::numeric_limits<int>::max()), "22369621'3⅞\"");
}

TEST(MeasurementParseTest, FeetAndInches) {
    EXPECT_EQ(parseToEighths("6'3\""), 600);
    EXPECT_EQ(parseToEighths("6' 3 1/2\""), 604);
    EXPECT_EQ(parseToEighths("6'3½\""), 604);
    EXPECT_EQ(parseToEighths("6'"), 576);
    EXPECT_EQ(parseToEighths("6′3″"), 600);
    EXPECT_EQ(parseToEighths("6’3”"), 600);
}

TEST(MeasurementParseTest, InchesOnly) {
    EXPECT_EQ(parseToEighths("75\""), 600);
    EXPECT_EQ(parseToEighths(" 75 "), 600);
    EXPECT_EQ(parseToEighths("3/4"), 6);
    EXPECT_EQ(parseToEighths("12.5"), 100);
    EXPECT_EQ(parseToEighths("3 1/2"), 28);
    EXPECT_EQ(parseToEighths("½"), 4);
    EXPECT_EQ(parseToEighths("0"), 0);
}

TEST(MeasurementParseTest, RejectsMalformedInput) {
    EXPECT_FALSE(parseToEighths("").has_value());
    EXPECT_FALSE(parseToEighths("   ").has_value());
    EXPECT_FALSE(parseToEighths("abc").has_value());
    EXPECT_FALSE(parseToEighths("1/0").has_value());
    EXPECT_FALSE(parseToEighths("6 ft").has_value());
    EXPECT_FALSE(parseToEighths("6'3\"x").has_value());
    EXPECT_FALSE(parseToEighths("\"").has_value());
    EXPECT_FALSE(parseToEighths("6'\"").has_value());
    EXPECT_FALSE(parseToEighths("12.").has_value());
    EXPECT_FALSE(parseToEighths("1234567890").has_value());
}

TEST(MeasurementParseTest, RejectsValuesBeyondIntRange) {
    EXPECT_FALSE(parseToEighths("999999999'").has_value());
    EXPECT_FALSE(parseToEighths("268435456\"").has_value());
    EXPECT_EQ(parseToEighths("268435455\""), 2147483640);
}

TEST(StringUtilsTest, DecodesFourByteSequences) {
    std::uint32_t len = 0;
    EXPECT_EQ(decodeUtf8Codepoint("\xF0\x9F\x98\x80", 0, len), 0x1F600u);
    EXPECT_EQ(len, 4u);
    EXPECT_EQ(decodeUtf8Codepoint("\xF0\x9F\x98", 0, len), 0xFFFDu);
    EXPECT_EQ(len, 1u);
    EXPECT_EQ(decodeUtf8Codepoint("½", 0, len), 0x00BDu);
    EXPECT_EQ(len, 2u);
    EXPECT_FALSE(parseToEighths("6'\xF0\x9F\x98\x80").has_value());
}

TEST(MeasurementParseTest, ParsesWhatFormatProduces) {
    for (int eighths : { 0, 1, 4, 7, 8, 95, 96, 97, 100, 576, 604, 1000 }) {
        const auto parsed = parseToEighths(formatEighths(eighths));
        ASSERT_TRUE(parsed.has_value()) << formatEighths(eighths);
        EXPECT_EQ(*parsed, eighths) << formatEighths(eighths);
    }
}

TEST(MeasurementParseTest, InchConversions) {
    EXPECT_EQ(inchesToEighths(75.5f), 604);
    EXPECT_EQ(inchesToEighths(0.06f), 0);
    EXPECT_EQ(inchesToEighths(0.07f), 1);
    EXPECT_FLOAT_EQ(eighthsToInches(604), 75.5f);
}
