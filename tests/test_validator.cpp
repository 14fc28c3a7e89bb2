#include <limits>

#include <gtest/gtest.h>

#include "errorhandling.h"
#include "validator.h"

TEST(ValidatorTest, RoNumber_Format) {
    EXPECT_TRUE(Validator::isValidRoNumber("1001"));
    EXPECT_TRUE(Validator::isValidRoNumber("RO-1001"));
    EXPECT_TRUE(Validator::isValidRoNumber("  RO-1001 "));
    EXPECT_FALSE(Validator::isValidRoNumber(""));
    EXPECT_FALSE(Validator::isValidRoNumber("RO 1001"));
    EXPECT_FALSE(Validator::isValidRoNumber("RO--1001"));
    EXPECT_FALSE(Validator::isValidRoNumber("-1001"));
    EXPECT_FALSE(Validator::isValidRoNumber("RO-1001/2"));
}

TEST(ValidatorTest, RequireRoNumber_TrimsOrThrows) {
    EXPECT_EQ(Validator::requireRoNumber(" RO-7 "), "RO-7");
    EXPECT_THROW(Validator::requireRoNumber("   "), ValidationException);
    EXPECT_THROW(Validator::requireRoNumber("RO_7"), ValidationException);
}

TEST(ValidatorTest, ParseHours_BlankIsZero) {
    bool ok = false;
    EXPECT_DOUBLE_EQ(Validator::parseHours("", &ok), 0.0);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(Validator::parseHours("   ", &ok), 0.0);
    EXPECT_TRUE(ok);
}

TEST(ValidatorTest, ParseHours_Numbers) {
    bool ok = false;
    EXPECT_DOUBLE_EQ(Validator::parseHours("12.5", &ok), 12.5);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(Validator::parseHours(" 3 ", &ok), 3.0);
    EXPECT_TRUE(ok);
}

TEST(ValidatorTest, ParseHours_RejectsJunkAndNegatives) {
    bool ok = true;
    Validator::parseHours("abc", &ok);
    EXPECT_FALSE(ok);
    ok = true;
    Validator::parseHours("-1", &ok);
    EXPECT_FALSE(ok);
    ok = true;
    Validator::parseHours("inf", &ok);
    EXPECT_FALSE(ok);
}

TEST(ValidatorTest, RequireHours_ThrowsWithField) {
    EXPECT_DOUBLE_EQ(Validator::requireHours("8", "body_hours"), 8.0);
    try {
        Validator::requireHours("eight", "body_hours");
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.field(), "body_hours");
    }
}

TEST(ValidatorTest, Hours_AndPercentRanges) {
    EXPECT_TRUE(Validator::isValidHours(0.0));
    EXPECT_FALSE(Validator::isValidHours(-0.5));
    EXPECT_FALSE(Validator::isValidHours(std::numeric_limits<double>::quiet_NaN()));

    EXPECT_TRUE(Validator::isValidPercent(0.0));
    EXPECT_TRUE(Validator::isValidPercent(100.0));
    EXPECT_FALSE(Validator::isValidPercent(100.5));
    EXPECT_THROW(Validator::requirePercent(-1.0, "percent"), ValidationException);
}

TEST(ValidatorTest, Dates) {
    EXPECT_TRUE(Validator::isValidDate("2026-03-01"));
    EXPECT_FALSE(Validator::isValidDate("2026-02-30"));
    EXPECT_FALSE(Validator::isValidDate("03/01/2026"));
    EXPECT_TRUE(Validator::isValidDateTime("2026-03-01 08:30:00"));
}

TEST(ValidatorTest, StagesAndStatuses_CaseSensitive) {
    const QStringList stages{"Body", "Paint"};
    EXPECT_TRUE(Validator::isKnownStage("Paint", stages));
    EXPECT_FALSE(Validator::isKnownStage("paint", stages));
    EXPECT_THROW(Validator::requireStage("Detail", stages), ValidationException);
    EXPECT_NO_THROW(Validator::requireStatus("open", QStringList{"open", "closed"}));
    EXPECT_THROW(Validator::requireStatus("OPEN", QStringList{"open", "closed"}), ValidationException);
}
