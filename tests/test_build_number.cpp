#include <gtest/gtest.h>

#include "update/build_number.hpp"

#include <stdexcept>

namespace extupd {

namespace {

BuildNumber B(const char* text) {
    auto parsed = BuildNumber::Parse(text);
    if (!parsed) throw std::runtime_error(parsed.error());
    return *parsed;
}

} // namespace

TEST(BuildNumberTest, ParsesProductCodeAndComponents) {
    auto b = BuildNumber::Parse("IC-141.1234.5");
    ASSERT_TRUE(b.has_value()) << b.error();
    EXPECT_EQ(b->ProductCode(), "IC");
    EXPECT_EQ(b->Components(), (std::vector<int>{141, 1234, 5}));
    EXPECT_EQ(b->AsString(), "IC-141.1234.5");
}

TEST(BuildNumberTest, ParsesWildcards) {
    EXPECT_EQ(B("141.*").Components().back(), BuildNumber::kWildcard);
    EXPECT_EQ(B("141.SNAPSHOT").Components().back(), BuildNumber::kWildcard);
    EXPECT_EQ(B("141.SNAPSHOT").AsString(), "141.*");
}

TEST(BuildNumberTest, RejectsGarbage) {
    EXPECT_FALSE(BuildNumber::Parse("").has_value());
    EXPECT_FALSE(BuildNumber::Parse("   ").has_value());
    EXPECT_FALSE(BuildNumber::Parse("141.x").has_value());
    EXPECT_FALSE(BuildNumber::Parse("141..2").has_value());
    EXPECT_FALSE(BuildNumber::Parse("99999999999").has_value());
}

TEST(BuildNumberTest, Ordering) {
    EXPECT_LT(B("141.1").CompareTo(B("141.2")), 0);
    EXPECT_GT(B("142").CompareTo(B("141.999")), 0);
    EXPECT_EQ(B("141").CompareTo(B("141.0")), 0);
    EXPECT_EQ(B("IC-141.1").CompareTo(B("IU-141.1")), 0);
}

TEST(BuildNumberTest, WildcardCoversRemainder) {
    EXPECT_GT(B("141.*").CompareTo(B("141.99999")), 0);
    EXPECT_LT(B("142.1").CompareTo(B("142.*")), 0);
    EXPECT_EQ(B("141.*").CompareTo(B("141.SNAPSHOT")), 0);
    EXPECT_LT(B("141.*").CompareTo(B("142.0")), 0);
}

} // namespace extupd
