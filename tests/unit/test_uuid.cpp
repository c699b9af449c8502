#include <gtest/gtest.h>
#include "todo/uuid.hpp"
#include <cctype>
#include <set>
#include <string>

using namespace todo;


TEST(UuidTest, GeneratedIsVersion4) {
    Uuid id = Uuid::generate();
    EXPECT_EQ(id.version(), 4);
    EXPECT_EQ(id.bytes()[8] & 0xC0, 0x80); // RFC 4122 variant
    EXPECT_FALSE(id.is_nil());
}

TEST(UuidTest, GeneratedAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 10000; i++)
        seen.insert(Uuid::generate().to_string());
    EXPECT_EQ(seen.size(), 10000);
}

TEST(UuidTest, TextFormIsLowercaseHyphenated) {
    std::string text = Uuid::generate().to_string();
    ASSERT_EQ(text.size(), 36);
    for (size_t i = 0; i < text.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            EXPECT_EQ(text[i], '-');
        } else {
            EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(text[i])));
            EXPECT_FALSE(std::isupper(static_cast<unsigned char>(text[i])));
        }
    }
}

TEST(UuidTest, ParseHyphenated) {
    auto id = Uuid::parse("67e55044-10b1-426f-9247-bb680e5fe0c8");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->to_string(), "67e55044-10b1-426f-9247-bb680e5fe0c8");
    EXPECT_EQ(id->bytes()[0], 0x67);
    EXPECT_EQ(id->bytes()[15], 0xc8);
}

TEST(UuidTest, ParseIsCaseInsensitive) {
    auto upper = Uuid::parse("67E55044-10B1-426F-9247-BB680E5FE0C8");
    auto lower = Uuid::parse("67e55044-10b1-426f-9247-bb680e5fe0c8");
    ASSERT_TRUE(upper && lower);
    EXPECT_EQ(*upper, *lower);
}

TEST(UuidTest, ParseSimpleForm) {
    auto simple = Uuid::parse("67e5504410b1426f9247bb680e5fe0c8");
    ASSERT_TRUE(simple.has_value());
    EXPECT_EQ(simple->to_string(), "67e55044-10b1-426f-9247-bb680e5fe0c8");
}

TEST(UuidTest, ParseRejectsGarbage) {
    EXPECT_FALSE(Uuid::parse(""));
    EXPECT_FALSE(Uuid::parse("not-a-uuid"));
    EXPECT_FALSE(Uuid::parse("67e55044-10b1-426f-9247-bb680e5fe0c"));   // too short
    EXPECT_FALSE(Uuid::parse("67e55044-10b1-426f-9247-bb680e5fe0c8a")); // too long
    EXPECT_FALSE(Uuid::parse("67e55044x10b1-426f-9247-bb680e5fe0c8"));  // bad separator
    EXPECT_FALSE(Uuid::parse("g7e55044-10b1-426f-9247-bb680e5fe0c8"));  // bad digit
}

TEST(UuidTest, RoundTripThroughText) {
    Uuid id = Uuid::generate();
    auto parsed = Uuid::parse(id.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}
