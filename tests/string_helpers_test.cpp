#include <gtest/gtest.h>

#include "string_helpers.hpp"

using namespace std::literals;

TEST(StringHelpers, BeginsWith)
{
   EXPECT_TRUE(begins_with("chunk001"sv, "chunk"sv));
   EXPECT_TRUE(begins_with("chunk001"s, "chunk"sv));
   EXPECT_FALSE(begins_with("chu"sv, "chunk"sv));
}

TEST(StringHelpers, TrimWhitespace)
{
   EXPECT_EQ(trim_whitespace("  /tmp/file.bin \r\n"sv), "/tmp/file.bin"sv);
   EXPECT_EQ(trim_whitespace("\t"sv), ""sv);
   EXPECT_EQ(trim_whitespace("inner space"sv), "inner space"sv);
}

TEST(StringHelpers, ParseUnsigned)
{
   EXPECT_EQ(parse_unsigned("3"sv), std::optional<std::size_t>{3});
   EXPECT_EQ(parse_unsigned("0042"sv), std::optional<std::size_t>{42});
   EXPECT_EQ(parse_unsigned("+3"sv), std::optional<std::size_t>{3});
   EXPECT_FALSE(parse_unsigned(""sv).has_value());
   EXPECT_FALSE(parse_unsigned("+"sv).has_value());
   EXPECT_FALSE(parse_unsigned("++3"sv).has_value());
   EXPECT_FALSE(parse_unsigned("-1"sv).has_value());
   EXPECT_FALSE(parse_unsigned("2x"sv).has_value());
   EXPECT_FALSE(parse_unsigned("two"sv).has_value());
   EXPECT_FALSE(parse_unsigned("99999999999999999999999"sv).has_value());
}
