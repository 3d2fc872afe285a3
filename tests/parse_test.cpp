#include <string>
#include <variant>

#include <gtest/gtest.h>

#include "parse.hpp"
#include "test_fixtures.hpp"

using nflz::FilenameParser;
using nflz::ParsedFile;
using nflz::ParseError;
using nflz::ParseErrorKind;

TEST(FilenameParser, Parse_SingleGroup)
{
    ParsedFile parsed = MustParse("paris (100).png");

    EXPECT_EQ(parsed.original_filename(), "paris (100).png");
    EXPECT_EQ(parsed.number_group_span().begin, 7u);
    EXPECT_EQ(parsed.number_group_span().end, 10u);
    EXPECT_EQ(parsed.number_value(), 100u);
    EXPECT_EQ(parsed.prefix(), "paris (");
    EXPECT_EQ(parsed.suffix(), ").png");
    EXPECT_EQ(parsed.digits(), "100");
}

TEST(FilenameParser, Parse_GroupAtStart)
{
    ParsedFile parsed = MustParse("(100) foobar.png");

    EXPECT_EQ(parsed.prefix(), "(");
    EXPECT_EQ(parsed.suffix(), ") foobar.png");
    EXPECT_EQ(parsed.number_value(), 100u);
}

TEST(FilenameParser, Parse_PrefixDigitsSuffixRebuildFilename)
{
    for (const std::string filename : {"img (1).jpg", "(0)", "a(007)b", "x (42) y.tar.gz", "img (1) 100).jpg"})
    {
        ParsedFile parsed = MustParse(filename);
        EXPECT_EQ(parsed.prefix() + parsed.digits() + parsed.suffix(), filename);
        EXPECT_EQ(parsed.prefix().back(), '(');
        EXPECT_EQ(parsed.suffix().front(), ')');
    }
}

TEST(FilenameParser, Parse_UnbalancedParenthesesIgnored)
{
    // "100)" 没有左括号，不算数字组
    ParsedFile parsed = MustParse("img (1) 100)");

    EXPECT_EQ(parsed.number_group_span().begin, 5u);
    EXPECT_EQ(parsed.number_group_span().end, 6u);
    EXPECT_EQ(parsed.number_value(), 1u);
}

TEST(FilenameParser, Parse_LeadingZeroesAndZero)
{
    EXPECT_EQ(MustParse("img (007).jpg").number_value(), 7u);
    EXPECT_EQ(MustParse("img (0).jpg").number_value(), 0u);
}

TEST(FilenameParser, Parse_UsesLastPathComponent)
{
    ParsedFile parsed = MustParse(fs::path("some (1) dir") / "paris (3).jpg");

    EXPECT_EQ(parsed.original_filename(), "paris (3).jpg");
    EXPECT_EQ(parsed.path(), fs::path("some (1) dir") / "paris (3).jpg");
    EXPECT_EQ(parsed.number_value(), 3u);
}

TEST(FilenameParser, Parse_NoNumberGroup)
{
    FilenameParser parser;
    for (const std::string filename : {"paris.jpg", "paris ().jpg", "paris (a1).jpg", "paris (-1).jpg", "paris 1.jpg"})
    {
        nflz::ParseResult result = parser.Parse(filename);
        ASSERT_TRUE(std::holds_alternative<ParseError>(result)) << filename;
        EXPECT_EQ(std::get<ParseError>(result).kind, ParseErrorKind::NoNumberGroup);
        EXPECT_EQ(std::get<ParseError>(result).filename, filename);
    }
}

TEST(FilenameParser, Parse_MultipleNumberGroups)
{
    FilenameParser parser;
    for (const std::string filename : {"img (1) (100)", "invalid (100) (19231).jpg", "(1)(2)"})
    {
        nflz::ParseResult result = parser.Parse(filename);
        ASSERT_TRUE(std::holds_alternative<ParseError>(result)) << filename;
        EXPECT_EQ(std::get<ParseError>(result).kind, ParseErrorKind::MultipleNumberGroups);
    }
}

TEST(FilenameParser, Parse_NumberTooLarge)
{
    nflz::ParseResult result = FilenameParser().Parse("img (18446744073709551616).jpg");

    ASSERT_TRUE(std::holds_alternative<ParseError>(result));
    const auto &error = std::get<ParseError>(result);
    EXPECT_EQ(error.kind, ParseErrorKind::InvalidNumber);
    EXPECT_EQ(error.text, "18446744073709551616");
    EXPECT_FALSE(error.Message().empty());
}

TEST(FilenameParser, Parse_LargestNumber)
{
    EXPECT_EQ(MustParse("img (18446744073709551615).jpg").number_value(), 18446744073709551615ull);
}

TEST(ParsedFile, EqualityByFilenameOrderingByNumber)
{
    ParsedFile p1 = MustParse("img (1).png");
    ParsedFile p1_same = MustParse("img (1).png");
    ParsedFile p2 = MustParse("img (2).png");
    ParsedFile p10 = MustParse("img (10).png");

    EXPECT_EQ(p1, p1_same);
    EXPECT_NE(p1, p2);
    EXPECT_TRUE(p1 < p2);
    EXPECT_TRUE(p2 < p10);
    EXPECT_FALSE(p10 < p2);
    EXPECT_FALSE(p1 < p1_same);
}
