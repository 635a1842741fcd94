//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/strip/StripperTests.cpp
// Purpose: Verify comment deletion, whitespace tidying at deletion sites and
//          interpolation hole re-layout.
// Key invariants: Line terminators after comments survive; string bodies are
//                 untouched.
// Ownership/Lifetime: Tests own their inputs and results.
// Links: strip/Stripper.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "strip/Scanner.hpp"
#include "strip/Stripper.hpp"

#include <string>
#include <string_view>

using namespace dartstrip::strip;

namespace
{
StrippedText run(std::string_view source)
{
    Scanner scanner(source);
    const auto spans = scanner.scan();
    return strip(source, spans);
}
} // namespace

TEST(StripperTest, KeepsNewlineAfterLineComment)
{
    const StrippedText out = run("a(); // c\nb();");
    EXPECT_EQ(out.text, "a();\nb();");
    ASSERT_EQ(out.lines.size(), 2u);
    EXPECT_TRUE(out.lines[0].hadComment);
    EXPECT_FALSE(out.lines[1].hadComment);
}

TEST(StripperTest, CommentOnlyLineBecomesEmpty)
{
    const StrippedText out = run("a\n    // c\nb");
    EXPECT_EQ(out.text, "a\n\nb");
    ASSERT_EQ(out.lines.size(), 3u);
    EXPECT_TRUE(out.lines[1].hadComment);
    EXPECT_EQ(out.line(1), "");
}

TEST(StripperTest, LeadingBlockCommentKeepsIndentation)
{
    EXPECT_EQ(run("  /* c */ x();").text, "  x();");
}

TEST(StripperTest, InlineBlockCommentLeavesOneSeparator)
{
    EXPECT_EQ(run("a /* c */ b").text, "a b");
    EXPECT_EQ(run("a/* c */b").text, "ab");
    EXPECT_EQ(run("f(a, /* c */ b)").text, "f(a, b)");
}

TEST(StripperTest, MultiLineBlockCommentCollapsesToOneLine)
{
    const StrippedText out = run("x();\n  /* a\n     b */\ny();");
    EXPECT_EQ(out.text, "x();\n\ny();");
    EXPECT_TRUE(out.lines[1].hadComment);
}

TEST(StripperTest, CarriageReturnSurvives)
{
    EXPECT_EQ(run("a; // c\r\nb;\r\n").text, "a;\r\nb;\r\n");
}

TEST(StripperTest, StringContentIsCopiedVerbatim)
{
    const std::string source = "x = '''\n// not  \n'''; // gone";
    const StrippedText out = run(source);
    EXPECT_EQ(out.text, "x = '''\n// not  \n''';");
    ASSERT_EQ(out.lines.size(), 3u);
    EXPECT_FALSE(out.lines[0].startsInString);
    EXPECT_TRUE(out.lines[1].startsInString);
    EXPECT_TRUE(out.lines[2].startsInString);
}

TEST(StripperTest, JoinedRawPrefixKeepsSeparator)
{
    EXPECT_EQ(run("x = r/**/'a'").text, "x = r 'a'");
    EXPECT_EQ(run("a/**/r'b'").text, "a r'b'");
    EXPECT_EQ(run("'${r/**/'a'}'").text, "'${r 'a'}'");

    EXPECT_EQ(run("xr/**/'a'").text, "xr'a'");
    EXPECT_EQ(run("x/**/'a'").text, "x'a'");
}

TEST(StripperTest, EmptyBlockCommentInHoleLeavesEmptyHole)
{
    EXPECT_EQ(run("'${/**/}'").text, "'${}'");
}

TEST(StripperTest, SingleLineHoleIsTrimmed)
{
    EXPECT_EQ(run("'${ a /* c */ }'").text, "'${a}'");
}

TEST(StripperTest, MultiLineHoleClosesOnOwnLine)
{
    EXPECT_EQ(run("'${ // c\n f() }'").text, "'${\n f()\n}'");
}

TEST(StripperTest, HoleCloserTakesOpenerIndentation)
{
    EXPECT_EQ(run("  s = '${a // c\n    + b}';").text, "  s = '${a\n    + b\n  }';");
}

TEST(StripperTest, HoleWithoutCommentIsUntouched)
{
    const std::string source = "'${ a\n   + b }'";
    EXPECT_EQ(run(source).text, source);
}

TEST(StripperTest, LinesInsideHoleAreMarkedAsInString)
{
    const StrippedText out = run("'${ // c\n f() }'\nx");
    ASSERT_EQ(out.lines.size(), 4u);
    EXPECT_TRUE(out.lines[1].startsInString);
    EXPECT_TRUE(out.lines[2].startsInString);
    EXPECT_FALSE(out.lines[3].startsInString);
}

TEST(StripperTest, CommentsInNestedHolesAreRemoved)
{
    EXPECT_EQ(run("'${\"${1 /* c */}\"}'").text, "'${\"${1}\"}'");
}

TEST(StripperTest, UnicodeAroundCommentsIsPreserved)
{
    EXPECT_EQ(run("var s = 'héllo'; // コメント 🎉\nvar t = 1; /* 注释 */\n").text,
              "var s = 'héllo';\nvar t = 1;\n");
}
