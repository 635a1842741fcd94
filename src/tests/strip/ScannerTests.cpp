//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/strip/ScannerTests.cpp
// Purpose: Check span classification for comments, strings and interpolation.
// Key invariants: Top-level spans partition the input; comment markers inside
//                 literal text are never comments.
// Ownership/Lifetime: Each test owns its source text and scanner.
// Links: strip/Scanner.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "strip/Scanner.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace dartstrip::strip;

namespace
{
std::string dump(std::string_view source, ScanOptions options = {})
{
    Scanner scanner(source, options);
    return dumpSpans(source, scanner.scan());
}

std::vector<ScanIssue> issuesOf(std::string_view source)
{
    Scanner scanner(source);
    (void)scanner.scan();
    return scanner.issues();
}
} // namespace

TEST(ScannerTest, SplitsLineCommentFromCode)
{
    EXPECT_EQ(dump("a // c\nb"), R"(code"a " line"// c" code"\nb")");
}

TEST(ScannerTest, DocCommentWinsOverLineComment)
{
    EXPECT_EQ(dump("/// doc\nx"), R"(doc"/// doc" code"\nx")");
    EXPECT_EQ(dump("//// four"), R"(doc"//// four")");
}

TEST(ScannerTest, LineCommentStopsBeforeCarriageReturn)
{
    EXPECT_EQ(dump("a // c\r\nb"), R"(code"a " line"// c" code"\r\nb")");
}

TEST(ScannerTest, BlockCommentsNest)
{
    EXPECT_EQ(dump("/* a /* b */ c */x"), R"(block"/* a /* b */ c */" code"x")");
}

TEST(ScannerTest, UnterminatedBlockCommentEndsAtLineEnd)
{
    EXPECT_EQ(dump("x /* never\ny"), R"(code"x " block"/* never"! code"\ny")");

    const auto issues = issuesOf("x /* never\ny");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, ScanIssueKind::UnterminatedBlockComment);
    EXPECT_EQ(issues[0].offset, 2u);
}

TEST(ScannerTest, UnclosedOpenerBeforeClosedComment)
{
    EXPECT_EQ(dump("/* a\n/* b */ c"), R"(block"/* a"! code"\n" block"/* b */" code" c")");
}

TEST(ScannerTest, OverlappingMarkersPairFromTheOpener)
{
    EXPECT_EQ(dump("/*/ x */y"), R"(block"/*/ x */" code"y")");
    EXPECT_EQ(dump("/*/*/ */ */x"), R"(block"/*/*/ */ */" code"x")");
}

TEST(ScannerTest, ManyUnclosedBlockCommentsStayOnTheirLines)
{
    std::string source;
    for (int i = 0; i < 20000; ++i)
        source += "x = 1; /* stray\n";

    Scanner scanner(source);
    const auto spans = scanner.scan();
    EXPECT_EQ(scanner.issues().size(), 20000u);
    ASSERT_EQ(spans.size(), 40001u);
    EXPECT_EQ(spans[1].kind, SpanKind::BlockComment);
    EXPECT_FALSE(spans[1].terminated);
    EXPECT_EQ(spans[1].text(source), "/* stray");
    EXPECT_EQ(spans[2].text(source), "\nx = 1; ");
    EXPECT_EQ(spans.back().text(source), "\n");
}

TEST(ScannerTest, StringWithInterpolationHole)
{
    EXPECT_EQ(dump("x = 'a${b}';"), R"(code"x = " string'(text"a" hole(code"b")) code";")");
}

TEST(ScannerTest, CommentMarkersInsideStringsAreText)
{
    EXPECT_EQ(dump(R"("http://x/*y*/")"), R"(string"(text"http://x/*y*/"))");
    EXPECT_EQ(dump("'/// no'"), R"(string'(text"/// no"))");
}

TEST(ScannerTest, EscapedQuoteDoesNotCloseString)
{
    EXPECT_EQ(dump(R"('\'' // c)"), R"(string'(text"\\'") code" " line"// c")");
}

TEST(ScannerTest, EscapedDollarIsNotAHole)
{
    EXPECT_EQ(dump(R"('\${x}')"), R"(string'(text"\\${x}"))");
}

TEST(ScannerTest, RawStringIgnoresEscapesButKeepsHoles)
{
    EXPECT_EQ(dump(R"(r'a // b \')"), R"(stringr'(text"a // b \\"))");
    EXPECT_EQ(dump("r'${a /* c */}'"), R"(stringr'(hole(code"a " block"/* c */")))");
}

TEST(ScannerTest, IdentifierEndingInRIsNotARawPrefix)
{
    EXPECT_EQ(dump("bar'x'"), R"(code"bar" string'(text"x"))");
}

TEST(ScannerTest, TripleQuotedStringSpansLines)
{
    EXPECT_EQ(dump("'''x'y\n// z'''"), R"(string'''(text"x'y\n// z"))");
    EXPECT_EQ(dump("\"\"\"a\"\"b\"\"\""), R"(string"""(text"a\"\"b"))");
}

TEST(ScannerTest, HoleCountsBraces)
{
    EXPECT_EQ(dump("'${ {1: 2}[1] }'"), R"(string'(hole(code" {1: 2}[1] ")))");
}

TEST(ScannerTest, NestedStringsAndHoles)
{
    EXPECT_EQ(dump(R"('${"${1 /* c */}"}')"),
              R"(string'(hole(string"(hole(code"1 " block"/* c */")))))");
}

TEST(ScannerTest, StrayClosingBraceInStringIsText)
{
    EXPECT_EQ(dump("'a}b'"), R"(string'(text"a}b"))");
}

TEST(ScannerTest, ColonGuardIsConfigurable)
{
    EXPECT_EQ(dump("a://b"), R"(code"a://b")");

    ScanOptions off;
    off.colonGuard = false;
    EXPECT_EQ(dump("a://b", off), R"(code"a:" line"//b")");
}

TEST(ScannerTest, ColonGuardDoesNotHideBlockComment)
{
    EXPECT_EQ(dump("a:/* c */b"), R"(code"a:" block"/* c */" code"b")");
}

TEST(ScannerTest, UnterminatedStringRunsToEndOfFile)
{
    EXPECT_EQ(dump("'abc // d"), R"(string'(text"abc // d")!)");

    const auto issues = issuesOf("x = 'abc");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, ScanIssueKind::UnterminatedString);
    EXPECT_EQ(issues[0].offset, 4u);
}

TEST(ScannerTest, UnterminatedHoleStillScansCode)
{
    EXPECT_EQ(dump("'${a // c"), R"(string'(hole(code"a " line"// c")!)!)");

    const auto issues = issuesOf("'${a");
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].kind, ScanIssueKind::UnterminatedString);
    EXPECT_EQ(issues[0].offset, 0u);
    EXPECT_EQ(issues[1].kind, ScanIssueKind::UnterminatedInterpolation);
    EXPECT_EQ(issues[1].offset, 1u);
}

TEST(ScannerTest, TopLevelSpansPartitionSource)
{
    const std::vector<std::string> inputs = {
        "",
        "plain code",
        "a /* b */ c // d\n'e${f /* g */}h' r\"i\" '''j\n'''",
        "'unterminated ${ hole",
        "/* open",
    };
    for (const std::string &input : inputs)
    {
        Scanner scanner(input);
        const auto spans = scanner.scan();
        std::size_t expected = 0;
        for (const Span &span : spans)
        {
            EXPECT_EQ(span.begin, expected) << input;
            EXPECT_LT(span.begin, span.end) << input;
            expected = span.end;
        }
        EXPECT_EQ(expected, input.size()) << input;
    }
}

TEST(ScannerTest, MultiByteTextPassesThrough)
{
    EXPECT_EQ(dump("é // ü\n'ß'"), R"(code"é " line"// ü" code"\n" string'(text"ß"))");
}
