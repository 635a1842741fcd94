//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/strip/ProcessTests.cpp
// Purpose: End-to-end checks of process() on realistic Dart snippets, plus
//          the idempotence and preservation properties.
// Key invariants: process() is a fixed point after one application and never
//                 alters comment-free text.
// Ownership/Lifetime: Tests own their inputs and results.
// Links: include/dartstrip/strip/Process.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "dartstrip/strip/Process.hpp"

#include <string>
#include <vector>

using namespace dartstrip::strip;

namespace
{
const std::vector<std::string> &corpus()
{
    static const std::vector<std::string> kInputs = {
        "code1\n// c\ncode2",
        "/* a /* b */ c */x",
        "'${ // c\n f() }'",
        "r'a // b /* c */'",
        "/* never closed\ncode",
        "void main() {\n  // c\n  print('Hi'); // d\n}\n",
        "a;\n\n// c\n\n\nb;\n",
        "foo()\n  // c\n  .bar()\n\n  /* d */\n  .baz();\n",
        "x = '''\n// keep\n''' // drop\n;",
        "s = '${a /* c */ + \"${b // d\n}\"}';\n",
        "'${ {1: 2} /* c */ }' // e\n",
        "x = 'unterminated // still text\n",
        "  /// doc\r\n  int a; // b\r\n\r\n  // c\r\n  int d;\r\n",
        "a /* x */ /* y */ b",
        "x = r/**/'a\\' // y';\n",
        "a/**/r'\\'; b = ' // c';\n",
        "",
        "\n\n",
    };
    return kInputs;
}
} // namespace

TEST(ProcessTest, RemovesWholeLineComment)
{
    const ProcessResult result = process("code1\n// c\ncode2");
    EXPECT_EQ(result.outputText, "code1\ncode2");
    EXPECT_TRUE(result.changed);
    EXPECT_TRUE(result.issues.empty());
}

TEST(ProcessTest, RemovesNestedBlockComment)
{
    EXPECT_EQ(process("/* a /* b */ c */x").outputText, "x");
}

TEST(ProcessTest, StripsCommentInsideInterpolation)
{
    EXPECT_EQ(process("'${ // c\n f() }'").outputText, "'${\n f()\n}'");
}

TEST(ProcessTest, RawStringIsUnchanged)
{
    const ProcessResult result = process("r'a // b /* c */'");
    EXPECT_EQ(result.outputText, "r'a // b /* c */'");
    EXPECT_FALSE(result.changed);
}

TEST(ProcessTest, UnterminatedBlockCommentIsReported)
{
    const ProcessResult result = process("/* never closed\ncode");
    EXPECT_EQ(result.outputText, "code");
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, ScanIssueKind::UnterminatedBlockComment);
    EXPECT_EQ(result.issues[0].offset, 0u);
}

TEST(ProcessTest, NonLatinCommentsAreRemovedCleanly)
{
    EXPECT_EQ(process("var s = 'héllo'; // コメント 🎉\n/* 注释 */\nvar t = '😀';\n").outputText,
              "var s = 'héllo';\nvar t = '😀';\n");
}

TEST(ProcessTest, FunctionWithComments)
{
    const std::string source = "void main() {\n"
                               "  // This is a comment\n"
                               "  print('Hello'); // End of line comment\n"
                               "}";
    EXPECT_EQ(process(source).outputText, "void main() {\n  print('Hello');\n}");
}

TEST(ProcessTest, MultiLineBlockCommentInBody)
{
    const std::string source = "void main() {\n"
                               "  /* Outer comment\n"
                               "     /* Nested comment */\n"
                               "     Still in outer comment */\n"
                               "  print('Hello');\n"
                               "}";
    EXPECT_EQ(process(source).outputText, "void main() {\n  print('Hello');\n}");
}

TEST(ProcessTest, CommentLikeStringsArePreserved)
{
    const std::string source = "void main() {\n"
                               "  print('http://example.com');\n"
                               "  print('Contains // in string');\n"
                               "  print('Contains /* in string */');\n"
                               "  print(\"\"\"Multi-line string with //\n"
                               "and /* comment-like */ content\"\"\");\n"
                               "  final raw = r'Contains // and /* */';\n"
                               "}";
    const ProcessResult result = process(source);
    EXPECT_EQ(result.outputText, source);
    EXPECT_FALSE(result.changed);
}

TEST(ProcessTest, WidgetTreeKeepsStructure)
{
    const std::string source = "class UserWidget extends StatelessWidget {\n"
                               "  // User data\n"
                               "  final String name;\n"
                               "  final int age;    // User age\n"
                               "\n"
                               "  Widget build(BuildContext context) {\n"
                               "    return Column(\n"
                               "      children: [\n"
                               "        /* Header section */\n"
                               "        Text(name),\n"
                               "\n"
                               "        /// Profile section\n"
                               "        Text('Age: \\$age'),\n"
                               "      ],\n"
                               "    );\n"
                               "  }\n"
                               "}\n";
    const std::string expected = "class UserWidget extends StatelessWidget {\n"
                                 "  final String name;\n"
                                 "  final int age;\n"
                                 "\n"
                                 "  Widget build(BuildContext context) {\n"
                                 "    return Column(\n"
                                 "      children: [\n"
                                 "        Text(name),\n"
                                 "\n"
                                 "        Text('Age: \\$age'),\n"
                                 "      ],\n"
                                 "    );\n"
                                 "  }\n"
                                 "}\n";
    EXPECT_EQ(process(source).outputText, expected);
}

TEST(ProcessTest, ColonGuardKeepsSchemeLikeCode)
{
    EXPECT_FALSE(process("x = a://b\n").changed);

    ScanOptions options;
    options.colonGuard = false;
    EXPECT_EQ(process("x = a://b\n", options).outputText, "x = a:\n");
}

TEST(ProcessTest, RawPrefixSurvivesCommentRemoval)
{
    EXPECT_EQ(process("x = r/**/'a\\' // y';\n").outputText, "x = r 'a\\' // y';\n");
    EXPECT_EQ(process("a/**/r'\\'; b = ' // c';\n").outputText, "a r'\\'; b = ' // c';\n");
}

TEST(ProcessTest, SecondPassChangesNothing)
{
    for (const std::string &input : corpus())
    {
        const std::string once = process(input).outputText;
        const ProcessResult twice = process(once);
        EXPECT_EQ(twice.outputText, once) << "input: " << input;
        EXPECT_FALSE(twice.changed) << "input: " << input;
    }
}

TEST(ProcessTest, CommentFreeTextIsUnchanged)
{
    const std::vector<std::string> inputs = {
        "",
        "\n",
        "int a = 1;\n\n\nint b = 2;",
        "  indented;   \n\ttabbed;\t\n",
        "a\r\nb\r\n",
        "x = 'it''s' + \"//\" + r'/*' + '''\n\n''';",
        "y = '${ {'k': \"/* v */\"}['k'] }';\n",
        "z = 8 / 2 * 3;\n",
        "ünïcödé = '字';\n",
    };
    for (const std::string &input : inputs)
    {
        const ProcessResult result = process(input);
        EXPECT_EQ(result.outputText, input);
        EXPECT_FALSE(result.changed);
    }
}

TEST(ProcessTest, StringBodiesSurviveByteForByte)
{
    const std::string body = "// a /* b */ /// c";
    const ProcessResult result = process("// lead\nx = '" + body + "'; /* tail */\n");
    EXPECT_EQ(result.outputText, "x = '" + body + "';\n");
}

TEST(ProcessTest, PositionOfCountsScalarValues)
{
    const std::string text = "ab\nc\xE2\x82\xAC" "d";
    const TextPosition pos = positionOf(text, 7);
    EXPECT_EQ(pos.line, 2u);
    EXPECT_EQ(pos.column, 3u);

    const TextPosition start = positionOf(text, 0);
    EXPECT_EQ(start.line, 1u);
    EXPECT_EQ(start.column, 1u);
}

TEST(ProcessTest, ScanIssueNames)
{
    EXPECT_STREQ(scanIssueToString(ScanIssueKind::UnterminatedBlockComment),
                 "unterminated block comment");
    EXPECT_STREQ(scanIssueToString(ScanIssueKind::UnterminatedString),
                 "unterminated string literal");
    EXPECT_STREQ(scanIssueToString(ScanIssueKind::UnterminatedInterpolation),
                 "unterminated string interpolation");
}
