/*
 * Copyright (C) 2026 The Sieve Authors. All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE SIEVE AUTHORS AND CONTRIBUTORS ``AS IS''
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
 * THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE SIEVE AUTHORS OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF
 * THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "config.h"

#include "RegexTestUtilities.h"
#include "Test.h"
#include <cstring>
#include <regex/RegexCompiler.h>
#include <regex/RegexErrorCode.h>
#include <string>

namespace TestSieveAPI {

using namespace Sieve::Regex;

struct SyntaxErrorCase {
    const char* pattern;
    ErrorCode code;
    unsigned offset;
};

TEST(Sieve_RegexParser, SyntaxErrorCodesAndOffsets)
{
    static const SyntaxErrorCase cases[] = {
        { "(abc", ErrorCode::MissingParentheses, 4 },
        { "((a)", ErrorCode::MissingParentheses, 4 },
        { "abc)", ErrorCode::ParenthesesUnmatched, 3 },
        { "[abc", ErrorCode::CharacterClassUnmatched, 4 },
        { "[]", ErrorCode::CharacterClassUnmatched, 2 },
        { "*a", ErrorCode::QuantifierWithoutAtom, 0 },
        { "a|*", ErrorCode::QuantifierWithoutAtom, 2 },
        { "(+)", ErrorCode::QuantifierWithoutAtom, 1 },
        { "a**", ErrorCode::QuantifierWithoutAtom, 2 },
        { "^*", ErrorCode::QuantifierWithoutAtom, 1 },
        { "\\b+", ErrorCode::QuantifierWithoutAtom, 2 },
        { "{2}", ErrorCode::QuantifierWithoutAtom, 0 },
        { "a{2", ErrorCode::QuantifierIncomplete, 3 },
        { "a{x}", ErrorCode::QuantifierIncomplete, 2 },
        { "a{}", ErrorCode::QuantifierIncomplete, 2 },
        { "a{2,x}", ErrorCode::QuantifierIncomplete, 4 },
        { "a{3,2}", ErrorCode::QuantifierOutOfOrder, 1 },
        { "a{99999999999}", ErrorCode::QuantifierTooLarge, 1 },
        { "[z-a]", ErrorCode::CharacterClassOutOfOrder, 3 },
        { "abc\\", ErrorCode::EscapeUnterminated, 3 },
        { "(a)\\1", ErrorCode::BackReferenceUnsupported, 3 },
        { "(?=a)", ErrorCode::ParenthesesTypeInvalid, 2 },
        { "(?", ErrorCode::ParenthesesTypeInvalid, 2 },
        { "ab\xFF" "cd", ErrorCode::InvalidEncoding, 2 },
    };

    for (const auto& testCase : cases) {
        SCOPED_TRACE(testCase.pattern);
        SyntaxError error = syntaxErrorFor(testCase.pattern);
        EXPECT_TRUE(error.hasError());
        EXPECT_STRONG_ENUM_EQ(testCase.code, error.code);
        EXPECT_EQ(testCase.offset, error.offset);
    }
}

TEST(Sieve_RegexParser, SyntaxErrorOffsetsAreByteOffsets)
{
    // U+00E9 takes two bytes.
    SyntaxError error = syntaxErrorFor("\xC3\xA9(");
    EXPECT_STRONG_ENUM_EQ(ErrorCode::MissingParentheses, error.code);
    EXPECT_EQ(3u, error.offset);

    error = syntaxErrorFor("\xC3\xA9{2,1}");
    EXPECT_STRONG_ENUM_EQ(ErrorCode::QuantifierOutOfOrder, error.code);
    EXPECT_EQ(2u, error.offset);

    error = syntaxErrorFor("\xC3\xA9\xE2\x82\xAC)");
    EXPECT_STRONG_ENUM_EQ(ErrorCode::ParenthesesUnmatched, error.code);
    EXPECT_EQ(5u, error.offset);
}

TEST(Sieve_RegexParser, ErrorMessages)
{
    EXPECT_NULL(errorMessage(ErrorCode::NoError));
    EXPECT_FALSE(hasError(ErrorCode::NoError));

    for (unsigned code = static_cast<unsigned>(ErrorCode::PatternTooLarge); code <= static_cast<unsigned>(ErrorCode::BackReferenceUnsupported); ++code) {
        const char* message = errorMessage(static_cast<ErrorCode>(code));
        ASSERT_NOT_NULL(message);
        EXPECT_TRUE(!strncmp(message, "Invalid regular expression: ", 28)) << message;
    }

    SyntaxError error = syntaxErrorFor("(abc");
    EXPECT_STREQ("Invalid regular expression: missing )", error.message());
    EXPECT_STREQ("Invalid regular expression: nothing to repeat", syntaxErrorFor("+").message());
}

TEST(Sieve_RegexParser, FailedCompileLeavesNoPattern)
{
    RegexPattern pattern;
    EXPECT_FALSE(compileRegex("a(b)", pattern).hasError());
    EXPECT_NOT_NULL(pattern.body());

    SyntaxError error = compileRegex("a(b", pattern);
    EXPECT_STRONG_ENUM_EQ(ErrorCode::MissingParentheses, error.code);
    EXPECT_NULL(pattern.body());
    EXPECT_EQ(0u, pattern.numSubpatterns());

    MatchResult result;
    EXPECT_EQ(MatchStatus::NoMatch, interpretRegex(pattern, "ab", 0, result));
    EXPECT_TRUE(result.isEmpty());
}

TEST(Sieve_RegexParser, EmptyAlternativesAreValid)
{
    for (const char* pattern : { "", "a|", "|a", "()", "(|)", "(?:)", "a||b" }) {
        SCOPED_TRACE(pattern);
        EXPECT_FALSE(syntaxErrorFor(pattern).hasError());
    }

    EXPECT_EQ(std::string(""), findText("", "abc"));
    EXPECT_EQ(std::string(""), findText("b|", "abc"));
    EXPECT_EQ(std::string("b"), findText("|b", "b"));
}

TEST(Sieve_RegexParser, QuantifierBindsToPrecedingAtom)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("ab*", pattern).hasError());

    const PatternNode* body = pattern.body();
    ASSERT_EQ(PatternNode::Type::Concatenation, body->type);
    ASSERT_EQ(2u, body->children.size());
    EXPECT_EQ(PatternNode::Type::Literal, body->children[0]->type);
    EXPECT_EQ(static_cast<UChar32>('a'), body->children[0]->character);

    const PatternNode* repeat = body->children[1];
    ASSERT_EQ(PatternNode::Type::Repeat, repeat->type);
    EXPECT_EQ(0u, repeat->minimum);
    EXPECT_EQ(quantifyInfinite, repeat->maximum);
    EXPECT_TRUE(repeat->greedy);
    EXPECT_EQ(static_cast<UChar32>('b'), repeat->body->character);
}

TEST(Sieve_RegexParser, AlternationHasLowestPrecedence)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("ab|c+", pattern).hasError());

    const PatternNode* body = pattern.body();
    ASSERT_EQ(PatternNode::Type::Alternation, body->type);
    ASSERT_EQ(2u, body->children.size());

    const PatternNode* first = body->children[0];
    ASSERT_EQ(PatternNode::Type::Concatenation, first->type);
    EXPECT_EQ(2u, first->children.size());

    const PatternNode* second = body->children[1];
    ASSERT_EQ(PatternNode::Type::Repeat, second->type);
    EXPECT_EQ(1u, second->minimum);
    EXPECT_EQ(PatternNode::Type::Literal, second->body->type);
}

TEST(Sieve_RegexParser, BracedQuantifierForms)
{
    struct {
        const char* pattern;
        unsigned minimum;
        unsigned maximum;
        bool greedy;
    } cases[] = {
        { "a{3}", 3, 3, true },
        { "a{2,}", 2, quantifyInfinite, true },
        { "a{2,5}", 2, 5, true },
        { "a{0}", 0, 0, true },
        { "a{2,5}?", 2, 5, false },
        { "a*?", 0, quantifyInfinite, false },
        { "a+?", 1, quantifyInfinite, false },
        { "a??", 0, 1, false },
    };

    for (const auto& testCase : cases) {
        SCOPED_TRACE(testCase.pattern);
        RegexPattern pattern;
        ASSERT_FALSE(compileRegex(testCase.pattern, pattern).hasError());
        const PatternNode* repeat = pattern.body();
        ASSERT_EQ(PatternNode::Type::Repeat, repeat->type);
        EXPECT_EQ(testCase.minimum, repeat->minimum);
        EXPECT_EQ(testCase.maximum, repeat->maximum);
        EXPECT_EQ(testCase.greedy, repeat->greedy);
    }
}

TEST(Sieve_RegexParser, CapturingGroupsNumberedByOpeningParenthesis)
{
    RegexPattern pattern;
    auto result = findIn("((a)(b(c)))(d)", "abcd", pattern);
    EXPECT_EQ(5u, pattern.numSubpatterns());
    ASSERT_TRUE(result);
    EXPECT_EQ("abc", result->capturedText(1));
    EXPECT_EQ("a", result->capturedText(2));
    EXPECT_EQ("bc", result->capturedText(3));
    EXPECT_EQ("c", result->capturedText(4));
    EXPECT_EQ("d", result->capturedText(5));
}

TEST(Sieve_RegexParser, NonCapturingGroupsAreNotNumbered)
{
    RegexPattern pattern;
    auto result = findIn("(?:a)(b)(?:(c))", "abc", pattern);
    EXPECT_EQ(2u, pattern.numSubpatterns());
    ASSERT_TRUE(result);
    EXPECT_EQ("b", result->capturedText(1));
    EXPECT_EQ("c", result->capturedText(2));
}

TEST(Sieve_RegexParser, CharacterClassBrackets)
{
    EXPECT_TRUE(matchesEntirely("[]a]", "]"));
    EXPECT_TRUE(matchesEntirely("[]a]", "a"));
    EXPECT_FALSE(matchesEntirely("[]a]", "b"));

    EXPECT_TRUE(matchesEntirely("[^]a]", "b"));
    EXPECT_FALSE(matchesEntirely("[^]a]", "]"));
    EXPECT_FALSE(matchesEntirely("[^]a]", "a"));

    // ']' followed by '-' at the start is three members, not a range.
    EXPECT_TRUE(matchesEntirely("[]-a]", "-"));
    EXPECT_TRUE(matchesEntirely("[]-a]", "]"));
    EXPECT_FALSE(matchesEntirely("[]-a]", "_"));

    EXPECT_TRUE(matchesEntirely("[\\]\\\\]", "]"));
    EXPECT_TRUE(matchesEntirely("[\\]\\\\]", "\\"));
}

TEST(Sieve_RegexParser, CharacterClassHyphens)
{
    EXPECT_TRUE(matchesEntirely("[a-]", "a"));
    EXPECT_TRUE(matchesEntirely("[a-]", "-"));
    EXPECT_FALSE(matchesEntirely("[a-]", "b"));

    EXPECT_TRUE(matchesEntirely("[-a]", "-"));

    EXPECT_TRUE(matchesEntirely("[\\d-z]", "-"));
    EXPECT_TRUE(matchesEntirely("[\\d-z]", "7"));
    EXPECT_TRUE(matchesEntirely("[\\d-z]", "z"));
    EXPECT_FALSE(matchesEntirely("[\\d-z]", "y"));

    EXPECT_TRUE(matchesEntirely("[a\\-z]", "-"));
    EXPECT_FALSE(matchesEntirely("[a\\-z]", "m"));

    EXPECT_TRUE(matchesEntirely("[a-c-e]", "-"));
    EXPECT_TRUE(matchesEntirely("[a-c-e]", "e"));
    EXPECT_FALSE(matchesEntirely("[a-c-e]", "d"));
}

TEST(Sieve_RegexParser, CharacterClassEscapes)
{
    EXPECT_TRUE(matchesEntirely("[\\b]", "\b"));
    EXPECT_FALSE(matchesEntirely("[\\b]", "b"));
    EXPECT_TRUE(matchesEntirely("[\\1]", "1"));
    EXPECT_TRUE(matchesEntirely("[\\w.]+", "file_name.txt"));
    EXPECT_TRUE(matchesEntirely("[\\D]+", "abc"));
    EXPECT_FALSE(matchesEntirely("[\\D]", "4"));
    EXPECT_TRUE(matchesEntirely("[\\s]", "\t"));
    EXPECT_TRUE(matchesEntirely("[^\\s]", "x"));
    EXPECT_TRUE(matchesEntirely("[\\x41-\\x43]", "B"));
}

TEST(Sieve_RegexParser, AtomEscapes)
{
    EXPECT_TRUE(matchesEntirely("\\x41", "A"));
    EXPECT_TRUE(matchesEntirely("\\u00e9", "\xC3\xA9"));
    EXPECT_TRUE(matchesEntirely("\\xZ", "xZ"));
    EXPECT_TRUE(matchesEntirely("\\u12", "u12"));
    EXPECT_TRUE(matchesEntirely("\\t\\n\\r\\f\\v", "\t\n\r\f\v"));
    EXPECT_TRUE(matchesEntirely("\\.", "."));
    EXPECT_FALSE(matchesEntirely("\\.", "a"));
    EXPECT_TRUE(matchesEntirely("\\0", std::string_view("\0", 1)));
    EXPECT_TRUE(matchesEntirely("\\(\\)\\[\\]\\{\\}\\*\\+\\?\\|\\^\\$", "()[]{}*+?|^$"));
    EXPECT_TRUE(matchesEntirely("\\d\\D\\s\\S\\w\\W", "5a xb!"));
}

TEST(Sieve_RegexParser, DeepNestingIsRejected)
{
    std::string pattern(1001, '(');
    pattern += 'a';
    pattern.append(1001, ')');
    SyntaxError error = syntaxErrorFor(pattern);
    EXPECT_STRONG_ENUM_EQ(ErrorCode::PatternTooLarge, error.code);
    EXPECT_EQ(1000u, error.offset);

    std::string shallower(200, '(');
    shallower += 'a';
    shallower.append(200, ')');
    EXPECT_FALSE(syntaxErrorFor(shallower).hasError());
    EXPECT_EQ(std::string("a"), findText(shallower, "a"));
}

TEST(Sieve_RegexParser, CompilingTwiceGivesTheSameTree)
{
    for (const char* source : { "(a|b)*c", "^\\d{2,4}-[a-z]+?$", "x(?:y|z)+\\b" }) {
        SCOPED_TRACE(source);
        RegexPattern first;
        RegexPattern second;
        ASSERT_FALSE(compileRegex(source, first).hasError());
        ASSERT_FALSE(compileRegex(source, second).hasError());

        ASSERT_EQ(first.numberOfNodes(), second.numberOfNodes());
        EXPECT_EQ(first.numSubpatterns(), second.numSubpatterns());
        for (unsigned i = 0; i < first.numberOfNodes(); ++i) {
            EXPECT_EQ(first.nodeAt(i).type, second.nodeAt(i).type);
            EXPECT_EQ(first.nodeAt(i).minimum, second.nodeAt(i).minimum);
            EXPECT_EQ(first.nodeAt(i).maximum, second.nodeAt(i).maximum);
            EXPECT_EQ(first.nodeAt(i).memoizable, second.nodeAt(i).memoizable);
        }
    }
}

TEST(Sieve_RegexParser, RecompilingReplacesThePreviousPattern)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("(a)(b)(c)", pattern).hasError());
    EXPECT_EQ(3u, pattern.numSubpatterns());

    ASSERT_FALSE(compileRegex("x", pattern).hasError());
    EXPECT_EQ(0u, pattern.numSubpatterns());
    EXPECT_EQ(1u, pattern.numberOfNodes());
    EXPECT_TRUE(findRegex(pattern, "axb"));
    EXPECT_FALSE(findRegex(pattern, "abc"));
}

} // namespace TestSieveAPI
