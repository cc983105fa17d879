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
#include <regex/RegexCompiler.h>
#include <regex/RegexInterpreter.h>
#include <regex/RegexOptions.h>
#include <string>

namespace TestSieveAPI {

using namespace Sieve::Regex;

static MatchOptions withoutMemoization(unsigned matchLimit)
{
    MatchOptions options;
    options.matchLimit = matchLimit;
    options.memoize = false;
    return options;
}

#if ENABLE(REGEX_MEMOIZATION)

TEST(Sieve_RegexBacktracking, NestedQuantifiersFinishWithMemoization)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("(a+)+b", pattern).hasError());

    std::string input(30, 'a');
    MatchResult result;
    EXPECT_EQ(MatchStatus::NoMatch, interpretRegex(pattern, input, 0, result));
    EXPECT_EQ(MatchStatus::HitLimit, interpretRegex(pattern, input, 0, result, withoutMemoization(100000)));
    EXPECT_TRUE(result.isEmpty());

    input += 'b';
    EXPECT_EQ(MatchStatus::Match, interpretRegex(pattern, input, 0, result));
    EXPECT_EQ(input.size(), result.span().end);
    EXPECT_EQ((MatchSpan { 0, 30 }), result.captureSpan(1));
}

TEST(Sieve_RegexBacktracking, OverlappingRepeatsFinishWithMemoization)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("(x+x+)+y", pattern).hasError());

    std::string input(25, 'x');
    MatchResult result;
    EXPECT_EQ(MatchStatus::NoMatch, interpretRegex(pattern, input, 0, result));
    EXPECT_EQ(MatchStatus::HitLimit, interpretRegex(pattern, input, 0, result, withoutMemoization(100000)));
}

TEST(Sieve_RegexBacktracking, ChainedStarsOnLongInput)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("a*a*a*b", pattern).hasError());

    std::string input(5000, 'a');
    MatchResult result;
    EXPECT_EQ(MatchStatus::NoMatch, interpretRegex(pattern, input, 0, result));

    input += 'b';
    EXPECT_EQ(MatchStatus::Match, interpretRegex(pattern, input, 0, result));
    EXPECT_EQ((MatchSpan { 0, 5001 }), result.span());
}

TEST(Sieve_RegexBacktracking, LazyChainedStarsOnLongInput)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("a*?a*?a*?b", pattern).hasError());

    std::string input(5000, 'a');
    MatchResult result;
    EXPECT_EQ(MatchStatus::NoMatch, interpretRegex(pattern, input, 0, result));

    input += 'b';
    EXPECT_EQ(MatchStatus::Match, interpretRegex(pattern, input, 1, result));
    EXPECT_EQ((MatchSpan { 1, 5001 }), result.span());
}

#endif

TEST(Sieve_RegexBacktracking, NullableRepeatBodyOnLongInput)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("(a*)*b", pattern).hasError());

    EXPECT_FALSE(findRegex(pattern, std::string(25, 'a')));
    EXPECT_TRUE(findRegex(pattern, std::string(25, 'a') + "b"));
}

TEST(Sieve_RegexBacktracking, MemoizationDoesNotChangeResults)
{
    struct {
        const char* pattern;
        const char* input;
    } cases[] = {
        { "(a|ab)(c|bcd)(d*)", "abcd" },
        { "(?:a|ab)*c", "ababc" },
        { "(a|ab){2}c", "abac" },
        { "((a)|b)+c", "abbac" },
        { "(?:(a)|(b))*c", "abx abc" },
        { "(a*)+b", "aaab" },
        { "(\\w+)\\s(\\w+)$", "one two three" },
        { "x(a?){2,3}y", "xaay" },
        { "(a|b)*?b", "aab" },
        { "^(?:a+|b)*c", "aabab" },
        { "(a*)(a*)b", "aaaxaab" },
        { "x*?(y*)z", "xxyxyyz" },
        { "(?:.)*?(\\d+)", "ab12c345" },
    };

    for (const auto& testCase : cases) {
        SCOPED_TRACE(testCase.pattern);
        RegexPattern pattern;
        ASSERT_FALSE(compileRegex(testCase.pattern, pattern).hasError());

        MatchOptions memoized;
        MatchResult memoizedResult;
        MatchStatus memoizedStatus = interpretRegex(pattern, testCase.input, 0, memoizedResult, memoized);

        MatchResult plainResult;
        MatchStatus plainStatus = interpretRegex(pattern, testCase.input, 0, plainResult, withoutMemoization(0));

        ASSERT_EQ(plainStatus, memoizedStatus);
        if (plainStatus != MatchStatus::Match)
            continue;
        ASSERT_EQ(plainResult.numSubpatterns(), memoizedResult.numSubpatterns());
        for (unsigned i = 0; i <= plainResult.numSubpatterns(); ++i)
            EXPECT_EQ(plainResult.captureSpan(i), memoizedResult.captureSpan(i)) << "subpattern " << i;
    }
}

TEST(Sieve_RegexBacktracking, MatchLimitReportsHitLimit)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("(a|b)*c", pattern).hasError());

    MatchOptions options;
    options.matchLimit = 10;

    MatchResult result;
    EXPECT_EQ(MatchStatus::HitLimit, interpretRegex(pattern, std::string(100, 'a'), 0, result, options));
    EXPECT_TRUE(result.isEmpty());

    options.matchLimit = 0;
    EXPECT_EQ(MatchStatus::NoMatch, interpretRegex(pattern, std::string(100, 'a'), 0, result, options));
}

TEST(Sieve_RegexBacktracking, BacktrackLimitReportsHitLimit)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("(?:ab)*$", pattern).hasError());

    std::string input;
    for (unsigned i = 0; i < 200; ++i)
        input += "ab";

    MatchOptions options;
    options.backtrackLimit = 50;
    MatchResult result;
    EXPECT_EQ(MatchStatus::HitLimit, interpretRegex(pattern, input, 0, result, options));
    EXPECT_TRUE(result.isEmpty());

    EXPECT_EQ(MatchStatus::Match, interpretRegex(pattern, input, 0, result));
    EXPECT_EQ((MatchSpan { 0, 400 }), result.span());
}

TEST(Sieve_RegexBacktracking, LongRepeatBodiesAreFound)
{
    std::string pairs;
    for (unsigned i = 0; i < 20000; ++i)
        pairs += "ab";

    RegexPattern pattern;
    auto result = findIn("(?:ab)*", pairs, pattern);
    ASSERT_TRUE(result);
    EXPECT_EQ((MatchSpan { 0, 40000 }), result->span());

    std::string shortPairs = pairs.substr(0, 4000);
    result = findIn("(ab)*", shortPairs, pattern);
    ASSERT_TRUE(result);
    EXPECT_EQ((MatchSpan { 0, 4000 }), result->span());
    EXPECT_EQ((MatchSpan { 3998, 4000 }), result->captureSpan(1));

    std::string terminated = pairs.substr(0, 3000) + "c";
    result = findIn("(?:a|b)*c", terminated, pattern);
    ASSERT_TRUE(result);
    EXPECT_EQ((MatchSpan { 0, 3001 }), result->span());

    std::string letters(6000, 'q');
    result = findIn("(.)*", letters, pattern);
    ASSERT_TRUE(result);
    EXPECT_EQ((MatchSpan { 0, 6000 }), result->span());
    EXPECT_EQ((MatchSpan { 5999, 6000 }), result->captureSpan(1));
}

TEST(Sieve_RegexBacktracking, LongLiteralIsFound)
{
    std::string literal(6000, 'x');
    std::string input = "y" + literal;
    RegexPattern pattern;
    auto result = findIn(literal, input, pattern);
    ASSERT_TRUE(result);
    EXPECT_EQ((MatchSpan { 1, 6001 }), result->span());
}

TEST(Sieve_RegexBacktracking, LongRepeatedCharacterRun)
{
    RegexPattern pattern;
    ASSERT_FALSE(compileRegex("a*b", pattern).hasError());

    std::string input(100000, 'a');
    input += 'b';
    auto result = findRegex(pattern, input);
    ASSERT_TRUE(result);
    EXPECT_EQ(input.size(), result->span().length());
}

} // namespace TestSieveAPI
