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
#include <atomic>
#include <runtime/RegExp.h>
#include <string>
#include <thread>
#include <vector>

namespace TestSieveAPI {

using Sieve::RegExp;
using namespace Sieve::Regex;

TEST(Sieve_RegExp, ValidPattern)
{
    auto regExp = RegExp::create("(\\w+)@(\\w+)");
    ASSERT_NOT_NULL(regExp);
    EXPECT_TRUE(regExp->isValid());
    EXPECT_EQ("(\\w+)@(\\w+)", regExp->pattern());
    EXPECT_EQ(2u, regExp->numSubpatterns());
    EXPECT_NULL(regExp->errorMessage());
    EXPECT_STRONG_ENUM_EQ(ErrorCode::NoError, regExp->syntaxError().code);

    MatchResult result;
    EXPECT_EQ(MatchStatus::Match, regExp->match("mail me@home now", result));
    EXPECT_EQ("me@home", result.matchedText());
    EXPECT_EQ("me", result.capturedText(1));
    EXPECT_EQ("home", result.capturedText(2));
}

TEST(Sieve_RegExp, InvalidPattern)
{
    auto regExp = RegExp::create("(abc");
    ASSERT_NOT_NULL(regExp);
    EXPECT_FALSE(regExp->isValid());
    EXPECT_STRONG_ENUM_EQ(ErrorCode::MissingParentheses, regExp->syntaxError().code);
    EXPECT_EQ(4u, regExp->syntaxError().offset);
    EXPECT_STREQ("Invalid regular expression: missing )", regExp->errorMessage());
    EXPECT_EQ(0u, regExp->numSubpatterns());

    MatchResult result;
    EXPECT_EQ(MatchStatus::NoMatch, regExp->match("abc", result));
    EXPECT_TRUE(result.isEmpty());
    EXPECT_FALSE(regExp->find("abc"));
    EXPECT_FALSE(regExp->test("abc"));
}

TEST(Sieve_RegExp, InvalidEncodingInPattern)
{
    auto regExp = RegExp::create("ab\xC3(");
    EXPECT_FALSE(regExp->isValid());
    EXPECT_STRONG_ENUM_EQ(ErrorCode::InvalidEncoding, regExp->syntaxError().code);
    EXPECT_EQ(2u, regExp->syntaxError().offset);
}

TEST(Sieve_RegExp, Find)
{
    auto regExp = RegExp::create("o+");
    auto result = regExp->find("foo boooo");
    ASSERT_TRUE(result);
    EXPECT_EQ((MatchSpan { 1, 3 }), result->span());
    EXPECT_FALSE(regExp->find("xyz"));
}

TEST(Sieve_RegExp, Test)
{
    auto regExp = RegExp::create("h.llo");
    EXPECT_TRUE(regExp->test("say hello"));
    EXPECT_TRUE(regExp->test("hxllo"));
    EXPECT_FALSE(regExp->test("hllo"));
}

TEST(Sieve_RegExp, TestOutlastsTheDefaultMatchLimit)
{
    // Five node visits for every character, more than the default budget allows.
    auto regExp = RegExp::create("(?:a|b|c|d)*e");
    std::string input(250000, 'd');
    std::string terminated = input + "e";

    MatchResult result;
    EXPECT_EQ(MatchStatus::HitLimit, regExp->match(terminated, result));
    EXPECT_TRUE(regExp->test(terminated));
    EXPECT_FALSE(regExp->test(input));

    auto found = regExp->find(terminated);
    ASSERT_TRUE(found);
    EXPECT_EQ((MatchSpan { 0, 250001 }), found->span());
}

TEST(Sieve_RegExp, MatchFromStartOffset)
{
    auto regExp = RegExp::create("a");
    MatchResult result;
    EXPECT_EQ(MatchStatus::Match, regExp->match("banana", 2, result));
    EXPECT_EQ((MatchSpan { 3, 4 }), result.span());

    EXPECT_EQ(MatchStatus::NoMatch, regExp->match("banana", 6, result));
    EXPECT_EQ(MatchStatus::NoMatch, regExp->match("banana", 7, result));
    EXPECT_TRUE(result.isEmpty());

    auto empty = RegExp::create("");
    EXPECT_EQ(MatchStatus::Match, empty->match("banana", 6, result));
    EXPECT_EQ((MatchSpan { 6, 6 }), result.span());
}

TEST(Sieve_RegExp, MatchHonorsOptions)
{
    auto regExp = RegExp::create("(a|b)*c");
    std::string input(200, 'a');

    MatchOptions options;
    options.matchLimit = 50;
    MatchResult result;
    EXPECT_EQ(MatchStatus::HitLimit, regExp->match(input, result, options));
    EXPECT_EQ(MatchStatus::NoMatch, regExp->match(input, result));
    EXPECT_EQ(MatchStatus::Match, regExp->match(input + "c", result));
}

TEST(Sieve_RegExp, ConcurrentMatching)
{
    auto regExp = RegExp::create("(\\d+)-(\\d+)");
    const RegExp& shared = *regExp;
    std::atomic<unsigned> failures { 0 };

    std::vector<std::thread> threads;
    for (unsigned thread = 0; thread < 4; ++thread) {
        threads.emplace_back([&shared, &failures, thread] {
            for (unsigned i = 0; i < 200; ++i) {
                std::string left = std::to_string(thread * 1000 + i);
                std::string right = std::to_string(i);
                std::string input = "id " + left + "-" + right + ";";

                MatchResult result;
                if (shared.match(input, result) != MatchStatus::Match
                    || result.capturedText(1) != std::string_view(left)
                    || result.capturedText(2) != std::string_view(right))
                    ++failures;
            }
        });
    }

    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(0u, failures.load());
}

} // namespace TestSieveAPI
