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

#include "Test.h"
#include <support/unicode/UTF8.h>
#include <vector>

namespace TestSieveAPI {

using namespace Sieve::Unicode;

TEST(Sieve_UTF8, DecodeRecordsByteOffsets)
{
    DecodedText text;
    // a, U+00E9, U+20AC, U+1F600
    ASSERT_TRUE(decodeUTF8("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80", text, ConversionMode::Strict));
    EXPECT_EQ((std::vector<UChar32> { 0x61, 0xE9, 0x20AC, 0x1F600 }), text.characters);
    EXPECT_EQ((std::vector<unsigned> { 0, 1, 3, 6, 10 }), text.offsets);
    EXPECT_EQ(4u, text.length());
    EXPECT_EQ(10u, text.byteOffset(4));
}

TEST(Sieve_UTF8, DecodeEmpty)
{
    DecodedText text;
    ASSERT_TRUE(decodeUTF8("", text, ConversionMode::Strict));
    EXPECT_EQ(0u, text.length());
    EXPECT_EQ((std::vector<unsigned> { 0 }), text.offsets);
}

TEST(Sieve_UTF8, StrictModeReportsFirstBadSequence)
{
    struct {
        const char* bytes;
        unsigned errorOffset;
    } cases[] = {
        { "a\xC3", 1 },
        { "\xED\xA0\x80", 0 },
        { "\xC0\xAF", 0 },
        { "ok\xFF", 2 },
        { "\xC3\xA9\x80", 2 },
    };

    for (const auto& testCase : cases) {
        DecodedText text;
        unsigned errorOffset = 1234;
        EXPECT_FALSE(decodeUTF8(testCase.bytes, text, ConversionMode::Strict, &errorOffset));
        EXPECT_EQ(testCase.errorOffset, errorOffset);
    }
}

TEST(Sieve_UTF8, LenientModeSubstitutesReplacementCharacter)
{
    DecodedText text;
    ASSERT_TRUE(decodeUTF8("a\xFF" "b", text, ConversionMode::Lenient));
    EXPECT_EQ((std::vector<UChar32> { 'a', 0xFFFD, 'b' }), text.characters);
    EXPECT_EQ((std::vector<unsigned> { 0, 1, 2, 3 }), text.offsets);
}

TEST(Sieve_UTF8, CharacterIndexForByteOffset)
{
    DecodedText text;
    ASSERT_TRUE(decodeUTF8("a\xC3\xA9", text, ConversionMode::Strict));

    unsigned index = 99;
    EXPECT_TRUE(characterIndexForByteOffset(text, 0, index));
    EXPECT_EQ(0u, index);
    EXPECT_TRUE(characterIndexForByteOffset(text, 1, index));
    EXPECT_EQ(1u, index);
    EXPECT_TRUE(characterIndexForByteOffset(text, 3, index));
    EXPECT_EQ(2u, index);
    EXPECT_FALSE(characterIndexForByteOffset(text, 2, index));
    EXPECT_FALSE(characterIndexForByteOffset(text, 4, index));
}

} // namespace TestSieveAPI
