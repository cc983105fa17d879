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
#include "UTF8.h"

#include <algorithm>
#include <limits>
#include <support/Assertions.h>
#include <unicode/utf8.h>

namespace Sieve {
namespace Unicode {

static constexpr UChar32 replacementCharacter = 0xFFFD;

bool decodeUTF8(std::string_view string, DecodedText& result, ConversionMode mode, unsigned* errorOffset)
{
    result.characters.clear();
    result.offsets.clear();

    if (string.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        if (errorOffset)
            *errorOffset = 0;
        return false;
    }

    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(string.data());
    int32_t length = static_cast<int32_t>(string.size());
    result.characters.reserve(string.size());
    result.offsets.reserve(string.size() + 1);

    int32_t i = 0;
    while (i < length) {
        int32_t start = i;
        UChar32 character;
        U8_NEXT(bytes, i, length, character);
        if (character < 0) {
            if (mode == ConversionMode::Strict) {
                if (errorOffset)
                    *errorOffset = start;
                result.characters.clear();
                result.offsets.clear();
                return false;
            }
            character = replacementCharacter;
        }
        result.characters.push_back(character);
        result.offsets.push_back(start);
    }
    result.offsets.push_back(length);

    return true;
}

bool characterIndexForByteOffset(const DecodedText& text, unsigned byteOffset, unsigned& characterIndex)
{
    ASSERT(!text.offsets.empty());
    auto position = std::lower_bound(text.offsets.begin(), text.offsets.end(), byteOffset);
    if (position == text.offsets.end() || *position != byteOffset)
        return false;
    characterIndex = position - text.offsets.begin();
    return true;
}

} // namespace Unicode
} // namespace Sieve
