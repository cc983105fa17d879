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

#ifndef Sieve_UTF8_h
#define Sieve_UTF8_h

#include <string_view>
#include <unicode/umachine.h>
#include <vector>

namespace Sieve {
namespace Unicode {

// A UTF-8 string decoded into code points. offsets[i] is the byte offset of
// characters[i]; offsets carries one extra entry holding the byte length.
struct DecodedText {
    std::vector<UChar32> characters;
    std::vector<unsigned> offsets;

    unsigned length() const { return characters.size(); }
    unsigned byteOffset(unsigned index) const { return offsets[index]; }
};

enum class ConversionMode {
    Strict,
    Lenient,
};

// Strict mode stops at the first ill-formed sequence, storing its byte offset in
// errorOffset. Lenient mode decodes each ill-formed sequence as U+FFFD.
// Strings of 2 GiB or more are rejected in both modes.
bool decodeUTF8(std::string_view, DecodedText&, ConversionMode, unsigned* errorOffset = nullptr);

// Maps a byte offset back to a code point index. Returns false when the
// offset does not fall on a code point boundary.
bool characterIndexForByteOffset(const DecodedText&, unsigned byteOffset, unsigned& characterIndex);

} // namespace Unicode
} // namespace Sieve

#endif // Sieve_UTF8_h
