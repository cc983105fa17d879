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

#ifndef Sieve_ASCIICType_h
#define Sieve_ASCIICType_h

#include <support/Assertions.h>

// The behavior of many of the functions in the <ctype.h> header is dependent
// on the current locale. But in the regex grammar those functions are expected
// to be locale independent. These functions also take code points wider than
// a char without truncating them first.

namespace Sieve {

template<typename CharacterType> inline bool isASCII(CharacterType c)
{
    return !(c & ~0x7F);
}

template<typename CharacterType> inline bool isASCIIAlpha(CharacterType c)
{
    return (c | 0x20) >= 'a' && (c | 0x20) <= 'z';
}

template<typename CharacterType> inline bool isASCIIDigit(CharacterType c)
{
    return c >= '0' && c <= '9';
}

template<typename CharacterType> inline bool isASCIIAlphanumeric(CharacterType c)
{
    return isASCIIDigit(c) || isASCIIAlpha(c);
}

template<typename CharacterType> inline bool isASCIIHexDigit(CharacterType c)
{
    return isASCIIDigit(c) || ((c | 0x20) >= 'a' && (c | 0x20) <= 'f');
}

// Space, tab, line feed, vertical tab, form feed and carriage return.
template<typename CharacterType> inline bool isASCIISpace(CharacterType c)
{
    return c == ' ' || (c >= '\t' && c <= '\r');
}

template<typename CharacterType> inline bool isASCIIWordCharacter(CharacterType c)
{
    return isASCIIAlphanumeric(c) || c == '_';
}

template<typename CharacterType> inline int toASCIIHexValue(CharacterType c)
{
    ASSERT(isASCIIHexDigit(c));
    return c < 'A' ? c - '0' : (c - 'A' + 10) & 0xF;
}

} // namespace Sieve

using Sieve::isASCII;
using Sieve::isASCIIAlpha;
using Sieve::isASCIIAlphanumeric;
using Sieve::isASCIIDigit;
using Sieve::isASCIIHexDigit;
using Sieve::isASCIISpace;
using Sieve::isASCIIWordCharacter;
using Sieve::toASCIIHexValue;

#endif // Sieve_ASCIICType_h
