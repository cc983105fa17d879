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

#ifndef RegexErrorCode_h
#define RegexErrorCode_h

#include <cstdint>

namespace Sieve { namespace Regex {

enum class ErrorCode : uint8_t {
    NoError = 0,
    PatternTooLarge,
    InvalidEncoding,
    QuantifierOutOfOrder,
    QuantifierWithoutAtom,
    QuantifierTooLarge,
    QuantifierIncomplete,
    MissingParentheses,
    ParenthesesUnmatched,
    ParenthesesTypeInvalid,
    CharacterClassUnmatched,
    CharacterClassOutOfOrder,
    EscapeUnterminated,
    BackReferenceUnsupported,
};

// Returns a static string, or nullptr for ErrorCode::NoError.
const char* errorMessage(ErrorCode);

inline bool hasError(ErrorCode errorCode)
{
    return errorCode != ErrorCode::NoError;
}

// A pattern that could not be compiled. offset is the byte offset into the
// pattern at which the problem was detected.
struct SyntaxError {
    ErrorCode code { ErrorCode::NoError };
    unsigned offset { 0 };

    bool hasError() const { return Regex::hasError(code); }
    const char* message() const { return errorMessage(code); }
};

} } // namespace Sieve::Regex

#endif // RegexErrorCode_h
