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
#include "RegexErrorCode.h"

namespace Sieve { namespace Regex {

const char* errorMessage(ErrorCode error)
{
#define REGEXP_ERROR_PREFIX "Invalid regular expression: "
    // The order of this array must match the ErrorCode enum.
    static const char* const errorMessages[] = {
        nullptr, // NoError
        REGEXP_ERROR_PREFIX "regular expression too large", // PatternTooLarge
        REGEXP_ERROR_PREFIX "invalid UTF-8 in pattern", // InvalidEncoding
        REGEXP_ERROR_PREFIX "numbers out of order in {} quantifier", // QuantifierOutOfOrder
        REGEXP_ERROR_PREFIX "nothing to repeat", // QuantifierWithoutAtom
        REGEXP_ERROR_PREFIX "number too large in {} quantifier", // QuantifierTooLarge
        REGEXP_ERROR_PREFIX "incomplete {} quantifier", // QuantifierIncomplete
        REGEXP_ERROR_PREFIX "missing )", // MissingParentheses
        REGEXP_ERROR_PREFIX "unmatched parentheses", // ParenthesesUnmatched
        REGEXP_ERROR_PREFIX "unrecognized character after (?", // ParenthesesTypeInvalid
        REGEXP_ERROR_PREFIX "missing terminating ] for character class", // CharacterClassUnmatched
        REGEXP_ERROR_PREFIX "range out of order in character class", // CharacterClassOutOfOrder
        REGEXP_ERROR_PREFIX "\\ at end of pattern", // EscapeUnterminated
        REGEXP_ERROR_PREFIX "backreferences are not supported", // BackReferenceUnsupported
    };
#undef REGEXP_ERROR_PREFIX

    static_assert(sizeof(errorMessages) / sizeof(errorMessages[0]) == static_cast<unsigned>(ErrorCode::BackReferenceUnsupported) + 1, "errorMessages must cover every ErrorCode");

    return errorMessages[static_cast<unsigned>(error)];
}

} } // namespace Sieve::Regex
