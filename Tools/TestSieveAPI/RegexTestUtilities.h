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

#pragma once

#include "Test.h"
#include "regex/RegexCompiler.h"
#include "regex/RegexInterpreter.h"
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Sieve { namespace Regex {

inline void PrintTo(MatchStatus status, std::ostream* stream)
{
    *stream << matchStatusName(status);
}

inline void PrintTo(const MatchSpan& span, std::ostream* stream)
{
    *stream << "[" << span.start << ", " << span.end << ")";
}

} } // namespace Sieve::Regex

namespace TestSieveAPI {

inline Sieve::Regex::SyntaxError syntaxErrorFor(std::string_view pattern)
{
    Sieve::Regex::RegexPattern regexPattern;
    return Sieve::Regex::compileRegex(pattern, regexPattern);
}

// Leftmost match of pattern in input, or std::nullopt. An invalid pattern fails the test.
inline std::optional<Sieve::Regex::MatchResult> findIn(std::string_view pattern, std::string_view input, Sieve::Regex::RegexPattern& regexPattern)
{
    auto error = Sieve::Regex::compileRegex(pattern, regexPattern);
    if (error.hasError()) {
        ADD_FAILURE() << "/" << pattern << "/ failed to compile: " << error.message() << " at offset " << error.offset;
        return std::nullopt;
    }
    return Sieve::Regex::findRegex(regexPattern, input);
}

inline std::optional<std::string> findText(std::string_view pattern, std::string_view input)
{
    Sieve::Regex::RegexPattern regexPattern;
    auto result = findIn(pattern, input, regexPattern);
    if (!result)
        return std::nullopt;
    return std::string(result->matchedText());
}

// True when pattern matches the whole of input.
inline bool matchesEntirely(std::string_view pattern, std::string_view input)
{
    std::string anchored = "^(?:";
    anchored.append(pattern.data(), pattern.size());
    anchored += ")$";
    Sieve::Regex::RegexPattern regexPattern;
    return !!findIn(anchored, input, regexPattern);
}

} // namespace TestSieveAPI
