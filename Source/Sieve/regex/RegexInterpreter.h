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

#ifndef RegexInterpreter_h
#define RegexInterpreter_h

#include "RegexOptions.h"
#include "RegexPattern.h"
#include <climits>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace Sieve { namespace Regex {

enum class MatchStatus : uint8_t {
    NoMatch,
    Match,
    // The search ran out of budget before it could prove there is no match.
    HitLimit,
};

const char* matchStatusName(MatchStatus);

static constexpr unsigned offsetNoMatch = UINT_MAX;

struct MatchSpan {
    unsigned start;
    unsigned end;

    unsigned length() const { return end - start; }

    bool operator==(const MatchSpan& other) const { return start == other.start && end == other.end; }
    bool operator!=(const MatchSpan& other) const { return !(*this == other); }
};

// Byte offsets into the searched input, which must outlive the result.
// Subpattern 0 is the whole match; subpatterns that did not take part in the
// match have no span, which is not the same as an empty span.
class MatchResult {
public:
    MatchResult() = default;
    MatchResult(std::string_view input, std::vector<unsigned>&& offsets);

    bool isEmpty() const { return m_offsets.empty(); }

    MatchSpan span() const;
    std::string_view matchedText() const;

    unsigned numSubpatterns() const;
    std::optional<MatchSpan> captureSpan(unsigned subpatternId) const;
    std::optional<std::string_view> capturedText(unsigned subpatternId) const;

private:
    std::string_view m_input;
    // Start and end pairs, offsetNoMatch for subpatterns that did not participate.
    std::vector<unsigned> m_offsets;
};

// Searches for the leftmost match, trying each code point boundary from
// startOffset up to and including the end of input.
MatchStatus interpretRegex(const RegexPattern&, std::string_view input, unsigned startOffset, MatchResult&, const MatchOptions& = MatchOptions());

// Attempts a single match that begins exactly at offset.
MatchStatus matchRegexAt(const RegexPattern&, std::string_view input, unsigned offset, MatchResult&, const MatchOptions& = MatchOptions());

// Leftmost match with neither budget. Only input too large to index can stop
// the search early; that is logged and reported as std::nullopt.
std::optional<MatchResult> findRegex(const RegexPattern&, std::string_view input);

} } // namespace Sieve::Regex

#endif // RegexInterpreter_h
