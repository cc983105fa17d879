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
#include "RegExp.h"

#include "regex/RegexCompiler.h"
#include <support/Assertions.h>

namespace Sieve {

inline RegExp::RegExp(std::string_view pattern)
    : m_pattern(pattern)
    , m_regexPattern(std::make_unique<Regex::RegexPattern>())
{
    compile();
}

RegExp::~RegExp()
{
}

std::unique_ptr<RegExp> RegExp::create(std::string_view pattern)
{
    return std::unique_ptr<RegExp>(new RegExp(pattern));
}

void RegExp::compile()
{
    m_constructionError = Regex::compileRegex(m_pattern, *m_regexPattern);
    m_numSubpatterns = m_regexPattern->numSubpatterns();
}

Regex::MatchStatus RegExp::match(std::string_view input, Regex::MatchResult& result, const Regex::MatchOptions& options) const
{
    return match(input, 0, result, options);
}

Regex::MatchStatus RegExp::match(std::string_view input, unsigned startOffset, Regex::MatchResult& result, const Regex::MatchOptions& options) const
{
    result = Regex::MatchResult();

    if (!isValid()) {
        LOG_ERROR("Cannot match with invalid regular expression /%s/: %s", m_pattern.c_str(), errorMessage());
        return Regex::MatchStatus::NoMatch;
    }

    if (startOffset > input.size())
        return Regex::MatchStatus::NoMatch;

    return Regex::interpretRegex(*m_regexPattern, input, startOffset, result, options);
}

std::optional<Regex::MatchResult> RegExp::find(std::string_view input) const
{
    if (!isValid()) {
        LOG_ERROR("Cannot match with invalid regular expression /%s/: %s", m_pattern.c_str(), errorMessage());
        return std::nullopt;
    }

    return Regex::findRegex(*m_regexPattern, input);
}

bool RegExp::test(std::string_view input) const
{
    Regex::MatchResult result;
    return match(input, result, Regex::MatchOptions::unlimited()) == Regex::MatchStatus::Match;
}

} // namespace Sieve
