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

#ifndef RegExp_h
#define RegExp_h

#include "regex/RegexErrorCode.h"
#include "regex/RegexInterpreter.h"
#include "regex/RegexOptions.h"
#include "regex/RegexPattern.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <support/Noncopyable.h>

namespace Sieve {

// A pattern compiled once and matched any number of times. Matching never
// modifies the RegExp, so one instance may be used from several threads at once.
class RegExp {
public:
    static std::unique_ptr<RegExp> create(std::string_view pattern);
    ~RegExp();

    const std::string& pattern() const { return m_pattern; }

    bool isValid() const { return !m_constructionError.hasError(); }
    const Regex::SyntaxError& syntaxError() const { return m_constructionError; }
    const char* errorMessage() const { return m_constructionError.message(); }

    unsigned numSubpatterns() const { return m_numSubpatterns; }
    const Regex::RegexPattern& regexPattern() const { return *m_regexPattern; }

    Regex::MatchStatus match(std::string_view input, Regex::MatchResult&, const Regex::MatchOptions& = Regex::MatchOptions()) const;
    Regex::MatchStatus match(std::string_view input, unsigned startOffset, Regex::MatchResult&, const Regex::MatchOptions& = Regex::MatchOptions()) const;

    // These run without budgets, so their answers are never cut short. Use
    // match() to bound the work and tell HitLimit apart from NoMatch.
    std::optional<Regex::MatchResult> find(std::string_view input) const;
    bool test(std::string_view input) const;

private:
    explicit RegExp(std::string_view pattern);

    void compile();

    std::string m_pattern;
    Regex::SyntaxError m_constructionError;
    unsigned m_numSubpatterns { 0 };
    std::unique_ptr<Regex::RegexPattern> m_regexPattern;

    SIEVE_MAKE_NONCOPYABLE(RegExp);
};

} // namespace Sieve

#endif // RegExp_h
