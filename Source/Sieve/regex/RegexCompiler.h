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

#ifndef RegexCompiler_h
#define RegexCompiler_h

#include "RegexErrorCode.h"
#include "RegexParser.h"
#include "RegexPattern.h"
#include <string_view>
#include <vector>

namespace Sieve { namespace Regex {

class CharacterClassConstructor {
public:
    void reset();

    void append(const CharacterClass*);
    void putChar(UChar32);
    void putRange(UChar32 lo, UChar32 hi);

    // Hands over everything added since the last reset and starts afresh.
    std::unique_ptr<CharacterClass> charClass();

private:
    static void addSorted(std::vector<UChar32>& matches, UChar32);
    static void addSortedRange(std::vector<CharacterRange>& ranges, UChar32 lo, UChar32 hi);

    std::vector<UChar32> m_matches;
    std::vector<CharacterRange> m_ranges;
};

// Builds a RegexPattern from the callbacks made by Regex::parse(). It may also be
// driven directly to build trees the pattern syntax has no spelling for, such as
// an empty character class.
class RegexPatternConstructor {
public:
    explicit RegexPatternConstructor(RegexPattern&);

    void reset();

    void assertionBOL();
    void assertionEOL();
    void assertionWordBoundary(bool invert);

    void atomPatternCharacter(UChar32);
    void atomAnyCharacter();
    void atomBuiltInCharacterClass(BuiltInCharacterClassID, bool invert);
    void atomCharacterClassBegin(bool invert = false);
    void atomCharacterClassAtom(UChar32);
    void atomCharacterClassRange(UChar32 begin, UChar32 end);
    void atomCharacterClassBuiltIn(BuiltInCharacterClassID, bool invert);
    void atomCharacterClassEnd();
    void atomParenthesesSubpatternBegin(bool capture = true);
    void atomParenthesesEnd();

    void quantifyAtom(unsigned min, unsigned max, bool greedy);

    void disjunction();

    void regexBegin();
    void regexEnd();
    void regexError();

private:
    PatternNode* createNode(std::unique_ptr<PatternNode>);
    void appendTerm(std::unique_ptr<PatternNode>);
    PatternNode* addNewAlternative(PatternNode* disjunction);

    RegexPattern& m_pattern;
    PatternNode* m_body { nullptr };
    PatternNode* m_alternative { nullptr };
    CharacterClassConstructor m_characterClassConstructor;
    bool m_invertCharacterClass { false };
};

// Parses patternString into pattern. On failure the returned SyntaxError carries
// the error code and byte offset, and pattern is left empty.
SyntaxError compileRegex(std::string_view patternString, RegexPattern&);

} } // namespace Sieve::Regex

#endif // RegexCompiler_h
