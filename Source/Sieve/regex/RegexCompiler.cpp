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
#include "RegexCompiler.h"

#include <algorithm>
#include <support/Logging.h>

namespace Sieve { namespace Regex {

void CharacterClassConstructor::reset()
{
    m_matches.clear();
    m_ranges.clear();
}

void CharacterClassConstructor::append(const CharacterClass* other)
{
    for (UChar32 match : other->m_matches)
        addSorted(m_matches, match);
    for (const auto& range : other->m_ranges)
        addSortedRange(m_ranges, range.begin, range.end);
}

void CharacterClassConstructor::putChar(UChar32 ch)
{
    addSorted(m_matches, ch);
}

void CharacterClassConstructor::putRange(UChar32 lo, UChar32 hi)
{
    ASSERT(lo <= hi);
    addSortedRange(m_ranges, lo, hi);
}

std::unique_ptr<CharacterClass> CharacterClassConstructor::charClass()
{
    auto characterClass = std::make_unique<CharacterClass>();
    characterClass->m_matches = std::move(m_matches);
    characterClass->m_ranges = std::move(m_ranges);
    reset();
    return characterClass;
}

void CharacterClassConstructor::addSorted(std::vector<UChar32>& matches, UChar32 ch)
{
    auto position = std::lower_bound(matches.begin(), matches.end(), ch);
    if (position != matches.end() && *position == ch)
        return;
    matches.insert(position, ch);
}

void CharacterClassConstructor::addSortedRange(std::vector<CharacterRange>& ranges, UChar32 lo, UChar32 hi)
{
    size_t end = ranges.size();

    for (size_t i = 0; i < end; ++i) {
        // Does the new range fall before the current position in the array?
        if (hi < ranges[i].begin) {
            if (hi == ranges[i].begin - 1) {
                ranges[i].begin = lo;
                return;
            }
            ranges.insert(ranges.begin() + i, CharacterRange(lo, hi));
            return;
        }
        // The end of the new range is at or after the beginning of this one. If it
        // also starts at or just after the end of this one, the two merge.
        if (lo <= ranges[i].end + 1) {
            ranges[i].begin = std::min(ranges[i].begin, lo);
            ranges[i].end = std::max(ranges[i].end, hi);

            // Now check if the new range can subsume any subsequent ranges.
            size_t next = i + 1;
            while (next < ranges.size() && ranges[next].begin <= ranges[i].end + 1) {
                ranges[i].end = std::max(ranges[i].end, ranges[next].end);
                ranges.erase(ranges.begin() + next);
            }
            return;
        }
    }

    // CharacterRange comes after all existing ranges.
    ranges.emplace_back(lo, hi);
}

// A disjunction with one alternative is that alternative, and an alternative
// with one term is that term.
static PatternNode* simplifyAlternative(PatternNode* alternative)
{
    ASSERT(alternative->type == PatternNode::Type::Concatenation);
    return alternative->children.size() == 1 ? alternative->children.front() : alternative;
}

static PatternNode* simplifyDisjunction(PatternNode* disjunction)
{
    ASSERT(disjunction->type == PatternNode::Type::Alternation);
    if (disjunction->children.size() == 1)
        return simplifyAlternative(disjunction->children.front());

    for (auto& alternative : disjunction->children)
        alternative = simplifyAlternative(alternative);
    return disjunction;
}

RegexPatternConstructor::RegexPatternConstructor(RegexPattern& pattern)
    : m_pattern(pattern)
{
}

void RegexPatternConstructor::reset()
{
    m_pattern.reset();
    m_characterClassConstructor.reset();
    m_body = nullptr;
    m_alternative = nullptr;
    m_invertCharacterClass = false;
}

PatternNode* RegexPatternConstructor::createNode(std::unique_ptr<PatternNode> node)
{
    return m_pattern.adoptNode(std::move(node));
}

void RegexPatternConstructor::appendTerm(std::unique_ptr<PatternNode> node)
{
    ASSERT(m_alternative);
    m_alternative->children.push_back(createNode(std::move(node)));
}

PatternNode* RegexPatternConstructor::addNewAlternative(PatternNode* disjunction)
{
    PatternNode* alternative = createNode(std::make_unique<PatternNode>(PatternNode::Type::Concatenation));
    alternative->parent = disjunction;
    disjunction->children.push_back(alternative);
    return alternative;
}

void RegexPatternConstructor::assertionBOL()
{
    appendTerm(std::make_unique<PatternNode>(AssertionType::BeginningOfInput, false));
}

void RegexPatternConstructor::assertionEOL()
{
    appendTerm(std::make_unique<PatternNode>(AssertionType::EndOfInput, false));
}

void RegexPatternConstructor::assertionWordBoundary(bool invert)
{
    appendTerm(std::make_unique<PatternNode>(AssertionType::WordBoundary, invert));
}

void RegexPatternConstructor::atomPatternCharacter(UChar32 ch)
{
    appendTerm(std::make_unique<PatternNode>(ch));
}

void RegexPatternConstructor::atomAnyCharacter()
{
    appendTerm(std::make_unique<PatternNode>(PatternNode::Type::AnyCharacter));
}

void RegexPatternConstructor::atomBuiltInCharacterClass(BuiltInCharacterClassID classID, bool invert)
{
    switch (classID) {
    case DigitClassID:
        appendTerm(std::make_unique<PatternNode>(m_pattern.digitsCharacterClass(), invert));
        break;
    case SpaceClassID:
        appendTerm(std::make_unique<PatternNode>(m_pattern.spacesCharacterClass(), invert));
        break;
    case WordClassID:
        appendTerm(std::make_unique<PatternNode>(m_pattern.wordcharCharacterClass(), invert));
        break;
    }
}

void RegexPatternConstructor::atomCharacterClassBegin(bool invert)
{
    m_invertCharacterClass = invert;
}

void RegexPatternConstructor::atomCharacterClassAtom(UChar32 ch)
{
    m_characterClassConstructor.putChar(ch);
}

void RegexPatternConstructor::atomCharacterClassRange(UChar32 begin, UChar32 end)
{
    m_characterClassConstructor.putRange(begin, end);
}

void RegexPatternConstructor::atomCharacterClassBuiltIn(BuiltInCharacterClassID classID, bool invert)
{
    switch (classID) {
    case DigitClassID:
        m_characterClassConstructor.append(invert ? m_pattern.nondigitsCharacterClass() : m_pattern.digitsCharacterClass());
        break;
    case SpaceClassID:
        m_characterClassConstructor.append(invert ? m_pattern.nonspacesCharacterClass() : m_pattern.spacesCharacterClass());
        break;
    case WordClassID:
        m_characterClassConstructor.append(invert ? m_pattern.nonwordcharCharacterClass() : m_pattern.wordcharCharacterClass());
        break;
    }
}

void RegexPatternConstructor::atomCharacterClassEnd()
{
    CharacterClass* newCharacterClass = m_pattern.adoptCharacterClass(m_characterClassConstructor.charClass());
    appendTerm(std::make_unique<PatternNode>(newCharacterClass, m_invertCharacterClass));
    m_invertCharacterClass = false;
}

void RegexPatternConstructor::atomParenthesesSubpatternBegin(bool capture)
{
    unsigned subpatternId = 0;
    if (capture)
        subpatternId = ++m_pattern.m_numSubpatterns;

    PatternNode* parenthesesDisjunction = createNode(std::make_unique<PatternNode>(PatternNode::Type::Alternation));
    parenthesesDisjunction->parent = m_alternative;
    appendTerm(PatternNode::createGroup(parenthesesDisjunction, subpatternId, capture));
    m_alternative = addNewAlternative(parenthesesDisjunction);
}

void RegexPatternConstructor::atomParenthesesEnd()
{
    ASSERT(m_alternative->parent);
    ASSERT(m_alternative->parent->parent);

    PatternNode* parenthesesDisjunction = m_alternative->parent;
    m_alternative = parenthesesDisjunction->parent;

    PatternNode*& group = m_alternative->children.back();
    ASSERT(group->type == PatternNode::Type::Group);
    ASSERT(group->body == parenthesesDisjunction);
    group->body = simplifyDisjunction(parenthesesDisjunction);

    // A non-capturing group only delimits its body. Assertions keep the group so
    // that a quantifier still applies to a parenthesized atom.
    if (!group->capture && group->body->type != PatternNode::Type::Assertion)
        group = group->body;
}

void RegexPatternConstructor::quantifyAtom(unsigned min, unsigned max, bool greedy)
{
    ASSERT(min <= max);
    ASSERT(!m_alternative->children.empty());

    PatternNode*& term = m_alternative->children.back();
    ASSERT(term->type != PatternNode::Type::Assertion);
    term = createNode(PatternNode::createRepeat(term, min, max, greedy));
}

void RegexPatternConstructor::disjunction()
{
    ASSERT(m_alternative->parent);
    m_alternative = addNewAlternative(m_alternative->parent);
}

void RegexPatternConstructor::regexBegin()
{
    reset();
    m_body = createNode(std::make_unique<PatternNode>(PatternNode::Type::Alternation));
    m_alternative = addNewAlternative(m_body);
}

void RegexPatternConstructor::regexEnd()
{
    ASSERT(m_body);
    ASSERT(m_alternative->parent == m_body);
    m_pattern.finalize(simplifyDisjunction(m_body));
}

void RegexPatternConstructor::regexError()
{
    reset();
}

SyntaxError compileRegex(std::string_view patternString, RegexPattern& pattern)
{
    RegexPatternConstructor constructor(pattern);

    SyntaxError error = parse(constructor, patternString);
    if (error.hasError()) {
        LOG(RegexCompile, "/%.*s/ failed to compile at offset %u: %s", static_cast<int>(patternString.size()), patternString.data(), error.offset, error.message());
        return error;
    }

    LOG(RegexCompile, "/%.*s/ compiled: %u nodes, %u subpatterns%s%s", static_cast<int>(patternString.size()), patternString.data(),
        pattern.numberOfNodes(), pattern.numSubpatterns(),
        pattern.isAnchoredAtStart() ? ", anchored at start" : "",
        pattern.isLiteralOnly() ? ", literal only" : "");
    return error;
}

} } // namespace Sieve::Regex
