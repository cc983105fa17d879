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
#include "RegexPattern.h"

#include <algorithm>
#include <support/Assertions.h>

namespace Sieve { namespace Regex {

static constexpr UChar32 maximumCodePoint = 0x10FFFF;

bool CharacterClass::contains(UChar32 character) const
{
    if (std::binary_search(m_matches.begin(), m_matches.end(), character))
        return true;

    // Find the first range that ends at or after the character.
    auto range = std::lower_bound(m_ranges.begin(), m_ranges.end(), character, [](const CharacterRange& range, UChar32 character) {
        return range.end < character;
    });
    return range != m_ranges.end() && range->begin <= character;
}

bool PatternNode::matchesCharacter(UChar32 input) const
{
    switch (type) {
    case Type::Literal:
        return input == character;
    case Type::AnyCharacter:
        return true;
    case Type::CharacterClass:
        return characterClass->contains(input) != invert;
    case Type::Concatenation:
    case Type::Alternation:
    case Type::Repeat:
    case Type::Group:
    case Type::Assertion:
        break;
    }
    ASSERT_NOT_REACHED();
    return false;
}

const char* nodeTypeName(PatternNode::Type type)
{
    switch (type) {
    case PatternNode::Type::Literal:
        return "Literal";
    case PatternNode::Type::AnyCharacter:
        return "AnyCharacter";
    case PatternNode::Type::CharacterClass:
        return "CharacterClass";
    case PatternNode::Type::Concatenation:
        return "Concatenation";
    case PatternNode::Type::Alternation:
        return "Alternation";
    case PatternNode::Type::Repeat:
        return "Repeat";
    case PatternNode::Type::Group:
        return "Group";
    case PatternNode::Type::Assertion:
        return "Assertion";
    }
    ASSERT_NOT_REACHED();
    return nullptr;
}

std::string describeQuantifier(unsigned minimum, unsigned maximum, bool greedy)
{
    ASSERT(minimum <= maximum);

    std::string description;
    if (!minimum && maximum == quantifyInfinite)
        description = "zero or more (*)";
    else if (minimum == 1 && maximum == quantifyInfinite)
        description = "one or more (+)";
    else if (!minimum && maximum == 1)
        description = "optional (?)";
    else if (minimum == maximum)
        description = "exactly {" + std::to_string(minimum) + "}";
    else if (maximum != quantifyInfinite)
        description = "between {" + std::to_string(minimum) + "," + std::to_string(maximum) + "}";
    else
        description = "at least {" + std::to_string(minimum) + ",}";

    if (!greedy)
        description += " (lazy)";
    return description;
}

static std::unique_ptr<CharacterClass> digitsCreate()
{
    auto characterClass = std::make_unique<CharacterClass>();
    characterClass->m_ranges.emplace_back('0', '9');
    return characterClass;
}

static std::unique_ptr<CharacterClass> spacesCreate()
{
    auto characterClass = std::make_unique<CharacterClass>();
    characterClass->m_ranges.emplace_back('\t', '\r');
    characterClass->m_matches.push_back(' ');
    return characterClass;
}

static std::unique_ptr<CharacterClass> wordcharCreate()
{
    auto characterClass = std::make_unique<CharacterClass>();
    characterClass->m_ranges.emplace_back('0', '9');
    characterClass->m_ranges.emplace_back('A', 'Z');
    characterClass->m_ranges.emplace_back('a', 'z');
    characterClass->m_matches.push_back('_');
    return characterClass;
}

static std::unique_ptr<CharacterClass> nondigitsCreate()
{
    auto characterClass = std::make_unique<CharacterClass>();
    characterClass->m_ranges.emplace_back(0, '0' - 1);
    characterClass->m_ranges.emplace_back('9' + 1, maximumCodePoint);
    return characterClass;
}

static std::unique_ptr<CharacterClass> nonspacesCreate()
{
    auto characterClass = std::make_unique<CharacterClass>();
    characterClass->m_ranges.emplace_back(0, '\t' - 1);
    characterClass->m_ranges.emplace_back('\r' + 1, ' ' - 1);
    characterClass->m_ranges.emplace_back(' ' + 1, maximumCodePoint);
    return characterClass;
}

static std::unique_ptr<CharacterClass> nonwordcharCreate()
{
    auto characterClass = std::make_unique<CharacterClass>();
    characterClass->m_ranges.emplace_back(0, '0' - 1);
    characterClass->m_ranges.emplace_back('9' + 1, 'A' - 1);
    characterClass->m_ranges.emplace_back('Z' + 1, '_' - 1);
    characterClass->m_matches.push_back('`');
    characterClass->m_ranges.emplace_back('z' + 1, maximumCodePoint);
    return characterClass;
}

RegexPattern::RegexPattern() = default;

void RegexPattern::reset()
{
    m_body = nullptr;
    m_numSubpatterns = 0;
    m_containsAlternation = false;
    m_anchoredAtStart = false;
    m_literalOnly = false;

    m_digitsCached = nullptr;
    m_spacesCached = nullptr;
    m_wordcharCached = nullptr;
    m_nondigitsCached = nullptr;
    m_nonspacesCached = nullptr;
    m_nonwordcharCached = nullptr;

    m_nodes.clear();
    m_nodesInPreorder.clear();
    m_userCharacterClasses.clear();
}

PatternNode* RegexPattern::adoptNode(std::unique_ptr<PatternNode> node)
{
    m_nodes.push_back(std::move(node));
    return m_nodes.back().get();
}

CharacterClass* RegexPattern::adoptCharacterClass(std::unique_ptr<CharacterClass> characterClass)
{
    m_userCharacterClasses.push_back(std::move(characterClass));
    return m_userCharacterClasses.back().get();
}

const CharacterClass* RegexPattern::digitsCharacterClass()
{
    if (!m_digitsCached)
        m_digitsCached = adoptCharacterClass(digitsCreate());
    return m_digitsCached;
}

const CharacterClass* RegexPattern::spacesCharacterClass()
{
    if (!m_spacesCached)
        m_spacesCached = adoptCharacterClass(spacesCreate());
    return m_spacesCached;
}

const CharacterClass* RegexPattern::wordcharCharacterClass()
{
    if (!m_wordcharCached)
        m_wordcharCached = adoptCharacterClass(wordcharCreate());
    return m_wordcharCached;
}

const CharacterClass* RegexPattern::nondigitsCharacterClass()
{
    if (!m_nondigitsCached)
        m_nondigitsCached = adoptCharacterClass(nondigitsCreate());
    return m_nondigitsCached;
}

const CharacterClass* RegexPattern::nonspacesCharacterClass()
{
    if (!m_nonspacesCached)
        m_nonspacesCached = adoptCharacterClass(nonspacesCreate());
    return m_nonspacesCached;
}

const CharacterClass* RegexPattern::nonwordcharCharacterClass()
{
    if (!m_nonwordcharCached)
        m_nonwordcharCached = adoptCharacterClass(nonwordcharCreate());
    return m_nonwordcharCached;
}

// A Repeat hands its body the same continuation on every iteration only when
// whether it may iterate again and whether it may stop do not depend on how
// many iterations have completed.
static bool isCountInsensitive(const PatternNode& repeat)
{
    ASSERT(repeat.type == PatternNode::Type::Repeat);
    if (repeat.maximum <= 1)
        return true;
    return repeat.maximum == quantifyInfinite && repeat.minimum <= 1;
}

static bool isAnchoredAtStart(const PatternNode& node)
{
    switch (node.type) {
    case PatternNode::Type::Assertion:
        return node.assertionType == AssertionType::BeginningOfInput;
    case PatternNode::Type::Concatenation:
        return !node.children.empty() && isAnchoredAtStart(*node.children.front());
    case PatternNode::Type::Alternation:
        if (node.children.empty())
            return false;
        for (auto* child : node.children) {
            if (!isAnchoredAtStart(*child))
                return false;
        }
        return true;
    case PatternNode::Type::Group:
        return isAnchoredAtStart(*node.body);
    case PatternNode::Type::Repeat:
        return node.minimum && isAnchoredAtStart(*node.body);
    case PatternNode::Type::Literal:
    case PatternNode::Type::AnyCharacter:
    case PatternNode::Type::CharacterClass:
        return false;
    }
    ASSERT_NOT_REACHED();
    return false;
}

static bool isLiteralOnly(const PatternNode& node)
{
    switch (node.type) {
    case PatternNode::Type::Literal:
        return true;
    case PatternNode::Type::Concatenation:
        for (auto* child : node.children) {
            if (!isLiteralOnly(*child))
                return false;
        }
        return true;
    case PatternNode::Type::Alternation:
        return node.children.size() == 1 && isLiteralOnly(*node.children.front());
    case PatternNode::Type::Group:
        return isLiteralOnly(*node.body);
    case PatternNode::Type::AnyCharacter:
    case PatternNode::Type::CharacterClass:
    case PatternNode::Type::Repeat:
    case PatternNode::Type::Assertion:
        return false;
    }
    ASSERT_NOT_REACHED();
    return false;
}

void RegexPattern::numberNodes(PatternNode* node, bool continuationIsStable)
{
    node->index = m_nodesInPreorder.size();
    node->memoizable = continuationIsStable;
    m_nodesInPreorder.push_back(node);

    switch (node->type) {
    case PatternNode::Type::Concatenation:
        for (auto* child : node->children)
            numberNodes(child, continuationIsStable);
        break;
    case PatternNode::Type::Alternation:
        if (node->children.size() > 1)
            m_containsAlternation = true;
        for (auto* child : node->children)
            numberNodes(child, continuationIsStable);
        break;
    case PatternNode::Type::Repeat:
        numberNodes(node->body, continuationIsStable && isCountInsensitive(*node));
        break;
    case PatternNode::Type::Group:
        numberNodes(node->body, continuationIsStable);
        break;
    case PatternNode::Type::Literal:
    case PatternNode::Type::AnyCharacter:
    case PatternNode::Type::CharacterClass:
    case PatternNode::Type::Assertion:
        break;
    }
}

void RegexPattern::finalize(PatternNode* body)
{
    ASSERT(body);
    m_body = body;
    m_containsAlternation = false;
    m_nodesInPreorder.clear();
    m_nodesInPreorder.reserve(m_nodes.size());

    numberNodes(m_body, true);

    m_anchoredAtStart = Regex::isAnchoredAtStart(*m_body);
    m_literalOnly = Regex::isLiteralOnly(*m_body);

    for (auto& node : m_nodes)
        node->parent = nullptr;
}

} } // namespace Sieve::Regex
