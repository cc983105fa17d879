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

#ifndef RegexPattern_h
#define RegexPattern_h

#include <climits>
#include <cstdint>
#include <memory>
#include <string>
#include <support/Noncopyable.h>
#include <unicode/umachine.h>
#include <vector>

namespace Sieve { namespace Regex {

static constexpr unsigned quantifyInfinite = UINT_MAX;

struct CharacterRange {
    UChar32 begin;
    UChar32 end;

    CharacterRange(UChar32 begin, UChar32 end)
        : begin(begin)
        , end(end)
    {
    }
};

// Both vectors are kept sorted and the ranges never overlap. An empty class
// matches nothing.
struct CharacterClass {
    std::vector<UChar32> m_matches;
    std::vector<CharacterRange> m_ranges;

    bool contains(UChar32) const;
    bool isEmpty() const { return m_matches.empty() && m_ranges.empty(); }
};

enum class AssertionType : uint8_t {
    BeginningOfInput,
    EndOfInput,
    WordBoundary,
};

struct PatternNode {
    enum class Type : uint8_t {
        Literal,
        AnyCharacter,
        CharacterClass,
        Concatenation,
        Alternation,
        Repeat,
        Group,
        Assertion,
    };
    static constexpr unsigned numberOfTypes = 8;

    explicit PatternNode(Type type)
        : type(type)
    {
    }

    explicit PatternNode(UChar32 character)
        : type(Type::Literal)
        , character(character)
    {
    }

    PatternNode(const Regex::CharacterClass* characterClass, bool invert)
        : type(Type::CharacterClass)
        , invert(invert)
        , characterClass(characterClass)
    {
    }

    PatternNode(AssertionType assertionType, bool invert)
        : type(Type::Assertion)
        , invert(invert)
        , assertionType(assertionType)
    {
    }

    static std::unique_ptr<PatternNode> createRepeat(PatternNode* body, unsigned minimum, unsigned maximum, bool greedy)
    {
        auto node = std::make_unique<PatternNode>(Type::Repeat);
        node->body = body;
        node->minimum = minimum;
        node->maximum = maximum;
        node->greedy = greedy;
        return node;
    }

    static std::unique_ptr<PatternNode> createGroup(PatternNode* body, unsigned subpatternId, bool capture)
    {
        auto node = std::make_unique<PatternNode>(Type::Group);
        node->body = body;
        node->subpatternId = subpatternId;
        node->capture = capture;
        return node;
    }

    bool isSingleCharacter() const
    {
        return type == Type::Literal || type == Type::AnyCharacter || type == Type::CharacterClass;
    }

    bool matchesCharacter(UChar32) const;

    Type type;
    // CharacterClass: matches code points outside the class. Assertion: a \B rather than a \b.
    bool invert { false };

    UChar32 character { 0 };
    const Regex::CharacterClass* characterClass { nullptr };
    AssertionType assertionType { AssertionType::BeginningOfInput };

    // Concatenation and Alternation, in pattern order.
    std::vector<PatternNode*> children;

    // Repeat and Group.
    PatternNode* body { nullptr };
    unsigned minimum { 1 };
    unsigned maximum { 1 };
    bool greedy { true };
    bool capture { false };
    unsigned subpatternId { 0 };

    // Pre-order position in the finished tree, used as the memoization key.
    unsigned index { 0 };
    // True when every enclosing Repeat behaves the same whatever its iteration
    // count, so a failure at a given offset can be cached for this node.
    bool memoizable { false };

    // Only used while the tree is being built.
    PatternNode* parent { nullptr };
};

const char* nodeTypeName(PatternNode::Type);

// "zero or more (*)", "between {2,4}", etc. Non-greedy quantifiers get " (lazy)" appended.
std::string describeQuantifier(unsigned minimum, unsigned maximum, bool greedy);

struct RegexPattern {
    RegexPattern();

    void reset();

    PatternNode* adoptNode(std::unique_ptr<PatternNode>);
    CharacterClass* adoptCharacterClass(std::unique_ptr<CharacterClass>);

    const CharacterClass* digitsCharacterClass();
    const CharacterClass* spacesCharacterClass();
    const CharacterClass* wordcharCharacterClass();
    const CharacterClass* nondigitsCharacterClass();
    const CharacterClass* nonspacesCharacterClass();
    const CharacterClass* nonwordcharCharacterClass();

    // Numbers the nodes reachable from body in pre-order and computes the
    // derived flags below. The tree must not change afterwards.
    void finalize(PatternNode* body);

    const PatternNode* body() const { return m_body; }
    unsigned numSubpatterns() const { return m_numSubpatterns; }
    unsigned numberOfNodes() const { return m_nodesInPreorder.size(); }
    const PatternNode& nodeAt(unsigned index) const { return *m_nodesInPreorder[index]; }

    bool containsAlternation() const { return m_containsAlternation; }
    bool isAnchoredAtStart() const { return m_anchoredAtStart; }
    bool isLiteralOnly() const { return m_literalOnly; }

    PatternNode* m_body { nullptr };
    unsigned m_numSubpatterns { 0 };
    bool m_containsAlternation { false };
    bool m_anchoredAtStart { false };
    bool m_literalOnly { false };
    std::vector<std::unique_ptr<PatternNode>> m_nodes;
    std::vector<const PatternNode*> m_nodesInPreorder;
    std::vector<std::unique_ptr<CharacterClass>> m_userCharacterClasses;

private:
    void numberNodes(PatternNode*, bool continuationIsStable);

    CharacterClass* m_digitsCached { nullptr };
    CharacterClass* m_spacesCached { nullptr };
    CharacterClass* m_wordcharCached { nullptr };
    CharacterClass* m_nondigitsCached { nullptr };
    CharacterClass* m_nonspacesCached { nullptr };
    CharacterClass* m_nonwordcharCached { nullptr };

    SIEVE_MAKE_NONCOPYABLE(RegexPattern);
};

} } // namespace Sieve::Regex

#endif // RegexPattern_h
