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
#include "RegexInterpreter.h"

#include <algorithm>
#include <support/ASCIICType.h>
#include <support/Logging.h>
#include <support/unicode/UTF8.h>
#include <unordered_set>

namespace Sieve { namespace Regex {

const char* matchStatusName(MatchStatus status)
{
    switch (status) {
    case MatchStatus::NoMatch:
        return "NoMatch";
    case MatchStatus::Match:
        return "Match";
    case MatchStatus::HitLimit:
        return "HitLimit";
    }
    ASSERT_NOT_REACHED();
    return nullptr;
}

MatchResult::MatchResult(std::string_view input, std::vector<unsigned>&& offsets)
    : m_input(input)
    , m_offsets(std::move(offsets))
{
    ASSERT(m_offsets.size() >= 2);
    ASSERT(!(m_offsets.size() % 2));
    ASSERT(m_offsets[0] != offsetNoMatch);
}

MatchSpan MatchResult::span() const
{
    ASSERT(!isEmpty());
    return { m_offsets[0], m_offsets[1] };
}

std::string_view MatchResult::matchedText() const
{
    MatchSpan matchSpan = span();
    return m_input.substr(matchSpan.start, matchSpan.length());
}

unsigned MatchResult::numSubpatterns() const
{
    return isEmpty() ? 0 : m_offsets.size() / 2 - 1;
}

std::optional<MatchSpan> MatchResult::captureSpan(unsigned subpatternId) const
{
    if (subpatternId > numSubpatterns() || isEmpty())
        return std::nullopt;
    unsigned start = m_offsets[2 * subpatternId];
    if (start == offsetNoMatch)
        return std::nullopt;
    return MatchSpan { start, m_offsets[2 * subpatternId + 1] };
}

std::optional<std::string_view> MatchResult::capturedText(unsigned subpatternId) const
{
    auto captured = captureSpan(subpatternId);
    if (!captured)
        return std::nullopt;
    return m_input.substr(captured->start, captured->length());
}

// Matches a pattern tree against decoded input by backtracking. The work that
// remains once a node has matched is a chain of continuation frames, and every
// choice that has not been tried yet is an entry on the backtrack stack. Both
// live in heap vectors, so the native stack does not grow with the input.
class Interpreter {
public:
    Interpreter(const RegexPattern& pattern, const Unicode::DecodedText& input, const MatchOptions& options)
        : m_pattern(pattern)
        , m_input(input.characters.data())
        , m_length(input.length())
        , m_options(options)
        , m_output(2 * (pattern.numSubpatterns() + 1), offsetNoMatch)
        , m_characterRuns(pattern.numberOfNodes())
#if ENABLE(REGEX_MEMOIZATION)
        , m_failedContinuations(pattern.numberOfNodes())
#endif
    {
        ASSERT(m_pattern.body());
    }

    // Failures recorded for one start offset stay valid for the later ones: a
    // node's outcome depends on where it starts, never on where the match began.
    MatchStatus search(unsigned firstStart, unsigned lastStart)
    {
        for (unsigned start = firstStart; start <= lastStart && start <= m_length; ++start) {
            resetForAttempt();
            ++m_startOffsetsTried;

            if (matchFrom(start)) {
                m_output[0] = start;
                m_output[1] = m_matchEnd;
                return MatchStatus::Match;
            }

            if (m_hitLimit)
                return MatchStatus::HitLimit;
        }
        return MatchStatus::NoMatch;
    }

    // Code point indices, in the same layout as MatchResult's offsets.
    const std::vector<unsigned>& output() const { return m_output; }

    unsigned steps() const { return m_steps; }
    unsigned memoHits() const { return m_memoHits; }
    unsigned startOffsetsTried() const { return m_startOffsetsTried; }
    size_t deepestState() const { return m_deepestState; }

private:
    static constexpr int noContinuation = -1;

    struct Frame {
        enum Kind : uint8_t {
            // Match node->children[index] onwards.
            Sequence,
            // An iteration of the Repeat node that began at position has completed; index iterations had completed before it.
            RepeatIteration,
            // The body of the capturing Group node that began at position has matched.
            GroupClose,
        };

        Kind kind;
        const PatternNode* node;
        unsigned index;
        unsigned position;
        int next;
    };

    struct BacktrackEntry {
        enum Kind : uint8_t {
            // Try alternative count of the Alternation node.
            NextAlternative,
            // Leave a greedy Repeat after count iterations.
            RepeatStop,
            // Run one more iteration of a lazy Repeat that has done count.
            RepeatIteration,
            // Hand the next candidate count of a single character Repeat to the continuation.
            RepeatedCharacter,
            // Popping these proves that node (or whatever follows the Repeat node) cannot succeed from position.
            NodeFailed,
            ContinuationFailed,
        };

        Kind kind;
        const PatternNode* node;
        unsigned position;
        unsigned count;
        unsigned matchAmount;
        int continuation;
        unsigned frameCount;
        unsigned captureLogSize;
    };

    // The next thing to run: node at position, or the continuation alone when node is null.
    struct Next {
        const PatternNode* node;
        unsigned position;
        int continuation;
    };

    // Inclusive; begin > end when empty.
    struct PositionRange {
        unsigned begin { 1 };
        unsigned end { 0 };

        bool contains(unsigned position) const { return begin <= position && position <= end; }
    };

    struct CaptureLogEntry {
        unsigned subpatternId;
        unsigned start;
        unsigned end;
    };

    void resetForAttempt()
    {
        std::fill(m_output.begin(), m_output.end(), offsetNoMatch);
        m_captureLog.clear();
        m_frames.clear();
        m_backtrack.clear();
        m_matchEnd = offsetNoMatch;
    }

    bool consumeStep()
    {
        if (m_hitLimit)
            return false;
        ++m_steps;
        if (m_options.matchLimit && m_steps > m_options.matchLimit) {
            m_hitLimit = true;
            return false;
        }
        return true;
    }

    bool matchFrom(unsigned start)
    {
        Next next { m_pattern.body(), start, noContinuation };
        for (;;) {
            size_t state = m_frames.size() + m_backtrack.size();
            m_deepestState = std::max(m_deepestState, state);
            if (m_options.backtrackLimit && state > m_options.backtrackLimit) {
                m_hitLimit = true;
                return false;
            }

            bool advanced = next.node ? matchNode(next) : continueMatch(next);
            if (m_matchEnd != offsetNoMatch)
                return true;
            if (advanced)
                continue;
            if (m_hitLimit || !backtrack(next))
                return false;
        }
    }

    int pushFrame(Frame::Kind kind, const PatternNode& node, unsigned index, unsigned position, int next)
    {
        m_frames.push_back({ kind, &node, index, position, next });
        return static_cast<int>(m_frames.size() - 1);
    }

    void pushBacktrack(BacktrackEntry::Kind kind, const PatternNode& node, unsigned position, unsigned count = 0, unsigned matchAmount = 0, int continuation = noContinuation)
    {
        m_backtrack.push_back({ kind, &node, position, count, matchAmount, continuation,
            static_cast<unsigned>(m_frames.size()), static_cast<unsigned>(m_captureLog.size()) });
    }

#if ENABLE(REGEX_MEMOIZATION)
    bool shouldMemoize(const PatternNode& node) const
    {
        return m_options.memoize && node.memoizable;
    }

    static uint64_t nodeKey(const PatternNode& node, unsigned position)
    {
        return static_cast<uint64_t>(node.index) << 32 | position;
    }

    static uint64_t continuationKey(const PatternNode& repeat, unsigned position)
    {
        return static_cast<uint64_t>(repeat.index | 0x80000000) << 32 | position;
    }

    void recordFailedContinuation(const PatternNode& repeat, unsigned position)
    {
        m_failures.insert(continuationKey(repeat, position));

        PositionRange& failed = m_failedContinuations[repeat.index];
        if (failed.contains(position))
            return;
        if (failed.begin <= failed.end && position + 1 == failed.begin)
            failed.begin = position;
        else if (failed.begin <= failed.end && position == failed.end + 1)
            failed.end = position;
        else if (failed.begin >= failed.end)
            failed = { position, position };
    }
#endif

    bool matchNode(Next& next)
    {
        if (!consumeStep())
            return false;

        const PatternNode& node = *next.node;
        unsigned position = next.position;

#if ENABLE(REGEX_MEMOIZATION)
        if (shouldMemoize(node)) {
            if (m_failures.count(nodeKey(node, position))) {
                ++m_memoHits;
                return false;
            }
            pushBacktrack(BacktrackEntry::NodeFailed, node, position);
        }
#endif

        switch (node.type) {
        case PatternNode::Type::Literal:
        case PatternNode::Type::AnyCharacter:
        case PatternNode::Type::CharacterClass:
            if (position >= m_length || !node.matchesCharacter(m_input[position]))
                return false;
            next = { nullptr, position + 1, next.continuation };
            return true;

        case PatternNode::Type::Concatenation:
            return matchSequence(node, 0, next);

        case PatternNode::Type::Alternation:
            if (node.children.empty())
                return false;
            if (node.children.size() > 1)
                pushBacktrack(BacktrackEntry::NextAlternative, node, position, 1, 0, next.continuation);
            next.node = node.children[0];
            return true;

        case PatternNode::Type::Repeat:
            return matchRepeat(node, 0, next);

        case PatternNode::Type::Group:
            if (node.capture)
                next.continuation = pushFrame(Frame::GroupClose, node, 0, position, next.continuation);
            next.node = node.body;
            return true;

        case PatternNode::Type::Assertion:
            if (!matchAssertion(node, position))
                return false;
            next.node = nullptr;
            return true;
        }

        ASSERT_NOT_REACHED();
        return false;
    }

    bool continueMatch(Next& next)
    {
        ASSERT(!next.node);
        if (next.continuation == noContinuation) {
            m_matchEnd = next.position;
            return true;
        }

        Frame frame = m_frames[next.continuation];
        next.continuation = frame.next;

        switch (frame.kind) {
        case Frame::Sequence:
            return matchSequence(*frame.node, frame.index, next);

        case Frame::RepeatIteration:
            // An iteration that consumed nothing would repeat forever, so it ends the loop.
            if (next.position == frame.position)
                return true;
            return matchRepeat(*frame.node, frame.index + 1, next);

        case Frame::GroupClose:
            setCapture(frame.node->subpatternId, frame.position, next.position);
            return true;
        }

        ASSERT_NOT_REACHED();
        return false;
    }

    bool matchSequence(const PatternNode& sequence, unsigned index, Next& next)
    {
        ASSERT(sequence.type == PatternNode::Type::Concatenation);
        const auto& children = sequence.children;
        if (index == children.size()) {
            next.node = nullptr;
            return true;
        }

        if (index + 1 < children.size())
            next.continuation = pushFrame(Frame::Sequence, sequence, index + 1, 0, next.continuation);
        next.node = children[index];
        return true;
    }

    void beginIteration(const PatternNode& repeat, unsigned count, Next& next)
    {
        next.continuation = pushFrame(Frame::RepeatIteration, repeat, count, next.position, next.continuation);
        next.node = repeat.body;
    }

    bool matchRepeat(const PatternNode& repeat, unsigned count, Next& next)
    {
        ASSERT(repeat.type == PatternNode::Type::Repeat);
        if (!count && repeat.body->isSingleCharacter())
            return matchRepeatedCharacter(repeat, next);

        bool canIterate = count < repeat.maximum;
        bool canStop = count >= repeat.minimum;
        next.node = nullptr;

        if (!canIterate)
            return canStop;

        if (canStop && !repeat.greedy) {
            pushBacktrack(BacktrackEntry::RepeatIteration, repeat, next.position, count, 0, next.continuation);
            return true;
        }

        if (canStop)
            pushBacktrack(BacktrackEntry::RepeatStop, repeat, next.position, count, 0, next.continuation);
        beginIteration(repeat, count, next);
        return true;
    }

    // Characters in [begin, end) match the body of the Repeat node, and the one at end does not.
    unsigned characterRunLength(const PatternNode& repeat, unsigned position)
    {
        PositionRange& run = m_characterRuns[repeat.index];
        if (!run.contains(position)) {
            unsigned end = position;
            while (end < m_length && !run.contains(end) && repeat.body->matchesCharacter(m_input[end]))
                ++end;
            // Scanning backwards from a known run only has to reach it.
            if (run.contains(end))
                end = run.end;
            run = { position, end };
        }
        return std::min(repeat.maximum, run.end - position);
    }

    // A repeated single character needs no per-iteration frames: count how many
    // could match, then hand each candidate end position to the continuation in
    // greedy or lazy order.
    bool matchRepeatedCharacter(const PatternNode& repeat, Next& next)
    {
        next.node = nullptr;
        unsigned matchAmount = characterRunLength(repeat, next.position);
        if (matchAmount < repeat.minimum)
            return false;

        unsigned count = repeat.greedy ? matchAmount : repeat.minimum;
        return tryRepeatedCharacter(repeat, next.position, count, matchAmount, next);
    }

#if ENABLE(REGEX_MEMOIZATION)
    // Moves count past end positions whose continuation is already known to
    // fail. Returns false when no candidate is left.
    bool skipFailedContinuations(const PatternNode& repeat, unsigned start, unsigned& count, unsigned matchAmount)
    {
        const PositionRange& failed = m_failedContinuations[repeat.index];
        for (;;) {
            if (failed.contains(start + count)) {
                ++m_memoHits;
                if (repeat.greedy) {
                    if (failed.begin <= start + repeat.minimum)
                        return false;
                    count = failed.begin - start - 1;
                } else {
                    if (failed.end >= start + matchAmount)
                        return false;
                    count = failed.end - start + 1;
                }
            }

            if (!m_failures.count(continuationKey(repeat, start + count)))
                return true;

            ++m_memoHits;
            if (!consumeStep() || count == (repeat.greedy ? repeat.minimum : matchAmount))
                return false;
            if (repeat.greedy)
                --count;
            else
                ++count;
        }
    }
#endif

    bool tryRepeatedCharacter(const PatternNode& repeat, unsigned start, unsigned count, unsigned matchAmount, Next& next)
    {
#if ENABLE(REGEX_MEMOIZATION)
        bool memoize = shouldMemoize(repeat);
        if (memoize && !skipFailedContinuations(repeat, start, count, matchAmount))
            return false;
#endif
        if (!consumeStep())
            return false;

        if (repeat.greedy && count > repeat.minimum)
            pushBacktrack(BacktrackEntry::RepeatedCharacter, repeat, start, count - 1, matchAmount, next.continuation);
        else if (!repeat.greedy && count < matchAmount)
            pushBacktrack(BacktrackEntry::RepeatedCharacter, repeat, start, count + 1, matchAmount, next.continuation);

#if ENABLE(REGEX_MEMOIZATION)
        if (memoize)
            pushBacktrack(BacktrackEntry::ContinuationFailed, repeat, start + count);
#endif

        next = { nullptr, start + count, next.continuation };
        return true;
    }

    // Pops the backtrack stack until an untried choice is found, restoring the
    // frames and captures it was taken with.
    bool backtrack(Next& next)
    {
        while (!m_backtrack.empty()) {
            BacktrackEntry entry = m_backtrack.back();
            m_backtrack.pop_back();

            if (entry.kind == BacktrackEntry::NodeFailed || entry.kind == BacktrackEntry::ContinuationFailed) {
#if ENABLE(REGEX_MEMOIZATION)
                if (entry.kind == BacktrackEntry::NodeFailed)
                    m_failures.insert(nodeKey(*entry.node, entry.position));
                else
                    recordFailedContinuation(*entry.node, entry.position);
#endif
                continue;
            }

            m_frames.erase(m_frames.begin() + entry.frameCount, m_frames.end());
            rollbackCaptures(entry.captureLogSize);
            next = { nullptr, entry.position, entry.continuation };

            switch (entry.kind) {
            case BacktrackEntry::NextAlternative:
                if (entry.count + 1 < entry.node->children.size())
                    pushBacktrack(BacktrackEntry::NextAlternative, *entry.node, entry.position, entry.count + 1, 0, entry.continuation);
                next.node = entry.node->children[entry.count];
                return true;

            case BacktrackEntry::RepeatStop:
                return true;

            case BacktrackEntry::RepeatIteration:
                beginIteration(*entry.node, entry.count, next);
                return true;

            case BacktrackEntry::RepeatedCharacter:
                if (tryRepeatedCharacter(*entry.node, entry.position, entry.count, entry.matchAmount, next))
                    return true;
                if (m_hitLimit)
                    return false;
                break;

            case BacktrackEntry::NodeFailed:
            case BacktrackEntry::ContinuationFailed:
                ASSERT_NOT_REACHED();
                break;
            }
        }
        return false;
    }

    void setCapture(unsigned subpatternId, unsigned start, unsigned end)
    {
        ASSERT(subpatternId && subpatternId <= m_pattern.numSubpatterns());
        m_captureLog.push_back({ subpatternId, m_output[2 * subpatternId], m_output[2 * subpatternId + 1] });
        m_output[2 * subpatternId] = start;
        m_output[2 * subpatternId + 1] = end;
    }

    void rollbackCaptures(size_t checkpoint)
    {
        while (m_captureLog.size() > checkpoint) {
            const CaptureLogEntry& entry = m_captureLog.back();
            m_output[2 * entry.subpatternId] = entry.start;
            m_output[2 * entry.subpatternId + 1] = entry.end;
            m_captureLog.pop_back();
        }
    }

    bool isWordchar(unsigned position)
    {
        return position < m_length && isASCIIWordCharacter(m_input[position]);
    }

    bool matchAssertion(const PatternNode& assertion, unsigned position)
    {
        switch (assertion.assertionType) {
        case AssertionType::BeginningOfInput:
            return !position;
        case AssertionType::EndOfInput:
            return position == m_length;
        case AssertionType::WordBoundary: {
            bool prevIsWordchar = position && isWordchar(position - 1);
            bool wordBoundary = prevIsWordchar != isWordchar(position);
            return assertion.invert ? !wordBoundary : wordBoundary;
        }
        }
        ASSERT_NOT_REACHED();
        return false;
    }

    const RegexPattern& m_pattern;
    const UChar32* m_input;
    unsigned m_length;
    const MatchOptions& m_options;

    std::vector<unsigned> m_output;
    std::vector<CaptureLogEntry> m_captureLog;
    std::vector<Frame> m_frames;
    std::vector<BacktrackEntry> m_backtrack;
    // Indexed by the Repeat node, for single character bodies only.
    std::vector<PositionRange> m_characterRuns;
#if ENABLE(REGEX_MEMOIZATION)
    std::unordered_set<uint64_t> m_failures;
    // The widest run of end positions known to fail after each single character Repeat node.
    std::vector<PositionRange> m_failedContinuations;
#endif
    unsigned m_matchEnd { offsetNoMatch };
    bool m_hitLimit { false };

    unsigned m_steps { 0 };
    unsigned m_memoHits { 0 };
    unsigned m_startOffsetsTried { 0 };
    size_t m_deepestState { 0 };

    SIEVE_MAKE_NONCOPYABLE(Interpreter);
};

static MatchStatus runInterpreter(const RegexPattern& pattern, std::string_view input, unsigned startOffset, bool onlyAtStartOffset, MatchResult& result, const MatchOptions& options)
{
    result = MatchResult();

    if (!pattern.body()) {
        LOG_ERROR("Attempted to match with a pattern that failed to compile");
        return MatchStatus::NoMatch;
    }

    Unicode::DecodedText text;
    if (!Unicode::decodeUTF8(input, text, Unicode::ConversionMode::Lenient)) {
        LOG_ERROR("Input of %zu bytes is too large to search", input.size());
        return MatchStatus::HitLimit;
    }

    unsigned startIndex;
    if (!Unicode::characterIndexForByteOffset(text, startOffset, startIndex)) {
        LOG_ERROR("Start offset %u is not on a code point boundary of the input", startOffset);
        return MatchStatus::NoMatch;
    }

    // A pattern anchored at the beginning of input can only match at offset 0.
    unsigned lastStart = onlyAtStartOffset ? startIndex : text.length();
    if (pattern.isAnchoredAtStart())
        lastStart = 0;

    Interpreter interpreter(pattern, text, options);
    MatchStatus status = interpreter.search(startIndex, lastStart);

    LOG(RegexMatch, "%s after %u start offsets, %u steps, %u memoized failures reused, %zu backtracking entries at most", matchStatusName(status),
        interpreter.startOffsetsTried(), interpreter.steps(), interpreter.memoHits(), interpreter.deepestState());

    if (status != MatchStatus::Match)
        return status;

    std::vector<unsigned> offsets = interpreter.output();
    for (auto& offset : offsets) {
        if (offset != offsetNoMatch)
            offset = text.byteOffset(offset);
    }
    result = MatchResult(input, std::move(offsets));
    return status;
}

MatchStatus interpretRegex(const RegexPattern& pattern, std::string_view input, unsigned startOffset, MatchResult& result, const MatchOptions& options)
{
    return runInterpreter(pattern, input, startOffset, false, result, options);
}

MatchStatus matchRegexAt(const RegexPattern& pattern, std::string_view input, unsigned offset, MatchResult& result, const MatchOptions& options)
{
    return runInterpreter(pattern, input, offset, true, result, options);
}

std::optional<MatchResult> findRegex(const RegexPattern& pattern, std::string_view input)
{
    MatchResult result;
    MatchStatus status = interpretRegex(pattern, input, 0, result, MatchOptions::unlimited());
    switch (status) {
    case MatchStatus::Match:
        return result;
    case MatchStatus::NoMatch:
        return std::nullopt;
    case MatchStatus::HitLimit:
        LOG_ERROR("Search of %zu bytes could not be completed", input.size());
        return std::nullopt;
    }
    ASSERT_NOT_REACHED();
    return std::nullopt;
}

} } // namespace Sieve::Regex
