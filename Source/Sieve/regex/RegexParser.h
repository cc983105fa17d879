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

#ifndef RegexParser_h
#define RegexParser_h

#include "RegexErrorCode.h"
#include "RegexPattern.h"
#include <cstdint>
#include <string_view>
#include <support/ASCIICType.h>
#include <support/Assertions.h>
#include <support/unicode/UTF8.h>

namespace Sieve { namespace Regex {

enum BuiltInCharacterClassID {
    DigitClassID,
    SpaceClassID,
    WordClassID,
};

// The Parser class should not be used directly - only via the Regex::parse() method.
template<class Delegate>
class Parser {
private:
    template<class FriendDelegate>
    friend SyntaxError parse(FriendDelegate&, std::string_view pattern);

    /*
     * CharacterClassParserDelegate:
     *
     * The class CharacterClassParserDelegate is used in the parsing of character
     * classes. This class handles detection of character ranges. This class
     * implements enough of the delegate interface such that it can be passed to
     * parseEscape() as an EscapeDelegate. This allows parseEscape() to be reused
     * to perform the parsing of escape characters in character sets.
     */
    class CharacterClassParserDelegate {
    public:
        CharacterClassParserDelegate(Delegate& delegate, ErrorCode& err)
            : m_delegate(delegate)
            , m_err(err)
            , m_state(Empty)
            , m_character(0)
        {
        }

        void begin(bool invert)
        {
            m_delegate.atomCharacterClassBegin(invert);
        }

        /*
         * atomLeadingBracket():
         *
         * A ']' directly after '[' or '[^' is a member, and never the start of a range.
         */
        void atomLeadingBracket()
        {
            ASSERT(m_state == Empty);
            m_delegate.atomCharacterClassAtom(']');
        }

        /*
         * atomPatternCharacterUnescaped():
         *
         * This method is called directly from parseCharacterClass(), to report a new
         * pattern character token. This method differs from atomPatternCharacter(),
         * which will be called from parseEscape(), since a hyphen provided via this
         * method may be indicating a character range, but a hyphen parsed by
         * parseEscape() cannot be interpreted as doing so.
         */
        void atomPatternCharacterUnescaped(UChar32 ch)
        {
            switch (m_state) {
            case Empty:
                m_character = ch;
                m_state = CachedCharacter;
                break;

            case CachedCharacter:
                if (ch == '-')
                    m_state = CachedCharacterHyphen;
                else {
                    m_delegate.atomCharacterClassAtom(m_character);
                    m_character = ch;
                }
                break;

            case CachedCharacterHyphen:
                if (ch >= m_character)
                    m_delegate.atomCharacterClassRange(m_character, ch);
                else
                    m_err = ErrorCode::CharacterClassOutOfOrder;
                m_state = Empty;
            }
        }

        /*
         * atomPatternCharacter():
         *
         * Adds a pattern character, called by parseEscape(), as such will not
         * interpret a hyphen as indicating a character range.
         */
        void atomPatternCharacter(UChar32 ch)
        {
            // Flush if a character is already pending to prevent the
            // hyphen from being interpreted as indicating a range.
            if (ch == '-' && m_state == CachedCharacter)
                flush();

            atomPatternCharacterUnescaped(ch);
        }

        void atomBuiltInCharacterClass(BuiltInCharacterClassID classID, bool invert)
        {
            flush();
            m_delegate.atomCharacterClassBuiltIn(classID, invert);
        }

        void end()
        {
            flush();
            m_delegate.atomCharacterClassEnd();
        }

        // parseEscape() should never call these delegate methods when
        // invoked with inCharacterClass set.
        void assertionWordBoundary(bool) { ASSERT_NOT_REACHED(); }

    private:
        void flush()
        {
            if (m_state != Empty) // either CachedCharacter or CachedCharacterHyphen
                m_delegate.atomCharacterClassAtom(m_character);
            if (m_state == CachedCharacterHyphen)
                m_delegate.atomCharacterClassAtom('-');
            m_state = Empty;
        }

        Delegate& m_delegate;
        ErrorCode& m_err;
        enum CharacterClassConstructionState {
            Empty,
            CachedCharacter,
            CachedCharacterHyphen,
        } m_state;
        UChar32 m_character;
    };

    Parser(Delegate& delegate, const Unicode::DecodedText& pattern)
        : m_delegate(delegate)
        , m_err(ErrorCode::NoError)
        , m_errorIndex(0)
        , m_data(pattern.characters.data())
        , m_offsets(pattern.offsets.data())
        , m_size(pattern.length())
        , m_index(0)
        , m_parenthesesNestingDepth(0)
    {
    }

    void setError(ErrorCode error, unsigned index)
    {
        ASSERT(!hasError(m_err));
        ASSERT(index <= m_size);
        m_err = error;
        m_errorIndex = index;
    }

    /*
     * parseEscape():
     *
     * Helper for parseTokens() AND parseCharacterClass().
     * Unlike the other parser methods, this function does not report tokens
     * directly to the member delegate (m_delegate), instead tokens are
     * emitted to the delegate provided as an argument. In the case of atom
     * escapes, parseTokens() will call parseEscape() passing m_delegate as
     * an argument, and as such the escape will be reported to the delegate.
     *
     * However this method may also be used by parseCharacterClass(), in which
     * case a CharacterClassParserDelegate will be passed as the delegate that
     * tokens should be added to. A boolean flag is also provided to indicate
     * whether an escape in a character class is being parsed (some parsing
     * rules change in this context).
     *
     * The boolean value returned by this method indicates whether the token
     * parsed was an atom (outside of a character class \b and \B will be
     * interpreted as assertions).
     */
    template<bool inCharacterClass, class EscapeDelegate>
    bool parseEscape(EscapeDelegate& delegate)
    {
        ASSERT(!hasError(m_err));
        ASSERT(peek() == '\\');
        unsigned escapeIndex = m_index;
        consume();

        if (atEndOfPattern()) {
            setError(ErrorCode::EscapeUnterminated, escapeIndex);
            return false;
        }

        switch (peek()) {
        // Assertions
        case 'b':
            consume();
            if (inCharacterClass)
                delegate.atomPatternCharacter('\b');
            else {
                delegate.assertionWordBoundary(false);
                return false;
            }
            break;
        case 'B':
            consume();
            if (inCharacterClass)
                delegate.atomPatternCharacter('B');
            else {
                delegate.assertionWordBoundary(true);
                return false;
            }
            break;

        // CharacterClassEscape
        case 'd':
            consume();
            delegate.atomBuiltInCharacterClass(DigitClassID, false);
            break;
        case 's':
            consume();
            delegate.atomBuiltInCharacterClass(SpaceClassID, false);
            break;
        case 'w':
            consume();
            delegate.atomBuiltInCharacterClass(WordClassID, false);
            break;
        case 'D':
            consume();
            delegate.atomBuiltInCharacterClass(DigitClassID, true);
            break;
        case 'S':
            consume();
            delegate.atomBuiltInCharacterClass(SpaceClassID, true);
            break;
        case 'W':
            consume();
            delegate.atomBuiltInCharacterClass(WordClassID, true);
            break;

        // DecimalEscape
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            if (!inCharacterClass) {
                setError(ErrorCode::BackReferenceUnsupported, escapeIndex);
                return false;
            }
            delegate.atomPatternCharacter(consume());
            break;

        case '0':
            consume();
            delegate.atomPatternCharacter(0);
            break;

        // ControlEscape
        case 'f':
            consume();
            delegate.atomPatternCharacter('\f');
            break;
        case 'n':
            consume();
            delegate.atomPatternCharacter('\n');
            break;
        case 'r':
            consume();
            delegate.atomPatternCharacter('\r');
            break;
        case 't':
            consume();
            delegate.atomPatternCharacter('\t');
            break;
        case 'v':
            consume();
            delegate.atomPatternCharacter('\v');
            break;

        // HexEscape
        case 'x': {
            consume();
            int x = tryConsumeHex(2);
            if (x == -1)
                delegate.atomPatternCharacter('x');
            else
                delegate.atomPatternCharacter(x);
            break;
        }

        // UnicodeEscape
        case 'u': {
            consume();
            int u = tryConsumeHex(4);
            if (u == -1)
                delegate.atomPatternCharacter('u');
            else
                delegate.atomPatternCharacter(u);
            break;
        }

        // IdentityEscape
        default:
            delegate.atomPatternCharacter(consume());
        }

        return true;
    }

    /*
     * parseAtomEscape(), parseCharacterClassEscape():
     *
     * These methods alias to parseEscape().
     */
    bool parseAtomEscape()
    {
        return parseEscape<false>(m_delegate);
    }
    void parseCharacterClassEscape(CharacterClassParserDelegate& delegate)
    {
        parseEscape<true>(delegate);
    }

    /*
     * parseCharacterClass():
     *
     * Helper for parseTokens(); calls directly and indirectly (via parseCharacterClassEscape)
     * to an instance of CharacterClassParserDelegate, to describe the character class to the
     * delegate.
     */
    void parseCharacterClass()
    {
        ASSERT(!hasError(m_err));
        ASSERT(peek() == '[');
        consume();

        CharacterClassParserDelegate characterClassConstructor(m_delegate, m_err);

        characterClassConstructor.begin(tryConsume('^'));

        if (tryConsume(']'))
            characterClassConstructor.atomLeadingBracket();

        while (!atEndOfPattern()) {
            unsigned elementIndex = m_index;

            switch (peek()) {
            case ']':
                consume();
                characterClassConstructor.end();
                return;

            case '\\':
                parseCharacterClassEscape(characterClassConstructor);
                break;

            default:
                characterClassConstructor.atomPatternCharacterUnescaped(consume());
            }

            if (hasError(m_err)) {
                // Errors found by the class delegate have no position of their own.
                if (m_err == ErrorCode::CharacterClassOutOfOrder)
                    m_errorIndex = elementIndex;
                return;
            }
        }

        setError(ErrorCode::CharacterClassUnmatched, m_size);
    }

    /*
     * parseParenthesesBegin():
     *
     * Helper for parseTokens(); checks for parentheses types other than regular capturing subpatterns.
     */
    void parseParenthesesBegin()
    {
        ASSERT(!hasError(m_err));
        ASSERT(peek() == '(');
        unsigned parenthesesIndex = m_index;
        consume();

        if (m_parenthesesNestingDepth >= maxParenthesesNestingDepth) {
            setError(ErrorCode::PatternTooLarge, parenthesesIndex);
            return;
        }

        if (tryConsume('?')) {
            if (atEndOfPattern() || peek() != ':') {
                setError(ErrorCode::ParenthesesTypeInvalid, m_index);
                return;
            }
            consume();
            m_delegate.atomParenthesesSubpatternBegin(false);
        } else
            m_delegate.atomParenthesesSubpatternBegin();

        ++m_parenthesesNestingDepth;
    }

    /*
     * parseParenthesesEnd():
     *
     * Helper for parseTokens(); checks for parse errors (due to unmatched parentheses).
     */
    void parseParenthesesEnd()
    {
        ASSERT(!hasError(m_err));
        ASSERT(peek() == ')');

        if (!m_parenthesesNestingDepth) {
            setError(ErrorCode::ParenthesesUnmatched, m_index);
            return;
        }

        consume();
        m_delegate.atomParenthesesEnd();
        --m_parenthesesNestingDepth;
    }

    /*
     * parseQuantifier():
     *
     * Helper for parseTokens(); checks for parse errors and non-greedy quantifiers.
     */
    void parseQuantifier(bool lastTokenWasAnAtom, unsigned min, unsigned max, unsigned quantifierIndex)
    {
        ASSERT(!hasError(m_err));
        ASSERT(min <= max);

        if (lastTokenWasAnAtom)
            m_delegate.quantifyAtom(min, max, !tryConsume('?'));
        else
            setError(ErrorCode::QuantifierWithoutAtom, quantifierIndex);
    }

    /*
     * parseBracedQuantifier():
     *
     * Helper for parseTokens(); parses {m}, {m,} and {m,n}. Anything else after
     * the brace is an error rather than a literal '{'.
     */
    void parseBracedQuantifier(bool lastTokenWasAnAtom)
    {
        ASSERT(!hasError(m_err));
        ASSERT(peek() == '{');
        unsigned braceIndex = m_index;
        consume();

        if (!peekIsDigit()) {
            setError(ErrorCode::QuantifierIncomplete, m_index);
            return;
        }

        unsigned min;
        if (!consumeNumber(min)) {
            setError(ErrorCode::QuantifierTooLarge, braceIndex);
            return;
        }

        unsigned max = min;
        if (tryConsume(',')) {
            if (peekIsDigit()) {
                if (!consumeNumber(max)) {
                    setError(ErrorCode::QuantifierTooLarge, braceIndex);
                    return;
                }
            } else
                max = quantifyInfinite;
        }

        if (!tryConsume('}')) {
            setError(ErrorCode::QuantifierIncomplete, m_index);
            return;
        }

        if (min > max) {
            setError(ErrorCode::QuantifierOutOfOrder, braceIndex);
            return;
        }

        parseQuantifier(lastTokenWasAnAtom, min, max, braceIndex);
    }

    /*
     * parseTokens():
     *
     * This method loops over the input pattern reporting tokens to the delegate.
     * The method returns when a parse error is detected, or the end of the pattern
     * is reached. One piece of state is tracked around the loop, which is whether
     * the last token passed to the delegate was an atom (this is necessary to detect
     * a parse error when a quantifier is provided without an atom to quantify).
     */
    void parseTokens()
    {
        bool lastTokenWasAnAtom = false;

        while (!atEndOfPattern()) {
            switch (peek()) {
            case '|':
                consume();
                m_delegate.disjunction();
                lastTokenWasAnAtom = false;
                break;

            case '(':
                parseParenthesesBegin();
                lastTokenWasAnAtom = false;
                break;

            case ')':
                parseParenthesesEnd();
                lastTokenWasAnAtom = true;
                break;

            case '^':
                consume();
                m_delegate.assertionBOL();
                lastTokenWasAnAtom = false;
                break;

            case '$':
                consume();
                m_delegate.assertionEOL();
                lastTokenWasAnAtom = false;
                break;

            case '.':
                consume();
                m_delegate.atomAnyCharacter();
                lastTokenWasAnAtom = true;
                break;

            case '[':
                parseCharacterClass();
                lastTokenWasAnAtom = true;
                break;

            case '\\':
                lastTokenWasAnAtom = parseAtomEscape();
                break;

            case '*':
                parseQuantifier(lastTokenWasAnAtom, 0, quantifyInfinite, consumeQuantifierCharacter());
                lastTokenWasAnAtom = false;
                break;

            case '+':
                parseQuantifier(lastTokenWasAnAtom, 1, quantifyInfinite, consumeQuantifierCharacter());
                lastTokenWasAnAtom = false;
                break;

            case '?':
                parseQuantifier(lastTokenWasAnAtom, 0, 1, consumeQuantifierCharacter());
                lastTokenWasAnAtom = false;
                break;

            case '{':
                parseBracedQuantifier(lastTokenWasAnAtom);
                lastTokenWasAnAtom = false;
                break;

            default:
                m_delegate.atomPatternCharacter(consume());
                lastTokenWasAnAtom = true;
            }

            if (hasError(m_err))
                return;
        }

        if (m_parenthesesNestingDepth > 0)
            setError(ErrorCode::MissingParentheses, m_size);
    }

    /*
     * parse():
     *
     * This method calls regexBegin(), calls parseTokens() to parse over the input
     * patterns, calls regexEnd() or regexError() as appropriate, and converts the
     * error position into a byte offset into the pattern.
     */
    SyntaxError parse()
    {
        m_delegate.regexBegin();

        if (m_size > maxPatternSize)
            setError(ErrorCode::PatternTooLarge, 0);
        else
            parseTokens();
        ASSERT(atEndOfPattern() || hasError(m_err));

        if (hasError(m_err)) {
            m_delegate.regexError();
            return { m_err, m_offsets[m_errorIndex] };
        }

        m_delegate.regexEnd();
        return { };
    }

    // Misc helper functions:

    typedef unsigned ParseState;

    ParseState saveState()
    {
        return m_index;
    }

    void restoreState(ParseState state)
    {
        m_index = state;
    }

    bool atEndOfPattern()
    {
        ASSERT(m_index <= m_size);
        return m_index == m_size;
    }

    UChar32 peek()
    {
        ASSERT(m_index < m_size);
        return m_data[m_index];
    }

    bool peekIsDigit()
    {
        return !atEndOfPattern() && isASCIIDigit(peek());
    }

    UChar32 consume()
    {
        ASSERT(m_index < m_size);
        return m_data[m_index++];
    }

    unsigned consumeQuantifierCharacter()
    {
        unsigned index = m_index;
        consume();
        return index;
    }

    unsigned consumeDigit()
    {
        ASSERT(peekIsDigit());
        return consume() - '0';
    }

    // Returns false if the number does not fit below quantifyInfinite. All the
    // digits are consumed either way.
    bool consumeNumber(unsigned& result)
    {
        unsigned long long n = consumeDigit();
        bool overflowed = false;
        while (peekIsDigit()) {
            n = n * 10 + consumeDigit();
            if (n >= quantifyInfinite) {
                overflowed = true;
                n = quantifyInfinite;
            }
        }
        result = static_cast<unsigned>(n);
        return !overflowed;
    }

    bool tryConsume(UChar32 ch)
    {
        if (atEndOfPattern() || m_data[m_index] != ch)
            return false;
        ++m_index;
        return true;
    }

    int tryConsumeHex(int count)
    {
        ParseState state = saveState();

        int n = 0;
        while (count--) {
            if (atEndOfPattern() || !isASCIIHexDigit(peek())) {
                restoreState(state);
                return -1;
            }
            n = (n << 4) | toASCIIHexValue(consume());
        }
        return n;
    }

    Delegate& m_delegate;
    ErrorCode m_err;
    unsigned m_errorIndex;
    const UChar32* m_data;
    const unsigned* m_offsets;
    unsigned m_size;
    unsigned m_index;
    unsigned m_parenthesesNestingDepth;

    // Derived by empirical testing of compile time in PCRE and WREC.
    static constexpr unsigned maxPatternSize = 1024 * 1024;
    // Parsing and matching both recurse once per level of nesting.
    static constexpr unsigned maxParenthesesNestingDepth = 1000;
};

/*
 * Regex::parse():
 *
 * The parse method is passed a UTF-8 pattern to be parsed and a delegate upon
 * which callbacks will be made to record the parsed tokens forming the regex.
 * Regex::parse() returns a SyntaxError without an error code on success, or the
 * error code and the byte offset at which the problem was detected.
 *
 * The Delegate must implement the following interface:
 *
 *    void assertionBOL();
 *    void assertionEOL();
 *    void assertionWordBoundary(bool invert);
 *
 *    void atomPatternCharacter(UChar32 ch);
 *    void atomAnyCharacter();
 *    void atomBuiltInCharacterClass(BuiltInCharacterClassID classID, bool invert);
 *    void atomCharacterClassBegin(bool invert)
 *    void atomCharacterClassAtom(UChar32 ch)
 *    void atomCharacterClassRange(UChar32 begin, UChar32 end)
 *    void atomCharacterClassBuiltIn(BuiltInCharacterClassID classID, bool invert)
 *    void atomCharacterClassEnd()
 *    void atomParenthesesSubpatternBegin(bool capture = true);
 *    void atomParenthesesEnd();
 *
 *    void quantifyAtom(unsigned min, unsigned max, bool greedy);
 *
 *    void disjunction();
 *
 *    void regexBegin();
 *    void regexEnd();
 *    void regexError();
 *
 * Before any call recording tokens are made, regexBegin() will be called on the
 * delegate once. Once parsing is complete either regexEnd() or regexError() will
 * be called, as appropriate.
 *
 * The regular expression is described by a sequence of assertion*() and atom*()
 * callbacks to the delegate, describing the terms in the regular expression.
 * Following an atom a quantifyAtom() call may occur to indicate that the previous
 * atom should be quantified. In the case of atoms described across multiple
 * calls (parentheses and character classes) the call to quantifyAtom() will come
 * after the call to the atom*End() method, never after atom*Begin().
 *
 * Character classes may either be described by a single call to
 * atomBuiltInCharacterClass(), or by a sequence of atomCharacterClass*() calls.
 * In the latter case, ...Begin() will be called, followed by a sequence of
 * calls to ...Atom(), ...Range(), and ...BuiltIn(), followed by a call to ...End().
 *
 * Sequences of atoms and assertions are broken into alternatives via calls to
 * disjunction(). Assertions, atoms, and disjunctions emitted between calls to
 * atomParenthesesSubpatternBegin() and atomParenthesesEnd() form the body of a
 * subpattern. Capturing subpatterns are reported in the order of their opening
 * parentheses, which is the order their ids are assigned in.
 */

template<class Delegate>
SyntaxError parse(Delegate& delegate, std::string_view pattern)
{
    Unicode::DecodedText decodedPattern;
    unsigned errorOffset = 0;
    if (!Unicode::decodeUTF8(pattern, decodedPattern, Unicode::ConversionMode::Strict, &errorOffset)) {
        delegate.regexBegin();
        delegate.regexError();
        if (pattern.size() > static_cast<size_t>(INT32_MAX))
            return { ErrorCode::PatternTooLarge, 0 };
        return { ErrorCode::InvalidEncoding, errorOffset };
    }

    return Parser<Delegate>(delegate, decodedPattern).parse();
}

} } // namespace Sieve::Regex

#endif // RegexParser_h
