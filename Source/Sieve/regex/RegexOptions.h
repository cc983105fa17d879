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

#ifndef RegexOptions_h
#define RegexOptions_h

namespace Sieve { namespace Regex {

// Budgets for a single search. A limit of 0 means unlimited.
struct MatchOptions {
    static constexpr unsigned defaultMatchLimit = 1000000;
    static constexpr unsigned defaultBacktrackLimit = 10000000;

    // Backtracking steps (node visits) allowed before the search gives up with MatchStatus::HitLimit.
    unsigned matchLimit { defaultMatchLimit };
    // Continuation frames plus pending choices the interpreter may hold at once
    // before the search gives up with MatchStatus::HitLimit. Bounds memory, not time.
    unsigned backtrackLimit { defaultBacktrackLimit };
    // Cache (node, offset) failures for the duration of one search.
    bool memoize { true };

    // Neither budget applies.
    static MatchOptions unlimited();
    static MatchOptions fromEnvironment();
};

// Applies a single "name=value" pair. Returns false for an unknown name or a
// malformed value, leaving options untouched.
bool parseOption(MatchOptions&, const char* nameEqualsValue);

// Applies a whitespace separated list of "name=value" pairs. Every pair is
// attempted; returns false if any of them failed.
bool parseOptions(MatchOptions&, const char* optionList);

} } // namespace Sieve::Regex

#endif // RegexOptions_h
