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
#include "RegexOptions.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <string>
#include <strings.h>
#include <support/ASCIICType.h>
#include <support/Logging.h>

namespace Sieve { namespace Regex {

static bool parseUnsigned(const char* value, unsigned& result)
{
    if (!value || !isASCIIDigit(*value))
        return false;

    errno = 0;
    char* end = nullptr;
    unsigned long parsed = strtoul(value, &end, 10);
    if (errno || *end || parsed > UINT_MAX)
        return false;

    result = static_cast<unsigned>(parsed);
    return true;
}

static bool parseBoolean(const char* value, bool& result)
{
    if (!value)
        return false;

    if (!strcmp(value, "1") || !strcasecmp(value, "true") || !strcasecmp(value, "yes")) {
        result = true;
        return true;
    }
    if (!strcmp(value, "0") || !strcasecmp(value, "false") || !strcasecmp(value, "no")) {
        result = false;
        return true;
    }
    return false;
}

static bool handleOptionMatchLimit(MatchOptions& options, const char*, const char* value)
{
    return parseUnsigned(value, options.matchLimit);
}

static bool handleOptionBacktrackLimit(MatchOptions& options, const char*, const char* value)
{
    return parseUnsigned(value, options.backtrackLimit);
}

static bool handleOptionMemoize(MatchOptions& options, const char*, const char* value)
{
    return parseBoolean(value, options.memoize);
}

struct OptionHandler {
    const char* name;
    bool (*handler)(MatchOptions&, const char* name, const char* value);
};

static const OptionHandler optionHandlers[] = {
    { "matchLimit", handleOptionMatchLimit },
    { "backtrackLimit", handleOptionBacktrackLimit },
    { "memoize", handleOptionMemoize },
};

MatchOptions MatchOptions::unlimited()
{
    MatchOptions options;
    options.matchLimit = 0;
    options.backtrackLimit = 0;
    return options;
}

MatchOptions MatchOptions::fromEnvironment()
{
    MatchOptions options;
    if (const char* optionList = getenv("SIEVE_OPTIONS")) {
        if (!parseOptions(options, optionList))
            LOG_ERROR("Ignoring malformed entries in SIEVE_OPTIONS: %s", optionList);
    }
    return options;
}

bool parseOption(MatchOptions& options, const char* nameEqualsValue)
{
    const char* separator = strchr(nameEqualsValue, '=');
    if (!separator) {
        LOG(Options, "Option '%s' is missing a value", nameEqualsValue);
        return false;
    }

    std::string name(nameEqualsValue, separator - nameEqualsValue);
    const char* value = separator + 1;
    for (const auto& option : optionHandlers) {
        if (name != option.name)
            continue;

        MatchOptions candidate = options;
        if (!option.handler(candidate, option.name, value)) {
            LOG(Options, "Bad value '%s' for option %s", value, option.name);
            return false;
        }
        options = candidate;
        LOG(Options, "Set option %s=%s", option.name, value);
        return true;
    }

    LOG(Options, "Unknown option '%s'", name.c_str());
    return false;
}

bool parseOptions(MatchOptions& options, const char* optionList)
{
    if (!optionList)
        return true;

    bool status = true;
    std::string pair;
    for (const char* character = optionList; ; ++character) {
        if (*character && !isASCIISpace(*character)) {
            pair.push_back(*character);
            continue;
        }
        if (!pair.empty()) {
            status &= parseOption(options, pair.c_str());
            pair.clear();
        }
        if (!*character)
            break;
    }
    return status;
}

} } // namespace Sieve::Regex
