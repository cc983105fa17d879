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
#include "Logging.h"

#include <stdlib.h>
#include <string>
#include <strings.h>

namespace Sieve {

SieveLogChannel LogRegexCompile = { SieveLogChannelOff, "RegexCompile" };
SieveLogChannel LogRegexMatch = { SieveLogChannelOff, "RegexMatch" };
SieveLogChannel LogOptions = { SieveLogChannelOff, "Options" };

static SieveLogChannel* const logChannels[] = {
    &LogRegexCompile,
    &LogRegexMatch,
    &LogOptions,
};

SieveLogChannel* logChannelByName(const char* name)
{
    if (!name)
        return nullptr;

    for (auto* channel : logChannels) {
        if (!strcasecmp(name, channel->name))
            return channel;
    }
    return nullptr;
}

static void applyLogChannelToken(const std::string& token)
{
    if (token.empty())
        return;

    SieveLogChannelState state = SieveLogChannelOn;
    std::string name = token;
    if (name[0] == '-') {
        state = SieveLogChannelOff;
        name.erase(0, 1);
    }

    if (!strcasecmp(name.c_str(), "all")) {
        for (auto* channel : logChannels)
            channel->state = state;
        return;
    }

    if (SieveLogChannel* channel = logChannelByName(name.c_str())) {
        channel->state = state;
        return;
    }

    LOG_ERROR("Unknown logging channel: %s", name.c_str());
}

void initializeLogChannelsFromString(const char* channelNames)
{
    if (!channelNames)
        return;

    std::string token;
    for (const char* character = channelNames; *character; ++character) {
        if (*character == ',' || *character == ' ') {
            applyLogChannelToken(token);
            token.clear();
            continue;
        }
        token.push_back(*character);
    }
    applyLogChannelToken(token);
}

void initializeLogChannelsIfNecessary()
{
    static bool haveInitializedLogChannels = false;
    if (haveInitializedLogChannels)
        return;
    haveInitializedLogChannels = true;

    initializeLogChannelsFromString(getenv("SIEVE_LOG"));
}

} // namespace Sieve
