/*
 * Copyright (c) 2017-2025 [Ribose Inc](https://www.ribose.com).
 * All rights reserved.
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
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * ``AS IS'' AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDERS OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <stdint.h>
#include <keyreg/keyreg.hpp>
#include "time-utils.h"

namespace keyreg {

TimePoint
time_from_unix(int64_t secs) noexcept
{
    return TimePoint(std::chrono::seconds(secs));
}

int64_t
time_to_unix(const TimePoint &time) noexcept
{
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

int64_t
time_now()
{
    return time_to_unix(std::chrono::system_clock::now());
}

void
gmtime(int64_t t, struct tm &tm)
{
    time_t adjusted = (time_t) t;
#ifndef _WIN32
    gmtime_r(&adjusted, &tm);
#else
    (void) gmtime_s(&tm, &adjusted);
#endif
}

std::string
time_rfc3339(int64_t t)
{
    struct tm tm = {};
    gmtime(t, tm);
    char buf[32] = {0};
    if (!strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm)) {
        return "";
    }
    return buf;
}

} // namespace keyreg
