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

#include <string.h>
#include <strings.h>
#include <atomic>
#include "logging.h"

namespace {

enum log_mode_t : int8_t { LOG_MODE_UNSET = -1, LOG_MODE_OFF = 0, LOG_MODE_ON = 1 };

/* Debug builds always log; release builds read KEYREG_LOG_CONSOLE on first use */
std::atomic<int8_t> log_mode(
#ifdef NDEBUG
  LOG_MODE_UNSET
#else
  LOG_MODE_ON
#endif
);

/* Number of active LogStop scopes */
std::atomic<size_t> log_stops(0);

/* Unset, empty, "0", "off", "no" and "false" keep the console quiet */
int8_t
log_mode_from_env()
{
    const char *var = getenv(KEYREG_LOG_CONSOLE);
    if (!var || !*var) {
        return LOG_MODE_OFF;
    }
    static const char *quiet[] = {"0", "off", "no", "false"};
    for (auto word : quiet) {
        if (!strcasecmp(var, word)) {
            return LOG_MODE_OFF;
        }
    }
    return LOG_MODE_ON;
}

} // namespace

void
set_keyreg_log_switch(int8_t value)
{
    log_mode = (value < 0) ? LOG_MODE_UNSET : (value ? LOG_MODE_ON : LOG_MODE_OFF);
}

bool
keyreg_log_switch()
{
    int8_t mode = log_mode;
    if (mode == LOG_MODE_UNSET) {
        int8_t env = log_mode_from_env();
        /* a concurrent set_keyreg_log_switch() call wins over the environment */
        if (!log_mode.compare_exchange_strong(mode, env)) {
            env = mode;
        }
        mode = env;
    }
    return (mode == LOG_MODE_ON) && !log_stops;
}

void
keyreg_log_stop()
{
    size_t cur = log_stops;
    while ((cur < SIZE_MAX) && !log_stops.compare_exchange_weak(cur, cur + 1)) {
    }
}

void
keyreg_log_continue()
{
    size_t cur = log_stops;
    while (cur && !log_stops.compare_exchange_weak(cur, cur - 1)) {
    }
}
