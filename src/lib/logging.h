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

#ifndef KEYREG_LOGGING_H_
#define KEYREG_LOGGING_H_

#include <stdlib.h>
#include <stdint.h>
#include <stdio.h>

/* Console logging is enabled when this variable holds anything but
 * "0", "off", "no" or "false". Debug builds log regardless. */
static const char KEYREG_LOG_CONSOLE[] = "KEYREG_LOG_CONSOLE";

bool keyreg_log_switch();
/* 1 forces logging on, 0 off, -1 re-reads KEYREG_LOG_CONSOLE on next use */
void set_keyreg_log_switch(int8_t);
void keyreg_log_stop();
void keyreg_log_continue();

namespace keyreg {
/*
 * Silences KEYREG_LOG output for the lifetime of the object. Scopes nest, so
 * logging comes back only once the outermost LogStop is gone:
 *
 *     {
 *         keyreg::LogStop quiet;
 *         ret = decode_key(blob, key); // failures here are expected
 *     }
 *
 * LogStop(false) is a no-op, for callers that silence output conditionally.
 */
class LogStop {
    bool stop_;

  public:
    explicit LogStop(bool stop = true) : stop_(stop)
    {
        if (stop_) {
            keyreg_log_stop();
        }
    }
    ~LogStop()
    {
        if (stop_) {
            keyreg_log_continue();
        }
    }
    LogStop(const LogStop &) = delete;
    LogStop &operator=(const LogStop &) = delete;
};
} // namespace keyreg

/* remove "src" */
#ifndef SOURCE_PATH_SIZE
#define SOURCE_PATH_SIZE 0
#endif
#define __SOURCE_PATH_FILE__ (&(__FILE__[SOURCE_PATH_SIZE + 3]))

#define KEYREG_LOG_FD(fd, ...)                                                           \
    do {                                                                                 \
        if (!keyreg_log_switch())                                                        \
            break;                                                                       \
        (void) fprintf((fd), "[%s() %s:%d] ", __func__, __SOURCE_PATH_FILE__, __LINE__); \
        (void) fprintf((fd), __VA_ARGS__);                                               \
        (void) fprintf((fd), "\n");                                                      \
    } while (0)

#define KEYREG_LOG(...) KEYREG_LOG_FD(stderr, __VA_ARGS__)

#define KEYREG_LOG_KEY(msg, key)                                              \
    do {                                                                      \
        if (!(key)) {                                                         \
            KEYREG_LOG(msg, "(null)");                                        \
            break;                                                            \
        }                                                                     \
        auto idhex = keyreg::keyid_to_hex((key)->keyid());                    \
        KEYREG_LOG(msg, idhex.c_str());                                       \
    } while (0)

#endif
