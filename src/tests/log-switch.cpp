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

#include <unistd.h>
#include "keyreg_tests.h"
#include "support.h"
#include "logging.h"

/* Log a line to the temporary file and report how many bytes landed there */
static long
logged_bytes(FILE *fp)
{
    long before = ftell(fp);
    KEYREG_LOG_FD(fp, "log line %d", 1);
    fflush(fp);
    return ftell(fp) - before;
}

TEST_F(keyreg_tests, test_log_switch)
{
    FILE *fp = fopen("log.txt", "w+");
    assert_non_null(fp);
    bool        saved = keyreg_log_switch();
    std::string saved_env = getenv(KEYREG_LOG_CONSOLE) ? getenv(KEYREG_LOG_CONSOLE) : "";
    bool        had_env = getenv(KEYREG_LOG_CONSOLE) != NULL;

    set_keyreg_log_switch(0);
    assert_int_equal(logged_bytes(fp), 0);
    set_keyreg_log_switch(1);
    assert_greater_than(logged_bytes(fp), 0);

    /* lazy initialization from the environment */
    assert_int_equal(0, unsetenv(KEYREG_LOG_CONSOLE));
    set_keyreg_log_switch(-1);
    assert_int_equal(logged_bytes(fp), 0);
    assert_int_equal(0, setenv(KEYREG_LOG_CONSOLE, "0", 1));
    set_keyreg_log_switch(-1);
    assert_int_equal(logged_bytes(fp), 0);
    assert_int_equal(0, setenv(KEYREG_LOG_CONSOLE, "", 1));
    set_keyreg_log_switch(-1);
    assert_int_equal(logged_bytes(fp), 0);
    assert_int_equal(0, setenv(KEYREG_LOG_CONSOLE, "Off", 1));
    set_keyreg_log_switch(-1);
    assert_int_equal(logged_bytes(fp), 0);
    assert_int_equal(0, setenv(KEYREG_LOG_CONSOLE, "FALSE", 1));
    set_keyreg_log_switch(-1);
    assert_int_equal(logged_bytes(fp), 0);
    /* value is read once, until the switch is reset */
    assert_int_equal(0, setenv(KEYREG_LOG_CONSOLE, "1", 1));
    assert_int_equal(logged_bytes(fp), 0);
    assert_int_equal(0, setenv(KEYREG_LOG_CONSOLE, "yes", 1));
    set_keyreg_log_switch(-1);
    assert_greater_than(logged_bytes(fp), 0);

    /* stops nest */
    {
        keyreg::LogStop outer;
        {
            keyreg::LogStop inner;
            assert_int_equal(logged_bytes(fp), 0);
        }
        assert_int_equal(logged_bytes(fp), 0);
        keyreg::LogStop noop(false);
        assert_int_equal(logged_bytes(fp), 0);
    }
    assert_greater_than(logged_bytes(fp), 0);

    if (had_env) {
        setenv(KEYREG_LOG_CONSOLE, saved_env.c_str(), 1);
    } else {
        unsetenv(KEYREG_LOG_CONSOLE);
    }
    set_keyreg_log_switch(saved ? 1 : 0);
    fclose(fp);
}
