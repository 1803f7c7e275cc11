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

#ifndef KEYREG_TESTS_H
#define KEYREG_TESTS_H

#include <gtest/gtest.h>
#include <string>
#include "support.h"

/* Each test runs in its own temp directory with data/ linked to the test data */
class keyreg_tests : public ::testing::Test {
  public:
    keyreg_tests();
    virtual ~keyreg_tests();

  protected:
    std::string work_dir_;
};

#if defined(KEYREG_TESTS_EXPECT)
#define KEYREG_CHECK(kind, ...) EXPECT_##kind(__VA_ARGS__)
#else
#define KEYREG_CHECK(kind, ...) ASSERT_##kind(__VA_ARGS__)
#endif

#define assert_true(a) KEYREG_CHECK(TRUE, (a))
#define assert_false(a) KEYREG_CHECK(FALSE, (a))
#define assert_int_equal(a, b) KEYREG_CHECK(EQ, (a), (b))
#define assert_int_not_equal(a, b) KEYREG_CHECK(NE, (a), (b))
#define assert_greater_than(a, b) KEYREG_CHECK(GT, (a), (b))
#define assert_string_equal(a, b) KEYREG_CHECK(STREQ, (a), (b))
#define assert_non_null(a) KEYREG_CHECK(NE, (a), nullptr)
#define assert_null(a) KEYREG_CHECK(EQ, (a), nullptr)
#define assert_keyreg_success(a) KEYREG_CHECK(EQ, (a), KEYREG_SUCCESS)
#define assert_keyreg_failure(a) KEYREG_CHECK(NE, (a), KEYREG_SUCCESS)
#define assert_throw(a) KEYREG_CHECK(ANY_THROW, a)

#endif // KEYREG_TESTS_H
