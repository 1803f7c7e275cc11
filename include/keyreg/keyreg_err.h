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

#ifndef KEYREG_ERR_H_
#define KEYREG_ERR_H_

#include <stdint.h>

typedef uint32_t keyreg_result_t;

/*
 * Result codes
 */
enum {
    KEYREG_SUCCESS = 0x00000000,

    /* Common error codes */
    KEYREG_ERROR_GENERIC = 0x10000000,
    KEYREG_ERROR_BAD_FORMAT,
    KEYREG_ERROR_BAD_PARAMETERS,
    KEYREG_ERROR_NOT_IMPLEMENTED,
    KEYREG_ERROR_NOT_SUPPORTED,
    KEYREG_ERROR_OUT_OF_MEMORY,
    KEYREG_ERROR_SHORT_BUFFER,
    KEYREG_ERROR_NULL_POINTER,

    /* Storage */
    KEYREG_ERROR_STORAGE = 0x11000000,
    KEYREG_ERROR_STORAGE_NOT_AVAILABLE,
    KEYREG_ERROR_STORAGE_BUSY,
    KEYREG_ERROR_READ,
    KEYREG_ERROR_WRITE,

    /* Parsing */
    KEYREG_ERROR_NOT_ENOUGH_DATA = 0x12000000,
    KEYREG_ERROR_UNKNOWN_TAG,
    KEYREG_ERROR_PACKET_NOT_CONSUMED,
    KEYREG_ERROR_BAD_ARMOR,
    KEYREG_ERROR_NO_KEY,

    /* Registry */
    KEYREG_ERROR_UNVERIFIED_IDENTITY = 0x13000000,
    KEYREG_ERROR_KEY_ID_CONFLICT,
    KEYREG_ERROR_KEY_NOT_FOUND,
    KEYREG_ERROR_ACCESS_DENIED,
};

#endif
