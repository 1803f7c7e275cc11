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

#ifndef KEYREG_UTILS_H_
#define KEYREG_UTILS_H_

#include <stdio.h>
#include <limits.h>
#include <string>
#include <vector>
#include "logging.h"
#include "types.h"


/* Big-endian integer helpers for the packet fields */
inline uint16_t
read_uint16(const uint8_t *buf)
{
    return (uint16_t)((buf[0] << 8) | buf[1]);
}

inline uint32_t
read_uint32(const uint8_t *buf)
{
    uint32_t val = 0;
    for (int i = 0; i < 4; i++) {
        val = (val << 8) | buf[i];
    }
    return val;
}

inline void
write_uint16(uint8_t *buf, uint16_t val)
{
    buf[0] = (uint8_t)(val >> 8);
    buf[1] = (uint8_t) val;
}

inline void
write_uint32(uint8_t *buf, uint32_t val)
{
    for (int i = 3; i >= 0; i--) {
        buf[i] = (uint8_t) val;
        val >>= 8;
    }
}

namespace keyreg {

enum class HexFormat { Lowercase, Uppercase };

/* Hex dump without any prefix or spacing. buf may be NULL if len is 0. */
std::string bin_to_hex(const uint8_t *buf, size_t len, HexFormat format = HexFormat::Uppercase);
std::string bin_to_hex(const std::vector<uint8_t> &vec,
                       HexFormat                   format = HexFormat::Uppercase);

/**
 * @brief Decode hex string, skipping whitespaces and the 0x prefix.
 * @return false for odd number of digits or non-hex characters.
 */
bool hex_to_bin(const std::string &str, std::vector<uint8_t> &bin);

/* 16 uppercase hex characters */
std::string keyid_to_hex(const pgp::KeyID &keyid);

/* Base64 via OpenSSL EVP block encoder. Decoding throws KEYREG_ERROR_BAD_FORMAT. */
std::string          base64_encode(const uint8_t *buf, size_t len);
std::string          base64_encode(const std::vector<uint8_t> &vec);
std::vector<uint8_t> base64_decode(const std::string &str);

} // namespace keyreg

#endif
