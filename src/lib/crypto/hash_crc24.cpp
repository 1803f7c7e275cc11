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

#include "hash_crc24.hpp"

#define CRC24_INIT 0xB704CEL
#define CRC24_POLY 0x1864CFBL

namespace keyreg {

CRC24_KEYREG::CRC24_KEYREG() : state_(CRC24_INIT)
{
}

CRC24_KEYREG::~CRC24_KEYREG()
{
}

std::unique_ptr<CRC24_KEYREG>
CRC24_KEYREG::create()
{
    return std::unique_ptr<CRC24_KEYREG>(new CRC24_KEYREG());
}

void
CRC24_KEYREG::add(const void *buf, size_t len)
{
    const uint8_t *bytes = static_cast<const uint8_t *>(buf);
    for (size_t idx = 0; idx < len; idx++) {
        state_ ^= (uint32_t) bytes[idx] << 16;
        for (int bit = 0; bit < 8; bit++) {
            state_ <<= 1;
            if (state_ & 0x1000000) {
                state_ ^= CRC24_POLY;
            }
        }
    }
}

std::array<uint8_t, 3>
CRC24_KEYREG::finish()
{
    uint32_t crc = state_ & 0xFFFFFFL;
    state_ = CRC24_INIT;
    return {(uint8_t)(crc >> 16), (uint8_t)(crc >> 8), (uint8_t) crc};
}

} // namespace keyreg
