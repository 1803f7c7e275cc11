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
#include <ctype.h>
#include <openssl/evp.h>
#include "utils.h"

namespace keyreg {

std::string
bin_to_hex(const uint8_t *buf, size_t len, HexFormat format)
{
    const char *digits =
      format == HexFormat::Lowercase ? "0123456789abcdef" : "0123456789ABCDEF";
    std::string res;
    res.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        res.push_back(digits[buf[i] >> 4]);
        res.push_back(digits[buf[i] & 0x0f]);
    }
    return res;
}

std::string
bin_to_hex(const std::vector<uint8_t> &vec, HexFormat format)
{
    return bin_to_hex(vec.data(), vec.size(), format);
}

static int
hex_digit(char ch)
{
    const char *digits = "0123456789abcdef";
    const char *pos = ch ? strchr(digits, tolower((unsigned char) ch)) : NULL;
    return pos ? (int) (pos - digits) : -1;
}

bool
hex_to_bin(const std::string &str, std::vector<uint8_t> &bin)
{
    std::string digits;
    size_t      start = 0;
    if (!str.compare(0, 2, "0x") || !str.compare(0, 2, "0X")) {
        start = 2;
    }
    for (size_t i = start; i < str.size(); i++) {
        if (!isspace((unsigned char) str[i])) {
            digits.push_back(str[i]);
        }
    }
    if (digits.size() % 2) {
        KEYREG_LOG("Invalid hex string length.");
        return false;
    }
    bin.clear();
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = hex_digit(digits[i]);
        int lo = hex_digit(digits[i + 1]);
        if ((hi < 0) || (lo < 0)) {
            KEYREG_LOG("Hex decode failed on string: %s", str.c_str());
            return false;
        }
        bin.push_back((uint8_t)((hi << 4) | lo));
    }
    return true;
}

std::string
keyid_to_hex(const pgp::KeyID &keyid)
{
    return bin_to_hex(keyid.data(), keyid.size(), HexFormat::Uppercase);
}

std::string
base64_encode(const uint8_t *buf, size_t len)
{
    if (len > INT_MAX / 2) {
        throw keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS);
    }
    /* EVP_EncodeBlock writes the trailing zero */
    std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
    int                        enc = EVP_EncodeBlock(out.data(), buf, (int) len);
    if (enc < 0) {
        throw keyreg_exception(KEYREG_ERROR_GENERIC);
    }
    return std::string((const char *) out.data(), enc);
}

std::string
base64_encode(const std::vector<uint8_t> &vec)
{
    return base64_encode(vec.data(), vec.size());
}

std::vector<uint8_t>
base64_decode(const std::string &str)
{
    if (str.size() % 4 || (str.size() > INT_MAX)) {
        KEYREG_LOG("wrong base64 length: %zu", str.size());
        throw keyreg_exception(KEYREG_ERROR_BAD_FORMAT);
    }
    std::vector<uint8_t> res(str.size() / 4 * 3);
    if (str.empty()) {
        return res;
    }
    int len = EVP_DecodeBlock(res.data(), (const unsigned char *) str.data(), (int) str.size());
    if (len < 0) {
        KEYREG_LOG("wrong base64 data");
        throw keyreg_exception(KEYREG_ERROR_BAD_FORMAT);
    }
    /* padding characters still produce zero bytes in the output */
    size_t pad = str.size() - str.find_last_not_of('=') - 1;
    if (pad > 2) {
        KEYREG_LOG("wrong base64 padding");
        throw keyreg_exception(KEYREG_ERROR_BAD_FORMAT);
    }
    res.resize(len - pad);
    return res;
}

} // namespace keyreg
