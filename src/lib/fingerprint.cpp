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
#include <algorithm>
#include "crypto/hash.hpp"
#include <librepgp/stream-key.h>
#include "utils.h"
#include "fingerprint.hpp"

namespace pgp {

namespace {

std::vector<uint8_t>
v3_fingerprint(const pgp_key_pkt_t &key, KeyID &keyid)
{
    auto &nums = key.material.fields();
    if (!is_rsa_key_alg(key.alg) || (nums.size() != 2)) {
        KEYREG_LOG("v%d fingerprint requires RSA key", (int) key.version);
        throw keyreg::keyreg_exception(KEYREG_ERROR_NOT_SUPPORTED);
    }
    auto md5 = keyreg::Hash::create(PGP_HASH_MD5);
    md5->add(nums[0].data(), nums[0].size());
    md5->add(nums[1].data(), nums[1].size());
    /* key id: low 64 bits of the modulus */
    size_t len = std::min(nums[0].size(), keyid.size());
    keyid.fill(0);
    memcpy(keyid.data() + keyid.size() - len, nums[0].data() + nums[0].size() - len, len);
    return md5->finish();
}

std::vector<uint8_t>
packet_fingerprint(const pgp_key_pkt_t &key)
{
    const size_t len = key.pub_data.size();
    std::unique_ptr<keyreg::Hash> hash;
    if (key.version == PGP_V4) {
        if (len > 0xffff) {
            KEYREG_LOG("key material too long: %zu", len);
            throw keyreg::keyreg_exception(KEYREG_ERROR_BAD_FORMAT);
        }
        uint8_t prefix[3] = {0x99};
        write_uint16(prefix + 1, len);
        hash = keyreg::Hash::create(PGP_HASH_SHA1);
        hash->add(prefix, sizeof(prefix));
    } else {
        uint8_t prefix[5] = {0x9A};
        write_uint32(prefix + 1, len);
        hash = keyreg::Hash::create(PGP_HASH_SHA256);
        hash->add(prefix, sizeof(prefix));
    }
    hash->add(key.pub_data);
    return hash->finish();
}

} // namespace

Fingerprint::Fingerprint() : keyid_{}
{
}

Fingerprint::Fingerprint(const uint8_t *data, size_t size) : fp_(data, data + size), keyid_{}
{
    if (size == PGP_FINGERPRINT_V4_SIZE) {
        memcpy(keyid_.data(), data + size - keyid_.size(), keyid_.size());
    } else if (size == PGP_FINGERPRINT_V5_SIZE) {
        memcpy(keyid_.data(), data, keyid_.size());
    }
}

Fingerprint::Fingerprint(const pgp_key_pkt_t &key) : keyid_{}
{
    switch (key.version) {
    case PGP_V2:
    case PGP_V3:
        fp_ = v3_fingerprint(key, keyid_);
        break;
    case PGP_V4:
    case PGP_V5: {
        auto digest = packet_fingerprint(key);
        *this = Fingerprint(digest.data(), digest.size());
        break;
    }
    default:
        KEYREG_LOG("unsupported key version %d", (int) key.version);
        throw keyreg::keyreg_exception(KEYREG_ERROR_NOT_SUPPORTED);
    }
}

bool
Fingerprint::operator==(const Fingerprint &src) const
{
    return fp_ == src.fp_;
}

bool
Fingerprint::operator!=(const Fingerprint &src) const
{
    return fp_ != src.fp_;
}

const KeyID &
Fingerprint::keyid() const noexcept
{
    return keyid_;
}

const uint8_t *
Fingerprint::data() const noexcept
{
    return fp_.data();
}

size_t
Fingerprint::size() const noexcept
{
    return fp_.size();
}

std::string
Fingerprint::str() const
{
    return keyreg::bin_to_hex(fp_);
}

} // namespace pgp
