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

#include <cstring>
#include <cinttypes>
#include "sig_subpacket.hpp"
#include "librepgp/stream-packet.h"
#include "utils.h"
#include "logging.h"

namespace pgp {
namespace pkt {
namespace sigsub {

Subpacket::Subpacket(uint8_t type, bool hashed, bool critical)
    : type_(type), hashed_(hashed), critical_(critical)
{
}

Subpacket::Subpacket(Type type, bool hashed, bool critical)
    : Subpacket(static_cast<uint8_t>(type), hashed, critical)
{
}

Type
Subpacket::type() const noexcept
{
    switch (type_) {
    case 2:
    case 3:
    case 9:
    case 16:
    case 25:
    case 27:
    case 29:
    case 32:
    case 33:
        return static_cast<Type>(type_);
    default:
        return Type::Unknown;
    }
}

static bool
body_size_ok(Type type, size_t size)
{
    switch (type) {
    case Type::CreationTime:
    case Type::ExpirationTime:
    case Type::KeyExpirationTime:
        return size == 4;
    case Type::IssuerKeyID:
        return size == PGP_KEY_ID_SIZE;
    case Type::PrimaryUserID:
        return size == 1;
    case Type::KeyFlags:
    case Type::RevocationReason:
        return size >= 1;
    case Type::IssuerFingerprint:
        /* version octet and v4 or v5 fingerprint */
        return (size == PGP_FINGERPRINT_V4_SIZE + 1) || (size == PGP_FINGERPRINT_V5_SIZE + 1);
    default:
        return true;
    }
}

bool
Subpacket::decode(const uint8_t *data, size_t len)
{
    if (!len) {
        KEYREG_LOG("empty subpacket");
        return false;
    }
    type_ = data[0] & 0x7f;
    critical_ = data[0] & 0x80;
    if (!body_size_ok(type(), len - 1)) {
        KEYREG_LOG("wrong len %zu of subpacket type %" PRIu8, len - 1, type_);
        return false;
    }
    body_.assign(data + 1, data + len);
    return true;
}

void
Subpacket::encode(std::vector<uint8_t> &dst) const
{
    uint8_t lenbuf[6];
    size_t  lenlen = write_packet_len(lenbuf, body_.size() + 1);
    dst.insert(dst.end(), lenbuf, lenbuf + lenlen);
    dst.push_back(type_ | (critical_ ? 0x80 : 0x00));
    dst.insert(dst.end(), body_.begin(), body_.end());
}

uint32_t
Subpacket::time() const noexcept
{
    return body_.size() == 4 ? read_uint32(body_.data()) : 0;
}

void
Subpacket::set_time(uint32_t value)
{
    body_.resize(4);
    write_uint32(body_.data(), value);
}

uint8_t
Subpacket::octet() const noexcept
{
    return body_.empty() ? 0 : body_[0];
}

void
Subpacket::set_octet(uint8_t value)
{
    body_.assign(1, value);
}

KeyID
Subpacket::keyid() const noexcept
{
    KeyID res{};
    if (body_.size() == res.size()) {
        memcpy(res.data(), body_.data(), res.size());
    }
    return res;
}

void
Subpacket::set_keyid(const KeyID &value)
{
    body_.assign(value.begin(), value.end());
}

Fingerprint
Subpacket::fp() const
{
    if (body_.size() < 2) {
        return Fingerprint();
    }
    return Fingerprint(body_.data() + 1, body_.size() - 1);
}

void
Subpacket::set_fp(uint8_t version, const Fingerprint &value)
{
    body_.clear();
    body_.push_back(version);
    body_.insert(body_.end(), value.data(), value.data() + value.size());
}

Subpacket
Subpacket::time_pkt(Type type, uint32_t value)
{
    Subpacket res(type);
    res.set_time(value);
    return res;
}

} // namespace sigsub
} // namespace pkt
} // namespace pgp
