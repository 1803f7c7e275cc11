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

#ifndef KEYREG_SIG_SUBPACKET_HPP_
#define KEYREG_SIG_SUBPACKET_HPP_

#include <cstdint>
#include <vector>
#include "repgp/repgp_def.h"
#include "fingerprint.hpp"
#include "types.h"

namespace pgp {
namespace pkt {
namespace sigsub {

/* Subpacket types the registry looks at. Everything else is carried as opaque bytes. */
enum class Type : uint8_t {
    Unknown = 0,
    CreationTime = 2,
    ExpirationTime = 3,
    KeyExpirationTime = 9,
    IssuerKeyID = 16,
    PrimaryUserID = 25,
    KeyFlags = 27,
    RevocationReason = 29,
    EmbeddedSignature = 32,
    IssuerFingerprint = 33,
};

/**
 * @brief Single signature subpacket: the type octet (without the critical bit), area flag and
 *        the body as it goes on the wire. Typed accessors decode the body on demand.
 */
class Subpacket {
    uint8_t              type_;
    bool                 hashed_;
    bool                 critical_;
    std::vector<uint8_t> body_;

  public:
    Subpacket(uint8_t type = 0, bool hashed = true, bool critical = false);
    Subpacket(Type type, bool hashed = true, bool critical = false);

    /**
     * @brief Decode subpacket from the type octet followed by the body.
     *        Size of the known subpackets is checked.
     * @return true on success or false if data is malformed.
     */
    bool decode(const uint8_t *data, size_t len);
    /** @brief Append wire form (length, type and body) to the buffer */
    void encode(std::vector<uint8_t> &dst) const;

    uint8_t
    raw_type() const noexcept
    {
        return type_;
    }
    Type type() const noexcept;
    bool
    hashed() const noexcept
    {
        return hashed_;
    }
    bool
    critical() const noexcept
    {
        return critical_;
    }
    const std::vector<uint8_t> &
    body() const noexcept
    {
        return body_;
    }

    /* Creation, expiration and key expiration times */
    uint32_t    time() const noexcept;
    void        set_time(uint32_t value);
    /* Key flags and primary uid flag: first body octet */
    uint8_t     octet() const noexcept;
    void        set_octet(uint8_t value);
    KeyID       keyid() const noexcept;
    void        set_keyid(const KeyID &value);
    Fingerprint fp() const;
    void        set_fp(uint8_t version, const Fingerprint &value);

    static Subpacket time_pkt(Type type, uint32_t value);
};

typedef std::vector<Subpacket> Subpackets;

} // namespace sigsub
} // namespace pkt
} // namespace pgp

#endif
