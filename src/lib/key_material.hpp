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

#ifndef KEYREG_KEY_MATERIAL_HPP_
#define KEYREG_KEY_MATERIAL_HPP_

#include <vector>
#include "types.h"
#include "crypto/mpi.hpp"

typedef struct pgp_packet_body_t pgp_packet_body_t;

namespace pgp {

/**
 * @brief Algorithm-specific fields of the public key packet.
 *
 * Keys are stored as they were submitted, so fields are only split out of the packet and
 * checked to be well-formed. Integers (RSA n and e, DSA p/q/g/y, EC point, ...) go to
 * fields() in packet order. ECDH KDF parameters and native 25519 keys go to extra(), as well
 * as the whole material of algorithms we do not know.
 */
class KeyMaterial {
    pgp_pubkey_alg_t     alg_;
    pgp_curve_t          curve_;
    std::vector<mpi>     fields_;
    std::vector<uint8_t> extra_;
    bool                 known_;

    bool parse_ecdh_kdf(pgp_packet_body_t &pkt);

  public:
    KeyMaterial(pgp_pubkey_alg_t alg = PGP_PKA_NOTHING);

    /** @brief Consume the material from the packet body.
     *  @return false if fields are malformed or truncated. */
    bool parse(pgp_packet_body_t &pkt);

    pgp_pubkey_alg_t
    alg() const noexcept
    {
        return alg_;
    }
    /* PGP_CURVE_UNKNOWN for non-EC algorithms */
    pgp_curve_t
    curve() const noexcept
    {
        return curve_;
    }
    bool
    known() const noexcept
    {
        return known_;
    }
    const std::vector<mpi> &
    fields() const noexcept
    {
        return fields_;
    }
    const std::vector<uint8_t> &
    extra() const noexcept
    {
        return extra_;
    }
};

} // namespace pgp

#endif
