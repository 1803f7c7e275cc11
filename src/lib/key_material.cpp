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

#include "key_material.hpp"
#include "librepgp/stream-packet.h"
#include "logging.h"

namespace pgp {

namespace {

/* Shape of the public key material */
enum class Layout { Mpis, Curve, CurveKdf, Raw, Opaque };

struct alg_layout_t {
    pgp_pubkey_alg_t alg;
    Layout           layout;
    size_t           count; /* number of mpis, or raw bytes */
    pgp_curve_t      curve;
};

const alg_layout_t layouts[] = {
  {PGP_PKA_RSA, Layout::Mpis, 2, PGP_CURVE_UNKNOWN},
  {PGP_PKA_RSA_ENCRYPT_ONLY, Layout::Mpis, 2, PGP_CURVE_UNKNOWN},
  {PGP_PKA_RSA_SIGN_ONLY, Layout::Mpis, 2, PGP_CURVE_UNKNOWN},
  {PGP_PKA_ELGAMAL, Layout::Mpis, 3, PGP_CURVE_UNKNOWN},
  {PGP_PKA_ELGAMAL_ENCRYPT_OR_SIGN, Layout::Mpis, 3, PGP_CURVE_UNKNOWN},
  {PGP_PKA_DSA, Layout::Mpis, 4, PGP_CURVE_UNKNOWN},
  {PGP_PKA_ECDSA, Layout::Curve, 1, PGP_CURVE_UNKNOWN},
  {PGP_PKA_EDDSA, Layout::Curve, 1, PGP_CURVE_UNKNOWN},
  {PGP_PKA_SM2, Layout::Curve, 1, PGP_CURVE_UNKNOWN},
  {PGP_PKA_ECDH, Layout::CurveKdf, 1, PGP_CURVE_UNKNOWN},
  {PGP_PKA_ED25519, Layout::Raw, 32, PGP_CURVE_ED25519},
  {PGP_PKA_X25519, Layout::Raw, 32, PGP_CURVE_25519},
};

const alg_layout_t *
find_layout(pgp_pubkey_alg_t alg)
{
    for (auto &layout : layouts) {
        if (layout.alg == alg) {
            return &layout;
        }
    }
    return nullptr;
}

} // namespace

KeyMaterial::KeyMaterial(pgp_pubkey_alg_t alg)
    : alg_(alg), curve_(PGP_CURVE_UNKNOWN), known_(find_layout(alg) != nullptr)
{
}

bool
KeyMaterial::parse_ecdh_kdf(pgp_packet_body_t &pkt)
{
    /* size (3), reserved (1), hash algorithm and key wrap algorithm */
    uint8_t kdf[4] = {};
    if (!pkt.get(kdf, sizeof(kdf))) {
        KEYREG_LOG("failed to get ECDH KDF parameters");
        return false;
    }
    if ((kdf[0] != 3) || (kdf[1] != 1)) {
        KEYREG_LOG("wrong ECDH KDF parameters %d/%d", (int) kdf[0], (int) kdf[1]);
        return false;
    }
    extra_.assign(kdf, kdf + sizeof(kdf));
    return true;
}

bool
KeyMaterial::parse(pgp_packet_body_t &pkt)
{
    fields_.clear();
    extra_.clear();
    curve_ = PGP_CURVE_UNKNOWN;

    auto layout = find_layout(alg_);
    if (!layout) {
        KEYREG_LOG("unknown public key algorithm %d, keeping opaque material", (int) alg_);
        extra_.resize(pkt.left());
        return pkt.get(extra_.data(), extra_.size());
    }

    switch (layout->layout) {
    case Layout::Raw:
        curve_ = layout->curve;
        extra_.resize(layout->count);
        return pkt.get(extra_.data(), extra_.size());
    case Layout::Curve:
    case Layout::CurveKdf:
        if (!pkt.get(curve_)) {
            return false;
        }
        break;
    default:
        break;
    }

    fields_.resize(layout->count);
    for (auto &field : fields_) {
        if (!pkt.get(field)) {
            KEYREG_LOG("failed to read mpi of algorithm %d", (int) alg_);
            return false;
        }
    }
    return (layout->layout != Layout::CurveKdf) || parse_ecdh_kdf(pkt);
}

} // namespace pgp
