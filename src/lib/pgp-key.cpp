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

#include "pgp-key.h"
#include "logging.h"

namespace {

const uint8_t SIGNER = PGP_KF_SIGN | PGP_KF_CERTIFY | PGP_KF_AUTH;

struct alg_usage_t {
    pgp_pubkey_alg_t alg;
    uint8_t          usage;
};

/* Elgamal sign+encrypt (20) is missing on purpose: such keys are not usable at all */
const alg_usage_t alg_usage[] = {
  {PGP_PKA_RSA, SIGNER | PGP_KF_ENCRYPT},
  {PGP_PKA_RSA_ENCRYPT_ONLY, PGP_KF_ENCRYPT},
  {PGP_PKA_RSA_SIGN_ONLY, PGP_KF_SIGN},
  {PGP_PKA_ELGAMAL, PGP_KF_ENCRYPT},
  {PGP_PKA_DSA, SIGNER},
  {PGP_PKA_ECDH, PGP_KF_ENCRYPT},
  {PGP_PKA_ECDSA, SIGNER},
  {PGP_PKA_EDDSA, SIGNER},
  {PGP_PKA_X25519, PGP_KF_ENCRYPT},
  {PGP_PKA_ED25519, SIGNER},
  {PGP_PKA_SM2, SIGNER | PGP_KF_ENCRYPT},
};

} // namespace

pgp_key_flags_t
pgp_pk_alg_capabilities(pgp_pubkey_alg_t alg)
{
    for (auto &entry : alg_usage) {
        if (entry.alg == alg) {
            return (pgp_key_flags_t) entry.usage;
        }
    }
    KEYREG_LOG("no usage for pk alg %d", (int) alg);
    return PGP_KF_NONE;
}

namespace keyreg {

KeyCapabilities
derive_capabilities(pgp_pubkey_alg_t alg, uint8_t flags, bool declared)
{
    uint8_t usage = pgp_pk_alg_capabilities(alg);
    if (declared) {
        usage &= flags;
    }

    KeyCapabilities caps;
    caps.sign = (usage & PGP_KF_SIGN) != 0;
    caps.certify = (usage & PGP_KF_CERTIFY) != 0;
    caps.encrypt_comms = (usage & PGP_KF_ENCRYPT_COMMS) != 0;
    caps.encrypt_storage = (usage & PGP_KF_ENCRYPT_STORAGE) != 0;
    return caps;
}

} // namespace keyreg
