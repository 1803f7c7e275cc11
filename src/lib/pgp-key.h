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

#ifndef KEYREG_PGP_KEY_H_
#define KEYREG_PGP_KEY_H_

#include <stdint.h>
#include <repgp/repgp_def.h>

/**
 * @brief Get the usage flags allowed by the public key algorithm.
 *
 * @param alg public key algorithm.
 * @return combination of PGP_KF_* flags, PGP_KF_NONE for unknown or deprecated algorithms.
 */
pgp_key_flags_t pgp_pk_alg_capabilities(pgp_pubkey_alg_t alg);

namespace keyreg {

/* What the key may be used for, as stored in the registry */
typedef struct KeyCapabilities {
    bool sign{};
    bool encrypt_comms{};
    bool encrypt_storage{};
    bool certify{};

    bool
    operator==(const KeyCapabilities &src) const
    {
        return (sign == src.sign) && (encrypt_comms == src.encrypt_comms) &&
               (encrypt_storage == src.encrypt_storage) && (certify == src.certify);
    }
    bool
    operator!=(const KeyCapabilities &src) const
    {
        return !(*this == src);
    }
} KeyCapabilities;

/**
 * @brief Derive the key capabilities. Declared flags, if any, are limited to what the
 *        algorithm is able to do. Never fails: unknown algorithm gets all capabilities false.
 *
 * @param alg public key algorithm.
 * @param flags key flags from the self-signature.
 * @param declared whether self-signature has the key flags subpacket. If not then flags are
 *        ignored and the algorithm capabilities are used.
 */
KeyCapabilities derive_capabilities(pgp_pubkey_alg_t alg, uint8_t flags, bool declared);

} // namespace keyreg

#endif // KEYREG_PGP_KEY_H_
