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

#ifndef KEYREG_FINGERPRINT_HPP_
#define KEYREG_FINGERPRINT_HPP_

#include <array>
#include <vector>
#include <string>
#include "types.h"

typedef struct pgp_key_pkt_t pgp_key_pkt_t;

/* Size of the v3 fingerprint */
#define PGP_FINGERPRINT_V3_SIZE 16

namespace pgp {

/** Key fingerprint together with the key id, derived from it.
 *  v2/v3: MD5 of RSA n and e, key id is the low 64 bits of n.
 *  v4:    SHA1 of the public key packet, key id is the low 64 bits of fingerprint.
 *  v5:    SHA256 of the public key packet, key id is the high 64 bits of fingerprint.
 */
class Fingerprint {
    std::vector<uint8_t> fp_;
    KeyID                keyid_;

  public:
    Fingerprint();
    /* Fingerprint as it is stored in the issuer subpacket. Key id is derived for the v4 and
     * v5 sizes only. */
    Fingerprint(const uint8_t *data, size_t size);
    /* Calculate fingerprint of the key packet. Throws for unsupported versions. */
    Fingerprint(const pgp_key_pkt_t &src);

    bool operator==(const Fingerprint &src) const;
    bool operator!=(const Fingerprint &src) const;

    const KeyID &  keyid() const noexcept;
    const uint8_t *data() const noexcept;
    size_t         size() const noexcept;
    /* uppercase hex */
    std::string str() const;
};

} // namespace pgp

#endif
