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

#ifndef STREAM_SIG_H_
#define STREAM_SIG_H_

#include <stdint.h>
#include <array>
#include <vector>
#include "stream-common.h"
#include "stream-packet.h"
#include "sig_subpacket.hpp"

namespace pgp {
namespace pkt {

/**
 * @brief Signature packet of version 2 to 5.
 *
 * Signature material is not interpreted: keys are stored as published and their
 * self-signatures are only consulted for key flags, key expiration and primary user id.
 */
class Signature {
    pgp_sig_type_t type_;

    /* v2 and v3 only */
    uint32_t v3_created_;
    KeyID    v3_signer_;

    const sigsub::Subpacket *find(sigsub::Type type, bool hashed) const;
    void                     put(sigsub::Subpacket &&sub);
    keyreg_result_t          parse_v3(pgp_packet_body_t &pkt);
    keyreg_result_t          parse_v4(pgp_packet_body_t &pkt);
    keyreg_result_t          parse_area(const std::vector<uint8_t> &area, bool hashed);
    std::vector<uint8_t>     area(bool hashed) const;

  public:
    pgp_version_t          version;
    pgp_pubkey_alg_t       palg;
    pgp_hash_alg_t         halg;
    std::array<uint8_t, 2> lbits{};
    /* v4 and up: version, type, algorithms and hashed area as it is hashed */
    std::vector<uint8_t> hashed_data;
    std::vector<uint8_t> material_buf;
    sigsub::Subpackets   subpkts;

    Signature();

    pgp_sig_type_t
    type() const
    {
        return type_;
    }
    void
    set_type(pgp_sig_type_t atype)
    {
        type_ = atype;
    }

    /** @brief Whether this is one of the user id certification types */
    bool is_cert() const;

    /**
     * @brief Lookup subpacket of the given type.
     * @param hashed look only in the hashed area, otherwise in both.
     * @return pointer to the first matching subpacket or nullptr.
     */
    const sigsub::Subpacket *get_subpkt(sigsub::Type type, bool hashed = true) const;

    /* Issuer information: v3 field, issuer key id or issuer fingerprint subpacket */
    bool        has_keyid() const;
    KeyID       keyid() const noexcept;
    void        set_keyid(const KeyID &id);
    bool        has_keyfp() const;
    Fingerprint keyfp() const noexcept;
    void        set_keyfp(const Fingerprint &fp);

    /* All of the following return 0 or false when subpacket is absent */
    uint32_t creation() const;
    void     set_creation(uint32_t ctime);
    uint32_t key_expiration() const;
    void     set_key_expiration(uint32_t etime);
    bool     has_key_flags() const;
    uint8_t  key_flags() const;
    void     set_key_flags(uint8_t flags);
    bool     primary_uid() const;
    void     set_primary_uid(bool primary);

    /** @brief Parse signature body, packet header must be already stripped. */
    keyreg_result_t parse(pgp_packet_body_t &pkt);
    /** @brief Read signature packet from the source and parse it. */
    keyreg_result_t parse(pgp_source_t &src);

    /** @brief Rebuild hashed_data from the fields and hashed subpackets (v4 and up). */
    void fill_hashed_data();
    /** @brief Serialize signature, optionally with the packet header. */
    std::vector<uint8_t> write(bool hdr = true) const;
};

typedef std::vector<Signature> Signatures;

} // namespace pkt
} // namespace pgp

#endif
