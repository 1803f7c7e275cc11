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

#ifndef KEYREG_KEY_HPP_
#define KEYREG_KEY_HPP_

#include <stdint.h>
#include <string>
#include <vector>
#include "librepgp/stream-key.h"
#include "fingerprint.hpp"
#include "pgp-key.h"
#include "signature.hpp"
#include "userid.hpp"

namespace keyreg {

/* Primary key or subkey, loaded from the transferable key */
class Key {
  private:
    std::vector<Signature> sigs_;             /* all signatures, in the original order */
    std::vector<UserID>    uids_{};           /* array of user ids */
    pgp_key_pkt_t          pkt_{};            /* public key data packet */
    uint8_t                flags_{};          /* key flags */
    bool                   flags_declared_{}; /* flags were taken from the self-signature */
    uint32_t               expiration_{};     /* key expiration time, if available */
    pgp::Fingerprint       fingerprint_;
    pgp::Fingerprint       primary_fp_; /* fingerprint of the primary key (for subkeys) */
    bool                   primary_fp_set_{};

    void refresh_primary();
    void refresh_subkey();

  public:
    Key() = default;
    /** @brief Load primary key with userids and direct-key signatures. Subkeys are not
     *         loaded, use the next constructor for each of them. */
    Key(const pgp_transferable_key_t &src);
    Key(const pgp_transferable_subkey_t &src, const Key &primary);

    size_t           sig_count() const;
    const Signature &get_sig(size_t idx) const;
    size_t           uid_count() const;
    const UserID &   get_uid(size_t idx) const;

    const pgp_key_pkt_t &pkt() const noexcept;
    pgp_pubkey_alg_t     alg() const noexcept;
    pgp_version_t        version() const noexcept;
    bool                 is_primary() const noexcept;
    bool                 is_subkey() const noexcept;

    const pgp::KeyID &      keyid() const noexcept;
    const pgp::Fingerprint &fp() const noexcept;
    const pgp::Fingerprint &primary_fp() const;
    std::string             keyid_hex() const;

    /** @brief key creation time, seconds since the epoch */
    uint32_t creation() const noexcept;
    /** @brief key expiration in seconds since the creation, 0 if key doesn't expire */
    uint32_t expiration() const noexcept;
    /** @brief key expiration time, seconds since the epoch, or 0 if key doesn't expire */
    uint64_t expires_at() const noexcept;
    uint8_t  flags() const noexcept;
    bool     flags_declared() const noexcept;
    /** @brief capabilities of the key: declared flags limited by the algorithm */
    KeyCapabilities capabilities() const;

    /** @brief base64 of the key packet, including the packet header */
    std::string content() const;

    /** @brief Check whether signature is issued by this key */
    bool is_signer(const Signature &sig) const;
    /** @brief Check whether signature is a certification of own userid */
    bool is_self_cert(const Signature &sig) const;
    /** @brief Check whether signature is a direct-key self-signature */
    bool is_direct_self(const Signature &sig) const;
    /** @brief Check whether signature is a subkey binding by the primary key */
    bool is_binding(const Signature &sig) const;

    /**
     * @brief Get the latest self-signature. Signatures are not validated.
     *
     * @param uid userid index, UserID::None for direct-key signature, UserID::Primary
     *            for the certification of the primary userid or UserID::Any for the latest
     *            certification of any userid.
     * @return pointer to signature or nullptr if there is no matching one.
     */
    const Signature *latest_selfsig(uint32_t uid) const;
    /** @brief Get the latest subkey binding signature, or nullptr */
    const Signature *latest_binding() const;

    /** @brief Recalculate key flags and expiration from the self-signatures */
    void refresh_data();
};

} // namespace keyreg

#endif // KEYREG_KEY_HPP_
