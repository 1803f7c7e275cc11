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

#include <stdexcept>
#include "key.hpp"
#include "logging.h"
#include "utils.h"

namespace keyreg {

namespace {

/* Pick the newest of the signatures accepted by the filter. Ties go to the later one. */
template <typename Filter>
const Signature *
newest_sig(const std::vector<Signature> &sigs, Filter accept)
{
    const Signature *res = nullptr;
    for (auto &sig : sigs) {
        if (accept(sig) && (!res || (sig.creation() >= res->creation()))) {
            res = &sig;
        }
    }
    return res;
}

} // namespace

Key::Key(const pgp_transferable_key_t &src) : pkt_(src.key), fingerprint_(src.key)
{
    if (!is_primary_key_pkt(pkt_.tag)) {
        throw keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS, "not a primary key");
    }
    sigs_.insert(sigs_.end(), src.signatures.begin(), src.signatures.end());
    for (auto &userid : src.userids) {
        uint32_t uidx = uids_.size();
        uids_.emplace_back(userid.uid);
        for (auto &cert : userid.signatures) {
            sigs_.emplace_back(cert, uidx);
        }
    }
    refresh_data();
}

Key::Key(const pgp_transferable_subkey_t &src, const Key &primary)
    : pkt_(src.subkey), fingerprint_(src.subkey), primary_fp_(primary.fp()),
      primary_fp_set_(true)
{
    if (!is_subkey_pkt(pkt_.tag)) {
        throw keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS, "not a subkey");
    }
    sigs_.insert(sigs_.end(), src.signatures.begin(), src.signatures.end());
    refresh_data();
}

size_t
Key::sig_count() const
{
    return sigs_.size();
}

const Signature &
Key::get_sig(size_t idx) const
{
    return sigs_.at(idx);
}

size_t
Key::uid_count() const
{
    return uids_.size();
}

const UserID &
Key::get_uid(size_t idx) const
{
    return uids_.at(idx);
}

const pgp_key_pkt_t &
Key::pkt() const noexcept
{
    return pkt_;
}

pgp_pubkey_alg_t
Key::alg() const noexcept
{
    return pkt_.alg;
}

pgp_version_t
Key::version() const noexcept
{
    return pkt_.version;
}

bool
Key::is_primary() const noexcept
{
    return is_primary_key_pkt(pkt_.tag);
}

bool
Key::is_subkey() const noexcept
{
    return is_subkey_pkt(pkt_.tag);
}

const pgp::KeyID &
Key::keyid() const noexcept
{
    return fingerprint_.keyid();
}

const pgp::Fingerprint &
Key::fp() const noexcept
{
    return fingerprint_;
}

const pgp::Fingerprint &
Key::primary_fp() const
{
    if (primary_fp_set_) {
        return primary_fp_;
    }
    throw keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS, "primary fingerprint is not set");
}

std::string
Key::keyid_hex() const
{
    return keyid_to_hex(keyid());
}

uint32_t
Key::creation() const noexcept
{
    return pkt_.creation_time;
}

uint32_t
Key::expiration() const noexcept
{
    if (pkt_.version < PGP_V4) {
        /* v3 keys carry validity period in days, saturate it */
        const uint32_t max_days = UINT32_MAX / 86400;
        return pkt_.v3_days > max_days ? UINT32_MAX : (uint32_t) pkt_.v3_days * 86400;
    }
    return expiration_;
}

uint64_t
Key::expires_at() const noexcept
{
    uint64_t period = expiration();
    return period ? period + creation() : 0;
}

uint8_t
Key::flags() const noexcept
{
    return flags_;
}

bool
Key::flags_declared() const noexcept
{
    return flags_declared_;
}

KeyCapabilities
Key::capabilities() const
{
    return derive_capabilities(alg(), flags_, flags_declared_);
}

std::string
Key::content() const
{
    return base64_encode(pkt_.raw);
}

/* Issuer of the signature against the given fingerprint. Fingerprint has priority over
 * the key id, and missing issuer gives an empty result. */
static bool
issued_by(const pgp::pkt::Signature &sig, const pgp::Fingerprint &fp, bool *known)
{
    *known = true;
    if (sig.has_keyfp()) {
        return sig.keyfp() == fp;
    }
    if (sig.has_keyid()) {
        return sig.keyid() == fp.keyid();
    }
    *known = false;
    return false;
}

bool
Key::is_signer(const Signature &sig) const
{
    bool known = false;
    return issued_by(sig.sig, fp(), &known);
}

bool
Key::is_self_cert(const Signature &sig) const
{
    return is_primary() && sig.is_cert() && is_signer(sig);
}

bool
Key::is_direct_self(const Signature &sig) const
{
    return is_primary() && (sig.sig.type() == PGP_SIG_DIRECT) && is_signer(sig);
}

bool
Key::is_binding(const Signature &sig) const
{
    if (!is_subkey() || (sig.sig.type() != PGP_SIG_SUBKEY)) {
        return false;
    }
    bool known = false;
    bool res = issued_by(sig.sig, primary_fp(), &known);
    /* binding right after the subkey may omit the issuer */
    return known ? res : true;
}

const Signature *
Key::latest_selfsig(uint32_t uid) const
{
    if (uid == UserID::None) {
        return newest_sig(sigs_, [this](const Signature &sig) {
            return (sig.uid == UserID::None) && is_direct_self(sig);
        });
    }
    if (uid == UserID::Any) {
        return newest_sig(sigs_, [this](const Signature &sig) {
            return (sig.uid != UserID::None) && is_self_cert(sig);
        });
    }
    if (uid != UserID::Primary) {
        return newest_sig(sigs_, [this, uid](const Signature &sig) {
            return (sig.uid == uid) && is_self_cert(sig);
        });
    }

    auto prim = newest_sig(sigs_, [this](const Signature &sig) {
        return (sig.uid != UserID::None) && is_self_cert(sig) && sig.sig.primary_uid();
    });
    /* newer certification of the same userid overrides primary flag */
    if (prim) {
        auto last = latest_selfsig(prim->uid);
        if (last && (last->creation() > prim->creation())) {
            return nullptr;
        }
    }
    return prim;
}

const Signature *
Key::latest_binding() const
{
    return newest_sig(sigs_, [this](const Signature &sig) { return is_binding(sig); });
}

void
Key::refresh_primary()
{
    auto direct = latest_selfsig(UserID::None);
    auto primary = latest_selfsig(UserID::Primary);
    auto latest = latest_selfsig(UserID::Any);

    /* expiration: direct-key signature, limited by the primary userid certification */
    expiration_ = direct ? direct->sig.key_expiration() : 0;
    if (primary) {
        uint32_t pexp = primary->sig.key_expiration();
        if (pexp && (!expiration_ || (pexp < expiration_))) {
            expiration_ = pexp;
        }
    } else if (!direct && latest) {
        expiration_ = latest->sig.key_expiration();
    }

    /* flags: the first of direct-key, primary userid and latest certification */
    const Signature *source = nullptr;
    for (auto sig : {direct, primary, latest}) {
        if (sig && sig->sig.has_key_flags()) {
            source = sig;
            break;
        }
    }
    flags_declared_ = source != nullptr;
    flags_ = source ? source->sig.key_flags() : pgp_pk_alg_capabilities(alg());
}

void
Key::refresh_subkey()
{
    auto binding = latest_binding();
    if (!binding) {
        KEYREG_LOG_KEY("No binding signature for subkey %s", this);
    }
    expiration_ = binding ? binding->sig.key_expiration() : 0;
    flags_declared_ = binding && binding->sig.has_key_flags();
    flags_ = flags_declared_ ? binding->sig.key_flags() : pgp_pk_alg_capabilities(alg());
}

void
Key::refresh_data()
{
    if (is_primary()) {
        refresh_primary();
        return;
    }
    refresh_subkey();
}

} // namespace keyreg
