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

#include <cinttypes>
#include <stdexcept>
#include "stream-sig.h"
#include "stream-packet.h"
#include "utils.h"
#include "logging.h"

namespace pgp {
namespace pkt {

using sigsub::Subpacket;
using sigsub::Type;

Signature::Signature()
    : type_(PGP_SIG_BINARY), v3_created_(0), v3_signer_{}, version(PGP_VUNKNOWN),
      palg(PGP_PKA_NOTHING), halg(PGP_HASH_UNKNOWN)
{
}

bool
Signature::is_cert() const
{
    switch (type_) {
    case PGP_CERT_GENERIC:
    case PGP_CERT_PERSONA:
    case PGP_CERT_CASUAL:
    case PGP_CERT_POSITIVE:
        return true;
    default:
        return false;
    }
}

const Subpacket *
Signature::find(Type type, bool hashed) const
{
    for (auto &sub : subpkts) {
        if ((sub.raw_type() == static_cast<uint8_t>(type)) && (!hashed || sub.hashed())) {
            return &sub;
        }
    }
    return nullptr;
}

const Subpacket *
Signature::get_subpkt(Type type, bool hashed) const
{
    return version < PGP_V4 ? nullptr : find(type, hashed);
}

void
Signature::put(Subpacket &&sub)
{
    if (version < PGP_V4) {
        KEYREG_LOG("v%d signature cannot carry subpackets", (int) version);
        throw std::invalid_argument("version");
    }
    for (auto &existing : subpkts) {
        if ((existing.raw_type() == sub.raw_type()) && (existing.hashed() == sub.hashed())) {
            existing = std::move(sub);
            return;
        }
    }
    subpkts.push_back(std::move(sub));
}

bool
Signature::has_keyid() const
{
    return (version < PGP_V4) || get_subpkt(Type::IssuerKeyID, false) || has_keyfp();
}

KeyID
Signature::keyid() const noexcept
{
    if (version < PGP_V4) {
        return v3_signer_;
    }
    auto sub = get_subpkt(Type::IssuerKeyID, false);
    if (sub && (version == PGP_V4)) {
        return sub->keyid();
    }
    /* v5 has no issuer key id, take it from the fingerprint */
    return keyfp().keyid();
}

void
Signature::set_keyid(const KeyID &id)
{
    if (version < PGP_V4) {
        v3_signer_ = id;
        return;
    }
    Subpacket sub(Type::IssuerKeyID, false);
    sub.set_keyid(id);
    put(std::move(sub));
}

bool
Signature::has_keyfp() const
{
    auto sub = get_subpkt(Type::IssuerFingerprint, false);
    if (!sub) {
        return false;
    }
    size_t expected = version == PGP_V5 ? PGP_FINGERPRINT_V5_SIZE : PGP_FINGERPRINT_V4_SIZE;
    return (version >= PGP_V4) && (version <= PGP_V5) && (sub->fp().size() == expected);
}

Fingerprint
Signature::keyfp() const noexcept
{
    auto sub = get_subpkt(Type::IssuerFingerprint, false);
    try {
        return sub ? sub->fp() : Fingerprint();
    } catch (const std::exception &e) {
        KEYREG_LOG("%s", e.what());
        return Fingerprint();
    }
}

void
Signature::set_keyfp(const Fingerprint &fp)
{
    Subpacket sub(Type::IssuerFingerprint);
    sub.set_fp(version, fp);
    put(std::move(sub));
}

uint32_t
Signature::creation() const
{
    if (version < PGP_V4) {
        return v3_created_;
    }
    auto sub = get_subpkt(Type::CreationTime);
    return sub ? sub->time() : 0;
}

void
Signature::set_creation(uint32_t ctime)
{
    if (version < PGP_V4) {
        v3_created_ = ctime;
        return;
    }
    put(Subpacket::time_pkt(Type::CreationTime, ctime));
}

uint32_t
Signature::key_expiration() const
{
    auto sub = get_subpkt(Type::KeyExpirationTime);
    return sub ? sub->time() : 0;
}

void
Signature::set_key_expiration(uint32_t etime)
{
    put(Subpacket::time_pkt(Type::KeyExpirationTime, etime));
}

bool
Signature::has_key_flags() const
{
    return get_subpkt(Type::KeyFlags);
}

uint8_t
Signature::key_flags() const
{
    auto sub = get_subpkt(Type::KeyFlags);
    return sub ? sub->octet() : 0;
}

void
Signature::set_key_flags(uint8_t flags)
{
    Subpacket sub(Type::KeyFlags);
    sub.set_octet(flags);
    put(std::move(sub));
}

bool
Signature::primary_uid() const
{
    auto sub = get_subpkt(Type::PrimaryUserID);
    return sub && sub->octet();
}

void
Signature::set_primary_uid(bool primary)
{
    Subpacket sub(Type::PrimaryUserID);
    sub.set_octet(primary);
    put(std::move(sub));
}

keyreg_result_t
Signature::parse_v3(pgp_packet_body_t &pkt)
{
    uint8_t hlen = 0;
    uint8_t stype = 0;
    uint8_t alg = 0;
    uint8_t hash = 0;
    if (!pkt.get(hlen) || (hlen != 5)) {
        KEYREG_LOG("wrong v3 hashed length");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (!pkt.get(stype) || !pkt.get(v3_created_) || !pkt.get(v3_signer_) || !pkt.get(alg) ||
        !pkt.get(hash)) {
        KEYREG_LOG("truncated v3 signature");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    type_ = (pgp_sig_type_t) stype;
    palg = (pgp_pubkey_alg_t) alg;
    halg = (pgp_hash_alg_t) hash;
    return KEYREG_SUCCESS;
}

keyreg_result_t
Signature::parse_area(const std::vector<uint8_t> &area, bool hashed)
{
    size_t pos = 0;
    size_t count = 0;
    while (pos < area.size()) {
        if (++count > PGP_MAX_SUBPACKETS) {
            KEYREG_LOG("too many signature subpackets");
            return KEYREG_ERROR_BAD_FORMAT;
        }
        size_t left = area.size() - pos;
        size_t len = area[pos];
        size_t lenlen = 1;
        if ((len >= 192) && (len < 255)) {
            lenlen = 2;
            len = left < 2 ? 0 : ((len - 192) << 8) + area[pos + 1] + 192;
        } else if (len == 255) {
            lenlen = 5;
            len = left < 5 ? 0 : read_uint32(&area[pos + 1]);
        }
        if (!len || (left < lenlen + len)) {
            KEYREG_LOG("wrong subpacket length %zu at %zu", len, pos);
            return KEYREG_ERROR_BAD_FORMAT;
        }
        Subpacket sub(Type::Unknown, hashed);
        if (!sub.decode(&area[pos + lenlen], len)) {
            return KEYREG_ERROR_BAD_FORMAT;
        }
        subpkts.push_back(std::move(sub));
        pos += lenlen + len;
    }
    return KEYREG_SUCCESS;
}

keyreg_result_t
Signature::parse_v4(pgp_packet_body_t &pkt)
{
    uint8_t  hdr[5] = {};
    uint16_t unhlen = 0;
    if (!pkt.get(hdr, sizeof(hdr))) {
        KEYREG_LOG("truncated v4 signature");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    type_ = (pgp_sig_type_t) hdr[0];
    palg = (pgp_pubkey_alg_t) hdr[1];
    halg = (pgp_hash_alg_t) hdr[2];

    std::vector<uint8_t> hashed(read_uint16(&hdr[3]));
    if (!pkt.get(hashed.data(), hashed.size())) {
        KEYREG_LOG("truncated hashed subpackets");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    hashed_data.assign(1, version);
    hashed_data.insert(hashed_data.end(), hdr, hdr + sizeof(hdr));
    hashed_data.insert(hashed_data.end(), hashed.begin(), hashed.end());

    if (!pkt.get(unhlen)) {
        KEYREG_LOG("no unhashed subpackets length");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    std::vector<uint8_t> unhashed(unhlen);
    if (!pkt.get(unhashed.data(), unhashed.size())) {
        KEYREG_LOG("truncated unhashed subpackets");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    keyreg_result_t ret = parse_area(hashed, true);
    return ret ? ret : parse_area(unhashed, false);
}

keyreg_result_t
Signature::parse(pgp_packet_body_t &pkt)
{
    uint8_t ver = 0;
    if (!pkt.get(ver)) {
        return KEYREG_ERROR_BAD_FORMAT;
    }
    version = (pgp_version_t) ver;
    subpkts.clear();

    keyreg_result_t ret = KEYREG_ERROR_BAD_FORMAT;
    if ((ver == PGP_V2) || (ver == PGP_V3)) {
        ret = parse_v3(pkt);
    } else if ((ver == PGP_V4) || (ver == PGP_V5)) {
        ret = parse_v4(pkt);
    } else {
        KEYREG_LOG("unsupported signature version %d", (int) ver);
    }
    if (ret) {
        return ret;
    }
    if (!pkt.get(lbits.data(), lbits.size())) {
        KEYREG_LOG("no hash left bits");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    material_buf.resize(pkt.left());
    return pkt.get(material_buf.data(), material_buf.size()) ? KEYREG_SUCCESS :
                                                              KEYREG_ERROR_BAD_FORMAT;
}

keyreg_result_t
Signature::parse(pgp_source_t &src)
{
    pgp_packet_body_t pkt(PGP_PKT_SIGNATURE);
    keyreg_result_t   ret = pkt.read(src);
    return ret ? ret : parse(pkt);
}

std::vector<uint8_t>
Signature::area(bool hashed) const
{
    std::vector<uint8_t> res(2, 0);
    for (auto &sub : subpkts) {
        if (sub.hashed() == hashed) {
            sub.encode(res);
        }
    }
    if (res.size() - 2 > 0xffff) {
        KEYREG_LOG("subpackets area is too large");
        throw keyreg::keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS);
    }
    write_uint16(res.data(), res.size() - 2);
    return res;
}

void
Signature::fill_hashed_data()
{
    if ((version != PGP_V4) && (version != PGP_V5)) {
        KEYREG_LOG("cannot build hashed data for v%d", (int) version);
        throw keyreg::keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS);
    }
    hashed_data = {(uint8_t) version, (uint8_t) type_, (uint8_t) palg, (uint8_t) halg};
    auto hashed = area(true);
    hashed_data.insert(hashed_data.end(), hashed.begin(), hashed.end());
}

std::vector<uint8_t>
Signature::write(bool hdr) const
{
    pgp_packet_body_t body(PGP_PKT_SIGNATURE);
    switch (version) {
    case PGP_V2:
    case PGP_V3:
        body.add_byte(version);
        body.add_byte(5);
        body.add_byte(type_);
        body.add_uint32(v3_created_);
        body.add(v3_signer_);
        body.add_byte(palg);
        body.add_byte(halg);
        break;
    case PGP_V4:
    case PGP_V5: {
        body.add(hashed_data.data(), hashed_data.size());
        auto unhashed = area(false);
        body.add(unhashed.data(), unhashed.size());
        break;
    }
    default:
        KEYREG_LOG("cannot write v%d signature", (int) version);
        throw keyreg::keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS);
    }
    body.add(lbits.data(), lbits.size());
    body.add(material_buf.data(), material_buf.size());
    return body.write(hdr);
}

} // namespace pkt
} // namespace pgp
