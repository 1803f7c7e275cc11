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
#include <initializer_list>
#include "stream-key.h"
#include "stream-armor.h"
#include "stream-packet.h"
#include "stream-sig.h"
#include "types.h"
#include "logging.h"

/* Skip packets of the listed types. Returns false on read error or malformed packet. */
static bool
skip_packets(pgp_source_t &src, std::initializer_list<int> types)
{
    while (true) {
        int ptype = stream_pkt_type(src);
        if (ptype < 0) {
            return false;
        }
        bool listed = false;
        for (int type : types) {
            listed = listed || (type == ptype);
        }
        if (!ptype || !listed) {
            return true;
        }
        size_t pos = src.pos;
        if (stream_skip_packet(&src)) {
            KEYREG_LOG("failed to skip packet at %zu", pos);
            return false;
        }
    }
}

static keyreg_result_t
read_signatures(pgp_source_t &src, pgp::pkt::Signatures &sigs)
{
    int ptype = 0;
    while ((ptype = stream_pkt_type(src)) == PGP_PKT_SIGNATURE) {
        size_t              pos = src.pos;
        pgp::pkt::Signature sig;
        keyreg_result_t     ret = sig.parse(src);
        if (ret) {
            KEYREG_LOG("failed to parse signature at %zu", pos);
            return ret;
        }
        sigs.push_back(std::move(sig));
        if (!skip_packets(src, {PGP_PKT_TRUST})) {
            return KEYREG_ERROR_READ;
        }
    }
    return ptype < 0 ? KEYREG_ERROR_BAD_FORMAT : KEYREG_SUCCESS;
}

/* Key or subkey packet followed by trust packets and signatures */
static keyreg_result_t
read_key_with_sigs(pgp_source_t &src, pgp_key_pkt_t &key, pgp::pkt::Signatures &sigs)
{
    size_t          pos = src.pos;
    keyreg_result_t ret = key.parse(src);
    if (ret) {
        KEYREG_LOG("failed to parse key packet at %zu", pos);
        return ret;
    }
    if (!skip_packets(src, {PGP_PKT_TRUST})) {
        return KEYREG_ERROR_READ;
    }
    return read_signatures(src, sigs);
}

keyreg_result_t
process_pgp_key(pgp_source_t &src, pgp_transferable_key_t &key)
{
    key = pgp_transferable_key_t();
    int ptype = stream_pkt_type(src);
    if ((ptype <= 0) || !is_primary_key_pkt(ptype)) {
        KEYREG_LOG("wrong key packet tag %d at %zu", ptype, src.pos);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    keyreg_result_t ret = read_key_with_sigs(src, key.key, key.signatures);
    if (ret) {
        return ret;
    }

    while ((ptype = stream_pkt_type(src)) > 0) {
        if (ptype == PGP_PKT_USER_ATTR) {
            /* photo ids are not registered, drop them with certifications */
            if (stream_skip_packet(&src) ||
                !skip_packets(src, {PGP_PKT_TRUST, PGP_PKT_SIGNATURE})) {
                return KEYREG_ERROR_BAD_FORMAT;
            }
            continue;
        }
        if (ptype == PGP_PKT_USER_ID) {
            pgp_transferable_userid_t uid;
            if ((ret = uid.uid.parse(src))) {
                KEYREG_LOG("failed to parse userid at %zu", src.pos);
                return ret;
            }
            if (!skip_packets(src, {PGP_PKT_TRUST})) {
                return KEYREG_ERROR_READ;
            }
            if ((ret = read_signatures(src, uid.signatures))) {
                return ret;
            }
            key.userids.push_back(std::move(uid));
            continue;
        }
        if (is_subkey_pkt(ptype)) {
            pgp_transferable_subkey_t sub;
            if ((ret = read_key_with_sigs(src, sub.subkey, sub.signatures))) {
                return ret;
            }
            key.subkeys.push_back(std::move(sub));
            continue;
        }
        break;
    }
    return ptype < 0 ? KEYREG_ERROR_BAD_FORMAT : KEYREG_SUCCESS;
}

static keyreg_result_t
process_key_packets(pgp_source_t &src, pgp_key_sequence_t &keys)
{
    while (true) {
        if (!skip_packets(src, {PGP_PKT_MARKER, PGP_PKT_PADDING})) {
            if (keys.keys.empty()) {
                return KEYREG_ERROR_BAD_FORMAT;
            }
            break;
        }
        if (src_eof(&src)) {
            break;
        }
        pgp_transferable_key_t key;
        keyreg_result_t        ret = process_pgp_key(src, key);
        if (ret && keys.keys.empty()) {
            return ret;
        }
        if (ret) {
            KEYREG_LOG("ignoring %zu bytes after the last key", src_left(&src));
            break;
        }
        keys.keys.push_back(std::move(key));
    }
    return keys.keys.empty() ? KEYREG_ERROR_NO_KEY : KEYREG_SUCCESS;
}

keyreg_result_t
process_pgp_keys(pgp_source_t &src, pgp_key_sequence_t &keys)
{
    keys.keys.clear();
    if (src_eof(&src)) {
        return KEYREG_ERROR_NO_KEY;
    }

    uint8_t first = 0;
    if (src_peek_eq(&src, &first, 1) && (first & PGP_PTAG_ALWAYS_SET)) {
        if (armor_guess_type(&src) == PGP_ARMORED_SECRET_KEY) {
            KEYREG_LOG("secret keys are not accepted");
            return KEYREG_ERROR_BAD_FORMAT;
        }
        return process_key_packets(src, keys);
    }
    if (!is_armored_source(&src)) {
        KEYREG_LOG("input is neither armored nor binary OpenPGP data");
        return KEYREG_ERROR_BAD_FORMAT;
    }

    std::vector<uint8_t> bin;
    pgp_armor_info_t     info;
    keyreg_result_t      ret = dearmor_source(&src, bin, &info);
    if (ret) {
        return ret;
    }
    if (info.type != PGP_ARMORED_PUBLIC_KEY) {
        KEYREG_LOG("wrong armored data type: %s", info.armorhdr.c_str());
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (!src_eof(&src)) {
        KEYREG_LOG("ignoring data after the first armored block");
    }
    pgp_source_t binsrc = {};
    init_mem_src(&binsrc, bin.data(), bin.size());
    return process_key_packets(binsrc, keys);
}

keyreg_result_t
pgp_key_pkt_t::parse(pgp_source_t &src)
{
    int ptype = stream_pkt_type(src);
    if (!is_key_pkt(ptype) || is_secret_key_pkt(ptype)) {
        KEYREG_LOG("not a public key packet: %d", ptype);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    pgp_packet_body_t pkt((pgp_pkt_type_t) ptype);
    keyreg_result_t   ret = pkt.read(src);
    if (ret) {
        return ret;
    }
    tag = (pgp_pkt_type_t) ptype;

    uint8_t ver = 0;
    uint8_t kalg = 0;
    if (!pkt.get(ver) || (ver < PGP_V2) || (ver > PGP_V5)) {
        KEYREG_LOG("wrong key packet version %d", (int) ver);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    version = (pgp_version_t) ver;
    if (!pkt.get(creation_time) || ((version < PGP_V4) && !pkt.get(v3_days)) ||
        !pkt.get(kalg)) {
        KEYREG_LOG("truncated key packet");
        return KEYREG_ERROR_BAD_FORMAT;
    }
    alg = (pgp_pubkey_alg_t) kalg;

    if ((version < PGP_V4) && !is_rsa_key_alg(alg)) {
        KEYREG_LOG("v%d key must be RSA, got %d", (int) version, (int) alg);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    /* v5 keys prefix the material with its length */
    uint32_t matlen = 0;
    if ((version == PGP_V5) && (!pkt.get(matlen) || (matlen != pkt.left()))) {
        KEYREG_LOG("wrong v5 key material length");
        return KEYREG_ERROR_BAD_FORMAT;
    }

    material = pgp::KeyMaterial(alg);
    if (!material.parse(pkt)) {
        KEYREG_LOG("failed to parse key material of algorithm %d", (int) alg);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (pkt.left()) {
        KEYREG_LOG("extra %zu bytes in key packet", pkt.left());
        return KEYREG_ERROR_BAD_FORMAT;
    }

    pub_data.assign(pkt.data(), pkt.data() + pkt.size());
    raw = pkt.hdr();
    raw.insert(raw.end(), pub_data.begin(), pub_data.end());
    return KEYREG_SUCCESS;
}
