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

#include <librepgp/stream-common.h>
#include <librepgp/stream-packet.h>
#include <librepgp/stream-key.h>
#include "key_decoder.hpp"
#include "logging.h"
#include "utils.h"

namespace keyreg {

static keyreg_result_t
decode_ts_key(const pgp_transferable_key_t &tkey, DecodedKey &key)
{
    try {
        Key primary(tkey);
        std::vector<Key> subkeys;
        for (auto &subkey : tkey.subkeys) {
            subkeys.emplace_back(subkey, primary);
        }
        std::vector<UserID> identities;
        for (size_t idx = 0; idx < primary.uid_count(); idx++) {
            identities.push_back(primary.get_uid(idx));
        }
        key.primary = std::move(primary);
        key.subkeys = std::move(subkeys);
        key.identities = std::move(identities);
        return KEYREG_SUCCESS;
    } catch (const keyreg_exception &e) {
        KEYREG_LOG("failed to load key: %s (0x%x)", e.what(), e.code());
        return KEYREG_ERROR_BAD_FORMAT;
    }
}

keyreg_result_t
decode_key(const uint8_t *buf, size_t len, DecodedKey &key)
{
    if (!buf && len) {
        return KEYREG_ERROR_NULL_POINTER;
    }

    pgp_source_t src = {};
    init_mem_src(&src, buf, len);

    pgp_key_sequence_t keys;
    keyreg_result_t    ret = KEYREG_ERROR_GENERIC;
    try {
        ret = process_pgp_keys(src, keys);
    } catch (const keyreg_exception &e) {
        KEYREG_LOG("%s", e.what());
        ret = e.code();
    }
    if (ret) {
        KEYREG_LOG("failed to process keys: 0x%x", ret);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (keys.keys.empty()) {
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (keys.keys.size() > 1) {
        KEYREG_LOG("%zu keys found, using the first one", keys.keys.size());
    }
    return decode_ts_key(keys.keys.front(), key);
}

keyreg_result_t
decode_key(const std::string &armored, DecodedKey &key)
{
    return decode_key((const uint8_t *) armored.data(), armored.size(), key);
}

keyreg_result_t
decode_key_content(const std::string &content, pgp_key_pkt_t &pkt)
{
    try {
        std::vector<uint8_t> raw = base64_decode(content);
        if (raw.empty()) {
            KEYREG_LOG("empty key content");
            return KEYREG_ERROR_BAD_FORMAT;
        }

        pgp_source_t src = {};
        init_mem_src(&src, raw.data(), raw.size());
        if (!is_key_pkt(stream_pkt_type(src))) {
            KEYREG_LOG("key content is not a key packet");
            return KEYREG_ERROR_BAD_FORMAT;
        }
        if (pkt.parse(src)) {
            return KEYREG_ERROR_BAD_FORMAT;
        }
        if (!src_eof(&src)) {
            KEYREG_LOG("extra data after the key packet");
            return KEYREG_ERROR_BAD_FORMAT;
        }
        return KEYREG_SUCCESS;
    } catch (const keyreg_exception &e) {
        KEYREG_LOG("%s", e.what());
        return KEYREG_ERROR_BAD_FORMAT;
    }
}

} // namespace keyreg
