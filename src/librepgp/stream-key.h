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

#ifndef STREAM_KEY_H_
#define STREAM_KEY_H_

#include <stdint.h>
#include <vector>
#include "stream-common.h"
#include "stream-sig.h"
#include "stream-packet.h"
#include "key_material.hpp"

/** Public key or public subkey packet */
typedef struct pgp_key_pkt_t {
    pgp_pkt_type_t   tag{PGP_PKT_RESERVED};
    pgp_version_t    version{PGP_VUNKNOWN};
    uint32_t         creation_time{};
    pgp_pubkey_alg_t alg{PGP_PKA_NOTHING};
    uint16_t         v3_days{}; /* v2 and v3 only: validity period in days */

    std::vector<uint8_t> pub_data; /* packet body, hashed for the fingerprint */
    std::vector<uint8_t> raw;      /* header and body as they were read */
    pgp::KeyMaterial     material;

    /** @brief Read and parse the key packet. Secret key packets are refused. */
    keyreg_result_t parse(pgp_source_t &src);
} pgp_key_pkt_t;

typedef struct pgp_transferable_userid_t {
    pgp_userid_pkt_t     uid;
    pgp::pkt::Signatures signatures;
} pgp_transferable_userid_t;

typedef struct pgp_transferable_subkey_t {
    pgp_key_pkt_t        subkey;
    pgp::pkt::Signatures signatures;
} pgp_transferable_subkey_t;

/* Transferable public key, RFC 4880 section 11.1 */
typedef struct pgp_transferable_key_t {
    pgp_key_pkt_t                          key;
    pgp::pkt::Signatures                   signatures; /* direct-key signatures */
    std::vector<pgp_transferable_userid_t> userids;
    std::vector<pgp_transferable_subkey_t> subkeys;
} pgp_transferable_key_t;

typedef struct pgp_key_sequence_t {
    std::vector<pgp_transferable_key_t> keys;
} pgp_key_sequence_t;

/**
 * @brief Read all transferable public keys from the source.
 *        Armored input is dearmored first, and only the first armored block is used.
 *        Trust packets and user attributes are skipped. Data after the last complete key is
 *        ignored if at least one key was read.
 * @return KEYREG_SUCCESS, KEYREG_ERROR_NO_KEY for empty input or other error code.
 */
keyreg_result_t process_pgp_keys(pgp_source_t &src, pgp_key_sequence_t &keys);

/** @brief Read a single transferable key from the binary source */
keyreg_result_t process_pgp_key(pgp_source_t &src, pgp_transferable_key_t &key);

#endif
