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

#ifndef KEYREG_KEY_DECODER_HPP_
#define KEYREG_KEY_DECODER_HPP_

#include <string>
#include <vector>
#include "key.hpp"

namespace keyreg {

/* Key as it was submitted: primary key, its subkeys and userids claiming emails */
typedef struct DecodedKey {
    Key                 primary;
    std::vector<Key>    subkeys;
    std::vector<UserID> identities;
} DecodedKey;

/**
 * @brief Decode armored (or binary) transferable public key. Only the first key of the
 *        sequence is used. This is a pure function: no storage is touched and no emails are
 *        checked.
 *
 * @param buf key data.
 * @param len length of the data.
 * @param key on success decoded key is stored here.
 * @return KEYREG_SUCCESS, KEYREG_ERROR_BAD_FORMAT if data is not a parseable public key
 *         block or has no keys at all, or KEYREG_ERROR_BAD_PARAMETERS.
 */
keyreg_result_t decode_key(const uint8_t *buf, size_t len, DecodedKey &key);
keyreg_result_t decode_key(const std::string &armored, DecodedKey &key);

/**
 * @brief Parse key packet, stored as base64 in the registry record content.
 *
 * @param content base64 of the key packet with header.
 * @param pkt on success parsed packet is stored here.
 * @return KEYREG_SUCCESS or KEYREG_ERROR_BAD_FORMAT.
 */
keyreg_result_t decode_key_content(const std::string &content, pgp_key_pkt_t &pkt);

} // namespace keyreg

#endif
