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

#ifndef STREAM_ARMOR_H_
#define STREAM_ARMOR_H_

#include <string>
#include <vector>
#include <repgp/repgp_def.h>
#include "stream-common.h"

/* Information, gathered while dearmoring */
typedef struct pgp_armor_info_t {
    pgp_armored_msg_t type{PGP_ARMORED_UNKNOWN};
    std::string       armorhdr; /* armor header line contents, i.e. BEGIN PGP PUBLIC KEY BLOCK */
    std::string       version;  /* Version: header if any */
    std::string       comment;  /* Comment: header if any */
    std::string       hash;     /* Hash: header if any */
    std::string       charset;  /* Charset: header if any */
    bool              has_crc{};
    bool              crc_valid{};
} pgp_armor_info_t;

/* @brief Check whether source could be an armored source
 * @param src initialized source with some data
 * @return true if source could be an armored data or false otherwise
 **/
bool is_armored_source(pgp_source_t *src);

/* @brief Guess the corresponding armored message type by first byte(s) of PGP message
 * @param src initialized source with binary PGP message data
 * @return corresponding enum element or PGP_ARMORED_UNKNOWN
 **/
pgp_armored_msg_t armor_guess_type(pgp_source_t *src);

/* @brief Get type of the armored message by peeking header.
 * @param src initialized source with armored message data.
 * @return corresponding enum element or PGP_ARMORED_UNKNOWN
 **/
pgp_armored_msg_t armored_get_type(pgp_source_t *src);

/* @brief Dearmor the single armored block from the source, outputting binary data.
 *        Source position is moved after the armor trailer, so the next block may be read.
 * @param src initialized source with armored data
 * @param dst vector to append binary data to
 * @param info if not NULL then armor headers and crc status would be stored here
 * @return KEYREG_SUCCESS on success or error code otherwise
 **/
keyreg_result_t dearmor_source(pgp_source_t *          src,
                               std::vector<uint8_t> &  dst,
                               pgp_armor_info_t *      info = NULL);

#endif
