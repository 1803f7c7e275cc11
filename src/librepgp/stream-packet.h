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

#ifndef STREAM_PACKET_H_
#define STREAM_PACKET_H_

#include <stdint.h>
#include <vector>
#include "types.h"
#include "stream-common.h"
#include "crypto/mpi.hpp"

/* Decoded packet header, old or new format */
typedef struct pgp_packet_hdr_t {
    pgp_pkt_type_t tag;
    uint8_t        hdr[PGP_MAX_HEADER_SIZE]; /* raw header bytes */
    size_t         hdr_len;
    size_t         pkt_len;       /* body length, 0 for partial or indeterminate */
    bool           partial;       /* new format partial body length */
    bool           indeterminate; /* old format, packet lasts till the end of data */
} pgp_packet_hdr_t;

/* Packet body, either read from the source or being composed for writing. Only packets
 * with the definite length are supported, which is enough for the key material. */
typedef struct pgp_packet_body_t {
  private:
    pgp_pkt_type_t       tag_;
    std::vector<uint8_t> data_;
    uint8_t              hdr_[PGP_MAX_HEADER_SIZE]{};
    size_t               hdr_len_{};
    size_t               pos_{};

  public:
    /* empty body of the packet to write */
    pgp_packet_body_t(pgp_pkt_type_t tag);
    /* body without header, to parse fields from the memory */
    pgp_packet_body_t(const uint8_t *data, size_t len);

    pgp_packet_body_t(const pgp_packet_body_t &src) = delete;
    pgp_packet_body_t(pgp_packet_body_t &&src) = delete;
    pgp_packet_body_t &operator=(const pgp_packet_body_t &) = delete;
    pgp_packet_body_t &operator=(pgp_packet_body_t &&) = delete;

    pgp_pkt_type_t tag() const noexcept;
    uint8_t *      data() noexcept;
    size_t         size() const noexcept;
    /* bytes which were not consumed by get() yet */
    size_t left() const noexcept;

    /**
     * @brief Consume the next field of the body. Integers are big-endian.
     * @return false if there is not enough data or field is malformed, in this case read
     *         position is undefined.
     */
    bool get(uint8_t &val) noexcept;
    bool get(uint16_t &val) noexcept;
    bool get(uint32_t &val) noexcept;
    bool get(uint8_t *val, size_t len) noexcept;
    bool get(pgp::KeyID &val) noexcept;
    /* multiprecision integer: bit count followed by the bytes */
    bool get(pgp::mpi &val) noexcept;
    /* curve OID, prefixed with its length. Unknown curves fail. */
    bool get(pgp_curve_t &val) noexcept;

    void add(const void *data, size_t len);
    void add_byte(uint8_t bt);
    void add_uint16(uint16_t val);
    void add_uint32(uint32_t val);
    void add(const pgp::KeyID &val);

    /**
     * @brief Read the whole packet from the source. If tag was specified in constructor then
     *        it must match the packet's one.
     * @return KEYREG_SUCCESS, KEYREG_ERROR_NOT_ENOUGH_DATA or KEYREG_ERROR_BAD_FORMAT.
     */
    keyreg_result_t read(pgp_source_t &src) noexcept;
    /* header as it was read */
    std::vector<uint8_t> hdr() const;
    /* body, prefixed with the new format header if hdr is set */
    std::vector<uint8_t> write(bool hdr = true) const;
} pgp_packet_body_t;

/* User ID, or user attribute which is kept as opaque data */
typedef struct pgp_userid_pkt_t {
    pgp_pkt_type_t       tag{PGP_PKT_RESERVED};
    std::vector<uint8_t> uid;

    bool operator==(const pgp_userid_pkt_t &src) const;
    bool operator!=(const pgp_userid_pkt_t &src) const;

    std::vector<uint8_t> write() const;
    keyreg_result_t      parse(pgp_source_t &src);
} pgp_userid_pkt_t;

/** @brief Encode new format body length to buf, which must have room for 5 bytes.
 *  @return number of bytes used: 1, 2 or 5.
 */
size_t write_packet_len(uint8_t *buf, size_t len);

/* Packet tag from the first header byte, or -1 if it is not a packet header */
int get_packet_type(uint8_t ptag);

/**
 * @brief Peek the type of the next packet.
 * @return tag, 0 at the end of data or -1 if the header is malformed or truncated.
 */
int stream_pkt_type(pgp_source_t &src);

/**
 * @brief Peek and decode the next packet header. Source position is not changed.
 * @return KEYREG_SUCCESS, KEYREG_ERROR_NOT_ENOUGH_DATA or KEYREG_ERROR_BAD_FORMAT.
 */
keyreg_result_t stream_peek_packet_hdr(pgp_source_t *src, pgp_packet_hdr_t *hdr);

/* Skip the next packet. Packets without definite length are not skipped. */
keyreg_result_t stream_skip_packet(pgp_source_t *src);

bool is_key_pkt(int tag);
bool is_subkey_pkt(int tag);
bool is_primary_key_pkt(int tag);
bool is_secret_key_pkt(int tag);
bool is_rsa_key_alg(pgp_pubkey_alg_t alg);

#endif
