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

#include <string.h>
#include <inttypes.h>
#include "stream-packet.h"
#include "crypto/ec.h"
#include "logging.h"
#include "utils.h"

size_t
write_packet_len(uint8_t *buf, size_t len)
{
    if (len < 192) {
        buf[0] = (uint8_t) len;
        return 1;
    }
    if (len < 8384) {
        size_t rest = len - 192;
        buf[0] = (uint8_t)((rest >> 8) + 192);
        buf[1] = (uint8_t)(rest & 0xff);
        return 2;
    }
    buf[0] = 0xff;
    write_uint32(buf + 1, (uint32_t) len);
    return 5;
}

int
get_packet_type(uint8_t ptag)
{
    if (!(ptag & PGP_PTAG_ALWAYS_SET)) {
        return -1;
    }
    if (ptag & PGP_PTAG_NEW_FORMAT) {
        return ptag & PGP_PTAG_NF_CONTENT_TAG_MASK;
    }
    return (ptag & PGP_PTAG_OF_CONTENT_TAG_MASK) >> PGP_PTAG_OF_CONTENT_TAG_SHIFT;
}

/* Header size by the first two bytes, 0 if header is not valid */
static size_t
pkt_hdr_size(const uint8_t *buf)
{
    if (!(buf[0] & PGP_PTAG_ALWAYS_SET)) {
        return 0;
    }
    if (buf[0] & PGP_PTAG_NEW_FORMAT) {
        if (buf[1] < 192) {
            return 2;
        }
        if (buf[1] < 224) {
            return 3;
        }
        /* 224..254 is the partial length, single byte as well */
        return buf[1] == 255 ? 6 : 2;
    }
    static const size_t old_sizes[] = {2, 3, 5, 1};
    return old_sizes[buf[0] & PGP_PTAG_OF_LENGTH_TYPE_MASK];
}

/* Decode header without logging, pkt_type() calls it for every packet boundary */
static keyreg_result_t
peek_pkt_hdr(pgp_source_t &src, pgp_packet_hdr_t &hdr)
{
    memset(&hdr, 0, sizeof(hdr));
    uint8_t first[2] = {0};
    size_t  avail = 0;
    if (!src_peek(&src, first, 2, &avail) || !avail) {
        return KEYREG_ERROR_NOT_ENOUGH_DATA;
    }
    /* indeterminate old-format packet may have 1-byte body, but we need 2 bytes to check */
    if (avail < 2) {
        return (first[0] & PGP_PTAG_ALWAYS_SET) ? KEYREG_ERROR_NOT_ENOUGH_DATA :
                                                  KEYREG_ERROR_BAD_FORMAT;
    }
    size_t hlen = pkt_hdr_size(first);
    if (!hlen) {
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (!src_peek_eq(&src, hdr.hdr, hlen)) {
        return KEYREG_ERROR_NOT_ENOUGH_DATA;
    }
    hdr.hdr_len = hlen;
    hdr.tag = (pgp_pkt_type_t) get_packet_type(hdr.hdr[0]);

    const uint8_t *hb = hdr.hdr;
    if (hb[0] & PGP_PTAG_NEW_FORMAT) {
        if (hb[1] < 192) {
            hdr.pkt_len = hb[1];
        } else if (hb[1] < 224) {
            hdr.pkt_len = (((size_t) hb[1] - 192) << 8) + hb[2] + 192;
        } else if (hb[1] < 255) {
            hdr.partial = true;
        } else {
            hdr.pkt_len = read_uint32(hb + 2);
        }
        return KEYREG_SUCCESS;
    }
    switch (hb[0] & PGP_PTAG_OF_LENGTH_TYPE_MASK) {
    case PGP_PTAG_OLD_LEN_1:
        hdr.pkt_len = hb[1];
        break;
    case PGP_PTAG_OLD_LEN_2:
        hdr.pkt_len = read_uint16(hb + 1);
        break;
    case PGP_PTAG_OLD_LEN_4:
        hdr.pkt_len = read_uint32(hb + 1);
        break;
    default:
        hdr.indeterminate = true;
        break;
    }
    return KEYREG_SUCCESS;
}

int
stream_pkt_type(pgp_source_t &src)
{
    if (src_eof(&src)) {
        return 0;
    }
    pgp_packet_hdr_t hdr;
    if (peek_pkt_hdr(src, hdr)) {
        return -1;
    }
    return hdr.tag;
}

keyreg_result_t
stream_peek_packet_hdr(pgp_source_t *src, pgp_packet_hdr_t *hdr)
{
    keyreg_result_t ret = peek_pkt_hdr(*src, *hdr);
    if (ret == KEYREG_ERROR_BAD_FORMAT) {
        KEYREG_LOG("malformed packet header at %zu", src->pos);
    } else if (ret) {
        KEYREG_LOG("truncated packet header at %zu", src->pos);
    }
    return ret;
}

/* Header of the packet which may be read into memory as a whole */
static keyreg_result_t
peek_definite_hdr(pgp_source_t &src, pgp_packet_hdr_t &hdr)
{
    keyreg_result_t ret = stream_peek_packet_hdr(&src, &hdr);
    if (ret) {
        return ret;
    }
    if (hdr.partial || hdr.indeterminate) {
        KEYREG_LOG("packet %d doesn't have definite length", (int) hdr.tag);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (hdr.pkt_len > PGP_MAX_PKT_SIZE) {
        KEYREG_LOG("packet %d is too large: %zu", (int) hdr.tag, hdr.pkt_len);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    if (src_left(&src) < hdr.hdr_len + hdr.pkt_len) {
        KEYREG_LOG("packet %d is truncated", (int) hdr.tag);
        return KEYREG_ERROR_NOT_ENOUGH_DATA;
    }
    return KEYREG_SUCCESS;
}

keyreg_result_t
stream_skip_packet(pgp_source_t *src)
{
    pgp_packet_hdr_t hdr;
    keyreg_result_t  ret = peek_definite_hdr(*src, hdr);
    if (!ret) {
        src_skip(src, hdr.hdr_len + hdr.pkt_len);
    }
    return ret;
}

bool
is_key_pkt(int tag)
{
    return is_primary_key_pkt(tag) || is_subkey_pkt(tag);
}

bool
is_subkey_pkt(int tag)
{
    return (tag == PGP_PKT_PUBLIC_SUBKEY) || (tag == PGP_PKT_SECRET_SUBKEY);
}

bool
is_primary_key_pkt(int tag)
{
    return (tag == PGP_PKT_PUBLIC_KEY) || (tag == PGP_PKT_SECRET_KEY);
}

bool
is_secret_key_pkt(int tag)
{
    return (tag == PGP_PKT_SECRET_KEY) || (tag == PGP_PKT_SECRET_SUBKEY);
}

bool
is_rsa_key_alg(pgp_pubkey_alg_t alg)
{
    return (alg == PGP_PKA_RSA) || (alg == PGP_PKA_RSA_ENCRYPT_ONLY) ||
           (alg == PGP_PKA_RSA_SIGN_ONLY);
}

pgp_packet_body_t::pgp_packet_body_t(pgp_pkt_type_t tag) : tag_(tag)
{
}

pgp_packet_body_t::pgp_packet_body_t(const uint8_t *data, size_t len)
    : tag_(PGP_PKT_RESERVED), data_(data, data + len)
{
}

pgp_pkt_type_t
pgp_packet_body_t::tag() const noexcept
{
    return tag_;
}

uint8_t *
pgp_packet_body_t::data() noexcept
{
    return data_.data();
}

size_t
pgp_packet_body_t::size() const noexcept
{
    return data_.size();
}

size_t
pgp_packet_body_t::left() const noexcept
{
    return data_.size() - pos_;
}

bool
pgp_packet_body_t::get(uint8_t *val, size_t len) noexcept
{
    if (len > left()) {
        return false;
    }
    if (len) {
        memcpy(val, &data_[pos_], len);
        pos_ += len;
    }
    return true;
}

bool
pgp_packet_body_t::get(uint8_t &val) noexcept
{
    return get(&val, 1);
}

bool
pgp_packet_body_t::get(uint16_t &val) noexcept
{
    uint8_t buf[2];
    if (!get(buf, sizeof(buf))) {
        return false;
    }
    val = read_uint16(buf);
    return true;
}

bool
pgp_packet_body_t::get(uint32_t &val) noexcept
{
    uint8_t buf[4];
    if (!get(buf, sizeof(buf))) {
        return false;
    }
    val = read_uint32(buf);
    return true;
}

bool
pgp_packet_body_t::get(pgp::KeyID &val) noexcept
{
    return get(val.data(), val.size());
}

bool
pgp_packet_body_t::get(pgp::mpi &val) noexcept
{
    uint16_t bits = 0;
    if (!get(bits)) {
        return false;
    }
    size_t len = ((size_t) bits + 7) / 8;
    if (!len || (len > PGP_MPINT_SIZE)) {
        KEYREG_LOG("unsupported mpi bit count: %" PRIu16, bits);
        return false;
    }
    if (len > left()) {
        KEYREG_LOG("mpi is truncated");
        return false;
    }
    val.assign(&data_[pos_], len);
    pos_ += len;
    /* some implementations write the wrong bit count, this is not fatal */
    if (val.bits() != bits) {
        KEYREG_LOG("mpi bit count mismatch: %" PRIu16 " vs %zu", bits, val.bits());
    }
    return true;
}

bool
pgp_packet_body_t::get(pgp_curve_t &val) noexcept
{
    uint8_t len = 0;
    if (!get(len)) {
        return false;
    }
    if (!len || (len > MAX_CURVE_OID_HEX_LEN)) {
        KEYREG_LOG("wrong curve oid length: %" PRIu8, len);
        return false;
    }
    std::vector<uint8_t> oid(len);
    if (!get(oid.data(), len)) {
        return false;
    }
    pgp_curve_t curve = pgp::ec::curve_by_oid(oid);
    if (curve == PGP_CURVE_MAX) {
        KEYREG_LOG("unknown curve oid %s", keyreg::bin_to_hex(oid).c_str());
        return false;
    }
    val = curve;
    return true;
}

void
pgp_packet_body_t::add(const void *data, size_t len)
{
    auto bytes = static_cast<const uint8_t *>(data);
    data_.insert(data_.end(), bytes, bytes + len);
}

void
pgp_packet_body_t::add_byte(uint8_t bt)
{
    data_.push_back(bt);
}

void
pgp_packet_body_t::add_uint16(uint16_t val)
{
    data_.push_back((uint8_t)(val >> 8));
    data_.push_back((uint8_t) val);
}

void
pgp_packet_body_t::add_uint32(uint32_t val)
{
    add_uint16((uint16_t)(val >> 16));
    add_uint16((uint16_t) val);
}

void
pgp_packet_body_t::add(const pgp::KeyID &val)
{
    add(val.data(), val.size());
}

keyreg_result_t
pgp_packet_body_t::read(pgp_source_t &src) noexcept
{
    pgp_packet_hdr_t hdr;
    keyreg_result_t  ret = peek_definite_hdr(src, hdr);
    if (ret) {
        return ret;
    }
    if ((tag_ != PGP_PKT_RESERVED) && (tag_ != hdr.tag)) {
        KEYREG_LOG("expected packet %d, got %d", (int) tag_, (int) hdr.tag);
        return KEYREG_ERROR_BAD_FORMAT;
    }

    try {
        data_.resize(hdr.pkt_len);
    } catch (const std::bad_alloc &e) {
        KEYREG_LOG("failed to allocate %zu bytes: %s", hdr.pkt_len, e.what());
        return KEYREG_ERROR_OUT_OF_MEMORY;
    }
    tag_ = hdr.tag;
    memcpy(hdr_, hdr.hdr, hdr.hdr_len);
    hdr_len_ = hdr.hdr_len;
    pos_ = 0;
    src_skip(&src, hdr.hdr_len);
    if (!src_read_eq(&src, data_.data(), data_.size())) {
        return KEYREG_ERROR_NOT_ENOUGH_DATA;
    }
    return KEYREG_SUCCESS;
}

std::vector<uint8_t>
pgp_packet_body_t::hdr() const
{
    return std::vector<uint8_t>(hdr_, hdr_ + hdr_len_);
}

std::vector<uint8_t>
pgp_packet_body_t::write(bool hdr) const
{
    std::vector<uint8_t> res;
    res.reserve(data_.size() + PGP_MAX_HEADER_SIZE);
    if (hdr) {
        uint8_t buf[PGP_MAX_HEADER_SIZE] = {0};
        buf[0] = (uint8_t)(tag_ | PGP_PTAG_ALWAYS_SET | PGP_PTAG_NEW_FORMAT);
        size_t len = write_packet_len(buf + 1, data_.size()) + 1;
        res.assign(buf, buf + len);
    }
    res.insert(res.end(), data_.begin(), data_.end());
    return res;
}

bool
pgp_userid_pkt_t::operator==(const pgp_userid_pkt_t &src) const
{
    return (tag == src.tag) && (uid == src.uid);
}

bool
pgp_userid_pkt_t::operator!=(const pgp_userid_pkt_t &src) const
{
    return !(*this == src);
}

std::vector<uint8_t>
pgp_userid_pkt_t::write() const
{
    if ((tag != PGP_PKT_USER_ID) && (tag != PGP_PKT_USER_ATTR)) {
        throw keyreg::keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS, "not a userid packet");
    }
    pgp_packet_body_t body(tag);
    body.add(uid.data(), uid.size());
    return body.write();
}

keyreg_result_t
pgp_userid_pkt_t::parse(pgp_source_t &src)
{
    int ptag = stream_pkt_type(src);
    if ((ptag != PGP_PKT_USER_ID) && (ptag != PGP_PKT_USER_ATTR)) {
        KEYREG_LOG("not a userid packet: %d", ptag);
        return KEYREG_ERROR_BAD_FORMAT;
    }
    pgp_packet_body_t body((pgp_pkt_type_t) ptag);
    keyreg_result_t   ret = body.read(src);
    if (ret) {
        return ret;
    }
    tag = body.tag();
    uid.assign(body.data(), body.data() + body.size());
    return KEYREG_SUCCESS;
}
