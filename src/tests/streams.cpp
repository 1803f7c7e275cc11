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

#include "keyreg_tests.h"
#include "support.h"
#include "utils.h"
#include "crypto/hash.hpp"
#include "librepgp/stream-armor.h"
#include "librepgp/stream-packet.h"
#include "librepgp/stream-sig.h"
#include "librepgp/stream-key.h"

static keyreg_result_t
dearmor_file(const std::string &path, std::vector<uint8_t> &bin, pgp_armor_info_t *info = NULL)
{
    std::string  armored = file_to_str(path);
    pgp_source_t src = {};
    init_mem_src(&src, armored.data(), armored.size());
    return dearmor_source(&src, bin, info);
}

TEST_F(keyreg_tests, test_stream_crc24)
{
    auto crc = keyreg::CRC24::create();
    /* empty input gives the initial value */
    auto res = crc->finish();
    assert_true(bin_eq_hex(res.data(), res.size(), "B704CE"));

    crc = keyreg::CRC24::create();
    crc->add("123456789", 9);
    res = crc->finish();
    assert_true(bin_eq_hex(res.data(), res.size(), "21CF02"));

    /* splitting input doesn't change the result */
    crc = keyreg::CRC24::create();
    crc->add("1234", 4);
    crc->add("56789", 5);
    res = crc->finish();
    assert_true(bin_eq_hex(res.data(), res.size(), "21CF02"));
}

TEST_F(keyreg_tests, test_stream_dearmor)
{
    std::vector<uint8_t> bin;
    pgp_armor_info_t     info;
    assert_keyreg_success(dearmor_file(key_path("alice-ed25519-cv25519.asc"), bin, &info));
    assert_int_equal(info.type, PGP_ARMORED_PUBLIC_KEY);
    assert_true(info.armorhdr == "BEGIN PGP PUBLIC KEY BLOCK");
    assert_true(info.has_crc);
    assert_true(info.crc_valid);
    /* binary export of the same key */
    assert_true(bin == file_to_vec(key_path("alice-ed25519-cv25519.gpg")));

    /* is_armored_source / armored_get_type */
    std::string  armored = file_to_str(key_path("dave-secret.asc"));
    pgp_source_t src = {};
    init_mem_src(&src, armored.data(), armored.size());
    assert_true(is_armored_source(&src));
    assert_int_equal(armored_get_type(&src), PGP_ARMORED_SECRET_KEY);

    std::vector<uint8_t> keybin = file_to_vec(key_path("alice-ed25519-cv25519.gpg"));
    init_mem_src(&src, keybin.data(), keybin.size());
    assert_false(is_armored_source(&src));
    assert_int_equal(armor_guess_type(&src), PGP_ARMORED_PUBLIC_KEY);

    std::string text = file_to_str(key_path("malformed-plain-text.txt"));
    init_mem_src(&src, text.data(), text.size());
    assert_false(is_armored_source(&src));
}

TEST_F(keyreg_tests, test_stream_dearmor_bad_crc)
{
    std::vector<uint8_t> bin;
    pgp_armor_info_t     info;
    /* crc mismatch is reported but doesn't fail dearmoring */
    assert_keyreg_success(dearmor_file(key_path("alice-bad-crc.asc"), bin, &info));
    assert_true(info.has_crc);
    assert_false(info.crc_valid);
    assert_false(bin.empty());
}

TEST_F(keyreg_tests, test_stream_dearmor_malformed)
{
    std::vector<uint8_t> bin;
    assert_int_equal(dearmor_file(key_path("malformed-truncated.asc"), bin),
                     KEYREG_ERROR_BAD_ARMOR);
    bin.clear();
    assert_int_equal(dearmor_file(key_path("malformed-bad-base64.asc"), bin),
                     KEYREG_ERROR_BAD_ARMOR);
    bin.clear();
    assert_int_equal(dearmor_file(key_path("malformed-plain-text.txt"), bin),
                     KEYREG_ERROR_BAD_ARMOR);

    /* empty block dearmors to nothing */
    bin.clear();
    assert_keyreg_success(dearmor_file(key_path("malformed-empty-block.asc"), bin));
    assert_true(bin.empty());

    /* trailer must match the header */
    const char *mismatch = "-----BEGIN PGP PUBLIC KEY BLOCK-----\n"
                           "\n"
                           "mDMEatZnnRYJKwYBBAHaRw8BAQdA\n"
                           "-----END PGP SIGNATURE-----\n";
    pgp_source_t src = {};
    init_mem_src(&src, mismatch, strlen(mismatch));
    assert_int_equal(dearmor_source(&src, bin), KEYREG_ERROR_BAD_ARMOR);
}

static std::vector<std::string>
split_lines(const std::string &text)
{
    std::vector<std::string> lines;
    size_t                   pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string::npos) {
            eol = text.size();
        }
        lines.push_back(text.substr(pos, eol - pos));
        pos = eol + 1;
    }
    return lines;
}

static keyreg_result_t
dearmor_str(const std::string &armored, std::vector<uint8_t> &bin, pgp_armor_info_t *info = NULL)
{
    pgp_source_t src = {};
    init_mem_src(&src, armored.data(), armored.size());
    return dearmor_source(&src, bin, info);
}

static size_t
armored_subkeys(const std::string &armored)
{
    pgp_source_t src = {};
    init_mem_src(&src, armored.data(), armored.size());
    pgp_key_sequence_t keys;
    if (process_pgp_keys(src, keys) || (keys.keys.size() != 1)) {
        return 0;
    }
    return keys.keys[0].subkeys.size();
}

TEST_F(keyreg_tests, test_stream_dearmor_large_lines)
{
    std::vector<std::string> lines = split_lines(file_to_str(key_path("bob-rsa-2subs.asc")));
    /* header, empty line, body, checksum and trailer */
    assert_greater_than(lines.size(), 5U);
    assert_true(lines[1].empty());
    assert_true(lines[lines.size() - 2][0] == '=');

    std::vector<uint8_t> expected;
    assert_keyreg_success(dearmor_str(file_to_str(key_path("bob-rsa-2subs.asc")), expected));
    assert_false(expected.empty());

    /* whole base64 body on a single line */
    std::string body;
    for (size_t idx = 2; idx < lines.size() - 2; idx++) {
        body += lines[idx];
    }
    assert_greater_than(body.size(), 3000U);
    std::string oneline = lines[0] + "\n\n" + body + "\n" + lines[lines.size() - 2] + "\n" +
                          lines.back() + "\n";
    std::vector<uint8_t> bin;
    assert_keyreg_success(dearmor_str(oneline, bin));
    assert_true(bin == expected);
    assert_int_equal(armored_subkeys(oneline), 2U);

    /* long text before the armor header, like a pasted mail */
    std::string preamble;
    for (int idx = 0; idx < 20; idx++) {
        preamble += "Hi, here is my public key, please add it to the account settings.\n";
    }
    preamble += std::string(1100, 'x') + "\n\n";
    std::string pasted = preamble + file_to_str(key_path("bob-rsa-2subs.asc"));
    bin.clear();
    assert_keyreg_success(dearmor_str(pasted, bin));
    assert_true(bin == expected);
    assert_int_equal(armored_subkeys(pasted), 2U);

    /* armor header which doesn't fit into the usual line limits */
    std::string comment(1100, 'c');
    std::string withhdr = lines[0] + "\nComment: " + comment + "\nVersion: v1\n";
    for (size_t idx = 1; idx < lines.size(); idx++) {
        withhdr += lines[idx] + "\n";
    }
    pgp_armor_info_t info;
    bin.clear();
    assert_keyreg_success(dearmor_str(withhdr, bin, &info));
    assert_true(info.comment == comment);
    assert_true(info.version == "v1");
    assert_true(info.crc_valid);
    assert_true(bin == expected);
    assert_int_equal(armored_subkeys(withhdr), 2U);

    /* the same with CRLF line ends */
    std::string crlf;
    for (auto &line : split_lines(withhdr)) {
        crlf += line + "\r\n";
    }
    bin.clear();
    assert_keyreg_success(dearmor_str(crlf, bin));
    assert_true(bin == expected);
}

TEST_F(keyreg_tests, test_stream_packet_length)
{
    uint8_t buf[6] = {0};
    assert_int_equal(write_packet_len(buf, 100), 1);
    assert_int_equal(buf[0], 100);
    assert_int_equal(write_packet_len(buf, 1000), 2);
    assert_int_equal(buf[0], 195);
    assert_int_equal(buf[1], 40);
    assert_int_equal(write_packet_len(buf, 100000), 5);
    assert_int_equal(buf[0], 0xff);
    assert_int_equal(read_uint32(&buf[1]), 100000);

    /* new format header, two-octet length */
    std::vector<uint8_t> data(1000, 0x55);
    pgp_packet_body_t    body(PGP_PKT_USER_ID);
    body.add(data.data(), data.size());
    auto pkt = body.write();
    assert_int_equal(pkt.size(), 1003);
    assert_int_equal(pkt[0], 0xCD);

    pgp_source_t src = {};
    init_mem_src(&src, pkt.data(), pkt.size());
    assert_int_equal(stream_pkt_type(src), PGP_PKT_USER_ID);
    pgp_packet_hdr_t hdr = {};
    assert_keyreg_success(stream_peek_packet_hdr(&src, &hdr));
    assert_int_equal(hdr.hdr_len, 3);
    assert_int_equal(hdr.pkt_len, 1000);
    assert_false(hdr.partial);

    /* old format, one-octet length: tag 13 */
    const uint8_t oldfmt[] = {0xB4, 0x03, 'a', 'b', 'c'};
    init_mem_src(&src, oldfmt, sizeof(oldfmt));
    pgp_userid_pkt_t uid;
    assert_keyreg_success(uid.parse(src));
    assert_int_equal(uid.tag, PGP_PKT_USER_ID);
    assert_true(uid.uid == std::vector<uint8_t>({'a', 'b', 'c'}));
    assert_true(src_eof(&src));

    /* truncated packet */
    init_mem_src(&src, oldfmt, sizeof(oldfmt) - 1);
    pgp_userid_pkt_t uid2;
    assert_keyreg_failure(uid2.parse(src));

    /* not a packet */
    const uint8_t garbage[] = {0x12, 0x34};
    init_mem_src(&src, garbage, sizeof(garbage));
    assert_int_equal(stream_pkt_type(src), -1);
}

TEST_F(keyreg_tests, test_stream_signature_subpackets)
{
    pgp::pkt::Signature sig;
    sig.version = PGP_V4;
    sig.palg = PGP_PKA_EDDSA;
    sig.halg = PGP_HASH_SHA256;
    sig.set_type(PGP_CERT_POSITIVE);
    sig.set_creation(1792436125);
    sig.set_key_flags(PGP_KF_SIGN | PGP_KF_CERTIFY);
    sig.set_key_expiration(86400);
    sig.set_primary_uid(true);
    pgp::KeyID keyid = {0x17, 0x3F, 0x01, 0xBC, 0x63, 0x33, 0x98, 0xA2};
    sig.set_keyid(keyid);
    sig.fill_hashed_data();
    sig.material_buf = {0x00, 0x01, 0x01};

    auto         raw = sig.write();
    pgp_source_t src = {};
    init_mem_src(&src, raw.data(), raw.size());
    pgp::pkt::Signature parsed;
    assert_keyreg_success(parsed.parse(src));
    assert_true(src_eof(&src));
    assert_int_equal(parsed.type(), PGP_CERT_POSITIVE);
    assert_true(parsed.is_cert());
    assert_int_equal(parsed.creation(), 1792436125);
    assert_true(parsed.has_key_flags());
    assert_int_equal(parsed.key_flags(), PGP_KF_SIGN | PGP_KF_CERTIFY);
    assert_int_equal(parsed.key_expiration(), 86400);
    assert_true(parsed.primary_uid());
    assert_true(parsed.has_keyid());
    assert_true(parsed.keyid() == keyid);
    assert_false(parsed.has_keyfp());
    assert_true(parsed.material_buf == sig.material_buf);

    /* signature without any subpackets */
    pgp::pkt::Signature empty;
    empty.version = PGP_V4;
    empty.palg = PGP_PKA_RSA;
    empty.halg = PGP_HASH_SHA256;
    empty.set_type(PGP_SIG_SUBKEY);
    empty.fill_hashed_data();
    raw = empty.write();
    init_mem_src(&src, raw.data(), raw.size());
    pgp::pkt::Signature parsed2;
    assert_keyreg_success(parsed2.parse(src));
    assert_false(parsed2.has_key_flags());
    assert_int_equal(parsed2.creation(), 0);
    assert_false(parsed2.has_keyid());

    /* unknown version */
    raw[2] = 7;
    init_mem_src(&src, raw.data(), raw.size());
    pgp::pkt::Signature parsed3;
    assert_keyreg_failure(parsed3.parse(src));
}

TEST_F(keyreg_tests, test_stream_key_packets)
{
    pgp_transferable_key_t key;
    assert_true(load_transferable_key(key_path("bob-rsa-2subs.asc"), key));
    assert_int_equal(key.key.tag, PGP_PKT_PUBLIC_KEY);
    assert_int_equal(key.key.version, PGP_V4);
    assert_int_equal(key.key.alg, PGP_PKA_RSA);
    assert_int_equal(key.key.creation_time, 1792436125);
    assert_int_equal(key.userids.size(), 2);
    assert_int_equal(key.subkeys.size(), 2);
    assert_int_equal(key.subkeys[0].subkey.tag, PGP_PKT_PUBLIC_SUBKEY);
    assert_false(key.subkeys[0].signatures.empty());
    assert_false(key.key.raw.empty());

    /* raw packet could be parsed back to the same key */
    pgp_source_t src = {};
    init_mem_src(&src, key.key.raw.data(), key.key.raw.size());
    pgp_key_pkt_t pkt;
    assert_keyreg_success(pkt.parse(src));
    assert_true(pkt.pub_data == key.key.pub_data);
    assert_int_equal(pkt.alg, PGP_PKA_RSA);

    /* secret keys are rejected */
    std::string sec = file_to_str(key_path("dave-secret.asc"));
    init_mem_src(&src, sec.data(), sec.size());
    pgp_key_sequence_t keys;
    assert_keyreg_failure(process_pgp_keys(src, keys));

    /* several keys in a keyring */
    std::string ring = file_to_str(key_path("alice-bob-keyring.asc"));
    init_mem_src(&src, ring.data(), ring.size());
    assert_keyreg_success(process_pgp_keys(src, keys));
    assert_int_equal(keys.keys.size(), 2);
    assert_int_equal(keys.keys[0].key.alg, PGP_PKA_EDDSA);
    assert_int_equal(keys.keys[1].key.alg, PGP_PKA_RSA);

    /* empty input */
    init_mem_src(&src, NULL, 0);
    assert_int_equal(process_pgp_keys(src, keys), KEYREG_ERROR_NO_KEY);
}
