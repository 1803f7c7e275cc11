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
#include "key.hpp"
#include "librekey/key_decoder.hpp"

static keyreg_result_t
decode_file(const std::string &name, keyreg::DecodedKey &key)
{
    return keyreg::decode_key(file_to_str(key_path(name)), key);
}

TEST_F(keyreg_tests, test_load_eddsa_key)
{
    keyreg::DecodedKey key;
    assert_keyreg_success(decode_file("alice-ed25519-cv25519.asc", key));

    auto &primary = key.primary;
    assert_true(primary.is_primary());
    assert_false(primary.is_subkey());
    assert_int_equal(primary.alg(), PGP_PKA_EDDSA);
    assert_int_equal(primary.version(), PGP_V4);
    assert_true(primary.keyid_hex() == "173F01BC633398A2");
    assert_true(cmp_keyid(primary.keyid(), "173F01BC633398A2"));
    assert_true(cmp_keyfp(primary.fp(), "7197927CE44D6E73BD5FC558173F01BC633398A2"));
    assert_true(primary.fp().str() == "7197927CE44D6E73BD5FC558173F01BC633398A2");
    assert_int_equal(primary.creation(), 1792436125);
    assert_int_equal(primary.expiration(), 0);
    assert_int_equal(primary.expires_at(), 0);
    assert_throw(primary.primary_fp());

    assert_int_equal(primary.uid_count(), 1);
    assert_true(primary.get_uid(0).str == "Alice <a@example.com>");
    assert_true(primary.get_uid(0).email == "a@example.com");
    assert_int_equal(key.identities.size(), 1);
    assert_true(key.identities[0].email == "a@example.com");
    /* certification of the userid */
    assert_int_equal(primary.sig_count(), 1);
    assert_int_equal(primary.get_sig(0).uid, 0);
    assert_true(primary.is_self_cert(primary.get_sig(0)));
    assert_non_null(primary.latest_selfsig(keyreg::UserID::Any));
    assert_null(primary.latest_selfsig(keyreg::UserID::None));

    assert_int_equal(key.subkeys.size(), 1);
    auto &sub = key.subkeys[0];
    assert_true(sub.is_subkey());
    assert_int_equal(sub.alg(), PGP_PKA_ECDH);
    assert_true(sub.keyid_hex() == "9ED1F779680F2EAF");
    assert_true(sub.primary_fp() == primary.fp());
    assert_int_equal(sub.uid_count(), 0);
    assert_non_null(sub.latest_binding());
    assert_true(sub.is_binding(*sub.latest_binding()));
    assert_null(sub.latest_selfsig(keyreg::UserID::Any));

    /* binary input gives the same result */
    auto               bin = file_to_vec(key_path("alice-ed25519-cv25519.gpg"));
    keyreg::DecodedKey binkey;
    assert_keyreg_success(keyreg::decode_key(bin.data(), bin.size(), binkey));
    assert_true(binkey.primary.fp() == primary.fp());
    assert_true(binkey.primary.content() == primary.content());
    assert_int_equal(binkey.subkeys.size(), 1);
}

TEST_F(keyreg_tests, test_load_rsa_key_with_subkeys)
{
    keyreg::DecodedKey key;
    assert_keyreg_success(decode_file("bob-rsa-2subs.asc", key));

    assert_true(key.primary.keyid_hex() == "1A5D06AA8D765B9E");
    assert_true(key.primary.fp().str() == "952D7ABBEADBFF66564FB2901A5D06AA8D765B9E");
    assert_int_equal(key.primary.alg(), PGP_PKA_RSA);
    assert_int_equal(key.primary.expires_at(), 1855508125);
    assert_int_equal(key.primary.expiration(), 1855508125 - 1792436125);

    /* identities in packet order */
    assert_int_equal(key.identities.size(), 2);
    assert_true(key.identities[0].str == "Bob Builder <bob@example.org>");
    assert_true(key.identities[0].email == "bob@example.org");
    assert_true(key.identities[1].email == "bob@work.example.net");

    assert_int_equal(key.subkeys.size(), 2);
    assert_true(key.subkeys[0].keyid_hex() == "89ED021D03A45F0C");
    assert_true(key.subkeys[1].keyid_hex() == "EE492BC24C8B93E5");
    for (auto &sub : key.subkeys) {
        assert_int_equal(sub.alg(), PGP_PKA_RSA);
        assert_int_equal(sub.expires_at(), 1823972125);
        assert_true(sub.primary_fp().keyid() == key.primary.keyid());
    }
}

TEST_F(keyreg_tests, test_load_other_algs)
{
    keyreg::DecodedKey carol;
    assert_keyreg_success(decode_file("carol-p256-no-email-uid.asc", carol));
    assert_true(carol.primary.keyid_hex() == "E471E7B06D39D823");
    assert_int_equal(carol.primary.alg(), PGP_PKA_ECDSA);
    assert_int_equal(carol.primary.creation(), 1792436126);
    assert_int_equal(carol.identities.size(), 2);
    assert_true(carol.identities[0].has_email());
    assert_true(carol.identities[1].str == "carol-no-email");
    assert_false(carol.identities[1].has_email());
    assert_true(carol.subkeys.empty());

    keyreg::DecodedKey dave;
    assert_keyreg_success(decode_file("dave-dsa.asc", dave));
    assert_true(dave.primary.keyid_hex() == "DFB50B99793050B4");
    assert_true(dave.primary.fp().str() == "10F05E25844D650E49FDBBE9DFB50B99793050B4");
    assert_int_equal(dave.primary.alg(), PGP_PKA_DSA);
    assert_true(dave.subkeys.empty());
}

TEST_F(keyreg_tests, test_load_keyring_uses_first_key)
{
    keyreg::DecodedKey key;
    assert_keyreg_success(decode_file("alice-bob-keyring.asc", key));
    assert_true(key.primary.keyid_hex() == "173F01BC633398A2");
    assert_int_equal(key.subkeys.size(), 1);
}

TEST_F(keyreg_tests, test_load_bad_crc_key)
{
    keyreg::DecodedKey key;
    assert_keyreg_success(decode_file("alice-bad-crc.asc", key));
    assert_true(key.primary.keyid_hex() == "173F01BC633398A2");
}

TEST_F(keyreg_tests, test_load_malformed_keys)
{
    const char *files[] = {"malformed-truncated.asc",
                           "malformed-bad-base64.asc",
                           "malformed-empty-block.asc",
                           "malformed-plain-text.txt",
                           "dave-secret.asc"};
    for (auto file : files) {
        keyreg::DecodedKey key;
        assert_int_equal(decode_file(file, key), KEYREG_ERROR_BAD_FORMAT);
    }

    keyreg::DecodedKey key;
    assert_int_equal(keyreg::decode_key("", key), KEYREG_ERROR_BAD_FORMAT);
    assert_int_equal(keyreg::decode_key(NULL, 10, key), KEYREG_ERROR_NULL_POINTER);

    /* binary key with the cut last packet */
    auto bin = file_to_vec(key_path("alice-ed25519-cv25519.gpg"));
    assert_keyreg_failure(keyreg::decode_key(bin.data(), bin.size() - 3, key));
    /* userid packet in place of the key */
    const uint8_t uid[] = {0xB4, 0x03, 'a', 'b', 'c'};
    assert_int_equal(keyreg::decode_key(uid, sizeof(uid), key), KEYREG_ERROR_BAD_FORMAT);
}

TEST_F(keyreg_tests, test_key_content_round_trip)
{
    keyreg::DecodedKey key;
    assert_keyreg_success(decode_file("bob-rsa-2subs.asc", key));

    std::string content = key.primary.content();
    assert_false(content.empty());
    pgp_key_pkt_t pkt;
    assert_keyreg_success(keyreg::decode_key_content(content, pkt));
    assert_true(pgp::Fingerprint(pkt) == key.primary.fp());
    assert_true(keyreg::keyid_to_hex(pgp::Fingerprint(pkt).keyid()) == "1A5D06AA8D765B9E");
    assert_int_equal(pkt.creation_time, key.primary.creation());

    /* subkey content is a subkey packet */
    pgp_key_pkt_t subpkt;
    assert_keyreg_success(keyreg::decode_key_content(key.subkeys[1].content(), subpkt));
    assert_int_equal(subpkt.tag, PGP_PKT_PUBLIC_SUBKEY);
    assert_true(pgp::Fingerprint(subpkt) == key.subkeys[1].fp());

    /* broken content */
    pgp_key_pkt_t bad;
    assert_int_equal(keyreg::decode_key_content("", bad), KEYREG_ERROR_BAD_FORMAT);
    assert_int_equal(keyreg::decode_key_content("!!!!", bad), KEYREG_ERROR_BAD_FORMAT);
    assert_int_equal(keyreg::decode_key_content(keyreg::base64_encode(
                                                  std::vector<uint8_t>({0xB4, 0x01, 'a'})),
                                                bad),
                     KEYREG_ERROR_BAD_FORMAT);
    /* extra data after the packet */
    auto raw = keyreg::base64_decode(content);
    raw.push_back(0);
    assert_int_equal(keyreg::decode_key_content(keyreg::base64_encode(raw), bad),
                     KEYREG_ERROR_BAD_FORMAT);
}
