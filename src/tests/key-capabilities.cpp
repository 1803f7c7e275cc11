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
#include "key.hpp"
#include "pgp-key.h"

static keyreg::KeyCapabilities
make_caps(bool sign, bool encrypt_comms, bool encrypt_storage, bool certify)
{
    keyreg::KeyCapabilities caps;
    caps.sign = sign;
    caps.encrypt_comms = encrypt_comms;
    caps.encrypt_storage = encrypt_storage;
    caps.certify = certify;
    return caps;
}

TEST_F(keyreg_tests, test_alg_capabilities)
{
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_RSA),
                     PGP_KF_SIGN | PGP_KF_CERTIFY | PGP_KF_AUTH | PGP_KF_ENCRYPT);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_RSA_SIGN_ONLY), PGP_KF_SIGN);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_RSA_ENCRYPT_ONLY), PGP_KF_ENCRYPT);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_DSA),
                     PGP_KF_SIGN | PGP_KF_CERTIFY | PGP_KF_AUTH);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_EDDSA),
                     PGP_KF_SIGN | PGP_KF_CERTIFY | PGP_KF_AUTH);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_ECDH), PGP_KF_ENCRYPT);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_ELGAMAL), PGP_KF_ENCRYPT);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_ELGAMAL_ENCRYPT_OR_SIGN), PGP_KF_NONE);
    assert_int_equal(pgp_pk_alg_capabilities(PGP_PKA_NOTHING), PGP_KF_NONE);
}

TEST_F(keyreg_tests, test_derive_capabilities)
{
    /* declared flags are limited by the algorithm */
    assert_true(keyreg::derive_capabilities(PGP_PKA_RSA, 0x03, true) ==
                make_caps(true, false, false, true));
    assert_true(keyreg::derive_capabilities(PGP_PKA_ECDH, 0x03, true) ==
                make_caps(false, false, false, false));
    assert_true(keyreg::derive_capabilities(PGP_PKA_EDDSA, 0x0C, true) ==
                make_caps(false, false, false, false));
    assert_true(keyreg::derive_capabilities(PGP_PKA_ECDH, 0x04, true) ==
                make_caps(false, true, false, false));
    assert_true(keyreg::derive_capabilities(PGP_PKA_RSA, 0x08, true) ==
                make_caps(false, false, true, false));
    /* declared empty flags mean no usage at all */
    assert_true(keyreg::derive_capabilities(PGP_PKA_RSA, 0x00, true) ==
                make_caps(false, false, false, false));
    /* auth and other bits do not map to any capability */
    assert_true(keyreg::derive_capabilities(PGP_PKA_RSA, 0xB0, true) ==
                make_caps(false, false, false, false));
    /* no flags: algorithm capabilities are used */
    assert_true(keyreg::derive_capabilities(PGP_PKA_RSA, 0x00, false) ==
                make_caps(true, true, true, true));
    assert_true(keyreg::derive_capabilities(PGP_PKA_DSA, 0xFF, false) ==
                make_caps(true, false, false, true));
    assert_true(keyreg::derive_capabilities(PGP_PKA_ECDH, 0x00, false) ==
                make_caps(false, true, true, false));
    /* unknown algorithm */
    assert_true(keyreg::derive_capabilities(PGP_PKA_NOTHING, 0x0F, true) ==
                make_caps(false, false, false, false));
    assert_true(keyreg::derive_capabilities(PGP_PKA_NOTHING, 0x00, false) ==
                make_caps(false, false, false, false));
}

TEST_F(keyreg_tests, test_key_capabilities_from_selfsigs)
{
    pgp_transferable_key_t tkey;
    assert_true(load_transferable_key(key_path("alice-ed25519-cv25519.asc"), tkey));
    keyreg::Key alice(tkey);
    assert_int_equal(alice.flags(), 0x03);
    assert_true(alice.flags_declared());
    assert_true(alice.capabilities() == make_caps(true, false, false, true));

    keyreg::Key alice_sub(tkey.subkeys[0], alice);
    assert_int_equal(alice_sub.flags(), 0x0C);
    assert_true(alice_sub.capabilities() == make_caps(false, true, true, false));

    assert_true(load_transferable_key(key_path("bob-rsa-2subs.asc"), tkey));
    keyreg::Key bob(tkey);
    assert_true(bob.capabilities() == make_caps(false, false, false, true));
    keyreg::Key bob_sign(tkey.subkeys[0], bob);
    assert_true(bob_sign.capabilities() == make_caps(true, false, false, false));
    keyreg::Key bob_enc(tkey.subkeys[1], bob);
    assert_true(bob_enc.capabilities() == make_caps(false, true, true, false));
}

TEST_F(keyreg_tests, test_primary_flags_precedence)
{
    pgp_transferable_key_t tkey;
    assert_true(load_transferable_key(key_path("bob-rsa-2subs.asc"), tkey));
    assert_int_equal(tkey.userids.size(), 2);

    /* latest self-certification wins when there is no primary uid or direct-key sig */
    tkey.userids[1].signatures[0].set_key_flags(PGP_KF_SIGN);
    {
        keyreg::Key key(tkey);
        assert_int_equal(key.flags(), PGP_KF_SIGN);
        assert_true(key.latest_selfsig(keyreg::UserID::Any) == &key.get_sig(1));
        assert_null(key.latest_selfsig(keyreg::UserID::Primary));
    }

    /* certification of the primary uid has higher priority, even if it is older */
    auto &pricert = tkey.userids[0].signatures[0];
    pricert.set_primary_uid(true);
    pricert.set_key_flags(PGP_KF_CERTIFY | PGP_KF_ENCRYPT_COMMS);
    pricert.set_key_expiration(365 * 24 * 3600);
    {
        keyreg::Key key(tkey);
        assert_int_equal(key.flags(), PGP_KF_CERTIFY | PGP_KF_ENCRYPT_COMMS);
        assert_true(key.capabilities() == make_caps(false, true, false, true));
        assert_int_equal(key.expiration(), 365 * 24 * 3600);
        assert_non_null(key.latest_selfsig(keyreg::UserID::Primary));
        assert_int_equal(key.latest_selfsig(keyreg::UserID::Primary)->uid, 0);
    }

    /* direct-key signature has the highest priority */
    pgp::pkt::Signature dirsig = tkey.userids[1].signatures[0];
    dirsig.set_type(PGP_SIG_DIRECT);
    dirsig.set_key_flags(PGP_KF_ENCRYPT_STORAGE);
    tkey.signatures.push_back(dirsig);
    {
        keyreg::Key key(tkey);
        assert_non_null(key.latest_selfsig(keyreg::UserID::None));
        assert_int_equal(key.flags(), PGP_KF_ENCRYPT_STORAGE);
        assert_true(key.capabilities() == make_caps(false, false, true, false));
        /* more restrictive expiration of the primary uid is still used */
        assert_int_equal(key.expiration(), 365 * 24 * 3600);
        assert_int_equal(key.expires_at(), 1792436125ULL + 365 * 24 * 3600);
    }

    /* direct-key signature by some other key is ignored */
    tkey.signatures.back().set_keyid({1, 2, 3, 4, 5, 6, 7, 8});
    tkey.signatures.back().set_keyfp(pgp::Fingerprint(tkey.subkeys[0].subkey));
    {
        keyreg::Key key(tkey);
        assert_null(key.latest_selfsig(keyreg::UserID::None));
        assert_int_equal(key.flags(), PGP_KF_CERTIFY | PGP_KF_ENCRYPT_COMMS);
    }

    /* later certification of the primary uid without the flag drops it */
    pgp::pkt::Signature newer = tkey.userids[0].signatures[0];
    newer.set_primary_uid(false);
    newer.set_creation(newer.creation() + 100);
    newer.set_key_flags(PGP_KF_CERTIFY);
    tkey.userids[0].signatures.push_back(newer);
    {
        keyreg::Key key(tkey);
        assert_null(key.latest_selfsig(keyreg::UserID::Primary));
        assert_int_equal(key.flags(), PGP_KF_CERTIFY);
    }
}

TEST_F(keyreg_tests, test_subkey_binding_flags)
{
    pgp_transferable_key_t tkey;
    assert_true(load_transferable_key(key_path("bob-rsa-2subs.asc"), tkey));
    keyreg::Key primary(tkey);

    /* the latest binding is used */
    auto &subkey = tkey.subkeys[0];
    pgp::pkt::Signature rebind = subkey.signatures[0];
    rebind.set_creation(rebind.creation() + 10);
    rebind.set_key_flags(PGP_KF_ENCRYPT);
    rebind.set_key_expiration(0);
    subkey.signatures.push_back(rebind);
    {
        keyreg::Key sub(subkey, primary);
        assert_int_equal(sub.sig_count(), 2);
        assert_true(sub.latest_binding() == &sub.get_sig(1));
        assert_true(sub.capabilities() == make_caps(false, true, true, false));
        assert_int_equal(sub.expires_at(), 0);
    }

    /* binding of the other type is not a binding */
    subkey.signatures[1].set_type(PGP_SIG_DIRECT);
    {
        keyreg::Key sub(subkey, primary);
        assert_true(sub.latest_binding() == &sub.get_sig(0));
        assert_true(sub.capabilities() == make_caps(true, false, false, false));
        assert_int_equal(sub.expires_at(), 1823972125);
    }

    /* without binding algorithm capabilities are used */
    subkey.signatures.clear();
    {
        keyreg::Key sub(subkey, primary);
        assert_null(sub.latest_binding());
        assert_false(sub.flags_declared());
        assert_true(sub.capabilities() == make_caps(true, true, true, true));
        assert_int_equal(sub.expiration(), 0);
    }

    /* subkey may not be loaded as primary and vice versa */
    pgp_transferable_key_t fake;
    fake.key = tkey.subkeys[1].subkey;
    assert_throw(keyreg::Key key(fake));
    pgp_transferable_subkey_t fakesub;
    fakesub.subkey = tkey.key;
    assert_throw(keyreg::Key sub(fakesub, primary));
}
