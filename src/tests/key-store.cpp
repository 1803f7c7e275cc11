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

#include <functional>
#include <thread>
#include "keyreg_tests.h"
#include "support.h"
#include "file-utils.h"
#include "librekey/key_store_sql.hpp"

static keyreg::KeyRecord
make_record(int64_t owner, const std::string &keyid, const std::vector<std::string> &subs = {})
{
    keyreg::KeyRecord rec;
    rec.owner_id = owner;
    rec.key_id = keyid;
    rec.content = "xsDNBGNl";
    rec.created = keyreg::time_from_unix(1792436125);
    rec.emails = {"a@example.com"};
    rec.can_sign = true;
    rec.can_certify = true;
    for (auto &sub : subs) {
        keyreg::KeyRecord subrec;
        subrec.key_id = sub;
        subrec.content = "zsBNBGNl";
        subrec.created = keyreg::time_from_unix(1792436126);
        subrec.has_expiry = true;
        subrec.expires = keyreg::time_from_unix(1823972125);
        subrec.can_encrypt_comms = true;
        subrec.can_encrypt_storage = true;
        rec.subkeys.push_back(subrec);
    }
    return rec;
}

static keyreg_result_t
catch_code(const std::function<void()> &func)
{
    try {
        func();
        return KEYREG_SUCCESS;
    } catch (const keyreg::keyreg_exception &e) {
        return e.code();
    }
}

TEST_F(keyreg_tests, test_key_store_insert)
{
    keyreg::KeyStore store("keys.db");
    assert_int_equal(store.count(), 0);

    auto rec = make_record(42, "173F01BC633398A2", {"9ED1F779680F2EAF", "0123456789ABCDEF"});
    store.insert(rec);
    assert_int_equal(store.count(), 3);
    assert_true(rec.id > 0);
    assert_true(rec.is_primary());
    assert_int_equal(rec.subkeys.size(), 2);
    for (auto &sub : rec.subkeys) {
        assert_true(sub.id > rec.id);
        assert_false(sub.is_primary());
        assert_true(sub.primary_key_id == "173F01BC633398A2");
        assert_int_equal(sub.owner_id, 42);
        assert_true(sub.added == rec.added);
        assert_true(sub.emails.empty());
    }

    /* primary key comes with subkeys */
    auto got = store.get(rec.id);
    assert_int_equal(got.id, rec.id);
    assert_int_equal(got.owner_id, 42);
    assert_true(got.key_id == "173F01BC633398A2");
    assert_true(got.content == "xsDNBGNl");
    assert_int_equal(keyreg::time_to_unix(got.created), 1792436125);
    assert_false(got.has_expiry);
    assert_int_equal(keyreg::time_to_unix(got.added), keyreg::time_to_unix(rec.added));
    assert_int_equal(got.emails.size(), 1);
    assert_true(got.emails[0] == "a@example.com");
    assert_true(got.can_sign);
    assert_true(got.can_certify);
    assert_false(got.can_encrypt_comms);
    assert_false(got.can_encrypt_storage);
    assert_int_equal(got.subkeys.size(), 2);
    assert_true(got.subkeys[0].key_id == "9ED1F779680F2EAF");
    assert_true(got.subkeys[1].key_id == "0123456789ABCDEF");
    assert_true(got.subkeys[0].has_expiry);
    assert_int_equal(keyreg::time_to_unix(got.subkeys[0].expires), 1823972125);
    assert_true(got.subkeys[0].can_encrypt_comms);
    assert_false(got.subkeys[0].can_sign);

    /* subkey is returned without subkeys */
    auto sub = store.get(rec.subkeys[1].id);
    assert_true(sub.primary_key_id == "173F01BC633398A2");
    assert_true(sub.subkeys.empty());

    assert_int_equal(catch_code([&]() { store.get(1000); }), KEYREG_ERROR_KEY_NOT_FOUND);

    /* several emails survive the round trip in order */
    auto rec2 = make_record(42, "1A5D06AA8D765B9E");
    rec2.emails = {"bob@example.org", "bob@work.example.net"};
    store.insert(rec2);
    got = store.get(rec2.id);
    assert_int_equal(got.emails.size(), 2);
    assert_true(got.emails[1] == "bob@work.example.net");
    assert_true(got.subkeys.empty());
}

TEST_F(keyreg_tests, test_key_store_list)
{
    keyreg::KeyStore store("keys.db");
    auto             k1 = make_record(42, "0000000000000001", {"0000000000000011"});
    auto             k2 = make_record(7, "0000000000000002");
    auto             k3 = make_record(42, "0000000000000003", {"0000000000000031"});
    store.insert(k1);
    store.insert(k2);
    store.insert(k3);

    auto list = store.list_by_owner(42);
    assert_int_equal(list.size(), 2);
    assert_true(list[0].key_id == "0000000000000001");
    assert_true(list[1].key_id == "0000000000000003");
    assert_true(list[0].id < list[1].id);
    assert_int_equal(list[0].subkeys.size(), 1);
    assert_true(list[1].subkeys[0].key_id == "0000000000000031");

    assert_int_equal(store.list_by_owner(7).size(), 1);
    assert_true(store.list_by_owner(100).empty());
}

TEST_F(keyreg_tests, test_key_store_conflict)
{
    keyreg::KeyStore store("keys.db");
    auto             rec = make_record(42, "173F01BC633398A2", {"9ED1F779680F2EAF"});
    store.insert(rec);
    assert_int_equal(store.count(), 2);

    /* same primary, any owner */
    auto dup = make_record(7, "173F01BC633398A2");
    assert_int_equal(catch_code([&]() { store.insert(dup); }), KEYREG_ERROR_KEY_ID_CONFLICT);
    /* new primary with already stored subkey: nothing is written */
    dup = make_record(7, "1111111111111111", {"2222222222222222", "9ED1F779680F2EAF"});
    assert_int_equal(catch_code([&]() { store.insert(dup); }), KEYREG_ERROR_KEY_ID_CONFLICT);
    assert_int_equal(store.count(), 2);
    assert_int_equal(dup.id, 0);
    assert_true(store.list_by_owner(7).empty());
    /* stored subkey id used as primary */
    dup = make_record(7, "9ED1F779680F2EAF");
    assert_int_equal(catch_code([&]() { store.insert(dup); }), KEYREG_ERROR_KEY_ID_CONFLICT);
    /* duplicate inside of the same key */
    dup = make_record(7, "3333333333333333", {"4444444444444444", "4444444444444444"});
    assert_int_equal(catch_code([&]() { store.insert(dup); }), KEYREG_ERROR_KEY_ID_CONFLICT);
    assert_int_equal(store.count(), 2);

    /* store may be used after the failures */
    dup = make_record(7, "3333333333333333", {"4444444444444444"});
    store.insert(dup);
    assert_int_equal(store.count(), 4);
}

TEST_F(keyreg_tests, test_key_store_bad_records)
{
    keyreg::KeyStore store("keys.db");
    auto             rec = make_record(42, "173F01BC633398A2");
    rec.emails.clear();
    assert_int_equal(catch_code([&]() { store.insert(rec); }),
                     KEYREG_ERROR_UNVERIFIED_IDENTITY);
    rec = make_record(42, "");
    assert_int_equal(catch_code([&]() { store.insert(rec); }), KEYREG_ERROR_BAD_PARAMETERS);
    rec = make_record(42, "173F01BC633398A2");
    rec.primary_key_id = "1A5D06AA8D765B9E";
    assert_int_equal(catch_code([&]() { store.insert(rec); }), KEYREG_ERROR_BAD_PARAMETERS);
    assert_int_equal(store.count(), 0);
}

TEST_F(keyreg_tests, test_key_store_concurrent_insert)
{
    /* separate connections to the same file */
    keyreg::KeyStore store1("keys.db");
    keyreg::KeyStore store2("keys.db");

    for (int round = 0; round < 10; round++) {
        char keyid[17];
        snprintf(keyid, sizeof(keyid), "00000000000000%02d", round);
        auto            rec1 = make_record(1, keyid);
        auto            rec2 = make_record(2, keyid);
        keyreg_result_t ret1 = KEYREG_ERROR_GENERIC;
        keyreg_result_t ret2 = KEYREG_ERROR_GENERIC;

        std::thread th1([&]() { ret1 = catch_code([&]() { store1.insert(rec1); }); });
        std::thread th2([&]() { ret2 = catch_code([&]() { store2.insert(rec2); }); });
        th1.join();
        th2.join();

        /* exactly one of the inserts succeeds */
        assert_true(((ret1 == KEYREG_SUCCESS) && (ret2 == KEYREG_ERROR_KEY_ID_CONFLICT)) ||
                    ((ret2 == KEYREG_SUCCESS) && (ret1 == KEYREG_ERROR_KEY_ID_CONFLICT)));
        assert_int_equal(store1.count(), (size_t)(round + 1));
    }
    assert_int_equal(store1.list_by_owner(1).size() + store2.list_by_owner(2).size(), 10);
}

TEST_F(keyreg_tests, test_key_store_remove)
{
    keyreg::KeyStore store("keys.db");
    auto             rec = make_record(42, "173F01BC633398A2", {"9ED1F779680F2EAF"});
    auto             other =
      make_record(42, "1A5D06AA8D765B9E", {"89ED021D03A45F0C", "EE492BC24C8B93E5"});
    store.insert(rec);
    store.insert(other);
    assert_int_equal(store.count(), 5);

    /* not an owner */
    assert_int_equal(catch_code([&]() { store.remove(7, false, rec.id); }),
                     KEYREG_ERROR_ACCESS_DENIED);
    assert_int_equal(catch_code([&]() { store.remove(7, false, rec.subkeys[0].id); }),
                     KEYREG_ERROR_ACCESS_DENIED);
    assert_int_equal(store.count(), 5);

    /* subkey only */
    assert_int_equal(store.remove(42, false, other.subkeys[0].id), 1);
    assert_int_equal(store.get(other.id).subkeys.size(), 1);
    /* primary key with subkeys */
    assert_int_equal(store.remove(42, false, rec.id), 2);
    assert_int_equal(store.count(), 2);
    assert_int_equal(catch_code([&]() { store.get(rec.subkeys[0].id); }),
                     KEYREG_ERROR_KEY_NOT_FOUND);
    /* missing record */
    assert_int_equal(store.remove(42, false, rec.id), 0);
    assert_int_equal(store.remove(7, false, 1000), 0);
    /* administrator may delete any key */
    assert_int_equal(store.remove(7, true, other.id), 2);
    assert_int_equal(store.count(), 0);

    /* deleted key may be registered again */
    rec = make_record(7, "173F01BC633398A2", {"9ED1F779680F2EAF"});
    store.insert(rec);
    assert_int_equal(store.count(), 2);
}

TEST_F(keyreg_tests, test_key_store_reopen)
{
    int64_t id = 0;
    {
        keyreg::KeyStore store("keys.db");
        auto             rec = make_record(42, "173F01BC633398A2", {"9ED1F779680F2EAF"});
        store.insert(rec);
        id = rec.id;
    }
    assert_true(keyreg::path::exists("keys.db"));
    keyreg::KeyStore store("keys.db");
    assert_int_equal(store.count(), 2);
    assert_int_equal(store.get(id).subkeys.size(), 1);
    assert_true(store.path == "keys.db");

    /* directory in place of the database */
    assert_keyreg_failure(catch_code([]() { keyreg::KeyStore bad("data"); }));
}
