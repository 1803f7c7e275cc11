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

#include <thread>
#include "keyreg_tests.h"
#include "support.h"
#include "utils.h"
#include "librekey/key_store_sql.hpp"
#include "librekey/key_decoder.hpp"

TEST_F(keyreg_tests, test_registry_add_key)
{
    keyreg::MemoryAccountDirectory accounts;
    accounts.add_email(42, "a@example.com");
    keyreg::KeyRegistry registry("registry.db", accounts);

    keyreg::KeyRecord record;
    std::string       alice = file_to_str(key_path("alice-ed25519-cv25519.asc"));
    assert_keyreg_success(registry.add_key(42, alice, record));

    assert_true(record.id > 0);
    assert_int_equal(record.owner_id, 42);
    assert_true(record.key_id == "173F01BC633398A2");
    assert_true(record.is_primary());
    assert_int_equal(keyreg::time_to_unix(record.created), 1792436125);
    assert_false(record.has_expiry);
    assert_int_equal(record.emails.size(), 1);
    assert_true(record.emails[0] == "a@example.com");
    assert_true(record.can_sign);
    assert_true(record.can_certify);
    assert_false(record.can_encrypt_comms);
    assert_false(record.can_encrypt_storage);

    assert_int_equal(record.subkeys.size(), 1);
    auto &sub = record.subkeys[0];
    assert_true(sub.key_id == "9ED1F779680F2EAF");
    assert_true(sub.primary_key_id == "173F01BC633398A2");
    assert_int_equal(sub.owner_id, 42);
    assert_true(sub.emails.empty());
    assert_false(sub.can_sign);
    assert_false(sub.can_certify);
    assert_true(sub.can_encrypt_comms);
    assert_true(sub.can_encrypt_storage);

    /* stored content is the key packet itself */
    pgp_key_pkt_t pkt;
    assert_keyreg_success(keyreg::decode_key_content(record.content, pkt));
    assert_true(keyreg::keyid_to_hex(pgp::Fingerprint(pkt).keyid()) == record.key_id);
    assert_keyreg_success(keyreg::decode_key_content(sub.content, pkt));
    assert_true(keyreg::keyid_to_hex(pgp::Fingerprint(pkt).keyid()) == sub.key_id);

    /* same key again */
    keyreg::KeyRecord again;
    assert_int_equal(registry.add_key(42, alice, again), KEYREG_ERROR_KEY_ID_CONFLICT);

    keyreg::KeyRecord got;
    assert_keyreg_success(registry.get_key(record.id, got));
    assert_true(got.key_id == record.key_id);
    assert_true(got.content == record.content);
    assert_int_equal(got.subkeys.size(), 1);
    assert_keyreg_success(registry.get_key(sub.id, got));
    assert_true(got.key_id == "9ED1F779680F2EAF");
    assert_int_equal(registry.get_key(record.id + 100, got), KEYREG_ERROR_KEY_NOT_FOUND);

    std::vector<keyreg::KeyRecord> records;
    assert_keyreg_success(registry.list_keys(42, records));
    assert_int_equal(records.size(), 1);
    assert_true(records[0].key_id == "173F01BC633398A2");
    assert_keyreg_success(registry.list_keys(7, records));
    assert_true(records.empty());
}

TEST_F(keyreg_tests, test_registry_rejects_keys)
{
    keyreg::MemoryAccountDirectory accounts;
    accounts.add_email(42, "a@example.com");
    accounts.add_email(42, "bob@example.org");
    accounts.add_email(42, "bob@work.example.net", false);
    accounts.add_email(42, "carol@example.com");
    keyreg::KeyRegistry registry("registry.db", accounts);

    keyreg::KeyRecord              record;
    std::string                    rejected;
    std::vector<keyreg::KeyRecord> records;

    /* one of emails is not verified */
    assert_int_equal(
      registry.add_key(42, file_to_str(key_path("bob-rsa-2subs.asc")), record, &rejected),
      KEYREG_ERROR_UNVERIFIED_IDENTITY);
    assert_true(rejected == "Bob Work <bob@work.example.net>");
    assert_true(record.key_id.empty());
    assert_keyreg_success(registry.list_keys(42, records));
    assert_true(records.empty());

    /* userid without email */
    assert_int_equal(registry.add_key(42,
                                      file_to_str(key_path("carol-p256-no-email-uid.asc")),
                                      record,
                                      &rejected),
                     KEYREG_ERROR_UNVERIFIED_IDENTITY);
    assert_true(rejected == "carol-no-email");

    /* other account */
    assert_int_equal(
      registry.add_key(7, file_to_str(key_path("alice-ed25519-cv25519.asc")), record),
      KEYREG_ERROR_UNVERIFIED_IDENTITY);

    /* broken or secret keys */
    const char *bad[] = {"malformed-truncated.asc",
                         "malformed-bad-base64.asc",
                         "malformed-empty-block.asc",
                         "malformed-plain-text.txt",
                         "dave-secret.asc"};
    for (auto name : bad) {
        rejected.clear();
        assert_int_equal(registry.add_key(42, file_to_str(key_path(name)), record, &rejected),
                         KEYREG_ERROR_BAD_FORMAT);
        assert_true(rejected.empty());
    }
    assert_int_equal(registry.add_key(42, "", record), KEYREG_ERROR_BAD_FORMAT);

    assert_keyreg_success(registry.list_keys(42, records));
    assert_true(records.empty());

    /* once email is verified the key is accepted */
    accounts.add_email(42, "bob@work.example.net", true);
    assert_keyreg_success(
      registry.add_key(42, file_to_str(key_path("bob-rsa-2subs.asc")), record, &rejected));
    assert_true(record.key_id == "1A5D06AA8D765B9E");
    assert_true(record.has_expiry);
    assert_int_equal(keyreg::time_to_unix(record.expires), 1855508125);
    assert_int_equal(record.emails.size(), 2);
    assert_true(record.can_certify);
    assert_false(record.can_sign);
    assert_int_equal(record.subkeys.size(), 2);
    assert_true(record.subkeys[0].can_sign);
    assert_false(record.subkeys[0].can_encrypt_comms);
    assert_true(record.subkeys[1].can_encrypt_comms);
    assert_true(record.subkeys[1].can_encrypt_storage);
    assert_int_equal(keyreg::time_to_unix(record.subkeys[1].expires), 1823972125);
}

TEST_F(keyreg_tests, test_registry_keyring_and_binary)
{
    keyreg::MemoryAccountDirectory accounts;
    accounts.add_email(42, "a@example.com");
    keyreg::KeyRegistry registry("registry.db", accounts);

    /* only the first key of the keyring is registered */
    keyreg::KeyRecord record;
    assert_keyreg_success(
      registry.add_key(42, file_to_str(key_path("alice-bob-keyring.asc")), record));
    assert_true(record.key_id == "173F01BC633398A2");
    std::vector<keyreg::KeyRecord> records;
    assert_keyreg_success(registry.list_keys(42, records));
    assert_int_equal(records.size(), 1);

    /* binary form of the same key */
    assert_int_equal(
      registry.add_key(42, file_to_str(key_path("alice-ed25519-cv25519.gpg")), record),
      KEYREG_ERROR_KEY_ID_CONFLICT);
}

TEST_F(keyreg_tests, test_registry_delete_key)
{
    keyreg::MemoryAccountDirectory accounts;
    accounts.add_email(42, "a@example.com");
    accounts.add_email(7, "dave@example.com");
    keyreg::KeyRegistry registry("registry.db", accounts);

    keyreg::KeyRecord alice;
    keyreg::KeyRecord dave;
    assert_keyreg_success(
      registry.add_key(42, file_to_str(key_path("alice-ed25519-cv25519.asc")), alice));
    assert_keyreg_success(registry.add_key(7, file_to_str(key_path("dave-dsa.asc")), dave));
    assert_true(dave.subkeys.empty());

    /* somebody else's key */
    assert_int_equal(registry.delete_key(7, alice.id), KEYREG_ERROR_ACCESS_DENIED);
    assert_int_equal(registry.delete_key(7, alice.subkeys[0].id), KEYREG_ERROR_ACCESS_DENIED);
    keyreg::KeyRecord got;
    assert_keyreg_success(registry.get_key(alice.id, got));

    /* owner deletes primary key together with subkey */
    assert_keyreg_success(registry.delete_key(42, alice.id));
    assert_int_equal(registry.get_key(alice.id, got), KEYREG_ERROR_KEY_NOT_FOUND);
    assert_int_equal(registry.get_key(alice.subkeys[0].id, got), KEYREG_ERROR_KEY_NOT_FOUND);
    /* deleting the missing key succeeds */
    assert_keyreg_success(registry.delete_key(42, alice.id));
    assert_keyreg_success(registry.delete_key(7, 100000));

    /* administrator */
    assert_int_equal(registry.delete_key(1, dave.id), KEYREG_ERROR_ACCESS_DENIED);
    accounts.set_admin(1);
    assert_keyreg_success(registry.delete_key(1, dave.id));
    std::vector<keyreg::KeyRecord> records;
    assert_keyreg_success(registry.list_keys(7, records));
    assert_true(records.empty());
    accounts.set_admin(1, false);
    assert_false(accounts.is_admin(1));

    /* key may be registered again, now by other account */
    accounts.add_email(7, "a@example.com");
    assert_keyreg_success(
      registry.add_key(7, file_to_str(key_path("alice-ed25519-cv25519.asc")), alice));
    assert_int_equal(alice.owner_id, 7);
}

TEST_F(keyreg_tests, test_registry_concurrent_add)
{
    keyreg::MemoryAccountDirectory accounts;
    accounts.add_email(1, "a@example.com");
    accounts.add_email(2, "a@example.com");
    keyreg::KeyRegistry registry1("registry.db", accounts);
    keyreg::KeyRegistry registry2("registry.db", accounts);
    std::string         alice = file_to_str(key_path("alice-ed25519-cv25519.asc"));

    keyreg::KeyRecord rec1, rec2;
    keyreg_result_t   ret1 = KEYREG_ERROR_GENERIC;
    keyreg_result_t   ret2 = KEYREG_ERROR_GENERIC;
    std::thread       th1([&]() { ret1 = registry1.add_key(1, alice, rec1); });
    std::thread       th2([&]() { ret2 = registry2.add_key(2, alice, rec2); });
    th1.join();
    th2.join();

    assert_true(((ret1 == KEYREG_SUCCESS) && (ret2 == KEYREG_ERROR_KEY_ID_CONFLICT)) ||
                ((ret2 == KEYREG_SUCCESS) && (ret1 == KEYREG_ERROR_KEY_ID_CONFLICT)));
    keyreg::KeyStore store("registry.db");
    assert_int_equal(store.count(), 2);
}

TEST_F(keyreg_tests, test_registry_sql_accounts)
{
    keyreg::SqlAccountDirectory accounts("registry.db");
    accounts.add_email(42, "a@example.com");
    accounts.add_email(42, "old@example.com", false);
    accounts.add_email(42, "second@example.com");
    accounts.add_email(7, "bob@example.org");

    auto emails = accounts.verified_emails(42);
    assert_int_equal(emails.size(), 2);
    assert_true(emails[0] == "a@example.com");
    assert_true(emails[1] == "second@example.com");
    accounts.add_email(42, "a@example.com", false);
    accounts.add_email(42, "old@example.com", true);
    emails = accounts.verified_emails(42);
    assert_int_equal(emails.size(), 2);
    assert_true(emails[0] == "old@example.com");
    assert_true(accounts.verified_emails(100).empty());

    assert_false(accounts.is_admin(7));
    accounts.set_admin(7);
    assert_true(accounts.is_admin(7));
    accounts.set_admin(7, false);
    assert_false(accounts.is_admin(7));
    assert_false(accounts.is_admin(100));

    /* registry and accounts share the database file */
    accounts.add_email(42, "a@example.com", true);
    keyreg::KeyRegistry registry("registry.db", accounts);
    keyreg::KeyRecord   record;
    assert_keyreg_success(
      registry.add_key(42, file_to_str(key_path("alice-ed25519-cv25519.asc")), record));
    assert_int_equal(registry.delete_key(7, record.id), KEYREG_ERROR_ACCESS_DENIED);
    accounts.set_admin(7);
    assert_keyreg_success(registry.delete_key(7, record.id));
}

TEST_F(keyreg_tests, test_registry_misc)
{
    keyreg::MemoryAccountDirectory accounts;
    std::unique_ptr<keyreg::KeyStore> empty;
    assert_throw(keyreg::KeyRegistry nostore(std::move(empty), accounts));
    std::unique_ptr<keyreg::KeyStore> store(new keyreg::KeyStore("registry.db"));
    keyreg::KeyRegistry               registry(std::move(store), accounts);
    std::vector<keyreg::KeyRecord>    records;
    assert_keyreg_success(registry.list_keys(1, records));

    assert_string_equal(keyreg::keyreg_result_str(KEYREG_SUCCESS), "Success");
    assert_string_equal(keyreg::keyreg_result_str(KEYREG_ERROR_KEY_ID_CONFLICT),
                        "Key id conflict");
    assert_string_equal(keyreg::keyreg_result_str(KEYREG_ERROR_UNVERIFIED_IDENTITY),
                        "Unverified identity");
    assert_string_equal(keyreg::keyreg_result_str(0x7fffffff), "Unsupported error code");

    const char *version = keyreg::keyreg_version_string();
    assert_non_null(version);
    assert_true(strlen(version) > 0);
}
