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

#include <sstream>
#include "key_store_sql.hpp"
#include "logging.h"
#include "time-utils.h"

namespace keyreg {

static const char SQL_CREATE_TABLE[] =
  "CREATE TABLE IF NOT EXISTS gpg_key ("
  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
  "owner_id INTEGER NOT NULL, "
  "key_id TEXT NOT NULL UNIQUE, "
  "primary_key_id TEXT NOT NULL DEFAULT '', "
  "content TEXT NOT NULL, "
  "created_unix INTEGER NOT NULL, "
  "expires_unix INTEGER NOT NULL DEFAULT 0, "
  "added_unix INTEGER NOT NULL, "
  "emails TEXT NOT NULL DEFAULT '', "
  "can_sign INTEGER NOT NULL DEFAULT 0, "
  "can_encrypt_comms INTEGER NOT NULL DEFAULT 0, "
  "can_encrypt_storage INTEGER NOT NULL DEFAULT 0, "
  "can_certify INTEGER NOT NULL DEFAULT 0);"
  "CREATE INDEX IF NOT EXISTS gpg_key_owner ON gpg_key (owner_id);"
  "CREATE INDEX IF NOT EXISTS gpg_key_primary ON gpg_key (primary_key_id);";

#define SQL_KEY_COLUMNS                                                               \
    "id, owner_id, key_id, primary_key_id, content, created_unix, expires_unix, "     \
    "added_unix, emails, can_sign, can_encrypt_comms, can_encrypt_storage, can_certify"

static const char SQL_INSERT_KEY[] =
  "INSERT INTO gpg_key (owner_id, key_id, primary_key_id, content, created_unix, "
  "expires_unix, added_unix, emails, can_sign, can_encrypt_comms, can_encrypt_storage, "
  "can_certify) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)";
static const char SQL_SELECT_KEY[] = "SELECT " SQL_KEY_COLUMNS " FROM gpg_key WHERE id = ?1";
static const char SQL_SELECT_SUBKEYS[] =
  "SELECT " SQL_KEY_COLUMNS " FROM gpg_key WHERE primary_key_id = ?1 ORDER BY id";
static const char SQL_SELECT_OWNER_KEYS[] = "SELECT " SQL_KEY_COLUMNS
                                            " FROM gpg_key WHERE owner_id = ?1 AND "
                                            "primary_key_id = '' ORDER BY id";
static const char SQL_SELECT_KEY_ID[] = "SELECT 1 FROM gpg_key WHERE key_id = ?1";
static const char SQL_SELECT_KEY_OWNER[] =
  "SELECT owner_id, key_id, primary_key_id FROM gpg_key WHERE id = ?1";
static const char SQL_DELETE_KEY[] = "DELETE FROM gpg_key WHERE id = ?1";
static const char SQL_DELETE_SUBKEYS[] = "DELETE FROM gpg_key WHERE primary_key_id = ?1";
static const char SQL_COUNT_KEYS[] = "SELECT COUNT(*) FROM gpg_key";

/* emails can't have line breaks, so they are kept one per line */
static std::string
join_emails(const std::vector<std::string> &emails)
{
    std::string res;
    for (auto &email : emails) {
        if (!res.empty()) {
            res.push_back('\n');
        }
        res.append(email);
    }
    return res;
}

static std::vector<std::string>
split_emails(const std::string &str)
{
    std::vector<std::string> res;
    std::istringstream       ss(str);
    std::string              email;
    while (std::getline(ss, email)) {
        if (!email.empty()) {
            res.push_back(email);
        }
    }
    return res;
}

KeyStore::KeyStore(const std::string &dbpath, int busy_timeout)
    : db_(dbpath, busy_timeout), path(dbpath)
{
    init_schema();
}

void
KeyStore::init_schema()
{
    std::lock_guard<std::mutex> lock(db_.lock());
    db_.exec(SQL_CREATE_TABLE);
}

KeyRecord
KeyStore::read_record(sql::Statement &st)
{
    KeyRecord rec;
    rec.id = st.column_int64(0);
    rec.owner_id = st.column_int64(1);
    rec.key_id = st.column_text(2);
    rec.primary_key_id = st.column_text(3);
    rec.content = st.column_text(4);
    rec.created = time_from_unix(st.column_int64(5));
    int64_t expires = st.column_int64(6);
    rec.has_expiry = expires != 0;
    rec.expires = rec.has_expiry ? time_from_unix(expires) : TimePoint();
    rec.added = time_from_unix(st.column_int64(7));
    rec.emails = split_emails(st.column_text(8));
    rec.can_sign = st.column_bool(9);
    rec.can_encrypt_comms = st.column_bool(10);
    rec.can_encrypt_storage = st.column_bool(11);
    rec.can_certify = st.column_bool(12);
    return rec;
}

void
KeyStore::attach_subkeys(KeyRecord &record)
{
    record.subkeys.clear();
    if (!record.is_primary()) {
        return;
    }
    sql::Statement st(db_, SQL_SELECT_SUBKEYS);
    st.bind(1, record.key_id);
    while (st.step()) {
        record.subkeys.push_back(read_record(st));
    }
}

bool
KeyStore::has_key_id(const std::string &keyid)
{
    sql::Statement st(db_, SQL_SELECT_KEY_ID);
    st.bind(1, keyid);
    return st.step();
}

void
KeyStore::insert_record(KeyRecord &record)
{
    sql::Statement st(db_, SQL_INSERT_KEY);
    st.bind(1, record.owner_id);
    st.bind(2, record.key_id);
    st.bind(3, record.primary_key_id);
    st.bind(4, record.content);
    st.bind(5, time_to_unix(record.created));
    st.bind(6, record.has_expiry ? time_to_unix(record.expires) : 0);
    st.bind(7, time_to_unix(record.added));
    st.bind(8, join_emails(record.emails));
    st.bind(9, (int64_t) record.can_sign);
    st.bind(10, (int64_t) record.can_encrypt_comms);
    st.bind(11, (int64_t) record.can_encrypt_storage);
    st.bind(12, (int64_t) record.can_certify);
    try {
        st.step();
    } catch (const sql::Error &e) {
        if (e.is_unique_violation()) {
            KEYREG_LOG("key id %s is already registered", record.key_id.c_str());
            throw keyreg_exception(KEYREG_ERROR_KEY_ID_CONFLICT, record.key_id);
        }
        throw;
    }
    record.id = db_.last_insert_rowid();
}

void
KeyStore::insert(KeyRecord &primary)
{
    if (!primary.is_primary() || primary.key_id.empty()) {
        throw keyreg_exception(KEYREG_ERROR_BAD_PARAMETERS, "not a primary key record");
    }
    if (primary.emails.empty()) {
        throw keyreg_exception(KEYREG_ERROR_UNVERIFIED_IDENTITY, "no bound emails");
    }

    KeyRecord added = primary;
    added.added = time_from_unix(time_now());
    for (auto &sub : added.subkeys) {
        sub.owner_id = added.owner_id;
        sub.primary_key_id = added.key_id;
        sub.added = added.added;
        sub.emails.clear();
        sub.subkeys.clear();
    }

    std::lock_guard<std::mutex> lock(db_.lock());
    sql::Transaction            tx(db_);
    /* check under the write lock, concurrent insert would wait for it */
    if (has_key_id(added.key_id)) {
        KEYREG_LOG("key %s already exists", added.key_id.c_str());
        throw keyreg_exception(KEYREG_ERROR_KEY_ID_CONFLICT, added.key_id);
    }
    for (auto &sub : added.subkeys) {
        if (has_key_id(sub.key_id)) {
            KEYREG_LOG("subkey %s already exists", sub.key_id.c_str());
            throw keyreg_exception(KEYREG_ERROR_KEY_ID_CONFLICT, sub.key_id);
        }
    }
    insert_record(added);
    for (auto &sub : added.subkeys) {
        insert_record(sub);
    }
    tx.commit();
    primary = std::move(added);
}

KeyRecord
KeyStore::get(int64_t id)
{
    std::lock_guard<std::mutex> lock(db_.lock());
    sql::Statement              st(db_, SQL_SELECT_KEY);
    st.bind(1, id);
    if (!st.step()) {
        throw keyreg_exception(KEYREG_ERROR_KEY_NOT_FOUND, std::to_string(id));
    }
    KeyRecord rec = read_record(st);
    attach_subkeys(rec);
    return rec;
}

std::vector<KeyRecord>
KeyStore::list_by_owner(int64_t owner)
{
    std::lock_guard<std::mutex> lock(db_.lock());
    std::vector<KeyRecord>      res;
    sql::Statement              st(db_, SQL_SELECT_OWNER_KEYS);
    st.bind(1, owner);
    while (st.step()) {
        res.push_back(read_record(st));
    }
    for (auto &rec : res) {
        attach_subkeys(rec);
    }
    return res;
}

size_t
KeyStore::remove(int64_t requestor, bool admin, int64_t id)
{
    std::lock_guard<std::mutex> lock(db_.lock());
    sql::Transaction            tx(db_);

    int64_t     owner = 0;
    std::string keyid;
    bool        primary = false;
    {
        sql::Statement st(db_, SQL_SELECT_KEY_OWNER);
        st.bind(1, id);
        if (!st.step()) {
            /* nothing to delete */
            tx.commit();
            return 0;
        }
        owner = st.column_int64(0);
        keyid = st.column_text(1);
        primary = st.column_text(2).empty();
    }
    if ((owner != requestor) && !admin) {
        KEYREG_LOG("account %lld may not delete key %s",
                   (long long) requestor,
                   keyid.c_str());
        throw keyreg_exception(KEYREG_ERROR_ACCESS_DENIED, keyid);
    }

    size_t removed = 0;
    {
        sql::Statement st(db_, SQL_DELETE_KEY);
        st.bind(1, id);
        st.step();
        removed += db_.changes();
    }
    if (primary) {
        sql::Statement st(db_, SQL_DELETE_SUBKEYS);
        st.bind(1, keyid);
        st.step();
        removed += db_.changes();
    }
    tx.commit();
    return removed;
}

size_t
KeyStore::count()
{
    std::lock_guard<std::mutex> lock(db_.lock());
    sql::Statement              st(db_, SQL_COUNT_KEYS);
    if (!st.step()) {
        return 0;
    }
    return (size_t) st.column_int64(0);
}

} // namespace keyreg
