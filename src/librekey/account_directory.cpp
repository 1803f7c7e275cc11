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

#include <keyreg/keyreg.hpp>
#include "sql.hpp"
#include "logging.h"

namespace keyreg {

void
MemoryAccountDirectory::add_email(int64_t owner, const std::string &email, bool verified)
{
    std::lock_guard<std::mutex> lock(lock_);
    auto &                      emails = emails_[owner];
    for (auto &item : emails) {
        if (item.first == email) {
            item.second = verified;
            return;
        }
    }
    emails.emplace_back(email, verified);
}

void
MemoryAccountDirectory::set_admin(int64_t id, bool admin)
{
    std::lock_guard<std::mutex> lock(lock_);
    if (admin) {
        admins_.insert(id);
    } else {
        admins_.erase(id);
    }
}

std::vector<std::string>
MemoryAccountDirectory::verified_emails(int64_t owner)
{
    std::lock_guard<std::mutex> lock(lock_);
    std::vector<std::string>    res;
    auto                        it = emails_.find(owner);
    if (it == emails_.end()) {
        return res;
    }
    for (auto &item : it->second) {
        if (item.second) {
            res.push_back(item.first);
        }
    }
    return res;
}

bool
MemoryAccountDirectory::is_admin(int64_t requestor)
{
    std::lock_guard<std::mutex> lock(lock_);
    return admins_.count(requestor);
}

static const char SQL_CREATE_ACCOUNT_TABLES[] =
  "CREATE TABLE IF NOT EXISTS email_address ("
  "id INTEGER PRIMARY KEY AUTOINCREMENT, "
  "uid INTEGER NOT NULL, "
  "email TEXT NOT NULL, "
  "is_activated INTEGER NOT NULL DEFAULT 0, "
  "UNIQUE (uid, email));"
  "CREATE TABLE IF NOT EXISTS \"user\" ("
  "id INTEGER PRIMARY KEY, "
  "is_admin INTEGER NOT NULL DEFAULT 0);";

static const char SQL_UPSERT_EMAIL[] =
  "INSERT INTO email_address (uid, email, is_activated) VALUES (?1, ?2, ?3) "
  "ON CONFLICT (uid, email) DO UPDATE SET is_activated = excluded.is_activated";
static const char SQL_UPSERT_USER[] =
  "INSERT INTO \"user\" (id, is_admin) VALUES (?1, ?2) "
  "ON CONFLICT (id) DO UPDATE SET is_admin = excluded.is_admin";
static const char SQL_SELECT_VERIFIED[] =
  "SELECT email FROM email_address WHERE uid = ?1 AND is_activated != 0 ORDER BY id";
static const char SQL_SELECT_ADMIN[] = "SELECT is_admin FROM \"user\" WHERE id = ?1";

SqlAccountDirectory::SqlAccountDirectory(const std::string &path, int busy_timeout)
    : db_(new sql::Database(path, busy_timeout))
{
    std::lock_guard<std::mutex> lock(db_->lock());
    db_->exec(SQL_CREATE_ACCOUNT_TABLES);
}

SqlAccountDirectory::~SqlAccountDirectory()
{
}

void
SqlAccountDirectory::add_email(int64_t owner, const std::string &email, bool verified)
{
    std::lock_guard<std::mutex> lock(db_->lock());
    sql::Statement              st(*db_, SQL_UPSERT_EMAIL);
    st.bind(1, owner);
    st.bind(2, email);
    st.bind(3, (int64_t) verified);
    st.step();
}

void
SqlAccountDirectory::set_admin(int64_t id, bool admin)
{
    std::lock_guard<std::mutex> lock(db_->lock());
    sql::Statement              st(*db_, SQL_UPSERT_USER);
    st.bind(1, id);
    st.bind(2, (int64_t) admin);
    st.step();
}

std::vector<std::string>
SqlAccountDirectory::verified_emails(int64_t owner)
{
    std::lock_guard<std::mutex> lock(db_->lock());
    std::vector<std::string>    res;
    sql::Statement              st(*db_, SQL_SELECT_VERIFIED);
    st.bind(1, owner);
    while (st.step()) {
        res.push_back(st.column_text(0));
    }
    return res;
}

bool
SqlAccountDirectory::is_admin(int64_t requestor)
{
    std::lock_guard<std::mutex> lock(db_->lock());
    sql::Statement              st(*db_, SQL_SELECT_ADMIN);
    st.bind(1, requestor);
    if (!st.step()) {
        return false;
    }
    return st.column_bool(0);
}

} // namespace keyreg
