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

#include "sql.hpp"
#include "logging.h"

namespace keyreg {
namespace sql {

Error::Error(int rc, const std::string &msg) : keyreg_exception(sqlite_result(rc), msg), rc_(rc)
{
}

keyreg_result_t
sqlite_result(int rc)
{
    switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
        return KEYREG_SUCCESS;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        return KEYREG_ERROR_STORAGE_BUSY;
    case SQLITE_NOMEM:
        return KEYREG_ERROR_OUT_OF_MEMORY;
    case SQLITE_CANTOPEN:
    case SQLITE_NOTADB:
        return KEYREG_ERROR_STORAGE_NOT_AVAILABLE;
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
        return KEYREG_ERROR_READ;
    case SQLITE_READONLY:
    case SQLITE_FULL:
    case SQLITE_CONSTRAINT:
        return KEYREG_ERROR_WRITE;
    default:
        return KEYREG_ERROR_STORAGE;
    }
}

Database::Database(const std::string &path, int busy_timeout) : db_(NULL)
{
    int rc = sqlite3_open_v2(path.c_str(),
                             &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             NULL);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = NULL;
        KEYREG_LOG("failed to open database %s: %s", path.c_str(), msg.c_str());
        throw Error(rc, msg);
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busy_timeout);
    try {
        /* readers should not block the writer and vice versa */
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA foreign_keys=ON");
    } catch (const Error &) {
        sqlite3_close(db_);
        db_ = NULL;
        throw;
    }
}

Database::~Database()
{
    if (db_ && (sqlite3_close(db_) != SQLITE_OK)) {
        KEYREG_LOG("failed to close database: %s", sqlite3_errmsg(db_));
    }
}

void
Database::exec(const char *sql)
{
    char *errmsg = NULL;
    int   rc = sqlite3_exec(db_, sql, NULL, NULL, &errmsg);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        KEYREG_LOG("'%s' failed: %s", sql, msg.c_str());
        throw Error(sqlite3_extended_errcode(db_), msg);
    }
}

int64_t
Database::last_insert_rowid() noexcept
{
    return sqlite3_last_insert_rowid(db_);
}

int
Database::changes() noexcept
{
    return sqlite3_changes(db_);
}

Statement::Statement(Database &db, const char *sql) : db_(db), stmt_(NULL)
{
    int rc = sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, NULL);
    if (rc != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db_.handle());
        KEYREG_LOG("failed to prepare '%s': %s", sql, msg.c_str());
        throw Error(rc, msg);
    }
}

Statement::~Statement()
{
    sqlite3_finalize(stmt_);
}

void
Statement::bind(int idx, int64_t val)
{
    int rc = sqlite3_bind_int64(stmt_, idx, val);
    if (rc != SQLITE_OK) {
        throw Error(rc, sqlite3_errmsg(db_.handle()));
    }
}

void
Statement::bind(int idx, const std::string &val)
{
    int rc = sqlite3_bind_text(stmt_, idx, val.data(), (int) val.size(), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw Error(rc, sqlite3_errmsg(db_.handle()));
    }
}

bool
Statement::step()
{
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    std::string msg = sqlite3_errmsg(db_.handle());
    KEYREG_LOG("statement failed (%d): %s", rc, msg.c_str());
    throw Error(rc, msg);
}

int64_t
Statement::column_int64(int col)
{
    return sqlite3_column_int64(stmt_, col);
}

bool
Statement::column_bool(int col)
{
    return sqlite3_column_int(stmt_, col) != 0;
}

std::string
Statement::column_text(int col)
{
    const unsigned char *txt = sqlite3_column_text(stmt_, col);
    if (!txt) {
        return "";
    }
    return std::string((const char *) txt, sqlite3_column_bytes(stmt_, col));
}

Transaction::Transaction(Database &db) : db_(db), finished_(false)
{
    /* take the write lock right away, so check-then-insert sequences do not race */
    db_.exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction()
{
    if (finished_) {
        return;
    }
    char *errmsg = NULL;
    if (sqlite3_exec(db_.handle(), "ROLLBACK", NULL, NULL, &errmsg) != SQLITE_OK) {
        KEYREG_LOG("rollback failed: %s", errmsg ? errmsg : "unknown error");
    }
    sqlite3_free(errmsg);
}

void
Transaction::commit()
{
    db_.exec("COMMIT");
    finished_ = true;
}

} // namespace sql
} // namespace keyreg
