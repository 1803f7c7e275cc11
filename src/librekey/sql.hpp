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

#ifndef KEYREG_SQL_HPP_
#define KEYREG_SQL_HPP_

#include <stdint.h>
#include <mutex>
#include <string>
#include <sqlite3.h>
#include "types.h"

namespace keyreg {
namespace sql {

/* SQLite failure, keeps the extended result code */
class Error : public keyreg_exception {
    int rc_;

  public:
    Error(int rc, const std::string &msg);

    bool
    is_unique_violation() const noexcept
    {
        return (rc_ == SQLITE_CONSTRAINT_UNIQUE) || (rc_ == SQLITE_CONSTRAINT_PRIMARYKEY);
    }
};

/** @brief Map SQLite result code to the registry one */
keyreg_result_t sqlite_result(int rc);

/* Database connection. SQLite handle is not shared between the Database objects. */
class Database {
    sqlite3 *  db_;
    std::mutex lock_;

  public:
    Database(const std::string &path, int busy_timeout);
    ~Database();
    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    sqlite3 *
    handle() noexcept
    {
        return db_;
    }
    /* Serializes statements and transactions which use this connection */
    std::mutex &
    lock() noexcept
    {
        return lock_;
    }

    void    exec(const char *sql);
    int64_t last_insert_rowid() noexcept;
    int     changes() noexcept;
};

/* Prepared statement, finalized on destruction */
class Statement {
    Database &    db_;
    sqlite3_stmt *stmt_;

  public:
    Statement(Database &db, const char *sql);
    ~Statement();
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void bind(int idx, int64_t val);
    void bind(int idx, const std::string &val);

    /**
     * @brief Execute statement step.
     * @return true if there is a row available, false if statement is done.
     *         Throws sql::Error on failure.
     */
    bool step();

    int64_t     column_int64(int col);
    bool        column_bool(int col);
    std::string column_text(int col);
};

/* Write transaction: BEGIN IMMEDIATE on construction, rollback unless committed */
class Transaction {
    Database &db_;
    bool      finished_;

  public:
    Transaction(Database &db);
    ~Transaction();
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();
};

} // namespace sql
} // namespace keyreg

#endif
