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

#ifndef KEYREG_KEY_STORE_SQL_HPP_
#define KEYREG_KEY_STORE_SQL_HPP_

#include <string>
#include <vector>
#include <keyreg/keyreg.hpp>
#include "sql.hpp"

namespace keyreg {

/**
 * @brief Storage of key records in the SQLite table gpg_key. Each KeyStore object has its
 *        own connection, several stores may work on the same database file. Key ids are
 *        unique across all the records, subkeys reference the primary key via
 *        primary_key_id.
 */
class KeyStore {
    sql::Database db_;

    void      init_schema();
    KeyRecord read_record(sql::Statement &st);
    void      attach_subkeys(KeyRecord &record);
    bool      has_key_id(const std::string &keyid);
    void      insert_record(KeyRecord &record);

  public:
    KeyStore(const std::string &path, int busy_timeout = 5000);

    const std::string path;

    /**
     * @brief Insert primary key record together with subkeys in one transaction.
     *        Throws KEYREG_ERROR_KEY_ID_CONFLICT if any of key ids is already stored, or
     *        storage error. Nothing is stored on failure.
     *
     * @param primary primary key record with subkeys attached. On success ids, added time
     *        and subkeys' primary_key_id are updated.
     */
    void insert(KeyRecord &primary);

    /**
     * @brief Get record by id. Primary key is returned with subkeys.
     *        Throws KEYREG_ERROR_KEY_NOT_FOUND if there is no such record.
     */
    KeyRecord get(int64_t id);

    /** @brief Get primary key records of the owner, ordered by id, with subkeys */
    std::vector<KeyRecord> list_by_owner(int64_t owner);

    /**
     * @brief Delete record, and all subkeys if it is a primary key, in one transaction.
     *        Throws KEYREG_ERROR_ACCESS_DENIED if requestor is not an owner and not admin.
     *
     * @param requestor account which deletes the key.
     * @param admin whether requestor has the administrative privilege.
     * @param id record id.
     * @return number of deleted records, 0 if there was no such record.
     */
    size_t remove(int64_t requestor, bool admin, int64_t id);

    /** @brief Total number of records, including subkeys */
    size_t count();
};

} // namespace keyreg

#endif
