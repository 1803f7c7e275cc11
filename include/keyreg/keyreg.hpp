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

#ifndef KEYREG_HPP_
#define KEYREG_HPP_

#include <stdint.h>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "keyreg_err.h"

namespace keyreg {

typedef std::chrono::system_clock::time_point TimePoint;

/* Stored timestamps are seconds since the epoch, these convert them both ways */
TimePoint time_from_unix(int64_t secs) noexcept;
int64_t   time_to_unix(const TimePoint &time) noexcept;

/* Registered primary key or subkey */
class KeyRecord {
  public:
    int64_t     id{};             /* assigned by the store */
    int64_t     owner_id{};       /* account which registered the key */
    std::string key_id;           /* 16 upper-case hex chars */
    std::string primary_key_id;   /* empty for the primary key */
    std::string content;          /* base64 of the key packet */
    TimePoint   created{};
    TimePoint   expires{}; /* valid only if has_expiry is set */
    bool        has_expiry{};
    TimePoint   added{};

    std::vector<std::string> emails;  /* bound verified emails, primary key only */
    std::vector<KeyRecord>   subkeys; /* primary key only */

    bool can_sign{};
    bool can_encrypt_comms{};
    bool can_encrypt_storage{};
    bool can_certify{};

    bool
    is_primary() const noexcept
    {
        return primary_key_id.empty();
    }
};

/* Accounts of the host platform, used to check emails and privileges */
class AccountDirectory {
  public:
    virtual ~AccountDirectory() = default;
    /** @brief Get emails which were verified by the account */
    virtual std::vector<std::string> verified_emails(int64_t owner) = 0;
    /** @brief Check whether account has the administrative privilege */
    virtual bool is_admin(int64_t requestor) = 0;
};

/* In-memory account directory, thread-safe */
class MemoryAccountDirectory : public AccountDirectory {
    std::mutex                                                    lock_;
    std::map<int64_t, std::vector<std::pair<std::string, bool>>> emails_;
    std::set<int64_t>                                             admins_;

  public:
    void add_email(int64_t owner, const std::string &email, bool verified = true);
    void set_admin(int64_t id, bool admin = true);

    std::vector<std::string> verified_emails(int64_t owner) override;
    bool                     is_admin(int64_t requestor) override;
};

class KeyStore;
namespace sql {
class Database;
}

/* Account directory on top of the host platform tables email_address and user */
class SqlAccountDirectory : public AccountDirectory {
    std::unique_ptr<sql::Database> db_;

  public:
    SqlAccountDirectory(const std::string &path, int busy_timeout = 5000);
    ~SqlAccountDirectory();

    /** @brief Add or update the account email */
    void add_email(int64_t owner, const std::string &email, bool verified = true);
    void set_admin(int64_t id, bool admin = true);

    std::vector<std::string> verified_emails(int64_t owner) override;
    bool                     is_admin(int64_t requestor) override;
};

/**
 * @brief Registry of the account keys: decodes submitted keys, binds them to the verified
 *        emails and keeps primary keys together with subkeys in the store. All functions
 *        are safe to call from several threads.
 */
class KeyRegistry {
    std::unique_ptr<KeyStore> store_;
    AccountDirectory &        accounts_;

  public:
    KeyRegistry(std::unique_ptr<KeyStore> store, AccountDirectory &accounts);
    /** @brief Open (and create if needed) the SQLite key store at path */
    KeyRegistry(const std::string &path, AccountDirectory &accounts, int busy_timeout = 5000);
    ~KeyRegistry();
    KeyRegistry(const KeyRegistry &) = delete;
    KeyRegistry &operator=(const KeyRegistry &) = delete;

    /**
     * @brief Register the key with subkeys for the owner.
     *
     * @param owner account id.
     * @param armored armored public key.
     * @param record on success the stored primary key record with subkeys is put here.
     * @param rejected if not NULL then userid which has no verified email is put here.
     * @return KEYREG_SUCCESS, KEYREG_ERROR_BAD_FORMAT, KEYREG_ERROR_UNVERIFIED_IDENTITY,
     *         KEYREG_ERROR_KEY_ID_CONFLICT or storage error.
     */
    keyreg_result_t add_key(int64_t            owner,
                            const std::string &armored,
                            KeyRecord &        record,
                            std::string *      rejected = NULL);
    /** @brief Get key record by id, primary key comes with subkeys */
    keyreg_result_t get_key(int64_t id, KeyRecord &record);
    /** @brief List primary keys of the owner, ordered by id */
    keyreg_result_t list_keys(int64_t owner, std::vector<KeyRecord> &records);
    /**
     * @brief Delete key record. Primary key is deleted together with subkeys. Deleting the
     *        missing record succeeds.
     * @return KEYREG_SUCCESS, KEYREG_ERROR_ACCESS_DENIED if requestor is neither owner nor
     *         administrator, or storage error.
     */
    keyreg_result_t delete_key(int64_t requestor, int64_t id);
};

/** @brief Get the library version as string like "0.3.0" */
const char *keyreg_version_string();

/** @brief Get the description of the result code */
const char *keyreg_result_str(keyreg_result_t result);

/* flags for key_record_to_json */
#define KEYREG_JSON_PRETTY (1U << 0)

/**
 * @brief Render the key record as JSON object.
 *
 * @param record key record.
 * @param json on success JSON text is stored here.
 * @param flags KEYREG_JSON_PRETTY or 0.
 * @return KEYREG_SUCCESS or error code.
 */
keyreg_result_t key_record_to_json(const KeyRecord &record, std::string &json, uint32_t flags = 0);

} // namespace keyreg

#endif
