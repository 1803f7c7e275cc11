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

#include <new>
#include <stdexcept>
#include <keyreg/keyreg.hpp>
#include "config.h"
#include "librekey/key_decoder.hpp"
#include "librekey/identity_binder.hpp"
#include "librekey/key_store_sql.hpp"
#include "logging.h"
#include "types.h"
#include "utils.h"

namespace keyreg {

static keyreg_result_t
registry_exception(const char *func, const char *msg, keyreg_result_t ret = KEYREG_ERROR_GENERIC)
{
    if (keyreg_log_switch()) {
        fprintf(stderr,
                "[%s()] Error 0x%08X (%s): %s\n",
                func,
                (unsigned) ret,
                keyreg_result_str(ret),
                msg);
    }
    return ret;
}

#define KEYREG_GUARD                                                                  \
    catch (keyreg::keyreg_exception & e)                                              \
    {                                                                                 \
        return registry_exception(__func__, e.what(), e.code());                      \
    }                                                                                 \
    catch (std::bad_alloc &)                                                          \
    {                                                                                 \
        return registry_exception(__func__, "bad_alloc", KEYREG_ERROR_OUT_OF_MEMORY); \
    }                                                                                 \
    catch (std::exception & e)                                                        \
    {                                                                                 \
        return registry_exception(__func__, e.what());                                \
    }

const char *
keyreg_version_string()
{
    return KEYREG_VERSION_STRING;
}

const char *
keyreg_result_str(keyreg_result_t result)
{
    switch (result) {
    case KEYREG_SUCCESS:
        return "Success";

    case KEYREG_ERROR_GENERIC:
        return "Unknown error";
    case KEYREG_ERROR_BAD_FORMAT:
        return "Bad format";
    case KEYREG_ERROR_BAD_PARAMETERS:
        return "Bad parameters";
    case KEYREG_ERROR_NOT_IMPLEMENTED:
        return "Not implemented";
    case KEYREG_ERROR_NOT_SUPPORTED:
        return "Not supported";
    case KEYREG_ERROR_OUT_OF_MEMORY:
        return "Out of memory";
    case KEYREG_ERROR_SHORT_BUFFER:
        return "Buffer too short";
    case KEYREG_ERROR_NULL_POINTER:
        return "Null pointer";

    case KEYREG_ERROR_STORAGE:
        return "Storage error";
    case KEYREG_ERROR_STORAGE_NOT_AVAILABLE:
        return "Storage is not available";
    case KEYREG_ERROR_STORAGE_BUSY:
        return "Storage is busy";
    case KEYREG_ERROR_READ:
        return "Failed to read from the storage";
    case KEYREG_ERROR_WRITE:
        return "Failed to write to the storage";

    case KEYREG_ERROR_NOT_ENOUGH_DATA:
        return "Not enough data";
    case KEYREG_ERROR_UNKNOWN_TAG:
        return "Unknown tag";
    case KEYREG_ERROR_PACKET_NOT_CONSUMED:
        return "Packet not consumed";
    case KEYREG_ERROR_BAD_ARMOR:
        return "Bad armor";
    case KEYREG_ERROR_NO_KEY:
        return "No key";

    case KEYREG_ERROR_UNVERIFIED_IDENTITY:
        return "Unverified identity";
    case KEYREG_ERROR_KEY_ID_CONFLICT:
        return "Key id conflict";
    case KEYREG_ERROR_KEY_NOT_FOUND:
        return "Key not found";
    case KEYREG_ERROR_ACCESS_DENIED:
        return "Access denied";
    }

    return "Unsupported error code";
}

static KeyRecord
key_record(const Key &key, int64_t owner)
{
    KeyRecord rec;
    rec.owner_id = owner;
    rec.key_id = key.keyid_hex();
    if (key.is_subkey()) {
        rec.primary_key_id = keyid_to_hex(key.primary_fp().keyid());
    }
    rec.content = key.content();
    rec.created = time_from_unix(key.creation());
    rec.has_expiry = key.expires_at() != 0;
    if (rec.has_expiry) {
        rec.expires = time_from_unix((int64_t) key.expires_at());
    }
    auto caps = key.capabilities();
    rec.can_sign = caps.sign;
    rec.can_encrypt_comms = caps.encrypt_comms;
    rec.can_encrypt_storage = caps.encrypt_storage;
    rec.can_certify = caps.certify;
    return rec;
}

KeyRegistry::KeyRegistry(std::unique_ptr<KeyStore> store, AccountDirectory &accounts)
    : store_(std::move(store)), accounts_(accounts)
{
    if (!store_) {
        throw keyreg_exception(KEYREG_ERROR_NULL_POINTER, "store");
    }
}

KeyRegistry::KeyRegistry(const std::string &path, AccountDirectory &accounts, int busy_timeout)
    : store_(new KeyStore(path, busy_timeout)), accounts_(accounts)
{
}

KeyRegistry::~KeyRegistry()
{
}

keyreg_result_t
KeyRegistry::add_key(int64_t            owner,
                     const std::string &armored,
                     KeyRecord &        record,
                     std::string *      rejected)
try {
    /* decode and check everything before touching the storage */
    DecodedKey      key;
    keyreg_result_t ret = decode_key(armored, key);
    if (ret) {
        return registry_exception(__func__, "failed to decode key", ret);
    }

    std::vector<std::string> emails;
    std::string              badid;
    ret = bind_identities(key.identities, accounts_.verified_emails(owner), emails, badid);
    if (ret) {
        if (rejected) {
            *rejected = badid;
        }
        return registry_exception(__func__, badid.c_str(), ret);
    }

    KeyRecord primary = key_record(key.primary, owner);
    primary.emails = std::move(emails);
    for (auto &subkey : key.subkeys) {
        primary.subkeys.push_back(key_record(subkey, owner));
    }

    store_->insert(primary);
    record = std::move(primary);
    return KEYREG_SUCCESS;
}
KEYREG_GUARD

keyreg_result_t
KeyRegistry::get_key(int64_t id, KeyRecord &record)
try {
    record = store_->get(id);
    return KEYREG_SUCCESS;
}
KEYREG_GUARD

keyreg_result_t
KeyRegistry::list_keys(int64_t owner, std::vector<KeyRecord> &records)
try {
    records = store_->list_by_owner(owner);
    return KEYREG_SUCCESS;
}
KEYREG_GUARD

keyreg_result_t
KeyRegistry::delete_key(int64_t requestor, int64_t id)
try {
    bool admin = accounts_.is_admin(requestor);
    if (!store_->remove(requestor, admin, id)) {
        KEYREG_LOG("key %lld doesn't exist", (long long) id);
    }
    return KEYREG_SUCCESS;
}
KEYREG_GUARD

} // namespace keyreg
