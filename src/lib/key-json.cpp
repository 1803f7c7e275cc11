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
#include "json-utils.h"
#include "time-utils.h"
#include "logging.h"

namespace keyreg {

static json_object *
key_record_json(const KeyRecord &record)
{
    JSONObject jso(json_object_new_object());
    json_object *obj = jso.get();
    if (!obj) {
        return NULL;
    }
    if (!json_add(obj, "id", record.id) ||
        !json_add(obj, "primary_key_id", record.primary_key_id) ||
        !json_add(obj, "key_id", record.key_id) ||
        !json_add(obj, "public_key", record.content)) {
        return NULL;
    }

    json_object *jsoemails = json_object_new_array();
    if (!json_add(obj, "emails", jsoemails)) {
        return NULL;
    }
    for (auto &email : record.emails) {
        json_object *jsoemail = json_object_new_object();
        if (!json_array_add(jsoemails, jsoemail)) {
            return NULL;
        }
        /* only verified emails are bound to the key */
        if (!json_add(jsoemail, "email", email) || !json_add(jsoemail, "verified", true)) {
            return NULL;
        }
    }

    json_object *jsosubs = json_object_new_array();
    if (!json_add(obj, "subkeys", jsosubs)) {
        return NULL;
    }
    for (auto &sub : record.subkeys) {
        if (!json_array_add(jsosubs, key_record_json(sub))) {
            return NULL;
        }
    }

    if (!json_add(obj, "can_sign", record.can_sign) ||
        !json_add(obj, "can_encrypt_comms", record.can_encrypt_comms) ||
        !json_add(obj, "can_encrypt_storage", record.can_encrypt_storage) ||
        !json_add(obj, "can_certify", record.can_certify)) {
        return NULL;
    }
    if (!json_add(obj, "created_at", time_rfc3339(time_to_unix(record.created)))) {
        return NULL;
    }
    if (record.has_expiry &&
        !json_add(obj, "expires_at", time_rfc3339(time_to_unix(record.expires)))) {
        return NULL;
    }
    return jso.release();
}

keyreg_result_t
key_record_to_json(const KeyRecord &record, std::string &json, uint32_t flags)
{
    if (flags & ~KEYREG_JSON_PRETTY) {
        KEYREG_LOG("unknown flags remaining: 0x%X", flags & ~KEYREG_JSON_PRETTY);
        return KEYREG_ERROR_BAD_PARAMETERS;
    }
    JSONObject jso(key_record_json(record));
    if (!jso.get()) {
        return KEYREG_ERROR_OUT_OF_MEMORY;
    }
    int         jflags = (flags & KEYREG_JSON_PRETTY) ? JSON_C_TO_STRING_PRETTY : 0;
    const char *str = json_object_to_json_string_ext(jso.get(), jflags);
    if (!str) {
        return KEYREG_ERROR_OUT_OF_MEMORY;
    }
    json = str;
    return KEYREG_SUCCESS;
}

} // namespace keyreg
