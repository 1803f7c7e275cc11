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

#ifndef KEYREG_JSON_UTILS_H_
#define KEYREG_JSON_UTILS_H_

#include <stdint.h>
#include <string>
#include "json_object.h"
#include "json.h"

/*
 * Helpers below take ownership of val: it is attached to obj on success and released
 * otherwise, so a NULL coming from a failed json_object_new_*() call may be passed
 * directly.
 */
bool json_add(json_object *obj, const char *name, json_object *val);
bool json_add(json_object *obj, const char *name, const std::string &value);
bool json_add(json_object *obj, const char *name, bool value);
bool json_add(json_object *obj, const char *name, int64_t value);
bool json_array_add(json_object *arr, json_object *val);

namespace keyreg {
/* Owning reference to the json-c object */
class JSONObject {
    json_object *obj_;

  public:
    JSONObject(json_object *obj) : obj_(obj)
    {
    }
    JSONObject(const JSONObject &) = delete;
    JSONObject &operator=(const JSONObject &) = delete;
    ~JSONObject()
    {
        json_object_put(obj_);
    }

    json_object *
    get() const noexcept
    {
        return obj_;
    }

    json_object *
    release() noexcept
    {
        json_object *obj = obj_;
        obj_ = NULL;
        return obj;
    }
};
} // namespace keyreg

#endif
