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

#include "json-utils.h"

bool
json_add(json_object *obj, const char *name, json_object *val)
{
    if (!val) {
        return false;
    }
    /* json-c before 0.13 reports nothing, so check that the field landed */
    json_object_object_add(obj, name, val);
    json_object *added = NULL;
    if (json_object_object_get_ex(obj, name, &added) && (added == val)) {
        return true;
    }
    json_object_put(val);
    return false;
}

bool
json_add(json_object *obj, const char *name, const std::string &value)
{
    return json_add(obj, name, json_object_new_string_len(value.c_str(), (int) value.size()));
}

bool
json_add(json_object *obj, const char *name, bool value)
{
    return json_add(obj, name, json_object_new_boolean(value));
}

bool
json_add(json_object *obj, const char *name, int64_t value)
{
    return json_add(obj, name, json_object_new_int64(value));
}

bool
json_array_add(json_object *arr, json_object *val)
{
    if (val && !json_object_array_add(arr, val)) {
        return true;
    }
    json_object_put(val);
    return false;
}
