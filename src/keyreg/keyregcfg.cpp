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

#include <stdlib.h>
#include <strings.h>

#include "keyregcfg.h"
#include "file-utils.h"
#include "str-utils.h"
#include "logging.h"

void
keyreg_cfg::load_defaults()
{
    set_int(CFG_BUSY_TIMEOUT, DEFAULT_BUSY_TIMEOUT);
    set_bool(CFG_PRETTY, true);
    set_bool(CFG_DEBUG, false);
}

const keyreg_cfg::value_t *
keyreg_cfg::find(const std::string &key) const
{
    auto it = vals_.find(key);
    return it == vals_.end() ? NULL : &it->second;
}

void
keyreg_cfg::set_str(const std::string &key, const std::string &val)
{
    vals_[key] = {VAL_STRING, 0, val};
}

void
keyreg_cfg::set_str(const std::string &key, const char *val)
{
    set_str(key, std::string(val ? val : ""));
}

void
keyreg_cfg::set_int(const std::string &key, int val)
{
    vals_[key] = {VAL_INT, val, std::string()};
}

void
keyreg_cfg::set_bool(const std::string &key, bool val)
{
    vals_[key] = {VAL_BOOL, val ? 1 : 0, std::string()};
}

void
keyreg_cfg::unset(const std::string &key)
{
    vals_.erase(key);
}

bool
keyreg_cfg::has(const std::string &key) const
{
    return find(key) != NULL;
}

const std::string &
keyreg_cfg::get_str(const std::string &key) const
{
    const value_t *val = find(key);
    return (val && (val->type == VAL_STRING)) ? val->str : empty_str_;
}

int
keyreg_cfg::get_int(const std::string &key, int def) const
{
    const value_t *val = find(key);
    if (!val) {
        return def;
    }
    return val->type == VAL_STRING ? atoi(val->str.c_str()) : val->num;
}

bool
keyreg_cfg::get_bool(const std::string &key) const
{
    const value_t *val = find(key);
    if (!val) {
        return false;
    }
    if (val->type != VAL_STRING) {
        return val->num != 0;
    }
    return !strcasecmp(val->str.c_str(), "true") || (atoi(val->str.c_str()) > 0);
}

bool
keyreg_cfg::get_int64(const std::string &key, int64_t &val) const
{
    const value_t *cval = find(key);
    if (!cval || (cval->type == VAL_BOOL)) {
        return false;
    }
    if (cval->type == VAL_INT) {
        val = cval->num;
        return true;
    }
    if (!keyreg::str_to_int64(cval->str, val)) {
        KEYREG_LOG("%s is not a number: %s", key.c_str(), cval->str.c_str());
        return false;
    }
    return true;
}

std::string
keyreg_cfg::get_db_path() const
{
    const std::string &db = get_str(CFG_DB);
    if (!db.empty()) {
        return db;
    }
    std::string homedir = get_str(CFG_HOMEDIR);
    if (homedir.empty()) {
        homedir = keyreg::path::HOME(DEFAULT_HOMEDIR);
    }
    return homedir.empty() ? homedir : keyreg::path::append(homedir, DEFAULT_DB_NAME);
}
