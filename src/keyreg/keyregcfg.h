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

#ifndef KEYREG_CFG_H_
#define KEYREG_CFG_H_

#include <stdint.h>
#include <string>
#include <unordered_map>

/* Settings of the keyreg tool, filled from defaults and the command line */
#define CFG_HOMEDIR "homedir"           /* directory with the default database */
#define CFG_DB "db"                     /* database file, takes precedence over homedir */
#define CFG_OWNER "owner"               /* account registering or listing keys */
#define CFG_REQUESTOR "requestor"       /* account asking for deletion */
#define CFG_KEY "key"                   /* record id for get and delete */
#define CFG_EMAIL "email"               /* email to mark as verified */
#define CFG_ADMIN "admin"               /* account to make an administrator */
#define CFG_BUSY_TIMEOUT "busy-timeout" /* ms to wait on the locked database */
#define CFG_PRETTY "pretty"
#define CFG_DEBUG "debug"

#define DEFAULT_HOMEDIR ".keyreg"
#define DEFAULT_DB_NAME "keyreg.db"
#define DEFAULT_BUSY_TIMEOUT 5000

class keyreg_cfg {
  public:
    typedef enum { VAL_INT, VAL_BOOL, VAL_STRING } val_type_t;

    typedef struct value_t {
        val_type_t  type;
        int         num;
        std::string str;
    } value_t;

  private:
    std::unordered_map<std::string, value_t> vals_;
    std::string                              empty_str_;

    const value_t *find(const std::string &key) const;

  public:
    void load_defaults();

    void set_str(const std::string &key, const std::string &val);
    void set_str(const std::string &key, const char *val);
    void set_int(const std::string &key, int val);
    void set_bool(const std::string &key, bool val);
    void unset(const std::string &key);
    bool has(const std::string &key) const;

    /* Empty string for absent or non-string values */
    const std::string &get_str(const std::string &key) const;
    /* Strings are converted with atoi(), def is returned for absent keys */
    int get_int(const std::string &key, int def = 0) const;
    /* "true" in any case or a positive number for strings, false if absent */
    bool get_bool(const std::string &key) const;
    /**
     * @brief Get account or record id. These come as strings from the command line and
     *        may not fit into int.
     *
     * @return true if value exists and is a valid decimal number.
     */
    bool get_int64(const std::string &key, int64_t &val) const;
    /**
     * @brief Resolve the database file: CFG_DB, otherwise DEFAULT_DB_NAME inside of
     *        CFG_HOMEDIR or $HOME/DEFAULT_HOMEDIR.
     *
     * @return path or empty string when neither is available.
     */
    std::string get_db_path() const;
};

#endif
