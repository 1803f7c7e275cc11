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

/* Command line program to manage the key registry */

#include <string.h>
#include <sys/stat.h>
#include <keyreg/keyreg.hpp>
#include "keyregcli.h"
#include "file-utils.h"
#include "str-utils.h"
#include "logging.h"
#include "types.h"
#include "config.h"

const char *usage =
  "Manage OpenPGP public keys registered by the accounts.\n"
  "Usage: keyreg --command [options] [file]\n"
  "Commands:\n"
  "  -h, --help             This help message.\n"
  "  -V, --version          Print keyreg version information.\n"
  "  -a, --add              Add key from the file or stdin.\n"
  "    --owner              Account which registers the key.\n"
  "  -g, --get ID           Print the key record.\n"
  "  -l, --list             List keys of the account.\n"
  "    --owner              Account which keys should be listed.\n"
  "  -d, --delete ID        Delete the key record together with subkeys.\n"
  "    --requestor          Account which requests deletion.\n"
  "  --verify-email EMAIL   Mark the account's email as verified.\n"
  "    --owner              Account which owns the email.\n"
  "  --admin ID             Grant the administrative privilege to the account.\n"
  "\n"
  "Other options:\n"
  "  --homedir              Override home directory (default is ~/.keyreg/).\n"
  "  --db                   Path to the database file.\n"
  "  --busy-timeout         Milliseconds to wait for the locked database.\n"
  "  --compact              Do not pretty-print JSON output.\n"
  "  --debug                Print debug messages to stderr.\n"
  "\n";

struct option options[] = {
  /* key-management commands */
  {"add", no_argument, NULL, CMD_ADD_KEY},
  {"add-key", no_argument, NULL, CMD_ADD_KEY},
  {"get", required_argument, NULL, CMD_GET_KEY},
  {"get-key", required_argument, NULL, CMD_GET_KEY},
  {"list", no_argument, NULL, CMD_LIST_KEYS},
  {"list-keys", no_argument, NULL, CMD_LIST_KEYS},
  {"delete", required_argument, NULL, CMD_DELETE_KEY},
  {"delete-key", required_argument, NULL, CMD_DELETE_KEY},
  {"verify-email", required_argument, NULL, CMD_VERIFY_EMAIL},
  {"admin", required_argument, NULL, CMD_SET_ADMIN},
  {"help", no_argument, NULL, CMD_HELP},
  {"version", no_argument, NULL, CMD_VERSION},
  /* options */
  {"homedir", required_argument, NULL, OPT_HOMEDIR},
  {"home", required_argument, NULL, OPT_HOMEDIR},
  {"db", required_argument, NULL, OPT_DB},
  {"owner", required_argument, NULL, OPT_OWNER},
  {"requestor", required_argument, NULL, OPT_REQUESTOR},
  {"busy-timeout", required_argument, NULL, OPT_BUSY_TIMEOUT},
  {"compact", no_argument, NULL, OPT_COMPACT},
  {"debug", no_argument, NULL, OPT_DEBUG},
  {NULL, 0, NULL, 0},
};

void
print_praise(void)
{
    printf("%s\n%s\n", PACKAGE_STRING, PACKAGE_BUGREPORT);
    printf("Library version: %s\n", keyreg::keyreg_version_string());
}

/* print a usage message */
void
print_usage(const char *usagemsg)
{
    print_praise();
    puts(usagemsg);
}

static bool
check_id(const char *name, const char *arg)
{
    int64_t id = 0;
    if (!arg || !keyreg::str_to_int64(arg, id)) {
        ERR_MSG("Invalid %s: %s", name, arg ? arg : "(null)");
        return false;
    }
    return true;
}

bool
setoption(keyreg_cfg &cfg, optdefs_t *cmd, int val, const char *arg)
{
    switch (val) {
    case CMD_ADD_KEY:
    case CMD_LIST_KEYS:
    case CMD_VERSION:
    case CMD_HELP:
        *cmd = (optdefs_t) val;
        return true;
    case CMD_GET_KEY:
    case CMD_DELETE_KEY:
        if (!check_id("key id", arg)) {
            return false;
        }
        cfg.set_str(CFG_KEY, arg);
        *cmd = (optdefs_t) val;
        return true;
    case CMD_VERIFY_EMAIL:
        if (!arg || !*arg) {
            ERR_MSG("No email specified");
            return false;
        }
        cfg.set_str(CFG_EMAIL, arg);
        *cmd = (optdefs_t) val;
        return true;
    case CMD_SET_ADMIN:
        if (!check_id("account id", arg)) {
            return false;
        }
        cfg.set_str(CFG_ADMIN, arg);
        *cmd = (optdefs_t) val;
        return true;
    case OPT_HOMEDIR:
        if (!arg) {
            ERR_MSG("No home directory argument provided");
            return false;
        }
        cfg.set_str(CFG_HOMEDIR, arg);
        return true;
    case OPT_DB:
        if (!arg) {
            ERR_MSG("No database path provided");
            return false;
        }
        cfg.set_str(CFG_DB, arg);
        return true;
    case OPT_OWNER:
        if (!check_id("owner", arg)) {
            return false;
        }
        cfg.set_str(CFG_OWNER, arg);
        return true;
    case OPT_REQUESTOR:
        if (!check_id("requestor", arg)) {
            return false;
        }
        cfg.set_str(CFG_REQUESTOR, arg);
        return true;
    case OPT_BUSY_TIMEOUT: {
        int64_t ms = 0;
        if (!arg || !keyreg::str_to_int64(arg, ms) || (ms < 0) || (ms > INT32_MAX)) {
            ERR_MSG("Invalid busy timeout: %s", arg ? arg : "(null)");
            return false;
        }
        cfg.set_int(CFG_BUSY_TIMEOUT, (int) ms);
        return true;
    }
    case OPT_COMPACT:
        cfg.set_bool(CFG_PRETTY, false);
        return true;
    case OPT_DEBUG:
        cfg.set_bool(CFG_DEBUG, true);
        set_keyreg_log_switch(1);
        return true;
    default:
        *cmd = CMD_HELP;
        return true;
    }
}

static bool
prepare_db_path(const keyreg_cfg &cfg, std::string &path)
{
    path = cfg.get_db_path();
    if (path.empty()) {
        ERR_MSG("Failed to determine the database path, use --homedir or --db");
        return false;
    }
    if (!cfg.get_str(CFG_DB).empty()) {
        return true;
    }
    /* create default home directory if needed */
    std::string homedir = cfg.get_str(CFG_HOMEDIR);
    if (homedir.empty()) {
        homedir = keyreg::path::HOME(DEFAULT_HOMEDIR);
    }
    if (!keyreg::path::exists(homedir, true) && keyreg_mkdir(homedir.c_str(), 0700)) {
        ERR_MSG("Failed to create home directory %s", homedir.c_str());
        return false;
    }
    return true;
}

static bool
print_record(const keyreg_cfg &cfg, const keyreg::KeyRecord &record)
{
    std::string     json;
    uint32_t        flags = cfg.get_bool(CFG_PRETTY) ? KEYREG_JSON_PRETTY : 0;
    keyreg_result_t ret = keyreg::key_record_to_json(record, json, flags);
    if (ret) {
        ERR_MSG("Failed to render key record: %s", keyreg::keyreg_result_str(ret));
        return false;
    }
    printf("%s\n", json.c_str());
    return true;
}

static bool
read_key_input(const char *f, std::string &armored)
{
    if (!f || !strcmp(f, "-")) {
        if (!keyreg::read_stream(stdin, armored)) {
            ERR_MSG("Failed to read key from stdin");
            return false;
        }
        return true;
    }
    if (!keyreg::read_file(f, armored)) {
        ERR_MSG("Failed to read key from %s", f);
        return false;
    }
    return true;
}

static bool
add_key(const keyreg_cfg &cfg, keyreg::KeyRegistry &registry, const char *f)
{
    int64_t owner = 0;
    if (!cfg.get_int64(CFG_OWNER, owner)) {
        ERR_MSG("Key owner must be specified with --owner");
        return false;
    }
    std::string armored;
    if (!read_key_input(f, armored)) {
        return false;
    }
    keyreg::KeyRecord record;
    std::string       rejected;
    keyreg_result_t   ret = registry.add_key(owner, armored, record, &rejected);
    if (ret == KEYREG_ERROR_UNVERIFIED_IDENTITY) {
        ERR_MSG("User id \"%s\" has no verified email of the account", rejected.c_str());
    }
    if (ret) {
        ERR_MSG("Failed to add key: %s", keyreg::keyreg_result_str(ret));
        return false;
    }
    return print_record(cfg, record);
}

static bool
get_key(const keyreg_cfg &cfg, keyreg::KeyRegistry &registry)
{
    int64_t id = 0;
    if (!cfg.get_int64(CFG_KEY, id)) {
        ERR_MSG("Key id must be specified");
        return false;
    }
    keyreg::KeyRecord record;
    keyreg_result_t   ret = registry.get_key(id, record);
    if (ret) {
        ERR_MSG("Failed to get key %lld: %s", (long long) id, keyreg::keyreg_result_str(ret));
        return false;
    }
    return print_record(cfg, record);
}

static bool
list_keys(const keyreg_cfg &cfg, keyreg::KeyRegistry &registry)
{
    int64_t owner = 0;
    if (!cfg.get_int64(CFG_OWNER, owner)) {
        ERR_MSG("Key owner must be specified with --owner");
        return false;
    }
    std::vector<keyreg::KeyRecord> records;
    keyreg_result_t                ret = registry.list_keys(owner, records);
    if (ret) {
        ERR_MSG("Failed to list keys: %s", keyreg::keyreg_result_str(ret));
        return false;
    }
    ERR_MSG("%zu key%s found", records.size(), (records.size() == 1) ? "" : "s");
    for (auto &record : records) {
        if (!print_record(cfg, record)) {
            return false;
        }
    }
    return true;
}

static bool
delete_key(const keyreg_cfg &cfg, keyreg::KeyRegistry &registry)
{
    int64_t id = 0;
    int64_t requestor = 0;
    if (!cfg.get_int64(CFG_KEY, id)) {
        ERR_MSG("Key id must be specified");
        return false;
    }
    if (!cfg.get_int64(CFG_REQUESTOR, requestor)) {
        ERR_MSG("Requestor must be specified with --requestor");
        return false;
    }
    keyreg_result_t ret = registry.delete_key(requestor, id);
    if (ret) {
        ERR_MSG(
          "Failed to delete key %lld: %s", (long long) id, keyreg::keyreg_result_str(ret));
        return false;
    }
    return true;
}

static bool
verify_email(const keyreg_cfg &cfg, keyreg::SqlAccountDirectory &accounts)
{
    int64_t owner = 0;
    if (!cfg.get_int64(CFG_OWNER, owner)) {
        ERR_MSG("Email owner must be specified with --owner");
        return false;
    }
    accounts.add_email(owner, cfg.get_str(CFG_EMAIL), true);
    return true;
}

static bool
set_admin(const keyreg_cfg &cfg, keyreg::SqlAccountDirectory &accounts)
{
    int64_t id = 0;
    if (!cfg.get_int64(CFG_ADMIN, id)) {
        ERR_MSG("Account id must be specified");
        return false;
    }
    accounts.set_admin(id, true);
    return true;
}

static bool
run_cmd(const keyreg_cfg &cfg, optdefs_t cmd, const std::string &path, const char *f)
{
    int                         timeout = cfg.get_int(CFG_BUSY_TIMEOUT, DEFAULT_BUSY_TIMEOUT);
    keyreg::SqlAccountDirectory accounts(path, timeout);

    switch (cmd) {
    case CMD_VERIFY_EMAIL:
        return verify_email(cfg, accounts);
    case CMD_SET_ADMIN:
        return set_admin(cfg, accounts);
    default:
        break;
    }

    keyreg::KeyRegistry registry(path, accounts, timeout);
    switch (cmd) {
    case CMD_ADD_KEY:
        return add_key(cfg, registry, f);
    case CMD_GET_KEY:
        return get_key(cfg, registry);
    case CMD_LIST_KEYS:
        return list_keys(cfg, registry);
    case CMD_DELETE_KEY:
        return delete_key(cfg, registry);
    default:
        ERR_MSG("Unexpected command: %d", cmd);
        return false;
    }
}

/* do a command once for a specified file 'f' */
bool
keyreg_cmd(const keyreg_cfg &cfg, optdefs_t cmd, const char *f)
{
    switch (cmd) {
    case CMD_VERSION:
        print_praise();
        return true;
    case CMD_NONE:
    case CMD_HELP:
        print_usage(usage);
        return cmd == CMD_HELP;
    default:
        break;
    }

    std::string path;
    if (!prepare_db_path(cfg, path)) {
        return false;
    }
    try {
        return run_cmd(cfg, cmd, path, f);
    } catch (const keyreg::keyreg_exception &e) {
        ERR_MSG("%s: %s", keyreg::keyreg_result_str(e.code()), e.what());
        return false;
    }
}
