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

#ifndef KEYREGCLI_H_
#define KEYREGCLI_H_

#include <stdbool.h>
#include <stdio.h>
#include <getopt.h>
#include "keyregcfg.h"

typedef enum {
    CMD_NONE = 0,
    /* commands */
    CMD_ADD_KEY = 260,
    CMD_GET_KEY,
    CMD_LIST_KEYS,
    CMD_DELETE_KEY,
    CMD_VERIFY_EMAIL,
    CMD_SET_ADMIN,
    CMD_VERSION,
    CMD_HELP,

    /* options */
    OPT_HOMEDIR,
    OPT_DB,
    OPT_OWNER,
    OPT_REQUESTOR,
    OPT_BUSY_TIMEOUT,
    OPT_COMPACT,

    /* debug */
    OPT_DEBUG
} optdefs_t;

#define ERR_MSG(...)                           \
    do {                                       \
        (void) fprintf((stderr), __VA_ARGS__); \
        (void) fprintf((stderr), "\n");        \
    } while (0)

extern struct option options[];
extern const char *  usage;

/**
 * @brief Process the command line option, storing its value in cfg.
 *
 * @param cfg configuration.
 * @param cmd if option is a command then it is stored here.
 * @param val option value from the options table.
 * @param arg option argument, may be NULL.
 * @return true on success or false if argument is invalid.
 */
bool setoption(keyreg_cfg &cfg, optdefs_t *cmd, int val, const char *arg);
void print_praise(void);
void print_usage(const char *usagemsg);

/**
 * @brief Execute the command over the registry database.
 *
 * @param cfg configuration with settings from command line.
 * @param cmd command to execute.
 * @param f file name for the --add command, NULL or "-" means stdin.
 * @return true on success or false otherwise.
 */
bool keyreg_cmd(const keyreg_cfg &cfg, optdefs_t cmd, const char *f);

#endif
