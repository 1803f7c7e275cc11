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

/* Entry point of the keyreg command line tool */
#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include "keyregcli.h"

/* Short aliases of the commands, see the options table for the long ones */
static const struct {
    int       ch;
    optdefs_t cmd;
} short_cmds[] = {
  {'V', CMD_VERSION},
  {'a', CMD_ADD_KEY},
  {'l', CMD_LIST_KEYS},
  {'g', CMD_GET_KEY},
  {'d', CMD_DELETE_KEY},
  {'h', CMD_HELP},
};

static int
long_value(int ch, int optindex)
{
    if (ch >= CMD_ADD_KEY) {
        return options[optindex].val;
    }
    for (auto &sc : short_cmds) {
        if (sc.ch == ch) {
            return sc.cmd;
        }
    }
    return CMD_HELP;
}

static bool
parse_args(int argc, char **argv, keyreg_cfg &cfg, optdefs_t &cmd)
{
    int optindex = 0;
    int ch = 0;

    while ((ch = getopt_long(argc, argv, "Valg:d:h", options, &optindex)) != -1) {
        if (ch == '?') {
            print_usage(usage);
            return false;
        }
        optdefs_t next = cmd;
        if (!setoption(cfg, &next, long_value(ch, optindex), optarg)) {
            if (ch >= CMD_ADD_KEY) {
                ERR_MSG("Failed to process argument --%s", options[optindex].name);
            }
            return false;
        }
        if ((cmd != CMD_NONE) && (next != cmd)) {
            ERR_MSG("Only one command may be given");
            return false;
        }
        cmd = next;
    }
    return true;
}

int
main(int argc, char **argv)
{
    if (argc < 2) {
        print_usage(usage);
        return EXIT_FAILURE;
    }

    keyreg_cfg cfg;
    cfg.load_defaults();
    optdefs_t cmd = CMD_NONE;
    if (!parse_args(argc, argv, cfg, cmd)) {
        return EXIT_FAILURE;
    }
    if (argc - optind > 1) {
        ERR_MSG("Only one input file may be specified");
        return EXIT_FAILURE;
    }
    const char *input = (optind < argc) ? argv[optind] : NULL;
    return keyreg_cmd(cfg, cmd, input) ? EXIT_SUCCESS : EXIT_FAILURE;
}
