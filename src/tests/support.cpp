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

#include "keyreg_tests.h"
#include "support.h"
#include "utils.h"
#include "librepgp/stream-armor.h"

#include <fstream>
#include <iterator>
#include <memory>
#include <errno.h>
#include <ftw.h>
#include <limits.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

std::string
file_to_str(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<uint8_t>
file_to_vec(const std::string &path)
{
    std::string data = file_to_str(path);
    return std::vector<uint8_t>(data.begin(), data.end());
}

static std::string
temp_root()
{
    const char *env = getenv("TEMP");
    char        real[PATH_MAX] = {0};
    if (!realpath(env ? env : "/tmp", real)) {
        return env ? env : "/tmp";
    }
    return real;
}

std::string
make_temp_dir()
{
    std::string       tmpl = temp_root() + "/keyreg-gtest-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        fprintf(stderr, "mkdtemp(%s) failed: %s\n", tmpl.c_str(), strerror(errno));
        return std::string();
    }
    return buf.data();
}

static int
unlink_entry(const char *fpath, const struct stat *, int, struct FTW *)
{
    if (remove(fpath)) {
        perror(fpath);
        return -1;
    }
    return 0;
}

void
clean_temp_dir(const std::string &path)
{
    if (path.empty() || getenv("KEYREG_KEEP_TEMP")) {
        return;
    }
    std::string root = temp_root() + "/";
    /* never purge anything outside of the temp root */
    assert_int_equal(path.compare(0, root.size(), root), 0);
    nftw(path.c_str(), unlink_entry, 16, FTW_DEPTH | FTW_PHYS);
}

bool
bin_eq_hex(const uint8_t *data, size_t len, const char *val)
{
    std::vector<uint8_t> expected;
    if (!keyreg::hex_to_bin(val, expected)) {
        return false;
    }
    return std::vector<uint8_t>(data, data + len) == expected;
}

bool
cmp_keyid(const pgp::KeyID &id, const std::string &val)
{
    return bin_eq_hex(id.data(), id.size(), val.c_str());
}

bool
cmp_keyfp(const pgp::Fingerprint &fp, const std::string &val)
{
    return bin_eq_hex(fp.data(), fp.size(), val.c_str());
}

bool
load_transferable_key(const std::string &path, pgp_transferable_key_t &key)
{
    std::vector<uint8_t> raw = file_to_vec(path);
    if (raw.empty()) {
        return false;
    }
    pgp_source_t src = {};
    init_mem_src(&src, raw.data(), raw.size());
    if (is_armored_source(&src)) {
        std::vector<uint8_t> bin;
        if (dearmor_source(&src, bin)) {
            return false;
        }
        raw.swap(bin);
    }
    pgp_source_t keysrc = {};
    init_mem_src(&keysrc, raw.data(), raw.size());
    return process_pgp_key(keysrc, key) == KEYREG_SUCCESS;
}

std::string
key_path(const std::string &name)
{
    return "data/keys/" + name;
}
