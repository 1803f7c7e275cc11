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
#include <sys/stat.h>
#include <memory>
#include "file-utils.h"

int
keyreg_mkdir(const char *path, mode_t mode)
{
    return mkdir(path, mode);
}

namespace keyreg {

bool
read_stream(FILE *fp, std::string &data)
{
    char   chunk[4096];
    size_t got = 0;

    data.clear();
    do {
        got = fread(chunk, 1, sizeof(chunk), fp);
        data.append(chunk, got);
    } while (got == sizeof(chunk));
    return ferror(fp) == 0;
}

bool
read_file(const std::string &path, std::string &data)
{
    std::unique_ptr<FILE, int (*)(FILE *)> fp(fopen(path.c_str(), "rb"), fclose);
    return fp && read_stream(fp.get(), data);
}

namespace path {

bool
exists(const std::string &path, bool is_dir)
{
    struct stat st = {};
    if (stat(path.c_str(), &st)) {
        return false;
    }
    return is_dir ? S_ISDIR(st.st_mode) : S_ISREG(st.st_mode);
}

std::string
HOME(const std::string &sdir)
{
    const char *home = getenv("HOME");
    if (!home) {
        return std::string();
    }
    return append(home, sdir);
}

std::string
append(const std::string &path, const std::string &name)
{
    if (path.empty() || name.empty()) {
        return path + name;
    }
    if ((path.back() == '/') || (name.front() == '/')) {
        return path + name;
    }
    return path + "/" + name;
}

} // namespace path
} // namespace keyreg
