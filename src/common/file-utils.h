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

#ifndef KEYREG_FILE_UTILS_H_
#define KEYREG_FILE_UTILS_H_

#include <stdio.h>
#include <sys/types.h>
#include <string>

int keyreg_mkdir(const char *path, mode_t mode);

namespace keyreg {
/**
 * @brief Slurp everything left in the stream. Stream is not closed.
 * @return false on read error, data is then incomplete.
 */
bool read_stream(FILE *fp, std::string &data);
/* Same for the named file, opened in binary mode */
bool read_file(const std::string &path, std::string &data);

namespace path {
/* Check that path names an existing regular file, or a directory if is_dir is set */
bool        exists(const std::string &path, bool is_dir = false);
/* $HOME joined with sdir, empty when HOME is unset */
std::string HOME(const std::string &sdir = "");
std::string append(const std::string &path, const std::string &name);
} // namespace path
} // namespace keyreg

#endif
