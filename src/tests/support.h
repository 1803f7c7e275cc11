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

#ifndef SUPPORT_H_
#define SUPPORT_H_

#include <string>
#include <vector>
#include <stdint.h>
#include <stddef.h>

#include "types.h"
#include "fingerprint.hpp"
#include "librepgp/stream-key.h"

std::string          file_to_str(const std::string &path);
std::vector<uint8_t> file_to_vec(const std::string &path);

/* Create a fresh working directory under $TEMP (or /tmp). Empty string on failure. */
std::string make_temp_dir();

/* Remove the directory tree, refusing anything outside of the temp root.
 * Kept in place when KEYREG_KEEP_TEMP is set. */
void clean_temp_dir(const std::string &path);

bool bin_eq_hex(const uint8_t *data, size_t len, const char *val);
bool cmp_keyid(const pgp::KeyID &id, const std::string &val);
bool cmp_keyfp(const pgp::Fingerprint &fp, const std::string &val);

/* First transferable key of the file, armored or binary */
bool load_transferable_key(const std::string &path, pgp_transferable_key_t &key);

/* Relative path of the test key, resolved against the fixture directory */
std::string key_path(const std::string &name);

#endif /* SUPPORT_H_ */
