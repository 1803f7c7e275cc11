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

#ifndef STREAM_COMMON_H_
#define STREAM_COMMON_H_

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <keyreg/keyreg_err.h>

/*
 * Input is always a complete buffer in memory: armored text or the decoded packets. The
 * source is a cursor over it, so reads never block and any prefix of the remaining data
 * may be peeked.
 */
typedef struct pgp_source_t {
    const uint8_t *data; /* not owned, must outlive the source */
    size_t         size;
    size_t         pos;
} pgp_source_t;

void init_mem_src(pgp_source_t *src, const void *mem, size_t len);

/** @brief copy up to len bytes to buf, which may be NULL, without moving the position
 *  @param read number of available bytes, up to len, is stored here
 *  @return false only if there is no data left at all
 */
bool src_peek(pgp_source_t *src, void *buf, size_t len, size_t *read);

/* Exactly len bytes or nothing. The _eq read does not move on failure */
bool src_peek_eq(pgp_source_t *src, void *buf, size_t len);
bool src_read_eq(pgp_source_t *src, void *buf, size_t len);

/* Move forward by len bytes, or to the end of data if less is left */
void   src_skip(pgp_source_t *src, size_t len);
bool   src_eof(const pgp_source_t *src);
size_t src_left(const pgp_source_t *src);

/* Skip \n or \r\n at the current position, false if there is none */
bool src_skip_eol(pgp_source_t *src);

/**
 * @brief Get the line at the current position without consuming it.
 *        Line terminator (\n or \r\n) is stripped, the last line may be unterminated.
 * @return false on eof or when the line is longer than maxlen.
 */
bool src_peek_line(pgp_source_t *src, std::string &line, size_t maxlen);

#endif
