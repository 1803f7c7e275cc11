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

#include <string.h>
#include <algorithm>
#include "stream-common.h"

void
init_mem_src(pgp_source_t *src, const void *mem, size_t len)
{
    src->data = (const uint8_t *) mem;
    src->size = mem ? len : 0;
    src->pos = 0;
}

size_t
src_left(const pgp_source_t *src)
{
    return src->size - src->pos;
}

bool
src_eof(const pgp_source_t *src)
{
    return !src_left(src);
}

bool
src_peek(pgp_source_t *src, void *buf, size_t len, size_t *read)
{
    *read = std::min(len, src_left(src));
    if (buf && *read) {
        memcpy(buf, src->data + src->pos, *read);
    }
    return *read || !len;
}

bool
src_peek_eq(pgp_source_t *src, void *buf, size_t len)
{
    if (src_left(src) < len) {
        return false;
    }
    size_t read = 0;
    return src_peek(src, buf, len, &read);
}

bool
src_read_eq(pgp_source_t *src, void *buf, size_t len)
{
    if (!src_peek_eq(src, buf, len)) {
        return false;
    }
    src->pos += len;
    return true;
}

void
src_skip(pgp_source_t *src, size_t len)
{
    src->pos += std::min(len, src_left(src));
}

bool
src_skip_eol(pgp_source_t *src)
{
    size_t left = src_left(src);
    const uint8_t *cur = src->data + src->pos;
    if (left && (cur[0] == '\n')) {
        src->pos += 1;
        return true;
    }
    if ((left > 1) && (cur[0] == '\r') && (cur[1] == '\n')) {
        src->pos += 2;
        return true;
    }
    return false;
}

bool
src_peek_line(pgp_source_t *src, std::string &line, size_t maxlen)
{
    size_t left = src_left(src);
    if (!left) {
        return false;
    }
    /* line of maxlen chars may be followed by \r\n */
    size_t      scan = (maxlen < left) ? std::min(left, maxlen + 2) : left;
    const char *start = (const char *) src->data + src->pos;
    const char *eol = (const char *) memchr(start, '\n', scan);
    size_t      len = eol ? (size_t)(eol - start) : left;
    if (len && (start[len - 1] == '\r')) {
        len--;
    }
    if (len > maxlen) {
        return false;
    }
    line.assign(start, len);
    return true;
}
