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

#include "hash_ossl.hpp"
#include <openssl/err.h>
#include "logging.h"

namespace keyreg {

static const EVP_MD *
evp_digest(pgp_hash_alg_t alg)
{
    switch (alg) {
    case PGP_HASH_MD5:
        return EVP_md5();
    case PGP_HASH_SHA1:
        return EVP_sha1();
    case PGP_HASH_SHA256:
        return EVP_sha256();
    default:
        return NULL;
    }
}

Hash_OpenSSL::Hash_OpenSSL(pgp_hash_alg_t alg) : Hash(alg), ctx_(NULL)
{
    const EVP_MD *md = evp_digest(alg);
    if (!md) {
        KEYREG_LOG("No OpenSSL digest for algorithm %d", (int) alg);
        throw keyreg_exception(KEYREG_ERROR_NOT_SUPPORTED);
    }
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw keyreg_exception(KEYREG_ERROR_OUT_OF_MEMORY);
    }
    if (EVP_DigestInit_ex(ctx_, md, NULL) != 1) {
        KEYREG_LOG("EVP_DigestInit_ex failed: %lu", ERR_peek_last_error());
        EVP_MD_CTX_free(ctx_);
        ctx_ = NULL;
        throw keyreg_exception(KEYREG_ERROR_GENERIC);
    }
}

Hash_OpenSSL::~Hash_OpenSSL()
{
    EVP_MD_CTX_free(ctx_);
}

void
Hash_OpenSSL::add(const void *buf, size_t len)
{
    if (!ctx_) {
        throw keyreg_exception(KEYREG_ERROR_NULL_POINTER);
    }
    if (EVP_DigestUpdate(ctx_, buf, len) != 1) {
        KEYREG_LOG("EVP_DigestUpdate failed: %lu", ERR_peek_last_error());
        throw keyreg_exception(KEYREG_ERROR_GENERIC);
    }
}

std::vector<uint8_t>
Hash_OpenSSL::finish()
{
    if (!ctx_) {
        throw keyreg_exception(KEYREG_ERROR_NULL_POINTER);
    }
    std::vector<uint8_t> res(EVP_MAX_MD_SIZE);
    unsigned int         len = 0;
    int                  ok = EVP_DigestFinal_ex(ctx_, res.data(), &len);
    EVP_MD_CTX_free(ctx_);
    ctx_ = NULL;
    if (ok != 1) {
        KEYREG_LOG("EVP_DigestFinal_ex failed: %lu", ERR_peek_last_error());
        throw keyreg_exception(KEYREG_ERROR_GENERIC);
    }
    res.resize(len);
    return res;
}

} // namespace keyreg
