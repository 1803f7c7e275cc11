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

#ifndef KEYREG_USERID_HPP_
#define KEYREG_USERID_HPP_

#include <string>
#include "librepgp/stream-packet.h"

namespace keyreg {

/**
 * @brief Extract email from the userid of form "Display Name <user@example.com>".
 *
 * @param uid userid string.
 * @param email on success the address without angle brackets is stored here.
 * @return true if userid has the expected form, false otherwise.
 */
bool uid_extract_email(const std::string &uid, std::string &email);

/* userid, as it was loaded from the key, together with the email claim */
class UserID {
  public:
    pgp_userid_pkt_t pkt;   /* User ID packet as it was loaded */
    std::string      str;   /* Human-readable representation of the userid */
    std::string      email; /* Email claimed by the userid, empty if there is no one */

    UserID() = default;
    UserID(const pgp_userid_pkt_t &pkt);

    bool
    has_email() const noexcept
    {
        return !email.empty();
    }

    /* No userid, i.e. direct-key signature */
    static const uint32_t None = (uint32_t) -1;
    /* look only for primary userids */
    static const uint32_t Primary = (uint32_t) -2;
    /* look for any uid, except UserID::None) */
    static const uint32_t Any = (uint32_t) -3;
};

} // namespace keyreg

#endif
