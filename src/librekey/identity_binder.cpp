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

#include <algorithm>
#include "identity_binder.hpp"
#include "logging.h"

namespace keyreg {

keyreg_result_t
bind_identities(const std::vector<UserID> &     identities,
                const std::vector<std::string> &verified,
                std::vector<std::string> &      emails,
                std::string &                   rejected)
{
    emails.clear();
    rejected.clear();

    if (identities.empty()) {
        KEYREG_LOG("key doesn't have any userids");
        return KEYREG_ERROR_UNVERIFIED_IDENTITY;
    }

    std::vector<std::string> bound;
    for (auto &uid : identities) {
        if (!uid.has_email()) {
            KEYREG_LOG("no email in userid '%s'", uid.str.c_str());
            rejected = uid.str;
            return KEYREG_ERROR_UNVERIFIED_IDENTITY;
        }
        /* exact, case-sensitive match */
        auto it = std::find(verified.begin(), verified.end(), uid.email);
        if (it == verified.end()) {
            KEYREG_LOG("email %s is not verified", uid.email.c_str());
            rejected = uid.str;
            return KEYREG_ERROR_UNVERIFIED_IDENTITY;
        }
        if (std::find(bound.begin(), bound.end(), *it) == bound.end()) {
            bound.push_back(*it);
        }
    }
    emails = std::move(bound);
    return KEYREG_SUCCESS;
}

} // namespace keyreg
