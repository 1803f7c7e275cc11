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

#ifndef KEYREG_IDENTITY_BINDER_HPP_
#define KEYREG_IDENTITY_BINDER_HPP_

#include <string>
#include <vector>
#include "userid.hpp"

namespace keyreg {

/**
 * @brief Bind key userids to the verified emails of the account. Either all userids are
 *        bound, or none.
 *
 * @param identities userids of the key, with the extracted emails.
 * @param verified verified emails of the account which submits the key.
 * @param emails on success bound emails are stored here, each one only once, in the order
 *        of the userids.
 * @param rejected on failure the userid which wasn't bound is stored here. Empty if key has
 *        no userids at all.
 * @return KEYREG_SUCCESS or KEYREG_ERROR_UNVERIFIED_IDENTITY.
 */
keyreg_result_t bind_identities(const std::vector<UserID> &     identities,
                                const std::vector<std::string> &verified,
                                std::vector<std::string> &      emails,
                                std::string &                   rejected);

} // namespace keyreg

#endif
