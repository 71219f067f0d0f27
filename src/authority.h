/*
 * Copyright (c) 2003-2018, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @addtogroup data
 */

/**
 * @file   authority.h
 *
 * @ingroup data
 *
 * @brief Capability checks for privileged ledger operations.
 *
 * Who may do what is decided outside the ledger.  The ledger only asks,
 * through authority_t, before performing an operation that undermines one
 * of its own guarantees (reopening a locked period).
 */
#pragma once

#include "utils.h"

namespace folio {

#define CAPABILITY_PERIOD_REOPEN "period.reopen"

class authority_t
{
public:
  virtual ~authority_t() {}

  virtual bool permits(const string& user_id,
                       const string& capability) const = 0;
};

/**
 * Grants the reopen capability to a fixed list of users, as read from
 * the [security] section of the configuration.
 */
class user_list_authority_t : public authority_t
{
  std::set<string> reopen_users;

public:
  explicit user_list_authority_t(const std::set<string>& _reopen_users)
    : reopen_users(_reopen_users) {}

  virtual bool permits(const string& user_id,
                       const string& capability) const {
    if (capability == CAPABILITY_PERIOD_REOPEN)
      return reopen_users.count(user_id) > 0;
    return false;
  }
};

} // namespace folio
