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
 * @file   account.h
 *
 * @ingroup data
 *
 * @brief The chart of accounts.
 */
#pragma once

#include "database.h"

namespace folio {

class account_t
{
public:
  enum type_t {
    ASSET,
    LIABILITY,
    EQUITY,
    REVENUE,
    COGS,
    EXPENSE
  };

  ident_t           id;
  string            org_id;
  string            code;
  string            name;
  type_t            type;
  optional<ident_t> parent_id;
  bool              is_active;

  account_t() : id(0), type(ASSET), is_active(true) {}

  /**
   * Assets, cost of goods and expenses grow with debits; liabilities,
   * equity and revenue grow with credits.
   */
  bool is_debit_normal() const {
    return type == ASSET || type == COGS || type == EXPENSE;
  }

  string description() const {
    return code + " " + name;
  }
};

const char *     account_type_name(account_t::type_t type);
account_t::type_t string_to_account_type(const string& name);

typedef std::vector<account_t> accounts_list;

struct account_filter_t
{
  optional<account_t::type_t> type;
  bool                        active_only;

  account_filter_t() : active_only(false) {}
};

class account_registry_t : public noncopyable
{
  database_t& db;

public:
  explicit account_registry_t(database_t& _db) : db(_db) {}

  account_t create_account(const string&            org_id,
                           const string&            code,
                           const string&            name,
                           const account_t::type_t  type,
                           const optional<ident_t>& parent_id = none);

  optional<account_t> find_account(const ident_t id);
  optional<account_t> find_account_by_code(const string& org_id,
                                           const string& code);

  /** Like find_account, but a missing row raises not_found_error. */
  account_t get_account(const ident_t id);

  /**
   * Look up an account of the posting map.  Absence, or an inactive
   * account, raises missing_account_mapping_error naming the code.
   */
  account_t require_mapped(const string& org_id, const string& code,
                           const string& role);

  accounts_list list_accounts(const string&           org_id,
                              const account_filter_t& filter =
                              account_filter_t());

  void rename_account(const ident_t           id,
                      const optional<string>& code,
                      const optional<string>& name);
  void set_account_active(const ident_t id, const bool active);
  void change_account_type(const ident_t id, const account_t::type_t type);

  /** True once any non-draft journal line references the account. */
  bool has_posted_lines(const ident_t id);
};

std::ostream& operator<<(std::ostream& out, const account_t& account);

} // namespace folio
