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
 * @file   reconcile.h
 *
 * @ingroup data
 *
 * @brief Bank reconciliation.
 *
 * Statement rows are imported into a bank account unreconciled.  Each
 * row may then be matched, once, to a settlement recorded by the
 * operational side: a completed payment, a refund, or a cash safe drop
 * or pickup.  Matching is final.
 */
#pragma once

#include "account.h"
#include "csv.h"

namespace folio {

class bank_account_t
{
public:
  ident_t           id;
  string            org_id;
  string            name;
  optional<string>  number;
  optional<ident_t> gl_account_id;

  bank_account_t() : id(0) {}
};

typedef std::vector<bank_account_t> bank_accounts_list;

class bank_txn_t
{
public:
  ident_t          id;
  ident_t          bank_account_id;
  date_t           posted_at;
  amount_t         amount;
  string           description;
  optional<string> reference;
  bool             reconciled;
  datetime_t       imported_at;

  bank_txn_t() : id(0), bank_account_id(0), reconciled(false) {}
};

typedef std::vector<bank_txn_t> bank_txns_list;

class reconcile_match_t
{
public:
  enum source_t {
    PAYMENT,
    REFUND,
    CASH_SAFE_DROP,
    CASH_PICKUP
  };

  ident_t          id;
  ident_t          bank_txn_id;
  source_t         source;
  string           source_id;
  optional<string> matched_by_id;
  datetime_t       matched_at;
  bool             automatic;

  reconcile_match_t() : id(0), bank_txn_id(0), source(PAYMENT),
                        automatic(false) {}
};

typedef std::vector<reconcile_match_t> matches_list;

const char *                match_source_name(reconcile_match_t::source_t source);
reconcile_match_t::source_t string_to_match_source(const string& name);

#define SETTLEMENT_COMPLETED "COMPLETED"

/** A payment, refund or cash movement as the operational side saw it. */
struct settlement_t
{
  string                      id;
  string                      org_id;
  reconcile_match_t::source_t kind;
  amount_t                    amount;
  string                      status;
  date_t                      occurred_on;

  settlement_t() : kind(reconcile_match_t::PAYMENT),
                   status(SETTLEMENT_COMPLETED) {}
};

struct import_result_t
{
  ident_t              bank_account_id;
  std::vector<ident_t> txn_ids;

  import_result_t() : bank_account_id(0) {}
};

class reconciler_t : public noncopyable
{
  database_t&         db;
  account_registry_t& accounts;

  bank_txns_list select_txns(const ident_t           bank_account_id,
                             const optional<date_t>& from,
                             const optional<date_t>& to,
                             const bool              unreconciled_only);

  reconcile_match_t insert_match(const bank_txn_t&                 txn,
                                 const reconcile_match_t::source_t source,
                                 const string&                     source_id,
                                 const optional<string>&           user_id,
                                 const bool                        automatic);

public:
  /** Days either side of a statement date that auto-matching searches. */
  static const int match_window_days = 3;

  reconciler_t(database_t& _db, account_registry_t& _accounts)
    : db(_db), accounts(_accounts) {}

  bank_account_t upsert_bank_account(const string&            org_id,
                                     const string&            name,
                                     const optional<string>&  number = none,
                                     const optional<ident_t>& gl_account_id =
                                     none);
  bank_account_t     get_bank_account(const ident_t id);
  optional<bank_account_t> find_bank_account(const string& org_id,
                                             const string& name);
  bank_accounts_list list_bank_accounts(const string& org_id);

  void record_settlement(const settlement_t& settlement);

  import_result_t import_csv(const ident_t bank_account_id,
                             const string& text);

  reconcile_match_t match_transaction(const ident_t bank_txn_id,
                                      const reconcile_match_t::source_t source,
                                      const string&  source_id,
                                      const string&  user_id);

  /**
   * Match every unreconciled row of the account, dated within [from, to]
   * when given, to the first completed payment or refund of the same
   * absolute amount within match_window_days that nothing else matches.
   */
  matches_list auto_match(const ident_t           bank_account_id,
                          const optional<date_t>& from = none,
                          const optional<date_t>& to   = none);

  bank_txn_t                  get_transaction(const ident_t id);
  optional<reconcile_match_t> match_for(const ident_t bank_txn_id);

  bank_txns_list get_unreconciled(const ident_t           bank_account_id,
                                  const optional<date_t>& from = none,
                                  const optional<date_t>& to   = none) {
    return select_txns(bank_account_id, from, to, true);
  }
  bank_txns_list list_transactions(const ident_t bank_account_id) {
    return select_txns(bank_account_id, none, none, false);
  }
};

} // namespace folio
