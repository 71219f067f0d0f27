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
 * @addtogroup report
 */

/**
 * @file   report.h
 *
 * @ingroup report
 *
 * @brief Financial statements derived from the posted journal.
 *
 * Reports only read.  They count every line of an entry that reached the
 * ledger, so a REVERSED entry still counts and its reversal cancels it.
 * Balances are signed by each account's normal side: debit-normal for
 * assets, cost of goods and expenses, credit-normal for the rest.
 */
#pragma once

#include "account.h"
#include "config.h"

namespace folio {

struct account_balance_t
{
  ident_t           account_id;
  string            code;
  string            name;
  account_t::type_t type;
  amount_t          debit;
  amount_t          credit;
  amount_t          balance;

  account_balance_t() : account_id(0), type(account_t::ASSET) {}
};

typedef std::vector<account_balance_t> balances_list;

struct trial_balance_t
{
  date_t           as_of;
  optional<string> branch_id;
  balances_list    accounts;
  amount_t         total_debits;
  amount_t         total_credits;
  bool             balanced;

  trial_balance_t() : balanced(true) {}
};

struct profit_and_loss_t
{
  date_t           from;
  date_t           to;
  optional<string> branch_id;
  balances_list    revenue;
  balances_list    cogs;
  balances_list    expenses;
  amount_t         total_revenue;
  amount_t         total_cogs;
  amount_t         total_expenses;
  amount_t         gross_profit;
  amount_t         net_profit;
};

struct balance_sheet_t
{
  date_t           as_of;
  optional<string> branch_id;
  balances_list    assets;
  balances_list    liabilities;
  balances_list    equity;
  amount_t         total_assets;
  amount_t         total_liabilities;
  amount_t         total_equity;      // includes current earnings
  amount_t         current_earnings;
  bool             balanced;          // assets == liabilities + equity

  balance_sheet_t() : balanced(true) {}
};

struct aging_line_t
{
  ident_t          document_id;
  ident_t          party_id;
  string           party_name;
  optional<string> number;
  date_t           due_date;
  amount_t         total;
  amount_t         paid;
  amount_t         balance;
  long             days_overdue;

  aging_line_t() : document_id(0), party_id(0), days_overdue(0) {}
};

/**
 * Outstanding balances bucketed by days past due: up to 30 (including
 * documents not yet due), 31 to 60, 61 to 90, and over 90.
 */
struct aging_report_t
{
  date_t                    as_of;
  amount_t                  current;
  amount_t                  days_31_60;
  amount_t                  days_61_90;
  amount_t                  over_90;
  amount_t                  total;
  std::vector<aging_line_t> documents;
};

class report_t : public noncopyable
{
  database_t&     db;
  const config_t& config;

  balances_list balances(const string&           org_id,
                         const optional<date_t>& from,
                         const date_t&           to,
                         const optional<string>& branch_id);

  aging_report_t aging(const string& org_id, const date_t& as_of,
                       const char * documents, const char * parties,
                       const char * party_column);

public:
  report_t(database_t& _db, const config_t& _config)
    : db(_db), config(_config) {}

  trial_balance_t trial_balance(const string&           org_id,
                                const optional<date_t>& as_of     = none,
                                const optional<string>& branch_id = none);

  /** `from' defaults to the first of January of `to''s year. */
  profit_and_loss_t profit_and_loss(const string&           org_id,
                                    const optional<date_t>& from      = none,
                                    const optional<date_t>& to        = none,
                                    const optional<string>& branch_id = none);

  balance_sheet_t balance_sheet(const string&           org_id,
                                const optional<date_t>& as_of     = none,
                                const optional<string>& branch_id = none);

  aging_report_t ap_aging(const string&           org_id,
                          const optional<date_t>& as_of = none);
  aging_report_t ar_aging(const string&           org_id,
                          const optional<date_t>& as_of = none);
};

void write_csv(std::ostream& out, const trial_balance_t& report);
void write_csv(std::ostream& out, const profit_and_loss_t& report);
void write_csv(std::ostream& out, const balance_sheet_t& report);
void write_csv(std::ostream& out, const aging_report_t& report);
void write_csv(std::ostream& out, const accounts_list& accounts);

void print(std::ostream& out, const trial_balance_t& report);
void print(std::ostream& out, const profit_and_loss_t& report);
void print(std::ostream& out, const balance_sheet_t& report);
void print(std::ostream& out, const aging_report_t& report);
void print(std::ostream& out, const accounts_list& accounts);

} // namespace folio
