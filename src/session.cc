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

#include <system.hh>

#include "session.h"

namespace folio {

session_t::session_t(const config_t& _config)
  : config(_config),
    db(config.database_path, config.busy_timeout_ms),
    authority(config.reopen_users),
    accounts(db),
    periods(db, config, authority),
    journal(db, config, accounts, periods),
    mapper(db, config, accounts),
    payables(db, config, accounts, journal, mapper),
    receivables(db, config, accounts, journal, mapper),
    vendor_credits(db, config, accounts, journal, mapper, payables),
    customer_credits(db, config, accounts, journal, mapper, receivables),
    adapter(config, accounts, journal),
    reconciler(db, accounts),
    reports(db, config)
{
  db.create_schema();
  INFO("Opened ledger database " << config.database_path);
}

std::size_t session_t::seed_chart(const string& org_id)
{
  struct seed_t {
    const string *    code;
    const char *      name;
    account_t::type_t type;
  } seeds[] = {
    { &config.accounts.cash,                "Cash",                account_t::ASSET },
    { &config.accounts.accounts_receivable, "Accounts Receivable", account_t::ASSET },
    { &config.accounts.inventory,           "Inventory",           account_t::ASSET },
    { &config.accounts.accounts_payable,    "Accounts Payable",    account_t::LIABILITY },
    { &config.accounts.tax_payable,         "Tax Payable",         account_t::LIABILITY },
    { &config.accounts.equity,              "Owner's Equity",      account_t::EQUITY },
    { &config.accounts.sales,               "Sales",               account_t::REVENUE },
    { &config.accounts.cogs,                "Cost of Goods Sold",  account_t::COGS },
    { &config.accounts.expense,             "Operating Expenses",  account_t::EXPENSE }
  };

  std::size_t created = 0;

  transaction_t xact(db);
  foreach (const seed_t& seed, seeds) {
    if (! accounts.find_account_by_code(org_id, *seed.code)) {
      accounts.create_account(org_id, *seed.code, seed.name, seed.type);
      ++created;
    }
  }
  xact.commit();

  DEBUG("session.seed", "Seeded " << created << " accounts for " << org_id);
  return created;
}

} // namespace folio
