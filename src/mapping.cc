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

#include "mapping.h"
#include "mask.h"

namespace folio {

const char * payment_method_name(payment_method_t method)
{
  switch (method) {
  case PAYMENT_CASH:          return "CASH";
  case PAYMENT_CARD:          return "CARD";
  case PAYMENT_MOMO:          return "MOMO";
  case PAYMENT_BANK_TRANSFER: return "BANK_TRANSFER";
  }
  assert(false);
  return "";
}

payment_method_t string_to_payment_method(const string& name)
{
  string uname = uppered(name);
  if (uname == "CASH")
    return PAYMENT_CASH;
  else if (uname == "CARD")
    return PAYMENT_CARD;
  else if (uname == "MOMO")
    return PAYMENT_MOMO;
  else if (uname == "BANK_TRANSFER")
    return PAYMENT_BANK_TRANSFER;

  throw_(validation_error, _f("Unknown payment method '%1%'") % name);
  return PAYMENT_CASH;
}

payment_method_mapping_t
payment_mapper_t::upsert_mapping(const string&          org_id,
                                 const payment_method_t method,
                                 const ident_t          account_id)
{
  transaction_t xact(db);

  optional<account_t> account = accounts.find_account(account_id);
  if (! account || account->org_id != org_id)
    throw_(not_found_error,
           _f("Account %1% not found in organization %2%")
           % account_id % org_id);
  if (account->type != account_t::ASSET || ! account->is_active)
    throw_(validation_error,
           _f("Payment method %1% must map to an active asset account, "
              "not %2%") % payment_method_name(method)
           % account->description());

  statement_t stmt(db, "INSERT INTO payment_method_mappings "
                   "(org_id, method, account_id) VALUES (?, ?, ?) "
                   "ON CONFLICT (org_id, method) DO UPDATE SET "
                   "account_id = excluded.account_id");
  stmt.bind(1, org_id).bind(2, payment_method_name(method)).bind(3, account_id);
  stmt.execute();

  statement_t query(db, "SELECT id FROM payment_method_mappings "
                    "WHERE org_id = ? AND method = ?");
  query.bind(1, org_id).bind(2, payment_method_name(method));
  if (! query.step())
    throw_(database_error,
           _f("Mapping for %1% vanished after upsert")
           % payment_method_name(method));

  payment_method_mapping_t mapping;
  mapping.id         = query.get_ident(0);
  mapping.org_id     = org_id;
  mapping.method     = method;
  mapping.account_id = account_id;

  xact.commit();

  INFO("Payment method " << payment_method_name(method) << " of " << org_id
       << " now settles through " << *account);
  return mapping;
}

mappings_list payment_mapper_t::list_mappings(const string& org_id)
{
  statement_t stmt(db, "SELECT id, org_id, method, account_id "
                   "FROM payment_method_mappings WHERE org_id = ? "
                   "ORDER BY method");
  stmt.bind(1, org_id);

  mappings_list mappings;
  while (stmt.step()) {
    payment_method_mapping_t mapping;
    mapping.id         = stmt.get_ident(0);
    mapping.org_id     = stmt.get_string(1);
    mapping.method     = string_to_payment_method(stmt.get_string(2));
    mapping.account_id = stmt.get_ident(3);
    mappings.push_back(mapping);
  }
  return mappings;
}

void payment_mapper_t::remove_mapping(const string&          org_id,
                                      const payment_method_t method)
{
  statement_t stmt(db, "DELETE FROM payment_method_mappings "
                   "WHERE org_id = ? AND method = ?");
  stmt.bind(1, org_id).bind(2, payment_method_name(method));
  stmt.execute();

  if (db.changes() == 0)
    throw_(not_found_error,
           _f("Organization %1% has no mapping for %2%")
           % org_id % payment_method_name(method));

  INFO("Removed payment method mapping " << payment_method_name(method)
       << " of " << org_id);
}

account_t payment_mapper_t::cash_account(const string&          org_id,
                                         const payment_method_t method)
{
  statement_t stmt(db, "SELECT account_id FROM payment_method_mappings "
                   "WHERE org_id = ? AND method = ?");
  stmt.bind(1, org_id).bind(2, payment_method_name(method));
  if (stmt.step()) {
    account_t account = accounts.get_account(stmt.get_ident(0));
    if (! account.is_active)
      throw_(missing_account_mapping_error,
             _f("Payment method %1% of %2% maps to inactive account %3%")
             % payment_method_name(method) % org_id % account.description());
    DEBUG("mapping.cash", payment_method_name(method) << " mapped to "
          << account);
    return account;
  }

  mask_t hint;
  switch (method) {
  case PAYMENT_CASH:
    hint = "cash";
    break;
  case PAYMENT_CARD:
  case PAYMENT_BANK_TRANSFER:
    hint = "bank";
    break;
  case PAYMENT_MOMO:
    hint = "mobile|momo";
    break;
  }

  account_filter_t filter;
  filter.type        = account_t::ASSET;
  filter.active_only = true;
  foreach (const account_t& account, accounts.list_accounts(org_id, filter)) {
    if (hint.match(account.name)) {
      DEBUG("mapping.cash", payment_method_name(method)
            << " guessed by name as " << account);
      return account;
    }
  }

  if (optional<account_t> fallback =
      accounts.find_account_by_code(org_id, config.accounts.cash)) {
    if (fallback->is_active) {
      DEBUG("mapping.cash", payment_method_name(method)
            << " falls back to " << *fallback);
      return *fallback;
    }
  }

  throw_(missing_account_mapping_error,
         _f("No cash account for payment method %1% in organization %2%: "
            "add a mapping or an active asset account with code %3%")
         % payment_method_name(method) % org_id % config.accounts.cash);
  return account_t();
}

} // namespace folio
