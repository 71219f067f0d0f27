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

#include "reconcile.h"

namespace folio {

namespace {
  const char * txn_columns =
    "SELECT id, bank_account_id, posted_at, amount, description, reference, "
    "reconciled, imported_at FROM bank_txns";

  bank_txn_t read_txn(statement_t& stmt)
  {
    bank_txn_t txn;
    txn.id              = stmt.get_ident(0);
    txn.bank_account_id = stmt.get_ident(1);
    txn.posted_at       = stmt.get_date(2);
    txn.amount          = stmt.get_amount(3);
    txn.description     = stmt.get_string(4);
    txn.reference       = stmt.get_optional_string(5);
    txn.reconciled      = stmt.get_bool(6);
    txn.imported_at     = stmt.get_datetime(7);
    return txn;
  }

  bank_account_t read_bank_account(statement_t& stmt)
  {
    bank_account_t account;
    account.id            = stmt.get_ident(0);
    account.org_id        = stmt.get_string(1);
    account.name          = stmt.get_string(2);
    account.number        = stmt.get_optional_string(3);
    account.gl_account_id = stmt.get_optional_ident(4);
    return account;
  }

  reconcile_match_t read_match(statement_t& stmt)
  {
    reconcile_match_t match;
    match.id            = stmt.get_ident(0);
    match.bank_txn_id   = stmt.get_ident(1);
    match.source        = string_to_match_source(stmt.get_string(2));
    match.source_id     = stmt.get_string(3);
    match.matched_by_id = stmt.get_optional_string(4);
    match.matched_at    = stmt.get_datetime(5);
    match.automatic     = stmt.get_bool(6);
    return match;
  }

  // Is the settlement already matched to any row of its organization?
  const char * settlement_matched =
    "EXISTS (SELECT 1 FROM reconcile_matches m "
    "JOIN bank_txns t ON t.id = m.bank_txn_id "
    "JOIN bank_accounts b ON b.id = t.bank_account_id "
    "WHERE m.source = s.kind AND m.source_id = s.id AND b.org_id = s.org_id)";
}

const int reconciler_t::match_window_days;

const char * match_source_name(reconcile_match_t::source_t source)
{
  switch (source) {
  case reconcile_match_t::PAYMENT:        return "PAYMENT";
  case reconcile_match_t::REFUND:         return "REFUND";
  case reconcile_match_t::CASH_SAFE_DROP: return "CASH_SAFE_DROP";
  case reconcile_match_t::CASH_PICKUP:    return "CASH_PICKUP";
  }
  assert(false);
  return "";
}

reconcile_match_t::source_t string_to_match_source(const string& name)
{
  string uname = uppered(name);
  if (uname == "PAYMENT")
    return reconcile_match_t::PAYMENT;
  else if (uname == "REFUND")
    return reconcile_match_t::REFUND;
  else if (uname == "CASH_SAFE_DROP")
    return reconcile_match_t::CASH_SAFE_DROP;
  else if (uname == "CASH_PICKUP")
    return reconcile_match_t::CASH_PICKUP;

  throw_(validation_error, _f("Unknown reconciliation source '%1%'") % name);
  return reconcile_match_t::PAYMENT;
}

bank_account_t
reconciler_t::upsert_bank_account(const string&            org_id,
                                  const string&            name,
                                  const optional<string>&  number,
                                  const optional<ident_t>& gl_account_id)
{
  if (trim_copy(name).empty())
    throw_(validation_error, _("A bank account needs a name"));

  transaction_t xact(db);

  if (gl_account_id) {
    optional<account_t> gl = accounts.find_account(*gl_account_id);
    if (! gl || gl->org_id != org_id)
      throw_(not_found_error,
             _f("Account %1% not found in organization %2%")
             % *gl_account_id % org_id);
    if (gl->type != account_t::ASSET)
      throw_(validation_error,
             _f("Bank account \"%1%\" must post to an asset account, not %2%")
             % name % gl->description());
  }

  statement_t stmt(db, "INSERT INTO bank_accounts (org_id, name, number, "
                   "gl_account_id) VALUES (?, ?, ?, ?) "
                   "ON CONFLICT (org_id, name) DO UPDATE SET "
                   "number = excluded.number, "
                   "gl_account_id = excluded.gl_account_id");
  stmt.bind(1, org_id).bind(2, name).bind(3, number).bind(4, gl_account_id);
  stmt.execute();

  optional<bank_account_t> account = find_bank_account(org_id, name);
  if (! account)
    throw_(database_error,
           _f("Bank account \"%1%\" vanished after upsert") % name);

  xact.commit();

  INFO("Saved bank account " << account->id << " (" << name << ") of "
       << org_id);
  return *account;
}

bank_account_t reconciler_t::get_bank_account(const ident_t id)
{
  statement_t stmt(db, "SELECT id, org_id, name, number, gl_account_id "
                   "FROM bank_accounts WHERE id = ?");
  stmt.bind(1, id);
  if (! stmt.step())
    throw_(not_found_error, _f("No bank account %1%") % id);
  return read_bank_account(stmt);
}

optional<bank_account_t>
reconciler_t::find_bank_account(const string& org_id, const string& name)
{
  statement_t stmt(db, "SELECT id, org_id, name, number, gl_account_id "
                   "FROM bank_accounts WHERE org_id = ? AND name = ?");
  stmt.bind(1, org_id).bind(2, name);
  if (stmt.step())
    return read_bank_account(stmt);
  return none;
}

bank_accounts_list reconciler_t::list_bank_accounts(const string& org_id)
{
  statement_t stmt(db, "SELECT id, org_id, name, number, gl_account_id "
                   "FROM bank_accounts WHERE org_id = ? ORDER BY name");
  stmt.bind(1, org_id);

  bank_accounts_list result;
  while (stmt.step())
    result.push_back(read_bank_account(stmt));
  return result;
}

void reconciler_t::record_settlement(const settlement_t& settlement)
{
  if (settlement.id.empty())
    throw_(validation_error, _("A settlement needs an id"));
  if (settlement.amount.is_zero())
    throw_(validation_error,
           _f("Settlement %1% has no amount") % settlement.id);
  if (! is_valid(settlement.occurred_on))
    throw_(validation_error,
           _f("Settlement %1% needs a date") % settlement.id);

  statement_t stmt(db, "INSERT INTO settlements (id, org_id, kind, amount, "
                   "status, occurred_on) VALUES (?, ?, ?, ?, ?, ?) "
                   "ON CONFLICT (org_id, kind, id) DO UPDATE SET "
                   "amount = excluded.amount, status = excluded.status, "
                   "occurred_on = excluded.occurred_on");
  stmt.bind(1, settlement.id)
      .bind(2, settlement.org_id)
      .bind(3, match_source_name(settlement.kind))
      .bind(4, settlement.amount)
      .bind(5, uppered(settlement.status))
      .bind(6, settlement.occurred_on);
  stmt.execute();

  DEBUG("reconcile.settlement", "Recorded "
        << match_source_name(settlement.kind) << ' ' << settlement.id
        << " of " << settlement.amount << " on "
        << format_date(settlement.occurred_on));
}

import_result_t reconciler_t::import_csv(const ident_t bank_account_id,
                                         const string& text)
{
  bank_account_t   account = get_bank_account(bank_account_id);
  statement_rows_t rows    = parse_statement(text);

  import_result_t result;
  result.bank_account_id = bank_account_id;

  transaction_t xact(db);

  datetime_t  now = CURRENT_TIME();
  statement_t stmt(db, "INSERT INTO bank_txns (bank_account_id, posted_at, "
                   "amount, description, reference, reconciled, imported_at) "
                   "VALUES (?, ?, ?, ?, ?, 0, ?)");
  foreach (const statement_row_t& row, rows) {
    stmt.reset();
    stmt.bind(1, bank_account_id)
        .bind(2, row.date)
        .bind(3, row.amount)
        .bind(4, row.description)
        .bind(5, row.reference)
        .bind(6, now);
    stmt.execute();
    result.txn_ids.push_back(db.last_insert_id());
  }

  xact.commit();

  INFO("Imported " << result.txn_ids.size() << " statement rows into bank "
       << "account " << account.name);
  return result;
}

reconcile_match_t
reconciler_t::insert_match(const bank_txn_t&                 txn,
                           const reconcile_match_t::source_t source,
                           const string&                     source_id,
                           const optional<string>&           user_id,
                           const bool                        automatic)
{
  statement_t flip(db, "UPDATE bank_txns SET reconciled = 1 "
                   "WHERE id = ? AND reconciled = 0");
  flip.bind(1, txn.id);
  flip.execute();
  if (db.changes() != 1)
    throw_(invalid_state_error,
           _f("Bank transaction %1% is already reconciled") % txn.id);

  reconcile_match_t match;
  match.bank_txn_id   = txn.id;
  match.source        = source;
  match.source_id     = source_id;
  match.matched_by_id = user_id;
  match.matched_at    = CURRENT_TIME();
  match.automatic     = automatic;

  statement_t stmt(db, "INSERT INTO reconcile_matches (bank_txn_id, source, "
                   "source_id, matched_by_id, matched_at, automatic) "
                   "VALUES (?, ?, ?, ?, ?, ?)");
  stmt.bind(1, txn.id)
      .bind(2, match_source_name(source))
      .bind(3, source_id)
      .bind(4, user_id)
      .bind(5, match.matched_at)
      .bind(6, automatic);
  stmt.execute();

  match.id = db.last_insert_id();
  return match;
}

reconcile_match_t
reconciler_t::match_transaction(const ident_t                     bank_txn_id,
                                const reconcile_match_t::source_t source,
                                const string&                     source_id,
                                const string&                     user_id)
{
  transaction_t xact(db);

  bank_txn_t txn = get_transaction(bank_txn_id);
  if (txn.reconciled)
    throw_(invalid_state_error,
           _f("Bank transaction %1% is already reconciled") % bank_txn_id);

  bank_account_t account = get_bank_account(txn.bank_account_id);

  statement_t query(db, string("SELECT ") + settlement_matched +
                    " FROM settlements s "
                    "WHERE s.org_id = ? AND s.kind = ? AND s.id = ?");
  query.bind(1, account.org_id)
       .bind(2, match_source_name(source))
       .bind(3, source_id);
  if (! query.step())
    throw_(not_found_error,
           _f("No %1% %2% in organization %3%")
           % match_source_name(source) % source_id % account.org_id);
  if (query.get_bool(0))
    throw_(invalid_state_error,
           _f("%1% %2% is already matched to another bank transaction")
           % match_source_name(source) % source_id);

  reconcile_match_t match =
    insert_match(txn, source, source_id, user_id, false);

  xact.commit();

  INFO("Matched bank transaction " << bank_txn_id << " to "
       << match_source_name(source) << ' ' << source_id << " by " << user_id);
  return match;
}

matches_list reconciler_t::auto_match(const ident_t           bank_account_id,
                                      const optional<date_t>& from,
                                      const optional<date_t>& to)
{
  bank_account_t account = get_bank_account(bank_account_id);

  transaction_t xact(db);

  matches_list matches;

  foreach (const bank_txn_t& txn,
           select_txns(bank_account_id, from, to, true)) {
    optional<std::pair<reconcile_match_t::source_t, string> > candidate;
    {
      statement_t stmt(db, string("SELECT s.kind, s.id, s.amount "
                                  "FROM settlements s "
                                  "WHERE s.org_id = ? "
                                  "AND s.kind IN ('PAYMENT', 'REFUND') "
                                  "AND s.status = '" SETTLEMENT_COMPLETED "' "
                                  "AND s.occurred_on >= ? "
                                  "AND s.occurred_on <= ? AND NOT ") +
                       settlement_matched + " ORDER BY s.occurred_on, s.id");
      stmt.bind(1, account.org_id)
          .bind(2, txn.posted_at - gregorian::days(match_window_days))
          .bind(3, txn.posted_at + gregorian::days(match_window_days));

      while (stmt.step()) {
        if (stmt.get_amount(2).abs() == txn.amount.abs()) {
          candidate = std::make_pair(string_to_match_source(stmt.get_string(0)),
                                     stmt.get_string(1));
          break;
        }
      }
    }

    if (candidate) {
      matches.push_back(insert_match(txn, candidate->first, candidate->second,
                                     none, true));
      DEBUG("reconcile.auto", "Bank transaction " << txn.id << " ("
            << txn.amount << ") matched to "
            << match_source_name(candidate->first) << ' '
            << candidate->second);
    }
  }

  xact.commit();

  INFO("Auto-matched " << matches.size() << " transactions of bank account "
       << account.name);
  return matches;
}

bank_txns_list reconciler_t::select_txns(const ident_t           bank_account_id,
                                         const optional<date_t>& from,
                                         const optional<date_t>& to,
                                         const bool              unreconciled_only)
{
  get_bank_account(bank_account_id);

  string sql(txn_columns);
  sql += " WHERE bank_account_id = ?";
  if (unreconciled_only)
    sql += " AND reconciled = 0";
  if (from)
    sql += " AND posted_at >= ?";
  if (to)
    sql += " AND posted_at <= ?";
  sql += " ORDER BY posted_at, id";

  statement_t stmt(db, sql);
  int n = 1;
  stmt.bind(n++, bank_account_id);
  if (from)
    stmt.bind(n++, *from);
  if (to)
    stmt.bind(n++, *to);

  bank_txns_list txns;
  while (stmt.step())
    txns.push_back(read_txn(stmt));
  return txns;
}

bank_txn_t reconciler_t::get_transaction(const ident_t id)
{
  statement_t stmt(db, string(txn_columns) + " WHERE id = ?");
  stmt.bind(1, id);
  if (! stmt.step())
    throw_(not_found_error, _f("No bank transaction %1%") % id);
  return read_txn(stmt);
}

optional<reconcile_match_t> reconciler_t::match_for(const ident_t bank_txn_id)
{
  statement_t stmt(db, "SELECT id, bank_txn_id, source, source_id, "
                   "matched_by_id, matched_at, automatic "
                   "FROM reconcile_matches WHERE bank_txn_id = ?");
  stmt.bind(1, bank_txn_id);
  if (stmt.step())
    return read_match(stmt);
  return none;
}

} // namespace folio
