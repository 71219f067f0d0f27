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

#include "account.h"

namespace folio {

namespace {
  const char * account_columns =
    "SELECT id, org_id, code, name, type, parent_id, is_active FROM accounts";

  account_t read_account(statement_t& stmt)
  {
    account_t account;
    account.id        = stmt.get_ident(0);
    account.org_id    = stmt.get_string(1);
    account.code      = stmt.get_string(2);
    account.name      = stmt.get_string(3);
    account.type      = string_to_account_type(stmt.get_string(4));
    account.parent_id = stmt.get_optional_ident(5);
    account.is_active = stmt.get_bool(6);
    return account;
  }
}

const char * account_type_name(account_t::type_t type)
{
  switch (type) {
  case account_t::ASSET:     return "ASSET";
  case account_t::LIABILITY: return "LIABILITY";
  case account_t::EQUITY:    return "EQUITY";
  case account_t::REVENUE:   return "REVENUE";
  case account_t::COGS:      return "COGS";
  case account_t::EXPENSE:   return "EXPENSE";
  }
  assert(false);
  return "";
}

account_t::type_t string_to_account_type(const string& name)
{
  string uname = uppered(name);
  if (uname == "ASSET")
    return account_t::ASSET;
  else if (uname == "LIABILITY")
    return account_t::LIABILITY;
  else if (uname == "EQUITY")
    return account_t::EQUITY;
  else if (uname == "REVENUE")
    return account_t::REVENUE;
  else if (uname == "COGS")
    return account_t::COGS;
  else if (uname == "EXPENSE")
    return account_t::EXPENSE;

  throw_(validation_error, _f("Unknown account type '%1%'") % name);
  return account_t::ASSET;
}

account_t account_registry_t::create_account(const string&            org_id,
                                             const string&            code,
                                             const string&            name,
                                             const account_t::type_t  type,
                                             const optional<ident_t>& parent_id)
{
  if (org_id.empty())
    throw_(validation_error, _("An account needs an organization"));
  if (trim_copy(code).empty())
    throw_(validation_error, _("An account needs a code"));
  if (trim_copy(name).empty())
    throw_(validation_error,
           _f("Account %1% needs a name") % code);

  transaction_t xact(db);

  if (find_account_by_code(org_id, code))
    throw_(validation_error,
           _f("Account code %1% already exists in organization %2%")
           % code % org_id);

  if (parent_id) {
    optional<account_t> parent = find_account(*parent_id);
    if (! parent || parent->org_id != org_id)
      throw_(not_found_error,
             _f("Parent account %1% not found in organization %2%")
             % *parent_id % org_id);
  }

  statement_t stmt(db, "INSERT INTO accounts (org_id, code, name, type, "
                   "parent_id, is_active) VALUES (?, ?, ?, ?, ?, 1)");
  stmt.bind(1, org_id)
      .bind(2, code)
      .bind(3, name)
      .bind(4, account_type_name(type))
      .bind(5, parent_id);
  stmt.execute();

  account_t account;
  account.id        = db.last_insert_id();
  account.org_id    = org_id;
  account.code      = code;
  account.name      = name;
  account.type      = type;
  account.parent_id = parent_id;
  account.is_active = true;

  xact.commit();

  INFO("Created account " << account << " in " << org_id);
  return account;
}

optional<account_t> account_registry_t::find_account(const ident_t id)
{
  statement_t stmt(db, string(account_columns) + " WHERE id = ?");
  stmt.bind(1, id);
  if (stmt.step())
    return read_account(stmt);
  return none;
}

optional<account_t>
account_registry_t::find_account_by_code(const string& org_id,
                                         const string& code)
{
  statement_t stmt(db, string(account_columns) +
                   " WHERE org_id = ? AND code = ?");
  stmt.bind(1, org_id).bind(2, code);
  if (stmt.step())
    return read_account(stmt);
  return none;
}

account_t account_registry_t::get_account(const ident_t id)
{
  if (optional<account_t> account = find_account(id))
    return *account;
  throw_(not_found_error, _f("Account %1% not found") % id);
  return account_t();
}

account_t account_registry_t::require_mapped(const string& org_id,
                                             const string& code,
                                             const string& role)
{
  optional<account_t> account = find_account_by_code(org_id, code);
  if (! account)
    throw_(missing_account_mapping_error,
           _f("No %1% account: code %2% is not in the chart of "
              "organization %3%") % role % code % org_id);
  if (! account->is_active)
    throw_(missing_account_mapping_error,
           _f("The %1% account %2% of organization %3% is inactive")
           % role % account->description() % org_id);
  return *account;
}

accounts_list
account_registry_t::list_accounts(const string&           org_id,
                                  const account_filter_t& filter)
{
  string sql(account_columns);
  sql += " WHERE org_id = ?";
  if (filter.type)
    sql += " AND type = ?";
  if (filter.active_only)
    sql += " AND is_active = 1";
  sql += " ORDER BY code";

  statement_t stmt(db, sql);
  stmt.bind(1, org_id);
  if (filter.type)
    stmt.bind(2, account_type_name(*filter.type));

  accounts_list accounts;
  while (stmt.step())
    accounts.push_back(read_account(stmt));
  return accounts;
}

void account_registry_t::rename_account(const ident_t           id,
                                        const optional<string>& code,
                                        const optional<string>& name)
{
  transaction_t xact(db);

  account_t account = get_account(id);

  if (code && *code != account.code) {
    if (trim_copy(*code).empty())
      throw_(validation_error, _("An account needs a code"));
    if (find_account_by_code(account.org_id, *code))
      throw_(validation_error,
             _f("Account code %1% already exists in organization %2%")
             % *code % account.org_id);
  }
  if (name && trim_copy(*name).empty())
    throw_(validation_error,
           _f("Account %1% needs a name") % account.code);

  statement_t stmt(db, "UPDATE accounts SET code = ?, name = ? WHERE id = ?");
  stmt.bind(1, code ? *code : account.code)
      .bind(2, name ? *name : account.name)
      .bind(3, id);
  stmt.execute();

  xact.commit();

  INFO("Relabeled account " << account << " as "
       << (code ? *code : account.code) << " "
       << (name ? *name : account.name));
}

void account_registry_t::set_account_active(const ident_t id,
                                            const bool    active)
{
  transaction_t xact(db);

  account_t account = get_account(id);

  statement_t stmt(db, "UPDATE accounts SET is_active = ? WHERE id = ?");
  stmt.bind(1, active).bind(2, id);
  stmt.execute();

  xact.commit();

  INFO((active ? "Activated" : "Deactivated") << " account " << account);
}

void account_registry_t::change_account_type(const ident_t           id,
                                             const account_t::type_t type)
{
  transaction_t xact(db);

  account_t account = get_account(id);
  if (account.type == type)
    return;

  if (has_posted_lines(id))
    throw_(invalid_state_error,
           _f("Account %1% has posted lines; its type can no longer "
              "change from %2% to %3%")
           % account.description() % account_type_name(account.type)
           % account_type_name(type));

  statement_t stmt(db, "UPDATE accounts SET type = ? WHERE id = ?");
  stmt.bind(1, account_type_name(type)).bind(2, id);
  stmt.execute();

  xact.commit();

  INFO("Account " << account << " is now " << account_type_name(type));
}

bool account_registry_t::has_posted_lines(const ident_t id)
{
  statement_t stmt(db, "SELECT 1 FROM journal_lines l "
                   "JOIN journal_entries e ON e.id = l.entry_id "
                   "WHERE l.account_id = ? AND e.status <> 'DRAFT' LIMIT 1");
  stmt.bind(1, id);
  return stmt.step();
}

std::ostream& operator<<(std::ostream& out, const account_t& account)
{
  out << account.code << " (" << account.name << ")";
  return out;
}

} // namespace folio
