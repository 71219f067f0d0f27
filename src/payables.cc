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

#include "payables.h"

namespace folio {

namespace {
  const book_schema_t payables_schema = {
    "bill", "vendor",
    "vendor_bills", "vendors", "vendor_id", "bill_date",
    "expense_account_id",
    "vendor_payments", "bill_id", "paid_at",
    journal_entry_t::VENDOR_BILL,
    journal_entry_t::VENDOR_BILL_VOID,
    journal_entry_t::VENDOR_PAYMENT
  };

  const char * valid_terms[] = { "NET7", "NET14", "NET30" };
}

payables_t::payables_t(database_t& _db, const config_t& _config,
                       account_registry_t& _accounts, journal_t& _journal,
                       payment_mapper_t& _mapper)
  : document_book_t(_db, _config, _accounts, _journal, _mapper,
                    payables_schema)
{
}

account_t payables_t::control_account(const string& org_id)
{
  return accounts.require_mapped(org_id, config.accounts.accounts_payable,
                                 "accounts payable");
}

account_t payables_t::counter_account(const document_t& bill)
{
  if (bill.account_id)
    return accounts.get_account(*bill.account_id);
  return accounts.require_mapped(bill.org_id, config.accounts.expense,
                                 "expense");
}

vendor_t payables_t::create_vendor(const string&           org_id,
                                   const string&           name,
                                   const optional<string>& email,
                                   const optional<string>& phone,
                                   const optional<string>& default_terms)
{
  if (trim_copy(name).empty())
    throw_(validation_error, _("A vendor needs a name"));

  optional<string> terms;
  if (default_terms) {
    string uterms = uppered(*default_terms);
    foreach (const char * known, valid_terms)
      if (uterms == known)
        terms = uterms;
    if (! terms)
      throw_(validation_error,
             _f("Unknown payment terms '%1%' (NET7, NET14 or NET30)")
             % *default_terms);
  }

  statement_t stmt(db, "INSERT INTO vendors (org_id, name, email, phone, "
                   "default_terms) VALUES (?, ?, ?, ?, ?)");
  stmt.bind(1, org_id)
      .bind(2, name)
      .bind(3, email)
      .bind(4, phone)
      .bind(5, terms);
  stmt.execute();

  vendor_t vendor;
  vendor.id            = db.last_insert_id();
  vendor.org_id        = org_id;
  vendor.name          = name;
  vendor.email         = email;
  vendor.phone         = phone;
  vendor.default_terms = terms;

  INFO("Created vendor " << vendor.id << " (" << name << ") in " << org_id);
  return vendor;
}

namespace {
  vendor_t read_vendor(statement_t& stmt)
  {
    vendor_t vendor;
    vendor.id            = stmt.get_ident(0);
    vendor.org_id        = stmt.get_string(1);
    vendor.name          = stmt.get_string(2);
    vendor.email         = stmt.get_optional_string(3);
    vendor.phone         = stmt.get_optional_string(4);
    vendor.default_terms = stmt.get_optional_string(5);
    return vendor;
  }
}

vendor_t payables_t::get_vendor(const ident_t id)
{
  statement_t stmt(db, "SELECT id, org_id, name, email, phone, default_terms "
                   "FROM vendors WHERE id = ?");
  stmt.bind(1, id);
  if (! stmt.step())
    throw_(not_found_error, _f("No vendor %1%") % id);
  return read_vendor(stmt);
}

vendors_list payables_t::list_vendors(const string& org_id)
{
  statement_t stmt(db, "SELECT id, org_id, name, email, phone, default_terms "
                   "FROM vendors WHERE org_id = ? ORDER BY name, id");
  stmt.bind(1, org_id);

  vendors_list vendors;
  while (stmt.step())
    vendors.push_back(read_vendor(stmt));
  return vendors;
}

} // namespace folio
