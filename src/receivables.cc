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

#include "receivables.h"

namespace folio {

namespace {
  const book_schema_t receivables_schema = {
    "invoice", "customer",
    "customer_invoices", "customers", "customer_id", "invoice_date",
    "revenue_account_id",
    "customer_receipts", "invoice_id", "received_at",
    journal_entry_t::CUSTOMER_INVOICE,
    journal_entry_t::CUSTOMER_INVOICE_VOID,
    journal_entry_t::CUSTOMER_RECEIPT
  };

  customer_t read_customer(statement_t& stmt)
  {
    customer_t customer;
    customer.id           = stmt.get_ident(0);
    customer.org_id       = stmt.get_string(1);
    customer.name         = stmt.get_string(2);
    customer.email        = stmt.get_optional_string(3);
    customer.phone        = stmt.get_optional_string(4);
    customer.credit_limit = stmt.get_optional_amount(5);
    return customer;
  }
}

receivables_t::receivables_t(database_t& _db, const config_t& _config,
                             account_registry_t& _accounts,
                             journal_t& _journal, payment_mapper_t& _mapper)
  : document_book_t(_db, _config, _accounts, _journal, _mapper,
                    receivables_schema)
{
}

account_t receivables_t::control_account(const string& org_id)
{
  return accounts.require_mapped(org_id, config.accounts.accounts_receivable,
                                 "accounts receivable");
}

account_t receivables_t::counter_account(const document_t& invoice)
{
  if (invoice.account_id)
    return accounts.get_account(*invoice.account_id);
  return accounts.require_mapped(invoice.org_id, config.accounts.sales,
                                 "sales");
}

customer_t receivables_t::create_customer(const string&             org_id,
                                          const string&             name,
                                          const optional<string>&   email,
                                          const optional<string>&   phone,
                                          const optional<amount_t>& credit_limit)
{
  if (trim_copy(name).empty())
    throw_(validation_error, _("A customer needs a name"));
  if (credit_limit && credit_limit->sign() < 0)
    throw_(validation_error,
           _f("Credit limit cannot be negative (%1%)") % *credit_limit);

  statement_t stmt(db, "INSERT INTO customers (org_id, name, email, phone, "
                   "credit_limit) VALUES (?, ?, ?, ?, ?)");
  stmt.bind(1, org_id)
      .bind(2, name)
      .bind(3, email)
      .bind(4, phone)
      .bind(5, credit_limit);
  stmt.execute();

  customer_t customer;
  customer.id           = db.last_insert_id();
  customer.org_id       = org_id;
  customer.name         = name;
  customer.email        = email;
  customer.phone        = phone;
  customer.credit_limit = credit_limit;

  INFO("Created customer " << customer.id << " (" << name << ") in "
       << org_id);
  return customer;
}

customer_t receivables_t::get_customer(const ident_t id)
{
  statement_t stmt(db, "SELECT id, org_id, name, email, phone, credit_limit "
                   "FROM customers WHERE id = ?");
  stmt.bind(1, id);
  if (! stmt.step())
    throw_(not_found_error, _f("No customer %1%") % id);
  return read_customer(stmt);
}

customers_list receivables_t::list_customers(const string& org_id)
{
  statement_t stmt(db, "SELECT id, org_id, name, email, phone, credit_limit "
                   "FROM customers WHERE org_id = ? ORDER BY name, id");
  stmt.bind(1, org_id);

  customers_list customers;
  while (stmt.step())
    customers.push_back(read_customer(stmt));
  return customers;
}

} // namespace folio
