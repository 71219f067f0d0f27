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
 * @file   receivables.h
 *
 * @ingroup data
 *
 * @brief Accounts receivable: customers, invoices and receipts.
 */
#pragma once

#include "book.h"

namespace folio {

class receivables_t : public document_book_t
{
protected:
  virtual account_t control_account(const string& org_id);
  virtual account_t counter_account(const document_t& invoice);
  virtual bool control_is_debit() const {
    return true;
  }

public:
  receivables_t(database_t& _db, const config_t& _config,
                account_registry_t& _accounts, journal_t& _journal,
                payment_mapper_t& _mapper);

  customer_t create_customer(const string&             org_id,
                             const string&             name,
                             const optional<string>&   email        = none,
                             const optional<string>&   phone        = none,
                             const optional<amount_t>& credit_limit = none);
  customer_t     get_customer(const ident_t id);
  customers_list list_customers(const string& org_id);

  customer_invoice_t create_invoice(const document_draft_t& draft) {
    return create_document(draft);
  }
  customer_invoice_t open_invoice(const ident_t id, const string& user_id) {
    return open_document(id, user_id);
  }
  customer_invoice_t void_invoice(const ident_t id, const string& user_id,
                                  const optional<date_t>& when = none) {
    return void_document(id, user_id, when);
  }
  customer_invoice_t get_invoice(const ident_t id) {
    return get_document(id);
  }
  documents_list list_invoices(const string& org_id,
                               const optional<document_t::status_t>& status =
                               none) {
    return list_documents(org_id, status);
  }
  outstanding_t invoice_outstanding(const ident_t id) {
    return outstanding(id);
  }

  payment_t create_receipt(const payment_request_t& request,
                           const string&            user_id) {
    return create_payment(request, user_id);
  }
  payments_list receipts_for_invoice(const ident_t id) {
    return payments_for(id);
  }
};

} // namespace folio
