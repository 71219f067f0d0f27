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
 * @file   payables.h
 *
 * @ingroup data
 *
 * @brief Accounts payable: vendors, their bills and the payments to them.
 *
 * Opening a bill debits its expense account and credits accounts
 * payable; paying it debits accounts payable and credits the cash
 * account of the payment method.
 */
#pragma once

#include "book.h"

namespace folio {

class payables_t : public document_book_t
{
protected:
  virtual account_t control_account(const string& org_id);
  virtual account_t counter_account(const document_t& bill);
  virtual bool control_is_debit() const {
    return false;
  }

public:
  payables_t(database_t& _db, const config_t& _config,
             account_registry_t& _accounts, journal_t& _journal,
             payment_mapper_t& _mapper);

  vendor_t create_vendor(const string&           org_id,
                         const string&           name,
                         const optional<string>& email         = none,
                         const optional<string>& phone         = none,
                         const optional<string>& default_terms = none);
  vendor_t     get_vendor(const ident_t id);
  vendors_list list_vendors(const string& org_id);

  vendor_bill_t create_bill(const document_draft_t& draft) {
    return create_document(draft);
  }
  vendor_bill_t open_bill(const ident_t id, const string& user_id) {
    return open_document(id, user_id);
  }
  vendor_bill_t void_bill(const ident_t id, const string& user_id,
                          const optional<date_t>& when = none) {
    return void_document(id, user_id, when);
  }
  vendor_bill_t get_bill(const ident_t id) {
    return get_document(id);
  }
  documents_list list_bills(const string& org_id,
                            const optional<document_t::status_t>& status =
                            none) {
    return list_documents(org_id, status);
  }
  outstanding_t bill_outstanding(const ident_t id) {
    return outstanding(id);
  }
  payments_list payments_for_bill(const ident_t id) {
    return payments_for(id);
  }
};

} // namespace folio
