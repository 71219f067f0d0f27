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
 * @file   document.h
 *
 * @ingroup data
 *
 * @brief Bills, invoices, their parties and the payments against them.
 *
 * A vendor bill and a customer invoice have the same shape and the same
 * lifecycle, so both are a document_t.  The status of an opened document
 * is never set directly: it is derived from paid_amount against total
 * after every change.
 */
#pragma once

#include "mapping.h"

namespace folio {

class party_t
{
public:
  ident_t          id;
  string           org_id;
  string           name;
  optional<string> email;
  optional<string> phone;

  party_t() : id(0) {}
};

class vendor_t : public party_t
{
public:
  optional<string> default_terms;   // NET7, NET14 or NET30
};

class customer_t : public party_t
{
public:
  optional<amount_t> credit_limit;
};

typedef std::vector<vendor_t>   vendors_list;
typedef std::vector<customer_t> customers_list;

/** How much of a total has been used up, within the tolerance. */
enum coverage_t {
  COVERED_NONE,
  COVERED_PARTLY,
  COVERED_FULLY
};

coverage_t coverage_of(const amount_t& used, const amount_t& total,
                       const amount_t& tolerance);

class document_t
{
public:
  enum status_t {
    DRAFT,
    OPEN,
    PARTIALLY_PAID,
    PAID,
    VOID
  };

  ident_t              id;
  string               org_id;
  ident_t              party_id;
  optional<string>     number;
  date_t               date;
  date_t               due_date;
  amount_t             subtotal;
  optional<amount_t>   tax;
  amount_t             total;
  amount_t             paid_amount;
  status_t             status;
  optional<string>     memo;
  optional<ident_t>    account_id;   // expense or revenue override
  optional<ident_t>    journal_entry_id;
  optional<string>     opened_by_id;
  optional<datetime_t> opened_at;

  document_t() : id(0), party_id(0), status(DRAFT) {}

  amount_t outstanding() const {
    return total - paid_amount;
  }

  bool is_payable() const {
    return status == OPEN || status == PARTIALLY_PAID;
  }
};

typedef document_t vendor_bill_t;
typedef document_t customer_invoice_t;

typedef std::vector<document_t> documents_list;

const char *         document_status_name(document_t::status_t status);
document_t::status_t string_to_document_status(const string& name);

/** The status an opened document takes for a given paid amount. */
document_t::status_t derive_document_status(const amount_t& paid,
                                             const amount_t& total,
                                             const amount_t& tolerance);

/** Fields of a document being created; the rest start out empty. */
struct document_draft_t
{
  string             org_id;
  ident_t            party_id;
  optional<string>   number;
  date_t             date;
  date_t             due_date;
  amount_t           subtotal;
  optional<amount_t> tax;
  amount_t           total;
  optional<string>   memo;
  optional<ident_t>  account_id;

  document_draft_t() : party_id(0) {}
};

struct outstanding_t
{
  amount_t             total;
  amount_t             paid;
  amount_t             outstanding;
  document_t::status_t status;
};

class payment_t
{
public:
  ident_t           id;
  string            org_id;
  ident_t           party_id;
  optional<ident_t> document_id;
  amount_t          amount;
  date_t            date;
  payment_method_t  method;
  optional<string>  ref;
  optional<string>  memo;
  optional<ident_t> journal_entry_id;

  payment_t() : id(0), party_id(0), method(PAYMENT_CASH) {}
};

typedef std::vector<payment_t> payments_list;

struct payment_request_t
{
  string            org_id;
  ident_t           party_id;
  optional<ident_t> document_id;
  amount_t          amount;
  date_t            date;
  payment_method_t  method;
  optional<string>  ref;
  optional<string>  memo;

  payment_request_t() : party_id(0), method(PAYMENT_CASH) {}
};

} // namespace folio
