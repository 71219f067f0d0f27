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
 * @file   credit.h
 *
 * @ingroup data
 *
 * @brief Vendor and customer credit notes.
 *
 * Opening a credit note posts its whole amount against the control
 * account at once.  After that the credit is either allocated to bills
 * or invoices, which only moves their paid amounts and posts nothing,
 * or refunded in cash, which posts a cash entry.  What has been used,
 * allocated plus refunded, never exceeds the note's amount.
 */
#pragma once

#include "book.h"

namespace folio {

class credit_allocation_t
{
public:
  ident_t          id;
  ident_t          credit_note_id;
  ident_t          document_id;
  amount_t         amount;
  datetime_t       applied_at;
  optional<string> applied_by_id;

  credit_allocation_t() : id(0), credit_note_id(0), document_id(0) {}
};

class credit_refund_t
{
public:
  ident_t           id;
  ident_t           credit_note_id;
  amount_t          amount;
  date_t            date;
  payment_method_t  method;
  optional<string>  ref;
  optional<string>  memo;
  optional<ident_t> journal_entry_id;

  credit_refund_t() : id(0), credit_note_id(0), method(PAYMENT_CASH) {}
};

typedef std::vector<credit_allocation_t> allocations_list;
typedef std::vector<credit_refund_t>     refunds_list;

class credit_note_t
{
public:
  enum status_t {
    DRAFT,
    OPEN,
    PARTIALLY_APPLIED,
    APPLIED,
    VOID
  };

  ident_t              id;
  string               org_id;
  ident_t              party_id;
  optional<string>     number;
  date_t               date;
  amount_t             amount;
  amount_t             allocated_amount;
  amount_t             refunded_amount;
  status_t             status;
  optional<string>     reason;
  optional<string>     memo;
  optional<ident_t>    journal_entry_id;
  optional<string>     opened_by_id;
  optional<datetime_t> opened_at;

  allocations_list     allocations;
  refunds_list         refunds;

  credit_note_t() : id(0), party_id(0), status(DRAFT) {}

  amount_t used() const {
    return allocated_amount + refunded_amount;
  }
  amount_t remaining() const {
    return amount - used();
  }
  bool is_usable() const {
    return status == OPEN || status == PARTIALLY_APPLIED;
  }
};

typedef std::vector<credit_note_t> credit_notes_list;

const char *            credit_status_name(credit_note_t::status_t status);
credit_note_t::status_t string_to_credit_status(const string& name);
credit_note_t::status_t derive_credit_status(const amount_t& used,
                                             const amount_t& amount,
                                             const amount_t& tolerance);

struct credit_draft_t
{
  string           org_id;
  ident_t          party_id;
  optional<string> number;
  date_t           date;
  amount_t         amount;
  optional<string> reason;
  optional<string> memo;

  credit_draft_t() : party_id(0) {}
};

struct allocation_request_t
{
  ident_t  document_id;
  amount_t amount;

  allocation_request_t(const ident_t _document_id, const amount_t& _amount)
    : document_id(_document_id), amount(_amount) {}
};

typedef std::vector<allocation_request_t> allocation_requests_t;

struct refund_request_t
{
  amount_t         amount;
  date_t           date;
  payment_method_t method;
  optional<string> ref;
  optional<string> memo;

  refund_request_t() : method(PAYMENT_CASH) {}
};

struct credit_schema_t
{
  const char * noun;
  const char * party_noun;
  const char * notes;
  const char * allocations;
  const char * refunds;
  const char * parties;

  journal_entry_t::source_t open_source;
  journal_entry_t::source_t void_source;
  journal_entry_t::source_t refund_source;
};

class credit_book_t : public noncopyable
{
protected:
  database_t&            db;
  const config_t&        config;
  account_registry_t&    accounts;
  journal_t&             journal;
  payment_mapper_t&      mapper;
  document_book_t&       documents;
  const credit_schema_t& schema;

  credit_book_t(database_t& _db, const config_t& _config,
                account_registry_t& _accounts, journal_t& _journal,
                payment_mapper_t& _mapper, document_book_t& _documents,
                const credit_schema_t& _schema)
    : db(_db), config(_config), accounts(_accounts), journal(_journal),
      mapper(_mapper), documents(_documents), schema(_schema) {}

  virtual account_t control_account(const string& org_id) = 0;
  virtual account_t counter_account(const string& org_id) = 0;

  /**
   * Vendor credit debits accounts payable when opened and credits it when
   * refunded; customer credit does the opposite.
   */
  virtual bool control_debited_on_open() const = 0;

  credit_note_t read_note(statement_t& stmt) const;
  void          read_children(credit_note_t& note);
  void          store_usage(const credit_note_t& note,
                            const amount_t&      allocated,
                            const amount_t&      refunded);

public:
  virtual ~credit_book_t() {}

  credit_note_t create(const credit_draft_t& draft);
  credit_note_t open(const ident_t id, const string& user_id);

  /**
   * Only an unused note can be voided; its opening entry, if any, is
   * reversed as of `when' (today by default).
   */
  credit_note_t void_note(const ident_t id, const string& user_id,
                          const optional<date_t>& when = none);

  credit_note_t allocate(const ident_t                id,
                         const string&                user_id,
                         const allocation_requests_t& requests);
  credit_note_t delete_allocation(const ident_t allocation_id,
                                  const string& user_id);

  credit_refund_t create_refund(const ident_t           id,
                                const refund_request_t& request,
                                const string&           user_id);

  credit_note_t     get(const ident_t id);
  credit_notes_list list(const string& org_id,
                         const optional<credit_note_t::status_t>& status =
                         none);
};

class vendor_credits_t : public credit_book_t
{
protected:
  virtual account_t control_account(const string& org_id);
  virtual account_t counter_account(const string& org_id);
  virtual bool control_debited_on_open() const {
    return true;
  }

public:
  vendor_credits_t(database_t& _db, const config_t& _config,
                   account_registry_t& _accounts, journal_t& _journal,
                   payment_mapper_t& _mapper, document_book_t& _bills);
};

class customer_credits_t : public credit_book_t
{
protected:
  virtual account_t control_account(const string& org_id);
  virtual account_t counter_account(const string& org_id);
  virtual bool control_debited_on_open() const {
    return false;
  }

public:
  customer_credits_t(database_t& _db, const config_t& _config,
                     account_registry_t& _accounts, journal_t& _journal,
                     payment_mapper_t& _mapper, document_book_t& _invoices);
};

} // namespace folio
