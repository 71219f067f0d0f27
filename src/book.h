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
 * @file   book.h
 *
 * @ingroup data
 *
 * @brief The lifecycle shared by payables and receivables.
 *
 * document_book_t carries a document from DRAFT through OPEN and its
 * payments to PAID or VOID.  The two ledgers differ only in their tables
 * and in which side of the control account a document lands on, which
 * the subclasses supply.
 */
#pragma once

#include "document.h"
#include "journal.h"

namespace folio {

struct book_schema_t
{
  const char * noun;                 // "bill"
  const char * party_noun;           // "vendor"
  const char * documents;
  const char * parties;
  const char * party_column;
  const char * date_column;
  const char * account_column;
  const char * payments;
  const char * payment_column;
  const char * payment_date_column;

  journal_entry_t::source_t open_source;
  journal_entry_t::source_t void_source;
  journal_entry_t::source_t payment_source;
};

class document_book_t : public noncopyable
{
protected:
  database_t&          db;
  const config_t&      config;
  account_registry_t&  accounts;
  journal_t&           journal;
  payment_mapper_t&    mapper;
  const book_schema_t& schema;

  document_book_t(database_t& _db, const config_t& _config,
                  account_registry_t& _accounts, journal_t& _journal,
                  payment_mapper_t& _mapper, const book_schema_t& _schema)
    : db(_db), config(_config), accounts(_accounts), journal(_journal),
      mapper(_mapper), schema(_schema) {}

  /** Accounts payable or receivable. */
  virtual account_t control_account(const string& org_id) = 0;

  /** Where the document's total lands opposite the control account. */
  virtual account_t counter_account(const document_t& doc) = 0;

  /** Receivables are debited on open; payables are credited. */
  virtual bool control_is_debit() const = 0;

  string document_columns() const;
  document_t read_document(statement_t& stmt) const;

  void require_party(const string& org_id, const ident_t party_id);

  void store_paid_amount(const document_t& doc, const amount_t& paid);

public:
  virtual ~document_book_t() {}

  const book_schema_t& describe() const {
    return schema;
  }

  document_t create_document(const document_draft_t& draft);

  /** Post the document's total and move it from DRAFT to OPEN. */
  document_t open_document(const ident_t id, const string& user_id);

  /**
   * Reverse the document's opening entry, dated `when' (today by default),
   * and make it VOID.  Payments already made are left as they are.
   */
  document_t void_document(const ident_t id, const string& user_id,
                           const optional<date_t>& when = none);

  payment_t create_payment(const payment_request_t& request,
                           const string&            user_id);

  document_t           get_document(const ident_t id);
  documents_list       list_documents(const string& org_id,
                                      const optional<document_t::status_t>&
                                      status = none);
  payments_list        payments_for(const ident_t document_id);
  outstanding_t        outstanding(const ident_t id);

  /**
   * Apply non-cash credit to a document, as a credit note allocation
   * does.  The document must be payable and the amount within what it
   * still owes.
   */
  document_t apply_credit(const ident_t id, const amount_t& amount);

  /** Undo apply_credit; paid_amount never drops below zero. */
  document_t unapply_credit(const ident_t id, const amount_t& amount);
};

} // namespace folio
