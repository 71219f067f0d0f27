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

#include "book.h"

namespace folio {

coverage_t coverage_of(const amount_t& used, const amount_t& total,
                       const amount_t& tolerance)
{
  if (used.sign() <= 0)
    return COVERED_NONE;
  if (used >= total - tolerance)
    return COVERED_FULLY;
  return COVERED_PARTLY;
}

const char * document_status_name(document_t::status_t status)
{
  switch (status) {
  case document_t::DRAFT:          return "DRAFT";
  case document_t::OPEN:           return "OPEN";
  case document_t::PARTIALLY_PAID: return "PARTIALLY_PAID";
  case document_t::PAID:           return "PAID";
  case document_t::VOID:           return "VOID";
  }
  assert(false);
  return "";
}

document_t::status_t string_to_document_status(const string& name)
{
  string uname = uppered(name);
  if (uname == "DRAFT")
    return document_t::DRAFT;
  else if (uname == "OPEN")
    return document_t::OPEN;
  else if (uname == "PARTIALLY_PAID")
    return document_t::PARTIALLY_PAID;
  else if (uname == "PAID")
    return document_t::PAID;
  else if (uname == "VOID")
    return document_t::VOID;

  throw_(validation_error, _f("Unknown document status '%1%'") % name);
  return document_t::DRAFT;
}

document_t::status_t derive_document_status(const amount_t& paid,
                                            const amount_t& total,
                                            const amount_t& tolerance)
{
  switch (coverage_of(paid, total, tolerance)) {
  case COVERED_NONE:   return document_t::OPEN;
  case COVERED_PARTLY: return document_t::PARTIALLY_PAID;
  case COVERED_FULLY:  return document_t::PAID;
  }
  assert(false);
  return document_t::OPEN;
}

namespace {
  string label(const book_schema_t& schema, const document_t& doc)
  {
    std::ostringstream buf;
    buf << schema.noun << ' ' << doc.id;
    if (doc.number)
      buf << " (" << *doc.number << ')';
    return buf.str();
  }
}

string document_book_t::document_columns() const
{
  std::ostringstream buf;
  buf << "SELECT id, org_id, " << schema.party_column << ", number, "
      << schema.date_column << ", due_date, subtotal, tax, total, "
      << "paid_amount, status, memo, " << schema.account_column
      << ", journal_entry_id, opened_by_id, opened_at FROM "
      << schema.documents;
  return buf.str();
}

document_t document_book_t::read_document(statement_t& stmt) const
{
  document_t doc;
  doc.id               = stmt.get_ident(0);
  doc.org_id           = stmt.get_string(1);
  doc.party_id         = stmt.get_ident(2);
  doc.number           = stmt.get_optional_string(3);
  doc.date             = stmt.get_date(4);
  doc.due_date         = stmt.get_date(5);
  doc.subtotal         = stmt.get_amount(6);
  doc.tax              = stmt.get_optional_amount(7);
  doc.total            = stmt.get_amount(8);
  doc.paid_amount      = stmt.get_amount(9);
  doc.status           = string_to_document_status(stmt.get_string(10));
  doc.memo             = stmt.get_optional_string(11);
  doc.account_id       = stmt.get_optional_ident(12);
  doc.journal_entry_id = stmt.get_optional_ident(13);
  doc.opened_by_id     = stmt.get_optional_string(14);
  doc.opened_at        = stmt.get_optional_datetime(15);
  return doc;
}

void document_book_t::require_party(const string& org_id,
                                    const ident_t party_id)
{
  statement_t stmt(db, string("SELECT org_id FROM ") + schema.parties +
                   " WHERE id = ?");
  stmt.bind(1, party_id);
  if (! stmt.step() || stmt.get_string(0) != org_id)
    throw_(not_found_error,
           _f("No %1% %2% in organization %3%")
           % schema.party_noun % party_id % org_id);
}

void document_book_t::store_paid_amount(const document_t& doc,
                                        const amount_t&   paid)
{
  document_t::status_t status = doc.status;
  if (status != document_t::VOID && status != document_t::DRAFT)
    status = derive_document_status(paid, doc.total, config.tolerance);

  statement_t stmt(db, string("UPDATE ") + schema.documents +
                   " SET paid_amount = ?, status = ? WHERE id = ?");
  stmt.bind(1, paid).bind(2, document_status_name(status)).bind(3, doc.id);
  stmt.execute();

  DEBUG("book.paid", label(schema, doc) << " paid " << paid << " of "
        << doc.total << ": " << document_status_name(status));
}

document_t document_book_t::create_document(const document_draft_t& draft)
{
  amount_t tax = draft.tax ? *draft.tax : amount_t();

  if (draft.total.sign() <= 0)
    throw_(validation_error,
           _f("The %1% total must be greater than zero, not %2%")
           % schema.noun % draft.total);
  if (draft.subtotal.sign() < 0)
    throw_(validation_error,
           _f("The %1% subtotal cannot be negative (%2%)")
           % schema.noun % draft.subtotal);
  if (tax.sign() < 0)
    throw_(validation_error,
           _f("The %1% tax cannot be negative (%2%)") % schema.noun % tax);
  if (! within_tolerance(draft.subtotal + tax, draft.total, config.tolerance))
    throw_(validation_error,
           _f("The %1% subtotal %2% plus tax %3% does not equal its total %4%")
           % schema.noun % draft.subtotal % tax % draft.total);
  if (! is_valid(draft.date) || ! is_valid(draft.due_date))
    throw_(validation_error,
           _f("A %1% needs a date and a due date") % schema.noun);
  if (draft.due_date < draft.date)
    throw_(validation_error,
           _f("The %1% is due (%2%) before it is dated (%3%)")
           % schema.noun % format_date(draft.due_date)
           % format_date(draft.date));

  transaction_t xact(db);

  require_party(draft.org_id, draft.party_id);

  if (draft.account_id) {
    optional<account_t> account = accounts.find_account(*draft.account_id);
    if (! account || account->org_id != draft.org_id)
      throw_(not_found_error,
             _f("Account %1% not found in organization %2%")
             % *draft.account_id % draft.org_id);
    if (! account->is_active)
      throw_(validation_error,
             _f("Account %1% is inactive") % account->description());
  }

  std::ostringstream sql;
  sql << "INSERT INTO " << schema.documents << " (org_id, "
      << schema.party_column << ", number, " << schema.date_column
      << ", due_date, subtotal, tax, total, paid_amount, status, memo, "
      << schema.account_column
      << ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 'DRAFT', ?, ?)";

  statement_t stmt(db, sql.str());
  stmt.bind(1, draft.org_id)
      .bind(2, draft.party_id)
      .bind(3, draft.number)
      .bind(4, draft.date)
      .bind(5, draft.due_date)
      .bind(6, draft.subtotal)
      .bind(7, draft.tax)
      .bind(8, draft.total)
      .bind(9, amount_t())
      .bind(10, draft.memo)
      .bind(11, draft.account_id);
  stmt.execute();

  document_t doc = get_document(db.last_insert_id());
  xact.commit();

  INFO("Created " << label(schema, doc) << " for " << schema.party_noun
       << ' ' << doc.party_id << ", total " << doc.total);
  return doc;
}

document_t document_book_t::open_document(const ident_t id,
                                          const string& user_id)
{
  transaction_t xact(db);

  document_t doc = get_document(id);
  if (doc.status != document_t::DRAFT)
    throw_(invalid_state_error,
           _f("%1% is %2%; only a DRAFT %3% can be opened")
           % label(schema, doc) % document_status_name(doc.status)
           % schema.noun);

  account_t control = control_account(doc.org_id);
  account_t counter = counter_account(doc);

  posting_request_t request;
  request.org_id    = doc.org_id;
  request.date      = doc.date;
  request.memo      = doc.memo ? *doc.memo : label(schema, doc);
  request.source    = schema.open_source;
  request.source_id = to_string(doc.id);
  request.user_id   = user_id;
  if (control_is_debit()) {
    request.lines.push_back(journal_line_t::debit_of(control.id, doc.total));
    request.lines.push_back(journal_line_t::credit_of(counter.id, doc.total));
  } else {
    request.lines.push_back(journal_line_t::debit_of(counter.id, doc.total));
    request.lines.push_back(journal_line_t::credit_of(control.id, doc.total));
  }

  posting_result_t result = journal.post_direct(request);

  statement_t stmt(db, string("UPDATE ") + schema.documents +
                   " SET status = ?, journal_entry_id = ?, opened_by_id = ?, "
                   "opened_at = ? WHERE id = ?");
  stmt.bind(1, document_status_name(derive_document_status(doc.paid_amount,
                                                           doc.total,
                                                           config.tolerance)))
      .bind(2, result.entry_id)
      .bind(3, user_id)
      .bind(4, CURRENT_TIME())
      .bind(5, id);
  stmt.execute();

  doc = get_document(id);
  xact.commit();

  INFO("Opened " << label(schema, doc) << " as entry " << result.entry_id);
  return doc;
}

document_t document_book_t::void_document(const ident_t           id,
                                          const string&           user_id,
                                          const optional<date_t>& when)
{
  transaction_t xact(db);

  document_t doc = get_document(id);
  if (doc.status == document_t::DRAFT || doc.status == document_t::VOID)
    throw_(invalid_state_error,
           _f("%1% is %2% and cannot be voided")
           % label(schema, doc) % document_status_name(doc.status));

  optional<ident_t> reversal_id;
  if (doc.journal_entry_id) {
    journal_entry_t opening = journal.get_entry(*doc.journal_entry_id);
    if (opening.status == journal_entry_t::REVERSED)
      WARN("Opening entry " << opening.id << " of " << label(schema, doc)
           << " was already reversed; voiding without a new reversal");
    else
      reversal_id = journal.reverse(opening.id, user_id, when,
                                    schema.void_source);
  }

  statement_t stmt(db, string("UPDATE ") + schema.documents +
                   " SET status = 'VOID' WHERE id = ?");
  stmt.bind(1, id);
  stmt.execute();

  doc = get_document(id);
  xact.commit();

  if (reversal_id)
    INFO("Voided " << label(schema, doc) << "; reversal entry "
         << *reversal_id);
  else
    INFO("Voided " << label(schema, doc));
  return doc;
}

payment_t document_book_t::create_payment(const payment_request_t& request,
                                          const string&            user_id)
{
  if (request.amount.sign() <= 0)
    throw_(validation_error,
           _f("Payment amount must be greater than zero, not %1%")
           % request.amount);
  if (! is_valid(request.date))
    throw_(validation_error, _("A payment needs a date"));

  transaction_t xact(db);

  require_party(request.org_id, request.party_id);

  optional<document_t> doc;
  if (request.document_id) {
    doc = get_document(*request.document_id);
    if (doc->org_id != request.org_id)
      throw_(not_found_error,
             _f("No %1% %2% in organization %3%")
             % schema.noun % *request.document_id % request.org_id);
    if (doc->party_id != request.party_id)
      throw_(validation_error,
             _f("%1% belongs to %2% %3%, not %4%")
             % label(schema, *doc) % schema.party_noun % doc->party_id
             % request.party_id);
    if (! doc->is_payable())
      throw_(invalid_state_error,
             _f("%1% is %2%; payments need an OPEN or PARTIALLY_PAID %3%")
             % label(schema, *doc) % document_status_name(doc->status)
             % schema.noun);
    if (request.amount > doc->outstanding() + config.tolerance)
      throw_(insufficient_balance_error,
             _f("Payment of %1% exceeds outstanding %2% on %3%")
             % request.amount % doc->outstanding() % label(schema, *doc));
  }

  account_t cash    = mapper.cash_account(request.org_id, request.method);
  account_t control = control_account(request.org_id);

  std::ostringstream sql;
  sql << "INSERT INTO " << schema.payments << " (org_id, "
      << schema.party_column << ", " << schema.payment_column
      << ", amount, " << schema.payment_date_column
      << ", method, ref, memo) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

  statement_t stmt(db, sql.str());
  stmt.bind(1, request.org_id)
      .bind(2, request.party_id)
      .bind(3, request.document_id)
      .bind(4, request.amount)
      .bind(5, request.date)
      .bind(6, payment_method_name(request.method))
      .bind(7, request.ref)
      .bind(8, request.memo);
  stmt.execute();

  payment_t payment;
  payment.id          = db.last_insert_id();
  payment.org_id      = request.org_id;
  payment.party_id    = request.party_id;
  payment.document_id = request.document_id;
  payment.amount      = request.amount;
  payment.date        = request.date;
  payment.method      = request.method;
  payment.ref         = request.ref;
  payment.memo        = request.memo;

  posting_request_t posting;
  posting.org_id    = request.org_id;
  posting.date      = request.date;
  posting.source    = schema.payment_source;
  posting.source_id = to_string(payment.id);
  posting.user_id   = user_id;
  if (request.memo)
    posting.memo = *request.memo;
  else if (doc)
    posting.memo = "Payment on " + label(schema, *doc);
  else
    posting.memo = string("Unapplied payment, ") + schema.party_noun + " " +
                   to_string(request.party_id);

  if (control_is_debit()) {
    posting.lines.push_back(journal_line_t::debit_of(cash.id, request.amount));
    posting.lines.push_back(journal_line_t::credit_of(control.id,
                                                      request.amount));
  } else {
    posting.lines.push_back(journal_line_t::debit_of(control.id,
                                                     request.amount));
    posting.lines.push_back(journal_line_t::credit_of(cash.id, request.amount));
  }

  posting_result_t result = journal.post_direct(posting);
  payment.journal_entry_id = result.entry_id;

  statement_t link(db, string("UPDATE ") + schema.payments +
                   " SET journal_entry_id = ? WHERE id = ?");
  link.bind(1, result.entry_id).bind(2, payment.id);
  link.execute();

  if (doc)
    store_paid_amount(*doc, doc->paid_amount + request.amount);

  xact.commit();

  if (doc)
    INFO("Applied payment " << payment.id << " of " << payment.amount
         << " to " << label(schema, *doc) << " via " << cash);
  else
    INFO("Recorded unapplied payment " << payment.id << " of "
         << payment.amount << " via " << cash);
  return payment;
}

document_t document_book_t::get_document(const ident_t id)
{
  statement_t stmt(db, document_columns() + " WHERE id = ?");
  stmt.bind(1, id);
  if (! stmt.step())
    throw_(not_found_error, _f("No %1% %2%") % schema.noun % id);
  return read_document(stmt);
}

documents_list
document_book_t::list_documents(const string& org_id,
                                const optional<document_t::status_t>& status)
{
  string sql = document_columns() + " WHERE org_id = ?";
  if (status)
    sql += " AND status = ?";
  sql += string(" ORDER BY ") + schema.date_column + ", id";

  statement_t stmt(db, sql);
  stmt.bind(1, org_id);
  if (status)
    stmt.bind(2, document_status_name(*status));

  documents_list docs;
  while (stmt.step())
    docs.push_back(read_document(stmt));
  return docs;
}

payments_list document_book_t::payments_for(const ident_t document_id)
{
  get_document(document_id);

  std::ostringstream sql;
  sql << "SELECT id, org_id, " << schema.party_column << ", "
      << schema.payment_column << ", amount, " << schema.payment_date_column
      << ", method, ref, memo, journal_entry_id FROM " << schema.payments
      << " WHERE " << schema.payment_column << " = ? ORDER BY "
      << schema.payment_date_column << ", id";

  statement_t stmt(db, sql.str());
  stmt.bind(1, document_id);

  payments_list payments;
  while (stmt.step()) {
    payment_t payment;
    payment.id               = stmt.get_ident(0);
    payment.org_id           = stmt.get_string(1);
    payment.party_id         = stmt.get_ident(2);
    payment.document_id      = stmt.get_optional_ident(3);
    payment.amount           = stmt.get_amount(4);
    payment.date             = stmt.get_date(5);
    payment.method           = string_to_payment_method(stmt.get_string(6));
    payment.ref              = stmt.get_optional_string(7);
    payment.memo             = stmt.get_optional_string(8);
    payment.journal_entry_id = stmt.get_optional_ident(9);
    payments.push_back(payment);
  }
  return payments;
}

outstanding_t document_book_t::outstanding(const ident_t id)
{
  document_t doc = get_document(id);

  outstanding_t result;
  result.total       = doc.total;
  result.paid        = doc.paid_amount;
  result.outstanding = doc.outstanding();
  result.status      = doc.status;
  return result;
}

document_t document_book_t::apply_credit(const ident_t   id,
                                         const amount_t& amount)
{
  transaction_t xact(db);

  document_t doc = get_document(id);
  if (! doc.is_payable())
    throw_(invalid_state_error,
           _f("%1% is %2%; credit applies only to an OPEN or "
              "PARTIALLY_PAID %3%")
           % label(schema, doc) % document_status_name(doc.status)
           % schema.noun);
  if (amount > doc.outstanding() + config.tolerance)
    throw_(insufficient_balance_error,
           _f("Allocation of %1% exceeds outstanding %2% on %3%")
           % amount % doc.outstanding() % label(schema, doc));

  store_paid_amount(doc, doc.paid_amount + amount);

  doc = get_document(id);
  xact.commit();
  return doc;
}

document_t document_book_t::unapply_credit(const ident_t   id,
                                           const amount_t& amount)
{
  transaction_t xact(db);

  document_t doc  = get_document(id);
  amount_t   paid = doc.paid_amount - amount;
  if (paid.sign() < 0)
    paid = amount_t();

  store_paid_amount(doc, paid);

  doc = get_document(id);
  xact.commit();
  return doc;
}

} // namespace folio
