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

#include "credit.h"

namespace folio {

namespace {
  const credit_schema_t vendor_credit_schema = {
    "vendor credit note", "vendor",
    "vendor_credit_notes", "vendor_credit_allocations",
    "vendor_credit_refunds", "vendors",
    journal_entry_t::VENDOR_CREDIT_NOTE,
    journal_entry_t::VENDOR_CREDIT_NOTE_VOID,
    journal_entry_t::VENDOR_CREDIT_REFUND
  };

  const credit_schema_t customer_credit_schema = {
    "customer credit note", "customer",
    "customer_credit_notes", "customer_credit_allocations",
    "customer_credit_refunds", "customers",
    journal_entry_t::CUSTOMER_CREDIT_NOTE,
    journal_entry_t::CUSTOMER_CREDIT_NOTE_VOID,
    journal_entry_t::CUSTOMER_CREDIT_REFUND
  };

  const char * note_columns =
    "SELECT id, org_id, party_id, number, credit_date, amount, "
    "allocated_amount, refunded_amount, status, reason, memo, "
    "journal_entry_id, opened_by_id, opened_at FROM ";

  string label(const credit_schema_t& schema, const credit_note_t& note)
  {
    std::ostringstream buf;
    buf << schema.noun << ' ' << note.id;
    if (note.number)
      buf << " (" << *note.number << ')';
    return buf.str();
  }
}

const char * credit_status_name(credit_note_t::status_t status)
{
  switch (status) {
  case credit_note_t::DRAFT:             return "DRAFT";
  case credit_note_t::OPEN:              return "OPEN";
  case credit_note_t::PARTIALLY_APPLIED: return "PARTIALLY_APPLIED";
  case credit_note_t::APPLIED:           return "APPLIED";
  case credit_note_t::VOID:              return "VOID";
  }
  assert(false);
  return "";
}

credit_note_t::status_t string_to_credit_status(const string& name)
{
  string uname = uppered(name);
  if (uname == "DRAFT")
    return credit_note_t::DRAFT;
  else if (uname == "OPEN")
    return credit_note_t::OPEN;
  else if (uname == "PARTIALLY_APPLIED")
    return credit_note_t::PARTIALLY_APPLIED;
  else if (uname == "APPLIED")
    return credit_note_t::APPLIED;
  else if (uname == "VOID")
    return credit_note_t::VOID;

  throw_(validation_error, _f("Unknown credit note status '%1%'") % name);
  return credit_note_t::DRAFT;
}

credit_note_t::status_t derive_credit_status(const amount_t& used,
                                             const amount_t& amount,
                                             const amount_t& tolerance)
{
  switch (coverage_of(used, amount, tolerance)) {
  case COVERED_NONE:   return credit_note_t::OPEN;
  case COVERED_PARTLY: return credit_note_t::PARTIALLY_APPLIED;
  case COVERED_FULLY:  return credit_note_t::APPLIED;
  }
  assert(false);
  return credit_note_t::OPEN;
}

credit_note_t credit_book_t::read_note(statement_t& stmt) const
{
  credit_note_t note;
  note.id               = stmt.get_ident(0);
  note.org_id           = stmt.get_string(1);
  note.party_id         = stmt.get_ident(2);
  note.number           = stmt.get_optional_string(3);
  note.date             = stmt.get_date(4);
  note.amount           = stmt.get_amount(5);
  note.allocated_amount = stmt.get_amount(6);
  note.refunded_amount  = stmt.get_amount(7);
  note.status           = string_to_credit_status(stmt.get_string(8));
  note.reason           = stmt.get_optional_string(9);
  note.memo             = stmt.get_optional_string(10);
  note.journal_entry_id = stmt.get_optional_ident(11);
  note.opened_by_id     = stmt.get_optional_string(12);
  note.opened_at        = stmt.get_optional_datetime(13);
  return note;
}

void credit_book_t::read_children(credit_note_t& note)
{
  statement_t allocs(db, string("SELECT id, credit_note_id, document_id, "
                                "amount, applied_at, applied_by_id FROM ") +
                     schema.allocations +
                     " WHERE credit_note_id = ? ORDER BY id");
  allocs.bind(1, note.id);

  note.allocations.clear();
  while (allocs.step()) {
    credit_allocation_t alloc;
    alloc.id             = allocs.get_ident(0);
    alloc.credit_note_id = allocs.get_ident(1);
    alloc.document_id    = allocs.get_ident(2);
    alloc.amount         = allocs.get_amount(3);
    alloc.applied_at     = allocs.get_datetime(4);
    alloc.applied_by_id  = allocs.get_optional_string(5);
    note.allocations.push_back(alloc);
  }

  statement_t refunds(db, string("SELECT id, credit_note_id, amount, "
                                 "refund_date, method, ref, memo, "
                                 "journal_entry_id FROM ") +
                      schema.refunds + " WHERE credit_note_id = ? ORDER BY id");
  refunds.bind(1, note.id);

  note.refunds.clear();
  while (refunds.step()) {
    credit_refund_t refund;
    refund.id               = refunds.get_ident(0);
    refund.credit_note_id   = refunds.get_ident(1);
    refund.amount           = refunds.get_amount(2);
    refund.date             = refunds.get_date(3);
    refund.method           = string_to_payment_method(refunds.get_string(4));
    refund.ref              = refunds.get_optional_string(5);
    refund.memo             = refunds.get_optional_string(6);
    refund.journal_entry_id = refunds.get_optional_ident(7);
    note.refunds.push_back(refund);
  }
}

void credit_book_t::store_usage(const credit_note_t& note,
                                const amount_t&      allocated,
                                const amount_t&      refunded)
{
  credit_note_t::status_t status =
    derive_credit_status(allocated + refunded, note.amount, config.tolerance);

  statement_t stmt(db, string("UPDATE ") + schema.notes +
                   " SET allocated_amount = ?, refunded_amount = ?, "
                   "status = ? WHERE id = ?");
  stmt.bind(1, allocated)
      .bind(2, refunded)
      .bind(3, credit_status_name(status))
      .bind(4, note.id);
  stmt.execute();

  DEBUG("credit.usage", label(schema, note) << ": allocated " << allocated
        << ", refunded " << refunded << " of " << note.amount << ": "
        << credit_status_name(status));
}

credit_note_t credit_book_t::create(const credit_draft_t& draft)
{
  if (draft.amount.sign() <= 0)
    throw_(validation_error,
           _f("The %1% amount must be greater than zero, not %2%")
           % schema.noun % draft.amount);
  if (! is_valid(draft.date))
    throw_(validation_error, _f("A %1% needs a date") % schema.noun);

  transaction_t xact(db);

  statement_t party(db, string("SELECT org_id FROM ") + schema.parties +
                    " WHERE id = ?");
  party.bind(1, draft.party_id);
  if (! party.step() || party.get_string(0) != draft.org_id)
    throw_(not_found_error,
           _f("No %1% %2% in organization %3%")
           % schema.party_noun % draft.party_id % draft.org_id);

  statement_t stmt(db, string("INSERT INTO ") + schema.notes +
                   " (org_id, party_id, number, credit_date, amount, "
                   "allocated_amount, refunded_amount, status, reason, memo) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, 'DRAFT', ?, ?)");
  stmt.bind(1, draft.org_id)
      .bind(2, draft.party_id)
      .bind(3, draft.number)
      .bind(4, draft.date)
      .bind(5, draft.amount)
      .bind(6, amount_t())
      .bind(7, amount_t())
      .bind(8, draft.reason)
      .bind(9, draft.memo);
  stmt.execute();

  credit_note_t note = get(db.last_insert_id());
  xact.commit();

  INFO("Created " << label(schema, note) << " for " << schema.party_noun
       << ' ' << note.party_id << ", amount " << note.amount);
  return note;
}

credit_note_t credit_book_t::open(const ident_t id, const string& user_id)
{
  transaction_t xact(db);

  credit_note_t note = get(id);
  if (note.status != credit_note_t::DRAFT)
    throw_(invalid_state_error,
           _f("%1% is %2%; only a DRAFT credit note can be opened")
           % label(schema, note) % credit_status_name(note.status));

  account_t control = control_account(note.org_id);
  account_t counter = counter_account(note.org_id);

  posting_request_t request;
  request.org_id    = note.org_id;
  request.date      = note.date;
  request.memo      = note.memo ? *note.memo : label(schema, note);
  request.source    = schema.open_source;
  request.source_id = to_string(note.id);
  request.user_id   = user_id;
  if (control_debited_on_open()) {
    request.lines.push_back(journal_line_t::debit_of(control.id, note.amount));
    request.lines.push_back(journal_line_t::credit_of(counter.id,
                                                      note.amount));
  } else {
    request.lines.push_back(journal_line_t::debit_of(counter.id, note.amount));
    request.lines.push_back(journal_line_t::credit_of(control.id,
                                                      note.amount));
  }

  posting_result_t result = journal.post_direct(request);

  statement_t stmt(db, string("UPDATE ") + schema.notes +
                   " SET status = 'OPEN', journal_entry_id = ?, "
                   "opened_by_id = ?, opened_at = ? WHERE id = ?");
  stmt.bind(1, result.entry_id)
      .bind(2, user_id)
      .bind(3, CURRENT_TIME())
      .bind(4, id);
  stmt.execute();

  note = get(id);
  xact.commit();

  INFO("Opened " << label(schema, note) << " as entry " << result.entry_id);
  return note;
}

credit_note_t credit_book_t::void_note(const ident_t           id,
                                       const string&           user_id,
                                       const optional<date_t>& when)
{
  transaction_t xact(db);

  credit_note_t note = get(id);
  if (note.status == credit_note_t::VOID)
    throw_(invalid_state_error,
           _f("%1% is already VOID") % label(schema, note));
  if (note.allocated_amount.is_nonzero() || note.refunded_amount.is_nonzero())
    throw_(invalid_state_error,
           _f("%1% has been used (allocated %2%, refunded %3%) and cannot "
              "be voided") % label(schema, note) % note.allocated_amount
           % note.refunded_amount);

  if (note.journal_entry_id)
    journal.reverse(*note.journal_entry_id, user_id, when,
                    schema.void_source);

  statement_t stmt(db, string("UPDATE ") + schema.notes +
                   " SET status = 'VOID' WHERE id = ?");
  stmt.bind(1, id);
  stmt.execute();

  note = get(id);
  xact.commit();

  INFO("Voided " << label(schema, note) << " by " << user_id);
  return note;
}

credit_note_t credit_book_t::allocate(const ident_t                id,
                                      const string&                user_id,
                                      const allocation_requests_t& requests)
{
  if (requests.empty())
    throw_(validation_error, _("Nothing to allocate"));

  amount_t total;
  foreach (const allocation_request_t& request, requests) {
    if (request.amount.sign() <= 0)
      throw_(validation_error,
             _f("Allocation amount must be greater than zero, not %1%")
             % request.amount);
    total += request.amount;
  }

  transaction_t xact(db);

  credit_note_t note = get(id);
  if (! note.is_usable())
    throw_(invalid_state_error,
           _f("%1% is %2%; only an OPEN or PARTIALLY_APPLIED credit note "
              "can be allocated")
           % label(schema, note) % credit_status_name(note.status));
  if (total > note.remaining() + config.tolerance)
    throw_(insufficient_balance_error,
           _f("Allocating %1% exceeds the %2% remaining on %3%")
           % total % note.remaining() % label(schema, note));

  const book_schema_t& target = documents.describe();

  statement_t insert(db, string("INSERT INTO ") + schema.allocations +
                     " (credit_note_id, document_id, amount, applied_at, "
                     "applied_by_id) VALUES (?, ?, ?, ?, ?)");

  foreach (const allocation_request_t& request, requests) {
    document_t doc = documents.get_document(request.document_id);
    if (doc.org_id != note.org_id)
      throw_(not_found_error,
             _f("No %1% %2% in organization %3%")
             % target.noun % request.document_id % note.org_id);
    if (doc.party_id != note.party_id)
      throw_(validation_error,
             _f("%1% %2% belongs to %3% %4%, not to the credit note's %5%")
             % target.noun % doc.id % schema.party_noun % doc.party_id
             % note.party_id);

    documents.apply_credit(doc.id, request.amount);

    insert.reset();
    insert.bind(1, id)
          .bind(2, doc.id)
          .bind(3, request.amount)
          .bind(4, CURRENT_TIME())
          .bind(5, user_id);
    insert.execute();

    DEBUG("credit.allocate", "Allocated " << request.amount << " of "
          << label(schema, note) << " to " << target.noun << ' ' << doc.id);
  }

  store_usage(note, note.allocated_amount + total, note.refunded_amount);

  note = get(id);
  xact.commit();

  INFO("Allocated " << total << " of " << label(schema, note) << " across "
       << requests.size() << ' ' << target.noun << "(s)");
  return note;
}

credit_note_t credit_book_t::delete_allocation(const ident_t allocation_id,
                                               const string& user_id)
{
  transaction_t xact(db);

  statement_t query(db, string("SELECT credit_note_id, document_id, amount "
                               "FROM ") + schema.allocations +
                    " WHERE id = ?");
  query.bind(1, allocation_id);
  if (! query.step())
    throw_(not_found_error,
           _f("No allocation %1% of a %2%") % allocation_id % schema.noun);

  ident_t  note_id     = query.get_ident(0);
  ident_t  document_id = query.get_ident(1);
  amount_t amount      = query.get_amount(2);

  credit_note_t note = get(note_id);

  documents.unapply_credit(document_id, amount);

  amount_t allocated = note.allocated_amount - amount;
  if (allocated.sign() < 0)
    allocated = amount_t();
  store_usage(note, allocated, note.refunded_amount);

  statement_t remove(db, string("DELETE FROM ") + schema.allocations +
                     " WHERE id = ?");
  remove.bind(1, allocation_id);
  remove.execute();

  note = get(note_id);
  xact.commit();

  INFO("Deleted allocation " << allocation_id << " of " << amount
       << " from " << label(schema, note) << " by " << user_id);
  return note;
}

credit_refund_t credit_book_t::create_refund(const ident_t           id,
                                             const refund_request_t& request,
                                             const string&           user_id)
{
  if (request.amount.sign() <= 0)
    throw_(validation_error,
           _f("Refund amount must be greater than zero, not %1%")
           % request.amount);
  if (! is_valid(request.date))
    throw_(validation_error, _("A refund needs a date"));

  transaction_t xact(db);

  credit_note_t note = get(id);
  if (! note.is_usable())
    throw_(invalid_state_error,
           _f("%1% is %2%; only an OPEN or PARTIALLY_APPLIED credit note "
              "can be refunded")
           % label(schema, note) % credit_status_name(note.status));
  if (request.amount > note.remaining() + config.tolerance)
    throw_(insufficient_balance_error,
           _f("Refund of %1% exceeds the %2% remaining on %3%")
           % request.amount % note.remaining() % label(schema, note));

  account_t cash    = mapper.cash_account(note.org_id, request.method);
  account_t control = control_account(note.org_id);

  statement_t stmt(db, string("INSERT INTO ") + schema.refunds +
                   " (credit_note_id, amount, refund_date, method, ref, memo) "
                   "VALUES (?, ?, ?, ?, ?, ?)");
  stmt.bind(1, id)
      .bind(2, request.amount)
      .bind(3, request.date)
      .bind(4, payment_method_name(request.method))
      .bind(5, request.ref)
      .bind(6, request.memo);
  stmt.execute();

  credit_refund_t refund;
  refund.id             = db.last_insert_id();
  refund.credit_note_id = id;
  refund.amount         = request.amount;
  refund.date           = request.date;
  refund.method         = request.method;
  refund.ref            = request.ref;
  refund.memo           = request.memo;

  posting_request_t posting;
  posting.org_id    = note.org_id;
  posting.date      = request.date;
  posting.memo      = request.memo ? *request.memo
                                   : "Refund of " + label(schema, note);
  posting.source    = schema.refund_source;
  posting.source_id = to_string(refund.id);
  posting.user_id   = user_id;
  if (control_debited_on_open()) {
    posting.lines.push_back(journal_line_t::debit_of(cash.id, request.amount));
    posting.lines.push_back(journal_line_t::credit_of(control.id,
                                                      request.amount));
  } else {
    posting.lines.push_back(journal_line_t::debit_of(control.id,
                                                     request.amount));
    posting.lines.push_back(journal_line_t::credit_of(cash.id,
                                                      request.amount));
  }

  posting_result_t result = journal.post_direct(posting);
  refund.journal_entry_id = result.entry_id;

  statement_t link(db, string("UPDATE ") + schema.refunds +
                   " SET journal_entry_id = ? WHERE id = ?");
  link.bind(1, result.entry_id).bind(2, refund.id);
  link.execute();

  store_usage(note, note.allocated_amount,
              note.refunded_amount + request.amount);

  xact.commit();

  INFO("Refunded " << refund.amount << " of " << label(schema, note)
       << " via " << cash << " as entry " << result.entry_id);
  return refund;
}

credit_note_t credit_book_t::get(const ident_t id)
{
  statement_t stmt(db, string(note_columns) + schema.notes + " WHERE id = ?");
  stmt.bind(1, id);
  if (! stmt.step())
    throw_(not_found_error, _f("No %1% %2%") % schema.noun % id);

  credit_note_t note = read_note(stmt);
  read_children(note);
  return note;
}

credit_notes_list
credit_book_t::list(const string&                            org_id,
                    const optional<credit_note_t::status_t>& status)
{
  string sql = string(note_columns) + schema.notes + " WHERE org_id = ?";
  if (status)
    sql += " AND status = ?";
  sql += " ORDER BY credit_date, id";

  statement_t stmt(db, sql);
  stmt.bind(1, org_id);
  if (status)
    stmt.bind(2, credit_status_name(*status));

  credit_notes_list notes;
  while (stmt.step())
    notes.push_back(read_note(stmt));

  foreach (credit_note_t& note, notes)
    read_children(note);
  return notes;
}

vendor_credits_t::vendor_credits_t(database_t& _db, const config_t& _config,
                                   account_registry_t& _accounts,
                                   journal_t& _journal,
                                   payment_mapper_t& _mapper,
                                   document_book_t& _bills)
  : credit_book_t(_db, _config, _accounts, _journal, _mapper, _bills,
                  vendor_credit_schema)
{
}

account_t vendor_credits_t::control_account(const string& org_id)
{
  return accounts.require_mapped(org_id, config.accounts.accounts_payable,
                                 "accounts payable");
}

account_t vendor_credits_t::counter_account(const string& org_id)
{
  return accounts.require_mapped(org_id, config.accounts.expense, "expense");
}

customer_credits_t::customer_credits_t(database_t& _db,
                                       const config_t& _config,
                                       account_registry_t& _accounts,
                                       journal_t& _journal,
                                       payment_mapper_t& _mapper,
                                       document_book_t& _invoices)
  : credit_book_t(_db, _config, _accounts, _journal, _mapper, _invoices,
                  customer_credit_schema)
{
}

account_t customer_credits_t::control_account(const string& org_id)
{
  return accounts.require_mapped(org_id, config.accounts.accounts_receivable,
                                 "accounts receivable");
}

account_t customer_credits_t::counter_account(const string& org_id)
{
  return accounts.require_mapped(org_id, config.accounts.sales, "sales");
}

} // namespace folio
