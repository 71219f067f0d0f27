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

#include "journal.h"

namespace folio {

namespace {
  const char * entry_columns =
    "SELECT id, org_id, branch_id, date, memo, source, source_id, status, "
    "created_by_id, created_at, posted_by_id, posted_at, reverses_entry_id, "
    "reversed_by_id, reversed_at, "
    "(SELECT r.id FROM journal_entries r WHERE r.reverses_entry_id = "
    "journal_entries.id) FROM journal_entries";

  journal_entry_t read_entry(statement_t& stmt)
  {
    journal_entry_t entry;
    entry.id                   = stmt.get_ident(0);
    entry.org_id               = stmt.get_string(1);
    entry.branch_id            = stmt.get_optional_string(2);
    entry.date                 = stmt.get_date(3);
    entry.memo                 = stmt.get_string(4);
    entry.source               = string_to_entry_source(stmt.get_string(5));
    entry.source_id            = stmt.get_optional_string(6);
    entry.status               = string_to_entry_status(stmt.get_string(7));
    entry.created_by_id        = stmt.get_optional_string(8);
    entry.created_at           = stmt.get_datetime(9);
    entry.posted_by_id         = stmt.get_optional_string(10);
    entry.posted_at            = stmt.get_optional_datetime(11);
    entry.reverses_entry_id    = stmt.get_optional_ident(12);
    entry.reversed_by_id       = stmt.get_optional_string(13);
    entry.reversed_at          = stmt.get_optional_datetime(14);
    entry.reversed_by_entry_id = stmt.get_optional_ident(15);
    return entry;
  }

  const char * source_names[] = {
    "MANUAL",
    "ORDER",
    "COGS",
    "REFUND",
    "CASH_MOVEMENT",
    "VENDOR_BILL",
    "VENDOR_PAYMENT",
    "CUSTOMER_INVOICE",
    "CUSTOMER_RECEIPT",
    "VENDOR_BILL_VOID",
    "CUSTOMER_INVOICE_VOID",
    "VENDOR_CREDIT_NOTE",
    "CUSTOMER_CREDIT_NOTE",
    "VENDOR_CREDIT_NOTE_VOID",
    "CUSTOMER_CREDIT_NOTE_VOID",
    "VENDOR_CREDIT_REFUND",
    "CUSTOMER_CREDIT_REFUND",
    "REVERSAL"
  };
}

amount_t journal_entry_t::total_debits() const
{
  amount_t total;
  foreach (const journal_line_t& line, lines)
    total += line.debit;
  return total;
}

amount_t journal_entry_t::total_credits() const
{
  amount_t total;
  foreach (const journal_line_t& line, lines)
    total += line.credit;
  return total;
}

const char * entry_status_name(journal_entry_t::status_t status)
{
  switch (status) {
  case journal_entry_t::DRAFT:    return "DRAFT";
  case journal_entry_t::POSTED:   return "POSTED";
  case journal_entry_t::REVERSED: return "REVERSED";
  }
  assert(false);
  return "";
}

journal_entry_t::status_t string_to_entry_status(const string& name)
{
  if (name == "DRAFT")
    return journal_entry_t::DRAFT;
  else if (name == "POSTED")
    return journal_entry_t::POSTED;
  else if (name == "REVERSED")
    return journal_entry_t::REVERSED;

  throw_(validation_error, _f("Unknown journal entry status '%1%'") % name);
  return journal_entry_t::DRAFT;
}

const char * entry_source_name(journal_entry_t::source_t source)
{
  assert(source >= journal_entry_t::MANUAL &&
         source <= journal_entry_t::REVERSAL);
  return source_names[source];
}

journal_entry_t::source_t string_to_entry_source(const string& name)
{
  for (int i = journal_entry_t::MANUAL; i <= journal_entry_t::REVERSAL; i++)
    if (name == source_names[i])
      return static_cast<journal_entry_t::source_t>(i);

  throw_(validation_error, _f("Unknown journal entry source '%1%'") % name);
  return journal_entry_t::MANUAL;
}

void journal_t::validate_lines(const string& org_id, lines_vector& lines)
{
  if (lines.size() < 2)
    throw_(validation_error,
           _f("A journal entry needs at least two lines, not %1%")
           % lines.size());

  std::map<ident_t, account_t> seen;
  amount_t debits;
  amount_t credits;
  int      line_no = 0;

  foreach (journal_line_t& line, lines) {
    line.line_no = ++line_no;

    if (line.debit.sign() < 0 || line.credit.sign() < 0)
      throw_(validation_error,
             _f("Line %1% has a negative amount (debit %2%, credit %3%)")
             % line.line_no % line.debit % line.credit);
    if (line.debit.is_zero() == line.credit.is_zero())
      throw_(validation_error,
             _f("Line %1% must carry either a debit or a credit "
                "(debit %2%, credit %3%)")
             % line.line_no % line.debit % line.credit);

    if (seen.find(line.account_id) == seen.end()) {
      optional<account_t> account = accounts.find_account(line.account_id);
      if (! account || account->org_id != org_id)
        throw_(not_found_error,
               _f("Line %1%: account %2% not found in organization %3%")
               % line.line_no % line.account_id % org_id);
      if (! account->is_active)
        throw_(validation_error,
               _f("Line %1%: account %2% is inactive")
               % line.line_no % account->description());
      seen.insert(std::pair<ident_t, account_t>(line.account_id, *account));
    }

    debits  += line.debit;
    credits += line.credit;
  }

  if (! within_tolerance(debits, credits, config.tolerance))
    throw_(unbalanced_entry_error,
           _f("Entry does not balance: debits %1%, credits %2% "
              "(difference %3%)") % debits % credits % (debits - credits));

  DEBUG("journal.validate", "Entry of " << lines.size()
        << " lines balances at " << debits);
}

ident_t journal_t::insert_entry(const string&                   org_id,
                                const optional<string>&         branch_id,
                                const date_t&                   date,
                                const string&                   memo,
                                const journal_entry_t::source_t source,
                                const optional<string>&         source_id,
                                const journal_entry_t::status_t status,
                                const optional<string>&         user_id,
                                const optional<ident_t>&        reverses_entry_id,
                                const lines_vector&             lines)
{
  datetime_t now = CURRENT_TIME();

  statement_t stmt(db, "INSERT INTO journal_entries (org_id, branch_id, "
                   "date, memo, source, source_id, status, created_by_id, "
                   "created_at, posted_by_id, posted_at, reverses_entry_id) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  stmt.bind(1, org_id)
      .bind(2, branch_id)
      .bind(3, date)
      .bind(4, memo)
      .bind(5, entry_source_name(source))
      .bind(6, source_id)
      .bind(7, entry_status_name(status))
      .bind(8, user_id)
      .bind(9, now);
  if (status == journal_entry_t::POSTED)
    stmt.bind(10, user_id).bind(11, now);
  else
    stmt.bind_null(10).bind_null(11);
  stmt.bind(12, reverses_entry_id);
  stmt.execute();

  ident_t entry_id = db.last_insert_id();

  statement_t insert_line(db, "INSERT INTO journal_lines (entry_id, line_no, "
                          "account_id, branch_id, debit, credit) "
                          "VALUES (?, ?, ?, ?, ?, ?)");
  foreach (const journal_line_t& line, lines) {
    insert_line.reset();
    insert_line.bind(1, entry_id)
               .bind(2, line.line_no)
               .bind(3, line.account_id)
               .bind(4, line.branch_id)
               .bind(5, line.debit)
               .bind(6, line.credit);
    insert_line.execute();
  }

  return entry_id;
}

void journal_t::read_lines(journal_entry_t& entry)
{
  statement_t stmt(db, "SELECT id, line_no, account_id, branch_id, debit, "
                   "credit FROM journal_lines WHERE entry_id = ? "
                   "ORDER BY line_no");
  stmt.bind(1, entry.id);

  entry.lines.clear();
  while (stmt.step()) {
    journal_line_t line;
    line.id         = stmt.get_ident(0);
    line.line_no    = stmt.get_int(1);
    line.account_id = stmt.get_ident(2);
    line.branch_id  = stmt.get_optional_string(3);
    line.debit      = stmt.get_amount(4);
    line.credit     = stmt.get_amount(5);
    entry.lines.push_back(line);
  }
}

ident_t journal_t::create_draft(const string&           org_id,
                                const date_t&           date,
                                const string&           memo,
                                lines_vector            lines,
                                const optional<string>& branch_id,
                                const optional<string>& user_id)
{
  if (! is_valid(date))
    throw_(validation_error, _("A journal entry needs a date"));

  transaction_t xact(db);

  validate_lines(org_id, lines);
  ident_t entry_id = insert_entry(org_id, branch_id, date, memo,
                                  journal_entry_t::MANUAL, none,
                                  journal_entry_t::DRAFT, user_id, none,
                                  lines);
  xact.commit();

  INFO("Created draft entry " << entry_id << " dated " << format_date(date)
       << " for " << org_id);
  return entry_id;
}

void journal_t::post(const ident_t entry_id, const string& user_id)
{
  transaction_t xact(db);

  journal_entry_t entry = get_entry(entry_id);
  if (entry.status != journal_entry_t::DRAFT)
    throw_(invalid_state_error,
           _f("Entry %1% is %2%; only a DRAFT entry can be posted")
           % entry_id % entry_status_name(entry.status));

  periods.check_postable(entry.org_id, entry.date,
                         "post journal entry " + to_string(entry_id));

  // Accounts may have been deactivated since the draft was written.
  validate_lines(entry.org_id, entry.lines);

  statement_t stmt(db, "UPDATE journal_entries SET status = 'POSTED', "
                   "posted_by_id = ?, posted_at = ? "
                   "WHERE id = ? AND status = 'DRAFT'");
  stmt.bind(1, user_id).bind(2, CURRENT_TIME()).bind(3, entry_id);
  stmt.execute();
  if (db.changes() != 1)
    throw_(invalid_state_error,
           _f("Entry %1% was posted concurrently") % entry_id);

  xact.commit();

  INFO("Posted entry " << entry_id << " by " << user_id);
}

posting_result_t journal_t::post_direct(const posting_request_t& request)
{
  if (request.source_id.empty())
    throw_(validation_error,
           _f("A %1% posting needs a source id")
           % entry_source_name(request.source));
  if (! is_valid(request.date))
    throw_(validation_error,
           _f("%1% posting %2% needs a date")
           % entry_source_name(request.source) % request.source_id);

  transaction_t xact(db);

  if (optional<journal_entry_t> existing =
      find_by_source(request.org_id, request.source, request.source_id)) {
    WARN("Already posted " << entry_source_name(request.source) << " "
         << request.source_id << " as entry " << existing->id
         << "; skipping");
    return posting_result_t(existing->id, true);
  }

  periods.check_postable(request.org_id, request.date,
                         string("post ") + entry_source_name(request.source) +
                         " " + request.source_id);

  lines_vector lines(request.lines);
  validate_lines(request.org_id, lines);

  ident_t entry_id = insert_entry(request.org_id, request.branch_id,
                                  request.date, request.memo, request.source,
                                  request.source_id, journal_entry_t::POSTED,
                                  request.user_id, none, lines);
  xact.commit();

  INFO("Posted " << entry_source_name(request.source) << " "
       << request.source_id << " as entry " << entry_id);
  return posting_result_t(entry_id, false);
}

ident_t journal_t::reverse(const ident_t                   entry_id,
                           const string&                   user_id,
                           const optional<date_t>&         date,
                           const journal_entry_t::source_t source)
{
  transaction_t xact(db);

  journal_entry_t entry = get_entry(entry_id);
  if (entry.status != journal_entry_t::POSTED)
    throw_(invalid_state_error,
           _f("Entry %1% is %2%; only a POSTED entry can be reversed")
           % entry_id % entry_status_name(entry.status));

  date_t when = date ? *date : CURRENT_DATE();
  periods.check_postable(entry.org_id, when,
                         "reverse journal entry " + to_string(entry_id));

  lines_vector lines;
  foreach (const journal_line_t& line, entry.lines) {
    journal_line_t mirror(line.account_id, line.credit, line.debit,
                          line.branch_id);
    mirror.line_no = line.line_no;
    lines.push_back(mirror);
  }

  string memo = "Reversal of entry " + to_string(entry_id);
  if (! entry.memo.empty())
    memo += ": " + entry.memo;

  ident_t reversal_id =
    insert_entry(entry.org_id, entry.branch_id, when, memo, source,
                 to_string(entry_id), journal_entry_t::POSTED, user_id,
                 entry_id, lines);

  statement_t stmt(db, "UPDATE journal_entries SET status = 'REVERSED', "
                   "reversed_by_id = ?, reversed_at = ? "
                   "WHERE id = ? AND status = 'POSTED'");
  stmt.bind(1, user_id).bind(2, CURRENT_TIME()).bind(3, entry_id);
  stmt.execute();
  if (db.changes() != 1)
    throw_(invalid_state_error,
           _f("Entry %1% was reversed concurrently") % entry_id);

  xact.commit();

  INFO("Reversed entry " << entry_id << " with entry " << reversal_id
       << " (" << entry_source_name(source) << ") by " << user_id);
  return reversal_id;
}

journal_entry_t journal_t::get_entry(const ident_t entry_id)
{
  statement_t stmt(db, string(entry_columns) + " WHERE id = ?");
  stmt.bind(1, entry_id);
  if (! stmt.step())
    throw_(not_found_error, _f("Journal entry %1% not found") % entry_id);

  journal_entry_t entry = read_entry(stmt);
  read_lines(entry);
  return entry;
}

optional<journal_entry_t>
journal_t::find_by_source(const string&                   org_id,
                          const journal_entry_t::source_t source,
                          const string&                   source_id)
{
  statement_t stmt(db, string(entry_columns) +
                   " WHERE org_id = ? AND source = ? AND source_id = ?");
  stmt.bind(1, org_id).bind(2, entry_source_name(source)).bind(3, source_id);
  if (! stmt.step())
    return none;

  journal_entry_t entry = read_entry(stmt);
  read_lines(entry);
  return entry;
}

entry_page_t journal_t::list_entries(const string&         org_id,
                                     const entry_filter_t& filter,
                                     const page_t&         page)
{
  string where(" WHERE org_id = ?");
  if (filter.from)
    where += " AND date >= ?";
  if (filter.to)
    where += " AND date <= ?";
  if (filter.source)
    where += " AND source = ?";
  if (filter.status)
    where += " AND status = ?";
  if (filter.account_id)
    where += " AND EXISTS (SELECT 1 FROM journal_lines l WHERE "
             "l.entry_id = journal_entries.id AND l.account_id = ?)";
  if (filter.branch_id)
    where += " AND (branch_id = ? OR EXISTS (SELECT 1 FROM journal_lines l "
             "WHERE l.entry_id = journal_entries.id AND l.branch_id = ?))";

  entry_page_t result;

  for (int pass = 0; pass < 2; pass++) {
    string sql = pass == 0
      ? "SELECT COUNT(*) FROM journal_entries" + where
      : entry_columns + where + " ORDER BY date DESC, id DESC LIMIT ? OFFSET ?";

    statement_t stmt(db, sql);
    int n = 1;
    stmt.bind(n++, org_id);
    if (filter.from)
      stmt.bind(n++, *filter.from);
    if (filter.to)
      stmt.bind(n++, *filter.to);
    if (filter.source)
      stmt.bind(n++, entry_source_name(*filter.source));
    if (filter.status)
      stmt.bind(n++, entry_status_name(*filter.status));
    if (filter.account_id)
      stmt.bind(n++, *filter.account_id);
    if (filter.branch_id) {
      stmt.bind(n++, *filter.branch_id);
      stmt.bind(n++, *filter.branch_id);
    }

    if (pass == 0) {
      if (stmt.step())
        result.total = static_cast<std::size_t>(stmt.get_ident(0));
    } else {
      stmt.bind(n++, static_cast<int64_t>(page.limit));
      stmt.bind(n++, static_cast<int64_t>(page.offset));
      while (stmt.step())
        result.entries.push_back(read_entry(stmt));
    }
  }

  foreach (journal_entry_t& entry, result.entries)
    read_lines(entry);

  return result;
}

void journal_t::export_csv(std::ostream& out, const string& org_id,
                           const date_t& from, const date_t& to)
{
  statement_t stmt(db, "SELECT e.date, e.id, e.source, e.source_id, "
                   "e.status, e.memo, a.code, a.name, "
                   "COALESCE(l.branch_id, e.branch_id), l.debit, l.credit "
                   "FROM journal_lines l "
                   "JOIN journal_entries e ON e.id = l.entry_id "
                   "JOIN accounts a ON a.id = l.account_id "
                   "WHERE e.org_id = ? AND e.status <> 'DRAFT' "
                   "AND e.date >= ? AND e.date <= ? "
                   "ORDER BY e.date, e.id, l.line_no");
  stmt.bind(1, org_id).bind(2, from).bind(3, to);

  out << "date,entry,source,source_id,status,memo,account,account_name,"
      << "branch,debit,credit\n";
  while (stmt.step()) {
    out << stmt.get_string(0) << ','
        << stmt.get_ident(1) << ','
        << stmt.get_string(2) << ','
        << csv_quote(stmt.get_string(3)) << ','
        << stmt.get_string(4) << ','
        << csv_quote(stmt.get_string(5)) << ','
        << csv_quote(stmt.get_string(6)) << ','
        << csv_quote(stmt.get_string(7)) << ','
        << csv_quote(stmt.get_string(8)) << ','
        << stmt.get_amount(9) << ','
        << stmt.get_amount(10) << '\n';
  }
}

} // namespace folio
