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

#include "database.h"

namespace folio {

namespace {
  const char * schema_statements[] = {
    "CREATE TABLE IF NOT EXISTS accounts ("
    "  id        INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id    TEXT NOT NULL,"
    "  code      TEXT NOT NULL,"
    "  name      TEXT NOT NULL,"
    "  type      TEXT NOT NULL CHECK (type IN ('ASSET','LIABILITY','EQUITY',"
    "                                          'REVENUE','COGS','EXPENSE')),"
    "  parent_id INTEGER REFERENCES accounts(id),"
    "  is_active INTEGER NOT NULL DEFAULT 1,"
    "  UNIQUE (org_id, code))",

    "CREATE TABLE IF NOT EXISTS journal_entries ("
    "  id                INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id            TEXT NOT NULL,"
    "  branch_id         TEXT,"
    "  date              TEXT NOT NULL,"
    "  memo              TEXT NOT NULL DEFAULT '',"
    "  source            TEXT NOT NULL,"
    "  source_id         TEXT,"
    "  status            TEXT NOT NULL CHECK (status IN ('DRAFT','POSTED','REVERSED')),"
    "  created_by_id     TEXT,"
    "  created_at        TEXT NOT NULL,"
    "  posted_by_id      TEXT,"
    "  posted_at         TEXT,"
    "  reverses_entry_id INTEGER REFERENCES journal_entries(id),"
    "  reversed_by_id    TEXT,"
    "  reversed_at       TEXT)",

    "CREATE UNIQUE INDEX IF NOT EXISTS journal_entries_source_idx"
    "  ON journal_entries (org_id, source, source_id)"
    "  WHERE source_id IS NOT NULL",

    "CREATE UNIQUE INDEX IF NOT EXISTS journal_entries_reverses_idx"
    "  ON journal_entries (reverses_entry_id)"
    "  WHERE reverses_entry_id IS NOT NULL",

    "CREATE INDEX IF NOT EXISTS journal_entries_org_date_idx"
    "  ON journal_entries (org_id, date)",

    "CREATE TABLE IF NOT EXISTS journal_lines ("
    "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  entry_id   INTEGER NOT NULL REFERENCES journal_entries(id) ON DELETE CASCADE,"
    "  line_no    INTEGER NOT NULL,"
    "  account_id INTEGER NOT NULL REFERENCES accounts(id),"
    "  branch_id  TEXT,"
    "  debit      TEXT NOT NULL,"
    "  credit     TEXT NOT NULL,"
    "  UNIQUE (entry_id, line_no))",

    "CREATE INDEX IF NOT EXISTS journal_lines_account_idx"
    "  ON journal_lines (account_id)",

    "CREATE TABLE IF NOT EXISTS fiscal_periods ("
    "  id           INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id       TEXT NOT NULL,"
    "  name         TEXT NOT NULL,"
    "  starts_at    TEXT NOT NULL,"
    "  ends_at      TEXT NOT NULL,"
    "  status       TEXT NOT NULL CHECK (status IN ('OPEN','CLOSED','LOCKED')),"
    "  closed_by_id TEXT,"
    "  closed_at    TEXT,"
    "  locked_by_id TEXT,"
    "  locked_at    TEXT,"
    "  CHECK (starts_at <= ends_at))",

    "CREATE TABLE IF NOT EXISTS period_events ("
    "  id        INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  period_id INTEGER NOT NULL REFERENCES fiscal_periods(id),"
    "  event     TEXT NOT NULL,"
    "  user_id   TEXT,"
    "  reason    TEXT,"
    "  at        TEXT NOT NULL)",

    "CREATE TABLE IF NOT EXISTS payment_method_mappings ("
    "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id     TEXT NOT NULL,"
    "  method     TEXT NOT NULL,"
    "  account_id INTEGER NOT NULL REFERENCES accounts(id),"
    "  UNIQUE (org_id, method))",

    "CREATE TABLE IF NOT EXISTS vendors ("
    "  id            INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id        TEXT NOT NULL,"
    "  name          TEXT NOT NULL,"
    "  email         TEXT,"
    "  phone         TEXT,"
    "  default_terms TEXT)",

    "CREATE TABLE IF NOT EXISTS customers ("
    "  id           INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id       TEXT NOT NULL,"
    "  name         TEXT NOT NULL,"
    "  email        TEXT,"
    "  phone        TEXT,"
    "  credit_limit TEXT)",

    "CREATE TABLE IF NOT EXISTS vendor_bills ("
    "  id                 INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id             TEXT NOT NULL,"
    "  vendor_id          INTEGER NOT NULL REFERENCES vendors(id),"
    "  number             TEXT,"
    "  bill_date          TEXT NOT NULL,"
    "  due_date           TEXT NOT NULL,"
    "  subtotal           TEXT NOT NULL,"
    "  tax                TEXT,"
    "  total              TEXT NOT NULL,"
    "  paid_amount        TEXT NOT NULL DEFAULT '0.00',"
    "  status             TEXT NOT NULL,"
    "  memo               TEXT,"
    "  expense_account_id INTEGER REFERENCES accounts(id),"
    "  journal_entry_id   INTEGER REFERENCES journal_entries(id),"
    "  opened_by_id       TEXT,"
    "  opened_at          TEXT)",

    "CREATE TABLE IF NOT EXISTS vendor_payments ("
    "  id               INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id           TEXT NOT NULL,"
    "  vendor_id        INTEGER NOT NULL REFERENCES vendors(id),"
    "  bill_id          INTEGER REFERENCES vendor_bills(id),"
    "  amount           TEXT NOT NULL,"
    "  paid_at          TEXT NOT NULL,"
    "  method           TEXT NOT NULL,"
    "  ref              TEXT,"
    "  memo             TEXT,"
    "  journal_entry_id INTEGER REFERENCES journal_entries(id))",

    "CREATE TABLE IF NOT EXISTS customer_invoices ("
    "  id                 INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id             TEXT NOT NULL,"
    "  customer_id        INTEGER NOT NULL REFERENCES customers(id),"
    "  number             TEXT,"
    "  invoice_date       TEXT NOT NULL,"
    "  due_date           TEXT NOT NULL,"
    "  subtotal           TEXT NOT NULL,"
    "  tax                TEXT,"
    "  total              TEXT NOT NULL,"
    "  paid_amount        TEXT NOT NULL DEFAULT '0.00',"
    "  status             TEXT NOT NULL,"
    "  memo               TEXT,"
    "  revenue_account_id INTEGER REFERENCES accounts(id),"
    "  journal_entry_id   INTEGER REFERENCES journal_entries(id),"
    "  opened_by_id       TEXT,"
    "  opened_at          TEXT)",

    "CREATE TABLE IF NOT EXISTS customer_receipts ("
    "  id               INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id           TEXT NOT NULL,"
    "  customer_id      INTEGER NOT NULL REFERENCES customers(id),"
    "  invoice_id       INTEGER REFERENCES customer_invoices(id),"
    "  amount           TEXT NOT NULL,"
    "  received_at      TEXT NOT NULL,"
    "  method           TEXT NOT NULL,"
    "  ref              TEXT,"
    "  memo             TEXT,"
    "  journal_entry_id INTEGER REFERENCES journal_entries(id))",

    "CREATE TABLE IF NOT EXISTS vendor_credit_notes ("
    "  id               INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id           TEXT NOT NULL,"
    "  party_id         INTEGER NOT NULL REFERENCES vendors(id),"
    "  number           TEXT,"
    "  credit_date      TEXT NOT NULL,"
    "  amount           TEXT NOT NULL,"
    "  allocated_amount TEXT NOT NULL DEFAULT '0.00',"
    "  refunded_amount  TEXT NOT NULL DEFAULT '0.00',"
    "  status           TEXT NOT NULL,"
    "  reason           TEXT,"
    "  memo             TEXT,"
    "  journal_entry_id INTEGER REFERENCES journal_entries(id),"
    "  opened_by_id     TEXT,"
    "  opened_at        TEXT)",

    "CREATE TABLE IF NOT EXISTS vendor_credit_allocations ("
    "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  credit_note_id INTEGER NOT NULL REFERENCES vendor_credit_notes(id),"
    "  document_id    INTEGER NOT NULL REFERENCES vendor_bills(id),"
    "  amount         TEXT NOT NULL,"
    "  applied_at     TEXT NOT NULL,"
    "  applied_by_id  TEXT)",

    "CREATE TABLE IF NOT EXISTS vendor_credit_refunds ("
    "  id               INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  credit_note_id   INTEGER NOT NULL REFERENCES vendor_credit_notes(id),"
    "  amount           TEXT NOT NULL,"
    "  refund_date      TEXT NOT NULL,"
    "  method           TEXT NOT NULL,"
    "  ref              TEXT,"
    "  memo             TEXT,"
    "  journal_entry_id INTEGER REFERENCES journal_entries(id))",

    "CREATE TABLE IF NOT EXISTS customer_credit_notes ("
    "  id               INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id           TEXT NOT NULL,"
    "  party_id         INTEGER NOT NULL REFERENCES customers(id),"
    "  number           TEXT,"
    "  credit_date      TEXT NOT NULL,"
    "  amount           TEXT NOT NULL,"
    "  allocated_amount TEXT NOT NULL DEFAULT '0.00',"
    "  refunded_amount  TEXT NOT NULL DEFAULT '0.00',"
    "  status           TEXT NOT NULL,"
    "  reason           TEXT,"
    "  memo             TEXT,"
    "  journal_entry_id INTEGER REFERENCES journal_entries(id),"
    "  opened_by_id     TEXT,"
    "  opened_at        TEXT)",

    "CREATE TABLE IF NOT EXISTS customer_credit_allocations ("
    "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  credit_note_id INTEGER NOT NULL REFERENCES customer_credit_notes(id),"
    "  document_id    INTEGER NOT NULL REFERENCES customer_invoices(id),"
    "  amount         TEXT NOT NULL,"
    "  applied_at     TEXT NOT NULL,"
    "  applied_by_id  TEXT)",

    "CREATE TABLE IF NOT EXISTS customer_credit_refunds ("
    "  id               INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  credit_note_id   INTEGER NOT NULL REFERENCES customer_credit_notes(id),"
    "  amount           TEXT NOT NULL,"
    "  refund_date      TEXT NOT NULL,"
    "  method           TEXT NOT NULL,"
    "  ref              TEXT,"
    "  memo             TEXT,"
    "  journal_entry_id INTEGER REFERENCES journal_entries(id))",

    "CREATE TABLE IF NOT EXISTS bank_accounts ("
    "  id            INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  org_id        TEXT NOT NULL,"
    "  name          TEXT NOT NULL,"
    "  number        TEXT,"
    "  gl_account_id INTEGER REFERENCES accounts(id),"
    "  UNIQUE (org_id, name))",

    "CREATE TABLE IF NOT EXISTS bank_txns ("
    "  id              INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  bank_account_id INTEGER NOT NULL REFERENCES bank_accounts(id),"
    "  posted_at       TEXT NOT NULL,"
    "  amount          TEXT NOT NULL,"
    "  description     TEXT NOT NULL DEFAULT '',"
    "  reference       TEXT,"
    "  reconciled      INTEGER NOT NULL DEFAULT 0,"
    "  imported_at     TEXT NOT NULL)",

    "CREATE TABLE IF NOT EXISTS reconcile_matches ("
    "  id            INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  bank_txn_id   INTEGER NOT NULL UNIQUE REFERENCES bank_txns(id),"
    "  source        TEXT NOT NULL CHECK (source IN ('PAYMENT','REFUND',"
    "                                       'CASH_SAFE_DROP','CASH_PICKUP')),"
    "  source_id     TEXT NOT NULL,"
    "  matched_by_id TEXT,"
    "  matched_at    TEXT NOT NULL,"
    "  automatic     INTEGER NOT NULL DEFAULT 0)",

    "CREATE TABLE IF NOT EXISTS settlements ("
    "  id          TEXT NOT NULL,"
    "  org_id      TEXT NOT NULL,"
    "  kind        TEXT NOT NULL CHECK (kind IN ('PAYMENT','REFUND',"
    "                                     'CASH_SAFE_DROP','CASH_PICKUP')),"
    "  amount      TEXT NOT NULL,"
    "  status      TEXT NOT NULL,"
    "  occurred_on TEXT NOT NULL,"
    "  PRIMARY KEY (org_id, kind, id))"
  };
}

database_t::database_t(const string& _pathname, int busy_timeout_ms)
  : db(NULL), pathname(_pathname), depth(0)
{
  int rc = sqlite3_open_v2(pathname.c_str(), &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                           SQLITE_OPEN_NOMUTEX, NULL);
  if (rc != SQLITE_OK) {
    string message(db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (db)
      sqlite3_close(db);
    db = NULL;
    throw_(database_error,
           _f("Cannot open database '%1%': %2%") % pathname % message);
  }

  sqlite3_busy_timeout(db, busy_timeout_ms);
  exec("PRAGMA foreign_keys = ON");

  INFO("Opened database " << pathname);
}

database_t::~database_t()
{
  if (db) {
    if (depth > 0)
      sqlite3_exec(db, "ROLLBACK", NULL, NULL, NULL);
    sqlite3_close(db);
  }
}

void database_t::check(int rc, const string& what) const
{
  if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
    throw_(database_error,
           _f("%1% failed: %2%") % what % sqlite3_errmsg(db));
}

void database_t::exec(const string& sql)
{
  char * errmsg = NULL;
  int    rc     = sqlite3_exec(db, sql.c_str(), NULL, NULL, &errmsg);
  if (rc != SQLITE_OK) {
    string message(errmsg ? errmsg : sqlite3_errstr(rc));
    sqlite3_free(errmsg);
    throw_(database_error, _f("SQL failed: %1% [%2%]") % message % sql);
  }
  DEBUG("db.exec", sql);
}

ident_t database_t::last_insert_id() const
{
  return static_cast<ident_t>(sqlite3_last_insert_rowid(db));
}

int database_t::changes() const
{
  return sqlite3_changes(db);
}

void database_t::create_schema()
{
  transaction_t xact(*this);
  foreach (const char * sql, schema_statements)
    exec(sql);
  xact.commit();
}

void database_t::begin()
{
  if (depth == 0)
    exec("BEGIN IMMEDIATE");
  else
    exec("SAVEPOINT sp" + to_string(static_cast<long>(depth)));
  ++depth;
}

void database_t::commit()
{
  assert(depth > 0);
  if (depth == 1)
    exec("COMMIT");
  else
    exec("RELEASE sp" + to_string(static_cast<long>(depth - 1)));
  --depth;
}

void database_t::rollback()
{
  assert(depth > 0);
  --depth;
  if (depth == 0) {
    exec("ROLLBACK");
  } else {
    string name("sp" + to_string(static_cast<long>(depth)));
    exec("ROLLBACK TO " + name);
    exec("RELEASE " + name);
  }
}

statement_t::statement_t(database_t& _db, const string& _sql)
  : db(_db), stmt(NULL), sql(_sql)
{
  int rc = sqlite3_prepare_v2(db.handle(), sql.c_str(),
                              static_cast<int>(sql.length()), &stmt, NULL);
  if (rc != SQLITE_OK)
    throw_(database_error,
           _f("Cannot prepare statement: %1% [%2%]")
           % sqlite3_errmsg(db.handle()) % sql);
}

statement_t::~statement_t()
{
  sqlite3_finalize(stmt);
}

statement_t& statement_t::bind(int index, const string& value)
{
  db.check(sqlite3_bind_text(stmt, index, value.c_str(),
                             static_cast<int>(value.length()),
                             SQLITE_TRANSIENT), "bind");
  return *this;
}

statement_t& statement_t::bind(int index, const int64_t value)
{
  db.check(sqlite3_bind_int64(stmt, index,
                              static_cast<sqlite3_int64>(value)), "bind");
  return *this;
}

statement_t& statement_t::bind(int index, const amount_t& value)
{
  return bind(index, value.to_fullstring());
}

statement_t& statement_t::bind(int index, const date_t& value)
{
  return bind(index, format_date(value));
}

statement_t& statement_t::bind(int index, const datetime_t& value)
{
  return bind(index, format_datetime(value));
}

statement_t& statement_t::bind_null(int index)
{
  db.check(sqlite3_bind_null(stmt, index), "bind");
  return *this;
}

bool statement_t::step()
{
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;

  throw_(database_error,
         _f("Statement failed: %1% [%2%]") % sqlite3_errmsg(db.handle()) % sql);
  return false;
}

void statement_t::execute()
{
  while (step())
    ;
  DEBUG("db.exec", sql);
}

void statement_t::reset()
{
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
}

bool statement_t::is_null(int column) const
{
  return sqlite3_column_type(stmt, column) == SQLITE_NULL;
}

string statement_t::get_string(int column) const
{
  const unsigned char * text = sqlite3_column_text(stmt, column);
  if (! text)
    return empty_string;
  return string(reinterpret_cast<const char *>(text),
                static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

ident_t statement_t::get_ident(int column) const
{
  return static_cast<ident_t>(sqlite3_column_int64(stmt, column));
}

int statement_t::get_int(int column) const
{
  return sqlite3_column_int(stmt, column);
}

bool statement_t::get_bool(int column) const
{
  return sqlite3_column_int(stmt, column) != 0;
}

amount_t statement_t::get_amount(int column) const
{
  if (is_null(column))
    return amount_t();
  return amount_t(get_string(column));
}

date_t statement_t::get_date(int column) const
{
  return parse_date(get_string(column));
}

datetime_t statement_t::get_datetime(int column) const
{
  return parse_datetime(get_string(column));
}

optional<string> statement_t::get_optional_string(int column) const
{
  if (is_null(column))
    return none;
  return get_string(column);
}

optional<ident_t> statement_t::get_optional_ident(int column) const
{
  if (is_null(column))
    return none;
  return get_ident(column);
}

optional<amount_t> statement_t::get_optional_amount(int column) const
{
  if (is_null(column))
    return none;
  return get_amount(column);
}

optional<date_t> statement_t::get_optional_date(int column) const
{
  if (is_null(column))
    return none;
  return get_date(column);
}

optional<datetime_t> statement_t::get_optional_datetime(int column) const
{
  if (is_null(column))
    return none;
  return get_datetime(column);
}

transaction_t::transaction_t(database_t& _db) : db(_db), finished(false)
{
  db.begin();
}

transaction_t::~transaction_t()
{
  if (! finished) {
    try {
      db.rollback();
    }
    catch (const database_error& err) {
      ERROR("Rollback failed: " << err.what());
    }
  }
}

void transaction_t::commit()
{
  // A failed COMMIT leaves the transaction open; the destructor rolls it
  // back.
  db.commit();
  finished = true;
}

} // namespace folio
