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
 * @file   database.h
 *
 * @ingroup data
 *
 * @brief The relational store every ledger table lives in.
 *
 * database_t owns one SQLite connection.  All mutations run inside a
 * transaction_t guard: the outermost guard issues BEGIN IMMEDIATE, which
 * takes the database write lock up front, so two writers racing to pay
 * the same bill serialize and the second one re-reads what the first
 * committed.  Inner guards become savepoints, which lets one service call
 * another (opening a bill posts a journal entry) inside a single atomic
 * unit.
 *
 * A connection and its transaction depth belong to one thread.  Threads
 * that write concurrently each open their own session; the database lock
 * serializes them.
 */
#pragma once

#include "amount.h"
#include "times.h"

namespace folio {

class transaction_t;

class database_t : public noncopyable
{
  friend class transaction_t;

  sqlite3 *   db;
  string      pathname;
  std::size_t depth;

  void begin();
  void commit();
  void rollback();

public:
  explicit database_t(const string& _pathname, int busy_timeout_ms = 5000);
  ~database_t();

  sqlite3 * handle() {
    return db;
  }
  const string& path() const {
    return pathname;
  }
  bool in_transaction() const {
    return depth > 0;
  }

  void exec(const string& sql);

  ident_t last_insert_id() const;
  int     changes() const;

  /** Create every table and index that does not exist yet. */
  void create_schema();

  void check(int rc, const string& what) const;
};

/**
 * @brief A prepared statement with typed binds and column accessors.
 *
 * Parameters are numbered from 1 and columns from 0, as in SQLite.
 */
class statement_t : public noncopyable
{
  database_t&    db;
  sqlite3_stmt * stmt;
  string         sql;

public:
  statement_t(database_t& _db, const string& _sql);
  ~statement_t();

  statement_t& bind(int index, const string& value);
  statement_t& bind(int index, const char * value) {
    return bind(index, string(value));
  }
  statement_t& bind(int index, const int64_t value);
  statement_t& bind(int index, const int value) {
    return bind(index, static_cast<int64_t>(value));
  }
  statement_t& bind(int index, const bool value) {
    return bind(index, static_cast<int64_t>(value ? 1 : 0));
  }
  statement_t& bind(int index, const amount_t& value);
  statement_t& bind(int index, const date_t& value);
  statement_t& bind(int index, const datetime_t& value);
  statement_t& bind_null(int index);

  template <typename T>
  statement_t& bind(int index, const optional<T>& value) {
    if (value)
      return bind(index, *value);
    return bind_null(index);
  }

  /** Advance to the next row; false once the result set is exhausted. */
  bool step();

  /** Run a statement that returns no rows. */
  void execute();

  void reset();

  bool       is_null(int column) const;
  string     get_string(int column) const;
  ident_t    get_ident(int column) const;
  int        get_int(int column) const;
  bool       get_bool(int column) const;
  amount_t   get_amount(int column) const;
  date_t     get_date(int column) const;
  datetime_t get_datetime(int column) const;

  optional<string>     get_optional_string(int column) const;
  optional<ident_t>    get_optional_ident(int column) const;
  optional<amount_t>   get_optional_amount(int column) const;
  optional<date_t>     get_optional_date(int column) const;
  optional<datetime_t> get_optional_datetime(int column) const;
};

/**
 * @brief RAII guard around one atomic unit of work.
 *
 * Destroying a guard that was not committed rolls the unit back, which
 * is how any exception thrown part way through a mutation leaves the
 * store untouched.
 */
class transaction_t : public noncopyable
{
  database_t& db;
  bool        finished;

public:
  explicit transaction_t(database_t& _db);
  ~transaction_t();

  void commit();
};

} // namespace folio
