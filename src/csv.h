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
 * @file   csv.h
 *
 * @ingroup data
 *
 * @brief Reading bank statements exported as CSV.
 *
 * The first line names the columns, in any order.  Recognized headings
 * are matched loosely: a date or posted date, an amount or separate debit
 * and credit columns, a description or memo, and a reference or
 * transaction id.  Other columns are ignored.
 */
#pragma once

#include "mask.h"
#include "amount.h"
#include "times.h"

namespace folio {

struct statement_row_t
{
  date_t           date;
  amount_t         amount;      // money in is positive
  string           description;
  optional<string> reference;
  std::size_t      linenum;

  statement_row_t() : linenum(0) {}
};

typedef std::vector<statement_row_t> statement_rows_t;

class csv_reader
{
  enum headers_t {
    FIELD_DATE = 0,
    FIELD_AMOUNT,
    FIELD_DEBIT,
    FIELD_CREDIT,
    FIELD_DESCRIPTION,
    FIELD_REFERENCE,

    FIELD_UNKNOWN
  };

  std::istream& in;
  std::size_t   linenum;
  string        linebuf;

  std::vector<std::pair<mask_t, headers_t> > masks;

  std::vector<headers_t> index;
  std::vector<string>    names;

  bool has_field(headers_t field) const {
    return std::find(index.begin(), index.end(), field) != index.end();
  }

public:
  explicit csv_reader(std::istream& _in);

  void   read_index();
  string read_field(std::istream& line);
  bool   next_line();

  /** The next row, or none at the end of the statement. */
  optional<statement_row_t> read_row();

  std::size_t get_linenum() const {
    return linenum;
  }
};

/**
 * Parse a money amount as banks print it: currency symbols, letters,
 * blanks and thousands separators are dropped, and parentheses mean a
 * negative amount.  A blank field yields none.
 */
optional<amount_t> parse_money(const string& field);

/**
 * Read a whole statement.  Empty input, a header without rows, and
 * unreadable dates or amounts raise invalid_format_error.
 */
statement_rows_t parse_statement(const string& text);

} // namespace folio
