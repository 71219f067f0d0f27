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

#include "csv.h"

namespace folio {

csv_reader::csv_reader(std::istream& _in) : in(_in), linenum(0)
{
  masks.push_back(std::make_pair(mask_t("date|posted"), FIELD_DATE));
  masks.push_back(std::make_pair(mask_t("debit|withdrawal|paid out"),
                                 FIELD_DEBIT));
  masks.push_back(std::make_pair(mask_t("credit|deposit|paid in"),
                                 FIELD_CREDIT));
  masks.push_back(std::make_pair(mask_t("amount"), FIELD_AMOUNT));
  masks.push_back(std::make_pair(mask_t("desc(ription)?|memo|payee|"
                                        "narrative|details"),
                                 FIELD_DESCRIPTION));
  masks.push_back(std::make_pair(mask_t("ref(erence)?|transaction|txn"),
                                 FIELD_REFERENCE));

  read_index();
}

string csv_reader::read_field(std::istream& line)
{
  string field;

  char c;
  if (line.peek() == '"') {
    line.get(c);
    char x;
    while (line.good() && ! line.eof()) {
      line.get(x);
      if (! line.good())
        break;
      if (x == '"' && line.peek() == '"') {
        line.get(x);
      }
      else if (x == '"') {
        if (line.peek() == ',')
          line.get(c);
        break;
      }
      field += x;
    }
  }
  else {
    while (line.good() && ! line.eof()) {
      line.get(c);
      if (line.good()) {
        if (c == ',')
          break;
        if (c != '\r')
          field += c;
      }
    }
  }
  trim(field);
  return field;
}

bool csv_reader::next_line()
{
  while (std::getline(in, linebuf)) {
    linenum++;
    if (! linebuf.empty() && linebuf[linebuf.length() - 1] == '\r')
      linebuf.erase(linebuf.length() - 1);
    if (trim_copy(linebuf).empty() || linebuf[0] == '#')
      continue;
    return true;
  }
  return false;
}

void csv_reader::read_index()
{
  if (! next_line())
    throw_(invalid_format_error, _("The statement is empty"));

  std::istringstream instr(linebuf);

  while (instr.good() && ! instr.eof()) {
    string field = read_field(instr);
    names.push_back(field);

    headers_t kind = FIELD_UNKNOWN;
    typedef std::pair<mask_t, headers_t> mask_pair;
    foreach (const mask_pair& mask, masks) {
      if (mask.first.match(field)) {
        kind = mask.second;
        break;
      }
    }
    index.push_back(has_field(kind) ? FIELD_UNKNOWN : kind);

    DEBUG("csv.parse", "Header field: " << field);
  }

  if (! has_field(FIELD_DATE))
    throw_(invalid_format_error,
           _f("The statement header has no date column: %1%") % linebuf);
  if (! has_field(FIELD_AMOUNT) && ! has_field(FIELD_DEBIT) &&
      ! has_field(FIELD_CREDIT))
    throw_(invalid_format_error,
           _f("The statement header has no amount, debit or credit "
              "column: %1%") % linebuf);
}

optional<statement_row_t> csv_reader::read_row()
{
  if (! next_line())
    return none;

  std::istringstream instr(linebuf);

  statement_row_t    row;
  bool               have_date = false;
  optional<amount_t> amount;
  optional<amount_t> debit;
  optional<amount_t> credit;

  row.linenum = linenum;

  try {
    for (std::size_t n = 0; n < index.size() && instr.good(); n++) {
      string field = read_field(instr);

      switch (index[n]) {
      case FIELD_DATE:
        if (optional<date_t> when = try_parse_date(field)) {
          row.date  = *when;
          have_date = true;
        } else {
          throw_(invalid_format_error,
                 _f("unrecognized date '%1%'") % field);
        }
        break;

      case FIELD_AMOUNT:
        amount = parse_money(field);
        break;

      case FIELD_DEBIT:
        debit = parse_money(field);
        break;

      case FIELD_CREDIT:
        credit = parse_money(field);
        break;

      case FIELD_DESCRIPTION:
        row.description = field;
        break;

      case FIELD_REFERENCE:
        if (! field.empty())
          row.reference = field;
        break;

      case FIELD_UNKNOWN:
        break;
      }
    }
  }
  catch (const invalid_format_error& err) {
    throw_(invalid_format_error,
           _f("Line %1%: %2%") % linenum % err.what());
  }

  if (! have_date)
    throw_(invalid_format_error, _f("Line %1% has no date") % linenum);

  if (amount) {
    row.amount = *amount;
  }
  else if (debit || credit) {
    row.amount = (credit ? *credit : amount_t()) -
                 (debit ? debit->abs() : amount_t());
  }
  else {
    throw_(invalid_format_error, _f("Line %1% has no amount") % linenum);
  }

  DEBUG("csv.parse", "Row " << linenum << ": " << format_date(row.date)
        << ' ' << row.amount << ' ' << row.description);
  return row;
}

optional<amount_t> parse_money(const string& field)
{
  string digits;
  bool   negative = false;

  foreach (char c, field) {
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.')
      digits += c;
    else if (c == '-')
      negative = ! negative;
    else if (c == '(' || c == ')')
      negative = true;
  }

  if (digits.empty()) {
    if (trim_copy(field).empty())
      return none;
    throw_(invalid_format_error, _f("unrecognized amount '%1%'") % field);
  }

  amount_t amt;
  try {
    amt.parse(digits);
  }
  catch (const validation_error&) {
    throw_(invalid_format_error, _f("unrecognized amount '%1%'") % field);
  }
  if (negative)
    amt.in_place_negate();
  return amt;
}

statement_rows_t parse_statement(const string& text)
{
  std::istringstream in(text);
  csv_reader         reader(in);

  statement_rows_t rows;
  while (optional<statement_row_t> row = reader.read_row())
    rows.push_back(*row);

  if (rows.empty())
    throw_(invalid_format_error,
           _("The statement has a header but no transactions"));

  DEBUG("csv.parse", "Read " << rows.size() << " statement rows");
  return rows;
}

} // namespace folio
