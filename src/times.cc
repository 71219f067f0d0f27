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

#include "times.h"

namespace folio {

optional<datetime_t> epoch;

namespace {
  const boost::regex iso_date_re("^\\s*(\\d{4})[-/](\\d{1,2})[-/](\\d{1,2})\\s*$");
  const boost::regex dmy_date_re("^\\s*(\\d{1,2})[-/](\\d{1,2})[-/](\\d{4})\\s*$");

  optional<date_t> make_date(const string& year, const string& month,
                             const string& day)
  {
    try {
      return date_t(lexical_cast<unsigned short>(year),
                    lexical_cast<unsigned short>(month),
                    lexical_cast<unsigned short>(day));
    }
    catch (const std::out_of_range&) {
      // gregorian::bad_year, bad_month and bad_day_of_month all derive
      // from std::out_of_range
    }
    catch (const bad_lexical_cast&) {
    }
    return none;
  }
}

optional<date_t> try_parse_date(const string& str)
{
  boost::smatch what;
  if (boost::regex_match(str, what, iso_date_re))
    return make_date(what[1], what[2], what[3]);
  else if (boost::regex_match(str, what, dmy_date_re))
    return make_date(what[3], what[2], what[1]);

  DEBUG("times.parse", "Not a recognized date: " << str);
  return none;
}

date_t parse_date(const string& str)
{
  if (optional<date_t> when = try_parse_date(str))
    return *when;
  throw_(validation_error, _f("Invalid date: %1%") % str);
  return date_t();
}

datetime_t parse_datetime(const string& str)
{
  try {
    string::size_type sep = str.find_first_of("T ");
    if (sep == string::npos)
      return datetime_t(parse_date(str));
    string tmp(str);
    tmp[sep] = ' ';
    return boost::posix_time::time_from_string(tmp);
  }
  catch (const std::out_of_range&) {
  }
  catch (const bad_lexical_cast&) {
  }
  throw_(validation_error, _f("Invalid date/time: %1%") % str);
  return datetime_t();
}

string format_date(const date_t& when)
{
  return boost::gregorian::to_iso_extended_string(when);
}

string format_datetime(const datetime_t& when)
{
  string text = boost::posix_time::to_iso_extended_string(when);
  string::size_type sep = text.find('T');
  if (sep != string::npos)
    text[sep] = ' ';
  string::size_type frac = text.find('.');
  if (frac != string::npos)
    text.erase(frac);
  return text;
}

} // namespace folio
