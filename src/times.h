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
 * @addtogroup util
 */

/**
 * @file   times.h
 *
 * @ingroup util
 *
 * @brief datetime_t and date_t objects
 */
#pragma once

#include "utils.h"

namespace folio {

typedef boost::posix_time::ptime        datetime_t;
typedef datetime_t::time_duration_type  time_duration_t;

inline bool is_valid(const datetime_t& moment) {
  return ! moment.is_not_a_date_time();
}

typedef boost::gregorian::date          date_t;

inline bool is_valid(const date_t& moment) {
  return ! moment.is_not_a_date();
}

/**
 * When set, the current moment is pinned to this value.  Reports that are
 * relative to "today" (aging, default as-of dates) consult it.
 */
extern optional<datetime_t> epoch;

#define TRUE_CURRENT_TIME() (boost::posix_time::second_clock::local_time())
#define CURRENT_TIME()      (epoch ? *epoch : TRUE_CURRENT_TIME())
#define CURRENT_DATE() \
  (epoch ? epoch->date() : boost::gregorian::day_clock::local_day())

/**
 * Parse a calendar date in any of the accepted layouts:
 * YYYY-MM-DD, YYYY/MM/DD, DD/MM/YYYY and DD-MM-YYYY.  Returns none when
 * the text is not a date.
 */
optional<date_t> try_parse_date(const string& str);

date_t parse_date(const string& str);

inline date_t parse_date(const char * str) {
  return parse_date(string(str));
}

datetime_t parse_datetime(const string& str);

/** ISO-8601 extended form, which is also the storage form. */
string format_date(const date_t& when);
string format_datetime(const datetime_t& when);

/** Whole days from `from' to `to'; negative when `to' is earlier. */
inline long days_between(const date_t& from, const date_t& to) {
  return static_cast<long>((to - from).days());
}

} // namespace folio
