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
 * @file   utils.h
 *
 * @ingroup util
 *
 * @brief General utility facilities used by folio
 */
#pragma once

#include <system.hh>

/**
 * @name Forward declarations
 */
/*@{*/

namespace folio {
  using namespace boost;

  typedef std::string            string;
  typedef std::list<string>      strings_list;
  typedef std::vector<string>    strings_vector;

  typedef posix_time::ptime         ptime;
  typedef ptime::time_duration_type time_duration;
  typedef gregorian::date           date;
  typedef gregorian::date_duration  date_duration;

  typedef int64_t ident_t;
}

/*@}*/

/**
 * @name Assertions
 */
/*@{*/

#ifdef assert
#undef assert
#endif

#if !NO_ASSERTS

namespace folio {
  void debug_assert(const string& reason, const string& func,
                    const string& file, std::size_t line);
}

#define assert(x)                                               \
  ((x) ? ((void)0) : folio::debug_assert(#x, BOOST_CURRENT_FUNCTION, \
                                         __FILE__, __LINE__))

#else // !NO_ASSERTS

#define assert(x) ((void)(x))

#endif // !NO_ASSERTS

/*@}*/

/**
 * @name String helpers
 */
/*@{*/

namespace folio {

extern string empty_string;

inline string to_string(long num) {
  std::ostringstream buf;
  buf << num;
  return buf.str();
}

inline string to_string(long long num) {
  std::ostringstream buf;
  buf << num;
  return buf.str();
}

inline string lowered(const string& str) {
  string tmp(str);
  to_lower(tmp);
  return tmp;
}

inline string uppered(const string& str) {
  string tmp(str);
  to_upper(tmp);
  return tmp;
}

/**
 * Quote a field for CSV output, doubling embedded quotes.  Fields without
 * separators, quotes or newlines are written bare.
 */
string csv_quote(const string& field);

} // namespace folio

/*@}*/

/**
 * @name Tracing and logging
 */
/*@{*/

#if LOGGING_ON

namespace folio {

enum log_level_t {
  LOG_OFF = 0,
  LOG_CRIT,
  LOG_FATAL,
  LOG_ASSERT,
  LOG_ERROR,
  LOG_VERIFY,
  LOG_WARN,
  LOG_INFO,
  LOG_EXCEPT,
  LOG_DEBUG,
  LOG_TRACE,
  LOG_ALL
};

extern log_level_t        _log_level;
extern std::ostream *     _log_stream;
extern thread_local std::ostringstream _log_buffer;

void logger_func(log_level_t level);

optional<log_level_t> string_to_log_level(const string& name);

#if DEBUG_ON

extern optional<std::string>  _log_category;
extern optional<boost::regex> _log_category_re;

inline bool category_matches(const char * cat) {
  if (_log_category) {
    if (! _log_category_re) {
      _log_category_re =
        boost::regex(_log_category->c_str(),
                     boost::regex::perl | boost::regex::icase);
    }
    return boost::regex_search(cat, *_log_category_re);
  }
  return false;
}

#define SHOW_DEBUG(cat) \
  (folio::_log_level >= folio::LOG_DEBUG && folio::category_matches(cat))

#define DEBUG(cat, msg) \
  (SHOW_DEBUG(cat) ? \
   ((folio::_log_buffer << msg), \
    folio::logger_func(folio::LOG_DEBUG)) : (void)0)

#else // DEBUG_ON

#define SHOW_DEBUG(cat) false
#define DEBUG(cat, msg)

#endif // DEBUG_ON

#define LOG_MACRO(level, msg) \
  (folio::_log_level >= level ? \
   ((folio::_log_buffer << msg), folio::logger_func(level)) : (void)0)

#define INFO(msg)      LOG_MACRO(folio::LOG_INFO, msg)
#define WARN(msg)      LOG_MACRO(folio::LOG_WARN, msg)
#define ERROR(msg)     LOG_MACRO(folio::LOG_ERROR, msg)

} // namespace folio

#else // ! LOGGING_ON

#define SHOW_DEBUG(cat) false

#define DEBUG(cat, msg)
#define INFO(msg)
#define WARN(msg)
#define ERROR(msg)

#endif // LOGGING_ON

/*@}*/

/*
 * These files define the other internal facilities.
 */

#include "error.h"

/**
 * @name General utility functions
 */
/*@{*/

#define foreach BOOST_FOREACH

namespace folio {

template <typename T, typename U>
inline T& downcast(U& object) {
  return *polymorphic_downcast<T *>(&object);
}

inline char * skip_ws(char * ptr) {
  while (*ptr == ' ' || *ptr == '\t' || *ptr == '\n')
    ptr++;
  return ptr;
}

} // namespace folio

/*@}*/
