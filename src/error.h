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
 * @file   error.h
 *
 * @ingroup util
 *
 * @brief The error taxonomy reported by every ledger operation.
 */
#pragma once

namespace folio {

extern thread_local std::ostringstream _desc_buffer;

template <typename T>
inline void throw_func(const string& message) {
  _desc_buffer.clear();
  _desc_buffer.str("");
  throw T(message);
}

#define throw_(cls, msg)                        \
  ((_desc_buffer << (msg)),                     \
   throw_func<cls>(_desc_buffer.str()))

inline void warning_func(const string& message) {
  WARN(message);
  _desc_buffer.clear();
  _desc_buffer.str("");
}

#define warning_(msg)                           \
  ((_desc_buffer << (msg)),                     \
   warning_func(_desc_buffer.str()))

#define DECLARE_EXCEPTION(name, kind)                           \
  class name : public kind {                                    \
  public:                                                       \
  explicit name(const string& why) throw() : kind(why) {}       \
  virtual ~name() throw() {}                                    \
  }

/**
 * @brief Base class of every error a ledger operation raises.
 *
 * kind() names the failure class, so that an outer layer may map it onto
 * its own status codes without a chain of catch clauses.
 */
class ledger_error : public std::runtime_error
{
public:
  explicit ledger_error(const string& why) throw()
    : std::runtime_error(why) {}
  virtual ~ledger_error() throw() {}

  virtual const char * kind() const throw() {
    return "ledger_error";
  }
};

#define DECLARE_LEDGER_ERROR(name)                              \
  class name : public ledger_error {                            \
  public:                                                       \
  explicit name(const string& why) throw() : ledger_error(why) {} \
  virtual ~name() throw() {}                                    \
  virtual const char * kind() const throw() { return #name; }   \
  }

DECLARE_LEDGER_ERROR(validation_error);
DECLARE_LEDGER_ERROR(unbalanced_entry_error);
DECLARE_LEDGER_ERROR(invalid_state_error);
DECLARE_LEDGER_ERROR(period_locked_error);
DECLARE_LEDGER_ERROR(not_found_error);
DECLARE_LEDGER_ERROR(insufficient_balance_error);
DECLARE_LEDGER_ERROR(missing_account_mapping_error);
DECLARE_LEDGER_ERROR(duplicate_overlap_error);
DECLARE_LEDGER_ERROR(forbidden_error);
DECLARE_LEDGER_ERROR(invalid_format_error);
DECLARE_LEDGER_ERROR(database_error);

} // namespace folio
