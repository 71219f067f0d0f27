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
 * @file   config.h
 *
 * @ingroup util
 *
 * @brief Settings read from an INI file and the command line.
 */
#pragma once

#include "amount.h"

namespace folio {

/**
 * @brief Account codes of the fixed posting map.
 *
 * System-generated postings resolve their accounts through these codes,
 * looked up in the posting organization's chart at call time.
 */
struct posting_map_t
{
  string cash;
  string accounts_receivable;
  string inventory;
  string accounts_payable;
  string tax_payable;
  string equity;
  string sales;
  string cogs;
  string expense;

  posting_map_t()
    : cash("1000"), accounts_receivable("1100"), inventory("1200"),
      accounts_payable("2000"), tax_payable("2100"), equity("3000"),
      sales("4000"), cogs("5000"), expense("6000") {}
};

class config_t
{
public:
  string           database_path;
  int              busy_timeout_ms;
  amount_t         tolerance;
  bool             harden_closed_periods;
  posting_map_t    accounts;
  std::set<string> reopen_users;
  string           log_level;
  optional<string> debug_category;

  config_t();

  /**
   * Read settings from an INI stream.  Keys that are absent keep their
   * current value, so a file only needs to name what it changes.
   */
  void read(std::istream& in);
  void read_file(const string& pathname);

  /** Push the logging settings into the global logger. */
  void apply_logging() const;
};

} // namespace folio
