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

#include "config.h"

namespace folio {

config_t::config_t()
  : database_path("folio.db"),
    busy_timeout_ms(5000),
    tolerance(string("0.01")),
    harden_closed_periods(false),
    log_level("warn")
{
}

void config_t::read(std::istream& in)
{
  property_tree::ptree pt;
  try {
    property_tree::ini_parser::read_ini(in, pt);
  }
  catch (const property_tree::ini_parser::ini_parser_error& err) {
    throw_(validation_error,
           _f("Invalid configuration (line %1%): %2%")
           % err.line() % err.message());
  }

  database_path   = pt.get("database.path", database_path);
  busy_timeout_ms = pt.get("database.busy_timeout_ms", busy_timeout_ms);

  if (optional<string> tol = pt.get_optional<string>("ledger.tolerance"))
    tolerance = amount_t(*tol);
  harden_closed_periods =
    pt.get("ledger.harden_closed_periods", harden_closed_periods);

  accounts.cash                = pt.get("accounts.cash", accounts.cash);
  accounts.accounts_receivable =
    pt.get("accounts.accounts_receivable", accounts.accounts_receivable);
  accounts.inventory = pt.get("accounts.inventory", accounts.inventory);
  accounts.accounts_payable =
    pt.get("accounts.accounts_payable", accounts.accounts_payable);
  accounts.tax_payable = pt.get("accounts.tax_payable", accounts.tax_payable);
  accounts.equity      = pt.get("accounts.equity", accounts.equity);
  accounts.sales       = pt.get("accounts.sales", accounts.sales);
  accounts.cogs        = pt.get("accounts.cogs", accounts.cogs);
  accounts.expense     = pt.get("accounts.expense", accounts.expense);

  if (optional<string> users = pt.get_optional<string>("security.reopen_users")) {
    strings_vector names;
    split(names, *users, is_any_of(", "), token_compress_on);
    reopen_users.clear();
    foreach (const string& name, names)
      if (! name.empty())
        reopen_users.insert(name);
  }

  log_level = pt.get("log.level", log_level);
  if (optional<string> cat = pt.get_optional<string>("log.debug"))
    debug_category = *cat;

  if (tolerance.sign() <= 0)
    throw_(validation_error,
           _f("Configured tolerance must be positive, not %1%") % tolerance);

  DEBUG("config.read", "database = " << database_path
        << ", tolerance = " << tolerance
        << ", harden closed = " << harden_closed_periods);
}

void config_t::read_file(const string& pathname)
{
  std::ifstream in(pathname.c_str());
  if (! in)
    throw_(not_found_error,
           _f("Cannot read configuration file '%1%'") % pathname);
  read(in);
}

void config_t::apply_logging() const
{
#if LOGGING_ON
  if (optional<log_level_t> level = string_to_log_level(log_level))
    _log_level = *level;
  else
    throw_(validation_error, _f("Unknown log level '%1%'") % log_level);

#if DEBUG_ON
  if (debug_category) {
    _log_category    = *debug_category;
    _log_category_re = none;
    if (_log_level < LOG_DEBUG)
      _log_level = LOG_DEBUG;
  }
#endif
#endif
}

} // namespace folio
