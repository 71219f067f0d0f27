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
 * @file   period.h
 *
 * @ingroup data
 *
 * @brief Fiscal periods and the locks they place on posting dates.
 *
 * A period moves OPEN -> CLOSED -> LOCKED (or straight from OPEN to
 * LOCKED).  Only LOCKED is a hard barrier: a posting dated inside a
 * CLOSED period is logged as a warning unless the configuration hardens
 * closed periods.  Going back to OPEN is a privileged reopen that needs
 * the reopen capability and a stated reason; every transition is kept in
 * the period's history.
 */
#pragma once

#include "database.h"
#include "authority.h"
#include "config.h"

namespace folio {

class fiscal_period_t
{
public:
  enum status_t {
    OPEN,
    CLOSED,
    LOCKED
  };

  ident_t              id;
  string               org_id;
  string               name;
  date_t               starts_at;
  date_t               ends_at;
  status_t             status;
  optional<string>     closed_by_id;
  optional<datetime_t> closed_at;
  optional<string>     locked_by_id;
  optional<datetime_t> locked_at;

  fiscal_period_t() : id(0), status(OPEN) {}

  bool contains(const date_t& when) const {
    return starts_at <= when && when <= ends_at;
  }

  string description() const;
};

const char *              period_status_name(fiscal_period_t::status_t status);
fiscal_period_t::status_t string_to_period_status(const string& name);

typedef std::vector<fiscal_period_t> periods_list;

struct period_event_t
{
  ident_t          id;
  ident_t          period_id;
  string           event;
  optional<string> user_id;
  optional<string> reason;
  datetime_t       at;
};

typedef std::vector<period_event_t> period_events_list;

class period_manager_t : public noncopyable
{
  database_t&        db;
  const config_t&    config;
  const authority_t& authority;

  void record_event(const ident_t           period_id,
                    const string&           event,
                    const optional<string>& user_id,
                    const optional<string>& reason = none);

public:
  period_manager_t(database_t& _db, const config_t& _config,
                   const authority_t& _authority)
    : db(_db), config(_config), authority(_authority) {}

  fiscal_period_t create_period(const string& org_id,
                                const string& name,
                                const date_t& starts_at,
                                const date_t& ends_at,
                                const optional<string>& user_id = none);

  fiscal_period_t close_period(const ident_t id, const string& user_id);
  fiscal_period_t lock_period(const ident_t id, const string& user_id);
  fiscal_period_t reopen_period(const ident_t id, const string& user_id,
                                const string& reason);

  fiscal_period_t          get_period(const ident_t id);
  periods_list             list_periods(const string& org_id);
  optional<fiscal_period_t> find_period_for(const string& org_id,
                                            const date_t& when);
  period_events_list       period_history(const ident_t id);

  bool is_locked(const string& org_id, const date_t& when);

  /**
   * Raise period_locked_error when `when' falls in a LOCKED period (or a
   * CLOSED one, if closed periods are hardened).  `what' names the
   * mutation for the message.  A date outside every period is allowed.
   */
  void check_postable(const string& org_id, const date_t& when,
                      const string& what);
};

} // namespace folio
