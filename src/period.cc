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

#include "period.h"

namespace folio {

namespace {
  const char * period_columns =
    "SELECT id, org_id, name, starts_at, ends_at, status, closed_by_id, "
    "closed_at, locked_by_id, locked_at FROM fiscal_periods";

  fiscal_period_t read_period(statement_t& stmt)
  {
    fiscal_period_t period;
    period.id           = stmt.get_ident(0);
    period.org_id       = stmt.get_string(1);
    period.name         = stmt.get_string(2);
    period.starts_at    = stmt.get_date(3);
    period.ends_at      = stmt.get_date(4);
    period.status       = string_to_period_status(stmt.get_string(5));
    period.closed_by_id = stmt.get_optional_string(6);
    period.closed_at    = stmt.get_optional_datetime(7);
    period.locked_by_id = stmt.get_optional_string(8);
    period.locked_at    = stmt.get_optional_datetime(9);
    return period;
  }
}

string fiscal_period_t::description() const
{
  std::ostringstream buf;
  buf << '"' << name << "\" [" << format_date(starts_at) << ", "
      << format_date(ends_at) << "]";
  return buf.str();
}

const char * period_status_name(fiscal_period_t::status_t status)
{
  switch (status) {
  case fiscal_period_t::OPEN:   return "OPEN";
  case fiscal_period_t::CLOSED: return "CLOSED";
  case fiscal_period_t::LOCKED: return "LOCKED";
  }
  assert(false);
  return "";
}

fiscal_period_t::status_t string_to_period_status(const string& name)
{
  if (name == "OPEN")
    return fiscal_period_t::OPEN;
  else if (name == "CLOSED")
    return fiscal_period_t::CLOSED;
  else if (name == "LOCKED")
    return fiscal_period_t::LOCKED;

  throw_(validation_error, _f("Unknown period status '%1%'") % name);
  return fiscal_period_t::OPEN;
}

void period_manager_t::record_event(const ident_t           period_id,
                                    const string&           event,
                                    const optional<string>& user_id,
                                    const optional<string>& reason)
{
  statement_t stmt(db, "INSERT INTO period_events (period_id, event, "
                   "user_id, reason, at) VALUES (?, ?, ?, ?, ?)");
  stmt.bind(1, period_id)
      .bind(2, event)
      .bind(3, user_id)
      .bind(4, reason)
      .bind(5, CURRENT_TIME());
  stmt.execute();
}

fiscal_period_t
period_manager_t::create_period(const string&           org_id,
                                const string&           name,
                                const date_t&           starts_at,
                                const date_t&           ends_at,
                                const optional<string>& user_id)
{
  if (trim_copy(name).empty())
    throw_(validation_error, _("A fiscal period needs a name"));
  if (ends_at < starts_at)
    throw_(validation_error,
           _f("Period \"%1%\" ends (%2%) before it starts (%3%)")
           % name % format_date(ends_at) % format_date(starts_at));

  transaction_t xact(db);

  statement_t overlap(db, string(period_columns) +
                      " WHERE org_id = ? AND starts_at <= ? AND ends_at >= ?"
                      " ORDER BY starts_at LIMIT 1");
  overlap.bind(1, org_id).bind(2, ends_at).bind(3, starts_at);
  if (overlap.step()) {
    fiscal_period_t other = read_period(overlap);
    throw_(duplicate_overlap_error,
           _f("Period \"%1%\" [%2%, %3%] overlaps existing period %4%")
           % name % format_date(starts_at) % format_date(ends_at)
           % other.description());
  }

  statement_t stmt(db, "INSERT INTO fiscal_periods (org_id, name, "
                   "starts_at, ends_at, status) VALUES (?, ?, ?, ?, 'OPEN')");
  stmt.bind(1, org_id)
      .bind(2, name)
      .bind(3, starts_at)
      .bind(4, ends_at);
  stmt.execute();

  ident_t id = db.last_insert_id();
  record_event(id, "CREATED", user_id);

  fiscal_period_t period = get_period(id);
  xact.commit();

  INFO("Created fiscal period " << period.description() << " for " << org_id);
  return period;
}

fiscal_period_t period_manager_t::close_period(const ident_t id,
                                               const string& user_id)
{
  transaction_t xact(db);

  fiscal_period_t period = get_period(id);
  if (period.status != fiscal_period_t::OPEN)
    throw_(invalid_state_error,
           _f("Period %1% is %2%; only an OPEN period can be closed")
           % period.description() % period_status_name(period.status));

  statement_t stmt(db, "UPDATE fiscal_periods SET status = 'CLOSED', "
                   "closed_by_id = ?, closed_at = ? WHERE id = ?");
  stmt.bind(1, user_id).bind(2, CURRENT_TIME()).bind(3, id);
  stmt.execute();

  record_event(id, "CLOSED", user_id);

  period = get_period(id);
  xact.commit();

  INFO("Closed fiscal period " << period.description());
  return period;
}

fiscal_period_t period_manager_t::lock_period(const ident_t id,
                                              const string& user_id)
{
  transaction_t xact(db);

  fiscal_period_t period = get_period(id);
  if (period.status == fiscal_period_t::LOCKED)
    throw_(invalid_state_error,
           _f("Period %1% is already LOCKED") % period.description());

  statement_t stmt(db, "UPDATE fiscal_periods SET status = 'LOCKED', "
                   "locked_by_id = ?, locked_at = ? WHERE id = ?");
  stmt.bind(1, user_id).bind(2, CURRENT_TIME()).bind(3, id);
  stmt.execute();

  record_event(id, "LOCKED", user_id);

  period = get_period(id);
  xact.commit();

  INFO("Locked fiscal period " << period.description());
  return period;
}

fiscal_period_t period_manager_t::reopen_period(const ident_t id,
                                                const string& user_id,
                                                const string& reason)
{
  if (! authority.permits(user_id, CAPABILITY_PERIOD_REOPEN))
    throw_(forbidden_error,
           _f("User '%1%' lacks the %2% capability")
           % user_id % CAPABILITY_PERIOD_REOPEN);
  if (trim_copy(reason).empty())
    throw_(validation_error, _("Reopening a period requires a reason"));

  transaction_t xact(db);

  fiscal_period_t period = get_period(id);
  if (period.status == fiscal_period_t::OPEN)
    throw_(invalid_state_error,
           _f("Period %1% is already OPEN") % period.description());

  statement_t stmt(db, "UPDATE fiscal_periods SET status = 'OPEN', "
                   "closed_by_id = NULL, closed_at = NULL, "
                   "locked_by_id = NULL, locked_at = NULL WHERE id = ?");
  stmt.bind(1, id);
  stmt.execute();

  record_event(id, "REOPENED", user_id, reason);

  fiscal_period_t reopened = get_period(id);
  xact.commit();

  WARN("Reopened " << period_status_name(period.status) << " fiscal period "
       << period.description() << " by " << user_id << ": " << reason);
  return reopened;
}

fiscal_period_t period_manager_t::get_period(const ident_t id)
{
  statement_t stmt(db, string(period_columns) + " WHERE id = ?");
  stmt.bind(1, id);
  if (! stmt.step())
    throw_(not_found_error, _f("Fiscal period %1% not found") % id);
  return read_period(stmt);
}

periods_list period_manager_t::list_periods(const string& org_id)
{
  statement_t stmt(db, string(period_columns) +
                   " WHERE org_id = ? ORDER BY starts_at");
  stmt.bind(1, org_id);

  periods_list periods;
  while (stmt.step())
    periods.push_back(read_period(stmt));
  return periods;
}

optional<fiscal_period_t>
period_manager_t::find_period_for(const string& org_id, const date_t& when)
{
  statement_t stmt(db, string(period_columns) +
                   " WHERE org_id = ? AND starts_at <= ? AND ends_at >= ?");
  stmt.bind(1, org_id).bind(2, when).bind(3, when);
  if (stmt.step())
    return read_period(stmt);
  return none;
}

period_events_list period_manager_t::period_history(const ident_t id)
{
  get_period(id);

  statement_t stmt(db, "SELECT id, period_id, event, user_id, reason, at "
                   "FROM period_events WHERE period_id = ? ORDER BY id");
  stmt.bind(1, id);

  period_events_list events;
  while (stmt.step()) {
    period_event_t event;
    event.id        = stmt.get_ident(0);
    event.period_id = stmt.get_ident(1);
    event.event     = stmt.get_string(2);
    event.user_id   = stmt.get_optional_string(3);
    event.reason    = stmt.get_optional_string(4);
    event.at        = stmt.get_datetime(5);
    events.push_back(event);
  }
  return events;
}

bool period_manager_t::is_locked(const string& org_id, const date_t& when)
{
  optional<fiscal_period_t> period = find_period_for(org_id, when);
  return period && period->status == fiscal_period_t::LOCKED;
}

void period_manager_t::check_postable(const string& org_id,
                                      const date_t& when,
                                      const string& what)
{
  optional<fiscal_period_t> period = find_period_for(org_id, when);
  if (! period)
    return;

  switch (period->status) {
  case fiscal_period_t::OPEN:
    break;

  case fiscal_period_t::CLOSED:
    if (config.harden_closed_periods)
      throw_(period_locked_error,
             _f("Cannot %1% dated %2%: period %3% is CLOSED")
             % what % format_date(when) % period->description());
    WARN("Posting into CLOSED period " << period->description()
         << ": " << what << " dated " << format_date(when));
    break;

  case fiscal_period_t::LOCKED:
    throw_(period_locked_error,
           _f("Cannot %1% dated %2%: period %3% is LOCKED")
           % what % format_date(when) % period->description());
  }
}

} // namespace folio
