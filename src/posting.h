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
 * @file   posting.h
 *
 * @ingroup data
 *
 * @brief Translates operational events into journal postings.
 *
 * Point-of-sale workflows report what happened (a sale closed, stock was
 * consumed, money was refunded, cash moved in or out of a drawer).  Each
 * event becomes one posting_request_t through the fixed posting map and
 * goes through journal_t::post_direct, keyed by the event's own id so a
 * retried event never posts twice.
 */
#pragma once

#include "journal.h"

namespace folio {

struct sale_event_t
{
  string           org_id;
  optional<string> branch_id;
  string           order_id;
  date_t           date;
  amount_t         total;
  amount_t         subtotal;
  bool             paid;        // settled at the till; otherwise on account
  optional<string> user_id;

  sale_event_t() : paid(true) {}
};

struct cogs_event_t
{
  string           org_id;
  optional<string> branch_id;
  string           order_id;
  date_t           date;
  amount_t         cost;
  optional<string> user_id;
};

struct refund_event_t
{
  string           org_id;
  optional<string> branch_id;
  string           refund_id;
  optional<string> order_id;
  date_t           date;
  amount_t         amount;
  optional<string> user_id;
};

struct cash_movement_event_t
{
  enum kind_t {
    PAID_IN,
    PAID_OUT,
    SAFE_DROP,
    PICKUP
  };

  string           org_id;
  optional<string> branch_id;
  string           movement_id;
  date_t           date;
  kind_t           kind;
  amount_t         amount;
  optional<string> reason;
  optional<string> user_id;

  cash_movement_event_t() : kind(PAID_IN) {}
};

const char * cash_movement_kind_name(cash_movement_event_t::kind_t kind);

typedef variant<sale_event_t, cogs_event_t, refund_event_t,
                cash_movement_event_t> operational_event_t;

class posting_adapter_t : public noncopyable
{
  const config_t&     config;
  account_registry_t& accounts;
  journal_t&          journal;

public:
  posting_adapter_t(const config_t& _config, account_registry_t& _accounts,
                    journal_t& _journal)
    : config(_config), accounts(_accounts), journal(_journal) {}

  /**
   * The posting an event calls for, or none when it has nothing to post
   * (a zero cost of goods).
   */
  optional<posting_request_t> translate(const operational_event_t& event);

  /** Translate and post.  Returns none when the event was skipped. */
  optional<posting_result_t> post(const operational_event_t& event);
};

} // namespace folio
