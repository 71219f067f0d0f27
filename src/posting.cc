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

#include "posting.h"

namespace folio {

const char * cash_movement_kind_name(cash_movement_event_t::kind_t kind)
{
  switch (kind) {
  case cash_movement_event_t::PAID_IN:   return "PAID_IN";
  case cash_movement_event_t::PAID_OUT:  return "PAID_OUT";
  case cash_movement_event_t::SAFE_DROP: return "SAFE_DROP";
  case cash_movement_event_t::PICKUP:    return "PICKUP";
  }
  assert(false);
  return "";
}

namespace {
  class translate_event
    : public static_visitor<optional<posting_request_t> >
  {
    const posting_map_t& map;
    account_registry_t&  accounts;

    posting_request_t begin(const string&                   org_id,
                            const optional<string>&         branch_id,
                            const date_t&                   date,
                            const journal_entry_t::source_t source,
                            const string&                   source_id,
                            const optional<string>&         user_id) const {
      if (source_id.empty())
        throw_(validation_error,
               _f("A %1% event needs an id") % entry_source_name(source));

      posting_request_t request;
      request.org_id    = org_id;
      request.branch_id = branch_id;
      request.date      = date;
      request.source    = source;
      request.source_id = source_id;
      request.user_id   = user_id;
      return request;
    }

    ident_t account(const string& org_id, const string& code,
                    const string& role) const {
      return accounts.require_mapped(org_id, code, role).id;
    }

  public:
    translate_event(const posting_map_t& _map, account_registry_t& _accounts)
      : map(_map), accounts(_accounts) {}

    result_type operator()(const sale_event_t& sale) const {
      if (sale.total.sign() <= 0)
        throw_(validation_error,
               _f("Sale %1% total must be greater than zero, not %2%")
               % sale.order_id % sale.total);
      if (sale.subtotal.sign() < 0 || sale.subtotal > sale.total)
        throw_(validation_error,
               _f("Sale %1% subtotal %2% must lie between zero and the "
                  "total %3%") % sale.order_id % sale.subtotal % sale.total);

      posting_request_t request =
        begin(sale.org_id, sale.branch_id, sale.date, journal_entry_t::ORDER,
              sale.order_id, sale.user_id);
      request.memo = "Sale - order " + sale.order_id;

      ident_t debit_account =
        sale.paid ? account(sale.org_id, map.cash, "cash")
                  : account(sale.org_id, map.accounts_receivable,
                            "accounts receivable");

      request.lines.push_back(journal_line_t::debit_of(debit_account,
                                                       sale.total,
                                                       sale.branch_id));
      if (sale.subtotal.is_nonzero())
        request.lines.push_back
          (journal_line_t::credit_of(account(sale.org_id, map.sales, "sales"),
                                     sale.subtotal, sale.branch_id));

      amount_t tax = sale.total - sale.subtotal;
      if (tax.is_nonzero())
        request.lines.push_back
          (journal_line_t::credit_of(account(sale.org_id, map.tax_payable,
                                             "tax payable"),
                                     tax, sale.branch_id));
      return request;
    }

    result_type operator()(const cogs_event_t& cogs) const {
      if (cogs.cost.sign() < 0)
        throw_(validation_error,
               _f("Cost of goods for order %1% cannot be negative (%2%)")
               % cogs.order_id % cogs.cost);
      if (cogs.cost.is_zero()) {
        WARN("Order " << cogs.order_id << " has no cost of goods; "
             "nothing to post");
        return none;
      }

      posting_request_t request =
        begin(cogs.org_id, cogs.branch_id, cogs.date, journal_entry_t::COGS,
              cogs.order_id, cogs.user_id);
      request.memo = "COGS - order " + cogs.order_id;
      request.lines.push_back
        (journal_line_t::debit_of(account(cogs.org_id, map.cogs, "COGS"),
                                  cogs.cost, cogs.branch_id));
      request.lines.push_back
        (journal_line_t::credit_of(account(cogs.org_id, map.inventory,
                                           "inventory"),
                                   cogs.cost, cogs.branch_id));
      return request;
    }

    result_type operator()(const refund_event_t& refund) const {
      if (refund.amount.sign() <= 0)
        throw_(validation_error,
               _f("Refund %1% amount must be greater than zero, not %2%")
               % refund.refund_id % refund.amount);

      posting_request_t request =
        begin(refund.org_id, refund.branch_id, refund.date,
              journal_entry_t::REFUND, refund.refund_id, refund.user_id);
      request.memo = "Refund " + refund.refund_id;
      if (refund.order_id)
        request.memo += " - order " + *refund.order_id;
      request.lines.push_back
        (journal_line_t::debit_of(account(refund.org_id, map.sales, "sales"),
                                  refund.amount, refund.branch_id));
      request.lines.push_back
        (journal_line_t::credit_of(account(refund.org_id, map.cash, "cash"),
                                   refund.amount, refund.branch_id));
      return request;
    }

    result_type operator()(const cash_movement_event_t& movement) const {
      amount_t amount = movement.amount.abs();
      if (amount.is_zero())
        throw_(validation_error,
               _f("Cash movement %1% has no amount") % movement.movement_id);

      posting_request_t request =
        begin(movement.org_id, movement.branch_id, movement.date,
              journal_entry_t::CASH_MOVEMENT, movement.movement_id,
              movement.user_id);
      request.memo = string("Cash ") + cash_movement_kind_name(movement.kind) +
                     " - " + (movement.reason ? *movement.reason
                                              : string("No reason"));

      ident_t cash   = account(movement.org_id, map.cash, "cash");
      ident_t equity = account(movement.org_id, map.equity, "equity");

      if (movement.kind == cash_movement_event_t::PAID_IN) {
        request.lines.push_back(journal_line_t::debit_of(cash, amount,
                                                         movement.branch_id));
        request.lines.push_back(journal_line_t::credit_of(equity, amount,
                                                          movement.branch_id));
      } else {
        request.lines.push_back(journal_line_t::debit_of(equity, amount,
                                                         movement.branch_id));
        request.lines.push_back(journal_line_t::credit_of(cash, amount,
                                                          movement.branch_id));
      }
      return request;
    }
  };
}

optional<posting_request_t>
posting_adapter_t::translate(const operational_event_t& event)
{
  return apply_visitor(translate_event(config.accounts, accounts), event);
}

optional<posting_result_t>
posting_adapter_t::post(const operational_event_t& event)
{
  optional<posting_request_t> request = translate(event);
  if (! request)
    return none;

  posting_result_t result = journal.post_direct(*request);
  if (! result.duplicate)
    DEBUG("posting.event", "Event " << entry_source_name(request->source)
          << ' ' << request->source_id << " posted as entry "
          << result.entry_id);
  return result;
}

} // namespace folio
