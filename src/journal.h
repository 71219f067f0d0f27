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
 * @file   journal.h
 *
 * @ingroup data
 *
 * @brief The journal engine: balanced entries, posting and reversal.
 *
 * Every change to the general ledger passes through journal_t.  An entry
 * is either created as a DRAFT and posted later, or posted directly by a
 * business workflow through post_direct(), which admits at most one entry
 * per (source, source id).  Posted entries are never edited or deleted;
 * reverse() appends a mirror entry and marks the original REVERSED.
 */
#pragma once

#include "account.h"
#include "period.h"

namespace folio {

class journal_line_t
{
public:
  ident_t          id;
  int              line_no;
  ident_t          account_id;
  optional<string> branch_id;
  amount_t         debit;
  amount_t         credit;

  journal_line_t() : id(0), line_no(0), account_id(0) {}
  journal_line_t(const ident_t           _account_id,
                 const amount_t&         _debit,
                 const amount_t&         _credit,
                 const optional<string>& _branch_id = none)
    : id(0), line_no(0), account_id(_account_id), branch_id(_branch_id),
      debit(_debit), credit(_credit) {}

  static journal_line_t debit_of(const ident_t account, const amount_t& amt,
                                 const optional<string>& branch = none) {
    return journal_line_t(account, amt, amount_t(), branch);
  }
  static journal_line_t credit_of(const ident_t account, const amount_t& amt,
                                  const optional<string>& branch = none) {
    return journal_line_t(account, amount_t(), amt, branch);
  }
};

typedef std::vector<journal_line_t> lines_vector;

class journal_entry_t
{
public:
  enum status_t {
    DRAFT,
    POSTED,
    REVERSED
  };

  enum source_t {
    MANUAL,
    ORDER,
    COGS,
    REFUND,
    CASH_MOVEMENT,
    VENDOR_BILL,
    VENDOR_PAYMENT,
    CUSTOMER_INVOICE,
    CUSTOMER_RECEIPT,
    VENDOR_BILL_VOID,
    CUSTOMER_INVOICE_VOID,
    VENDOR_CREDIT_NOTE,
    CUSTOMER_CREDIT_NOTE,
    VENDOR_CREDIT_NOTE_VOID,
    CUSTOMER_CREDIT_NOTE_VOID,
    VENDOR_CREDIT_REFUND,
    CUSTOMER_CREDIT_REFUND,
    REVERSAL
  };

  ident_t              id;
  string               org_id;
  optional<string>     branch_id;
  date_t               date;
  string               memo;
  source_t             source;
  optional<string>     source_id;
  status_t             status;
  optional<string>     created_by_id;
  datetime_t           created_at;
  optional<string>     posted_by_id;
  optional<datetime_t> posted_at;
  optional<ident_t>    reverses_entry_id;
  optional<string>     reversed_by_id;
  optional<datetime_t> reversed_at;

  // The entry that reversed this one, found through reverses_entry_id
  optional<ident_t>    reversed_by_entry_id;

  lines_vector         lines;

  journal_entry_t() : id(0), source(MANUAL), status(DRAFT) {}

  amount_t total_debits() const;
  amount_t total_credits() const;
};

const char *              entry_status_name(journal_entry_t::status_t status);
journal_entry_t::status_t string_to_entry_status(const string& name);
const char *              entry_source_name(journal_entry_t::source_t source);
journal_entry_t::source_t string_to_entry_source(const string& name);

typedef std::vector<journal_entry_t> entries_list;

/**
 * @brief One business event's request to post to the ledger.
 *
 * Workflows build one of these and hand it to journal_t::post_direct;
 * (org_id, source, source_id) identifies the event for the
 * at-most-one-posting guard.
 */
struct posting_request_t
{
  string                    org_id;
  optional<string>          branch_id;
  date_t                    date;
  string                    memo;
  journal_entry_t::source_t source;
  string                    source_id;
  lines_vector              lines;
  optional<string>          user_id;

  posting_request_t() : source(journal_entry_t::MANUAL) {}
};

struct posting_result_t
{
  ident_t entry_id;
  bool    duplicate;   // an entry for this event already existed

  posting_result_t(ident_t _entry_id, bool _duplicate)
    : entry_id(_entry_id), duplicate(_duplicate) {}
};

struct entry_filter_t
{
  optional<date_t>                    from;
  optional<date_t>                    to;
  optional<journal_entry_t::source_t> source;
  optional<journal_entry_t::status_t> status;
  optional<ident_t>                   account_id;
  optional<string>                    branch_id;
};

struct page_t
{
  std::size_t offset;
  std::size_t limit;

  page_t(std::size_t _offset = 0, std::size_t _limit = 50)
    : offset(_offset), limit(_limit) {}
};

struct entry_page_t
{
  entries_list entries;
  std::size_t  total;

  entry_page_t() : total(0) {}
};

class journal_t : public noncopyable
{
  database_t&         db;
  const config_t&     config;
  account_registry_t& accounts;
  period_manager_t&   periods;

  void validate_lines(const string& org_id, lines_vector& lines);

  ident_t insert_entry(const string&                   org_id,
                       const optional<string>&         branch_id,
                       const date_t&                   date,
                       const string&                   memo,
                       const journal_entry_t::source_t source,
                       const optional<string>&         source_id,
                       const journal_entry_t::status_t status,
                       const optional<string>&         user_id,
                       const optional<ident_t>&        reverses_entry_id,
                       const lines_vector&             lines);

  void read_lines(journal_entry_t& entry);

public:
  journal_t(database_t& _db, const config_t& _config,
            account_registry_t& _accounts, period_manager_t& _periods)
    : db(_db), config(_config), accounts(_accounts), periods(_periods) {}

  /**
   * Store an unposted entry.  Lines are validated and must balance, but no
   * period check applies since drafts do not reach reports.
   */
  ident_t create_draft(const string&           org_id,
                       const date_t&           date,
                       const string&           memo,
                       lines_vector            lines,
                       const optional<string>& branch_id = none,
                       const optional<string>& user_id   = none);

  void post(const ident_t entry_id, const string& user_id);

  posting_result_t post_direct(const posting_request_t& request);

  /**
   * Post the mirror image of a posted entry, dated `date' (today when
   * omitted), and mark the original REVERSED.  Returns the new entry's id.
   */
  ident_t reverse(const ident_t                   entry_id,
                  const string&                   user_id,
                  const optional<date_t>&         date   = none,
                  const journal_entry_t::source_t source =
                  journal_entry_t::REVERSAL);

  journal_entry_t           get_entry(const ident_t entry_id);
  optional<journal_entry_t> find_by_source(const string& org_id,
                                           const journal_entry_t::source_t source,
                                           const string& source_id);

  entry_page_t list_entries(const string&         org_id,
                            const entry_filter_t& filter = entry_filter_t(),
                            const page_t&         page   = page_t());

  /** Write every posted line dated within [from, to] as CSV. */
  void export_csv(std::ostream& out, const string& org_id,
                  const date_t& from, const date_t& to);
};

} // namespace folio
