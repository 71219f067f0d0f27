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
 * @defgroup report Reporting
 */

/**
 * @file   session.h
 *
 * @ingroup report
 *
 * @brief One open ledger database with every service wired to it.
 */
#pragma once

#include "config.h"
#include "authority.h"
#include "account.h"
#include "period.h"
#include "journal.h"
#include "mapping.h"
#include "payables.h"
#include "receivables.h"
#include "credit.h"
#include "posting.h"
#include "reconcile.h"
#include "report.h"

namespace folio {

class session_t : public noncopyable
{
public:
  config_t              config;
  database_t            db;
  user_list_authority_t authority;

  account_registry_t    accounts;
  period_manager_t      periods;
  journal_t             journal;
  payment_mapper_t      mapper;
  payables_t            payables;
  receivables_t         receivables;
  vendor_credits_t      vendor_credits;
  customer_credits_t    customer_credits;
  posting_adapter_t     adapter;
  reconciler_t          reconciler;
  report_t              reports;

  explicit session_t(const config_t& _config = config_t());

  /**
   * Create whichever accounts of the posting map the organization lacks.
   * Returns the number of accounts created.
   */
  std::size_t seed_chart(const string& org_id);
};

} // namespace folio
