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
 * @file   mapping.h
 *
 * @ingroup data
 *
 * @brief Which cash or bank account a payment method settles through.
 */
#pragma once

#include "account.h"
#include "config.h"

namespace folio {

enum payment_method_t {
  PAYMENT_CASH,
  PAYMENT_CARD,
  PAYMENT_MOMO,
  PAYMENT_BANK_TRANSFER
};

const char *     payment_method_name(payment_method_t method);
payment_method_t string_to_payment_method(const string& name);

struct payment_method_mapping_t
{
  ident_t          id;
  string           org_id;
  payment_method_t method;
  ident_t          account_id;
};

typedef std::vector<payment_method_mapping_t> mappings_list;

class payment_mapper_t : public noncopyable
{
  database_t&         db;
  const config_t&     config;
  account_registry_t& accounts;

public:
  payment_mapper_t(database_t& _db, const config_t& _config,
                   account_registry_t& _accounts)
    : db(_db), config(_config), accounts(_accounts) {}

  payment_method_mapping_t
  upsert_mapping(const string& org_id, const payment_method_t method,
                 const ident_t account_id);
  mappings_list list_mappings(const string& org_id);
  void          remove_mapping(const string& org_id,
                               const payment_method_t method);

  /**
   * The account a payment made by `method' moves money through.  Tried in
   * order: the org's explicit mapping, an active asset account whose name
   * suggests the method, and the posting map's cash code.
   */
  account_t cash_account(const string& org_id, const payment_method_t method);
};

} // namespace folio
