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

#include "report.h"
#include "database.h"

namespace folio {

namespace {
  void add_section(const balances_list& balances,
                   const account_t::type_t type,
                   balances_list& section, amount_t& total)
  {
    foreach (const account_balance_t& balance, balances) {
      if (balance.type == type) {
        section.push_back(balance);
        total += balance.balance;
      }
    }
  }

  void write_rows(std::ostream& out, const char * section,
                  const balances_list& balances)
  {
    foreach (const account_balance_t& balance, balances)
      out << section << ','
          << csv_quote(balance.code) << ','
          << csv_quote(balance.name) << ','
          << balance.balance << '\n';
  }

  void print_rows(std::ostream& out, const balances_list& balances)
  {
    foreach (const account_balance_t& balance, balances)
      out << (boost::format("  %-8s %-30s %16s\n")
              % balance.code % balance.name % balance.balance);
  }

  void print_total(std::ostream& out, const char * label,
                   const amount_t& amount)
  {
    out << (boost::format("  %-39s %16s\n") % label % amount);
  }
}

balances_list report_t::balances(const string&           org_id,
                                 const optional<date_t>& from,
                                 const date_t&           to,
                                 const optional<string>& branch_id)
{
  typedef std::map<ident_t, std::pair<amount_t, amount_t> > totals_map;
  totals_map totals;

  string sql("SELECT l.account_id, l.debit, l.credit "
             "FROM journal_lines l "
             "JOIN journal_entries e ON e.id = l.entry_id "
             "WHERE e.org_id = ? AND e.status IN ('POSTED', 'REVERSED') "
             "AND e.date <= ?");
  if (from)
    sql += " AND e.date >= ?";
  if (branch_id)
    sql += " AND COALESCE(l.branch_id, e.branch_id) = ?";

  statement_t stmt(db, sql);
  int index = 1;
  stmt.bind(index++, org_id).bind(index++, to);
  if (from)
    stmt.bind(index++, *from);
  if (branch_id)
    stmt.bind(index++, *branch_id);

  while (stmt.step()) {
    std::pair<amount_t, amount_t>& sums(totals[stmt.get_ident(0)]);
    sums.first  += stmt.get_amount(1);
    sums.second += stmt.get_amount(2);
  }

  DEBUG("report.balances",
        "Accumulated " << totals.size() << " accounts through "
        << format_date(to));

  balances_list result;

  statement_t accounts(db, "SELECT id, code, name, type, is_active "
                       "FROM accounts WHERE org_id = ? ORDER BY code");
  accounts.bind(1, org_id);
  while (accounts.step()) {
    ident_t id = accounts.get_ident(0);
    totals_map::const_iterator i = totals.find(id);

    // Inactive accounts without activity drop out of every report
    if (i == totals.end() && ! accounts.get_bool(4))
      continue;

    account_balance_t balance;
    balance.account_id = id;
    balance.code       = accounts.get_string(1);
    balance.name       = accounts.get_string(2);
    balance.type       = string_to_account_type(accounts.get_string(3));
    if (i != totals.end()) {
      balance.debit  = i->second.first;
      balance.credit = i->second.second;
    }

    account_t kind;
    kind.type = balance.type;
    if (kind.is_debit_normal())
      balance.balance = balance.debit - balance.credit;
    else
      balance.balance = balance.credit - balance.debit;

    result.push_back(balance);
  }
  return result;
}

trial_balance_t report_t::trial_balance(const string&           org_id,
                                        const optional<date_t>& as_of,
                                        const optional<string>& branch_id)
{
  trial_balance_t report;
  report.as_of     = as_of ? *as_of : CURRENT_DATE();
  report.branch_id = branch_id;
  report.accounts  = balances(org_id, none, report.as_of, branch_id);

  foreach (const account_balance_t& balance, report.accounts) {
    report.total_debits  += balance.debit;
    report.total_credits += balance.credit;
  }
  report.balanced = within_tolerance(report.total_debits,
                                     report.total_credits, config.tolerance);

  if (! report.balanced)
    WARN("Trial balance for " << org_id << " is out of balance: debits "
         << report.total_debits << ", credits " << report.total_credits);

  return report;
}

profit_and_loss_t
report_t::profit_and_loss(const string&           org_id,
                          const optional<date_t>& from,
                          const optional<date_t>& to,
                          const optional<string>& branch_id)
{
  profit_and_loss_t report;
  report.to        = to ? *to : CURRENT_DATE();
  report.from      = from ? *from : date_t(report.to.year(), 1, 1);
  report.branch_id = branch_id;

  if (report.to < report.from)
    throw_(validation_error,
           _f("Report period ends (%1%) before it begins (%2%)")
           % format_date(report.to) % format_date(report.from));

  balances_list all(balances(org_id, report.from, report.to, branch_id));

  add_section(all, account_t::REVENUE, report.revenue, report.total_revenue);
  add_section(all, account_t::COGS,    report.cogs,    report.total_cogs);
  add_section(all, account_t::EXPENSE, report.expenses, report.total_expenses);

  report.gross_profit = report.total_revenue - report.total_cogs;
  report.net_profit   = report.gross_profit - report.total_expenses;
  return report;
}

balance_sheet_t report_t::balance_sheet(const string&           org_id,
                                        const optional<date_t>& as_of,
                                        const optional<string>& branch_id)
{
  balance_sheet_t report;
  report.as_of     = as_of ? *as_of : CURRENT_DATE();
  report.branch_id = branch_id;

  balances_list all(balances(org_id, none, report.as_of, branch_id));

  add_section(all, account_t::ASSET,     report.assets,
              report.total_assets);
  add_section(all, account_t::LIABILITY, report.liabilities,
              report.total_liabilities);
  add_section(all, account_t::EQUITY,    report.equity,
              report.total_equity);

  foreach (const account_balance_t& balance, all) {
    switch (balance.type) {
    case account_t::REVENUE:
      report.current_earnings += balance.balance;
      break;
    case account_t::COGS:
    case account_t::EXPENSE:
      report.current_earnings -= balance.balance;
      break;
    default:
      break;
    }
  }
  report.total_equity += report.current_earnings;

  report.balanced =
    within_tolerance(report.total_assets,
                     report.total_liabilities + report.total_equity,
                     config.tolerance);
  if (! report.balanced)
    WARN("Balance sheet for " << org_id << " does not balance: assets "
         << report.total_assets << ", liabilities and equity "
         << (report.total_liabilities + report.total_equity));

  return report;
}

aging_report_t report_t::aging(const string& org_id, const date_t& as_of,
                               const char * documents, const char * parties,
                               const char * party_column)
{
  aging_report_t report;
  report.as_of = as_of;

  statement_t stmt(db, (_f("SELECT d.id, d.%3%, p.name, d.number, "
                           "d.due_date, d.total, d.paid_amount "
                           "FROM %1% d JOIN %2% p ON p.id = d.%3% "
                           "WHERE d.org_id = ? "
                           "AND d.status IN ('OPEN', 'PARTIALLY_PAID') "
                           "ORDER BY d.due_date, d.id")
                        % documents % parties % party_column).str());
  stmt.bind(1, org_id);

  while (stmt.step()) {
    aging_line_t line;
    line.document_id = stmt.get_ident(0);
    line.party_id    = stmt.get_ident(1);
    line.party_name  = stmt.get_string(2);
    line.number      = stmt.get_optional_string(3);
    line.due_date    = stmt.get_date(4);
    line.total       = stmt.get_amount(5);
    line.paid        = stmt.get_amount(6);
    line.balance     = line.total - line.paid;

    if (line.balance.sign() <= 0)
      continue;

    line.days_overdue = days_between(line.due_date, as_of);

    if (line.days_overdue <= 30)
      report.current += line.balance;
    else if (line.days_overdue <= 60)
      report.days_31_60 += line.balance;
    else if (line.days_overdue <= 90)
      report.days_61_90 += line.balance;
    else
      report.over_90 += line.balance;

    report.total += line.balance;
    report.documents.push_back(line);
  }
  return report;
}

aging_report_t report_t::ap_aging(const string&           org_id,
                                  const optional<date_t>& as_of)
{
  return aging(org_id, as_of ? *as_of : CURRENT_DATE(),
               "vendor_bills", "vendors", "vendor_id");
}

aging_report_t report_t::ar_aging(const string&           org_id,
                                  const optional<date_t>& as_of)
{
  return aging(org_id, as_of ? *as_of : CURRENT_DATE(),
               "customer_invoices", "customers", "customer_id");
}

void write_csv(std::ostream& out, const trial_balance_t& report)
{
  out << "code,name,type,debit,credit,balance\n";
  foreach (const account_balance_t& balance, report.accounts)
    out << csv_quote(balance.code) << ','
        << csv_quote(balance.name) << ','
        << account_type_name(balance.type) << ','
        << balance.debit << ','
        << balance.credit << ','
        << balance.balance << '\n';
  out << "TOTAL,,," << report.total_debits << ','
      << report.total_credits << ",\n";
}

void write_csv(std::ostream& out, const profit_and_loss_t& report)
{
  out << "section,code,name,amount\n";
  write_rows(out, "REVENUE", report.revenue);
  write_rows(out, "COGS",    report.cogs);
  write_rows(out, "EXPENSE", report.expenses);
  out << "TOTAL,,Revenue," << report.total_revenue << '\n'
      << "TOTAL,,Cost of goods sold," << report.total_cogs << '\n'
      << "TOTAL,,Gross profit," << report.gross_profit << '\n'
      << "TOTAL,,Expenses," << report.total_expenses << '\n'
      << "TOTAL,,Net profit," << report.net_profit << '\n';
}

void write_csv(std::ostream& out, const balance_sheet_t& report)
{
  out << "section,code,name,amount\n";
  write_rows(out, "ASSET",     report.assets);
  write_rows(out, "LIABILITY", report.liabilities);
  write_rows(out, "EQUITY",    report.equity);
  out << "EQUITY,,Current earnings," << report.current_earnings << '\n'
      << "TOTAL,,Assets," << report.total_assets << '\n'
      << "TOTAL,,Liabilities," << report.total_liabilities << '\n'
      << "TOTAL,,Equity," << report.total_equity << '\n';
}

void write_csv(std::ostream& out, const aging_report_t& report)
{
  out << "document,party,number,due_date,days_overdue,total,paid,balance\n";
  foreach (const aging_line_t& line, report.documents)
    out << line.document_id << ','
        << csv_quote(line.party_name) << ','
        << csv_quote(line.number ? *line.number : string()) << ','
        << format_date(line.due_date) << ','
        << line.days_overdue << ','
        << line.total << ','
        << line.paid << ','
        << line.balance << '\n';
}

void write_csv(std::ostream& out, const accounts_list& accounts)
{
  out << "code,name,type,parent,active\n";
  foreach (const account_t& account, accounts) {
    out << csv_quote(account.code) << ','
        << csv_quote(account.name) << ','
        << account_type_name(account.type) << ',';
    if (account.parent_id)
      out << *account.parent_id;
    out << ',' << (account.is_active ? "true" : "false") << '\n';
  }
}

void print(std::ostream& out, const trial_balance_t& report)
{
  out << "Trial balance as of " << format_date(report.as_of);
  if (report.branch_id)
    out << " (branch " << *report.branch_id << ")";
  out << '\n';

  foreach (const account_balance_t& balance, report.accounts)
    out << (boost::format("  %-8s %-30s %16s %16s\n")
            % balance.code % balance.name % balance.debit % balance.credit);

  out << (boost::format("  %-39s %16s %16s\n")
          % "Total" % report.total_debits % report.total_credits);
  if (! report.balanced)
    out << "  ** Out of balance **\n";
}

void print(std::ostream& out, const profit_and_loss_t& report)
{
  out << "Profit and loss from " << format_date(report.from)
      << " to " << format_date(report.to) << '\n';

  out << "Revenue\n";
  print_rows(out, report.revenue);
  print_total(out, "Total revenue", report.total_revenue);
  out << "Cost of goods sold\n";
  print_rows(out, report.cogs);
  print_total(out, "Gross profit", report.gross_profit);
  out << "Expenses\n";
  print_rows(out, report.expenses);
  print_total(out, "Total expenses", report.total_expenses);
  print_total(out, "Net profit", report.net_profit);
}

void print(std::ostream& out, const balance_sheet_t& report)
{
  out << "Balance sheet as of " << format_date(report.as_of) << '\n';

  out << "Assets\n";
  print_rows(out, report.assets);
  print_total(out, "Total assets", report.total_assets);
  out << "Liabilities\n";
  print_rows(out, report.liabilities);
  print_total(out, "Total liabilities", report.total_liabilities);
  out << "Equity\n";
  print_rows(out, report.equity);
  print_total(out, "Current earnings", report.current_earnings);
  print_total(out, "Total equity", report.total_equity);
  if (! report.balanced)
    out << "  ** Assets do not equal liabilities plus equity **\n";
}

void print(std::ostream& out, const aging_report_t& report)
{
  out << "Aging as of " << format_date(report.as_of) << '\n';
  foreach (const aging_line_t& line, report.documents)
    out << (boost::format("  %-24s %-12s %10s %5d %16s\n")
            % line.party_name
            % (line.number ? *line.number : string("#") +
               to_string(static_cast<long>(line.document_id)))
            % format_date(line.due_date) % line.days_overdue
            % line.balance);

  print_total(out, "Current",    report.current);
  print_total(out, "31-60 days", report.days_31_60);
  print_total(out, "61-90 days", report.days_61_90);
  print_total(out, "Over 90",    report.over_90);
  print_total(out, "Total",      report.total);
}

void print(std::ostream& out, const accounts_list& accounts)
{
  foreach (const account_t& account, accounts)
    out << (boost::format("%-8s %-30s %-10s%s\n")
            % account.code % account.name % account_type_name(account.type)
            % (account.is_active ? "" : " (inactive)"));
}

} // namespace folio
