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

#include "session.h"

using namespace folio;

namespace {
  void show_usage(std::ostream& out)
  {
    out << "usage: folio [options] COMMAND [ARGS]\n"
        << "\n"
        << "Options:\n"
        << "  --config FILE       read settings from an INI file\n"
        << "  --db PATH           ledger database (default folio.db)\n"
        << "  --org ID            organization to report on (default default)\n"
        << "  --csv               write reports as CSV\n"
        << "  --verbose           log informational messages\n"
        << "  --debug CATEGORY    log debug messages matching CATEGORY\n"
        << "\n"
        << "Commands:\n"
        << "  init                          create the schema and default chart\n"
        << "  accounts                      list the chart of accounts\n"
        << "  periods                       list fiscal periods\n"
        << "  trial-balance [ASOF]\n"
        << "  pnl [FROM [TO]]\n"
        << "  balance-sheet [ASOF]\n"
        << "  ap-aging [ASOF]\n"
        << "  ar-aging [ASOF]\n"
        << "  export-journal FROM TO        write journal lines as CSV\n"
        << "  import-csv BANK FILE          import a bank statement\n"
        << "  auto-match BANK               match statement rows to settlements\n"
        << "  unreconciled BANK             list unmatched statement rows\n";
  }

  optional<date_t> date_arg(const strings_vector& args, std::size_t index)
  {
    if (args.size() > index)
      return parse_date(args[index]);
    return none;
  }

  ident_t bank_account_arg(session_t& session, const string& org_id,
                           const string& name)
  {
    if (! name.empty() && all(name, is_digit()))
      return session.reconciler.get_bank_account(lexical_cast<ident_t>(name)).id;
    if (optional<bank_account_t> account =
        session.reconciler.find_bank_account(org_id, name))
      return account->id;
    throw_(not_found_error, _f("Unknown bank account '%1%'") % name);
    return 0;
  }

  void require_args(const strings_vector& args, std::size_t count)
  {
    if (args.size() < count + 1)
      throw_(validation_error,
             _f("Command '%1%' requires %2% argument(s)")
             % args[0] % count);
  }

  int execute_command(session_t& session, const string& org_id,
                      const bool csv, const strings_vector& args)
  {
    const string& verb(args[0]);
    std::ostream& out(std::cout);

    if (verb == "init") {
      std::size_t created = session.seed_chart(org_id);
      out << "Created " << created << " accounts for " << org_id << '\n';
    }
    else if (verb == "accounts") {
      accounts_list accounts(session.accounts.list_accounts(org_id));
      if (csv) write_csv(out, accounts); else print(out, accounts);
    }
    else if (verb == "periods") {
      foreach (const fiscal_period_t& period,
               session.periods.list_periods(org_id))
        out << (boost::format("%5d %-16s %10s %10s %s\n")
                % period.id % period.name % format_date(period.starts_at)
                % format_date(period.ends_at)
                % period_status_name(period.status));
    }
    else if (verb == "trial-balance" || verb == "tb") {
      trial_balance_t report(session.reports.trial_balance(org_id,
                                                           date_arg(args, 1)));
      if (csv) write_csv(out, report); else print(out, report);
    }
    else if (verb == "pnl") {
      profit_and_loss_t report(session.reports.profit_and_loss
                               (org_id, date_arg(args, 1), date_arg(args, 2)));
      if (csv) write_csv(out, report); else print(out, report);
    }
    else if (verb == "balance-sheet" || verb == "bs") {
      balance_sheet_t report(session.reports.balance_sheet(org_id,
                                                           date_arg(args, 1)));
      if (csv) write_csv(out, report); else print(out, report);
    }
    else if (verb == "ap-aging" || verb == "ar-aging") {
      aging_report_t report(verb == "ap-aging" ?
                            session.reports.ap_aging(org_id, date_arg(args, 1)) :
                            session.reports.ar_aging(org_id, date_arg(args, 1)));
      if (csv) write_csv(out, report); else print(out, report);
    }
    else if (verb == "export-journal") {
      require_args(args, 2);
      session.journal.export_csv(out, org_id, parse_date(args[1]),
                                 parse_date(args[2]));
    }
    else if (verb == "import-csv") {
      require_args(args, 2);
      std::ifstream in(args[2].c_str());
      if (! in)
        throw_(not_found_error, _f("Cannot read statement '%1%'") % args[2]);
      std::ostringstream text;
      text << in.rdbuf();

      ident_t account;
      if (optional<bank_account_t> existing =
          session.reconciler.find_bank_account(org_id, args[1]))
        account = existing->id;
      else
        account = session.reconciler.upsert_bank_account(org_id, args[1]).id;

      import_result_t result(session.reconciler.import_csv(account,
                                                           text.str()));
      out << "Imported " << result.txn_ids.size() << " rows into "
          << args[1] << '\n';
    }
    else if (verb == "auto-match") {
      require_args(args, 1);
      matches_list matches(session.reconciler.auto_match
                           (bank_account_arg(session, org_id, args[1])));
      foreach (const reconcile_match_t& match, matches)
        out << "Matched row " << match.bank_txn_id << " to "
            << match_source_name(match.source) << ' ' << match.source_id
            << '\n';
      out << matches.size() << " rows matched\n";
    }
    else if (verb == "unreconciled") {
      require_args(args, 1);
      foreach (const bank_txn_t& txn,
               session.reconciler.get_unreconciled
               (bank_account_arg(session, org_id, args[1])))
        out << (boost::format("%5d %10s %14s  %s\n")
                % txn.id % format_date(txn.posted_at) % txn.amount
                % txn.description);
    }
    else {
      throw_(validation_error, _f("Unrecognized command '%1%'") % verb);
    }
    return 0;
  }
}

int main(int argc, char * argv[])
{
  int status = 1;

  std::ios::sync_with_stdio(false);

  try {
    config_t         config;
    string           org_id("default");
    bool             csv = false;
    bool             verbose = false;
    optional<string> db_path;
    optional<string> debug_category;
    strings_vector   args;

    for (int i = 1; i < argc; i++) {
      string arg(argv[i]);
      if (arg == "--help" || arg == "-h") {
        show_usage(std::cout);
        return 0;
      }
      else if (arg == "--csv") {
        csv = true;
      }
      else if (arg == "--verbose") {
        verbose = true;
      }
      else if (arg == "--config" || arg == "--db" || arg == "--org" ||
               arg == "--debug") {
        if (i + 1 == argc)
          throw_(validation_error, _f("Option %1% requires an argument") % arg);
        string value(argv[++i]);
        if (arg == "--config")
          config.read_file(value);
        else if (arg == "--db")
          db_path = value;
        else if (arg == "--org")
          org_id = value;
        else
          debug_category = value;
      }
      else if (! arg.empty() && arg[0] == '-') {
        throw_(validation_error, _f("Unknown option '%1%'") % arg);
      }
      else {
        args.push_back(arg);
      }
    }

    if (db_path)
      config.database_path = *db_path;
    if (verbose && config.log_level != "debug")
      config.log_level = "info";
    if (debug_category)
      config.debug_category = debug_category;
    config.apply_logging();

    if (args.empty()) {
      show_usage(std::cerr);
      return 1;
    }

    session_t session(config);
    status = execute_command(session, org_id, csv, args);
  }
  catch (const ledger_error& err) {
    std::cout.flush();
    std::cerr << "Error (" << err.kind() << "): " << err.what() << std::endl;
  }
  catch (const std::exception& err) {
    std::cout.flush();
    std::cerr << "Error: " << err.what() << std::endl;
  }

  return status;
}
