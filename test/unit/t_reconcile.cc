#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE reconcile
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

struct reconcile_fixture : public session_fixture
{
  ident_t bank;

  reconcile_fixture() {
    bank = session.reconciler.upsert_bank_account(ORG, "Operating",
                                                  string("0042"),
                                                  account("1000")).id;
  }

  void settle(const char * id, const reconcile_match_t::source_t kind,
              const char * amount, const date_t& when,
              const char * status = SETTLEMENT_COMPLETED) {
    settlement_t settlement;
    settlement.id          = id;
    settlement.org_id      = ORG;
    settlement.kind        = kind;
    settlement.amount      = money(amount);
    settlement.status      = status;
    settlement.occurred_on = when;
    session.reconciler.record_settlement(settlement);
  }

  ident_t import_one(const char * line) {
    import_result_t result =
      session.reconciler.import_csv(bank, string("Date,Description,Amount\n")
                                    + line + "\n");
    BOOST_REQUIRE_EQUAL(1U, result.txn_ids.size());
    return result.txn_ids[0];
  }
};

BOOST_FIXTURE_TEST_SUITE(reconcile, reconcile_fixture)

BOOST_AUTO_TEST_CASE(testParseStatement)
{
  statement_rows_t rows =
    parse_statement("Posted Date,Memo,Ref,Amount\n"
                    "2024-06-01,Card sales,T-1,\"1,250.00\"\n"
                    "\n"
                    "# pending items follow\n"
                    "2024-06-02,Rent,T-2,(800.00)\n");
  BOOST_REQUIRE_EQUAL(2U, rows.size());
  BOOST_CHECK_EQUAL(date_t(2024, 6, 1), rows[0].date);
  BOOST_CHECK_EQUAL(money("1250.00"), rows[0].amount);
  BOOST_CHECK_EQUAL(string("Card sales"), rows[0].description);
  BOOST_CHECK_EQUAL(string("T-1"), *rows[0].reference);
  BOOST_CHECK_EQUAL(money("-800.00"), rows[1].amount);

  rows = parse_statement("DATE,DESCRIPTION,DEBIT,CREDIT\n"
                         "2024-06-03,Supplies,45.10,\n"
                         "2024-06-04,Deposit,,300\n");
  BOOST_REQUIRE_EQUAL(2U, rows.size());
  BOOST_CHECK_EQUAL(money("-45.10"), rows[0].amount);
  BOOST_CHECK_EQUAL(amount_t(300L), rows[1].amount);
  BOOST_CHECK(! rows[1].reference);

  BOOST_CHECK_THROW(parse_statement(""), invalid_format_error);
  BOOST_CHECK_THROW(parse_statement("Description,Amount\nx,1\n"),
                    invalid_format_error);
  BOOST_CHECK_THROW(parse_statement("Date,Description\n2024-06-01,x\n"),
                    invalid_format_error);
  BOOST_CHECK_THROW(parse_statement("Date,Amount\n"), invalid_format_error);
  BOOST_CHECK_THROW(parse_statement("Date,Amount\nyesterday,1\n"),
                    invalid_format_error);
  BOOST_CHECK_THROW(parse_statement("Date,Amount\n2024-06-01,lots\n"),
                    invalid_format_error);
}

BOOST_AUTO_TEST_CASE(testBankAccounts)
{
  bank_account_t renamed =
    session.reconciler.upsert_bank_account(ORG, "Operating", string("0043"));
  BOOST_CHECK_EQUAL(bank, renamed.id);
  BOOST_CHECK_EQUAL(string("0043"), *renamed.number);
  BOOST_CHECK_EQUAL(1U, session.reconciler.list_bank_accounts(ORG).size());
  BOOST_CHECK(session.reconciler.find_bank_account(ORG, "Operating"));
  BOOST_CHECK(! session.reconciler.find_bank_account(ORG, "Payroll"));

  BOOST_CHECK_THROW(session.reconciler.upsert_bank_account
                    (ORG, "Payroll", none, account("4000")),
                    validation_error);
  BOOST_CHECK_THROW(session.reconciler.upsert_bank_account(ORG, "  "),
                    validation_error);
  BOOST_CHECK_THROW(session.reconciler.get_bank_account(bank + 100),
                    not_found_error);
}

BOOST_AUTO_TEST_CASE(testImport)
{
  import_result_t result =
    session.reconciler.import_csv(bank, "Date,Description,Amount,Reference\n"
                                  "2024-06-10,Card batch,150.00,B-1\n"
                                  "2024-06-11,Bank fee,-2.50,\n");
  BOOST_CHECK_EQUAL(bank, result.bank_account_id);
  BOOST_REQUIRE_EQUAL(2U, result.txn_ids.size());

  bank_txn_t txn = session.reconciler.get_transaction(result.txn_ids[0]);
  BOOST_CHECK_EQUAL(money("150.00"), txn.amount);
  BOOST_CHECK_EQUAL(string("B-1"), *txn.reference);
  BOOST_CHECK(! txn.reconciled);
  BOOST_CHECK_EQUAL(2U, session.reconciler.get_unreconciled(bank).size());

  // A bad row imports nothing
  BOOST_CHECK_THROW(session.reconciler.import_csv
                    (bank, "Date,Amount\n2024-06-12,1\n2024-06-13,x\n"),
                    invalid_format_error);
  BOOST_CHECK_EQUAL(2U, session.reconciler.list_transactions(bank).size());
}

BOOST_AUTO_TEST_CASE(testManualMatch)
{
  ident_t txn = import_one("2024-06-10,Transfer,-75.00");
  settle("P-1", reconcile_match_t::PAYMENT, "75.00", date_t(2024, 6, 1));
  settle("P-2", reconcile_match_t::PAYMENT, "75.00", date_t(2024, 6, 1));

  BOOST_CHECK_THROW(session.reconciler.match_transaction
                    (txn, reconcile_match_t::PAYMENT, "P-9", "clerk"),
                    not_found_error);
  BOOST_CHECK_THROW(session.reconciler.match_transaction
                    (txn, reconcile_match_t::REFUND, "P-1", "clerk"),
                    not_found_error);

  reconcile_match_t match =
    session.reconciler.match_transaction(txn, reconcile_match_t::PAYMENT,
                                         "P-1", "clerk");
  BOOST_CHECK_EQUAL(txn, match.bank_txn_id);
  BOOST_CHECK(! match.automatic);
  BOOST_CHECK_EQUAL(string("clerk"), *match.matched_by_id);
  BOOST_CHECK(session.reconciler.get_transaction(txn).reconciled);
  BOOST_CHECK(session.reconciler.match_for(txn));

  // Matching is final: one match per row, one row per settlement
  BOOST_CHECK_THROW(session.reconciler.match_transaction
                    (txn, reconcile_match_t::PAYMENT, "P-2", "clerk"),
                    invalid_state_error);
  ident_t other = import_one("2024-06-11,Transfer,-75.00");
  BOOST_CHECK_THROW(session.reconciler.match_transaction
                    (other, reconcile_match_t::PAYMENT, "P-1", "clerk"),
                    invalid_state_error);
  BOOST_CHECK_EQUAL(1, count_rows("reconcile_matches"));
  BOOST_CHECK(! session.reconciler.match_for(other));
}

BOOST_AUTO_TEST_CASE(testAutoMatch)
{
  ident_t near  = import_one("2024-06-10,Card batch,120.00");
  ident_t far   = import_one("2024-06-10,Card batch,60.00");
  ident_t twice = import_one("2024-06-12,Refund,-35.00");

  settle("P-1", reconcile_match_t::PAYMENT, "120.00", date_t(2024, 6, 13));
  settle("P-2", reconcile_match_t::PAYMENT, "60.00", date_t(2024, 6, 14));
  settle("P-3", reconcile_match_t::PAYMENT, "-35.00", date_t(2024, 6, 11),
         "PENDING");
  settle("R-1", reconcile_match_t::REFUND, "35.00", date_t(2024, 6, 12));
  settle("R-2", reconcile_match_t::REFUND, "35.00", date_t(2024, 6, 11));
  settle("D-1", reconcile_match_t::CASH_SAFE_DROP, "60.00",
         date_t(2024, 6, 10));

  matches_list matches = session.reconciler.auto_match(bank);
  BOOST_REQUIRE_EQUAL(2U, matches.size());

  BOOST_CHECK_EQUAL(near, matches[0].bank_txn_id);
  BOOST_CHECK_EQUAL(string("P-1"), matches[0].source_id);
  BOOST_CHECK(matches[0].automatic);
  BOOST_CHECK(! matches[0].matched_by_id);

  // The earliest candidate wins; pending payments never match
  BOOST_CHECK_EQUAL(twice, matches[1].bank_txn_id);
  BOOST_CHECK_EQUAL(reconcile_match_t::REFUND, matches[1].source);
  BOOST_CHECK_EQUAL(string("R-2"), matches[1].source_id);

  bank_txns_list left = session.reconciler.get_unreconciled(bank);
  BOOST_REQUIRE_EQUAL(1U, left.size());
  BOOST_CHECK_EQUAL(far, left[0].id);

  // Nothing left to match on a second run
  BOOST_CHECK(session.reconciler.auto_match(bank).empty());
}

BOOST_AUTO_TEST_CASE(testUnreconciledRange)
{
  session.reconciler.import_csv(bank, "Date,Amount\n"
                                "2024-05-30,10\n"
                                "2024-06-05,20\n"
                                "2024-06-20,30\n");
  BOOST_CHECK_EQUAL(1U, session.reconciler.get_unreconciled
                    (bank, date_t(2024, 6, 1), date_t(2024, 6, 10)).size());
  BOOST_CHECK_EQUAL(2U, session.reconciler.get_unreconciled
                    (bank, date_t(2024, 6, 1)).size());
  BOOST_CHECK_THROW(session.reconciler.get_unreconciled(bank + 7),
                    not_found_error);
}

BOOST_AUTO_TEST_SUITE_END()
