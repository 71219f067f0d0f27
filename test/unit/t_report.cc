#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE report
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

struct report_fixture : public session_fixture
{
  report_fixture() {
    post(date_t(2023, 12, 20), "1000", "4000", 700L);
    post(date_t(2024, 1, 10),  "1000", "3000", 10000L);
    post(date_t(2024, 2, 1),   "1200", "1000", 3000L);
    post(date_t(2024, 3, 5),   "1000", "4000", 2000L, string("accra-1"));
    post(date_t(2024, 3, 5),   "5000", "1200", 800L,  string("accra-1"));
    post(date_t(2024, 4, 1),   "6000", "1000", 500L,  string("kumasi"));
  }

  ident_t post(const date_t& date, const char * debit, const char * credit,
               const long amount,
               const optional<string>& branch = none) {
    lines_vector lines;
    lines.push_back(journal_line_t::debit_of(account(debit),
                                             amount_t(amount)));
    lines.push_back(journal_line_t::credit_of(account(credit),
                                              amount_t(amount)));
    ident_t id = session.journal.create_draft(ORG, date, "Test entry", lines,
                                              branch, string("clerk"));
    session.journal.post(id, "clerk");
    return id;
  }

  const account_balance_t * find(const balances_list& balances,
                                 const char * code) {
    foreach (const account_balance_t& balance, balances)
      if (balance.code == code)
        return &balance;
    return NULL;
  }
};

BOOST_FIXTURE_TEST_SUITE(report, report_fixture)

BOOST_AUTO_TEST_CASE(testTrialBalance)
{
  trial_balance_t tb = session.reports.trial_balance(ORG);
  BOOST_CHECK_EQUAL(date_t(2024, 6, 15), tb.as_of);
  BOOST_CHECK(tb.balanced);
  BOOST_CHECK_EQUAL(amount_t(17000L), tb.total_debits);
  BOOST_CHECK_EQUAL(amount_t(17000L), tb.total_credits);

  const account_balance_t * cash = find(tb.accounts, "1000");
  BOOST_REQUIRE(cash);
  BOOST_CHECK_EQUAL(amount_t(12700L), cash->debit);
  BOOST_CHECK_EQUAL(amount_t(3500L), cash->credit);
  BOOST_CHECK_EQUAL(amount_t(9200L), cash->balance);
  BOOST_CHECK_EQUAL(amount_t(2700L), find(tb.accounts, "4000")->balance);

  // Untouched accounts still appear while active
  BOOST_REQUIRE(find(tb.accounts, "2100"));
  BOOST_CHECK(find(tb.accounts, "2100")->balance.is_zero());
  session.accounts.set_account_active(account("2100"), false);
  BOOST_CHECK(! find(session.reports.trial_balance(ORG).accounts, "2100"));

  tb = session.reports.trial_balance(ORG, date_t(2024, 1, 31));
  BOOST_CHECK_EQUAL(amount_t(10700L), tb.total_debits);
  BOOST_CHECK_EQUAL(amount_t(10700L), find(tb.accounts, "1000")->balance);
}

BOOST_AUTO_TEST_CASE(testProfitAndLoss)
{
  profit_and_loss_t pnl = session.reports.profit_and_loss(ORG);
  BOOST_CHECK_EQUAL(date_t(2024, 1, 1), pnl.from);
  BOOST_CHECK_EQUAL(date_t(2024, 6, 15), pnl.to);
  BOOST_CHECK_EQUAL(amount_t(2000L), pnl.total_revenue);
  BOOST_CHECK_EQUAL(amount_t(800L), pnl.total_cogs);
  BOOST_CHECK_EQUAL(amount_t(1200L), pnl.gross_profit);
  BOOST_CHECK_EQUAL(amount_t(500L), pnl.total_expenses);
  BOOST_CHECK_EQUAL(amount_t(700L), pnl.net_profit);
  BOOST_CHECK_EQUAL(1U, pnl.revenue.size());

  pnl = session.reports.profit_and_loss(ORG, date_t(2023, 1, 1),
                                        date_t(2023, 12, 31));
  BOOST_CHECK_EQUAL(amount_t(700L), pnl.net_profit);

  BOOST_CHECK_THROW(session.reports.profit_and_loss(ORG, date_t(2024, 6, 1),
                                                    date_t(2024, 5, 1)),
                    validation_error);
}

BOOST_AUTO_TEST_CASE(testBalanceSheet)
{
  balance_sheet_t bs = session.reports.balance_sheet(ORG);
  BOOST_CHECK_EQUAL(amount_t(11400L), bs.total_assets);
  BOOST_CHECK(bs.total_liabilities.is_zero());
  BOOST_CHECK_EQUAL(amount_t(1400L), bs.current_earnings);
  BOOST_CHECK_EQUAL(amount_t(11400L), bs.total_equity);
  BOOST_CHECK(bs.balanced);

  // Liabilities enter the equation too
  vendor_bill_t bill = session.payables.create_bill
    (draft(new_vendor(), amount_t(250L), date_t(2024, 6, 1),
           date_t(2024, 7, 1)));
  session.payables.open_bill(bill.id, "clerk");

  bs = session.reports.balance_sheet(ORG);
  BOOST_CHECK_EQUAL(amount_t(250L), bs.total_liabilities);
  BOOST_CHECK_EQUAL(amount_t(1150L), bs.current_earnings);
  BOOST_CHECK_EQUAL(bs.total_assets,
                    bs.total_liabilities + bs.total_equity);
  BOOST_CHECK(bs.balanced);
}

BOOST_AUTO_TEST_CASE(testReversalsCancel)
{
  ident_t mistake = post(date_t(2024, 5, 1), "6000", "1000", 900L);
  BOOST_CHECK_EQUAL(amount_t(1400L),
                    session.reports.profit_and_loss(ORG).total_expenses);

  session.journal.reverse(mistake, "clerk", date_t(2024, 5, 2));
  profit_and_loss_t pnl = session.reports.profit_and_loss(ORG);
  BOOST_CHECK_EQUAL(amount_t(500L), pnl.total_expenses);
  BOOST_CHECK_EQUAL(amount_t(700L), pnl.net_profit);
  BOOST_CHECK(session.reports.trial_balance(ORG).balanced);
  BOOST_CHECK_EQUAL(amount_t(9200L), balance_of("1000"));
}

BOOST_AUTO_TEST_CASE(testBranchFilter)
{
  trial_balance_t tb = session.reports.trial_balance(ORG, none,
                                                     string("accra-1"));
  BOOST_CHECK_EQUAL(amount_t(2800L), tb.total_debits);
  BOOST_CHECK(tb.balanced);
  BOOST_CHECK_EQUAL(amount_t(2000L), find(tb.accounts, "1000")->balance);

  profit_and_loss_t pnl =
    session.reports.profit_and_loss(ORG, none, none, string("kumasi"));
  BOOST_CHECK(pnl.total_revenue.is_zero());
  BOOST_CHECK_EQUAL(amount_t(-500L), pnl.net_profit);

  BOOST_CHECK(session.reports.trial_balance(ORG, none, string("tema"))
              .total_debits.is_zero());
}

BOOST_AUTO_TEST_CASE(testPayablesAging)
{
  ident_t vendor = new_vendor();

  vendor_bill_t late = session.payables.create_bill
    (draft(vendor, amount_t(50000L), date_t(2024, 4, 1), date_t(2024, 5, 1)));
  session.payables.open_bill(late.id, "clerk");
  session.payables.create_payment
    (payment(vendor, late.id, amount_t(20000L), date_t(2024, 6, 1)), "clerk");

  vendor_bill_t upcoming = session.payables.create_bill
    (draft(vendor, amount_t(10000L), date_t(2024, 6, 1), date_t(2024, 7, 1)));
  session.payables.open_bill(upcoming.id, "clerk");

  vendor_bill_t ancient = session.payables.create_bill
    (draft(vendor, amount_t(5000L), date_t(2023, 12, 1), date_t(2024, 1, 1)));
  session.payables.open_bill(ancient.id, "clerk");

  // Drafts are not owed yet
  session.payables.create_bill
    (draft(vendor, amount_t(999L), date_t(2024, 6, 1), date_t(2024, 6, 2)));

  aging_report_t aging = session.reports.ap_aging(ORG);
  BOOST_CHECK_EQUAL(amount_t(10000L), aging.current);
  BOOST_CHECK_EQUAL(amount_t(30000L), aging.days_31_60);
  BOOST_CHECK(aging.days_61_90.is_zero());
  BOOST_CHECK_EQUAL(amount_t(5000L), aging.over_90);
  BOOST_CHECK_EQUAL(amount_t(45000L), aging.total);
  BOOST_REQUIRE_EQUAL(3U, aging.documents.size());

  BOOST_CHECK_EQUAL(ancient.id, aging.documents[0].document_id);
  BOOST_CHECK_EQUAL(166L, aging.documents[0].days_overdue);
  BOOST_CHECK_EQUAL(late.id, aging.documents[1].document_id);
  BOOST_CHECK_EQUAL(45L, aging.documents[1].days_overdue);
  BOOST_CHECK_EQUAL(amount_t(20000L), aging.documents[1].paid);
  BOOST_CHECK_EQUAL(amount_t(30000L), aging.documents[1].balance);
  BOOST_CHECK_EQUAL(string("Acme Supplies"), aging.documents[1].party_name);
  BOOST_CHECK_EQUAL(-16L, aging.documents[2].days_overdue);

  // A full payment drops the bill from the report
  session.payables.create_payment
    (payment(vendor, ancient.id, amount_t(5000L), date_t(2024, 6, 14)),
     "clerk");
  BOOST_CHECK(session.reports.ap_aging(ORG).over_90.is_zero());
  BOOST_CHECK_EQUAL(2U, session.reports.ap_aging(ORG).documents.size());
}

BOOST_AUTO_TEST_CASE(testReceivablesAging)
{
  ident_t customer = new_customer();

  customer_invoice_t first = session.receivables.create_invoice
    (draft(customer, amount_t(1200L), date_t(2024, 2, 1), date_t(2024, 3, 1)));
  session.receivables.open_invoice(first.id, "clerk");

  customer_invoice_t second = session.receivables.create_invoice
    (draft(customer, amount_t(800L), date_t(2024, 3, 10), date_t(2024, 4, 10)));
  session.receivables.open_invoice(second.id, "clerk");

  aging_report_t aging = session.reports.ar_aging(ORG, date_t(2024, 6, 15));
  BOOST_CHECK_EQUAL(amount_t(1200L), aging.over_90);
  BOOST_CHECK_EQUAL(amount_t(800L), aging.days_61_90);
  BOOST_CHECK_EQUAL(amount_t(2000L), aging.total);
  BOOST_CHECK_EQUAL(string("Globex"), aging.documents[0].party_name);

  // Aged as of an earlier day the same invoices are younger
  aging = session.reports.ar_aging(ORG, date_t(2024, 4, 15));
  BOOST_CHECK_EQUAL(amount_t(800L), aging.current);
  BOOST_CHECK_EQUAL(amount_t(1200L), aging.days_31_60);

  BOOST_CHECK(session.reports.ap_aging(ORG).total.is_zero());
}

BOOST_AUTO_TEST_CASE(testCsvOutput)
{
  std::ostringstream tb;
  write_csv(tb, session.reports.trial_balance(ORG));
  BOOST_CHECK(starts_with(tb.str(), "code,name,type,debit,credit,balance\n"
                          "1000,Cash,ASSET,12700.00,3500.00,9200.00\n"));
  BOOST_CHECK(ends_with(tb.str(), "TOTAL,,,17000.00,17000.00,\n"));

  std::ostringstream pnl;
  write_csv(pnl, session.reports.profit_and_loss(ORG));
  BOOST_CHECK(starts_with(pnl.str(), "section,code,name,amount\n"
                          "REVENUE,4000,Sales,2000.00\n"));
  BOOST_CHECK(ends_with(pnl.str(), "TOTAL,,Net profit,700.00\n"));

  std::ostringstream aging;
  write_csv(aging, session.reports.ap_aging(ORG));
  BOOST_CHECK_EQUAL(string("document,party,number,due_date,days_overdue,"
                           "total,paid,balance\n"), aging.str());

  std::ostringstream chart;
  write_csv(chart, session.accounts.list_accounts(ORG));
  BOOST_CHECK(starts_with(chart.str(), "code,name,type,parent,active\n"
                          "1000,Cash,ASSET,,true\n"));
}

BOOST_AUTO_TEST_SUITE_END()
