#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE payables
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

namespace {
  /** Debits less credits an entry puts on one account. */
  amount_t net_on(const journal_entry_t& entry, const ident_t account)
  {
    amount_t net;
    foreach (const journal_line_t& line, entry.lines)
      if (line.account_id == account)
        net += line.debit - line.credit;
    return net;
  }
}

BOOST_FIXTURE_TEST_SUITE(payables, session_fixture)

BOOST_AUTO_TEST_CASE(testVendors)
{
  vendor_t vendor = session.payables.create_vendor(ORG, "Acme Supplies",
                                                   string("ap@acme.test"),
                                                   none, string("net30"));
  BOOST_CHECK_EQUAL(string("NET30"), *vendor.default_terms);
  BOOST_CHECK_EQUAL(string("ap@acme.test"),
                    *session.payables.get_vendor(vendor.id).email);

  BOOST_CHECK_THROW(session.payables.create_vendor(ORG, "Slow Co", none, none,
                                                   string("NET90")),
                    validation_error);
  BOOST_CHECK_THROW(session.payables.create_vendor(ORG, ""),
                    validation_error);

  new_vendor("Beta Parts");
  BOOST_CHECK_EQUAL(2U, session.payables.list_vendors(ORG).size());
  BOOST_CHECK(session.payables.list_vendors("org-2").empty());
}

BOOST_AUTO_TEST_CASE(testBillValidation)
{
  ident_t vendor = new_vendor();

  document_draft_t zero(draft(vendor, amount_t(), date_t(2024, 6, 1),
                              date_t(2024, 7, 1)));
  BOOST_CHECK_THROW(session.payables.create_bill(zero), validation_error);

  document_draft_t mismatch(draft(vendor, amount_t(118L), date_t(2024, 6, 1),
                                  date_t(2024, 7, 1)));
  mismatch.subtotal = amount_t(100L);
  mismatch.tax      = amount_t(10L);
  BOOST_CHECK_THROW(session.payables.create_bill(mismatch), validation_error);

  mismatch.tax = amount_t(18L);
  BOOST_CHECK_NO_THROW(session.payables.create_bill(mismatch));

  document_draft_t negative_tax(mismatch);
  negative_tax.subtotal = amount_t(120L);
  negative_tax.tax      = amount_t(-2L);
  BOOST_CHECK_THROW(session.payables.create_bill(negative_tax),
                    validation_error);

  document_draft_t early(draft(vendor, amount_t(50L), date_t(2024, 6, 1),
                               date_t(2024, 5, 1)));
  BOOST_CHECK_THROW(session.payables.create_bill(early), validation_error);

  document_draft_t stranger(draft(9999, amount_t(50L), date_t(2024, 6, 1),
                                  date_t(2024, 7, 1)));
  BOOST_CHECK_THROW(session.payables.create_bill(stranger), not_found_error);

  BOOST_CHECK_EQUAL(1U, session.payables.list_bills(ORG).size());
}

BOOST_AUTO_TEST_CASE(testRoundTrip)
{
  ident_t vendor = new_vendor();

  document_draft_t doc(draft(vendor, amount_t(100000L), date_t(2024, 6, 1),
                             date_t(2024, 7, 1)));
  doc.number = string("INV-881");
  vendor_bill_t bill = session.payables.create_bill(doc);
  BOOST_CHECK_EQUAL(document_t::DRAFT, bill.status);
  BOOST_CHECK(! bill.journal_entry_id);

  bill = session.payables.open_bill(bill.id, "clerk");
  BOOST_CHECK_EQUAL(document_t::OPEN, bill.status);
  BOOST_REQUIRE(bill.journal_entry_id);

  journal_entry_t opening = session.journal.get_entry(*bill.journal_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::VENDOR_BILL, opening.source);
  BOOST_REQUIRE_EQUAL(2U, opening.lines.size());
  BOOST_CHECK_EQUAL(account("6000"), opening.lines[0].account_id);
  BOOST_CHECK_EQUAL(amount_t(100000L), opening.lines[0].debit);
  BOOST_CHECK_EQUAL(account("2000"), opening.lines[1].account_id);
  BOOST_CHECK_EQUAL(amount_t(100000L), opening.lines[1].credit);

  BOOST_CHECK_THROW(session.payables.open_bill(bill.id, "clerk"),
                    invalid_state_error);

  payment_t first = session.payables.create_payment
    (payment(vendor, bill.id, amount_t(60000L), date_t(2024, 6, 10)), "clerk");
  bill = session.payables.get_bill(bill.id);
  BOOST_CHECK_EQUAL(amount_t(60000L), bill.paid_amount);
  BOOST_CHECK_EQUAL(document_t::PARTIALLY_PAID, bill.status);

  BOOST_REQUIRE(first.journal_entry_id);
  journal_entry_t paid = session.journal.get_entry(*first.journal_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::VENDOR_PAYMENT, paid.source);
  BOOST_CHECK_EQUAL(amount_t(60000L), net_on(paid, account("2000")));
  BOOST_CHECK_EQUAL(amount_t(-60000L), net_on(paid, account("1000")));

  outstanding_t owed = session.payables.bill_outstanding(bill.id);
  BOOST_CHECK_EQUAL(amount_t(40000L), owed.outstanding);
  BOOST_CHECK_EQUAL(document_t::PARTIALLY_PAID, owed.status);

  session.payables.create_payment
    (payment(vendor, bill.id, amount_t(40000L), date_t(2024, 6, 12)), "clerk");
  bill = session.payables.get_bill(bill.id);
  BOOST_CHECK_EQUAL(amount_t(100000L), bill.paid_amount);
  BOOST_CHECK_EQUAL(document_t::PAID, bill.status);
  BOOST_CHECK(balance_of("2000").is_zero());
  BOOST_CHECK_EQUAL(2U, session.payables.payments_for_bill(bill.id).size());

  bill = session.payables.void_bill(bill.id, "controller");
  BOOST_CHECK_EQUAL(document_t::VOID, bill.status);

  // The opening entry and its reversal cancel on accounts payable
  opening = session.journal.get_entry(*bill.journal_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::REVERSED, opening.status);
  journal_entry_t reversal =
    session.journal.get_entry(*opening.reversed_by_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::VENDOR_BILL_VOID, reversal.source);
  BOOST_CHECK((net_on(opening, account("2000")) +
               net_on(reversal, account("2000"))).is_zero());
  BOOST_CHECK(balance_of("6000").is_zero());

  // Payments already made stay on the books
  BOOST_CHECK_EQUAL(amount_t(100000L), bill.paid_amount);
  BOOST_CHECK_EQUAL(amount_t(-100000L), balance_of("1000"));

  BOOST_CHECK_THROW(session.payables.void_bill(bill.id, "controller"),
                    invalid_state_error);
}

BOOST_AUTO_TEST_CASE(testPaymentRules)
{
  ident_t vendor = new_vendor();
  ident_t other  = new_vendor("Other Vendor");

  vendor_bill_t bill =
    session.payables.create_bill(draft(vendor, amount_t(1000L),
                                       date_t(2024, 6, 1), date_t(2024, 6, 30)));

  // Drafts cannot be paid or voided
  BOOST_CHECK_THROW(session.payables.create_payment
                    (payment(vendor, bill.id, amount_t(10L),
                             date_t(2024, 6, 2)), "clerk"),
                    invalid_state_error);
  BOOST_CHECK_THROW(session.payables.void_bill(bill.id, "clerk"),
                    invalid_state_error);

  session.payables.open_bill(bill.id, "clerk");

  BOOST_CHECK_THROW(session.payables.create_payment
                    (payment(vendor, bill.id, money("1000.02"),
                             date_t(2024, 6, 2)), "clerk"),
                    insufficient_balance_error);
  BOOST_CHECK_THROW(session.payables.create_payment
                    (payment(vendor, bill.id, amount_t(), date_t(2024, 6, 2)),
                     "clerk"),
                    validation_error);
  BOOST_CHECK_THROW(session.payables.create_payment
                    (payment(other, bill.id, amount_t(10L),
                             date_t(2024, 6, 2)), "clerk"),
                    validation_error);
  BOOST_CHECK_EQUAL(0, count_rows("vendor_payments"));

  // Within the tolerance counts as paid in full
  session.payables.create_payment
    (payment(vendor, bill.id, money("999.995"), date_t(2024, 6, 2)), "clerk");
  BOOST_CHECK_EQUAL(document_t::PAID,
                    session.payables.get_bill(bill.id).status);

  BOOST_CHECK_THROW(session.payables.create_payment
                    (payment(vendor, bill.id, amount_t(1L),
                             date_t(2024, 6, 3)), "clerk"),
                    invalid_state_error);
}

BOOST_AUTO_TEST_CASE(testUnappliedPaymentAndMethods)
{
  ident_t vendor = new_vendor();
  ident_t bank   = session.accounts.create_account(ORG, "1010", "Main Bank",
                                                   account_t::ASSET).id;

  payment_request_t advance;
  advance.org_id   = ORG;
  advance.party_id = vendor;
  advance.amount   = amount_t(300L);
  advance.date     = date_t(2024, 6, 5);
  advance.method   = PAYMENT_BANK_TRANSFER;

  payment_t paid = session.payables.create_payment(advance, "clerk");
  BOOST_CHECK(! paid.document_id);
  BOOST_CHECK_EQUAL(amount_t(-300L), balance_of("2000"));
  BOOST_CHECK_EQUAL(amount_t(-300L), balance_of("1010"));

  // An explicit mapping wins over the name heuristic
  ident_t momo = session.accounts.create_account(ORG, "1020", "Till float",
                                                 account_t::ASSET).id;
  session.mapper.upsert_mapping(ORG, PAYMENT_MOMO, momo);
  BOOST_CHECK_EQUAL(momo, session.mapper.cash_account(ORG, PAYMENT_MOMO).id);
  BOOST_CHECK_EQUAL(bank, session.mapper.cash_account(ORG, PAYMENT_CARD).id);
  BOOST_CHECK_EQUAL(account("1000"),
                    session.mapper.cash_account(ORG, PAYMENT_CASH).id);
  BOOST_CHECK_EQUAL(1U, session.mapper.list_mappings(ORG).size());

  BOOST_CHECK_THROW(session.mapper.upsert_mapping(ORG, PAYMENT_CARD,
                                                  account("6000")),
                    validation_error);

  session.mapper.remove_mapping(ORG, PAYMENT_MOMO);
  BOOST_CHECK_THROW(session.mapper.remove_mapping(ORG, PAYMENT_MOMO),
                    not_found_error);

  // Without any asset account to fall back on, the method is unmapped
  BOOST_CHECK_THROW(session.mapper.cash_account("org-2", PAYMENT_CASH),
                    missing_account_mapping_error);
}

BOOST_AUTO_TEST_CASE(testExpenseOverrideAndMissingAccounts)
{
  ident_t vendor   = new_vendor();
  ident_t supplies = session.accounts.create_account(ORG, "6100", "Supplies",
                                                     account_t::EXPENSE).id;

  document_draft_t doc(draft(vendor, amount_t(75L), date_t(2024, 6, 1),
                             date_t(2024, 6, 15)));
  doc.account_id = supplies;
  vendor_bill_t bill = session.payables.create_bill(doc);
  session.payables.open_bill(bill.id, "clerk");
  BOOST_CHECK_EQUAL(amount_t(75L), balance_of("6100"));
  BOOST_CHECK(balance_of("6000").is_zero());

  session.accounts.set_account_active(account("2000"), false);
  vendor_bill_t second =
    session.payables.create_bill(draft(vendor, amount_t(10L),
                                       date_t(2024, 6, 1), date_t(2024, 6, 15)));
  BOOST_CHECK_THROW(session.payables.open_bill(second.id, "clerk"),
                    missing_account_mapping_error);
  BOOST_CHECK_EQUAL(document_t::DRAFT,
                    session.payables.get_bill(second.id).status);

  BOOST_CHECK_EQUAL(1U, session.payables.list_bills(ORG, document_t::OPEN)
                    .size());
  BOOST_CHECK_EQUAL(1U, session.payables.list_bills(ORG, document_t::DRAFT)
                    .size());
}

BOOST_AUTO_TEST_CASE(testVoidAfterOpeningReversed)
{
  ident_t vendor = new_vendor();
  vendor_bill_t bill = session.payables.create_bill
    (draft(vendor, amount_t(300L), date_t(2024, 6, 1), date_t(2024, 7, 1)));
  bill = session.payables.open_bill(bill.id, "clerk");

  // The opening entry was already reversed by hand in the journal
  session.journal.reverse(*bill.journal_entry_id, "controller");
  int entries = count_rows("journal_entries");

  bill = session.payables.void_bill(bill.id, "controller");
  BOOST_CHECK_EQUAL(document_t::VOID, bill.status);
  BOOST_CHECK_EQUAL(entries, count_rows("journal_entries"));
  BOOST_CHECK(balance_of("2000").is_zero());
  BOOST_CHECK(balance_of("6000").is_zero());
}

BOOST_AUTO_TEST_SUITE_END()

struct two_session_fixture : public database_file_fixture
{
  session_t first;
  session_t second;

  two_session_fixture()
    : database_file_fixture("t_payables"), first(file_config()),
      second(file_config()) {
    first.seed_chart(ORG);
  }
};

BOOST_FIXTURE_TEST_SUITE(concurrent_payables, two_session_fixture)

BOOST_AUTO_TEST_CASE(testPaymentsSerialize)
{
  ident_t vendor = first.payables.create_vendor(ORG, "Acme Supplies").id;
  vendor_bill_t bill = first.payables.create_bill
    (draft(vendor, amount_t(1000L), date_t(2024, 6, 1), date_t(2024, 7, 1)));
  first.payables.open_bill(bill.id, "clerk");

  {
    // The first session pays most of the bill and has not committed yet
    transaction_t pending(first.db);
    first.payables.create_payment
      (payment(vendor, bill.id, amount_t(900L), date_t(2024, 6, 10)),
       "clerk");

    BOOST_CHECK_THROW(second.payables.create_payment
                      (payment(vendor, bill.id, amount_t(200L),
                               date_t(2024, 6, 10)), "teller"),
                      database_error);
    BOOST_CHECK(! second.db.in_transaction());

    pending.commit();
  }

  // Once the first payment lands the second sees what is left
  BOOST_CHECK_THROW(second.payables.create_payment
                    (payment(vendor, bill.id, amount_t(200L),
                             date_t(2024, 6, 10)), "teller"),
                    insufficient_balance_error);
  second.payables.create_payment
    (payment(vendor, bill.id, amount_t(100L), date_t(2024, 6, 11)), "teller");

  bill = second.payables.get_bill(bill.id);
  BOOST_CHECK_EQUAL(amount_t(1000L), bill.paid_amount);
  BOOST_CHECK_EQUAL(document_t::PAID, bill.status);
  BOOST_CHECK_EQUAL(2U, first.payables.payments_for_bill(bill.id).size());
}

BOOST_AUTO_TEST_SUITE_END()
