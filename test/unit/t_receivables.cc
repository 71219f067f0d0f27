#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE receivables
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

BOOST_FIXTURE_TEST_SUITE(receivables, session_fixture)

BOOST_AUTO_TEST_CASE(testCustomers)
{
  customer_t customer =
    session.receivables.create_customer(ORG, "Globex", none,
                                        string("+233 20 000 0000"),
                                        amount_t(50000L));
  BOOST_CHECK_EQUAL(amount_t(50000L),
                    *session.receivables.get_customer(customer.id).credit_limit);

  BOOST_CHECK_THROW(session.receivables.create_customer(ORG, "Initech", none,
                                                        none, amount_t(-1L)),
                    validation_error);
  BOOST_CHECK_THROW(session.receivables.get_customer(9999), not_found_error);
  BOOST_CHECK_EQUAL(1U, session.receivables.list_customers(ORG).size());
}

BOOST_AUTO_TEST_CASE(testInvoiceLifecycle)
{
  ident_t customer = new_customer();

  document_draft_t doc(draft(customer, amount_t(1180L), date_t(2024, 6, 1),
                             date_t(2024, 6, 15)));
  doc.subtotal = amount_t(1000L);
  doc.tax      = amount_t(180L);
  doc.number   = string("S-1001");

  customer_invoice_t invoice = session.receivables.create_invoice(doc);
  invoice = session.receivables.open_invoice(invoice.id, "clerk");
  BOOST_CHECK_EQUAL(document_t::OPEN, invoice.status);

  journal_entry_t opening =
    session.journal.get_entry(*invoice.journal_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::CUSTOMER_INVOICE, opening.source);
  BOOST_CHECK_EQUAL(to_string(static_cast<long>(invoice.id)),
                    *opening.source_id);
  BOOST_CHECK_EQUAL(account("1100"), opening.lines[0].account_id);
  BOOST_CHECK_EQUAL(amount_t(1180L), opening.lines[0].debit);
  BOOST_CHECK_EQUAL(account("4000"), opening.lines[1].account_id);
  BOOST_CHECK_EQUAL(amount_t(1180L), balance_of("1100"));
  BOOST_CHECK_EQUAL(amount_t(1180L), balance_of("4000"));

  payment_request_t receipt(payment(customer, invoice.id, amount_t(500L),
                                    date_t(2024, 6, 5)));
  receipt.method = PAYMENT_MOMO;
  receipt.ref    = string("MM-4411");
  session.receivables.create_receipt(receipt, "cashier");

  outstanding_t owed = session.receivables.invoice_outstanding(invoice.id);
  BOOST_CHECK_EQUAL(amount_t(1180L), owed.total);
  BOOST_CHECK_EQUAL(amount_t(500L), owed.paid);
  BOOST_CHECK_EQUAL(amount_t(680L), owed.outstanding);
  BOOST_CHECK_EQUAL(document_t::PARTIALLY_PAID, owed.status);
  BOOST_CHECK_EQUAL(amount_t(680L), balance_of("1100"));

  // No mobile money account exists, so the receipt landed in cash
  BOOST_CHECK_EQUAL(amount_t(500L), balance_of("1000"));

  payments_list receipts = session.receivables.receipts_for_invoice(invoice.id);
  BOOST_REQUIRE_EQUAL(1U, receipts.size());
  BOOST_CHECK_EQUAL(PAYMENT_MOMO, receipts[0].method);
  BOOST_CHECK_EQUAL(string("MM-4411"), *receipts[0].ref);

  BOOST_CHECK_THROW(session.receivables.create_receipt
                    (payment(customer, invoice.id, amount_t(681L),
                             date_t(2024, 6, 6)), "cashier"),
                    insufficient_balance_error);

  session.receivables.create_receipt
    (payment(customer, invoice.id, amount_t(680L), date_t(2024, 6, 7)),
     "cashier");
  BOOST_CHECK_EQUAL(document_t::PAID,
                    session.receivables.get_invoice(invoice.id).status);
  BOOST_CHECK(balance_of("1100").is_zero());

  invoice = session.receivables.void_invoice(invoice.id, "controller",
                                             date_t(2024, 6, 14));
  BOOST_CHECK_EQUAL(document_t::VOID, invoice.status);
  BOOST_CHECK(balance_of("4000").is_zero());

  journal_entry_t reversal = session.journal.get_entry
    (*session.journal.get_entry(*invoice.journal_entry_id).reversed_by_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::CUSTOMER_INVOICE_VOID, reversal.source);
  BOOST_CHECK_EQUAL(date_t(2024, 6, 14), reversal.date);
}

BOOST_AUTO_TEST_CASE(testRevenueOverride)
{
  ident_t customer = new_customer();
  ident_t catering = session.accounts.create_account(ORG, "4100", "Catering",
                                                     account_t::REVENUE).id;

  document_draft_t doc(draft(customer, amount_t(900L), date_t(2024, 6, 1),
                             date_t(2024, 6, 30)));
  doc.account_id = catering;
  customer_invoice_t invoice = session.receivables.create_invoice(doc);
  session.receivables.open_invoice(invoice.id, "clerk");

  BOOST_CHECK_EQUAL(amount_t(900L), balance_of("4100"));
  BOOST_CHECK(balance_of("4000").is_zero());

  document_draft_t foreign(doc);
  session.seed_chart("org-2");
  foreign.account_id =
    session.accounts.find_account_by_code("org-2", "4000")->id;
  BOOST_CHECK_THROW(session.receivables.create_invoice(foreign),
                    not_found_error);
}

BOOST_AUTO_TEST_CASE(testUnappliedReceipt)
{
  ident_t customer = new_customer();

  payment_request_t deposit;
  deposit.org_id   = ORG;
  deposit.party_id = customer;
  deposit.amount   = amount_t(250L);
  deposit.date     = date_t(2024, 6, 3);

  payment_t receipt = session.receivables.create_receipt(deposit, "cashier");
  BOOST_CHECK(receipt.journal_entry_id);
  BOOST_CHECK_EQUAL(amount_t(250L), balance_of("1000"));
  BOOST_CHECK_EQUAL(amount_t(-250L), balance_of("1100"));

  deposit.party_id = 9999;
  BOOST_CHECK_THROW(session.receivables.create_receipt(deposit, "cashier"),
                    not_found_error);
}

BOOST_AUTO_TEST_SUITE_END()
