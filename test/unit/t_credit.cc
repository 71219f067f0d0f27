#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE credit
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

struct credit_fixture : public session_fixture
{
  credit_draft_t note(const ident_t party, const amount_t& amount) {
    credit_draft_t draft;
    draft.org_id   = ORG;
    draft.party_id = party;
    draft.date     = date_t(2024, 6, 4);
    draft.amount   = amount;
    draft.reason   = string("Damaged goods");
    return draft;
  }

  refund_request_t refund(const amount_t& amount) {
    refund_request_t request;
    request.amount = amount;
    request.date   = date_t(2024, 6, 8);
    return request;
  }

  void check_conserved(const credit_note_t& note) {
    BOOST_CHECK(note.allocated_amount + note.refunded_amount <=
                note.amount + session.config.tolerance);
  }
};

BOOST_FIXTURE_TEST_SUITE(credit, credit_fixture)

BOOST_AUTO_TEST_CASE(testVendorCredit)
{
  ident_t vendor = new_vendor();
  vendor_bill_t bill =
    session.payables.create_bill(draft(vendor, amount_t(1000L),
                                       date_t(2024, 6, 1), date_t(2024, 7, 1)));
  session.payables.open_bill(bill.id, "clerk");

  credit_note_t credit = session.vendor_credits.create(note(vendor,
                                                            amount_t(500L)));
  BOOST_CHECK_EQUAL(credit_note_t::DRAFT, credit.status);
  BOOST_CHECK_THROW(session.vendor_credits.allocate
                    (credit.id, "clerk",
                     allocation_requests_t(1, allocation_request_t
                                           (bill.id, amount_t(10L)))),
                    invalid_state_error);

  credit = session.vendor_credits.open(credit.id, "clerk");
  BOOST_CHECK_EQUAL(credit_note_t::OPEN, credit.status);
  BOOST_CHECK_EQUAL(amount_t(500L), balance_of("2000"));   // 1000 - 500
  BOOST_CHECK_EQUAL(amount_t(500L), balance_of("6000"));   // 1000 - 500

  journal_entry_t opening = session.journal.get_entry(*credit.journal_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::VENDOR_CREDIT_NOTE, opening.source);

  // Allocation moves the bill's paid amount and posts nothing
  int entries = count_rows("journal_entries");
  credit = session.vendor_credits.allocate
    (credit.id, "clerk",
     allocation_requests_t(1, allocation_request_t(bill.id, amount_t(300L))));
  BOOST_CHECK_EQUAL(entries, count_rows("journal_entries"));
  BOOST_CHECK_EQUAL(credit_note_t::PARTIALLY_APPLIED, credit.status);
  BOOST_CHECK_EQUAL(amount_t(300L), credit.allocated_amount);
  BOOST_CHECK_EQUAL(amount_t(200L), credit.remaining());
  check_conserved(credit);

  bill = session.payables.get_bill(bill.id);
  BOOST_CHECK_EQUAL(amount_t(300L), bill.paid_amount);
  BOOST_CHECK_EQUAL(document_t::PARTIALLY_PAID, bill.status);

  BOOST_CHECK_THROW(session.vendor_credits.allocate
                    (credit.id, "clerk",
                     allocation_requests_t(1, allocation_request_t
                                           (bill.id, amount_t(250L)))),
                    insufficient_balance_error);
  BOOST_CHECK_THROW(session.vendor_credits.create_refund(credit.id,
                                                         refund(amount_t(201L)),
                                                         "clerk"),
                    insufficient_balance_error);
  BOOST_CHECK_EQUAL(amount_t(300L),
                    session.vendor_credits.get(credit.id).allocated_amount);

  credit_refund_t refunded =
    session.vendor_credits.create_refund(credit.id, refund(amount_t(200L)),
                                         "clerk");
  BOOST_REQUIRE(refunded.journal_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::VENDOR_CREDIT_REFUND,
                    session.journal.get_entry(*refunded.journal_entry_id)
                    .source);
  BOOST_CHECK_EQUAL(amount_t(200L), balance_of("1000"));
  BOOST_CHECK_EQUAL(amount_t(700L), balance_of("2000"));

  credit = session.vendor_credits.get(credit.id);
  BOOST_CHECK_EQUAL(credit_note_t::APPLIED, credit.status);
  BOOST_CHECK(credit.remaining().is_zero());
  BOOST_CHECK_EQUAL(1U, credit.allocations.size());
  BOOST_CHECK_EQUAL(1U, credit.refunds.size());
  check_conserved(credit);

  BOOST_CHECK_THROW(session.vendor_credits.create_refund(credit.id,
                                                         refund(amount_t(1L)),
                                                         "clerk"),
                    invalid_state_error);
  BOOST_CHECK_THROW(session.vendor_credits.void_note(credit.id, "clerk"),
                    invalid_state_error);

  // Removing the allocation gives the bill its balance back
  credit = session.vendor_credits.delete_allocation(credit.allocations[0].id,
                                                    "clerk");
  BOOST_CHECK(credit.allocated_amount.is_zero());
  BOOST_CHECK_EQUAL(credit_note_t::PARTIALLY_APPLIED, credit.status);
  BOOST_CHECK(credit.allocations.empty());

  bill = session.payables.get_bill(bill.id);
  BOOST_CHECK(bill.paid_amount.is_zero());
  BOOST_CHECK_EQUAL(document_t::OPEN, bill.status);

  BOOST_CHECK_THROW(session.vendor_credits.delete_allocation(9999, "clerk"),
                    not_found_error);
}

BOOST_AUTO_TEST_CASE(testAllocationTargets)
{
  ident_t vendor = new_vendor();
  ident_t other  = new_vendor("Other Vendor");

  vendor_bill_t theirs =
    session.payables.create_bill(draft(other, amount_t(100L),
                                       date_t(2024, 6, 1), date_t(2024, 7, 1)));
  session.payables.open_bill(theirs.id, "clerk");

  vendor_bill_t small =
    session.payables.create_bill(draft(vendor, amount_t(40L),
                                       date_t(2024, 6, 1), date_t(2024, 7, 1)));
  session.payables.open_bill(small.id, "clerk");

  credit_note_t credit =
    session.vendor_credits.open(session.vendor_credits.create
                                (note(vendor, amount_t(100L))).id, "clerk");

  BOOST_CHECK_THROW(session.vendor_credits.allocate
                    (credit.id, "clerk",
                     allocation_requests_t(1, allocation_request_t
                                           (theirs.id, amount_t(10L)))),
                    validation_error);

  // More than the bill still owes
  BOOST_CHECK_THROW(session.vendor_credits.allocate
                    (credit.id, "clerk",
                     allocation_requests_t(1, allocation_request_t
                                           (small.id, amount_t(50L)))),
                    insufficient_balance_error);

  // A failed batch leaves nothing behind
  allocation_requests_t batch;
  batch.push_back(allocation_request_t(small.id, amount_t(40L)));
  batch.push_back(allocation_request_t(theirs.id, amount_t(10L)));
  BOOST_CHECK_THROW(session.vendor_credits.allocate(credit.id, "clerk", batch),
                    validation_error);
  BOOST_CHECK(session.payables.get_bill(small.id).paid_amount.is_zero());
  BOOST_CHECK(session.vendor_credits.get(credit.id).allocated_amount.is_zero());

  credit = session.vendor_credits.allocate
    (credit.id, "clerk",
     allocation_requests_t(1, allocation_request_t(small.id, amount_t(40L))));
  BOOST_CHECK_EQUAL(document_t::PAID,
                    session.payables.get_bill(small.id).status);
  check_conserved(credit);

  BOOST_CHECK_THROW(session.vendor_credits.allocate
                    (credit.id, "clerk", allocation_requests_t()),
                    validation_error);
}

BOOST_AUTO_TEST_CASE(testCustomerCredit)
{
  ident_t customer = new_customer();
  customer_invoice_t invoice =
    session.receivables.create_invoice(draft(customer, amount_t(600L),
                                             date_t(2024, 6, 1),
                                             date_t(2024, 6, 30)));
  session.receivables.open_invoice(invoice.id, "clerk");

  credit_note_t credit =
    session.customer_credits.open(session.customer_credits.create
                                  (note(customer, amount_t(150L))).id,
                                  "clerk");
  BOOST_CHECK_EQUAL(amount_t(450L), balance_of("1100"));
  BOOST_CHECK_EQUAL(amount_t(450L), balance_of("4000"));

  credit = session.customer_credits.allocate
    (credit.id, "clerk",
     allocation_requests_t(1, allocation_request_t(invoice.id,
                                                   amount_t(150L))));
  BOOST_CHECK_EQUAL(credit_note_t::APPLIED, credit.status);
  BOOST_CHECK_EQUAL(amount_t(150L),
                    session.receivables.get_invoice(invoice.id).paid_amount);

  // A customer refund pays cash out against receivables
  credit_note_t second =
    session.customer_credits.open(session.customer_credits.create
                                  (note(customer, amount_t(80L))).id, "clerk");
  session.customer_credits.create_refund(second.id, refund(amount_t(80L)),
                                         "clerk");
  BOOST_CHECK_EQUAL(amount_t(-80L), balance_of("1000"));
  BOOST_CHECK_EQUAL(amount_t(450L), balance_of("1100"));

  BOOST_CHECK_EQUAL(2U, session.customer_credits.list(ORG).size());
  BOOST_CHECK_EQUAL(2U, session.customer_credits
                    .list(ORG, credit_note_t::APPLIED).size());
}

BOOST_AUTO_TEST_CASE(testVoidUnusedNote)
{
  ident_t customer = new_customer();

  credit_note_t credit =
    session.customer_credits.open(session.customer_credits.create
                                  (note(customer, amount_t(90L))).id, "clerk");
  credit = session.customer_credits.void_note(credit.id, "controller");
  BOOST_CHECK_EQUAL(credit_note_t::VOID, credit.status);
  BOOST_CHECK(balance_of("1100").is_zero());
  BOOST_CHECK(balance_of("4000").is_zero());

  journal_entry_t reversal = session.journal.get_entry
    (*session.journal.get_entry(*credit.journal_entry_id).reversed_by_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::CUSTOMER_CREDIT_NOTE_VOID,
                    reversal.source);

  BOOST_CHECK_THROW(session.customer_credits.void_note(credit.id, "controller"),
                    invalid_state_error);

  // A draft note voids without touching the journal
  credit_note_t draft_note =
    session.customer_credits.create(note(customer, amount_t(10L)));
  int entries = count_rows("journal_entries");
  BOOST_CHECK_EQUAL(credit_note_t::VOID,
                    session.customer_credits.void_note(draft_note.id, "clerk")
                    .status);
  BOOST_CHECK_EQUAL(entries, count_rows("journal_entries"));

  BOOST_CHECK_THROW(session.customer_credits.create(note(customer, amount_t())),
                    validation_error);
}

BOOST_AUTO_TEST_SUITE_END()
