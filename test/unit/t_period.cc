#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE period
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

struct period_fixture : public session_fixture
{
  ident_t may;
  ident_t june;

  period_fixture() {
    may  = session.periods.create_period(ORG, "2024-05", date_t(2024, 5, 1),
                                         date_t(2024, 5, 31), string("cfo")).id;
    june = session.periods.create_period(ORG, "2024-06", date_t(2024, 6, 1),
                                         date_t(2024, 6, 30)).id;
  }

  posting_request_t cash_sale(const char * id, const date_t& date) {
    posting_request_t request;
    request.org_id    = ORG;
    request.date      = date;
    request.source    = journal_entry_t::ORDER;
    request.source_id = id;
    request.lines.push_back(journal_line_t::debit_of(account("1000"),
                                                     amount_t(100L)));
    request.lines.push_back(journal_line_t::credit_of(account("4000"),
                                                      amount_t(100L)));
    return request;
  }
};

BOOST_FIXTURE_TEST_SUITE(period, period_fixture)

BOOST_AUTO_TEST_CASE(testCreate)
{
  periods_list periods = session.periods.list_periods(ORG);
  BOOST_REQUIRE_EQUAL(2U, periods.size());
  BOOST_CHECK_EQUAL(string("2024-05"), periods[0].name);
  BOOST_CHECK_EQUAL(fiscal_period_t::OPEN, periods[0].status);

  BOOST_CHECK_THROW(session.periods.create_period(ORG, "Overlap",
                                                  date_t(2024, 5, 20),
                                                  date_t(2024, 6, 10)),
                    duplicate_overlap_error);
  BOOST_CHECK_THROW(session.periods.create_period(ORG, "Backwards",
                                                  date_t(2024, 8, 31),
                                                  date_t(2024, 8, 1)),
                    validation_error);

  // Another organization's calendar is independent
  BOOST_CHECK_NO_THROW(session.periods.create_period("org-2", "2024-05",
                                                     date_t(2024, 5, 1),
                                                     date_t(2024, 5, 31)));

  optional<fiscal_period_t> found =
    session.periods.find_period_for(ORG, date_t(2024, 6, 30));
  BOOST_REQUIRE(found);
  BOOST_CHECK_EQUAL(june, found->id);
  BOOST_CHECK(! session.periods.find_period_for(ORG, date_t(2024, 7, 1)));
}

BOOST_AUTO_TEST_CASE(testLifecycle)
{
  fiscal_period_t closed = session.periods.close_period(may, "cfo");
  BOOST_CHECK_EQUAL(fiscal_period_t::CLOSED, closed.status);
  BOOST_CHECK_EQUAL(string("cfo"), *closed.closed_by_id);
  BOOST_CHECK_THROW(session.periods.close_period(may, "cfo"),
                    invalid_state_error);

  fiscal_period_t locked = session.periods.lock_period(may, "cfo");
  BOOST_CHECK_EQUAL(fiscal_period_t::LOCKED, locked.status);
  BOOST_CHECK(session.periods.is_locked(ORG, date_t(2024, 5, 15)));
  BOOST_CHECK_THROW(session.periods.lock_period(may, "cfo"),
                    invalid_state_error);

  // An open period may be locked directly
  BOOST_CHECK_EQUAL(fiscal_period_t::LOCKED,
                    session.periods.lock_period(june, "cfo").status);

  BOOST_CHECK_THROW(session.periods.reopen_period(may, "clerk", "Audit"),
                    forbidden_error);
  BOOST_CHECK_THROW(session.periods.reopen_period(may, "controller", "  "),
                    validation_error);

  fiscal_period_t reopened =
    session.periods.reopen_period(may, "controller", "Late supplier invoice");
  BOOST_CHECK_EQUAL(fiscal_period_t::OPEN, reopened.status);
  BOOST_CHECK(! reopened.closed_by_id);
  BOOST_CHECK(! reopened.locked_at);
  BOOST_CHECK_THROW(session.periods.reopen_period(may, "controller", "Again"),
                    invalid_state_error);

  period_events_list history = session.periods.period_history(may);
  BOOST_REQUIRE_EQUAL(4U, history.size());
  BOOST_CHECK_EQUAL(string("CREATED"), history[0].event);
  BOOST_CHECK_EQUAL(string("cfo"), *history[0].user_id);
  BOOST_CHECK_EQUAL(string("CLOSED"), history[1].event);
  BOOST_CHECK_EQUAL(string("LOCKED"), history[2].event);
  BOOST_CHECK_EQUAL(string("REOPENED"), history[3].event);
  BOOST_CHECK_EQUAL(string("Late supplier invoice"), *history[3].reason);

  BOOST_CHECK_THROW(session.periods.get_period(9999), not_found_error);
}

BOOST_AUTO_TEST_CASE(testLockedRejectsPosting)
{
  ident_t draft =
    session.journal.create_draft(ORG, date_t(2024, 5, 10), "Accrual",
                                 cash_sale("x", date_t(2024, 5, 10)).lines);

  session.periods.lock_period(may, "cfo");

  BOOST_CHECK_THROW(session.journal.post_direct(cash_sale("1",
                                                          date_t(2024, 5, 10))),
                    period_locked_error);
  BOOST_CHECK_THROW(session.journal.post(draft, "clerk"),
                    period_locked_error);
  BOOST_CHECK_EQUAL(journal_entry_t::DRAFT,
                    session.journal.get_entry(draft).status);

  // Reversing into a locked period fails; out of it, succeeds
  ident_t june_entry =
    session.journal.post_direct(cash_sale("2", date_t(2024, 6, 5))).entry_id;
  BOOST_CHECK_THROW(session.journal.reverse(june_entry, "clerk",
                                            date_t(2024, 5, 31)),
                    period_locked_error);
  BOOST_CHECK_NO_THROW(session.journal.reverse(june_entry, "clerk"));

  // Dates outside every period are not restricted
  BOOST_CHECK_NO_THROW(session.journal.post_direct(cash_sale("3",
                                                             date_t(2024, 7, 1))));
}

BOOST_AUTO_TEST_CASE(testClosedIsSoftUnlessHardened)
{
  session.periods.close_period(may, "cfo");
  BOOST_CHECK_NO_THROW(session.journal.post_direct(cash_sale("1",
                                                             date_t(2024, 5, 3))));

  config_t hardened(memory_config());
  hardened.harden_closed_periods = true;
  session_t strict(hardened);
  strict.seed_chart(ORG);
  ident_t period = strict.periods.create_period(ORG, "2024-05",
                                                date_t(2024, 5, 1),
                                                date_t(2024, 5, 31)).id;
  strict.periods.close_period(period, "cfo");

  posting_request_t request;
  request.org_id    = ORG;
  request.date      = date_t(2024, 5, 3);
  request.source    = journal_entry_t::ORDER;
  request.source_id = "1";
  request.lines.push_back(journal_line_t::debit_of
                          (strict.accounts.find_account_by_code(ORG, "1000")->id,
                           amount_t(100L)));
  request.lines.push_back(journal_line_t::credit_of
                          (strict.accounts.find_account_by_code(ORG, "4000")->id,
                           amount_t(100L)));
  BOOST_CHECK_THROW(strict.journal.post_direct(request), period_locked_error);
}

BOOST_AUTO_TEST_CASE(testLockedRejectsDocuments)
{
  ident_t vendor = new_vendor();

  vendor_bill_t may_bill =
    session.payables.create_bill(draft(vendor, amount_t(500L),
                                       date_t(2024, 5, 2), date_t(2024, 6, 1)));
  vendor_bill_t open_bill =
    session.payables.create_bill(draft(vendor, amount_t(800L),
                                       date_t(2024, 5, 3), date_t(2024, 6, 2)));
  open_bill = session.payables.open_bill(open_bill.id, "clerk");

  session.periods.lock_period(may, "cfo");

  // Opening a bill dated inside the period
  BOOST_CHECK_THROW(session.payables.open_bill(may_bill.id, "clerk"),
                    period_locked_error);
  BOOST_CHECK_EQUAL(document_t::DRAFT,
                    session.payables.get_bill(may_bill.id).status);

  // Paying on a date inside the period
  BOOST_CHECK_THROW(session.payables.create_payment
                    (payment(vendor, open_bill.id, amount_t(100L),
                             date_t(2024, 5, 20)), "clerk"),
                    period_locked_error);
  BOOST_CHECK_EQUAL(0, count_rows("vendor_payments"));
  BOOST_CHECK(session.payables.get_bill(open_bill.id).paid_amount.is_zero());

  // Voiding as of a date inside the period
  BOOST_CHECK_THROW(session.payables.void_bill(open_bill.id, "clerk",
                                               date_t(2024, 5, 31)),
                    period_locked_error);
  BOOST_CHECK_EQUAL(document_t::OPEN,
                    session.payables.get_bill(open_bill.id).status);
}

BOOST_AUTO_TEST_SUITE_END()
