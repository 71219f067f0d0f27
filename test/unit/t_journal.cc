#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE journal
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

namespace {
  lines_vector two_lines(const ident_t debit, const ident_t credit,
                         const amount_t& amount)
  {
    lines_vector lines;
    lines.push_back(journal_line_t::debit_of(debit, amount));
    lines.push_back(journal_line_t::credit_of(credit, amount));
    return lines;
  }
}

BOOST_FIXTURE_TEST_SUITE(journal, session_fixture)

BOOST_AUTO_TEST_CASE(testDraftAndPost)
{
  ident_t id = session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                            "Owner investment",
                                            two_lines(account("1000"),
                                                      account("3000"),
                                                      amount_t(5000L)));

  journal_entry_t draft = session.journal.get_entry(id);
  BOOST_CHECK_EQUAL(journal_entry_t::DRAFT, draft.status);
  BOOST_CHECK_EQUAL(2U, draft.lines.size());
  BOOST_CHECK_EQUAL(1, draft.lines[0].line_no);

  // Drafts do not reach reports
  BOOST_CHECK(balance_of("1000").is_zero());

  session.journal.post(id, "clerk");

  journal_entry_t posted = session.journal.get_entry(id);
  BOOST_CHECK_EQUAL(journal_entry_t::POSTED, posted.status);
  BOOST_CHECK_EQUAL(string("clerk"), *posted.posted_by_id);
  BOOST_CHECK_EQUAL(amount_t(5000L), balance_of("1000"));
  BOOST_CHECK_EQUAL(amount_t(5000L), balance_of("3000"));

  BOOST_CHECK_THROW(session.journal.post(id, "clerk"), invalid_state_error);
}

BOOST_AUTO_TEST_CASE(testUnbalancedCreatesNothing)
{
  lines_vector lines;
  lines.push_back(journal_line_t::debit_of(account("1000"), amount_t(100L)));
  lines.push_back(journal_line_t::credit_of(account("4000"), amount_t(90L)));

  BOOST_CHECK_THROW(session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                                 "Bad", lines),
                    unbalanced_entry_error);

  posting_request_t request;
  request.org_id    = ORG;
  request.date      = date_t(2024, 6, 1);
  request.source    = journal_entry_t::ORDER;
  request.source_id = "order-1";
  request.lines     = lines;
  BOOST_CHECK_THROW(session.journal.post_direct(request),
                    unbalanced_entry_error);

  BOOST_CHECK_EQUAL(0, count_rows("journal_entries"));
  BOOST_CHECK_EQUAL(0, count_rows("journal_lines"));

  // A difference inside the tolerance is accepted
  lines[1].credit = money("100.005");
  BOOST_CHECK_NO_THROW(session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                                    "Close enough", lines));
}

BOOST_AUTO_TEST_CASE(testMalformedLines)
{
  lines_vector single;
  single.push_back(journal_line_t::debit_of(account("1000"), amount_t(1L)));
  BOOST_CHECK_THROW(session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                                 "One line", single),
                    validation_error);

  lines_vector both(two_lines(account("1000"), account("4000"),
                              amount_t(10L)));
  both[0].credit = amount_t(10L);
  both.push_back(journal_line_t::credit_of(account("4000"), amount_t(10L)));
  BOOST_CHECK_THROW(session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                                 "Both sides", both),
                    validation_error);

  lines_vector negative(two_lines(account("1000"), account("4000"),
                                  amount_t(-10L)));
  BOOST_CHECK_THROW(session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                                 "Negative", negative),
                    validation_error);

  session.seed_chart("org-2");
  ident_t foreign =
    session.accounts.find_account_by_code("org-2", "4000")->id;
  BOOST_CHECK_THROW(session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                                 "Foreign",
                                                 two_lines(account("1000"),
                                                           foreign,
                                                           amount_t(10L))),
                    not_found_error);

  session.accounts.set_account_active(account("6000"), false);
  BOOST_CHECK_THROW(session.journal.create_draft(ORG, date_t(2024, 6, 1),
                                                 "Inactive",
                                                 two_lines(account("6000"),
                                                           account("1000"),
                                                           amount_t(10L))),
                    validation_error);
}

BOOST_AUTO_TEST_CASE(testPostDirectIsIdempotent)
{
  posting_request_t request;
  request.org_id    = ORG;
  request.date      = date_t(2024, 6, 2);
  request.memo      = "Sale - order 17";
  request.source    = journal_entry_t::ORDER;
  request.source_id = "17";
  request.lines     = two_lines(account("1000"), account("4000"),
                                amount_t(250L));

  posting_result_t first  = session.journal.post_direct(request);
  posting_result_t second = session.journal.post_direct(request);

  BOOST_CHECK(! first.duplicate);
  BOOST_CHECK(second.duplicate);
  BOOST_CHECK_EQUAL(first.entry_id, second.entry_id);
  BOOST_CHECK_EQUAL(1, count_rows("journal_entries"));
  BOOST_CHECK_EQUAL(amount_t(250L), balance_of("4000"));

  // The same id under another source is a different event
  request.source = journal_entry_t::REFUND;
  request.lines  = two_lines(account("4000"), account("1000"),
                             amount_t(250L));
  BOOST_CHECK(! session.journal.post_direct(request).duplicate);
  BOOST_CHECK_EQUAL(2, count_rows("journal_entries"));

  optional<journal_entry_t> found =
    session.journal.find_by_source(ORG, journal_entry_t::ORDER, "17");
  BOOST_CHECK(found);
  BOOST_CHECK_EQUAL(first.entry_id, found->id);

  request.source_id = "";
  BOOST_CHECK_THROW(session.journal.post_direct(request), validation_error);
}

BOOST_AUTO_TEST_CASE(testReversalSymmetry)
{
  posting_request_t request;
  request.org_id    = ORG;
  request.date      = date_t(2024, 6, 3);
  request.memo      = "Rent";
  request.source    = journal_entry_t::MANUAL;
  request.source_id = "rent-june";
  request.lines     = two_lines(account("6000"), account("1000"),
                                amount_t(1200L));
  request.lines.push_back(journal_line_t::debit_of(account("2100"),
                                                   amount_t(50L)));
  request.lines.push_back(journal_line_t::credit_of(account("1000"),
                                                    amount_t(50L)));

  ident_t original = session.journal.post_direct(request).entry_id;
  ident_t reversal = session.journal.reverse(original, "controller",
                                             date_t(2024, 6, 10));

  journal_entry_t before = session.journal.get_entry(original);
  journal_entry_t after  = session.journal.get_entry(reversal);

  BOOST_CHECK_EQUAL(journal_entry_t::REVERSED, before.status);
  BOOST_CHECK_EQUAL(reversal, *before.reversed_by_entry_id);
  BOOST_CHECK_EQUAL(journal_entry_t::POSTED, after.status);
  BOOST_CHECK_EQUAL(journal_entry_t::REVERSAL, after.source);
  BOOST_CHECK_EQUAL(original, *after.reverses_entry_id);
  BOOST_CHECK_EQUAL(to_string(static_cast<long>(original)), *after.source_id);
  BOOST_CHECK_EQUAL(date_t(2024, 6, 10), after.date);

  BOOST_REQUIRE_EQUAL(before.lines.size(), after.lines.size());
  for (std::size_t i = 0; i < before.lines.size(); i++) {
    BOOST_CHECK_EQUAL(before.lines[i].account_id, after.lines[i].account_id);
    BOOST_CHECK_EQUAL(before.lines[i].debit, after.lines[i].credit);
    BOOST_CHECK_EQUAL(before.lines[i].credit, after.lines[i].debit);
  }

  BOOST_CHECK(balance_of("1000").is_zero());
  BOOST_CHECK(balance_of("2100").is_zero());
  BOOST_CHECK(balance_of("6000").is_zero());

  BOOST_CHECK_THROW(session.journal.reverse(original, "controller"),
                    invalid_state_error);
}

BOOST_AUTO_TEST_CASE(testListAndExport)
{
  for (int i = 1; i <= 3; i++) {
    posting_request_t request;
    request.org_id    = ORG;
    request.branch_id = string(i == 2 ? "north" : "south");
    request.date      = date_t(2024, 6, i);
    request.memo      = "Sale, counter " + to_string(static_cast<long>(i));
    request.source    = journal_entry_t::ORDER;
    request.source_id = to_string(static_cast<long>(i));
    request.lines     = two_lines(account("1000"), account("4000"),
                                  amount_t(static_cast<long>(i * 10)));
    session.journal.post_direct(request);
  }
  session.journal.create_draft(ORG, date_t(2024, 6, 4), "Draft",
                               two_lines(account("6000"), account("1000"),
                                         amount_t(5L)));

  entry_page_t all = session.journal.list_entries(ORG);
  BOOST_CHECK_EQUAL(4U, all.total);
  BOOST_CHECK_EQUAL(date_t(2024, 6, 4), all.entries.front().date);

  entry_filter_t filter;
  filter.status = journal_entry_t::POSTED;
  filter.from   = date_t(2024, 6, 2);
  entry_page_t posted = session.journal.list_entries(ORG, filter);
  BOOST_CHECK_EQUAL(2U, posted.total);

  entry_filter_t branch;
  branch.branch_id = string("north");
  BOOST_CHECK_EQUAL(1U, session.journal.list_entries(ORG, branch).total);

  entry_page_t page = session.journal.list_entries(ORG, entry_filter_t(),
                                                   page_t(1, 2));
  BOOST_CHECK_EQUAL(4U, page.total);
  BOOST_CHECK_EQUAL(2U, page.entries.size());

  std::ostringstream out;
  session.journal.export_csv(out, ORG, date_t(2024, 6, 1),
                             date_t(2024, 6, 30));

  std::istringstream in(out.str());
  string line;
  std::getline(in, line);
  BOOST_CHECK_EQUAL(string("date,entry,source,source_id,status,memo,account,"
                           "account_name,branch,debit,credit"), line);
  std::getline(in, line);
  BOOST_CHECK(starts_with(line, "2024-06-01,"));
  BOOST_CHECK(contains(line, "\"Sale, counter 1\""));

  int rows = 1;
  while (std::getline(in, line))
    rows++;
  BOOST_CHECK_EQUAL(6, rows);   // three entries of two lines, no draft
}

BOOST_AUTO_TEST_SUITE_END()
