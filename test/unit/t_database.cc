#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE database
#include <boost/test/unit_test.hpp>

#include "t_fixture.h"

struct locked_file_fixture : public database_file_fixture
{
  session_t session;
  sqlite3 * reader;

  locked_file_fixture()
    : database_file_fixture("t_database"), session(file_config()),
      reader(NULL) {
    session.seed_chart(ORG);
    BOOST_REQUIRE_EQUAL(SQLITE_OK, sqlite3_open(path.c_str(), &reader));
  }

  ~locked_file_fixture() {
    sqlite3_close(reader);
  }

  // A read transaction on a second connection keeps its shared lock until
  // it ends, so a writer cannot commit meanwhile.
  void begin_read() {
    BOOST_REQUIRE_EQUAL(SQLITE_OK,
                        sqlite3_exec(reader, "BEGIN; "
                                     "SELECT COUNT(*) FROM accounts;",
                                     NULL, NULL, NULL));
  }

  void end_read() {
    BOOST_REQUIRE_EQUAL(SQLITE_OK,
                        sqlite3_exec(reader, "COMMIT", NULL, NULL, NULL));
  }
};

BOOST_FIXTURE_TEST_SUITE(database, locked_file_fixture)

BOOST_AUTO_TEST_CASE(testFailedCommitRollsBack)
{
  begin_read();
  BOOST_CHECK_THROW(session.periods.create_period(ORG, "June",
                                                  date_t(2024, 6, 1),
                                                  date_t(2024, 6, 30)),
                    database_error);

  // Nothing of the failed unit is left pending on the connection
  BOOST_CHECK(! session.db.in_transaction());
  BOOST_CHECK(sqlite3_get_autocommit(session.db.handle()) != 0);
  end_read();

  fiscal_period_t june = session.periods.create_period(ORG, "June",
                                                       date_t(2024, 6, 1),
                                                       date_t(2024, 6, 30));
  BOOST_CHECK_EQUAL(1U, session.periods.list_periods(ORG).size());
  session.periods.create_period(ORG, "July", date_t(2024, 7, 1),
                                date_t(2024, 7, 31));
  BOOST_CHECK_EQUAL(june.id, session.periods.list_periods(ORG)[0].id);
}

BOOST_AUTO_TEST_CASE(testNestedGuards)
{
  {
    transaction_t outer(session.db);
    session.accounts.create_account(ORG, "6100", "Fuel", account_t::EXPENSE);
    {
      transaction_t inner(session.db);
      session.accounts.create_account(ORG, "6200", "Rent",
                                      account_t::EXPENSE);
    }
    BOOST_CHECK(session.db.in_transaction());
    outer.commit();
  }
  BOOST_CHECK(! session.db.in_transaction());
  BOOST_CHECK(session.accounts.find_account_by_code(ORG, "6100"));
  BOOST_CHECK(! session.accounts.find_account_by_code(ORG, "6200"));

  {
    transaction_t outer(session.db);
    session.accounts.create_account(ORG, "6300", "Power",
                                    account_t::EXPENSE);
  }
  BOOST_CHECK(! session.accounts.find_account_by_code(ORG, "6300"));
}

BOOST_AUTO_TEST_SUITE_END()
