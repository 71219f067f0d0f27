#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE math
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "amount.h"
#include "times.h"
#include "csv.h"

using namespace folio;

struct amount_fixture {
  amount_fixture() {}
  ~amount_fixture() {}
};

BOOST_FIXTURE_TEST_SUITE(amount, amount_fixture)

BOOST_AUTO_TEST_CASE(testParser)
{
  amount_t x0;
  amount_t x1(string("123.45"));
  amount_t x2(string("-0.5"));
  amount_t x3(string("+100"));
  amount_t x4(string("  7.250 "));

  BOOST_CHECK(x0.is_zero());
  BOOST_CHECK_EQUAL(string("123.45"), x1.to_string());
  BOOST_CHECK_EQUAL(string("-0.50"), x2.to_string());
  BOOST_CHECK_EQUAL(amount_t(100L), x3);
  BOOST_CHECK_EQUAL(amount_t::precision_t(3), x4.precision());
  BOOST_CHECK_EQUAL(string("7.250"), x4.to_fullstring());

  amount_t x5;
  BOOST_CHECK_THROW(x5.parse("$12"), validation_error);
  BOOST_CHECK_THROW(x5.parse("1,000"), validation_error);
  BOOST_CHECK_THROW(x5.parse(""), validation_error);
  BOOST_CHECK_THROW(x5.parse("1e5"), validation_error);
}

BOOST_AUTO_TEST_CASE(testArithmetic)
{
  amount_t x1(string("0.10"));
  amount_t x2(string("0.20"));

  BOOST_CHECK_EQUAL(amount_t(string("0.30")), x1 + x2);
  BOOST_CHECK_EQUAL(amount_t(string("-0.10")), x1 - x2);
  BOOST_CHECK_EQUAL(amount_t(string("0.02")), x1 * x2);
  BOOST_CHECK_EQUAL(amount_t(string("2.5")), amount_t(10L) / amount_t(4L));
  BOOST_CHECK_THROW(x1 / amount_t(), validation_error);

  amount_t sum;
  for (int i = 0; i < 10; i++)
    sum += x1;
  BOOST_CHECK_EQUAL(amount_t(1L), sum);
  BOOST_CHECK(sum == 1L);

  BOOST_CHECK(x1 < x2);
  BOOST_CHECK(x2 > x1);
  BOOST_CHECK_EQUAL(x1, (-x1).abs());
  BOOST_CHECK_EQUAL(-1, (-x1).sign());
}

BOOST_AUTO_TEST_CASE(testRounding)
{
  BOOST_CHECK_EQUAL(string("2.35"), amount_t(string("2.345")).to_string());
  BOOST_CHECK_EQUAL(string("-2.35"), amount_t(string("-2.345")).to_string());
  BOOST_CHECK_EQUAL(string("2.34"), amount_t(string("2.344")).to_string());
  BOOST_CHECK_EQUAL(amount_t(string("0.33")),
                    (amount_t(1L) / amount_t(3L)).rounded());
  BOOST_CHECK_EQUAL(string("100000.00"), amount_t(100000L).to_string());
}

BOOST_AUTO_TEST_CASE(testTolerance)
{
  amount_t tolerance(string("0.01"));

  BOOST_CHECK(within_tolerance(amount_t(string("100.004")), amount_t(100L),
                               tolerance));
  BOOST_CHECK(! within_tolerance(amount_t(string("100.01")), amount_t(100L),
                                 tolerance));
  BOOST_CHECK(! within_tolerance(amount_t(string("99.98")), amount_t(100L),
                                 tolerance));
}

BOOST_AUTO_TEST_CASE(testParseMoney)
{
  BOOST_CHECK_EQUAL(amount_t(string("1234.50")), *parse_money("$1,234.50"));
  BOOST_CHECK_EQUAL(amount_t(string("-12")), *parse_money("(12.00)"));
  BOOST_CHECK_EQUAL(amount_t(-3L), *parse_money("-3"));
  BOOST_CHECK_EQUAL(amount_t(2500L), *parse_money("GHS 2 500"));
  BOOST_CHECK(! parse_money(""));
  BOOST_CHECK(! parse_money("   "));
  BOOST_CHECK_THROW(parse_money("n/a"), invalid_format_error);
}

BOOST_AUTO_TEST_CASE(testDates)
{
  date_t when(2024, 3, 5);

  BOOST_CHECK_EQUAL(when, parse_date("2024-03-05"));
  BOOST_CHECK_EQUAL(when, parse_date("2024/03/05"));
  BOOST_CHECK_EQUAL(when, parse_date("05/03/2024"));
  BOOST_CHECK_EQUAL(when, parse_date("05-03-2024"));
  BOOST_CHECK(! try_parse_date("March 5th"));
  BOOST_CHECK_EQUAL(string("2024-03-05"), format_date(when));
  BOOST_CHECK_EQUAL(45L, days_between(date_t(2024, 5, 1),
                                      date_t(2024, 6, 15)));
}

BOOST_AUTO_TEST_SUITE_END()
