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

/**
 * @defgroup math Mathematical objects
 */

/**
 * @file   amount.h
 *
 * @ingroup math
 *
 * @brief Exact decimal amounts of money.
 *
 * amount_t keeps its quantity as a GMP rational, so sums of journal lines
 * are exact no matter how many of them are added.  Each amount also
 * remembers how many decimal places it was created with (its precision),
 * which decides how it is written back to the store.  Display rounds to
 * the currency's two minor digits.
 */
#pragma once

#include "utils.h"

namespace folio {

/**
 * @class amount_t
 *
 * @brief Encapsulates an infinite-precision decimal amount.
 */
class amount_t
  : public ordered_field_operators<amount_t,
           ordered_field_operators<amount_t, long> >
{
public:
  typedef uint_least16_t precision_t;

  /** Number of minor digits every amount is displayed with. */
  static const precision_t display_precision = 2;

  /** Extra digits kept when a division does not terminate. */
  static const precision_t extend_by_digits = 6;

protected:
  mpq_t       quantity;
  precision_t prec;

public:
  amount_t() : prec(0) {
    mpq_init(quantity);
  }
  amount_t(const long val);
  amount_t(const string& val) : prec(0) {
    mpq_init(quantity);
    parse(val);
  }

  amount_t(const amount_t& amt) : prec(amt.prec) {
    mpq_init(quantity);
    mpq_set(quantity, amt.quantity);
  }
  amount_t& operator=(const amount_t& amt);

  ~amount_t() {
    mpq_clear(quantity);
  }

  /**
   * Parse a plain decimal of the form [-+]digits[.digits].  Anything else
   * (currency symbols, separators, exponents) raises validation_error;
   * lenient statement parsing lives with the bank import.
   */
  void parse(const string& str);

  int compare(const amount_t& amt) const;

  bool operator==(const amount_t& amt) const {
    return compare(amt) == 0;
  }
  bool operator<(const amount_t& amt) const {
    return compare(amt) < 0;
  }
  bool operator==(const long val) const {
    return compare(amount_t(val)) == 0;
  }
  bool operator<(const long val) const {
    return compare(amount_t(val)) < 0;
  }
  bool operator>(const long val) const {
    return compare(amount_t(val)) > 0;
  }

  amount_t& operator+=(const amount_t& amt);
  amount_t& operator-=(const amount_t& amt);
  amount_t& operator*=(const amount_t& amt);
  amount_t& operator/=(const amount_t& amt);

  amount_t& operator+=(const long val) {
    return *this += amount_t(val);
  }
  amount_t& operator-=(const long val) {
    return *this -= amount_t(val);
  }
  amount_t& operator*=(const long val) {
    return *this *= amount_t(val);
  }
  amount_t& operator/=(const long val) {
    return *this /= amount_t(val);
  }

  precision_t precision() const {
    return prec;
  }

  amount_t negated() const {
    amount_t temp(*this);
    temp.in_place_negate();
    return temp;
  }
  amount_t& in_place_negate();

  amount_t operator-() const {
    return negated();
  }

  amount_t abs() const {
    if (sign() < 0)
      return negated();
    return *this;
  }

  /**
   * Round half away from zero to `places' decimal digits.  This changes
   * the internal value, not only its display.
   */
  amount_t rounded(precision_t places = display_precision) const {
    amount_t temp(*this);
    temp.in_place_round(places);
    return temp;
  }
  amount_t& in_place_round(precision_t places = display_precision);

  int sign() const {
    return mpq_sgn(quantity);
  }
  bool is_zero() const {
    return sign() == 0;
  }
  bool is_nonzero() const {
    return ! is_zero();
  }
  explicit operator bool() const {
    return is_nonzero();
  }

  /**
   * to_string() rounds to the display precision ("1234.50");
   * to_fullstring() keeps every digit of the amount's own precision and
   * is the form written to the store.
   */
  string to_string() const;
  string to_fullstring() const;

  void print(std::ostream& out, precision_t places) const;

  bool valid() const;
};

inline std::ostream& operator<<(std::ostream& out, const amount_t& amt) {
  amt.print(out, amount_t::display_precision);
  return out;
}

/**
 * True when the two amounts differ by less than `tolerance'.  Balance and
 * fully-paid tests go through here.
 */
inline bool within_tolerance(const amount_t& left, const amount_t& right,
                             const amount_t& tolerance) {
  return (left - right).abs() < tolerance;
}

} // namespace folio
