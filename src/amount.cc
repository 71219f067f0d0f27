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

#include <system.hh>

#include "amount.h"

namespace folio {

namespace {
  const boost::regex decimal_re("^\\s*([-+])?(\\d+)(?:\\.(\\d*))?\\s*$");

  void set_power_of_ten(mpz_t result, amount_t::precision_t places)
  {
    mpz_ui_pow_ui(result, 10, places);
  }

  void stream_out_mpq(std::ostream&         out,
                      mpq_srcptr            quant,
                      amount_t::precision_t precision)
  {
    // Convert the rational number to a floating-point, extending the
    // floating-point to a large enough size to get a precise answer.

    mpfr_prec_t num_prec =
      static_cast<mpfr_prec_t>(mpz_sizeinbase(mpq_numref(quant), 2));
    num_prec += amount_t::extend_by_digits * 64;
    if (num_prec < MPFR_PREC_MIN)
      num_prec = MPFR_PREC_MIN;

    mpfr_prec_t den_prec =
      static_cast<mpfr_prec_t>(mpz_sizeinbase(mpq_denref(quant), 2));
    den_prec += amount_t::extend_by_digits * 64;
    if (den_prec < MPFR_PREC_MIN)
      den_prec = MPFR_PREC_MIN;

    mpfr_t fnum, fden, fresult;
    mpfr_init2(fnum, num_prec);
    mpfr_init2(fden, den_prec);
    mpfr_init2(fresult, num_prec + den_prec);

    mpfr_set_z(fnum, mpq_numref(quant), MPFR_RNDN);
    mpfr_set_z(fden, mpq_denref(quant), MPFR_RNDN);
    mpfr_div(fresult, fnum, fden, MPFR_RNDN);

    char * buf = NULL;
    int    len = mpfr_asprintf(&buf, "%.*RNf", static_cast<int>(precision),
                               fresult);

    mpfr_clear(fnum);
    mpfr_clear(fden);
    mpfr_clear(fresult);

    if (len < 0)
      throw_(validation_error,
             _("Cannot output amount to a floating-point representation"));

    DEBUG("amount.convert", "mpfr_print = " << buf
          << " (precision " << precision << ")");

    out << buf;
    mpfr_free_str(buf);
  }
}

amount_t::amount_t(const long val) : prec(0)
{
  mpq_init(quantity);
  mpq_set_si(quantity, val, 1);
}

amount_t& amount_t::operator=(const amount_t& amt)
{
  if (this != &amt) {
    mpq_set(quantity, amt.quantity);
    prec = amt.prec;
  }
  return *this;
}

void amount_t::parse(const string& str)
{
  boost::smatch what;
  if (! boost::regex_match(str, what, decimal_re))
    throw_(validation_error, _f("Invalid amount: '%1%'") % str);

  string digits(what[2]);
  string fraction(what[3].matched ? string(what[3]) : string());
  digits += fraction;

  mpz_t num;
  mpz_init(num);
  if (mpz_set_str(num, digits.c_str(), 10) != 0) {
    mpz_clear(num);
    throw_(validation_error, _f("Invalid amount: '%1%'") % str);
  }

  prec = static_cast<precision_t>(fraction.length());

  mpq_set_num(quantity, num);
  set_power_of_ten(num, prec);
  mpq_set_den(quantity, num);
  mpq_canonicalize(quantity);
  mpz_clear(num);

  if (what[1].matched && what[1] == "-")
    mpq_neg(quantity, quantity);

  DEBUG("amount.parse", "Parsed '" << str << "' as " << to_fullstring());
}

int amount_t::compare(const amount_t& amt) const
{
  return mpq_cmp(quantity, amt.quantity);
}

amount_t& amount_t::operator+=(const amount_t& amt)
{
  mpq_add(quantity, quantity, amt.quantity);
  if (amt.prec > prec)
    prec = amt.prec;
  return *this;
}

amount_t& amount_t::operator-=(const amount_t& amt)
{
  mpq_sub(quantity, quantity, amt.quantity);
  if (amt.prec > prec)
    prec = amt.prec;
  return *this;
}

amount_t& amount_t::operator*=(const amount_t& amt)
{
  mpq_mul(quantity, quantity, amt.quantity);
  prec = static_cast<precision_t>(prec + amt.prec);
  return *this;
}

amount_t& amount_t::operator/=(const amount_t& amt)
{
  if (amt.is_zero())
    throw_(validation_error, _("Divide by zero"));

  mpq_div(quantity, quantity, amt.quantity);
  prec = static_cast<precision_t>(prec + amt.prec + extend_by_digits);
  return *this;
}

amount_t& amount_t::in_place_negate()
{
  mpq_neg(quantity, quantity);
  return *this;
}

amount_t& amount_t::in_place_round(precision_t places)
{
  // q = sign(x) * floor((2 * |num| * 10^p + den) / (2 * den)) / 10^p
  mpz_t scale, num, den;
  mpz_init(scale);
  mpz_init(num);
  mpz_init(den);

  set_power_of_ten(scale, places);

  mpz_abs(num, mpq_numref(quantity));
  mpz_mul(num, num, scale);
  mpz_mul_ui(num, num, 2);
  mpz_mul_ui(den, mpq_denref(quantity), 2);
  mpz_add(num, num, mpq_denref(quantity));
  mpz_fdiv_q(num, num, den);

  if (sign() < 0)
    mpz_neg(num, num);

  mpq_set_num(quantity, num);
  mpq_set_den(quantity, scale);
  mpq_canonicalize(quantity);

  mpz_clear(scale);
  mpz_clear(num);
  mpz_clear(den);

  prec = places;
  return *this;
}

void amount_t::print(std::ostream& out, precision_t places) const
{
  amount_t temp(rounded(places));
  stream_out_mpq(out, temp.quantity, places);
}

string amount_t::to_string() const
{
  std::ostringstream buf;
  print(buf, display_precision);
  return buf.str();
}

string amount_t::to_fullstring() const
{
  std::ostringstream buf;
  print(buf, prec > display_precision ? prec : display_precision);
  return buf.str();
}

bool amount_t::valid() const
{
  if (mpz_sgn(mpq_denref(quantity)) <= 0) {
    DEBUG("folio.validate", "amount_t: denominator <= 0");
    return false;
  }
  if (prec > 1024) {
    DEBUG("folio.validate", "amount_t: prec > 1024");
    return false;
  }
  return true;
}

} // namespace folio
