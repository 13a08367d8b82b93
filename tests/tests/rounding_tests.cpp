/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#include <vaultdist/protocol/rounding.hpp>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>

using namespace vaultdist::protocol;

BOOST_AUTO_TEST_SUITE( rounding_tests )

BOOST_AUTO_TEST_CASE( half_up )
{
   BOOST_CHECK_EQUAL( round_half_up( 2.5 ), 3.0 );
   BOOST_CHECK_EQUAL( round_half_up( 2.4999 ), 2.0 );
   BOOST_CHECK_EQUAL( round_half_up( -2.5 ), -2.0 );
   BOOST_CHECK_EQUAL( round_half_up( -2.6 ), -3.0 );
   BOOST_CHECK_EQUAL( round_decimal( 1.005, 1e2 ), 1.0 );   // 1.005 is stored below the half
   BOOST_CHECK_EQUAL( round_decimal( 200.0, 1e2 ), 200.0 );
   BOOST_CHECK_EQUAL( round_decimal( 10.0000004, 1e6 ), 10.0 );
}

BOOST_AUTO_TEST_CASE( high_precision_keeps_representable_values )
{
   BOOST_CHECK_EQUAL( round_high_precision( 475000.0 ), 475000.0 );
   BOOST_CHECK_EQUAL( round_high_precision( 9.5e11 * 0.5 ), 4.75e11 );
   BOOST_CHECK_EQUAL( round_high_precision( 0.0002 ), 0.0002 );
   BOOST_CHECK_EQUAL( round_high_precision( 0.0 ), 0.0 );
   // below 1e-9 the 25th decimal is inside the precision of a double
   BOOST_CHECK_EQUAL( round_high_precision( 4e-26 ), 0.0 );
   BOOST_CHECK_CLOSE( round_high_precision( 6e-26 ), 1e-25, 1e-6 );
}

BOOST_AUTO_TEST_CASE( high_precision_moves_large_values_by_one_ulp )
{
   // x * 1e25 and the division back each round once, whole numbers do not always survive
   BOOST_CHECK_EQUAL( round_high_precision( 31.0 ), 30.999999999999996 );
   BOOST_CHECK_LT( round_high_precision( 31.0 ), 31.0 );
   BOOST_CHECK_EQUAL( round_high_precision( 61.0 / 125.0 ), 0.48799999999999993 );
   BOOST_CHECK_EQUAL( round_high_precision( 488000000.0 ), 488000000.0 );
   BOOST_CHECK_EQUAL( round_high_precision( 0.1 + 0.2 ), 0.1 + 0.2 );
   // the scaled product overflows, the floor still never yields an amount
   BOOST_CHECK_EQUAL( floor_to_unit( round_high_precision( 1e300 ) ), 0 );
}

BOOST_AUTO_TEST_CASE( floors )
{
   BOOST_CHECK_EQUAL( floor_to_unit( 474999.9999 ), 474999 );
   BOOST_CHECK_EQUAL( floor_to_unit( -1.5 ), -1 );
   BOOST_CHECK_EQUAL( floor_to_int( -1.5 ), -2 );
   BOOST_CHECK_EQUAL( floor_to_int( 0.00475 ), 0 );
}

BOOST_AUTO_TEST_CASE( non_finite_inputs_never_become_amounts )
{
   const double inf = std::numeric_limits<double>::infinity();
   const double nan = std::numeric_limits<double>::quiet_NaN();
   BOOST_CHECK_EQUAL( floor_to_unit( inf ), 0 );
   BOOST_CHECK_EQUAL( floor_to_unit( nan ), 0 );
   BOOST_CHECK_EQUAL( floor_to_int( -inf ), 0 );
   BOOST_CHECK_EQUAL( round_decimal( nan, 1e6 ), 0.0 );
   BOOST_CHECK_EQUAL( round_high_precision( inf ), 0.0 );
   BOOST_CHECK_EQUAL( floor_to_unit( 1e30 ), std::numeric_limits<int64_t>::max() );
}

BOOST_AUTO_TEST_SUITE_END()
