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

#include <cmath>
#include <limits>

namespace vaultdist { namespace protocol {

namespace {
   const double high_precision_scale = 1e25;

   int64_t saturate( double x )
   {
      if( x >= 9223372036854775807.0 )
         return std::numeric_limits<int64_t>::max();
      if( x <= -9223372036854775808.0 )
         return std::numeric_limits<int64_t>::min();
      return static_cast<int64_t>( x );
   }
}

double round_half_up( double x )
{
   if( !std::isfinite( x ) )
      return x;
   double r = std::floor( x );
   if( x - r >= 0.5 )
      r += 1.0;
   return r;
}

double round_decimal( double x, double scale )
{
   if( !std::isfinite( x ) )
      return 0;
   return round_half_up( x * scale ) / scale;
}

double round_high_precision( double x )
{
   if( !std::isfinite( x ) )
      return 0;
   // no magnitude shortcut, both the product and the quotient may move x by one ulp
   return round_half_up( x * high_precision_scale ) / high_precision_scale;
}

int64_t floor_to_unit( double x )
{
   if( !std::isfinite( x ) )
      return 0;
   return saturate( std::trunc( x ) );
}

int64_t floor_to_int( double x )
{
   if( !std::isfinite( x ) )
      return 0;
   return saturate( std::floor( x ) );
}

} } // vaultdist::protocol
