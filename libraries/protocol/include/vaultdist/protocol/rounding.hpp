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

#pragma once

#include <cstdint>

namespace vaultdist { namespace protocol {

   /**
    *  @defgroup rounding Rounding kernel
    *
    *  Every allocation goes through these primitives in the same order so that recomputation
    *  reproduces stored claims bit for bit. The functions are total: non-finite inputs never
    *  propagate into amounts.
    *  @{
    */

   /// rounds to the nearest integer, halves go toward positive infinity
   double  round_half_up( double x );

   /// round_half_up( x * scale ) / scale, where scale is a power of ten such as 1e2 or 1e6
   double  round_decimal( double x, double scale );

   /// round_half_up( x * 1e25 ) / 1e25, removes binary noise left by chained multiplications
   double  round_high_precision( double x );

   /// truncates toward zero to a whole number of smallest units, non-finite input yields 0
   int64_t floor_to_unit( double x );

   /// floor toward negative infinity, non-finite input yields 0
   int64_t floor_to_int( double x );

   /// @}

} } // vaultdist::protocol
