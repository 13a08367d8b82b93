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

#include <vaultdist/chain/settlement_sweeper.hpp>

namespace vaultdist { namespace chain {

settlement_sweeper::settlement_sweeper( settlement_processor& processor, std::chrono::seconds interval,
                                        observer_type observer )
   : recurring_task( "settlement_sweeper", interval ), _processor( processor ), _observer( std::move( observer ) )
{}

settlement_sweeper::~settlement_sweeper()
{
   cancel();
   try
   {
      wait();
   }
   catch( const fc::canceled_exception& ) {}
}

void settlement_sweeper::run_once()
{
   const auto result = _processor.sweep( time_point_sec( fc::time_point::now() ) );
   if( result.lease_acquired )
      ilog( "Sweep settled ${b} batches out of ${n} claims, ${f} failed, ${r} recovered",
            ("b",result.batches.size())("n",result.selected)("f",result.failed.size())("r",result.recovered.size()) );
   _last = result;
   if( _observer )
      _observer( result );
}

} } // vaultdist::chain
