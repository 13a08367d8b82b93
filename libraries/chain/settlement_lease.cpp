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

#include <vaultdist/chain/settlement_lease.hpp>

#include <fc/log/logger.hpp>
#include <fc/string.hpp>

#include <mutex>

namespace vaultdist { namespace chain {

optional<string> local_settlement_lease::try_acquire( const string& holder, time_point_sec now, microseconds ttl )
{
   FC_ASSERT( ttl.count() > 0, "Lease ttl must be positive" );
   std::unique_lock<boost::fibers::mutex> lock( _mtx );
   if( _token.valid() && now < _expires )
   {
      wlog( "Settlement lease requested by ${r} is held by ${h} until ${e}", ("r",holder)("h",_holder)("e",_expires) );
      return optional<string>();
   }
   if( _token.valid() )
      wlog( "Settlement lease of ${h} expired at ${e}, taking it over", ("h",_holder)("e",_expires) );

   _holder = holder;
   _expires = now + ttl;
   _token = holder + ":" + fc::to_string( ++_sequence );
   return _token;
}

void local_settlement_lease::release( const string& token )
{
   std::unique_lock<boost::fibers::mutex> lock( _mtx );
   if( !_token.valid() || *_token != token )
      return;
   _token.reset();
   _holder.clear();
}

optional<string> local_settlement_lease::current_holder( time_point_sec now )const
{
   std::unique_lock<boost::fibers::mutex> lock( _mtx );
   if( _token.valid() && now < _expires )
      return _holder;
   return optional<string>();
}

scoped_settlement_lease::~scoped_settlement_lease()
{
   _lease.release( _token );
}

} } // vaultdist::chain
