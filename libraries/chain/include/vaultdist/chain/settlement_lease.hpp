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

#include <vaultdist/chain/types.hpp>

#include <boost/fiber/mutex.hpp>

namespace vaultdist { namespace chain {

   /**
    *  @brief short lived mutual exclusion between settlement sweeps
    *
    *  A lease is held by at most one holder at a time and expires on its own after its ttl, so a crashed
    *  holder never locks settlement out for good. Releasing with a stale or unknown token does nothing.
    */
   class settlement_lease
   {
      public:
         virtual ~settlement_lease() {}

         /// @return the token of the new lease, or nothing when another holder owns an unexpired lease
         virtual optional<string> try_acquire( const string& holder, time_point_sec now, microseconds ttl ) = 0;
         virtual void             release( const string& token ) = 0;
   };

   /// in process lease for a single node
   class local_settlement_lease : public settlement_lease
   {
      public:
         optional<string> try_acquire( const string& holder, time_point_sec now, microseconds ttl ) override;
         void             release( const string& token ) override;

         optional<string> current_holder( time_point_sec now )const;

      private:
         mutable boost::fibers::mutex _mtx;
         optional<string>             _token;
         string                       _holder;
         time_point_sec               _expires;
         uint64_t                     _sequence = 0;
   };

   /// releases a lease when it goes out of scope
   class scoped_settlement_lease
   {
      public:
         scoped_settlement_lease( settlement_lease& lease, string token )
            : _lease( lease ), _token( std::move( token ) ) {}
         ~scoped_settlement_lease();

         scoped_settlement_lease( const scoped_settlement_lease& ) = delete;
         scoped_settlement_lease& operator=( const scoped_settlement_lease& ) = delete;

      private:
         settlement_lease& _lease;
         string            _token;
   };

} } // vaultdist::chain
