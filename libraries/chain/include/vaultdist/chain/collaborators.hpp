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

#include <vaultdist/chain/settlement_types.hpp>

namespace vaultdist { namespace chain {

   class claim_object;
   class source_transaction_object;

   /**
    *  Encodes and submits settlement transactions to the external ledger. Both calls may throw
    *  transport_exception, which the settlement processor retries; implementations should give up
    *  once @p deadline has passed.
    */
   class transaction_builder
   {
      public:
         virtual ~transaction_builder() {}

         virtual raw_settlement_transaction build( const settlement_batch_spec& spec, time_point deadline ) = 0;
         virtual settlement_reference       submit( const raw_settlement_transaction& trx, time_point deadline ) = 0;
   };

   /// looks up whether the external funds behind a claim are still spendable
   class backing_validator
   {
      public:
         virtual ~backing_validator() {}

         virtual backing_status check( const claim_object& claim, const source_transaction_object& backing ) = 0;
   };

   /// keeps the external asset registry in step with settled acquirer claims
   class asset_status_updater
   {
      public:
         virtual ~asset_status_updater() {}

         virtual void mark_distributed( const vector<vault_asset_id_type>& assets ) = 0;
   };

} } // vaultdist::chain
