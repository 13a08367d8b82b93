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
#include <vaultdist/chain/distribution_calculator.hpp>

namespace vaultdist { namespace chain {

   typedef string settlement_reference;

   /// one payout inside a settlement transaction
   struct settlement_output
   {
      claim_id_type        claim;
      participant_id_type  recipient;
      string               address;
      claim_type           type = claim_type::contributor;
      share_type           token_amount;
      share_type           currency_amount;
      optional<string>     backing_reference;     ///< external transaction holding the claim's funds
      uint32_t             backing_output_index = 0;
   };

   /// everything a transaction builder needs to pay out one batch
   struct settlement_batch_spec
   {
      vault_id_type             vault;
      settlement_batch_id_type  batch;
      vector<settlement_output> outputs;
      vector<asset_multiplier>  token_multipliers;
      vector<asset_multiplier>  currency_multipliers;
      share_type                total_tokens;
      share_type                total_currency;
   };

   /// encoded settlement transaction, opaque to the core
   struct raw_settlement_transaction
   {
      vector<char> bytes;

      uint64_t size()const { return bytes.size(); }
   };

   enum class backing_state
   {
      unspent           = 0,
      spent             = 1,   ///< consumed by a transaction that is not ours
      missing_reference = 2,   ///< the claim points at no external transaction
      missing_output    = 3,   ///< the referenced transaction has no such output
      lookup_error      = 4
   };

   struct backing_status
   {
      backing_state    state = backing_state::unspent;
      optional<string> consumed_by;
      optional<string> detail;
   };

} } // vaultdist::chain

FC_REFLECT( vaultdist::chain::settlement_output,
            (claim)(recipient)(address)(type)(token_amount)(currency_amount)
            (backing_reference)(backing_output_index) )
FC_REFLECT( vaultdist::chain::settlement_batch_spec,
            (vault)(batch)(outputs)(token_multipliers)(currency_multipliers)(total_tokens)(total_currency) )
FC_REFLECT( vaultdist::chain::raw_settlement_transaction, (bytes) )
FC_REFLECT_ENUM( vaultdist::chain::backing_state,
                 (unspent)(spent)(missing_reference)(missing_output)(lookup_error) )
FC_REFLECT( vaultdist::chain::backing_status, (state)(consumed_by)(detail) )
