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

#include <vaultdist/protocol/types.hpp>

namespace vaultdist { namespace protocol {

   struct contributor_claim_metadata
   {
      bool   no_acquirers = false;   ///< set when the vault closed without any acquisition
      double assessed_value = 0;     ///< value of the backing contribution in display units
      double proportion = 0;         ///< share of this transaction in the owner's total contribution
      double user_total_tokens = 0;  ///< tokens owed to the owner across all of their contributions
   };

   struct acquirer_claim_metadata
   {
      double  currency_sent = 0;     ///< display units
      int64_t raw_multiplier = 0;    ///< multiplier before vault wide normalization
   };

   struct liquidity_pool_claim_metadata
   {
      double  fdv = 0;
      double  lp_currency = 0;       ///< display units
      double  lp_tokens = 0;         ///< tokens before pair multiplier normalization
      int64_t pair_multiplier = 0;
      optional<string> pool_reference;
   };

   /// an asset that goes back to its contributor when a vault fails
   struct refund_asset
   {
      vault_asset_id_type id;
      string              policy_id;
      string              asset_name;
      int64_t             quantity = 0;
      asset_type          type = asset_type::nft;
   };

   struct cancellation_claim_metadata
   {
      transaction_kind     transaction = transaction_kind::contribute;
      vector<refund_asset> assets;
      string               failure_reason;
      uint32_t             output_index = 0;
   };

   struct termination_claim_metadata
   {
      string     address;
      share_type token_amount;       ///< vault tokens to burn
      share_type currency_amount;    ///< currency the holder receives
      bool       no_currency_distribution = false;
   };

   struct secondary_reward_claim_metadata
   {
      string program;
   };

   /// one payload per claim type, in claim_type order
   typedef static_variant< contributor_claim_metadata,
                           acquirer_claim_metadata,
                           liquidity_pool_claim_metadata,
                           cancellation_claim_metadata,
                           termination_claim_metadata,
                           secondary_reward_claim_metadata > claim_payload;

   /// fields every claim may carry regardless of type, written by settlement and reconciliation
   struct claim_diagnostics
   {
      optional<string>         error;
      optional<string>         notes;
      optional<string>         auto_marked_reason;
      uint32_t                 failed_attempts = 0;
      optional<time_point_sec> last_attempt;
      bool                     processing_failed = false;
   };

   struct claim_metadata
   {
      claim_payload     payload;
      claim_diagnostics diagnostics;
   };

   /// partial update for claim_metadata, unset fields are left alone
   struct claim_metadata_patch
   {
      optional<string>         error;
      optional<string>         notes;
      optional<string>         auto_marked_reason;
      optional<uint32_t>       failed_attempts;
      optional<time_point_sec> last_attempt;
      optional<bool>           processing_failed;
      optional<claim_payload>  payload;
   };

   claim_type payload_type( const claim_payload& payload );

   /// builds an empty payload of the given type
   claim_payload default_payload( claim_type type );

   /**
    * Applies @p patch on top of @p metadata.
    * @throws validation_exception if the patch replaces the payload with one of another claim type
    */
   void merge_metadata( claim_metadata& metadata, const claim_metadata_patch& patch );

} } // vaultdist::protocol

FC_REFLECT( vaultdist::protocol::contributor_claim_metadata,
            (no_acquirers)(assessed_value)(proportion)(user_total_tokens) )
FC_REFLECT( vaultdist::protocol::acquirer_claim_metadata, (currency_sent)(raw_multiplier) )
FC_REFLECT( vaultdist::protocol::liquidity_pool_claim_metadata,
            (fdv)(lp_currency)(lp_tokens)(pair_multiplier)(pool_reference) )
FC_REFLECT( vaultdist::protocol::refund_asset, (id)(policy_id)(asset_name)(quantity)(type) )
FC_REFLECT( vaultdist::protocol::cancellation_claim_metadata,
            (transaction)(assets)(failure_reason)(output_index) )
FC_REFLECT( vaultdist::protocol::termination_claim_metadata,
            (address)(token_amount)(currency_amount)(no_currency_distribution) )
FC_REFLECT( vaultdist::protocol::secondary_reward_claim_metadata, (program) )
FC_REFLECT( vaultdist::protocol::claim_diagnostics,
            (error)(notes)(auto_marked_reason)(failed_attempts)(last_attempt)(processing_failed) )
FC_REFLECT( vaultdist::protocol::claim_metadata, (payload)(diagnostics) )
FC_REFLECT( vaultdist::protocol::claim_metadata_patch,
            (error)(notes)(auto_marked_reason)(failed_attempts)(last_attempt)(processing_failed)(payload) )
