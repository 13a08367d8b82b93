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

namespace vaultdist { namespace chain {

   /// aggregate inputs of one vault distribution
   struct distribution_parameters
   {
      double  token_supply = 0;           ///< S, in smallest token units
      double  acquirer_share = 0;         ///< a, fraction of S offered to acquirers
      double  lp_share = 0;               ///< p, fraction of the valuation reserved for the pool
      double  total_acquired = 0;         ///< A, display units
      int64_t total_acquired_units = 0;   ///< A in smallest units
      double  total_contributed = 0;      ///< C, display units
   };

   struct liquidity_pool_allocation
   {
      double  fdv = 0;
      double  lp_currency = 0;            ///< display units
      double  lp_tokens = 0;
      double  price = 0;                  ///< currency per smallest token unit
      int64_t pair_multiplier = 0;
      int64_t adjusted_lp_tokens = 0;     ///< pair_multiplier * A in smallest units

      /// a pool claim is only owed when both sides of the pair are funded
      bool    exists()const { return lp_currency > 0 && lp_tokens > 0; }
      int64_t claim_currency()const;
   };

   struct acquisition_input
   {
      source_transaction_id_type transaction;
      double                     sent = 0;          ///< display units
      int64_t                    sent_units = 0;    ///< smallest units
   };

   struct acquirer_allocation
   {
      source_transaction_id_type transaction;
      double                     sent = 0;
      int64_t                    sent_units = 0;
      double                     raw_tokens = 0;       ///< before the multiplier is floored
      int64_t                    raw_multiplier = 0;   ///< this acquirer's own multiplier
      int64_t                    multiplier = 0;       ///< vault wide minimum after normalization
      int64_t                    tokens = 0;
   };

   struct contribution_input
   {
      source_transaction_id_type transaction;
      double                     value = 0;         ///< assessed value of this transaction
      double                     user_total = 0;    ///< assessed value across the owner's transactions
   };

   struct contributor_allocation
   {
      source_transaction_id_type transaction;
      double                     value = 0;
      double                     proportion = 0;
      double                     share = 0;
      double                     user_total_tokens = 0;
      int64_t                    tokens = 0;
      int64_t                    currency = 0;      ///< smallest units
   };

   struct distribution_result
   {
      distribution_parameters        parameters;
      liquidity_pool_allocation      liquidity_pool;
      vector<acquirer_allocation>    acquirers;
      vector<contributor_allocation> contributors;
      int64_t                        acquirer_multiplier = 0;

      int64_t total_tokens()const;
   };

   /// one asset of a contributor claim, used to derive per unit multipliers for the settlement contract
   struct asset_share_input
   {
      string  policy_id;
      string  asset_name;
      int64_t quantity = 0;
   };

   struct contributor_claim_input
   {
      claim_id_type             claim;
      int64_t                   tokens = 0;
      int64_t                   currency = 0;
      vector<asset_share_input> assets;
   };

   struct asset_multiplier
   {
      string  policy_id;
      string  asset_name;
      int64_t per_unit = 0;
   };

   struct asset_multiplier_result
   {
      vector<asset_multiplier>          token_multipliers;
      vector<asset_multiplier>          currency_multipliers;
      flat_map<claim_id_type, int64_t>  recalculated_tokens;     ///< sum of quantity * per unit
      flat_map<claim_id_type, int64_t>  recalculated_currency;
   };

   /**
    *  @brief pure allocation of vault tokens and currency
    *
    *  Each step consumes the output of the previous one and goes through the rounding kernel in a
    *  fixed order, so calling it twice with the same inputs gives bit identical results. None of the
    *  functions keep state; reconciliation calls them with historical totals.
    */
   class distribution_calculator
   {
      public:
         static liquidity_pool_allocation calculate_liquidity_pool( const distribution_parameters& params );

         static acquirer_allocation calculate_acquirer( const distribution_parameters& params,
                                                        const liquidity_pool_allocation& lp,
                                                        const acquisition_input& acquisition );

         /// sets every allocation to the smallest multiplier, returns that multiplier
         static int64_t normalize_acquirers( vector<acquirer_allocation>& allocations );

         static contributor_allocation calculate_contributor( const distribution_parameters& params,
                                                              const liquidity_pool_allocation& lp,
                                                              const contribution_input& contribution );

         /// runs every step, skipping inputs with a non-positive amount
         static distribution_result calculate( const distribution_parameters& params,
                                               const vector<acquisition_input>& acquisitions,
                                               const vector<contribution_input>& contributions );

         static asset_multiplier_result calculate_asset_multipliers(
               const vector<contributor_claim_input>& contributor_claims,
               optional<int64_t> acquirer_multiplier );

         /**
          * Picks the decimal precision of a vault token so that scaled supplies and multiplier products
          * stay within the exactly representable integer range of a double.
          */
         static uint8_t optimal_decimals( double token_supply,
                                          optional<double> max_multiplier = optional<double>(),
                                          optional<double> min_multiplier = optional<double>() );
   };

} } // vaultdist::chain

FC_REFLECT( vaultdist::chain::distribution_parameters,
            (token_supply)(acquirer_share)(lp_share)(total_acquired)(total_acquired_units)(total_contributed) )
FC_REFLECT( vaultdist::chain::liquidity_pool_allocation,
            (fdv)(lp_currency)(lp_tokens)(price)(pair_multiplier)(adjusted_lp_tokens) )
FC_REFLECT( vaultdist::chain::acquirer_allocation,
            (transaction)(sent)(sent_units)(raw_tokens)(raw_multiplier)(multiplier)(tokens) )
FC_REFLECT( vaultdist::chain::contributor_allocation,
            (transaction)(value)(proportion)(share)(user_total_tokens)(tokens)(currency) )
FC_REFLECT( vaultdist::chain::distribution_result,
            (parameters)(liquidity_pool)(acquirers)(contributors)(acquirer_multiplier) )
FC_REFLECT( vaultdist::chain::asset_multiplier, (policy_id)(asset_name)(per_unit) )
