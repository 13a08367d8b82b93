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

   class database;

   /// narrows the participant breakdown and the discrepancy list, amounts are always computed vault wide
   struct reconciliation_filter
   {
      optional<participant_id_type> participant;
      optional<string>              address;      ///< case insensitive substring of the settlement address
   };

   /// inputs and intermediate values of the recomputation
   struct reconciliation_context
   {
      vault_id_type vault;
      string        vault_name;
      vault_status  status = vault_status::draft;
      double        total_acquired = 0;
      double        total_contributed = 0;
      double        token_supply = 0;
      double        acquirer_share = 0;
      double        lp_share = 0;
      double        fdv = 0;
      double        lp_currency = 0;
      double        lp_tokens = 0;
      double        price = 0;
      int64_t       pair_multiplier = 0;
      int64_t       acquirer_multiplier = 0;
      uint32_t      acquisition_transactions = 0;
      uint32_t      contribution_transactions = 0;
   };

   struct claim_discrepancy
   {
      optional<claim_id_type>              claim;     ///< unset when the expected claim is missing
      participant_id_type                  owner;
      claim_type                           type = claim_type::contributor;
      optional<source_transaction_id_type> source_transaction;
      int64_t                              actual_tokens = 0;
      int64_t                              expected_tokens = 0;
      int64_t                              token_difference = 0;
      int64_t                              actual_currency = 0;
      int64_t                              expected_currency = 0;
      int64_t                              currency_difference = 0;
      optional<int64_t>                    actual_multiplier;
      optional<int64_t>                    expected_multiplier;
      string                               reason;
   };

   struct reconciliation_summary
   {
      uint32_t total_claims = 0;
      uint32_t valid_claims = 0;
      uint32_t discrepant_claims = 0;
      uint32_t acquirer_claims = 0;
      uint32_t contributor_claims = 0;
      uint32_t liquidity_pool_claims = 0;
      int64_t  actual_tokens = 0;
      int64_t  expected_tokens = 0;
      int64_t  token_difference = 0;
      int64_t  actual_currency = 0;
      int64_t  expected_currency = 0;
      int64_t  currency_difference = 0;
      int64_t  max_token_error = 0;
      int64_t  max_currency_error = 0;
   };

   /// the sum of every allocation may never exceed the supply
   struct conservation_check
   {
      int64_t allocated_tokens = 0;
      int64_t token_supply = 0;
      int64_t slack = 0;
      bool    ok = true;
   };

   struct participant_breakdown
   {
      participant_id_type participant;
      string              address;
      int64_t             tokens_claimed = 0;
      int64_t             currency_claimed = 0;
      uint32_t            contribution_transactions = 0;
      uint32_t            acquisition_transactions = 0;
      double              value_contributed = 0;
      double              currency_acquired = 0;
      uint32_t            discrepancies = 0;
      int64_t             worst_token_discrepancy = 0;
      int64_t             worst_currency_discrepancy = 0;
      optional<double>    tvl_share_percent;
      optional<int64_t>   expected_tokens_from_share;
   };

   struct reconciliation_report
   {
      reconciliation_context        context;
      reconciliation_summary        summary;
      conservation_check            conservation;
      vector<claim_discrepancy>     discrepancies;
      vector<participant_breakdown> participants;
      time_point_sec                verified_at;

      bool passed()const { return discrepancies.empty() && conservation.ok; }
   };

   /**
    *  @brief recomputes a vault distribution from its source transactions and diffs it against the ledger
    *
    *  Acquirer, contributor and liquidity pool claims are compared with the calculator output; any amount
    *  off by more than VAULTDIST_RECONCILIATION_TOLERANCE smallest units is a discrepancy. Failed claims
    *  are left out. The engine never writes amounts.
    */
   class reconciliation_engine
   {
      public:
         explicit reconciliation_engine( const database& db ) : _db( db ) {}

         reconciliation_report verify( vault_id_type vault,
                                       const reconciliation_filter& filter = reconciliation_filter() )const;

         /// writes a note on every discrepant claim of @p report, returns how many claims were annotated
         static uint32_t annotate_discrepancies( database& db, const reconciliation_report& report );

      private:
         const database& _db;
   };

} } // vaultdist::chain

FC_REFLECT( vaultdist::chain::reconciliation_filter, (participant)(address) )
FC_REFLECT( vaultdist::chain::reconciliation_context,
            (vault)(vault_name)(status)(total_acquired)(total_contributed)(token_supply)(acquirer_share)(lp_share)
            (fdv)(lp_currency)(lp_tokens)(price)(pair_multiplier)(acquirer_multiplier)
            (acquisition_transactions)(contribution_transactions) )
FC_REFLECT( vaultdist::chain::claim_discrepancy,
            (claim)(owner)(type)(source_transaction)(actual_tokens)(expected_tokens)(token_difference)
            (actual_currency)(expected_currency)(currency_difference)(actual_multiplier)(expected_multiplier)(reason) )
FC_REFLECT( vaultdist::chain::reconciliation_summary,
            (total_claims)(valid_claims)(discrepant_claims)(acquirer_claims)(contributor_claims)(liquidity_pool_claims)
            (actual_tokens)(expected_tokens)(token_difference)(actual_currency)(expected_currency)(currency_difference)
            (max_token_error)(max_currency_error) )
FC_REFLECT( vaultdist::chain::conservation_check, (allocated_tokens)(token_supply)(slack)(ok) )
FC_REFLECT( vaultdist::chain::participant_breakdown,
            (participant)(address)(tokens_claimed)(currency_claimed)(contribution_transactions)
            (acquisition_transactions)(value_contributed)(currency_acquired)(discrepancies)
            (worst_token_discrepancy)(worst_currency_discrepancy)(tvl_share_percent)(expected_tokens_from_share) )
FC_REFLECT( vaultdist::chain::reconciliation_report,
            (context)(summary)(conservation)(discrepancies)(participants)(verified_at) )
