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

#include <vaultdist/chain/reconciliation.hpp>
#include <vaultdist/chain/database.hpp>

#include <vaultdist/chain/participant_object.hpp>
#include <vaultdist/chain/vault_object.hpp>
#include <vaultdist/chain/source_transaction_object.hpp>
#include <vaultdist/chain/claim_object.hpp>
#include <vaultdist/protocol/rounding.hpp>

#include <fc/string.hpp>

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>

namespace vaultdist { namespace chain {

namespace {
   struct expected_claim
   {
      claim_type          type = claim_type::contributor;
      participant_id_type owner;
      int64_t             tokens = 0;
      int64_t             currency = 0;
      optional<int64_t>   multiplier;
      bool                matched = false;
   };

   int64_t distance( int64_t a, int64_t b )
   {
      return a > b ? a - b : b - a;
   }

   bool is_distribution_claim( const claim_object& claim )
   {
      return claim.type == claim_type::acquirer
          || claim.type == claim_type::contributor
          || claim.type == claim_type::liquidity_pool;
   }
}

reconciliation_report reconciliation_engine::verify( vault_id_type vault_id, const reconciliation_filter& filter )const
{ try {
   const vault_object& vault = _db.get_vault( vault_id );
   const vault_totals totals = _db.compute_vault_totals( vault_id );
   const distribution_result dist = _db.calculate_distribution( vault_id, totals );
   const liquidity_pool_allocation& lp = dist.liquidity_pool;
   const int64_t tolerance = VAULTDIST_RECONCILIATION_TOLERANCE;

   reconciliation_report report;
   auto& context = report.context;
   context.vault = vault_id;
   context.vault_name = vault.name;
   context.status = vault.status;
   context.total_acquired = totals.total_acquired;
   context.total_contributed = totals.total_contributed;
   context.token_supply = dist.parameters.token_supply;
   context.acquirer_share = dist.parameters.acquirer_share;
   context.lp_share = dist.parameters.lp_share;
   context.fdv = lp.fdv;
   context.lp_currency = lp.lp_currency;
   context.lp_tokens = lp.lp_tokens;
   context.price = lp.price;
   context.pair_multiplier = lp.pair_multiplier;
   context.acquirer_multiplier = dist.acquirer_multiplier;
   context.acquisition_transactions = _db.get_confirmed_transactions( vault_id, transaction_kind::acquire ).size();
   context.contribution_transactions = _db.get_confirmed_transactions( vault_id, transaction_kind::contribute ).size();

   flat_map<source_transaction_id_type, expected_claim> expected;
   for( const auto& allocation : dist.acquirers )
   {
      expected_claim& e = expected[allocation.transaction];
      e.type = claim_type::acquirer;
      e.owner = _db.get_source_transaction( allocation.transaction ).owner;
      e.tokens = allocation.tokens;
      e.multiplier = allocation.multiplier;
   }
   for( const auto& allocation : dist.contributors )
   {
      expected_claim& e = expected[allocation.transaction];
      e.type = claim_type::contributor;
      e.owner = _db.get_source_transaction( allocation.transaction ).owner;
      e.tokens = allocation.tokens;
      e.currency = allocation.currency;
   }
   optional<expected_claim> expected_lp;
   if( lp.exists() )
   {
      expected_claim e;
      e.type = claim_type::liquidity_pool;
      e.owner = vault.owner;
      e.tokens = lp.adjusted_lp_tokens;
      e.currency = lp.claim_currency();
      expected_lp = e;
   }

   auto& summary = report.summary;
   flat_map<participant_id_type, participant_breakdown> breakdowns;
   auto breakdown_of = [&]( participant_id_type owner ) -> participant_breakdown& {
      auto itr = breakdowns.find( owner );
      if( itr == breakdowns.end() )
      {
         participant_breakdown b;
         b.participant = owner;
         const auto* participant = _db.find( owner );
         if( participant != nullptr )
            b.address = participant->address;
         itr = breakdowns.emplace( owner, b ).first;
      }
      return itr->second;
   };
   auto record = [&]( const claim_discrepancy& d ) {
      auto& b = breakdown_of( d.owner );
      ++b.discrepancies;
      b.worst_token_discrepancy = std::max( b.worst_token_discrepancy, distance( d.actual_tokens, d.expected_tokens ) );
      b.worst_currency_discrepancy = std::max( b.worst_currency_discrepancy,
                                               distance( d.actual_currency, d.expected_currency ) );
      report.discrepancies.push_back( d );
   };

   for( const claim_object* claim : _db.get_vault_claims( vault_id ) )
   {
      if( !is_distribution_claim( *claim ) || claim->status == claim_status::failed )
         continue;

      ++summary.total_claims;
      if( claim->type == claim_type::acquirer )
         ++summary.acquirer_claims;
      else if( claim->type == claim_type::contributor )
         ++summary.contributor_claims;
      else
         ++summary.liquidity_pool_claims;

      claim_discrepancy d;
      d.claim = claim->get_id();
      d.owner = claim->owner;
      d.type = claim->type;
      d.source_transaction = claim->source_transaction;
      d.actual_tokens = claim->token_amount.value;
      d.actual_currency = claim->currency_amount.value;
      d.actual_multiplier = claim->multiplier;
      summary.actual_tokens += d.actual_tokens;
      summary.actual_currency += d.actual_currency;

      auto& b = breakdown_of( claim->owner );
      b.tokens_claimed += d.actual_tokens;
      b.currency_claimed += d.actual_currency;
      if( claim->source_transaction.valid() )
      {
         const auto& trx = _db.get_source_transaction( *claim->source_transaction );
         if( claim->type == claim_type::contributor )
         {
            ++b.contribution_transactions;
            b.value_contributed += _db.transaction_value( trx );
         }
         else if( claim->type == claim_type::acquirer )
         {
            ++b.acquisition_transactions;
            b.currency_acquired += trx.currency_display();
         }
      }

      expected_claim* match = nullptr;
      if( claim->type == claim_type::liquidity_pool )
      {
         if( expected_lp.valid() )
            match = &*expected_lp;
         else
            d.reason = "liquidity pool claim exists but should not";
      }
      else
      {
         auto itr = claim->source_transaction.valid() ? expected.find( *claim->source_transaction ) : expected.end();
         if( itr != expected.end() && itr->second.type == claim->type )
            match = &itr->second;
         else
            d.reason = "no corresponding transaction found for recalculation";
      }

      if( match == nullptr )
      {
         d.token_difference = d.actual_tokens;
         d.currency_difference = d.actual_currency;
         record( d );
         continue;
      }

      match->matched = true;
      d.expected_tokens = match->tokens;
      d.expected_currency = match->currency;
      d.expected_multiplier = match->multiplier;
      d.token_difference = d.actual_tokens - d.expected_tokens;
      d.currency_difference = d.actual_currency - d.expected_currency;
      summary.expected_tokens += d.expected_tokens;
      summary.expected_currency += d.expected_currency;

      const int64_t token_error = distance( d.actual_tokens, d.expected_tokens );
      const int64_t currency_error = distance( d.actual_currency, d.expected_currency );
      summary.max_token_error = std::max( summary.max_token_error, token_error );
      summary.max_currency_error = std::max( summary.max_currency_error, currency_error );
      if( token_error > tolerance || currency_error > tolerance )
      {
         d.reason = "amount mismatch";
         record( d );
      }
   }

   summary.discrepant_claims = report.discrepancies.size();
   summary.valid_claims = summary.total_claims - summary.discrepant_claims;

   // entitlements the ledger never materialized
   for( const auto& entry : expected )
   {
      if( entry.second.matched )
         continue;
      claim_discrepancy d;
      d.owner = entry.second.owner;
      d.type = entry.second.type;
      d.source_transaction = entry.first;
      d.expected_tokens = entry.second.tokens;
      d.expected_currency = entry.second.currency;
      d.expected_multiplier = entry.second.multiplier;
      d.token_difference = -d.expected_tokens;
      d.currency_difference = -d.expected_currency;
      d.reason = "no claim recorded for this transaction";
      summary.expected_tokens += d.expected_tokens;
      summary.expected_currency += d.expected_currency;
      record( d );
   }
   if( expected_lp.valid() && !expected_lp->matched )
   {
      claim_discrepancy d;
      d.owner = expected_lp->owner;
      d.type = claim_type::liquidity_pool;
      d.expected_tokens = expected_lp->tokens;
      d.expected_currency = expected_lp->currency;
      d.token_difference = -d.expected_tokens;
      d.currency_difference = -d.expected_currency;
      d.reason = "liquidity pool claim missing";
      summary.expected_tokens += d.expected_tokens;
      summary.expected_currency += d.expected_currency;
      record( d );
   }

   summary.token_difference = summary.actual_tokens - summary.expected_tokens;
   summary.currency_difference = summary.actual_currency - summary.expected_currency;

   auto& conservation = report.conservation;
   conservation.allocated_tokens = summary.actual_tokens;
   conservation.token_supply = floor_to_unit( dist.parameters.token_supply );
   conservation.slack = conservation.token_supply - conservation.allocated_tokens;
   conservation.ok = conservation.allocated_tokens <= conservation.token_supply;
   if( !conservation.ok )
      elog( "Vault ${v} allocates ${a} tokens out of a supply of ${s}",
            ("v",vault_id)("a",conservation.allocated_tokens)("s",conservation.token_supply) );

   const double contributor_tokens = ( dist.parameters.token_supply - lp.lp_tokens ) * ( 1 - dist.parameters.acquirer_share );
   for( auto& entry : breakdowns )
   {
      auto& b = entry.second;
      if( b.contribution_transactions == 0 || totals.total_contributed <= 0 )
         continue;
      b.tvl_share_percent = b.value_contributed / totals.total_contributed * 100;
      b.expected_tokens_from_share = floor_to_unit( b.value_contributed / totals.total_contributed * contributor_tokens );
   }

   string address_filter;
   if( filter.address.valid() )
      address_filter = boost::algorithm::to_lower_copy( *filter.address );
   flat_set<participant_id_type> selected;
   for( const auto& entry : breakdowns )
   {
      const auto& b = entry.second;
      if( filter.participant.valid() && b.participant != *filter.participant )
         continue;
      if( filter.address.valid()
          && boost::algorithm::to_lower_copy( b.address ).find( address_filter ) == string::npos )
         continue;
      selected.insert( b.participant );
      report.participants.push_back( b );
   }
   std::stable_sort( report.participants.begin(), report.participants.end(),
                     []( const participant_breakdown& x, const participant_breakdown& y ) {
                        return x.tokens_claimed > y.tokens_claimed;
                     } );
   if( filter.participant.valid() || filter.address.valid() )
   {
      report.discrepancies.erase( std::remove_if( report.discrepancies.begin(), report.discrepancies.end(),
                                                  [&selected]( const claim_discrepancy& d ) {
                                                     return selected.find( d.owner ) == selected.end();
                                                  } ),
                                  report.discrepancies.end() );
   }

   report.verified_at = _db.now();
   ilog( "Verified vault ${v}: ${d} discrepancies in ${n} claims, ${slack} tokens unallocated",
         ("v",vault_id)("d",summary.discrepant_claims)("n",summary.total_claims)("slack",conservation.slack) );
   return report;
} FC_CAPTURE_AND_RETHROW( (vault_id)(filter) ) }

uint32_t reconciliation_engine::annotate_discrepancies( database& db, const reconciliation_report& report )
{ try {
   uint32_t annotated = 0;
   for( const auto& d : report.discrepancies )
   {
      if( !d.claim.valid() || db.find( *d.claim ) == nullptr )
         continue;
      claim_metadata_patch patch;
      patch.notes = "reconciliation: " + d.reason
                  + ", expected " + fc::to_string( d.expected_tokens ) + " tokens and "
                  + fc::to_string( d.expected_currency ) + " currency units";
      db.merge_claim_metadata( *d.claim, patch );
      ++annotated;
   }
   if( annotated > 0 )
      wlog( "Annotated ${n} discrepant claims of vault ${v}", ("n",annotated)("v",report.context.vault) );
   return annotated;
} FC_CAPTURE_AND_RETHROW( (report.context.vault) ) }

} } // vaultdist::chain
