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

#include <vaultdist/chain/database.hpp>

#include <vaultdist/chain/participant_object.hpp>
#include <vaultdist/chain/vault_object.hpp>
#include <vaultdist/chain/source_transaction_object.hpp>
#include <vaultdist/chain/claim_object.hpp>
#include <vaultdist/protocol/rounding.hpp>

#include <cmath>

namespace vaultdist { namespace chain {

namespace {
   void validate_totals( const database& db, const vault_object& vault, const vault_totals& totals )
   {
      VAULTDIST_ASSERT( std::isfinite( totals.total_acquired ) && totals.total_acquired >= 0, validation_exception,
                        "Acquired total must be a non-negative number", ("A",totals.total_acquired) );
      VAULTDIST_ASSERT( std::isfinite( totals.total_contributed ) && totals.total_contributed >= 0, validation_exception,
                        "Contributed total must be a non-negative number", ("C",totals.total_contributed) );
      for( const auto& entry : totals.participant_values )
      {
         VAULTDIST_ASSERT( std::isfinite( entry.second ) && entry.second >= 0, validation_exception,
                           "Contributed value of ${p} must be a non-negative number", ("p",entry.first)("v",entry.second) );
      }
      for( const auto* trx : db.get_confirmed_transactions( vault.get_id(), transaction_kind::contribute ) )
      {
         if( db.transaction_value( *trx ) <= 0 )
            continue;
         VAULTDIST_ASSERT( totals.participant_values.find( trx->owner ) != totals.participant_values.end(),
                           validation_exception, "No contributed value given for participant ${p}", ("p",trx->owner) );
      }
   }

   bool same_amounts( const claim_object& claim, const new_claim& expected )
   {
      return claim.token_amount == expected.token_amount && claim.currency_amount == expected.currency_amount;
   }
}

vault_totals database::compute_vault_totals( vault_id_type vault )const
{ try {
   get_vault( vault );

   vault_totals totals;
   // display units summed in creation order
   for( const auto* trx : get_confirmed_transactions( vault, transaction_kind::acquire ) )
      totals.total_acquired += trx->currency_display();

   for( const auto* trx : get_confirmed_transactions( vault, transaction_kind::contribute ) )
   {
      const double value = transaction_value( *trx );
      totals.total_contributed += value;
      totals.participant_values[trx->owner] += value;
   }
   return totals;
} FC_CAPTURE_AND_RETHROW( (vault) ) }

distribution_parameters database::distribution_parameters_for( const vault_object& vault,
                                                               const vault_totals& totals )const
{
   distribution_parameters params;
   params.token_supply = vault.scaled_supply();
   params.acquirer_share = vault.acquirer_share();
   params.lp_share = vault.lp_share();
   params.total_acquired = totals.total_acquired;
   params.total_acquired_units = floor_to_unit( round_half_up( totals.total_acquired * VAULTDIST_CURRENCY_UNIT_SCALE ) );
   params.total_contributed = totals.total_contributed;
   return params;
}

distribution_result database::calculate_distribution( vault_id_type vault_id, const vault_totals& totals )const
{ try {
   const vault_object& vault = get_vault( vault_id );

   vector<acquisition_input> acquisitions;
   for( const auto* trx : get_confirmed_transactions( vault_id, transaction_kind::acquire ) )
   {
      acquisition_input input;
      input.transaction = trx->get_id();
      input.sent = trx->currency_display();
      input.sent_units = trx->currency_amount.value;
      acquisitions.push_back( input );
   }

   vector<contribution_input> contributions;
   for( const auto* trx : get_confirmed_transactions( vault.get_id(), transaction_kind::contribute ) )
   {
      contribution_input input;
      input.transaction = trx->get_id();
      input.value = transaction_value( *trx );
      auto itr = totals.participant_values.find( trx->owner );
      input.user_total = itr != totals.participant_values.end() ? itr->second : 0;
      contributions.push_back( input );
   }

   return distribution_calculator::calculate( distribution_parameters_for( vault, totals ), acquisitions, contributions );
} FC_CAPTURE_AND_RETHROW( (vault_id) ) }

claim_creation_result database::create_claims_for_vault( vault_id_type vault_id, const vault_totals& totals,
                                                         bool recompute )
{ try {
   const vault_object& vault = get_vault( vault_id );
   VAULTDIST_ASSERT( vault.status == vault_status::locked, validation_exception,
                     "Claims can only be created for a locked vault, ${v} is ${s}", ("v",vault_id)("s",vault.status) );
   validate_totals( *this, vault, totals );

   claim_creation_result result;
   result.distribution = calculate_distribution( vault_id, totals );
   const distribution_result& dist = result.distribution;

   vector<new_claim> entitlements;
   for( const auto& allocation : dist.acquirers )
   {
      const auto& trx = get_source_transaction( allocation.transaction );
      new_claim args;
      args.owner = trx.owner;
      args.vault = vault_id;
      args.type = claim_type::acquirer;
      args.token_amount = allocation.tokens;
      args.multiplier = allocation.multiplier;
      args.source_transaction = trx.get_id();
      acquirer_claim_metadata payload;
      payload.currency_sent = allocation.sent;
      payload.raw_multiplier = allocation.raw_multiplier;
      args.payload = claim_payload( payload );
      args.description = "Tokens for acquiring into " + vault.name;
      entitlements.push_back( std::move( args ) );
   }

   for( const auto& allocation : dist.contributors )
   {
      const auto& trx = get_source_transaction( allocation.transaction );
      new_claim args;
      args.owner = trx.owner;
      args.vault = vault_id;
      args.type = claim_type::contributor;
      args.token_amount = allocation.tokens;
      args.currency_amount = allocation.currency;
      args.source_transaction = trx.get_id();
      contributor_claim_metadata payload;
      payload.no_acquirers = dist.acquirers.empty();
      payload.assessed_value = allocation.value;
      payload.proportion = allocation.proportion;
      payload.user_total_tokens = allocation.user_total_tokens;
      args.payload = claim_payload( payload );
      args.description = "Tokens and currency for contributing to " + vault.name;
      entitlements.push_back( std::move( args ) );
   }

   if( dist.liquidity_pool.exists() )
   {
      new_claim args;
      args.owner = vault.owner;
      args.vault = vault_id;
      args.type = claim_type::liquidity_pool;
      args.token_amount = dist.liquidity_pool.adjusted_lp_tokens;
      args.currency_amount = dist.liquidity_pool.claim_currency();
      liquidity_pool_claim_metadata payload;
      payload.fdv = dist.liquidity_pool.fdv;
      payload.lp_currency = dist.liquidity_pool.lp_currency;
      payload.lp_tokens = dist.liquidity_pool.lp_tokens;
      payload.pair_multiplier = dist.liquidity_pool.pair_multiplier;
      args.payload = claim_payload( payload );
      args.description = "Liquidity pool seed of " + vault.name;
      entitlements.push_back( std::move( args ) );
   }

   auto session = start_undo_session();

   for( const auto& args : entitlements )
   {
      const claim_object* existing = find_unresolved_claim( args.owner, args.source_transaction, args.type, vault_id );
      if( existing != nullptr )
      {
         if( !recompute || existing->status != claim_status::available || same_amounts( *existing, args ) )
         {
            ilog( "Skipping ${t} claim for ${o}, claim ${c} already exists",
                  ("t",args.type)("o",args.owner)("c",existing->id) );
            ++result.skipped;
            continue;
         }
         result.replaced.push_back( existing->get_id() );
         remove_obsolete_claim( existing->get_id() );
      }
      result.created.push_back( create_claim( args ).get_id() );
   }

   modify( vault, [&]( vault_object& v ) {
      v.total_acquired = totals.total_acquired;
      v.total_contributed = totals.total_contributed;
      v.claims_created = true;
   });

   session.commit();

   ilog( "Vault ${v}: created ${n} claims, skipped ${s}, replaced ${r}, ${tokens} of ${supply} tokens allocated",
         ("v",vault_id)("n",result.created.size())("s",result.skipped)("r",result.replaced.size())
         ("tokens",dist.total_tokens())("supply",dist.parameters.token_supply) );
   return result;
} FC_CAPTURE_AND_RETHROW( (vault_id)(totals)(recompute) ) }

vector<claim_id_type> database::create_cancellation_claims( vault_id_type vault_id, const string& reason )
{ try {
   const vault_object& vault = get_vault( vault_id );
   VAULTDIST_ASSERT( vault.status == vault_status::failed, validation_exception,
                     "Cancellation claims need a failed vault, ${v} is ${s}", ("v",vault_id)("s",vault.status) );

   vector<claim_id_type> created;
   auto session = start_undo_session();

   auto refund = [&]( const source_transaction_object& trx, share_type currency, cancellation_claim_metadata payload ) {
      if( find_unresolved_claim( trx.owner, trx.get_id(), claim_type::cancellation, vault_id ) != nullptr )
      {
         ilog( "Skipping cancellation of ${t}, a claim already exists", ("t",trx.id) );
         return;
      }
      payload.failure_reason = reason;
      payload.output_index = 0;

      new_claim args;
      args.owner = trx.owner;
      args.vault = vault_id;
      args.type = claim_type::cancellation;
      args.currency_amount = currency;
      args.source_transaction = trx.get_id();
      args.payload = claim_payload( payload );
      args.description = "Refund from failed vault " + vault.name;
      created.push_back( create_claim( args ).get_id() );
   };

   for( const auto* trx : get_confirmed_transactions( vault.get_id(), transaction_kind::contribute ) )
   {
      cancellation_claim_metadata payload;
      payload.transaction = transaction_kind::contribute;
      for( const auto* asset : get_transaction_assets( trx->get_id() ) )
      {
         refund_asset item;
         item.id = asset->get_id();
         item.policy_id = asset->policy_id;
         item.asset_name = asset->asset_name;
         item.quantity = asset->quantity;
         item.type = asset->type;
         payload.assets.push_back( item );
      }
      refund( *trx, 0, std::move( payload ) );
   }

   for( const auto* trx : get_confirmed_transactions( vault_id, transaction_kind::acquire ) )
   {
      cancellation_claim_metadata payload;
      payload.transaction = transaction_kind::acquire;
      refund( *trx, trx->currency_amount, std::move( payload ) );
   }

   session.commit();
   ilog( "Vault ${v} failed (${r}): ${n} cancellation claims created", ("v",vault_id)("r",reason)("n",created.size()) );
   return created;
} FC_CAPTURE_AND_RETHROW( (vault_id)(reason) ) }

} } // vaultdist::chain
