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

#include <vaultdist/chain/distribution_calculator.hpp>
#include <vaultdist/protocol/rounding.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>
#include <cmath>

namespace vaultdist { namespace chain {

namespace {
   const double unit_scale = VAULTDIST_CURRENCY_UNIT_SCALE;

   int64_t to_units( double display_amount, int64_t known_units )
   {
      if( known_units > 0 || display_amount <= 0 )
         return known_units;
      return floor_to_unit( round_half_up( display_amount * unit_scale ) );
   }
}

int64_t liquidity_pool_allocation::claim_currency()const
{
   return floor_to_unit( lp_currency * unit_scale );
}

int64_t distribution_result::total_tokens()const
{
   share_type total;
   for( const auto& a : acquirers )
      total += share_type( a.tokens );
   for( const auto& c : contributors )
      total += share_type( c.tokens );
   if( liquidity_pool.exists() )
      total += share_type( liquidity_pool.adjusted_lp_tokens );
   return total.value;
}

liquidity_pool_allocation distribution_calculator::calculate_liquidity_pool( const distribution_parameters& params )
{
   liquidity_pool_allocation lp;
   const double supply = params.token_supply;
   const double a = params.acquirer_share;
   const double p = params.lp_share;
   const double acquired = params.total_acquired;

   if( a > 0 && acquired > 0 )
      lp.fdv = round_decimal( acquired / a, 1e2 );
   else
      lp.fdv = params.total_contributed;

   if( p <= 0 || lp.fdv <= 0 )
   {
      lp.price = ( supply > 0 && lp.fdv > 0 ) ? round_high_precision( lp.fdv / supply ) : 0;
      return lp;
   }

   lp.lp_currency = round_decimal( ( p * lp.fdv ) / 2, 1e6 );
   lp.lp_tokens = round_high_precision( ( p * supply ) / 2 );
   lp.price = lp.lp_tokens > 0 ? round_high_precision( lp.lp_currency / lp.lp_tokens ) : 0;

   if( acquired > 0 && lp.lp_tokens > 0 )
   {
      lp.pair_multiplier = floor_to_int( lp.lp_tokens / ( acquired * unit_scale ) );
      lp.adjusted_lp_tokens = ( share_type( lp.pair_multiplier )
                                * share_type( to_units( acquired, params.total_acquired_units ) ) ).value;
   }
   return lp;
}

acquirer_allocation distribution_calculator::calculate_acquirer( const distribution_parameters& params,
                                                                 const liquidity_pool_allocation& lp,
                                                                 const acquisition_input& acquisition )
{
   acquirer_allocation result;
   result.transaction = acquisition.transaction;
   result.sent = acquisition.sent;
   result.sent_units = to_units( acquisition.sent, acquisition.sent_units );

   const double sent = acquisition.sent;
   if( params.total_acquired <= 0 || sent <= 0 )
      return result;

   const double percent_of_total = round_high_precision( sent / params.total_acquired );
   result.raw_tokens = round_high_precision( percent_of_total * params.acquirer_share
                                             * ( params.token_supply - lp.lp_tokens ) );
   result.raw_multiplier = std::max<int64_t>( 0, floor_to_int( result.raw_tokens / sent / unit_scale ) );
   result.multiplier = result.raw_multiplier;
   result.tokens = ( share_type( result.multiplier ) * share_type( result.sent_units ) ).value;
   return result;
}

int64_t distribution_calculator::normalize_acquirers( vector<acquirer_allocation>& allocations )
{
   if( allocations.empty() )
      return 0;

   auto lowest = std::min_element( allocations.begin(), allocations.end(),
         []( const acquirer_allocation& x, const acquirer_allocation& y ) {
            return x.raw_multiplier < y.raw_multiplier;
         } );
   const int64_t multiplier = lowest->raw_multiplier;

   for( auto& allocation : allocations )
   {
      allocation.multiplier = multiplier;
      allocation.tokens = ( share_type( multiplier ) * share_type( allocation.sent_units ) ).value;
   }
   return multiplier;
}

contributor_allocation distribution_calculator::calculate_contributor( const distribution_parameters& params,
                                                                       const liquidity_pool_allocation& lp,
                                                                       const contribution_input& contribution )
{
   contributor_allocation result;
   result.transaction = contribution.transaction;
   result.value = contribution.value;

   const double user_total = contribution.user_total;
   result.proportion = user_total > 0 ? contribution.value / user_total : 0;
   result.share = params.total_contributed > 0 ? user_total / params.total_contributed : 0;

   double tokens = 0;
   if( params.acquirer_share < 1.0 )
   {
      result.user_total_tokens = round_high_precision( ( params.token_supply - lp.lp_tokens )
                                                       * ( 1 - params.acquirer_share ) * result.share );
      tokens = result.user_total_tokens * result.proportion;
   }

   const double currency_pool = std::max( 0.0, params.total_acquired - lp.lp_currency );
   const double currency = result.share * currency_pool * result.proportion;

   result.tokens = floor_to_unit( tokens );
   result.currency = floor_to_unit( currency * unit_scale );
   return result;
}

distribution_result distribution_calculator::calculate( const distribution_parameters& params,
                                                        const vector<acquisition_input>& acquisitions,
                                                        const vector<contribution_input>& contributions )
{
   distribution_result result;
   result.parameters = params;
   result.liquidity_pool = calculate_liquidity_pool( params );
   const auto& lp = result.liquidity_pool;

   if( params.acquirer_share <= 0 )
      dlog( "No acquirer share, valuation ${fdv} taken from contributed value", ("fdv",lp.fdv) );
   if( params.lp_share <= 0 )
      dlog( "No liquidity pool, token price ${p} derived from valuation", ("p",lp.price) );

   for( const auto& acquisition : acquisitions )
   {
      if( acquisition.sent <= 0 )
         continue;
      result.acquirers.push_back( calculate_acquirer( params, lp, acquisition ) );
   }
   result.acquirer_multiplier = normalize_acquirers( result.acquirers );

   if( params.acquirer_share >= 1.0 && !contributions.empty() )
      ilog( "Entire supply offered to acquirers, contributors receive currency only" );
   if( params.total_acquired - lp.lp_currency < 0 && !contributions.empty() )
      wlog( "Pool currency ${lp} exceeds acquired currency ${a}, contributors receive no currency",
            ("lp",lp.lp_currency)("a",params.total_acquired) );

   for( const auto& contribution : contributions )
   {
      if( contribution.value <= 0 )
         continue;
      result.contributors.push_back( calculate_contributor( params, lp, contribution ) );
   }
   return result;
}

asset_multiplier_result distribution_calculator::calculate_asset_multipliers(
      const vector<contributor_claim_input>& contributor_claims,
      optional<int64_t> acquirer_multiplier )
{
   asset_multiplier_result result;

   for( const auto& claim : contributor_claims )
   {
      const int64_t asset_count = claim.assets.size();
      if( asset_count == 0 )
         continue;

      const int64_t base_tokens = claim.tokens / asset_count;
      const int64_t token_remainder = claim.tokens - base_tokens * asset_count;
      const int64_t base_currency = claim.currency / asset_count;
      const int64_t currency_remainder = claim.currency - base_currency * asset_count;

      share_type recalculated_tokens;
      share_type recalculated_currency;
      for( int64_t i = 0; i < asset_count; ++i )
      {
         const auto& asset = claim.assets[i];
         const int64_t quantity = asset.quantity > 0 ? asset.quantity : 1;

         const int64_t token_share = base_tokens + ( i < token_remainder ? 1 : 0 );
         const int64_t tokens_per_unit = token_share / quantity;
         result.token_multipliers.push_back( { asset.policy_id, asset.asset_name, tokens_per_unit } );
         recalculated_tokens += share_type( quantity ) * share_type( tokens_per_unit );

         const int64_t currency_share = base_currency + ( i < currency_remainder ? 1 : 0 );
         const int64_t currency_per_unit = currency_share / quantity;
         result.currency_multipliers.push_back( { asset.policy_id, asset.asset_name, currency_per_unit } );
         recalculated_currency += share_type( quantity ) * share_type( currency_per_unit );
      }
      result.recalculated_tokens[claim.claim] = recalculated_tokens.value;
      result.recalculated_currency[claim.claim] = recalculated_currency.value;
   }

   if( acquirer_multiplier.valid() )
      result.token_multipliers.push_back( { string(), string(), *acquirer_multiplier } );

   return result;
}

uint8_t distribution_calculator::optimal_decimals( double token_supply,
                                                   optional<double> max_multiplier,
                                                   optional<double> min_multiplier )
{
   FC_ASSERT( token_supply > 0, "Token supply must be positive", ("supply",token_supply) );
   const double max_safe = double( VAULTDIST_MAX_SAFE_INTEGER );

   const int64_t from_supply = floor_to_int( std::log10( max_safe / token_supply ) );
   int64_t from_multiplier = 15;
   if( max_multiplier.valid() && *max_multiplier > 0 )
      from_multiplier = floor_to_int( std::log10( max_safe / ( *max_multiplier * VAULTDIST_ASSUMED_MAX_ASSET_QUANTITY ) ) );

   int64_t extra_for_underflow = 0;
   if( min_multiplier.valid() && *min_multiplier > 0 && *min_multiplier < 1 )
   {
      extra_for_underflow = static_cast<int64_t>( std::ceil( -std::log10( *min_multiplier ) ) );
      wlog( "Multiplier underflow detected: min multiplier ${m}, adding ${n} decimals",
            ("m",*min_multiplier)("n",extra_for_underflow) );
   }

   int64_t target;
   if( token_supply >= 90000000000.0 )
      target = 1;
   else if( token_supply >= 9000000000.0 )
      target = 2;
   else if( token_supply >= 900000000.0 )
      target = 3;
   else if( token_supply >= 90000000.0 )
      target = 4;
   else if( token_supply >= 9000000.0 )
      target = 5;
   else
      target = 6;

   const int64_t wanted = target + extra_for_underflow;
   const int64_t result = std::min( { wanted, from_supply, from_multiplier, int64_t(VAULTDIST_MAX_TOKEN_DECIMALS) } );

   if( extra_for_underflow > 0 && result < wanted )
      elog( "Cannot fully prevent multiplier underflow: need ${w} decimals but capped at ${r} for supply ${s}",
            ("w",wanted)("r",result)("s",token_supply) );
   else if( result < target )
      wlog( "Token supply ${s}: target decimals ${t} reduced to ${r}", ("s",token_supply)("t",target)("r",result) );

   return static_cast<uint8_t>( std::max<int64_t>( result, VAULTDIST_MIN_TOKEN_DECIMALS ) );
}

} } // vaultdist::chain
