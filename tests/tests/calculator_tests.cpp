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

#include <fc/io/json.hpp>

#include <boost/test/unit_test.hpp>

using namespace vaultdist::chain;

namespace {
   distribution_parameters make_parameters( double supply, double a, double p, double acquired, double contributed )
   {
      distribution_parameters params;
      params.token_supply = supply;
      params.acquirer_share = a;
      params.lp_share = p;
      params.total_acquired = acquired;
      params.total_acquired_units = int64_t( acquired * VAULTDIST_CURRENCY_UNIT_SCALE );
      params.total_contributed = contributed;
      return params;
   }

   acquisition_input acquisition( uint64_t trx, int64_t units )
   {
      acquisition_input input;
      input.transaction = source_transaction_id_type( trx );
      input.sent = double( units ) / VAULTDIST_CURRENCY_UNIT_SCALE;
      input.sent_units = units;
      return input;
   }

   contribution_input contribution( uint64_t trx, double value, double user_total )
   {
      contribution_input input;
      input.transaction = source_transaction_id_type( trx );
      input.value = value;
      input.user_total = user_total;
      return input;
   }
}

BOOST_AUTO_TEST_SUITE( calculator_tests )

/**
 * One acquirer sending 100, one contributor worth 50, S = 1,000,000 smallest units.
 * The acquirer multiplier floors to zero at this supply.
 */
BOOST_AUTO_TEST_CASE( reference_scenario )
{ try {
   const auto params = make_parameters( 1000000, 0.5, 0.1, 100, 50 );
   const auto result = distribution_calculator::calculate( params, { acquisition( 0, 100000000 ) },
                                                           { contribution( 1, 50, 50 ) } );
   const auto& lp = result.liquidity_pool;
   BOOST_CHECK_EQUAL( lp.fdv, 200.0 );
   BOOST_CHECK_EQUAL( lp.lp_currency, 10.0 );
   BOOST_CHECK_EQUAL( lp.lp_tokens, 50000.0 );
   BOOST_CHECK_CLOSE( lp.price, 0.0002, 1e-9 );
   BOOST_CHECK_EQUAL( lp.pair_multiplier, 0 );
   BOOST_CHECK_EQUAL( lp.adjusted_lp_tokens, 0 );
   BOOST_CHECK_EQUAL( lp.claim_currency(), 10000000 );

   BOOST_REQUIRE_EQUAL( result.acquirers.size(), 1u );
   BOOST_CHECK_EQUAL( result.acquirers[0].raw_tokens, 475000.0 );
   BOOST_CHECK_EQUAL( result.acquirers[0].multiplier, 0 );
   BOOST_CHECK_EQUAL( result.acquirers[0].tokens, 0 );
   BOOST_CHECK_EQUAL( result.acquirer_multiplier, 0 );

   BOOST_REQUIRE_EQUAL( result.contributors.size(), 1u );
   const auto& c = result.contributors[0];
   BOOST_CHECK_EQUAL( c.proportion, 1.0 );
   BOOST_CHECK_EQUAL( c.share, 1.0 );
   BOOST_CHECK_EQUAL( c.tokens, 475000 );
   BOOST_CHECK_EQUAL( c.currency, 90000000 );

   BOOST_CHECK_LE( result.total_tokens(), 1000000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( scaled_supply_allocates_everything )
{ try {
   const auto params = make_parameters( 1e12, 0.5, 0.1, 100, 50 );
   const auto result = distribution_calculator::calculate( params, { acquisition( 0, 100000000 ) },
                                                           { contribution( 1, 50, 50 ) } );
   BOOST_CHECK_EQUAL( result.liquidity_pool.lp_tokens, 5e10 );
   BOOST_CHECK_EQUAL( result.liquidity_pool.pair_multiplier, 500 );
   BOOST_CHECK_EQUAL( result.liquidity_pool.adjusted_lp_tokens, 50000000000ll );
   BOOST_CHECK_EQUAL( result.acquirer_multiplier, 4750 );
   BOOST_CHECK_EQUAL( result.acquirers[0].tokens, 475000000000ll );
   BOOST_CHECK_EQUAL( result.contributors[0].tokens, 475000000000ll );
   BOOST_CHECK_EQUAL( result.contributors[0].currency, 90000000 );
   BOOST_CHECK_EQUAL( result.total_tokens(), 1000000000000ll );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( acquirers_share_one_multiplier )
{ try {
   const auto params = make_parameters( 1e12, 0.5, 0.1, 100, 0 );
   const auto result = distribution_calculator::calculate( params,
                                                           { acquisition( 0, 30000000 ), acquisition( 1, 70000000 ) },
                                                           {} );
   BOOST_REQUIRE_EQUAL( result.acquirers.size(), 2u );
   for( const auto& a : result.acquirers )
   {
      BOOST_CHECK_EQUAL( a.multiplier, result.acquirer_multiplier );
      BOOST_CHECK_EQUAL( a.tokens, a.multiplier * a.sent_units );
   }

   vector<acquirer_allocation> uneven( 2 );
   uneven[0].raw_multiplier = 10;
   uneven[0].sent_units = 5;
   uneven[1].raw_multiplier = 7;
   uneven[1].sent_units = 3;
   BOOST_CHECK_EQUAL( distribution_calculator::normalize_acquirers( uneven ), 7 );
   BOOST_CHECK_EQUAL( uneven[0].tokens, 35 );
   BOOST_CHECK_EQUAL( uneven[1].tokens, 21 );
   BOOST_CHECK_EQUAL( uneven[0].raw_multiplier, 10 );
} FC_LOG_AND_RETHROW() }

/**
 * 61 / 125 rounds to 0.48799999999999993, which leaves the first acquirer just short of
 * multiplier 8. Both acquirers are normalized down to 7.
 */
BOOST_AUTO_TEST_CASE( uneven_acquirers_keep_rounding_noise )
{ try {
   const auto params = make_parameters( 1e9, 1.0, 0.0, 125, 0 );
   const auto result = distribution_calculator::calculate( params,
                                                           { acquisition( 0, 61000000 ), acquisition( 1, 64000000 ) },
                                                           {} );
   BOOST_CHECK_EQUAL( result.liquidity_pool.fdv, 125.0 );
   BOOST_CHECK( !result.liquidity_pool.exists() );
   BOOST_REQUIRE_EQUAL( result.acquirers.size(), 2u );
   BOOST_CHECK_EQUAL( result.acquirers[0].raw_tokens, 487999999.99999994 );
   BOOST_CHECK_EQUAL( result.acquirers[0].raw_multiplier, 7 );
   BOOST_CHECK_EQUAL( result.acquirers[1].raw_tokens, 512000000.0 );
   BOOST_CHECK_EQUAL( result.acquirers[1].raw_multiplier, 8 );
   BOOST_CHECK_EQUAL( result.acquirer_multiplier, 7 );
   BOOST_CHECK_EQUAL( result.acquirers[0].tokens, 427000000 );
   BOOST_CHECK_EQUAL( result.acquirers[1].tokens, 448000000 );
   BOOST_CHECK_EQUAL( result.total_tokens(), 875000000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( everything_offered_to_acquirers )
{ try {
   const auto params = make_parameters( 1e12, 1.0, 0.1, 100, 50 );
   const auto result = distribution_calculator::calculate( params, { acquisition( 0, 100000000 ) },
                                                           { contribution( 1, 30, 50 ), contribution( 2, 20, 50 ) } );
   BOOST_CHECK_EQUAL( result.liquidity_pool.fdv, 100.0 );
   BOOST_CHECK_EQUAL( result.liquidity_pool.lp_currency, 5.0 );
   BOOST_REQUIRE_EQUAL( result.contributors.size(), 2u );
   for( const auto& c : result.contributors )
      BOOST_CHECK_EQUAL( c.tokens, 0 );
   const int64_t paid = result.contributors[0].currency + result.contributors[1].currency;
   BOOST_CHECK_LE( paid, 95000000 );
   BOOST_CHECK_GE( paid, 95000000 - 2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( no_acquisitions )
{ try {
   const auto params = make_parameters( 1e12, 0.5, 0.1, 0, 50 );
   const auto result = distribution_calculator::calculate( params, {}, { contribution( 1, 50, 50 ) } );
   BOOST_CHECK_EQUAL( result.liquidity_pool.fdv, 50.0 );
   BOOST_CHECK_EQUAL( result.liquidity_pool.pair_multiplier, 0 );
   BOOST_CHECK( result.acquirers.empty() );
   BOOST_CHECK_EQUAL( result.contributors[0].tokens, 475000000000ll );
   BOOST_CHECK_EQUAL( result.contributors[0].currency, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( zero_totals_yield_zero_allocations )
{ try {
   const auto params = make_parameters( 1e12, 0.5, 0.1, 0, 0 );
   const auto empty = distribution_calculator::calculate( params, {}, { contribution( 1, 0, 0 ) } );
   BOOST_CHECK_EQUAL( empty.liquidity_pool.fdv, 0.0 );
   BOOST_CHECK_EQUAL( empty.liquidity_pool.price, 0.0 );
   BOOST_CHECK( !empty.liquidity_pool.exists() );
   BOOST_CHECK( empty.contributors.empty() );
   BOOST_CHECK_EQUAL( empty.total_tokens(), 0 );

   // a contribution whose owner total is unknown must not divide by zero
   const auto orphan = distribution_calculator::calculate_contributor( params, empty.liquidity_pool,
                                                                       contribution( 2, 10, 0 ) );
   BOOST_CHECK_EQUAL( orphan.proportion, 0.0 );
   BOOST_CHECK_EQUAL( orphan.tokens, 0 );
   BOOST_CHECK_EQUAL( orphan.currency, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( repeated_calculation_is_identical )
{ try {
   const auto params = make_parameters( 123456789000.0, 0.37, 0.05, 1234.567891, 987.654321 );
   const vector<acquisition_input> acquisitions{ acquisition( 0, 1000000001 ), acquisition( 1, 234567890 ) };
   const vector<contribution_input> contributions{ contribution( 2, 500.5, 700.25 ), contribution( 3, 199.75, 700.25 ),
                                                   contribution( 4, 287.404321, 287.404321 ) };
   const auto first = distribution_calculator::calculate( params, acquisitions, contributions );
   const auto second = distribution_calculator::calculate( params, acquisitions, contributions );
   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( first, 10 ) ), fc::json::to_string( fc::variant( second, 10 ) ) );
   BOOST_CHECK_LE( first.total_tokens(), int64_t( params.token_supply ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( asset_multipliers )
{ try {
   contributor_claim_input split;
   split.claim = claim_id_type( 1 );
   split.tokens = 10;
   split.currency = 7;
   split.assets = { { "p", "a", 1 }, { "p", "b", 1 }, { "p", "c", 1 } };

   contributor_claim_input fungible;
   fungible.claim = claim_id_type( 2 );
   fungible.tokens = 100;
   fungible.assets = { { "q", "coin", 3 } };

   const auto result = distribution_calculator::calculate_asset_multipliers( { split, fungible }, 4750 );
   BOOST_REQUIRE_EQUAL( result.token_multipliers.size(), 5u );
   BOOST_CHECK_EQUAL( result.token_multipliers[0].per_unit, 4 );
   BOOST_CHECK_EQUAL( result.token_multipliers[1].per_unit, 3 );
   BOOST_CHECK_EQUAL( result.token_multipliers[2].per_unit, 3 );
   BOOST_CHECK_EQUAL( result.token_multipliers[3].per_unit, 33 );
   BOOST_CHECK_EQUAL( result.token_multipliers[4].per_unit, 4750 );
   BOOST_CHECK( result.token_multipliers[4].policy_id.empty() );
   BOOST_CHECK_EQUAL( result.currency_multipliers[0].per_unit, 3 );
   BOOST_CHECK_EQUAL( result.currency_multipliers[1].per_unit, 2 );

   BOOST_CHECK_EQUAL( result.recalculated_tokens.at( claim_id_type( 1 ) ), 10 );
   BOOST_CHECK_EQUAL( result.recalculated_currency.at( claim_id_type( 1 ) ), 7 );
   BOOST_CHECK_EQUAL( result.recalculated_tokens.at( claim_id_type( 2 ) ), 99 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( optimal_decimals )
{ try {
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e6 ), 6 );
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e7 ), 5 );
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e9 ), 3 );
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e11 ), 1 );
   // the supply bound would allow none, the result never drops below one
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e15 ), 1 );
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e6, 1e10 ), 2 );
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e6, optional<double>(), 0.5 ), 7 );
   BOOST_CHECK_EQUAL( distribution_calculator::optimal_decimals( 1e6, optional<double>(), 0.001 ), 8 );
   BOOST_CHECK_THROW( distribution_calculator::optimal_decimals( 0 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
