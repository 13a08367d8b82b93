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

#include "database_fixture.hpp"

#include <fc/string.hpp>

#include <boost/fiber/operations.hpp>

#include <chrono>

namespace vaultdist { namespace chain { namespace test {

raw_settlement_transaction scripted_transaction_builder::build( const settlement_batch_spec& spec, time_point deadline )
{
   if( fail_builds && transport_failures > 0 )
   {
      --transport_failures;
      FC_THROW_EXCEPTION( transport_exception, "builder unreachable" );
   }
   built.push_back( spec );
   if( build_delay.count() > 0 )
      boost::this_fiber::sleep_for( std::chrono::microseconds( build_delay.count() ) );
   raw_settlement_transaction trx;
   trx.bytes.resize( 64 + bytes_per_output * spec.outputs.size() );
   return trx;
}

settlement_reference scripted_transaction_builder::submit( const raw_settlement_transaction& trx, time_point deadline )
{
   ++submit_calls;
   if( !fail_builds && transport_failures > 0 )
   {
      --transport_failures;
      FC_THROW_EXCEPTION( transport_exception, "connection reset by peer" );
   }
   submitted.push_back( "settlement-" + fc::to_string( uint64_t( submitted.size() + 1 ) ) );
   return submitted.back();
}

backing_status scripted_backing_validator::check( const claim_object& claim, const source_transaction_object& backing )
{
   ++checks;
   if( lookup_failures.find( claim.get_id() ) != lookup_failures.end() )
      FC_THROW_EXCEPTION( transport_exception, "ledger index unavailable" );
   auto itr = outcomes.find( claim.get_id() );
   return itr != outcomes.end() ? itr->second : backing_status();
}

void recording_asset_updater::mark_distributed( const vector<vault_asset_id_type>& assets )
{
   calls.push_back( assets );
   if( fail )
      FC_THROW( "asset registry unavailable" );
}

database_fixture::database_fixture()
   : now( 1700000000 ), updater( std::make_shared<recording_asset_updater>() )
{
   db.set_clock( [this]() { return now; } );
   db.set_asset_status_updater( updater );
}

database_fixture::~database_fixture()
{
}

const participant_object& database_fixture::create_participant( const string& name, const string& address )
{
   return db.create<participant_object>( [&]( participant_object& p ) {
      p.name = name;
      p.address = address.empty() ? "addr_test1_" + name : address;
   });
}

const vault_object& database_fixture::create_vault( const string& name, participant_id_type owner,
                                                    int64_t token_supply, uint8_t decimals,
                                                    double acquirer_percent, double lp_percent,
                                                    vault_status status )
{
   return db.create<vault_object>( [&]( vault_object& v ) {
      v.name = name;
      v.owner = owner;
      v.status = status;
      v.token_supply = token_supply;
      v.token_decimals = decimals;
      v.acquirer_percent = acquirer_percent;
      v.lp_percent = lp_percent;
      v.created = now;
   });
}

void database_fixture::set_vault_status( vault_id_type vault, vault_status status )
{
   db.modify( db.get_vault( vault ), [status]( vault_object& v ) {
      v.status = status;
   });
}

const source_transaction_object& database_fixture::contribute( vault_id_type vault, participant_id_type owner,
                                                               double unit_price, int64_t quantity,
                                                               uint32_t asset_count, transaction_status status )
{
   const auto& trx = db.create<source_transaction_object>( [&]( source_transaction_object& t ) {
      t.owner = owner;
      t.vault = vault;
      t.kind = transaction_kind::contribute;
      t.status = status;
      t.ledger_reference = "contribution-" + fc::to_string( uint64_t( ++_references ) );
      t.output_index = 0;
      t.created = now;
   });
   for( uint32_t i = 0; i < asset_count; ++i )
      add_asset( trx, "asset" + fc::to_string( uint64_t( i ) ), unit_price, optional<double>(), quantity );
   return trx;
}

const source_transaction_object& database_fixture::acquire( vault_id_type vault, participant_id_type owner,
                                                            int64_t currency_units, transaction_status status )
{
   return db.create<source_transaction_object>( [&]( source_transaction_object& t ) {
      t.owner = owner;
      t.vault = vault;
      t.kind = transaction_kind::acquire;
      t.status = status;
      t.currency_amount = currency_units;
      t.ledger_reference = "acquisition-" + fc::to_string( uint64_t( ++_references ) );
      t.output_index = 1;
      t.created = now;
   });
}

const vault_asset_object& database_fixture::add_asset( const source_transaction_object& trx, const string& asset_name,
                                                       optional<double> dex_price, optional<double> floor_price,
                                                       int64_t quantity )
{
   return db.create<vault_asset_object>( [&]( vault_asset_object& a ) {
      a.transaction = trx.get_id();
      a.vault = trx.vault;
      a.policy_id = "policy" + fc::to_string( trx.id.instance() );
      a.asset_name = asset_name;
      a.quantity = quantity;
      a.type = quantity > 1 ? asset_type::fungible : asset_type::nft;
      a.dex_price = dex_price;
      a.floor_price = floor_price;
      a.status = asset_status::locked;
   });
}

claim_creation_result database_fixture::distribute( vault_id_type vault, bool recompute )
{
   return db.create_claims_for_vault( vault, db.compute_vault_totals( vault ), recompute );
}

vector<const claim_object*> database_fixture::claims_of( vault_id_type vault, claim_type type )const
{
   vector<const claim_object*> result;
   for( const claim_object* claim : db.get_vault_claims( vault ) )
      if( claim->type == type )
         result.push_back( claim );
   return result;
}

const claim_object& database_fixture::only_claim( vault_id_type vault, claim_type type )const
{
   const auto claims = claims_of( vault, type );
   BOOST_REQUIRE_EQUAL( claims.size(), 1u );
   return *claims.front();
}

new_claim database_fixture::contributor_claim( const source_transaction_object& trx, int64_t tokens,
                                               int64_t currency )const
{
   new_claim args;
   args.owner = trx.owner;
   args.vault = trx.vault;
   args.type = claim_type::contributor;
   args.token_amount = tokens;
   args.currency_amount = currency;
   args.source_transaction = trx.get_id();
   return args;
}

} } } // vaultdist::chain::test
