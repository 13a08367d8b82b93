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

#include <vaultdist/chain/database.hpp>
#include <vaultdist/chain/participant_object.hpp>
#include <vaultdist/chain/vault_object.hpp>
#include <vaultdist/chain/source_transaction_object.hpp>
#include <vaultdist/chain/claim_object.hpp>
#include <vaultdist/chain/settlement_batch_object.hpp>
#include <vaultdist/chain/collaborators.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/test/unit_test.hpp>

#include <iostream>

#define VAULTDIST_REQUIRE_THROW( expr, exc_type )         \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "VAULTDIST_REQUIRE_THROW begin "       \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "VAULTDIST_REQUIRE_THROW end "         \
         << req_throw_info << std::endl;                  \
}

#define VAULTDIST_CHECK_THROW( expr, exc_type )           \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "VAULTDIST_CHECK_THROW begin "         \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "VAULTDIST_CHECK_THROW end "           \
         << req_throw_info << std::endl;                  \
}

namespace vaultdist { namespace chain { namespace test {

/// encodes a batch as a fixed number of bytes per output and fails submissions on demand
struct scripted_transaction_builder : public transaction_builder
{
   uint64_t                       bytes_per_output = 100;
   uint32_t                       transport_failures = 0;   ///< the next submissions that fail
   bool                           fail_builds = false;      ///< build() fails instead of submit()
   microseconds                   build_delay;              ///< build() blocks its fiber this long
   vector<settlement_batch_spec>  built;
   vector<settlement_reference>   submitted;
   uint32_t                       submit_calls = 0;

   raw_settlement_transaction build( const settlement_batch_spec& spec, time_point deadline ) override;
   settlement_reference       submit( const raw_settlement_transaction& trx, time_point deadline ) override;
};

/// reports unspent for every claim except the ones given an outcome
struct scripted_backing_validator : public backing_validator
{
   flat_map<claim_id_type, backing_status> outcomes;
   flat_set<claim_id_type>                 lookup_failures;   ///< check() throws for these
   uint32_t                                checks = 0;

   backing_status check( const claim_object& claim, const source_transaction_object& backing ) override;
};

struct recording_asset_updater : public asset_status_updater
{
   vector<vector<vault_asset_id_type>> calls;
   bool                                fail = false;

   void mark_distributed( const vector<vault_asset_id_type>& assets ) override;
};

struct database_fixture
{
   database                                 db;
   time_point_sec                           now;
   std::shared_ptr<recording_asset_updater> updater;

   database_fixture();
   virtual ~database_fixture();

   void advance_time( uint32_t seconds ) { now += seconds; }

   const participant_object& create_participant( const string& name, const string& address = string() );

   /// a locked vault of 1,000,000 tokens with 6 decimals, half offered to acquirers and 10% for the pool
   const vault_object& create_vault( const string& name, participant_id_type owner,
                                     int64_t token_supply = 1000000, uint8_t decimals = 6,
                                     double acquirer_percent = 50, double lp_percent = 10,
                                     vault_status status = vault_status::locked );
   void set_vault_status( vault_id_type vault, vault_status status );

   /// a confirmed contribution of @p asset_count assets, each priced at @p unit_price per unit
   const source_transaction_object& contribute( vault_id_type vault, participant_id_type owner, double unit_price,
                                                int64_t quantity = 1, uint32_t asset_count = 1,
                                                transaction_status status = transaction_status::confirmed );

   /// a confirmed acquisition of @p currency_units smallest currency units
   const source_transaction_object& acquire( vault_id_type vault, participant_id_type owner, int64_t currency_units,
                                             transaction_status status = transaction_status::confirmed );

   const vault_asset_object& add_asset( const source_transaction_object& trx, const string& asset_name,
                                        optional<double> dex_price, optional<double> floor_price = optional<double>(),
                                        int64_t quantity = 1 );

   /// distributes a vault from its own confirmed transactions
   claim_creation_result distribute( vault_id_type vault, bool recompute = false );

   vector<const claim_object*> claims_of( vault_id_type vault, claim_type type )const;
   const claim_object&         only_claim( vault_id_type vault, claim_type type )const;

   new_claim contributor_claim( const source_transaction_object& trx, int64_t tokens, int64_t currency = 0 )const;

   private:
      uint32_t _references = 0;
};

} } } // vaultdist::chain::test
