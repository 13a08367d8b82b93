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

#include <boost/test/unit_test.hpp>

#include <fc/filesystem.hpp>

#include "../common/database_fixture.hpp"

using namespace vaultdist::chain;
using namespace vaultdist::chain::test;

BOOST_FIXTURE_TEST_SUITE( ledger_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_claim_guards_duplicates )
{ try {
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", alice.get_id() );
   const auto& trx = contribute( vault.get_id(), alice.get_id(), 50 );

   const claim_object& claim = db.create_claim( contributor_claim( trx, 1000, 20 ) );
   BOOST_CHECK( claim.status == claim_status::available );
   BOOST_CHECK( claim.created == now );
   BOOST_CHECK( claim.metadata.payload.which() == int( claim_type::contributor ) );
   const claim_id_type first = claim.get_id();

   VAULTDIST_REQUIRE_THROW( db.create_claim( contributor_claim( trx, 1000, 20 ) ), duplicate_claim_exception );

   // a failed claim no longer blocks the entitlement
   db.transition( first, claim_status::failed );
   const claim_object& retry = db.create_claim( contributor_claim( trx, 1000, 20 ) );
   BOOST_CHECK( retry.get_id() != first );

   // the same transaction may back a claim of another type
   new_claim refund = contributor_claim( trx, 0, 0 );
   refund.type = claim_type::cancellation;
   BOOST_CHECK_NO_THROW( db.create_claim( refund ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_claim_validation )
{ try {
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", alice.get_id() );
   const auto& other = create_vault( "other", alice.get_id() );
   const auto& trx = contribute( vault.get_id(), alice.get_id(), 50 );

   VAULTDIST_CHECK_THROW( db.create_claim( contributor_claim( trx, -1 ) ), validation_exception );
   VAULTDIST_CHECK_THROW( db.create_claim( contributor_claim( trx, 1, -1 ) ), validation_exception );

   auto with_multiplier = contributor_claim( trx, 1 );
   with_multiplier.multiplier = 5;
   VAULTDIST_CHECK_THROW( db.create_claim( with_multiplier ), validation_exception );

   auto wrong_payload = contributor_claim( trx, 1 );
   wrong_payload.payload = claim_payload( acquirer_claim_metadata() );
   VAULTDIST_CHECK_THROW( db.create_claim( wrong_payload ), validation_exception );

   auto foreign = contributor_claim( trx, 1 );
   foreign.vault = other.get_id();
   VAULTDIST_CHECK_THROW( db.create_claim( foreign ), validation_exception );

   auto unknown_owner = contributor_claim( trx, 1 );
   unknown_owner.owner = participant_id_type( 42 );
   VAULTDIST_CHECK_THROW( db.create_claim( unknown_owner ), not_found_exception );

   auto unknown_trx = contributor_claim( trx, 1 );
   unknown_trx.source_transaction = source_transaction_id_type( 42 );
   VAULTDIST_CHECK_THROW( db.create_claim( unknown_trx ), not_found_exception );

   BOOST_CHECK( db.get_vault_claims( vault.get_id() ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( status_edges )
{ try {
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", alice.get_id() );
   const auto& trx = contribute( vault.get_id(), alice.get_id(), 50 );
   const claim_id_type id = db.create_claim( contributor_claim( trx, 1000 ) ).get_id();

   VAULTDIST_CHECK_THROW( db.transition( id, claim_status::claimed ), invalid_transition_exception );
   VAULTDIST_CHECK_THROW( db.transition( id, claim_status::available ), invalid_transition_exception );

   advance_time( 60 );
   db.transition( id, claim_status::pending, claim_metadata_patch(), settlement_batch_id_type( 3 ) );
   BOOST_CHECK( db.get_claim( id ).status == claim_status::pending );
   BOOST_REQUIRE( db.get_claim( id ).settlement.valid() );
   BOOST_CHECK( *db.get_claim( id ).settlement == settlement_batch_id_type( 3 ) );
   BOOST_CHECK( db.get_claim( id ).updated == now );

   db.transition( id, claim_status::claimed );
   BOOST_CHECK( db.get_claim( id ).status == claim_status::claimed );
   VAULTDIST_CHECK_THROW( db.transition( id, claim_status::failed ), invalid_transition_exception );
   VAULTDIST_CHECK_THROW( db.transition( claim_id_type( 99 ), claim_status::pending ), not_found_exception );

   // a claimed claim cannot be recovered again
   VAULTDIST_CHECK_THROW( db.recover_settled_claim( id, "again" ), invalid_transition_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( settled_acquirer_claim_distributes_assets )
{ try {
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", alice.get_id() );
   const auto& trx = acquire( vault.get_id(), alice.get_id(), 100000000 );
   const auto& asset = add_asset( trx, "receipt", 1.0 );
   const auto& unlocked = add_asset( trx, "late-receipt", 1.0 );
   db.modify( unlocked, []( vault_asset_object& a ) {
      a.status = asset_status::pending;
   });

   new_claim args;
   args.owner = alice.get_id();
   args.vault = vault.get_id();
   args.type = claim_type::acquirer;
   args.token_amount = 1000;
   args.multiplier = 10;
   args.source_transaction = trx.get_id();
   const claim_id_type id = db.create_claim( args ).get_id();

   db.transition( id, claim_status::pending );
   BOOST_CHECK( updater->calls.empty() );
   db.transition( id, claim_status::claimed );

   // assets that never got locked are distributed too
   BOOST_CHECK( asset.status == asset_status::distributed );
   BOOST_CHECK( unlocked.status == asset_status::distributed );
   BOOST_REQUIRE_EQUAL( updater->calls.size(), 1u );
   BOOST_REQUIRE_EQUAL( updater->calls[0].size(), 2u );
   BOOST_CHECK( updater->calls[0][0] == asset.get_id() );
   BOOST_CHECK( updater->calls[0][1] == unlocked.get_id() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( asset_registry_failure_keeps_claim_settled )
{ try {
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", alice.get_id() );
   const auto& trx = acquire( vault.get_id(), alice.get_id(), 100000000 );
   add_asset( trx, "receipt", 1.0 );

   new_claim args;
   args.owner = alice.get_id();
   args.vault = vault.get_id();
   args.type = claim_type::acquirer;
   args.source_transaction = trx.get_id();
   const claim_id_type id = db.create_claim( args ).get_id();

   updater->fail = true;
   db.recover_settled_claim( id, "backing_already_consumed" );
   BOOST_CHECK( db.get_claim( id ).status == claim_status::claimed );
   BOOST_REQUIRE( db.get_claim( id ).metadata.diagnostics.auto_marked_reason.valid() );
   BOOST_CHECK_EQUAL( *db.get_claim( id ).metadata.diagnostics.auto_marked_reason, "backing_already_consumed" );
   BOOST_CHECK_EQUAL( updater->calls.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( metadata_merge )
{ try {
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", alice.get_id() );
   const auto& trx = contribute( vault.get_id(), alice.get_id(), 50 );
   const claim_id_type id = db.create_claim( contributor_claim( trx, 1000 ) ).get_id();

   claim_metadata_patch patch;
   patch.notes = "checked";
   patch.failed_attempts = 2;
   db.merge_claim_metadata( id, patch );

   claim_metadata_patch second;
   contributor_claim_metadata payload;
   payload.assessed_value = 50;
   second.payload = claim_payload( payload );
   db.merge_claim_metadata( id, second );

   const auto& diagnostics = db.get_claim( id ).metadata.diagnostics;
   BOOST_CHECK_EQUAL( *diagnostics.notes, "checked" );
   BOOST_CHECK_EQUAL( diagnostics.failed_attempts, 2u );
   BOOST_CHECK( !diagnostics.error.valid() );
   BOOST_CHECK_EQUAL( db.get_claim( id ).metadata.payload.get<contributor_claim_metadata>().assessed_value, 50.0 );

   claim_metadata_patch mismatch;
   mismatch.notes = "overwritten";
   mismatch.payload = claim_payload( liquidity_pool_claim_metadata() );
   VAULTDIST_CHECK_THROW( db.merge_claim_metadata( id, mismatch ), validation_exception );
   BOOST_CHECK_EQUAL( *db.get_claim( id ).metadata.diagnostics.notes, "checked" );
   BOOST_CHECK( db.get_claim( id ).status == claim_status::available );

   VAULTDIST_CHECK_THROW( db.merge_claim_metadata( claim_id_type( 77 ), patch ), not_found_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( claims_query )
{ try {
   const auto& alice = create_participant( "alice" );
   const auto& bob = create_participant( "bob" );
   const auto& vault = create_vault( "genesis", alice.get_id() );
   const auto& second_vault = create_vault( "second", alice.get_id() );

   vector<claim_id_type> ids;
   for( int i = 0; i < 5; ++i )
   {
      const auto& trx = contribute( i < 3 ? vault.get_id() : second_vault.get_id(), alice.get_id(), 10 );
      ids.push_back( db.create_claim( contributor_claim( trx, 100 + i ) ).get_id() );
   }
   db.create_claim( contributor_claim( contribute( vault.get_id(), bob.get_id(), 10 ), 1 ) );
   db.transition( ids[1], claim_status::pending );
   db.transition( ids[1], claim_status::claimed );
   db.transition( ids[2], claim_status::failed );

   claim_query query;
   query.limit = 2;
   auto page = db.get_claims( alice.get_id(), query );
   BOOST_CHECK_EQUAL( page.total, 5u );
   BOOST_REQUIRE_EQUAL( page.items.size(), 2u );
   BOOST_CHECK( page.items[0].get_id() == ids[4] );
   BOOST_CHECK( page.items[1].get_id() == ids[3] );

   query.page = 3;
   page = db.get_claims( alice.get_id(), query );
   BOOST_REQUIRE_EQUAL( page.items.size(), 1u );
   BOOST_CHECK( page.items[0].get_id() == ids[0] );

   query.page = 4;
   BOOST_CHECK( db.get_claims( alice.get_id(), query ).items.empty() );

   claim_query unclaimed;
   unclaimed.state = string( "unclaimed" );
   unclaimed.vault = vault.get_id();
   page = db.get_claims( alice.get_id(), unclaimed );
   BOOST_CHECK_EQUAL( page.total, 1u );
   BOOST_CHECK( page.items[0].get_id() == ids[0] );

   claim_query claimed;
   claimed.state = string( "claimed" );
   BOOST_CHECK_EQUAL( db.get_claims( alice.get_id(), claimed ).total, 1u );

   claim_query failed;
   failed.status = claim_status::failed;
   failed.types = { claim_type::contributor, claim_type::acquirer };
   BOOST_CHECK_EQUAL( db.get_claims( alice.get_id(), failed ).total, 1u );
   failed.types = { claim_type::acquirer };
   BOOST_CHECK_EQUAL( db.get_claims( alice.get_id(), failed ).total, 0u );

   claim_query bad;
   bad.limit = 0;
   VAULTDIST_CHECK_THROW( db.get_claims( alice.get_id(), bad ), validation_exception );
   bad.limit = VAULTDIST_MAX_CLAIMS_PAGE_SIZE + 1;
   VAULTDIST_CHECK_THROW( db.get_claims( alice.get_id(), bad ), validation_exception );
   bad.limit = 10;
   bad.page = 0;
   VAULTDIST_CHECK_THROW( db.get_claims( alice.get_id(), bad ), validation_exception );
   bad.page = 1;
   bad.state = string( "settled" );
   VAULTDIST_CHECK_THROW( db.get_claims( alice.get_id(), bad ), validation_exception );
   VAULTDIST_CHECK_THROW( db.get_claims( participant_id_type( 9 ), claim_query() ), not_found_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( distribute_locked_vault )
{ try {
   const auto& owner = create_participant( "curator" );
   const auto& alice = create_participant( "alice" );
   const auto& bob = create_participant( "bob" );
   const auto& vault = create_vault( "genesis", owner.get_id() );
   acquire( vault.get_id(), bob.get_id(), 100000000 );
   contribute( vault.get_id(), alice.get_id(), 50 );
   acquire( vault.get_id(), bob.get_id(), 5000000, transaction_status::failed );

   const auto result = distribute( vault.get_id() );
   BOOST_CHECK_EQUAL( result.created.size(), 3u );
   BOOST_CHECK_EQUAL( result.skipped, 0u );

   const auto& acquirer = only_claim( vault.get_id(), claim_type::acquirer );
   BOOST_CHECK( acquirer.owner == bob.get_id() );
   BOOST_CHECK_EQUAL( acquirer.token_amount.value, 475000000000ll );
   BOOST_CHECK_EQUAL( *acquirer.multiplier, 4750 );
   BOOST_CHECK_EQUAL( acquirer.metadata.payload.get<acquirer_claim_metadata>().raw_multiplier, 4750 );

   const auto& contributor = only_claim( vault.get_id(), claim_type::contributor );
   BOOST_CHECK( contributor.owner == alice.get_id() );
   BOOST_CHECK_EQUAL( contributor.token_amount.value, 475000000000ll );
   BOOST_CHECK_EQUAL( contributor.currency_amount.value, 90000000 );
   BOOST_CHECK( !contributor.metadata.payload.get<contributor_claim_metadata>().no_acquirers );

   const auto& pool = only_claim( vault.get_id(), claim_type::liquidity_pool );
   BOOST_CHECK( pool.owner == owner.get_id() );
   BOOST_CHECK_EQUAL( pool.token_amount.value, 50000000000ll );
   BOOST_CHECK_EQUAL( pool.currency_amount.value, 10000000 );
   BOOST_CHECK_EQUAL( pool.metadata.payload.get<liquidity_pool_claim_metadata>().pair_multiplier, 500 );

   BOOST_CHECK( vault.claims_created );
   BOOST_CHECK_EQUAL( vault.total_acquired, 100.0 );
   BOOST_CHECK_EQUAL( vault.total_contributed, 50.0 );

   // running again creates nothing
   const auto again = distribute( vault.get_id() );
   BOOST_CHECK( again.created.empty() );
   BOOST_CHECK_EQUAL( again.skipped, 3u );
   BOOST_CHECK_EQUAL( db.get_vault_claims( vault.get_id() ).size(), 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( acquired_total_sums_display_amounts_oldest_first )
{ try {
   const auto& owner = create_participant( "curator" );
   const auto& alice = create_participant( "alice" );

   const auto& small = create_vault( "small", owner.get_id() );
   acquire( small.get_id(), alice.get_id(), 100000 );
   acquire( small.get_id(), alice.get_id(), 200000 );
   const vault_totals small_totals = db.compute_vault_totals( small.get_id() );
   BOOST_CHECK_EQUAL( small_totals.total_acquired, 0.1 + 0.2 );
   BOOST_CHECK( small_totals.total_acquired != 0.3 );

   // the first transaction is the newest, it is added last
   const auto& ordered = create_vault( "ordered", owner.get_id() );
   const auto& late = acquire( ordered.get_id(), alice.get_id(), 100000 );
   db.modify( late, [this]( source_transaction_object& t ) {
      t.created = now + 100;
   });
   acquire( ordered.get_id(), alice.get_id(), 300000 );
   acquire( ordered.get_id(), alice.get_id(), 200000 );

   const auto confirmed = db.get_confirmed_transactions( ordered.get_id(), transaction_kind::acquire );
   BOOST_REQUIRE_EQUAL( confirmed.size(), 3u );
   BOOST_CHECK( confirmed.back()->get_id() == late.get_id() );
   BOOST_CHECK_EQUAL( db.compute_vault_totals( ordered.get_id() ).total_acquired, ( 0.3 + 0.2 ) + 0.1 );
   BOOST_CHECK( db.compute_vault_totals( ordered.get_id() ).total_acquired != ( 0.1 + 0.3 ) + 0.2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( distribute_rejects_bad_input )
{ try {
   const auto& owner = create_participant( "curator" );
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", owner.get_id(), 1000000, 6, 50, 10, vault_status::acquire );
   contribute( vault.get_id(), alice.get_id(), 50 );

   VAULTDIST_CHECK_THROW( distribute( vault.get_id() ), validation_exception );
   set_vault_status( vault.get_id(), vault_status::locked );

   vault_totals missing_value = db.compute_vault_totals( vault.get_id() );
   missing_value.participant_values.clear();
   VAULTDIST_CHECK_THROW( db.create_claims_for_vault( vault.get_id(), missing_value ), validation_exception );

   vault_totals negative = db.compute_vault_totals( vault.get_id() );
   negative.total_acquired = -1;
   VAULTDIST_CHECK_THROW( db.create_claims_for_vault( vault.get_id(), negative ), validation_exception );

   VAULTDIST_CHECK_THROW( distribute( vault_id_type( 12 ) ), not_found_exception );
   BOOST_CHECK( db.get_vault_claims( vault.get_id() ).empty() );
   BOOST_CHECK( !vault.claims_created );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( distribution_is_all_or_nothing )
{ try {
   const auto& owner = create_participant( "curator" );
   const auto& bob = create_participant( "bob" );
   const auto& vault = create_vault( "genesis", owner.get_id() );
   acquire( vault.get_id(), bob.get_id(), 100000000 );
   // a contribution whose owner is not a known participant fails after the acquirer claim was created
   const auto& orphan = db.create<source_transaction_object>( [&]( source_transaction_object& t ) {
      t.owner = participant_id_type( 50 );
      t.vault = vault.get_id();
      t.kind = transaction_kind::contribute;
      t.status = transaction_status::confirmed;
   });
   add_asset( orphan, "lost", 50.0 );

   VAULTDIST_CHECK_THROW( distribute( vault.get_id() ), not_found_exception );
   BOOST_CHECK( db.get_vault_claims( vault.get_id() ).empty() );
   BOOST_CHECK( !vault.claims_created );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( recompute_replaces_stale_claims )
{ try {
   const auto& owner = create_participant( "curator" );
   const auto& alice = create_participant( "alice" );
   const auto& carol = create_participant( "carol" );
   const auto& bob = create_participant( "bob" );
   const auto& vault = create_vault( "genesis", owner.get_id() );
   acquire( vault.get_id(), bob.get_id(), 100000000 );
   contribute( vault.get_id(), alice.get_id(), 50 );
   distribute( vault.get_id() );
   const claim_id_type stale = only_claim( vault.get_id(), claim_type::contributor ).get_id();

   // a late confirmation halves alice's share
   contribute( vault.get_id(), carol.get_id(), 50 );
   const auto plain = distribute( vault.get_id() );
   BOOST_CHECK_EQUAL( plain.created.size(), 1u );
   BOOST_CHECK( db.find( stale ) != nullptr );

   const auto result = distribute( vault.get_id(), true );
   BOOST_REQUIRE_EQUAL( result.replaced.size(), 1u );
   BOOST_CHECK( result.replaced[0] == stale );
   BOOST_CHECK_EQUAL( result.created.size(), 1u );
   BOOST_CHECK( db.find( stale ) == nullptr );
   for( const auto* claim : claims_of( vault.get_id(), claim_type::contributor ) )
   {
      BOOST_CHECK_EQUAL( claim->token_amount.value, 237500000000ll );
      BOOST_CHECK_EQUAL( claim->currency_amount.value, 45000000 );
   }

   const claim_id_type settled = claims_of( vault.get_id(), claim_type::contributor ).front()->get_id();
   db.transition( settled, claim_status::pending );
   VAULTDIST_CHECK_THROW( db.remove_obsolete_claim( settled ), invalid_transition_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancellation_claims )
{ try {
   const auto& owner = create_participant( "curator" );
   const auto& alice = create_participant( "alice" );
   const auto& bob = create_participant( "bob" );
   const auto& vault = create_vault( "genesis", owner.get_id() );
   const auto& contribution = contribute( vault.get_id(), alice.get_id(), 25, 1, 2 );
   const auto& acquisition = acquire( vault.get_id(), bob.get_id(), 5000000 );

   VAULTDIST_CHECK_THROW( db.create_cancellation_claims( vault.get_id(), "threshold not met" ), validation_exception );
   set_vault_status( vault.get_id(), vault_status::failed );

   const auto created = db.create_cancellation_claims( vault.get_id(), "threshold not met" );
   BOOST_REQUIRE_EQUAL( created.size(), 2u );

   for( const auto& id : created )
   {
      const claim_object& claim = db.get_claim( id );
      BOOST_CHECK( claim.type == claim_type::cancellation );
      const auto& payload = claim.metadata.payload.get<cancellation_claim_metadata>();
      BOOST_CHECK_EQUAL( payload.failure_reason, "threshold not met" );
      BOOST_CHECK_EQUAL( payload.output_index, 0u );
      if( *claim.source_transaction == contribution.get_id() )
      {
         BOOST_CHECK( payload.transaction == transaction_kind::contribute );
         BOOST_CHECK_EQUAL( payload.assets.size(), 2u );
         BOOST_CHECK_EQUAL( claim.currency_amount.value, 0 );
      }
      else
      {
         BOOST_CHECK( *claim.source_transaction == acquisition.get_id() );
         BOOST_CHECK( payload.transaction == transaction_kind::acquire );
         BOOST_CHECK_EQUAL( claim.currency_amount.value, 5000000 );
      }
   }

   BOOST_CHECK( db.create_cancellation_claims( vault.get_id(), "threshold not met" ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_round_trip )
{ try {
   const auto& owner = create_participant( "curator" );
   const auto& alice = create_participant( "alice" );
   const auto& vault = create_vault( "genesis", owner.get_id() );
   acquire( vault.get_id(), alice.get_id(), 100000000 );
   contribute( vault.get_id(), alice.get_id(), 50 );
   distribute( vault.get_id() );
   const claim_object& pool = only_claim( vault.get_id(), claim_type::liquidity_pool );
   claim_metadata_patch patch;
   patch.notes = "seeded";
   db.merge_claim_metadata( pool.get_id(), patch );

   fc::temp_directory dir;
   const fc::path file = dir.path() / "ledger" / "snapshot.json";
   db.save_snapshot( file );
   BOOST_REQUIRE( fc::exists( file ) );

   database restored;
   restored.load_snapshot( file );
   BOOST_CHECK_EQUAL( restored.get_vault_claims( vault.get_id() ).size(), 3u );
   const claim_object& copy = restored.get_claim( pool.get_id() );
   BOOST_CHECK_EQUAL( copy.token_amount.value, pool.token_amount.value );
   BOOST_CHECK_EQUAL( *copy.metadata.diagnostics.notes, "seeded" );
   BOOST_CHECK_EQUAL( copy.metadata.payload.get<liquidity_pool_claim_metadata>().pair_multiplier, 500 );
   BOOST_CHECK( restored.get_vault( vault.get_id() ).claims_created );

   // new objects continue after the loaded ones
   const auto& late = restored.create<participant_object>( []( participant_object& p ) { p.name = "late"; } );
   BOOST_CHECK_EQUAL( late.id.instance(), 2u );

   VAULTDIST_CHECK_THROW( restored.load_snapshot( file ), validation_exception );
   database empty;
   VAULTDIST_CHECK_THROW( empty.load_snapshot( dir.path() / "missing.json" ), not_found_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
