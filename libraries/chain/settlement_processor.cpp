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

#include <vaultdist/chain/settlement_processor.hpp>
#include <vaultdist/chain/database.hpp>
#include <vaultdist/chain/collaborators.hpp>
#include <vaultdist/chain/settlement_lease.hpp>

#include <vaultdist/chain/participant_object.hpp>
#include <vaultdist/chain/vault_object.hpp>
#include <vaultdist/chain/source_transaction_object.hpp>
#include <vaultdist/chain/claim_object.hpp>

#include <fc/thread/async.hpp>

#include <boost/fiber/future.hpp>
#include <boost/fiber/operations.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

namespace vaultdist { namespace chain {

namespace {
   const char* const backing_consumed_reason = "backing_already_consumed";
   const char* const size_limit_reason = "exceeds settlement size limit";

   /// waits for a builder call, a call still running after the timeout is abandoned
   template<typename Future>
   auto wait_for_call( Future call, uint32_t timeout, const char* what ) -> decltype( call.get() )
   {
      if( call.wait_for( std::chrono::seconds( timeout ) ) != boost::fibers::future_status::ready )
         FC_THROW_EXCEPTION( transport_exception, "${w} did not return within ${t} seconds",
                             ("w",what)("t",timeout) );
      return call.get();
   }
}

void settlement_config::validate()const
{
   VAULTDIST_ASSERT( max_transaction_bytes > 0, validation_exception, "max_transaction_bytes must be positive" );
   VAULTDIST_ASSERT( max_claims_per_batch > 0, validation_exception, "max_claims_per_batch must be positive" );
   VAULTDIST_ASSERT( max_attempts > 0, validation_exception, "max_attempts must be positive" );
   VAULTDIST_ASSERT( base_backoff <= max_backoff, validation_exception, "base_backoff exceeds max_backoff",
                     ("base",base_backoff)("max",max_backoff) );
   VAULTDIST_ASSERT( jitter_ratio >= 0 && jitter_ratio < 1, validation_exception,
                     "jitter_ratio must be in [0,1)", ("jitter",jitter_ratio) );
   VAULTDIST_ASSERT( lease_ttl > 0, validation_exception, "lease_ttl must be positive" );
   VAULTDIST_ASSERT( call_timeout > 0, validation_exception, "call_timeout must be positive" );
   VAULTDIST_ASSERT( !eligible_types.empty(), validation_exception, "No claim type is eligible for settlement" );
}

settlement_processor::settlement_processor( database& db,
                                            std::shared_ptr<transaction_builder> builder,
                                            std::shared_ptr<backing_validator> validator,
                                            std::shared_ptr<settlement_lease> lease,
                                            settlement_config config )
   : _db( db ),
     _builder( std::move( builder ) ),
     _validator( std::move( validator ) ),
     _lease( std::move( lease ) ),
     _config( std::move( config ) )
{
   FC_ASSERT( _builder && _validator && _lease, "settlement_processor needs a builder, a validator and a lease" );
   _config.validate();

   _sleep = []( microseconds delay ) {
      boost::this_fiber::sleep_for( std::chrono::microseconds( delay.count() ) );
   };
   auto engine = std::make_shared<std::mt19937_64>( std::random_device()() );
   _jitter = [engine]() {
      return std::uniform_real_distribution<double>( -1.0, 1.0 )( *engine );
   };
}

settlement_processor::~settlement_processor()
{
}

void settlement_processor::set_sleeper( sleeper_type sleeper )
{
   FC_ASSERT( sleeper, "sleeper must be callable" );
   _sleep = std::move( sleeper );
}

void settlement_processor::set_jitter_source( jitter_source_type source )
{
   FC_ASSERT( source, "jitter source must be callable" );
   _jitter = std::move( source );
}

microseconds settlement_processor::backoff_delay( uint32_t attempt )const
{
   FC_ASSERT( attempt >= 1, "attempts are counted from 1" );
   const double exponential = double( _config.base_backoff ) * std::pow( 2.0, double( attempt - 1 ) );
   const double capped = std::min( double( _config.max_backoff ), exponential );
   const double r = std::max( -1.0, std::min( 1.0, _jitter() ) );
   const double delay = capped * ( 1.0 + _config.jitter_ratio * r );
   return microseconds( static_cast<int64_t>( delay * 1000000.0 ) );
}

settlement_batch_spec settlement_processor::build_batch_spec( vault_id_type vault, const vector<claim_id_type>& claims,
                                                              settlement_batch_id_type batch )const
{ try {
   settlement_batch_spec spec;
   spec.vault = vault;
   spec.batch = batch;

   vector<contributor_claim_input> contributor_claims;
   optional<int64_t> acquirer_multiplier;
   for( const auto& id : claims )
   {
      const claim_object& claim = _db.get_claim( id );
      settlement_output output;
      output.claim = id;
      output.recipient = claim.owner;
      output.address = _db.get_participant( claim.owner ).address;
      output.type = claim.type;
      output.token_amount = claim.token_amount;
      output.currency_amount = claim.currency_amount;
      if( claim.source_transaction.valid() )
      {
         const auto& trx = _db.get_source_transaction( *claim.source_transaction );
         output.backing_reference = trx.ledger_reference;
         output.backing_output_index = trx.output_index;

         if( claim.type == claim_type::contributor )
         {
            contributor_claim_input input;
            input.claim = id;
            input.tokens = claim.token_amount.value;
            input.currency = claim.currency_amount.value;
            for( const auto* asset : _db.get_transaction_assets( trx.get_id() ) )
               input.assets.push_back( { asset->policy_id, asset->asset_name, asset->quantity } );
            contributor_claims.push_back( std::move( input ) );
         }
      }
      if( claim.type == claim_type::acquirer && claim.multiplier.valid() && !acquirer_multiplier.valid() )
         acquirer_multiplier = claim.multiplier;
      spec.outputs.push_back( std::move( output ) );
   }

   const asset_multiplier_result multipliers =
         distribution_calculator::calculate_asset_multipliers( contributor_claims, acquirer_multiplier );
   spec.token_multipliers = multipliers.token_multipliers;
   spec.currency_multipliers = multipliers.currency_multipliers;

   // contributor payouts are whatever the per unit multipliers reproduce
   for( const auto& output : spec.outputs )
   {
      auto tokens = multipliers.recalculated_tokens.find( output.claim );
      auto currency = multipliers.recalculated_currency.find( output.claim );
      spec.total_tokens += tokens != multipliers.recalculated_tokens.end() ? share_type( tokens->second )
                                                                             : output.token_amount;
      spec.total_currency += currency != multipliers.recalculated_currency.end() ? share_type( currency->second )
                                                                                 : output.currency_amount;
   }
   return spec;
} FC_CAPTURE_AND_RETHROW( (vault)(claims)(batch) ) }

vector<claim_id_type> settlement_processor::validate_backing( const vector<claim_id_type>& claims,
                                                              sweep_result& result )
{
   vector<claim_id_type> valid;
   for( const auto& id : claims )
   {
      const claim_object& claim = _db.get_claim( id );
      if( !claim.source_transaction.valid() )
      {
         valid.push_back( id );
         continue;
      }

      backing_status status;
      try {
         status = _validator->check( claim, _db.get_source_transaction( *claim.source_transaction ) );
      } catch( const fc::exception& e ) {
         status.state = backing_state::lookup_error;
         status.detail = e.to_string();
      }

      switch( status.state )
      {
         case backing_state::unspent:
            valid.push_back( id );
            break;
         case backing_state::spent:
            ilog( "Backing of claim ${c} already consumed by ${t}", ("c",id)("t",status.consumed_by) );
            _db.recover_settled_claim( id, backing_consumed_reason );
            result.recovered.push_back( id );
            break;
         default:
         {
            backing_problem problem;
            problem.claim = id;
            problem.state = status.state;
            problem.detail = status.detail.valid() ? *status.detail : string();
            wlog( "Claim ${c} has no usable backing: ${s} ${d}", ("c",id)("s",status.state)("d",problem.detail) );
            result.invalid_backing.push_back( std::move( problem ) );
         }
      }
   }
   return valid;
}

void settlement_processor::fail_claims( const vector<claim_id_type>& claims, const string& error, uint32_t attempts,
                                        time_point_sec now, sweep_result& result )
{
   claim_metadata_patch patch;
   patch.error = error;
   patch.failed_attempts = attempts;
   patch.last_attempt = now;
   patch.processing_failed = true;
   for( const auto& id : claims )
   {
      _db.transition( id, claim_status::failed, patch );
      result.failed.push_back( id );
   }
   elog( "Failed ${n} claims after ${a} attempts: ${e}", ("n",claims.size())("a",attempts)("e",error) );
}

void settlement_processor::execute_batch( vault_id_type vault, const vector<claim_id_type>& claims,
                                          time_point_sec now, bool split_oversized, sweep_result& result )
{
   const time_point_sec created = now;
   const auto& batch = _db.create<settlement_batch_object>( [&]( settlement_batch_object& b ) {
      b.vault = vault;
      b.claims = claims;
      b.created = created;
      b.updated = created;
   });
   const settlement_batch_id_type batch_id = batch.get_id();

   settled_batch outcome;
   outcome.batch = batch_id;
   outcome.vault = vault;
   outcome.claims = claims;

   auto record_attempt = [&]( settlement_batch_status status, const optional<string>& error, uint64_t size ) {
      _db.modify( batch, [&]( settlement_batch_object& b ) {
         b.status = status;
         b.last_error = error;
         if( size > 0 )
            b.transaction_size = size;
         b.updated = now;
      });
      outcome.status = status;
      outcome.error = error;
   };

   const auto spec = std::make_shared<const settlement_batch_spec>( build_batch_spec( vault, claims, batch_id ) );
   const std::shared_ptr<transaction_builder> builder = _builder;
   string last_error;
   for( uint32_t attempt = 1; attempt <= _config.max_attempts; ++attempt )
   {
      _db.modify( batch, []( settlement_batch_object& b ) { ++b.attempts; } );
      outcome.attempts = attempt;
      const time_point deadline = fc::time_point::now() + fc::seconds( _config.call_timeout );

      try {
         const raw_settlement_transaction trx = wait_for_call(
               fc::async( [builder, spec, deadline]() { return builder->build( *spec, deadline ); } ),
               _config.call_timeout, "build" );
         VAULTDIST_ASSERT( trx.size() <= _config.max_transaction_bytes, size_limit_exceeded_exception,
                           "Settlement transaction of ${s} bytes exceeds the limit of ${l}",
                           ("s",trx.size())("l",_config.max_transaction_bytes) );

         auto session = _db.start_undo_session();
         for( const auto& id : claims )
            _db.transition( id, claim_status::pending, claim_metadata_patch(), batch_id );
         const settlement_reference reference = wait_for_call(
               fc::async( [builder, trx, deadline]() { return builder->submit( trx, deadline ); } ),
               _config.call_timeout, "submit" );
         claim_metadata_patch settled;
         settled.last_attempt = now;
         for( const auto& id : claims )
            _db.transition( id, claim_status::claimed, settled );
         _db.modify( batch, [&]( settlement_batch_object& b ) {
            b.settlement_reference = reference;
         });
         record_attempt( settlement_batch_status::confirmed, optional<string>(), trx.size() );
         session.commit();

         outcome.reference = reference;
         ilog( "Settled batch ${b} of vault ${v}: ${n} claims in ${r} after ${a} attempt(s)",
               ("b",batch_id)("v",vault)("n",claims.size())("r",reference)("a",attempt) );
         result.batches.push_back( outcome );
         return;
      }
      catch( const size_limit_exceeded_exception& )
      {
         record_attempt( settlement_batch_status::failed, string( size_limit_reason ), 0 );
         result.batches.push_back( outcome );
         if( !split_oversized )
            throw;
         if( claims.size() == 1 )
         {
            fail_claims( claims, size_limit_reason, attempt, now, result );
            return;
         }
         wlog( "Batch ${b} of ${n} claims is too large, splitting it", ("b",batch_id)("n",claims.size()) );
         const auto middle = claims.begin() + claims.size() / 2;
         execute_batch( vault, vector<claim_id_type>( claims.begin(), middle ), now, split_oversized, result );
         execute_batch( vault, vector<claim_id_type>( middle, claims.end() ), now, split_oversized, result );
         return;
      }
      catch( const transport_exception& e )
      {
         last_error = e.to_string();
         record_attempt( settlement_batch_status::submitted, last_error, 0 );
         if( attempt < _config.max_attempts )
         {
            const microseconds delay = backoff_delay( attempt );
            wlog( "Attempt ${a} of batch ${b} failed, retrying in ${d} ms: ${e}",
                  ("a",attempt)("b",batch_id)("d",delay.count() / 1000)("e",last_error) );
            _sleep( delay );
         }
      }
      catch( const fc::exception& e )
      {
         record_attempt( settlement_batch_status::failed, e.to_string(), 0 );
         result.batches.push_back( outcome );
         throw;
      }
   }

   record_attempt( settlement_batch_status::failed, last_error, 0 );
   result.batches.push_back( outcome );
   fail_claims( claims, last_error, _config.max_attempts, now, result );
}

void settlement_processor::settle_in_batches( vault_id_type vault, const vector<claim_id_type>& claims,
                                              time_point_sec now, sweep_result& result )
{
   for( size_t first = 0; first < claims.size(); first += _config.max_claims_per_batch )
   {
      const size_t last = std::min<size_t>( claims.size(), first + _config.max_claims_per_batch );
      execute_batch( vault, vector<claim_id_type>( claims.begin() + first, claims.begin() + last ), now, true, result );
   }
}

uint32_t settlement_processor::unresolved_acquirer_claims( vault_id_type vault )const
{
   uint32_t count = 0;
   for( const auto* claim : _db.get_vault_claims( vault ) )
   {
      if( claim->type == claim_type::acquirer && claim->status != claim_status::claimed )
         ++count;
   }
   return count;
}

bool settlement_processor::finalize_distribution( vault_id_type vault_id, time_point_sec now )
{
   const vault_object& vault = _db.get_vault( vault_id );
   if( !vault.claims_created || vault.distribution_processed )
      return false;

   uint32_t settled = 0;
   for( const auto* claim : _db.get_vault_claims( vault_id ) )
   {
      if( claim->type != claim_type::acquirer && claim->type != claim_type::contributor )
         continue;
      if( claim->status != claim_status::claimed )
         return false;
      ++settled;
   }
   if( settled == 0 )
      return false;

   _db.modify( vault, [now]( vault_object& v ) {
      v.distribution_processed = true;
      v.distribution_completed = now;
   });
   ilog( "Distribution of vault ${v} processed, ${n} claims settled", ("v",vault_id)("n",settled) );
   return true;
}

void settlement_processor::process_vault( vault_id_type vault, const vector<claim_id_type>& claims,
                                          time_point_sec now, sweep_result& result )
{
   vector<claim_id_type> first_phase;
   vector<claim_id_type> contributor_claims;
   for( const auto& id : claims )
   {
      if( _db.get_claim( id ).type == claim_type::contributor )
         contributor_claims.push_back( id );
      else
         first_phase.push_back( id );
   }

   settle_in_batches( vault, validate_backing( first_phase, result ), now, result );

   if( !contributor_claims.empty() )
   {
      const uint32_t unresolved = unresolved_acquirer_claims( vault );
      if( unresolved > 0 )
      {
         ilog( "Vault ${v} has ${n} unresolved acquirer claims, holding ${c} contributor claims",
               ("v",vault)("n",unresolved)("c",contributor_claims.size()) );
         result.held.insert( result.held.end(), contributor_claims.begin(), contributor_claims.end() );
      }
      else
         settle_in_batches( vault, validate_backing( contributor_claims, result ), now, result );
   }

   if( finalize_distribution( vault, now ) )
      result.completed.push_back( vault );
}

sweep_result settlement_processor::sweep( time_point_sec now )
{ try {
   sweep_result result;
   optional<string> token = _lease->try_acquire( "sweep", now, fc::seconds( _config.lease_ttl ) );
   if( !token.valid() )
   {
      wlog( "Skipping settlement sweep, another settlement is running" );
      return result;
   }
   scoped_settlement_lease guard( *_lease, *token );
   result.lease_acquired = true;

   // the status index is ordered by vault within a status
   flat_map<vault_id_type, vector<claim_id_type>> by_vault_claims;
   const auto& idx = _db.get_index_type<claim_index>().indices().get<by_status>();
   auto range = idx.equal_range( claim_status::available );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      if( _config.eligible_types.find( itr->type ) == _config.eligible_types.end() )
         continue;
      by_vault_claims[itr->vault].push_back( itr->get_id() );
      ++result.selected;
   }

   for( const auto& entry : by_vault_claims )
   {
      try {
         process_vault( entry.first, entry.second, now, result );
      } catch( const fc::exception& e ) {
         elog( "Settlement of vault ${v} stopped: ${e}", ("v",entry.first)("e",e.to_detail_string()) );
         result.errors.push_back( e.to_string() );
      }
   }

   ilog( "Settlement sweep: ${s} selected, ${b} batches, ${r} recovered, ${i} without backing, ${f} failed, ${h} held",
         ("s",result.selected)("b",result.batches.size())("r",result.recovered.size())
         ("i",result.invalid_backing.size())("f",result.failed.size())("h",result.held.size()) );
   return result;
} FC_CAPTURE_AND_RETHROW( (now) ) }

manual_settlement_result settlement_processor::settle( const vector<claim_id_type>& claims, time_point_sec now )
{ try {
   VAULTDIST_ASSERT( !claims.empty(), validation_exception, "No claims to settle" );
   flat_set<claim_id_type> unique_ids( claims.begin(), claims.end() );
   VAULTDIST_ASSERT( unique_ids.size() == claims.size(), validation_exception, "Claim ids must be unique" );

   const vault_id_type vault = _db.get_claim( claims.front() ).vault;
   bool has_contributor_claims = false;
   for( const auto& id : claims )
   {
      const claim_object& claim = _db.get_claim( id );
      VAULTDIST_ASSERT( claim.vault == vault, validation_exception,
                        "Claim ${c} belongs to vault ${v}, a settlement covers one vault", ("c",id)("v",claim.vault) );
      VAULTDIST_ASSERT( _config.eligible_types.find( claim.type ) != _config.eligible_types.end(),
                        validation_exception, "Claims of type ${t} are not settled here", ("t",claim.type) );
      VAULTDIST_ASSERT( claim.status == claim_status::available, invalid_transition_exception,
                        "Claim ${c} is ${s}, only available claims can be settled", ("c",id)("s",claim.status) );
      has_contributor_claims = has_contributor_claims || claim.type == claim_type::contributor;
   }
   if( has_contributor_claims )
   {
      const uint32_t unresolved = unresolved_acquirer_claims( vault );
      VAULTDIST_ASSERT( unresolved == 0, validation_exception,
                        "Vault ${v} has ${n} unresolved acquirer claims, contributor claims have to wait",
                        ("v",vault)("n",unresolved) );
   }

   optional<string> token = _lease->try_acquire( "manual", now, fc::seconds( _config.lease_ttl ) );
   VAULTDIST_ASSERT( token.valid(), lease_unavailable_exception, "Another settlement is running" );
   scoped_settlement_lease guard( *_lease, *token );

   sweep_result result;
   manual_settlement_result outcome;
   const vector<claim_id_type> valid = validate_backing( claims, result );
   outcome.recovered = result.recovered;
   if( valid.empty() && result.invalid_backing.empty() )
   {
      ilog( "Backing of every claim was already consumed, marked ${r} claimed", ("r",outcome.recovered) );
      finalize_distribution( vault, now );
      return outcome;
   }
   VAULTDIST_ASSERT( !valid.empty(), insufficient_backing_exception,
                     "None of the claims has spendable backing", ("problems",result.invalid_backing)("recovered",result.recovered) );

   execute_batch( vault, valid, now, false, result );

   const settled_batch& batch = result.batches.back();
   VAULTDIST_ASSERT( batch.reference.valid(), transport_exception,
                     "Settlement failed after ${a} attempts: ${e}", ("a",batch.attempts)("e",batch.error) );
   outcome.reference = batch.reference;
   outcome.batch = batch.batch;
   outcome.settled = valid;
   finalize_distribution( vault, now );
   return outcome;
} FC_CAPTURE_AND_RETHROW( (claims)(now) ) }

} } // vaultdist::chain
