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
#include <vaultdist/chain/settlement_types.hpp>
#include <vaultdist/chain/settlement_batch_object.hpp>

#include <functional>
#include <memory>

namespace vaultdist { namespace chain {

   class database;
   class claim_object;
   class transaction_builder;
   class backing_validator;
   class settlement_lease;

   struct settlement_config
   {
      uint64_t             max_transaction_bytes = VAULTDIST_DEFAULT_MAX_TRANSACTION_BYTES;
      uint32_t             max_claims_per_batch  = VAULTDIST_DEFAULT_MAX_CLAIMS_PER_BATCH;
      uint32_t             max_attempts          = VAULTDIST_DEFAULT_MAX_SETTLE_ATTEMPTS;
      uint32_t             base_backoff          = VAULTDIST_DEFAULT_BASE_BACKOFF_SECONDS;   ///< seconds
      uint32_t             max_backoff           = VAULTDIST_DEFAULT_MAX_BACKOFF_SECONDS;    ///< seconds
      double               jitter_ratio          = VAULTDIST_DEFAULT_BACKOFF_JITTER;
      uint32_t             lease_ttl             = VAULTDIST_DEFAULT_LEASE_TTL_SECONDS;      ///< seconds
      uint32_t             call_timeout          = VAULTDIST_DEFAULT_CALL_TIMEOUT_SECONDS;   ///< seconds
      flat_set<claim_type> eligible_types{ claim_type::acquirer, claim_type::contributor, claim_type::cancellation };

      /// @throws validation_exception on a limit of zero or a jitter outside [0,1)
      void validate()const;
   };

   /// a claim whose backing funds could not be confirmed, left untouched
   struct backing_problem
   {
      claim_id_type claim;
      backing_state state = backing_state::lookup_error;
      string        detail;
   };

   struct settled_batch
   {
      settlement_batch_id_type       batch;
      vault_id_type                  vault;
      vector<claim_id_type>          claims;
      settlement_batch_status        status = settlement_batch_status::created;
      uint32_t                       attempts = 0;
      optional<settlement_reference> reference;
      optional<string>               error;
   };

   struct sweep_result
   {
      bool                    lease_acquired = false;
      uint32_t                selected = 0;
      vector<claim_id_type>   recovered;        ///< backing already consumed, marked claimed
      vector<backing_problem> invalid_backing;
      vector<settled_batch>   batches;
      vector<claim_id_type>   failed;
      vector<claim_id_type>   held;             ///< contributor claims waiting for the acquirer payouts
      vector<vault_id_type>   completed;        ///< vaults whose distribution finished in this sweep
      vector<string>          errors;           ///< vaults that could not be processed
   };

   struct manual_settlement_result
   {
      optional<settlement_reference>     reference;   ///< unset when every claim had been settled already
      optional<settlement_batch_id_type> batch;
      vector<claim_id_type>              settled;
      vector<claim_id_type>              recovered;   ///< backing already consumed, marked claimed
   };

   /**
    *  @brief pays out available claims in vault scoped batches
    *
    *  One batch is one settlement transaction: its claims move to claimed together when the submission
    *  succeeds and stay available when it does not. Transport errors are retried with exponential backoff
    *  and jitter; once the attempt ceiling is reached every claim of the batch is failed with the error in
    *  its metadata. Batches whose transaction exceeds the byte limit are halved instead. Building and
    *  submitting a transaction are bounded by call_timeout, a call that does not return in time counts
    *  as a transport error.
    *
    *  Contributor currency comes out of the extracted acquirer funds, so contributor claims of a vault are
    *  held back while any of its acquirer claims is not claimed. Once every acquirer and contributor claim
    *  of a vault is claimed its distribution is marked processed.
    *
    *  Only one sweep or manual settlement runs at a time, guarded by a settlement_lease.
    */
   class settlement_processor
   {
      public:
         typedef std::function<void( microseconds )> sleeper_type;
         /// returns a uniformly distributed value in [-1,1]
         typedef std::function<double()>             jitter_source_type;

         settlement_processor( database& db,
                               std::shared_ptr<transaction_builder> builder,
                               std::shared_ptr<backing_validator> validator,
                               std::shared_ptr<settlement_lease> lease,
                               settlement_config config = settlement_config() );
         ~settlement_processor();

         void set_sleeper( sleeper_type sleeper );
         void set_jitter_source( jitter_source_type source );

         const settlement_config& config()const { return _config; }

         /// settles every eligible available claim, does nothing when the lease is held elsewhere
         sweep_result sweep( time_point_sec now );

         /**
          * Settles the given claims as a single batch. Claims whose backing was already consumed are
          * marked claimed and reported in manual_settlement_result::recovered.
          * @throws validation_exception for contributor claims while acquirer claims of the vault are open
          * @throws lease_unavailable_exception while a sweep is running
          * @throws insufficient_backing_exception when no claim has usable backing
          * @throws size_limit_exceeded_exception when the batch does not fit into one transaction
          * @throws transport_exception when every attempt failed, the claims are failed by then
          */
         manual_settlement_result settle( const vector<claim_id_type>& claims, time_point_sec now );

         /// delay before retrying after the given failed attempt, starting at 1
         microseconds backoff_delay( uint32_t attempt )const;

         settlement_batch_spec build_batch_spec( vault_id_type vault, const vector<claim_id_type>& claims,
                                                 settlement_batch_id_type batch )const;

      private:
         vector<claim_id_type> validate_backing( const vector<claim_id_type>& claims, sweep_result& result );

         void process_vault( vault_id_type vault, const vector<claim_id_type>& claims, time_point_sec now,
                             sweep_result& result );
         void settle_in_batches( vault_id_type vault, const vector<claim_id_type>& claims, time_point_sec now,
                                 sweep_result& result );

         /// acquirer claims of the vault that are not claimed yet
         uint32_t unresolved_acquirer_claims( vault_id_type vault )const;
         bool     finalize_distribution( vault_id_type vault, time_point_sec now );

         /// @param split_oversized halve batches over the byte limit instead of throwing
         void execute_batch( vault_id_type vault, const vector<claim_id_type>& claims, time_point_sec now,
                             bool split_oversized, sweep_result& result );

         void fail_claims( const vector<claim_id_type>& claims, const string& error, uint32_t attempts,
                           time_point_sec now, sweep_result& result );

         database&                            _db;
         std::shared_ptr<transaction_builder> _builder;
         std::shared_ptr<backing_validator>   _validator;
         std::shared_ptr<settlement_lease>    _lease;
         settlement_config                    _config;
         sleeper_type                         _sleep;
         jitter_source_type                   _jitter;
   };

} } // vaultdist::chain

FC_REFLECT( vaultdist::chain::settlement_config,
            (max_transaction_bytes)(max_claims_per_batch)(max_attempts)(base_backoff)(max_backoff)
            (jitter_ratio)(lease_ttl)(call_timeout)(eligible_types) )
FC_REFLECT( vaultdist::chain::backing_problem, (claim)(state)(detail) )
FC_REFLECT( vaultdist::chain::settled_batch, (batch)(vault)(claims)(status)(attempts)(reference)(error) )
FC_REFLECT( vaultdist::chain::sweep_result,
            (lease_acquired)(selected)(recovered)(invalid_backing)(batches)(failed)(held)(completed)(errors) )
FC_REFLECT( vaultdist::chain::manual_settlement_result, (reference)(batch)(settled)(recovered) )
