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

#include <vaultdist/db/object_database.hpp>

#include <vaultdist/chain/types.hpp>
#include <vaultdist/chain/distribution_calculator.hpp>
#include <vaultdist/protocol/claim_metadata.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>

#include <functional>
#include <memory>

namespace vaultdist { namespace chain {
   using vaultdist::db::abstract_object;
   using vaultdist::db::object;

   class participant_object;
   class vault_object;
   class source_transaction_object;
   class vault_asset_object;
   class claim_object;
   class settlement_batch_object;
   class asset_status_updater;

   /// arguments of database::create_claim
   struct new_claim
   {
      participant_id_type                  owner;
      vault_id_type                        vault;
      claim_type                           type = claim_type::contributor;
      share_type                           token_amount;
      share_type                           currency_amount;
      optional<int64_t>                    multiplier;
      optional<source_transaction_id_type> source_transaction;
      optional<claim_payload>              payload;        ///< defaults to an empty payload of @ref type
      string                               description;
   };

   /// aggregate amounts a vault closed with, as handed over by the phase scheduler
   struct vault_totals
   {
      double                                total_acquired = 0;     ///< A, display units
      double                                total_contributed = 0;  ///< C, display units
      flat_map<participant_id_type, double> participant_values;     ///< assessed value per contributor
   };

   struct claim_creation_result
   {
      distribution_result   distribution;
      vector<claim_id_type> created;
      vector<claim_id_type> replaced;     ///< obsolete claims removed by a recompute
      uint32_t              skipped = 0;  ///< entitlements that already had a claim
   };

   /// filters of database::get_claims, unset fields match everything
   struct claim_query
   {
      optional<claim_status>  status;
      vector<claim_type>      types;
      optional<vault_id_type> vault;
      optional<string>        state;      ///< "claimed" or "unclaimed"
      uint32_t                page = 1;
      uint32_t                limit = VAULTDIST_DEFAULT_CLAIMS_PAGE_SIZE;
   };

   struct claim_page;

   /**
    *   @class database
    *   @brief the claims ledger of every vault and the state it is derived from
    *
    *   Claims are created from vault totals through the distribution calculator and are afterwards only
    *   moved along their status edges. Every mutating call either completes or leaves the database as it
    *   found it: bulk operations run inside an undo session.
    */
   class database : public db::object_database
   {
         //////////////////// db_init.cpp ////////////////////
      public:
         database();
         ~database() override;

         void initialize_indexes();

         /// all timestamps written by the ledger come from this clock
         void           set_clock( std::function<time_point_sec()> clock );
         time_point_sec now()const;

         /// notified whenever an acquirer claim reaches claimed
         void set_asset_status_updater( std::shared_ptr<asset_status_updater> updater );

         //////////////////// db_getter.cpp ////////////////////

         /// @throws not_found_exception when the object does not exist
         /// @{
         const participant_object&        get_participant( participant_id_type id )const;
         const vault_object&              get_vault( vault_id_type id )const;
         const source_transaction_object& get_source_transaction( source_transaction_id_type id )const;
         const claim_object&              get_claim( claim_id_type id )const;
         /// @}

         /// confirmed transactions of one kind, oldest first
         vector<const source_transaction_object*> get_confirmed_transactions( vault_id_type vault,
                                                                              transaction_kind kind )const;
         vector<const vault_asset_object*>        get_transaction_assets( source_transaction_id_type trx )const;
         vector<const claim_object*>              get_vault_claims( vault_id_type vault )const;

         /// sum of the assessed values of the assets a transaction carried
         double transaction_value( const source_transaction_object& trx )const;

         /// unresolved claim of @p type blocking a new claim for the same owner and source transaction
         const claim_object* find_unresolved_claim( participant_id_type owner,
                                                    const optional<source_transaction_id_type>& source,
                                                    claim_type type,
                                                    vault_id_type vault )const;

         /// claims of one participant, newest first
         claim_page get_claims( participant_id_type participant, const claim_query& query )const;

         //////////////////// db_claims.cpp ////////////////////

         /**
          * Persists one claim.
          * @throws validation_exception for negative amounts or a payload of another type
          * @throws duplicate_claim_exception if an unresolved claim already covers the same entitlement
          */
         const claim_object& create_claim( const new_claim& args );

         /**
          * Moves a claim along one of the edges available to pending, available to failed,
          * pending to claimed and pending to failed.
          */
         const claim_object& transition( claim_id_type id, claim_status new_status,
                                         const claim_metadata_patch& patch = claim_metadata_patch(),
                                         optional<settlement_batch_id_type> settlement = optional<settlement_batch_id_type>() );

         /// marks an available claim as claimed because its backing funds were already paid out elsewhere
         const claim_object& recover_settled_claim( claim_id_type id, const string& reason );

         const claim_object& merge_claim_metadata( claim_id_type id, const claim_metadata_patch& patch );

         /// deletes a claim that is still available, used when a recomputation made it obsolete
         void remove_obsolete_claim( claim_id_type id );

         //////////////////// db_distribution.cpp ////////////////////

         /// totals of a vault derived from its confirmed source transactions
         vault_totals compute_vault_totals( vault_id_type vault )const;

         distribution_parameters distribution_parameters_for( const vault_object& vault,
                                                              const vault_totals& totals )const;

         distribution_result calculate_distribution( vault_id_type vault, const vault_totals& totals )const;

         /**
          * Creates the acquirer, contributor and liquidity pool claims of a locked vault. Entitlements that
          * already have a claim are skipped; with @p recompute, available claims whose amounts no longer
          * match are replaced.
          */
         claim_creation_result create_claims_for_vault( vault_id_type vault, const vault_totals& totals,
                                                        bool recompute = false );

         /// refunds every confirmed transaction of a failed vault
         vector<claim_id_type> create_cancellation_claims( vault_id_type vault, const string& reason );

         //////////////////// db_snapshot.cpp ////////////////////

         void save_snapshot( const fc::path& file )const;
         void load_snapshot( const fc::path& file );

      private:
         void on_claim_settled( const claim_object& claim );

         std::function<time_point_sec()>       _clock;
         std::shared_ptr<asset_status_updater> _asset_updater;
   };

} } // vaultdist::chain

FC_REFLECT( vaultdist::chain::vault_totals, (total_acquired)(total_contributed)(participant_values) )
FC_REFLECT( vaultdist::chain::claim_creation_result, (distribution)(created)(replaced)(skipped) )
FC_REFLECT( vaultdist::chain::claim_query, (status)(types)(vault)(state)(page)(limit) )
