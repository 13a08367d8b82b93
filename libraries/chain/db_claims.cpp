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
#include <vaultdist/chain/collaborators.hpp>

namespace vaultdist { namespace chain {

namespace {
   bool is_allowed_transition( claim_status from, claim_status to )
   {
      switch( from )
      {
         case claim_status::available:
            return to == claim_status::pending || to == claim_status::failed;
         case claim_status::pending:
            return to == claim_status::claimed || to == claim_status::failed;
         default:
            return false;
      }
   }
}

const claim_object& database::create_claim( const new_claim& args )
{ try {
   VAULTDIST_ASSERT( args.type < claim_type::CLAIM_TYPE_COUNT, validation_exception, "Unknown claim type" );
   VAULTDIST_ASSERT( args.token_amount >= 0, validation_exception, "Token amount must not be negative",
                     ("amount",args.token_amount) );
   VAULTDIST_ASSERT( args.currency_amount >= 0, validation_exception, "Currency amount must not be negative",
                     ("amount",args.currency_amount) );
   VAULTDIST_ASSERT( !args.multiplier.valid() || args.type == claim_type::acquirer, validation_exception,
                     "Only acquirer claims carry a multiplier" );
   VAULTDIST_ASSERT( !args.payload.valid() || payload_type( *args.payload ) == args.type, validation_exception,
                     "Metadata of a ${p} claim does not fit a ${t} claim",
                     ("p",payload_type( *args.payload ))("t",args.type) );

   get_participant( args.owner );
   get_vault( args.vault );
   if( args.source_transaction.valid() )
   {
      const auto& trx = get_source_transaction( *args.source_transaction );
      VAULTDIST_ASSERT( trx.vault == args.vault, validation_exception,
                        "Transaction ${t} belongs to vault ${v}", ("t",trx.id)("v",trx.vault) );
   }

   const claim_object* existing = find_unresolved_claim( args.owner, args.source_transaction, args.type, args.vault );
   VAULTDIST_ASSERT( existing == nullptr, duplicate_claim_exception,
                     "Claim ${c} already covers this ${t} entitlement", ("c",existing->id)("t",args.type) );

   const time_point_sec created = now();
   const auto& claim = create<claim_object>( [&]( claim_object& c ) {
      c.owner = args.owner;
      c.vault = args.vault;
      c.type = args.type;
      c.status = claim_status::available;
      c.token_amount = args.token_amount;
      c.currency_amount = args.currency_amount;
      c.multiplier = args.multiplier;
      c.metadata.payload = args.payload.valid() ? *args.payload : default_payload( args.type );
      c.source_transaction = args.source_transaction;
      c.description = args.description;
      c.created = created;
      c.updated = created;
   });

   dlog( "Created ${t} claim ${c} for ${o}: ${tokens} tokens, ${currency} currency",
         ("t",claim.type)("c",claim.id)("o",claim.owner)("tokens",claim.token_amount)("currency",claim.currency_amount) );
   return claim;
} FC_CAPTURE_AND_RETHROW( (args.owner)(args.vault)(args.type)(args.source_transaction) ) }

const claim_object& database::transition( claim_id_type id, claim_status new_status,
                                          const claim_metadata_patch& patch,
                                          optional<settlement_batch_id_type> settlement )
{ try {
   const claim_object& claim = get_claim( id );
   VAULTDIST_ASSERT( is_allowed_transition( claim.status, new_status ), invalid_transition_exception,
                     "Claim ${c} cannot move from ${from} to ${to}",
                     ("c",id)("from",claim.status)("to",new_status) );

   claim_metadata metadata = claim.metadata;
   merge_metadata( metadata, patch );

   const claim_status old_status = claim.status;
   const time_point_sec updated = now();
   modify( claim, [&]( claim_object& c ) {
      c.status = new_status;
      c.metadata = std::move( metadata );
      if( settlement.valid() )
         c.settlement = settlement;
      c.updated = updated;
   });
   dlog( "Claim ${c}: ${from} -> ${to}", ("c",id)("from",old_status)("to",new_status) );

   if( new_status == claim_status::claimed )
      on_claim_settled( claim );
   return claim;
} FC_CAPTURE_AND_RETHROW( (id)(new_status)(settlement) ) }

const claim_object& database::recover_settled_claim( claim_id_type id, const string& reason )
{ try {
   const claim_object& claim = get_claim( id );
   VAULTDIST_ASSERT( claim.status == claim_status::available || claim.status == claim_status::pending,
                     invalid_transition_exception, "Claim ${c} cannot be recovered from ${s}",
                     ("c",id)("s",claim.status) );

   const time_point_sec updated = now();
   modify( claim, [&]( claim_object& c ) {
      c.status = claim_status::claimed;
      c.metadata.diagnostics.auto_marked_reason = reason;
      c.updated = updated;
   });
   ilog( "Claim ${c} marked claimed: ${r}", ("c",id)("r",reason) );

   on_claim_settled( claim );
   return claim;
} FC_CAPTURE_AND_RETHROW( (id)(reason) ) }

const claim_object& database::merge_claim_metadata( claim_id_type id, const claim_metadata_patch& patch )
{ try {
   const claim_object& claim = get_claim( id );

   // merge into a copy first so a rejected patch never reaches the index
   claim_metadata metadata = claim.metadata;
   merge_metadata( metadata, patch );

   const time_point_sec updated = now();
   modify( claim, [&]( claim_object& c ) {
      c.metadata = std::move( metadata );
      c.updated = updated;
   });
   return claim;
} FC_CAPTURE_AND_RETHROW( (id) ) }

void database::remove_obsolete_claim( claim_id_type id )
{ try {
   const claim_object& claim = get_claim( id );
   VAULTDIST_ASSERT( claim.status == claim_status::available, invalid_transition_exception,
                     "Only available claims can be removed, claim ${c} is ${s}", ("c",id)("s",claim.status) );
   ilog( "Removing obsolete ${t} claim ${c}", ("t",claim.type)("c",id) );
   remove( claim );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void database::on_claim_settled( const claim_object& claim )
{
   if( claim.type != claim_type::acquirer || !claim.source_transaction.valid() )
      return;

   // every asset of the transaction, whatever state it was left in
   vector<vault_asset_id_type> distributed;
   for( const auto* asset : get_transaction_assets( *claim.source_transaction ) )
   {
      if( asset->status != asset_status::distributed )
      {
         modify( *asset, []( vault_asset_object& a ) {
            a.status = asset_status::distributed;
         });
      }
      distributed.push_back( asset->get_id() );
   }

   if( distributed.empty() || !_asset_updater )
      return;

   // registry failures leave the claim claimed
   try {
      _asset_updater->mark_distributed( distributed );
   } catch( const fc::exception& e ) {
      elog( "Failed to mark assets of claim ${c} as distributed: ${e}",
            ("c",claim.id)("e",e.to_detail_string()) );
   }
}

} } // vaultdist::chain
