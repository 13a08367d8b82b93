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
#include <vaultdist/chain/settlement_batch_object.hpp>

#include <fc/io/json.hpp>

namespace vaultdist { namespace chain { namespace detail {

   struct ledger_snapshot
   {
      vector<participant_object>        participants;
      vector<vault_object>              vaults;
      vector<source_transaction_object> transactions;
      vector<vault_asset_object>        assets;
      vector<claim_object>              claims;
      vector<settlement_batch_object>   settlement_batches;
   };

   template<typename IndexType, typename ObjectType>
   void copy_index( const database& db, vector<ObjectType>& out )
   {
      for( const auto& obj : db.get_index_type<IndexType>().indices() )
         out.push_back( obj );
   }

} } } // vaultdist::chain::detail

FC_REFLECT( vaultdist::chain::detail::ledger_snapshot,
            (participants)(vaults)(transactions)(assets)(claims)(settlement_batches) )

namespace vaultdist { namespace chain {

void database::save_snapshot( const fc::path& file )const
{ try {
   detail::ledger_snapshot snapshot;
   detail::copy_index<participant_index>( *this, snapshot.participants );
   detail::copy_index<vault_index>( *this, snapshot.vaults );
   detail::copy_index<source_transaction_index>( *this, snapshot.transactions );
   detail::copy_index<vault_asset_index>( *this, snapshot.assets );
   detail::copy_index<claim_index>( *this, snapshot.claims );
   detail::copy_index<settlement_batch_index>( *this, snapshot.settlement_batches );

   if( file.has_parent_path() && !fc::exists( file.parent_path() ) )
      fc::create_directories( file.parent_path() );
   fc::json::save_to_file( snapshot, file );
   ilog( "Saved ${n} claims to ${f}", ("n",snapshot.claims.size())("f",file) );
} FC_CAPTURE_AND_RETHROW( (file) ) }

void database::load_snapshot( const fc::path& file )
{ try {
   VAULTDIST_ASSERT( fc::exists( file ), not_found_exception, "Snapshot ${f} does not exist", ("f",file) );
   bool empty = true;
   inspect_all_objects( [&empty]( const object& ) { empty = false; } );
   VAULTDIST_ASSERT( empty, validation_exception, "A snapshot can only be loaded into an empty database" );

   auto snapshot = fc::json::from_file( file ).as<detail::ledger_snapshot>( VAULTDIST_MAX_NESTED_OBJECTS );

   auto load = [this]( auto& objects ) {
      for( auto& obj : objects )
         insert( std::move( obj ) );
   };
   load( snapshot.participants );
   load( snapshot.vaults );
   load( snapshot.transactions );
   load( snapshot.assets );
   load( snapshot.claims );
   load( snapshot.settlement_batches );

   ilog( "Loaded ${v} vaults and ${n} claims from ${f}",
         ("v",snapshot.vaults.size())("n",snapshot.claims.size())("f",file) );
} FC_CAPTURE_AND_RETHROW( (file) ) }

} } // vaultdist::chain
