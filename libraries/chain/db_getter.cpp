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

#include <algorithm>

namespace vaultdist { namespace chain {

const participant_object& database::get_participant( participant_id_type id )const
{
   const auto* result = find( id );
   VAULTDIST_ASSERT( result != nullptr, not_found_exception, "Participant ${id} not found", ("id",id) );
   return *result;
}

const vault_object& database::get_vault( vault_id_type id )const
{
   const auto* result = find( id );
   VAULTDIST_ASSERT( result != nullptr, not_found_exception, "Vault ${id} not found", ("id",id) );
   return *result;
}

const source_transaction_object& database::get_source_transaction( source_transaction_id_type id )const
{
   const auto* result = find( id );
   VAULTDIST_ASSERT( result != nullptr, not_found_exception, "Transaction ${id} not found", ("id",id) );
   return *result;
}

const claim_object& database::get_claim( claim_id_type id )const
{
   const auto* result = find( id );
   VAULTDIST_ASSERT( result != nullptr, not_found_exception, "Claim ${id} not found", ("id",id) );
   return *result;
}

vector<const source_transaction_object*> database::get_confirmed_transactions( vault_id_type vault,
                                                                               transaction_kind kind )const
{
   vector<const source_transaction_object*> result;
   const auto& idx = get_index_type<source_transaction_index>().indices().get<by_vault>();
   auto range = idx.equal_range( boost::make_tuple( vault, kind ) );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      if( itr->is_confirmed() )
         result.push_back( &*itr );
   }
   std::stable_sort( result.begin(), result.end(),
         []( const source_transaction_object* x, const source_transaction_object* y ) {
            return x->created < y->created;
         } );
   return result;
}

vector<const vault_asset_object*> database::get_transaction_assets( source_transaction_id_type trx )const
{
   vector<const vault_asset_object*> result;
   const auto& idx = get_index_type<vault_asset_index>().indices().get<by_transaction>();
   auto range = idx.equal_range( trx );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( &*itr );
   return result;
}

vector<const claim_object*> database::get_vault_claims( vault_id_type vault )const
{
   vector<const claim_object*> result;
   const auto& idx = get_index_type<claim_index>().indices().get<by_vault>();
   auto range = idx.equal_range( vault );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( &*itr );
   return result;
}

double database::transaction_value( const source_transaction_object& trx )const
{
   double value = 0;
   for( const auto* asset : get_transaction_assets( trx.get_id() ) )
      value += asset->assessed_value();
   return value;
}

const claim_object* database::find_unresolved_claim( participant_id_type owner,
                                                     const optional<source_transaction_id_type>& source,
                                                     claim_type type,
                                                     vault_id_type vault )const
{
   const auto& claims = get_index_type<claim_index>().indices();

   if( !source.valid() )
   {
      // only the pool claim is unique per vault when there is no backing transaction
      if( type != claim_type::liquidity_pool )
         return nullptr;
      auto range = claims.get<by_vault>().equal_range( boost::make_tuple( vault, type ) );
      for( auto itr = range.first; itr != range.second; ++itr )
      {
         if( itr->is_unresolved() )
            return &*itr;
      }
      return nullptr;
   }

   auto range = claims.get<by_source>().equal_range( boost::make_tuple( object_id_type( *source ), type ) );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      if( itr->owner == owner && itr->is_unresolved() )
         return &*itr;
   }
   return nullptr;
}

claim_page database::get_claims( participant_id_type participant, const claim_query& query )const
{ try {
   VAULTDIST_ASSERT( query.page >= 1, validation_exception, "Page must be at least 1", ("page",query.page) );
   VAULTDIST_ASSERT( query.limit >= 1 && query.limit <= VAULTDIST_MAX_CLAIMS_PAGE_SIZE, validation_exception,
                     "Limit must be between 1 and ${max}", ("limit",query.limit)("max",VAULTDIST_MAX_CLAIMS_PAGE_SIZE) );
   VAULTDIST_ASSERT( !query.state.valid() || *query.state == "claimed" || *query.state == "unclaimed",
                     validation_exception, "Unknown claim state ${s}", ("s",query.state) );
   get_participant( participant );

   auto matches = [&query]( const claim_object& c ) {
      if( query.status.valid() && c.status != *query.status )
         return false;
      if( !query.types.empty() && std::find( query.types.begin(), query.types.end(), c.type ) == query.types.end() )
         return false;
      if( query.vault.valid() && c.vault != *query.vault )
         return false;
      if( query.state.valid() )
      {
         if( *query.state == "claimed" )
            return c.status == claim_status::claimed;
         return c.status == claim_status::available || c.status == claim_status::pending;
      }
      return true;
   };

   claim_page result;
   result.page = query.page;
   result.limit = query.limit;

   const uint64_t first = uint64_t( query.page - 1 ) * query.limit;
   const auto& idx = get_index_type<claim_index>().indices().get<by_owner>();
   auto range = idx.equal_range( participant );
   // ids grow with creation time, walking backwards yields the newest claims first
   for( auto itr = std::make_reverse_iterator( range.second ); itr != std::make_reverse_iterator( range.first ); ++itr )
   {
      if( !matches( *itr ) )
         continue;
      if( result.total >= first && result.items.size() < query.limit )
         result.items.push_back( *itr );
      ++result.total;
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (participant)(query) ) }

} } // vaultdist::chain
