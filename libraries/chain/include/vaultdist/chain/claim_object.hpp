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
#include <vaultdist/protocol/claim_metadata.hpp>
#include <vaultdist/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace vaultdist { namespace chain {

using namespace vaultdist::db;

/**
 *  @brief a typed entitlement of one participant against one vault
 *  @ingroup object
 *
 *  Amounts are integers in smallest units and are fixed at creation time. The settlement processor
 *  moves the status forward and records the batch that paid the claim; reconciliation only
 *  touches the diagnostics part of the metadata.
 */
class claim_object : public abstract_object<claim_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = claim_object_type;

      claim_id_type get_id()const { return claim_id_type( id ); }

      participant_id_type                  owner;
      vault_id_type                        vault;
      claim_type                           type = claim_type::contributor;
      claim_status                         status = claim_status::available;
      share_type                           token_amount;      ///< vault token smallest units
      share_type                           currency_amount;   ///< currency smallest units
      optional<int64_t>                    multiplier;        ///< acquirer claims only
      claim_metadata                       metadata;
      optional<source_transaction_id_type> source_transaction;
      optional<settlement_batch_id_type>   settlement;        ///< set once a batch paid this claim
      string                               description;
      time_point_sec                       created;
      time_point_sec                       updated;

      /// key used by the duplicate guard, null for claims without a backing transaction
      object_id_type source_key()const
      {
         return source_transaction.valid() ? object_id_type( *source_transaction ) : object_id_type();
      }

      bool is_unresolved()const { return status != claim_status::failed; }
};

/// one page of database::get_claims
struct claim_page
{
   vector<claim_object> items;
   uint64_t             total = 0;   ///< matches across all pages
   uint32_t             page = 1;
   uint32_t             limit = VAULTDIST_DEFAULT_CLAIMS_PAGE_SIZE;
};

struct by_owner;
struct by_vault;
struct by_status;
struct by_source;

typedef multi_index_container<
   claim_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_owner>,
         composite_key< claim_object,
            member< claim_object, participant_id_type, &claim_object::owner >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_vault>,
         composite_key< claim_object,
            member< claim_object, vault_id_type, &claim_object::vault >,
            member< claim_object, claim_type, &claim_object::type >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_status>,
         composite_key< claim_object,
            member< claim_object, claim_status, &claim_object::status >,
            member< claim_object, vault_id_type, &claim_object::vault >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_source>,
         composite_key< claim_object,
            const_mem_fun< claim_object, object_id_type, &claim_object::source_key >,
            member< claim_object, claim_type, &claim_object::type >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> claim_multi_index_type;

typedef generic_index<claim_object, claim_multi_index_type> claim_index;

} } // vaultdist::chain

MAP_OBJECT_ID_TO_TYPE( vaultdist::chain::claim_object )

FC_REFLECT_DERIVED( vaultdist::chain::claim_object, (vaultdist::db::object),
                    (owner)
                    (vault)
                    (type)
                    (status)
                    (token_amount)
                    (currency_amount)
                    (multiplier)
                    (metadata)
                    (source_transaction)
                    (settlement)
                    (description)
                    (created)
                    (updated)
                  )
FC_REFLECT( vaultdist::chain::claim_page, (items)(total)(page)(limit) )
