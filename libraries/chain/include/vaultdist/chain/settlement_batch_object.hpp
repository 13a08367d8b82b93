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
#include <vaultdist/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace vaultdist { namespace chain {

using namespace vaultdist::db;

enum class settlement_batch_status
{
   created   = 0,
   submitted = 1,
   confirmed = 2,
   failed    = 3
};

/**
 *  @brief audit record of one settlement transaction and its attempts
 *  @ingroup object
 */
class settlement_batch_object : public abstract_object<settlement_batch_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = settlement_batch_object_type;

      settlement_batch_id_type get_id()const { return settlement_batch_id_type( id ); }

      vault_id_type           vault;
      vector<claim_id_type>   claims;
      settlement_batch_status status = settlement_batch_status::created;
      uint32_t                attempts = 0;
      optional<string>        last_error;
      optional<string>        settlement_reference;
      uint64_t                transaction_size = 0;   ///< bytes of the last built transaction
      time_point_sec          created;
      time_point_sec          updated;
};

struct by_vault;

typedef multi_index_container<
   settlement_batch_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_vault>,
         composite_key< settlement_batch_object,
            member< settlement_batch_object, vault_id_type, &settlement_batch_object::vault >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> settlement_batch_multi_index_type;

typedef generic_index<settlement_batch_object, settlement_batch_multi_index_type> settlement_batch_index;

} } // vaultdist::chain

MAP_OBJECT_ID_TO_TYPE( vaultdist::chain::settlement_batch_object )

FC_REFLECT_ENUM( vaultdist::chain::settlement_batch_status, (created)(submitted)(confirmed)(failed) )

FC_REFLECT_DERIVED( vaultdist::chain::settlement_batch_object, (vaultdist::db::object),
                    (vault)
                    (claims)
                    (status)
                    (attempts)
                    (last_error)
                    (settlement_reference)
                    (transaction_size)
                    (created)
                    (updated)
                  )
