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

/**
 *  @brief someone who contributes to, acquires from or receives payouts of a vault
 *  @ingroup object
 */
class participant_object : public abstract_object<participant_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = participant_object_type;

      participant_id_type get_id()const { return participant_id_type( id ); }

      string name;
      string address;   ///< settlement outputs are paid to this address on the external ledger
};

struct by_address;

typedef multi_index_container<
   participant_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_address>,
         composite_key< participant_object,
            member< participant_object, string, &participant_object::address >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> participant_multi_index_type;

typedef generic_index<participant_object, participant_multi_index_type> participant_index;

} } // vaultdist::chain

MAP_OBJECT_ID_TO_TYPE( vaultdist::chain::participant_object )

FC_REFLECT_DERIVED( vaultdist::chain::participant_object, (vaultdist::db::object), (name)(address) )
