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

#include <cmath>

namespace vaultdist { namespace chain {

using namespace vaultdist::db;

/**
 *  @brief a pool of contributed assets and acquired currency that is fractionalized into vault tokens
 *  @ingroup object
 *
 *  The vault is owned by the phase scheduler; the ledger reads its parameters and records the totals
 *  it used when claims were materialized.
 */
class vault_object : public abstract_object<vault_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = vault_object_type;

      vault_id_type get_id()const { return vault_id_type( id ); }

      string              name;
      participant_id_type owner;           ///< receives the liquidity pool claim
      vault_status        status = vault_status::draft;
      int64_t             token_supply = 0;      ///< whole vault tokens
      uint8_t             token_decimals = 0;
      double              acquirer_percent = 0;  ///< share of the supply offered to acquirers, 0 to 100
      double              lp_percent = 0;        ///< share of the valuation reserved for the pool, 0 to 100
      double              total_acquired = 0;    ///< currency received from acquisitions, display units
      double              total_contributed = 0; ///< assessed value of contributions, display units
      bool                claims_created = false;
      bool                distribution_processed = false;   ///< every acquirer and contributor claim settled
      optional<time_point_sec> distribution_completed;
      time_point_sec      created;

      /// supply in smallest token units
      double scaled_supply()const { return double(token_supply) * std::pow( 10.0, token_decimals ); }
      double acquirer_share()const { return acquirer_percent * 0.01; }
      double lp_share()const { return lp_percent * 0.01; }
};

struct by_status;

typedef multi_index_container<
   vault_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_status>,
         composite_key< vault_object,
            member< vault_object, vault_status, &vault_object::status >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> vault_multi_index_type;

typedef generic_index<vault_object, vault_multi_index_type> vault_index;

} } // vaultdist::chain

MAP_OBJECT_ID_TO_TYPE( vaultdist::chain::vault_object )

FC_REFLECT_DERIVED( vaultdist::chain::vault_object, (vaultdist::db::object),
                    (name)
                    (owner)
                    (status)
                    (token_supply)
                    (token_decimals)
                    (acquirer_percent)
                    (lp_percent)
                    (total_acquired)
                    (total_contributed)
                    (claims_created)
                    (distribution_processed)
                    (distribution_completed)
                    (created)
                  )
