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
 *  @brief a contribution of assets to, or an acquisition of currency into, a vault
 *  @ingroup object
 */
class source_transaction_object : public abstract_object<source_transaction_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = source_transaction_object_type;

      source_transaction_id_type get_id()const { return source_transaction_id_type( id ); }

      participant_id_type owner;
      vault_id_type       vault;
      transaction_kind    kind = transaction_kind::contribute;
      transaction_status  status = transaction_status::created;
      share_type          currency_amount;     ///< smallest units, acquisitions only
      string              ledger_reference;    ///< transaction hash on the external ledger
      uint32_t            output_index = 0;    ///< output holding the vault's funds
      time_point_sec      created;

      bool   is_confirmed()const { return status == transaction_status::confirmed; }
      double currency_display()const
      {
         return double( currency_amount.value ) / VAULTDIST_CURRENCY_UNIT_SCALE;
      }
};

/**
 *  @brief an asset record attached to a contribution
 *  @ingroup object
 */
class vault_asset_object : public abstract_object<vault_asset_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = vault_asset_object_type;

      vault_asset_id_type get_id()const { return vault_asset_id_type( id ); }

      source_transaction_id_type transaction;
      vault_id_type              vault;
      string                     policy_id;
      string                     asset_name;
      int64_t                    quantity = 1;
      asset_type                 type = asset_type::nft;
      optional<double>           dex_price;     ///< unit price observed on an exchange, display units
      optional<double>           floor_price;   ///< collection floor, used when no exchange price exists
      asset_status               status = asset_status::locked;

      /// exchange price when known and non-zero, else floor price, else nothing
      double assessed_value()const
      {
         if( dex_price.valid() && *dex_price != 0 )
            return *dex_price * double(quantity);
         if( floor_price.valid() && *floor_price != 0 )
            return *floor_price * double(quantity);
         return 0;
      }
};

struct by_vault;
struct by_owner;
struct by_transaction;

typedef multi_index_container<
   source_transaction_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_vault>,
         composite_key< source_transaction_object,
            member< source_transaction_object, vault_id_type, &source_transaction_object::vault >,
            member< source_transaction_object, transaction_kind, &source_transaction_object::kind >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_owner>,
         composite_key< source_transaction_object,
            member< source_transaction_object, participant_id_type, &source_transaction_object::owner >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> source_transaction_multi_index_type;

typedef generic_index<source_transaction_object, source_transaction_multi_index_type> source_transaction_index;

typedef multi_index_container<
   vault_asset_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_transaction>,
         composite_key< vault_asset_object,
            member< vault_asset_object, source_transaction_id_type, &vault_asset_object::transaction >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_vault>,
         composite_key< vault_asset_object,
            member< vault_asset_object, vault_id_type, &vault_asset_object::vault >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> vault_asset_multi_index_type;

typedef generic_index<vault_asset_object, vault_asset_multi_index_type> vault_asset_index;

} } // vaultdist::chain

MAP_OBJECT_ID_TO_TYPE( vaultdist::chain::source_transaction_object )
MAP_OBJECT_ID_TO_TYPE( vaultdist::chain::vault_asset_object )

FC_REFLECT_DERIVED( vaultdist::chain::source_transaction_object, (vaultdist::db::object),
                    (owner)
                    (vault)
                    (kind)
                    (status)
                    (currency_amount)
                    (ledger_reference)
                    (output_index)
                    (created)
                  )

FC_REFLECT_DERIVED( vaultdist::chain::vault_asset_object, (vaultdist::db::object),
                    (transaction)
                    (vault)
                    (policy_id)
                    (asset_name)
                    (quantity)
                    (type)
                    (dex_price)
                    (floor_price)
                    (status)
                  )
