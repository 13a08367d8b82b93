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

#include <memory>
#include <vector>
#include <map>
#include <set>
#include <string>
#include <cstdint>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/cat.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/container/flat.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/io/raw.hpp>

#include <vaultdist/db/object_id.hpp>
#include <vaultdist/protocol/config.hpp>

#define VAULTDIST_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define VAULTDIST_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define VAULTDIST_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            VAULTDIST_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define VAULTDIST_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(vaultdist::id_namespace::name)

#define VAULTDIST_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace vaultdist { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(VAULTDIST_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(VAULTDIST_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(vaultdist::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(VAULTDIST_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(VAULTDIST_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(VAULTDIST_NAME_TO_ID_TYPE, , names_seq))

namespace vaultdist { namespace protocol {
using namespace vaultdist::db;

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;

using fc::variant_object;
using fc::variant;
using fc::optional;
using fc::time_point_sec;
using fc::time_point;
using fc::microseconds;
using fc::safe;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

/// Integer amount in smallest units, overflow checked
typedef safe<int64_t> share_type;

enum object_space
{
   null_ids = 0,
   protocol_ids = 1
};

/// Which side of a vault a source transaction funded
enum class transaction_kind
{
   contribute = 0,
   acquire    = 1
};

enum class transaction_status
{
   created   = 0,
   pending   = 1,
   submitted = 2,
   confirmed = 3,
   failed    = 4,
   stuck     = 5
};

enum class vault_status
{
   draft        = 0,
   published    = 1,
   contribution = 2,
   acquire      = 3,
   locked       = 4,
   governance   = 5,
   failed       = 6,
   terminated   = 7
};

enum class asset_type
{
   nft      = 0,
   fungible = 1
};

enum class asset_status
{
   pending     = 0,
   locked      = 1,
   distributed = 2,
   returned    = 3
};

/**
 * The order of these values matches the order of the payload types in claim_payload,
 * so claim_payload::which() of a well formed claim equals its type.
 */
enum class claim_type
{
   contributor      = 0,
   acquirer         = 1,
   liquidity_pool   = 2,
   cancellation     = 3,
   termination      = 4,
   secondary_reward = 5,
   CLAIM_TYPE_COUNT = 6
};

enum class claim_status
{
   available = 0,
   pending   = 1,
   claimed   = 2,
   failed    = 3
};

} }  // vaultdist::protocol

FC_REFLECT_ENUM( vaultdist::protocol::transaction_kind, (contribute)(acquire) )
FC_REFLECT_ENUM( vaultdist::protocol::transaction_status,
                 (created)(pending)(submitted)(confirmed)(failed)(stuck) )
FC_REFLECT_ENUM( vaultdist::protocol::vault_status,
                 (draft)(published)(contribution)(acquire)(locked)(governance)(failed)(terminated) )
FC_REFLECT_ENUM( vaultdist::protocol::asset_type, (nft)(fungible) )
FC_REFLECT_ENUM( vaultdist::protocol::asset_status, (pending)(locked)(distributed)(returned) )
FC_REFLECT_ENUM( vaultdist::protocol::claim_type,
                 (contributor)(acquirer)(liquidity_pool)(cancellation)(termination)(secondary_reward)
                 (CLAIM_TYPE_COUNT) )
FC_REFLECT_ENUM( vaultdist::protocol::claim_status, (available)(pending)(claimed)(failed) )

VAULTDIST_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                     /* 1.0.x */ (participant)
                     /* 1.1.x */ (vault)
                     /* 1.2.x */ (source_transaction)
                     /* 1.3.x */ (vault_asset)
                     /* 1.4.x */ (claim)
                     /* 1.5.x */ (settlement_batch)
                    )
