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
#include <vaultdist/chain/collaborators.hpp>

namespace vaultdist { namespace chain {

database::database()
{
   initialize_indexes();
   _clock = []() { return time_point_sec( fc::time_point::now() ); };
}

database::~database()
{
}

void database::initialize_indexes()
{
   add_index< participant_index >();
   add_index< vault_index >();
   add_index< source_transaction_index >();
   add_index< vault_asset_index >();
   add_index< claim_index >();
   add_index< settlement_batch_index >();
}

void database::set_clock( std::function<time_point_sec()> clock )
{
   FC_ASSERT( clock, "clock must be callable" );
   _clock = std::move( clock );
}

time_point_sec database::now()const
{
   return _clock();
}

void database::set_asset_status_updater( std::shared_ptr<asset_status_updater> updater )
{
   _asset_updater = std::move( updater );
}

} } // vaultdist::chain
