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

#include <fc/exception/exception.hpp>

#define VAULTDIST_ASSERT( expr, exc_type, FORMAT, ... )               \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define VAULTDIST_RECODE_EXC( cause_type, effect_type ) \
   catch( const cause_type& e ) \
   { throw( effect_type( e.what(), e.get_log() ) ); }

namespace vaultdist { namespace protocol {

   FC_DECLARE_EXCEPTION( ledger_exception, 5000000 )

   /// bad input shape, rejected before any state change
   FC_DECLARE_DERIVED_EXCEPTION( validation_exception,           vaultdist::protocol::ledger_exception, 5010000 )
   /// unknown vault, claim, participant or transaction
   FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,            vaultdist::protocol::ledger_exception, 5020000 )
   FC_DECLARE_DERIVED_EXCEPTION( duplicate_claim_exception,      vaultdist::protocol::ledger_exception, 5030000 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_transition_exception,   vaultdist::protocol::ledger_exception, 5040000 )
   /// the funds behind a claim are gone and were not spent by a prior settlement
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_backing_exception, vaultdist::protocol::ledger_exception, 5050000 )
   /// builder or submitter failure, retried by the settlement processor
   FC_DECLARE_DERIVED_EXCEPTION( transport_exception,            vaultdist::protocol::ledger_exception, 5060000 )
   FC_DECLARE_DERIVED_EXCEPTION( size_limit_exceeded_exception,  vaultdist::protocol::ledger_exception, 5070000 )
   FC_DECLARE_DERIVED_EXCEPTION( lease_unavailable_exception,    vaultdist::protocol::ledger_exception, 5080000 )

} } // vaultdist::protocol
