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

#include <vaultdist/protocol/exceptions.hpp>

namespace vaultdist { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( ledger_exception, 5000000, "vault ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( validation_exception,           ledger_exception, 5010000, "validation error" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_found_exception,            ledger_exception, 5020000, "not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_claim_exception,      ledger_exception, 5030000, "duplicate claim" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_transition_exception,   ledger_exception, 5040000,
                                   "invalid claim status transition" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_backing_exception, ledger_exception, 5050000,
                                   "insufficient backing" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transport_exception,            ledger_exception, 5060000, "transport error" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( size_limit_exceeded_exception,  ledger_exception, 5070000,
                                   "settlement size limit exceeded" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( lease_unavailable_exception,    ledger_exception, 5080000,
                                   "settlement lease unavailable" )

} } // vaultdist::protocol
