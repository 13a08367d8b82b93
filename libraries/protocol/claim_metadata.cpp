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

#include <vaultdist/protocol/claim_metadata.hpp>
#include <vaultdist/protocol/exceptions.hpp>

namespace vaultdist { namespace protocol {

claim_type payload_type( const claim_payload& payload )
{
   return static_cast<claim_type>( payload.which() );
}

claim_payload default_payload( claim_type type )
{
   VAULTDIST_ASSERT( type < claim_type::CLAIM_TYPE_COUNT, validation_exception,
                     "Unknown claim type ${t}", ("t", static_cast<int>(type)) );
   claim_payload result;
   result.set_which( static_cast<int64_t>(type) );
   return result;
}

void merge_metadata( claim_metadata& metadata, const claim_metadata_patch& patch )
{
   if( patch.payload.valid() )
   {
      VAULTDIST_ASSERT( patch.payload->which() == metadata.payload.which(), validation_exception,
                        "Metadata payload of type ${n} can not replace payload of type ${o}",
                        ("n", payload_type(*patch.payload))("o", payload_type(metadata.payload)) );
      metadata.payload = *patch.payload;
   }

   auto& d = metadata.diagnostics;
   if( patch.error.valid() )              d.error = patch.error;
   if( patch.notes.valid() )              d.notes = patch.notes;
   if( patch.auto_marked_reason.valid() ) d.auto_marked_reason = patch.auto_marked_reason;
   if( patch.failed_attempts.valid() )    d.failed_attempts = *patch.failed_attempts;
   if( patch.last_attempt.valid() )       d.last_attempt = patch.last_attempt;
   if( patch.processing_failed.valid() )  d.processing_failed = *patch.processing_failed;
}

} } // vaultdist::protocol
