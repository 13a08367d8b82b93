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

#include <vaultdist/db/object_id.hpp>

#include <fc/string.hpp>

namespace vaultdist { namespace db {

object_id_type parse_object_id( const std::string& s )
{ try {
   auto first_dot = s.find('.');
   FC_ASSERT( first_dot != std::string::npos, "Missing the first dot" );
   FC_ASSERT( first_dot != 0, "Missing the space part" );
   auto second_dot = s.find('.',first_dot+1);
   FC_ASSERT( second_dot != std::string::npos, "Missing the second dot" );
   FC_ASSERT( second_dot != first_dot+1, "Missing the type part" );
   auto space_id = fc::to_uint64( s.substr( 0, first_dot ) );
   FC_ASSERT( space_id <= object_id_type::one_byte_mask, "space overflow" );
   auto type_id = fc::to_uint64( s.substr( first_dot+1, (second_dot-first_dot)-1 ) );
   FC_ASSERT( type_id <= object_id_type::one_byte_mask, "type overflow" );
   auto instance = fc::to_uint64( s.substr( second_dot+1 ) );
   return object_id_type( static_cast<uint8_t>(space_id), static_cast<uint8_t>(type_id), instance );
} FC_CAPTURE_AND_RETHROW( (s) ) }

} } // namespace vaultdist::db
