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
#include <vaultdist/db/object_id.hpp>

#include <fc/config.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>
#include <vector>

namespace vaultdist { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  An object is the unit of undo and redo inside the object_database. Every object carries an id
    *  assigned sequentially by its index, and every object must be reflected with FC_REFLECT_DERIVED
    *  so that snapshots and undo states can copy it faithfully.
    *
    *  Objects refer to each other by id only, which keeps copies cheap when an undo session
    *  saves the previous value before a modification.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;

         object_id_type id;

         /// implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual std::unique_ptr<object> clone()const = 0;
         virtual void                    move_from( object& obj ) = 0;
         virtual fc::variant             to_variant()const = 0;
   };

   /**
    * @class abstract_object
    * @brief Curiously Recurring Template Pattern helper that lets the database clone, move and
    *  serialize objects without knowing their concrete type.
    */
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         std::unique_ptr<object> clone()const override
         {
            return std::unique_ptr<object>( new DerivedClass( *static_cast<const DerivedClass*>(this) ) );
         }

         void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         fc::variant to_variant()const override
         {
            return fc::variant( static_cast<const DerivedClass&>(*this), FC_PACK_MAX_DEPTH );
         }
   };

} } // vaultdist::db

FC_REFLECT( vaultdist::db::object, (id) )
