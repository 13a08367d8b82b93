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
#include <vaultdist/db/object.hpp>

#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace vaultdist { namespace db {

   class object_database;

   struct undo_state
   {
      std::unordered_map<object_id_type, std::unique_ptr<object> > old_values;
      std::unordered_map<object_id_type, object_id_type>           old_index_next_ids;
      std::unordered_set<object_id_type>                           new_ids;
      std::unordered_map<object_id_type, std::unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief tracks changes made inside sessions so that they can be rolled back
    *
    * Changes are only recorded while at least one session is open. A session that goes out of scope
    * without commit() or merge() restores every object it touched, which makes a session the unit of
    * atomic writes for the ledger.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session()
               {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch( const fc::exception& e )
                  {
                     elog( "${e}", ("e",e.to_detail_string() ) );
                     throw;
                  }
               }
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;

            private:
               friend class undo_database;
               explicit session( undo_database& db ): _db(db) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         session start_undo_session();

         /// should be called just after an object is created
         void on_create( const object& obj );
         /// should be called just before an object is modified
         void on_modify( const object& obj );
         /// should be called just before an object is removed
         void on_remove( const object& obj );

         bool     recording()const       { return _active_sessions > 0; }
         uint32_t active_sessions()const { return _active_sessions; }

      private:
         void undo();
         void merge();
         void commit();

         uint32_t                _active_sessions = 0;
         bool                    _applying = false;
         std::deque<undo_state>  _stack;
         object_database&        _db;
   };

} } // vaultdist::db
