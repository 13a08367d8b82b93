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

#include <vaultdist/chain/settlement_processor.hpp>
#include <vaultdist/utilities/recurring_task.hpp>

namespace vaultdist { namespace chain {

   /**
    *  Runs settlement_processor::sweep on a fixed interval. Every finished sweep is handed to the observer,
    *  if one is set, so the host can persist the ledger.
    */
   class settlement_sweeper : public utilities::recurring_task
   {
      public:
         typedef std::function<void( const sweep_result& )> observer_type;

         settlement_sweeper( settlement_processor& processor, std::chrono::seconds interval,
                             observer_type observer = observer_type() );
         ~settlement_sweeper() override;

         const optional<sweep_result>& last_result()const { return _last; }

      protected:
         void run_once() override;

      private:
         settlement_processor&  _processor;
         observer_type          _observer;
         optional<sweep_result> _last;
   };

} } // vaultdist::chain
