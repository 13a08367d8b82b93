/*
 * Copyright (c) 2019 BitShares Blockchain Foundation
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

#include <vaultdist/utilities/recurring_task.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

namespace vaultdist { namespace utilities {

recurring_task::recurring_task( const std::string& name, std::chrono::microseconds interval )
   : _name( name ), _interval( interval )
{
   FC_ASSERT( interval.count() > 0, "Task '${n}' needs a positive interval", ("n",name) );
}

recurring_task::~recurring_task()
{
   if( _worker.valid() && _worker.wait_for( std::chrono::seconds(0) ) != boost::fibers::future_status::ready )
   {
      cancel();
      try
      {
         wait();
      }
      catch( const fc::canceled_exception& ) {}
   }
}

uint64_t recurring_task::cycles()const
{
   std::unique_lock<boost::fibers::mutex> lock(_mtx);
   return _cycles;
}

void recurring_task::loop()
{
   fc::set_fiber_name( _name );
   while( true )
   {
      check_cancelled();
      try
      {
         run_once();
      }
      catch( const fc::canceled_exception& )
      {
         throw;
      }
      catch( const fc::exception& e )
      {
         elog( "Task '${n}' failed: ${e}", ("n",_name)("e",e.to_detail_string()) );
      }
      {
         std::unique_lock<boost::fibers::mutex> lock(_mtx);
         ++_cycles;
      }
      wait_until( std::chrono::steady_clock::now() + _interval );
   }
}

void recurring_task::wait_until( std::chrono::steady_clock::time_point deadline )
{
   std::unique_lock<boost::fibers::mutex> lock(_mtx);
   while( !_triggered && !_cancelled && std::chrono::steady_clock::now() < deadline )
      _cv.wait_until( lock, deadline );
   _triggered = false;
   check_cancelled();
}

void recurring_task::check_cancelled()const
{
   if( _cancelled )
      FC_THROW_EXCEPTION( fc::canceled_exception, "Task '${n}' was cancelled!", ("n",_name) );
}

void recurring_task::trigger()
{
   std::unique_lock<boost::fibers::mutex> lock(_mtx);
   check_cancelled();
   if( !_worker.valid() || _worker.wait_for( std::chrono::seconds(0) ) == boost::fibers::future_status::ready )
      _worker = fc::async( std::bind( &recurring_task::loop, this ) );
   else
   {
      _triggered = true;
      _cv.notify_all();
   }
}

void recurring_task::cancel()
{
   std::unique_lock<boost::fibers::mutex> lock(_mtx);
   _cancelled = true;
   _cv.notify_all();
}

void recurring_task::wait()
{
   std::unique_lock<boost::fibers::mutex> lock(_mtx);
   if( !_worker.valid() )
      check_cancelled();
   else
   {
      lock.unlock();
      _worker.get();
   }
}

} } // vaultdist::utilities
