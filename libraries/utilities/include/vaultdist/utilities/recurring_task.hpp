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

#pragma once

#include <fc/thread/async.hpp>

#include <chrono>
#include <string>

namespace vaultdist { namespace utilities {

/** A background job that repeats on a fixed cadence until cancelled.
 *  Subclasses override run_once(). The interval is measured from the end of one cycle to the start of the next,
 *  trigger() cuts the current wait short. Errors other than cancellation are logged and do not end the loop.
 */
class recurring_task
{
   std::string                         _name;
   std::chrono::microseconds           _interval;
   bool                                _cancelled = false;
   bool                                _triggered = false;
   uint64_t                            _cycles = 0;
   mutable boost::fibers::mutex        _mtx;
   boost::fibers::condition_variable   _cv;
   boost::fibers::future<void>         _worker;

   void loop();

   /** Blocks until the deadline passes, trigger() is called or the task is cancelled.
    *  Throws when cancelled.
    */
   void wait_until( std::chrono::steady_clock::time_point deadline );
protected:
   /** One unit of work. May throw, failures are logged by the loop. */
   virtual void run_once() = 0;

   /** Checks if the task has been cancelled, and throws if so. */
   void check_cancelled()const;
public:
   recurring_task( const std::string& name, std::chrono::microseconds interval );
   virtual ~recurring_task();

   const std::string& name()const { return _name; }
   uint64_t cycles()const;

   /** Throws when cancelled.
    * Starts the loop if it is not running, otherwise wakes it up for an immediate cycle.
    */
   void trigger();

   /** Cancels the loop. Future calls to trigger() and wait() will throw. */
   void cancel();

   /** Waits for the loop to end. Throws when cancelled. */
   void wait();
};

} } // vaultdist::utilities
