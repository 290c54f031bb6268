/**************************************************************************
 *
 * Copyright 2011-2014 Jose Fonseca
 * All Rights Reserved.
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
 *
 **************************************************************************/


#ifndef _HEAPSNAP_PROFILER_H_
#define _HEAPSNAP_PROFILER_H_


#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

#include <unordered_map>
#include <utility>
#include <vector>

#include "heapsnap.h"
#include "stack.h"


namespace heapsnap {


class Block;


/**
 * Aggregation table: allocation-site stack to counters.
 *
 * Not synchronised; the profiler state owns the lock around it.
 */
class Collector
{
public:
   typedef std::unordered_map<StackRecord, ProfileEntry, StackRecordHash> Map;

   /**
    * Positive deltas count an allocation, negative ones a free, zero is
    * ignored.  Returns false if the sample had to be dropped.
    */
   bool
   record(const StackRecord &stack, ssize_t delta) noexcept;

   void
   clear(void);

   inline const Map &
   map(void) const {
      return _map;
   }

   inline size_t
   size(void) const {
      return _map.size();
   }

private:
   Map _map;
};


/**
 * Counters and table contents, copied out under the read lock.
 */
struct ProfileSnapshot
{
   size_t period;
   int64_t allocated_bytes;
   int64_t allocated_objects;
   std::vector<std::pair<StackRecord, ProfileEntry> > entries;
};


/**
 * Process-wide sampling profiler.
 */
class Profiler
{
public:
   /**
    * Reset the state and begin sampling.  Starting an already running
    * profiler starts over.
    */
   static void
   start(size_t period, bool measure_free = HEAPSNAP_MEASURE_FREE_DEFAULT);

   /**
    * No new samples are taken once this returns.
    */
   static void
   stop(void);

   static bool
   enabled(void);

   static size_t
   period(void);

   static bool
   measure_free(void);

   /**
    * Called by the hooks for every allocation (delta > 0) and free
    * (delta < 0).  Never fails observably.
    */
   static void
   on_alloc(ssize_t delta, Block *block) noexcept;

   static ProfileSnapshot
   snapshot(void);
};


/**
 * Marks the current thread as being inside the profiler for the lifetime of
 * the guard.  Allocations made meanwhile are not sampled.
 */
class ReentrancyGuard
{
public:
   ReentrancyGuard();

   ~ReentrancyGuard();

   ReentrancyGuard(const ReentrancyGuard &) = delete;
   ReentrancyGuard &operator = (const ReentrancyGuard &) = delete;

   /**
    * Whether the thread was already inside the profiler.
    */
   inline bool
   reentered(void) const {
      return _reentered;
   }

private:
   bool _reentered;
};


} /* namespace heapsnap */


#endif /* _HEAPSNAP_PROFILER_H_ */
