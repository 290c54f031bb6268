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


#include <time.h>

#include <algorithm>

#include "heapsnap.h"
#include "profiler.h"
#include "stack.h"


namespace heapsnap {


Report::Report() :
   _period(1),
   _allocated_bytes(0),
   _allocated_objects(0),
   _time_nanos(0)
{
}


static bool
_by_alloc_bytes(const Report::Entry &a, const Report::Entry &b)
{
   return a.counts.alloc_bytes > b.counts.alloc_bytes;
}


Report
Report::snapshot(void)
{
   // Nothing the report allocates is worth profiling.
   ReentrancyGuard guard;

   ProfileSnapshot snapshot = Profiler::snapshot();

   Report report;
   report._period = snapshot.period;
   report._allocated_bytes = snapshot.allocated_bytes;
   report._allocated_objects = snapshot.allocated_objects;

   struct timespec ts;
   if (clock_gettime(CLOCK_REALTIME, &ts) == 0) {
      report._time_nanos = (int64_t)ts.tv_sec * 1000000000 + ts.tv_nsec;
   }

   // Symbolise outside the lock.
   report._entries.reserve(snapshot.entries.size());
   for (size_t i = 0; i < snapshot.entries.size(); ++i) {
      Entry entry;
      entry.frames = resolve(snapshot.entries[i].first);
      entry.counts = snapshot.entries[i].second;
      report._entries.push_back(entry);
   }

   std::stable_sort(report._entries.begin(), report._entries.end(), _by_alloc_bytes);

   return report;
}


void
Report::flamegraph(std::ostream &os, const FlamegraphOptions &options) const
{
   OstreamSink sink(os);
   flamegraph(sink, options);
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
