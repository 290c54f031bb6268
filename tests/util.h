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


#ifndef _HEAPSNAP_TESTS_UTIL_H_
#define _HEAPSNAP_TESTS_UTIL_H_


#include <string.h>

#include "heapsnap.h"


#define NOINLINE __attribute__ ((noinline))

// Stops the compiler from turning the preceding call into a tail call, which
// would take the calling frame off the stack.
#define KEEP_FRAME() __asm__ __volatile__ ("" ::: "memory")


static inline bool
has_frame(const heapsnap::Report::Entry &entry, const char *name)
{
   for (size_t i = 0; i < entry.frames.size(); ++i) {
      if (entry.frames[i].name == name) {
         return true;
      }
   }
   return false;
}


/**
 * Sum the counters of every stack that goes through the named function.
 */
static inline heapsnap::ProfileEntry
site_counts(const heapsnap::Report &report, const char *name)
{
   heapsnap::ProfileEntry total;
   for (size_t i = 0; i < report.entries().size(); ++i) {
      const heapsnap::Report::Entry &entry = report.entries()[i];
      if (has_frame(entry, name)) {
         total.alloc_bytes += entry.counts.alloc_bytes;
         total.alloc_objects += entry.counts.alloc_objects;
         total.free_bytes += entry.counts.free_bytes;
         total.free_objects += entry.counts.free_objects;
      }
   }
   return total;
}


#endif /* _HEAPSNAP_TESTS_UTIL_H_ */
