/**************************************************************************
 *
 * Copyright 2014 Jose Fonseca
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


#include <assert.h>
#include <stdlib.h>
#include <stdio.h>
#include <time.h>

#include "heapsnap.h"


static size_t numAllocations = 256*1024;
static size_t allocationSize = 4;
static size_t period = 512*1024;
static size_t leaked = 0;
static size_t numLeaks = 0;
static void *leaks[1024];

#define NUM_FUNCTIONS 4

typedef void (*FunctionPointer)(const unsigned *i, unsigned n, bool b);

extern const FunctionPointer functionPointers[NUM_FUNCTIONS];

#define FUNCTION(_index) \
   static void \
   fn##_index(const unsigned *indices, unsigned depth, bool leak) { \
      if (depth == 0) { \
         void * ptr = malloc(allocationSize); \
         if (leak) { \
            /* keep a ring of live blocks */ \
            void **slot = &leaks[numLeaks++ % 1024]; \
            free(*slot); \
            *slot = ptr; \
            leaked += allocationSize; \
         } else { \
            free(ptr); \
         } \
      } else { \
         --depth; \
         functionPointers[indices[depth]](indices, depth, leak); \
      } \
   }

FUNCTION(0)
FUNCTION(1)
FUNCTION(2)
FUNCTION(3)


const FunctionPointer functionPointers[NUM_FUNCTIONS] = {
   fn0,
   fn1,
   fn2,
   fn3
};


#define MAX_DEPTH 8


int
main(int argc, char *argv[])
{
   if (argc > 1) {
      numAllocations = atol(argv[1]);
      if (argc > 2) {
         allocationSize = atol(argv[2]);
         if (argc > 3) {
            period = atol(argv[3]);
         }
      }
   }

   heapsnap::HeapProfilerSession session = heapsnap::HeapProfilerSession::begin(period, true);

   struct timespec start;
   clock_gettime(CLOCK_MONOTONIC, &start);

   bool leak = false;
   for (unsigned i = 0; i < numAllocations; ++i) {
      unsigned indices[MAX_DEPTH];
      for (unsigned depth = 0; depth < MAX_DEPTH; ++depth) {
         // Random number, with non-uniform distribution
         unsigned index = rand() & 0xffff;
         index = (index * index) >> 16;
         index = (index * NUM_FUNCTIONS) >> 16;
         assert(index >= 0);
         assert(index < NUM_FUNCTIONS);

         indices[depth] = index;
      }

      leak = !leak;
      functionPointers[indices[MAX_DEPTH - 1]](indices, MAX_DEPTH - 1, leak);
   }

   struct timespec end;
   clock_gettime(CLOCK_MONOTONIC, &end);
   double seconds = (end.tv_sec - start.tv_sec) + (end.tv_nsec - start.tv_nsec) * 1e-9;

   heapsnap::Report report = session.report();

   for (unsigned i = 0; i < 1024; ++i) {
      free(leaks[i]);
   }

   printf("%zu allocations of %zu bytes in %.3f s, %.1f ns each\n",
          numAllocations, allocationSize, seconds,
          numAllocations ? seconds * 1e9 / numAllocations : 0.0);
   printf("period %zu bytes, %zu sampled stacks\n",
          report.period(), report.entries().size());

   return 0;
}


// vim:set sw=3 ts=3 et:
