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


#ifndef _HEAPSNAP_STACK_H_
#define _HEAPSNAP_STACK_H_


#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "heapsnap.h"


#define HEAPSNAP_MAX_DEPTH 32


namespace heapsnap {


/**
 * Fixed-depth backtrace.  Lives inline, so capturing one never touches the
 * heap.
 *
 * Frames are kept as raw program counters together with the start address of
 * the procedure each one falls in.  Equality and hashing only look at the
 * latter, so two call sites in the same function are the same stack.
 */
class StackRecord
{
public:
   StackRecord() :
      _depth(0)
   {
   }

   /**
    * Walk the current thread's stack.
    *
    * Safe to call while holding the profiler lock: libunwind's local unwinder
    * neither takes our lock nor calls malloc.  Returns an empty record if the
    * walk fails.
    */
   static StackRecord
   capture_unsynchronised(void);

   inline unsigned
   depth(void) const {
      return _depth;
   }

   inline bool
   empty(void) const {
      return _depth == 0;
   }

   inline uintptr_t
   ip(unsigned i) const {
      return _ips[i];
   }

   inline uintptr_t
   symbol_address(unsigned i) const {
      return _syms[i];
   }

   /**
    * Append a frame.  Returns false once the record is full.
    */
   bool
   push(uintptr_t ip, uintptr_t sym);

   bool
   operator == (const StackRecord &other) const;

   inline bool
   operator != (const StackRecord &other) const {
      return !(*this == other);
   }

   size_t
   hash(void) const;

private:
   unsigned _depth;
   uintptr_t _ips[HEAPSNAP_MAX_DEPTH];
   uintptr_t _syms[HEAPSNAP_MAX_DEPTH];
};


struct StackRecordHash
{
   inline size_t
   operator () (const StackRecord &stack) const {
      return stack.hash();
   }
};


/**
 * Whether a symbol belongs to the profiler's own allocation plumbing (or the
 * C++ runtime's allocator adapters) and should be hidden from reports.
 */
bool
is_internal_frame(const char *name);


/**
 * Symbolise a stack, innermost frame first, dropping internal frames.
 *
 * Allocates; only call from the report path.
 */
std::vector<Frame>
resolve(const StackRecord &stack);


} /* namespace heapsnap */


#endif /* _HEAPSNAP_STACK_H_ */
