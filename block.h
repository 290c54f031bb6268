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


#ifndef _HEAPSNAP_BLOCK_H_
#define _HEAPSNAP_BLOCK_H_


#include <stddef.h>
#include <stdint.h>

#include "stack.h"


#ifndef HEAPSNAP_MAGIC
#define HEAPSNAP_MAGIC 1
#endif


/* Minimum alignment for this platform */
#ifdef __x86_64__
#define MIN_ALIGN 16
#else
#define MIN_ALIGN (sizeof(double))
#endif


namespace heapsnap {


/**
 * Stamped immediately below every payload the hooks hand out.
 */
struct alignas(MIN_ALIGN) BlockHeader {
   // Size the application asked for
   size_t size;

   // Allocation-site stack, owned, allocated through SysAlloc
   StackRecord *frames;

   // Real pointer, as returned by SysAlloc
   void *ptr;

   // Bytes of this block currently accounted as allocated in the collector
   size_t sampled;

   // Profiler session the stack and the sampled bytes belong to
   uint32_t generation;

   // Last word, so that checking a foreign pointer only reads the word below
   // it, which lies within the foreign allocator's own chunk header
   uint64_t magic;
};

static_assert(sizeof(BlockHeader) % MIN_ALIGN == 0,
              "header must preserve the payload alignment");
static_assert(offsetof(BlockHeader, magic) == sizeof(BlockHeader) - sizeof(uint64_t),
              "magic must sit immediately below the payload");


/**
 * Handle on a block laid out as [padding][BlockHeader][payload].
 *
 * The handle itself holds no state other than the header address, so it is
 * freely copied and never outlives the block it refers to.
 */
class Block
{
public:
   static constexpr uint64_t MAGIC = 0xFEEDDEADBEEFF00DULL;

   /**
    * Stamp a header at base.  raw is what SysAlloc returned, and is lower
    * than base for over-aligned blocks.
    */
   static Block
   fresh(void *base, void *raw);

   static inline Block
   fresh(void *base) {
      return fresh(base, base);
   }

   /**
    * Recover the handle of a payload.  Nothing is known to be valid until
    * check() says so.
    */
   static inline Block
   adopt(void *payload) {
      return Block((BlockHeader *)((char *)payload - header_size()));
   }

   static constexpr size_t
   header_size(void) {
      return sizeof(BlockHeader);
   }

   /**
    * Returns the previous size.
    */
   size_t
   set_size(size_t size);

   inline size_t
   size(void) const {
      return _header->size;
   }

   inline void *
   payload(void) const {
      return (char *)_header + header_size();
   }

   inline void *
   base(void) const {
      return _header;
   }

   inline void *
   raw(void) const {
      return _header->ptr;
   }

   /**
    * Follow the block after SysAlloc moved it.  The header has already been
    * carried over to the new location.
    */
   void
   rebase(void *raw);

   /**
    * Whether the block went through our hooks.
    */
   bool
   check(void) const;

   /**
    * Return the allocation-site stack, capturing and storing it first when
    * the header has none and capture_if_missing is set.  Returns an empty
    * stack otherwise.
    */
   StackRecord
   attach_stack(bool capture_if_missing);

   inline bool
   has_stack(void) const {
      return _header->frames != nullptr;
   }

   inline uint32_t
   generation(void) const {
      return _header->generation;
   }

   /**
    * Forget any stack and accounting left over from another session.
    */
   void
   restamp(uint32_t generation);

   inline size_t
   sampled(void) const {
      return _header->sampled;
   }

   inline void
   set_sampled(size_t sampled) {
      _header->sampled = sampled;
   }

   /**
    * Release what the header owns.  The raw block itself is the caller's to
    * return to SysAlloc.
    */
   void
   drop(void);

private:
   explicit inline
   Block(BlockHeader *header) :
      _header(header)
   {
   }

   void
   _release_frames(void);

   BlockHeader *_header;
};


} /* namespace heapsnap */


#endif /* _HEAPSNAP_BLOCK_H_ */
