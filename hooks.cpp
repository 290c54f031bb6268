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


#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <malloc.h>
#include <unistd.h>

#include <algorithm>

#include "block.h"
#include "log.h"
#include "profiler.h"
#include "sysalloc.h"


#define PUBLIC __attribute__ ((visibility("default")))
#define ALWAYS_INLINE __attribute__ ((always_inline))


using heapsnap::Block;
using heapsnap::Profiler;
using heapsnap::SysAlloc;


/**
 * Stamp a header below the payload and account for the new block.
 */
static inline ALWAYS_INLINE void *
_track(void *raw, void *base, size_t size)
{
   Block block = Block::fresh(base, raw);
   block.set_size(size);
   Profiler::on_alloc((ssize_t)size, &block);
   HEAPSNAP_TRACE(2, "alloc %p %zu", block.payload(), size);
   return block.payload();
}


static inline ALWAYS_INLINE void *
_malloc(size_t size)
{
   size_t raw_size;
   if (__builtin_add_overflow(size, Block::header_size(), &raw_size)) {
      errno = ENOMEM;
      return NULL;
   }

   void *ptr = SysAlloc::raw_alloc(raw_size);
   if (!ptr) {
      return NULL;
   }

   return _track(ptr, ptr, size);
}


/**
 * Room needed in front of the payload so that it lands on an alignment
 * boundary with a whole header below it.
 */
static inline ALWAYS_INLINE size_t
_header_room(size_t alignment)
{
   size_t header_size = Block::header_size();
   if (alignment <= MIN_ALIGN) {
      return header_size;
   }
   return (header_size + alignment - 1) & ~(alignment - 1);
}


/**
 * Over-aligned blocks are over-allocated, and the header is placed
 * immediately below the aligned payload.  The header remembers the real
 * pointer.
 */
static inline ALWAYS_INLINE int
_memalign(void **memptr, size_t alignment, size_t size)
{
   size_t room = _header_room(alignment);
   size_t raw_size;
   if (__builtin_add_overflow(size, room, &raw_size)) {
      return ENOMEM;
   }

   void *ptr;
   int ret = SysAlloc::raw_posix_memalign(&ptr, std::max(alignment, sizeof(void *)), raw_size);
   if (ret != 0) {
      return ret;
   }

   void *base = (char *)ptr + room - Block::header_size();
   *memptr = _track(ptr, base, size);
   HEAPSNAP_ASSERT(((size_t)*memptr & (alignment - 1)) == 0);
   return 0;
}


static inline ALWAYS_INLINE void
_free(void *ptr)
{
   // if free is called with a NULL parameter, no operation is performed.
   if (!ptr) {
      return;
   }

   Block block = Block::adopt(ptr);
   if (!block.check()) {
      SysAlloc::raw_free(ptr);
      return;
   }

   HEAPSNAP_TRACE(2, "free %p %zu", ptr, block.size());

   Profiler::on_alloc(-(ssize_t)block.size(), &block);
   block.drop();
   SysAlloc::raw_free(block.raw());
}


static inline ALWAYS_INLINE void *
_realloc(void *ptr, size_t size)
{
   // if realloc is called with a NULL argument, it behaves like malloc
   if (!ptr) {
      return _malloc(size);
   }

   Block block = Block::adopt(ptr);
   if (!block.check()) {
      return SysAlloc::raw_realloc(ptr, size);
   }

   size_t raw_size;
   if (__builtin_add_overflow(size, Block::header_size(), &raw_size)) {
      errno = ENOMEM;
      return NULL;
   }

   size_t old_size = block.size();
   void *new_ptr;

   if (block.raw() == block.base()) {
      new_ptr = SysAlloc::raw_realloc(block.raw(), raw_size);
      if (!new_ptr) {
         return NULL;
      }
   } else {
      // The allocator would move an over-aligned block without regard for
      // where its header sits, so move it ourselves.
      new_ptr = SysAlloc::raw_alloc(raw_size);
      if (!new_ptr) {
         return NULL;
      }
      size_t min_size = old_size >= size ? size : old_size;
      memcpy(new_ptr, block.base(), Block::header_size() + min_size);
      SysAlloc::raw_free(block.raw());
   }

   block.rebase(new_ptr);
   block.set_size(size);
   Profiler::on_alloc((ssize_t)size - (ssize_t)old_size, &block);

   return block.payload();
}


/*
 * C
 */

extern "C"
PUBLIC void *
malloc(size_t size) __THROW
{
   return _malloc(size);
}


extern "C"
PUBLIC void
free(void *ptr) __THROW
{
   _free(ptr);
}


extern "C"
PUBLIC void *
calloc(size_t nmemb, size_t size) __THROW
{
   size_t header_size = Block::header_size();
   size_t bytes;
   if (__builtin_mul_overflow(nmemb, size, &bytes)) {
      errno = ENOMEM;
      return NULL;
   }

   // The allocator zeroes whole elements, so grow the element count until
   // the header fits in front of the payload.
   size_t count;
   size_t elem_size;
   if (bytes == 0) {
      count = 1;
      elem_size = header_size;
   } else {
      size_t extra = header_size / size;
      size_t block_size;
      if (__builtin_add_overflow(nmemb, extra, &count) ||
          __builtin_mul_overflow(count, size, &block_size)) {
         errno = ENOMEM;
         return NULL;
      }
      if (block_size - bytes < header_size) {
         if (__builtin_add_overflow(count, 1, &count) ||
             __builtin_mul_overflow(count, size, &block_size)) {
            errno = ENOMEM;
            return NULL;
         }
      }
      elem_size = size;
   }

   void *ptr = SysAlloc::raw_calloc(count, elem_size);
   if (!ptr) {
      return NULL;
   }

   return _track(ptr, ptr, bytes);
}


extern "C"
PUBLIC void *
realloc(void *ptr, size_t size) __THROW
{
   return _realloc(ptr, size);
}


extern "C"
PUBLIC void *
reallocarray(void *ptr, size_t nmemb, size_t size) __THROW
{
   size_t bytes;
   if (__builtin_mul_overflow(nmemb, size, &bytes)) {
      errno = ENOMEM;
      return NULL;
   }

   return _realloc(ptr, bytes);
}


extern "C"
PUBLIC int
posix_memalign(void **memptr, size_t alignment, size_t size) __THROW
{
   if (!SysAlloc::is_power_of_two(alignment) ||
       (alignment & (sizeof(void*) - 1)) != 0) {
      return EINVAL;
   }

   return _memalign(memptr, alignment, size);
}


extern "C"
PUBLIC void *
aligned_alloc(size_t alignment, size_t size) __THROW
{
   if (!SysAlloc::is_power_of_two(alignment)) {
      errno = EINVAL;
      return NULL;
   }

   void *ptr;
   int ret = _memalign(&ptr, alignment, size);
   if (ret != 0) {
      errno = ret;
      return NULL;
   }
   return ptr;
}


extern "C"
PUBLIC void *
memalign(size_t alignment, size_t size) __THROW
{
   // Like glibc, round a bogus alignment up to the next power of two.
   if (!SysAlloc::is_power_of_two(alignment)) {
      size_t a = MIN_ALIGN;
      while (a < alignment) {
         a <<= 1;
         if (a == 0) {
            errno = EINVAL;
            return NULL;
         }
      }
      alignment = a;
   }

   void *ptr;
   int ret = _memalign(&ptr, alignment, size);
   if (ret != 0) {
      errno = ret;
      return NULL;
   }
   return ptr;
}


extern "C"
PUBLIC void *
valloc(size_t size) __THROW
{
   return memalign(sysconf(_SC_PAGESIZE), size);
}


extern "C"
PUBLIC void *
pvalloc(size_t size) __THROW
{
   size_t pagesize = sysconf(_SC_PAGESIZE);
   size_t rounded;
   if (__builtin_add_overflow(size, pagesize - 1, &rounded)) {
      errno = ENOMEM;
      return NULL;
   }
   rounded &= ~(pagesize - 1);
   if (rounded == 0) {
      rounded = pagesize;
   }
   return memalign(pagesize, rounded);
}


extern "C"
PUBLIC size_t
malloc_usable_size(void *ptr) __THROW
{
   if (!ptr) {
      return 0;
   }

   Block block = Block::adopt(ptr);
   if (!block.check()) {
      return SysAlloc::raw_usable_size(ptr);
   }

   size_t offset = (char *)block.payload() - (char *)block.raw();
   size_t usable = SysAlloc::raw_usable_size(block.raw());
   return usable > offset ? usable - offset : 0;
}


// vim:set sw=3 ts=3 et:
