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


#ifndef _HEAPSNAP_SYSALLOC_H_
#define _HEAPSNAP_SYSALLOC_H_


#include <stddef.h>


namespace heapsnap {


/**
 * The only path through which raw memory is obtained or returned.
 *
 * Every entry point is a thin delegation to glibc's own allocator, reached
 * through symbols the hooks do not shadow.  No header handling, no
 * accounting.
 */
struct SysAlloc
{
   static void *
   raw_alloc(size_t size);

   static void *
   raw_calloc(size_t nmemb, size_t size);

   static void
   raw_free(void *ptr);

   static void *
   raw_realloc(void *ptr, size_t size);

   static size_t
   raw_usable_size(void *ptr);

   /**
    * POSIX.1 posix_memalign: returns 0, EINVAL or ENOMEM; *memptr is only
    * written on success.
    */
   static int
   raw_posix_memalign(void **memptr, size_t alignment, size_t size);

   static void *
   raw_aligned_alloc(size_t alignment, size_t size);

   static inline bool
   is_power_of_two(size_t alignment) {
      return alignment != 0 && (alignment & (alignment - 1)) == 0;
   }
};


} /* namespace heapsnap */


#endif /* _HEAPSNAP_SYSALLOC_H_ */
