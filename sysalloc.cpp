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

#include <errno.h>
#include <dlfcn.h>

#include <atomic>

#include "log.h"
#include "sysalloc.h"


extern "C" void *__libc_malloc(size_t size);
extern "C" void *__libc_calloc(size_t nmemb, size_t size);
extern "C" void *__libc_realloc(void *ptr, size_t size);
extern "C" void __libc_free(void *ptr);
extern "C" void *__libc_memalign(size_t alignment, size_t size);


namespace heapsnap {


typedef size_t (*usable_size_fn)(void *);

static std::atomic<usable_size_fn>
usable_size = {nullptr};


/**
 * glibc does not export a __libc_ alias for malloc_usable_size, so look up
 * the next definition after ours.
 */
static usable_size_fn
_resolve_usable_size(void)
{
   usable_size_fn fn = usable_size.load(std::memory_order_acquire);
   if (!fn) {
      fn = (usable_size_fn)dlsym(RTLD_NEXT, "malloc_usable_size");
      if (!fn) {
         HEAPSNAP_ERROR("could not resolve malloc_usable_size");
         return nullptr;
      }
      usable_size.store(fn, std::memory_order_release);
   }
   return fn;
}


void *
SysAlloc::raw_alloc(size_t size)
{
   return __libc_malloc(size);
}


void *
SysAlloc::raw_calloc(size_t nmemb, size_t size)
{
   return __libc_calloc(nmemb, size);
}


void
SysAlloc::raw_free(void *ptr)
{
   __libc_free(ptr);
}


void *
SysAlloc::raw_realloc(void *ptr, size_t size)
{
   return __libc_realloc(ptr, size);
}


size_t
SysAlloc::raw_usable_size(void *ptr)
{
   usable_size_fn fn = _resolve_usable_size();
   if (!fn) {
      return 0;
   }
   return fn(ptr);
}


int
SysAlloc::raw_posix_memalign(void **memptr, size_t alignment, size_t size)
{
   if (!is_power_of_two(alignment) ||
       (alignment & (sizeof(void*) - 1)) != 0) {
      return EINVAL;
   }

   void *ptr = __libc_memalign(alignment, size);
   if (!ptr) {
      return ENOMEM;
   }

   *memptr = ptr;
   return 0;
}


void *
SysAlloc::raw_aligned_alloc(size_t alignment, size_t size)
{
   if (!is_power_of_two(alignment)) {
      errno = EINVAL;
      return nullptr;
   }

   return __libc_memalign(alignment, size);
}


/*
 * Resolve before main() so the lookup does not happen in the middle of the
 * application's first malloc_usable_size call.
 */
__attribute__ ((constructor(101)))
static void
on_start(void)
{
   _resolve_usable_size();
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
