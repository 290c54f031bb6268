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

#include <string.h>
#include <stdlib.h>
#include <dlfcn.h>

#define UNW_LOCAL_ONLY
#include <libunwind.h>

#include <cxxabi.h>

#include <functional>

#include "log.h"
#include "stack.h"


#define ARRAY_SIZE(x) (sizeof (x) / sizeof ((x)[0]))


namespace heapsnap {


/**
 * Unlike glibc backtrace, libunwind will not invoke malloc.
 */
StackRecord
StackRecord::capture_unsynchronised(void)
{
   StackRecord record;
   int ret;

   unw_context_t uc;
   ret = unw_getcontext(&uc);
   if (ret != 0) {
      return record;
   }

   unw_cursor_t cursor;
   ret = unw_init_local(&cursor, &uc);
   if (ret != 0) {
      return record;
   }

   do {
      unw_word_t ip;
      ret = unw_get_reg(&cursor, UNW_REG_IP, &ip);
      if (ret != 0 || ip == 0) {
         break;
      }

      // Frames we cannot map to a procedure stand for themselves.
      unw_word_t sym = ip;
      unw_proc_info_t pi;
      if (unw_get_proc_info(&cursor, &pi) == 0 && pi.start_ip != 0) {
         sym = pi.start_ip;
      }

      if (!record.push(ip, sym)) {
         break;
      }

      ret = unw_step(&cursor);
   } while (ret > 0);

   return record;
}


bool
StackRecord::push(uintptr_t ip, uintptr_t sym)
{
   if (_depth >= HEAPSNAP_MAX_DEPTH) {
      return false;
   }
   _ips[_depth] = ip;
   _syms[_depth] = sym;
   ++_depth;
   return _depth < HEAPSNAP_MAX_DEPTH;
}


bool
StackRecord::operator == (const StackRecord &other) const
{
   if (_depth != other._depth) {
      return false;
   }
   for (unsigned i = 0; i < _depth; ++i) {
      if (_syms[i] != other._syms[i]) {
         return false;
      }
   }
   return true;
}


size_t
StackRecord::hash(void) const
{
   std::hash<uintptr_t> hasher;
   size_t h = _depth;
   for (unsigned i = 0; i < _depth; ++i) {
      h ^= hasher(_syms[i]) + 0x9e3779b9 + (h << 6) + (h >> 2);
   }
   return h;
}


// Entry points of our own hooks.
static const char *
internal_symbols[] = {
   "malloc",
   "calloc",
   "realloc",
   "free",
   "posix_memalign",
   "aligned_alloc",
   "memalign",
   "valloc",
   "pvalloc",
   "reallocarray",
   "malloc_usable_size",
};

// The profiler itself and the C++ runtime's allocator adapters.
static const char *
internal_prefixes[] = {
   "heapsnap::",
   "operator new",
   "__gnu_cxx::new_allocator<",
   "std::__new_allocator<",
};


bool
is_internal_frame(const char *name)
{
   for (size_t i = 0; i < ARRAY_SIZE(internal_symbols); ++i) {
      if (strcmp(name, internal_symbols[i]) == 0) {
         return true;
      }
   }
   for (size_t i = 0; i < ARRAY_SIZE(internal_prefixes); ++i) {
      if (strncmp(name, internal_prefixes[i], strlen(internal_prefixes[i])) == 0) {
         return true;
      }
   }
   return false;
}


static std::string
_demangle(const char *sname)
{
   int status = 0;
   char *demangled = abi::__cxa_demangle(sname, nullptr, nullptr, &status);
   if (status != 0 || !demangled) {
      return sname;
   }
   std::string name(demangled);
   free(demangled);
   return name;
}


std::vector<Frame>
resolve(const StackRecord &stack)
{
   std::vector<Frame> frames;
   frames.reserve(stack.depth());

   for (unsigned i = 0; i < stack.depth(); ++i) {
      uintptr_t ip = stack.ip(i);

      // Outer frames hold return addresses, which may already point past the
      // end of the calling function.
      uintptr_t lookup = i ? ip - 1 : ip;

      Frame frame;
      frame.address = ip;
      frame.module_base = 0;

      Dl_info info;
      memset(&info, 0, sizeof info);
      if (dladdr((void *)lookup, &info)) {
         if (info.dli_fname) {
            frame.module = info.dli_fname;
         }
         frame.module_base = (uintptr_t)info.dli_fbase;
      }

      if (info.dli_sname) {
         frame.name = _demangle(info.dli_sname);
         if (is_internal_frame(frame.name.c_str())) {
            continue;
         }
      } else {
         char buf[32];
         snprintf(buf, sizeof buf, "0x%lx", (unsigned long)ip);
         frame.name = buf;
      }

      frames.push_back(frame);
   }

   return frames;
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
