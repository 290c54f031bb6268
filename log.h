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


#ifndef _HEAPSNAP_LOG_H_
#define _HEAPSNAP_LOG_H_


#include <stdio.h>
#include <stdlib.h>


#ifndef HEAPSNAP_VERBOSITY
#define HEAPSNAP_VERBOSITY 0
#endif


/*
 * Diagnostics go straight to stderr.  stderr is unbuffered, so none of these
 * allocate on the way out.
 */

#define HEAPSNAP_WARNING(fmt, ...) \
   fprintf(stderr, "heapsnap: warning: " fmt "\n", ##__VA_ARGS__)

#define HEAPSNAP_ERROR(fmt, ...) \
   fprintf(stderr, "heapsnap: error: " fmt "\n", ##__VA_ARGS__)

#define HEAPSNAP_TRACE(level, fmt, ...) \
   do { \
      if (HEAPSNAP_VERBOSITY >= (level)) { \
         fprintf(stderr, "heapsnap: " fmt "\n", ##__VA_ARGS__); \
      } \
   } while (0)


namespace heapsnap {

void
assert_fail(const char *expr,
            const char *file,
            unsigned line,
            const char *function);

}


/**
 * glibc's assert macro invokes malloc, so roll our own to avoid recursion.
 */
#ifndef NDEBUG
#define HEAPSNAP_ASSERT(expr) \
   ((expr) ? (void)0 : heapsnap::assert_fail(#expr, __FILE__, __LINE__, __FUNCTION__))
#else
#define HEAPSNAP_ASSERT(expr) while (0) { (void)(expr); }
#endif


#endif /* _HEAPSNAP_LOG_H_ */
