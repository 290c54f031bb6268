#include <assert.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <malloc.h>

#include <dlfcn.h>

#include <exception>
#include <fstream>
#include <vector>

#include "heapsnap.h"


static size_t leaked = 0;
static std::vector<void *> leaks;


static void
leak(void *p, size_t size)
{
   leaks.push_back(p);
   leaked += size;
}


static void
test_dlsym(void)
{
   dlsym(RTLD_NEXT, "foo");
}


static void
test_malloc(void)
{
   void *p;

   // allocate some
   p = malloc(1024);
   assert(p);

   // leak some
   leak(malloc(1024), 1024);

   // free some
   free(p);

   // allocate 0 bytes
   p = malloc(0);
   assert(p);
   free(p);

   // free nothing
   free(NULL);
}


static void
test_calloc(void)
{
   void *p;

   // allocate some
   p = calloc(2, 1024);
   assert(p);
   assert(((char *)p)[2047] == 0);

   // leak some
   leak(calloc(2, 1024), 2 * 1024);

   // free some
   free(p);

   // allocate 0 bytes
   p = calloc(0, 1);
   assert(p);
   free(p);
   p = calloc(1, 0);
   assert(p);
   free(p);
}


static void
test_realloc(void)
{
   void *p;

   // allocate some
   p = realloc(NULL, 1024);
   assert(p);
   memset(p, 0x5a, 1024);

   // grow some
   p = realloc(p, 2048);
   assert(p);
   assert(((unsigned char *)p)[1023] == 0x5a);

   // shrink to nothing; the block stays valid
   p = realloc(p, 0);
   assert(p);
   free(p);

   // allocate 0 bytes
   p = realloc(NULL, 0);
   assert(p);
   free(p);
}


static void
test_memalign(void)
{
   void *p;
   void *q;
   int ret;

   // allocate some
   ret = posix_memalign(&p, 16, 1024);
   assert(ret == 0);
   assert(((size_t)p & 15) == 0);

   // leak some
   ret = posix_memalign(&q, 4096, 1024);
   assert(ret == 0);
   assert(((size_t)q & 4095) == 0);
   leak(q, 1024);

   // free some
   free(p);

   // allocate 0 bytes
   ret = posix_memalign(&p, sizeof (void*), 0);
   assert(ret == 0);
   assert(p);
   free(p);

   // bogus alignment
   p = NULL;
   ret = posix_memalign(&p, 24, 1024);
   assert(ret != 0);
   assert(p == NULL);

   p = aligned_alloc(64, 256);
   assert(((size_t)p & 63) == 0);
   assert(malloc_usable_size(p) >= 256);
   free(p);

   (void)ret;
}


static void
test_cxx(void)
{
   char *p;
   char *q;

   // allocate some
   p = new char;
   q = new char[512];

   char *r = new char;
   char *s = new char[512];

   // free out of order
   delete [] q;
   delete r;
   delete p;
   delete [] s;
}


static void
test_string(void)
{
   char *p;
   int n;

   p = strdup("foo");
   free(p);

   p = NULL;
   n = asprintf(&p, "%u", 12345);
   assert(n == 5);

   free(p);

   (void)n;
}


int
main(int argc, char *argv[])
{
   const char *svg = argc > 1 ? argv[1] : "heapsnap.svg";
   const char *pb = argc > 2 ? argv[2] : "heapsnap.pb.gz";

   heapsnap::Report report = [] {
      heapsnap::HeapProfilerSession session = heapsnap::HeapProfilerSession::begin(1, true);

      test_dlsym();
      test_malloc();
      test_calloc();
      test_realloc();
      test_memalign();
      test_cxx();
      test_string();

      return session.report();
   }();

   int64_t in_use = 0;
   for (size_t i = 0; i < report.entries().size(); ++i) {
      in_use += report.entries()[i].counts.in_use_bytes();
   }

   printf("Sampled %zu stacks, %lld bytes in use, should leak %zu bytes...\n",
          report.entries().size(), (long long)in_use, leaked);

   try {
      std::ofstream os(svg);
      heapsnap::FlamegraphOptions options;
      options.title = "sample";
      report.flamegraph(os, options);

      report.write_pprof(pb);
   } catch (const std::exception &e) {
      fprintf(stderr, "sample: %s\n", e.what());
      return EXIT_FAILURE;
   }

   for (size_t i = 0; i < leaks.size(); ++i) {
      free(leaks[i]);
   }

   return 0;
}


// vim:set sw=3 ts=3 et:
