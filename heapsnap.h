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


#ifndef _HEAPSNAP_H_
#define _HEAPSNAP_H_


#include <stddef.h>
#include <stdint.h>

#include <ostream>
#include <string>
#include <vector>


#ifndef HEAPSNAP_MEASURE_FREE_DEFAULT
#define HEAPSNAP_MEASURE_FREE_DEFAULT false
#endif


namespace perftools {
namespace profiles {
class Profile;
}
}


namespace heapsnap {


/**
 * Aggregated counters of one allocation site.
 */
struct ProfileEntry
{
   int64_t alloc_bytes;
   int64_t alloc_objects;
   int64_t free_bytes;
   int64_t free_objects;

   ProfileEntry() :
      alloc_bytes(0),
      alloc_objects(0),
      free_bytes(0),
      free_objects(0)
   {
   }

   inline int64_t
   in_use_bytes(void) const {
      return alloc_bytes - free_bytes;
   }

   inline int64_t
   in_use_objects(void) const {
      return alloc_objects - free_objects;
   }
};


/**
 * One symbolised stack frame.
 */
struct Frame
{
   uintptr_t address;
   std::string name;
   std::string module;
   uintptr_t module_base;
};


/**
 * Destination of report bytes.
 */
class ReportSink
{
public:
   virtual ~ReportSink() {}

   /**
    * Throws std::system_error or std::runtime_error on failure.
    */
   virtual void
   write(const void *buf, size_t nbytes) = 0;

   virtual void
   flush(void) {}
};


/**
 * Buffered writes to a file descriptor.  The descriptor is not owned.
 */
class FdSink : public ReportSink
{
protected:
   int _fd;
   char _buf[4096];
   size_t _written;

public:
   explicit FdSink(int fd);

   void
   write(const void *buf, size_t nbytes) override;

   void
   flush(void) override;
};


class OstreamSink : public ReportSink
{
protected:
   std::ostream &_os;

public:
   explicit OstreamSink(std::ostream &os) :
      _os(os)
   {
   }

   void
   write(const void *buf, size_t nbytes) override;

   void
   flush(void) override;
};


enum Palette
{
   PALETTE_MEM,
   PALETTE_HOT,
};


enum Measure
{
   MEASURE_ALLOC_SPACE,
   MEASURE_INUSE_SPACE,
};


struct FlamegraphOptions
{
   std::string title;

   // Unit shown in frame tooltips
   std::string count_name;

   Palette palette;

   // Which counter sizes the frames
   Measure measure;

   unsigned width;
   unsigned frame_height;
   unsigned font_size;

   // Frames narrower than this many pixels are omitted
   double min_width;

   FlamegraphOptions();
};


/**
 * Point-in-time copy of the profiler's aggregation table, with symbolised
 * stacks.
 */
class Report
{
public:
   struct Entry
   {
      // Innermost first, internal frames removed
      std::vector<Frame> frames;
      ProfileEntry counts;
   };

   /**
    * Read the collector under its lock.  Does not stop the profiler.
    */
   static Report
   snapshot(void);

   inline const std::vector<Entry> &
   entries(void) const {
      return _entries;
   }

   inline size_t
   period(void) const {
      return _period;
   }

   inline int64_t
   allocated_bytes(void) const {
      return _allocated_bytes;
   }

   inline int64_t
   allocated_objects(void) const {
      return _allocated_objects;
   }

   inline int64_t
   time_nanos(void) const {
      return _time_nanos;
   }

   /**
    * Render an SVG flamegraph.
    */
   void
   flamegraph(ReportSink &sink,
              const FlamegraphOptions &options = FlamegraphOptions()) const;

   void
   flamegraph(std::ostream &os,
              const FlamegraphOptions &options = FlamegraphOptions()) const;

   /**
    * Build a pprof profile, for use with go tool pprof and compatible
    * viewers.
    */
   perftools::profiles::Profile
   pprof(void) const;

   /**
    * Write the pprof profile gzip-compressed, as pprof tools expect it.
    */
   void
   write_pprof(const char *filename) const;

private:
   Report();

   size_t _period;
   int64_t _allocated_bytes;
   int64_t _allocated_objects;
   int64_t _time_nanos;
   std::vector<Entry> _entries;
};


/**
 * Scoped profiling session.  The profiler runs from begin() until report()
 * is called or the session goes out of scope, whichever comes first.
 */
class HeapProfilerSession
{
public:
   /**
    * Start sampling every period bytes.  A period of 1 samples every
    * allocation.  When measure_free is set, frees of sampled blocks are
    * charged back to their allocation site.
    */
   static HeapProfilerSession
   begin(size_t period, bool measure_free = HEAPSNAP_MEASURE_FREE_DEFAULT);

   HeapProfilerSession(HeapProfilerSession &&other) noexcept;

   HeapProfilerSession(const HeapProfilerSession &) = delete;
   HeapProfilerSession &operator = (const HeapProfilerSession &) = delete;

   ~HeapProfilerSession();

   /**
    * Stop the profiler and take the final report.  The session is over
    * afterwards.
    */
   Report
   report(void);

   inline bool
   active(void) const {
      return _active;
   }

private:
   HeapProfilerSession();

   bool _active;
};


} /* namespace heapsnap */


#endif /* _HEAPSNAP_H_ */
