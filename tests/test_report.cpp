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


#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <zlib.h>

#include "profile.pb.h"
#include "heapsnap.h"
#include "util.h"


using heapsnap::FdSink;
using heapsnap::FlamegraphOptions;
using heapsnap::HeapProfilerSession;
using heapsnap::OstreamSink;
using heapsnap::Report;
using heapsnap::ReportSink;


extern "C" NOINLINE void *
report_site_leaf(size_t size)
{
   void *p = malloc(size);
   KEEP_FRAME();
   return p;
}


extern "C" NOINLINE void *
report_site_outer(size_t size)
{
   void *p = report_site_leaf(size);
   KEEP_FRAME();
   return p;
}


extern "C" NOINLINE void *
report_site_other(size_t size)
{
   void *p = malloc(size);
   KEEP_FRAME();
   return p;
}


/**
 * Profile a few known sites.  Blocks allocated at report_site_other are
 * freed before the report.
 */
NOINLINE Report
profile_sites(void)
{
   HeapProfilerSession session = HeapProfilerSession::begin(1, true);

   void *a = report_site_outer(3000);
   void *b = report_site_outer(1000);
   void *c = report_site_other(500);
   free(c);

   Report report = session.report();

   free(a);
   free(b);

   return report;
}


static Report
empty_report(void)
{
   HeapProfilerSession session = HeapProfilerSession::begin((size_t)1 << 40);
   return session.report();
}


static std::string
render(const Report &report, const FlamegraphOptions &options = FlamegraphOptions())
{
   std::ostringstream os;
   report.flamegraph(os, options);
   return os.str();
}


static size_t
count(const std::string &haystack, const std::string &needle)
{
   size_t n = 0;
   for (size_t pos = haystack.find(needle); pos != std::string::npos;
        pos = haystack.find(needle, pos + needle.size())) {
      ++n;
   }
   return n;
}


class FailingSink : public ReportSink
{
public:
   void
   write(const void *, size_t) override {
      throw std::system_error(EIO, std::generic_category(), "sink");
   }
};


TEST(Report, EntriesAreSortedByBytes)
{
   Report report = profile_sites();

   ASSERT_FALSE(report.entries().empty());
   for (size_t i = 1; i < report.entries().size(); ++i) {
      EXPECT_GE(report.entries()[i - 1].counts.alloc_bytes,
                report.entries()[i].counts.alloc_bytes);
   }

   EXPECT_EQ(site_counts(report, "report_site_leaf").alloc_bytes, 4000);
   EXPECT_EQ(site_counts(report, "report_site_other").in_use_bytes(), 0);
   EXPECT_GT(report.time_nanos(), 0);
}


TEST(Report, FramesAreInnermostFirst)
{
   Report report = profile_sites();

   bool found = false;
   for (size_t i = 0; i < report.entries().size(); ++i) {
      const Report::Entry &entry = report.entries()[i];
      if (!has_frame(entry, "report_site_leaf")) {
         continue;
      }
      found = true;
      ASSERT_GE(entry.frames.size(), 2u);
      EXPECT_EQ(entry.frames[0].name, "report_site_leaf");
      EXPECT_EQ(entry.frames[1].name, "report_site_outer");
   }
   EXPECT_TRUE(found);
}


TEST(Flamegraph, Svg)
{
   Report report = profile_sites();

   FlamegraphOptions options;
   options.title = "Test <profile>";
   std::string svg = render(report, options);

   EXPECT_EQ(svg.compare(0, 5, "<?xml"), 0);
   EXPECT_NE(svg.find("<svg "), std::string::npos);
   EXPECT_NE(svg.find("</svg>\n"), std::string::npos);
   EXPECT_NE(svg.find("Test &lt;profile&gt;"), std::string::npos);
   EXPECT_EQ(svg.find("Test <profile>"), std::string::npos);

   // Both calls of report_site_outer merge into one frame.
   EXPECT_EQ(count(svg, "<title>report_site_outer ("), 1u);
   EXPECT_NE(svg.find("<title>report_site_leaf (4000 bytes"), std::string::npos);
   EXPECT_NE(svg.find("<title>report_site_other (500 bytes"), std::string::npos);
   EXPECT_NE(svg.find("<title>all ("), std::string::npos);

   // Internal frames never show.
   EXPECT_EQ(svg.find("heapsnap::"), std::string::npos);
   EXPECT_EQ(svg.find("<title>malloc ("), std::string::npos);

   EXPECT_EQ(count(svg, "<g>"), count(svg, "</g>"));
   EXPECT_EQ(count(svg, "<rect "), count(svg, "<g>") + 1);
}


TEST(Flamegraph, InUseMeasure)
{
   Report report = profile_sites();

   FlamegraphOptions options;
   options.measure = heapsnap::MEASURE_INUSE_SPACE;
   std::string svg = render(report, options);

   EXPECT_NE(svg.find("<title>report_site_leaf (4000 bytes"), std::string::npos);
   // Everything allocated there was freed.
   EXPECT_EQ(svg.find("report_site_other"), std::string::npos);
}


TEST(Flamegraph, Options)
{
   Report report = profile_sites();

   FlamegraphOptions options;
   options.count_name = "octets";
   options.palette = heapsnap::PALETTE_HOT;
   options.width = 800;
   std::string svg = render(report, options);

   EXPECT_NE(svg.find("width=\"800\""), std::string::npos);
   EXPECT_NE(svg.find("4000 octets"), std::string::npos);
   EXPECT_NE(svg.find("#eeeeb0"), std::string::npos);
}


TEST(Flamegraph, Deterministic)
{
   Report report = profile_sites();
   EXPECT_EQ(render(report), render(report));
}


TEST(Flamegraph, Empty)
{
   Report report = empty_report();
   ASSERT_TRUE(report.entries().empty());

   std::string svg = render(report);
   EXPECT_NE(svg.find("<svg "), std::string::npos);
   EXPECT_NE(svg.find("</svg>"), std::string::npos);
   EXPECT_EQ(svg.find("<g>"), std::string::npos);
}


TEST(Flamegraph, SinkErrorsPropagate)
{
   Report report = profile_sites();
   FailingSink sink;
   EXPECT_THROW(report.flamegraph(sink), std::system_error);
}


TEST(Flamegraph, BadStreamThrows)
{
   Report report = profile_sites();
   std::ostringstream os;
   os.setstate(std::ios::badbit);
   EXPECT_THROW(report.flamegraph(os), std::runtime_error);
}


TEST(Flamegraph, FdSink)
{
   Report report = profile_sites();

   int fds[2];
   ASSERT_EQ(pipe(fds), 0);
   // Big enough for the whole graph.
   fcntl(fds[1], F_SETPIPE_SZ, 1 << 20);

   {
      FdSink sink(fds[1]);
      report.flamegraph(sink);
   }
   close(fds[1]);

   std::string svg;
   char buf[4096];
   ssize_t n;
   while ((n = read(fds[0], buf, sizeof buf)) > 0) {
      svg.append(buf, n);
   }
   close(fds[0]);

   EXPECT_EQ(svg, render(report));
}


TEST(FdSink, BadDescriptor)
{
   EXPECT_THROW(FdSink sink(-1), std::system_error);
}


TEST(FdSink, WriteErrorThrows)
{
   int fd = open("/dev/full", O_WRONLY);
   if (fd < 0) {
      GTEST_SKIP() << "no /dev/full";
   }

   FdSink sink(fd);
   sink.write("hello", 5);
   try {
      sink.flush();
      ADD_FAILURE() << "flush to /dev/full succeeded";
   } catch (const std::system_error &e) {
      EXPECT_EQ(e.code().value(), ENOSPC);
   }
   close(fd);
}


TEST(Pprof, Profile)
{
   Report report = profile_sites();
   perftools::profiles::Profile profile = report.pprof();

   ASSERT_GT(profile.string_table_size(), 0);
   EXPECT_EQ(profile.string_table(0), "");

   ASSERT_EQ(profile.sample_type_size(), 1);
   EXPECT_EQ(profile.string_table(profile.sample_type(0).type()), "alloc_space");
   EXPECT_EQ(profile.string_table(profile.sample_type(0).unit()), "bytes");
   EXPECT_EQ(profile.string_table(profile.period_type().type()), "space");
   EXPECT_EQ(profile.string_table(profile.period_type().unit()), "bytes");
   EXPECT_EQ(profile.period(), 1);
   EXPECT_EQ(profile.string_table(profile.drop_frames()), "heapsnap::.*");
   EXPECT_EQ(profile.time_nanos(), report.time_nanos());

   EXPECT_EQ(profile.sample_size(), (int)report.entries().size());

   std::set<uint64_t> location_ids;
   std::set<uint64_t> addresses;
   for (int i = 0; i < profile.location_size(); ++i) {
      const perftools::profiles::Location &location = profile.location(i);
      EXPECT_TRUE(location_ids.insert(location.id()).second);
      EXPECT_TRUE(addresses.insert(location.address()).second);
      EXPECT_EQ(location.line_size(), 1);
   }

   std::set<uint64_t> function_ids;
   std::set<std::string> function_names;
   for (int i = 0; i < profile.function_size(); ++i) {
      const perftools::profiles::Function &function = profile.function(i);
      EXPECT_TRUE(function_ids.insert(function.id()).second);
      EXPECT_TRUE(function_names.insert(profile.string_table(function.name())).second);
   }
   EXPECT_TRUE(function_names.count("report_site_leaf"));
   EXPECT_TRUE(function_names.count("report_site_outer"));

   std::set<uint64_t> mapping_ids;
   for (int i = 0; i < profile.mapping_size(); ++i) {
      const perftools::profiles::Mapping &mapping = profile.mapping(i);
      EXPECT_TRUE(mapping_ids.insert(mapping.id()).second);
      EXPECT_LT(mapping.memory_start(), mapping.memory_limit());
   }
   EXPECT_GT(profile.mapping_size(), 0);

   int64_t total = 0;
   for (int i = 0; i < profile.sample_size(); ++i) {
      const perftools::profiles::Sample &sample = profile.sample(i);
      ASSERT_EQ(sample.value_size(), 1);
      total += sample.value(0);
      for (int j = 0; j < sample.location_id_size(); ++j) {
         EXPECT_TRUE(location_ids.count(sample.location_id(j)));
      }
   }

   int64_t expected = 0;
   for (size_t i = 0; i < report.entries().size(); ++i) {
      expected += report.entries()[i].counts.alloc_bytes;
   }
   EXPECT_EQ(total, expected);
}


TEST(Pprof, WriteGzip)
{
   Report report = profile_sites();

   char path[] = "/tmp/heapsnap-test-XXXXXX";
   int fd = mkstemp(path);
   ASSERT_GE(fd, 0);
   close(fd);

   report.write_pprof(path);

   gzFile file = gzopen(path, "rb");
   ASSERT_NE(file, nullptr);
   std::string data;
   char buf[4096];
   int n;
   while ((n = gzread(file, buf, sizeof buf)) > 0) {
      data.append(buf, n);
   }
   gzclose(file);

   // Check the file really is compressed.
   FILE *raw = fopen(path, "rb");
   ASSERT_NE(raw, nullptr);
   unsigned char magic[2] = {0, 0};
   EXPECT_EQ(fread(magic, 1, 2, raw), 2u);
   fclose(raw);
   EXPECT_EQ(magic[0], 0x1f);
   EXPECT_EQ(magic[1], 0x8b);

   unlink(path);

   perftools::profiles::Profile profile;
   ASSERT_TRUE(profile.ParseFromString(data));
   EXPECT_EQ(profile.period(), 1);
   EXPECT_EQ(profile.sample_size(), (int)report.entries().size());
}


TEST(Pprof, WriteToBadPathThrows)
{
   Report report = empty_report();
   EXPECT_THROW(report.write_pprof("/nonexistent-dir/heapsnap.pb.gz"), std::system_error);
}


TEST(Pprof, EmptyReport)
{
   Report report = empty_report();
   perftools::profiles::Profile profile = report.pprof();

   EXPECT_EQ(profile.sample_size(), 0);
   EXPECT_EQ(profile.period(), (int64_t)1 << 40);
   EXPECT_EQ(profile.sample_type_size(), 1);
}


// vim:set sw=3 ts=3 et:
