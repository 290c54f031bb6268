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
#include <link.h>

#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

#include <zlib.h>

#include "heapsnap.h"
#include "profile.pb.h"


namespace heapsnap {


namespace {


/**
 * Frames of the profiler itself.  Reports already leave them out, so this
 * only matters to viewers that merge our profile with raw stacks.
 */
const char *
drop_frames = "heapsnap::.*";


class StringTable
{
   perftools::profiles::Profile &_profile;
   std::unordered_map<std::string, int64_t> _index;

public:
   explicit StringTable(perftools::profiles::Profile &profile) :
      _profile(profile)
   {
      intern("");
   }

   int64_t
   intern(const std::string &s) {
      std::unordered_map<std::string, int64_t>::const_iterator it = _index.find(s);
      if (it != _index.end()) {
         return it->second;
      }
      int64_t id = _profile.string_table_size();
      _profile.add_string_table(s);
      _index[s] = id;
      return id;
   }
};


struct ModuleRange
{
   uintptr_t base;
   uintptr_t start;
   uintptr_t limit;
   uint64_t file_offset;
   bool found;
};


/**
 * Find the loaded segments of the object that contains range->base.
 */
int
_find_module(struct dl_phdr_info *info, size_t size, void *data)
{
   (void)size;
   ModuleRange *range = (ModuleRange *)data;

   bool contains = false;
   uintptr_t start = UINTPTR_MAX;
   uintptr_t limit = 0;
   uint64_t file_offset = 0;
   for (ElfW(Half) i = 0; i < info->dlpi_phnum; ++i) {
      const ElfW(Phdr) &phdr = info->dlpi_phdr[i];
      if (phdr.p_type != PT_LOAD) {
         continue;
      }
      uintptr_t seg_start = info->dlpi_addr + phdr.p_vaddr;
      uintptr_t seg_limit = seg_start + phdr.p_memsz;
      if (range->base >= seg_start && range->base < seg_limit) {
         contains = true;
      }
      if (seg_start < start) {
         start = seg_start;
         file_offset = phdr.p_offset;
      }
      if (seg_limit > limit) {
         limit = seg_limit;
      }
   }

   if (!contains) {
      return 0;
   }

   range->start = start;
   range->limit = limit;
   range->file_offset = file_offset;
   range->found = true;
   return 1;
}


} /* anonymous namespace */


perftools::profiles::Profile
Report::pprof(void) const
{
   perftools::profiles::Profile profile;
   StringTable strings(profile);

   perftools::profiles::ValueType *sample_type = profile.add_sample_type();
   sample_type->set_type(strings.intern("alloc_space"));
   sample_type->set_unit(strings.intern("bytes"));

   perftools::profiles::ValueType *period_type = profile.mutable_period_type();
   period_type->set_type(strings.intern("space"));
   period_type->set_unit(strings.intern("bytes"));

   profile.set_period((int64_t)_period);
   profile.set_drop_frames(strings.intern(drop_frames));
   profile.set_time_nanos(_time_nanos);

   std::map<uintptr_t, uint64_t> mappings;
   std::map<std::string, uint64_t> functions;
   std::map<uintptr_t, uint64_t> locations;

   for (size_t i = 0; i < _entries.size(); ++i) {
      const Entry &entry = _entries[i];

      perftools::profiles::Sample *sample = profile.add_sample();
      sample->add_value(entry.counts.alloc_bytes);

      // Frames are already innermost first, which is the order pprof wants.
      for (size_t j = 0; j < entry.frames.size(); ++j) {
         const Frame &frame = entry.frames[j];

         std::map<uintptr_t, uint64_t>::const_iterator loc = locations.find(frame.address);
         if (loc != locations.end()) {
            sample->add_location_id(loc->second);
            continue;
         }

         uint64_t mapping_id = 0;
         if (frame.module_base) {
            std::map<uintptr_t, uint64_t>::const_iterator it = mappings.find(frame.module_base);
            if (it != mappings.end()) {
               mapping_id = it->second;
            } else {
               mapping_id = mappings.size() + 1;
               mappings[frame.module_base] = mapping_id;

               ModuleRange range = {frame.module_base, 0, 0, 0, false};
               dl_iterate_phdr(_find_module, &range);

               perftools::profiles::Mapping *mapping = profile.add_mapping();
               mapping->set_id(mapping_id);
               if (range.found) {
                  mapping->set_memory_start(range.start);
                  mapping->set_memory_limit(range.limit);
                  mapping->set_file_offset(range.file_offset);
               } else {
                  mapping->set_memory_start(frame.module_base);
               }
               mapping->set_filename(strings.intern(frame.module));
               mapping->set_has_functions(true);
            }
         }

         uint64_t function_id;
         std::map<std::string, uint64_t>::const_iterator fn = functions.find(frame.name);
         if (fn != functions.end()) {
            function_id = fn->second;
         } else {
            function_id = functions.size() + 1;
            functions[frame.name] = function_id;

            perftools::profiles::Function *function = profile.add_function();
            function->set_id(function_id);
            function->set_name(strings.intern(frame.name));
            function->set_system_name(function->name());
         }

         uint64_t location_id = locations.size() + 1;
         locations[frame.address] = location_id;

         perftools::profiles::Location *location = profile.add_location();
         location->set_id(location_id);
         location->set_mapping_id(mapping_id);
         location->set_address(frame.address);
         location->add_line()->set_function_id(function_id);

         sample->add_location_id(location_id);
      }
   }

   return profile;
}


void
Report::write_pprof(const char *filename) const
{
   std::string data;
   if (!pprof().SerializeToString(&data)) {
      throw std::runtime_error("heapsnap: failed to serialise profile");
   }

   errno = 0;
   gzFile file = gzopen(filename, "wb");
   if (!file) {
      throw std::system_error(errno ? errno : ENOMEM, std::generic_category(),
                              std::string("heapsnap: ") + filename);
   }

   const char *p = data.data();
   size_t remaining = data.size();
   while (remaining) {
      unsigned chunk = remaining > (1U << 30) ? (1U << 30) : (unsigned)remaining;
      int written = gzwrite(file, p, chunk);
      if (written <= 0) {
         int err = errno ? errno : EIO;
         gzclose(file);
         throw std::system_error(err, std::generic_category(),
                                 std::string("heapsnap: ") + filename);
      }
      p += written;
      remaining -= (size_t)written;
   }

   if (gzclose(file) != Z_OK) {
      throw std::system_error(errno ? errno : EIO, std::generic_category(),
                              std::string("heapsnap: ") + filename);
   }
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
