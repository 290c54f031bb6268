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


#include <new>

#include "block.h"
#include "sysalloc.h"


namespace heapsnap {


Block
Block::fresh(void *base, void *raw)
{
   BlockHeader *hdr = (BlockHeader *)base;
   hdr->size = 0;
   hdr->frames = nullptr;
   hdr->ptr = raw;
   hdr->magic = MAGIC;
   hdr->sampled = 0;
   hdr->generation = 0;
   return Block(hdr);
}


size_t
Block::set_size(size_t size)
{
   size_t old_size = _header->size;
   _header->size = size;
   return old_size;
}


void
Block::rebase(void *raw)
{
   _header = (BlockHeader *)raw;
   _header->ptr = raw;
}


bool
Block::check(void) const
{
#if HEAPSNAP_MAGIC
   return _header->magic == MAGIC;
#else
   return true;
#endif
}


StackRecord
Block::attach_stack(bool capture_if_missing)
{
   if (_header->frames) {
      return *_header->frames;
   }

   if (!capture_if_missing) {
      return StackRecord();
   }

   StackRecord stack = StackRecord::capture_unsynchronised();

   // Keep a copy for the eventual free.  Losing it only costs the free-side
   // attribution of this block.
   void *storage = SysAlloc::raw_alloc(sizeof(StackRecord));
   if (storage) {
      _header->frames = new (storage) StackRecord(stack);
   }

   return stack;
}


void
Block::restamp(uint32_t generation)
{
   if (_header->generation != generation) {
      _release_frames();
      _header->sampled = 0;
      _header->generation = generation;
   }
}


void
Block::_release_frames(void)
{
   if (_header->frames) {
      _header->frames->~StackRecord();
      SysAlloc::raw_free(_header->frames);
      _header->frames = nullptr;
   }
}


void
Block::drop(void)
{
   _release_frames();
   _header->sampled = 0;
   _header->magic = 0;
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
