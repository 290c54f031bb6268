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


#include <gtest/gtest.h>

#include "profiler.h"


using heapsnap::Collector;
using heapsnap::ProfileEntry;
using heapsnap::StackRecord;


static StackRecord
make_stack(uintptr_t a, uintptr_t b)
{
   StackRecord stack;
   stack.push(a + 4, a);
   stack.push(b + 8, b);
   return stack;
}


TEST(Collector, RecordAllocation)
{
   Collector collector;
   StackRecord stack = make_stack(0x1000, 0x2000);

   EXPECT_TRUE(collector.record(stack, 100));
   EXPECT_TRUE(collector.record(stack, 28));

   ASSERT_EQ(collector.size(), 1u);
   const ProfileEntry &entry = collector.map().at(stack);
   EXPECT_EQ(entry.alloc_bytes, 128);
   EXPECT_EQ(entry.alloc_objects, 2);
   EXPECT_EQ(entry.free_bytes, 0);
   EXPECT_EQ(entry.free_objects, 0);
   EXPECT_EQ(entry.in_use_bytes(), 128);
   EXPECT_EQ(entry.in_use_objects(), 2);
}


TEST(Collector, RecordFree)
{
   Collector collector;
   StackRecord stack = make_stack(0x1000, 0x2000);

   collector.record(stack, 64);
   collector.record(stack, -64);

   const ProfileEntry &entry = collector.map().at(stack);
   EXPECT_EQ(entry.alloc_bytes, 64);
   EXPECT_EQ(entry.free_bytes, 64);
   EXPECT_EQ(entry.free_objects, 1);
   EXPECT_EQ(entry.in_use_bytes(), 0);
   EXPECT_EQ(entry.in_use_objects(), 0);
}


TEST(Collector, ZeroDeltaIsIgnored)
{
   Collector collector;

   EXPECT_TRUE(collector.record(make_stack(0x1000, 0x2000), 0));
   EXPECT_EQ(collector.size(), 0u);
}


TEST(Collector, StacksAreKeyedBySymbol)
{
   Collector collector;

   // Same functions, different call offsets.
   StackRecord a;
   a.push(0x1010, 0x1000);
   StackRecord b;
   b.push(0x1020, 0x1000);
   StackRecord c;
   c.push(0x3010, 0x3000);

   collector.record(a, 1);
   collector.record(b, 2);
   collector.record(c, 4);

   ASSERT_EQ(collector.size(), 2u);
   EXPECT_EQ(collector.map().at(a).alloc_bytes, 3);
   EXPECT_EQ(collector.map().at(c).alloc_bytes, 4);
}


TEST(Collector, EmptyStackIsAKey)
{
   Collector collector;

   collector.record(StackRecord(), 16);

   ASSERT_EQ(collector.size(), 1u);
   EXPECT_EQ(collector.map().at(StackRecord()).alloc_bytes, 16);
}


TEST(Collector, Clear)
{
   Collector collector;
   collector.record(make_stack(0x1000, 0x2000), 10);
   collector.record(make_stack(0x1000, 0x3000), 10);
   ASSERT_EQ(collector.size(), 2u);

   collector.clear();

   EXPECT_EQ(collector.size(), 0u);
   EXPECT_TRUE(collector.map().empty());
}


// vim:set sw=3 ts=3 et:
