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


#include <pthread.h>

#include <algorithm>
#include <atomic>
#include <new>

#include "block.h"
#include "log.h"
#include "profiler.h"


namespace heapsnap {


static thread_local bool
in_profiler __attribute__ ((tls_model("initial-exec"))) = false;

static std::atomic<bool>
enabled_flag(false);


ReentrancyGuard::ReentrancyGuard() :
   _reentered(in_profiler)
{
   in_profiler = true;
}


ReentrancyGuard::~ReentrancyGuard()
{
   in_profiler = _reentered;
}


class ReadLock
{
   pthread_rwlock_t *_lock;

public:
   explicit inline
   ReadLock(pthread_rwlock_t *lock) :
      _lock(lock)
   {
      int ret = pthread_rwlock_rdlock(_lock);
      HEAPSNAP_ASSERT(ret == 0);
      (void)ret;
   }

   inline
   ~ReadLock() {
      pthread_rwlock_unlock(_lock);
   }
};


class WriteLock
{
   pthread_rwlock_t *_lock;

public:
   explicit inline
   WriteLock(pthread_rwlock_t *lock) :
      _lock(lock)
   {
      int ret = pthread_rwlock_wrlock(_lock);
      HEAPSNAP_ASSERT(ret == 0);
      (void)ret;
   }

   inline
   ~WriteLock() {
      pthread_rwlock_unlock(_lock);
   }
};


bool
Collector::record(const StackRecord &stack, ssize_t delta) noexcept
{
   if (delta == 0) {
      return true;
   }

   try {
      ProfileEntry &entry = _map[stack];
      if (delta > 0) {
         entry.alloc_bytes += delta;
         entry.alloc_objects += 1;
      } else {
         entry.free_bytes += -delta;
         entry.free_objects += 1;
      }
   } catch (const std::bad_alloc &) {
      return false;
   }

   return true;
}


void
Collector::clear(void)
{
   Map().swap(_map);
}


struct ProfilerState
{
   pthread_rwlock_t lock;

   // Sample every period bytes
   std::atomic<size_t> period;

   std::atomic<bool> measure_free;

   // Bumped on every start, so blocks can tell which session sampled them
   std::atomic<uint32_t> generation;

   std::atomic<int64_t> allocated_bytes;
   std::atomic<int64_t> allocated_objects;

   // Take a sample when allocated_bytes crosses this threshold
   std::atomic<int64_t> next_sample;

   Collector collector;

   ProfilerState() :
      period(1),
      measure_free(false),
      generation(0),
      allocated_bytes(0),
      allocated_objects(0),
      next_sample(1)
   {
      pthread_rwlock_init(&lock, nullptr);
   }
};


/**
 * Constructed on first use and never destroyed: blocks keep being freed
 * after static destructors have run.
 */
static ProfilerState &
_state(void)
{
   alignas(ProfilerState) static unsigned char storage[sizeof(ProfilerState)];
   static ProfilerState *state = new (storage) ProfilerState;
   return *state;
}


void
Profiler::start(size_t period, bool measure_free)
{
   if (period == 0) {
      period = 1;
   }

   ReentrancyGuard guard;
   ProfilerState &state = _state();

   {
      WriteLock lock(&state.lock);

      state.collector.clear();

      uint32_t generation = state.generation.load() + 1;
      if (generation == 0) {
         // Zero is what fresh blocks carry.
         ++generation;
      }
      state.generation.store(generation);

      state.period.store(period);
      state.measure_free.store(measure_free);
      state.allocated_bytes.store(0);
      state.allocated_objects.store(0);
      state.next_sample.store((int64_t)period);
   }

   enabled_flag.store(true, std::memory_order_seq_cst);

   HEAPSNAP_TRACE(1, "start period=%zu measure_free=%d", period, (int)measure_free);
}


void
Profiler::stop(void)
{
   enabled_flag.store(false, std::memory_order_seq_cst);

   HEAPSNAP_TRACE(1, "stop");
}


bool
Profiler::enabled(void)
{
   return enabled_flag.load(std::memory_order_seq_cst);
}


size_t
Profiler::period(void)
{
   return _state().period.load();
}


bool
Profiler::measure_free(void)
{
   return _state().measure_free.load();
}


void
Profiler::on_alloc(ssize_t delta, Block *block) noexcept
{
   ReentrancyGuard guard;
   if (guard.reentered()) {
      return;
   }

   if (!enabled() || delta == 0) {
      return;
   }

   ProfilerState &state = _state();

   if (delta > 0) {
      uint32_t generation;
      {
         WriteLock lock(&state.lock);

         int64_t allocated = state.allocated_bytes.fetch_add(delta) + delta;
         state.allocated_objects.fetch_add(1);

         if (allocated < state.next_sample.load()) {
            return;
         }
         state.next_sample.store(allocated + (int64_t)state.period.load());
         generation = state.generation.load();
      }

      // Unwinding takes the loader lock, and a thread inside dlopen holds
      // that lock while it allocates, so no lock of ours may be held here.
      StackRecord stack;
      if (block) {
         // Keep the stack in the block, so its free lands on the same entry.
         block->restamp(generation);
         stack = block->attach_stack(true);
      } else {
         stack = StackRecord::capture_unsynchronised();
      }

      WriteLock lock(&state.lock);

      // A restart in between discarded the session this sample was taken in.
      if (state.generation.load() != generation) {
         return;
      }

      if (state.collector.record(stack, delta) && block && block->has_stack()) {
         block->set_sampled(block->sampled() + delta);
      }
      return;
   }

   if (!block || !state.measure_free.load()) {
      return;
   }

   // Frees are charged to the allocation site, and only up to what was
   // sampled for this block in this session.
   if (block->generation() != state.generation.load() ||
       !block->has_stack() ||
       block->sampled() == 0) {
      return;
   }

   size_t freed = std::min((size_t)-delta, block->sampled());
   StackRecord stack = block->attach_stack(false);

   WriteLock lock(&state.lock);
   if (block->generation() == state.generation.load() &&
       state.collector.record(stack, -(ssize_t)freed)) {
      block->set_sampled(block->sampled() - freed);
   }
}


ProfileSnapshot
Profiler::snapshot(void)
{
   ReentrancyGuard guard;
   ProfilerState &state = _state();

   ProfileSnapshot snapshot;

   ReadLock lock(&state.lock);

   snapshot.period = state.period.load();
   snapshot.allocated_bytes = state.allocated_bytes.load();
   snapshot.allocated_objects = state.allocated_objects.load();

   const Collector::Map &map = state.collector.map();
   snapshot.entries.reserve(map.size());
   for (Collector::Map::const_iterator it = map.begin(); it != map.end(); ++it) {
      snapshot.entries.push_back(*it);
   }

   return snapshot;
}


/*
 * Session
 */


HeapProfilerSession::HeapProfilerSession() :
   _active(true)
{
}


HeapProfilerSession::HeapProfilerSession(HeapProfilerSession &&other) noexcept :
   _active(other._active)
{
   other._active = false;
}


HeapProfilerSession
HeapProfilerSession::begin(size_t period, bool measure_free)
{
   Profiler::start(period, measure_free);
   return HeapProfilerSession();
}


HeapProfilerSession::~HeapProfilerSession()
{
   if (_active) {
      Profiler::stop();
   }
}


Report
HeapProfilerSession::report(void)
{
   if (_active) {
      Profiler::stop();
      _active = false;
   }
   return Report::snapshot();
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
