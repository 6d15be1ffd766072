// This file tests plenum::FrameAllocator

#include <gtest/gtest.h>
#include <plenum/FrameAllocator.hpp>
#include <plenum/Logger.hpp>
#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <algorithm>
#include <string>
#include <thread>
#include <vector>


class FrameAllocatorTest : public ::testing::Test {
 public:
  void SetUp() override {
    // Make it so we only get warnings
    plenum::set_log_level(LOG_WARN);
  }
  void TearDown() override {}

  // 1MiB of 4k frames at physical address zero.
  plenum::FrameAllocator frames{1024 * 1024, 4096, 0};
};



TEST_F(FrameAllocatorTest, Geometry) {
  ASSERT_EQ(frames.total_frames(), 256);
  ASSERT_EQ(frames.free_frames(), 256);
  ASSERT_EQ(frames.used_frames(), 0);
  ASSERT_EQ(frames.page_size(), 4096);
  ASSERT_EQ(frames.base_address(), 0);
}


TEST_F(FrameAllocatorTest, LowestFrameFirst) {
  ASSERT_EQ(frames.allocate_frame().unwrap(), 0);
  ASSERT_EQ(frames.allocate_frame().unwrap(), 4096);
  ASSERT_EQ(frames.allocate_frame().unwrap(), 8192);

  ASSERT_TRUE(frames.deallocate_frame(4096).ok());
  // The hole is reused before anything higher up.
  ASSERT_EQ(frames.allocate_frame().unwrap(), 4096);
  ASSERT_EQ(frames.used_frames(), 3);
}


TEST_F(FrameAllocatorTest, BaseAddressOffset) {
  plenum::FrameAllocator high(16 * 4096, 4096, 0x100000);
  ASSERT_EQ(high.allocate_frame().unwrap(), 0x100000);
  ASSERT_EQ(high.allocate_frame().unwrap(), 0x101000);

  auto below = high.deallocate_frame(0x1000);
  ASSERT_FALSE(below);
  ASSERT_EQ(below.error().kind, plenum::ErrorKind::InvalidAddress);
}


TEST_F(FrameAllocatorTest, DefaultPageSize) {
  auto f = plenum::FrameAllocator::with_default_page_size(64 * 1024);
  ASSERT_EQ(f.page_size(), plenum::default_page_size);
  ASSERT_EQ(f.total_frames(), 16);
}


TEST_F(FrameAllocatorTest, PartialFrameIsDropped) {
  plenum::FrameAllocator f(3 * 4096 + 100, 4096, 0);
  ASSERT_EQ(f.total_frames(), 3);
}


TEST_F(FrameAllocatorTest, ExhaustionWithTailPadding) {
  // 100 frames is one full word plus 36 bits of a second. The padding bits in the second word
  // are clear, but they are not frames.
  plenum::FrameAllocator f(100 * 4096, 4096, 0);
  for (int i = 0; i < 100; i++) {
    ASSERT_TRUE(f.allocate_frame().ok());
  }
  auto r = f.allocate_frame();
  ASSERT_FALSE(r);
  ASSERT_EQ(r.error().kind, plenum::ErrorKind::FrameExhausted);
  ASSERT_EQ(f.free_frames(), 0);
}


TEST_F(FrameAllocatorTest, ExhaustionWithFullWords) {
  plenum::FrameAllocator f(64 * 4096, 4096, 0);
  for (int i = 0; i < 64; i++) {
    ASSERT_TRUE(f.allocate_frame().ok());
  }
  ASSERT_EQ(f.allocate_frame().error().kind, plenum::ErrorKind::FrameExhausted);
}


TEST_F(FrameAllocatorTest, FreeInAnyOrderRestoresEverything) {
  std::vector<uintptr_t> first;
  for (int i = 0; i < 100; i++) {
    first.push_back(frames.allocate_frame().unwrap());
  }

  // Free evens ascending, then odds descending
  for (size_t i = 0; i < first.size(); i += 2) {
    ASSERT_TRUE(frames.deallocate_frame(first[i]).ok());
  }
  for (size_t i = first.size() - 1; i < first.size(); i -= 2) {
    ASSERT_TRUE(frames.deallocate_frame(first[i]).ok());
  }
  ASSERT_EQ(frames.free_frames(), frames.total_frames());

  // And the same sequence comes back out.
  for (int i = 0; i < 100; i++) {
    ASSERT_EQ(frames.allocate_frame().unwrap(), first[i]);
  }
}


TEST_F(FrameAllocatorTest, DoubleFree) {
  uintptr_t a = frames.allocate_frame().unwrap();
  ASSERT_TRUE(frames.deallocate_frame(a).ok());

  size_t before = frames.free_frames();
  auto r = frames.deallocate_frame(a);
  ASSERT_FALSE(r);
  ASSERT_EQ(r.error().kind, plenum::ErrorKind::DoubleFree);
  ASSERT_EQ(r.error().address, a);
  ASSERT_EQ(frames.free_frames(), before);

  // Never allocated at all is a double free too
  ASSERT_EQ(frames.deallocate_frame(0x80000).error().kind, plenum::ErrorKind::DoubleFree);
  ASSERT_EQ(frames.free_frames(), before);
}


TEST_F(FrameAllocatorTest, DeallocateBadAddresses) {
  frames.allocate_frame().unwrap();

  auto misaligned = frames.deallocate_frame(100);
  ASSERT_EQ(misaligned.error().kind, plenum::ErrorKind::InvalidAlignment);
  ASSERT_EQ(misaligned.error().address, 100);

  auto beyond = frames.deallocate_frame(256 * 4096);
  ASSERT_EQ(beyond.error().kind, plenum::ErrorKind::InvalidAddress);
  ASSERT_EQ(frames.used_frames(), 1);
}


TEST_F(FrameAllocatorTest, ContiguousRoundTrip) {
  frames.allocate_frame().unwrap();
  size_t before = frames.free_frames();

  uintptr_t run = frames.allocate_contiguous(8).unwrap();
  ASSERT_EQ(run, 4096);
  ASSERT_EQ(frames.free_frames(), before - 8);

  ASSERT_TRUE(frames.deallocate_contiguous(run, 8).ok());
  ASSERT_EQ(frames.free_frames(), before);
}


TEST_F(FrameAllocatorTest, ContiguousSkipsShortRuns) {
  // used, free, used, free x3, ...
  uintptr_t a = frames.allocate_frame().unwrap();
  uintptr_t b = frames.allocate_frame().unwrap();
  frames.allocate_frame().unwrap();
  (void)a;
  ASSERT_TRUE(frames.deallocate_frame(b).ok());

  // A single frame fits in the hole at `b`, a run of two does not.
  uintptr_t run = frames.allocate_contiguous(2).unwrap();
  ASSERT_EQ(run, 3 * 4096);
  ASSERT_EQ(frames.allocate_contiguous(1).unwrap(), b);
}


TEST_F(FrameAllocatorTest, ContiguousZeroCount) {
  auto r = frames.allocate_contiguous(0);
  ASSERT_FALSE(r);
  ASSERT_EQ(r.error().kind, plenum::ErrorKind::InvalidAlignment);
  ASSERT_EQ(r.error().address, 0);
  ASSERT_EQ(frames.used_frames(), 0);
}


TEST_F(FrameAllocatorTest, ContiguousTooLarge) {
  auto r = frames.allocate_contiguous(257);
  ASSERT_EQ(r.error().kind, plenum::ErrorKind::OutOfMemory);

  // Free frames that are not adjacent do not make a run.
  for (int i = 0; i < 256; i++)
    frames.allocate_frame().unwrap();
  for (int i = 0; i < 256; i += 2)
    ASSERT_TRUE(frames.deallocate_frame(i * 4096).ok());
  ASSERT_EQ(frames.free_frames(), 128);
  ASSERT_EQ(frames.allocate_contiguous(2).error().kind, plenum::ErrorKind::OutOfMemory);
  ASSERT_EQ(frames.free_frames(), 128);
}


TEST_F(FrameAllocatorTest, DeallocateContiguousStopsAtFirstFailure) {
  uintptr_t run = frames.allocate_contiguous(4).unwrap();
  ASSERT_TRUE(frames.deallocate_frame(run + 2 * 4096).ok());

  // Frames 0 and 1 are freed, frame 2 is a double free, frame 3 is left alone.
  auto r = frames.deallocate_contiguous(run, 4);
  ASSERT_FALSE(r);
  ASSERT_EQ(r.error().kind, plenum::ErrorKind::DoubleFree);
  ASSERT_EQ(r.error().address, run + 2 * 4096);

  ASSERT_FALSE(frames.is_allocated(run).unwrap());
  ASSERT_FALSE(frames.is_allocated(run + 4096).unwrap());
  ASSERT_TRUE(frames.is_allocated(run + 3 * 4096).unwrap());
  ASSERT_EQ(frames.used_frames(), 1);
}


TEST_F(FrameAllocatorTest, ReserveRange) {
  ASSERT_TRUE(frames.reserve_range(0x10000, 3 * 4096 + 1).ok());
  ASSERT_EQ(frames.used_frames(), 4);
  ASSERT_TRUE(frames.is_allocated(0x10000).unwrap());
  ASSERT_TRUE(frames.is_allocated(0x13000).unwrap());
  ASSERT_FALSE(frames.is_allocated(0x14000).unwrap());

  // Allocation goes around the reservation.
  ASSERT_EQ(frames.allocate_contiguous(16).unwrap(), 0);
  ASSERT_EQ(frames.allocate_frame().unwrap(), 0x14000);
}


TEST_F(FrameAllocatorTest, ReserveRangeIsAllOrNothing) {
  ASSERT_TRUE(frames.reserve_range(3 * 4096, 4096).ok());

  // Frames 0 to 2 are free, frame 3 is not.
  auto overlap = frames.reserve_range(0, 4 * 4096);
  ASSERT_EQ(overlap.error().kind, plenum::ErrorKind::RegionOverlap);
  ASSERT_EQ(overlap.error().base, 0);
  ASSERT_EQ(overlap.error().size, 4 * 4096);
  ASSERT_FALSE(frames.is_allocated(0).unwrap());
  ASSERT_FALSE(frames.is_allocated(2 * 4096).unwrap());
  ASSERT_EQ(frames.used_frames(), 1);

  // Runs off the end of memory.
  auto past_end = frames.reserve_range(254 * 4096, 4 * 4096);
  ASSERT_EQ(past_end.error().kind, plenum::ErrorKind::InvalidAddress);
  ASSERT_EQ(past_end.error().address, 256 * 4096);
  ASSERT_FALSE(frames.is_allocated(254 * 4096).unwrap());
  ASSERT_EQ(frames.used_frames(), 1);
}


TEST_F(FrameAllocatorTest, ReserveRangeHugeSize) {
  // Sizes this close to SIZE_MAX must not round up to a tiny frame count.
  for (size_t size : {SIZE_MAX, SIZE_MAX - 100, SIZE_MAX - 4095}) {
    auto r = frames.reserve_range(0, size);
    ASSERT_FALSE(r);
    ASSERT_EQ(r.error().kind, plenum::ErrorKind::InvalidAddress);
    ASSERT_EQ(r.error().address, 256 * 4096);
    ASSERT_EQ(frames.used_frames(), 0);
  }
  ASSERT_EQ(frames.allocate_frame().unwrap(), 0);
}


TEST_F(FrameAllocatorTest, ReserveEmptyRange) {
  ASSERT_TRUE(frames.reserve_range(0x2000, 0).ok());
  ASSERT_EQ(frames.used_frames(), 0);
  ASSERT_EQ(frames.reserve_range(0x2001, 0).error().kind, plenum::ErrorKind::InvalidAlignment);
}


TEST_F(FrameAllocatorTest, Stats) {
  frames.allocate_contiguous(3).unwrap();
  auto s = frames.stats();
  ASSERT_EQ(s.total_frames, 256);
  ASSERT_EQ(s.used_frames, 3);
  ASSERT_EQ(s.free_frames, 253);
  ASSERT_EQ(s.page_size, 4096);
  ASSERT_EQ(s.total_bytes, 1024 * 1024);
  ASSERT_EQ(s.used_bytes, 3 * 4096);
  ASSERT_EQ(s.free_bytes, 253 * 4096);
  ASSERT_EQ(s.heap_allocated, 0);
}


TEST_F(FrameAllocatorTest, TernaryPageSize) {
  plenum::FrameAllocator f(10 * plenum::ternary_page_size, plenum::ternary_page_size, 0);
  ASSERT_EQ(f.total_frames(), 10);
  f.allocate_frame().unwrap();
  ASSERT_EQ(f.allocate_frame().unwrap(), 2187);
  ASSERT_EQ(f.deallocate_frame(4096).error().kind, plenum::ErrorKind::InvalidAlignment);
}


TEST_F(FrameAllocatorTest, Dump) {
  frames.allocate_contiguous(2).unwrap();
  char *buf = nullptr;
  size_t len = 0;
  FILE *stream = open_memstream(&buf, &len);
  frames.dump(stream);
  fclose(stream);
  std::string out(buf, len);
  free(buf);

  ASSERT_NE(out.find("256 frames"), std::string::npos);
  ASSERT_NE(out.find("2 frames"), std::string::npos);
}


TEST_F(FrameAllocatorTest, ZeroPageSizeDies) {
  ASSERT_DEATH({ plenum::FrameAllocator f(4096, 0, 0); }, "non-zero page size");
}


TEST_F(FrameAllocatorTest, ConcurrentAllocateFree) {
  constexpr int thread_count = 8;
  constexpr int per_thread = 32;

  std::vector<std::vector<uintptr_t>> got(thread_count);
  std::vector<std::thread> threads;
  for (int t = 0; t < thread_count; t++) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < per_thread; i++) {
        got[t].push_back(frames.allocate_frame().unwrap());
      }
    });
  }
  for (auto &th : threads)
    th.join();

  // Every frame handed out exactly once.
  std::vector<uintptr_t> all;
  for (auto &v : got)
    all.insert(all.end(), v.begin(), v.end());
  std::sort(all.begin(), all.end());
  ASSERT_EQ(std::unique(all.begin(), all.end()), all.end());
  ASSERT_EQ(all.size(), 256);
  ASSERT_EQ(frames.free_frames(), 0);

  threads.clear();
  for (int t = 0; t < thread_count; t++) {
    threads.emplace_back([&, t]() {
      for (auto a : got[t])
        frames.deallocate_frame(a).unwrap();
    });
  }
  for (auto &th : threads)
    th.join();

  ASSERT_EQ(frames.free_frames(), 256);
}
