// This file tests plenum::BumpAllocator

#include <gtest/gtest.h>
#include <plenum/BumpAllocator.hpp>
#include <plenum/Logger.hpp>
#include <stdint.h>


class BumpAllocatorTest : public ::testing::Test {
 public:
  void SetUp() override { plenum::set_log_level(LOG_WARN); }

  plenum::BumpAllocator bump{0x1000, 256};
};


TEST_F(BumpAllocatorTest, SequentialAndAligned) {
  ASSERT_EQ(bump.allocate(10, 1).unwrap(), 0x1000);
  ASSERT_EQ(bump.allocate(8, 16).unwrap(), 0x1010);
  ASSERT_EQ(bump.used(), 0x18);
  ASSERT_EQ(bump.remaining(), 256 - 0x18);
  ASSERT_EQ(bump.allocations(), 2);
}


TEST_F(BumpAllocatorTest, BadAlignment) {
  auto r = bump.allocate(8, 3);
  ASSERT_EQ(r.error().kind, plenum::ErrorKind::InvalidAlignment);
  ASSERT_EQ(r.error().address, 3);
  ASSERT_EQ(bump.allocate(8, 0).error().kind, plenum::ErrorKind::InvalidAlignment);
  ASSERT_EQ(bump.used(), 0);
}


TEST_F(BumpAllocatorTest, Exhaustion) {
  ASSERT_EQ(bump.allocate(256, 8).unwrap(), 0x1000);
  ASSERT_EQ(bump.remaining(), 0);
  ASSERT_EQ(bump.allocate(1, 1).error().kind, plenum::ErrorKind::OutOfMemory);
}


TEST_F(BumpAllocatorTest, FailureLeavesCursor) {
  bump.allocate(100, 8).unwrap();
  ASSERT_EQ(bump.allocate(1000, 8).error().kind, plenum::ErrorKind::OutOfMemory);
  ASSERT_EQ(bump.allocate(SIZE_MAX, 8).error().kind, plenum::ErrorKind::OutOfMemory);
  ASSERT_EQ(bump.used(), 100);
  ASSERT_EQ(bump.allocations(), 1);
}


TEST_F(BumpAllocatorTest, Reset) {
  bump.allocate(100, 8).unwrap();
  bump.reset();
  ASSERT_EQ(bump.used(), 0);
  ASSERT_EQ(bump.allocations(), 0);
  ASSERT_EQ(bump.allocate(16, 8).unwrap(), 0x1000);
}
