/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#pragma once

#include <stdio.h>
#include <vector>
#include <plenum/Error.hpp>
#include <plenum/lock.hpp>

namespace plenum {

  // The HeapAllocator manages the byte range [base, base + size) as a list of blocks. Every
  // block is a header followed by its data, blocks tile the range exactly, and the list is
  // kept in address order. The list lives outside the managed range (nothing is written into
  // the heap's memory), which is what lets the kernel heap describe memory that is not
  // mapped into this address space.
  //
  //   [hdr|   data   ][hdr|data][hdr|       data        ]
  //   ^ base                                            ^ base + size
  //
  // Allocation is best-fit with splitting, and freeing coalesces with both neighbours, so
  // no two adjacent blocks are ever both free.
  class HeapAllocator final {
   public:
    struct BlockHeader {
      size_t size;  // bytes of data following the header
      bool is_free;
    };

    static constexpr size_t header_size = sizeof(BlockHeader);
    static constexpr size_t min_block_size = 16;
    static constexpr size_t alignment = 8;

    // `base` must be aligned to `alignment` and `size` must hold at least one header.
    HeapAllocator(uintptr_t base, size_t size);
    ~HeapAllocator(void);

    HeapAllocator(const HeapAllocator &) = delete;
    HeapAllocator &operator=(const HeapAllocator &) = delete;

    // Returns the address of `size` usable bytes, aligned to `alignment`. A zero byte request
    // is an error (InvalidAlignment), and OutOfMemory means no single free block is big enough.
    Result<uintptr_t> allocate(size_t size);

    // `ptr` must be exactly an address returned by allocate().
    Result<void> deallocate(uintptr_t ptr);

    // Data size of a live allocation (its rounded up size, not what was asked for).
    Result<size_t> size_of(uintptr_t ptr) const;

    uintptr_t base(void) const { return m_base; }
    size_t total_size(void) const { return m_size; }
    size_t total_allocated(void) const;
    size_t total_free(void) const;
    size_t allocation_count(void) const;
    size_t block_count(void) const;
    size_t largest_free_block(void) const;

    // 1 - largest_free / total_free. Zero with no free space or one free block, and tends
    // towards one as the free space splinters.
    double fragmentation_ratio(void) const;

    // Walk the whole block list and check every structural invariant. HeapCorruption if any
    // of them does not hold.
    Result<void> validate(void) const;

    void dump(FILE *stream) const;

   private:
    struct BlockEntry {
      uintptr_t address;  // address of the header
      BlockHeader header;

      uintptr_t data(void) const { return address + header_size; }
      uintptr_t end(void) const { return data() + header.size; }
    };

    // Index of the smallest free block with at least `size` bytes. The first one found in
    // address order wins ties. -1 if nothing fits.
    long find_best_fit(size_t size) const;
    // Index of the block whose header lives at `address`, or -1.
    long find_block(uintptr_t address) const;
    void coalesce(size_t idx);

    size_t total_free_locked(void) const;
    size_t largest_free_locked(void) const;
    Result<void> validate_locked(void) const;

    mutable plenum::mutex m_lock;
    uintptr_t m_base;
    size_t m_size;
    std::vector<BlockEntry> m_blocks;
    size_t m_total_allocated = 0;
    size_t m_allocation_count = 0;
  };
}  // namespace plenum
