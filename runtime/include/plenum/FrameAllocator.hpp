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
#include <plenum/plenum.hpp>
#include <plenum/Bitmap.hpp>
#include <plenum/Error.hpp>
#include <plenum/lock.hpp>

namespace plenum {

  // The FrameAllocator hands out whole physical frames from the fixed range
  // [base_address, base_address + total_frames * page_size). One bit per frame, set when the
  // frame is in use. Frames are always handed out lowest-first, and callers (and tests) are
  // allowed to depend on that ordering.
  //
  // Every public method takes the allocator's lock for its whole duration.
  class FrameAllocator final {
   public:
    FrameAllocator(size_t memory_size, size_t page_size, uintptr_t base_address);
    ~FrameAllocator(void);

    FrameAllocator(const FrameAllocator &) = delete;
    FrameAllocator &operator=(const FrameAllocator &) = delete;

    static FrameAllocator with_default_page_size(size_t memory_size) {
      return FrameAllocator(memory_size, plenum::default_page_size, 0);
    }

    // Allocate the lowest free frame. FrameExhausted if there is none.
    Result<uintptr_t> allocate_frame(void);

    // Allocate the first run of `count` free frames (first fit on the start of the run).
    // Nothing is marked unless the whole run was found. count == 0 is InvalidAlignment,
    // no long enough run is OutOfMemory.
    Result<uintptr_t> allocate_contiguous(size_t count);

    Result<void> deallocate_frame(uintptr_t address);

    // Free `count` frames starting at `address`, stopping at the first one that cannot be
    // freed and returning its error. Frames before the failing one STAY freed: there is no
    // rollback, so on failure the caller must assume a prefix of the range was released.
    Result<void> deallocate_contiguous(uintptr_t address, size_t count);

    // Mark the frames covering [start_address, start_address + size) as used (firmware
    // tables, the kernel image, MMIO holes...). Either the whole range is reserved or nothing
    // is: RegionOverlap if any frame is already in use, InvalidAddress if the range runs off
    // the end of physical memory.
    Result<void> reserve_range(uintptr_t start_address, size_t size);

    // InvalidAddress / InvalidAlignment for addresses that do not name a frame.
    Result<bool> is_allocated(uintptr_t address) const;

    MemoryStats stats(void) const;

    size_t total_frames(void) const { return m_total_frames; }
    size_t free_frames(void) const;
    size_t used_frames(void) const;
    size_t page_size(void) const { return m_page_size; }
    uintptr_t base_address(void) const { return m_base_address; }

    void dump(FILE *stream) const;

   private:
    Result<size_t> address_to_frame(uintptr_t address) const;
    uintptr_t frame_to_address(size_t frame) const { return m_base_address + frame * m_page_size; }

    // These expect the lock to already be held.
    Result<uintptr_t> allocate_frame_locked(void);
    Result<void> deallocate_frame_locked(uintptr_t address);
    void validate(void) const;

    mutable plenum::mutex m_lock;
    plenum::Bitmap m_bitmap;
    size_t m_total_frames;
    size_t m_free_frames;
    size_t m_page_size;
    uintptr_t m_base_address;
  };
}  // namespace plenum
