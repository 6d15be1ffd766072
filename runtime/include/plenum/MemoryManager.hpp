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
#include <plenum/Configuration.hpp>
#include <plenum/FrameAllocator.hpp>
#include <plenum/HeapAllocator.hpp>
#include <plenum/PageTable.hpp>

namespace plenum {

  // The memory core as the rest of the kernel sees it: the physical frame pool, the kernel
  // heap and the kernel page table, built together from one Configuration.
  //
  // The components are public. MemoryManager only adds the operations that need more than
  // one of them at once, and each component keeps its own lock.
  class MemoryManager final {
   public:
    // `config` must have passed validate().
    explicit MemoryManager(const Configuration &config);
    ~MemoryManager(void);

    MemoryManager(const MemoryManager &) = delete;
    MemoryManager &operator=(const MemoryManager &) = delete;

    // Frame statistics, with the heap fields filled in.
    MemoryStats stats(void) const;

    // Reserve the frames backing `region` and identity map them into the kernel page table.
    // Flags come from the region's permissions, plus the user bit for user regions and the
    // matching extension bit for ternary, encrypted and timing critical regions.
    //
    // If the mapping fails part way through the frames stay reserved and the pages mapped so
    // far stay mapped.
    Result<void> map_region(const MemoryRegion &region);

    const Configuration &config(void) const { return m_config; }
    void dump(FILE *stream) const;

    FrameAllocator frames;
    HeapAllocator heap;
    PageTable page_table;

   private:
    Configuration m_config;
  };

  // Page flags a mapping of `region` should carry.
  PageFlags region_flags(const MemoryRegion &region);
}  // namespace plenum
