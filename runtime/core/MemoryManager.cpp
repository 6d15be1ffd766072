/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/MemoryManager.hpp>
#include <plenum/Logger.hpp>


namespace plenum {

  const char *to_string(MemoryRegionType type) {
    switch (type) {
      case MemoryRegionType::KernelCode:
        return "KernelCode";
      case MemoryRegionType::KernelData:
        return "KernelData";
      case MemoryRegionType::KernelStack:
        return "KernelStack";
      case MemoryRegionType::UserCode:
        return "UserCode";
      case MemoryRegionType::UserData:
        return "UserData";
      case MemoryRegionType::UserStack:
        return "UserStack";
      case MemoryRegionType::TernaryCompute:
        return "TernaryCompute";
      case MemoryRegionType::PhaseEncrypted:
        return "PhaseEncrypted";
      case MemoryRegionType::TimingCritical:
        return "TimingCritical";
      case MemoryRegionType::Mmio:
        return "Mmio";
      case MemoryRegionType::Reserved:
        return "Reserved";
      case MemoryRegionType::Free:
        return "Free";
    }
    return "Unknown";
  }


  PageFlags region_flags(const MemoryRegion &region) {
    PageFlags flags = PageFlags::from_permissions(region.permissions, is_user_region(region.type));

    switch (region.type) {
      case MemoryRegionType::TernaryCompute:
        flags = flags | page_compute;
        break;
      case MemoryRegionType::PhaseEncrypted:
        flags = flags | page_encrypted;
        break;
      case MemoryRegionType::TimingCritical:
        flags = flags | page_timing_critical;
        break;
      default:
        break;
    }
    return flags;
  }



  MemoryManager::MemoryManager(const Configuration &config)
      : frames(config.physical_memory_size, config.page_size, config.physical_base)
      , heap(config.kernel_heap_base, config.kernel_heap_size)
      , page_table(config.page_size)
      , m_config(config) {
    if (config.reserved_low_memory > 0) {
      auto r = frames.reserve_range(config.physical_base, config.reserved_low_memory);
      // A validated configuration always fits, and nothing else has touched the frames yet.
      PLENUM_ASSERT(r.ok(), "could not reserve low memory: %s", r.error().describe().c_str());
    }

    log_info("MemoryManager: %zu frames of %zu bytes at %#lx, %zu byte heap at %#lx",
        frames.total_frames(), frames.page_size(), (unsigned long)frames.base_address(),
        heap.total_size(), (unsigned long)heap.base());
  }


  MemoryManager::~MemoryManager(void) {
    log_debug("MemoryManager: shutting down, %zu frames and %zu heap allocations still live",
        frames.used_frames(), heap.allocation_count());
  }


  MemoryStats MemoryManager::stats(void) const {
    MemoryStats s = frames.stats();
    s.heap_allocated = heap.total_allocated();
    s.heap_free = heap.total_free();
    return s;
  }


  Result<void> MemoryManager::map_region(const MemoryRegion &region) {
    log_debug("MemoryManager: mapping %s region %#lx+%zu", to_string(region.type),
        (unsigned long)region.base, region.size);

    auto reserved = frames.reserve_range(region.base, region.size);
    if (!reserved) return reserved;

    auto mapped = page_table.map_range(
        region.base, region.base, region.size, region_flags(region), region.security_mode);
    if (!mapped) {
      log_warn("MemoryManager: %s region %#lx+%zu reserved but only partly mapped: %s",
          to_string(region.type), (unsigned long)region.base, region.size,
          mapped.error().describe().c_str());
    }
    return mapped;
  }


  void MemoryManager::dump(FILE *stream) const {
    MemoryStats s = stats();
    fprintf(stream, "MemoryManager: %zu/%zu frames used, heap %zu allocated %zu free\n",
        s.used_frames, s.total_frames, s.heap_allocated, s.heap_free);
    frames.dump(stream);
    heap.dump(stream);
    page_table.dump(stream);
  }
}  // namespace plenum
