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

#include <stddef.h>
#include <stdint.h>
#include <plenum/Error.hpp>
#include <plenum/Security.hpp>
#include <plenum/utils.h>

namespace plenum {
  static constexpr size_t kilobyte = 1024;
  static constexpr size_t megabyte = 1024 * kilobyte;

  // 3^7 bytes. Not a power of two, so anything that has to work with it must align with
  // division rather than masks.
  static constexpr size_t ternary_page_size = 2187;
  static constexpr size_t binary_page_size = 4096;
  static constexpr size_t default_page_size = binary_page_size;

  // 3 trytes of 9 trits each
  static constexpr size_t trit_addressable_bits = 27;
  static constexpr uint64_t max_ternary_address = 7'625'597'484'987ULL;  // 3^27


  // Frame counts and byte totals for memory pressure reporting. The heap fields are only
  // filled in by the MemoryManager, which is the only thing that knows about both.
  struct MemoryStats {
    size_t total_frames = 0;
    size_t free_frames = 0;
    size_t used_frames = 0;
    size_t page_size = 0;
    size_t total_bytes = 0;
    size_t free_bytes = 0;
    size_t used_bytes = 0;
    size_t heap_allocated = 0;
    size_t heap_free = 0;
  };


  enum class MemoryRegionType : uint8_t {
    KernelCode,
    KernelData,
    KernelStack,
    UserCode,
    UserData,
    UserStack,
    TernaryCompute,
    PhaseEncrypted,
    TimingCritical,
    Mmio,
    Reserved,
    Free,
  };

  const char *to_string(MemoryRegionType type);

  inline bool is_user_region(MemoryRegionType type) {
    return type == MemoryRegionType::UserCode || type == MemoryRegionType::UserData ||
           type == MemoryRegionType::UserStack;
  }


  struct MemoryRegion {
    uintptr_t base = 0;
    size_t size = 0;
    MemoryRegionType type = MemoryRegionType::Free;
    SecurityMode security_mode = SecurityMode::ModeOne;
    Permissions permissions;
  };
}  // namespace plenum
