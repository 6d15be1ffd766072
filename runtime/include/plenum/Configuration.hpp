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
#include <plenum/plenum.hpp>

namespace plenum {

  // Boot-time layout of the memory core. Plain data: construct one, tweak the fields (or
  // overlay the environment with from_env()), validate(), and hand it to a MemoryManager.
  struct Configuration {
    size_t physical_memory_size = 16 * megabyte;
    size_t page_size = default_page_size;
    uintptr_t physical_base = 0;

    size_t kernel_heap_size = 1 * megabyte;
    uintptr_t kernel_heap_base = 0xFFFF800000000000ULL;

    SecurityMode default_security_mode = SecurityMode::ModeOne;

    // Bytes of frames starting at physical_base that are reserved at boot (firmware, the
    // kernel image, ...)
    size_t reserved_low_memory = 0;

    // Defaults, overlaid with any PLENUM_* variables that are set. Values which fail to parse
    // are ignored with a warning.
    //
    //   PLENUM_MEMORY_SIZE    physical_memory_size
    //   PLENUM_PAGE_SIZE      page_size
    //   PLENUM_PHYS_BASE      physical_base
    //   PLENUM_HEAP_BASE      kernel_heap_base
    //   PLENUM_HEAP_SIZE      kernel_heap_size
    //   PLENUM_RESERVED_LOW   reserved_low_memory
    //   PLENUM_SECURITY_MODE  default_security_mode (phi, one, zero)
    static Configuration from_env(void);

    Result<void> validate(void) const;
  };
}  // namespace plenum
