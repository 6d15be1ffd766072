/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <errno.h>
#include <stdlib.h>
#include <plenum/Configuration.hpp>
#include <plenum/HeapAllocator.hpp>
#include <plenum/Logger.hpp>


// Parse an unsigned number from the environment into `out` (base auto-detected, so 0x and 0
// prefixes work). Leaves `out` alone if the variable is unset or malformed.
template <typename T>
static void get_knob(const char *name, T &out) {
  const char *arg = getenv(name);
  if (arg == nullptr) return;

  char *end = nullptr;
  errno = 0;
  unsigned long long value = strtoull(arg, &end, 0);
  if (end == arg || *end != '\0' || errno != 0 || *arg == '-') {
    log_warn("ignoring %s='%s', not a number", name, arg);
    return;
  }
  out = (T)value;
}


namespace plenum {

  Configuration Configuration::from_env(void) {
    Configuration config;

    get_knob("PLENUM_MEMORY_SIZE", config.physical_memory_size);
    get_knob("PLENUM_PAGE_SIZE", config.page_size);
    get_knob("PLENUM_PHYS_BASE", config.physical_base);
    get_knob("PLENUM_HEAP_BASE", config.kernel_heap_base);
    get_knob("PLENUM_HEAP_SIZE", config.kernel_heap_size);
    get_knob("PLENUM_RESERVED_LOW", config.reserved_low_memory);

    if (const char *mode = getenv("PLENUM_SECURITY_MODE"); mode != nullptr) {
      if (!parse_security_mode(mode, config.default_security_mode)) {
        log_warn("ignoring PLENUM_SECURITY_MODE='%s', expected phi, one or zero", mode);
      }
    }

    return config;
  }


  Result<void> Configuration::validate(void) const {
    if (page_size == 0) return Error::invalid_alignment(0);
    if (physical_memory_size < page_size) return Error::out_of_memory();
    if (kernel_heap_size <= HeapAllocator::header_size) return Error::out_of_memory();
    if (kernel_heap_base % HeapAllocator::alignment != 0) {
      return Error::invalid_alignment(kernel_heap_base);
    }
    if (physical_memory_size - 1 > UINTPTR_MAX - physical_base) {
      return Error::invalid_address(physical_base);
    }
    if (kernel_heap_size - 1 > UINTPTR_MAX - kernel_heap_base) {
      return Error::invalid_address(kernel_heap_base);
    }

    // The frame pool only has whole frames, and the reservation is rounded up to whole frames,
    // so compare in frames rather than bytes.
    size_t total_frames = physical_memory_size / page_size;
    size_t reserved_frames =
        reserved_low_memory / page_size + (reserved_low_memory % page_size != 0);
    if (reserved_frames > total_frames) {
      return Error::invalid_address(physical_base + total_frames * page_size);
    }
    return {};
  }
}  // namespace plenum
