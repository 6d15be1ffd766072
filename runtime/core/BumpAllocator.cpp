/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/BumpAllocator.hpp>
#include <plenum/Logger.hpp>

namespace plenum {

  Result<uintptr_t> BumpAllocator::allocate(size_t size, size_t align) {
    if (!is_power_of_two(align)) return Error::invalid_alignment(align);

    uintptr_t aligned = round_up(m_current, (uintptr_t)align);
    // Guard the arithmetic as well as the limit, a huge request must not wrap around.
    if (aligned < m_current || aligned > m_limit || size > m_limit - aligned) {
      log_debug("BumpAllocator: %zu bytes (align %zu) does not fit, %zu remaining", size, align,
          remaining());
      return Error::out_of_memory();
    }

    m_current = aligned + size;
    m_allocations++;
    return aligned;
  }
}  // namespace plenum
