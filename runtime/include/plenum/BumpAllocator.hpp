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

namespace plenum {

  // A trivial bump allocator over [base, base + size), used for early boot allocations
  // before there is a heap to ask. Memory is only ever given back all at once via reset().
  // There is no lock: a bump allocator has exactly one owner.
  class BumpAllocator final {
   public:
    BumpAllocator(uintptr_t base, size_t size)
        : m_base(base)
        , m_current(base)
        , m_limit(base + size) {}

    // `align` must be a power of two. Fails without moving the cursor.
    Result<uintptr_t> allocate(size_t size, size_t align);

    void reset(void) {
      m_current = m_base;
      m_allocations = 0;
    }

    size_t used(void) const { return m_current - m_base; }
    size_t remaining(void) const { return m_limit - m_current; }
    size_t allocations(void) const { return m_allocations; }

   private:
    uintptr_t m_base;
    uintptr_t m_current;
    uintptr_t m_limit;
    size_t m_allocations = 0;
  };
}  // namespace plenum
