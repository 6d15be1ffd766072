/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/HeapAllocator.hpp>
#include <plenum/Logger.hpp>
#include <algorithm>


namespace plenum {

  HeapAllocator::HeapAllocator(uintptr_t base, size_t size)
      : m_base(base)
      , m_size(size) {
    PLENUM_ASSERT(size > header_size, "a heap of %zu bytes cannot hold a single block header",
        size);
    PLENUM_ASSERT(round_down(base, alignment) == base, "heap base %#lx is not %zu byte aligned",
        (unsigned long)base, alignment);

    // One free block spanning everything
    m_blocks.push_back(BlockEntry{base, BlockHeader{size - header_size, true}});

    log_debug("HeapAllocator: %zu bytes at %#lx (%zu usable)", size, (unsigned long)base,
        size - header_size);
  }

  HeapAllocator::~HeapAllocator(void) {
    if (m_allocation_count != 0) {
      log_debug("HeapAllocator: destroyed with %zu live allocations (%zu bytes)",
          m_allocation_count, m_total_allocated);
    }
  }



  Result<uintptr_t> HeapAllocator::allocate(size_t size) {
    if (size == 0) return Error::invalid_alignment(0);
    // Anything this large cannot fit, and rounding it up would overflow.
    if (size > m_size) return Error::out_of_memory();

    size_t aligned_size = round_up(std::max(size, min_block_size), alignment);

    plenum::scoped_lock lk(m_lock);

    long idx = find_best_fit(aligned_size);
    if (idx < 0) {
      log_debug("HeapAllocator: no free block of %zu bytes (%zu free, largest %zu)",
          aligned_size, total_free_locked(), largest_free_locked());
      return Error::out_of_memory();
    }

    BlockEntry &blk = m_blocks[idx];
    size_t remaining = blk.header.size - aligned_size;

    // Only split if the leftover can hold a header and a minimum sized block. Otherwise the
    // slack stays in this allocation.
    if (remaining >= min_block_size + header_size) {
      blk.header.size = aligned_size;
      BlockEntry tail{blk.end(), BlockHeader{remaining - header_size, true}};
      m_blocks.insert(m_blocks.begin() + idx + 1, tail);
    }

    // `blk` may have been invalidated by the insert.
    BlockEntry &allocated = m_blocks[idx];
    allocated.header.is_free = false;

    m_total_allocated += allocated.header.size;
    m_allocation_count++;

    PLENUM_SANITY(validate_locked().ok(), "heap invariants broken after allocate(%zu)", size);
    log_trace("HeapAllocator: allocate(%zu) -> %#lx (%zu bytes)", size,
        (unsigned long)allocated.data(), allocated.header.size);
    return allocated.data();
  }



  Result<void> HeapAllocator::deallocate(uintptr_t ptr) {
    if (ptr < m_base + header_size) return Error::invalid_address(ptr);

    plenum::scoped_lock lk(m_lock);

    long idx = find_block(ptr - header_size);
    if (idx < 0) {
      log_debug("HeapAllocator: %#lx was never handed out", (unsigned long)ptr);
      return Error::invalid_address(ptr);
    }

    BlockEntry &blk = m_blocks[idx];
    if (blk.header.is_free) {
      log_debug("HeapAllocator: double free of %#lx", (unsigned long)ptr);
      return Error::double_free(ptr);
    }

    m_total_allocated -= blk.header.size;
    m_allocation_count--;
    blk.header.is_free = true;

    coalesce(idx);

    PLENUM_SANITY(validate_locked().ok(), "heap invariants broken after deallocate(%#lx)",
        (unsigned long)ptr);
    log_trace("HeapAllocator: deallocate(%#lx), %zu blocks", (unsigned long)ptr,
        m_blocks.size());
    return {};
  }


  Result<size_t> HeapAllocator::size_of(uintptr_t ptr) const {
    if (ptr < m_base + header_size) return Error::invalid_address(ptr);

    plenum::scoped_lock lk(m_lock);
    long idx = find_block(ptr - header_size);
    if (idx < 0 || m_blocks[idx].header.is_free) return Error::invalid_address(ptr);
    return m_blocks[idx].header.size;
  }



  long HeapAllocator::find_best_fit(size_t size) const {
    long best = -1;
    size_t best_size = 0;

    for (size_t i = 0; i < m_blocks.size(); i++) {
      const BlockHeader &h = m_blocks[i].header;
      if (!h.is_free || h.size < size) continue;
      // strictly smaller, so the lowest address wins a tie
      if (best < 0 || h.size < best_size) {
        best = i;
        best_size = h.size;
      }
    }
    return best;
  }


  long HeapAllocator::find_block(uintptr_t address) const {
    // The list is sorted by address, so this can be a binary search.
    auto it = std::lower_bound(m_blocks.begin(), m_blocks.end(), address,
        [](const BlockEntry &b, uintptr_t addr) { return b.address < addr; });
    if (it == m_blocks.end() || it->address != address) return -1;
    return it - m_blocks.begin();
  }


  // Merge the (now free) block at `idx` with its neighbours. The right neighbour is absorbed
  // first, then the block itself is absorbed into its left neighbour. Each merge folds the
  // absorbed header into the surviving block's size.
  void HeapAllocator::coalesce(size_t idx) {
    if (idx + 1 < m_blocks.size() && m_blocks[idx + 1].header.is_free) {
      m_blocks[idx].header.size += header_size + m_blocks[idx + 1].header.size;
      m_blocks.erase(m_blocks.begin() + idx + 1);
    }

    if (idx > 0 && m_blocks[idx - 1].header.is_free) {
      m_blocks[idx - 1].header.size += header_size + m_blocks[idx].header.size;
      m_blocks.erase(m_blocks.begin() + idx);
    }
  }



  size_t HeapAllocator::total_allocated(void) const {
    plenum::scoped_lock lk(m_lock);
    return m_total_allocated;
  }

  size_t HeapAllocator::allocation_count(void) const {
    plenum::scoped_lock lk(m_lock);
    return m_allocation_count;
  }

  size_t HeapAllocator::block_count(void) const {
    plenum::scoped_lock lk(m_lock);
    return m_blocks.size();
  }

  size_t HeapAllocator::total_free(void) const {
    plenum::scoped_lock lk(m_lock);
    return total_free_locked();
  }

  size_t HeapAllocator::largest_free_block(void) const {
    plenum::scoped_lock lk(m_lock);
    return largest_free_locked();
  }


  size_t HeapAllocator::total_free_locked(void) const {
    size_t total = 0;
    for (auto &b : m_blocks) {
      if (b.header.is_free) total += b.header.size;
    }
    return total;
  }

  size_t HeapAllocator::largest_free_locked(void) const {
    size_t largest = 0;
    for (auto &b : m_blocks) {
      if (b.header.is_free && b.header.size > largest) largest = b.header.size;
    }
    return largest;
  }


  double HeapAllocator::fragmentation_ratio(void) const {
    plenum::scoped_lock lk(m_lock);

    size_t total = total_free_locked();
    if (total == 0) return 0.0;

    return 1.0 - ((double)largest_free_locked() / (double)total);
  }



  Result<void> HeapAllocator::validate(void) const {
    plenum::scoped_lock lk(m_lock);
    return validate_locked();
  }


  Result<void> HeapAllocator::validate_locked(void) const {
    if (m_blocks.empty() || m_blocks.front().address != m_base) {
      log_error("HeapAllocator: first block does not start at the heap base");
      return Error::heap_corruption();
    }

    size_t allocated_bytes = 0;
    size_t allocated_blocks = 0;

    for (size_t i = 0; i < m_blocks.size(); i++) {
      const BlockEntry &b = m_blocks[i];

      if (i + 1 < m_blocks.size()) {
        const BlockEntry &next = m_blocks[i + 1];
        if (b.end() != next.address) {
          log_error("HeapAllocator: block %zu ends at %#lx but block %zu starts at %#lx", i,
              (unsigned long)b.end(), i + 1, (unsigned long)next.address);
          return Error::heap_corruption();
        }
        if (b.header.is_free && next.header.is_free) {
          log_error("HeapAllocator: blocks %zu and %zu are both free", i, i + 1);
          return Error::heap_corruption();
        }
      }

      if (!b.header.is_free) {
        allocated_bytes += b.header.size;
        allocated_blocks++;
      }
    }

    if (m_blocks.back().end() != m_base + m_size) {
      log_error("HeapAllocator: blocks end at %#lx, heap ends at %#lx",
          (unsigned long)m_blocks.back().end(), (unsigned long)(m_base + m_size));
      return Error::heap_corruption();
    }

    if (allocated_bytes != m_total_allocated || allocated_blocks != m_allocation_count) {
      log_error("HeapAllocator: accounting says %zu bytes in %zu blocks, list says %zu in %zu",
          m_total_allocated, m_allocation_count, allocated_bytes, allocated_blocks);
      return Error::heap_corruption();
    }

    return {};
  }


  void HeapAllocator::dump(FILE *stream) const {
    plenum::scoped_lock lk(m_lock);

    fprintf(stream, "HeapAllocator @ %#lx: %zu bytes, %zu allocated in %zu blocks, %zu blocks\n",
        (unsigned long)m_base, m_size, m_total_allocated, m_allocation_count, m_blocks.size());
    for (auto &b : m_blocks) {
      fprintf(stream, "  %#lx %8zu %s\n", (unsigned long)b.address, b.header.size,
          b.header.is_free ? "free" : "used");
    }
  }
}  // namespace plenum
