/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/FrameAllocator.hpp>
#include <plenum/Logger.hpp>


namespace plenum {

  static size_t checked_frame_count(size_t memory_size, size_t page_size) {
    PLENUM_ASSERT(page_size != 0, "FrameAllocator needs a non-zero page size");
    return memory_size / page_size;
  }


  FrameAllocator::FrameAllocator(size_t memory_size, size_t page_size, uintptr_t base_address)
      : m_bitmap(checked_frame_count(memory_size, page_size))
      , m_total_frames(memory_size / page_size)
      , m_free_frames(memory_size / page_size)
      , m_page_size(page_size)
      , m_base_address(base_address) {
    log_debug("FrameAllocator: %zu frames of %zu bytes at %#lx (%zu bitmap words)",
        m_total_frames, m_page_size, (unsigned long)m_base_address, m_bitmap.word_count());
  }

  FrameAllocator::~FrameAllocator(void) {
    log_debug("FrameAllocator: destroyed with %zu/%zu frames in use", used_frames(),
        m_total_frames);
  }



  Result<uintptr_t> FrameAllocator::allocate_frame(void) {
    plenum::scoped_lock lk(m_lock);
    return allocate_frame_locked();
  }


  Result<uintptr_t> FrameAllocator::allocate_frame_locked(void) {
    PLENUM_SANITY(m_lock.is_locked(), "The lock must be held");

    size_t frame = m_bitmap.find_first_clear();
    // The first clear bit might be padding at the end of the last word. That means every
    // real frame is taken, not that we should wrap around.
    if (frame == SIZE_MAX || frame >= m_total_frames) {
      log_debug("FrameAllocator: out of frames (%zu total)", m_total_frames);
      return Error::frame_exhausted();
    }

    m_bitmap.set(frame);
    m_free_frames--;
    validate();

    uintptr_t address = frame_to_address(frame);
    log_trace("FrameAllocator: allocated frame %zu (%#lx)", frame, (unsigned long)address);
    return address;
  }


  Result<uintptr_t> FrameAllocator::allocate_contiguous(size_t count) {
    if (count == 0) return Error::invalid_alignment(0);

    plenum::scoped_lock lk(m_lock);
    if (count == 1) return allocate_frame_locked();

    size_t run_start = 0;
    size_t run_length = 0;

    for (size_t frame = 0; frame < m_total_frames; frame++) {
      if (m_bitmap.get(frame)) {
        run_length = 0;
        continue;
      }

      if (run_length == 0) run_start = frame;
      run_length++;

      if (run_length == count) {
        for (size_t i = run_start; i < run_start + count; i++) {
          m_bitmap.set(i);
        }
        m_free_frames -= count;
        validate();

        log_trace("FrameAllocator: allocated %zu contiguous frames at %zu", count, run_start);
        return frame_to_address(run_start);
      }
    }

    log_debug("FrameAllocator: no run of %zu free frames (%zu free in total)", count,
        m_free_frames);
    return Error::out_of_memory();
  }



  Result<void> FrameAllocator::deallocate_frame(uintptr_t address) {
    plenum::scoped_lock lk(m_lock);
    return deallocate_frame_locked(address);
  }


  Result<void> FrameAllocator::deallocate_frame_locked(uintptr_t address) {
    auto frame = address_to_frame(address);
    if (!frame) return frame.error();

    if (!m_bitmap.get(frame.unwrap())) {
      log_debug("FrameAllocator: double free of %#lx", (unsigned long)address);
      return Error::double_free(address);
    }

    m_bitmap.clear(frame.unwrap());
    m_free_frames++;
    validate();

    log_trace("FrameAllocator: freed frame %zu", frame.unwrap());
    return {};
  }


  Result<void> FrameAllocator::deallocate_contiguous(uintptr_t address, size_t count) {
    plenum::scoped_lock lk(m_lock);

    for (size_t i = 0; i < count; i++) {
      auto r = deallocate_frame_locked(address + i * m_page_size);
      if (!r) {
        log_debug("FrameAllocator: contiguous free stopped after %zu of %zu frames", i, count);
        return r;
      }
    }
    return {};
  }



  Result<void> FrameAllocator::reserve_range(uintptr_t start_address, size_t size) {
    plenum::scoped_lock lk(m_lock);

    auto start = address_to_frame(start_address);
    if (!start) return start.error();

    size_t first = start.unwrap();
    // Rounded up without `size + page_size - 1`, which wraps for sizes near SIZE_MAX.
    size_t frame_count = size / m_page_size + (size % m_page_size != 0);

    // Check everything before touching anything, so a rejected reservation leaves the bitmap
    // exactly as it was.
    for (size_t i = 0; i < frame_count; i++) {
      size_t frame = first + i;
      if (frame >= m_total_frames) {
        return Error::invalid_address(start_address + i * m_page_size);
      }
      if (m_bitmap.get(frame)) {
        log_debug("FrameAllocator: reservation [%#lx, +%zu) overlaps frame %zu",
            (unsigned long)start_address, size, frame);
        return Error::region_overlap(start_address, size);
      }
    }

    for (size_t i = 0; i < frame_count; i++) {
      m_bitmap.set(first + i);
    }
    m_free_frames -= frame_count;
    validate();

    log_debug("FrameAllocator: reserved %zu frames at %#lx", frame_count,
        (unsigned long)start_address);
    return {};
  }



  Result<bool> FrameAllocator::is_allocated(uintptr_t address) const {
    plenum::scoped_lock lk(m_lock);
    auto frame = address_to_frame(address);
    if (!frame) return frame.error();
    return m_bitmap.get(frame.unwrap());
  }


  Result<size_t> FrameAllocator::address_to_frame(uintptr_t address) const {
    if (address < m_base_address) return Error::invalid_address(address);

    uintptr_t offset = address - m_base_address;
    if (offset % m_page_size != 0) return Error::invalid_alignment(address);

    size_t frame = offset / m_page_size;
    if (frame >= m_total_frames) return Error::invalid_address(address);

    return frame;
  }


  size_t FrameAllocator::free_frames(void) const {
    plenum::scoped_lock lk(m_lock);
    return m_free_frames;
  }

  size_t FrameAllocator::used_frames(void) const {
    plenum::scoped_lock lk(m_lock);
    return m_total_frames - m_free_frames;
  }


  MemoryStats FrameAllocator::stats(void) const {
    plenum::scoped_lock lk(m_lock);

    MemoryStats s;
    s.total_frames = m_total_frames;
    s.free_frames = m_free_frames;
    s.used_frames = m_total_frames - m_free_frames;
    s.page_size = m_page_size;
    s.total_bytes = m_total_frames * m_page_size;
    s.free_bytes = m_free_frames * m_page_size;
    s.used_bytes = s.used_frames * m_page_size;
    return s;
  }


  void FrameAllocator::validate(void) const {
    PLENUM_SANITY(m_free_frames == m_total_frames - m_bitmap.count_set(m_total_frames),
        "free frame count (%zu) disagrees with the bitmap (%zu used of %zu)", m_free_frames,
        m_bitmap.count_set(m_total_frames), m_total_frames);
  }


  void FrameAllocator::dump(FILE *stream) const {
    plenum::scoped_lock lk(m_lock);

    fprintf(stream, "FrameAllocator @ %#lx: %zu frames x %zu bytes, %zu used, %zu free\n",
        (unsigned long)m_base_address, m_total_frames, m_page_size,
        m_total_frames - m_free_frames, m_free_frames);

    // Print the used frames as runs, otherwise this is unreadable for any real memory size.
    size_t frame = 0;
    while (frame < m_total_frames) {
      if (!m_bitmap.get(frame)) {
        frame++;
        continue;
      }
      size_t start = frame;
      while (frame < m_total_frames && m_bitmap.get(frame))
        frame++;
      fprintf(stream, "  used [%#lx, %#lx) %zu frames\n", (unsigned long)frame_to_address(start),
          (unsigned long)frame_to_address(frame), frame - start);
    }
  }
}  // namespace plenum
