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
#include <map>
#include <optional>
#include <plenum/plenum.hpp>
#include <plenum/Error.hpp>
#include <plenum/Security.hpp>
#include <plenum/lock.hpp>

namespace plenum {

  // x86_64 compatible low bits, plus three bits in the OS-available range for ternary region
  // tagging.
  static constexpr uint64_t page_present = 1ULL << 0;
  static constexpr uint64_t page_writable = 1ULL << 1;
  static constexpr uint64_t page_user = 1ULL << 2;
  static constexpr uint64_t page_write_through = 1ULL << 3;
  static constexpr uint64_t page_cache_disable = 1ULL << 4;
  static constexpr uint64_t page_accessed = 1ULL << 5;
  static constexpr uint64_t page_dirty = 1ULL << 6;
  static constexpr uint64_t page_huge = 1ULL << 7;
  static constexpr uint64_t page_global = 1ULL << 8;
  static constexpr uint64_t page_compute = 1ULL << 9;           // ternary compute capable
  static constexpr uint64_t page_encrypted = 1ULL << 10;        // phase encrypted at rest
  static constexpr uint64_t page_timing_critical = 1ULL << 11;  // femtosecond timing region
  static constexpr uint64_t page_no_execute = 1ULL << 63;


  class PageFlags final {
   public:
    constexpr PageFlags(void)
        : m_bits(0) {}
    constexpr explicit PageFlags(uint64_t bits)
        : m_bits(bits) {}

    static constexpr PageFlags empty(void) { return PageFlags(); }

    // Always present. Everything that cannot execute gets the NX bit.
    static PageFlags from_permissions(const Permissions &perms, bool user);
    Permissions to_permissions(void) const;

    constexpr bool present(void) const { return m_bits & page_present; }
    constexpr bool writable(void) const { return m_bits & page_writable; }
    constexpr bool user_accessible(void) const { return m_bits & page_user; }
    constexpr bool no_execute(void) const { return m_bits & page_no_execute; }
    constexpr bool compute(void) const { return m_bits & page_compute; }
    constexpr bool encrypted(void) const { return m_bits & page_encrypted; }
    constexpr bool timing_critical(void) const { return m_bits & page_timing_critical; }

    constexpr uint64_t bits(void) const { return m_bits; }

    constexpr PageFlags operator|(uint64_t bits) const { return PageFlags(m_bits | bits); }
    constexpr PageFlags operator|(PageFlags other) const { return PageFlags(m_bits | other.m_bits); }
    constexpr bool operator==(PageFlags other) const { return m_bits == other.m_bits; }
    constexpr bool operator!=(PageFlags other) const { return m_bits != other.m_bits; }

   private:
    uint64_t m_bits;
  };


  struct PageTableEntry {
    uintptr_t virtual_address;   // page aligned
    uintptr_t physical_address;  // page aligned
    PageFlags flags;
    SecurityMode security_mode;
  };



  // The PageTable maps virtual pages to physical pages, and tags each mapping with access
  // flags and a security classification which are both enforced by check_access().
  //
  // A virtual page is mapped at most once. Mappings are immutable: changing one means an
  // unmap() followed by a map(), never an in-place update, and map() on a page which is already
  // mapped is refused rather than treated as a remap.
  //
  // Page alignment uses division, not masks, so the ternary page size works too.
  class PageTable final {
   public:
    PageTable(void)
        : PageTable(plenum::default_page_size) {}
    explicit PageTable(size_t page_size);
    ~PageTable(void);

    PageTable(const PageTable &) = delete;
    PageTable &operator=(const PageTable &) = delete;

    static PageTable with_page_size(size_t page_size) { return PageTable(page_size); }

    // Both addresses are truncated to their page boundary. RegionOverlap if the virtual page is
    // already mapped.
    Result<void> map(uintptr_t virtual_address, uintptr_t physical_address, PageFlags flags,
        SecurityMode security_mode);

    // Remove and return the mapping for the page containing `virtual_address`. PageFault if
    // there isn't one.
    Result<PageTableEntry> unmap(uintptr_t virtual_address);

    // Physical address of the exact byte at `virtual_address`. PageFault if the page is not
    // mapped, or is mapped but not present.
    Result<uintptr_t> translate(uintptr_t virtual_address) const;

    // The raw entry for the page containing `virtual_address`, if any. This is a copy: the
    // table may change as soon as the call returns.
    std::optional<PageTableEntry> lookup(uintptr_t virtual_address) const;

    // In order:
    //   1. PageFault if the page is not mapped
    //   2. SecurityViolation if `caller_mode` cannot access the mapping's classification
    //   3. PermissionDenied if the mapping lacks anything `required` asks for
    Result<void> check_access(uintptr_t virtual_address, const Permissions &required,
        SecurityMode caller_mode) const;

    // map() / unmap() over every page in ceil(size / page_size) pages.
    //
    // NOTE: these are NOT atomic. They stop at the first page that fails and return its error,
    // and the pages that were already mapped (or unmapped) before it stay that way. A caller
    // that needs all-or-nothing has to undo the prefix itself.
    //
    // A range that would run past the top of the address space is InvalidAddress, and nothing
    // is touched.
    Result<void> map_range(uintptr_t virtual_base, uintptr_t physical_base, size_t size,
        PageFlags flags, SecurityMode security_mode);
    Result<void> unmap_range(uintptr_t virtual_base, size_t size);

    bool is_mapped(uintptr_t virtual_address) const;
    size_t entry_count(void) const;
    size_t page_size(void) const { return m_page_size; }

    // Drop every mapping.
    void clear(void);

    // Visit every entry in ascending virtual address order. The table is locked for the
    // duration, so `fn` must not call back into it.
    template <typename Fn>
    void for_each(Fn &&fn) const {
      plenum::scoped_lock lk(m_lock);
      for (auto &kv : m_entries) {
        fn(kv.second);
      }
    }

    void dump(FILE *stream) const;

   private:
    uintptr_t align_down(uintptr_t address) const { return address - (address % m_page_size); }
    size_t page_count(size_t size) const {
      return size / m_page_size + (size % m_page_size != 0);
    }
    // Does [base, base + size) stay below the top of the address space?
    static bool range_fits(uintptr_t base, size_t size) {
      return size == 0 || size - 1 <= UINTPTR_MAX - base;
    }

    Result<void> map_locked(uintptr_t virtual_address, uintptr_t physical_address,
        PageFlags flags, SecurityMode security_mode);
    Result<PageTableEntry> unmap_locked(uintptr_t virtual_address);

    mutable plenum::mutex m_lock;
    std::map<uintptr_t, PageTableEntry> m_entries;
    size_t m_page_size;
  };
}  // namespace plenum
