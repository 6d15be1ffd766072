/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/PageTable.hpp>
#include <plenum/Logger.hpp>


namespace plenum {

  PageFlags PageFlags::from_permissions(const Permissions &perms, bool user) {
    uint64_t bits = page_present;
    if (perms.write) bits |= page_writable;
    if (user) bits |= page_user;
    if (!perms.execute) bits |= page_no_execute;
    if (perms.compute) bits |= page_compute;
    return PageFlags(bits);
  }


  Permissions PageFlags::to_permissions(void) const {
    Permissions p;
    p.read = present();
    p.write = writable();
    p.execute = !no_execute();
    p.compute = compute();
    return p;
  }



  PageTable::PageTable(size_t page_size)
      : m_page_size(page_size) {
    PLENUM_ASSERT(page_size != 0, "a page table needs a non-zero page size");
    log_debug("PageTable: created with %zu byte pages", page_size);
  }

  PageTable::~PageTable(void) {
    log_debug("PageTable: destroyed with %zu live mappings", m_entries.size());
  }



  Result<void> PageTable::map(uintptr_t virtual_address, uintptr_t physical_address,
      PageFlags flags, SecurityMode security_mode) {
    plenum::scoped_lock lk(m_lock);
    return map_locked(virtual_address, physical_address, flags, security_mode);
  }


  Result<void> PageTable::map_locked(uintptr_t virtual_address, uintptr_t physical_address,
      PageFlags flags, SecurityMode security_mode) {
    uintptr_t vpage = align_down(virtual_address);
    uintptr_t ppage = align_down(physical_address);

    PageTableEntry entry{vpage, ppage, flags, security_mode};
    auto inserted = m_entries.emplace(vpage, entry);
    if (!inserted.second) {
      log_debug("PageTable: %#lx is already mapped to %#lx", (unsigned long)vpage,
          (unsigned long)inserted.first->second.physical_address);
      return Error::region_overlap(vpage, m_page_size);
    }

    log_trace("PageTable: map %#lx -> %#lx flags=%#lx %s", (unsigned long)vpage,
        (unsigned long)ppage, (unsigned long)flags.bits(), to_string(security_mode));
    return {};
  }



  Result<PageTableEntry> PageTable::unmap(uintptr_t virtual_address) {
    plenum::scoped_lock lk(m_lock);
    return unmap_locked(virtual_address);
  }


  Result<PageTableEntry> PageTable::unmap_locked(uintptr_t virtual_address) {
    auto it = m_entries.find(align_down(virtual_address));
    if (it == m_entries.end()) return Error::page_fault(virtual_address);

    PageTableEntry entry = it->second;
    m_entries.erase(it);

    log_trace("PageTable: unmap %#lx", (unsigned long)entry.virtual_address);
    return entry;
  }



  Result<uintptr_t> PageTable::translate(uintptr_t virtual_address) const {
    uintptr_t vpage = align_down(virtual_address);

    plenum::scoped_lock lk(m_lock);
    auto it = m_entries.find(vpage);
    if (it == m_entries.end() || !it->second.flags.present()) {
      return Error::page_fault(virtual_address);
    }

    return it->second.physical_address + (virtual_address - vpage);
  }


  std::optional<PageTableEntry> PageTable::lookup(uintptr_t virtual_address) const {
    plenum::scoped_lock lk(m_lock);
    auto it = m_entries.find(align_down(virtual_address));
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
  }



  Result<void> PageTable::check_access(uintptr_t virtual_address, const Permissions &required,
      SecurityMode caller_mode) const {
    plenum::scoped_lock lk(m_lock);

    auto it = m_entries.find(align_down(virtual_address));
    if (it == m_entries.end()) return Error::page_fault(virtual_address);

    const PageTableEntry &entry = it->second;

    if (!plenum::can_access(caller_mode, entry.security_mode)) {
      log_debug("PageTable: %s caller denied access to %s page %#lx", to_string(caller_mode),
          to_string(entry.security_mode), (unsigned long)entry.virtual_address);
      return Error::security_violation(entry.security_mode, caller_mode);
    }

    Permissions actual = entry.flags.to_permissions();
    if (!actual.satisfies(required)) {
      return Error::permission_denied(required, actual);
    }

    return {};
  }



  Result<void> PageTable::map_range(uintptr_t virtual_base, uintptr_t physical_base, size_t size,
      PageFlags flags, SecurityMode security_mode) {
    if (!range_fits(virtual_base, size)) return Error::invalid_address(virtual_base);
    if (!range_fits(physical_base, size)) return Error::invalid_address(physical_base);

    plenum::scoped_lock lk(m_lock);

    size_t pages = page_count(size);
    for (size_t i = 0; i < pages; i++) {
      auto r = map_locked(virtual_base + i * m_page_size, physical_base + i * m_page_size, flags,
          security_mode);
      if (!r) {
        log_debug("PageTable: map_range stopped at page %zu of %zu, "
                  "the first %zu pages stay mapped",
            i, pages, i);
        return r;
      }
    }
    return {};
  }


  Result<void> PageTable::unmap_range(uintptr_t virtual_base, size_t size) {
    if (!range_fits(virtual_base, size)) return Error::invalid_address(virtual_base);

    plenum::scoped_lock lk(m_lock);

    size_t pages = page_count(size);
    for (size_t i = 0; i < pages; i++) {
      auto r = unmap_locked(virtual_base + i * m_page_size);
      if (!r) {
        log_debug("PageTable: unmap_range stopped at page %zu of %zu", i, pages);
        return r.error();
      }
    }
    return {};
  }



  bool PageTable::is_mapped(uintptr_t virtual_address) const {
    plenum::scoped_lock lk(m_lock);
    return m_entries.count(align_down(virtual_address)) != 0;
  }

  size_t PageTable::entry_count(void) const {
    plenum::scoped_lock lk(m_lock);
    return m_entries.size();
  }

  void PageTable::clear(void) {
    plenum::scoped_lock lk(m_lock);
    m_entries.clear();
  }


  void PageTable::dump(FILE *stream) const {
    plenum::scoped_lock lk(m_lock);

    fprintf(stream, "PageTable: %zu mappings, %zu byte pages\n", m_entries.size(), m_page_size);
    for (auto &kv : m_entries) {
      const PageTableEntry &e = kv.second;
      char perms[5];
      fprintf(stream, "  %#018lx -> %#018lx %s %s%s%s %s\n", (unsigned long)e.virtual_address,
          (unsigned long)e.physical_address, to_string(e.flags.to_permissions(), perms),
          e.flags.user_accessible() ? "u" : "k", e.flags.encrypted() ? "e" : "-",
          e.flags.timing_critical() ? "t" : "-", to_string(e.security_mode));
    }
  }
}  // namespace plenum
