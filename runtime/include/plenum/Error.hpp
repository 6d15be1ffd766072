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
#include <optional>
#include <string>
#include <utility>
#include <plenum/Security.hpp>
#include <plenum/utils.h>

namespace plenum {

  enum class ErrorKind : uint8_t {
    OutOfMemory,        // no sufficiently large run of frames / heap block
    InvalidAddress,     // out of range, or not something this allocator handed out
    InvalidAlignment,   // misaligned request
    RegionOverlap,      // conflicting reservation or mapping
    PermissionDenied,   // mapping lacks a required permission
    SecurityViolation,  // caller's classification is below the mapping's
    DoubleFree,         // freeing something that is already free
    PageFault,          // translation miss or not-present entry
    FrameExhausted,     // no free frame at all
    HeapCorruption,     // heap validation found a broken invariant
  };

  const char *to_string(ErrorKind kind);


  // An error carries the diagnostic context of its kind. Fields that do not apply to the kind
  // are left zeroed.
  struct Error final {
    ErrorKind kind = ErrorKind::OutOfMemory;

    uintptr_t address = 0;  // InvalidAddress, InvalidAlignment, DoubleFree, PageFault
    uintptr_t base = 0;     // RegionOverlap
    size_t size = 0;        // RegionOverlap

    Permissions required_perms;  // PermissionDenied
    Permissions actual_perms;
    SecurityMode required_mode = SecurityMode::ModeZero;  // SecurityViolation
    SecurityMode actual_mode = SecurityMode::ModeZero;

    static Error out_of_memory(void) { return Error(ErrorKind::OutOfMemory); }
    static Error frame_exhausted(void) { return Error(ErrorKind::FrameExhausted); }
    static Error heap_corruption(void) { return Error(ErrorKind::HeapCorruption); }
    static Error invalid_address(uintptr_t addr) { return with_address(ErrorKind::InvalidAddress, addr); }
    static Error invalid_alignment(uintptr_t addr) { return with_address(ErrorKind::InvalidAlignment, addr); }
    static Error double_free(uintptr_t addr) { return with_address(ErrorKind::DoubleFree, addr); }
    static Error page_fault(uintptr_t addr) { return with_address(ErrorKind::PageFault, addr); }

    static Error region_overlap(uintptr_t base, size_t size) {
      Error e(ErrorKind::RegionOverlap);
      e.base = base;
      e.size = size;
      return e;
    }

    static Error permission_denied(const Permissions &required, const Permissions &actual) {
      Error e(ErrorKind::PermissionDenied);
      e.required_perms = required;
      e.actual_perms = actual;
      return e;
    }

    static Error security_violation(SecurityMode required, SecurityMode actual) {
      Error e(ErrorKind::SecurityViolation);
      e.required_mode = required;
      e.actual_mode = actual;
      return e;
    }

    bool is(ErrorKind k) const { return kind == k; }

    // Human readable, for logs and trap handlers ("Double free at 0x4000", ...)
    std::string describe(void) const;

   private:
    explicit Error(ErrorKind kind)
        : kind(kind) {}

    static Error with_address(ErrorKind kind, uintptr_t addr) {
      Error e(kind);
      e.address = addr;
      return e;
    }
  };



  // Either a T, or the Error explaining why there is no T. Every fallible operation in the
  // memory core returns one of these. Nothing is retried internally, so a failed Result is
  // always the caller's to handle.
  template <typename T>
  class Result final {
   public:
    Result(const T &value)
        : m_value(value) {}
    Result(T &&value)
        : m_value(std::move(value)) {}
    Result(const Error &error)
        : m_error(error) {}

    bool ok(void) const { return m_value.has_value(); }
    explicit operator bool(void) const { return ok(); }

    T &unwrap(void) {
      PLENUM_ASSERT(ok(), "unwrap() on a failed result: %s", m_error.describe().c_str());
      return *m_value;
    }

    const T &unwrap(void) const {
      PLENUM_ASSERT(ok(), "unwrap() on a failed result: %s", m_error.describe().c_str());
      return *m_value;
    }

    T unwrap_or(T fallback) const { return ok() ? *m_value : fallback; }

    const Error &error(void) const {
      PLENUM_ASSERT(!ok(), "error() on a successful result");
      return m_error;
    }

   private:
    std::optional<T> m_value;
    Error m_error = Error::out_of_memory();
  };


  template <>
  class Result<void> final {
   public:
    Result(void)
        : m_ok(true) {}
    Result(const Error &error)
        : m_ok(false)
        , m_error(error) {}

    bool ok(void) const { return m_ok; }
    explicit operator bool(void) const { return ok(); }

    void unwrap(void) const {
      PLENUM_ASSERT(ok(), "unwrap() on a failed result: %s", m_error.describe().c_str());
    }

    const Error &error(void) const {
      PLENUM_ASSERT(!ok(), "error() on a successful result");
      return m_error;
    }

   private:
    bool m_ok;
    Error m_error = Error::out_of_memory();
  };
}  // namespace plenum
