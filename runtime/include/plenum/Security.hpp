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

#include <stdint.h>

// This is the whole surface the memory core needs from the security subsystem: one
// classification value with an ordering predicate, and the permission bits a mapping grants.
// Capabilities, policies and auditing live elsewhere and are not visible from here.
namespace plenum {

  enum class SecurityMode : uint8_t {
    ModePhi,   // maximum privilege
    ModeOne,   // standard operation
    ModeZero,  // restricted / quarantine
  };

  inline constexpr uint8_t access_level(SecurityMode mode) {
    switch (mode) {
      case SecurityMode::ModePhi:
        return 3;
      case SecurityMode::ModeOne:
        return 2;
      case SecurityMode::ModeZero:
        return 1;
    }
    return 0;
  }

  // May a caller holding `caller` operate on a resource classified as `target`?
  inline constexpr bool can_access(SecurityMode caller, SecurityMode target) {
    return access_level(caller) >= access_level(target);
  }

  const char *to_string(SecurityMode mode);
  // "phi", "ModeOne", "zero", ... Returns false (and leaves `out` alone) on anything else.
  bool parse_security_mode(const char *name, SecurityMode &out);



  struct Permissions {
    bool read = false;
    bool write = false;
    bool execute = false;
    bool compute = false;  // ternary compute capable

    static constexpr Permissions read_only(void) { return {true, false, false, false}; }
    static constexpr Permissions read_write(void) { return {true, true, false, false}; }
    static constexpr Permissions read_execute(void) { return {true, false, true, false}; }
    static constexpr Permissions ternary(void) { return {true, true, false, true}; }
    static constexpr Permissions all(void) { return {true, true, true, true}; }
    static constexpr Permissions none(void) { return {false, false, false, false}; }

    // Does `this` grant everything `required` asks for?
    constexpr bool satisfies(const Permissions &required) const {
      return (!required.read || read) && (!required.write || write) &&
             (!required.execute || execute) && (!required.compute || compute);
    }

    constexpr bool operator==(const Permissions &o) const {
      return read == o.read && write == o.write && execute == o.execute && compute == o.compute;
    }
    constexpr bool operator!=(const Permissions &o) const { return !(*this == o); }
  };

  // Renders as "rwxc", with '-' in place of missing permissions. `buf` needs 5 bytes.
  const char *to_string(const Permissions &perms, char buf[5]);
}  // namespace plenum
