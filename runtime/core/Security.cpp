/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/Security.hpp>
#include <strings.h>

namespace plenum {

  const char *to_string(SecurityMode mode) {
    switch (mode) {
      case SecurityMode::ModePhi:
        return "ModePhi";
      case SecurityMode::ModeOne:
        return "ModeOne";
      case SecurityMode::ModeZero:
        return "ModeZero";
    }
    return "ModeUnknown";
  }


  bool parse_security_mode(const char *name, SecurityMode &out) {
    if (name == nullptr) return false;
    // Accept both the short form ("phi") and the enumerator name ("ModePhi").
    if (strncasecmp(name, "mode", 4) == 0) name += 4;

    if (strcasecmp(name, "phi") == 0) {
      out = SecurityMode::ModePhi;
    } else if (strcasecmp(name, "one") == 0) {
      out = SecurityMode::ModeOne;
    } else if (strcasecmp(name, "zero") == 0) {
      out = SecurityMode::ModeZero;
    } else {
      return false;
    }
    return true;
  }


  const char *to_string(const Permissions &perms, char buf[5]) {
    buf[0] = perms.read ? 'r' : '-';
    buf[1] = perms.write ? 'w' : '-';
    buf[2] = perms.execute ? 'x' : '-';
    buf[3] = perms.compute ? 'c' : '-';
    buf[4] = '\0';
    return buf;
  }
}  // namespace plenum
