/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/Error.hpp>
#include <stdio.h>

namespace plenum {

  const char *to_string(ErrorKind kind) {
    switch (kind) {
      case ErrorKind::OutOfMemory:
        return "OutOfMemory";
      case ErrorKind::InvalidAddress:
        return "InvalidAddress";
      case ErrorKind::InvalidAlignment:
        return "InvalidAlignment";
      case ErrorKind::RegionOverlap:
        return "RegionOverlap";
      case ErrorKind::PermissionDenied:
        return "PermissionDenied";
      case ErrorKind::SecurityViolation:
        return "SecurityViolation";
      case ErrorKind::DoubleFree:
        return "DoubleFree";
      case ErrorKind::PageFault:
        return "PageFault";
      case ErrorKind::FrameExhausted:
        return "FrameExhausted";
      case ErrorKind::HeapCorruption:
        return "HeapCorruption";
    }
    return "Unknown";
  }


  std::string Error::describe(void) const {
    char buf[128];
    char req[5], act[5];

    switch (kind) {
      case ErrorKind::OutOfMemory:
        return "Out of memory";
      case ErrorKind::InvalidAddress:
        snprintf(buf, sizeof(buf), "Invalid address: %#lx", (unsigned long)address);
        break;
      case ErrorKind::InvalidAlignment:
        // The alignment errors carry either an address or a raw request value (a frame
        // count of zero, a bad alignment), so this one prints in decimal.
        snprintf(buf, sizeof(buf), "Invalid alignment: %lu", (unsigned long)address);
        break;
      case ErrorKind::RegionOverlap:
        snprintf(buf, sizeof(buf), "Region overlap at %#lx size %zu", (unsigned long)base, size);
        break;
      case ErrorKind::PermissionDenied:
        snprintf(buf, sizeof(buf), "Permission denied (required %s, have %s)",
            to_string(required_perms, req), to_string(actual_perms, act));
        break;
      case ErrorKind::SecurityViolation:
        snprintf(buf, sizeof(buf), "Security mode violation (required %s, caller %s)",
            to_string(required_mode), to_string(actual_mode));
        break;
      case ErrorKind::DoubleFree:
        snprintf(buf, sizeof(buf), "Double free at %#lx", (unsigned long)address);
        break;
      case ErrorKind::PageFault:
        snprintf(buf, sizeof(buf), "Page fault at %#lx", (unsigned long)address);
        break;
      case ErrorKind::FrameExhausted:
        return "Physical frames exhausted";
      case ErrorKind::HeapCorruption:
        return "Heap corruption detected";
      default:
        return "Unknown memory error";
    }
    return buf;
  }
}  // namespace plenum
