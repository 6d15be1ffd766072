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
#include <stdlib.h>

#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

// Checks which are too expensive to leave on all the time (walking the whole block
// list on every heap operation, recounting the frame bitmap, etc).
#ifdef PLENUM_SANITY_CHECK
#define PLENUM_SANITY(c, msg, ...)                                                              \
  do {                                                                                          \
    if (!(c)) {                                                                                 \
      fprintf(stderr, "\x1b[31m-----------[ Plenum Sanity Check Failed ]-----------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                                      \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                             \
      fprintf(stderr, msg "\n", ##__VA_ARGS__);                                                 \
      plenum_dump_backtrace();                                                                  \
      fprintf(stderr, "\x1b[31m                      Bailing!\x1b[0m\n");                       \
      exit(EXIT_FAILURE);                                                                       \
    }                                                                                           \
  } while (0)
#else
#define PLENUM_SANITY(c, msg, ...) /* do nothing if it's disabled */
#endif

// A broken PLENUM_ASSERT is a bug in the memory core (or a caller handing it nonsense
// at construction), never a request that was simply refused. Those go through Result.
#define PLENUM_ASSERT(c, msg, ...)                                                        \
  do {                                                                                    \
    if (!(c)) {                                                                           \
      fprintf(stderr, "\x1b[31m-----------[ Plenum Assert Failed ]-----------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                                \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                       \
      fprintf(stderr, "Reason: \x1b[33m" msg "\x1b[0m\n", ##__VA_ARGS__);                 \
      plenum_dump_backtrace();                                                            \
      fprintf(stderr, "\x1b[31mExiting.\x1b[0m\n");                                       \
      abort();                                                                            \
    }                                                                                     \
  } while (0)


#define likely(x) __builtin_expect((x), 1)
#define unlikely(x) __builtin_expect((x), 0)

// Only valid for power of two `y`/`s`.
#define round_up(x, y) (((x) + (y)-1) & ~((y)-1))
#define round_down(x, s) ((x) & ~((s)-1))

#define is_power_of_two(x) ((x) != 0 && (((x) & ((x)-1)) == 0))


extern void plenum_dump_backtrace(void);
