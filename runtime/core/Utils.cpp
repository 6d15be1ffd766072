/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <plenum/utils.h>
#include <execinfo.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define BT_BUF_SIZE 64

// Printed on the way down from a failed PLENUM_ASSERT or PLENUM_SANITY, so it only writes to
// stderr and never allocates through the memory core.
void plenum_dump_backtrace(void) {
  void *buffer[BT_BUF_SIZE];
  int nptrs = backtrace(buffer, BT_BUF_SIZE);

  fprintf(stderr, "Backtrace (%d frames):\n", nptrs);
  char **strings = backtrace_symbols(buffer, nptrs);
  if (strings == NULL) {
    // Still worth something without symbols
    backtrace_symbols_fd(buffer, nptrs, fileno(stderr));
  } else {
    for (int j = 0; j < nptrs; j++)
      fprintf(stderr, "\x1b[92m%d\x1b[0m: %s\n", j, strings[j]);
    free(strings);
  }

  // The addresses above are only useful next to the mappings they came from.
  if (getenv("PLENUM_DUMP_MAPS") == NULL) return;
  FILE *maps = fopen("/proc/self/maps", "r");
  if (maps == NULL) return;

  fprintf(stderr, "Memory Map:\n");
  char line[1024];
  while (fgets(line, sizeof(line), maps) != NULL) {
    fputs(line, stderr);
  }
  fclose(maps);
}
