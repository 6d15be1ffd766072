/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */



#include <plenum/Logger.hpp>
#include <pthread.h>
#include <stdarg.h>
#include <stdlib.h>
#include <strings.h>
#include <time.h>
#include <unistd.h>

static const char *level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

static const char *level_colors[] = {
    "\x1b[94m", "\x1b[36m", "\x1b[32m", "\x1b[33m", "\x1b[31m", "\x1b[35m"};


static pthread_mutex_t log_mutex = PTHREAD_MUTEX_INITIALIZER;
static int log_level = LOG_ERROR;
static bool enable_colors = true;

// If the log level is coming from ENV, lock it so it cannot change.
static bool log_level_locked = false;

static void __attribute__((constructor(102))) plenum_logger_init(void) {
  enable_colors = isatty(STDERR_FILENO);

  const char *env = getenv("PLENUM_LOG_LEVEL");
  if (env != NULL) {
    int level = plenum::parse_log_level(env);
    if (level >= 0) {
      log_level = level;
      log_level_locked = true;
    }
  }
}


namespace plenum {
  void log(int level, const char *file, int line, const char *fmt, ...) {
    if (level < log_level || level < LOG_TRACE || level > LOG_FATAL) return;

    va_list args;
    va_start(args, fmt);

    pthread_mutex_lock(&log_mutex);

    time_t t = time(NULL);
    struct tm now;
    localtime_r(&t, &now);

    char buf[16];
    buf[strftime(buf, sizeof(buf), "%H:%M:%S", &now)] = '\0';

    if (enable_colors) {
      fprintf(stderr, "%s %s%-5s\x1b[0m \x1b[90m%s:%d\x1b[0m | ", buf, level_colors[level],
          level_strings[level], file, line);
    } else {
      fprintf(stderr, "%s %-5s %s:%d | ", buf, level_strings[level], file, line);
    }

    vfprintf(stderr, fmt, args);
    fputc('\n', stderr);
    fflush(stderr);

    pthread_mutex_unlock(&log_mutex);
    va_end(args);
  }


  void set_log_level(int level) {
    if (!log_level_locked) {
      log_level = level;
    }
  }

  int get_log_level(void) { return log_level; }


  int parse_log_level(const char *name) {
    if (name == NULL || name[0] == '\0') return -1;

    for (int level = LOG_TRACE; level <= LOG_FATAL; level++) {
      if (strcasecmp(name, level_strings[level]) == 0) return level;
    }

    // Single letter shorthands (T, D, I, W, E, F), like the old env var format.
    if (name[1] == '\0') {
      for (int level = LOG_TRACE; level <= LOG_FATAL; level++) {
        if ((name[0] | 0x20) == (level_strings[level][0] | 0x20)) return level;
      }
    }
    return -1;
  }


  const char *log_level_name(int level) {
    if (level < LOG_TRACE || level > LOG_FATAL) return "?";
    return level_strings[level];
  }
}  // namespace plenum
