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
#include <plenum/utils.h>

enum { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR, LOG_FATAL };


namespace plenum {
  void log(int level, const char *file, int line, const char *fmt, ...)
      __attribute__((format(printf, 4, 5)));

  // Has no effect if the level was fixed by PLENUM_LOG_LEVEL in the environment.
  void set_log_level(int level);
  int get_log_level(void);

  // "trace", "DEBUG", "w", ... -> LOG_*. Returns -1 if the string names no level.
  int parse_log_level(const char *name);
  const char *log_level_name(int level);
};  // namespace plenum



#ifdef PLENUM_ENABLE_LOGGING
#define log_trace(...) plenum::log(LOG_TRACE, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_debug(...) plenum::log(LOG_DEBUG, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_info(...) plenum::log(LOG_INFO, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_warn(...) plenum::log(LOG_WARN, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_error(...) plenum::log(LOG_ERROR, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_fatal(...) plenum::log(LOG_FATAL, __FILE_NAME__, __LINE__, __VA_ARGS__)
#else
#define log_trace(...)
#define log_debug(...)
#define log_info(...)
#define log_warn(...)
#define log_error(...)
#define log_fatal(...)
#endif
