/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace taintflow {

enum class LogSeverity {
  Info,
  Warning,
  Error,
};

/**
 * Process-wide logger writing timestamped lines to stderr.
 *
 * A message of level `n` is shown when `n` is at most the current level. The
 * level starts from `TRACE=TAINTFLOW:<n>` and is 0 when unset.
 */
class Logger final {
 public:
  Logger() = delete;

  static void set_level(int level);
  static int level();
  static bool enabled(int level);

  static void write(LogSeverity severity, const std::string& message);
};

} // namespace taintflow

#define TF_LOG(severity, level, fmt_str, ...)                         \
  do {                                                                \
    if (taintflow::Logger::enabled(level)) {                          \
      taintflow::Logger::write(                                       \
          severity, fmt::format(fmt_str, ##__VA_ARGS__));             \
    }                                                                 \
  } while (0)

#define LOG(level, format, ...) \
  TF_LOG(taintflow::LogSeverity::Info, level, format, ##__VA_ARGS__)

#define WARNING(level, format, ...) \
  TF_LOG(taintflow::LogSeverity::Warning, level, format, ##__VA_ARGS__)

#define ERROR(level, format, ...) \
  TF_LOG(taintflow::LogSeverity::Error, level, format, ##__VA_ARGS__)
