/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <fmt/chrono.h>

#include <taintflow/Log.h>

namespace taintflow {

namespace {

/**
 * Level requested through the environment, e.g `TRACE=TAINTFLOW:2`.
 * Other modules may be listed, separated by commas.
 */
int level_from_environment() {
  const char* trace = std::getenv("TRACE");
  if (trace == nullptr) {
    return 0;
  }

  std::vector<std::string> entries;
  boost::algorithm::split(entries, std::string(trace), boost::is_any_of(", "));

  int level = 0;
  for (const auto& entry : entries) {
    auto separator = entry.find(':');
    if (separator == std::string::npos ||
        entry.substr(0, separator) != "TAINTFLOW") {
      continue;
    }
    level = std::atoi(entry.c_str() + separator + 1);
  }
  return level;
}

std::atomic<int>& current_level() {
  static std::atomic<int> level(level_from_environment());
  return level;
}

std::mutex& output_mutex() {
  static std::mutex mutex;
  return mutex;
}

const char* show(LogSeverity severity) {
  switch (severity) {
    case LogSeverity::Info:
      return "INFO";
    case LogSeverity::Warning:
      return "WARNING";
    case LogSeverity::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

} // namespace

void Logger::set_level(int level) {
  current_level().store(level);
}

int Logger::level() {
  return current_level().load();
}

bool Logger::enabled(int level) {
  return level <= current_level().load();
}

void Logger::write(LogSeverity severity, const std::string& message) {
  auto line = fmt::format(
      "{:%Y-%m-%d %H:%M:%S} {} {}\n",
      fmt::localtime(std::time(nullptr)),
      show(severity),
      message);

  std::lock_guard<std::mutex> lock(output_mutex());
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
}

} // namespace taintflow
