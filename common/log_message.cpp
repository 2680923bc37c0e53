/**
 * Copyright 2023 KUMAZAKI Hiroki
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/log_message.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <tuple>

namespace {

std::atomic<int> log_threshold{WARN};
std::mutex output_latch;

const char* LevelColor(int log_level) {
  switch (log_level) {
    case FATAL:
      return "\e[1;31m";
    case ERROR:
      return "\e[4;31m";
    case ALERT:
      return "\e[1;5;95m";
    case WARN:
      return "\e[33m";
    case NOTICE:
      return "\e[1;36m";
    case USER:
      return "\e[7;32m";
    case DEBUG:
      return "\e[1;34m";
    case TRACE:
      return "\e[4;36m";
    default:
      return "";
  }
}

const char* LevelName(int log_level) {
  switch (log_level) {
    case FATAL:
      return " FATAL  ";
    case ERROR:
      return " ERROR  ";
    case ALERT:
      return " ALERT  ";
    case WARN:
      return " WARN   ";
    case NOTICE:
      return " NOTICE ";
    case INFO:
      return " INFO   ";
    case USER:
      return " USER   ";
    case DEBUG:
      return " DEBUG  ";
    case TRACE:
      return " TRACE  ";
    default:
      return " UNKNOWN LOG LEVEL ";
  }
}

}  // anonymous namespace

int LogThreshold() { return log_threshold.load(std::memory_order_relaxed); }

void SetLogThreshold(int level) {
  log_threshold.store(level, std::memory_order_relaxed);
}

LogStream::~LogStream() {
  std::scoped_lock lk(output_latch);
  std::cerr << message_.str() << "\e[0;39;49m\n";
}

LogMessage::LogMessage(int log_level, const char* filename, int lineno,
                       const char* func_name) {
  std::array<char, 70> buff{};
  auto now = std::chrono::system_clock::now();
  std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm now_tm{};
  localtime_r(&now_time, &now_tm);
  std::ignore =
      strftime(buff.data(), buff.size(), "%Y-%m-%d %H:%M:%S ", &now_tm);

  ls << LevelColor(log_level) << buff.data() << filename << ":" << lineno
     << " " << func_name << LevelName(log_level) << " - ";
}
