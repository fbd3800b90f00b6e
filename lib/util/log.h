// Copyright 2025 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef NOCTIS_LIB_UTIL_LOG_H_
#define NOCTIS_LIB_UTIL_LOG_H_

namespace noctis {

enum LogLevel {
  ERROR = 0,
  WARNING = 1,
  INFO = 2,
};

// Messages above the current level are dropped.  The default level is
// WARNING, so library code can log at INFO without spamming callers.
void set_log_level(enum LogLevel l);

// printf-style logging to stderr, prefixed with a timestamp and the level.
void log(enum LogLevel l, const char* format, ...)
    __attribute__((format(printf, 2, 3)));

}  // namespace noctis

#endif  // NOCTIS_LIB_UTIL_LOG_H_
