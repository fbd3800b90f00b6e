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

#include "util/log.h"

#include <stdarg.h>
#include <stdio.h>
#include <time.h>

#include <atomic>

namespace noctis {

static std::atomic<int> current_level(WARNING);

void set_log_level(enum LogLevel l) { current_level.store(l); }

void log(enum LogLevel l, const char* format, ...) {
  if (l > current_level.load()) {
    return;
  }

  static const char* const kNames[] = {"E", "W", "I"};
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);

  char buf[1024];
  va_list ap;
  va_start(ap, format);
  vsnprintf(buf, sizeof(buf), format, ap);
  va_end(ap);

  fprintf(stderr, "%s %ld.%06ld] %s\n", kNames[l],
          static_cast<long>(ts.tv_sec), static_cast<long>(ts.tv_nsec / 1000),
          buf);
}

}  // namespace noctis
