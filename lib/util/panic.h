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

#ifndef NOCTIS_LIB_UTIL_PANIC_H_
#define NOCTIS_LIB_UTIL_PANIC_H_

namespace noctis {

// Abort the program with a message if the condition is false.  Use this
// for conditions that can only fail because of a programming error, never
// for conditions that depend on user-supplied data.
void check(bool truth, const char* why);

// Unconditionally abort the program.
[[noreturn]] void fail(const char* why);

}  // namespace noctis

#endif  // NOCTIS_LIB_UTIL_PANIC_H_
