/*
 * Copyright 2020 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SIMPLE_CAS_DEFINES_H_
#define SIMPLE_CAS_DEFINES_H_

#include <cstdio>
#include <cstdlib>

#define simple_cas_unreachable(msg) \
  simple_cas::unreachable(msg, __FILE__, __LINE__)

namespace simple_cas {

// Reports a broken internal invariant (e.g. a switch over a closed enum that
// fell through) and terminates. Not used for errors caused by the caller.
[[noreturn]] inline void unreachable(const char* msg, const char* file,
                                     int line) {
  fprintf(stderr, "Unreachable statement at %s:%d (%s)\n", file, line, msg);
  abort();
}

}  // namespace simple_cas

#endif  // SIMPLE_CAS_DEFINES_H_
