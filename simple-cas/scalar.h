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

#ifndef SIMPLE_CAS_SCALAR_H_
#define SIMPLE_CAS_SCALAR_H_

#include <cstdint>

#include "simple-cas/ast.h"
#include "simple-cas/error.h"

namespace simple_cas {

// Checks that `value` may be held by a `Constant`. Sets `error` and returns
// false if it may not.
bool ValidateConstantValue(int64_t value, Error& error);

// Computes `lhs op rhs` on raw integers. Division rounds towards negative
// infinity, e.g. `-7 ÷ 2` is `-4`.
//
// Division by zero and results outside of the `int64_t` range set `error`; the
// returned value is meaningless in that case. Nothing is thrown.
int64_t EvaluateBinOp(BinOp op, int64_t lhs, int64_t rhs, Error& error);

}  // namespace simple_cas

#endif  // SIMPLE_CAS_SCALAR_H_
