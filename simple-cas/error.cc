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

#include "simple-cas/error.h"

#include "simple-cas/defines.h"

namespace simple_cas {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kNegativeConstant:
      return "negative_constant";
    case ErrorCode::kEmptyVariableName:
      return "empty_variable_name";
    case ErrorCode::kDivisionByZero:
      return "division_by_zero";
    case ErrorCode::kIntegerOverflow:
      return "integer_overflow";
  }
  simple_cas_unreachable("ErrorCode enum wasn't exhausted in the switch.");
}

void ThrowIfError(const Error& error) {
  if (error) {
    throw DomainError(error);
  }
}

}  // namespace simple_cas
