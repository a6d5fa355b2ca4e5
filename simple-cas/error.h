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

#ifndef SIMPLE_CAS_ERROR_H_
#define SIMPLE_CAS_ERROR_H_

#include <stdexcept>
#include <string>
#include <utility>

namespace simple_cas {

enum class ErrorCode : unsigned char {
  kOk = 0,
  kNegativeConstant,
  kEmptyVariableName,
  kDivisionByZero,
  kIntegerOverflow,
};

const char* ErrorCodeName(ErrorCode code);

// Status object filled in by the non-throwing parts of the library (checked
// arithmetic, value validation).
class Error {
 public:
  void Set(ErrorCode code, std::string message) {
    code_ = code;
    message_ = std::move(message);
  }
  void Clear() { *this = {}; }

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

  explicit operator bool() const { return code_ != ErrorCode::kOk; }

 private:
  ErrorCode code_ = ErrorCode::kOk;
  std::string message_;
};

// The only error a caller of the expression API observes. Thrown at the point
// of violation; nothing is left partially constructed.
class DomainError : public std::runtime_error {
 public:
  explicit DomainError(const Error& error)
      : std::runtime_error(error.message()), code_(error.code()) {}
  DomainError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

// Throws `DomainError` if `error` is set.
void ThrowIfError(const Error& error);

}  // namespace simple_cas

#endif  // SIMPLE_CAS_ERROR_H_
