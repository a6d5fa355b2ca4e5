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

#include "simple-cas/scalar.h"

#include <cstdint>
#include <limits>

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MathExtras.h"
#include "simple-cas/defines.h"

namespace simple_cas {

static int64_t FloorDivide(int64_t lhs, int64_t rhs) {
  int64_t quotient = lhs / rhs;
  // C++ division truncates towards zero, adjust when the exact quotient is
  // negative and not whole.
  if (lhs % rhs != 0 && ((lhs < 0) != (rhs < 0))) {
    --quotient;
  }
  return quotient;
}

bool ValidateConstantValue(int64_t value, Error& error) {
  if (value < 0) {
    error.Set(ErrorCode::kNegativeConstant,
              llvm::formatv("negative constant: {0}", value).str());
    return false;
  }
  return true;
}

int64_t EvaluateBinOp(BinOp op, int64_t lhs, int64_t rhs, Error& error) {
  int64_t result = 0;
  bool overflow = false;

  switch (op) {
    case BinOp::Add:
      overflow = llvm::AddOverflow(lhs, rhs, result);
      break;

    case BinOp::Sub:
      overflow = llvm::SubOverflow(lhs, rhs, result);
      break;

    case BinOp::Mul:
      overflow = llvm::MulOverflow(lhs, rhs, result);
      break;

    case BinOp::Div:
      if (rhs == 0) {
        error.Set(ErrorCode::kDivisionByZero,
                  llvm::formatv("division by zero: {0} {1} 0", lhs,
                                bin_op_symbol(op))
                      .str());
        return 0;
      }
      // The only quotient that doesn't fit.
      if (lhs == std::numeric_limits<int64_t>::min() && rhs == -1) {
        overflow = true;
        break;
      }
      result = FloorDivide(lhs, rhs);
      break;

    default:
      simple_cas_unreachable("BinOp enum wasn't exhausted in the switch.");
  }

  if (overflow) {
    error.Set(ErrorCode::kIntegerOverflow,
              llvm::formatv("integer overflow: {0} {1} {2}", lhs,
                            bin_op_symbol(op), rhs)
                  .str());
    return 0;
  }
  return result;
}

}  // namespace simple_cas
