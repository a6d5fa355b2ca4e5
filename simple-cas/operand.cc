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

#include "simple-cas/operand.h"

#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

#include "llvm/Support/FormatVariadic.h"
#include "simple-cas/error.h"
#include "simple-cas/scalar.h"

namespace simple_cas {

static bool IsZeroLiteral(const Operand& operand) {
  const auto* literal = std::get_if<int64_t>(&operand);
  return literal != nullptr && *literal == 0;
}

std::ostream& operator<<(std::ostream& os, const Operand& operand) {
  if (const auto* literal = std::get_if<int64_t>(&operand)) {
    return os << *literal;
  }
  return os << std::get<Expr>(operand);
}

Expr ToExpr(Operand operand) {
  if (const auto* literal = std::get_if<int64_t>(&operand)) {
    return Constant(*literal);
  }
  return std::get<Expr>(std::move(operand));
}

Operand Apply(BinOp op, Operand lhs, Operand rhs) {
  if (is_literal(lhs) && is_literal(rhs)) {
    Error error;
    int64_t value = EvaluateBinOp(op, std::get<int64_t>(lhs),
                                  std::get<int64_t>(rhs), error);
    ThrowIfError(error);
    return value;
  }

  // An expression divisor is never inspected, `x ÷ 0` is a valid tree.
  if (op == BinOp::Div && IsZeroLiteral(rhs)) {
    std::ostringstream dividend;
    dividend << lhs;
    throw DomainError(ErrorCode::kDivisionByZero,
                      llvm::formatv("division by zero: {0} {1} 0",
                                    dividend.str(), bin_op_symbol(op))
                          .str());
  }

  // Both sides are validated before the node is allocated.
  Expr lhs_expr = ToExpr(std::move(lhs));
  Expr rhs_expr = ToExpr(std::move(rhs));
  return Expr(
      CompoundExpression(op, std::move(lhs_expr), std::move(rhs_expr)));
}

Operand Add(Operand lhs, Operand rhs) {
  return Apply(BinOp::Add, std::move(lhs), std::move(rhs));
}

Operand Sub(Operand lhs, Operand rhs) {
  return Apply(BinOp::Sub, std::move(lhs), std::move(rhs));
}

Operand Mul(Operand lhs, Operand rhs) {
  return Apply(BinOp::Mul, std::move(lhs), std::move(rhs));
}

Operand Div(Operand lhs, Operand rhs) {
  return Apply(BinOp::Div, std::move(lhs), std::move(rhs));
}

// At least one side of `lhs op rhs` is an expression here, so `Apply()` always
// builds a node.
static CompoundExpression Build(BinOp op, Operand lhs, Operand rhs) {
  Operand result = Apply(op, std::move(lhs), std::move(rhs));
  return std::get<CompoundExpression>(std::get<Expr>(std::move(result)));
}

CompoundExpression operator+(Expr lhs, Expr rhs) {
  return Build(BinOp::Add, std::move(lhs), std::move(rhs));
}
CompoundExpression operator+(Expr lhs, int64_t rhs) {
  return Build(BinOp::Add, std::move(lhs), rhs);
}
CompoundExpression operator+(int64_t lhs, Expr rhs) {
  return Build(BinOp::Add, lhs, std::move(rhs));
}

CompoundExpression operator-(Expr lhs, Expr rhs) {
  return Build(BinOp::Sub, std::move(lhs), std::move(rhs));
}
CompoundExpression operator-(Expr lhs, int64_t rhs) {
  return Build(BinOp::Sub, std::move(lhs), rhs);
}
CompoundExpression operator-(int64_t lhs, Expr rhs) {
  return Build(BinOp::Sub, lhs, std::move(rhs));
}

CompoundExpression operator*(Expr lhs, Expr rhs) {
  return Build(BinOp::Mul, std::move(lhs), std::move(rhs));
}
CompoundExpression operator*(Expr lhs, int64_t rhs) {
  return Build(BinOp::Mul, std::move(lhs), rhs);
}
CompoundExpression operator*(int64_t lhs, Expr rhs) {
  return Build(BinOp::Mul, lhs, std::move(rhs));
}

CompoundExpression operator/(Expr lhs, Expr rhs) {
  return Build(BinOp::Div, std::move(lhs), std::move(rhs));
}
CompoundExpression operator/(Expr lhs, int64_t rhs) {
  return Build(BinOp::Div, std::move(lhs), rhs);
}
CompoundExpression operator/(int64_t lhs, Expr rhs) {
  return Build(BinOp::Div, lhs, std::move(rhs));
}

}  // namespace simple_cas
