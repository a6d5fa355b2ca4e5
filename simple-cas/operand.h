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

#ifndef SIMPLE_CAS_OPERAND_H_
#define SIMPLE_CAS_OPERAND_H_

#include <cstdint>
#include <iosfwd>
#include <variant>

#include "simple-cas/ast.h"

namespace simple_cas {

// Either a raw integer literal or an expression tree. Raw literals never end
// up inside a tree: as soon as one meets an expression it is turned into a
// `Constant`.
using Operand = std::variant<int64_t, Expr>;

inline bool is_literal(const Operand& operand) {
  return std::holds_alternative<int64_t>(operand);
}

std::ostream& operator<<(std::ostream& os, const Operand& operand);

// Turns `operand` into an expression. A literal becomes a new `Constant`, so
// this throws `DomainError` for negative literals.
Expr ToExpr(Operand operand);

// Combines two operands with `op`:
//
//  - two literals are computed right away and the result is a literal, no
//    tree is built (see `EvaluateBinOp()` for the rounding and overflow
//    rules);
//  - otherwise the literal side, if any, becomes a `Constant` and the result
//    is a new `CompoundExpression` with both operands on their original side.
//
// Throws `DomainError` on division by a literal `0`, on overflow and on
// negative literals that would have to become a `Constant`. Two expressions
// are combined without further checks, so `Div(x, Constant(0))` is `(x ÷ 0)`.
Operand Apply(BinOp op, Operand lhs, Operand rhs);

Operand Add(Operand lhs, Operand rhs);
Operand Sub(Operand lhs, Operand rhs);
Operand Mul(Operand lhs, Operand rhs);
Operand Div(Operand lhs, Operand rhs);

// Operators for building trees with ordinary C++ syntax. There is no overload
// for two integers: `a + 1 * 2` computes `1 * 2` as plain integers first and
// produces `(a + 2)`, while `a + Constant(1) * 2` keeps the product and
// produces `(a + (1 × 2))`.
CompoundExpression operator+(Expr lhs, Expr rhs);
CompoundExpression operator+(Expr lhs, int64_t rhs);
CompoundExpression operator+(int64_t lhs, Expr rhs);

CompoundExpression operator-(Expr lhs, Expr rhs);
CompoundExpression operator-(Expr lhs, int64_t rhs);
CompoundExpression operator-(int64_t lhs, Expr rhs);

CompoundExpression operator*(Expr lhs, Expr rhs);
CompoundExpression operator*(Expr lhs, int64_t rhs);
CompoundExpression operator*(int64_t lhs, Expr rhs);

CompoundExpression operator/(Expr lhs, Expr rhs);
CompoundExpression operator/(Expr lhs, int64_t rhs);
CompoundExpression operator/(int64_t lhs, Expr rhs);

}  // namespace simple_cas

#endif  // SIMPLE_CAS_OPERAND_H_
