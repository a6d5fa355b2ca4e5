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

#ifndef SIMPLE_CAS_AST_H_
#define SIMPLE_CAS_AST_H_

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <variant>

namespace simple_cas {

class Constant;
class Variable;
class CompoundExpression;

enum class BinOp : unsigned char {
  // Used to determine the first enum element.
  EnumFirst,
  Add = EnumFirst,
  Sub,
  Mul,
  Div,
  // Used to determine the last enum element.
  EnumLast = Div,
};
inline constexpr size_t NUM_BIN_OPS = (size_t)BinOp::EnumLast + 1;

inline constexpr bool is_additive(BinOp op) {
  return op == BinOp::Add || op == BinOp::Sub;
}
inline constexpr bool is_multiplicative(BinOp op) {
  return op == BinOp::Mul || op == BinOp::Div;
}

enum class SymbolStyle : unsigned char {
  // `×` for multiplication and `÷` for division. This is the canonical form.
  Unicode,
  // `*` and `/`.
  Ascii,
};

const char* bin_op_symbol(BinOp op, SymbolStyle style = SymbolStyle::Unicode);
const char* bin_op_name(BinOp op);
std::ostream& operator<<(std::ostream& os, BinOp op);

// Position of a child inside a `CompoundExpression`.
enum class Side : unsigned char {
  Left,
  Right,
};

using Expr = std::variant<Constant, Variable, CompoundExpression>;

std::ostream& operator<<(std::ostream& os, const Expr& expr);

// Canonical, fully parenthesized text of `expr`. `expr` must not contain a
// moved-from `CompoundExpression`.
std::string Render(const Expr& expr, SymbolStyle style = SymbolStyle::Unicode);

// Writes the tree structure of `expr`, one node per line.
void DumpExpr(const Expr& expr, std::ostream& os,
              SymbolStyle style = SymbolStyle::Unicode);
// Same as above, to `stdout`. Meant for debugging.
void DumpExpr(const Expr& expr);

class Constant {
 public:
  // Throws `DomainError` if `value` is negative.
  explicit Constant(int64_t value);

  uint64_t value() const { return value_; }

  friend std::ostream& operator<<(std::ostream& os, const Constant& expr);
  bool operator==(const Constant& rhs) const;
  bool operator!=(const Constant& rhs) const;

 private:
  uint64_t value_;
};

class Variable {
 public:
  // Throws `DomainError` if `name` is empty.
  explicit Variable(std::string name);

  const std::string& name() const { return name_; }

  friend std::ostream& operator<<(std::ostream& os, const Variable& expr);
  bool operator==(const Variable& rhs) const;
  bool operator!=(const Variable& rhs) const;

 private:
  std::string name_;
};

/*
 * A binary node `lhs op rhs`.
 *
 * The node exclusively owns both children, so every expression is a tree.
 * Copying a node copies the whole subtree. Children are held behind a pointer
 * so that rewrites (commute, re-association, replacing a child) move subtrees
 * around without copying them.
 *
 * A moved-from node has no children. It can only be assigned to or destroyed;
 * rendering, copying or comparing it is undefined.
 */
class CompoundExpression {
 public:
  CompoundExpression(BinOp op, Expr lhs, Expr rhs);

  CompoundExpression(const CompoundExpression& other);
  CompoundExpression(CompoundExpression&& other) noexcept;
  CompoundExpression& operator=(const CompoundExpression& other);
  CompoundExpression& operator=(CompoundExpression&& other) noexcept;
  ~CompoundExpression();

  BinOp op() const { return op_; }
  const Expr& lhs() const;
  const Expr& rhs() const;
  const Expr& child(Side side) const;

  Expr* mutable_lhs();
  Expr* mutable_rhs();

  bool additive() const { return is_additive(op_); }
  bool multiplicative() const { return is_multiplicative(op_); }

  // `A op B` -> `B op A`. Only this node changes, the children are kept as
  // they are. No check is made that `op` is commutative.
  void Commute();

  // `(A op B) op C` -> `A op (B op C)`. Applies only if the left child is a
  // compound expression with the same operator; returns false and leaves the
  // tree untouched otherwise.
  bool AssociateRight();

  // `A op (B op C)` -> `(A op B) op C`, the mirror of `AssociateRight()`.
  bool AssociateLeft();

  // Puts `expr` in place of the child on `side` and returns the old child.
  Expr ReplaceChild(Side side, Expr expr);

  friend std::ostream& operator<<(std::ostream& os,
                                  const CompoundExpression& expr);
  bool operator==(const CompoundExpression& rhs) const;
  bool operator!=(const CompoundExpression& rhs) const;

 private:
  BinOp op_;
  std::unique_ptr<Expr> lhs_;
  std::unique_ptr<Expr> rhs_;
};

}  // namespace simple_cas

#endif  // SIMPLE_CAS_AST_H_
