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

#include "simple-cas/ast.h"

#include <ios>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "simple-cas/ast_visitor.h"
#include "simple-cas/error.h"
#include "simple-cas/scalar.h"

namespace simple_cas {

struct BinOpInfo {
  const char* symbol;
  const char* ascii_symbol;
  const char* name;
};

static const BinOpInfo BIN_OP_TABLE[NUM_BIN_OPS] = {
    {"+", "+", "Add"},       // BinOp::Add
    {"-", "-", "Sub"},       // BinOp::Sub
    {"\u00d7", "*", "Mul"},  // BinOp::Mul, `×`
    {"\u00f7", "/", "Div"},  // BinOp::Div, `÷`
};

const char* bin_op_symbol(BinOp op, SymbolStyle style) {
  const BinOpInfo& info = BIN_OP_TABLE[(size_t)op];
  return style == SymbolStyle::Ascii ? info.ascii_symbol : info.symbol;
}

const char* bin_op_name(BinOp op) { return BIN_OP_TABLE[(size_t)op].name; }

std::ostream& operator<<(std::ostream& os, BinOp op) {
  return os << bin_op_symbol(op);
}

/**
 * Writes the canonical form of an expression. Every compound expression is
 * wrapped in parentheses, no matter the precedence of the operators involved.
 */
class ExprPrinter {
 public:
  ExprPrinter(std::ostream& os, SymbolStyle style) : os_(os), style_(style) {}

  void Print(const Expr& e) { std::visit(*this, e); }

  void operator()(const Constant& e) {
    auto saved_flags = os_.flags();
    os_ << std::dec << e.value();
    os_.flags(saved_flags);
  }

  void operator()(const Variable& e) { os_ << e.name(); }

  void operator()(const CompoundExpression& e) {
    os_ << "(";
    Print(e.lhs());
    os_ << " " << bin_op_symbol(e.op(), style_) << " ";
    Print(e.rhs());
    os_ << ")";
  }

 private:
  std::ostream& os_;
  SymbolStyle style_;
};

std::ostream& operator<<(std::ostream& os, const Expr& e) {
  ExprPrinter(os, SymbolStyle::Unicode).Print(e);
  return os;
}

std::string Render(const Expr& expr, SymbolStyle style) {
  std::ostringstream os;
  ExprPrinter(os, style).Print(expr);
  return os.str();
}

Constant::Constant(int64_t value) {
  Error error;
  ValidateConstantValue(value, error);
  ThrowIfError(error);
  value_ = static_cast<uint64_t>(value);
}
std::ostream& operator<<(std::ostream& os, const Constant& e) {
  ExprPrinter(os, SymbolStyle::Unicode)(e);
  return os;
}
bool Constant::operator==(const Constant& rhs) const {
  return value_ == rhs.value_;
}
bool Constant::operator!=(const Constant& rhs) const {
  return value_ != rhs.value_;
}

Variable::Variable(std::string name) : name_(std::move(name)) {
  if (name_.empty()) {
    throw DomainError(ErrorCode::kEmptyVariableName, "empty variable name");
  }
}
std::ostream& operator<<(std::ostream& os, const Variable& e) {
  return os << e.name();
}
bool Variable::operator==(const Variable& rhs) const {
  return name_ == rhs.name_;
}
bool Variable::operator!=(const Variable& rhs) const {
  return name_ != rhs.name_;
}

CompoundExpression::CompoundExpression(BinOp op, Expr lhs, Expr rhs)
    : op_(op),
      lhs_(std::make_unique<Expr>(std::move(lhs))),
      rhs_(std::make_unique<Expr>(std::move(rhs))) {}

CompoundExpression::CompoundExpression(const CompoundExpression& other)
    : op_(other.op_),
      lhs_(std::make_unique<Expr>(*other.lhs_)),
      rhs_(std::make_unique<Expr>(*other.rhs_)) {}

CompoundExpression::CompoundExpression(CompoundExpression&& other) noexcept =
    default;

CompoundExpression& CompoundExpression::operator=(
    const CompoundExpression& other) {
  if (this != &other) {
    // `other` may be part of this node's subtree, copy it before anything is
    // released.
    CompoundExpression copy(other);
    *this = std::move(copy);
  }
  return *this;
}

CompoundExpression& CompoundExpression::operator=(
    CompoundExpression&& other) noexcept {
  // `other` may live inside this node's subtree. Take both of its children
  // before the old children (and with them `other` itself) are destroyed.
  std::unique_ptr<Expr> lhs = std::move(other.lhs_);
  std::unique_ptr<Expr> rhs = std::move(other.rhs_);
  op_ = other.op_;
  lhs_ = std::move(lhs);
  rhs_ = std::move(rhs);
  return *this;
}

CompoundExpression::~CompoundExpression() = default;

const Expr& CompoundExpression::lhs() const { return *lhs_; }
const Expr& CompoundExpression::rhs() const { return *rhs_; }
const Expr& CompoundExpression::child(Side side) const {
  return side == Side::Left ? *lhs_ : *rhs_;
}

Expr* CompoundExpression::mutable_lhs() { return lhs_.get(); }
Expr* CompoundExpression::mutable_rhs() { return rhs_.get(); }

void CompoundExpression::Commute() { std::swap(lhs_, rhs_); }

bool CompoundExpression::AssociateRight() {
  const auto* inner = std::get_if<CompoundExpression>(lhs_.get());
  if (inner == nullptr || inner->op_ != op_) {
    return false;
  }

  // The inner node `A op B` is reused as `B op C`.
  std::unique_ptr<Expr> moved = std::move(lhs_);
  auto& node = std::get<CompoundExpression>(*moved);
  std::unique_ptr<Expr> a = std::move(node.lhs_);
  node.lhs_ = std::move(node.rhs_);
  node.rhs_ = std::move(rhs_);

  lhs_ = std::move(a);
  rhs_ = std::move(moved);
  return true;
}

bool CompoundExpression::AssociateLeft() {
  const auto* inner = std::get_if<CompoundExpression>(rhs_.get());
  if (inner == nullptr || inner->op_ != op_) {
    return false;
  }

  // The inner node `B op C` is reused as `A op B`.
  std::unique_ptr<Expr> moved = std::move(rhs_);
  auto& node = std::get<CompoundExpression>(*moved);
  std::unique_ptr<Expr> c = std::move(node.rhs_);
  node.rhs_ = std::move(node.lhs_);
  node.lhs_ = std::move(lhs_);

  lhs_ = std::move(moved);
  rhs_ = std::move(c);
  return true;
}

Expr CompoundExpression::ReplaceChild(Side side, Expr expr) {
  std::unique_ptr<Expr>& slot = side == Side::Left ? lhs_ : rhs_;
  Expr previous = std::move(*slot);
  *slot = std::move(expr);
  return previous;
}

std::ostream& operator<<(std::ostream& os, const CompoundExpression& e) {
  ExprPrinter(os, SymbolStyle::Unicode)(e);
  return os;
}

bool CompoundExpression::operator==(const CompoundExpression& rhs) const {
  return op_ == rhs.op_ && *lhs_ == *rhs.lhs_ && *rhs_ == *rhs.rhs_;
}
bool CompoundExpression::operator!=(const CompoundExpression& rhs) const {
  return !(*this == rhs);
}

/**
 * A visitor that dumps the tree structure of an expression, e.g. for
 * `((a + 1) × b)`:
 *
 *   CompoundExpression op=×
 *   |-CompoundExpression op=+
 *   | |-Variable name=a
 *   | `-Constant value=1
 *   `-Variable name=b
 */
class ExprDumper : public Visitor {
 public:
  ExprDumper(std::ostream& os, SymbolStyle style) : os_(os), style_(style) {}

  using Visitor::Visit;

  void Visit(const Constant& e) override {
    os_ << "Constant value=" << e << "\n";
  }

  void Visit(const Variable& e) override {
    os_ << "Variable name=" << e.name() << "\n";
  }

  void Visit(const CompoundExpression& e) override {
    os_ << "CompoundExpression op=" << bin_op_symbol(e.op(), style_) << "\n";

    PrintChild(e.lhs());
    PrintLastChild(e.rhs());
  }

 private:
  void PrintChild(const Expr& e) { Print("|-", "| ", e); }
  void PrintLastChild(const Expr& e) { Print("`-", "  ", e); }

  void Print(const std::string& header, std::string prefix, const Expr& e) {
    for (const auto& p : prefixes_) {
      os_ << p;
    }
    os_ << header;

    prefixes_.push_back(std::move(prefix));
    Visit(e);
    prefixes_.pop_back();
  }

 private:
  std::ostream& os_;
  SymbolStyle style_;
  std::vector<std::string> prefixes_;
};

void DumpExpr(const Expr& expr, std::ostream& os, SymbolStyle style) {
  ExprDumper dumper(os, style);
  dumper.Visit(expr);
}

void DumpExpr(const Expr& expr) { DumpExpr(expr, std::cout); }

}  // namespace simple_cas
