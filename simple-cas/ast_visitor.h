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

#ifndef SIMPLE_CAS_AST_VISITOR_H_
#define SIMPLE_CAS_AST_VISITOR_H_

#include <variant>

#include "simple-cas/ast.h"

namespace simple_cas {

// Subclasses override one `Visit` per node kind and usually bring the
// `Visit(const Expr&)` dispatcher back into scope with `using Visitor::Visit`.
class Visitor {
 public:
  virtual ~Visitor() {}

  virtual void Visit(const Constant& e) = 0;
  virtual void Visit(const Variable& e) = 0;
  virtual void Visit(const CompoundExpression& e) = 0;

  void Visit(const Expr& e) { std::visit(*this, e); }

  void operator()(const Constant& e) { Visit(e); }
  void operator()(const Variable& e) { Visit(e); }
  void operator()(const CompoundExpression& e) { Visit(e); }
};

}  // namespace simple_cas

#endif  // SIMPLE_CAS_AST_VISITOR_H_
