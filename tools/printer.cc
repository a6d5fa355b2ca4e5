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

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include "simple-cas/ast.h"
#include "simple-cas/error.h"
#include "simple-cas/operand.h"

using simple_cas::CompoundExpression;
using simple_cas::Constant;
using simple_cas::Expr;
using simple_cas::SymbolStyle;
using simple_cas::Variable;

static void PrintExpr(const std::string& title, const Expr& expr,
                      SymbolStyle style) {
  std::cout << title << ": " << simple_cas::Render(expr, style) << std::endl;
  simple_cas::DumpExpr(expr, std::cout, style);
  std::cout << std::endl;
}

static void PrintSamples(SymbolStyle style) {
  Variable a("a");
  Variable b("b");
  Variable x("x");
  Variable y("y");
  Variable z("z");

  PrintExpr("sum", a + Constant(10), style);
  PrintExpr("difference", (a + 1) - ((2 - b) + 3 * a), style);

  // `1 * 2` is computed before it meets `a`, the product is not kept.
  PrintExpr("collapsed", a + 1 * 2, style);
  PrintExpr("preserved", a + Constant(1) * 2, style);

  CompoundExpression expr = 2 * (x + 1) + 5 * y + z;
  PrintExpr("before commute", expr, style);
  expr.Commute();
  PrintExpr("after commute", expr, style);
}

int main(int argc, char** argv) {
  SymbolStyle style = SymbolStyle::Unicode;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--ascii") == 0) {
      style = SymbolStyle::Ascii;
    } else {
      fprintf(stderr, "Usage: %s [--ascii]\n", argv[0]);
      return 1;
    }
  }

  try {
    PrintSamples(style);
  } catch (const simple_cas::DomainError& e) {
    fprintf(stderr, "error (%s): %s\n", simple_cas::ErrorCodeName(e.code()),
            e.what());
    return 1;
  }

  return 0;
}
