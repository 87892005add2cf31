#include "wasmir/ir/visitor.hpp"

#include <variant>

#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"

namespace wasmir::ir {

void Walk(const LocalFunction& func, ExprId root, Visitor& visitor) {
  const Expr& expr = func.exprs.Get(root);
  visitor.EnterExpr(root, expr);
  std::visit([&](const auto& node) { visitor.Visit(root, node); }, expr);
  ForEachChild(expr, [&](ExprId child) { Walk(func, child, visitor); });
  visitor.LeaveExpr(root, expr);
}

void WalkFunction(const LocalFunction& func, Visitor& visitor) {
  Walk(func, func.entry.ToExprId(), visitor);
}

}  // namespace wasmir::ir
