#pragma once

#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"

namespace wasmir::ir {

// Hooks invoked by Walk. Every hook defaults to doing nothing, so a visitor
// only overrides the node types it cares about.
//
// Per node, Walk calls EnterExpr, then the typed Visit overload, then walks
// the node's children (see ForEachChild), then LeaveExpr.
class Visitor {
 public:
  Visitor() = default;
  Visitor(const Visitor&) = default;
  Visitor(Visitor&&) = delete;
  auto operator=(const Visitor&) -> Visitor& = default;
  auto operator=(Visitor&&) -> Visitor& = delete;
  virtual ~Visitor() = default;

  virtual void EnterExpr(ExprId /*id*/, const Expr& /*expr*/) {
  }
  virtual void LeaveExpr(ExprId /*id*/, const Expr& /*expr*/) {
  }

  virtual void Visit(ExprId /*id*/, const Block& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Call& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const CallIndirect& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const LocalGet& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const LocalSet& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const LocalTee& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const GlobalGet& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const GlobalSet& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Const& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Binop& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Unop& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Select& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Unreachable& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Br& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const BrIf& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const IfElse& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const BrTable& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Drop& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Return& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const MemorySize& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const MemoryGrow& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Load& /*node*/) {
  }
  virtual void Visit(ExprId /*id*/, const Store& /*node*/) {
  }
};

// Walks the subtree rooted at `root` in evaluation order. Branch targets are
// never descended into: a block is visited once, at its position in its
// parent's body, however many branches name it. Throws InternalError on an
// id foreign to `func`.
void Walk(const LocalFunction& func, ExprId root, Visitor& visitor);

// Walk starting at the function's entry block.
void WalkFunction(const LocalFunction& func, Visitor& visitor);

}  // namespace wasmir::ir
