#include <gtest/gtest.h>

#include <format>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "wasmir/common/internal_error.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/operator.hpp"
#include "wasmir/ir/value.hpp"
#include "wasmir/ir/visitor.hpp"
#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {
namespace {

// Records every hook in call order.
class RecordingVisitor : public Visitor {
 public:
  void EnterExpr(ExprId id, const Expr& /*expr*/) override {
    ++enter_counts[id];
    events.push_back(std::format("enter e{}", id.value));
  }
  void LeaveExpr(ExprId id, const Expr& /*expr*/) override {
    events.push_back(std::format("leave e{}", id.value));
  }
  void Visit(ExprId id, const LocalTee& node) override {
    events.push_back(std::format("tee e{} l{}", id.value, node.local.value));
  }
  void Visit(ExprId id, const Br& /*node*/) override {
    events.push_back(std::format("br e{}", id.value));
  }

  std::vector<std::string> events;
  absl::flat_hash_map<ExprId, int> enter_counts;
};

class VisitorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    func_.signature = FunctionType{.params = {}, .results = {}};
    func_.entry = func_.exprs.AddBlock(
        Block::New(BlockKind::kFunctionEntry, {}, {}));
    local_ = func_.locals.Create(ValType::kI32);
  }

  void Append(BlockId block, ExprId expr) {
    func_.exprs.GetBlockMut(block).exprs.push_back(expr);
  }

  LocalFunction func_;
  LocalId local_;
};

TEST_F(VisitorTest, EnterTypedVisitChildrenLeave) {
  // (drop (local.tee l0 (const i32 1)))
  ExprId one = func_.exprs.Add(Const{.value = Value::I32(1)});
  ExprId tee = func_.exprs.Add(LocalTee{.local = local_, .value = one});
  ExprId drop = func_.exprs.Add(Drop{.expr = tee});
  Append(func_.entry, drop);

  RecordingVisitor visitor;
  WalkFunction(func_, visitor);

  EXPECT_EQ(
      visitor.events,
      (std::vector<std::string>{
          "enter e0", "enter e3", "enter e2", "tee e2 l0", "enter e1",
          "leave e1", "leave e2", "leave e3", "leave e0"}));
}

TEST_F(VisitorTest, BranchTargetIsVisitedOnce) {
  // A block holding two branches back to itself.
  BlockId block = func_.exprs.AddBlock(Block::New(BlockKind::kBlock, {}, {}));
  ExprId cond = func_.exprs.Add(LocalGet{.local = local_});
  ExprId br_if =
      func_.exprs.Add(BrIf{.args = {}, .condition = cond, .block = block});
  ExprId br = func_.exprs.Add(Br{.block = block, .args = {}});
  Append(block, br_if);
  Append(block, br);
  Append(func_.entry, block.ToExprId());

  RecordingVisitor visitor;
  WalkFunction(func_, visitor);

  EXPECT_EQ(visitor.enter_counts[block.ToExprId()], 1);
  for (const auto& [id, count] : visitor.enter_counts) {
    EXPECT_EQ(count, 1) << "e" << id.value;
  }
  EXPECT_EQ(visitor.enter_counts.size(), 5U);
}

TEST_F(VisitorTest, OperandsAreWalkedInEvaluationOrder) {
  // (I32Sub (const 5) (const 3)): lhs before rhs.
  ExprId five = func_.exprs.Add(Const{.value = Value::I32(5)});
  ExprId three = func_.exprs.Add(Const{.value = Value::I32(3)});
  ExprId sub = func_.exprs.Add(
      Binop{.op = BinaryOp::kI32Sub, .lhs = five, .rhs = three});
  Append(func_.entry, func_.exprs.Add(Drop{.expr = sub}));

  std::vector<ExprId> order;
  class ConstOrder : public Visitor {
   public:
    explicit ConstOrder(std::vector<ExprId>* out) : out_(out) {
    }
    void Visit(ExprId id, const Const& /*node*/) override {
      out_->push_back(id);
    }

   private:
    std::vector<ExprId>* out_;
  };
  ConstOrder visitor(&order);
  WalkFunction(func_, visitor);

  EXPECT_EQ(order, (std::vector<ExprId>{five, three}));
}

TEST_F(VisitorTest, WalkFromInnerRoot) {
  ExprId one = func_.exprs.Add(Const{.value = Value::I32(1)});
  ExprId drop = func_.exprs.Add(Drop{.expr = one});
  Append(func_.entry, drop);

  RecordingVisitor visitor;
  Walk(func_, drop, visitor);
  EXPECT_EQ(
      visitor.events,
      (std::vector<std::string>{
          "enter e2", "enter e1", "leave e1", "leave e2"}));
}

TEST_F(VisitorTest, ForeignRootThrows) {
  RecordingVisitor visitor;
  EXPECT_THROW(Walk(func_, ExprId{99}, visitor), common::InternalError);
}

}  // namespace
}  // namespace wasmir::ir
