#include "wasmir/ir/verify.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "wasmir/common/internal_error.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/visitor.hpp"

namespace wasmir::ir {

namespace {

class VerifyVisitor final : public Visitor {
 public:
  VerifyVisitor(const LocalFunction& func, std::string_view label)
      : func_(func), label_(label) {
  }

  void EnterExpr(ExprId id, const Expr& expr) override {
    on_path_.insert(id);
    ForEachChild(expr, [&](ExprId child) {
      if (!func_.exprs.Contains(child)) {
        Fail(std::format(
            "e{} references e{}, which is not in the arena ({} nodes)",
            id.value, child.value, func_.exprs.Size()));
      }
      if (on_path_.contains(child)) {
        Fail(std::format(
            "e{} is its own descendant via e{}", child.value, id.value));
      }
    });
    if (std::holds_alternative<Block>(expr)) {
      open_blocks_.insert(BlockId{id.value});
    }
  }

  void LeaveExpr(ExprId id, const Expr& expr) override {
    if (std::holds_alternative<Block>(expr)) {
      open_blocks_.erase(BlockId{id.value});
    }
    on_path_.erase(id);
  }

  void Visit(ExprId id, const LocalGet& node) override {
    CheckLocal(id, node.local);
  }
  void Visit(ExprId id, const LocalSet& node) override {
    CheckLocal(id, node.local);
  }
  void Visit(ExprId id, const LocalTee& node) override {
    CheckLocal(id, node.local);
  }

  void Visit(ExprId id, const IfElse& node) override {
    CheckArm(id, node.consequent, "consequent");
    CheckArm(id, node.alternative, "alternative");
  }

  void Visit(ExprId id, const Br& node) override {
    CheckBranch(id, node.block, node.args.size());
  }

  void Visit(ExprId id, const BrIf& node) override {
    CheckBranch(id, node.block, node.args.size());
  }

  void Visit(ExprId id, const BrTable& node) override {
    CheckBranch(id, node.default_block, node.args.size());
    for (BlockId target : node.blocks) {
      CheckBranch(id, target, node.args.size());
    }
  }

 private:
  [[noreturn]] void Fail(const std::string& detail) const {
    throw common::InternalError(
        "IR verify", std::format("{}: {}", label_, detail));
  }

  void CheckLocal(ExprId id, LocalId local) const {
    if (!func_.locals.Contains(local)) {
      Fail(std::format(
          "e{} references local {}, but the function has {} locals", id.value,
          local.value, func_.locals.Size()));
    }
  }

  auto ResolveBlock(ExprId id, BlockId target) const -> const Block& {
    if (!func_.exprs.Contains(target.ToExprId())) {
      Fail(std::format(
          "e{} targets e{}, which is not in the arena", id.value,
          target.value));
    }
    const auto* block = std::get_if<Block>(&func_.exprs[target.ToExprId()]);
    if (block == nullptr) {
      Fail(std::format(
          "e{} targets e{}, which is not a block", id.value, target.value));
    }
    return *block;
  }

  void CheckArm(ExprId id, BlockId arm, std::string_view which) const {
    const Block& block = ResolveBlock(id, arm);
    if (block.kind != BlockKind::kIfElse) {
      Fail(std::format(
          "e{} {} arm e{} is not an if/else block", id.value, which,
          arm.value));
    }
  }

  void CheckBranch(ExprId id, BlockId target, size_t arg_count) const {
    const Block& block = ResolveBlock(id, target);
    if (!open_blocks_.contains(target)) {
      Fail(std::format(
          "e{} branches to e{}, which does not enclose it", id.value,
          target.value));
    }
    size_t arity = BranchArity(block).size();
    if (arg_count != arity) {
      Fail(std::format(
          "e{} passes {} args to e{}, which expects {}", id.value, arg_count,
          target.value, arity));
    }
  }

  const LocalFunction& func_;
  std::string_view label_;
  absl::flat_hash_set<ExprId> on_path_;
  absl::flat_hash_set<BlockId> open_blocks_;
};

}  // namespace

void VerifyFunction(const LocalFunction& func, std::string_view label) {
  if (!func.exprs.Contains(func.entry.ToExprId())) {
    throw common::InternalError(
        "IR verify", std::format("{}: entry e{} is not in the arena", label,
                                 func.entry.value));
  }
  const auto* entry = std::get_if<Block>(&func.exprs[func.entry.ToExprId()]);
  if (entry == nullptr || entry->kind != BlockKind::kFunctionEntry) {
    throw common::InternalError(
        "IR verify",
        std::format(
            "{}: entry e{} is not a function entry block", label,
            func.entry.value));
  }
  if (entry->results != func.signature.results) {
    throw common::InternalError(
        "IR verify",
        std::format(
            "{}: entry block results ({}) differ from signature results ({})",
            label, entry->results.size(), func.signature.results.size()));
  }
  if (func.params.size() != func.signature.params.size()) {
    throw common::InternalError(
        "IR verify",
        std::format(
            "{}: {} param locals for {} signature params", label,
            func.params.size(), func.signature.params.size()));
  }
  for (size_t i = 0; i < func.params.size(); ++i) {
    if (!func.locals.Contains(func.params[i]) ||
        func.locals[func.params[i]].Type() != func.signature.params[i]) {
      throw common::InternalError(
          "IR verify",
          std::format("{}: param {} does not match its local", label, i));
    }
  }

  VerifyVisitor visitor(func, label);
  WalkFunction(func, visitor);
}

}  // namespace wasmir::ir
