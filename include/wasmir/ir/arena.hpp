#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <utility>
#include <variant>
#include <vector>

#include "wasmir/common/internal_error.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/handle.hpp"

namespace wasmir::ir {

// Append-only node storage for one function. Nodes are never removed: a node
// nothing refers to any more is simply unreachable from the entry block.
class ExprArena final {
 public:
  ExprArena() = default;
  ~ExprArena() = default;

  ExprArena(const ExprArena&) = delete;
  auto operator=(const ExprArena&) -> ExprArena& = delete;

  ExprArena(ExprArena&&) = default;
  auto operator=(ExprArena&&) -> ExprArena& = default;

  // Branch targets and IfElse arms must already name Block nodes here.
  auto Add(Expr expr) -> ExprId {
    CheckTargets(expr, "ExprArena::Add");
    ExprId id{static_cast<uint32_t>(exprs_.size())};
    exprs_.push_back(std::move(expr));
    return id;
  }

  auto AddBlock(Block block) -> BlockId {
    return BlockId{Add(std::move(block)).value};
  }

  [[nodiscard]] auto Get(ExprId id) const -> const Expr& {
    CheckOwned(id, "ExprArena::Get");
    return exprs_[id.value];
  }

  [[nodiscard]] auto GetMut(ExprId id) -> Expr& {
    CheckOwned(id, "ExprArena::GetMut");
    return exprs_[id.value];
  }

  [[nodiscard]] auto operator[](ExprId id) const -> const Expr& {
    return Get(id);
  }

  // Overwrites the node's payload in place; every reference to `id` now sees
  // the new node. A Block may only be replaced by another Block, since
  // BlockIds pointing at it must keep naming a block.
  void Replace(ExprId id, Expr expr) {
    CheckOwned(id, "ExprArena::Replace");
    Expr& slot = exprs_[id.value];
    if (std::holds_alternative<Block>(slot) &&
        !std::holds_alternative<Block>(expr)) {
      throw common::InternalError(
          "ExprArena::Replace",
          std::format("e{} is a block and must stay one", id.value));
    }
    CheckTargets(expr, "ExprArena::Replace");
    slot = std::move(expr);
  }

  // Checked narrowing of an ExprId that should reference a Block.
  [[nodiscard]] auto AsBlockId(ExprId id) const -> BlockId {
    if (!std::holds_alternative<Block>(Get(id))) {
      throw common::InternalError(
          "ExprArena::AsBlockId",
          std::format("e{} is not a block", id.value));
    }
    return BlockId{id.value};
  }

  [[nodiscard]] auto GetBlock(BlockId id) const -> const Block& {
    const auto* block = std::get_if<Block>(&Get(id.ToExprId()));
    if (block == nullptr) {
      throw common::InternalError(
          "ExprArena::GetBlock",
          std::format("e{} is not a block", id.value));
    }
    return *block;
  }

  [[nodiscard]] auto GetBlockMut(BlockId id) -> Block& {
    auto* block = std::get_if<Block>(&GetMut(id.ToExprId()));
    if (block == nullptr) {
      throw common::InternalError(
          "ExprArena::GetBlockMut",
          std::format("e{} is not a block", id.value));
    }
    return *block;
  }

  [[nodiscard]] auto Contains(ExprId id) const -> bool {
    return id.value < exprs_.size();
  }

  [[nodiscard]] auto Size() const -> size_t {
    return exprs_.size();
  }

 private:
  void CheckOwned(ExprId id, const char* context) const {
    if (!Contains(id)) {
      throw common::InternalError(
          context, std::format(
                       "e{} is foreign to this arena ({} nodes)", id.value,
                       exprs_.size()));
    }
  }

  void CheckTargets(const Expr& expr, const char* context) const {
    auto check = [&](BlockId target) {
      if (!Contains(target.ToExprId())) {
        throw common::InternalError(
            context,
            std::format("target e{} is not in the arena", target.value));
      }
      if (!std::holds_alternative<Block>(exprs_[target.value])) {
        throw common::InternalError(
            context, std::format("target e{} is not a block", target.value));
      }
    };
    ForEachBranchTarget(expr, check);
    if (const auto* if_else = std::get_if<IfElse>(&expr)) {
      check(if_else->consequent);
      check(if_else->alternative);
    }
  }

  std::vector<Expr> exprs_;
};

}  // namespace wasmir::ir
