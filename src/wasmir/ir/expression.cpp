#include "wasmir/ir/expression.hpp"

#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <absl/functional/function_ref.h>

#include "wasmir/common/overloaded.hpp"
#include "wasmir/ir/handle.hpp"

namespace wasmir::ir {

namespace {

template <ExprKind K, typename T>
constexpr bool kKindMatches =
    std::is_same_v<std::variant_alternative_t<static_cast<size_t>(K), Expr>, T>;

static_assert(kKindMatches<ExprKind::kBlock, Block>);
static_assert(kKindMatches<ExprKind::kCall, Call>);
static_assert(kKindMatches<ExprKind::kCallIndirect, CallIndirect>);
static_assert(kKindMatches<ExprKind::kLocalGet, LocalGet>);
static_assert(kKindMatches<ExprKind::kLocalSet, LocalSet>);
static_assert(kKindMatches<ExprKind::kLocalTee, LocalTee>);
static_assert(kKindMatches<ExprKind::kGlobalGet, GlobalGet>);
static_assert(kKindMatches<ExprKind::kGlobalSet, GlobalSet>);
static_assert(kKindMatches<ExprKind::kConst, Const>);
static_assert(kKindMatches<ExprKind::kBinop, Binop>);
static_assert(kKindMatches<ExprKind::kUnop, Unop>);
static_assert(kKindMatches<ExprKind::kSelect, Select>);
static_assert(kKindMatches<ExprKind::kUnreachable, Unreachable>);
static_assert(kKindMatches<ExprKind::kBr, Br>);
static_assert(kKindMatches<ExprKind::kBrIf, BrIf>);
static_assert(kKindMatches<ExprKind::kIfElse, IfElse>);
static_assert(kKindMatches<ExprKind::kBrTable, BrTable>);
static_assert(kKindMatches<ExprKind::kDrop, Drop>);
static_assert(kKindMatches<ExprKind::kReturn, Return>);
static_assert(kKindMatches<ExprKind::kMemorySize, MemorySize>);
static_assert(kKindMatches<ExprKind::kMemoryGrow, MemoryGrow>);
static_assert(kKindMatches<ExprKind::kLoad, Load>);
static_assert(kKindMatches<ExprKind::kStore, Store>);
static_assert(kExprKindCount == static_cast<size_t>(ExprKind::kStore) + 1);

}  // namespace

auto KindOf(const Expr& expr) -> ExprKind {
  return static_cast<ExprKind>(expr.index());
}

auto ToString(ExprKind kind) -> std::string_view {
  switch (kind) {
    case ExprKind::kBlock:
      return "Block";
    case ExprKind::kCall:
      return "Call";
    case ExprKind::kCallIndirect:
      return "CallIndirect";
    case ExprKind::kLocalGet:
      return "LocalGet";
    case ExprKind::kLocalSet:
      return "LocalSet";
    case ExprKind::kLocalTee:
      return "LocalTee";
    case ExprKind::kGlobalGet:
      return "GlobalGet";
    case ExprKind::kGlobalSet:
      return "GlobalSet";
    case ExprKind::kConst:
      return "Const";
    case ExprKind::kBinop:
      return "Binop";
    case ExprKind::kUnop:
      return "Unop";
    case ExprKind::kSelect:
      return "Select";
    case ExprKind::kUnreachable:
      return "Unreachable";
    case ExprKind::kBr:
      return "Br";
    case ExprKind::kBrIf:
      return "BrIf";
    case ExprKind::kIfElse:
      return "IfElse";
    case ExprKind::kBrTable:
      return "BrTable";
    case ExprKind::kDrop:
      return "Drop";
    case ExprKind::kReturn:
      return "Return";
    case ExprKind::kMemorySize:
      return "MemorySize";
    case ExprKind::kMemoryGrow:
      return "MemoryGrow";
    case ExprKind::kLoad:
      return "Load";
    case ExprKind::kStore:
      return "Store";
  }
  return "<?>";
}

auto ToString(BlockKind kind) -> std::string_view {
  switch (kind) {
    case BlockKind::kBlock:
      return "block";
    case BlockKind::kLoop:
      return "loop";
    case BlockKind::kIfElse:
      return "if_else";
    case BlockKind::kFunctionEntry:
      return "entry";
  }
  return "<?>";
}

auto BranchArity(const Block& block) -> const std::vector<ValType>& {
  switch (block.kind) {
    case BlockKind::kLoop:
      return block.params;
    case BlockKind::kBlock:
    case BlockKind::kIfElse:
    case BlockKind::kFunctionEntry:
      return block.results;
  }
  return block.results;
}

auto FollowingInstructionsAreUnreachable(const Expr& expr) -> bool {
  // One overload per node type with no generic fallback, so adding a node
  // kind breaks the build here until it is classified.
  return std::visit(
      Overloaded{
          [](const Unreachable&) { return true; },
          [](const Br&) { return true; },
          [](const BrTable&) { return true; },
          [](const Return&) { return true; },

          [](const Block&) { return false; },
          [](const Call&) { return false; },
          [](const CallIndirect&) { return false; },
          [](const LocalGet&) { return false; },
          [](const LocalSet&) { return false; },
          [](const LocalTee&) { return false; },
          [](const GlobalGet&) { return false; },
          [](const GlobalSet&) { return false; },
          [](const Const&) { return false; },
          [](const Binop&) { return false; },
          [](const Unop&) { return false; },
          [](const Select&) { return false; },
          [](const BrIf&) { return false; },
          [](const IfElse&) { return false; },
          [](const Drop&) { return false; },
          [](const MemorySize&) { return false; },
          [](const MemoryGrow&) { return false; },
          [](const Load&) { return false; },
          [](const Store&) { return false; },
      },
      expr);
}

void ForEachChild(const Expr& expr, absl::FunctionRef<void(ExprId)> fn) {
  auto each = [&fn](const std::vector<ExprId>& ids) {
    for (ExprId id : ids) {
      fn(id);
    }
  };
  std::visit(
      Overloaded{
          [&](const Block& e) { each(e.exprs); },
          [&](const Call& e) { each(e.args); },
          [&](const CallIndirect& e) {
            each(e.args);
            fn(e.func);
          },
          [](const LocalGet&) {},
          [&](const LocalSet& e) { fn(e.value); },
          [&](const LocalTee& e) { fn(e.value); },
          [](const GlobalGet&) {},
          [&](const GlobalSet& e) { fn(e.value); },
          [](const Const&) {},
          [&](const Binop& e) {
            fn(e.lhs);
            fn(e.rhs);
          },
          [&](const Unop& e) { fn(e.expr); },
          [&](const Select& e) {
            fn(e.consequent);
            fn(e.alternative);
            fn(e.condition);
          },
          [](const Unreachable&) {},
          [&](const Br& e) { each(e.args); },
          [&](const BrIf& e) {
            each(e.args);
            fn(e.condition);
          },
          [&](const IfElse& e) {
            fn(e.condition);
            fn(e.consequent.ToExprId());
            fn(e.alternative.ToExprId());
          },
          [&](const BrTable& e) {
            each(e.args);
            fn(e.which);
          },
          [&](const Drop& e) { fn(e.expr); },
          [&](const Return& e) { each(e.values); },
          [](const MemorySize&) {},
          [&](const MemoryGrow& e) { fn(e.pages); },
          [&](const Load& e) { fn(e.address); },
          [&](const Store& e) {
            fn(e.address);
            fn(e.value);
          },
      },
      expr);
}

auto Children(const Expr& expr) -> std::vector<ExprId> {
  std::vector<ExprId> result;
  ForEachChild(expr, [&result](ExprId id) { result.push_back(id); });
  return result;
}

void ForEachOperandMut(Expr& expr, absl::FunctionRef<void(ExprId&)> fn) {
  auto each = [&fn](std::vector<ExprId>& ids) {
    for (ExprId& id : ids) {
      fn(id);
    }
  };
  std::visit(
      Overloaded{
          [&](Block& e) { each(e.exprs); },
          [&](Call& e) { each(e.args); },
          [&](CallIndirect& e) {
            each(e.args);
            fn(e.func);
          },
          [](LocalGet&) {},
          [&](LocalSet& e) { fn(e.value); },
          [&](LocalTee& e) { fn(e.value); },
          [](GlobalGet&) {},
          [&](GlobalSet& e) { fn(e.value); },
          [](Const&) {},
          [&](Binop& e) {
            fn(e.lhs);
            fn(e.rhs);
          },
          [&](Unop& e) { fn(e.expr); },
          [&](Select& e) {
            fn(e.consequent);
            fn(e.alternative);
            fn(e.condition);
          },
          [](Unreachable&) {},
          [&](Br& e) { each(e.args); },
          [&](BrIf& e) {
            each(e.args);
            fn(e.condition);
          },
          [&](IfElse& e) { fn(e.condition); },
          [&](BrTable& e) {
            each(e.args);
            fn(e.which);
          },
          [&](Drop& e) { fn(e.expr); },
          [&](Return& e) { each(e.values); },
          [](MemorySize&) {},
          [&](MemoryGrow& e) { fn(e.pages); },
          [&](Load& e) { fn(e.address); },
          [&](Store& e) {
            fn(e.address);
            fn(e.value);
          },
      },
      expr);
}

void ForEachBranchTarget(
    const Expr& expr, absl::FunctionRef<void(BlockId)> fn) {
  if (const auto* br = std::get_if<Br>(&expr)) {
    fn(br->block);
  } else if (const auto* br_if = std::get_if<BrIf>(&expr)) {
    fn(br_if->block);
  } else if (const auto* br_table = std::get_if<BrTable>(&expr)) {
    for (BlockId target : br_table->blocks) {
      fn(target);
    }
    fn(br_table->default_block);
  }
}

}  // namespace wasmir::ir
