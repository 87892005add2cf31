#pragma once

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/functional/function_ref.h>

#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/memory_op.hpp"
#include "wasmir/ir/operator.hpp"
#include "wasmir/ir/value.hpp"
#include "wasmir/module/ids.hpp"
#include "wasmir/module/val_type.hpp"

// Expression graph nodes. Each stack-machine instruction family maps to one
// node type; operands are ExprIds into the owning function's arena, listed in
// the order the original instruction stream evaluated them. That field order
// is the evaluation order and every rewrite must keep it.

namespace wasmir::ir {

enum class BlockKind : uint8_t {
  kBlock,          // `block`: a branch exits it
  kLoop,           // `loop`: a branch re-enters it at the top
  kIfElse,         // one arm of an `if`; exits like kBlock
  kFunctionEntry,  // the outermost frame of a function body
};

auto ToString(BlockKind kind) -> std::string_view;

// A control frame and the ordered sequence of nodes it evaluates.
struct Block {
  BlockKind kind = BlockKind::kBlock;
  // Types expected on the stack on entry.
  std::vector<ValType> params;
  // Types left on the stack on exit.
  std::vector<ValType> results;
  std::vector<ExprId> exprs;

  static auto New(
      BlockKind kind, std::vector<ValType> params, std::vector<ValType> results)
      -> Block {
    return Block{
        .kind = kind,
        .params = std::move(params),
        .results = std::move(results),
        .exprs = {}};
  }

  auto operator==(const Block&) const -> bool = default;
};

struct Call {
  FunctionId func;
  std::vector<ExprId> args;

  auto operator==(const Call&) const -> bool = default;
};

struct CallIndirect {
  TypeId type;
  TableId table;
  // Index into `table` of the callee; evaluated after the arguments, as on
  // the operand stack.
  std::vector<ExprId> args;
  ExprId func;

  auto operator==(const CallIndirect&) const -> bool = default;
};

struct LocalGet {
  LocalId local;

  auto operator==(const LocalGet&) const -> bool = default;
};

struct LocalSet {
  LocalId local;
  ExprId value;

  auto operator==(const LocalSet&) const -> bool = default;
};

// Stores `value` into `local` and also yields it. One node, not a set
// followed by a get.
struct LocalTee {
  LocalId local;
  ExprId value;

  auto operator==(const LocalTee&) const -> bool = default;
};

struct GlobalGet {
  GlobalId global;

  auto operator==(const GlobalGet&) const -> bool = default;
};

struct GlobalSet {
  GlobalId global;
  ExprId value;

  auto operator==(const GlobalSet&) const -> bool = default;
};

struct Const {
  Value value;

  auto operator==(const Const&) const -> bool = default;
};

struct Binop {
  BinaryOp op;
  ExprId lhs;
  ExprId rhs;

  auto operator==(const Binop&) const -> bool = default;
};

struct Unop {
  UnaryOp op;
  ExprId expr;

  auto operator==(const Unop&) const -> bool = default;
};

// Both values are evaluated whatever the condition; `condition` is evaluated
// last.
struct Select {
  ExprId consequent;
  ExprId alternative;
  ExprId condition;

  auto operator==(const Select&) const -> bool = default;
};

struct Unreachable {
  auto operator==(const Unreachable&) const -> bool = default;
};

struct Br {
  BlockId block;
  std::vector<ExprId> args;

  auto operator==(const Br&) const -> bool = default;
};

struct BrIf {
  std::vector<ExprId> args;
  ExprId condition;
  BlockId block;

  auto operator==(const BrIf&) const -> bool = default;
};

// Both arms always exist, even when the source `if` had no `else`.
struct IfElse {
  ExprId condition;
  BlockId consequent;
  BlockId alternative;

  auto operator==(const IfElse&) const -> bool = default;
};

struct BrTable {
  std::vector<ExprId> args;
  ExprId which;
  std::vector<BlockId> blocks;
  // Taken when `which` is out of range for `blocks`.
  BlockId default_block;

  auto operator==(const BrTable&) const -> bool = default;
};

struct Drop {
  ExprId expr;

  auto operator==(const Drop&) const -> bool = default;
};

struct Return {
  std::vector<ExprId> values;

  auto operator==(const Return&) const -> bool = default;
};

struct MemorySize {
  MemoryId memory;

  auto operator==(const MemorySize&) const -> bool = default;
};

struct MemoryGrow {
  MemoryId memory;
  ExprId pages;

  auto operator==(const MemoryGrow&) const -> bool = default;
};

struct Load {
  MemoryId memory;
  LoadKind kind;
  MemArg arg;
  ExprId address;

  auto operator==(const Load&) const -> bool = default;
};

struct Store {
  MemoryId memory;
  StoreKind kind;
  MemArg arg;
  ExprId address;
  ExprId value;

  auto operator==(const Store&) const -> bool = default;
};

using Expr = std::variant<
    Block, Call, CallIndirect, LocalGet, LocalSet, LocalTee, GlobalGet,
    GlobalSet, Const, Binop, Unop, Select, Unreachable, Br, BrIf, IfElse,
    BrTable, Drop, Return, MemorySize, MemoryGrow, Load, Store>;

// Tag for each Expr alternative, in the same order.
enum class ExprKind : uint8_t {
  kBlock,
  kCall,
  kCallIndirect,
  kLocalGet,
  kLocalSet,
  kLocalTee,
  kGlobalGet,
  kGlobalSet,
  kConst,
  kBinop,
  kUnop,
  kSelect,
  kUnreachable,
  kBr,
  kBrIf,
  kIfElse,
  kBrTable,
  kDrop,
  kReturn,
  kMemorySize,
  kMemoryGrow,
  kLoad,
  kStore,
};

inline constexpr size_t kExprKindCount = std::variant_size_v<Expr>;

auto KindOf(const Expr& expr) -> ExprKind;
auto ToString(ExprKind kind) -> std::string_view;

// Arity a branch to this block carries: `params` for loops (the branch
// re-enters at the top), `results` for every other kind.
auto BranchArity(const Block& block) -> const std::vector<ValType>&;

// Are the instructions that follow this one in the same block unreachable?
// True only for nodes that unconditionally divert control: `unreachable`,
// `br`, `br_table` and `return`.
auto FollowingInstructionsAreUnreachable(const Expr& expr) -> bool;

// Every ExprId the generic walk descends into, in evaluation order: value
// operands, block bodies, and the two arms of an IfElse. Branch targets are
// not children.
void ForEachChild(const Expr& expr, absl::FunctionRef<void(ExprId)> fn);
auto Children(const Expr& expr) -> std::vector<ExprId>;

// Mutable access to every ExprId-typed field (operands and block bodies), for
// passes that redirect operands. BlockId fields are not included.
void ForEachOperandMut(Expr& expr, absl::FunctionRef<void(ExprId&)> fn);

// Control destinations of a branch node. Empty for non-branches.
void ForEachBranchTarget(const Expr& expr, absl::FunctionRef<void(BlockId)> fn);

}  // namespace wasmir::ir
