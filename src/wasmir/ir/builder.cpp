#include "wasmir/ir/builder.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "wasmir/common/diagnostic.hpp"
#include "wasmir/common/overloaded.hpp"
#include "wasmir/decode/instruction.hpp"
#include "wasmir/ir/dumper.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/memory_op.hpp"
#include "wasmir/ir/operator.hpp"
#include "wasmir/ir/value.hpp"
#include "wasmir/ir/verify.hpp"

namespace wasmir::ir {

FunctionBuilder::FunctionBuilder(
    const module::Registry* registry, FunctionType signature,
    const std::vector<ValType>& declared_locals, BuilderOptions options)
    : registry_(registry), options_(std::move(options)) {
  function_.name = options_.name;
  function_.signature = std::move(signature);
  for (ValType param : function_.signature.params) {
    function_.params.push_back(function_.locals.Create(param));
  }
  for (ValType local : declared_locals) {
    function_.locals.Create(local);
  }
  declared_local_count_ = static_cast<uint32_t>(function_.locals.Size());

  function_.entry = function_.exprs.AddBlock(
      Block::New(
          BlockKind::kFunctionEntry, {}, function_.signature.results));
  frames_.push_back(
      ControlFrame{
          .kind = BlockKind::kFunctionEntry,
          .block = function_.entry,
          .results = function_.signature.results});
}

auto FunctionBuilder::Push(const decode::Instruction& instr) -> Result<void> {
  if (complete_) {
    return Error(
        DiagnosticKind::kUnbalancedControl,
        "instruction after the function's final end");
  }
  Result<void> result =
      Current().unreachable
          ? SkipUnreachable(instr)
          : std::visit(
                [this](const auto& i) { return Handle(i); }, instr);
  ++instruction_index_;
  return result;
}

auto FunctionBuilder::Finish() -> Result<LocalFunction> {
  if (finished_) {
    return Error(
        DiagnosticKind::kUnbalancedControl,
        "function was already handed over by an earlier Finish");
  }
  if (!complete_) {
    return Error(
        DiagnosticKind::kUnbalancedControl,
        std::format(
            "function body ended with {} unclosed frame(s)", frames_.size()));
  }
  if (options_.verify) {
    VerifyFunction(
        function_, function_.name.empty() ? "function" : function_.name);
  }
  spdlog::debug(
      "built function '{}': {} nodes, {} locals ({} temporaries)",
      function_.name, function_.exprs.Size(), function_.locals.Size(),
      temporaries_.size());
  if (options_.dump) {
    spdlog::debug("\n{}", DumpToString(function_));
  }
  finished_ = true;
  return std::move(function_);
}

auto FunctionBuilder::SkipUnreachable(const decode::Instruction& instr)
    -> Result<void> {
  ControlFrame& frame = Current();
  return std::visit(
      Overloaded{
          [&](const decode::Block&) -> Result<void> {
            ++frame.dead_depth;
            return {};
          },
          [&](const decode::Loop&) -> Result<void> {
            ++frame.dead_depth;
            return {};
          },
          [&](const decode::If&) -> Result<void> {
            ++frame.dead_depth;
            return {};
          },
          [&](const decode::Else& i) -> Result<void> {
            if (frame.dead_depth > 0) {
              return {};
            }
            return Handle(i);
          },
          [&](const decode::End& i) -> Result<void> {
            if (frame.dead_depth > 0) {
              --frame.dead_depth;
              return {};
            }
            return Handle(i);
          },
          [](const auto&) -> Result<void> { return {}; },
      },
      instr);
}

auto FunctionBuilder::Error(DiagnosticKind kind, std::string message) const
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::Error(kind, instruction_index_, std::move(message)));
}

auto FunctionBuilder::Pop() -> Result<StackValue> {
  ControlFrame& frame = Current();
  if (frame.stack.empty()) {
    return Error(
        DiagnosticKind::kStackUnderflow, "operand stack of frame is empty");
  }
  StackValue value = frame.stack.back();
  frame.stack.pop_back();
  return value;
}

auto FunctionBuilder::PopN(size_t count) -> Result<std::vector<ExprId>> {
  ControlFrame& frame = Current();
  if (frame.stack.size() < count) {
    return Error(
        DiagnosticKind::kStackUnderflow,
        std::format(
            "need {} operand(s), frame has {}", count, frame.stack.size()));
  }
  std::vector<ExprId> values;
  values.reserve(count);
  for (size_t i = frame.stack.size() - count; i < frame.stack.size(); ++i) {
    values.push_back(frame.stack[i].expr);
  }
  frame.stack.resize(frame.stack.size() - count);
  return values;
}

void FunctionBuilder::PushValue(ExprId expr, ValType type) {
  Current().stack.push_back(StackValue{.expr = expr, .type = type});
}

void FunctionBuilder::SpillPending() {
  ControlFrame& frame = Current();
  for (StackValue& pending : frame.stack) {
    const Expr& node = function_.exprs[pending.expr];
    if (std::holds_alternative<Const>(node)) {
      continue;
    }
    if (const auto* get = std::get_if<LocalGet>(&node);
        get != nullptr && temporaries_.contains(get->local)) {
      continue;
    }
    LocalId temp = function_.locals.Create(pending.type);
    temporaries_.insert(temp);
    ExprId set =
        function_.exprs.Add(LocalSet{.local = temp, .value = pending.expr});
    function_.exprs.GetBlockMut(frame.block).exprs.push_back(set);
    spdlog::trace(
        "spill e{} into temporary l{} before instr {}", pending.expr.value,
        temp.value, instruction_index_);
    pending.expr = function_.exprs.Add(LocalGet{.local = temp});
  }
}

void FunctionBuilder::EmitStatement(ExprId expr) {
  SpillPending();
  ControlFrame& frame = Current();
  function_.exprs.GetBlockMut(frame.block).exprs.push_back(expr);
  if (FollowingInstructionsAreUnreachable(function_.exprs[expr])) {
    frame.unreachable = true;
    frame.stack.clear();
  }
}

auto FunctionBuilder::Produce(ExprId expr, const std::vector<ValType>& results)
    -> Result<void> {
  if (results.empty()) {
    EmitStatement(expr);
    return {};
  }
  if (results.size() > 1) {
    return Error(
        DiagnosticKind::kUnsupported,
        std::format(
            "a single node cannot yield {} values", results.size()));
  }
  PushValue(expr, results.front());
  return {};
}

auto FunctionBuilder::CheckBlockType(const decode::BlockType& type) const
    -> Result<void> {
  if (!type.params.empty()) {
    return Error(
        DiagnosticKind::kUnsupported, "block parameters are not supported");
  }
  if (type.results.size() > 1) {
    return Error(
        DiagnosticKind::kUnsupported,
        std::format(
            "blocks with {} results are not supported", type.results.size()));
  }
  return {};
}

auto FunctionBuilder::ResolveLocal(uint32_t index) const -> Result<LocalId> {
  if (index >= declared_local_count_) {
    return Error(
        DiagnosticKind::kUnknownLocal,
        std::format(
            "local {} out of range ({} locals)", index,
            declared_local_count_));
  }
  return LocalId{index};
}

auto FunctionBuilder::ResolveTarget(uint32_t depth) -> Result<BlockId> {
  if (depth >= frames_.size()) {
    return Error(
        DiagnosticKind::kUnknownBranchDepth,
        std::format(
            "branch depth {} exceeds {} enclosing frame(s)", depth,
            frames_.size()));
  }
  return frames_[frames_.size() - 1 - depth].block;
}

auto FunctionBuilder::ArityOf(BlockId block) const -> size_t {
  return BranchArity(function_.exprs.GetBlock(block)).size();
}

void FunctionBuilder::OpenFrame(ControlFrame frame) {
  spdlog::trace(
      "open {} frame e{} at depth {}", ToString(frame.kind), frame.block.value,
      frames_.size());
  frames_.push_back(std::move(frame));
}

auto FunctionBuilder::SealBody(ControlFrame& frame) -> Result<void> {
  if (frame.unreachable) {
    return {};
  }
  auto values = PopN(frame.results.size());
  if (!values) {
    return std::unexpected(std::move(values.error()));
  }
  if (!frame.stack.empty()) {
    return Error(
        DiagnosticKind::kUnbalancedControl,
        std::format(
            "{} value(s) left on the stack at the end of e{}",
            frame.stack.size(), frame.block.value));
  }
  auto& body = function_.exprs.GetBlockMut(frame.block).exprs;
  body.insert(body.end(), values->begin(), values->end());
  return {};
}

auto FunctionBuilder::Handle(const decode::Block& instr) -> Result<void> {
  if (auto ok = CheckBlockType(instr.type); !ok) {
    return ok;
  }
  BlockId block = function_.exprs.AddBlock(
      Block::New(BlockKind::kBlock, {}, instr.type.results));
  OpenFrame(
      ControlFrame{
          .kind = BlockKind::kBlock,
          .block = block,
          .results = instr.type.results});
  return {};
}

auto FunctionBuilder::Handle(const decode::Loop& instr) -> Result<void> {
  if (auto ok = CheckBlockType(instr.type); !ok) {
    return ok;
  }
  BlockId block = function_.exprs.AddBlock(
      Block::New(BlockKind::kLoop, {}, instr.type.results));
  OpenFrame(
      ControlFrame{
          .kind = BlockKind::kLoop,
          .block = block,
          .results = instr.type.results});
  return {};
}

auto FunctionBuilder::Handle(const decode::If& instr) -> Result<void> {
  if (auto ok = CheckBlockType(instr.type); !ok) {
    return ok;
  }
  auto condition = Pop();
  if (!condition) {
    return std::unexpected(std::move(condition.error()));
  }
  BlockId consequent = function_.exprs.AddBlock(
      Block::New(BlockKind::kIfElse, {}, instr.type.results));
  BlockId alternative = function_.exprs.AddBlock(
      Block::New(BlockKind::kIfElse, {}, instr.type.results));
  OpenFrame(
      ControlFrame{
          .kind = BlockKind::kIfElse,
          .block = consequent,
          .results = instr.type.results,
          .condition = condition->expr,
          .consequent = consequent,
          .alternative = alternative});
  return {};
}

auto FunctionBuilder::Handle(const decode::Else& /*instr*/) -> Result<void> {
  ControlFrame& frame = Current();
  if (frame.kind != BlockKind::kIfElse || frame.in_else) {
    return Error(
        DiagnosticKind::kUnbalancedControl, "else without a matching if");
  }
  if (auto ok = SealBody(frame); !ok) {
    return ok;
  }
  frame.block = frame.alternative;
  frame.in_else = true;
  frame.unreachable = false;
  frame.dead_depth = 0;
  frame.stack.clear();
  return {};
}

auto FunctionBuilder::Handle(const decode::End& /*instr*/) -> Result<void> {
  if (auto ok = SealBody(Current()); !ok) {
    return ok;
  }
  ControlFrame closed = std::move(frames_.back());
  frames_.pop_back();
  spdlog::trace(
      "close {} frame e{}", ToString(closed.kind), closed.block.value);

  switch (closed.kind) {
    case BlockKind::kFunctionEntry:
      complete_ = true;
      return {};
    case BlockKind::kBlock:
    case BlockKind::kLoop:
      return Produce(closed.block.ToExprId(), closed.results);
    case BlockKind::kIfElse: {
      ExprId node = function_.exprs.Add(
          IfElse{
              .condition = closed.condition,
              .consequent = closed.consequent,
              .alternative = closed.alternative});
      return Produce(node, closed.results);
    }
  }
  return {};
}

auto FunctionBuilder::Handle(const decode::Br& instr) -> Result<void> {
  auto target = ResolveTarget(instr.depth);
  if (!target) {
    return std::unexpected(std::move(target.error()));
  }
  auto args = PopN(ArityOf(*target));
  if (!args) {
    return std::unexpected(std::move(args.error()));
  }
  EmitStatement(
      function_.exprs.Add(Br{.block = *target, .args = std::move(*args)}));
  return {};
}

auto FunctionBuilder::Handle(const decode::BrIf& instr) -> Result<void> {
  auto target = ResolveTarget(instr.depth);
  if (!target) {
    return std::unexpected(std::move(target.error()));
  }
  auto condition = Pop();
  if (!condition) {
    return std::unexpected(std::move(condition.error()));
  }
  const std::vector<ValType> arity =
      BranchArity(function_.exprs.GetBlock(*target));
  auto args = PopN(arity.size());
  if (!args) {
    return std::unexpected(std::move(args.error()));
  }
  ExprId node = function_.exprs.Add(
      BrIf{
          .args = std::move(*args),
          .condition = condition->expr,
          .block = *target});
  // When not taken, br_if leaves its arguments on the stack.
  return Produce(node, arity);
}

auto FunctionBuilder::Handle(const decode::BrTable& instr) -> Result<void> {
  auto default_block = ResolveTarget(instr.default_depth);
  if (!default_block) {
    return std::unexpected(std::move(default_block.error()));
  }
  size_t arity = ArityOf(*default_block);
  std::vector<BlockId> blocks;
  blocks.reserve(instr.depths.size());
  for (uint32_t depth : instr.depths) {
    auto target = ResolveTarget(depth);
    if (!target) {
      return std::unexpected(std::move(target.error()));
    }
    if (ArityOf(*target) != arity) {
      return Error(
          DiagnosticKind::kUnbalancedControl,
          std::format(
              "br_table target e{} expects {} value(s), default expects {}",
              target->value, ArityOf(*target), arity));
    }
    blocks.push_back(*target);
  }
  auto which = Pop();
  if (!which) {
    return std::unexpected(std::move(which.error()));
  }
  auto args = PopN(arity);
  if (!args) {
    return std::unexpected(std::move(args.error()));
  }
  EmitStatement(
      function_.exprs.Add(
          BrTable{
              .args = std::move(*args),
              .which = which->expr,
              .blocks = std::move(blocks),
              .default_block = *default_block}));
  return {};
}

auto FunctionBuilder::Handle(const decode::Return& /*instr*/) -> Result<void> {
  auto values = PopN(function_.signature.results.size());
  if (!values) {
    return std::unexpected(std::move(values.error()));
  }
  EmitStatement(function_.exprs.Add(Return{.values = std::move(*values)}));
  return {};
}

auto FunctionBuilder::Handle(const decode::Unreachable& /*instr*/)
    -> Result<void> {
  EmitStatement(function_.exprs.Add(Unreachable{}));
  return {};
}

auto FunctionBuilder::Handle(const decode::Call& instr) -> Result<void> {
  if (!registry_->Contains(instr.func)) {
    return Error(
        DiagnosticKind::kUnknownFunction,
        std::format("function {} is not registered", instr.func.value));
  }
  const FunctionType& type = registry_->TypeOf(instr.func);
  auto args = PopN(type.params.size());
  if (!args) {
    return std::unexpected(std::move(args.error()));
  }
  ExprId node =
      function_.exprs.Add(Call{.func = instr.func, .args = std::move(*args)});
  return Produce(node, type.results);
}

auto FunctionBuilder::Handle(const decode::CallIndirect& instr)
    -> Result<void> {
  if (!registry_->Contains(instr.type)) {
    return Error(
        DiagnosticKind::kUnknownType,
        std::format("type {} is not registered", instr.type.value));
  }
  if (!registry_->Contains(instr.table)) {
    return Error(
        DiagnosticKind::kUnknownTable,
        std::format("table {} is not registered", instr.table.value));
  }
  const FunctionType& type = registry_->Type(instr.type);
  auto func = Pop();
  if (!func) {
    return std::unexpected(std::move(func.error()));
  }
  auto args = PopN(type.params.size());
  if (!args) {
    return std::unexpected(std::move(args.error()));
  }
  ExprId node = function_.exprs.Add(
      CallIndirect{
          .type = instr.type,
          .table = instr.table,
          .args = std::move(*args),
          .func = func->expr});
  return Produce(node, type.results);
}

auto FunctionBuilder::Handle(const decode::LocalGet& instr) -> Result<void> {
  auto local = ResolveLocal(instr.index);
  if (!local) {
    return std::unexpected(std::move(local.error()));
  }
  PushValue(
      function_.exprs.Add(LocalGet{.local = *local}),
      function_.locals[*local].Type());
  return {};
}

auto FunctionBuilder::Handle(const decode::LocalSet& instr) -> Result<void> {
  auto local = ResolveLocal(instr.index);
  if (!local) {
    return std::unexpected(std::move(local.error()));
  }
  auto value = Pop();
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  EmitStatement(
      function_.exprs.Add(LocalSet{.local = *local, .value = value->expr}));
  return {};
}

auto FunctionBuilder::Handle(const decode::LocalTee& instr) -> Result<void> {
  auto local = ResolveLocal(instr.index);
  if (!local) {
    return std::unexpected(std::move(local.error()));
  }
  auto value = Pop();
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  PushValue(
      function_.exprs.Add(LocalTee{.local = *local, .value = value->expr}),
      function_.locals[*local].Type());
  return {};
}

auto FunctionBuilder::Handle(const decode::GlobalGet& instr) -> Result<void> {
  if (!registry_->Contains(instr.global)) {
    return Error(
        DiagnosticKind::kUnknownGlobal,
        std::format("global {} is not registered", instr.global.value));
  }
  PushValue(
      function_.exprs.Add(GlobalGet{.global = instr.global}),
      registry_->Global(instr.global).type);
  return {};
}

auto FunctionBuilder::Handle(const decode::GlobalSet& instr) -> Result<void> {
  if (!registry_->Contains(instr.global)) {
    return Error(
        DiagnosticKind::kUnknownGlobal,
        std::format("global {} is not registered", instr.global.value));
  }
  if (!registry_->Global(instr.global).is_mutable) {
    return Error(
        DiagnosticKind::kImmutableGlobal,
        std::format("global {} is immutable", instr.global.value));
  }
  auto value = Pop();
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  EmitStatement(
      function_.exprs.Add(
          GlobalSet{.global = instr.global, .value = value->expr}));
  return {};
}

auto FunctionBuilder::Handle(const decode::Const& instr) -> Result<void> {
  PushValue(
      function_.exprs.Add(Const{.value = instr.value}), TypeOf(instr.value));
  return {};
}

auto FunctionBuilder::Handle(const decode::Binary& instr) -> Result<void> {
  auto operands = PopN(2);
  if (!operands) {
    return std::unexpected(std::move(operands.error()));
  }
  PushValue(
      function_.exprs.Add(
          Binop{
              .op = instr.op,
              .lhs = (*operands)[0],
              .rhs = (*operands)[1]}),
      ResultType(instr.op));
  return {};
}

auto FunctionBuilder::Handle(const decode::Unary& instr) -> Result<void> {
  auto operand = Pop();
  if (!operand) {
    return std::unexpected(std::move(operand.error()));
  }
  PushValue(
      function_.exprs.Add(Unop{.op = instr.op, .expr = operand->expr}),
      ResultType(instr.op));
  return {};
}

auto FunctionBuilder::Handle(const decode::Select& /*instr*/) -> Result<void> {
  if (Current().stack.size() < 3) {
    return Error(
        DiagnosticKind::kStackUnderflow,
        std::format(
            "select needs 3 operands, frame has {}", Current().stack.size()));
  }
  ValType type = Current().stack[Current().stack.size() - 3].type;
  auto operands = PopN(3);
  if (!operands) {
    return std::unexpected(std::move(operands.error()));
  }
  PushValue(
      function_.exprs.Add(
          Select{
              .consequent = (*operands)[0],
              .alternative = (*operands)[1],
              .condition = (*operands)[2]}),
      type);
  return {};
}

auto FunctionBuilder::Handle(const decode::Drop& /*instr*/) -> Result<void> {
  auto value = Pop();
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  EmitStatement(function_.exprs.Add(Drop{.expr = value->expr}));
  return {};
}

auto FunctionBuilder::Handle(const decode::MemorySize& instr) -> Result<void> {
  if (!registry_->Contains(instr.memory)) {
    return Error(
        DiagnosticKind::kUnknownMemory,
        std::format("memory {} is not registered", instr.memory.value));
  }
  PushValue(
      function_.exprs.Add(MemorySize{.memory = instr.memory}), ValType::kI32);
  return {};
}

auto FunctionBuilder::Handle(const decode::MemoryGrow& instr) -> Result<void> {
  if (!registry_->Contains(instr.memory)) {
    return Error(
        DiagnosticKind::kUnknownMemory,
        std::format("memory {} is not registered", instr.memory.value));
  }
  auto pages = Pop();
  if (!pages) {
    return std::unexpected(std::move(pages.error()));
  }
  PushValue(
      function_.exprs.Add(
          MemoryGrow{.memory = instr.memory, .pages = pages->expr}),
      ValType::kI32);
  return {};
}

auto FunctionBuilder::Handle(const decode::Load& instr) -> Result<void> {
  if (!registry_->Contains(instr.memory)) {
    return Error(
        DiagnosticKind::kUnknownMemory,
        std::format("memory {} is not registered", instr.memory.value));
  }
  auto address = Pop();
  if (!address) {
    return std::unexpected(std::move(address.error()));
  }
  PushValue(
      function_.exprs.Add(
          Load{
              .memory = instr.memory,
              .kind = instr.kind,
              .arg = instr.arg,
              .address = address->expr}),
      ResultType(instr.kind));
  return {};
}

auto FunctionBuilder::Handle(const decode::Store& instr) -> Result<void> {
  if (!registry_->Contains(instr.memory)) {
    return Error(
        DiagnosticKind::kUnknownMemory,
        std::format("memory {} is not registered", instr.memory.value));
  }
  auto operands = PopN(2);
  if (!operands) {
    return std::unexpected(std::move(operands.error()));
  }
  EmitStatement(
      function_.exprs.Add(
          Store{
              .memory = instr.memory,
              .kind = instr.kind,
              .arg = instr.arg,
              .address = (*operands)[0],
              .value = (*operands)[1]}));
  return {};
}

auto BuildFunction(
    const module::Registry& registry, FunctionType signature,
    const std::vector<ValType>& declared_locals,
    std::span<const decode::Instruction> body, BuilderOptions options)
    -> Result<LocalFunction> {
  FunctionBuilder builder(
      &registry, std::move(signature), declared_locals, std::move(options));
  for (const decode::Instruction& instr : body) {
    if (auto ok = builder.Push(instr); !ok) {
      spdlog::debug("function build failed: {}", FormatDiagnostic(ok.error()));
      return std::unexpected(std::move(ok.error()));
    }
  }
  return builder.Finish();
}

}  // namespace wasmir::ir
