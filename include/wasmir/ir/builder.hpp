#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "wasmir/common/diagnostic.hpp"
#include "wasmir/decode/instruction.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/module/registry.hpp"
#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

struct BuilderOptions {
  // Run VerifyFunction on the finished graph.
  bool verify = true;
  // Log the textual dump of the finished graph at debug level.
  bool dump = false;
  // Debug name given to the built function.
  std::string name;
};

// Translates one function's instruction stream into an expression graph,
// one instruction at a time.
//
// The operand stack holds ExprIds instead of values. Instructions that
// produce a value push their node; the rest are appended to the current
// block's body. Before anything is appended, values still pending on the
// current frame's stack are moved into fresh temporary locals so they are
// evaluated before the appended node, as they were in the original stream.
//
// Input problems (unknown identifiers, bad branch depths, stack underflow,
// unbalanced else/end) come back as Diagnostics and abandon the build.
class FunctionBuilder {
 public:
  FunctionBuilder(
      const module::Registry* registry, FunctionType signature,
      const std::vector<ValType>& declared_locals, BuilderOptions options = {});

  // Consume the next instruction.
  auto Push(const decode::Instruction& instr) -> Result<void>;

  // Hand over the built function. Requires the final `end` to have been
  // pushed, and succeeds only once.
  auto Finish() -> Result<LocalFunction>;

  [[nodiscard]] auto IsComplete() const -> bool {
    return complete_;
  }

 private:
  struct StackValue {
    ExprId expr;
    ValType type;
  };

  struct ControlFrame {
    BlockKind kind;
    // Block receiving the body; for if frames, the arm being built.
    BlockId block;
    std::vector<ValType> results;
    std::vector<StackValue> stack;
    // Set once an unconditional branch ends the reachable part of the frame.
    bool unreachable = false;
    // Control instructions opened inside the unreachable part.
    uint32_t dead_depth = 0;

    // If frames only.
    ExprId condition = kInvalidExprId;
    BlockId consequent = kInvalidBlockId;
    BlockId alternative = kInvalidBlockId;
    bool in_else = false;
  };

  auto Handle(const decode::Block& instr) -> Result<void>;
  auto Handle(const decode::Loop& instr) -> Result<void>;
  auto Handle(const decode::If& instr) -> Result<void>;
  auto Handle(const decode::Else& instr) -> Result<void>;
  auto Handle(const decode::End& instr) -> Result<void>;
  auto Handle(const decode::Br& instr) -> Result<void>;
  auto Handle(const decode::BrIf& instr) -> Result<void>;
  auto Handle(const decode::BrTable& instr) -> Result<void>;
  auto Handle(const decode::Return& instr) -> Result<void>;
  auto Handle(const decode::Unreachable& instr) -> Result<void>;
  auto Handle(const decode::Call& instr) -> Result<void>;
  auto Handle(const decode::CallIndirect& instr) -> Result<void>;
  auto Handle(const decode::LocalGet& instr) -> Result<void>;
  auto Handle(const decode::LocalSet& instr) -> Result<void>;
  auto Handle(const decode::LocalTee& instr) -> Result<void>;
  auto Handle(const decode::GlobalGet& instr) -> Result<void>;
  auto Handle(const decode::GlobalSet& instr) -> Result<void>;
  auto Handle(const decode::Const& instr) -> Result<void>;
  auto Handle(const decode::Binary& instr) -> Result<void>;
  auto Handle(const decode::Unary& instr) -> Result<void>;
  auto Handle(const decode::Select& instr) -> Result<void>;
  auto Handle(const decode::Drop& instr) -> Result<void>;
  auto Handle(const decode::MemorySize& instr) -> Result<void>;
  auto Handle(const decode::MemoryGrow& instr) -> Result<void>;
  auto Handle(const decode::Load& instr) -> Result<void>;
  auto Handle(const decode::Store& instr) -> Result<void>;

  // Dead code: only tracks nesting until the frame's own else/end.
  auto SkipUnreachable(const decode::Instruction& instr) -> Result<void>;

  [[nodiscard]] auto Error(DiagnosticKind kind, std::string message) const
      -> std::unexpected<Diagnostic>;

  auto Current() -> ControlFrame& {
    return frames_.back();
  }

  auto Pop() -> Result<StackValue>;
  // Pops `count` values and returns them bottom-first.
  auto PopN(size_t count) -> Result<std::vector<ExprId>>;
  void PushValue(ExprId expr, ValType type);

  // Appends a node to the current body, spilling pending values first.
  void EmitStatement(ExprId expr);
  void SpillPending();
  // Pushes `expr` when it yields one value, emits it when it yields none.
  auto Produce(ExprId expr, const std::vector<ValType>& results)
      -> Result<void>;

  auto CheckBlockType(const decode::BlockType& type) const -> Result<void>;
  auto ResolveLocal(uint32_t index) const -> Result<LocalId>;
  // Target block and branch arity of the frame `depth` levels out.
  auto ResolveTarget(uint32_t depth) -> Result<BlockId>;
  [[nodiscard]] auto ArityOf(BlockId block) const -> size_t;

  void OpenFrame(ControlFrame frame);
  // Checks the frame's stack against its results and appends them as the
  // trailing values of the current arm.
  auto SealBody(ControlFrame& frame) -> Result<void>;

  const module::Registry* registry_;
  BuilderOptions options_;
  LocalFunction function_;
  // Params plus declared locals; indices past this are builder temporaries.
  uint32_t declared_local_count_ = 0;
  absl::flat_hash_set<LocalId> temporaries_;
  std::vector<ControlFrame> frames_;
  uint32_t instruction_index_ = 0;
  bool complete_ = false;
  bool finished_ = false;
};

// Builds a whole function body from its instruction stream.
auto BuildFunction(
    const module::Registry& registry, FunctionType signature,
    const std::vector<ValType>& declared_locals,
    std::span<const decode::Instruction> body, BuilderOptions options = {})
    -> Result<LocalFunction>;

}  // namespace wasmir::ir
