#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "wasmir/ir/memory_op.hpp"
#include "wasmir/ir/operator.hpp"
#include "wasmir/ir/value.hpp"
#include "wasmir/module/ids.hpp"
#include "wasmir/module/val_type.hpp"

// Typed instruction stream handed to the IR builder by the binary decoder.
// Identifiers are raw module indices; the builder checks them against the
// module registry. Branch targets are relative label depths (0 = innermost
// enclosing frame).

namespace wasmir::decode {

struct BlockType {
  std::vector<ValType> params;
  std::vector<ValType> results;

  auto operator==(const BlockType&) const -> bool = default;
};

struct Block {
  BlockType type;
};
struct Loop {
  BlockType type;
};
struct If {
  BlockType type;
};
struct Else {};
struct End {};

struct Br {
  uint32_t depth = 0;
};
struct BrIf {
  uint32_t depth = 0;
};
struct BrTable {
  std::vector<uint32_t> depths;
  uint32_t default_depth = 0;
};
struct Return {};
struct Unreachable {};

struct Call {
  FunctionId func;
};
struct CallIndirect {
  TypeId type;
  TableId table;
};

// Local index: parameters first, then declared locals.
struct LocalGet {
  uint32_t index = 0;
};
struct LocalSet {
  uint32_t index = 0;
};
struct LocalTee {
  uint32_t index = 0;
};
struct GlobalGet {
  GlobalId global;
};
struct GlobalSet {
  GlobalId global;
};

struct Const {
  ir::Value value;
};
struct Binary {
  ir::BinaryOp op;
};
struct Unary {
  ir::UnaryOp op;
};
struct Select {};
struct Drop {};

struct MemorySize {
  MemoryId memory;
};
struct MemoryGrow {
  MemoryId memory;
};
struct Load {
  MemoryId memory;
  ir::LoadKind kind;
  ir::MemArg arg;
};
struct Store {
  MemoryId memory;
  ir::StoreKind kind;
  ir::MemArg arg;
};

using Instruction = std::variant<
    Block, Loop, If, Else, End, Br, BrIf, BrTable, Return, Unreachable, Call,
    CallIndirect, LocalGet, LocalSet, LocalTee, GlobalGet, GlobalSet, Const,
    Binary, Unary, Select, Drop, MemorySize, MemoryGrow, Load, Store>;

}  // namespace wasmir::decode
