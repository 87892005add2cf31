#pragma once

#include <string>
#include <vector>

#include "wasmir/ir/arena.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/local.hpp"
#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

// A function body in expression-graph form. Owns its arena and locals
// exclusively; nothing in here refers into another function.
struct LocalFunction {
  FunctionType signature;
  LocalRegistry locals;
  // One local per signature param, in order.
  std::vector<LocalId> params;
  ExprArena exprs;
  // A kFunctionEntry block with the signature's results.
  BlockId entry = kInvalidBlockId;
  // Debug name, may be empty.
  std::string name;

  [[nodiscard]] auto EntryBlock() const -> const Block& {
    return exprs.GetBlock(entry);
  }
};

}  // namespace wasmir::ir
