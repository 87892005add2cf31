#pragma once

#include <string_view>

#include "wasmir/ir/function.hpp"

namespace wasmir::ir {

// Verify the referential invariants of a function graph. Throws InternalError
// on the first violation. label: name used in error messages.
//
// Invariants checked, over every node reachable from the entry block:
// - The entry is a kFunctionEntry block whose results match the signature
// - Every child id resolves in the function's arena
// - No node is its own lexical descendant
// - IfElse arms are kIfElse blocks
// - Every branch target is a Block enclosing the branch
// - Branch argument count == BranchArity(target).size()
// - All br_table targets agree on arity
// - LocalGet/LocalSet/LocalTee reference locals of this function
void VerifyFunction(
    const LocalFunction& func, std::string_view label = "function");

}  // namespace wasmir::ir
