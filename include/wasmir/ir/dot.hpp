#pragma once

#include <ostream>
#include <string>

#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"

namespace wasmir::ir {

// Short node label used in Graphviz output. Block kinds render as "block",
// "loop", "if_else" or "entry"; operators use their case name.
auto DotName(const Expr& expr) -> std::string;

// Writes a Graphviz digraph of every node reachable from the entry block.
// Nodes are named expr_{index}; operand edges are solid, branch edges to
// their target block are dashed.
void WriteDot(const LocalFunction& func, std::ostream& out);

auto DotToString(const LocalFunction& func) -> std::string;

}  // namespace wasmir::ir
