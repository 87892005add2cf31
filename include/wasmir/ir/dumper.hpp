#pragma once

#include <ostream>
#include <string>

#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"

namespace wasmir::ir {

// Single-line description of a node without its children: the mnemonic,
// plain fields, and for branches the target annotation, e.g.
//   "I32Add", "loop", "br (;e2;)", "br_table (;default:e4  [e2 e3];)".
auto FormatNodeHeader(const Expr& expr) -> std::string;

// Textual S-expression rendering of a function graph. One node per line,
// children indented by two spaces under their parent.
class Dumper {
 public:
  Dumper(const LocalFunction* func, std::ostream* out);

  void Dump();
  void Dump(ExprId id);

 private:
  void DumpSignature();

  const LocalFunction* func_;
  std::ostream* out_;
};

// Convenience wrapper returning the Dump() output.
auto DumpToString(const LocalFunction& func) -> std::string;

}  // namespace wasmir::ir
