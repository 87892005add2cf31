#include "wasmir/ir/dot.hpp"

#include <format>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>

#include "wasmir/common/overloaded.hpp"
#include "wasmir/ir/dumper.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/operator.hpp"
#include "wasmir/ir/visitor.hpp"

namespace wasmir::ir {

namespace {

auto NodeName(ExprId id) -> std::string {
  return std::format("expr_{}", id.value);
}

class DotVisitor final : public Visitor {
 public:
  explicit DotVisitor(std::ostream& out) : out_(out) {
  }

  void EnterExpr(ExprId id, const Expr& expr) override {
    out_ << std::format("  {} [label=\"{}\"];\n", NodeName(id), DotName(expr));
    ForEachChild(expr, [&](ExprId child) {
      out_ << std::format("  {} -> {};\n", NodeName(id), NodeName(child));
    });
    ForEachBranchTarget(expr, [&](BlockId target) {
      out_ << std::format(
          "  {} -> {} [style=dashed];\n", NodeName(id),
          NodeName(target.ToExprId()));
    });
  }

 private:
  std::ostream& out_;
};

}  // namespace

auto DotName(const Expr& expr) -> std::string {
  return std::visit(
      Overloaded{
          [](const Block& e) -> std::string {
            return std::string(ToString(e.kind));
          },
          [](const Binop& e) -> std::string {
            return std::string(ToString(e.op));
          },
          [](const Unop& e) -> std::string {
            return std::string(ToString(e.op));
          },
          [&expr](const auto&) -> std::string {
            // Everything else reads the same as its textual header, minus
            // the branch annotation.
            std::string header = FormatNodeHeader(expr);
            return header.substr(0, header.find(" (;"));
          },
      },
      expr);
}

void WriteDot(const LocalFunction& func, std::ostream& out) {
  out << "digraph {\n";
  out << "  rankdir=TB;\n";
  DotVisitor visitor(out);
  WalkFunction(func, visitor);
  out << "}\n";
}

auto DotToString(const LocalFunction& func) -> std::string {
  std::ostringstream out;
  WriteDot(func, out);
  return out.str();
}

}  // namespace wasmir::ir
