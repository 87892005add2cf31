#include "wasmir/ir/dumper.hpp"

#include <format>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>

#include "wasmir/common/overloaded.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/memory_op.hpp"
#include "wasmir/ir/operator.hpp"
#include "wasmir/ir/value.hpp"
#include "wasmir/ir/visitor.hpp"

namespace wasmir::ir {

namespace {

auto BlockName(const Block& block) -> std::string {
  switch (block.kind) {
    case BlockKind::kLoop:
      return "loop";
    case BlockKind::kBlock:
    case BlockKind::kIfElse:
    case BlockKind::kFunctionEntry:
      return "block";
  }
  return "block";
}

auto FormatMemArg(const MemArg& arg) -> std::string {
  return std::format("align={} offset={}", arg.align, arg.offset);
}

auto BranchAnnotation(BlockId target) -> std::string {
  return std::format(" (;e{};)", target.value);
}

auto BranchTableAnnotation(const BrTable& table) -> std::string {
  std::string targets;
  for (size_t i = 0; i < table.blocks.size(); ++i) {
    if (i > 0) {
      targets += " ";
    }
    targets += std::format("e{}", table.blocks[i].value);
  }
  return std::format(
      " (;default:e{}  [{}];)", table.default_block.value, targets);
}

class DumpVisitor final : public Visitor {
 public:
  explicit DumpVisitor(std::ostream* out) : out_(out) {
  }

  void EnterExpr(ExprId /*id*/, const Expr& expr) override {
    if (depth_ > 0) {
      *out_ << "\n";
    }
    for (int i = 0; i < depth_; ++i) {
      *out_ << "  ";
    }
    *out_ << "(" << FormatNodeHeader(expr);
    ++depth_;
  }

  void LeaveExpr(ExprId /*id*/, const Expr& /*expr*/) override {
    --depth_;
    *out_ << ")";
    if (depth_ == 0) {
      *out_ << "\n";
    }
  }

 private:
  std::ostream* out_;
  int depth_ = 0;
};

}  // namespace

auto FormatNodeHeader(const Expr& expr) -> std::string {
  return std::visit(
      Overloaded{
          [](const Block& e) {
            std::string header = BlockName(e);
            for (ValType param : e.params) {
              header += std::format(" (param {})", ToString(param));
            }
            for (ValType result : e.results) {
              header += std::format(" (result {})", ToString(result));
            }
            return header;
          },
          [](const Call& e) { return std::format("call f{}", e.func.value); },
          [](const CallIndirect& e) {
            return std::format(
                "call_indirect type{} table{}", e.type.value, e.table.value);
          },
          [](const LocalGet& e) {
            return std::format("local.get l{}", e.local.value);
          },
          [](const LocalSet& e) {
            return std::format("local.set l{}", e.local.value);
          },
          [](const LocalTee& e) {
            return std::format("local.tee l{}", e.local.value);
          },
          [](const GlobalGet& e) {
            return std::format("global.get g{}", e.global.value);
          },
          [](const GlobalSet& e) {
            return std::format("global.set g{}", e.global.value);
          },
          [](const Const& e) {
            return std::format(
                "const {} {}", ToString(TypeOf(e.value)), ToString(e.value));
          },
          [](const Binop& e) { return std::string(ToString(e.op)); },
          [](const Unop& e) { return std::string(ToString(e.op)); },
          [](const Select&) { return std::string("select"); },
          [](const Unreachable&) { return std::string("unreachable"); },
          [](const Br& e) { return "br" + BranchAnnotation(e.block); },
          [](const BrIf& e) { return "br_if" + BranchAnnotation(e.block); },
          [](const IfElse&) { return std::string("if_else"); },
          [](const BrTable& e) {
            return "br_table" + BranchTableAnnotation(e);
          },
          [](const Drop&) { return std::string("drop"); },
          [](const Return&) { return std::string("return"); },
          [](const MemorySize& e) {
            return std::format("memory.size m{}", e.memory.value);
          },
          [](const MemoryGrow& e) {
            return std::format("memory.grow m{}", e.memory.value);
          },
          [](const Load& e) {
            return std::format(
                "load m{} {} {}", e.memory.value, ToString(e.kind),
                FormatMemArg(e.arg));
          },
          [](const Store& e) {
            return std::format(
                "store m{} {} {}", e.memory.value, ToString(e.kind),
                FormatMemArg(e.arg));
          },
      },
      expr);
}

Dumper::Dumper(const LocalFunction* func, std::ostream* out)
    : func_(func), out_(out) {
}

void Dumper::DumpSignature() {
  *out_ << "func";
  if (!func_->name.empty()) {
    *out_ << " " << func_->name;
  }
  for (LocalId param : func_->params) {
    *out_ << std::format(
        " (param l{} {})", param.value,
        ToString(func_->locals[param].Type()));
  }
  for (ValType result : func_->signature.results) {
    *out_ << std::format(" (result {})", ToString(result));
  }
  *out_ << "\n";

  for (const Local& local : func_->locals) {
    if (local.Id().value < func_->params.size()) {
      continue;
    }
    *out_ << std::format(
        "  local l{} {}", local.Id().value, ToString(local.Type()));
    if (local.name) {
      *out_ << " $" << *local.name;
    }
    *out_ << "\n";
  }
}

void Dumper::Dump() {
  DumpSignature();
  Dump(func_->entry.ToExprId());
}

void Dumper::Dump(ExprId id) {
  DumpVisitor visitor(out_);
  Walk(*func_, id, visitor);
}

auto DumpToString(const LocalFunction& func) -> std::string {
  std::ostringstream out;
  Dumper dumper(&func, &out);
  dumper.Dump();
  return out.str();
}

}  // namespace wasmir::ir
