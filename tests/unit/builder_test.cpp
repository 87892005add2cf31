#include <gtest/gtest.h>

#include <cstdint>
#include <format>
#include <utility>
#include <variant>
#include <vector>

#include "wasmir/common/diagnostic.hpp"
#include "wasmir/decode/instruction.hpp"
#include "wasmir/ir/builder.hpp"
#include "wasmir/ir/dumper.hpp"
#include "wasmir/ir/expression.hpp"
#include "wasmir/ir/function.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/memory_op.hpp"
#include "wasmir/ir/operator.hpp"
#include "wasmir/ir/value.hpp"
#include "wasmir/module/ids.hpp"
#include "wasmir/module/registry.hpp"
#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {
namespace {

using Body = std::vector<decode::Instruction>;

class FunctionBuilderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    void_type_ = registry_.AddType(FunctionType{});
    unary_type_ = registry_.AddType(
        FunctionType{.params = {ValType::kI32}, .results = {ValType::kI32}});
    pair_type_ = registry_.AddType(
        FunctionType{
            .params = {}, .results = {ValType::kI32, ValType::kI32}});
    side_effect_ = registry_.AddFunction(void_type_);
    unary_ = registry_.AddFunction(unary_type_);
    pair_ = registry_.AddFunction(pair_type_);
    counter_ = registry_.AddGlobal(ValType::kI32, true);
    constant_ = registry_.AddGlobal(ValType::kI64, false);
    memory_ = registry_.AddMemory();
    table_ = registry_.AddTable();
  }

  auto Build(
      FunctionType signature, const std::vector<ValType>& locals,
      const Body& body) -> Result<LocalFunction> {
    return BuildFunction(registry_, std::move(signature), locals, body);
  }

  // Builds a body that is expected to be rejected.
  auto Reject(
      FunctionType signature, const std::vector<ValType>& locals,
      const Body& body) -> Diagnostic {
    auto result = Build(std::move(signature), locals, body);
    if (result) {
      ADD_FAILURE() << "build unexpectedly succeeded:\n"
                    << DumpToString(*result);
      return Diagnostic{};
    }
    return result.error();
  }

  static auto I32(int32_t v) -> decode::Instruction {
    return decode::Const{.value = Value::I32(v)};
  }

  static auto Yields(ValType type) -> decode::BlockType {
    return decode::BlockType{.params = {}, .results = {type}};
  }

  static auto Sig(std::vector<ValType> params, std::vector<ValType> results)
      -> FunctionType {
    return FunctionType{
        .params = std::move(params), .results = std::move(results)};
  }

  static auto BodyOf(const LocalFunction& func, BlockId block)
      -> const std::vector<ExprId>& {
    return func.exprs.GetBlock(block).exprs;
  }

  module::Registry registry_;
  TypeId void_type_;
  TypeId unary_type_;
  TypeId pair_type_;
  FunctionId side_effect_;
  FunctionId unary_;
  FunctionId pair_;
  GlobalId counter_;
  GlobalId constant_;
  MemoryId memory_;
  TableId table_;
};

// =============================================================================
// Straight-line code
// =============================================================================

TEST_F(FunctionBuilderTest, OperandsBecomeTree) {
  auto func = Build(
      Sig({ValType::kI32, ValType::kI32}, {ValType::kI32}), {},
      {decode::LocalGet{.index = 0}, decode::LocalGet{.index = 1},
       decode::Binary{.op = BinaryOp::kI32Add}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  EXPECT_EQ(
      DumpToString(*func),
      "func (param l0 i32) (param l1 i32) (result i32)\n"
      "(block (result i32)\n"
      "  (I32Add\n"
      "    (local.get l0)\n"
      "    (local.get l1)))\n");
}

TEST_F(FunctionBuilderTest, ParamsPrecedeDeclaredLocals) {
  auto func = Build(
      Sig({ValType::kF32}, {}), {ValType::kI64, ValType::kF64},
      {decode::End{}});
  ASSERT_TRUE(func.has_value());

  ASSERT_EQ(func->locals.Size(), 3U);
  EXPECT_EQ(func->params, (std::vector<LocalId>{LocalId{0}}));
  EXPECT_EQ(func->locals[LocalId{0}].Type(), ValType::kF32);
  EXPECT_EQ(func->locals[LocalId{1}].Type(), ValType::kI64);
  EXPECT_EQ(func->locals[LocalId{2}].Type(), ValType::kF64);
  EXPECT_EQ(func->EntryBlock().kind, BlockKind::kFunctionEntry);
}

TEST_F(FunctionBuilderTest, PendingLocalReadIsSpilledBeforeWrite) {
  // The read of l0 happens before the write, so the result is the old value.
  auto func = Build(
      Sig({}, {ValType::kI32}), {ValType::kI32},
      {decode::LocalGet{.index = 0}, I32(5), decode::LocalSet{.index = 0},
       decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  EXPECT_EQ(
      DumpToString(*func),
      "func (result i32)\n"
      "  local l0 i32\n"
      "  local l1 i32\n"
      "(block (result i32)\n"
      "  (local.set l1\n"
      "    (local.get l0))\n"
      "  (local.set l0\n"
      "    (const i32 5))\n"
      "  (local.get l1))\n");
}

TEST_F(FunctionBuilderTest, ConstantsAreNotSpilled) {
  auto func = Build(
      Sig({}, {ValType::kI32}), {},
      {I32(7), I32(0), decode::GlobalSet{.global = counter_}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  EXPECT_EQ(func->locals.Size(), 0U);
  const auto& body = BodyOf(*func, func->entry);
  ASSERT_EQ(body.size(), 2U);
  EXPECT_EQ(KindOf(func->exprs[body[0]]), ExprKind::kGlobalSet);
  EXPECT_EQ(std::get<Const>(func->exprs[body[1]]).value, Value::I32(7));
}

TEST_F(FunctionBuilderTest, CallKeepsSideEffectOrder) {
  // call unary(3) runs before call side_effect(), even though its value is
  // consumed afterwards.
  auto func = Build(
      Sig({}, {ValType::kI32}), {},
      {I32(3), decode::Call{.func = unary_},
       decode::Call{.func = side_effect_}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& body = BodyOf(*func, func->entry);
  ASSERT_EQ(body.size(), 3U);
  const auto& spill = std::get<LocalSet>(func->exprs[body[0]]);
  EXPECT_EQ(std::get<Call>(func->exprs[spill.value]).func, unary_);
  EXPECT_EQ(std::get<Call>(func->exprs[body[1]]).func, side_effect_);
  EXPECT_EQ(std::get<LocalGet>(func->exprs[body[2]]).local, spill.local);
  EXPECT_EQ(func->locals[spill.local].Type(), ValType::kI32);
}

TEST_F(FunctionBuilderTest, LocalTeeYieldsValue) {
  auto func = Build(
      Sig({ValType::kI32}, {ValType::kI32}), {},
      {I32(4), decode::LocalTee{.index = 0}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& body = BodyOf(*func, func->entry);
  ASSERT_EQ(body.size(), 1U);
  const auto& tee = std::get<LocalTee>(func->exprs[body[0]]);
  EXPECT_EQ(tee.local, LocalId{0});
  EXPECT_EQ(std::get<Const>(func->exprs[tee.value]).value, Value::I32(4));
}

TEST_F(FunctionBuilderTest, SelectOperandsInStackOrder) {
  auto func = Build(
      Sig({}, {ValType::kI32}), {},
      {I32(1), I32(2), I32(0), decode::Select{}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& select =
      std::get<Select>(func->exprs[BodyOf(*func, func->entry)[0]]);
  EXPECT_EQ(std::get<Const>(func->exprs[select.consequent]).value,
            Value::I32(1));
  EXPECT_EQ(std::get<Const>(func->exprs[select.alternative]).value,
            Value::I32(2));
  EXPECT_EQ(std::get<Const>(func->exprs[select.condition]).value,
            Value::I32(0));
}

TEST_F(FunctionBuilderTest, CallIndirectTakesCalleeLast) {
  auto func = Build(
      Sig({ValType::kI32}, {ValType::kI32}), {},
      {I32(5), decode::LocalGet{.index = 0},
       decode::CallIndirect{.type = unary_type_, .table = table_},
       decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& call =
      std::get<CallIndirect>(func->exprs[BodyOf(*func, func->entry)[0]]);
  ASSERT_EQ(call.args.size(), 1U);
  EXPECT_TRUE(std::holds_alternative<Const>(func->exprs[call.args[0]]));
  EXPECT_TRUE(std::holds_alternative<LocalGet>(func->exprs[call.func]));
}

TEST_F(FunctionBuilderTest, MemoryAccess) {
  auto func = Build(
      Sig({ValType::kI32}, {}), {},
      {decode::LocalGet{.index = 0}, decode::LocalGet{.index = 0},
       decode::Load{
           .memory = memory_, .kind = LoadKind::kI32, .arg = MemArg{}},
       decode::Store{
           .memory = memory_,
           .kind = StoreKind::kI32,
           .arg = MemArg{.align = 4, .offset = 16}},
       decode::MemorySize{.memory = memory_}, decode::Drop{}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& body = BodyOf(*func, func->entry);
  ASSERT_EQ(body.size(), 2U);
  const auto& store = std::get<Store>(func->exprs[body[0]]);
  EXPECT_EQ(store.arg.offset, 16U);
  EXPECT_TRUE(std::holds_alternative<LocalGet>(func->exprs[store.address]));
  EXPECT_TRUE(std::holds_alternative<Load>(func->exprs[store.value]));
  const auto& drop = std::get<Drop>(func->exprs[body[1]]);
  EXPECT_TRUE(std::holds_alternative<MemorySize>(func->exprs[drop.expr]));
}

// =============================================================================
// Control flow
// =============================================================================

TEST_F(FunctionBuilderTest, IfElseWithResult) {
  auto func = Build(
      Sig({ValType::kI32}, {ValType::kI32}), {},
      {decode::LocalGet{.index = 0}, decode::If{.type = Yields(ValType::kI32)},
       I32(10), decode::Else{}, I32(20), decode::End{}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  EXPECT_EQ(
      DumpToString(*func),
      "func (param l0 i32) (result i32)\n"
      "(block (result i32)\n"
      "  (if_else\n"
      "    (local.get l0)\n"
      "    (block (result i32)\n"
      "      (const i32 10))\n"
      "    (block (result i32)\n"
      "      (const i32 20))))\n");
}

TEST_F(FunctionBuilderTest, IfWithoutElseHasEmptyAlternative) {
  auto func = Build(
      Sig({ValType::kI32}, {}), {},
      {decode::LocalGet{.index = 0}, decode::If{},
       decode::Call{.func = side_effect_}, decode::End{}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& if_else =
      std::get<IfElse>(func->exprs[BodyOf(*func, func->entry)[0]]);
  EXPECT_EQ(BodyOf(*func, if_else.consequent).size(), 1U);
  EXPECT_TRUE(BodyOf(*func, if_else.alternative).empty());
  EXPECT_EQ(
      func->exprs.GetBlock(if_else.alternative).kind, BlockKind::kIfElse);
}

TEST_F(FunctionBuilderTest, BranchLeavesRestOfBlockUnreachable) {
  auto func = Build(
      Sig({}, {}), {},
      {decode::Block{}, decode::Br{.depth = 0}, I32(1), decode::Drop{},
       decode::Block{}, decode::Unreachable{}, decode::End{}, decode::End{},
       decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  EXPECT_EQ(
      DumpToString(*func),
      "func\n"
      "(block\n"
      "  (block\n"
      "    (br (;e1;))))\n");
  // Nothing after the br was materialized.
  EXPECT_EQ(func->exprs.Size(), 3U);
}

TEST_F(FunctionBuilderTest, ReturnSkipsTrailingCode) {
  auto func = Build(
      Sig({}, {ValType::kI32}), {},
      {I32(1), decode::Return{}, I32(2), decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& body = BodyOf(*func, func->entry);
  ASSERT_EQ(body.size(), 1U);
  const auto& ret = std::get<Return>(func->exprs[body[0]]);
  ASSERT_EQ(ret.values.size(), 1U);
  EXPECT_EQ(std::get<Const>(func->exprs[ret.values[0]]).value, Value::I32(1));
}

TEST_F(FunctionBuilderTest, DeadElseArmIsStillBuilt) {
  auto func = Build(
      Sig({ValType::kI32}, {}), {},
      {decode::LocalGet{.index = 0}, decode::If{}, decode::Unreachable{},
       decode::Else{}, decode::Call{.func = side_effect_}, decode::End{},
       decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& if_else =
      std::get<IfElse>(func->exprs[BodyOf(*func, func->entry)[0]]);
  EXPECT_EQ(BodyOf(*func, if_else.consequent).size(), 1U);
  EXPECT_EQ(BodyOf(*func, if_else.alternative).size(), 1U);
}

TEST_F(FunctionBuilderTest, NestedIfElseInDeadCodeIsSkipped) {
  auto func = Build(
      Sig({}, {}), {},
      {decode::Block{}, decode::Br{.depth = 0}, decode::If{}, I32(1),
       decode::Else{}, I32(2), decode::End{}, decode::End{},
       decode::Call{.func = side_effect_}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  // The dead else and end close the skipped if, not the enclosing block, so
  // the call lands in the entry body after it.
  const auto& body = BodyOf(*func, func->entry);
  ASSERT_EQ(body.size(), 2U);
  BlockId block = func->exprs.AsBlockId(body[0]);
  ASSERT_EQ(BodyOf(*func, block).size(), 1U);
  EXPECT_TRUE(
      std::holds_alternative<Br>(func->exprs[BodyOf(*func, block)[0]]));
  EXPECT_EQ(std::get<Call>(func->exprs[body[1]]).func, side_effect_);
  EXPECT_EQ(func->exprs.Size(), 4U);
}

TEST_F(FunctionBuilderTest, BranchToLoopReentersIt) {
  auto func = Build(
      Sig({}, {}), {},
      {decode::Loop{}, decode::Br{.depth = 0}, decode::End{}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  BlockId loop = func->exprs.AsBlockId(BodyOf(*func, func->entry)[0]);
  EXPECT_EQ(func->exprs.GetBlock(loop).kind, BlockKind::kLoop);
  const auto& br = std::get<Br>(func->exprs[BodyOf(*func, loop)[0]]);
  EXPECT_EQ(br.block, loop);
}

TEST_F(FunctionBuilderTest, BrIfCarriesValueThrough) {
  auto func = Build(
      Sig({}, {ValType::kI32}), {},
      {decode::Block{.type = Yields(ValType::kI32)}, I32(1), I32(0),
       decode::BrIf{.depth = 0}, decode::End{}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  BlockId block = func->exprs.AsBlockId(BodyOf(*func, func->entry)[0]);
  const auto& br_if = std::get<BrIf>(func->exprs[BodyOf(*func, block)[0]]);
  EXPECT_EQ(br_if.block, block);
  ASSERT_EQ(br_if.args.size(), 1U);
  EXPECT_EQ(std::get<Const>(func->exprs[br_if.args[0]]).value, Value::I32(1));
  EXPECT_EQ(
      std::get<Const>(func->exprs[br_if.condition]).value, Value::I32(0));
}

TEST_F(FunctionBuilderTest, BranchTableResolvesDepths) {
  auto func = Build(
      Sig({ValType::kI32}, {}), {},
      {decode::Block{}, decode::Block{}, decode::LocalGet{.index = 0},
       decode::BrTable{.depths = {0, 1}, .default_depth = 1}, decode::End{},
       decode::End{}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  BlockId outer = func->exprs.AsBlockId(BodyOf(*func, func->entry)[0]);
  BlockId inner = func->exprs.AsBlockId(BodyOf(*func, outer)[0]);
  ExprId table = BodyOf(*func, inner)[0];
  EXPECT_EQ(
      FormatNodeHeader(func->exprs[table]),
      std::format(
          "br_table (;default:e{}  [e{} e{}];)", outer.value, inner.value,
          outer.value));
}

TEST_F(FunctionBuilderTest, BranchToFunctionFrameActsAsExit) {
  auto func = Build(
      Sig({}, {ValType::kI32}), {},
      {I32(9), decode::Br{.depth = 0}, decode::End{}});
  ASSERT_TRUE(func.has_value()) << FormatDiagnostic(func.error());

  const auto& br = std::get<Br>(func->exprs[BodyOf(*func, func->entry)[0]]);
  EXPECT_EQ(br.block, func->entry);
  EXPECT_EQ(br.args.size(), 1U);
}

// =============================================================================
// Incremental use
// =============================================================================

TEST_F(FunctionBuilderTest, PushOneInstructionAtATime) {
  FunctionBuilder builder(
      &registry_, Sig({}, {}), {}, BuilderOptions{.name = "incremental"});
  ASSERT_TRUE(builder.Push(decode::Call{.func = side_effect_}).has_value());
  EXPECT_FALSE(builder.IsComplete());
  ASSERT_TRUE(builder.Push(decode::End{}).has_value());
  EXPECT_TRUE(builder.IsComplete());

  auto func = builder.Finish();
  ASSERT_TRUE(func.has_value());
  EXPECT_EQ(func->name, "incremental");
}

TEST_F(FunctionBuilderTest, FinishBeforeFinalEndFails) {
  FunctionBuilder builder(&registry_, Sig({}, {}), {});
  ASSERT_TRUE(builder.Push(decode::Block{}).has_value());
  auto func = builder.Finish();
  ASSERT_FALSE(func.has_value());
  EXPECT_EQ(func.error().kind, DiagnosticKind::kUnbalancedControl);
}

TEST_F(FunctionBuilderTest, SecondFinishFails) {
  FunctionBuilder builder(
      &registry_, Sig({}, {}), {}, BuilderOptions{.verify = false});
  ASSERT_TRUE(builder.Push(decode::End{}).has_value());
  ASSERT_TRUE(builder.Finish().has_value());

  auto again = builder.Finish();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind, DiagnosticKind::kUnbalancedControl);
}

TEST_F(FunctionBuilderTest, InstructionAfterFinalEndFails) {
  FunctionBuilder builder(&registry_, Sig({}, {}), {});
  ASSERT_TRUE(builder.Push(decode::End{}).has_value());
  auto result = builder.Push(decode::Unreachable{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DiagnosticKind::kUnbalancedControl);
  EXPECT_EQ(result.error().instruction_index, 1U);
}

// =============================================================================
// Rejected input
// =============================================================================

TEST_F(FunctionBuilderTest, UnknownLocal) {
  Diagnostic diag = Reject(
      Sig({ValType::kI32}, {}), {ValType::kI32},
      {decode::LocalGet{.index = 2}, decode::Drop{}, decode::End{}});
  EXPECT_EQ(diag.kind, DiagnosticKind::kUnknownLocal);
  EXPECT_EQ(diag.instruction_index, 0U);
}

TEST_F(FunctionBuilderTest, UnknownModuleEntities) {
  EXPECT_EQ(
      Reject(Sig({}, {}), {}, {decode::Call{.func = FunctionId{40}}}).kind,
      DiagnosticKind::kUnknownFunction);
  EXPECT_EQ(
      Reject(Sig({}, {}), {}, {decode::GlobalGet{.global = GlobalId{40}}})
          .kind,
      DiagnosticKind::kUnknownGlobal);
  EXPECT_EQ(
      Reject(Sig({}, {}), {}, {decode::MemorySize{.memory = MemoryId{40}}})
          .kind,
      DiagnosticKind::kUnknownMemory);
  EXPECT_EQ(
      Reject(
          Sig({}, {}), {},
          {I32(0),
           decode::CallIndirect{.type = void_type_, .table = TableId{40}}})
          .kind,
      DiagnosticKind::kUnknownTable);
  EXPECT_EQ(
      Reject(
          Sig({}, {}), {},
          {I32(0),
           decode::CallIndirect{.type = TypeId{40}, .table = table_}})
          .kind,
      DiagnosticKind::kUnknownType);
}

TEST_F(FunctionBuilderTest, ImmutableGlobalCannotBeSet) {
  Diagnostic diag = Reject(
      Sig({}, {}), {},
      {decode::Const{.value = Value::I64(1)},
       decode::GlobalSet{.global = constant_}, decode::End{}});
  EXPECT_EQ(diag.kind, DiagnosticKind::kImmutableGlobal);
  EXPECT_EQ(diag.instruction_index, 1U);
}

TEST_F(FunctionBuilderTest, StackUnderflow) {
  Diagnostic diag = Reject(
      Sig({}, {}), {}, {I32(1), decode::Binary{.op = BinaryOp::kI32Add}});
  EXPECT_EQ(diag.kind, DiagnosticKind::kStackUnderflow);
  EXPECT_EQ(diag.instruction_index, 1U);
}

TEST_F(FunctionBuilderTest, BlockCannotPopOuterOperands) {
  Diagnostic diag = Reject(
      Sig({}, {}), {},
      {I32(1), decode::Block{}, decode::Drop{}, decode::End{}, decode::End{}});
  EXPECT_EQ(diag.kind, DiagnosticKind::kStackUnderflow);
  EXPECT_EQ(diag.instruction_index, 2U);
}

TEST_F(FunctionBuilderTest, BranchDepthOutOfRange) {
  Diagnostic diag = Reject(
      Sig({}, {}), {}, {decode::Block{}, decode::Br{.depth = 2}});
  EXPECT_EQ(diag.kind, DiagnosticKind::kUnknownBranchDepth);
  EXPECT_EQ(diag.instruction_index, 1U);
}

TEST_F(FunctionBuilderTest, ElseWithoutIf) {
  Diagnostic diag =
      Reject(Sig({}, {}), {}, {decode::Block{}, decode::Else{}});
  EXPECT_EQ(diag.kind, DiagnosticKind::kUnbalancedControl);
}

TEST_F(FunctionBuilderTest, ValuesLeftAtEnd) {
  Diagnostic diag = Reject(Sig({}, {}), {}, {I32(1), decode::End{}});
  EXPECT_EQ(diag.kind, DiagnosticKind::kUnbalancedControl);
}

TEST_F(FunctionBuilderTest, MultiValueIsUnsupported) {
  EXPECT_EQ(
      Reject(
          Sig({}, {}), {},
          {decode::Block{
              .type = decode::BlockType{
                  .params = {}, .results = {ValType::kI32, ValType::kI32}}}})
          .kind,
      DiagnosticKind::kUnsupported);
  EXPECT_EQ(
      Reject(
          Sig({}, {}), {},
          {I32(0), decode::Block{
                       .type = decode::BlockType{
                           .params = {ValType::kI32}, .results = {}}}})
          .kind,
      DiagnosticKind::kUnsupported);
  EXPECT_EQ(
      Reject(Sig({}, {}), {}, {decode::Call{.func = pair_}}).kind,
      DiagnosticKind::kUnsupported);
}

}  // namespace
}  // namespace wasmir::ir
