#include "wasmir/ir/operator.hpp"

#include <string_view>

#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

auto ToString(BinaryOp op) -> std::string_view {
  switch (op) {
    case BinaryOp::kI32Eq:
      return "I32Eq";
    case BinaryOp::kI32Ne:
      return "I32Ne";
    case BinaryOp::kI32LtS:
      return "I32LtS";
    case BinaryOp::kI32LtU:
      return "I32LtU";
    case BinaryOp::kI32GtS:
      return "I32GtS";
    case BinaryOp::kI32GtU:
      return "I32GtU";
    case BinaryOp::kI32LeS:
      return "I32LeS";
    case BinaryOp::kI32LeU:
      return "I32LeU";
    case BinaryOp::kI32GeS:
      return "I32GeS";
    case BinaryOp::kI32GeU:
      return "I32GeU";
    case BinaryOp::kI64Eq:
      return "I64Eq";
    case BinaryOp::kI64Ne:
      return "I64Ne";
    case BinaryOp::kI64LtS:
      return "I64LtS";
    case BinaryOp::kI64LtU:
      return "I64LtU";
    case BinaryOp::kI64GtS:
      return "I64GtS";
    case BinaryOp::kI64GtU:
      return "I64GtU";
    case BinaryOp::kI64LeS:
      return "I64LeS";
    case BinaryOp::kI64LeU:
      return "I64LeU";
    case BinaryOp::kI64GeS:
      return "I64GeS";
    case BinaryOp::kI64GeU:
      return "I64GeU";
    case BinaryOp::kF32Eq:
      return "F32Eq";
    case BinaryOp::kF32Ne:
      return "F32Ne";
    case BinaryOp::kF32Lt:
      return "F32Lt";
    case BinaryOp::kF32Gt:
      return "F32Gt";
    case BinaryOp::kF32Le:
      return "F32Le";
    case BinaryOp::kF32Ge:
      return "F32Ge";
    case BinaryOp::kF64Eq:
      return "F64Eq";
    case BinaryOp::kF64Ne:
      return "F64Ne";
    case BinaryOp::kF64Lt:
      return "F64Lt";
    case BinaryOp::kF64Gt:
      return "F64Gt";
    case BinaryOp::kF64Le:
      return "F64Le";
    case BinaryOp::kF64Ge:
      return "F64Ge";
    case BinaryOp::kI32Add:
      return "I32Add";
    case BinaryOp::kI32Sub:
      return "I32Sub";
    case BinaryOp::kI32Mul:
      return "I32Mul";
    case BinaryOp::kI32DivS:
      return "I32DivS";
    case BinaryOp::kI32DivU:
      return "I32DivU";
    case BinaryOp::kI32RemS:
      return "I32RemS";
    case BinaryOp::kI32RemU:
      return "I32RemU";
    case BinaryOp::kI32And:
      return "I32And";
    case BinaryOp::kI32Or:
      return "I32Or";
    case BinaryOp::kI32Xor:
      return "I32Xor";
    case BinaryOp::kI32Shl:
      return "I32Shl";
    case BinaryOp::kI32ShrS:
      return "I32ShrS";
    case BinaryOp::kI32ShrU:
      return "I32ShrU";
    case BinaryOp::kI32Rotl:
      return "I32Rotl";
    case BinaryOp::kI32Rotr:
      return "I32Rotr";
    case BinaryOp::kI64Add:
      return "I64Add";
    case BinaryOp::kI64Sub:
      return "I64Sub";
    case BinaryOp::kI64Mul:
      return "I64Mul";
    case BinaryOp::kI64DivS:
      return "I64DivS";
    case BinaryOp::kI64DivU:
      return "I64DivU";
    case BinaryOp::kI64RemS:
      return "I64RemS";
    case BinaryOp::kI64RemU:
      return "I64RemU";
    case BinaryOp::kI64And:
      return "I64And";
    case BinaryOp::kI64Or:
      return "I64Or";
    case BinaryOp::kI64Xor:
      return "I64Xor";
    case BinaryOp::kI64Shl:
      return "I64Shl";
    case BinaryOp::kI64ShrS:
      return "I64ShrS";
    case BinaryOp::kI64ShrU:
      return "I64ShrU";
    case BinaryOp::kI64Rotl:
      return "I64Rotl";
    case BinaryOp::kI64Rotr:
      return "I64Rotr";
    case BinaryOp::kF32Add:
      return "F32Add";
    case BinaryOp::kF32Sub:
      return "F32Sub";
    case BinaryOp::kF32Mul:
      return "F32Mul";
    case BinaryOp::kF32Div:
      return "F32Div";
    case BinaryOp::kF32Min:
      return "F32Min";
    case BinaryOp::kF32Max:
      return "F32Max";
    case BinaryOp::kF32Copysign:
      return "F32Copysign";
    case BinaryOp::kF64Add:
      return "F64Add";
    case BinaryOp::kF64Sub:
      return "F64Sub";
    case BinaryOp::kF64Mul:
      return "F64Mul";
    case BinaryOp::kF64Div:
      return "F64Div";
    case BinaryOp::kF64Min:
      return "F64Min";
    case BinaryOp::kF64Max:
      return "F64Max";
    case BinaryOp::kF64Copysign:
      return "F64Copysign";
  }
  return "<?>";
}

auto ToString(UnaryOp op) -> std::string_view {
  switch (op) {
    case UnaryOp::kI32Eqz:
      return "I32Eqz";
    case UnaryOp::kI32Clz:
      return "I32Clz";
    case UnaryOp::kI32Ctz:
      return "I32Ctz";
    case UnaryOp::kI32Popcnt:
      return "I32Popcnt";
    case UnaryOp::kI64Eqz:
      return "I64Eqz";
    case UnaryOp::kI64Clz:
      return "I64Clz";
    case UnaryOp::kI64Ctz:
      return "I64Ctz";
    case UnaryOp::kI64Popcnt:
      return "I64Popcnt";
    case UnaryOp::kF32Abs:
      return "F32Abs";
    case UnaryOp::kF32Neg:
      return "F32Neg";
    case UnaryOp::kF32Ceil:
      return "F32Ceil";
    case UnaryOp::kF32Floor:
      return "F32Floor";
    case UnaryOp::kF32Trunc:
      return "F32Trunc";
    case UnaryOp::kF32Nearest:
      return "F32Nearest";
    case UnaryOp::kF32Sqrt:
      return "F32Sqrt";
    case UnaryOp::kF64Abs:
      return "F64Abs";
    case UnaryOp::kF64Neg:
      return "F64Neg";
    case UnaryOp::kF64Ceil:
      return "F64Ceil";
    case UnaryOp::kF64Floor:
      return "F64Floor";
    case UnaryOp::kF64Trunc:
      return "F64Trunc";
    case UnaryOp::kF64Nearest:
      return "F64Nearest";
    case UnaryOp::kF64Sqrt:
      return "F64Sqrt";
    case UnaryOp::kI32WrapI64:
      return "I32WrapI64";
    case UnaryOp::kI32TruncSF32:
      return "I32TruncSF32";
    case UnaryOp::kI32TruncUF32:
      return "I32TruncUF32";
    case UnaryOp::kI32TruncSF64:
      return "I32TruncSF64";
    case UnaryOp::kI32TruncUF64:
      return "I32TruncUF64";
    case UnaryOp::kI64ExtendSI32:
      return "I64ExtendSI32";
    case UnaryOp::kI64ExtendUI32:
      return "I64ExtendUI32";
    case UnaryOp::kI64TruncSF32:
      return "I64TruncSF32";
    case UnaryOp::kI64TruncUF32:
      return "I64TruncUF32";
    case UnaryOp::kI64TruncSF64:
      return "I64TruncSF64";
    case UnaryOp::kI64TruncUF64:
      return "I64TruncUF64";
    case UnaryOp::kF32ConvertSI32:
      return "F32ConvertSI32";
    case UnaryOp::kF32ConvertUI32:
      return "F32ConvertUI32";
    case UnaryOp::kF32ConvertSI64:
      return "F32ConvertSI64";
    case UnaryOp::kF32ConvertUI64:
      return "F32ConvertUI64";
    case UnaryOp::kF32DemoteF64:
      return "F32DemoteF64";
    case UnaryOp::kF64ConvertSI32:
      return "F64ConvertSI32";
    case UnaryOp::kF64ConvertUI32:
      return "F64ConvertUI32";
    case UnaryOp::kF64ConvertSI64:
      return "F64ConvertSI64";
    case UnaryOp::kF64ConvertUI64:
      return "F64ConvertUI64";
    case UnaryOp::kF64PromoteF32:
      return "F64PromoteF32";
    case UnaryOp::kI32ReinterpretF32:
      return "I32ReinterpretF32";
    case UnaryOp::kI64ReinterpretF64:
      return "I64ReinterpretF64";
    case UnaryOp::kF32ReinterpretI32:
      return "F32ReinterpretI32";
    case UnaryOp::kF64ReinterpretI64:
      return "F64ReinterpretI64";
  }
  return "<?>";
}

auto ResultType(BinaryOp op) -> ValType {
  switch (op) {
    case BinaryOp::kI32Eq:
    case BinaryOp::kI32Ne:
    case BinaryOp::kI32LtS:
    case BinaryOp::kI32LtU:
    case BinaryOp::kI32GtS:
    case BinaryOp::kI32GtU:
    case BinaryOp::kI32LeS:
    case BinaryOp::kI32LeU:
    case BinaryOp::kI32GeS:
    case BinaryOp::kI32GeU:
    case BinaryOp::kI64Eq:
    case BinaryOp::kI64Ne:
    case BinaryOp::kI64LtS:
    case BinaryOp::kI64LtU:
    case BinaryOp::kI64GtS:
    case BinaryOp::kI64GtU:
    case BinaryOp::kI64LeS:
    case BinaryOp::kI64LeU:
    case BinaryOp::kI64GeS:
    case BinaryOp::kI64GeU:
    case BinaryOp::kF32Eq:
    case BinaryOp::kF32Ne:
    case BinaryOp::kF32Lt:
    case BinaryOp::kF32Gt:
    case BinaryOp::kF32Le:
    case BinaryOp::kF32Ge:
    case BinaryOp::kF64Eq:
    case BinaryOp::kF64Ne:
    case BinaryOp::kF64Lt:
    case BinaryOp::kF64Gt:
    case BinaryOp::kF64Le:
    case BinaryOp::kF64Ge:
    case BinaryOp::kI32Add:
    case BinaryOp::kI32Sub:
    case BinaryOp::kI32Mul:
    case BinaryOp::kI32DivS:
    case BinaryOp::kI32DivU:
    case BinaryOp::kI32RemS:
    case BinaryOp::kI32RemU:
    case BinaryOp::kI32And:
    case BinaryOp::kI32Or:
    case BinaryOp::kI32Xor:
    case BinaryOp::kI32Shl:
    case BinaryOp::kI32ShrS:
    case BinaryOp::kI32ShrU:
    case BinaryOp::kI32Rotl:
    case BinaryOp::kI32Rotr:
      return ValType::kI32;
    case BinaryOp::kI64Add:
    case BinaryOp::kI64Sub:
    case BinaryOp::kI64Mul:
    case BinaryOp::kI64DivS:
    case BinaryOp::kI64DivU:
    case BinaryOp::kI64RemS:
    case BinaryOp::kI64RemU:
    case BinaryOp::kI64And:
    case BinaryOp::kI64Or:
    case BinaryOp::kI64Xor:
    case BinaryOp::kI64Shl:
    case BinaryOp::kI64ShrS:
    case BinaryOp::kI64ShrU:
    case BinaryOp::kI64Rotl:
    case BinaryOp::kI64Rotr:
      return ValType::kI64;
    case BinaryOp::kF32Add:
    case BinaryOp::kF32Sub:
    case BinaryOp::kF32Mul:
    case BinaryOp::kF32Div:
    case BinaryOp::kF32Min:
    case BinaryOp::kF32Max:
    case BinaryOp::kF32Copysign:
      return ValType::kF32;
    case BinaryOp::kF64Add:
    case BinaryOp::kF64Sub:
    case BinaryOp::kF64Mul:
    case BinaryOp::kF64Div:
    case BinaryOp::kF64Min:
    case BinaryOp::kF64Max:
    case BinaryOp::kF64Copysign:
      return ValType::kF64;
  }
  return ValType::kI32;
}

auto ResultType(UnaryOp op) -> ValType {
  switch (op) {
    case UnaryOp::kI32Eqz:
    case UnaryOp::kI32Clz:
    case UnaryOp::kI32Ctz:
    case UnaryOp::kI32Popcnt:
    case UnaryOp::kI64Eqz:
    case UnaryOp::kI32WrapI64:
    case UnaryOp::kI32TruncSF32:
    case UnaryOp::kI32TruncUF32:
    case UnaryOp::kI32TruncSF64:
    case UnaryOp::kI32TruncUF64:
    case UnaryOp::kI32ReinterpretF32:
      return ValType::kI32;
    case UnaryOp::kI64Clz:
    case UnaryOp::kI64Ctz:
    case UnaryOp::kI64Popcnt:
    case UnaryOp::kI64ExtendSI32:
    case UnaryOp::kI64ExtendUI32:
    case UnaryOp::kI64TruncSF32:
    case UnaryOp::kI64TruncUF32:
    case UnaryOp::kI64TruncSF64:
    case UnaryOp::kI64TruncUF64:
    case UnaryOp::kI64ReinterpretF64:
      return ValType::kI64;
    case UnaryOp::kF32Abs:
    case UnaryOp::kF32Neg:
    case UnaryOp::kF32Ceil:
    case UnaryOp::kF32Floor:
    case UnaryOp::kF32Trunc:
    case UnaryOp::kF32Nearest:
    case UnaryOp::kF32Sqrt:
    case UnaryOp::kF32ConvertSI32:
    case UnaryOp::kF32ConvertUI32:
    case UnaryOp::kF32ConvertSI64:
    case UnaryOp::kF32ConvertUI64:
    case UnaryOp::kF32DemoteF64:
    case UnaryOp::kF32ReinterpretI32:
      return ValType::kF32;
    case UnaryOp::kF64Abs:
    case UnaryOp::kF64Neg:
    case UnaryOp::kF64Ceil:
    case UnaryOp::kF64Floor:
    case UnaryOp::kF64Trunc:
    case UnaryOp::kF64Nearest:
    case UnaryOp::kF64Sqrt:
    case UnaryOp::kF64ConvertSI32:
    case UnaryOp::kF64ConvertUI32:
    case UnaryOp::kF64ConvertSI64:
    case UnaryOp::kF64ConvertUI64:
    case UnaryOp::kF64PromoteF32:
    case UnaryOp::kF64ReinterpretI64:
      return ValType::kF64;
  }
  return ValType::kI32;
}

}  // namespace wasmir::ir
