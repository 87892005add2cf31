#pragma once

#include <string_view>

#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

enum class BinaryOp {
  // Integer comparison (i32)
  kI32Eq,
  kI32Ne,
  kI32LtS,
  kI32LtU,
  kI32GtS,
  kI32GtU,
  kI32LeS,
  kI32LeU,
  kI32GeS,
  kI32GeU,

  // Integer comparison (i64)
  kI64Eq,
  kI64Ne,
  kI64LtS,
  kI64LtU,
  kI64GtS,
  kI64GtU,
  kI64LeS,
  kI64LeU,
  kI64GeS,
  kI64GeU,

  // Float comparison (f32)
  kF32Eq,
  kF32Ne,
  kF32Lt,
  kF32Gt,
  kF32Le,
  kF32Ge,

  // Float comparison (f64)
  kF64Eq,
  kF64Ne,
  kF64Lt,
  kF64Gt,
  kF64Le,
  kF64Ge,

  // Integer arithmetic, bitwise, shift and rotate (i32)
  kI32Add,
  kI32Sub,
  kI32Mul,
  kI32DivS,
  kI32DivU,
  kI32RemS,
  kI32RemU,
  kI32And,
  kI32Or,
  kI32Xor,
  kI32Shl,
  kI32ShrS,
  kI32ShrU,
  kI32Rotl,
  kI32Rotr,

  // Integer arithmetic, bitwise, shift and rotate (i64)
  kI64Add,
  kI64Sub,
  kI64Mul,
  kI64DivS,
  kI64DivU,
  kI64RemS,
  kI64RemU,
  kI64And,
  kI64Or,
  kI64Xor,
  kI64Shl,
  kI64ShrS,
  kI64ShrU,
  kI64Rotl,
  kI64Rotr,

  // Float arithmetic (f32)
  kF32Add,
  kF32Sub,
  kF32Mul,
  kF32Div,
  kF32Min,
  kF32Max,
  kF32Copysign,

  // Float arithmetic (f64)
  kF64Add,
  kF64Sub,
  kF64Mul,
  kF64Div,
  kF64Min,
  kF64Max,
  kF64Copysign,
};

enum class UnaryOp {
  // Bit counting (i32)
  kI32Eqz,
  kI32Clz,
  kI32Ctz,
  kI32Popcnt,

  // Bit counting (i64)
  kI64Eqz,
  kI64Clz,
  kI64Ctz,
  kI64Popcnt,

  // Rounding and sign (f32)
  kF32Abs,
  kF32Neg,
  kF32Ceil,
  kF32Floor,
  kF32Trunc,
  kF32Nearest,
  kF32Sqrt,

  // Rounding and sign (f64)
  kF64Abs,
  kF64Neg,
  kF64Ceil,
  kF64Floor,
  kF64Trunc,
  kF64Nearest,
  kF64Sqrt,

  // Integer wrap, truncation and extension
  kI32WrapI64,
  kI32TruncSF32,
  kI32TruncUF32,
  kI32TruncSF64,
  kI32TruncUF64,
  kI64ExtendSI32,
  kI64ExtendUI32,
  kI64TruncSF32,
  kI64TruncUF32,
  kI64TruncSF64,
  kI64TruncUF64,

  // Float conversion
  kF32ConvertSI32,
  kF32ConvertUI32,
  kF32ConvertSI64,
  kF32ConvertUI64,
  kF32DemoteF64,
  kF64ConvertSI32,
  kF64ConvertUI32,
  kF64ConvertSI64,
  kF64ConvertUI64,
  kF64PromoteF32,

  // Reinterpretation
  kI32ReinterpretF32,
  kI64ReinterpretF64,
  kF32ReinterpretI32,
  kF64ReinterpretI64,
};

// Case-name spelling of the operator, e.g. "I32Add". Debug output and
// snapshot tests depend on this exact form.
auto ToString(BinaryOp op) -> std::string_view;
auto ToString(UnaryOp op) -> std::string_view;

// Type of the value an operator produces. Comparisons and `eqz` produce i32.
auto ResultType(BinaryOp op) -> ValType;
auto ResultType(UnaryOp op) -> ValType;

}  // namespace wasmir::ir
