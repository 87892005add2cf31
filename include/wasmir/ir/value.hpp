#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

// 128-bit vector constant, stored as two little-endian halves.
struct V128 {
  uint64_t low = 0;
  uint64_t high = 0;

  auto operator==(const V128&) const -> bool = default;
};

// A constant operand of a `*.const` instruction.
struct Value {
  std::variant<int32_t, int64_t, float, double, V128> data;

  static auto I32(int32_t v) -> Value {
    return Value{.data = v};
  }
  static auto I64(int64_t v) -> Value {
    return Value{.data = v};
  }
  static auto F32(float v) -> Value {
    return Value{.data = v};
  }
  static auto F64(double v) -> Value {
    return Value{.data = v};
  }
  static auto Vec128(V128 v) -> Value {
    return Value{.data = v};
  }

  // Floats compare by bit pattern so NaN payloads and signed zeros are
  // distinguished.
  auto operator==(const Value& other) const -> bool;
};

auto TypeOf(const Value& value) -> ValType;

// Decimal for scalars, "0x" followed by 32 hex digits for V128.
auto ToString(const Value& value) -> std::string;

}  // namespace wasmir::ir
