#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace wasmir {

enum class ValType : uint8_t {
  kI32,
  kI64,
  kF32,
  kF64,
  kV128,
};

inline auto ToString(ValType type) -> std::string_view {
  switch (type) {
    case ValType::kI32:
      return "i32";
    case ValType::kI64:
      return "i64";
    case ValType::kF32:
      return "f32";
    case ValType::kF64:
      return "f64";
    case ValType::kV128:
      return "v128";
  }
  return "<?>";
}

struct FunctionType {
  std::vector<ValType> params;
  std::vector<ValType> results;

  auto operator==(const FunctionType&) const -> bool = default;
};

}  // namespace wasmir
