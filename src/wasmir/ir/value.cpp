#include "wasmir/ir/value.hpp"

#include <bit>
#include <cstdint>
#include <format>
#include <string>
#include <type_traits>
#include <variant>

#include "wasmir/common/overloaded.hpp"

namespace wasmir::ir {

auto Value::operator==(const Value& other) const -> bool {
  if (data.index() != other.data.index()) {
    return false;
  }
  return std::visit(
      [&other](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const T& rhs = std::get<T>(other.data);
        if constexpr (std::is_same_v<T, float>) {
          return std::bit_cast<uint32_t>(lhs) == std::bit_cast<uint32_t>(rhs);
        } else if constexpr (std::is_same_v<T, double>) {
          return std::bit_cast<uint64_t>(lhs) == std::bit_cast<uint64_t>(rhs);
        } else {
          return lhs == rhs;
        }
      },
      data);
}

auto TypeOf(const Value& value) -> ValType {
  return std::visit(
      Overloaded{
          [](int32_t) { return ValType::kI32; },
          [](int64_t) { return ValType::kI64; },
          [](float) { return ValType::kF32; },
          [](double) { return ValType::kF64; },
          [](const V128&) { return ValType::kV128; },
      },
      value.data);
}

auto ToString(const Value& value) -> std::string {
  return std::visit(
      Overloaded{
          [](int32_t v) { return std::format("{}", v); },
          [](int64_t v) { return std::format("{}", v); },
          [](float v) { return std::format("{}", v); },
          [](double v) { return std::format("{}", v); },
          [](const V128& v) {
            return std::format("0x{:016x}{:016x}", v.high, v.low);
          },
      },
      value.data);
}

}  // namespace wasmir::ir
