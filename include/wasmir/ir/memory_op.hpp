#pragma once

#include <cstdint>
#include <string_view>

#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

// Width and extension behavior of a `*.load*` instruction. Sub-word integer
// loads carry their signedness (S = sign-extend, U = zero-extend).
//
// TODO: the full-width cases duplicate the node's result type; folding them
// into a single "value" kind would let the type drive codegen instead.
enum class LoadKind : uint8_t {
  kI32,
  kI64,
  kF32,
  kF64,
  kV128,
  kI32_8S,
  kI32_8U,
  kI32_16S,
  kI32_16U,
  kI64_8S,
  kI64_8U,
  kI64_16S,
  kI64_16U,
  kI64_32S,
  kI64_32U,
};

enum class StoreKind : uint8_t {
  kI32,
  kI64,
  kF32,
  kF64,
  kV128,
  kI32_8,
  kI32_16,
  kI64_8,
  kI64_16,
  kI64_32,
};

// Static offset and alignment hint of a memory access. Descriptive only; the
// IR never checks it against the access width.
struct MemArg {
  // Alignment in bytes, a power of two.
  uint32_t align = 1;
  // Byte offset added to the dynamic address.
  uint32_t offset = 0;

  auto operator==(const MemArg&) const -> bool = default;
};

auto ToString(LoadKind kind) -> std::string_view;
auto ToString(StoreKind kind) -> std::string_view;

// Type of the value a load produces.
auto ResultType(LoadKind kind) -> ValType;
// Type of the value a store consumes.
auto ValueType(StoreKind kind) -> ValType;

auto AccessBytes(LoadKind kind) -> uint32_t;
auto AccessBytes(StoreKind kind) -> uint32_t;

auto SignExtends(LoadKind kind) -> bool;

}  // namespace wasmir::ir
