#include "wasmir/ir/memory_op.hpp"

#include <cstdint>
#include <string_view>

#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

auto ToString(LoadKind kind) -> std::string_view {
  switch (kind) {
    case LoadKind::kI32:
      return "i32";
    case LoadKind::kI64:
      return "i64";
    case LoadKind::kF32:
      return "f32";
    case LoadKind::kF64:
      return "f64";
    case LoadKind::kV128:
      return "v128";
    case LoadKind::kI32_8S:
      return "i32_8_s";
    case LoadKind::kI32_8U:
      return "i32_8_u";
    case LoadKind::kI32_16S:
      return "i32_16_s";
    case LoadKind::kI32_16U:
      return "i32_16_u";
    case LoadKind::kI64_8S:
      return "i64_8_s";
    case LoadKind::kI64_8U:
      return "i64_8_u";
    case LoadKind::kI64_16S:
      return "i64_16_s";
    case LoadKind::kI64_16U:
      return "i64_16_u";
    case LoadKind::kI64_32S:
      return "i64_32_s";
    case LoadKind::kI64_32U:
      return "i64_32_u";
  }
  return "<?>";
}

auto ToString(StoreKind kind) -> std::string_view {
  switch (kind) {
    case StoreKind::kI32:
      return "i32";
    case StoreKind::kI64:
      return "i64";
    case StoreKind::kF32:
      return "f32";
    case StoreKind::kF64:
      return "f64";
    case StoreKind::kV128:
      return "v128";
    case StoreKind::kI32_8:
      return "i32_8";
    case StoreKind::kI32_16:
      return "i32_16";
    case StoreKind::kI64_8:
      return "i64_8";
    case StoreKind::kI64_16:
      return "i64_16";
    case StoreKind::kI64_32:
      return "i64_32";
  }
  return "<?>";
}

auto ResultType(LoadKind kind) -> ValType {
  switch (kind) {
    case LoadKind::kI32:
    case LoadKind::kI32_8S:
    case LoadKind::kI32_8U:
    case LoadKind::kI32_16S:
    case LoadKind::kI32_16U:
      return ValType::kI32;
    case LoadKind::kI64:
    case LoadKind::kI64_8S:
    case LoadKind::kI64_8U:
    case LoadKind::kI64_16S:
    case LoadKind::kI64_16U:
    case LoadKind::kI64_32S:
    case LoadKind::kI64_32U:
      return ValType::kI64;
    case LoadKind::kF32:
      return ValType::kF32;
    case LoadKind::kF64:
      return ValType::kF64;
    case LoadKind::kV128:
      return ValType::kV128;
  }
  return ValType::kI32;
}

auto ValueType(StoreKind kind) -> ValType {
  switch (kind) {
    case StoreKind::kI32:
    case StoreKind::kI32_8:
    case StoreKind::kI32_16:
      return ValType::kI32;
    case StoreKind::kI64:
    case StoreKind::kI64_8:
    case StoreKind::kI64_16:
    case StoreKind::kI64_32:
      return ValType::kI64;
    case StoreKind::kF32:
      return ValType::kF32;
    case StoreKind::kF64:
      return ValType::kF64;
    case StoreKind::kV128:
      return ValType::kV128;
  }
  return ValType::kI32;
}

auto AccessBytes(LoadKind kind) -> uint32_t {
  switch (kind) {
    case LoadKind::kI32_8S:
    case LoadKind::kI32_8U:
    case LoadKind::kI64_8S:
    case LoadKind::kI64_8U:
      return 1;
    case LoadKind::kI32_16S:
    case LoadKind::kI32_16U:
    case LoadKind::kI64_16S:
    case LoadKind::kI64_16U:
      return 2;
    case LoadKind::kI32:
    case LoadKind::kF32:
    case LoadKind::kI64_32S:
    case LoadKind::kI64_32U:
      return 4;
    case LoadKind::kI64:
    case LoadKind::kF64:
      return 8;
    case LoadKind::kV128:
      return 16;
  }
  return 0;
}

auto AccessBytes(StoreKind kind) -> uint32_t {
  switch (kind) {
    case StoreKind::kI32_8:
    case StoreKind::kI64_8:
      return 1;
    case StoreKind::kI32_16:
    case StoreKind::kI64_16:
      return 2;
    case StoreKind::kI32:
    case StoreKind::kF32:
    case StoreKind::kI64_32:
      return 4;
    case StoreKind::kI64:
    case StoreKind::kF64:
      return 8;
    case StoreKind::kV128:
      return 16;
  }
  return 0;
}

auto SignExtends(LoadKind kind) -> bool {
  switch (kind) {
    case LoadKind::kI32_8S:
    case LoadKind::kI32_16S:
    case LoadKind::kI64_8S:
    case LoadKind::kI64_16S:
    case LoadKind::kI64_32S:
      return true;
    case LoadKind::kI32:
    case LoadKind::kI64:
    case LoadKind::kF32:
    case LoadKind::kF64:
    case LoadKind::kV128:
    case LoadKind::kI32_8U:
    case LoadKind::kI32_16U:
    case LoadKind::kI64_8U:
    case LoadKind::kI64_16U:
    case LoadKind::kI64_32U:
      return false;
  }
  return false;
}

}  // namespace wasmir::ir
