#include "wasmir/module/registry.hpp"

#include <cstdint>
#include <format>
#include <utility>

#include "wasmir/common/internal_error.hpp"

namespace wasmir::module {

auto Registry::AddType(FunctionType type) -> TypeId {
  TypeId id{static_cast<uint32_t>(types_.size())};
  types_.push_back(std::move(type));
  return id;
}

auto Registry::AddFunction(TypeId type) -> FunctionId {
  if (!Contains(type)) {
    throw common::InternalError(
        "Registry::AddFunction",
        std::format("type {} not registered", type.value));
  }
  FunctionId id{static_cast<uint32_t>(functions_.size())};
  functions_.push_back(type);
  return id;
}

auto Registry::AddGlobal(ValType type, bool is_mutable) -> GlobalId {
  GlobalId id{static_cast<uint32_t>(globals_.size())};
  globals_.push_back(GlobalInfo{.type = type, .is_mutable = is_mutable});
  return id;
}

auto Registry::AddMemory() -> MemoryId {
  return MemoryId{memory_count_++};
}

auto Registry::AddTable() -> TableId {
  return TableId{table_count_++};
}

auto Registry::Type(TypeId id) const -> const FunctionType& {
  if (!Contains(id)) {
    throw common::InternalError(
        "Registry::Type", std::format("type {} not registered", id.value));
  }
  return types_[id.value];
}

auto Registry::TypeOf(FunctionId id) const -> const FunctionType& {
  if (!Contains(id)) {
    throw common::InternalError(
        "Registry::TypeOf",
        std::format("function {} not registered", id.value));
  }
  return types_[functions_[id.value].value];
}

auto Registry::Global(GlobalId id) const -> const GlobalInfo& {
  if (!Contains(id)) {
    throw common::InternalError(
        "Registry::Global", std::format("global {} not registered", id.value));
  }
  return globals_[id.value];
}

}  // namespace wasmir::module
