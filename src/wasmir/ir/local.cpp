#include "wasmir/ir/local.hpp"

#include <cstdint>
#include <format>

#include "wasmir/common/internal_error.hpp"

namespace wasmir::ir {

auto LocalRegistry::Create(ValType type) -> LocalId {
  LocalId id{static_cast<uint32_t>(locals_.size())};
  locals_.emplace_back(id, type);
  return id;
}

auto LocalRegistry::Get(LocalId id) const -> const Local& {
  if (!Contains(id)) {
    throw common::InternalError(
        "LocalRegistry::Get",
        std::format(
            "local {} is foreign to this function ({} locals)", id.value,
            locals_.size()));
  }
  return locals_[id.value];
}

auto LocalRegistry::GetMut(LocalId id) -> Local& {
  if (!Contains(id)) {
    throw common::InternalError(
        "LocalRegistry::GetMut",
        std::format(
            "local {} is foreign to this function ({} locals)", id.value,
            locals_.size()));
  }
  return locals_[id.value];
}

}  // namespace wasmir::ir
