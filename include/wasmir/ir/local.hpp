#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wasmir/ir/handle.hpp"
#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {

// A parameter, declared local, or builder temporary. The type is fixed at
// creation; only the debug name may change afterwards.
class Local {
 public:
  Local(LocalId id, ValType type) : id_(id), type_(type) {
  }

  [[nodiscard]] auto Id() const -> LocalId {
    return id_;
  }
  [[nodiscard]] auto Type() const -> ValType {
    return type_;
  }

  std::optional<std::string> name;

  auto operator==(const Local&) const -> bool = default;

 private:
  LocalId id_;
  ValType type_;
};

// Append-only table of one function's locals.
class LocalRegistry final {
 public:
  LocalRegistry() = default;

  LocalRegistry(const LocalRegistry&) = delete;
  auto operator=(const LocalRegistry&) -> LocalRegistry& = delete;

  LocalRegistry(LocalRegistry&&) = default;
  auto operator=(LocalRegistry&&) -> LocalRegistry& = default;

  auto Create(ValType type) -> LocalId;

  // Throws InternalError if the id was not issued by this registry.
  [[nodiscard]] auto Get(LocalId id) const -> const Local&;
  [[nodiscard]] auto GetMut(LocalId id) -> Local&;

  [[nodiscard]] auto operator[](LocalId id) const -> const Local& {
    return Get(id);
  }

  [[nodiscard]] auto Contains(LocalId id) const -> bool {
    return id.value < locals_.size();
  }
  [[nodiscard]] auto Size() const -> size_t {
    return locals_.size();
  }

  [[nodiscard]] auto begin() const {
    return locals_.begin();
  }
  [[nodiscard]] auto end() const {
    return locals_.end();
  }

 private:
  std::vector<Local> locals_;
};

}  // namespace wasmir::ir
