#pragma once

#include <cstdint>
#include <vector>

#include "wasmir/module/ids.hpp"
#include "wasmir/module/val_type.hpp"

namespace wasmir::module {

struct GlobalInfo {
  ValType type = ValType::kI32;
  bool is_mutable = false;
};

// Module-level identifier tables consulted while building function bodies.
// Append-only; an id is registered once it has been returned by an Add call.
class Registry final {
 public:
  Registry() = default;

  auto AddType(FunctionType type) -> TypeId;
  auto AddFunction(TypeId type) -> FunctionId;
  auto AddGlobal(ValType type, bool is_mutable) -> GlobalId;
  auto AddMemory() -> MemoryId;
  auto AddTable() -> TableId;

  [[nodiscard]] auto Contains(TypeId id) const -> bool {
    return id.value < types_.size();
  }
  [[nodiscard]] auto Contains(FunctionId id) const -> bool {
    return id.value < functions_.size();
  }
  [[nodiscard]] auto Contains(GlobalId id) const -> bool {
    return id.value < globals_.size();
  }
  [[nodiscard]] auto Contains(MemoryId id) const -> bool {
    return id.value < memory_count_;
  }
  [[nodiscard]] auto Contains(TableId id) const -> bool {
    return id.value < table_count_;
  }

  // Lookups throw InternalError for unregistered ids; callers check Contains
  // first when the id comes from untrusted input.
  [[nodiscard]] auto Type(TypeId id) const -> const FunctionType&;
  [[nodiscard]] auto TypeOf(FunctionId id) const -> const FunctionType&;
  [[nodiscard]] auto Global(GlobalId id) const -> const GlobalInfo&;

  [[nodiscard]] auto FunctionCount() const -> size_t {
    return functions_.size();
  }

 private:
  std::vector<FunctionType> types_;
  std::vector<TypeId> functions_;
  std::vector<GlobalInfo> globals_;
  uint32_t memory_count_ = 0;
  uint32_t table_count_ = 0;
};

}  // namespace wasmir::module
