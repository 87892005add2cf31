#pragma once

#include <cstdint>
#include <utility>

// Identifiers of module-level entities. The IR core never owns these; they
// are foreign keys into module::Registry and are only checked against it
// while a function body is being built.

namespace wasmir {

struct FunctionId {
  uint32_t value = 0;

  auto operator==(const FunctionId&) const -> bool = default;
  auto operator<=>(const FunctionId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, FunctionId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr FunctionId kInvalidFunctionId{UINT32_MAX};

struct GlobalId {
  uint32_t value = 0;

  auto operator==(const GlobalId&) const -> bool = default;
  auto operator<=>(const GlobalId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, GlobalId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr GlobalId kInvalidGlobalId{UINT32_MAX};

struct MemoryId {
  uint32_t value = 0;

  auto operator==(const MemoryId&) const -> bool = default;
  auto operator<=>(const MemoryId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, MemoryId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr MemoryId kInvalidMemoryId{UINT32_MAX};

struct TableId {
  uint32_t value = 0;

  auto operator==(const TableId&) const -> bool = default;
  auto operator<=>(const TableId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, TableId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr TableId kInvalidTableId{UINT32_MAX};

// Index of a function signature in the module's type section.
struct TypeId {
  uint32_t value = 0;

  auto operator==(const TypeId&) const -> bool = default;
  auto operator<=>(const TypeId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, TypeId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr TypeId kInvalidTypeId{UINT32_MAX};

}  // namespace wasmir
