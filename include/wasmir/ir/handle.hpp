#pragma once

#include <cstdint>
#include <utility>

namespace wasmir::ir {

// Index of a node in its function's ExprArena. Ids are handed out in
// insertion order and never reused, so an id stays valid for the lifetime of
// the function that issued it.
struct ExprId {
  uint32_t value = 0;

  auto operator==(const ExprId&) const -> bool = default;
  auto operator<=>(const ExprId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ExprId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr ExprId kInvalidExprId{UINT32_MAX};

// An ExprId that should reference a Block node. ExprArena::AddBlock and
// ExprArena::AsBlockId produce checked ones; Add and Replace reject nodes
// whose BlockIds do not name a Block.
struct BlockId {
  uint32_t value = 0;

  auto operator==(const BlockId&) const -> bool = default;
  auto operator<=>(const BlockId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  [[nodiscard]] constexpr auto ToExprId() const -> ExprId {
    return ExprId{value};
  }

  template <typename H>
  friend auto AbslHashValue(H h, BlockId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr BlockId kInvalidBlockId{UINT32_MAX};

// Function-local index into LocalRegistry. Parameters come first, in
// signature order, followed by declared locals and builder temporaries.
struct LocalId {
  uint32_t value = 0;

  auto operator==(const LocalId&) const -> bool = default;
  auto operator<=>(const LocalId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, LocalId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr LocalId kInvalidLocalId{UINT32_MAX};

}  // namespace wasmir::ir
