#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "wasmir/common/internal_error.hpp"
#include "wasmir/ir/handle.hpp"
#include "wasmir/ir/local.hpp"
#include "wasmir/module/val_type.hpp"

namespace wasmir::ir {
namespace {

class LocalTest : public ::testing::Test {
 protected:
  LocalRegistry locals_;
};

TEST_F(LocalTest, CreateHandsOutDenseIds) {
  LocalId a = locals_.Create(ValType::kI32);
  LocalId b = locals_.Create(ValType::kF64);
  EXPECT_EQ(a.value, 0U);
  EXPECT_EQ(b.value, 1U);
  EXPECT_EQ(locals_.Size(), 2U);
  EXPECT_NE(a, b);
}

TEST_F(LocalTest, TypeIsFixedAtCreation) {
  LocalId id = locals_.Create(ValType::kV128);
  EXPECT_EQ(locals_.Get(id).Type(), ValType::kV128);
  EXPECT_EQ(locals_[id].Id(), id);
}

TEST_F(LocalTest, NameIsMutable) {
  LocalId id = locals_.Create(ValType::kI64);
  EXPECT_FALSE(locals_[id].name.has_value());
  locals_.GetMut(id).name = "counter";
  EXPECT_EQ(locals_[id].name, std::optional<std::string>("counter"));
}

TEST_F(LocalTest, ForeignIdThrows) {
  locals_.Create(ValType::kI32);
  EXPECT_FALSE(locals_.Contains(LocalId{1}));
  EXPECT_THROW((void)locals_.Get(LocalId{1}), common::InternalError);
  EXPECT_THROW((void)locals_.GetMut(kInvalidLocalId), common::InternalError);
}

TEST_F(LocalTest, IterationFollowsCreationOrder) {
  locals_.Create(ValType::kI32);
  locals_.Create(ValType::kF32);
  locals_.Create(ValType::kI64);

  std::vector<ValType> types;
  for (const Local& local : locals_) {
    types.push_back(local.Type());
  }
  EXPECT_EQ(
      types,
      (std::vector<ValType>{ValType::kI32, ValType::kF32, ValType::kI64}));
}

TEST_F(LocalTest, MoveKeepsLocals) {
  LocalId id = locals_.Create(ValType::kF32);
  LocalRegistry moved = std::move(locals_);
  EXPECT_TRUE(moved.Contains(id));
  EXPECT_EQ(moved[id].Type(), ValType::kF32);
}

}  // namespace
}  // namespace wasmir::ir
