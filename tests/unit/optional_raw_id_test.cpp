#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <unordered_set>

#include <absl/container/flat_hash_set.h>
#include <fmt/core.h>

#include "rawid/internal_error.hpp"
#include "rawid/raw_id.hpp"

namespace rawid {
namespace {

class OptionalRawIdTest : public ::testing::Test {};

TEST_F(OptionalRawIdTest, SameSizeAsRawId) {
  EXPECT_EQ(sizeof(OptionalRawId), sizeof(RawId));
  EXPECT_EQ(sizeof(RawId), sizeof(uint32_t));
  // std::optional needs a separate tag; the sentinel encoding does not.
  EXPECT_GT(sizeof(std::optional<RawId>), sizeof(OptionalRawId));
}

TEST_F(OptionalRawIdTest, DefaultIsEmpty) {
  OptionalRawId none;
  EXPECT_FALSE(none.HasValue());
  EXPECT_FALSE(static_cast<bool>(none));
  EXPECT_EQ(none, OptionalRawId::None());
}

TEST_F(OptionalRawIdTest, HoldsZeroId) {
  // Displayed value 0 must not collide with the empty state.
  OptionalRawId zero = RawId::FromU32(0);
  EXPECT_TRUE(zero.HasValue());
  EXPECT_EQ(zero.Value(), RawId::FromU32(0));
  EXPECT_NE(zero, OptionalRawId::None());
}

TEST_F(OptionalRawIdTest, HoldsLargestId) {
  OptionalRawId last = RawId::FromU32(RawId::kMax - 1);
  ASSERT_TRUE(last.HasValue());
  EXPECT_EQ(last.Value().AsU32(), RawId::kMax - 1);
}

TEST_F(OptionalRawIdTest, ValueOnEmptyThrows) {
  EXPECT_THROW((void)OptionalRawId::None().Value(), InternalError);
}

TEST_F(OptionalRawIdTest, ValueOr) {
  RawId fallback = RawId::FromU32(99);
  EXPECT_EQ(OptionalRawId::None().ValueOr(fallback), fallback);
  EXPECT_EQ(OptionalRawId(RawId::FromU32(4)).ValueOr(fallback).AsU32(), 4u);
}

TEST_F(OptionalRawIdTest, EmptyOrdersFirst) {
  OptionalRawId none;
  OptionalRawId zero = RawId::FromU32(0);
  OptionalRawId five = RawId::FromU32(5);
  EXPECT_LT(none, zero);
  EXPECT_LT(zero, five);
  EXPECT_LT(none, five);
}

TEST_F(OptionalRawIdTest, HashesConsistently) {
  std::unordered_set<OptionalRawId> std_set;
  absl::flat_hash_set<OptionalRawId> absl_set;
  for (OptionalRawId id :
       {OptionalRawId::None(), OptionalRawId(RawId::FromU32(1)),
        OptionalRawId::None(), OptionalRawId(RawId::FromUsize(1))}) {
    std_set.insert(id);
    absl_set.insert(id);
  }
  EXPECT_EQ(std_set.size(), 2u);
  EXPECT_EQ(absl_set.size(), 2u);
}

TEST_F(OptionalRawIdTest, Renders) {
  EXPECT_EQ(OptionalRawId(RawId::FromU32(22)).ToString(), "22");
  EXPECT_EQ(fmt::format("{}", OptionalRawId(RawId::FromU32(22))), "22");
  EXPECT_EQ(fmt::format("{}", OptionalRawId::None()), "None");

  std::ostringstream os;
  os << OptionalRawId::None();
  EXPECT_EQ(os.str(), "None");
}

}  // namespace
}  // namespace rawid
