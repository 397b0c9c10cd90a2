#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>

#include <intervalix/csr_ops/prefix_sum.hpp>

#include "intervalix_test_utils.hpp"

using namespace intervalix::csr;
using namespace intervalix::csr_test;

namespace {

struct RawHost {
  Ids raw;
  std::vector<int> valid;
};

RawHost raw_ids(const std::vector<int>& seq, BoundaryPolicy policy,
                IntervalIdContext& ctx) {
  auto dev = to<DeviceMemorySpace>(make_grouped_sequence_host_from_values<int>({seq}));
  RawIds r = compute_raw_ids_device(dev, make_config(policy), ctx);

  auto raw_h = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), r.raw);
  auto valid_h = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), r.valid);

  RawHost out;
  for (std::size_t i = 0; i < r.num_elements; ++i) {
    out.raw.push_back(raw_h(i));
    out.valid.push_back(valid_h(i));
  }
  return out;
}

} // namespace

TEST(PrefixSumTest, StrictRawIdsAndValidity) {
  IntervalIdContext ctx;
  auto r = raw_ids({E, A, S, B, E, C}, BoundaryPolicy::Strict, ctx);
  EXPECT_EQ(r.raw, (Ids{0, 1, 2, 2, 2, 3}));
  EXPECT_EQ(r.valid, (std::vector<int>{0, 0, 1, 1, 1, 0}));
}

TEST(PrefixSumTest, LastStartLastEndRawIdsInInputOrder) {
  IntervalIdContext ctx;
  auto r = raw_ids({S, S, A, E, E}, BoundaryPolicy::LastStartLastEnd, ctx);
  EXPECT_EQ(r.raw, (Ids{2, 1, 1, 1, 1}));
  EXPECT_EQ(r.valid, (std::vector<int>{0, 1, 1, 1, 1}));
}

TEST(PrefixSumTest, FirstStartLastEndTrimsTailAfterLastEnd) {
  IntervalIdContext ctx;
  auto r = raw_ids({A, E, S, B, E, C, E, D}, BoundaryPolicy::FirstStartLastEnd, ctx);
  EXPECT_EQ(r.raw, (Ids{0, 0, 1, 1, 1, 1, 1, 1}));
  EXPECT_EQ(r.valid, (std::vector<int>{0, 0, 1, 1, 1, 1, 1, 0}));
}

TEST(PrefixSumTest, StrictPolicy) {
  const auto p = BoundaryPolicy::Strict;
  EXPECT_EQ(run_vectorized({E, A, S, B, E, C}, p), (Ids{0, 0, 1, 1, 1, 0}));
  EXPECT_EQ(run_vectorized({S, S, A, E}, p), (Ids{0, 1, 1, 1}));
  EXPECT_EQ(run_vectorized({A, S, B, C}, p), (Ids{0, 0, 0, 0}));
  EXPECT_EQ(run_vectorized({S, A, E, S, B, E}, p), (Ids{1, 1, 1, 2, 2, 2}));
  EXPECT_EQ(run_vectorized({S, E, E, S, E}, p), (Ids{1, 1, 0, 2, 2}));
  EXPECT_EQ(run_vectorized({S, E, S}, p), (Ids{1, 1, 0}));
  EXPECT_EQ(run_vectorized({E, E}, p), (Ids{0, 0}));
}

TEST(PrefixSumTest, FirstStartFirstEnd) {
  const auto p = BoundaryPolicy::FirstStartFirstEnd;
  EXPECT_EQ(run_vectorized({S, S, A, E}, p), (Ids{1, 1, 1, 1}));
  EXPECT_EQ(run_vectorized({A, S, B, C}, p), (Ids{0, 0, 0, 0}));
  EXPECT_EQ(run_vectorized({S, A, S, E, E, B, S, E}, p),
            (Ids{1, 1, 1, 1, 0, 0, 2, 2}));
  EXPECT_EQ(run_vectorized({S, S, A}, p), (Ids{0, 0, 0}));
}

TEST(PrefixSumTest, LastStartLastEnd) {
  const auto p = BoundaryPolicy::LastStartLastEnd;
  EXPECT_EQ(run_vectorized({S, S, A, E, E}, p), (Ids{0, 1, 1, 1, 1}));
  EXPECT_EQ(run_vectorized({S, A, S, E, B, E, C, S}, p),
            (Ids{0, 0, 1, 1, 1, 1, 0, 0}));
  EXPECT_EQ(run_vectorized({S, E, S, E}, p), (Ids{1, 1, 2, 2}));
  EXPECT_EQ(run_vectorized({E, S, A}, p), (Ids{0, 0, 0}));
  EXPECT_EQ(run_vectorized({S, E, A, E, S, A, E}, p),
            (Ids{1, 1, 1, 1, 2, 2, 2}));
}

TEST(PrefixSumTest, FirstStartLastEnd) {
  const auto p = BoundaryPolicy::FirstStartLastEnd;
  EXPECT_EQ(run_vectorized({S, S, A, E, E}, p), (Ids{1, 1, 1, 1, 1}));
  EXPECT_EQ(run_vectorized({S, A, S, E, B, E, C, S}, p),
            (Ids{1, 1, 1, 1, 1, 1, 0, 0}));
  EXPECT_EQ(run_vectorized({A, E, S, B, E, C, E, D}, p),
            (Ids{0, 0, 1, 1, 1, 1, 1, 0}));
}

TEST(PrefixSumTest, StartOnlyGroupIsInvalidUnderRelaxedPolicies) {
  for (const auto policy : kAllPolicies) {
    EXPECT_EQ(run_vectorized({S, A, S, B}, policy), (Ids{0, 0, 0, 0}))
        << to_string(policy);
  }
}

TEST(PrefixSumTest, IdenticalMarkers) {
  for (const auto policy : kAllPolicies) {
    const auto config = make_identical_config(S, policy);
    EXPECT_EQ(run({S, A, S, A}, config), (Ids{1, 1, 2, 2})) << to_string(policy);
    EXPECT_EQ(run({A, S, A}, config), (Ids{0, 1, 1})) << to_string(policy);
    EXPECT_EQ(run({S, S, S}, config), (Ids{1, 2, 3})) << to_string(policy);
  }
}

TEST(PrefixSumTest, ManyGroupsOfMixedLength) {
  const auto config = make_config(BoundaryPolicy::Strict);
  auto ids = run_groups({{}, {S, E}, {A}, {}, {S, A, E, S, B, E}, {S}}, config);
  ASSERT_EQ(ids.size(), 6u);
  EXPECT_TRUE(ids[0].empty());
  EXPECT_EQ(ids[1], (Ids{1, 1}));
  EXPECT_EQ(ids[2], (Ids{0}));
  EXPECT_TRUE(ids[3].empty());
  EXPECT_EQ(ids[4], (Ids{1, 1, 1, 2, 2, 2}));
  EXPECT_EQ(ids[5], (Ids{0}));
}

TEST(PrefixSumTest, AllGroupsEmpty) {
  for (const auto policy : kAllPolicies) {
    auto ids = run_groups({{}, {}}, make_config(policy));
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_TRUE(ids[0].empty());
    EXPECT_TRUE(ids[1].empty());
  }
}
