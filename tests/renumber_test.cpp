#include <cstdint>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>

#include <intervalix/csr_ops/renumber.hpp>

#include "intervalix_test_utils.hpp"

using namespace intervalix::csr;
using namespace intervalix::csr_test;

namespace {

IdSequenceDevice make_raw(const std::vector<std::size_t>& group_ptr,
                          const Ids& raw) {
  IdSequenceHost h;
  h.num_groups = group_ptr.size() - 1;
  h.num_elements = raw.size();
  h.group_ptr = IdSequenceHost::IndexView("test_group_ptr", group_ptr.size());
  h.ids = IdSequenceHost::IdView("test_raw", raw.size());
  for (std::size_t g = 0; g < group_ptr.size(); ++g) {
    h.group_ptr(g) = group_ptr[g];
  }
  for (std::size_t i = 0; i < raw.size(); ++i) {
    h.ids(i) = raw[i];
  }
  return to<DeviceMemorySpace>(h);
}

Kokkos::View<std::uint8_t*, DeviceMemorySpace>
make_valid(const std::vector<int>& flags) {
  Kokkos::View<std::uint8_t*, DeviceMemorySpace> d("test_valid", flags.size());
  auto h = Kokkos::create_mirror_view(d);
  for (std::size_t i = 0; i < flags.size(); ++i) {
    h(i) = static_cast<std::uint8_t>(flags[i]);
  }
  Kokkos::deep_copy(d, h);
  return d;
}

std::vector<Ids> to_groups(const IdSequenceDevice& ids) {
  return ids_per_group(to<HostMemorySpace>(ids));
}

} // namespace

TEST(RenumberTest, DenseIdsSkipInvalidElements) {
  IntervalIdContext ctx;
  auto raw = make_raw({0, 7}, {5, 5, 0, 9, 9, 9, 3});
  auto out = renumber_ids_device(raw, make_valid({1, 1, 0, 1, 1, 1, 1}), ctx);
  EXPECT_EQ(to_groups(out).front(), (Ids{1, 1, 0, 2, 2, 2, 3}));
}

TEST(RenumberTest, SameRawIdAcrossInvalidGapStaysOneInterval) {
  IntervalIdContext ctx;
  auto raw = make_raw({0, 3}, {4, 4, 4});
  auto out = renumber_ids_device(raw, make_valid({1, 0, 1}), ctx);
  EXPECT_EQ(to_groups(out).front(), (Ids{1, 0, 1}));
}

TEST(RenumberTest, RestartsInEveryGroup) {
  IntervalIdContext ctx;
  auto raw = make_raw({0, 2, 4}, {7, 7, 7, 8});
  auto out = renumber_ids_device(raw, make_valid({1, 1, 1, 1}), ctx);
  auto groups = to_groups(out);
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0], (Ids{1, 1}));
  EXPECT_EQ(groups[1], (Ids{1, 2}));
}

TEST(RenumberTest, AllInvalid) {
  IntervalIdContext ctx;
  auto raw = make_raw({0, 3}, {1, 2, 3});
  auto out = renumber_ids_device(raw, make_valid({0, 0, 0}), ctx);
  EXPECT_EQ(to_groups(out).front(), (Ids{0, 0, 0}));
}

TEST(RenumberTest, ZeroMeansInvalidOverload) {
  IntervalIdContext ctx;
  auto raw = make_raw({0, 6, 6, 9}, {3, 3, 0, 8, 0, 12, 0, 2, 2});
  auto groups = to_groups(renumber_ids_device(raw, ctx));
  ASSERT_EQ(groups.size(), 3u);
  EXPECT_EQ(groups[0], (Ids{1, 1, 0, 2, 0, 3}));
  EXPECT_TRUE(groups[1].empty());
  EXPECT_EQ(groups[2], (Ids{0, 1, 1}));
}

TEST(RenumberTest, Idempotent) {
  IntervalIdContext ctx;
  auto raw = make_raw({0, 5, 9}, {2, 2, 0, 6, 6, 0, 1, 1, 4});
  auto once = renumber_ids_device(raw, ctx);
  auto twice = renumber_ids_device(once, ctx);
  EXPECT_EQ(to_groups(once), to_groups(twice));
  EXPECT_EQ(to_groups(once)[0], (Ids{1, 1, 0, 2, 2}));
  EXPECT_EQ(to_groups(once)[1], (Ids{0, 1, 1, 2}));
}

TEST(RenumberTest, ShortValidityFlagsThrow) {
  IntervalIdContext ctx;
  auto raw = make_raw({0, 3}, {1, 1, 1});
  EXPECT_THROW(renumber_ids_device(raw, make_valid({1, 1}), ctx),
               std::runtime_error);
}
