#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>

#include <intervalix/csr_ops/classify.hpp>
#include <intervalix/sequence/marker.hpp>

#include "intervalix_test_utils.hpp"

using namespace intervalix::csr;
using namespace intervalix::csr_test;

TEST(MarkerClassifierTest, StartEndOther) {
  const auto config = make_config(BoundaryPolicy::Strict);
  EXPECT_EQ(classify(make_marker(S), config), MarkerKind::Start);
  EXPECT_EQ(classify(make_marker(E), config), MarkerKind::End);
  EXPECT_EQ(classify(make_marker(A), config), MarkerKind::Other);
  EXPECT_EQ(classify(null_marker<int>(), config), MarkerKind::Other);
}

TEST(MarkerClassifierTest, NullSafeEquality) {
  EXPECT_TRUE(null_safe_equal(null_marker<int>(), null_marker<int>()));
  EXPECT_FALSE(null_safe_equal(null_marker<int>(), make_marker(0)));
  EXPECT_FALSE(null_safe_equal(make_marker(0), null_marker<int>()));
  EXPECT_TRUE(null_safe_equal(make_marker(7), make_marker(7)));
  EXPECT_FALSE(null_safe_equal(make_marker(7), make_marker(8)));
}

TEST(MarkerClassifierTest, NullAsConfiguredMarker) {
  MarkerConfig<int> config;
  config.marker_start = null_marker<int>();
  config.marker_end = make_marker(0);

  EXPECT_EQ(classify(null_marker<int>(), config), MarkerKind::Start);
  // the null payload is 0, which must not make it an end marker
  EXPECT_EQ(classify(make_marker(0), config), MarkerKind::End);
  EXPECT_EQ(classify(make_marker(5), config), MarkerKind::Other);
}

TEST(MarkerClassifierTest, IdenticalMarkersNeverClassifyAsEnd) {
  auto omitted = make_identical_config(S, BoundaryPolicy::Strict);
  EXPECT_TRUE(omitted.identical_markers());
  EXPECT_EQ(classify(make_marker(S), omitted), MarkerKind::Start);

  auto same = make_config(BoundaryPolicy::Strict);
  same.marker_end = make_marker(S);
  EXPECT_TRUE(same.identical_markers());
  EXPECT_EQ(classify(make_marker(S), same), MarkerKind::Start);
  EXPECT_EQ(classify(make_marker(E), same), MarkerKind::Other);
}

TEST(MarkerClassifierTest, MissingStartMarkerThrows) {
  MarkerConfig<int> config;
  config.marker_end = make_marker(E);
  EXPECT_THROW(config.validate(), ConfigurationError);
  EXPECT_THROW(classify(make_marker(E), config), ConfigurationError);
}

TEST(MarkerClassifierTest, PolicyNamesRoundTrip) {
  for (const auto policy : kAllPolicies) {
    EXPECT_EQ(parse_boundary_policy(to_string(policy)), policy);
  }
  EXPECT_THROW(parse_boundary_policy("widest"), ConfigurationError);
}

TEST(MarkerClassifierTest, DeviceClassificationMatchesHost) {
  auto host = make_grouped_sequence_host<int>({
      {make_marker(E), make_marker(A), make_marker(S)},
      {},
      {null_marker<int>(), make_marker(S), make_marker(E)}});
  auto dev = to<DeviceMemorySpace>(host);
  const auto config = make_config(BoundaryPolicy::Strict);

  auto kinds = classify_markers_device(dev, config);
  auto kinds_host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), kinds);

  ASSERT_EQ(kinds_host.extent(0), host.num_elements);
  for (std::size_t i = 0; i < host.num_elements; ++i) {
    EXPECT_EQ(kinds_host(i), classify(host.values(i), config))
        << "kind mismatch at index " << i;
  }
}
