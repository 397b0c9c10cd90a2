#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>

#include <intervalix/intervalix.hpp>

#include "intervalix_test_utils.hpp"

using namespace intervalix::csr;
using namespace intervalix::csr_test;

TEST(AssignIdsApiTest, MissingStartMarkerThrowsBeforeAnyKernel) {
  MarkerConfig<int> config;
  config.marker_end = make_marker(E);
  auto dev = to<DeviceMemorySpace>(make_grouped_sequence_host_from_values<int>({{S, E}}));

  EXPECT_THROW(assign_ids(dev, config), ConfigurationError);
  config.algorithm = Algorithm::Sequential;
  EXPECT_THROW(assign_ids(dev, config), ConfigurationError);
  EXPECT_THROW(assign_ids_host(std::vector<int>{S, E}, config), ConfigurationError);
}

TEST(AssignIdsApiTest, ConfigurationErrorIsARuntimeError) {
  MarkerConfig<int> config;
  try {
    config.validate();
    FAIL() << "expected ConfigurationError";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("marker_start"), std::string::npos);
  }
}

TEST(AssignIdsApiTest, SingleGroupHostHelper) {
  const auto ids = assign_ids_host(std::vector<int>{E, A, S, B, E, C},
                                   make_config(BoundaryPolicy::Strict));
  EXPECT_EQ(ids, (Ids{0, 0, 1, 1, 1, 0}));
}

TEST(AssignIdsApiTest, EmptyInputs) {
  const auto config = make_config(BoundaryPolicy::Strict);
  EXPECT_TRUE(assign_ids_host(std::vector<std::vector<MarkerValue<int>>>{}, config).empty());
  EXPECT_TRUE(assign_ids_host(std::vector<int>{}, config).empty());

  GroupedSequenceDevice<int> none;
  auto ids = assign_ids(none, config);
  EXPECT_EQ(ids.num_groups, 0u);
  EXPECT_EQ(ids.num_elements, 0u);
}

TEST(AssignIdsApiTest, ResultSharesGroupLayout) {
  auto dev = to<DeviceMemorySpace>(make_grouped_sequence_host_from_values<int>(
      {{S, E}, {A, S, B, E}}));
  for (const auto algorithm : {Algorithm::Sequential, Algorithm::Vectorized}) {
    auto ids = assign_ids(dev, make_config(BoundaryPolicy::Strict, algorithm));
    EXPECT_EQ(ids.num_groups, dev.num_groups);
    EXPECT_EQ(ids.num_elements, dev.num_elements);
    EXPECT_EQ(ids.group_ptr.data(), dev.group_ptr.data());
  }
}

TEST(AssignIdsApiTest, ConcatenatedGroupsNumberOnward) {
  const auto config = make_config(BoundaryPolicy::Strict);
  auto split = run_groups({{S, E}, {S, E}}, config);
  EXPECT_EQ(split[0], (Ids{1, 1}));
  EXPECT_EQ(split[1], (Ids{1, 1}));
  EXPECT_EQ(run({S, E, S, E}, config), (Ids{1, 1, 2, 2}));
}

TEST(AssignIdsApiTest, NullMarkersOnBothAlgorithms) {
  MarkerConfig<int> config;
  config.marker_start = null_marker<int>();
  config.marker_end = make_marker(5);

  const std::vector<std::vector<MarkerValue<int>>> groups = {
      {make_marker(A), null_marker<int>(), make_marker(B), make_marker(5),
       null_marker<int>()}};
  for (const auto algorithm : {Algorithm::Sequential, Algorithm::Vectorized}) {
    config.algorithm = algorithm;
    EXPECT_EQ(assign_ids_host(groups, config).front(), (Ids{0, 1, 1, 1, 0}));
  }
}

TEST(AssignIdsApiTest, ExtractIntervalSpans) {
  auto dev = to<DeviceMemorySpace>(make_grouped_sequence_host_from_values<int>(
      {{S, A, E, B, S, E}, {}, {A}, {E, S, E}}));
  auto ids = assign_ids(dev, make_config(BoundaryPolicy::Strict));
  auto spans = to<HostMemorySpace>(extract_interval_spans(ids));

  ASSERT_EQ(spans.num_groups, 4u);
  ASSERT_EQ(spans.num_spans, 3u);
  EXPECT_EQ(spans.span_ptr(0), 0u);
  EXPECT_EQ(spans.span_ptr(1), 2u);
  EXPECT_EQ(spans.span_ptr(2), 2u);
  EXPECT_EQ(spans.span_ptr(3), 2u);
  EXPECT_EQ(spans.span_ptr(4), 3u);

  EXPECT_EQ(spans.spans(0).begin, 0u);
  EXPECT_EQ(spans.spans(0).end, 3u);
  EXPECT_EQ(spans.spans(0).id, 1);
  EXPECT_EQ(spans.spans(1).begin, 4u);
  EXPECT_EQ(spans.spans(1).end, 6u);
  EXPECT_EQ(spans.spans(1).id, 2);
  EXPECT_EQ(spans.spans(2).begin, 1u);
  EXPECT_EQ(spans.spans(2).end, 3u);
  EXPECT_EQ(spans.spans(2).id, 1);
}

TEST(AssignIdsApiTest, ExtractIntervalSpansWithoutIntervals) {
  auto dev = to<DeviceMemorySpace>(make_grouped_sequence_host_from_values<int>(
      {{A, B}, {S}}));
  auto spans = to<HostMemorySpace>(extract_interval_spans(
      assign_ids(dev, make_config(BoundaryPolicy::FirstStartLastEnd))));
  EXPECT_EQ(spans.num_groups, 2u);
  EXPECT_EQ(spans.num_spans, 0u);
  EXPECT_EQ(spans.span_ptr(2), 0u);
}
