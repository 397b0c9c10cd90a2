#pragma once

#include <cstddef>
#include <vector>

#include <Kokkos_Core.hpp>
#include <Kokkos_Profiling_ScopedRegion.hpp>

#include <intervalix/csr_ops/prefix_sum.hpp>
#include <intervalix/csr_ops/sequential_scan.hpp>
#include <intervalix/csr_ops/workspace.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>
#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {

/**
 * @brief Assign interval ids to every group of a device sequence.
 *
 * Groups are labeled independently: ids restart at 1 in every group, 0
 * marks elements outside a valid interval. config.algorithm picks the
 * vectorized pipeline (default) or the per-group sequential scan; both give
 * identical results.
 *
 * @throws ConfigurationError before any kernel runs if the configuration is
 *         incomplete. Unmatched or duplicate markers never throw.
 */
template <typename T>
IdSequenceDevice assign_ids(const GroupedSequenceDevice<T>& seq,
                            const MarkerConfig<T>& config,
                            IntervalIdContext& ctx) {
  Kokkos::Profiling::ScopedRegion region("intervalix::assign_ids");
  config.validate();

  if (config.algorithm == Algorithm::Sequential) {
    return assign_ids_sequential(seq, config);
  }
  return assign_ids_prefix_sum(seq, config, ctx);
}

template <typename T>
IdSequenceDevice assign_ids(const GroupedSequenceDevice<T>& seq,
                            const MarkerConfig<T>& config) {
  IntervalIdContext ctx;
  return assign_ids(seq, config, ctx);
}

/**
 * @brief Host convenience: one vector of markers per group in, one vector
 *        of ids per group out.
 */
template <typename T>
std::vector<std::vector<IntervalId>>
assign_ids_host(const std::vector<std::vector<MarkerValue<T>>>& groups,
                const MarkerConfig<T>& config) {
  config.validate();
  auto host_seq = make_grouped_sequence_host(groups);
  if (host_seq.num_groups == 0) {
    return {};
  }
  auto dev_seq = to<DeviceMemorySpace>(host_seq);
  auto ids = assign_ids(dev_seq, config);
  return ids_per_group(to<HostMemorySpace>(ids));
}

/**
 * @brief Host convenience for a single group without nulls.
 */
template <typename T>
std::vector<IntervalId> assign_ids_host(const std::vector<T>& sequence,
                                        const MarkerConfig<T>& config) {
  std::vector<std::vector<MarkerValue<T>>> groups(1);
  groups[0].reserve(sequence.size());
  for (const auto& v : sequence) {
    groups[0].push_back(make_marker(v));
  }
  return assign_ids_host(groups, config).front();
}

} // namespace csr
} // namespace intervalix
