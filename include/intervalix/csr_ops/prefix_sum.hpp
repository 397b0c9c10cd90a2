#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <Kokkos_Core.hpp>
#include <intervalix/csr_ops/boundary_policies.hpp>
#include <intervalix/csr_ops/classify.hpp>
#include <intervalix/csr_ops/renumber.hpp>
#include <intervalix/csr_ops/workspace.hpp>
#include <intervalix/detail/csr_utils.hpp>
#include <intervalix/detail/memory_utils.hpp>
#include <intervalix/detail/scan_utils.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>
#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {

/**
 * @brief Intermediate result of the vectorized pipeline, before renumbering.
 *
 * Views alias the IntervalIdContext workspace and stay valid until the next
 * call using the same context.
 */
struct RawIds {
  Kokkos::View<IntervalId*, DeviceMemorySpace> raw;      ///< per-group prefix sums
  Kokkos::View<std::uint8_t*, DeviceMemorySpace> valid;  ///< 1 inside a valid interval
  Kokkos::View<std::size_t*, DeviceMemorySpace> group_of;
  std::size_t num_elements = 0;
};

namespace detail {

// Raw ids never exceed twice the group length, so raw + 2 * first + g gives
// every (group, raw id) pair its own slot in [0, 2 * n + num_groups).
KOKKOS_INLINE_FUNCTION
std::size_t raw_slot(IntervalId raw, std::size_t first, std::size_t g) {
  return static_cast<std::size_t>(raw) + 2 * first + g;
}

/**
 * @brief Grouped aggregate over raw ids: start count, end count and, when
 *        last_end is non-empty, one past the position of the last end.
 */
template <class RawView, class KindView, class GroupOfView, class IndexView,
          class TableView>
void aggregate_raw_groups(const std::string& label,
                          std::size_t n,
                          const RawView& raw,
                          const KindView& kinds,
                          const GroupOfView& group_of,
                          const IndexView& group_ptr,
                          const TableView& starts,
                          const TableView& ends,
                          const TableView& last_end,
                          bool track_last_end) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::size_t g = group_of(i);
        const std::size_t slot = raw_slot(raw(i), group_ptr(g), g);
        if (is_kind(kinds(i), MarkerKind::Start)) {
          Kokkos::atomic_add(&starts(slot), IntervalId(1));
        } else if (is_kind(kinds(i), MarkerKind::End)) {
          Kokkos::atomic_add(&ends(slot), IntervalId(1));
          if (track_last_end) {
            Kokkos::atomic_max(&last_end(slot), static_cast<IntervalId>(i + 1));
          }
        }
      });
  ExecSpace().fence();
}

/**
 * @brief Validity mask from the grouped aggregates.
 *
 *  - Strict: exactly two markers (one start, one end) in the raw group.
 *  - Relaxed policies: at least one start and one end; FirstStartLastEnd
 *    additionally drops elements after the last end of the raw group.
 *  - Identical markers: everything from the first marker on.
 */
template <class RawView, class GroupOfView, class IndexView, class TableView,
          class FlagView>
void validate_raw_groups(const std::string& label,
                         std::size_t n,
                         BoundaryPolicy policy,
                         bool identical,
                         const RawView& raw,
                         const GroupOfView& group_of,
                         const IndexView& group_ptr,
                         const TableView& starts,
                         const TableView& ends,
                         const TableView& last_end,
                         const FlagView& valid) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        if (identical) {
          valid(i) = raw(i) > 0 ? 1 : 0;
          return;
        }
        const std::size_t g = group_of(i);
        const std::size_t slot = raw_slot(raw(i), group_ptr(g), g);
        const IntervalId s = starts(slot);
        const IntervalId e = ends(slot);
        bool ok = false;
        if (policy == BoundaryPolicy::Strict) {
          ok = (s + e == 2);
        } else {
          ok = (s >= 1 && e >= 1);
          if (ok && policy == BoundaryPolicy::FirstStartLastEnd) {
            ok = static_cast<IntervalId>(i) < last_end(slot);
          }
        }
        valid(i) = ok ? 1 : 0;
      });
  ExecSpace().fence();
}

} // namespace detail

/**
 * @brief Raw interval ids and validity flags for every element.
 *
 * Pipeline (per group, expressed as flat kernels over all elements):
 *  1. classify markers (mirrored and role-swapped for LastStartLastEnd),
 *  2. boundary indicator of the selected policy,
 *  3. per-group prefix sum of the indicator -> raw ids,
 *  4. start/end counts per raw id -> validity mask.
 *
 * Workspace use: index 0, flags 0-2, ids 0-3, fill 0.
 *
 * @throws ConfigurationError if marker_start is missing.
 */
template <typename T>
RawIds compute_raw_ids_device(const GroupedSequenceDevice<T>& seq,
                              const MarkerConfig<T>& config,
                              IntervalIdContext& ctx) {
  const MarkerClassifier<T> classifier = make_classifier(config);
  const BoundaryPolicy policy = config.policy;
  const bool identical = classifier.identical;
  const bool mirrored = !identical && policy == BoundaryPolicy::LastStartLastEnd;

  RawIds result;
  const std::size_t n = seq.num_elements;
  result.num_elements = n;
  if (seq.num_groups == 0 || n == 0) {
    return result;
  }

  auto& ws = ctx.workspace;
  auto group_ptr = seq.group_ptr;

  auto group_of = ws.get_index_buf(0, n);
  detail::build_group_index("intervalix_group_index", group_ptr,
                            seq.num_groups, n, group_of);

  auto kinds = ws.get_flag_buf(0, n);
  if (mirrored) {
    detail::classify_mirrored("intervalix_classify_mirrored", n, seq.values,
                              classifier, group_of, group_ptr, kinds);
  } else {
    detail::classify_into("intervalix_classify", n, seq.values, classifier,
                          kinds);
  }

  auto boundary = ws.get_flag_buf(1, n);
  if (identical) {
    detail::identical_boundaries("intervalix_boundary_identical", n, kinds,
                                 boundary);
  } else if (policy == BoundaryPolicy::Strict) {
    detail::strict_boundaries("intervalix_boundary_strict", n, kinds,
                              group_of, group_ptr, boundary);
  } else {
    auto last_marker = ws.get_fill_buf(0, n);
    detail::fill_last_marker("intervalix_last_marker", n, kinds, group_of,
                             group_ptr, last_marker);
    if (policy == BoundaryPolicy::FirstStartLastEnd) {
      detail::first_last_boundaries("intervalix_boundary_first_last", n,
                                    kinds, group_of, group_ptr, last_marker,
                                    boundary);
    } else {
      // FirstStartFirstEnd, or LastStartLastEnd in mirrored order
      detail::first_first_boundaries("intervalix_boundary_first_first", n,
                                     group_of, group_ptr, last_marker,
                                     boundary);
    }
  }

  auto raw = ws.get_id_buf(0, n);
  auto scratch = ws.get_id_buf(1, n);
  detail::segmented_inclusive_sum("intervalix_raw_ids", n, boundary, group_of,
                                  group_ptr, scratch, raw);

  const std::size_t num_slots = 2 * n + seq.num_groups;
  auto starts = ws.get_id_buf(2, num_slots);
  auto ends = ws.get_id_buf(3, num_slots);
  auto last_end = ws.get_id_buf(1, num_slots);
  const bool track_last_end = policy == BoundaryPolicy::FirstStartLastEnd;
  if (!identical) {
    detail::zero_prefix(starts, num_slots);
    detail::zero_prefix(ends, num_slots);
    if (track_last_end) {
      detail::zero_prefix(last_end, num_slots);
    }
    detail::aggregate_raw_groups("intervalix_raw_aggregate", n, raw, kinds,
                                 group_of, group_ptr, starts, ends, last_end,
                                 track_last_end);
  }

  auto valid = ws.get_flag_buf(2, n);
  detail::validate_raw_groups("intervalix_raw_validate", n, policy, identical,
                              raw, group_of, group_ptr, starts, ends,
                              last_end, valid);

  result.group_of = group_of;
  if (mirrored) {
    auto raw_fwd = ws.get_id_buf(1, n);
    auto valid_fwd = ws.get_flag_buf(1, n);
    detail::unmirror("intervalix_unmirror", n, group_of, group_ptr, raw, valid,
                     raw_fwd, valid_fwd);
    result.raw = raw_fwd;
    result.valid = valid_fwd;
  } else {
    result.raw = raw;
    result.valid = valid;
  }
  return result;
}

/**
 * @brief Vectorized interval ids: raw ids, validity, renumbering.
 *
 * @throws ConfigurationError if marker_start is missing.
 */
template <typename T>
IdSequenceDevice assign_ids_prefix_sum(const GroupedSequenceDevice<T>& seq,
                                       const MarkerConfig<T>& config,
                                       IntervalIdContext& ctx) {
  RawIds raw = compute_raw_ids_device(seq, config, ctx);
  IdSequenceDevice out = allocate_ids_like(seq, "intervalix_prefix_sum_ids");
  if (raw.num_elements == 0 || seq.num_groups == 0) {
    return out;
  }
  detail::renumber_into("intervalix_renumber", raw.num_elements, raw.raw,
                        raw.valid, raw.group_of, seq.group_ptr, ctx.workspace,
                        out.ids);
  return out;
}

} // namespace csr
} // namespace intervalix
