#pragma once

#include <cstddef>
#include <utility>

#include <Kokkos_Core.hpp>
#include <intervalix/detail/scan_utils.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>

namespace intervalix {
namespace csr {

/**
 * @brief One labeled interval: element range [begin, end) inside its group.
 */
struct IntervalSpan {
  std::size_t begin = 0;  // Inclusive, relative to the group start
  std::size_t end = 0;    // Exclusive
  IntervalId id = 0;
};

/**
 * @brief Valid intervals of every group in CSR layout.
 *
 * Spans of group g are spans[span_ptr(g), span_ptr(g + 1)), ordered by id.
 */
template <class MemorySpace>
struct IntervalSpans {
  using IndexView = Kokkos::View<std::size_t*, MemorySpace>;
  using SpanView = Kokkos::View<IntervalSpan*, MemorySpace>;

  IndexView span_ptr;  ///< [num_groups + 1]
  SpanView spans;      ///< [num_spans]
  std::size_t num_groups = 0;
  std::size_t num_spans = 0;
};

using IntervalSpansDevice = IntervalSpans<DeviceMemorySpace>;
using IntervalSpansHost = IntervalSpans<HostMemorySpace>;

template <class ToSpace, class FromSpace>
inline IntervalSpans<ToSpace> to(const IntervalSpans<FromSpace>& src) {
  IntervalSpans<ToSpace> dst;
  if (src.num_groups == 0) {
    return dst;
  }
  dst.num_groups = src.num_groups;
  dst.num_spans = src.num_spans;
  dst.span_ptr = Kokkos::create_mirror_view_and_copy(
      ToSpace{}, Kokkos::subview(src.span_ptr,
                                 std::make_pair(std::size_t(0), src.num_groups + 1)));
  dst.spans = Kokkos::create_mirror_view_and_copy(
      ToSpace{}, Kokkos::subview(src.spans,
                                 std::make_pair(std::size_t(0), src.num_spans)));
  return dst;
}

/**
 * @brief Collapse dense ids into one span per valid interval.
 *
 * Two passes per group like any CSR producer: count (the largest id of the
 * group, since ids are dense), exclusive scan into span_ptr, then fill.
 */
inline IntervalSpansDevice extract_interval_spans(const IdSequenceDevice& ids) {
  IntervalSpansDevice result;
  if (ids.num_groups == 0) {
    return result;
  }

  const std::size_t num_groups = ids.num_groups;
  result.num_groups = num_groups;

  auto group_ptr = ids.group_ptr;
  auto labels = ids.ids;

  Kokkos::View<std::size_t*, DeviceMemorySpace> counts(
      "intervalix_spans_counts", num_groups);

  Kokkos::parallel_for(
      "intervalix_spans_count",
      Kokkos::RangePolicy<ExecSpace>(0, num_groups),
      KOKKOS_LAMBDA(const std::size_t g) {
        IntervalId k = 0;
        for (std::size_t i = group_ptr(g); i < group_ptr(g + 1); ++i) {
          if (labels(i) > k) {
            k = labels(i);
          }
        }
        counts(g) = static_cast<std::size_t>(k);
      });

  IntervalSpansDevice::IndexView span_ptr("intervalix_spans_ptr", num_groups + 1);
  const std::size_t num_spans = detail::exclusive_scan_csr_row_ptr<std::size_t>(
      "intervalix_spans_scan", num_groups, counts, span_ptr);

  result.span_ptr = span_ptr;
  result.num_spans = num_spans;
  result.spans = IntervalSpansDevice::SpanView("intervalix_spans", num_spans);

  if (num_spans == 0) {
    return result;
  }

  auto spans = result.spans;
  Kokkos::parallel_for(
      "intervalix_spans_fill",
      Kokkos::RangePolicy<ExecSpace>(0, num_groups),
      KOKKOS_LAMBDA(const std::size_t g) {
        const std::size_t first = group_ptr(g);
        const std::size_t last = group_ptr(g + 1);
        for (std::size_t i = first; i < last; ++i) {
          const IntervalId id = labels(i);
          if (id == 0) {
            continue;
          }
          IntervalSpan& span = spans(span_ptr(g) + static_cast<std::size_t>(id - 1));
          if (i == first || labels(i - 1) != id) {
            span.begin = i - first;
            span.id = id;
          }
          span.end = i - first + 1;
        }
      });

  ExecSpace().fence();
  return result;
}

} // namespace csr
} // namespace intervalix
