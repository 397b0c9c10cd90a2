#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <Kokkos_Core.hpp>
#include <intervalix/sequence/csr_backend.hpp>

namespace intervalix {
namespace csr {
namespace detail {

/**
 * @brief Perform an exclusive scan for CSR row_ptr, returning the total.
 *
 * For each i in [0, n), writes row_ptr(i) = sum of counts(0..i-1).
 * Also writes row_ptr(n) = total.
 *
 * @tparam T The accumulator type (e.g., std::size_t)
 * @param label Kokkos kernel label
 * @param n Number of rows (row_ptr must have n+1 entries)
 * @param counts Input counts view
 * @param row_ptr Output row pointer view
 * @return The total sum of all counts
 */
template <typename T, class CountView, class IndexView>
T exclusive_scan_csr_row_ptr(
    const std::string& label,
    std::size_t n,
    const CountView& counts,
    IndexView& row_ptr) {
  if (n == 0) {
    Kokkos::deep_copy(Kokkos::subview(row_ptr, 0), T(0));
    return T(0);
  }

  Kokkos::View<T, DeviceMemorySpace> total_view(label + "_total");

  Kokkos::parallel_scan(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i, T& update, const bool final_pass) {
        const T c = static_cast<T>(counts(i));
        if (final_pass) {
          row_ptr(i) = update;
          if (i + 1 == n) {
            row_ptr(n) = update + c;
            total_view() = update + c;
          }
        }
        update += c;
      });

  ExecSpace().fence();

  T host_total = T(0);
  Kokkos::deep_copy(host_total, total_view);
  return host_total;
}

/**
 * @brief Prefix sum restarted at every group boundary.
 *
 * out(i) = sum of values(j) for group_ptr(g) <= j <= i, g = group_of(i).
 * Runs as one global inclusive scan followed by a per-element rebase on the
 * first element of the group, so the whole thing stays two flat kernels.
 *
 * @param n Number of elements
 * @param values Per-element addends
 * @param group_of Group index of every element
 * @param group_ptr Group offsets [num_groups + 1]
 * @param scratch Scratch view of at least n entries (clobbered)
 * @param out Output view of at least n entries (may alias nothing else)
 */
template <class ValueView, class GroupOfView, class IndexView,
          class ScratchView, class OutView>
void segmented_inclusive_sum(
    const std::string& label,
    std::size_t n,
    const ValueView& values,
    const GroupOfView& group_of,
    const IndexView& group_ptr,
    const ScratchView& scratch,
    const OutView& out) {
  if (n == 0) {
    return;
  }

  Kokkos::parallel_scan(
      label + "_scan",
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i, IntervalId& update,
                    const bool final_pass) {
        update += static_cast<IntervalId>(values(i));
        if (final_pass) {
          scratch(i) = update;
        }
      });

  Kokkos::parallel_for(
      label + "_rebase",
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::size_t first = group_ptr(group_of(i));
        const IntervalId base =
            scratch(first) - static_cast<IntervalId>(values(first));
        out(i) = scratch(i) - base;
      });

  ExecSpace().fence();
}

/**
 * @brief Last position/value pair seen by a forward-fill scan.
 *
 * pos < 0 means nothing was seen yet.
 */
struct LastSeen {
  std::int64_t pos = -1;
  std::int64_t value = 0;
};

/**
 * @brief Scan functor implementing a forward fill.
 *
 * The join keeps the entry with the greatest position, which makes the
 * operator commutative as well as associative.
 */
template <class PresentView, class ValueView, class OutView>
struct ForwardFillFunctor {
  using value_type = LastSeen;

  PresentView present;
  ValueView values;
  OutView out;

  KOKKOS_INLINE_FUNCTION
  void init(value_type& v) const {
    v.pos = -1;
    v.value = 0;
  }

  KOKKOS_INLINE_FUNCTION
  void join(value_type& dst, const value_type& src) const {
    if (src.pos > dst.pos) {
      dst = src;
    }
  }

  KOKKOS_INLINE_FUNCTION
  void operator()(const std::size_t i, value_type& update,
                  const bool final_pass) const {
    if (present(i)) {
      update.pos = static_cast<std::int64_t>(i);
      update.value = static_cast<std::int64_t>(values(i));
    }
    if (final_pass) {
      out(i) = update;
    }
  }
};

/**
 * @brief Forward fill restarted at every group boundary.
 *
 * out(i) holds the last (position, value) with present(j) != 0 for
 * group_ptr(g) <= j <= i, or pos == -1 if the group has none up to i.
 */
template <class PresentView, class ValueView, class GroupOfView,
          class IndexView, class OutView>
void segmented_forward_fill(
    const std::string& label,
    std::size_t n,
    const PresentView& present,
    const ValueView& values,
    const GroupOfView& group_of,
    const IndexView& group_ptr,
    const OutView& out) {
  if (n == 0) {
    return;
  }

  ForwardFillFunctor<PresentView, ValueView, OutView> functor{
      present, values, out};
  Kokkos::parallel_scan(
      label + "_scan", Kokkos::RangePolicy<ExecSpace>(0, n), functor);

  Kokkos::parallel_for(
      label + "_clip",
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::int64_t first =
            static_cast<std::int64_t>(group_ptr(group_of(i)));
        if (out(i).pos < first) {
          out(i) = LastSeen{};
        }
      });

  ExecSpace().fence();
}

} // namespace detail
} // namespace csr
} // namespace intervalix
