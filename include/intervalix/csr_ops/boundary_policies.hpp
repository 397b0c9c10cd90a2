#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <Kokkos_Core.hpp>
#include <intervalix/detail/csr_utils.hpp>
#include <intervalix/detail/scan_utils.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {
namespace detail {

KOKKOS_INLINE_FUNCTION
bool is_kind(std::uint8_t k, MarkerKind kind) {
  return k == static_cast<std::uint8_t>(kind);
}

// Kind of the last marker strictly before i in its group (Other if none).
template <class FillView>
KOKKOS_INLINE_FUNCTION
std::uint8_t previous_marker(const FillView& last_marker,
                             std::size_t i,
                             std::size_t first) {
  if (i == first) {
    return static_cast<std::uint8_t>(MarkerKind::Other);
  }
  const LastSeen prev = last_marker(i - 1);
  if (prev.pos < 0) {
    return static_cast<std::uint8_t>(MarkerKind::Other);
  }
  return static_cast<std::uint8_t>(prev.value);
}

// ---------------------------------------------------------------------------
// Strict: a boundary at every start and right after every end.
// ---------------------------------------------------------------------------

template <class KindView, class GroupOfView, class IndexView, class FlagView>
void strict_boundaries(const std::string& label,
                       std::size_t n,
                       const KindView& kinds,
                       const GroupOfView& group_of,
                       const IndexView& group_ptr,
                       const FlagView& boundary) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::size_t first = group_ptr(group_of(i));
        std::uint8_t b = is_kind(kinds(i), MarkerKind::Start) ? 1 : 0;
        if (i > first && is_kind(kinds(i - 1), MarkerKind::End)) {
          ++b;
        }
        boundary(i) = b;
      });
  ExecSpace().fence();
}

// ---------------------------------------------------------------------------
// Identical markers: every marker is a boundary, nothing else.
// ---------------------------------------------------------------------------

template <class KindView, class FlagView>
void identical_boundaries(const std::string& label,
                          std::size_t n,
                          const KindView& kinds,
                          const FlagView& boundary) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        boundary(i) = is_kind(kinds(i), MarkerKind::Start) ? 1 : 0;
      });
  ExecSpace().fence();
}

/**
 * @brief Forward fill of the last marker kind seen in each group.
 */
template <class KindView, class GroupOfView, class IndexView, class FillView>
void fill_last_marker(const std::string& label,
                      std::size_t n,
                      const KindView& kinds,
                      const GroupOfView& group_of,
                      const IndexView& group_ptr,
                      const FillView& last_marker) {
  segmented_forward_fill(label, n, kinds, kinds, group_of, group_ptr,
                         last_marker);
}

// ---------------------------------------------------------------------------
// First start / first end: every element not preceded by an open start is a
// boundary, so once the first end closes an interval each trailing element
// sits in a group of its own.
// ---------------------------------------------------------------------------

template <class GroupOfView, class IndexView, class FillView, class FlagView>
void first_first_boundaries(const std::string& label,
                            std::size_t n,
                            const GroupOfView& group_of,
                            const IndexView& group_ptr,
                            const FillView& last_marker,
                            const FlagView& boundary) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::size_t first = group_ptr(group_of(i));
        const std::uint8_t prev = previous_marker(last_marker, i, first);
        boundary(i) = is_kind(prev, MarkerKind::Start) ? 0 : 1;
      });
  ExecSpace().fence();
}

// ---------------------------------------------------------------------------
// First start / last end: a boundary only at the first start of each run of
// starts. The raw group then runs until the next such start; its tail after
// the last end is trimmed by the validity test.
// ---------------------------------------------------------------------------

template <class KindView, class GroupOfView, class IndexView, class FillView,
          class FlagView>
void first_last_boundaries(const std::string& label,
                           std::size_t n,
                           const KindView& kinds,
                           const GroupOfView& group_of,
                           const IndexView& group_ptr,
                           const FillView& last_marker,
                           const FlagView& boundary) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::size_t first = group_ptr(group_of(i));
        const std::uint8_t prev = previous_marker(last_marker, i, first);
        boundary(i) = (is_kind(kinds(i), MarkerKind::Start) &&
                       !is_kind(prev, MarkerKind::Start))
                          ? 1
                          : 0;
      });
  ExecSpace().fence();
}

// ---------------------------------------------------------------------------
// Last start / last end: first start / first end on the reversed group with
// start and end swapped. These two kernels move data into and out of that
// mirrored order.
// ---------------------------------------------------------------------------

/**
 * @brief kinds(mirror(i)) = swap_roles(classify(values(i))).
 */
template <typename T, class ValueView, class GroupOfView, class IndexView,
          class KindView>
void classify_mirrored(const std::string& label,
                       std::size_t n,
                       const ValueView& values,
                       const MarkerClassifier<T>& classify,
                       const GroupOfView& group_of,
                       const IndexView& group_ptr,
                       const KindView& kinds) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::size_t g = group_of(i);
        const std::size_t m = mirror_in_group(i, group_ptr(g), group_ptr(g + 1));
        kinds(m) = static_cast<std::uint8_t>(swap_roles(classify(values(i))));
      });
  ExecSpace().fence();
}

/**
 * @brief Undo the per-group reversal: dst(i) = src(mirror(i)).
 */
template <class GroupOfView, class IndexView, class RawSrc, class FlagSrc,
          class RawDst, class FlagDst>
void unmirror(const std::string& label,
              std::size_t n,
              const GroupOfView& group_of,
              const IndexView& group_ptr,
              const RawSrc& raw_src,
              const FlagSrc& valid_src,
              const RawDst& raw_dst,
              const FlagDst& valid_dst) {
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        const std::size_t g = group_of(i);
        const std::size_t m = mirror_in_group(i, group_ptr(g), group_ptr(g + 1));
        raw_dst(i) = raw_src(m);
        valid_dst(i) = valid_src(m);
      });
  ExecSpace().fence();
}

} // namespace detail
} // namespace csr
} // namespace intervalix
