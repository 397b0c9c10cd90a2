#pragma once

#include <cstddef>
#include <string>

#include <Kokkos_Core.hpp>
#include <intervalix/sequence/csr_backend.hpp>

namespace intervalix {
namespace csr {
namespace detail {

/**
 * @brief Find the group owning element k using binary search on group_ptr.
 *
 * Empty groups own no element: the result is the g with
 * group_ptr(g) <= k < group_ptr(g + 1).
 *
 * @param group_ptr Group offsets [num_groups + 1]
 * @param num_groups Number of groups
 * @param k Element index, k < group_ptr(num_groups)
 */
template <class IndexView>
KOKKOS_INLINE_FUNCTION
std::size_t find_group_of_element(const IndexView& group_ptr,
                                  std::size_t num_groups,
                                  std::size_t k) {
  std::size_t lo = 0;
  std::size_t hi = num_groups;
  while (lo < hi) {
    const std::size_t mid = lo + (hi - lo) / 2;
    if (group_ptr(mid + 1) <= k) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  return lo;
}

/**
 * @brief Fill group_of(k) with the group index of every element.
 */
template <class IndexView, class GroupOfView>
void build_group_index(const std::string& label,
                       const IndexView& group_ptr,
                       std::size_t num_groups,
                       std::size_t num_elements,
                       const GroupOfView& group_of) {
  if (num_elements == 0) {
    return;
  }
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, num_elements),
      KOKKOS_LAMBDA(const std::size_t k) {
        group_of(k) = find_group_of_element(group_ptr, num_groups, k);
      });
  ExecSpace().fence();
}

/**
 * @brief Position of element k once its group is reversed in place.
 */
KOKKOS_INLINE_FUNCTION
std::size_t mirror_in_group(std::size_t k, std::size_t begin, std::size_t end) {
  return begin + (end - 1 - k);
}

} // namespace detail
} // namespace csr
} // namespace intervalix
