#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <Kokkos_Core.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {

/**
 * @brief Grouped, already ordered marker sequences in CSR layout.
 *
 * Group g owns the elements [group_ptr(g), group_ptr(g + 1)) of values.
 * Templated on MemorySpace to support both Host and Device.
 *
 * Invariants:
 *  - group_ptr.extent(0) == num_groups + 1 (or 0 when num_groups == 0),
 *  - group_ptr(0) == 0 and group_ptr(num_groups) == num_elements,
 *  - values.extent(0) >= num_elements.
 */
template <typename T, class MemorySpace>
struct GroupedSequence {
  using ValueView = Kokkos::View<MarkerValue<T>*, MemorySpace>;
  using IndexView = Kokkos::View<std::size_t*, MemorySpace>;

  IndexView group_ptr;  ///< [num_groups + 1]
  ValueView values;     ///< [num_elements]
  std::size_t num_groups = 0;
  std::size_t num_elements = 0;
};

template <typename T>
using GroupedSequenceDevice = GroupedSequence<T, DeviceMemorySpace>;
template <typename T>
using GroupedSequenceHost = GroupedSequence<T, HostMemorySpace>;

/**
 * @brief Interval ids for a GroupedSequence, sharing its group layout.
 *
 * 0 marks elements outside any valid interval; positive ids are dense and
 * restart at 1 in every group.
 */
template <class MemorySpace>
struct IdSequence {
  using IndexView = Kokkos::View<std::size_t*, MemorySpace>;
  using IdView = Kokkos::View<IntervalId*, MemorySpace>;

  IndexView group_ptr;  ///< [num_groups + 1]
  IdView ids;           ///< [num_elements]
  std::size_t num_groups = 0;
  std::size_t num_elements = 0;
};

using IdSequenceDevice = IdSequence<DeviceMemorySpace>;
using IdSequenceHost = IdSequence<HostMemorySpace>;

/**
 * @brief Convert a GroupedSequence between memory spaces.
 *
 * Usage:
 *   auto dev = to<DeviceMemorySpace>(host_seq);
 */
template <class ToSpace, typename T, class FromSpace>
inline GroupedSequence<T, ToSpace> to(const GroupedSequence<T, FromSpace>& src) {
  GroupedSequence<T, ToSpace> dst;

  if (src.num_groups == 0) {
    return dst;
  }

  dst.num_groups = src.num_groups;
  dst.num_elements = src.num_elements;

  auto src_group_ptr = Kokkos::subview(
      src.group_ptr, std::make_pair(std::size_t(0), src.num_groups + 1));
  auto src_values = Kokkos::subview(
      src.values, std::make_pair(std::size_t(0), src.num_elements));

  dst.group_ptr = Kokkos::create_mirror_view_and_copy(ToSpace{}, src_group_ptr);
  dst.values = Kokkos::create_mirror_view_and_copy(ToSpace{}, src_values);

  return dst;
}

template <class ToSpace, class FromSpace>
inline IdSequence<ToSpace> to(const IdSequence<FromSpace>& src) {
  IdSequence<ToSpace> dst;

  if (src.num_groups == 0) {
    return dst;
  }

  dst.num_groups = src.num_groups;
  dst.num_elements = src.num_elements;

  auto src_group_ptr = Kokkos::subview(
      src.group_ptr, std::make_pair(std::size_t(0), src.num_groups + 1));
  auto src_ids = Kokkos::subview(
      src.ids, std::make_pair(std::size_t(0), src.num_elements));

  dst.group_ptr = Kokkos::create_mirror_view_and_copy(ToSpace{}, src_group_ptr);
  dst.ids = Kokkos::create_mirror_view_and_copy(ToSpace{}, src_ids);

  return dst;
}

/**
 * @brief Allocate an id sequence with the group layout of seq.
 *
 * The group_ptr view is shared, not copied.
 */
template <typename T, class MemorySpace>
inline IdSequence<MemorySpace>
allocate_ids_like(const GroupedSequence<T, MemorySpace>& seq,
                  const std::string& label) {
  IdSequence<MemorySpace> out;
  out.group_ptr = seq.group_ptr;
  out.num_groups = seq.num_groups;
  out.num_elements = seq.num_elements;
  out.ids = typename IdSequence<MemorySpace>::IdView(label, seq.num_elements);
  return out;
}

/**
 * @brief Create a host GroupedSequence from one vector per group.
 *
 * Useful for tests and simple constructions.
 *
 * Usage:
 *   auto h = make_grouped_sequence_host<int>({
 *       {make_marker(1), make_marker(7), make_marker(2)},
 *       {null_marker<int>(), make_marker(1)}
 *   });
 */
template <typename T>
inline GroupedSequenceHost<T> make_grouped_sequence_host(
    const std::vector<std::vector<MarkerValue<T>>>& groups) {
  GroupedSequenceHost<T> h;

  if (groups.empty()) {
    return h;
  }

  std::size_t total = 0;
  for (const auto& g : groups) {
    total += g.size();
  }

  h.num_groups = groups.size();
  h.num_elements = total;
  h.group_ptr = typename GroupedSequenceHost<T>::IndexView(
      "intervalix_seq_group_ptr", h.num_groups + 1);
  h.values = typename GroupedSequenceHost<T>::ValueView(
      "intervalix_seq_values", total);

  std::size_t k = 0;
  h.group_ptr(0) = 0;
  for (std::size_t g = 0; g < groups.size(); ++g) {
    for (const auto& v : groups[g]) {
      h.values(k++) = v;
    }
    h.group_ptr(g + 1) = k;
  }

  return h;
}

/**
 * @brief Same as make_grouped_sequence_host for columns without nulls.
 */
template <typename T>
inline GroupedSequenceHost<T> make_grouped_sequence_host_from_values(
    const std::vector<std::vector<T>>& groups) {
  std::vector<std::vector<MarkerValue<T>>> wrapped(groups.size());
  for (std::size_t g = 0; g < groups.size(); ++g) {
    wrapped[g].reserve(groups[g].size());
    for (const auto& v : groups[g]) {
      wrapped[g].push_back(make_marker(v));
    }
  }
  return make_grouped_sequence_host(wrapped);
}

/**
 * @brief Split host ids back into one vector per group.
 */
inline std::vector<std::vector<IntervalId>>
ids_per_group(const IdSequenceHost& h) {
  std::vector<std::vector<IntervalId>> out(h.num_groups);
  for (std::size_t g = 0; g < h.num_groups; ++g) {
    const std::size_t begin = h.group_ptr(g);
    const std::size_t end = h.group_ptr(g + 1);
    out[g].assign(h.ids.data() + begin, h.ids.data() + end);
  }
  return out;
}

} // namespace csr
} // namespace intervalix
