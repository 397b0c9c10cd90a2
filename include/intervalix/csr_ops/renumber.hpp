#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <Kokkos_Core.hpp>
#include <intervalix/csr_ops/workspace.hpp>
#include <intervalix/detail/csr_utils.hpp>
#include <intervalix/detail/scan_utils.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>

namespace intervalix {
namespace csr {

namespace detail {

/**
 * @brief Compact raw ids into dense per-group ids 1..K.
 *
 * A valid element opens a new dense id iff no valid element precedes it in
 * its group or the nearest preceding valid element carries a different raw
 * id. Invalid elements map to 0.
 *
 * Uses fill buffer 1, flag buffer 3 and id buffer 4 of the workspace; the
 * inputs must not live in those buffers.
 */
template <class RawView, class ValidView, class GroupOfView, class IndexView,
          class OutView>
void renumber_into(const std::string& label,
                   std::size_t n,
                   const RawView& raw,
                   const ValidView& valid,
                   const GroupOfView& group_of,
                   const IndexView& group_ptr,
                   UnifiedIdWorkspace& ws,
                   const OutView& out) {
  if (n == 0) {
    return;
  }

  auto last_valid = ws.get_fill_buf(1, n);
  auto heads = ws.get_flag_buf(3, n);
  auto scratch = ws.get_id_buf(4, n);

  segmented_forward_fill(label + "_last_valid", n, valid, raw,
                         group_of, group_ptr, last_valid);

  Kokkos::parallel_for(
      label + "_heads",
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        if (!valid(i)) {
          heads(i) = 0;
          return;
        }
        const std::size_t first = group_ptr(group_of(i));
        if (i == first) {
          heads(i) = 1;
          return;
        }
        const LastSeen prev = last_valid(i - 1);
        heads(i) = (prev.pos < 0 ||
                    prev.value != static_cast<std::int64_t>(raw(i)))
                       ? 1
                       : 0;
      });

  segmented_inclusive_sum(label + "_dense", n, heads, group_of, group_ptr,
                          scratch, out);

  Kokkos::parallel_for(
      label + "_mask",
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        if (!valid(i)) {
          out(i) = 0;
        }
      });

  ExecSpace().fence();
}

} // namespace detail

/**
 * @brief Renumber raw ids flagged valid/invalid into dense ids.
 *
 * Renumbering dense ids again (valid = id != 0) leaves them unchanged.
 *
 * @param raw Raw ids with the group layout of the sequence they label
 * @param valid Per-element validity flags, same length as raw.ids
 * @param ctx Scratch buffers
 * @return Dense ids sharing raw.group_ptr
 */
inline IdSequenceDevice
renumber_ids_device(const IdSequenceDevice& raw,
                    const Kokkos::View<std::uint8_t*, DeviceMemorySpace>& valid,
                    IntervalIdContext& ctx) {
  IdSequenceDevice out;
  out.group_ptr = raw.group_ptr;
  out.num_groups = raw.num_groups;
  out.num_elements = raw.num_elements;
  out.ids = IdSequenceDevice::IdView("intervalix_renumber_ids", raw.num_elements);

  if (raw.num_groups == 0 || raw.num_elements == 0) {
    return out;
  }

  if (valid.extent(0) < raw.num_elements) {
    throw std::runtime_error(
        "intervalix::csr::renumber_ids_device: "
        "validity flags shorter than the id sequence");
  }

  auto group_of = ctx.workspace.get_index_buf(0, raw.num_elements);
  detail::build_group_index("intervalix_renumber_group_index",
                            raw.group_ptr, raw.num_groups,
                            raw.num_elements, group_of);

  detail::renumber_into("intervalix_renumber", raw.num_elements,
                        raw.ids, valid, group_of, raw.group_ptr,
                        ctx.workspace, out.ids);
  return out;
}

/**
 * @brief Renumber already-labeled ids, treating 0 as invalid.
 */
inline IdSequenceDevice
renumber_ids_device(const IdSequenceDevice& raw, IntervalIdContext& ctx) {
  Kokkos::View<std::uint8_t*, DeviceMemorySpace> valid(
      "intervalix_renumber_valid", raw.num_elements);
  auto ids = raw.ids;
  Kokkos::parallel_for(
      "intervalix_renumber_nonzero",
      Kokkos::RangePolicy<ExecSpace>(0, raw.num_elements),
      KOKKOS_LAMBDA(const std::size_t i) {
        valid(i) = ids(i) != 0 ? 1 : 0;
      });
  ExecSpace().fence();
  return renumber_ids_device(raw, valid, ctx);
}

} // namespace csr
} // namespace intervalix
