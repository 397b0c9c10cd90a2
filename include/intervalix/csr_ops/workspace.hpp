#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <Kokkos_Core.hpp>
#include <intervalix/detail/memory_utils.hpp>
#include <intervalix/detail/scan_utils.hpp>
#include <intervalix/sequence/csr_backend.hpp>

namespace intervalix {
namespace csr {

namespace detail {

/**
 * @brief Unified workspace for interval id kernels.
 *
 * A pool of generic scratch buffers that the assigners "checkout" by index.
 * Buffers only grow, so repeated calls on similarly sized inputs do not
 * allocate.
 */
struct UnifiedIdWorkspace {
  static constexpr std::size_t NUM_FLAG_BUFS = 4;
  static constexpr std::size_t NUM_ID_BUFS = 5;
  static constexpr std::size_t NUM_INDEX_BUFS = 2;
  static constexpr std::size_t NUM_FILL_BUFS = 2;

  // uint8 per element (marker kinds, boundary and validity flags)
  std::array<Kokkos::View<std::uint8_t*, DeviceMemorySpace>, NUM_FLAG_BUFS> flag_bufs_;

  // IntervalId per element or per raw-id slot
  std::array<Kokkos::View<IntervalId*, DeviceMemorySpace>, NUM_ID_BUFS> id_bufs_;

  // size_t per element (group index, mirrored positions)
  std::array<Kokkos::View<std::size_t*, DeviceMemorySpace>, NUM_INDEX_BUFS> index_bufs_;

  // forward-fill results
  std::array<Kokkos::View<LastSeen*, DeviceMemorySpace>, NUM_FILL_BUFS> fill_bufs_;

  static constexpr const char* flag_buf_labels_[NUM_FLAG_BUFS] = {
    "intervalix_ws_flag_0", "intervalix_ws_flag_1",
    "intervalix_ws_flag_2", "intervalix_ws_flag_3"
  };
  static constexpr const char* id_buf_labels_[NUM_ID_BUFS] = {
    "intervalix_ws_id_0", "intervalix_ws_id_1",
    "intervalix_ws_id_2", "intervalix_ws_id_3", "intervalix_ws_id_4"
  };
  static constexpr const char* index_buf_labels_[NUM_INDEX_BUFS] = {
    "intervalix_ws_index_0", "intervalix_ws_index_1"
  };
  static constexpr const char* fill_buf_labels_[NUM_FILL_BUFS] = {
    "intervalix_ws_fill_0", "intervalix_ws_fill_1"
  };

  Kokkos::View<std::uint8_t*, DeviceMemorySpace> get_flag_buf(std::size_t idx, std::size_t size) {
    ensure_view_capacity(flag_bufs_[idx], size, flag_buf_labels_[idx]);
    return flag_bufs_[idx];
  }

  Kokkos::View<IntervalId*, DeviceMemorySpace> get_id_buf(std::size_t idx, std::size_t size) {
    ensure_view_capacity(id_bufs_[idx], size, id_buf_labels_[idx]);
    return id_bufs_[idx];
  }

  Kokkos::View<std::size_t*, DeviceMemorySpace> get_index_buf(std::size_t idx, std::size_t size) {
    ensure_view_capacity(index_bufs_[idx], size, index_buf_labels_[idx]);
    return index_bufs_[idx];
  }

  Kokkos::View<LastSeen*, DeviceMemorySpace> get_fill_buf(std::size_t idx, std::size_t size) {
    ensure_view_capacity(fill_bufs_[idx], size, fill_buf_labels_[idx]);
    return fill_bufs_[idx];
  }

  /**
   * @brief Reclaims memory by resetting all views to empty.
   */
  void clear() {
    for (auto& v : flag_bufs_) {
      v = Kokkos::View<std::uint8_t*, DeviceMemorySpace>();
    }
    for (auto& v : id_bufs_) {
      v = Kokkos::View<IntervalId*, DeviceMemorySpace>();
    }
    for (auto& v : index_bufs_) {
      v = Kokkos::View<std::size_t*, DeviceMemorySpace>();
    }
    for (auto& v : fill_bufs_) {
      v = Kokkos::View<LastSeen*, DeviceMemorySpace>();
    }
  }
};

} // namespace detail

/**
 * @brief Context object carrying reusable scratch buffers.
 *
 * Lets callers label many batches in a row without paying device
 * allocations for scratch space on every call. A context must not be shared
 * between threads calling concurrently.
 */
struct IntervalIdContext {
  detail::UnifiedIdWorkspace workspace;
};

} // namespace csr
} // namespace intervalix
