#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#include <Kokkos_Core.hpp>

namespace intervalix {
namespace csr {
namespace detail {

/**
 * @brief Ensure a Kokkos View has at least the required capacity.
 *
 * Reallocates without preserving content: the views handled here are scratch
 * buffers that every kernel fully overwrites before reading.
 *
 * @param view The view to check/resize (passed by reference).
 * @param required_size The minimum required extent.
 * @param label The label to use if reallocation occurs.
 */
template <class ViewType>
inline void ensure_view_capacity(ViewType& view,
                                 std::size_t required_size,
                                 const std::string& label) {
  if (view.extent(0) < required_size) {
    std::size_t new_size = std::max(
        required_size,
        static_cast<std::size_t>(view.extent(0) * 1.5));
    new_size = std::max(new_size, std::size_t(256));
    view = ViewType(Kokkos::view_alloc(Kokkos::WithoutInitializing, label),
                    new_size);
  }
}

/**
 * @brief Zero the first n entries of a scratch view.
 */
template <class ViewType>
inline void zero_prefix(const ViewType& view, std::size_t n) {
  if (n == 0) {
    return;
  }
  Kokkos::deep_copy(
      Kokkos::subview(view, std::make_pair(std::size_t(0), n)),
      typename ViewType::non_const_value_type{});
}

} // namespace detail
} // namespace csr
} // namespace intervalix
