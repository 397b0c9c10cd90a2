#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <Kokkos_Core.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>
#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {

namespace detail {

/**
 * @brief kinds(i) = classify(values(i)) for the first n elements.
 */
template <typename T, class ValueView, class KindView>
void classify_into(const std::string& label,
                   std::size_t n,
                   const ValueView& values,
                   const MarkerClassifier<T>& classify,
                   const KindView& kinds) {
  if (n == 0) {
    return;
  }
  using kind_type = typename KindView::non_const_value_type;
  Kokkos::parallel_for(
      label,
      Kokkos::RangePolicy<ExecSpace>(0, n),
      KOKKOS_LAMBDA(const std::size_t i) {
        kinds(i) = static_cast<kind_type>(classify(values(i)));
      });
  ExecSpace().fence();
}

} // namespace detail

/**
 * @brief Classify every element of a device sequence as Start/End/Other.
 *
 * Building block for callers assembling their own windowed pipelines.
 *
 * @throws ConfigurationError if marker_start is missing.
 */
template <typename T>
Kokkos::View<MarkerKind*, DeviceMemorySpace>
classify_markers_device(const GroupedSequenceDevice<T>& seq,
                        const MarkerConfig<T>& config) {
  const MarkerClassifier<T> classifier = make_classifier(config);
  Kokkos::View<MarkerKind*, DeviceMemorySpace> kinds(
      "intervalix_marker_kinds", seq.num_elements);
  detail::classify_into("intervalix_classify", seq.num_elements,
                        seq.values, classifier, kinds);
  return kinds;
}

} // namespace csr
} // namespace intervalix
