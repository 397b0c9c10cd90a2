#pragma once

#include <cstddef>

namespace intervalix {
namespace benchmark {

/**
 * @brief Standardized benchmark sizes for intervalix
 *
 * Total element counts shared by all benchmarks so results stay comparable.
 * Group lengths are drawn around kMeanGroupLength.
 */
constexpr std::size_t kElementsTiny   = 1 << 10;
constexpr std::size_t kElementsSmall  = 1 << 14;
constexpr std::size_t kElementsMedium = 1 << 18;
constexpr std::size_t kElementsLarge  = 1 << 21;
constexpr std::size_t kElementsXLarge = 1 << 24;

constexpr std::size_t kMeanGroupLength = 256;

} // namespace benchmark
} // namespace intervalix
