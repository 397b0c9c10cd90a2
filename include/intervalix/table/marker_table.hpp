#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <string>
#include <vector>

#include <Kokkos_Core.hpp>
#include <Kokkos_Profiling_ScopedRegion.hpp>

#include <intervalix/csr_ops/assign_ids.hpp>
#include <intervalix/csr_ops/workspace.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>
#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {

using KeyColumn = std::vector<std::int64_t>;

/**
 * @brief Row-oriented input: a marker column plus optional key columns.
 *
 * Rows are in arbitrary order. Group keys split rows into independent
 * sequences, order keys sort rows inside a group.
 */
template <typename T>
struct MarkerTable {
  std::vector<MarkerValue<T>> markers;
  std::vector<KeyColumn> group_keys;
  std::vector<KeyColumn> order_keys;

  std::size_t num_rows() const { return markers.size(); }
};

template <typename T>
struct IdentifyOptions {
  MarkerConfig<T> markers;
  /// One flag per order key; empty means every key ascending.
  std::vector<bool> ascending;
};

/**
 * @brief Sorted row order and group offsets of a MarkerTable.
 *
 * order[k] is the original row at sorted position k; group g covers sorted
 * positions [group_ptr[g], group_ptr[g + 1]).
 */
struct RowPlan {
  std::vector<std::size_t> order;
  std::vector<std::size_t> group_ptr;
};

/**
 * @throws ConfigurationError on missing markers, an ascending list whose
 *         size differs from the number of order keys, or a key column whose
 *         length differs from the marker column.
 */
template <typename T>
void validate_table(const MarkerTable<T>& table,
                    const IdentifyOptions<T>& options) {
  options.markers.validate();

  if (!options.ascending.empty() &&
      options.ascending.size() != table.order_keys.size()) {
    throw ConfigurationError(
        "intervalix::csr::identify_intervals: ascending has " +
        std::to_string(options.ascending.size()) + " entries for " +
        std::to_string(table.order_keys.size()) + " order keys");
  }

  const std::size_t n = table.num_rows();
  for (const auto& col : table.group_keys) {
    if (col.size() != n) {
      throw ConfigurationError(
          "intervalix::csr::identify_intervals: group key column has " +
          std::to_string(col.size()) + " rows, markers have " +
          std::to_string(n));
    }
  }
  for (const auto& col : table.order_keys) {
    if (col.size() != n) {
      throw ConfigurationError(
          "intervalix::csr::identify_intervals: order key column has " +
          std::to_string(col.size()) + " rows, markers have " +
          std::to_string(n));
    }
  }
}

/**
 * @brief Stable sort by (group keys, order keys) and group detection.
 *
 * Rows with equal keys keep their input order.
 */
template <typename T>
RowPlan plan_rows(const MarkerTable<T>& table,
                  const std::vector<bool>& ascending) {
  RowPlan plan;
  const std::size_t n = table.num_rows();
  plan.order.resize(n);
  std::iota(plan.order.begin(), plan.order.end(), std::size_t(0));

  const auto same_group = [&](std::size_t a, std::size_t b) {
    for (const auto& col : table.group_keys) {
      if (col[a] != col[b]) {
        return false;
      }
    }
    return true;
  };

  std::stable_sort(
      plan.order.begin(), plan.order.end(),
      [&](std::size_t a, std::size_t b) {
        for (const auto& col : table.group_keys) {
          if (col[a] != col[b]) {
            return col[a] < col[b];
          }
        }
        for (std::size_t k = 0; k < table.order_keys.size(); ++k) {
          const auto& col = table.order_keys[k];
          if (col[a] != col[b]) {
            const bool asc = ascending.empty() || ascending[k];
            return asc ? col[a] < col[b] : col[a] > col[b];
          }
        }
        return false;
      });

  plan.group_ptr.push_back(0);
  for (std::size_t k = 1; k < n; ++k) {
    if (!same_group(plan.order[k - 1], plan.order[k])) {
      plan.group_ptr.push_back(k);
    }
  }
  if (n > 0) {
    plan.group_ptr.push_back(n);
  }
  return plan;
}

/**
 * @brief Order, group, label and scatter back to input row order.
 *
 * @return One id per input row, result[r] labeling table.markers[r].
 */
template <typename T>
std::vector<IntervalId> identify_intervals(const MarkerTable<T>& table,
                                           const IdentifyOptions<T>& options,
                                           IntervalIdContext& ctx) {
  Kokkos::Profiling::ScopedRegion region("intervalix::identify_intervals");
  validate_table(table, options);

  const std::size_t n = table.num_rows();
  std::vector<IntervalId> result(n, 0);
  if (n == 0) {
    return result;
  }

  const RowPlan plan = plan_rows(table, options.ascending);
  const std::size_t num_groups = plan.group_ptr.size() - 1;

  GroupedSequenceHost<T> host_seq;
  host_seq.num_groups = num_groups;
  host_seq.num_elements = n;
  host_seq.group_ptr = typename GroupedSequenceHost<T>::IndexView(
      "intervalix_table_group_ptr", num_groups + 1);
  host_seq.values = typename GroupedSequenceHost<T>::ValueView(
      "intervalix_table_values", n);
  for (std::size_t g = 0; g <= num_groups; ++g) {
    host_seq.group_ptr(g) = plan.group_ptr[g];
  }
  for (std::size_t k = 0; k < n; ++k) {
    host_seq.values(k) = table.markers[plan.order[k]];
  }

  auto dev_ids = assign_ids(to<DeviceMemorySpace>(host_seq), options.markers, ctx);
  auto host_ids = to<HostMemorySpace>(dev_ids);

  for (std::size_t k = 0; k < n; ++k) {
    result[plan.order[k]] = host_ids.ids(k);
  }
  return result;
}

template <typename T>
std::vector<IntervalId> identify_intervals(const MarkerTable<T>& table,
                                           const IdentifyOptions<T>& options) {
  IntervalIdContext ctx;
  return identify_intervals(table, options, ctx);
}

} // namespace csr
} // namespace intervalix
