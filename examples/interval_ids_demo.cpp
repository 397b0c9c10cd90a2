#include <Kokkos_Core.hpp>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "example_output.hpp"

#include <intervalix/intervalix.hpp>

namespace {
using namespace intervalix::csr;

// Sensor log of two devices, rows deliberately out of time order.
struct Row {
  std::int64_t device;
  std::int64_t time;
  std::optional<std::string> event;
};

const std::vector<Row> kRows = {
    {1, 4, std::string("reading")}, {2, 1, std::string("reading")},
    {1, 1, std::string("boot")},    {1, 2, std::string("reading")},
    {2, 2, std::string("boot")},    {1, 3, std::string("boot")},
    {1, 5, std::string("halt")},    {2, 3, std::nullopt},
    {2, 4, std::string("halt")},    {1, 6, std::string("reading")},
    {2, 5, std::string("halt")},    {1, 7, std::string("halt")},
};

} // namespace

int main(int argc, char* argv[]) {
  Kokkos::ScopeGuard guard(argc, argv);

  int status = 0;
  try {
    const auto output_dir =
        intervalix_examples::make_example_output_dir("interval_ids_demo", argc, argv);
    const BoundaryPolicy selected = parse_boundary_policy(
        intervalix_examples::option_value("--policy", "strict", argc, argv));

    // 1. Encode the text column and build the table
    std::vector<std::optional<std::string>> events;
    MarkerTable<std::int32_t> table;
    table.group_keys.resize(1);
    table.order_keys.resize(1);
    for (const auto& row : kRows) {
      events.push_back(row.event);
      table.group_keys[0].push_back(row.device);
      table.order_keys[0].push_back(row.time);
    }
    const DictionaryColumn column = encode_dictionary(events);
    table.markers = column.codes;

    IdentifyOptions<std::int32_t> options;
    options.markers.marker_start = column.marker("boot");
    options.markers.marker_end = column.marker("halt");

    // 2. Label the rows under every policy
    std::printf("%6s %4s %-8s", "device", "time", "event");
    std::vector<std::vector<IntervalId>> results;
    for (const BoundaryPolicy policy :
         {BoundaryPolicy::Strict, BoundaryPolicy::FirstStartFirstEnd,
          BoundaryPolicy::LastStartLastEnd, BoundaryPolicy::FirstStartLastEnd}) {
      options.markers.policy = policy;
      results.push_back(identify_intervals(table, options));
      std::printf(" %11s", to_string(policy));
    }
    std::printf("\n");

    for (std::size_t r = 0; r < kRows.size(); ++r) {
      std::printf("%6lld %4lld %-8s", static_cast<long long>(kRows[r].device),
                  static_cast<long long>(kRows[r].time),
                  kRows[r].event ? kRows[r].event->c_str() : "(null)");
      for (const auto& ids : results) {
        std::printf(" %11lld", static_cast<long long>(ids[r]));
      }
      std::printf("\n");
    }

    // 3. Write the selected policy to CSV
    options.markers.policy = selected;
    const auto ids = identify_intervals(table, options);
    const std::string csv_path = intervalix_examples::output_file(
        output_dir, std::string("interval_ids_") + to_string(selected) + ".csv");
    std::ofstream csv(csv_path);
    csv << "device,time,event,interval_id\n";
    for (std::size_t r = 0; r < kRows.size(); ++r) {
      csv << kRows[r].device << ',' << kRows[r].time << ','
          << kRows[r].event.value_or("") << ',' << ids[r] << '\n';
    }
    std::printf("Wrote %s\n", csv_path.c_str());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "interval_ids_demo: %s\n", e.what());
    status = 1;
  }

  return status;
}
