#include <benchmark/benchmark.h>
#include <Kokkos_Core.hpp>
#include <chrono>
#include <random>
#include <vector>

#include <intervalix/benchmark_sizes.hpp>
#include <intervalix/csr_ops/assign_ids.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>
#include <intervalix/sequence/marker.hpp>

using namespace intervalix::csr;
namespace sizes = intervalix::benchmark;

namespace {

constexpr int kStart = 1;
constexpr int kEnd = 2;

// Markers make up about a fifth of the elements, split evenly between
// starts and ends; the rest is noise.
GroupedSequenceDevice<int> make_random_sequence(std::size_t num_elements) {
  std::mt19937 gen(42);
  std::uniform_int_distribution<std::size_t> len_dist(
      1, 2 * sizes::kMeanGroupLength);
  std::uniform_int_distribution<int> sym_dist(0, 9);

  std::vector<std::size_t> ptr{0};
  while (ptr.back() < num_elements) {
    const std::size_t len = len_dist(gen);
    ptr.push_back(ptr.back() + len < num_elements ? ptr.back() + len
                                                  : num_elements);
  }

  GroupedSequenceHost<int> host;
  host.num_groups = ptr.size() - 1;
  host.num_elements = num_elements;
  host.group_ptr = GroupedSequenceHost<int>::IndexView(
      "bench_group_ptr", ptr.size());
  host.values = GroupedSequenceHost<int>::ValueView(
      "bench_values", num_elements);
  for (std::size_t g = 0; g < ptr.size(); ++g) {
    host.group_ptr(g) = ptr[g];
  }
  for (std::size_t i = 0; i < num_elements; ++i) {
    const int s = sym_dist(gen);
    host.values(i) = make_marker(s == 0 ? kStart : (s == 1 ? kEnd : 10 + s));
  }
  return to<DeviceMemorySpace>(host);
}

void bench_assign_ids(benchmark::State& state,
                      BoundaryPolicy policy,
                      Algorithm algorithm,
                      std::size_t num_elements) {
  auto seq = make_random_sequence(num_elements);

  MarkerConfig<int> config;
  config.marker_start = make_marker(kStart);
  config.marker_end = make_marker(kEnd);
  config.policy = policy;
  config.algorithm = algorithm;

  IntervalIdContext ctx;
  // Warm the workspace so the timed loop does not allocate
  assign_ids(seq, config, ctx);
  Kokkos::fence();

  double total_seconds = 0.0;

  for (auto _ : state) {
    const auto t0 = std::chrono::steady_clock::now();
    auto ids = assign_ids(seq, config, ctx);
    Kokkos::fence();
    const auto t1 = std::chrono::steady_clock::now();

    total_seconds += std::chrono::duration<double>(t1 - t0).count();

    benchmark::DoNotOptimize(ids.num_elements);
  }

  const double total_elements =
      static_cast<double>(num_elements) *
      static_cast<double>(state.iterations());
  state.counters["ns_per_element"] = (total_seconds / total_elements) * 1e9;
  state.counters["groups"] = static_cast<double>(seq.num_groups);
}

} // namespace

#define INTERVALIX_BENCH_POLICY(NAME, POLICY)                                  \
  BENCHMARK_CAPTURE(bench_assign_ids, NAME##_Sequential_Small, POLICY,         \
                    Algorithm::Sequential, sizes::kElementsSmall)              \
      ->Unit(benchmark::kMicrosecond);                                         \
  BENCHMARK_CAPTURE(bench_assign_ids, NAME##_Vectorized_Small, POLICY,         \
                    Algorithm::Vectorized, sizes::kElementsSmall)              \
      ->Unit(benchmark::kMicrosecond);                                         \
  BENCHMARK_CAPTURE(bench_assign_ids, NAME##_Sequential_Medium, POLICY,        \
                    Algorithm::Sequential, sizes::kElementsMedium)             \
      ->Unit(benchmark::kMicrosecond);                                         \
  BENCHMARK_CAPTURE(bench_assign_ids, NAME##_Vectorized_Medium, POLICY,        \
                    Algorithm::Vectorized, sizes::kElementsMedium)             \
      ->Unit(benchmark::kMicrosecond);                                         \
  BENCHMARK_CAPTURE(bench_assign_ids, NAME##_Sequential_Large, POLICY,         \
                    Algorithm::Sequential, sizes::kElementsLarge)              \
      ->Unit(benchmark::kMillisecond);                                         \
  BENCHMARK_CAPTURE(bench_assign_ids, NAME##_Vectorized_Large, POLICY,         \
                    Algorithm::Vectorized, sizes::kElementsLarge)              \
      ->Unit(benchmark::kMillisecond)

INTERVALIX_BENCH_POLICY(Strict, BoundaryPolicy::Strict);
INTERVALIX_BENCH_POLICY(FirstFirst, BoundaryPolicy::FirstStartFirstEnd);
INTERVALIX_BENCH_POLICY(LastLast, BoundaryPolicy::LastStartLastEnd);
INTERVALIX_BENCH_POLICY(FirstLast, BoundaryPolicy::FirstStartLastEnd);

BENCHMARK_CAPTURE(bench_assign_ids, Strict_Vectorized_Tiny,
                  BoundaryPolicy::Strict, Algorithm::Vectorized,
                  sizes::kElementsTiny)
    ->Unit(benchmark::kNanosecond);
BENCHMARK_CAPTURE(bench_assign_ids, Strict_Vectorized_XLarge,
                  BoundaryPolicy::Strict, Algorithm::Vectorized,
                  sizes::kElementsXLarge)
    ->Unit(benchmark::kMillisecond);

int main(int argc, char** argv) {
  Kokkos::initialize(argc, argv);
  ::benchmark::Initialize(&argc, argv);
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  ::benchmark::RunSpecifiedBenchmarks();
  Kokkos::finalize();
  return 0;
}
