// Kokkos profiling tool: logs kernel and region durations to a JSONL file and
// prints a per-label summary when Kokkos finalizes.
//
//   KOKKOS_PROFILE_OUTPUT      output path (default kp_timeline.jsonl)
//   INTERVALIX_PROFILE_FILTER  only record labels starting with this prefix
#include <impl/Kokkos_Profiling_C_Interface.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace {
using Clock = std::chrono::steady_clock;

std::mutex g_mutex;
std::ofstream g_out;
std::string g_filter;

struct KernelInfo {
  Clock::time_point start;
  std::string name;
};

struct LabelStats {
  std::uint64_t count = 0;
  double total_us = 0.0;
  double max_us = 0.0;
};

std::unordered_map<uint64_t, KernelInfo> g_kernel_info;
std::atomic<uint64_t> g_kernel_counter{0};
std::vector<KernelInfo> g_regions;
std::map<std::string, LabelStats> g_summary;

std::string env_or(const char* var, const char* fallback) {
  const char* env = std::getenv(var);
  if (env && *env) {
    return std::string(env);
  }
  return fallback;
}

bool accepted(const std::string& name) {
  return g_filter.empty() || name.compare(0, g_filter.size(), g_filter) == 0;
}

// Caller holds g_mutex.
void log_event_locked(const std::string& kind,
                      const std::string& name,
                      double duration_us) {
  if (!accepted(name)) return;
  LabelStats& stats = g_summary[name];
  ++stats.count;
  stats.total_us += duration_us;
  stats.max_us = std::max(stats.max_us, duration_us);
  if (!g_out.is_open()) return;
  g_out << "{\"kind\":\"" << kind << "\","
        << "\"name\":\"" << name << "\","
        << "\"duration_us\":" << duration_us << "}\n";
}

double elapsed_us(Clock::time_point t0) {
  return static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - t0)
          .count());
}

uint64_t record_start(const char* name) {
  const uint64_t id = g_kernel_counter.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(g_mutex);
  KernelInfo info;
  info.start = Clock::now();
  info.name = name ? std::string(name) : std::string();
  g_kernel_info[id] = std::move(info);
  return id;
}

void record_end(const std::string& kind,
                uint64_t kID) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_kernel_info.find(kID);
  if (it == g_kernel_info.end()) {
    return;
  }
  const double dt = elapsed_us(it->second.start);
  const std::string name = it->second.name.empty() ? kind : it->second.name;
  g_kernel_info.erase(it);
  log_event_locked(kind, name, dt);
}

void print_summary() {
  if (g_summary.empty()) return;
  std::fprintf(stderr, "kp_timeline summary (%zu labels)\n", g_summary.size());
  std::fprintf(stderr, "%-48s %10s %14s %12s\n", "label", "count", "total_us",
               "max_us");
  for (const auto& [name, stats] : g_summary) {
    std::fprintf(stderr, "%-48s %10llu %14.1f %12.1f\n", name.c_str(),
                 static_cast<unsigned long long>(stats.count), stats.total_us,
                 stats.max_us);
  }
}
} // namespace

extern "C" {

void kokkosp_init_library(const int /*loadSeq*/,
                          const uint64_t /*interfaceVer*/,
                          const uint32_t /*devInfoCount*/,
                          Kokkos_Profiling_KokkosPDeviceInfo* /*deviceInfo*/) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_filter = env_or("INTERVALIX_PROFILE_FILTER", "");
  g_out.open(env_or("KOKKOS_PROFILE_OUTPUT", "kp_timeline.jsonl"),
             std::ios::out | std::ios::trunc);
}

void kokkosp_finalize_library() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_out.is_open()) {
    g_out.flush();
    g_out.close();
  }
  print_summary();
  g_kernel_info.clear();
  g_regions.clear();
  g_summary.clear();
}

void kokkosp_begin_parallel_for(const char* name,
                                const uint32_t /*devID*/,
                                uint64_t* kID) {
  const uint64_t id = record_start(name);
  if (kID) {
    *kID = id;
  }
}

void kokkosp_end_parallel_for(const uint64_t kID) {
  record_end("parallel_for", kID);
}

void kokkosp_begin_parallel_scan(const char* name,
                                 const uint32_t /*devID*/,
                                 uint64_t* kID) {
  const uint64_t id = record_start(name);
  if (kID) {
    *kID = id;
  }
}

void kokkosp_end_parallel_scan(const uint64_t kID) {
  record_end("parallel_scan", kID);
}

void kokkosp_begin_parallel_reduce(const char* name,
                                   const uint32_t /*devID*/,
                                   uint64_t* kID) {
  const uint64_t id = record_start(name);
  if (kID) {
    *kID = id;
  }
}

void kokkosp_end_parallel_reduce(const uint64_t kID) {
  record_end("parallel_reduce", kID);
}

// Regions nest, so a stack pairs every pop with its push.
void kokkosp_push_profile_region(const char* name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_regions.push_back(
      KernelInfo{Clock::now(), name ? std::string(name) : std::string()});
}

void kokkosp_pop_profile_region() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_regions.empty()) return;
  const KernelInfo region = g_regions.back();
  g_regions.pop_back();
  log_event_locked("region", region.name, elapsed_us(region.start));
}

void kokkosp_begin_fence(const char* name,
                         const uint32_t /*devID*/,
                         uint64_t* kID) {
  const uint64_t id = record_start(name);
  if (kID) {
    *kID = id;
  }
}

void kokkosp_end_fence(const uint64_t kID) {
  record_end("fence", kID);
}

void kokkosp_allocate_data(const Kokkos_Profiling_SpaceHandle /*handle*/,
                           const char* /*label*/,
                           const void* /*ptr*/,
                           const uint64_t /*size*/) {}
void kokkosp_deallocate_data(const Kokkos_Profiling_SpaceHandle /*handle*/,
                             const char* /*label*/,
                             const void* /*ptr*/,
                             const uint64_t /*size*/) {}
}
