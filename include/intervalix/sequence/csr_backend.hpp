#pragma once

#include <cstddef>
#include <cstdint>

#include <Kokkos_Core.hpp>

namespace intervalix {
namespace csr {

#if defined(INTERVALIX_EXECSPACE_CUDA)
using ExecSpace = Kokkos::Cuda;
#elif defined(INTERVALIX_EXECSPACE_OPENMP)
using ExecSpace = Kokkos::OpenMP;
#elif defined(INTERVALIX_EXECSPACE_SERIAL)
using ExecSpace = Kokkos::Serial;
#else
using ExecSpace = Kokkos::DefaultExecutionSpace;
#endif

#if defined(INTERVALIX_MEMORYSPACE_FORCE_UVM)
using DeviceMemorySpace = Kokkos::CudaUVMSpace;
#elif defined(INTERVALIX_MEMORYSPACE_FORCE_HOSTPINNED)
using DeviceMemorySpace = Kokkos::HostPinnedSpace;
#else
using DeviceMemorySpace = typename ExecSpace::memory_space;
#endif

using HostMemorySpace = Kokkos::HostSpace;

// Interval ids (raw and dense) and per-group offsets.
using IntervalId = std::int64_t;
using Offset = std::size_t;

} // namespace csr
} // namespace intervalix
