#pragma once

// Umbrella header: the full interval id API.

#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/marker.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>
#include <intervalix/csr_ops/workspace.hpp>
#include <intervalix/csr_ops/classify.hpp>
#include <intervalix/csr_ops/sequential_scan.hpp>
#include <intervalix/csr_ops/boundary_policies.hpp>
#include <intervalix/csr_ops/renumber.hpp>
#include <intervalix/csr_ops/prefix_sum.hpp>
#include <intervalix/csr_ops/interval_spans.hpp>
#include <intervalix/csr_ops/assign_ids.hpp>
#include <intervalix/table/dictionary.hpp>
#include <intervalix/table/marker_table.hpp>
