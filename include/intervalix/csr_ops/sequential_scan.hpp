#pragma once

#include <cstddef>
#include <cstdint>

#include <Kokkos_Core.hpp>
#include <intervalix/sequence/csr_backend.hpp>
#include <intervalix/sequence/grouped_sequence.hpp>
#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {

/**
 * @brief The two tie-break rules a BoundaryPolicy is made of.
 *
 *  - keep_first_start: a start seen while an interval is open is absorbed
 *    (true) or restarts the interval, voiding the earlier run (false).
 *  - extend_to_last_end: the interval closes on the last end marker before
 *    the next start (true) or on the first end marker (false).
 */
struct PolicyRules {
  bool keep_first_start = false;
  bool extend_to_last_end = false;
};

KOKKOS_INLINE_FUNCTION
PolicyRules rules_for(BoundaryPolicy policy) {
  switch (policy) {
    case BoundaryPolicy::FirstStartFirstEnd: return PolicyRules{true, false};
    case BoundaryPolicy::LastStartLastEnd: return PolicyRules{false, true};
    case BoundaryPolicy::FirstStartLastEnd: return PolicyRules{true, true};
    case BoundaryPolicy::Strict: break;
  }
  return PolicyRules{false, false};
}

namespace detail {

template <class IdView>
KOKKOS_INLINE_FUNCTION
void zero_range(const IdView& out, std::size_t first, std::size_t last) {
  for (std::size_t j = first; j < last; ++j) {
    out(j) = 0;
  }
}

/**
 * @brief Reference scan of one group [begin, end) under the strict policy.
 *
 * Ids are written tentatively as elements are visited; the elements from
 * `pending` onwards form the unconfirmed buffer and are zeroed when a
 * repeated start voids them or when the group ends with an open interval.
 */
template <class ValueView, class Classifier, class IdView>
KOKKOS_INLINE_FUNCTION
void scan_group_reference(const ValueView& values,
                          const Classifier& classify,
                          std::size_t begin,
                          std::size_t end,
                          const IdView& out) {
  IntervalId counter = 0;
  IntervalId active = 0;
  std::size_t pending = begin;

  for (std::size_t i = begin; i < end; ++i) {
    const MarkerKind kind = classify(values(i));

    if (kind == MarkerKind::Start && active != 0) {
      // only the last start of a run opens the interval
      zero_range(out, pending, i);
      pending = i;
      out(i) = active;
    } else if (kind == MarkerKind::Start) {
      active = counter + 1;
      out(i) = active;
    } else if (kind == MarkerKind::End && active != 0) {
      out(i) = active;
      pending = i + 1;
      active = 0;
      ++counter;
    } else {
      out(i) = active;
    }
  }

  zero_range(out, pending, end);
}

/**
 * @brief Identical-marker mode: every marker begins the next interval.
 */
template <class ValueView, class Classifier, class IdView>
KOKKOS_INLINE_FUNCTION
void scan_group_identical(const ValueView& values,
                          const Classifier& classify,
                          std::size_t begin,
                          std::size_t end,
                          const IdView& out) {
  IntervalId counter = 0;
  for (std::size_t i = begin; i < end; ++i) {
    if (classify(values(i)) == MarkerKind::Start) {
      ++counter;
    }
    out(i) = counter;
  }
}

/**
 * @brief Sequential oracle for any boundary policy.
 *
 * States: idle (no start pending), started (start seen, no end yet) and
 * ended (only with extend_to_last_end: at least one end seen, the interval
 * may still grow up to a later end).
 */
template <class ValueView, class Classifier, class IdView>
KOKKOS_INLINE_FUNCTION
void scan_group_policy(const ValueView& values,
                       const Classifier& classify,
                       std::size_t begin,
                       std::size_t end,
                       const PolicyRules rules,
                       const IdView& out) {
  enum State { Idle, Started, Ended };

  State state = Idle;
  IntervalId counter = 0;
  std::size_t open = begin;
  std::size_t last_end = begin;

  for (std::size_t i = begin; i < end; ++i) {
    const MarkerKind kind = classify(values(i));

    if (state == Idle) {
      if (kind == MarkerKind::Start) {
        state = Started;
        open = i;
        out(i) = counter + 1;
      } else {
        out(i) = 0;
      }
    } else if (state == Started) {
      if (kind == MarkerKind::Start && !rules.keep_first_start) {
        zero_range(out, open, i);
        open = i;
        out(i) = counter + 1;
      } else if (kind == MarkerKind::End && !rules.extend_to_last_end) {
        out(i) = counter + 1;
        ++counter;
        state = Idle;
      } else if (kind == MarkerKind::End) {
        out(i) = counter + 1;
        last_end = i;
        state = Ended;
      } else {
        out(i) = counter + 1;
      }
    } else {
      if (kind == MarkerKind::Start) {
        // confirm [open, last_end], drop the tail that followed the last end
        zero_range(out, last_end + 1, i);
        ++counter;
        state = Started;
        open = i;
        out(i) = counter + 1;
      } else {
        if (kind == MarkerKind::End) {
          last_end = i;
        }
        out(i) = counter + 1;
      }
    }
  }

  if (state == Started) {
    zero_range(out, open, end);
  } else if (state == Ended) {
    zero_range(out, last_end + 1, end);
  }
}

} // namespace detail

/**
 * @brief Label every group with one sequential scan per group.
 *
 * Groups are processed in parallel, each by a single thread. Strict policy
 * uses the reference scan, other policies the generic state machine.
 *
 * @throws ConfigurationError if marker_start is missing.
 */
template <typename T>
IdSequenceDevice assign_ids_sequential(const GroupedSequenceDevice<T>& seq,
                                       const MarkerConfig<T>& config) {
  const MarkerClassifier<T> classifier = make_classifier(config);
  IdSequenceDevice out = allocate_ids_like(seq, "intervalix_seq_ids");

  if (seq.num_groups == 0 || seq.num_elements == 0) {
    return out;
  }

  auto group_ptr = seq.group_ptr;
  auto values = seq.values;
  auto ids = out.ids;
  const bool identical = classifier.identical;
  const bool strict = config.policy == BoundaryPolicy::Strict;
  const PolicyRules rules = rules_for(config.policy);

  Kokkos::parallel_for(
      "intervalix_sequential_scan",
      Kokkos::RangePolicy<ExecSpace>(0, seq.num_groups),
      KOKKOS_LAMBDA(const std::size_t g) {
        const std::size_t begin = group_ptr(g);
        const std::size_t end = group_ptr(g + 1);
        if (identical) {
          detail::scan_group_identical(values, classifier, begin, end, ids);
        } else if (strict) {
          detail::scan_group_reference(values, classifier, begin, end, ids);
        } else {
          detail::scan_group_policy(values, classifier, begin, end, rules, ids);
        }
      });

  ExecSpace().fence();
  return out;
}

/**
 * @brief Generic state machine for every policy, strict included.
 *
 * Exists so the reference scan and the policy oracle can be checked
 * against each other.
 */
template <typename T>
IdSequenceDevice assign_ids_state_machine(const GroupedSequenceDevice<T>& seq,
                                          const MarkerConfig<T>& config) {
  const MarkerClassifier<T> classifier = make_classifier(config);
  IdSequenceDevice out = allocate_ids_like(seq, "intervalix_fsm_ids");

  if (seq.num_groups == 0 || seq.num_elements == 0) {
    return out;
  }

  auto group_ptr = seq.group_ptr;
  auto values = seq.values;
  auto ids = out.ids;
  const bool identical = classifier.identical;
  const PolicyRules rules = rules_for(config.policy);

  Kokkos::parallel_for(
      "intervalix_state_machine_scan",
      Kokkos::RangePolicy<ExecSpace>(0, seq.num_groups),
      KOKKOS_LAMBDA(const std::size_t g) {
        const std::size_t begin = group_ptr(g);
        const std::size_t end = group_ptr(g + 1);
        if (identical) {
          detail::scan_group_identical(values, classifier, begin, end, ids);
        } else {
          detail::scan_group_policy(values, classifier, begin, end, rules, ids);
        }
      });

  ExecSpace().fence();
  return out;
}

} // namespace csr
} // namespace intervalix
