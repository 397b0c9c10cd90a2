#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <Kokkos_Core.hpp>

namespace intervalix {
namespace csr {

/**
 * @brief Raised synchronously, before any kernel is launched, when the
 *        marker or ordering configuration is missing or contradictory.
 */
class ConfigurationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A marker column entry: a value plus a null flag.
 *
 * Plain aggregate so it can live in a Kokkos::View on any memory space.
 */
template <typename T>
struct MarkerValue {
  T value{};
  bool is_null = false;
};

template <typename T>
inline MarkerValue<T> make_marker(const T& value) {
  return MarkerValue<T>{value, false};
}

template <typename T>
inline MarkerValue<T> null_marker() {
  return MarkerValue<T>{T{}, true};
}

/**
 * @brief Null-safe equality: two nulls compare equal, a null never equals a
 *        non-null value.
 */
template <typename T>
KOKKOS_INLINE_FUNCTION
bool null_safe_equal(const MarkerValue<T>& a, const MarkerValue<T>& b) {
  if (a.is_null || b.is_null) {
    return a.is_null && b.is_null;
  }
  return a.value == b.value;
}

enum class MarkerKind : std::uint8_t {
  Other = 0,
  Start = 1,
  End = 2
};

// Start <-> End, used to run a forward policy on a reversed group.
KOKKOS_INLINE_FUNCTION
MarkerKind swap_roles(MarkerKind kind) {
  if (kind == MarkerKind::Start) return MarkerKind::End;
  if (kind == MarkerKind::End) return MarkerKind::Start;
  return MarkerKind::Other;
}

/**
 * @brief How duplicate start/end markers are resolved.
 *
 *  - Strict: last start of a run, first end; exactly one start and one end
 *    per interval.
 *  - FirstStartFirstEnd: earliest start matched with the earliest end.
 *  - LastStartLastEnd: latest start matched with the latest end of the run.
 *  - FirstStartLastEnd: widest span, first start to the last end before the
 *    next start.
 */
enum class BoundaryPolicy : int {
  Strict = 0,
  FirstStartFirstEnd = 1,
  LastStartLastEnd = 2,
  FirstStartLastEnd = 3
};

enum class Algorithm : int {
  Vectorized = 0,  ///< prefix sums and grouped aggregates
  Sequential = 1   ///< one state machine per group
};

inline const char* to_string(BoundaryPolicy policy) {
  switch (policy) {
    case BoundaryPolicy::Strict: return "strict";
    case BoundaryPolicy::FirstStartFirstEnd: return "first_first";
    case BoundaryPolicy::LastStartLastEnd: return "last_last";
    case BoundaryPolicy::FirstStartLastEnd: return "first_last";
  }
  return "unknown";
}

inline BoundaryPolicy parse_boundary_policy(std::string_view name) {
  if (name == "strict") return BoundaryPolicy::Strict;
  if (name == "first_first") return BoundaryPolicy::FirstStartFirstEnd;
  if (name == "last_last") return BoundaryPolicy::LastStartLastEnd;
  if (name == "first_last") return BoundaryPolicy::FirstStartLastEnd;
  throw ConfigurationError(
      "intervalix::csr::parse_boundary_policy: unknown policy '" +
      std::string(name) + "'");
}

/**
 * @brief User facing marker configuration.
 *
 * marker_start is required. Leaving marker_end empty (or setting it equal to
 * marker_start) selects identical-marker mode, where every marker occurrence
 * begins the next interval.
 */
template <typename T>
struct MarkerConfig {
  std::optional<MarkerValue<T>> marker_start;
  std::optional<MarkerValue<T>> marker_end;
  BoundaryPolicy policy = BoundaryPolicy::Strict;
  Algorithm algorithm = Algorithm::Vectorized;

  void validate() const {
    if (!marker_start) {
      throw ConfigurationError(
          "intervalix::csr::MarkerConfig: marker_start is required");
    }
  }

  bool identical_markers() const {
    validate();
    return !marker_end || null_safe_equal(*marker_start, *marker_end);
  }
};

/**
 * @brief Device-copyable classifier built from a validated MarkerConfig.
 */
template <typename T>
struct MarkerClassifier {
  MarkerValue<T> start;
  MarkerValue<T> end;
  bool identical = false;

  KOKKOS_INLINE_FUNCTION
  MarkerKind operator()(const MarkerValue<T>& v) const {
    if (null_safe_equal(v, start)) {
      return MarkerKind::Start;
    }
    if (!identical && null_safe_equal(v, end)) {
      return MarkerKind::End;
    }
    return MarkerKind::Other;
  }
};

template <typename T>
inline MarkerClassifier<T> make_classifier(const MarkerConfig<T>& config) {
  config.validate();
  MarkerClassifier<T> c;
  c.start = *config.marker_start;
  c.identical = config.identical_markers();
  c.end = c.identical ? c.start : *config.marker_end;
  return c;
}

template <typename T>
inline MarkerKind classify(const MarkerValue<T>& value,
                           const MarkerConfig<T>& config) {
  return make_classifier(config)(value);
}

} // namespace csr
} // namespace intervalix
