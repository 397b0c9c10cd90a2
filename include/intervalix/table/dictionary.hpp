#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <intervalix/sequence/marker.hpp>

namespace intervalix {
namespace csr {

/**
 * @brief Dictionary-encoded text column.
 *
 * Kernels only see integer codes; this keeps textual marker columns
 * (e.g. "sunrise"/"sunset") usable on any memory space. Codes are assigned
 * in order of first appearance, nulls stay nulls.
 */
struct DictionaryColumn {
  std::vector<MarkerValue<std::int32_t>> codes;
  std::vector<std::string> dictionary;
  std::unordered_map<std::string, std::int32_t> index;

  /**
   * @brief Marker for a text value; values absent from the column map to a
   *        code no element carries.
   */
  MarkerValue<std::int32_t> marker(const std::string& text) const {
    const auto it = index.find(text);
    if (it == index.end()) {
      return make_marker(std::int32_t(-1));
    }
    return make_marker(it->second);
  }
};

inline DictionaryColumn
encode_dictionary(const std::vector<std::optional<std::string>>& column) {
  DictionaryColumn out;
  out.codes.reserve(column.size());
  for (const auto& cell : column) {
    if (!cell) {
      out.codes.push_back(null_marker<std::int32_t>());
      continue;
    }
    auto it = out.index.find(*cell);
    if (it == out.index.end()) {
      const auto code = static_cast<std::int32_t>(out.dictionary.size());
      out.dictionary.push_back(*cell);
      it = out.index.emplace(*cell, code).first;
    }
    out.codes.push_back(make_marker(it->second));
  }
  return out;
}

inline DictionaryColumn
encode_dictionary(const std::vector<std::string>& column) {
  std::vector<std::optional<std::string>> cells(column.begin(), column.end());
  return encode_dictionary(cells);
}

} // namespace csr
} // namespace intervalix
