#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace intervalix_examples {

inline std::filesystem::path make_example_output_dir(std::string_view example_name,
                                                      int argc,
                                                      char* argv[]) {
  std::string name(example_name);
  std::filesystem::path output_dir = std::filesystem::path("examples_output") / name;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--output-dir" && i + 1 < argc) {
      output_dir = argv[++i];
    }
  }
  std::filesystem::create_directories(output_dir);
  return output_dir;
}

inline std::string output_file(const std::filesystem::path& dir,
                               std::string_view filename) {
  return (dir / std::string(filename)).string();
}

// Value following `flag` on the command line, or fallback.
inline std::string_view option_value(std::string_view flag,
                                     std::string_view fallback,
                                     int argc,
                                     char* argv[]) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string_view(argv[i]) == flag) {
      return argv[i + 1];
    }
  }
  return fallback;
}

} // namespace intervalix_examples
