#pragma once

#include "conductor/core/error.hpp"
#include "conductor/pipeline/pipeline.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

struct PipelineFile {
  std::filesystem::path path;
  PipelineDefinition definition;
};

// Reads pipeline definitions from TOML. The returned definitions carry no
// id or tenant; those are assigned on registration.
class PipelineLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<PipelineDefinition>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<PipelineDefinition>;
  // Loads every *.toml file in `directory`. Files that fail to load are
  // logged and skipped; a missing directory yields an empty list.
  [[nodiscard]] static auto load_directory(const std::filesystem::path &directory)
      -> Result<std::vector<PipelineFile>>;
};

} // namespace conductor
