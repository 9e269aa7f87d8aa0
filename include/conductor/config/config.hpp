#pragma once

#include "conductor/config/system_config.hpp"
#include "conductor/core/error.hpp"

#include <string_view>

namespace conductor {

using Config = SystemConfig;

// Values from the file are overridden by CONDUCTOR_* environment variables.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
};

} // namespace conductor
