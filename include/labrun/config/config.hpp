#pragma once

#include "labrun/config/run_config.hpp"
#include "labrun/core/error.hpp"

#include <string_view>

namespace labrun {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<RunConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<RunConfig>;
};

}  // namespace labrun
