#pragma once

#include "agentboard/config/system_config.hpp"
#include "agentboard/core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace agentboard {

using Config = SystemConfig;

inline constexpr std::string_view kConfigEnvVar = "AGENTBOARD_CONFIG";

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Non-default values only.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;

  // The path named by AGENTBOARD_CONFIG, if set and non-empty.
  [[nodiscard]] static auto default_path() -> std::optional<std::string>;

  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;
};

}  // namespace agentboard
