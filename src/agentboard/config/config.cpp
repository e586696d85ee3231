#include "agentboard/config/config.hpp"

#include "agentboard/config/yaml_utils.hpp"
#include "agentboard/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<agentboard::BoardConfig> {
  static bool decode(const Node& node, agentboard::BoardConfig& b) {
    if (!node.IsMap()) {
      return false;
    }
    b.root = agentboard::yaml_get_or<std::string>(node, "root",
                                                  "./runtime/boards");
    b.journal = agentboard::yaml_get_or<std::string>(node, "journal",
                                                     "./runtime/journal.db");
    b.backup_dir = agentboard::yaml_get_or<std::string>(node, "backup_dir", "");
    return true;
  }
};

template <>
struct convert<agentboard::LockConfig> {
  static bool decode(const Node& node, agentboard::LockConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.timeout_ms = agentboard::yaml_get_or(node, "timeout_ms", 5000);
    l.stale_ttl_ms = agentboard::yaml_get_or(node, "stale_ttl_ms", 30000);
    l.initial_backoff_ms = agentboard::yaml_get_or(node, "initial_backoff_ms", 5);
    l.max_backoff_ms = agentboard::yaml_get_or(node, "max_backoff_ms", 200);
    l.max_attempts =
        agentboard::yaml_get_or<std::uint32_t>(node, "max_attempts", 200);
    l.holder_id = agentboard::yaml_get_or<std::string>(node, "holder_id", "");
    return true;
  }
};

template <>
struct convert<agentboard::LogConfig> {
  static bool decode(const Node& node, agentboard::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = agentboard::yaml_get_or<std::string>(node, "level", "info");
    l.file = agentboard::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<agentboard::ValidationConfig> {
  static bool decode(const Node& node, agentboard::ValidationConfig& v) {
    if (!node.IsMap()) {
      return false;
    }
    v.max_description_bytes = agentboard::yaml_get_or<std::size_t>(
        node, "max_description_bytes", 65536);
    v.max_dependencies =
        agentboard::yaml_get_or<std::size_t>(node, "max_dependencies", 256);
    return true;
  }
};

template <>
struct convert<agentboard::SystemConfig> {
  static bool decode(const Node& node, agentboard::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto board = node["board"]) {
      c.board = board.as<agentboard::BoardConfig>();
    }
    if (auto lock = node["lock"]) {
      c.lock = lock.as<agentboard::LockConfig>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<agentboard::LogConfig>();
    }
    if (auto validation = node["validation"]) {
      c.validation = validation.as<agentboard::ValidationConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace agentboard {

namespace {

void to_yaml(YAML::Emitter& out, const BoardConfig& b) {
  const BoardConfig defaults;
  out << YAML::BeginMap;
  if (b.root != defaults.root) {
    yaml_emit(out, "root", b.root);
  }
  if (b.journal != defaults.journal) {
    yaml_emit(out, "journal", b.journal);
  }
  yaml_emit_if_not_empty(out, "backup_dir", b.backup_dir);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LockConfig& l) {
  const LockConfig defaults;
  out << YAML::BeginMap;
  if (l.timeout_ms != defaults.timeout_ms) {
    yaml_emit(out, "timeout_ms", l.timeout_ms);
  }
  if (l.stale_ttl_ms != defaults.stale_ttl_ms) {
    yaml_emit(out, "stale_ttl_ms", l.stale_ttl_ms);
  }
  if (l.initial_backoff_ms != defaults.initial_backoff_ms) {
    yaml_emit(out, "initial_backoff_ms", l.initial_backoff_ms);
  }
  if (l.max_backoff_ms != defaults.max_backoff_ms) {
    yaml_emit(out, "max_backoff_ms", l.max_backoff_ms);
  }
  if (l.max_attempts != defaults.max_attempts) {
    yaml_emit(out, "max_attempts", l.max_attempts);
  }
  yaml_emit_if_not_empty(out, "holder_id", l.holder_id);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LogConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  yaml_emit_if_not_empty(out, "file", l.file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ValidationConfig& v) {
  const ValidationConfig defaults;
  out << YAML::BeginMap;
  if (v.max_description_bytes != defaults.max_description_bytes) {
    yaml_emit(out, "max_description_bytes", v.max_description_bytes);
  }
  if (v.max_dependencies != defaults.max_dependencies) {
    yaml_emit(out, "max_dependencies", v.max_dependencies);
  }
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::NotFound, "cannot open config file " + path_str);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError, "config is empty");
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError, e.what());
  }
  if (auto valid = validate(config); !valid) {
    return fail(std::move(valid.error()));
  }
  return ok(std::move(config));
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "board" << YAML::Value;
  to_yaml(out, config.board);
  out << YAML::Key << "lock" << YAML::Value;
  to_yaml(out, config.lock);
  out << YAML::Key << "log" << YAML::Value;
  to_yaml(out, config.log);
  out << YAML::Key << "validation" << YAML::Value;
  to_yaml(out, config.validation);
  out << YAML::EndMap;
  return out.c_str();
}

auto ConfigLoader::default_path() -> std::optional<std::string> {
  const char* value = std::getenv(std::string(kConfigEnvVar).c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string{value};
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  if (config.board.root.empty()) {
    return fail(Error::InvalidArgument, "board.root must not be empty");
  }
  if (config.lock.timeout_ms < 0) {
    return fail(Error::InvalidArgument, "lock.timeout_ms must be >= 0");
  }
  if (config.lock.stale_ttl_ms <= 0) {
    return fail(Error::InvalidArgument, "lock.stale_ttl_ms must be > 0");
  }
  if (config.lock.initial_backoff_ms <= 0 ||
      config.lock.max_backoff_ms < config.lock.initial_backoff_ms) {
    return fail(Error::InvalidArgument,
                "lock backoff must satisfy 0 < initial_backoff_ms <= "
                "max_backoff_ms");
  }
  if (config.lock.max_attempts == 0) {
    return fail(Error::InvalidArgument, "lock.max_attempts must be > 0");
  }
  if (config.validation.max_description_bytes == 0) {
    return fail(Error::InvalidArgument,
                "validation.max_description_bytes must be > 0");
  }
  return ok();
}

}  // namespace agentboard
