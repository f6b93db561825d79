// typeweave/config/engine_config.cpp - Engine configuration implementation
//
#include "typeweave/config/engine_config.hpp"

#include <yaml-cpp/yaml.h>

namespace typeweave
{

namespace
{

/// Read a list of strings; false if the node is not a sequence
bool parse_string_list(const YAML::Node & node, std::vector<std::string> & out)
{
  if (!node.IsSequence()) {
    return false;
  }
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

/// Parse a single precedence entry
bool parse_precedence(const YAML::Node & node, std::vector<PrecedenceEdge> & out, std::string & error)
{
  if (!node.IsMap() || !node["operator"]) {
    error = "precedence entry must be a map with an 'operator' key";
    return false;
  }
  const auto name = node["operator"].as<std::string>();

  std::vector<std::string> deps;
  if (node["depends_on"]) {
    if (node["depends_on"].IsScalar()) {
      deps.push_back(node["depends_on"].as<std::string>());
    } else if (!parse_string_list(node["depends_on"], deps)) {
      error = "depends_on of '" + name + "' must be a name or a list";
      return false;
    }
  }
  if (deps.empty()) {
    error = "precedence entry for '" + name + "' has no depends_on";
    return false;
  }

  for (auto & dep : deps) {
    out.push_back(PrecedenceEdge{name, std::move(dep)});
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  EngineConfig config;
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'engine' section
  if (root["engine"]) {
    const auto & engine = root["engine"];
    if (engine["standard_operators"]) {
      config.standard_operators = engine["standard_operators"].as<bool>();
    }
    if (engine["disabled_operators"]) {
      if (!parse_string_list(engine["disabled_operators"], config.disabled_operators)) {
        return ConfigLoadResult::fail("engine.disabled_operators must be a list");
      }
    }
    if (engine["trace"]) {
      config.trace = engine["trace"].as<bool>();
    }
  }

  // Parse 'hints' section
  if (root["hints"]) {
    const auto & hints = root["hints"];
    if (hints["null_behavior"]) {
      const auto text = hints["null_behavior"].as<std::string>();
      config.null_behavior = parse_null_behavior(text);
      if (!config.null_behavior) {
        return ConfigLoadResult::fail(
          "invalid hints.null_behavior: '" + text +
          "' (must be 'unsupported', 'noop' or 'set_nulls')");
      }
    }
  }

  // Parse 'precedence' section
  if (root["precedence"]) {
    if (!root["precedence"].IsSequence()) {
      return ConfigLoadResult::fail("precedence must be a list");
    }
    for (const auto & entry : root["precedence"]) {
      std::string error;
      if (!parse_precedence(entry, config.precedence, error)) {
        return ConfigLoadResult::fail("invalid precedence: " + error);
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<NullBehavior> parse_null_behavior(std::string_view text) noexcept
{
  if (text == "unsupported") return NullBehavior::Unsupported;
  if (text == "noop") return NullBehavior::Noop;
  if (text == "set_nulls") return NullBehavior::SetNulls;
  return std::nullopt;
}

ConfigLoadResult parse_engine_config(std::string_view yaml)
{
  try {
    return parse_root(YAML::Load(std::string(yaml)));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_engine_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    return parse_root(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_engine_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_engine_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace typeweave
