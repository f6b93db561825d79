// typeweave/config/engine_config.hpp - Engine configuration (typeweave.yaml)
//
// Parses engine assembly settings: whether the standard operators are
// registered, which operators are disabled, extra precedence edges, default
// hints and tracing.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typeweave/dispatch/module.hpp"
#include "typeweave/operators/copiers.hpp"

namespace typeweave
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete engine configuration (typeweave.yaml).
 */
struct EngineConfig
{
  /// Register the standard module
  bool standard_operators = true;

  /// Operator entity names left out of the registry
  std::vector<std::string> disabled_operators;

  /// Record a diagnostic trace in every context
  bool trace = false;

  /// Engine-level default for the NullBehavior hint
  std::optional<NullBehavior> null_behavior;

  /// Extra "depends on" edges
  std::vector<PrecedenceEdge> precedence;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  EngineConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(EngineConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load an engine configuration from a typeweave.yaml file. Never throws.
 */
[[nodiscard]] ConfigLoadResult load_engine_config(const std::filesystem::path & config_path);

/**
 * Parse an engine configuration from YAML text. Never throws.
 */
[[nodiscard]] ConfigLoadResult parse_engine_config(std::string_view yaml);

/**
 * Find typeweave.yaml by searching upward from a directory.
 *
 * @return Path to typeweave.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_engine_config(
  const std::filesystem::path & start_dir);

/// "unsupported" | "noop" | "set_nulls"
[[nodiscard]] std::optional<NullBehavior> parse_null_behavior(std::string_view text) noexcept;

inline constexpr const char * k_engine_config_file_name = "typeweave.yaml";

}  // namespace typeweave
