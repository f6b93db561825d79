// tests/unit/config/test_engine_config.cpp - typeweave.yaml loading
//
// Covers parsing, error reporting and applying a configuration through
// EngineBuilder.
//

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "typeweave/config/engine_config.hpp"
#include "typeweave/dispatch/engine_builder.hpp"

using namespace typeweave;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ConfigEngineConfig, EmptyDocumentUsesDefaults)
{
  const auto result = parse_engine_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.standard_operators);
  EXPECT_TRUE(result.config.disabled_operators.empty());
  EXPECT_FALSE(result.config.trace);
  EXPECT_FALSE(result.config.null_behavior.has_value());
  EXPECT_TRUE(result.config.precedence.empty());
}

TEST(ConfigEngineConfig, FullDocument)
{
  const auto result = parse_engine_config(R"(
engine:
  standard_operators: false
  disabled_operators: [BeanCopier, SizeOfArray]
  trace: true
hints:
  null_behavior: set_nulls
precedence:
  - operator: ConvertingCopier
    depends_on: NopConverter
  - operator: BeanCopier
    depends_on: [SizeOfCollection, SizeOfIterable]
)");
  ASSERT_TRUE(result.success) << result.error;

  const EngineConfig & config = result.config;
  EXPECT_FALSE(config.standard_operators);
  EXPECT_EQ(config.disabled_operators, (std::vector<std::string>{"BeanCopier", "SizeOfArray"}));
  EXPECT_TRUE(config.trace);
  EXPECT_EQ(config.null_behavior, NullBehavior::SetNulls);

  ASSERT_EQ(config.precedence.size(), 3U);
  EXPECT_EQ(config.precedence[0].operator_name, "ConvertingCopier");
  EXPECT_EQ(config.precedence[0].depends_on, "NopConverter");
  EXPECT_EQ(config.precedence[2].operator_name, "BeanCopier");
  EXPECT_EQ(config.precedence[2].depends_on, "SizeOfIterable");
}

TEST(ConfigEngineConfig, InvalidDocumentsAreReported)
{
  EXPECT_EQ(parse_engine_config("- a\n- b\n").error, "configuration root must be a map");
  EXPECT_EQ(
    parse_engine_config("engine:\n  disabled_operators: BeanCopier\n").error,
    "engine.disabled_operators must be a list");
  EXPECT_EQ(
    parse_engine_config("hints:\n  null_behavior: ignore\n").error,
    "invalid hints.null_behavior: 'ignore' (must be 'unsupported', 'noop' or 'set_nulls')");
  EXPECT_EQ(parse_engine_config("precedence: BeanCopier\n").error, "precedence must be a list");
  EXPECT_EQ(
    parse_engine_config("precedence:\n  - operator: BeanCopier\n").error,
    "invalid precedence: precedence entry for 'BeanCopier' has no depends_on");

  const auto malformed = parse_engine_config("engine: [unclosed\n");
  EXPECT_FALSE(malformed.success);
  EXPECT_EQ(malformed.error.rfind("failed to parse YAML", 0), 0U);
}

TEST(ConfigEngineConfig, NullBehaviorNames)
{
  EXPECT_EQ(parse_null_behavior("unsupported"), NullBehavior::Unsupported);
  EXPECT_EQ(parse_null_behavior("noop"), NullBehavior::Noop);
  EXPECT_EQ(parse_null_behavior("set_nulls"), NullBehavior::SetNulls);
  EXPECT_FALSE(parse_null_behavior("SetNulls").has_value());
}

// ============================================================================
// Files
// ============================================================================

TEST(ConfigEngineConfig, LoadAndFindFromNestedDirectory)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "typeweave_config_test");
  const std::filesystem::path nested = temp_dir.path / "a" / "b";
  std::filesystem::create_directories(nested);
  {
    std::ofstream f(temp_dir.path / k_engine_config_file_name);
    f << "engine:\n  trace: true\n";
  }

  const auto found = find_engine_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename().string(), k_engine_config_file_name);

  const auto result = load_engine_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.trace);

  const auto missing = load_engine_config(temp_dir.path / "absent.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.error.rfind("configuration file not found", 0), 0U);
}

// ============================================================================
// Applying
// ============================================================================

TEST(ConfigEngineConfig, AppliedThroughEngineBuilder)
{
  const auto result = parse_engine_config(R"(
engine:
  disabled_operators: [SizeOfArray, BeanCopier]
  trace: true
hints:
  null_behavior: unsupported
precedence:
  - operator: SizeOfCollection
    depends_on: SizeOfIterator
)");
  ASSERT_TRUE(result.success) << result.error;

  TypeContext types;
  auto engine = EngineBuilder(types).apply(result.config).build();

  EXPECT_TRUE(engine->trace_enabled());
  EXPECT_EQ(engine->registry().find("SizeOfArray"), nullptr);
  EXPECT_EQ(engine->registry().find("BeanCopier"), nullptr);
  ASSERT_NE(engine->default_hints().find<NullBehavior>(), nullptr);
  EXPECT_EQ(*engine->default_hints().find<NullBehavior>(), NullBehavior::Unsupported);

  const auto order = engine->registry().order();
  const auto position = [&](const std::string & name) {
    return std::find(order.begin(), order.end(), name) - order.begin();
  };
  EXPECT_LT(position("SizeOfIterator"), position("SizeOfCollection"));
  EXPECT_EQ(order.front(), "SizeOfIterator");
}
