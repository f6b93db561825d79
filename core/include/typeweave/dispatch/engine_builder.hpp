// typeweave/dispatch/engine_builder.hpp - Fluent engine assembly
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "typeweave/config/engine_config.hpp"
#include "typeweave/dispatch/engine.hpp"

namespace typeweave
{

/**
 * Collects modules, operators and options, then builds an Engine.
 *
 *   auto engine = EngineBuilder(types)
 *                   .with_standard_operators()
 *                   .add(CopyingConverter::for_target_type(types, book))
 *                   .build();
 */
class EngineBuilder
{
public:
  explicit EngineBuilder(TypeContext & types);

  EngineBuilder & add_module(Module module);

  /// Add an operator to the builder's own module (registered after all others)
  EngineBuilder & add(std::shared_ptr<const Operator> op);

  EngineBuilder & with_standard_operators(bool enabled = true);
  EngineBuilder & disable(std::string operator_name);
  EngineBuilder & add_dependency(std::string operator_name, std::string depends_on);
  EngineBuilder & with_property_resolver(std::shared_ptr<const PropertyResolver> resolver);
  EngineBuilder & with_trace(bool enabled = true);

  template <typename T>
  EngineBuilder & with_hint(T value)
  {
    options_.default_hints.set<T>(std::move(value));
    return *this;
  }

  /// Apply a loaded configuration on top of the current settings.
  EngineBuilder & apply(const EngineConfig & config);

  /**
   * @throws DefinitionError if the registry cannot be assembled
   */
  [[nodiscard]] std::unique_ptr<Engine> build();

private:
  TypeContext & types_;
  std::vector<Module> modules_;
  Module own_;
  bool standard_ = false;
  EngineOptions options_;
};

}  // namespace typeweave
