// typeweave/dispatch/engine.hpp - Shared dispatch engine
//
// The engine owns the resolver caches and the assembled operator registry.
// It is immutable once built and may be shared by any number of threads,
// each evaluating operations through its own Context.
//
#pragma once

#include <memory>
#include <vector>

#include "typeweave/dispatch/hints.hpp"
#include "typeweave/dispatch/operator_registry.hpp"
#include "typeweave/position/property.hpp"

namespace typeweave
{

struct EngineOptions
{
  AssemblyOptions assembly;

  /// Hints visible to every context below its own
  HintSet default_hints;

  /// Defaults to a RecordPropertyResolver
  std::shared_ptr<const PropertyResolver> property_resolver;

  /// Contexts record a trace unless given their own bag
  bool trace = false;
};

class Engine
{
public:
  /**
   * @throws DefinitionError if the registry cannot be assembled
   */
  Engine(TypeContext & types, const std::vector<Module> & modules, EngineOptions options = {});

  Engine(const Engine &) = delete;
  Engine & operator=(const Engine &) = delete;

  [[nodiscard]] TypeContext & types() const noexcept { return types_; }
  [[nodiscard]] const GenericResolver & resolver() const noexcept { return resolver_; }
  [[nodiscard]] const OperatorRegistry & registry() const noexcept { return registry_; }
  [[nodiscard]] const PropertyResolver & property_resolver() const noexcept
  {
    return *property_resolver_;
  }
  [[nodiscard]] const HintSet & default_hints() const noexcept { return default_hints_; }
  [[nodiscard]] bool trace_enabled() const noexcept { return trace_; }

  /**
   * Signature check of a registered operator against an operation.
   *
   * The operation's entity must extend the declared entity, and for every
   * placeholder of the entities from the declared one up to Operation
   * (exclusive) the operation's binding must be assignable to the declared
   * argument. Unresolved values on either side do not constrain.
   */
  [[nodiscard]] bool matches(const RegisteredOperator & entry, const Operation & operation) const;

private:
  TypeContext & types_;
  GenericResolver resolver_;
  OperatorRegistry registry_;
  std::shared_ptr<const PropertyResolver> property_resolver_;
  HintSet default_hints_;
  bool trace_;
  const Entity * operation_entity_;
};

}  // namespace typeweave
