// typeweave/dispatch/operator_registry.hpp - Ordered, immutable operator list
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "typeweave/dispatch/module.hpp"
#include "typeweave/resolution/generic_resolver.hpp"

namespace typeweave
{

/**
 * Registered operator with its declared operation type.
 *
 * `operation_type` is Operator.OPERATION resolved at the operator instance,
 * with placeholders left unbound replaced by bounded wildcards.
 */
struct RegisteredOperator
{
  std::shared_ptr<const Operator> op;
  const TypeExpr * operation_type = nullptr;
  std::string module;
};

struct AssemblyOptions
{
  /// Extra edges (typically from configuration)
  std::vector<PrecedenceEdge> dependencies;

  /// Operator entity names left out of the registry
  std::vector<std::string> disabled;
};

class OperatorRegistry
{
public:
  /**
   * Assemble the registry from modules.
   *
   * Operators are ordered topologically by their "depends on" edges; ties
   * keep registration order (modules in order, operators within a module in
   * order). Edges naming unknown or disabled operators are ignored.
   *
   * @throws DefinitionError (CyclicPrecedence) on a dependency cycle
   * @throws DefinitionError (MalformedDeclaration) if an operator's entity
   *         does not implement Operator<OPERATION>
   */
  [[nodiscard]] static OperatorRegistry assemble(
    const GenericResolver & resolver, const std::vector<Module> & modules,
    const AssemblyOptions & options = {});

  [[nodiscard]] const std::vector<RegisteredOperator> & entries() const noexcept
  {
    return entries_;
  }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  /// First entry whose operator entity is named `name`, or nullptr
  [[nodiscard]] const RegisteredOperator * find(std::string_view name) const noexcept;

  /// Operator names in registry order
  [[nodiscard]] std::vector<std::string> order() const;

private:
  std::vector<RegisteredOperator> entries_;
};

}  // namespace typeweave
