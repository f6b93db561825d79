// typeweave/dispatch/engine_builder.cpp - Fluent engine assembly
//
#include "typeweave/dispatch/engine_builder.hpp"

#include "typeweave/operators/standard_module.hpp"

namespace typeweave
{

EngineBuilder::EngineBuilder(TypeContext & types) : types_(types), own_("user") {}

EngineBuilder & EngineBuilder::add_module(Module module)
{
  modules_.push_back(std::move(module));
  return *this;
}

EngineBuilder & EngineBuilder::add(std::shared_ptr<const Operator> op)
{
  own_.add(std::move(op));
  return *this;
}

EngineBuilder & EngineBuilder::with_standard_operators(bool enabled)
{
  standard_ = enabled;
  return *this;
}

EngineBuilder & EngineBuilder::disable(std::string operator_name)
{
  options_.assembly.disabled.push_back(std::move(operator_name));
  return *this;
}

EngineBuilder & EngineBuilder::add_dependency(std::string operator_name, std::string depends_on)
{
  options_.assembly.dependencies.push_back(PrecedenceEdge{std::move(operator_name), std::move(depends_on)});
  return *this;
}

EngineBuilder & EngineBuilder::with_property_resolver(std::shared_ptr<const PropertyResolver> resolver)
{
  options_.property_resolver = std::move(resolver);
  return *this;
}

EngineBuilder & EngineBuilder::with_trace(bool enabled)
{
  options_.trace = enabled;
  return *this;
}

EngineBuilder & EngineBuilder::apply(const EngineConfig & config)
{
  with_standard_operators(config.standard_operators);
  for (const auto & name : config.disabled_operators) {
    disable(name);
  }
  for (const auto & edge : config.precedence) {
    add_dependency(edge.operator_name, edge.depends_on);
  }
  if (config.null_behavior) {
    with_hint(*config.null_behavior);
  }
  if (config.trace) {
    with_trace();
  }
  return *this;
}

std::unique_ptr<Engine> EngineBuilder::build()
{
  std::vector<Module> modules;
  if (standard_) {
    modules.push_back(standard_module(types_));
  }
  modules.insert(modules.end(), modules_.begin(), modules_.end());
  if (!own_.operators().empty() || !own_.dependencies().empty()) {
    modules.push_back(own_);
  }
  return std::make_unique<Engine>(types_, modules, options_);
}

}  // namespace typeweave
