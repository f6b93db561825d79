// typeweave/dispatch/operator_registry.cpp - Registry assembly and precedence ordering
//
#include "typeweave/dispatch/operator_registry.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "typeweave/basic/error.hpp"
#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

struct Node
{
  std::shared_ptr<const Operator> op;
  std::string module;
  std::vector<size_t> deps;
};

std::string cycle_message(const std::vector<Node> & nodes, const std::vector<size_t> & stack, size_t dep)
{
  std::vector<std::string_view> path;
  for (auto it = std::find(stack.begin(), stack.end(), dep); it != stack.end(); ++it) {
    path.push_back(nodes[*it].op->name());
  }
  path.push_back(nodes[dep].op->name());
  return fmt::format("cyclic operator precedence: {}", fmt::join(path, " -> "));
}

/// Operator.OPERATION at `op`, normalized for matching.
const TypeExpr * declared_operation_type(const GenericResolver & resolver, const Operator & op)
{
  TypeContext & types = resolver.types();
  const Entity & operator_entity = Operator::declare(types);
  const Entity & operation_entity = Operation::declare(types);

  if (!is_subentity(op.entity(), operator_entity)) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, std::string(op.name()),
      fmt::format("operator '{}' does not implement Operator<OPERATION>", op.name()));
  }

  const TypeExpr * param = operator_entity.param(0);
  const TypeExpr * declared = resolver.resolve(op, param);
  if (declared != nullptr) {
    declared = erase_placeholders(types, resolver.resolve_deep(op, declared));
  } else {
    declared = param;
  }
  declared = refine(types, declared);

  if (declared == nullptr || !declared->is_named() ||
      !is_subentity(*declared->entity, operation_entity)) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, std::string(op.name()),
      fmt::format(
        "operator '{}' declares {}, which is not an operation type", op.name(), to_string(declared)));
  }
  return declared;
}

}  // namespace

OperatorRegistry OperatorRegistry::assemble(
  const GenericResolver & resolver, const std::vector<Module> & modules,
  const AssemblyOptions & options)
{
  const auto is_disabled = [&](std::string_view name) {
    return std::find(options.disabled.begin(), options.disabled.end(), name) !=
           options.disabled.end();
  };

  // Nodes in registration order
  std::vector<Node> nodes;
  std::unordered_map<std::string_view, std::vector<size_t>> by_name;
  for (const auto & module : modules) {
    for (const auto & op : module.operators()) {
      if (!op || is_disabled(op->name())) {
        continue;
      }
      nodes.push_back(Node{op, module.name(), {}});
    }
  }
  for (size_t i = 0; i < nodes.size(); ++i) {
    by_name[nodes[i].op->name()].push_back(i);
  }

  const auto add_edge = [&](std::string_view from, std::string_view to) {
    auto from_it = by_name.find(from);
    auto to_it = by_name.find(to);
    if (from_it == by_name.end() || to_it == by_name.end()) {
      return;
    }
    for (size_t u : from_it->second) {
      for (size_t v : to_it->second) {
        auto & deps = nodes[u].deps;
        if (u != v && std::find(deps.begin(), deps.end(), v) == deps.end()) {
          deps.push_back(v);
        }
      }
    }
  };

  for (const auto & node : nodes) {
    for (const auto & dep : node.op->depends_on()) {
      add_edge(node.op->name(), dep);
    }
  }
  for (const auto & module : modules) {
    for (const auto & edge : module.dependencies()) {
      add_edge(edge.operator_name, edge.depends_on);
    }
  }
  for (const auto & edge : options.dependencies) {
    add_edge(edge.operator_name, edge.depends_on);
  }

  // Depth-first topological sort; dependencies are emitted first
  std::vector<Color> color(nodes.size(), Color::White);
  std::vector<size_t> stack;
  std::vector<size_t> order;
  order.reserve(nodes.size());

  std::function<void(size_t)> dfs;
  dfs = [&](size_t u) {
    color[u] = Color::Gray;
    stack.push_back(u);
    for (size_t v : nodes[u].deps) {
      if (color[v] == Color::Gray) {
        throw_definition_error(
          ErrorCode::CyclicPrecedence, std::string(nodes[u].op->name()),
          cycle_message(nodes, stack, v));
      }
      if (color[v] == Color::White) {
        dfs(v);
      }
    }
    stack.pop_back();
    color[u] = Color::Black;
    order.push_back(u);
  };

  for (size_t i = 0; i < nodes.size(); ++i) {
    if (color[i] == Color::White) {
      dfs(i);
    }
  }

  OperatorRegistry registry;
  registry.entries_.reserve(order.size());
  for (size_t i : order) {
    Node & node = nodes[i];
    const TypeExpr * declared = declared_operation_type(resolver, *node.op);
    registry.entries_.push_back(RegisteredOperator{std::move(node.op), declared, std::move(node.module)});
  }
  return registry;
}

const RegisteredOperator * OperatorRegistry::find(std::string_view name) const noexcept
{
  for (const auto & entry : entries_) {
    if (entry.op->name() == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<std::string> OperatorRegistry::order() const
{
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto & entry : entries_) {
    names.emplace_back(entry.op->name());
  }
  return names;
}

}  // namespace typeweave
