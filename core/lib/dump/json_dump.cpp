// typeweave/dump/json_dump.cpp - JSON serialization implementation
//
#include "typeweave/dump/json_dump.hpp"

#include <string>

#include "typeweave/types/entity.hpp"
#include "typeweave/types/type_utils.hpp"

namespace typeweave
{
namespace
{

using nlohmann::json;

json j_types(const std::vector<const TypeExpr *> & types)
{
  json out = json::array();
  for (const auto * t : types) {
    out.push_back(to_json(t));
  }
  return out;
}

}  // namespace

json to_json(const TypeExpr * type)
{
  if (!type) return json{{"kind", "Unresolved"}, {"display", to_string(type)}};

  switch (type->kind) {
    case TypeKind::Named: {
      json j{{"kind", "Named"}, {"display", to_string(type)}, {"entity", std::string(type->entity->name())}};
      if (type->is_parameterized()) {
        j["arguments"] = j_types(type->type_arguments);
      }
      return j;
    }

    case TypeKind::Placeholder: {
      json j{{"kind", "Placeholder"}, {"display", to_string(type)}, {"name", std::string(type->name)}};
      if (type->declaring_entity) {
        j["declared_by"] = std::string(type->declaring_entity->name());
      } else {
        j["declared_by_method"] = std::string(type->declaring_method);
      }
      j["upper_bounds"] = j_types(type->upper_bounds);
      return j;
    }

    case TypeKind::Wildcard:
      return json{
        {"kind", "Wildcard"},
        {"display", to_string(type)},
        {"upper_bounds", j_types(type->upper_bounds)},
        {"lower_bounds", j_types(type->lower_bounds)}};

    case TypeKind::Array:
      return json{{"kind", "Array"}, {"display", to_string(type)}, {"component", to_json(type->component)}};
  }
  return json{{"kind", "Unknown"}};
}

json to_json(const OperatorRegistry & registry)
{
  json out = json::array();
  for (const auto & entry : registry.entries()) {
    out.push_back(json{
      {"operator", std::string(entry.op->name())},
      {"module", entry.module},
      {"operation", to_json(entry.operation_type)}});
  }
  return out;
}

}  // namespace typeweave
