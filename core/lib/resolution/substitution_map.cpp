// typeweave/resolution/substitution_map.cpp - Placeholder assignments over a hierarchy
//
#include "typeweave/resolution/substitution_map.hpp"

namespace typeweave
{

namespace
{

const std::vector<const TypeExpr *> k_no_aliases;

}  // namespace

SubstitutionMap SubstitutionMap::collect(const Entity & entity)
{
  return collect(entity.raw_type());
}

SubstitutionMap SubstitutionMap::collect(const TypeExpr * type)
{
  SubstitutionMap result;
  std::unordered_set<const Entity *> seen_interfaces;
  result.spider(seen_interfaces, type);
  result.build_inverse();
  return result;
}

void SubstitutionMap::spider(
  std::unordered_set<const Entity *> & seen_interfaces, const TypeExpr * type)
{
  if (type == nullptr || !type->is_named()) {
    return;
  }
  const Entity & raw = *type->entity;

  if (type->is_parameterized()) {
    for (size_t i = 0; i < raw.params().size(); ++i) {
      put(raw.params()[i], type->type_arguments[i]);
    }
  }

  // Each interface is walked once even if re-implemented further up
  if (raw.is_interface() && !seen_interfaces.insert(&raw).second) {
    return;
  }
  for (const auto * iface : raw.interfaces()) {
    spider(seen_interfaces, iface);
  }
  spider(seen_interfaces, raw.superclass());
}

void SubstitutionMap::put(const TypeExpr * placeholder, const TypeExpr * value)
{
  auto [it, inserted] = map_.emplace(placeholder, value);
  if (inserted) {
    order_.emplace_back(placeholder, value);
    return;
  }
  it->second = value;
  for (auto & entry : order_) {
    if (entry.first == placeholder) {
      entry.second = value;
      break;
    }
  }
}

void SubstitutionMap::build_inverse()
{
  inverse_.clear();
  for (const auto & [placeholder, value] : order_) {
    if (value->is_placeholder()) {
      inverse_[value].push_back(placeholder);
    }
  }
}

const TypeExpr * SubstitutionMap::find(const TypeExpr * placeholder) const noexcept
{
  auto it = map_.find(placeholder);
  return it == map_.end() ? nullptr : it->second;
}

const std::vector<const TypeExpr *> & SubstitutionMap::aliases_of(const TypeExpr * placeholder) const
{
  auto it = inverse_.find(placeholder);
  return it == inverse_.end() ? k_no_aliases : it->second;
}

}  // namespace typeweave
