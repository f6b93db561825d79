// typeweave/types/instance.hpp - Runtime instance of an entity
#pragma once

#include "typeweave/types/entity.hpp"

namespace typeweave
{

/**
 * Anything the resolver can be asked about: operations, operators and plain
 * runtime objects all expose the entity they are an instance of.
 */
class Instance
{
public:
  virtual ~Instance() = default;

  [[nodiscard]] virtual const Entity & entity() const noexcept = 0;
};

/**
 * Instance carrying nothing but its entity.
 */
class PlainInstance : public Instance
{
public:
  explicit PlainInstance(const Entity & entity) : entity_(&entity) {}

  [[nodiscard]] const Entity & entity() const noexcept override { return *entity_; }

private:
  const Entity * entity_;
};

}  // namespace typeweave
