// typeweave/runtime/values.hpp - Runtime value shapes
//
// Values travel through positions as std::any. An empty std::any is the null
// value. Collections, lists and arrays are held as Sequence, maps as
// Dictionary, iterators as Cursor and property-bearing objects as RecordPtr.
//
#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typeweave/types/instance.hpp"

namespace typeweave
{

using Sequence = std::vector<std::any>;
using Dictionary = std::map<std::string, std::any, std::less<>>;

/**
 * Forward-only iterator over a sequence.
 */
struct Cursor
{
  std::shared_ptr<const Sequence> items;
  size_t index = 0;

  [[nodiscard]] bool has_next() const noexcept { return items && index < items->size(); }
  [[nodiscard]] size_t remaining() const noexcept
  {
    return (items && index < items->size()) ? items->size() - index : 0;
  }
};

/**
 * Object with named property values.
 *
 * Which properties a record has is declared by its entity (and the entity's
 * superclasses); the record only stores values. Records are shared through
 * RecordPtr so that a value read from a position aliases the stored object.
 */
class Record : public Instance
{
public:
  explicit Record(const Entity & entity) : entity_(&entity) {}

  [[nodiscard]] const Entity & entity() const noexcept override { return *entity_; }

  /// Stored value, or an empty std::any if never set
  [[nodiscard]] std::any get(std::string_view name) const
  {
    auto it = values_.find(name);
    return it == values_.end() ? std::any{} : it->second;
  }

  void set(std::string_view name, std::any value)
  {
    auto it = values_.find(name);
    if (it == values_.end()) {
      values_.emplace(std::string(name), std::move(value));
    } else {
      it->second = std::move(value);
    }
  }

private:
  const Entity * entity_;
  Dictionary values_;
};

using RecordPtr = std::shared_ptr<Record>;

/// Value factory producing a fresh record of `entity`.
[[nodiscard]] inline ValueFactory record_factory(const Entity & entity)
{
  const Entity * e = &entity;
  return [e]() { return std::any(std::make_shared<Record>(*e)); };
}

/// Record held by `value`, or nullptr.
[[nodiscard]] inline RecordPtr as_record(const std::any & value)
{
  if (const auto * r = std::any_cast<RecordPtr>(&value)) {
    return *r;
  }
  return nullptr;
}

}  // namespace typeweave
