// typeweave/dispatch/hints.hpp - Typed side-channel values
#pragma once

#include <any>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace typeweave
{

/**
 * At most one value per C++ type.
 *
 * Used for engine-level default hints; contexts stack their own on top.
 */
class HintSet
{
public:
  template <typename T>
  void set(T value)
  {
    values_[std::type_index(typeid(T))] = std::move(value);
  }

  template <typename T>
  [[nodiscard]] const T * find() const
  {
    auto it = values_.find(std::type_index(typeid(T)));
    return it == values_.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

private:
  std::unordered_map<std::type_index, std::any> values_;
};

}  // namespace typeweave
