// typeweave/dispatch/module.hpp - Named bundle of operators
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "typeweave/dispatch/operator.hpp"

namespace typeweave
{

/// "operator must be ordered after depends_on"; both are operator entity names.
struct PrecedenceEdge
{
  std::string operator_name;
  std::string depends_on;
};

/**
 * Operators contributed together, plus precedence edges between them (or
 * towards operators of other modules).
 */
class Module
{
public:
  explicit Module(std::string name) : name_(std::move(name)) {}

  Module & add(std::shared_ptr<const Operator> op)
  {
    operators_.push_back(std::move(op));
    return *this;
  }

  Module & add_dependency(std::string operator_name, std::string depends_on)
  {
    edges_.push_back(PrecedenceEdge{std::move(operator_name), std::move(depends_on)});
    return *this;
  }

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] const std::vector<std::shared_ptr<const Operator>> & operators() const noexcept
  {
    return operators_;
  }
  [[nodiscard]] const std::vector<PrecedenceEdge> & dependencies() const noexcept { return edges_; }

private:
  std::string name_;
  std::vector<std::shared_ptr<const Operator>> operators_;
  std::vector<PrecedenceEdge> edges_;
};

}  // namespace typeweave
