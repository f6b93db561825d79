// typeweave/position/position.hpp - Typed value holders
//
// Operations carry positions: typed holders of the values they read or
// write. The engine depends on this contract only.
//
#pragma once

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "typeweave/types/type.hpp"

namespace typeweave
{

// ============================================================================
// Position Contract
// ============================================================================

class Position
{
public:
  virtual ~Position() = default;

  /// Declared type of the position
  [[nodiscard]] virtual const TypeExpr * type() const = 0;

  /**
   * Whether both positions denote the same storage.
   *
   * Identity by default; positions derived from a parent (properties)
   * compare structurally.
   */
  [[nodiscard]] virtual bool same_as(const Position & other) const noexcept { return this == &other; }

  /// Short human-readable description (used in diagnostics)
  [[nodiscard]] virtual std::string describe() const;
};

class Readable : public virtual Position
{
public:
  [[nodiscard]] virtual std::any value() const = 0;
};

class Writable : public virtual Position
{
public:
  virtual void set_value(std::any value) = 0;
};

class ReadWrite : public Readable, public Writable
{
};

// ============================================================================
// Reference Implementations
// ============================================================================

/**
 * Read-only position over a fixed value.
 */
class Ref : public Readable
{
public:
  Ref(const TypeExpr * type, std::any value) : type_(type), value_(std::move(value)) {}

  [[nodiscard]] const TypeExpr * type() const override { return type_; }
  [[nodiscard]] std::any value() const override { return value_; }

private:
  const TypeExpr * type_;
  std::any value_;
};

/**
 * Mutable position holding its own value.
 */
class Box : public ReadWrite
{
public:
  explicit Box(const TypeExpr * type, std::any value = {}) : type_(type), value_(std::move(value)) {}

  [[nodiscard]] const TypeExpr * type() const override { return type_; }
  [[nodiscard]] std::any value() const override { return value_; }
  void set_value(std::any value) override { value_ = std::move(value); }

private:
  const TypeExpr * type_;
  std::any value_;
};

/**
 * Write-only position forwarding every value to a callback.
 */
class Sink : public Writable
{
public:
  Sink(const TypeExpr * type, std::function<void(std::any)> consumer)
  : type_(type), consumer_(std::move(consumer))
  {
  }

  [[nodiscard]] const TypeExpr * type() const override { return type_; }
  void set_value(std::any value) override { consumer_(std::move(value)); }

private:
  const TypeExpr * type_;
  std::function<void(std::any)> consumer_;
};

[[nodiscard]] inline std::shared_ptr<Ref> read_only(const TypeExpr * type, std::any value)
{
  return std::make_shared<Ref>(type, std::move(value));
}

[[nodiscard]] inline std::shared_ptr<Box> read_write(const TypeExpr * type, std::any value = {})
{
  return std::make_shared<Box>(type, std::move(value));
}

[[nodiscard]] inline std::shared_ptr<Sink> writable(
  const TypeExpr * type, std::function<void(std::any)> consumer)
{
  return std::make_shared<Sink>(type, std::move(consumer));
}

}  // namespace typeweave
