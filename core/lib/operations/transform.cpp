// typeweave/operations/transform.cpp - Transform, Convert and Copy entities
//
#include "typeweave/operations/transform.hpp"

namespace typeweave
{

namespace
{

/// Type of the operation's k-th position; nullptr for foreign instances.
TypeAccessor position_type(size_t k)
{
  return [k](const Instance & instance) -> const TypeExpr * {
    const auto * op = dynamic_cast<const Operation *>(&instance);
    if (op == nullptr || op->positions().size() <= k) {
      return nullptr;
    }
    return op->positions()[k]->type();
  };
}

}  // namespace

const Entity & declare_transform(TypeContext & types)
{
  const Entity & operation = Operation::declare(types);
  return types.declare_once("Transform", false, {"SOURCE", "TARGET", "RESULT"}, [&](Entity & e) {
    const Entity & typed = *types.core().typed;
    e.set_superclass(types.get_named(operation, {e.param("RESULT")}));
    e.add_binding_accessor(
      MethodDecl{"source_type", {}, types.get_named(typed, {e.param("SOURCE")}), position_type(0)});
    e.add_binding_accessor(
      MethodDecl{"target_type", {}, types.get_named(typed, {e.param("TARGET")}), position_type(1)});
  });
}

// ============================================================================
// Convert
// ============================================================================

Convert::Convert(
  TypeContext & types, std::shared_ptr<const Readable> source, std::shared_ptr<Writable> target)
: Transform<std::any>(declare(types), std::move(source), target), target_(target)
{
}

void Convert::assign(std::any value)
{
  target_->set_value(value);
  set_result(std::move(value));
}

const Entity & Convert::declare(TypeContext & types)
{
  const Entity & transform = declare_transform(types);
  return types.declare_once("Convert", false, {"SOURCE", "TARGET"}, [&](Entity & e) {
    e.set_superclass(
      types.get_named(transform, {e.param("SOURCE"), e.param("TARGET"), e.param("TARGET")}));
  });
}

// ============================================================================
// Copy
// ============================================================================

Copy::Copy(TypeContext & types, std::shared_ptr<const Readable> source, std::shared_ptr<Readable> target)
: Transform<void>(declare(types), std::move(source), target), target_(target)
{
}

std::unique_ptr<Copy> Copy::safely(
  TypeContext & types, std::shared_ptr<const Readable> source, std::shared_ptr<Readable> target)
{
  auto copy = std::make_unique<Copy>(types, std::move(source), std::move(target));
  copy->mark_safe();
  return copy;
}

std::shared_ptr<Writable> Copy::writable_target() const
{
  return std::dynamic_pointer_cast<Writable>(target_);
}

const Entity & Copy::declare(TypeContext & types)
{
  const Entity & transform = declare_transform(types);
  return types.declare_once("Copy", false, {"SOURCE", "TARGET"}, [&](Entity & e) {
    e.set_superclass(types.get_named(
      transform, {e.param("SOURCE"), e.param("TARGET"), types.core().void_->raw_type()}));
  });
}

}  // namespace typeweave
