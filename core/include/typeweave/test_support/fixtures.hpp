// typeweave/test_support/fixtures.hpp - Sample entities and operators for tests
//
// Small hierarchies and a scriptable operation/operator pair shared by the
// unit tests. Everything is declared into a caller-owned TypeContext.
//
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typeweave/dispatch/context.hpp"
#include "typeweave/dispatch/operator.hpp"
#include "typeweave/runtime/values.hpp"
#include "typeweave/types/type_utils.hpp"

namespace typeweave::test_support
{

// ============================================================================
// Entity Fixtures
// ============================================================================

/// Box<T>; StringBox extends Box<String>.
struct BoxTypes
{
  const Entity * box = nullptr;
  const Entity * string_box = nullptr;
};

inline BoxTypes declare_boxes(TypeContext & types)
{
  BoxTypes out;
  Entity & box = types.declare_class("Box", {"T"});
  Entity & string_box = types.declare_class("StringBox");
  string_box.set_superclass(types.get_named(box, {types.core().string->raw_type()}));
  out.box = &box;
  out.string_box = &string_box;
  return out;
}

/**
 * Author { name }, Book { title, pages, author }, BookDto { title, pages },
 * Catalog { label (read-only), books: List<Book> }.
 */
struct LibraryTypes
{
  const Entity * author = nullptr;
  const Entity * book = nullptr;
  const Entity * book_dto = nullptr;
  const Entity * catalog = nullptr;
};

inline LibraryTypes declare_library(TypeContext & types)
{
  const CoreEntities & core = types.core();
  const TypeExpr * string = core.string->raw_type();
  const TypeExpr * integer = core.integer->raw_type();

  Entity & author = types.declare_class("Author");
  author.add_property("name", string);
  author.set_default_constructor(record_factory(author));

  Entity & book = types.declare_class("Book");
  book.add_property("title", string);
  book.add_property("pages", integer);
  book.add_property("author", author.raw_type());
  book.set_default_constructor(record_factory(book));

  Entity & dto = types.declare_class("BookDto");
  dto.add_property("title", string);
  dto.add_property("pages", integer);
  dto.set_default_constructor(record_factory(dto));

  Entity & catalog = types.declare_class("Catalog");
  catalog.add_property("label", string, false);
  catalog.add_property("books", types.get_named(*core.list, {book.raw_type()}));

  return LibraryTypes{&author, &book, &dto, &catalog};
}

inline RecordPtr make_record(const Entity & entity) { return std::make_shared<Record>(entity); }

// ============================================================================
// Scriptable Operation / Operator
// ============================================================================

/**
 * Probe<T> extends Operation<String>; T is bound to the subject's type.
 */
class Probe : public ResultOperation<std::string>
{
public:
  Probe(
    TypeContext & types, std::shared_ptr<const Readable> subject,
    AggregationMode aggregation = AggregationMode::FirstSuccess)
  : ResultOperation<std::string>(declare(types), aggregation), subject_(std::move(subject))
  {
    add_position(subject_);
  }

  [[nodiscard]] const std::shared_ptr<const Readable> & subject() const noexcept { return subject_; }

  static const Entity & declare(TypeContext & types)
  {
    const Entity & operation = Operation::declare(types);
    return types.declare_once("Probe", false, {"T"}, [&](Entity & e) {
      e.set_superclass(types.get_named(operation, {types.core().string->raw_type()}));
      e.add_binding_accessor(MethodDecl{
        "subject_type", {}, types.get_named(*types.core().typed, {e.param("T")}),
        [](const Instance & instance) -> const TypeExpr * {
          const auto * probe = dynamic_cast<const Probe *>(&instance);
          return probe ? probe->subject()->type() : nullptr;
        }});
    });
  }

  /// Probe<subject>
  static const TypeExpr * of(TypeContext & types, const TypeExpr * subject)
  {
    return types.get_named(declare(types), {subject});
  }

private:
  std::shared_ptr<const Readable> subject_;
};

/**
 * Operator whose behavior is supplied as callbacks.
 */
class ScriptedOperator : public Operator
{
public:
  using SupportsFn = std::function<bool(Context &, const Operation &)>;
  using PerformFn = std::function<bool(Context &, Operation &)>;

  ScriptedOperator(
    TypeContext & types, std::string_view name, const TypeExpr * operation_type,
    PerformFn perform, SupportsFn supports = nullptr, std::vector<std::string> deps = {})
  : Operator(Operator::declare_for(types, name, operation_type)),
    perform_(std::move(perform)),
    supports_(std::move(supports)),
    deps_(std::move(deps))
  {
  }

  [[nodiscard]] bool supports(Context & context, const Operation & operation) const override
  {
    return !supports_ || supports_(context, operation);
  }

  bool perform(Context & context, Operation & operation) const override
  {
    return perform_(context, operation);
  }

  [[nodiscard]] std::vector<std::string> depends_on() const override { return deps_; }

private:
  PerformFn perform_;
  SupportsFn supports_;
  std::vector<std::string> deps_;
};

/// Scripted operator appending its name to `log` and reporting `result`.
inline std::shared_ptr<ScriptedOperator> recording_operator(
  TypeContext & types, std::string_view name, const TypeExpr * operation_type,
  std::shared_ptr<std::vector<std::string>> log, bool result = true,
  std::vector<std::string> deps = {})
{
  std::string label(name);
  return std::make_shared<ScriptedOperator>(
    types, name, operation_type,
    [log, label, result](Context &, Operation &) {
      log->push_back(label);
      return result;
    },
    nullptr, std::move(deps));
}

}  // namespace typeweave::test_support
