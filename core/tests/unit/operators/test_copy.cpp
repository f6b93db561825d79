// tests/unit/operators/test_copy.cpp - BeanCopier, ConvertingCopier and PropertyCopier

#include <gtest/gtest.h>

#include "typeweave/basic/error.hpp"
#include "typeweave/dispatch/engine_builder.hpp"
#include "typeweave/operators/converters.hpp"
#include "typeweave/operators/copiers.hpp"
#include "typeweave/test_support/fixtures.hpp"

using namespace typeweave;
using namespace typeweave::test_support;

namespace
{

class OperatorsCopy : public ::testing::Test
{
protected:
  TypeContext types;
  LibraryTypes lib = declare_library(types);

  RecordPtr author(const std::string & name)
  {
    RecordPtr a = make_record(*lib.author);
    a->set("name", name);
    return a;
  }

  RecordPtr dune()
  {
    RecordPtr book = make_record(*lib.book);
    book->set("title", std::string("Dune"));
    book->set("pages", 412);
    book->set("author", author("Frank Herbert"));
    return book;
  }

  std::shared_ptr<Ref> ref(const Entity * entity, const RecordPtr & value)
  {
    return read_only(entity->raw_type(), value ? std::any(value) : std::any());
  }

  static std::string text(const RecordPtr & record, std::string_view name)
  {
    return std::any_cast<std::string>(record->get(name));
  }
};

}  // namespace

// ============================================================================
// BeanCopier
// ============================================================================

TEST_F(OperatorsCopy, BeanCopierCopiesSharedProperties)
{
  auto engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx(*engine);

  RecordPtr dto = make_record(*lib.book_dto);
  Copy op(types, ref(lib.book, dune()), ref(lib.book_dto, dto));

  const auto candidates = ctx.candidates(op);
  ASSERT_EQ(candidates.size(), 1U);
  EXPECT_EQ(candidates.front()->op->name(), "BeanCopier");

  ctx.forward_to(op);
  EXPECT_EQ(text(dto, "title"), "Dune");
  EXPECT_EQ(std::any_cast<int>(dto->get("pages")), 412);
}

TEST_F(OperatorsCopy, BeanCopierSharesNestedValuesOfTheSameType)
{
  auto engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx(*engine);

  RecordPtr source = dune();
  RecordPtr target = make_record(*lib.book);
  Copy op(types, ref(lib.book, source), ref(lib.book, target));
  ctx.forward_to(op);

  EXPECT_EQ(as_record(target->get("author")), as_record(source->get("author")));
  EXPECT_EQ(text(target, "title"), "Dune");
}

TEST_F(OperatorsCopy, BeanCopierNeedsATargetValue)
{
  auto engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx(*engine);

  Copy op(types, ref(lib.book, dune()), ref(lib.book_dto, nullptr));
  EXPECT_TRUE(ctx.supports(op));
  EXPECT_FALSE(ctx.eval_success(op));
}

TEST_F(OperatorsCopy, ReadOnlyPropertiesAreSkipped)
{
  const TypeExpr * string = types.core().string->raw_type();
  Entity & labelled = types.declare_class("Labelled");
  labelled.add_property("label", string);
  labelled.add_property("books", types.get_named(*types.core().list, {lib.book->raw_type()}));

  auto engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx(*engine);

  RecordPtr source = make_record(labelled);
  source->set("label", std::string("new"));
  source->set("books", Sequence{});
  RecordPtr catalog = make_record(*lib.catalog);
  catalog->set("label", std::string("old"));

  Copy op(types, ref(&labelled, source), ref(lib.catalog, catalog));
  ctx.forward_to(op);
  EXPECT_EQ(text(catalog, "label"), "old");
  EXPECT_TRUE(catalog->get("books").has_value());
}

// ============================================================================
// ConvertingCopier
// ============================================================================

TEST_F(OperatorsCopy, ConvertingCopierDeepCopiesThroughACopyingConverter)
{
  const TypeExpr * string = types.core().string->raw_type();
  Entity & author_view = types.declare_class("AuthorView");
  author_view.add_property("name", string);
  author_view.set_default_constructor(record_factory(author_view));
  Entity & book_view = types.declare_class("BookView");
  book_view.add_property("title", string);
  book_view.add_property("author", author_view.raw_type());

  auto engine = EngineBuilder(types)
                  .with_standard_operators()
                  .add(CopyingConverter::for_target_type(types, author_view.raw_type()))
                  .build();
  Context ctx(*engine);

  RecordPtr source = dune();
  RecordPtr view = make_record(book_view);
  Copy op(types, ref(lib.book, source), ref(&book_view, view));
  ctx.forward_to(op);

  EXPECT_EQ(text(view, "title"), "Dune");
  RecordPtr copied_author = as_record(view->get("author"));
  ASSERT_NE(copied_author, nullptr);
  EXPECT_EQ(&copied_author->entity(), &author_view);
  EXPECT_EQ(text(copied_author, "name"), "Frank Herbert");
}

TEST_F(OperatorsCopy, ConvertingCopierWritesIntoWritableTargets)
{
  auto engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx(*engine);

  auto target = read_write(types.core().number->raw_type());
  Copy op(types, read_only(types.core().integer->raw_type(), 3), target);
  EXPECT_EQ(ctx.candidates(op).front()->op->name(), "ConvertingCopier");
  ctx.forward_to(op);
  EXPECT_EQ(std::any_cast<int>(target->value()), 3);
}

// ============================================================================
// PropertyCopier
// ============================================================================

TEST_F(OperatorsCopy, PropertyCopierMapsNamedProperties)
{
  auto copier = PropertyCopier::between(types, lib.author->raw_type(), lib.book_dto->raw_type())
                  .map("name", "title")
                  .build();
  auto engine = EngineBuilder(types).with_standard_operators().add(copier).build();
  Context ctx(*engine);

  RecordPtr dto = make_record(*lib.book_dto);
  Copy op(types, ref(lib.author, author("Ursula")), ref(lib.book_dto, dto));
  ctx.forward_to(op);
  EXPECT_EQ(text(dto, "title"), "Ursula");

  EXPECT_EQ(
    to_string(engine->registry().find("PropertyCopier")->operation_type), "Copy<Author, BookDto>");
}

TEST_F(OperatorsCopy, PropertyCopierMapsTheWholeSource)
{
  auto copier = PropertyCopier::between(types, lib.author->raw_type(), lib.book->raw_type())
                  .map("", "author")
                  .build();
  auto engine = EngineBuilder(types).with_standard_operators().add(copier).build();
  Context ctx(*engine);

  RecordPtr writer = author("Ursula");
  RecordPtr book = make_record(*lib.book);
  Copy op(types, ref(lib.author, writer), ref(lib.book, book));
  ctx.forward_to(op);
  EXPECT_EQ(as_record(book->get("author")), writer);
}

TEST_F(OperatorsCopy, PropertyCopierMatchesLenientlyWithExclusions)
{
  auto copier = PropertyCopier::between(types, lib.book->raw_type(), lib.book_dto->raw_type())
                  .match({}, {"pages"})
                  .build();
  auto engine =
    EngineBuilder(types).with_standard_operators().disable("BeanCopier").add(copier).build();
  Context ctx(*engine);

  RecordPtr dto = make_record(*lib.book_dto);
  Copy op(types, ref(lib.book, dune()), ref(lib.book_dto, dto));
  ctx.forward_to(op);
  EXPECT_EQ(text(dto, "title"), "Dune");
  EXPECT_FALSE(dto->get("pages").has_value());
}

TEST_F(OperatorsCopy, PropertyCopierNullSourceBehavior)
{
  auto copier = PropertyCopier::between(types, lib.author->raw_type(), lib.book_dto->raw_type())
                  .map("name", "title")
                  .build();
  auto engine = EngineBuilder(types).with_standard_operators().add(copier).build();
  Context ctx(*engine);

  const auto run = [&](const RecordPtr & dto) {
    Copy op(types, ref(lib.author, nullptr), ref(lib.book_dto, dto));
    return ctx.eval_success(op);
  };

  RecordPtr untouched = make_record(*lib.book_dto);
  untouched->set("title", std::string("kept"));
  EXPECT_TRUE(run(untouched));
  EXPECT_EQ(text(untouched, "title"), "kept");

  {
    auto scope = ctx.push_hint(NullBehavior::SetNulls);
    RecordPtr cleared = make_record(*lib.book_dto);
    cleared->set("title", std::string("cleared"));
    EXPECT_TRUE(run(cleared));
    EXPECT_FALSE(cleared->get("title").has_value());
  }
  {
    auto scope = ctx.push_hint(NullBehavior::Unsupported);
    EXPECT_FALSE(run(make_record(*lib.book_dto)));
  }
}

TEST_F(OperatorsCopy, PropertyCopierNullBehaviorFromEngineDefaults)
{
  auto copier = PropertyCopier::between(types, lib.author->raw_type(), lib.book_dto->raw_type())
                  .map("name", "title")
                  .build();
  auto engine = EngineBuilder(types)
                  .with_standard_operators()
                  .add(copier)
                  .with_hint(NullBehavior::Unsupported)
                  .build();
  Context ctx(*engine);

  Copy op(types, ref(lib.author, nullptr), ref(lib.book_dto, make_record(*lib.book_dto)));
  EXPECT_FALSE(ctx.supports(op));
}

TEST_F(OperatorsCopy, PropertyCopierBuilderValidation)
{
  const TypeExpr * from = lib.author->raw_type();
  const TypeExpr * to = lib.book_dto->raw_type();
  try {
    (void)PropertyCopier::between(types, from, to).build();
    FAIL() << "expected MalformedDeclaration";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MalformedDeclaration);
    EXPECT_EQ(
      std::string(e.what()), "PropertyCopier<Author, BookDto> specifies neither mappings nor matching");
  }
  try {
    (void)PropertyCopier::between(types, from, to).map("", "").build();
    FAIL() << "expected MalformedDeclaration";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MalformedDeclaration);
  }
}
