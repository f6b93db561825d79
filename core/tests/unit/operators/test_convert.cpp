// tests/unit/operators/test_convert.cpp - NopConverter and CopyingConverter

#include <gtest/gtest.h>

#include "typeweave/basic/error.hpp"
#include "typeweave/dispatch/engine_builder.hpp"
#include "typeweave/operators/converters.hpp"
#include "typeweave/test_support/fixtures.hpp"

using namespace typeweave;
using namespace typeweave::test_support;

namespace
{

class OperatorsConvert : public ::testing::Test
{
protected:
  TypeContext types;
  const CoreEntities & core = types.core();
  LibraryTypes lib = declare_library(types);

  RecordPtr dune()
  {
    RecordPtr book = make_record(*lib.book);
    book->set("title", std::string("Dune"));
    book->set("pages", 412);
    return book;
  }
};

}  // namespace

TEST_F(OperatorsConvert, AssignableValuesPassThrough)
{
  auto engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx(*engine);

  auto target = read_write(core.number->raw_type());
  Convert op(types, read_only(core.integer->raw_type(), 5), target);
  const std::any result = ctx.eval(op);

  EXPECT_EQ(std::any_cast<int>(result), 5);
  EXPECT_EQ(std::any_cast<int>(target->value()), 5);
  EXPECT_EQ(op.describe(), "Convert[Integer -> Number]");
}

TEST_F(OperatorsConvert, UnrelatedTypesAreNotConverted)
{
  auto engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx(*engine);

  Convert op(types, read_only(core.string->raw_type(), std::string("5")), read_write(core.integer->raw_type()));
  EXPECT_FALSE(ctx.supports(op));
  EXPECT_FALSE(ctx.eval_success(op));
}

TEST_F(OperatorsConvert, CopyingConverterCreatesAndFillsTarget)
{
  auto converter = CopyingConverter::for_target_type(types, lib.book_dto->raw_type());
  auto engine = EngineBuilder(types).with_standard_operators().add(converter).build();
  Context ctx(*engine);

  auto target = read_write(lib.book_dto->raw_type());
  Convert op(types, read_only(lib.book->raw_type(), dune()), target);
  ASSERT_TRUE(ctx.eval_success(op));

  RecordPtr dto = as_record(target->value());
  ASSERT_NE(dto, nullptr);
  EXPECT_EQ(&dto->entity(), lib.book_dto);
  EXPECT_EQ(std::any_cast<std::string>(dto->get("title")), "Dune");
  EXPECT_EQ(std::any_cast<int>(dto->get("pages")), 412);
  EXPECT_EQ(as_record(*op.result()), dto);
}

TEST_F(OperatorsConvert, CopyingConverterSignature)
{
  auto converter = CopyingConverter::for_target_type(types, lib.book_dto->raw_type());
  auto engine = EngineBuilder(types).add(converter).build();

  const RegisteredOperator * entry = engine->registry().find("CopyingConverter");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(to_string(entry->operation_type), "Convert<?, ? super BookDto>");
  EXPECT_EQ(engine->resolver().resolve(*converter, CopyingConverter::declare(types).param("TARGET")),
            lib.book_dto->raw_type());
}

TEST_F(OperatorsConvert, CopyingConverterNeedsACopier)
{
  auto converter = CopyingConverter::for_target_type(types, lib.book_dto->raw_type());
  auto engine = EngineBuilder(types).with_standard_operators().add(converter).build();
  Context ctx(*engine);

  // Author shares no property with BookDto
  RecordPtr author = make_record(*lib.author);
  auto target = read_write(lib.book_dto->raw_type());
  Convert op(types, read_only(lib.author->raw_type(), author), target);
  EXPECT_FALSE(ctx.supports(op));
  EXPECT_FALSE(target->value().has_value());
}

TEST_F(OperatorsConvert, ImplementingUsesTheNarrowestValueType)
{
  const TypeExpr * strings = types.get_named(*core.list, {core.string->raw_type()});
  auto converter = CopyingConverter::implementing(types, strings).with(*core.array_list);
  EXPECT_EQ(converter->target_type(), strings);
  EXPECT_EQ(
    converter->value_type(), types.get_named(*core.array_list, {core.string->raw_type()}));
}

TEST_F(OperatorsConvert, DeclarationErrors)
{
  try {
    (void)CopyingConverter::for_target_type(types, lib.catalog->raw_type());
    FAIL() << "expected MissingDefaultConstructor";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MissingDefaultConstructor);
    EXPECT_EQ(std::string(e.what()), "could not find default constructor for Catalog");
  }

  try {
    (void)CopyingConverter::for_target_type(types, types.get_array(core.string->raw_type()));
    FAIL() << "expected MalformedDeclaration";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MalformedDeclaration);
  }

  const TypeExpr * strings = types.get_named(*core.list, {core.string->raw_type()});
  try {
    (void)CopyingConverter::implementing(types, strings).with(*core.hash_map);
    FAIL() << "expected MalformedDeclaration";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MalformedDeclaration);
    EXPECT_EQ(std::string(e.what()), "HashMap does not implement List<String>");
  }
}
