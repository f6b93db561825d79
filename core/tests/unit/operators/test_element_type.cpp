// tests/unit/operators/test_element_type.cpp - Standard GetElementType operators

#include <gtest/gtest.h>

#include "typeweave/dispatch/engine_builder.hpp"
#include "typeweave/operations/element_type.hpp"

using namespace typeweave;

namespace
{

class OperatorsElementType : public ::testing::Test
{
protected:
  TypeContext types;
  const CoreEntities & core = types.core();
  std::unique_ptr<Engine> engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx{*engine};

  const TypeExpr * element_of(const TypeExpr * container)
  {
    GetElementType op(types, container);
    return ctx.eval(op);
  }
};

}  // namespace

TEST_F(OperatorsElementType, ArrayComponent)
{
  EXPECT_EQ(element_of(types.get_array(core.string->raw_type())), core.string->raw_type());
  const TypeExpr * matrix = types.get_array(types.get_array(core.integer->raw_type()));
  EXPECT_EQ(element_of(matrix), types.get_array(core.integer->raw_type()));
}

TEST_F(OperatorsElementType, IterableArgument)
{
  EXPECT_EQ(
    element_of(types.get_named(*core.list, {core.string->raw_type()})), core.string->raw_type());
  EXPECT_EQ(
    element_of(types.get_named(*core.hash_set, {core.long_->raw_type()})), core.long_->raw_type());
  EXPECT_EQ(
    element_of(types.get_named(*core.list, {types.wildcard_extends(core.number->raw_type())})),
    core.number->raw_type());
  EXPECT_EQ(element_of(core.list->raw_type()), types.object_type());
}

TEST_F(OperatorsElementType, MapValueType)
{
  const TypeExpr * map =
    types.get_named(*core.hash_map, {core.string->raw_type(), core.integer->raw_type()});
  EXPECT_EQ(element_of(map), core.integer->raw_type());
}

TEST_F(OperatorsElementType, ScalarHasNoElementType)
{
  GetElementType op(types, core.string->raw_type());
  EXPECT_FALSE(ctx.eval_if_supported(op).has_value());
  EXPECT_EQ(op.describe(), "GetElementType[String]");
}

TEST_F(OperatorsElementType, SameSubjectIsSameShape)
{
  const TypeExpr * list = types.get_named(*core.list, {core.string->raw_type()});
  GetElementType a(types, list);
  GetElementType b(types, list);
  GetElementType c(types, core.list->raw_type());
  EXPECT_TRUE(a.same_shape(b));
  EXPECT_FALSE(a.same_shape(c));
}
