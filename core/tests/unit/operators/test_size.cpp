// tests/unit/operators/test_size.cpp - Standard Size operators

#include <gtest/gtest.h>

#include "typeweave/basic/error.hpp"
#include "typeweave/dispatch/engine_builder.hpp"
#include "typeweave/operations/size.hpp"
#include "typeweave/runtime/values.hpp"

using namespace typeweave;

namespace
{

class OperatorsSize : public ::testing::Test
{
protected:
  TypeContext types;
  const CoreEntities & core = types.core();
  std::unique_ptr<Engine> engine = EngineBuilder(types).with_standard_operators().build();
  Context ctx{*engine};

  const TypeExpr * of(const Entity * container)
  {
    return types.get_named(*container, {core.string->raw_type()});
  }

  static Sequence three() { return Sequence{std::string("a"), std::string("b"), std::string("c")}; }

  std::vector<std::string> candidate_names(const Operation & op)
  {
    std::vector<std::string> names;
    for (const auto * entry : ctx.candidates(op)) {
      names.emplace_back(entry->op->name());
    }
    return names;
  }
};

}  // namespace

TEST_F(OperatorsSize, ListMatchesCollectionAndIterableOperators)
{
  Size op(types, read_only(of(core.list), three()));
  EXPECT_EQ(candidate_names(op), (std::vector<std::string>{"SizeOfCollection", "SizeOfIterable"}));
  EXPECT_EQ(ctx.eval(op), 3);
}

TEST_F(OperatorsSize, PlainIterableIsCountedThroughAnIterator)
{
  Size op(types, read_only(of(core.iterable), three()));
  EXPECT_EQ(candidate_names(op), (std::vector<std::string>{"SizeOfIterable"}));
  EXPECT_EQ(ctx.eval(op), 3);
}

TEST_F(OperatorsSize, IteratorCountsRemainingElements)
{
  Cursor cursor{std::make_shared<const Sequence>(three()), 1};
  Size op(types, read_only(of(core.iterator), cursor));
  EXPECT_EQ(candidate_names(op), (std::vector<std::string>{"SizeOfIterator"}));
  EXPECT_EQ(ctx.eval(op), 2);
}

TEST_F(OperatorsSize, ArraysAreCounted)
{
  Size op(types, read_only(types.get_array(core.string->raw_type()), Sequence{std::string("a")}));
  EXPECT_EQ(candidate_names(op), (std::vector<std::string>{"SizeOfArray"}));
  EXPECT_EQ(ctx.eval(op), 1);
}

TEST_F(OperatorsSize, NullHasSizeZero)
{
  Size list(types, read_only(of(core.array_list), {}));
  EXPECT_EQ(ctx.eval(list), 0);

  Size array(types, read_only(types.get_array(core.integer->raw_type()), {}));
  EXPECT_EQ(ctx.eval(array), 0);
}

TEST_F(OperatorsSize, ScalarsHaveNoSize)
{
  Size op(types, read_only(core.string->raw_type(), std::string("abc")));
  EXPECT_FALSE(ctx.supports(op));
  EXPECT_FALSE(ctx.eval_if_supported(op).has_value());

  Size again(types, read_only(core.string->raw_type(), std::string("abc")));
  try {
    (void)ctx.eval(again);
    FAIL() << "expected Unsupported";
  } catch (const OperationError & e) {
    EXPECT_EQ(e.code(), ErrorCode::Unsupported);
    EXPECT_EQ(std::string(e.what()), "no operator succeeded for Size[String]");
  }
}
