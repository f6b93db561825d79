// tests/unit/types/test_type_utils.cpp - Hierarchy, assignability and normalization

#include <gtest/gtest.h>

#include "typeweave/types/entity.hpp"
#include "typeweave/types/type_utils.hpp"

using namespace typeweave;

namespace
{

class TypesTypeUtils : public ::testing::Test
{
protected:
  TypeContext types;
  const CoreEntities & core = types.core();

  const TypeExpr * string() const { return core.string->raw_type(); }
  const TypeExpr * integer() const { return core.integer->raw_type(); }
  const TypeExpr * number() const { return core.number->raw_type(); }

  const TypeExpr * list_of(const TypeExpr * e) { return types.get_named(*core.list, {e}); }
  const TypeExpr * array_list_of(const TypeExpr * e)
  {
    return types.get_named(*core.array_list, {e});
  }
};

}  // namespace

TEST_F(TypesTypeUtils, HierarchyVisitsEachEntityOnce)
{
  const std::vector<const Entity *> expected = {
    core.array_list, core.list,          core.collection, core.iterable,
    core.abstract_list, core.abstract_collection, core.object,
  };
  EXPECT_EQ(hierarchy(*core.array_list), expected);

  const std::vector<const Entity *> integer_chain = {core.integer, core.number, core.object};
  EXPECT_EQ(hierarchy(*core.integer), integer_chain);
}

TEST_F(TypesTypeUtils, SubentityFollowsSuperclassesAndInterfaces)
{
  EXPECT_TRUE(is_subentity(*core.array_list, *core.iterable));
  EXPECT_TRUE(is_subentity(*core.hash_set, *core.collection));
  EXPECT_TRUE(is_subentity(*core.list, *core.list));
  EXPECT_FALSE(is_subentity(*core.list, *core.array_list));
  EXPECT_FALSE(is_subentity(*core.list, *core.iterator));
}

TEST_F(TypesTypeUtils, TypeArgumentsFlowThroughTheHierarchy)
{
  const auto map = get_type_arguments(types, array_list_of(string()), *core.iterable);
  ASSERT_TRUE(map.has_value());
  EXPECT_EQ(unroll(types, *map, core.iterable->param(size_t{0})), string());
  EXPECT_EQ(unroll(types, *map, core.array_list->param(size_t{0})), string());

  EXPECT_FALSE(get_type_arguments(types, list_of(string()), *core.iterator).has_value());

  // Raw usage leaves the parameter undetermined
  const auto raw = get_type_arguments(types, core.list->raw_type(), *core.iterable);
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(unroll(types, *raw, core.iterable->param(size_t{0})), nullptr);
}

TEST_F(TypesTypeUtils, UnrollSubstitutesNestedPlaceholders)
{
  const TypeExpr * e = core.list->param(size_t{0});
  TypeVarMap map{{e, integer()}};
  EXPECT_EQ(unroll(types, map, list_of(e)), list_of(integer()));
  EXPECT_EQ(unroll(types, map, types.get_array(e)), types.get_array(integer()));
  EXPECT_EQ(unroll(types, map, types.wildcard_extends(e)), types.wildcard_extends(integer()));
  EXPECT_EQ(unroll(types, {}, e), nullptr);
  EXPECT_EQ(unroll(types, map, string()), string());
}

TEST_F(TypesTypeUtils, AssignabilityOfNamedTypes)
{
  EXPECT_TRUE(is_assignable(types, integer(), number()));
  EXPECT_TRUE(is_assignable(types, integer(), types.object_type()));
  EXPECT_FALSE(is_assignable(types, string(), integer()));
  EXPECT_TRUE(is_assignable(types, nullptr, string()));
  EXPECT_FALSE(is_assignable(types, string(), nullptr));

  EXPECT_TRUE(is_assignable(types, array_list_of(string()), list_of(string())));
  EXPECT_FALSE(is_assignable(types, array_list_of(string()), list_of(integer())));
  EXPECT_FALSE(is_assignable(types, list_of(string()), array_list_of(string())));
  // Raw types are assignable to any parameterization
  EXPECT_TRUE(is_assignable(types, core.list->raw_type(), list_of(string())));
}

TEST_F(TypesTypeUtils, AssignabilityToWildcards)
{
  const TypeExpr * any_collection = types.get_named(*core.collection, {types.wildcard_all()});
  const TypeExpr * any_iterator = types.get_named(*core.iterator, {types.wildcard_all()});
  EXPECT_TRUE(is_assignable(types, list_of(string()), any_collection));
  EXPECT_FALSE(is_assignable(types, list_of(string()), any_iterator));

  const TypeExpr * numbers = list_of(types.wildcard_extends(number()));
  EXPECT_TRUE(is_assignable(types, list_of(integer()), numbers));
  EXPECT_FALSE(is_assignable(types, list_of(string()), numbers));

  const TypeExpr * super_integer = types.wildcard_super(integer());
  EXPECT_TRUE(is_assignable(types, number(), super_integer));
  EXPECT_TRUE(is_assignable(types, integer(), super_integer));
  EXPECT_FALSE(is_assignable(types, string(), super_integer));
}

TEST_F(TypesTypeUtils, AssignabilityOfArrays)
{
  const TypeExpr * strings = types.get_array(string());
  EXPECT_TRUE(is_assignable(types, strings, types.object_type()));
  EXPECT_TRUE(is_assignable(types, strings, types.get_array(types.object_type())));
  EXPECT_FALSE(is_assignable(types, strings, types.get_array(integer())));
  EXPECT_FALSE(is_assignable(types, strings, core.list->raw_type()));
  EXPECT_FALSE(is_assignable(types, string(), strings));
}

TEST_F(TypesTypeUtils, RefineUsesTheFirstUpperBound)
{
  EXPECT_EQ(refine(types, types.wildcard_extends(number())), number());
  EXPECT_EQ(refine(types, types.wildcard_all()), types.object_type());
  EXPECT_EQ(refine(types, string()), string());
  EXPECT_EQ(refine(types, nullptr), nullptr);

  Entity & holder = types.declare_class("Holder", {"N"});
  holder.set_bounds("N", {number()});
  EXPECT_EQ(refine(types, holder.param("N")), number());
}

TEST_F(TypesTypeUtils, ErasePlaceholdersProducesWildcards)
{
  const TypeExpr * e = core.list->param(size_t{0});
  EXPECT_EQ(erase_placeholders(types, list_of(e)), list_of(types.wildcard_all()));
  EXPECT_EQ(erase_placeholders(types, list_of(string())), list_of(string()));
  EXPECT_EQ(erase_placeholders(types, types.get_array(e)), types.get_array(types.wildcard_all()));
}

TEST_F(TypesTypeUtils, NarrowestParameterizedType)
{
  EXPECT_EQ(
    narrowest_parameterized_type(types, core.array_list, list_of(string())),
    array_list_of(string()));
  EXPECT_EQ(narrowest_parameterized_type(types, nullptr, list_of(string())), list_of(string()));
  EXPECT_EQ(
    narrowest_parameterized_type(types, core.hash_map, list_of(string())), list_of(string()));
  EXPECT_EQ(
    narrowest_parameterized_type(types, core.array_list, core.list->raw_type()),
    core.array_list->raw_type());

  // A fixed supertype argument must agree with the requested one
  Entity & names = types.declare_class("NameList");
  names.set_superclass(array_list_of(string()));
  EXPECT_EQ(narrowest_parameterized_type(types, &names, list_of(string())), names.raw_type());
}

TEST_F(TypesTypeUtils, ToStringFormatting)
{
  EXPECT_EQ(to_string(list_of(string())), "List<String>");
  EXPECT_EQ(to_string(types.get_named(*core.map, {string(), integer()})), "Map<String, Integer>");
  EXPECT_EQ(to_string(types.wildcard_all()), "?");
  EXPECT_EQ(to_string(types.wildcard_extends(number())), "? extends Number");
  EXPECT_EQ(to_string(types.wildcard_super(integer())), "? super Integer");
  EXPECT_EQ(to_string(types.get_array(string())), "String[]");
  EXPECT_EQ(to_string(core.list->param(size_t{0})), "E");
  EXPECT_EQ(to_string(nullptr), "<unresolved>");
}
