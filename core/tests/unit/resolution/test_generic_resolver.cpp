// tests/unit/resolution/test_generic_resolver.cpp - Placeholder resolution

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "typeweave/basic/error.hpp"
#include "typeweave/operations/transform.hpp"
#include "typeweave/resolution/generic_resolver.hpp"
#include "typeweave/test_support/fixtures.hpp"

using namespace typeweave;
using namespace typeweave::test_support;

namespace
{

class ResolutionGenericResolver : public ::testing::Test
{
protected:
  TypeContext types;
  const CoreEntities & core = types.core();
  GenericResolver resolver{types};

  const TypeExpr * string() const { return core.string->raw_type(); }
  const TypeExpr * integer() const { return core.integer->raw_type(); }
};

/// Holder<V> implements Source<V>; value_type() binds V explicitly.
struct HolderTypes
{
  const Entity * source = nullptr;
  Entity * holder = nullptr;
};

HolderTypes declare_holder(TypeContext & types, const TypeExpr * bound)
{
  Entity & source = types.declare_interface("Source", {"S"});
  Entity & holder = types.declare_class("Holder", {"V"});
  holder.add_interface(types.get_named(source, {holder.param("V")}));
  holder.add_binding_accessor(MethodDecl{
    "value_type", {}, types.get_named(*types.core().typed, {holder.param("V")}),
    [bound](const Instance &) { return bound; }});
  return HolderTypes{&source, &holder};
}

}  // namespace

TEST_F(ResolutionGenericResolver, SupertypeArgumentBindsInheritedPlaceholder)
{
  const BoxTypes boxes = declare_boxes(types);
  const PlainInstance instance(*boxes.string_box);

  EXPECT_EQ(resolver.resolve(instance, boxes.box->param("T")), string());
}

TEST_F(ResolutionGenericResolver, UnboundPlaceholderResolvesToNull)
{
  const BoxTypes boxes = declare_boxes(types);
  const PlainInstance instance(*boxes.box);

  EXPECT_EQ(resolver.resolve(instance, boxes.box->param("T")), nullptr);
}

TEST_F(ResolutionGenericResolver, ExplicitBindingWins)
{
  const HolderTypes holder = declare_holder(types, integer());
  Entity & strings = types.declare_class("StringHolder");
  strings.set_superclass(types.get_named(*holder.holder, {string()}));
  const PlainInstance instance(strings);

  // The accessor is consulted even though the hierarchy fixes V = String
  EXPECT_EQ(resolver.resolve(instance, holder.holder->param("V")), integer());
}

TEST_F(ResolutionGenericResolver, ExplicitBindingReachesAliases)
{
  const HolderTypes holder = declare_holder(types, integer());
  const PlainInstance instance(*holder.holder);

  // Source.S is assigned Holder.V, the accessor's placeholder
  EXPECT_EQ(resolver.resolve(instance, holder.source->param("S")), integer());
}

TEST_F(ResolutionGenericResolver, TransformBindingsFlowToConvertPlaceholders)
{
  const Entity & convert = Convert::declare(types);
  const Entity & transform = declare_transform(types);
  const TypeExpr * list_of_string = types.get_named(*core.list, {string()});
  Convert op(types, read_only(list_of_string, {}), read_write(integer()));

  EXPECT_EQ(resolver.resolve(op, transform.param("SOURCE")), list_of_string);
  EXPECT_EQ(resolver.resolve(op, transform.param("TARGET")), integer());
  EXPECT_EQ(resolver.resolve(op, convert.param("SOURCE")), list_of_string);
  EXPECT_EQ(resolver.resolve(op, convert.param("TARGET")), integer());

  const TypeExpr * signature = types.get_named(convert, {convert.param("SOURCE"), convert.param("TARGET")});
  EXPECT_EQ(
    resolver.resolve_deep(op, signature), types.get_named(convert, {list_of_string, integer()}));
}

TEST_F(ResolutionGenericResolver, AccessorReturningNullIsUnresolved)
{
  const HolderTypes holder = declare_holder(types, nullptr);
  const PlainInstance instance(*holder.holder);

  EXPECT_EQ(resolver.resolve(instance, holder.holder->param("V")), nullptr);
  // resolve_deep leaves unresolved placeholders in place
  EXPECT_EQ(resolver.resolve_deep(instance, holder.holder->param("V")), holder.holder->param("V"));
}

TEST_F(ResolutionGenericResolver, ForeignPlaceholderIsRejected)
{
  const BoxTypes boxes = declare_boxes(types);
  const PlainInstance instance(*boxes.string_box);
  try {
    (void)resolver.resolve(instance, core.list->param(size_t{0}));
    FAIL() << "expected PlaceholderNotOwned";
  } catch (const ResolutionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::PlaceholderNotOwned);
    EXPECT_EQ(std::string(e.what()), "List.E does not belong to StringBox");
  }
}

TEST_F(ResolutionGenericResolver, NonEntityPlaceholderIsRejected)
{
  const BoxTypes boxes = declare_boxes(types);
  const PlainInstance instance(*boxes.string_box);

  try {
    (void)resolver.resolve(instance, types.create_method_placeholder("convert", "T"));
    FAIL() << "expected InvalidPlaceholderKind";
  } catch (const ResolutionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidPlaceholderKind);
  }
  try {
    (void)resolver.resolve(instance, string());
    FAIL() << "expected InvalidPlaceholderKind";
  } catch (const ResolutionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidPlaceholderKind);
  }
}

TEST_F(ResolutionGenericResolver, ResolveDeepSubstitutesNestedTypes)
{
  const BoxTypes boxes = declare_boxes(types);
  const PlainInstance instance(*boxes.string_box);
  const TypeExpr * t = boxes.box->param("T");

  EXPECT_EQ(resolver.resolve_deep(instance, types.get_named(*core.list, {t})),
            types.get_named(*core.list, {string()}));
  EXPECT_EQ(resolver.resolve_deep(instance, types.get_array(t)), types.get_array(string()));
  EXPECT_EQ(resolver.resolve_deep(instance, types.wildcard_super(t)), types.wildcard_super(string()));
  // Placeholders of unrelated entities are kept
  const TypeExpr * e = core.list->param(size_t{0});
  EXPECT_EQ(resolver.resolve_deep(instance, e), e);
}

TEST_F(ResolutionGenericResolver, LeafCachesAreShared)
{
  const BoxTypes boxes = declare_boxes(types);
  const SubstitutionMap & first = resolver.substitution_map(*boxes.string_box);
  const SubstitutionMap & second = resolver.substitution_map(*boxes.string_box);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(first.find(boxes.box->param("T")), string());
  EXPECT_TRUE(resolver.binding_table(*boxes.string_box).empty());
}

TEST_F(ResolutionGenericResolver, ConcurrentResolutionAgrees)
{
  const BoxTypes boxes = declare_boxes(types);
  const HolderTypes holder = declare_holder(types, integer());
  const PlainInstance box_instance(*boxes.string_box);
  const PlainInstance holder_instance(*holder.holder);

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      for (int n = 0; n < 200; ++n) {
        if (resolver.resolve(box_instance, boxes.box->param("T")) != string()) {
          ++mismatches;
        }
        if (resolver.resolve(holder_instance, holder.source->param("S")) != integer()) {
          ++mismatches;
        }
      }
    });
  }
  for (auto & t : threads) {
    t.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}
