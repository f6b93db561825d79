// tests/unit/dispatch/test_operator_registry.cpp - Registry assembly and ordering

#include <gtest/gtest.h>

#include "typeweave/basic/error.hpp"
#include "typeweave/dispatch/operator_registry.hpp"
#include "typeweave/test_support/fixtures.hpp"

using namespace typeweave;
using namespace typeweave::test_support;

namespace
{

class DispatchOperatorRegistry : public ::testing::Test
{
protected:
  TypeContext types;
  GenericResolver resolver{types};
  std::shared_ptr<std::vector<std::string>> log = std::make_shared<std::vector<std::string>>();

  std::shared_ptr<ScriptedOperator> op(const std::string & name, std::vector<std::string> deps = {})
  {
    return recording_operator(
      types, name, Probe::of(types, types.wildcard_all()), log, true, std::move(deps));
  }

  Module module_of(std::vector<std::shared_ptr<ScriptedOperator>> ops, std::string name = "test")
  {
    Module m(std::move(name));
    for (auto & o : ops) {
      m.add(o);
    }
    return m;
  }
};

/// Operator whose entity does not implement Operator<OPERATION>.
class Impostor : public Operator
{
public:
  using Operator::Operator;

  [[nodiscard]] bool supports(Context &, const Operation &) const override { return false; }
  bool perform(Context &, Operation &) const override { return false; }
};

}  // namespace

TEST_F(DispatchOperatorRegistry, RegistrationOrderIsKeptWithoutEdges)
{
  const auto registry =
    OperatorRegistry::assemble(resolver, {module_of({op("A"), op("B"), op("C")})});
  EXPECT_EQ(registry.order(), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(registry.size(), 3U);
}

TEST_F(DispatchOperatorRegistry, DependenciesComeFirst)
{
  const auto registry = OperatorRegistry::assemble(resolver, {module_of({op("B", {"A"}), op("A")})});
  EXPECT_EQ(registry.order(), (std::vector<std::string>{"A", "B"}));
}

TEST_F(DispatchOperatorRegistry, EdgesFromModulesAndOptions)
{
  Module first = module_of({op("A"), op("B")}, "first");
  first.add_dependency("A", "C");
  Module second = module_of({op("C"), op("D")}, "second");

  AssemblyOptions options;
  options.dependencies.push_back(PrecedenceEdge{"C", "D"});

  const auto registry = OperatorRegistry::assemble(resolver, {first, second}, options);
  EXPECT_EQ(registry.order(), (std::vector<std::string>{"D", "C", "A", "B"}));
  ASSERT_NE(registry.find("A"), nullptr);
  EXPECT_EQ(registry.find("A")->module, "first");
  EXPECT_EQ(registry.find("D")->module, "second");
  EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST_F(DispatchOperatorRegistry, UnknownAndDisabledNamesAreIgnored)
{
  AssemblyOptions options;
  options.disabled.push_back("B");
  options.dependencies.push_back(PrecedenceEdge{"C", "Nowhere"});

  const auto registry = OperatorRegistry::assemble(
    resolver, {module_of({op("A", {"B"}), op("B"), op("C")})}, options);
  EXPECT_EQ(registry.order(), (std::vector<std::string>{"A", "C"}));
}

TEST_F(DispatchOperatorRegistry, CycleIsReported)
{
  try {
    (void)OperatorRegistry::assemble(resolver, {module_of({op("A", {"B"}), op("B", {"A"})})});
    FAIL() << "expected CyclicPrecedence";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::CyclicPrecedence);
    EXPECT_EQ(std::string(e.what()), "cyclic operator precedence: A -> B -> A");
  }
}

TEST_F(DispatchOperatorRegistry, DeclaredOperationTypeIsNormalized)
{
  const TypeExpr * probe_of_list =
    Probe::of(types, types.get_named(*types.core().list, {types.wildcard_all()}));
  auto list_op = recording_operator(types, "ListProbe", probe_of_list, log);

  const auto registry = OperatorRegistry::assemble(resolver, {module_of({list_op, op("Any")})});
  EXPECT_EQ(registry.find("ListProbe")->operation_type, probe_of_list);
  EXPECT_EQ(registry.find("Any")->operation_type, Probe::of(types, types.wildcard_all()));
}

TEST_F(DispatchOperatorRegistry, NonOperatorEntityIsMalformed)
{
  Module m("test");
  m.add(std::make_shared<Impostor>(types.declare_class("Impostor")));
  try {
    (void)OperatorRegistry::assemble(resolver, {m});
    FAIL() << "expected MalformedDeclaration";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MalformedDeclaration);
  }
}

TEST_F(DispatchOperatorRegistry, NonOperationSignatureIsMalformed)
{
  auto bad = recording_operator(types, "Bad", types.core().string->raw_type(), log);
  try {
    (void)OperatorRegistry::assemble(resolver, {module_of({bad})});
    FAIL() << "expected MalformedDeclaration";
  } catch (const DefinitionError & e) {
    EXPECT_EQ(e.code(), ErrorCode::MalformedDeclaration);
    EXPECT_EQ(std::string(e.what()), "operator 'Bad' declares String, which is not an operation type");
  }
}
