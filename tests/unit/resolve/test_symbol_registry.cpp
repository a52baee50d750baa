#include <gtest/gtest.h>

#include <memory>

#include "docgraph/model/ids.hpp"
#include "docgraph/resolve/symbol_registry.hpp"

using namespace docgraph;

namespace
{

std::unique_ptr<Method> make_method(
  std::string_view ucid, std::string_view name, std::vector<std::string> types)
{
  auto m = std::make_unique<Method>();
  m->class_ucid = std::string(ucid);
  m->identifier = std::string(name);
  m->parameter_types = std::move(types);
  m->umid = make_umid(ucid, name, m->parameter_types);
  m->scoped_identifier = make_scoped_identifier(ucid, name);
  return m;
}

}  // namespace

TEST(ResolveRegistry, IndexesByUmidScopedAndShortName)
{
  SymbolRegistry reg;
  auto f1 = make_method("a.A", "f", {"int"});
  auto f2 = make_method("a.A", "f", {"int", "int"});
  auto f3 = make_method("b.B", "f", {});

  EXPECT_TRUE(reg.register_method(*f1));
  EXPECT_TRUE(reg.register_method(*f2));
  EXPECT_TRUE(reg.register_method(*f3));

  EXPECT_EQ(reg.lookup_by_umid("a.A#f(int,int)"), f2.get());
  EXPECT_EQ(reg.lookup_by_scoped("a.A.f").size(), 2u);
  EXPECT_EQ(reg.lookup_by_short_name("f").size(), 3u);
  EXPECT_TRUE(reg.lookup_by_scoped("c.C.f").empty());
  EXPECT_EQ(reg.lookup_by_umid("a.A#g()"), nullptr);
  EXPECT_EQ(reg.method_count(), 3u);
}

TEST(ResolveRegistry, RejectsDuplicateIds)
{
  SymbolRegistry reg;
  auto first = make_method("a.A", "f", {"int"});
  auto second = make_method("a.A", "f", {"int"});

  EXPECT_TRUE(reg.register_method(*first));
  EXPECT_FALSE(reg.register_method(*second));
  EXPECT_EQ(reg.lookup_by_umid("a.A#f(int)"), first.get());
  EXPECT_EQ(reg.lookup_by_scoped("a.A.f").size(), 1u);

  Class c1;
  c1.ucid = "a.A";
  Class c2;
  c2.ucid = "a.A";
  EXPECT_TRUE(reg.register_class(c1));
  EXPECT_FALSE(reg.register_class(c2));
  EXPECT_EQ(reg.lookup_class("a.A"), &c1);
}

TEST(ResolveRegistry, SealedRegistryRejectsRegistration)
{
  SymbolRegistry reg;
  auto m = make_method("a.A", "f", {});
  reg.seal();
  EXPECT_TRUE(reg.is_sealed());
  EXPECT_FALSE(reg.register_method(*m));
  EXPECT_FALSE(reg.contains_method("a.A#f()"));
}

TEST(ResolveRegistry, IterationFollowsRegistrationOrder)
{
  SymbolRegistry reg;
  auto z = make_method("z.Z", "z", {});
  auto a = make_method("a.A", "a", {});
  ASSERT_TRUE(reg.register_method(*z));
  ASSERT_TRUE(reg.register_method(*a));

  ASSERT_EQ(reg.methods().size(), 2u);
  EXPECT_EQ(reg.methods()[0], z.get());
  EXPECT_EQ(reg.methods()[1], a.get());
}
