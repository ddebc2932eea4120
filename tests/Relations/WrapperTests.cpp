// WrapperTests.cpp - tests for relation aliases and views

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Relations/Relations.hpp>

#include <string>
#include <vector>

using namespace NGIN::Relations;

namespace WrapperDemo
{
  struct Removals : RelationListener
  {
    std::vector<std::string> names;
    std::vector<std::string> values;

    std::expected<void, Error> HandleEvent(const RelationEvent &event) override
    {
      if (event.Type() != EventType::Remove)
        return {};
      names.emplace_back(event.ElementType().Name());
      values.push_back(event.ValueAs<std::string>().value_or("?"));
      return {};
    }
  };
} // namespace WrapperDemo

TEST_CASE("AliasReadsAndWritesAliasedRelation", "[relations][Wrappers]")
{
  auto name = NewType<std::string>("test.wrappers.Name");
  auto alias = NewType<std::string>("test.wrappers.AliasName");
  Relatable source;
  Relatable other;

  REQUIRE(source.Set(name, std::string{"a"}).has_value());
  auto aliased = source.AliasAs(name, alias, other);
  REQUIRE(aliased.has_value());
  CHECK((*aliased)->WrappedRelation() == source.GetRelation(name));
  CHECK(source.GetRelation(name)->AliasCount() == 1);
  CHECK(other.Get(alias).value() == "a");

  REQUIRE(source.Set(name, std::string{"b"}).has_value());
  CHECK(other.Get(alias).value() == "b");

  REQUIRE(other.Set(alias, std::string{"c"}).has_value());
  CHECK(source.Get(name).value() == "c");
  CHECK(other.Get(alias).value() == "c");
}

TEST_CASE("AliasUpdatesPassAliasedChecks", "[relations][Wrappers]")
{
  auto fixed = NewType<std::string>("test.wrappers.Fixed", Modifier::Final);
  auto fixedAlias = NewType<std::string>("test.wrappers.FixedAlias");
  auto name = NewType<std::string>("test.wrappers.Frozen");
  auto nameAlias = NewType<std::string>("test.wrappers.FrozenAlias");
  Relatable source;
  Relatable other;

  REQUIRE(source.Set(fixed, std::string{"fixed"}).has_value());
  REQUIRE(source.Set(name, std::string{"name"}).has_value());
  REQUIRE(source.AliasAs(fixed, fixedAlias, other).has_value());
  REQUIRE(source.AliasAs(name, nameAlias, other).has_value());

  auto finalUpdate = other.Set(fixedAlias, std::string{"x"});
  REQUIRE_FALSE(finalUpdate.has_value());
  CHECK(finalUpdate.error().code == ErrorCode::IllegalMutation);
  CHECK(source.Get(fixed).value() == "fixed");

  REQUIRE(source.SetFlag(MetaTypes::Immutable).has_value());
  auto frozen = other.Set(nameAlias, std::string{"y"});
  REQUIRE_FALSE(frozen.has_value());
  CHECK(frozen.error().code == ErrorCode::ImmutableViolation);
  CHECK(source.Get(name).value() == "name");
  CHECK(other.Get(nameAlias).value() == "name");
}

TEST_CASE("DeletingAliasedRelationDeletesAliases", "[relations][Wrappers]")
{
  using WrapperDemo::Removals;
  auto name = NewType<std::string>("test.wrappers.Deleted");
  auto alias = NewType<std::string>("test.wrappers.DeletedAlias");
  auto chained = NewType<std::string>("test.wrappers.DeletedChain");
  Relatable source;
  Relatable other;
  Relatable third;
  Removals removals;

  REQUIRE(source.Set(name, std::string{"gone"}).has_value());
  REQUIRE(source.AliasAs(name, alias, other).has_value());
  REQUIRE(other.AliasAs(alias, chained, third).has_value());
  REQUIRE(other.AddRelationListener(removals).has_value());

  REQUIRE(third.Set(chained, std::string{"through"}).has_value());
  CHECK(source.Get(name).value() == "through");

  REQUIRE(source.DeleteRelation(name).has_value());
  CHECK_FALSE(source.HasRelation(name));
  CHECK_FALSE(other.HasRelation(alias));
  CHECK_FALSE(third.HasRelation(chained));
  REQUIRE(removals.names.size() == 1);
  CHECK(removals.names[0] == "test.wrappers.DeletedAlias");
  CHECK(removals.values[0] == "through");
}

TEST_CASE("DeletingAliasKeepsAliasedRelation", "[relations][Wrappers]")
{
  auto name = NewType<std::string>("test.wrappers.Kept");
  auto alias = NewType<std::string>("test.wrappers.KeptAlias");
  Relatable source;
  Relatable other;

  REQUIRE(source.Set(name, std::string{"kept"}).has_value());
  REQUIRE(source.AliasAs(name, alias, other).has_value());
  REQUIRE(other.DeleteRelation(alias).has_value());

  CHECK_FALSE(other.HasRelation(alias));
  REQUIRE(source.HasRelation(name));
  CHECK(source.GetRelation(name)->AliasCount() == 0);
  CHECK(source.Get(name).value() == "kept");
  REQUIRE(source.Set(name, std::string{"still"}).has_value());
}

TEST_CASE("ViewConvertsAndIsReadOnly", "[relations][Wrappers]")
{
  auto count = NewIntType("test.wrappers.Count");
  auto text = NewType<std::string>("test.wrappers.CountText");
  Relatable source;
  Relatable other;

  REQUIRE(source.Set(count, 3).has_value());
  REQUIRE(source.ViewAs(count, text, other, [](const int &value)
                        { return std::to_string(value); })
              .has_value());
  CHECK(other.Get(text).value() == "3");

  REQUIRE(source.Set(count, 4).has_value());
  CHECK(other.Get(text).value() == "4");

  auto write = other.Set(text, std::string{"9"});
  REQUIRE_FALSE(write.has_value());
  CHECK(write.error().code == ErrorCode::IllegalMutation);
  CHECK(source.Get(count).value() == 4);
}

TEST_CASE("WrappersRejectInvalidSetup", "[relations][Wrappers]")
{
  auto name = NewType<std::string>("test.wrappers.Setup");
  auto alias = NewType<std::string>("test.wrappers.SetupAlias");
  auto size = NewIntType("test.wrappers.SetupSize");
  Relatable source;
  Relatable other;

  auto missing = source.AliasAs(name, alias, other);
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);

  REQUIRE(source.Set(name, std::string{"x"}).has_value());
  REQUIRE(other.Set(alias, std::string{"taken"}).has_value());
  auto taken = source.AliasAs(name, alias, other);
  REQUIRE_FALSE(taken.has_value());
  CHECK(taken.error().code == ErrorCode::IllegalMutation);
  CHECK(other.Get(alias).value() == "taken");

  auto noConversion = source.ViewAs(name, size, other, nullptr);
  REQUIRE_FALSE(noConversion.has_value());
  CHECK(noConversion.error().code == ErrorCode::InvalidArgument);
  CHECK_FALSE(other.HasRelation(size));
}

TEST_CASE("AliasKeepsLastValueWhenAliasedHostIsDestroyed", "[relations][Wrappers]")
{
  auto name = NewType<std::string>("test.wrappers.Detached");
  auto alias = NewType<std::string>("test.wrappers.DetachedAlias");
  Relatable other;

  {
    Relatable source;
    REQUIRE(source.Set(name, std::string{"last"}).has_value());
    REQUIRE(source.AliasAs(name, alias, other).has_value());
  }

  REQUIRE(other.HasRelation(alias));
  CHECK(other.GetRelation(alias)->WrappedRelation() == nullptr);
  CHECK(other.Get(alias).value() == "last");

  auto write = other.Set(alias, std::string{"x"});
  REQUIRE_FALSE(write.has_value());
  CHECK(write.error().code == ErrorCode::NotFound);
}
