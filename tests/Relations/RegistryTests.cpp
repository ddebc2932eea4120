// RegistryTests.cpp - tests for relation type registration and lookup

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Relations/Relations.hpp>

#include <spdlog/sinks/null_sink.h>

#include <string>

using namespace NGIN::Relations;

namespace RegistryDemo
{
  // Registration errors are logged; keep test output clean.
  struct QuietLogger
  {
    QuietLogger()
    {
      auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
      Configure(Options{std::make_shared<spdlog::logger>("relations-registry-test", sink)});
    }
    ~QuietLogger() { Configure(Options{}); }
  };
} // namespace RegistryDemo

TEST_CASE("StandardTypesAreRegistered", "[relations][Registry]")
{
  CHECK(RelationTypeBase::ValueOf("StandardTypes.Name") == &StandardTypes::Name);
  CHECK(RelationTypeBase::ValueOf("StandardTypes.Maximum") == &StandardTypes::Maximum);
  CHECK(RelationTypeBase::ValueOf("MetaTypes.Immutable") == &MetaTypes::Immutable);
  CHECK(StandardTypes::Name.Namespace() == "StandardTypes");
  CHECK(StandardTypes::Name.SimpleName() == "Name");
  CHECK(RelationTypeBase::ValueOf("StandardTypes.Missing") == nullptr);
}

TEST_CASE("TypesUnregisterOnDestruction", "[relations][Registry]")
{
  {
    auto scoped = NewIntType("test.registry.Scoped");
    CHECK(scoped.IsRegistered());
    CHECK(RelationTypeBase::ValueOf("test.registry.Scoped") == &scoped);
  }
  CHECK(RelationTypeBase::ValueOf("test.registry.Scoped") == nullptr);

  auto again = NewType<std::string>("test.registry.Scoped");
  CHECK(again.IsRegistered());
  CHECK(RelationTypeBase::ValueOf("test.registry.Scoped") == &again);
}

TEST_CASE("DuplicateNamesAreNotRegistered", "[relations][Registry]")
{
  RegistryDemo::QuietLogger quiet;
  auto first = NewIntType("test.registry.Duplicate");
  auto second = NewType<std::string>("test.registry.Duplicate");

  CHECK(first.IsRegistered());
  CHECK_FALSE(second.IsRegistered());
  CHECK(second.Name() == "test.registry.Duplicate");
  CHECK(RelationTypeBase::ValueOf("test.registry.Duplicate") == &first);
}

TEST_CASE("InvalidNamesAreNotRegistered", "[relations][Registry]")
{
  RegistryDemo::QuietLogger quiet;
  auto empty = NewIntType("");
  auto dotted = NewIntType("test..Dotted");
  auto trailing = NewIntType("test.registry.");
  auto digit = NewIntType("9test");

  CHECK_FALSE(empty.IsRegistered());
  CHECK_FALSE(dotted.IsRegistered());
  CHECK_FALSE(trailing.IsRegistered());
  CHECK_FALSE(digit.IsRegistered());
  CHECK(RelationTypeBase::ValueOf("test..Dotted") == nullptr);

  // Unregistered types still work as descriptors.
  Relatable o;
  REQUIRE(o.Set(dotted, 4).has_value());
  CHECK(o.Get(dotted).value() == 4);
}

TEST_CASE("RelationTypesCanBeFiltered", "[relations][Registry]")
{
  auto a = NewIntType("test.registry.filter.A");
  auto b = NewType<std::string>("test.registry.filter.B");
  auto c = NewIntType("test.registry.other.C");

  auto inNamespace = RelationTypeBase::GetRelationTypes([](const RelationTypeBase &t)
                                                        { return t.Namespace() == "test.registry.filter"; });
  REQUIRE(inNamespace.Size() == 2);
  CHECK(inNamespace[0] == &a);
  CHECK(inNamespace[1] == &b);

  auto all = RelationTypeBase::GetRegisteredRelationTypes();
  CHECK(all.Size() >= 3);
  CHECK(b.ValueTypeName().find("string") != std::string_view::npos);
  CHECK(a.ValueTypeId() == c.ValueTypeId());
}
