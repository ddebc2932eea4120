/// @file BasicTests.cpp
/// @brief Smoke tests for NGIN.Relations and its logger configuration.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Relations/Relations.hpp>

#include <spdlog/sinks/null_sink.h>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[relations][Basics]") {
  CHECK(NGIN::Relations::LibraryName() == std::string_view{"NGIN.Relations"});
}

TEST_CASE("ConfigureInstallsLogger", "[relations][Basics]") {
  using namespace NGIN::Relations;

  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("relations-test", sink);
  Configure(Options{logger});

  CHECK(GetOptions().logger == logger);
  CHECK(&Logger() == logger.get());

  Configure(Options{});
  CHECK(&Logger() == spdlog::default_logger().get());
}

TEST_CASE("ErrorCodesHaveNames", "[relations][Basics]") {
  using namespace NGIN::Relations;
  CHECK(ToString(ErrorCode::ConstraintViolation) == std::string_view{"ConstraintViolation"});
  CHECK(ToString(ErrorCode::ImmutableViolation) == std::string_view{"ImmutableViolation"});
  CHECK(ToString(EventType::Update) == std::string_view{"UPDATE"});
}

TEST_CASE("ModifiersCombine", "[relations][Basics]") {
  using namespace NGIN::Relations;
  const Modifiers m = Modifier::Final | Modifier::Private;
  CHECK(m.Has(Modifier::Final));
  CHECK(m.Has(Modifier::Private));
  CHECK_FALSE(m.Has(Modifier::ReadOnly));
  CHECK(Modifiers{}.IsEmpty());
  CHECK(Modifiers{Modifier::ReadOnly, Modifier::Transient}.Has(Modifier::Transient));
}
