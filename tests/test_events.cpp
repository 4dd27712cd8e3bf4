/**
 * @file test_events.cpp
 * @brief Tests for the domain event catalog.
 */

#include "apl/events.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <type_traits>

// ============================================================================
// Structural typing
// ============================================================================

// Payload is mandatory: no event can be default-constructed.
static_assert(!std::is_default_constructible<apl::AppCreated>::value, "");
static_assert(!std::is_default_constructible<
                  apl::ExistingInfrastructureSelected>::value, "");
static_assert(!std::is_default_constructible<apl::BuildRequested>::value, "");
static_assert(!std::is_default_constructible<apl::AwsTarget>::value,
              "AWS target requires a region");
static_assert(!std::is_constructible<apl::AzureTarget, apl::AwsRegion>::value,
              "AZURE target has no region");
static_assert(!std::is_constructible<apl::ExistingInfrastructureSelected,
                                     apl::AppId>::value,
              "selection requires a target");

TEST_CASE("events - type tags and names", "[events]") {
  apl::AppDomainEvent created = apl::AppCreated("u1");
  apl::AppDomainEvent selected = apl::ExistingInfrastructureSelected(
      "u1", apl::AwsTarget(apl::AwsRegion("us-east-1")));
  apl::AppDomainEvent build =
      apl::BuildRequested("u1", apl::AzureTarget{});
  apl::AppDomainEvent activated = apl::AppActivated("u1");
  apl::AppDomainEvent deleted = apl::AppDeleted("u1");

  REQUIRE(apl::TypeOf(created) == apl::EventType::kAppCreated);
  REQUIRE(apl::TypeOf(selected) ==
          apl::EventType::kExistingInfrastructureSelected);
  REQUIRE(apl::TypeOf(build) == apl::EventType::kBuildRequested);
  REQUIRE(apl::TypeOf(activated) == apl::EventType::kAppActivated);
  REQUIRE(apl::TypeOf(deleted) == apl::EventType::kAppDeleted);

  REQUIRE(std::strcmp(apl::EventName(created), "AppCreated") == 0);
  REQUIRE(std::strcmp(apl::EventName(selected),
                      "ExistingInfrastructureSelected") == 0);
  REQUIRE(std::strcmp(apl::EventName(build), "BuildRequested") == 0);
  REQUIRE(std::strcmp(apl::EventName(activated), "AppActivated") == 0);
  REQUIRE(std::strcmp(apl::EventName(deleted), "AppDeleted") == 0);
}

TEST_CASE("events - every event carries its uuid", "[events]") {
  apl::EventList list;
  list.push_back(apl::AppCreated("abc"));
  list.push_back(apl::ExistingInfrastructureSelected("abc",
                                                     apl::AzureTarget{}));
  list.push_back(apl::AppActivated("abc"));
  list.push_back(apl::AppDeleted("abc"));
  for (const auto& e : list) {
    REQUIRE(apl::EventUuid(e) == "abc");
  }
}

TEST_CASE("events - TargetOf only for infrastructure events", "[events]") {
  apl::AppDomainEvent sel = apl::ExistingInfrastructureSelected(
      "u1", apl::AwsTarget(apl::AwsRegion("eu-west-1")));
  auto target = apl::TargetOf(sel);
  REQUIRE(target.has_value());
  REQUIRE(apl::ProviderOf(target.value()) == apl::Provider::kAws);
  REQUIRE(std::get<apl::AwsTarget>(target.value()).region == "eu-west-1");

  REQUIRE(!apl::TargetOf(apl::AppActivated("u1")).has_value());
  REQUIRE(apl::TargetOf(apl::BuildRequested("u1", apl::AzureTarget{}))
              .has_value());
}

TEST_CASE("events - unknown event keeps its recorded name", "[events]") {
  apl::AppDomainEvent e = apl::UnknownEvent("u1", "AppRenamed");
  REQUIRE(apl::TypeOf(e) == apl::EventType::kUnknown);
  REQUIRE(std::strcmp(apl::EventName(e), "AppRenamed") == 0);
}

TEST_CASE("events - value equality", "[events]") {
  apl::AwsTarget east(apl::AwsRegion("us-east-1"));
  apl::AwsTarget west(apl::AwsRegion("us-west-2"));

  REQUIRE(apl::ExistingInfrastructureSelected("u1", east) ==
          apl::ExistingInfrastructureSelected("u1", east));
  REQUIRE(apl::ExistingInfrastructureSelected("u1", east) !=
          apl::ExistingInfrastructureSelected("u1", west));
  REQUIRE(apl::ExistingInfrastructureSelected("u1", east) !=
          apl::ExistingInfrastructureSelected("u1", apl::AzureTarget{}));
  REQUIRE(apl::AppDeleted("u1") != apl::AppDeleted("u2"));

  apl::AppDomainEvent a = apl::AppActivated("u1");
  apl::AppDomainEvent b = apl::AppDeleted("u1");
  REQUIRE(a != b);
}
