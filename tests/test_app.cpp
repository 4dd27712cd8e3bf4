/**
 * @file test_app.cpp
 * @brief Tests for the typestate application entity.
 */

#include "apl/app.hpp"

#include <catch2/catch_test_macros.hpp>

#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// ============================================================================
// Compile-time operation table
// ============================================================================

namespace {

template <typename T, typename = void>
struct HasSelectInfrastructure : std::false_type {};
template <typename T>
struct HasSelectInfrastructure<
    T, std::void_t<decltype(std::declval<T&&>().SelectInfrastructure(
           std::declval<const apl::InfrastructureTarget&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct HasRequestBuild : std::false_type {};
template <typename T>
struct HasRequestBuild<
    T, std::void_t<decltype(std::declval<T&&>().RequestBuild(
           std::declval<const apl::InfrastructureTarget&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct HasActivate : std::false_type {};
template <typename T>
struct HasActivate<T, std::void_t<decltype(std::declval<T&&>().Activate())>>
    : std::true_type {};

template <typename T, typename = void>
struct HasDelete : std::false_type {};
template <typename T>
struct HasDelete<T, std::void_t<decltype(std::declval<T&&>().Delete())>>
    : std::true_type {};

// Operations consume the value: they are not callable on an lvalue.
template <typename T, typename = void>
struct HasDeleteOnLvalue : std::false_type {};
template <typename T>
struct HasDeleteOnLvalue<T,
                         std::void_t<decltype(std::declval<T&>().Delete())>>
    : std::true_type {};

apl::AwsTarget UsEast() { return apl::AwsTarget(apl::AwsRegion("us-east-1")); }

template <typename Stage>
Stage Reconstruct(const apl::AppSnapshot& s) {
  apl::App app = apl::FromPersisted(s);
  REQUIRE(std::holds_alternative<Stage>(app));
  return std::get<Stage>(std::move(app));
}

}  // namespace

static_assert(HasSelectInfrastructure<apl::NewApp>::value, "");
static_assert(HasDelete<apl::NewApp>::value, "");
static_assert(!HasActivate<apl::NewApp>::value, "");
static_assert(!HasRequestBuild<apl::NewApp>::value, "");

static_assert(HasActivate<apl::NotActivatedApp>::value, "");
static_assert(HasRequestBuild<apl::NotActivatedApp>::value, "");
static_assert(HasDelete<apl::NotActivatedApp>::value, "");
static_assert(!HasSelectInfrastructure<apl::NotActivatedApp>::value, "");

static_assert(HasDelete<apl::ActiveApp>::value, "");
static_assert(!HasActivate<apl::ActiveApp>::value, "");
static_assert(!HasSelectInfrastructure<apl::ActiveApp>::value, "");
static_assert(!HasRequestBuild<apl::ActiveApp>::value, "");

static_assert(!HasDelete<apl::DeletedApp>::value, "");
static_assert(!HasActivate<apl::DeletedApp>::value, "");
static_assert(!HasSelectInfrastructure<apl::DeletedApp>::value, "");
static_assert(!HasRequestBuild<apl::DeletedApp>::value, "");

static_assert(!HasDelete<apl::CorruptedApp>::value, "");
static_assert(!HasActivate<apl::CorruptedApp>::value, "");
static_assert(!HasSelectInfrastructure<apl::CorruptedApp>::value, "");
static_assert(!HasRequestBuild<apl::CorruptedApp>::value, "");

static_assert(!HasDeleteOnLvalue<apl::NewApp>::value, "");
static_assert(!HasDeleteOnLvalue<apl::ActiveApp>::value, "");

// Stages can only be obtained through Create, a transition or FromPersisted.
static_assert(!std::is_constructible<apl::NewApp, apl::AppSnapshot,
                                     apl::EventList>::value, "");
static_assert(!std::is_default_constructible<apl::ActiveApp>::value, "");

// ============================================================================
// Create
// ============================================================================

TEST_CASE("app - Create emits AppCreated", "[app]") {
  apl::NewApp app = apl::NewApp::Create("u1");
  REQUIRE(app.Snapshot() ==
          apl::AppSnapshot{"u1", apl::AppStatus::kNew, apl::NotSelected{}, 1});
  REQUIRE(app.Events().size() == 1);
  REQUIRE(std::holds_alternative<apl::AppCreated>(app.Events().front()));
}

// ============================================================================
// Lifecycle scenarios
// ============================================================================

TEST_CASE("app - select, activate, delete", "[app][scenario]") {
  apl::NewApp fresh = Reconstruct<apl::NewApp>(
      {"u1", apl::AppStatus::kNew, apl::NotSelected{}, 1});
  REQUIRE(fresh.Events().empty());

  apl::NotActivatedApp selected =
      std::move(fresh).SelectInfrastructure(UsEast());
  REQUIRE(selected.Snapshot().status == apl::AppStatus::kNew);
  REQUIRE(selected.Snapshot().infrastructure ==
          apl::Infrastructure(apl::Selected{apl::Provider::kAws}));
  REQUIRE(selected.SelectedProvider() == apl::Provider::kAws);
  REQUIRE(selected.Events().size() == 1);
  REQUIRE(selected.Events().front() ==
          apl::AppDomainEvent(
              apl::ExistingInfrastructureSelected("u1", UsEast())));

  apl::ActiveApp active = std::move(selected).Activate();
  REQUIRE(active.Snapshot().status == apl::AppStatus::kActive);
  REQUIRE(active.Snapshot().infrastructure ==
          apl::Infrastructure(apl::Selected{apl::Provider::kAws}));
  REQUIRE(active.Events().size() == 1);
  REQUIRE(std::holds_alternative<apl::AppActivated>(active.Events().front()));

  apl::DeletedApp deleted = std::move(active).Delete();
  REQUIRE(deleted.Snapshot().status == apl::AppStatus::kDeleted);
  REQUIRE(deleted.Snapshot().infrastructure ==
          apl::Infrastructure(apl::Selected{apl::Provider::kAws}));
  REQUIRE(deleted.Events().size() == 1);
  REQUIRE(std::holds_alternative<apl::AppDeleted>(deleted.Events().front()));
  REQUIRE(deleted.Snapshot().version == 4);
}

TEST_CASE("app - delete before selection", "[app]") {
  apl::DeletedApp deleted = apl::NewApp::Create("u1").Delete();
  REQUIRE(deleted.Snapshot().status == apl::AppStatus::kDeleted);
  REQUIRE(!apl::IsSelected(deleted.Snapshot().infrastructure));
}

TEST_CASE("app - delete without activation", "[app]") {
  apl::DeletedApp deleted = apl::NewApp::Create("u1")
                                .SelectInfrastructure(apl::AzureTarget{})
                                .Delete();
  REQUIRE(deleted.Snapshot().infrastructure ==
          apl::Infrastructure(apl::Selected{apl::Provider::kAzure}));
}

TEST_CASE("app - RequestBuild keeps the stage", "[app]") {
  apl::NotActivatedApp selected = Reconstruct<apl::NotActivatedApp>(
      {"u1", apl::AppStatus::kNew, apl::Selected{apl::Provider::kAws}, 2});
  apl::NotActivatedApp built = std::move(selected).RequestBuild(UsEast());

  REQUIRE(built.Snapshot() ==
          apl::AppSnapshot{"u1", apl::AppStatus::kNew,
                           apl::Selected{apl::Provider::kAws}, 3});
  REQUIRE(built.Events().size() == 1);
  REQUIRE(built.Events().front() ==
          apl::AppDomainEvent(apl::BuildRequested("u1", UsEast())));

  apl::ActiveApp active = std::move(built).Activate();
  REQUIRE(active.Snapshot().version == 4);
}

TEST_CASE("app - emitted events replay to the same snapshot", "[app]") {
  apl::NewApp created = apl::NewApp::Create("u7");
  apl::EventList history = created.Events();
  apl::NotActivatedApp selected =
      std::move(created).SelectInfrastructure(apl::AzureTarget{});
  history.push_back(selected.Events().front());
  apl::ActiveApp active = std::move(selected).Activate();
  history.push_back(active.Events().front());

  auto replayed = apl::Replay(history);
  REQUIRE(replayed.has_value());
  REQUIRE(replayed.value() == active.Snapshot());
}

// ============================================================================
// Reconstruction
// ============================================================================

TEST_CASE("app - FromPersisted picks the stage", "[app][persisted]") {
  using apl::AppKind;
  using apl::AppStatus;
  const apl::Infrastructure none = apl::NotSelected{};
  const apl::Infrastructure aws = apl::Selected{apl::Provider::kAws};

  REQUIRE(apl::KindOf(apl::FromPersisted(
              apl::AppSnapshot{"u1", AppStatus::kNew, none, 1})) ==
          AppKind::kNew);
  REQUIRE(apl::KindOf(apl::FromPersisted(
              apl::AppSnapshot{"u1", AppStatus::kNew, aws, 2})) ==
          AppKind::kNotActivated);
  REQUIRE(apl::KindOf(apl::FromPersisted(
              apl::AppSnapshot{"u1", AppStatus::kActive, aws, 3})) ==
          AppKind::kActive);
  REQUIRE(apl::KindOf(apl::FromPersisted(
              apl::AppSnapshot{"u1", AppStatus::kDeleted, none, 2})) ==
          AppKind::kDeleted);
  REQUIRE(apl::KindOf(apl::FromPersisted(
              apl::AppSnapshot{"u1", AppStatus::kDeleted, aws, 4})) ==
          AppKind::kDeleted);
  REQUIRE(apl::KindOf(apl::FromPersisted(
              apl::AppSnapshot{"u1", AppStatus::kCorrupted, aws, 4})) ==
          AppKind::kCorrupted);
}

TEST_CASE("app - active without infrastructure is corrupted",
          "[app][persisted]") {
  apl::App app = apl::FromPersisted(
      apl::AppSnapshot{"u1", apl::AppStatus::kActive, apl::NotSelected{}, 3});
  REQUIRE(std::holds_alternative<apl::CorruptedApp>(app));
  REQUIRE(apl::SnapshotOf(app).status == apl::AppStatus::kCorrupted);
  REQUIRE(apl::SnapshotOf(app).uuid == "u1");
  REQUIRE(apl::EventsOf(app).empty());
}

TEST_CASE("app - inconsistent persisted record is corrupted",
          "[app][persisted]") {
  apl::PersistedApp rec{"u1", apl::AppStatus::kActive,
                        apl::InfrastructureStatus::kSelected, {}, 3};
  REQUIRE(apl::KindOf(apl::FromPersisted(rec)) == apl::AppKind::kCorrupted);

  apl::PersistedApp ok{"u1", apl::AppStatus::kActive,
                       apl::InfrastructureStatus::kSelected,
                       apl::Provider::kAzure, 3};
  REQUIRE(apl::KindOf(apl::FromPersisted(ok)) == apl::AppKind::kActive);
}

TEST_CASE("app - reachable snapshots round-trip", "[app][persisted]") {
  const std::vector<apl::AppSnapshot> reachable = {
      {"u1", apl::AppStatus::kNew, apl::NotSelected{}, 1},
      {"u1", apl::AppStatus::kNew, apl::Selected{apl::Provider::kAws}, 2},
      {"u1", apl::AppStatus::kNew, apl::Selected{apl::Provider::kAzure}, 3},
      {"u1", apl::AppStatus::kActive, apl::Selected{apl::Provider::kAws}, 3},
      {"u1", apl::AppStatus::kDeleted, apl::NotSelected{}, 2},
      {"u1", apl::AppStatus::kDeleted, apl::Selected{apl::Provider::kAzure}, 4},
      {"u1", apl::AppStatus::kCorrupted, apl::NotSelected{}, 5},
      {"u1", apl::AppStatus::kCorrupted, apl::Selected{apl::Provider::kAws}, 5},
  };
  for (const auto& s : reachable) {
    REQUIRE(apl::SnapshotOf(apl::FromPersisted(s)) == s);
  }
}

TEST_CASE("app - reconstruction is idempotent", "[app][persisted]") {
  const apl::AppStatus statuses[] = {apl::AppStatus::kNew,
                                     apl::AppStatus::kActive,
                                     apl::AppStatus::kDeleted,
                                     apl::AppStatus::kCorrupted};
  const apl::Infrastructure infras[] = {apl::NotSelected{},
                                        apl::Selected{apl::Provider::kAws},
                                        apl::Selected{apl::Provider::kAzure}};
  for (auto status : statuses) {
    for (const auto& infra : infras) {
      apl::App once = apl::FromPersisted(apl::AppSnapshot{"u1", status, infra, 7});
      apl::App twice = apl::FromPersisted(apl::SnapshotOf(once));
      REQUIRE(twice == once);
    }
  }
}

TEST_CASE("app - stage and event inequality", "[app][equality]") {
  apl::NewApp a = apl::NewApp::Create("u1");
  apl::NewApp b = apl::NewApp::Create("u1");
  apl::NewApp c = apl::NewApp::Create("u2");
  REQUIRE(a == b);
  REQUIRE(!(a != b));
  REQUIRE(a != c);

  // Same snapshot, but only the freshly created value carries events.
  apl::App rebuilt = apl::FromPersisted(a.Snapshot());
  REQUIRE(std::get<apl::NewApp>(rebuilt) != a);

  apl::AppDeleted del1("u1");
  apl::AppDeleted del2("u2");
  REQUIRE(del1 != del2);
  REQUIRE(!(del1 != apl::AppDeleted("u1")));
  REQUIRE(apl::BuildRequested("u1", apl::AzureTarget{}) !=
          apl::BuildRequested("u1", UsEast()));
}
