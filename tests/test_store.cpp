/**
 * @file test_store.cpp
 * @brief Tests for AppStore semantics on InMemoryAppStore.
 */

#include "apl/store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>

namespace {

apl::EventList CreatedAndSelected(const char* uuid) {
  apl::AppId id(apl::TruncateToCapacity, uuid);
  apl::EventList events;
  events.push_back(apl::AppCreated(id));
  events.push_back(apl::ExistingInfrastructureSelected(id, apl::AzureTarget{}));
  return events;
}

}  // namespace

TEST_CASE("store - load of unknown entity is not found", "[store]") {
  apl::InMemoryAppStore store;
  auto r = store.Load("missing");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == apl::StoreError::kNotFound);
  REQUIRE(store.ReadEvents("missing").get_error() ==
          apl::StoreError::kNotFound);
  REQUIRE(store.Size() == 0);
}

TEST_CASE("store - append folds events into the snapshot", "[store]") {
  apl::InMemoryAppStore store;
  REQUIRE(store.AppendEvents("u1", CreatedAndSelected("u1"), 0).has_value());

  auto loaded = store.Load("u1");
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value() ==
          apl::AppSnapshot{"u1", apl::AppStatus::kNew,
                           apl::Selected{apl::Provider::kAzure}, 2});

  auto events = store.ReadEvents("u1");
  REQUIRE(events.has_value());
  REQUIRE(events.value() == CreatedAndSelected("u1"));
  REQUIRE(store.Size() == 1);
}

TEST_CASE("store - stale version is a conflict", "[store]") {
  apl::InMemoryAppStore store;
  REQUIRE(store.AppendEvents("u1", CreatedAndSelected("u1"), 0).has_value());

  apl::EventList activate;
  activate.push_back(apl::AppActivated("u1"));
  auto stale = store.AppendEvents("u1", activate, 1);
  REQUIRE(!stale.has_value());
  REQUIRE(stale.get_error() == apl::StoreError::kConflict);
  REQUIRE(store.Load("u1").value().status == apl::AppStatus::kNew);

  REQUIRE(store.AppendEvents("u1", activate, 2).has_value());
  REQUIRE(store.Load("u1").value().status == apl::AppStatus::kActive);
  REQUIRE(store.Load("u1").value().version == 3);
}

TEST_CASE("store - creating twice conflicts", "[store]") {
  apl::InMemoryAppStore store;
  apl::EventList created;
  created.push_back(apl::AppCreated("u1"));
  REQUIRE(store.AppendEvents("u1", created, 0).has_value());
  REQUIRE(store.AppendEvents("u1", created, 0).get_error() ==
          apl::StoreError::kConflict);
}

TEST_CASE("store - empty append checks version only", "[store]") {
  apl::InMemoryAppStore store;
  REQUIRE(store.AppendEvents("u1", {}, 0).has_value());
  REQUIRE(store.Size() == 0);
  REQUIRE(store.AppendEvents("u1", {}, 3).get_error() ==
          apl::StoreError::kConflict);
}

TEST_CASE("store - illegal history is stored as corrupted", "[store]") {
  apl::InMemoryAppStore store;
  apl::EventList events;
  events.push_back(apl::AppCreated("u1"));
  events.push_back(apl::AppActivated("u1"));
  REQUIRE(store.AppendEvents("u1", events, 0).has_value());
  REQUIRE(store.Load("u1").value().status == apl::AppStatus::kCorrupted);
}

TEST_CASE("store - Import seeds a base snapshot", "[store][import]") {
  apl::InMemoryAppStore store;
  store.Import(apl::PersistedApp{"u9", apl::AppStatus::kActive,
                                 apl::InfrastructureStatus::kSelected,
                                 apl::Provider::kAws, 12});
  auto loaded = store.Load("u9");
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().status == apl::AppStatus::kActive);
  REQUIRE(loaded.value().version == 12);
  REQUIRE(store.ReadEvents("u9").value().empty());

  apl::EventList del;
  del.push_back(apl::AppDeleted("u9"));
  REQUIRE(store.AppendEvents("u9", del, 12).has_value());
  REQUIRE(store.Load("u9").value().status == apl::AppStatus::kDeleted);
  REQUIRE(store.Load("u9").value().version == 13);
}

TEST_CASE("store - concurrent writers at the same version", "[store][concurrency]") {
  apl::InMemoryAppStore store;
  REQUIRE(store.AppendEvents("u1", CreatedAndSelected("u1"), 0).has_value());

  std::atomic<int> wins{0};
  std::atomic<int> conflicts{0};
  auto writer = [&store, &wins, &conflicts]() {
    apl::EventList activate;
    activate.push_back(apl::AppActivated("u1"));
    auto r = store.AppendEvents("u1", activate, 2);
    if (r.has_value()) {
      wins.fetch_add(1);
    } else if (r.get_error() == apl::StoreError::kConflict) {
      conflicts.fetch_add(1);
    }
  };

  std::thread t1(writer);
  std::thread t2(writer);
  t1.join();
  t2.join();

  REQUIRE(wins.load() == 1);
  REQUIRE(conflicts.load() == 1);
  REQUIRE(store.Load("u1").value().version == 3);
  REQUIRE(store.ReadEvents("u1").value().size() == 3);
}
