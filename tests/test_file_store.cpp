/**
 * @file test_file_store.cpp
 * @brief Tests for the JSONL-backed AppStore.
 */

#include "apl/file_store.hpp"

#include <catch2/catch_test_macros.hpp>

#ifdef APL_JSON_ENABLED

#include "apl/service.hpp"

#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>

#if defined(APL_PLATFORM_LINUX)
#include <sys/resource.h>
#endif

namespace {

namespace fs = std::filesystem;

class TempDir {
 public:
  explicit TempDir(const char* name)
      : path_(fs::temp_directory_path() / name) {
    fs::remove_all(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  std::string str() const { return path_.string(); }
  const fs::path& path() const { return path_; }

 private:
  fs::path path_;
};

apl::EventList Lifecycle(const char* uuid) {
  apl::AppId id(apl::TruncateToCapacity, uuid);
  apl::EventList events;
  events.push_back(apl::AppCreated(id));
  events.push_back(apl::ExistingInfrastructureSelected(
      id, apl::AwsTarget(apl::AwsRegion("us-east-1"))));
  events.push_back(apl::AppActivated(id));
  return events;
}

}  // namespace

TEST_CASE("file_store - unknown entity is not found", "[file_store]") {
  TempDir dir("apl_fs_not_found");
  apl::JsonlAppStore store(dir.str());
  REQUIRE(store.Load("u1").get_error() == apl::StoreError::kNotFound);
  REQUIRE(store.ReadEvents("u1").get_error() == apl::StoreError::kNotFound);
}

TEST_CASE("file_store - events land one per line", "[file_store]") {
  TempDir dir("apl_fs_lines");
  apl::JsonlAppStore store(dir.str());
  REQUIRE(store.AppendEvents("u1", Lifecycle("u1"), 0).has_value());

  std::ifstream in(dir.path() / "u1" / apl::JsonlAppStore::kEventsFile);
  REQUIRE(in.good());
  std::string line;
  int count = 0;
  while (std::getline(in, line)) {
    REQUIRE(apl::DecodeEvent(line).has_value());
    ++count;
  }
  REQUIRE(count == 3);
}

TEST_CASE("file_store - state survives reopening", "[file_store]") {
  TempDir dir("apl_fs_reopen");
  {
    apl::JsonlAppStore store(dir.str());
    REQUIRE(store.AppendEvents("u1", Lifecycle("u1"), 0).has_value());
  }
  apl::JsonlAppStore reopened(dir.str());
  auto loaded = reopened.Load("u1");
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value() ==
          apl::AppSnapshot{"u1", apl::AppStatus::kActive,
                           apl::Selected{apl::Provider::kAws}, 3});
  REQUIRE(reopened.ReadEvents("u1").value() == Lifecycle("u1"));
}

TEST_CASE("file_store - stale version is a conflict", "[file_store]") {
  TempDir dir("apl_fs_conflict");
  apl::JsonlAppStore store(dir.str());
  REQUIRE(store.AppendEvents("u1", Lifecycle("u1"), 0).has_value());

  apl::EventList del;
  del.push_back(apl::AppDeleted("u1"));
  REQUIRE(store.AppendEvents("u1", del, 2).get_error() ==
          apl::StoreError::kConflict);
  REQUIRE(store.AppendEvents("u1", del, 3).has_value());
  REQUIRE(store.Load("u1").value().status == apl::AppStatus::kDeleted);
}

TEST_CASE("file_store - undecodable line is reported, not skipped",
          "[file_store]") {
  TempDir dir("apl_fs_corrupt");
  apl::JsonlAppStore store(dir.str());
  REQUIRE(store.AppendEvents("u1", Lifecycle("u1"), 0).has_value());
  {
    std::ofstream out(dir.path() / "u1" / apl::JsonlAppStore::kEventsFile,
                      std::ios::app);
    out << "{\"type\":\"AppDeleted\"\n";
  }
  REQUIRE(store.Load("u1").get_error() == apl::StoreError::kCorruptLog);
  REQUIRE(store.ReadEvents("u1").get_error() == apl::StoreError::kCorruptLog);
}

TEST_CASE("file_store - Import writes a base snapshot", "[file_store][import]") {
  TempDir dir("apl_fs_import");
  apl::JsonlAppStore store(dir.str());
  REQUIRE(store
              .Import(apl::PersistedApp{"u9", apl::AppStatus::kNew,
                                        apl::InfrastructureStatus::kSelected,
                                        apl::Provider::kAzure, 10})
              .has_value());
  REQUIRE(fs::exists(dir.path() / "u9" / apl::JsonlAppStore::kSnapshotFile));

  auto loaded = store.Load("u9");
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().version == 10);
  REQUIRE(store.ReadEvents("u9").value().empty());

  apl::EventList activate;
  activate.push_back(apl::AppActivated("u9"));
  REQUIRE(store.AppendEvents("u9", activate, 10).has_value());
  REQUIRE(store.Load("u9").value() ==
          apl::AppSnapshot{"u9", apl::AppStatus::kActive,
                           apl::Selected{apl::Provider::kAzure}, 11});
}

TEST_CASE("file_store - Import replaces an existing history",
          "[file_store][import]") {
  TempDir dir("apl_fs_import_over");
  apl::JsonlAppStore store(dir.str());
  REQUIRE(store.AppendEvents("u1", Lifecycle("u1"), 0).has_value());

  const apl::PersistedApp record{"u1", apl::AppStatus::kNew,
                                 apl::InfrastructureStatus::kNotSelected, {},
                                 20};
  REQUIRE(store.Import(record).has_value());
  REQUIRE(!fs::exists(dir.path() / "u1" / apl::JsonlAppStore::kEventsFile));
  REQUIRE(store.ReadEvents("u1").value().empty());
  REQUIRE(store.Load("u1").value() == apl::ToSnapshot(record));
}

TEST_CASE("file_store - failed Import publishes nothing",
          "[file_store][import]") {
  TempDir dir("apl_fs_import_fail");
  // A non-empty directory where the log should be cannot be removed.
  const fs::path entity = dir.path() / "u1";
  fs::create_directories(entity / apl::JsonlAppStore::kEventsFile / "pin");

  apl::JsonlAppStore store(dir.str());
  auto result = store.Import(apl::PersistedApp{
      "u1", apl::AppStatus::kNew, apl::InfrastructureStatus::kNotSelected, {},
      5});
  REQUIRE(result.get_error() == apl::StoreError::kIoError);
  REQUIRE(!fs::exists(entity / apl::JsonlAppStore::kSnapshotFile));
  REQUIRE(!fs::exists(entity / "snapshot.json.tmp"));
}

#if defined(APL_PLATFORM_LINUX)

TEST_CASE("file_store - short write is rolled back", "[file_store]") {
  TempDir dir("apl_fs_short_write");
  apl::JsonlAppStore store(dir.str());
  REQUIRE(store.AppendEvents("u1", Lifecycle("u1"), 0).has_value());
  const fs::path log = dir.path() / "u1" / apl::JsonlAppStore::kEventsFile;
  const auto size = fs::file_size(log);

  apl::EventList del;
  del.push_back(apl::AppDeleted("u1"));

  // Cap the file size a few bytes past the current log so the write tears.
  struct rlimit saved;
  REQUIRE(getrlimit(RLIMIT_FSIZE, &saved) == 0);
  struct rlimit tight = saved;
  tight.rlim_cur = static_cast<rlim_t>(size + 8U);
  auto old_handler = std::signal(SIGXFSZ, SIG_IGN);
  const bool limited = (setrlimit(RLIMIT_FSIZE, &tight) == 0);
  auto result = store.AppendEvents("u1", del, 3);
  setrlimit(RLIMIT_FSIZE, &saved);
  std::signal(SIGXFSZ, old_handler);

  REQUIRE(limited);
  REQUIRE(result.get_error() == apl::StoreError::kIoError);
  REQUIRE(fs::file_size(log) == size);
  REQUIRE(store.Load("u1").value().version == 3);
  REQUIRE(store.AppendEvents("u1", del, 3).has_value());
  REQUIRE(store.Load("u1").value().status == apl::AppStatus::kDeleted);
}

#endif  // APL_PLATFORM_LINUX

TEST_CASE("file_store - uuids cannot escape the root", "[file_store]") {
  TempDir dir("apl_fs_escape");
  apl::JsonlAppStore store(dir.str());
  apl::EventList events;
  events.push_back(apl::AppCreated("../evil"));
  REQUIRE(store.AppendEvents("../evil", events, 0).get_error() ==
          apl::StoreError::kIoError);
  REQUIRE(store.Load("..").get_error() == apl::StoreError::kIoError);
}

TEST_CASE("file_store - drives the service", "[file_store][service]") {
  TempDir dir("apl_fs_service");
  apl::JsonlAppStore store(dir.str());
  apl::AppService svc(store);
  REQUIRE(svc.Create("u1").has_value());
  REQUIRE(svc.SelectInfrastructure("u1", apl::AzureTarget{}).has_value());
  REQUIRE(svc.Activate("u1").has_value());
  REQUIRE(svc.Delete("u1").value().version == 4);
}

#endif  // APL_JSON_ENABLED
