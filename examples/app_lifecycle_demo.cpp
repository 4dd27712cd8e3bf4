/**
 * @file app_lifecycle_demo.cpp
 * @brief Typed lifecycle chain and reconstruction of stored snapshots.
 *
 * Demonstrates:
 *   - New -> NotActivated -> Active -> Deleted with rvalue-qualified operations
 *   - Collecting the emitted events and replaying them
 *   - FromPersisted() over several stored snapshots, including ones no legal
 *     history could produce
 *   - Exhaustive dispatch over the resulting stage with apl::overloaded
 */

#include "apl/app.hpp"
#include "apl/log.hpp"

#include <cstdio>
#include <utility>
#include <variant>

// ---------------------------------------------------------------------------

static void PrintSnapshot(const char* label, const apl::AppSnapshot& s) {
  auto provider = apl::SelectedProvider(s.infrastructure);
  std::printf("  %-14s uuid=%s status=%s infra=%s version=%llu\n", label,
              s.uuid.c_str(), apl::StatusName(s.status),
              provider.has_value() ? apl::ProviderName(provider.value())
                                   : "NotSelected",
              static_cast<unsigned long long>(s.version));
}

static void Describe(apl::App app) {
  std::visit(
      apl::overloaded{
          [](const apl::NewApp& a) {
            PrintSnapshot("new", a.Snapshot());
          },
          [](const apl::NotActivatedApp& a) {
            PrintSnapshot("not-activated", a.Snapshot());
          },
          [](const apl::ActiveApp& a) {
            PrintSnapshot("active", a.Snapshot());
          },
          [](const apl::DeletedApp& a) {
            PrintSnapshot("deleted", a.Snapshot());
          },
          [](const apl::CorruptedApp& a) {
            PrintSnapshot("corrupted", a.Snapshot());
          },
      },
      app);
}

int main() {
  apl::log::Init();
  apl::log::SetLevel(apl::log::Level::kInfo);

  // -- Typed chain ----------------------------------------------------------

  std::printf("Typed chain:\n");
  apl::EventList history;

  apl::NewApp created = apl::NewApp::Create("9b2f0c4e-app");
  history.insert(history.end(), created.Events().begin(),
                 created.Events().end());
  PrintSnapshot("created", created.Snapshot());

  apl::NotActivatedApp selected = std::move(created).SelectInfrastructure(
      apl::AwsTarget(apl::AwsRegion("us-east-1")));
  history.push_back(selected.Events().front());
  PrintSnapshot("selected", selected.Snapshot());

  apl::NotActivatedApp built = std::move(selected).RequestBuild(
      apl::AwsTarget(apl::AwsRegion("us-east-1")));
  history.push_back(built.Events().front());
  PrintSnapshot("build", built.Snapshot());

  apl::ActiveApp active = std::move(built).Activate();
  history.push_back(active.Events().front());
  PrintSnapshot("activated", active.Snapshot());

  apl::DeletedApp deleted = std::move(active).Delete();
  history.push_back(deleted.Events().front());
  PrintSnapshot("deleted", deleted.Snapshot());

  std::printf("\nEmitted events:\n");
  for (const auto& e : history) {
    std::printf("  %s\n", apl::EventName(e));
  }

  auto replayed = apl::Replay(history);
  std::printf("Replay matches final snapshot: %s\n",
              (replayed.has_value() && replayed.value() == deleted.Snapshot())
                  ? "yes"
                  : "no");

  // -- Reconstruction -------------------------------------------------------

  std::printf("\nReconstructed from storage:\n");
  const apl::PersistedApp stored[] = {
      {"a-new", apl::AppStatus::kNew, apl::InfrastructureStatus::kNotSelected,
       {}, 1},
      {"a-selected", apl::AppStatus::kNew, apl::InfrastructureStatus::kSelected,
       apl::Provider::kAzure, 2},
      {"a-active", apl::AppStatus::kActive,
       apl::InfrastructureStatus::kSelected, apl::Provider::kAws, 3},
      {"a-active-bare", apl::AppStatus::kActive,
       apl::InfrastructureStatus::kNotSelected, {}, 3},
      {"a-no-provider", apl::AppStatus::kNew,
       apl::InfrastructureStatus::kSelected, {}, 2},
  };
  for (const auto& rec : stored) {
    Describe(apl::FromPersisted(rec));
  }

  apl::log::Shutdown();
  return 0;
}
