/**
 * @file app_service_demo.cpp
 * @brief Config-driven AppService run against the configured store.
 *
 * Demonstrates:
 *   - Loading ServiceConfig from an INI/JSON/YAML file (argv[1]) when a
 *     config backend is compiled in, defaults otherwise
 *   - Choosing the in-memory or JSONL store from [store] backend
 *   - Forwarding infrastructure events to a provisioning sink
 *   - A rejected command leaving the stored state untouched
 *
 * Usage: app_service_demo [config-file]
 */

#include "apl/config.hpp"
#include "apl/file_store.hpp"
#include "apl/log.hpp"
#include "apl/service.hpp"
#include "apl/store.hpp"

#include <cstdio>
#include <memory>

// ---------------------------------------------------------------------------

static void LogProvisioning(const apl::ProvisioningRequest& req, void* ctx) {
  auto* count = static_cast<uint32_t*>(ctx);
  ++*count;
  if (const auto* aws = std::get_if<apl::AwsTarget>(&req.target)) {
    APL_LOG_INFO("Provision", "%s: AWS region=%s (#%u)", req.uuid.c_str(),
                 aws->region.c_str(), *count);
  } else {
    APL_LOG_INFO("Provision", "%s: AZURE (#%u)", req.uuid.c_str(), *count);
  }
}

static void Report(const char* step, const apl::AppService::Result& r) {
  if (r.has_value()) {
    const apl::AppSnapshot& s = r.value();
    APL_LOG_INFO("Demo", "%-22s -> status=%s version=%llu", step,
                 apl::StatusName(s.status),
                 static_cast<unsigned long long>(s.version));
  } else {
    APL_LOG_WARN("Demo", "%-22s -> rejected: %s", step,
                 apl::ServiceErrorName(r.get_error()));
  }
}

static apl::ServiceConfig LoadConfig(int argc, char* argv[]) {
#ifdef APL_CONFIG_HAS_BACKEND
  if (argc > 1) {
    apl::MultiConfig file;
    auto loaded = file.LoadFile(argv[1]);
    if (loaded.has_value()) {
      APL_LOG_INFO("Demo", "loaded %s (%u entries)", argv[1],
                   file.EntryCount());
      return apl::LoadServiceConfig(file);
    }
    APL_LOG_WARN("Demo", "cannot load %s (error %u), using defaults", argv[1],
                 static_cast<unsigned>(loaded.get_error()));
  }
#else
  if (argc > 1) {
    APL_LOG_WARN("Demo", "no config backend compiled in, ignoring %s",
                 argv[1]);
  }
#endif
  return apl::LoadServiceConfig(apl::ConfigStore());
}

static std::unique_ptr<apl::AppStore> MakeStore(const apl::ServiceConfig& cfg) {
  if (cfg.store_backend == apl::StoreBackend::kJsonl) {
#ifdef APL_JSON_ENABLED
    APL_LOG_INFO("Demo", "jsonl store at %s", cfg.store_directory.c_str());
    return std::make_unique<apl::JsonlAppStore>(cfg.store_directory.c_str());
#else
    APL_LOG_WARN("Demo", "jsonl store needs JSON support, using memory");
#endif
  }
  return std::make_unique<apl::InMemoryAppStore>();
}

int main(int argc, char* argv[]) {
  apl::log::Init();

  const apl::ServiceConfig cfg = LoadConfig(argc, argv);
  apl::log::SetLevel(cfg.log_level);

  std::unique_ptr<apl::AppStore> store = MakeStore(cfg);
  apl::AppService service(*store);

  uint32_t provisioned = 0;
  if (cfg.provisioning_enabled) {
    service.SetProvisioningSink(LogProvisioning, &provisioned);
  }

  const apl::AppId uuid("demo-app-1");
  const apl::AwsTarget target(apl::AwsRegion("eu-west-1"));

  Report("create", service.Create(uuid));
  Report("select-infrastructure", service.SelectInfrastructure(uuid, target));
  Report("request-build", service.RequestBuild(uuid, target));
  Report("activate", service.Activate(uuid));

  // Activate is not offered on an active app.
  Report("activate (again)", service.Activate(uuid));

  Report("delete", service.Delete(uuid));
  Report("get", service.Get(uuid));

  APL_LOG_INFO("Demo", "provisioning requests sent: %u", provisioned);

  apl::log::Shutdown();
  return 0;
}
