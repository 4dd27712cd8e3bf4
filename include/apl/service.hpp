/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file service.hpp
 * @brief Command-side orchestration over an AppStore.
 *
 * Each command runs the same flow:
 *   Load -> FromPersisted -> dispatch on the held stage -> typed operation
 *   -> AppendEvents(expected_version = loaded version) -> provisioning hand-off
 *
 * Commands arrive from outside the type system, so asking a stage for an
 * operation it does not expose is reported as kInvalidTransition here rather
 * than rejected at compile time. A version conflict is returned to the
 * caller as kConflict; the service never retries.
 *
 * Thread-safe as long as the underlying AppStore is.
 */

#ifndef APL_SERVICE_HPP_
#define APL_SERVICE_HPP_

#include "apl/app.hpp"
#include "apl/events.hpp"
#include "apl/log.hpp"
#include "apl/provisioning.hpp"
#include "apl/snapshot.hpp"
#include "apl/store.hpp"
#include "apl/vocabulary.hpp"

#include <cstdint>
#include <utility>
#include <variant>

namespace apl {

// ============================================================================
// Service Error
// ============================================================================

enum class ServiceError : uint8_t {
  kNotFound = 0,
  kAlreadyExists,
  kInvalidTransition,
  kProviderMismatch,
  kConflict,
  kStorageFailure,
};

inline const char* ServiceErrorName(ServiceError err) noexcept {
  switch (err) {
    case ServiceError::kNotFound:           return "not found";
    case ServiceError::kAlreadyExists:      return "already exists";
    case ServiceError::kInvalidTransition:  return "invalid transition";
    case ServiceError::kProviderMismatch:   return "provider mismatch";
    case ServiceError::kConflict:           return "conflict";
    case ServiceError::kStorageFailure:     return "storage failure";
  }
  return "unknown";
}

// ============================================================================
// AppService
// ============================================================================

class AppService {
 public:
  using Result = expected<AppSnapshot, ServiceError>;

  explicit AppService(AppStore& store) noexcept
      : store_(store), sink_(nullptr), sink_ctx_(nullptr) {}

  AppService(const AppService&) = delete;
  AppService& operator=(const AppService&) = delete;
  AppService(AppService&&) = delete;
  AppService& operator=(AppService&&) = delete;

  /**
   * @brief Route infrastructure events to a provisioner.
   * @param fn Callback, or nullptr to stop forwarding.
   * @param ctx User context pointer passed to the callback.
   */
  void SetProvisioningSink(ProvisioningSinkFn fn, void* ctx = nullptr) noexcept {
    sink_ = fn;
    sink_ctx_ = ctx;
  }

  Result Create(const AppId& uuid) {
    auto loaded = store_.Load(uuid);
    if (loaded.has_value()) {
      APL_LOG_WARN("Service", "create %s: already exists", uuid.c_str());
      return Result::error(ServiceError::kAlreadyExists);
    }
    if (loaded.get_error() != StoreError::kNotFound) {
      return StorageFailure("create", uuid, loaded.get_error());
    }
    return Commit("create", uuid, 0U, App(NewApp::Create(uuid)));
  }

  Result SelectInfrastructure(const AppId& uuid,
                              const InfrastructureTarget& target) {
    return Execute("select-infrastructure", uuid, [&target](App&& app) {
      return std::visit(
          overloaded{
              [&target](NewApp&& a) -> Step {
                return Step::success(
                    App(std::move(a).SelectInfrastructure(target)));
              },
              [](auto&&) -> Step {
                return Step::error(ServiceError::kInvalidTransition);
              },
          },
          std::move(app));
    });
  }

  Result RequestBuild(const AppId& uuid, const InfrastructureTarget& target) {
    return Execute("request-build", uuid, [&target](App&& app) {
      return std::visit(
          overloaded{
              [&target](NotActivatedApp&& a) -> Step {
                if (ProviderOf(target) != a.SelectedProvider()) {
                  return Step::error(ServiceError::kProviderMismatch);
                }
                return Step::success(App(std::move(a).RequestBuild(target)));
              },
              [](auto&&) -> Step {
                return Step::error(ServiceError::kInvalidTransition);
              },
          },
          std::move(app));
    });
  }

  Result Activate(const AppId& uuid) {
    return Execute("activate", uuid, [](App&& app) {
      return std::visit(
          overloaded{
              [](NotActivatedApp&& a) -> Step {
                return Step::success(App(std::move(a).Activate()));
              },
              [](auto&&) -> Step {
                return Step::error(ServiceError::kInvalidTransition);
              },
          },
          std::move(app));
    });
  }

  Result Delete(const AppId& uuid) {
    return Execute("delete", uuid, [](App&& app) {
      return std::visit(
          overloaded{
              [](NewApp&& a) -> Step {
                return Step::success(App(std::move(a).Delete()));
              },
              [](NotActivatedApp&& a) -> Step {
                return Step::success(App(std::move(a).Delete()));
              },
              [](ActiveApp&& a) -> Step {
                return Step::success(App(std::move(a).Delete()));
              },
              [](auto&&) -> Step {
                return Step::error(ServiceError::kInvalidTransition);
              },
          },
          std::move(app));
    });
  }

  /// Current snapshot, as stored. Does not narrow or validate.
  Result Get(const AppId& uuid) {
    auto loaded = store_.Load(uuid);
    if (!loaded.has_value()) {
      if (loaded.get_error() == StoreError::kNotFound) {
        return Result::error(ServiceError::kNotFound);
      }
      return StorageFailure("get", uuid, loaded.get_error());
    }
    return Result::success(loaded.value());
  }

 private:
  using Step = expected<App, ServiceError>;

  template <typename Op>
  Result Execute(const char* command, const AppId& uuid, Op&& op) {
    auto loaded = store_.Load(uuid);
    if (!loaded.has_value()) {
      if (loaded.get_error() == StoreError::kNotFound) {
        APL_LOG_WARN("Service", "%s %s: not found", command, uuid.c_str());
        return Result::error(ServiceError::kNotFound);
      }
      return StorageFailure(command, uuid, loaded.get_error());
    }

    const uint64_t version = loaded.value().version;
    App current = FromPersisted(loaded.value());
    const AppKind kind = KindOf(current);
    if (kind == AppKind::kCorrupted) {
      APL_LOG_WARN("Service", "%s %s: entity is corrupted (status %s)",
                   command, uuid.c_str(), StatusName(loaded.value().status));
    }

    Step next = op(std::move(current));
    if (!next.has_value()) {
      APL_LOG_WARN("Service", "%s %s rejected in stage %s: %s", command,
                   uuid.c_str(), AppKindName(kind),
                   ServiceErrorName(next.get_error()));
      return Result::error(next.get_error());
    }
    return Commit(command, uuid, version, std::move(next).value());
  }

  Result Commit(const char* command, const AppId& uuid, uint64_t version,
                App next) {
    const EventList& events = EventsOf(next);
    auto appended = store_.AppendEvents(uuid, events, version);
    if (!appended.has_value()) {
      if (appended.get_error() == StoreError::kConflict) {
        APL_LOG_WARN("Service", "%s %s: concurrent update at version %llu",
                     command, uuid.c_str(),
                     static_cast<unsigned long long>(version));
        return Result::error(ServiceError::kConflict);
      }
      return StorageFailure(command, uuid, appended.get_error());
    }

    if (sink_ != nullptr) {
      for (const auto& event : events) {
        auto request = ToProvisioningRequest(event);
        if (request.has_value()) {
          sink_(request.value(), sink_ctx_);
        }
      }
    }

    const AppSnapshot& snapshot = SnapshotOf(next);
    APL_LOG_INFO("Service", "%s %s -> %s (version %llu)", command,
                 uuid.c_str(), AppKindName(KindOf(next)),
                 static_cast<unsigned long long>(snapshot.version));
    return Result::success(snapshot);
  }

  Result StorageFailure(const char* command, const AppId& uuid,
                        StoreError err) {
    APL_LOG_ERROR("Service", "%s %s: store failed: %s", command, uuid.c_str(),
                  StoreErrorName(err));
    return Result::error(ServiceError::kStorageFailure);
  }

  AppStore& store_;
  ProvisioningSinkFn sink_;
  void* sink_ctx_;
};

}  // namespace apl

#endif  // APL_SERVICE_HPP_
