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
 * @file app.hpp
 * @brief Typestate application entity.
 *
 * Each lifecycle stage is its own sealed class exposing only the operations
 * legal in that stage:
 *
 *   NewApp            SelectInfrastructure(target) -> NotActivatedApp
 *                     Delete()                     -> DeletedApp
 *   NotActivatedApp   Activate()                   -> ActiveApp
 *                     RequestBuild(target)         -> NotActivatedApp
 *                     Delete()                     -> DeletedApp
 *   ActiveApp         Delete()                     -> DeletedApp
 *   DeletedApp        (none)
 *   CorruptedApp      (none)
 *
 * Operations are rvalue-qualified: calling one consumes the value and yields
 * the next stage, so an illegal call does not compile. Every stage carries
 * its snapshot and the events emitted by the operation that produced it
 * (empty when reconstructed from storage).
 *
 * FromPersisted() is the single place where a stored snapshot is narrowed to
 * a stage; anything that does not map to a reachable stage becomes
 * CorruptedApp.
 *
 * Usage:
 * @code
 *   apl::NotActivatedApp app = apl::NewApp::Create("u1").SelectInfrastructure(
 *       apl::AwsTarget(apl::AwsRegion("us-east-1")));
 *   store.AppendEvents(app.Snapshot().uuid, app.Events(), 1U);
 * @endcode
 */

#ifndef APL_APP_HPP_
#define APL_APP_HPP_

#include "apl/events.hpp"
#include "apl/log.hpp"
#include "apl/reducer.hpp"
#include "apl/snapshot.hpp"
#include "apl/vocabulary.hpp"

#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

namespace apl {

// ============================================================================
// Stage classification
// ============================================================================

enum class AppKind : uint8_t {
  kNew = 0,
  kNotActivated,
  kActive,
  kDeleted,
  kCorrupted,
};

inline const char* AppKindName(AppKind kind) noexcept {
  switch (kind) {
    case AppKind::kNew:          return "New";
    case AppKind::kNotActivated: return "NotActivated";
    case AppKind::kActive:       return "Active";
    case AppKind::kDeleted:      return "Deleted";
    case AppKind::kCorrupted:    return "Corrupted";
  }
  return "Corrupted";
}

/**
 * @brief Map a snapshot to the stage it belongs to.
 *
 *   New + NotSelected     -> kNew
 *   New + Selected        -> kNotActivated
 *   Active + Selected     -> kActive
 *   Deleted (either)      -> kDeleted
 *   anything else         -> kCorrupted
 */
inline AppKind Classify(const AppSnapshot& s) noexcept {
  const bool selected = IsSelected(s.infrastructure);
  switch (s.status) {
    case AppStatus::kNew:
      return selected ? AppKind::kNotActivated : AppKind::kNew;
    case AppStatus::kActive:
      return selected ? AppKind::kActive : AppKind::kCorrupted;
    case AppStatus::kDeleted:
      return AppKind::kDeleted;
    case AppStatus::kCorrupted:
      return AppKind::kCorrupted;
  }
  return AppKind::kCorrupted;
}

class NewApp;
class NotActivatedApp;
class ActiveApp;
class DeletedApp;
class CorruptedApp;

namespace detail {
struct AppAccess;
}  // namespace detail

// ============================================================================
// Stages
// ============================================================================

class NewApp final {
 public:
  static constexpr AppKind kKind = AppKind::kNew;

  /// Bring a new entity into existence. Emits AppCreated, version 1.
  static NewApp Create(const AppId& uuid);

  const AppSnapshot& Snapshot() const noexcept { return snapshot_; }
  const EventList& Events() const noexcept { return events_; }

  /// Emits ExistingInfrastructureSelected for the target's provider.
  NotActivatedApp SelectInfrastructure(const InfrastructureTarget& target) &&;
  DeletedApp Delete() &&;

 private:
  friend struct detail::AppAccess;
  NewApp(AppSnapshot snapshot, EventList events) noexcept
      : snapshot_(std::move(snapshot)), events_(std::move(events)) {}

  AppSnapshot snapshot_;
  EventList events_;
};

class NotActivatedApp final {
 public:
  static constexpr AppKind kKind = AppKind::kNotActivated;

  const AppSnapshot& Snapshot() const noexcept { return snapshot_; }
  const EventList& Events() const noexcept { return events_; }

  /// Provider of the selected infrastructure (always present in this stage).
  Provider SelectedProvider() const noexcept {
    return std::get<Selected>(snapshot_.infrastructure).provider;
  }

  ActiveApp Activate() &&;

  /**
   * @brief Emit BuildRequested for the selected infrastructure.
   *
   * @p target must name the provider already selected; anything else is a
   * caller bug and aborts.
   */
  NotActivatedApp RequestBuild(const InfrastructureTarget& target) &&;

  DeletedApp Delete() &&;

 private:
  friend struct detail::AppAccess;
  NotActivatedApp(AppSnapshot snapshot, EventList events) noexcept
      : snapshot_(std::move(snapshot)), events_(std::move(events)) {}

  AppSnapshot snapshot_;
  EventList events_;
};

class ActiveApp final {
 public:
  static constexpr AppKind kKind = AppKind::kActive;

  const AppSnapshot& Snapshot() const noexcept { return snapshot_; }
  const EventList& Events() const noexcept { return events_; }

  DeletedApp Delete() &&;

 private:
  friend struct detail::AppAccess;
  ActiveApp(AppSnapshot snapshot, EventList events) noexcept
      : snapshot_(std::move(snapshot)), events_(std::move(events)) {}

  AppSnapshot snapshot_;
  EventList events_;
};

/// Terminal. Infrastructure is left as it was at deletion time.
class DeletedApp final {
 public:
  static constexpr AppKind kKind = AppKind::kDeleted;

  const AppSnapshot& Snapshot() const noexcept { return snapshot_; }
  const EventList& Events() const noexcept { return events_; }

 private:
  friend struct detail::AppAccess;
  DeletedApp(AppSnapshot snapshot, EventList events) noexcept
      : snapshot_(std::move(snapshot)), events_(std::move(events)) {}

  AppSnapshot snapshot_;
  EventList events_;
};

/// Terminal catch-all. Snapshot status is always kCorrupted.
class CorruptedApp final {
 public:
  static constexpr AppKind kKind = AppKind::kCorrupted;

  const AppSnapshot& Snapshot() const noexcept { return snapshot_; }
  const EventList& Events() const noexcept { return events_; }

 private:
  friend struct detail::AppAccess;
  CorruptedApp(AppSnapshot snapshot, EventList events) noexcept
      : snapshot_(std::move(snapshot)), events_(std::move(events)) {
    snapshot_.status = AppStatus::kCorrupted;
  }

  AppSnapshot snapshot_;
  EventList events_;
};

using App =
    std::variant<NewApp, NotActivatedApp, ActiveApp, DeletedApp, CorruptedApp>;

// ============================================================================
// Transition plumbing
// ============================================================================

namespace detail {

struct AppAccess {
  template <typename Stage>
  static Stage Make(AppSnapshot snapshot, EventList events) noexcept {
    return Stage(std::move(snapshot), std::move(events));
  }
};

/**
 * @brief Fold @p event onto @p current and wrap the result as @p Target.
 *
 * A result that breaks the snapshot invariant, or lands in a stage other
 * than Target, means the operation table and the reducer disagree. That is
 * a defect in this library, not a modeled outcome, so it aborts.
 */
template <typename Target>
Target Transition(const AppSnapshot& current, AppDomainEvent event) {
  AppSnapshot next = Apply(current, event);
  if (APL_UNLIKELY(!SatisfiesInvariants(next))) {
    APL_LOG_FATAL("App", "%s on %s broke the snapshot invariant",
                  EventName(event), current.uuid.c_str());
  }
  if (APL_UNLIKELY(Classify(next) != Target::kKind)) {
    APL_LOG_FATAL("App", "%s on %s produced %s, expected %s",
                  EventName(event), current.uuid.c_str(),
                  AppKindName(Classify(next)), AppKindName(Target::kKind));
  }
  EventList events;
  events.push_back(std::move(event));
  return AppAccess::Make<Target>(std::move(next), std::move(events));
}

}  // namespace detail

// ============================================================================
// Operations
// ============================================================================

inline NewApp NewApp::Create(const AppId& uuid) {
  AppDomainEvent event = AppCreated(uuid);
  AppSnapshot first = ApplyFirst(event);
  EventList events;
  events.push_back(std::move(event));
  return NewApp(std::move(first), std::move(events));
}

inline NotActivatedApp NewApp::SelectInfrastructure(
    const InfrastructureTarget& target) && {
  return detail::Transition<NotActivatedApp>(
      snapshot_, ExistingInfrastructureSelected(snapshot_.uuid, target));
}

inline DeletedApp NewApp::Delete() && {
  return detail::Transition<DeletedApp>(snapshot_, AppDeleted(snapshot_.uuid));
}

inline ActiveApp NotActivatedApp::Activate() && {
  return detail::Transition<ActiveApp>(snapshot_,
                                       AppActivated(snapshot_.uuid));
}

inline NotActivatedApp NotActivatedApp::RequestBuild(
    const InfrastructureTarget& target) && {
  if (APL_UNLIKELY(ProviderOf(target) != SelectedProvider())) {
    APL_LOG_FATAL("App", "build on %s requested for %s, selected is %s",
                  snapshot_.uuid.c_str(), ProviderName(ProviderOf(target)),
                  ProviderName(SelectedProvider()));
  }
  return detail::Transition<NotActivatedApp>(
      snapshot_, BuildRequested(snapshot_.uuid, target));
}

inline DeletedApp NotActivatedApp::Delete() && {
  return detail::Transition<DeletedApp>(snapshot_, AppDeleted(snapshot_.uuid));
}

inline DeletedApp ActiveApp::Delete() && {
  return detail::Transition<DeletedApp>(snapshot_, AppDeleted(snapshot_.uuid));
}

// ============================================================================
// Reconstruction
// ============================================================================

/**
 * @brief Narrow a stored snapshot to its stage.
 *
 * The result carries no events. Total: every input maps to some stage.
 */
inline App FromPersisted(const AppSnapshot& snapshot) {
  using detail::AppAccess;
  switch (Classify(snapshot)) {
    case AppKind::kNew:
      return AppAccess::Make<NewApp>(snapshot, {});
    case AppKind::kNotActivated:
      return AppAccess::Make<NotActivatedApp>(snapshot, {});
    case AppKind::kActive:
      return AppAccess::Make<ActiveApp>(snapshot, {});
    case AppKind::kDeleted:
      return AppAccess::Make<DeletedApp>(snapshot, {});
    case AppKind::kCorrupted:
      break;
  }
  return AppAccess::Make<CorruptedApp>(snapshot, {});
}

inline App FromPersisted(const PersistedApp& record) {
  return FromPersisted(ToSnapshot(record));
}

// ============================================================================
// Variant accessors
// ============================================================================

inline const AppSnapshot& SnapshotOf(const App& app) noexcept {
  return std::visit(
      [](const auto& a) noexcept -> const AppSnapshot& { return a.Snapshot(); },
      app);
}

inline const EventList& EventsOf(const App& app) noexcept {
  return std::visit(
      [](const auto& a) noexcept -> const EventList& { return a.Events(); },
      app);
}

inline AppKind KindOf(const App& app) noexcept {
  return std::visit([](const auto& a) noexcept { return a.kKind; }, app);
}

// ============================================================================
// Equality
// ============================================================================

/// True for the five stage classes.
template <typename T, typename = void>
struct IsAppStage : std::false_type {};
template <typename T>
struct IsAppStage<T, std::void_t<decltype(T::kKind)>>
    : std::is_same<std::decay_t<decltype(T::kKind)>, AppKind> {};

template <typename Stage,
          std::enable_if_t<IsAppStage<Stage>::value, bool> = true>
inline bool operator==(const Stage& a, const Stage& b) {
  return a.Snapshot() == b.Snapshot() && a.Events() == b.Events();
}

template <typename Stage,
          std::enable_if_t<IsAppStage<Stage>::value, bool> = true>
inline bool operator!=(const Stage& a, const Stage& b) {
  return !(a == b);
}

}  // namespace apl

#endif  // APL_APP_HPP_
