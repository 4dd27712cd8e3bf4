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
 * @file events.hpp
 * @brief Domain event catalog for the application lifecycle.
 *
 * Every event is an immutable value that cannot be constructed without its
 * complete payload. Legality of an event relative to the current state is
 * decided by the reducer, not here.
 *
 * Infrastructure payloads are a closed sum:
 *   AwsTarget   -- provider AWS, region is mandatory
 *   AzureTarget -- provider AZURE, structurally has no region
 *
 * Usage:
 * @code
 *   apl::AppDomainEvent evt = apl::ExistingInfrastructureSelected(
 *       "u1", apl::AwsTarget(apl::AwsRegion("us-east-1")));
 *   std::visit(apl::overloaded{...}, evt);
 * @endcode
 */

#ifndef APL_EVENTS_HPP_
#define APL_EVENTS_HPP_

#include "apl/snapshot.hpp"
#include "apl/vocabulary.hpp"

#include <cstdint>
#include <type_traits>
#include <variant>
#include <vector>

namespace apl {

// ============================================================================
// Overloaded visitor pattern (C++17)
// ============================================================================

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// ============================================================================
// Infrastructure targets
// ============================================================================

inline constexpr uint32_t kAwsRegionCapacity = 32U;

/// Region code tag (e.g. "us-east-1"). Not validated against any catalog.
using AwsRegion = FixedString<kAwsRegionCapacity>;

struct AwsTarget {
  explicit AwsTarget(const AwsRegion& r) noexcept : region(r) {}

  AwsRegion region;

  bool operator==(const AwsTarget& o) const noexcept {
    return region == o.region;
  }
  bool operator!=(const AwsTarget& o) const noexcept { return !(*this == o); }
};

struct AzureTarget {
  bool operator==(const AzureTarget&) const noexcept { return true; }
  bool operator!=(const AzureTarget&) const noexcept { return false; }
};

using InfrastructureTarget = std::variant<AwsTarget, AzureTarget>;

inline Provider ProviderOf(const InfrastructureTarget& target) noexcept {
  return std::holds_alternative<AwsTarget>(target) ? Provider::kAws
                                                   : Provider::kAzure;
}

// ============================================================================
// Event type tags
// ============================================================================

enum class EventType : uint8_t {
  kAppCreated = 0,
  kExistingInfrastructureSelected,
  kBuildRequested,
  kAppActivated,
  kAppDeleted,
  kUnknown,
};

// ============================================================================
// Events
// ============================================================================

struct AppCreated {
  static constexpr EventType kType = EventType::kAppCreated;
  static constexpr const char* kName = "AppCreated";

  explicit AppCreated(const AppId& id) noexcept : uuid(id) {}

  AppId uuid;
};

struct ExistingInfrastructureSelected {
  static constexpr EventType kType = EventType::kExistingInfrastructureSelected;
  static constexpr const char* kName = "ExistingInfrastructureSelected";

  ExistingInfrastructureSelected(const AppId& id,
                                 const InfrastructureTarget& t) noexcept
      : uuid(id), target(t) {}

  AppId uuid;
  InfrastructureTarget target;
};

/// Asks the provisioning collaborator to build on the selected target.
struct BuildRequested {
  static constexpr EventType kType = EventType::kBuildRequested;
  static constexpr const char* kName = "BuildRequested";

  BuildRequested(const AppId& id, const InfrastructureTarget& t) noexcept
      : uuid(id), target(t) {}

  AppId uuid;
  InfrastructureTarget target;
};

struct AppActivated {
  static constexpr EventType kType = EventType::kAppActivated;
  static constexpr const char* kName = "AppActivated";

  explicit AppActivated(const AppId& id) noexcept : uuid(id) {}

  AppId uuid;
};

struct AppDeleted {
  static constexpr EventType kType = EventType::kAppDeleted;
  static constexpr const char* kName = "AppDeleted";

  explicit AppDeleted(const AppId& id) noexcept : uuid(id) {}

  AppId uuid;
};

inline constexpr uint32_t kEventTypeNameCapacity = 64U;
using EventTypeName = FixedString<kEventTypeNameCapacity>;

/**
 * @brief An event written by a newer producer that this build does not know.
 *
 * Produced only by decoders. The reducer passes it through unchanged.
 */
struct UnknownEvent {
  static constexpr EventType kType = EventType::kUnknown;
  static constexpr const char* kName = "Unknown";

  UnknownEvent(const AppId& id, const EventTypeName& type) noexcept
      : uuid(id), type_name(type) {}

  AppId uuid;
  EventTypeName type_name;
};

using AppDomainEvent =
    std::variant<AppCreated, ExistingInfrastructureSelected, BuildRequested,
                 AppActivated, AppDeleted, UnknownEvent>;

using EventList = std::vector<AppDomainEvent>;

// ============================================================================
// Accessors
// ============================================================================

inline EventType TypeOf(const AppDomainEvent& event) noexcept {
  return std::visit([](const auto& e) noexcept { return e.kType; }, event);
}

/// Catalog name of the event; for UnknownEvent the name it was recorded with.
inline const char* EventName(const AppDomainEvent& event) noexcept {
  if (const auto* unknown = std::get_if<UnknownEvent>(&event)) {
    return unknown->type_name.c_str();
  }
  return std::visit([](const auto& e) noexcept { return e.kName; }, event);
}

inline const AppId& EventUuid(const AppDomainEvent& event) noexcept {
  return std::visit(
      [](const auto& e) noexcept -> const AppId& { return e.uuid; }, event);
}

/// Target carried by infrastructure events, empty for the others.
inline optional<InfrastructureTarget> TargetOf(const AppDomainEvent& event) {
  if (const auto* sel = std::get_if<ExistingInfrastructureSelected>(&event)) {
    return sel->target;
  }
  if (const auto* build = std::get_if<BuildRequested>(&event)) {
    return build->target;
  }
  return {};
}

// ============================================================================
// Equality (value semantics for tests and replay comparison)
// ============================================================================

inline bool operator==(const AppCreated& a, const AppCreated& b) noexcept {
  return a.uuid == b.uuid;
}
inline bool operator==(const ExistingInfrastructureSelected& a,
                       const ExistingInfrastructureSelected& b) noexcept {
  return a.uuid == b.uuid && a.target == b.target;
}
inline bool operator==(const BuildRequested& a,
                       const BuildRequested& b) noexcept {
  return a.uuid == b.uuid && a.target == b.target;
}
inline bool operator==(const AppActivated& a, const AppActivated& b) noexcept {
  return a.uuid == b.uuid;
}
inline bool operator==(const AppDeleted& a, const AppDeleted& b) noexcept {
  return a.uuid == b.uuid;
}
inline bool operator==(const UnknownEvent& a, const UnknownEvent& b) noexcept {
  return a.uuid == b.uuid && a.type_name == b.type_name;
}

/// True for the event structs of this catalog.
template <typename T, typename = void>
struct IsDomainEvent : std::false_type {};
template <typename T>
struct IsDomainEvent<T, std::void_t<decltype(T::kType)>>
    : std::is_same<std::decay_t<decltype(T::kType)>, EventType> {};

template <typename E,
          std::enable_if_t<IsDomainEvent<E>::value, int> = 0>
inline bool operator!=(const E& a, const E& b) noexcept {
  return !(a == b);
}

}  // namespace apl

#endif  // APL_EVENTS_HPP_
