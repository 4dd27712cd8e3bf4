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
 * @file snapshot.hpp
 * @brief AppSnapshot: the materialized state of one application entity, and
 *        its format-agnostic persisted layout.
 *
 * Invariant (checked by SatisfiesInvariants):
 *   status == kActive  =>  infrastructure holds Selected
 *
 * kCorrupted carries no structural guarantee; it is the terminal state for
 * any snapshot/event combination outside the protocol.
 */

#ifndef APL_SNAPSHOT_HPP_
#define APL_SNAPSHOT_HPP_

#include "apl/platform.hpp"
#include "apl/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <variant>

namespace apl {

// ============================================================================
// Identifiers and enums
// ============================================================================

/// Opaque entity identifier, stable for the entity lifetime (UUID text).
inline constexpr uint32_t kAppIdCapacity = 64U;
using AppId = FixedString<kAppIdCapacity>;

enum class AppStatus : uint8_t {
  kNew = 0,
  kActive,
  kDeleted,
  kCorrupted,
};

enum class Provider : uint8_t {
  kAws = 0,
  kAzure,
};

enum class InfrastructureStatus : uint8_t {
  kNotSelected = 0,
  kSelected,
};

inline const char* StatusName(AppStatus status) noexcept {
  switch (status) {
    case AppStatus::kNew:       return "New";
    case AppStatus::kActive:    return "Active";
    case AppStatus::kDeleted:   return "Deleted";
    case AppStatus::kCorrupted: return "Corrupted";
  }
  return "Corrupted";
}

inline const char* ProviderName(Provider provider) noexcept {
  return provider == Provider::kAws ? "AWS" : "AZURE";
}

inline const char* InfrastructureStatusName(InfrastructureStatus s) noexcept {
  return s == InfrastructureStatus::kSelected ? "Selected" : "NotSelected";
}

/// Unknown names are reported as empty, never guessed.
inline optional<AppStatus> ParseStatus(const char* name) noexcept {
  if (name == nullptr) return {};
  if (std::strcmp(name, "New") == 0) return AppStatus::kNew;
  if (std::strcmp(name, "Active") == 0) return AppStatus::kActive;
  if (std::strcmp(name, "Deleted") == 0) return AppStatus::kDeleted;
  if (std::strcmp(name, "Corrupted") == 0) return AppStatus::kCorrupted;
  return {};
}

inline optional<Provider> ParseProvider(const char* name) noexcept {
  if (name == nullptr) return {};
  if (std::strcmp(name, "AWS") == 0) return Provider::kAws;
  if (std::strcmp(name, "AZURE") == 0) return Provider::kAzure;
  return {};
}

inline optional<InfrastructureStatus> ParseInfrastructureStatus(
    const char* name) noexcept {
  if (name == nullptr) return {};
  if (std::strcmp(name, "NotSelected") == 0)
    return InfrastructureStatus::kNotSelected;
  if (std::strcmp(name, "Selected") == 0)
    return InfrastructureStatus::kSelected;
  return {};
}

// ============================================================================
// Infrastructure
// ============================================================================

struct NotSelected {
  bool operator==(const NotSelected&) const noexcept { return true; }
  bool operator!=(const NotSelected&) const noexcept { return false; }
};

struct Selected {
  Provider provider;

  bool operator==(const Selected& o) const noexcept {
    return provider == o.provider;
  }
  bool operator!=(const Selected& o) const noexcept { return !(*this == o); }
};

using Infrastructure = std::variant<NotSelected, Selected>;

inline bool IsSelected(const Infrastructure& infra) noexcept {
  return std::holds_alternative<Selected>(infra);
}

inline optional<Provider> SelectedProvider(const Infrastructure& infra) noexcept {
  const Selected* sel = std::get_if<Selected>(&infra);
  if (sel == nullptr) return {};
  return sel->provider;
}

// ============================================================================
// AppSnapshot
// ============================================================================

/**
 * @brief Materialized state of one application.
 *
 * version counts the events folded into this snapshot. The persistence layer
 * uses it as the compare-and-swap precondition when appending; 0 means the
 * entity does not exist yet.
 */
struct AppSnapshot {
  AppId uuid;
  AppStatus status;
  Infrastructure infrastructure;
  uint64_t version;

  bool operator==(const AppSnapshot& o) const noexcept {
    return uuid == o.uuid && status == o.status &&
           infrastructure == o.infrastructure && version == o.version;
  }
  bool operator!=(const AppSnapshot& o) const noexcept { return !(*this == o); }
};

inline bool SatisfiesInvariants(const AppSnapshot& s) noexcept {
  if (s.status == AppStatus::kActive) return IsSelected(s.infrastructure);
  return true;
}

// ============================================================================
// PersistedApp -- storage layout
// ============================================================================

/**
 * @brief Flat record as a storage backend keeps it.
 *
 * infrastructure_provider must be present iff infrastructure_status is
 * kSelected. Nothing enforces that here: records come from outside and are
 * revalidated by ToSnapshot().
 */
struct PersistedApp {
  AppId uuid;
  AppStatus status;
  InfrastructureStatus infrastructure_status;
  optional<Provider> infrastructure_provider;
  uint64_t version;
};

inline PersistedApp ToPersisted(const AppSnapshot& s) {
  PersistedApp rec{s.uuid, s.status, InfrastructureStatus::kNotSelected, {},
                   s.version};
  if (const Selected* sel = std::get_if<Selected>(&s.infrastructure)) {
    rec.infrastructure_status = InfrastructureStatus::kSelected;
    rec.infrastructure_provider = sel->provider;
  }
  return rec;
}

/**
 * @brief Rebuild a snapshot from a stored record.
 *
 * A record whose provider presence disagrees with its infrastructure status
 * cannot be represented faithfully; it comes back as kCorrupted with
 * NotSelected infrastructure.
 */
inline AppSnapshot ToSnapshot(const PersistedApp& rec) {
  AppSnapshot s{rec.uuid, rec.status, NotSelected{}, rec.version};
  const bool selected =
      rec.infrastructure_status == InfrastructureStatus::kSelected;
  if (selected && rec.infrastructure_provider.has_value()) {
    s.infrastructure = Selected{rec.infrastructure_provider.value()};
  } else if (selected || rec.infrastructure_provider.has_value()) {
    s.status = AppStatus::kCorrupted;
  }
  return s;
}

}  // namespace apl

#endif  // APL_SNAPSHOT_HPP_
