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
 * @file store.hpp
 * @brief Persistence collaborator: load snapshots, append events with
 *        optimistic concurrency.
 *
 * AppendEvents() is a compare-and-swap on AppSnapshot::version. The caller
 * passes the version it loaded; if another writer got there first the call
 * fails with kConflict and nothing is written. An entity that does not exist
 * has version 0.
 *
 * Stores fold appended events through the reducer themselves, so a stored
 * snapshot is always the replay of its stored history (on top of an
 * imported base snapshot, if one was seeded).
 */

#ifndef APL_STORE_HPP_
#define APL_STORE_HPP_

#include "apl/events.hpp"
#include "apl/log.hpp"
#include "apl/reducer.hpp"
#include "apl/snapshot.hpp"
#include "apl/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace apl {

// ============================================================================
// Errors
// ============================================================================

enum class StoreError : uint8_t {
  kNotFound = 0,
  kConflict,
  kIoError,
  kCorruptLog,
};

inline const char* StoreErrorName(StoreError err) noexcept {
  switch (err) {
    case StoreError::kNotFound:   return "not found";
    case StoreError::kConflict:   return "version conflict";
    case StoreError::kIoError:    return "I/O error";
    case StoreError::kCorruptLog: return "corrupt event log";
  }
  return "unknown";
}

// ============================================================================
// AppStore interface
// ============================================================================

class AppStore {
 public:
  virtual ~AppStore() = default;

  /// Current snapshot, or kNotFound when the entity has no history.
  virtual expected<AppSnapshot, StoreError> Load(const AppId& uuid) = 0;

  /// Stored history in append order (excludes any imported base snapshot).
  virtual expected<EventList, StoreError> ReadEvents(const AppId& uuid) = 0;

  /**
   * @brief Append @p events if the stored version equals
   *        @p expected_version.
   *
   * An empty @p events is a successful no-op once the version check passes.
   */
  virtual expected<void, StoreError> AppendEvents(
      const AppId& uuid, const EventList& events,
      uint64_t expected_version) = 0;
};

namespace detail {

/// Fold @p events onto an optional starting snapshot.
inline optional<AppSnapshot> FoldOnto(const optional<AppSnapshot>& base,
                                      const EventList& events) {
  if (events.empty()) return base;
  if (base.has_value()) return ApplyAll(base.value(), events);
  AppSnapshot s = ApplyFirst(events.front());
  for (size_t i = 1; i < events.size(); ++i) {
    s = Apply(s, events[i]);
  }
  return s;
}

}  // namespace detail

// ============================================================================
// InMemoryAppStore
// ============================================================================

/**
 * @brief Mutex-guarded in-process store.
 *
 * Thread-safe. Suitable for tests and for single-process deployments where
 * durability is not required.
 */
class InMemoryAppStore final : public AppStore {
 public:
  InMemoryAppStore() = default;
  InMemoryAppStore(const InMemoryAppStore&) = delete;
  InMemoryAppStore& operator=(const InMemoryAppStore&) = delete;

  expected<AppSnapshot, StoreError> Load(const AppId& uuid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(Key(uuid));
    if (it == records_.end() || !it->second.snapshot.has_value()) {
      return expected<AppSnapshot, StoreError>::error(StoreError::kNotFound);
    }
    return expected<AppSnapshot, StoreError>::success(
        it->second.snapshot.value());
  }

  expected<EventList, StoreError> ReadEvents(const AppId& uuid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(Key(uuid));
    if (it == records_.end()) {
      return expected<EventList, StoreError>::error(StoreError::kNotFound);
    }
    return expected<EventList, StoreError>::success(it->second.events);
  }

  expected<void, StoreError> AppendEvents(const AppId& uuid,
                                          const EventList& events,
                                          uint64_t expected_version) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(Key(uuid));
    const uint64_t current =
        (it != records_.end() && it->second.snapshot.has_value())
            ? it->second.snapshot.value().version
            : 0U;
    if (current != expected_version) {
      APL_LOG_WARN("Store", "append to %s rejected: version %llu, expected %llu",
                   uuid.c_str(), static_cast<unsigned long long>(current),
                   static_cast<unsigned long long>(expected_version));
      return expected<void, StoreError>::error(StoreError::kConflict);
    }
    if (events.empty()) return expected<void, StoreError>::success();

    Record& rec = (it != records_.end()) ? it->second : records_[Key(uuid)];
    rec.snapshot = detail::FoldOnto(rec.snapshot, events);
    rec.events.insert(rec.events.end(), events.begin(), events.end());
    APL_LOG_DEBUG("Store", "appended %u event(s) to %s, now version %llu",
                  static_cast<unsigned>(events.size()), uuid.c_str(),
                  static_cast<unsigned long long>(rec.snapshot.value().version));
    return expected<void, StoreError>::success();
  }

  /**
   * @brief Seed a record as an administrative import, replacing any history.
   *
   * The record is stored as given; it is revalidated by FromPersisted()
   * when loaded, so an inconsistent record surfaces as CorruptedApp.
   */
  void Import(const PersistedApp& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record& rec = records_[Key(record.uuid)];
    rec.snapshot = ToSnapshot(record);
    rec.events.clear();
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(records_.size());
  }

 private:
  struct Record {
    optional<AppSnapshot> snapshot;
    EventList events;
  };

  static std::string Key(const AppId& uuid) {
    return std::string(uuid.c_str(), uuid.size());
  }

  mutable std::mutex mutex_;
  std::map<std::string, Record> records_;
};

}  // namespace apl

#endif  // APL_STORE_HPP_
