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
 * @file file_store.hpp
 * @brief Durable AppStore: one newline-delimited JSON event log per entity.
 *
 * Layout under the store root:
 * @code
 *   <root>/<uuid>/events.ndjson   one EncodeEvent() document per line
 *   <root>/<uuid>/snapshot.json   optional base snapshot written by Import()
 * @endcode
 *
 * Load() decodes the base snapshot (if any) and folds the log over it. A line
 * that does not decode is reported as kCorruptLog; it is never skipped,
 * because replaying around a hole would produce a snapshot no history
 * justifies.
 *
 * Requires nlohmann/json (APL_JSON_ENABLED). Thread-safe within one process;
 * concurrent writers in different processes are not coordinated.
 */

#ifndef APL_FILE_STORE_HPP_
#define APL_FILE_STORE_HPP_

#ifdef APL_JSON_ENABLED

#include "apl/event_codec.hpp"
#include "apl/events.hpp"
#include "apl/log.hpp"
#include "apl/snapshot.hpp"
#include "apl/store.hpp"
#include "apl/vocabulary.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace apl {

class JsonlAppStore final : public AppStore {
 public:
  static constexpr const char* kEventsFile = "events.ndjson";
  static constexpr const char* kSnapshotFile = "snapshot.json";

  explicit JsonlAppStore(std::string root) : root_(std::move(root)) {}

  JsonlAppStore(const JsonlAppStore&) = delete;
  JsonlAppStore& operator=(const JsonlAppStore&) = delete;

  const std::string& Root() const noexcept { return root_; }

  expected<AppSnapshot, StoreError> Load(const AppId& uuid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = ReadState(uuid);
    if (!state.has_value()) {
      return expected<AppSnapshot, StoreError>::error(state.get_error());
    }
    auto current = detail::FoldOnto(state.value().base, state.value().events);
    if (!current.has_value()) {
      return expected<AppSnapshot, StoreError>::error(StoreError::kNotFound);
    }
    return expected<AppSnapshot, StoreError>::success(current.value());
  }

  expected<EventList, StoreError> ReadEvents(const AppId& uuid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = ReadState(uuid);
    if (!state.has_value()) {
      return expected<EventList, StoreError>::error(state.get_error());
    }
    if (!state.value().exists) {
      return expected<EventList, StoreError>::error(StoreError::kNotFound);
    }
    return expected<EventList, StoreError>::success(
        std::move(state.value().events));
  }

  expected<void, StoreError> AppendEvents(const AppId& uuid,
                                          const EventList& events,
                                          uint64_t expected_version) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = ReadState(uuid);
    if (!state.has_value()) {
      return expected<void, StoreError>::error(state.get_error());
    }
    auto current = detail::FoldOnto(state.value().base, state.value().events);
    const uint64_t version = current.has_value() ? current.value().version : 0U;
    if (version != expected_version) {
      APL_LOG_WARN("FileStore",
                   "append to %s rejected: version %llu, expected %llu",
                   uuid.c_str(), static_cast<unsigned long long>(version),
                   static_cast<unsigned long long>(expected_version));
      return expected<void, StoreError>::error(StoreError::kConflict);
    }
    if (events.empty()) return expected<void, StoreError>::success();

    std::filesystem::path dir = EntityDir(uuid);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return IoFailure("create", dir, ec.message().c_str());

    std::ostringstream lines;
    for (const auto& event : events) {
      lines << EncodeEvent(event) << '\n';
    }
    // A failed write is cut back to the previous size so the log never ends
    // in a torn line.
    const std::filesystem::path log = dir / kEventsFile;
    uintmax_t before = 0U;
    if (std::filesystem::exists(log, ec)) {
      before = std::filesystem::file_size(log, ec);
    }
    if (ec) return IoFailure("stat", log, ec.message().c_str());
    {
      std::ofstream out(log, std::ios::app | std::ios::binary);
      out << lines.str();
      out.flush();
      if (out) return expected<void, StoreError>::success();
    }
    if (std::filesystem::exists(log, ec)) {
      std::filesystem::resize_file(log, before, ec);
      if (ec) {
        APL_LOG_ERROR("FileStore", "rollback of %s failed: %s",
                      log.string().c_str(), ec.message().c_str());
      }
    }
    return IoFailure("append", log, "write failed");
  }

  /**
   * @brief Replace an entity with @p record as its base snapshot.
   *
   * Any existing event log is discarded. The record is written as given and
   * revalidated when loaded.
   */
  expected<void, StoreError> Import(const PersistedApp& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsSafeName(record.uuid)) {
      return expected<void, StoreError>::error(StoreError::kIoError);
    }
    std::filesystem::path dir = EntityDir(record.uuid);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return IoFailure("create", dir, ec.message().c_str());

    // The old log goes before the new base is published, so a failure never
    // pairs the new base with a stale history.
    std::filesystem::path tmp = dir / "snapshot.json.tmp";
    {
      std::ofstream out(tmp, std::ios::trunc | std::ios::binary);
      out << EncodeSnapshot(record) << '\n';
      out.flush();
      if (!out) {
        out.close();
        std::filesystem::remove(tmp, ec);
        return IoFailure("write", tmp, "write failed");
      }
    }
    std::filesystem::remove(dir / kEventsFile, ec);
    if (ec) {
      const std::string reason = ec.message();
      std::filesystem::remove(tmp, ec);
      return IoFailure("remove", dir / kEventsFile, reason.c_str());
    }
    std::filesystem::rename(tmp, dir / kSnapshotFile, ec);
    if (ec) return IoFailure("rename", tmp, ec.message().c_str());
    return expected<void, StoreError>::success();
  }

 private:
  struct State {
    bool exists = false;
    optional<AppSnapshot> base;
    EventList events;
  };

  // Uuids become directory names; anything that could escape the root or
  // address a different entity is refused.
  static bool IsSafeName(const AppId& uuid) noexcept {
    if (uuid.empty() || uuid == "." || uuid == "..") return false;
    for (uint32_t i = 0; i < uuid.size(); ++i) {
      const char c = uuid.c_str()[i];
      if (c == '/' || c == '\\' || c == '\0') return false;
    }
    return true;
  }

  std::filesystem::path EntityDir(const AppId& uuid) const {
    return std::filesystem::path(root_) / uuid.c_str();
  }

  expected<void, StoreError> IoFailure(const char* op,
                                       const std::filesystem::path& path,
                                       const char* reason) const {
    APL_LOG_ERROR("FileStore", "%s %s: %s", op, path.string().c_str(), reason);
    return expected<void, StoreError>::error(StoreError::kIoError);
  }

  expected<State, StoreError> ReadState(const AppId& uuid) const {
    using Result = expected<State, StoreError>;
    if (!IsSafeName(uuid)) {
      APL_LOG_ERROR("FileStore", "refusing entity name '%s'", uuid.c_str());
      return Result::error(StoreError::kIoError);
    }
    State state;
    const std::filesystem::path dir = EntityDir(uuid);
    std::error_code ec;

    const std::filesystem::path snap_path = dir / kSnapshotFile;
    if (std::filesystem::exists(snap_path, ec)) {
      std::ifstream in(snap_path, std::ios::binary);
      if (!in) {
        (void)IoFailure("open", snap_path, "read failed");
        return Result::error(StoreError::kIoError);
      }
      std::ostringstream text;
      text << in.rdbuf();
      auto rec = DecodeSnapshot(text.str());
      if (!rec.has_value()) {
        APL_LOG_ERROR("FileStore", "%s: undecodable snapshot",
                      snap_path.string().c_str());
        return Result::error(StoreError::kCorruptLog);
      }
      if (rec.value().uuid != uuid) {
        APL_LOG_ERROR("FileStore", "%s: snapshot belongs to %s",
                      snap_path.string().c_str(), rec.value().uuid.c_str());
        return Result::error(StoreError::kCorruptLog);
      }
      state.base = ToSnapshot(rec.value());
      state.exists = true;
    }

    const std::filesystem::path log_path = dir / kEventsFile;
    if (std::filesystem::exists(log_path, ec)) {
      std::ifstream in(log_path, std::ios::binary);
      if (!in) {
        (void)IoFailure("open", log_path, "read failed");
        return Result::error(StoreError::kIoError);
      }
      std::string line;
      uint32_t line_no = 0;
      while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        auto event = DecodeEvent(line);
        if (!event.has_value()) {
          APL_LOG_ERROR("FileStore", "%s:%u: undecodable event",
                        log_path.string().c_str(), line_no);
          return Result::error(StoreError::kCorruptLog);
        }
        state.events.push_back(std::move(event).value());
      }
      state.exists = true;
    }
    return Result::success(std::move(state));
  }

  std::string root_;
  mutable std::mutex mutex_;
};

}  // namespace apl

#endif  // APL_JSON_ENABLED

#endif  // APL_FILE_STORE_HPP_
