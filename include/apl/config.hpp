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
 * @file config.hpp
 * @brief Service configuration: multi-format reader plus the mapping onto
 *        ServiceConfig.
 *
 * Backends are type tags resolved at compile time. Each one is compiled in
 * only when its library was found by the build:
 *   - IniBackend  : inih           (APL_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (APL_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (APL_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Keys at the top
 * level of JSON/YAML documents land in section "".
 *
 * Recognised settings:
 * @code
 *   [log]
 *   level = INFO              ; DEBUG | INFO | WARN | ERROR | FATAL | OFF
 *   [store]
 *   backend = jsonl           ; memory | jsonl
 *   directory = /var/lib/apps
 *   [provisioning]
 *   enabled = true
 * @endcode
 */

#ifndef APL_CONFIG_HPP_
#define APL_CONFIG_HPP_

#include "apl/log.hpp"
#include "apl/platform.hpp"
#include "apl/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef APL_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef APL_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef APL_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace apl {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool NoCaseEqual(const char* a, const char* b) noexcept {
  if (a == nullptr || b == nullptr) return a == b;
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a; ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::NoCaseEqual(ext, "ini") || detail::NoCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::NoCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::NoCaseEqual(ext, "yaml") || detail::NoCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef APL_CONFIG_MAX_FILE_SIZE
#define APL_CONFIG_MAX_FILE_SIZE 4096U
#endif

/// Flat, case-insensitive key/value table shared by all backends.
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 32U;
  static constexpr uint32_t kMaxNameLen = 32U;
  static constexpr uint32_t kMaxValueLen = 256U;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? IsTruthy(e->value.c_str()) : default_val;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return {};
    return static_cast<int32_t>(val);
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// Insert or overwrite. Returns false when the table is full.
  bool Set(const char* section, const char* key, const char* value) {
    Entry* e = const_cast<Entry*>(Find(section, key));
    if (e == nullptr) {
      if (count_ >= kMaxEntries) return false;
      e = &entries_[count_++];
      e->section.assign(TruncateToCapacity, section);
      e->key.assign(TruncateToCapacity, key);
    }
    e->value.assign(TruncateToCapacity, value);
    return true;
  }

 protected:
  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (bytes == buf_size - 1U) && std::fgetc(f) != EOF;
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  static const char* ExtensionOf(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

 private:
  struct Entry {
    FixedString<kMaxNameLen> section;
    FixedString<kMaxNameLen> key;
    FixedString<kMaxValueLen> value;
  };

  const Entry* Find(const char* section, const char* key) const {
    APL_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::NoCaseEqual(entries_[i].section.c_str(), section) &&
          detail::NoCaseEqual(entries_[i].key.c_str(), key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static bool IsTruthy(const char* s) noexcept {
    return detail::NoCaseEqual(s, "true") || detail::NoCaseEqual(s, "yes") ||
           detail::NoCaseEqual(s, "on") || detail::NoCaseEqual(s, "1");
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Primary template: a backend whose library is not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef APL_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int rc = ini_parse(path, OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return Finish(rc);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    return Finish(ini_parse_string(data, OnEntry, &store));
  }

 private:
  static expected<void, ConfigError> Finish(int rc) {
    if (rc != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  // inih stops and reports the line number when the handler returns 0.
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Set(section != nullptr ? section : "",
                      name != nullptr ? name : "",
                      value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif  // APL_CONFIG_INI_ENABLED

#ifdef APL_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[APL_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto doc = nlohmann::json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = doc.begin(); sec != doc.end(); ++sec) {
      if (!sec->is_object()) {
        if (!Put(store, "", sec.key(), *sec)) return Full();
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (!Put(store, sec.key().c_str(), kv.key(), *kv)) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static bool Put(ConfigStore& store, const char* section,
                  const std::string& key, const nlohmann::json& node) {
    std::string text;
    if (node.is_string()) {
      text = node.get<std::string>();
    } else if (node.is_boolean()) {
      text = node.get<bool>() ? "true" : "false";
    } else {
      text = node.dump();
    }
    return store.Set(section, key.c_str(), text.c_str());
  }
};
#endif  // APL_JSON_ENABLED

#ifdef APL_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[APL_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      const std::string name = sec.key().get_value<std::string>();
      auto& node = *sec;
      if (!node.is_mapping()) {
        if (!Put(store, "", name, node)) return Full();
        continue;
      }
      for (auto kv = node.begin(); kv != node.end(); ++kv) {
        if (!Put(store, name.c_str(), kv.key().get_value<std::string>(), *kv)) {
          return Full();
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static bool Put(ConfigStore& store, const char* section,
                  const std::string& key, const fkyaml::node& node) {
    std::string text;
    if (node.is_string()) {
      text = node.get_value<std::string>();
    } else if (node.is_boolean()) {
      text = node.get_value<bool>() ? "true" : "false";
    } else if (node.is_integer()) {
      text = std::to_string(node.get_value<int64_t>());
    } else if (node.is_float_number()) {
      char num[32];
      std::snprintf(num, sizeof(num), "%g", node.get_value<double>());
      text = num;
    }
    return store.Set(section, key.c_str(), text.c_str());
  }
};
#endif  // APL_CONFIG_YAML_ENABLED

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  /// Load @p path; kAuto picks the backend from the file extension.
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    APL_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return ParseFileAs<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    APL_ASSERT(data != nullptr);
    return ParseBufferAs<Backends...>(data, size, format);
  }

 private:
  using Fallback = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseFileAs(const char* path,
                                          ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return ParseFileAs<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseBufferAs(const char* data, uint32_t size,
                                            ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return ParseBufferAs<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  static ConfigFormat MatchExtension(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return MatchExtension<Rest...>(ext);
    return Fallback::kFormat;
  }

  static ConfigFormat DetectFormat(const char* path) noexcept {
    const char* ext = ExtensionOf(path);
    return (ext == nullptr) ? Fallback::kFormat : MatchExtension<Backends...>(ext);
  }
};

#if defined(APL_CONFIG_INI_ENABLED) || defined(APL_JSON_ENABLED) || \
    defined(APL_CONFIG_YAML_ENABLED)
#define APL_CONFIG_HAS_BACKEND 1

/// Every backend compiled into this build, INI first.
using MultiConfig = Config<
#ifdef APL_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(APL_CONFIG_INI_ENABLED) && \
    (defined(APL_JSON_ENABLED) || defined(APL_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef APL_JSON_ENABLED
    JsonBackend
#endif
#if defined(APL_JSON_ENABLED) && defined(APL_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef APL_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef APL_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef APL_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef APL_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// ServiceConfig
// ============================================================================

enum class StoreBackend : uint8_t {
  kMemory = 0,
  kJsonl,
};

inline const char* StoreBackendName(StoreBackend backend) noexcept {
  return backend == StoreBackend::kJsonl ? "jsonl" : "memory";
}

inline constexpr uint32_t kStoreDirCapacity = 200U;

struct ServiceConfig {
  log::Level log_level = log::Level::kInfo;
  StoreBackend store_backend = StoreBackend::kMemory;
  FixedString<kStoreDirCapacity> store_directory = "./apps";
  bool provisioning_enabled = true;
};

/**
 * @brief Map a loaded ConfigStore onto ServiceConfig.
 *
 * Missing keys keep their defaults. Unrecognised values are logged at WARN
 * and also keep their defaults.
 */
inline ServiceConfig LoadServiceConfig(const ConfigStore& cfg) {
  ServiceConfig out;

  if (cfg.HasKey("log", "level")) {
    const char* text = cfg.GetString("log", "level");
    // Two different fallbacks agree only when the name was recognised.
    const log::Level a = log::ParseLevel(text, log::Level::kDebug);
    const log::Level b = log::ParseLevel(text, log::Level::kOff);
    if (a == b) {
      out.log_level = a;
    } else {
      APL_LOG_WARN("Config", "unknown log level '%s', using %s", text,
                   log::detail::LevelTag(out.log_level));
    }
  }

  if (cfg.HasKey("store", "backend")) {
    const char* text = cfg.GetString("store", "backend");
    if (detail::NoCaseEqual(text, "memory")) {
      out.store_backend = StoreBackend::kMemory;
    } else if (detail::NoCaseEqual(text, "jsonl")) {
      out.store_backend = StoreBackend::kJsonl;
    } else {
      APL_LOG_WARN("Config", "unknown store backend '%s', using %s", text,
                   StoreBackendName(out.store_backend));
    }
  }

  if (cfg.HasKey("store", "directory")) {
    const char* text = cfg.GetString("store", "directory");
    if (text[0] != '\0' && std::strlen(text) <= kStoreDirCapacity) {
      out.store_directory.assign(TruncateToCapacity, text);
    } else {
      APL_LOG_WARN("Config", "unusable store directory '%s', using %s", text,
                   out.store_directory.c_str());
    }
  }

  out.provisioning_enabled =
      cfg.GetBool("provisioning", "enabled", out.provisioning_enabled);
  return out;
}

}  // namespace apl

#endif  // APL_CONFIG_HPP_
