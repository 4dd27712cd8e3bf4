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
 * @file event_codec.hpp
 * @brief JSON encoding of domain events and persisted snapshots.
 *
 * Requires nlohmann/json (APL_JSON_ENABLED). Parsing never throws: malformed
 * input comes back as a CodecError.
 *
 * Event document:
 * @code
 *   {"type":"ExistingInfrastructureSelected","uuid":"u1",
 *    "provider":"AWS","region":"us-east-1"}
 * @endcode
 * "provider" is present only for the infrastructure events, "region" only
 * when the provider is AWS. A "type" this build does not know decodes to
 * UnknownEvent so that logs written by newer producers still replay.
 *
 * Snapshot document (persisted layout):
 * @code
 *   {"uuid":"u1","status":"New","infrastructureStatus":"Selected",
 *    "infrastructureProvider":"AZURE","version":2}
 * @endcode
 */

#ifndef APL_EVENT_CODEC_HPP_
#define APL_EVENT_CODEC_HPP_

#ifdef APL_JSON_ENABLED

#include "apl/events.hpp"
#include "apl/snapshot.hpp"
#include "apl/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstring>
#include <string>

namespace apl {

enum class CodecError : uint8_t {
  kMalformed = 0,    ///< Not JSON, not an object, or a required field missing
  kInvalidValue,     ///< Field present but out of range for its type
};

namespace detail {

using Json = nlohmann::json;

/// Copy a JSON string field into a FixedString; false if absent or too long.
template <uint32_t N>
inline bool ReadText(const Json& doc, const char* field, FixedString<N>& out) {
  auto it = doc.find(field);
  if (it == doc.end() || !it->is_string()) return false;
  const std::string& text = it->template get_ref<const std::string&>();
  if (text.size() > N) return false;
  out.assign(TruncateToCapacity, text.c_str(),
             static_cast<uint32_t>(text.size()));
  return true;
}

inline bool HasString(const Json& doc, const char* field) {
  auto it = doc.find(field);
  return it != doc.end() && it->is_string();
}

inline void WriteTarget(Json& doc, const InfrastructureTarget& target) {
  doc["provider"] = ProviderName(ProviderOf(target));
  if (const auto* aws = std::get_if<AwsTarget>(&target)) {
    doc["region"] = aws->region.c_str();
  }
}

inline expected<InfrastructureTarget, CodecError> ReadTarget(const Json& doc) {
  using Result = expected<InfrastructureTarget, CodecError>;
  if (!HasString(doc, "provider")) return Result::error(CodecError::kMalformed);
  auto provider =
      ParseProvider(doc["provider"].get_ref<const std::string&>().c_str());
  if (!provider.has_value()) return Result::error(CodecError::kInvalidValue);

  if (provider.value() == Provider::kAzure) {
    if (doc.contains("region")) return Result::error(CodecError::kInvalidValue);
    return Result::success(InfrastructureTarget(AzureTarget{}));
  }
  if (!HasString(doc, "region")) return Result::error(CodecError::kMalformed);
  AwsRegion region;
  if (!ReadText(doc, "region", region) || region.empty()) {
    return Result::error(CodecError::kInvalidValue);
  }
  return Result::success(InfrastructureTarget(AwsTarget(region)));
}

}  // namespace detail

// ============================================================================
// Events
// ============================================================================

inline std::string EncodeEvent(const AppDomainEvent& event) {
  detail::Json doc;
  doc["type"] = EventName(event);
  doc["uuid"] = EventUuid(event).c_str();
  auto target = TargetOf(event);
  if (target.has_value()) detail::WriteTarget(doc, target.value());
  return doc.dump();
}

inline expected<AppDomainEvent, CodecError> DecodeEvent(const std::string& text) {
  using Result = expected<AppDomainEvent, CodecError>;
  auto doc = detail::Json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object() ||
      !detail::HasString(doc, "type") || !detail::HasString(doc, "uuid")) {
    return Result::error(CodecError::kMalformed);
  }

  AppId uuid;
  if (!detail::ReadText(doc, "uuid", uuid) || uuid.empty()) {
    return Result::error(CodecError::kInvalidValue);
  }
  const std::string& type = doc["type"].get_ref<const std::string&>();

  if (type == AppCreated::kName) return Result::success(AppCreated(uuid));
  if (type == AppActivated::kName) return Result::success(AppActivated(uuid));
  if (type == AppDeleted::kName) return Result::success(AppDeleted(uuid));

  const bool is_select = (type == ExistingInfrastructureSelected::kName);
  if (is_select || type == BuildRequested::kName) {
    auto target = detail::ReadTarget(doc);
    if (!target.has_value()) return Result::error(target.get_error());
    if (is_select) {
      return Result::success(
          ExistingInfrastructureSelected(uuid, target.value()));
    }
    return Result::success(BuildRequested(uuid, target.value()));
  }

  // A name that does not fit could not be written back unchanged.
  EventTypeName type_name;
  if (!detail::ReadText(doc, "type", type_name) || type_name.empty()) {
    return Result::error(CodecError::kInvalidValue);
  }
  return Result::success(UnknownEvent(uuid, type_name));
}

// ============================================================================
// Snapshots
// ============================================================================

inline std::string EncodeSnapshot(const PersistedApp& rec) {
  detail::Json doc;
  doc["uuid"] = rec.uuid.c_str();
  doc["status"] = StatusName(rec.status);
  doc["infrastructureStatus"] =
      InfrastructureStatusName(rec.infrastructure_status);
  if (rec.infrastructure_provider.has_value()) {
    doc["infrastructureProvider"] =
        ProviderName(rec.infrastructure_provider.value());
  }
  doc["version"] = rec.version;
  return doc.dump();
}

/**
 * @brief Decode a persisted snapshot.
 *
 * Only the document shape is checked. Unrecognised status or provider names
 * are stored data that this build cannot interpret; they decode to a record
 * with status kCorrupted rather than failing, so the entity stays visible.
 */
inline expected<PersistedApp, CodecError> DecodeSnapshot(
    const std::string& text) {
  using Result = expected<PersistedApp, CodecError>;
  auto doc = detail::Json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object() ||
      !detail::HasString(doc, "uuid") || !detail::HasString(doc, "status") ||
      !detail::HasString(doc, "infrastructureStatus")) {
    return Result::error(CodecError::kMalformed);
  }
  auto version = doc.find("version");
  if (version == doc.end() || !version->is_number_unsigned()) {
    return Result::error(CodecError::kMalformed);
  }

  PersistedApp rec{AppId(), AppStatus::kCorrupted,
                   InfrastructureStatus::kNotSelected, {},
                   version->get<uint64_t>()};
  if (!detail::ReadText(doc, "uuid", rec.uuid) || rec.uuid.empty()) {
    return Result::error(CodecError::kInvalidValue);
  }

  auto status = ParseStatus(doc["status"].get_ref<const std::string&>().c_str());
  auto infra = ParseInfrastructureStatus(
      doc["infrastructureStatus"].get_ref<const std::string&>().c_str());
  if (status.has_value() && infra.has_value()) {
    rec.status = status.value();
    rec.infrastructure_status = infra.value();
  }

  if (detail::HasString(doc, "infrastructureProvider")) {
    auto provider = ParseProvider(
        doc["infrastructureProvider"].get_ref<const std::string&>().c_str());
    if (provider.has_value()) {
      rec.infrastructure_provider = provider.value();
    } else {
      rec.status = AppStatus::kCorrupted;
    }
  }
  return Result::success(rec);
}

}  // namespace apl

#endif  // APL_JSON_ENABLED

#endif  // APL_EVENT_CODEC_HPP_
