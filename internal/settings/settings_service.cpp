#include "settings_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <array>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chunkcam::settings {

using chunkcam::observability::StringField;
using chunkcam::v1::Settings;

namespace {

constexpr std::array<std::string_view, 3> kQualities = {"480p", "720p", "1080p"};

bool IsKnownQuality(const std::string& quality) {
  for (auto q : kQualities) {
    if (quality == q) return true;
  }
  return false;
}

// Returns the name of the first invalid field, empty when all present fields are valid.
std::string FirstInvalidField(const Settings& s) {
  if (s.has_video_quality() && !IsKnownQuality(s.video_quality())) return "video_quality";
  if (s.has_chunk_duration_minutes() && (s.chunk_duration_minutes() < 1 || s.chunk_duration_minutes() > 30)) return "chunk_duration_minutes";
  if (s.has_max_retry_attempts() && s.max_retry_attempts() > 10) return "max_retry_attempts";
  if (s.has_max_local_storage_gb() && (s.max_local_storage_gb() < 0.5 || s.max_local_storage_gb() > 10.0)) return "max_local_storage_gb";
  return {};
}

} // namespace

SettingsService::SettingsService(std::shared_ptr<db::KeyValueStore> store) : store_(std::move(store)) {
}

Settings SettingsService::Defaults() {
  Settings s;
  s.set_video_quality("720p");
  s.set_record_audio(true);
  s.set_chunk_duration_minutes(5);
  s.set_auto_restart(true);
  s.set_wifi_only_upload(false);
  s.set_delete_after_upload(true);
  s.set_max_retry_attempts(3);
  s.set_background_notifications(true);
  s.set_max_local_storage_gb(2.0);
  s.set_auto_delete_old_files(true);
  return s;
}

void SettingsService::Validate(const Settings& partial) {
  const auto field = FirstInvalidField(partial);
  if (!field.empty()) {
    throw util::InvalidSetting("invalid value for setting " + field);
  }
}

void SettingsService::LoadLocked() {
  if (settings_) return;

  Settings merged = Defaults();

  std::optional<std::string> stored;
  try {
    stored = store_->Load(kStorageKey);
  } catch (const std::exception& e) {
    CHUNKCAM_LOG_ERROR("failed to load settings, using defaults", {StringField("error", e.what())});
    settings_ = merged;
    return;
  }

  if (!stored) {
    settings_ = merged;
    SaveLocked();
    return;
  }

  Settings                                 parsed;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(*stored, &parsed, options);
  if (!status.ok()) {
    CHUNKCAM_LOG_ERROR("stored settings are malformed, using defaults", {StringField("error", std::string(status.message()))});
  } else {
    merged.MergeFrom(parsed);
  }
  settings_ = merged;
}

void SettingsService::SaveLocked() {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(*settings_, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize settings: " + std::string(status.message()));
  }
  store_->Save(kStorageKey, json);
}

Settings SettingsService::Get() {
  std::lock_guard lock(mutex_);
  LoadLocked();
  return *settings_;
}

Settings SettingsService::Update(const Settings& partial) {
  Validate(partial);

  std::lock_guard lock(mutex_);
  LoadLocked();
  settings_->MergeFrom(partial);
  SaveLocked();

  CHUNKCAM_LOG_INFO("settings updated", {StringField("fields", partial.ShortDebugString())});
  return *settings_;
}

Settings SettingsService::ResetToDefaults() {
  std::lock_guard lock(mutex_);
  settings_ = Defaults();
  SaveLocked();

  CHUNKCAM_LOG_INFO("settings reset to defaults");
  return *settings_;
}

std::string SettingsService::ExportJson() {
  std::lock_guard lock(mutex_);
  LoadLocked();

  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(*settings_, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to export settings: " + std::string(status.message()));
  }
  return json;
}

Settings SettingsService::ImportJson(const std::string& json) {
  Settings                                 imported;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &imported, options);
  if (!status.ok()) {
    throw util::InvalidSetting("invalid settings format: " + std::string(status.message()));
  }

  // drop invalid entries one at a time instead of rejecting the whole document
  for (auto field = FirstInvalidField(imported); !field.empty(); field = FirstInvalidField(imported)) {
    CHUNKCAM_LOG_WARN("ignoring invalid imported setting", {StringField("field", field)});
    const auto* descriptor = imported.GetDescriptor()->FindFieldByName(field);
    imported.GetReflection()->ClearField(&imported, descriptor);
  }

  return Update(imported);
}

} // namespace chunkcam::settings
