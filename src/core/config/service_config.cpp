#include "core/config/service_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <sstream>

namespace bugreportd::core::config {

namespace {

using JsonValue = json::Value;

const std::set<std::string> kKnownKeys = {
    "consent_timeout_ms",
    "telephony_consent_timeout_ms",
    "require_consent",
    "consent_exempt_uids",
    "allowed_uids",
    "journal_dir",
    "retained_dir",
    "log_level",
};

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string TypeMismatch(std::string_view expected, const JsonValue& actual) {
  return "must be " + std::string(expected) + " (got " + json::TypeName(actual.type) + ")";
}

bool IsIntegral(double value) {
  return std::isfinite(value) && std::floor(value) == value;
}

void ReadTimeout(const JsonValue& root, std::string_view key, std::chrono::milliseconds& out,
                 ConfigReport& report) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return;
  }
  const std::string path = "$." + std::string(key);
  if (!field->is_number()) {
    AddIssue(report, path, TypeMismatch("a number", *field));
    return;
  }
  if (!IsIntegral(field->number_value) || field->number_value <= 0.0) {
    AddIssue(report, path, "must be a positive integer number of milliseconds");
    return;
  }
  if (field->number_value > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    AddIssue(report, path, "is unreasonably large");
    return;
  }
  out = std::chrono::milliseconds(static_cast<std::int64_t>(field->number_value));
}

void ReadUidList(const JsonValue& root, std::string_view key, std::vector<std::int32_t>& out,
                 ConfigReport& report) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return;
  }
  const std::string path = "$." + std::string(key);
  if (!field->is_array()) {
    AddIssue(report, path, TypeMismatch("an array of uids", *field));
    return;
  }

  std::vector<std::int32_t> uids;
  bool ok = true;
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    const std::string item_path = path + "[" + std::to_string(i) + "]";
    if (!item.is_number() || !IsIntegral(item.number_value) || item.number_value < 0.0 ||
        item.number_value > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
      AddIssue(report, item_path, "must be a non-negative integer uid");
      ok = false;
      continue;
    }
    uids.push_back(static_cast<std::int32_t>(item.number_value));
  }
  if (ok) {
    out = std::move(uids);
  }
}

void ReadPath(const JsonValue& root, std::string_view key, std::filesystem::path& out,
              ConfigReport& report) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return;
  }
  if (!field->is_string()) {
    AddIssue(report, "$." + std::string(key), TypeMismatch("a string path", *field));
    return;
  }
  out = field->string_value;
}

} // namespace

bool ParseServiceConfig(std::string_view json_text, ServiceConfig& config, ConfigReport& report) {
  report = ConfigReport{};

  JsonValue root;
  std::string parse_error;
  if (!json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    return false;
  }
  if (!root.is_object()) {
    AddIssue(report, "$", TypeMismatch("an object", root));
    return false;
  }

  for (const auto& [key, value] : root.object_value) {
    (void)value;
    if (kKnownKeys.count(key) == 0U) {
      AddIssue(report, "$." + key, "unknown config key");
    }
  }

  ReadTimeout(root, "consent_timeout_ms", config.consent_timeout, report);
  ReadTimeout(root, "telephony_consent_timeout_ms", config.telephony_consent_timeout, report);

  if (const JsonValue* field = root.Find("require_consent"); field != nullptr) {
    if (field->is_bool()) {
      config.require_consent = field->bool_value;
    } else {
      AddIssue(report, "$.require_consent", TypeMismatch("a bool", *field));
    }
  }

  ReadUidList(root, "consent_exempt_uids", config.consent_exempt_uids, report);
  ReadUidList(root, "allowed_uids", config.allowed_uids, report);
  ReadPath(root, "journal_dir", config.journal_dir, report);
  ReadPath(root, "retained_dir", config.retained_dir, report);

  if (const JsonValue* field = root.Find("log_level"); field != nullptr) {
    std::string level_error;
    if (!field->is_string()) {
      AddIssue(report, "$.log_level", TypeMismatch("a string", *field));
    } else if (!logging::ParseLogLevel(field->string_value, config.log_level, level_error)) {
      AddIssue(report, "$.log_level", level_error);
    }
  }

  report.valid = report.issues.empty();
  return report.valid;
}

bool LoadServiceConfig(const std::filesystem::path& path, ServiceConfig& config,
                       ConfigReport& report) {
  std::string text;
  std::string error;
  if (!ReadFileToString(path, text, error)) {
    report = ConfigReport{};
    AddIssue(report, "$", error);
    return false;
  }
  return ParseServiceConfig(text, config, report);
}

std::string FormatConfigIssues(const ConfigReport& report) {
  std::ostringstream out;
  for (const auto& issue : report.issues) {
    out << issue.path << ": " << issue.message << '\n';
  }
  return out.str();
}

} // namespace bugreportd::core::config
