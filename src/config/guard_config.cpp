#include "config/guard_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace docguard::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool TryGetInteger(const JsonValue& value, std::int64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value)) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored > static_cast<double>(std::numeric_limits<std::int32_t>::max()) ||
      floored < static_cast<double>(std::numeric_limits<std::int32_t>::min())) {
    return false;
  }
  out = static_cast<std::int64_t>(floored);
  return true;
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::int64_t& out) {
  return TryGetInteger(value, out) && out >= 0;
}

void ReportUnknownKeys(const JsonValue& object, std::string_view prefix,
                       std::initializer_list<std::string_view> known, ConfigReport& report) {
  for (const auto& [key, unused] : object.object_value) {
    (void)unused;
    bool recognized = false;
    for (const std::string_view candidate : known) {
      if (key == candidate) {
        recognized = true;
        break;
      }
    }
    if (!recognized) {
      const std::string path = prefix.empty() ? key : std::string(prefix) + "." + key;
      AddIssue(report, path, "unknown key");
    }
  }
}

const JsonValue* RequireObject(const JsonValue& parent, std::string_view key,
                               ConfigReport& report) {
  const JsonValue* section = parent.Find(key);
  if (section == nullptr) {
    return nullptr;
  }
  if (!section->IsObject()) {
    AddIssue(report, std::string(key), "must be an object");
    return nullptr;
  }
  return section;
}

void ReadBool(const JsonValue& section, std::string_view key, std::string_view path, bool& out,
              ConfigReport& report) {
  const JsonValue* value = section.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!value->IsBool()) {
    AddIssue(report, std::string(path), "must be a boolean");
    return;
  }
  out = value->bool_value;
}

bool ReadNonNegative(const JsonValue& section, std::string_view key, std::string_view path,
                     std::int64_t& out, ConfigReport& report) {
  const JsonValue* value = section.Find(key);
  if (value == nullptr) {
    return false;
  }
  if (!TryGetNonNegativeInteger(*value, out)) {
    AddIssue(report, std::string(path), "must be a non-negative integer");
    return false;
  }
  return true;
}

void ReadStringArray(const JsonValue& section, std::string_view key, std::string_view path,
                     bool allow_empty_items, std::vector<std::string>& out,
                     ConfigReport& report) {
  const JsonValue* value = section.Find(key);
  if (value == nullptr) {
    return;
  }
  if (!value->IsArray()) {
    AddIssue(report, std::string(path), "must be an array of strings");
    return;
  }

  std::vector<std::string> parsed;
  bool ok = true;
  for (std::size_t i = 0; i < value->array_value.size(); ++i) {
    const JsonValue& item = value->array_value[i];
    if (!item.IsString() || (!allow_empty_items && item.string_value.empty())) {
      AddIssue(report, std::string(path) + "[" + std::to_string(i) + "]",
               "must be a non-empty string");
      ok = false;
      continue;
    }
    parsed.push_back(item.string_value);
  }
  if (ok) {
    out = std::move(parsed);
  }
}

void LoadResilience(const JsonValue& root, resilience::ResilienceConfig& out,
                    ConfigReport& report) {
  const JsonValue* section = RequireObject(root, "resilience", report);
  if (section == nullptr) {
    return;
  }
  ReportUnknownKeys(*section, "resilience",
                    {"enabled", "max_retries", "initial_backoff_ms", "max_backoff_ms",
                     "backoff_multiplier", "jitter_factor", "failure_threshold",
                     "reset_timeout_ms"},
                    report);

  ReadBool(*section, "enabled", "resilience.enabled", out.enabled, report);

  std::int64_t parsed = 0;
  if (ReadNonNegative(*section, "max_retries", "resilience.max_retries", parsed, report)) {
    out.max_retries = static_cast<std::uint32_t>(parsed);
  }
  if (ReadNonNegative(*section, "initial_backoff_ms", "resilience.initial_backoff_ms", parsed,
                      report)) {
    out.initial_backoff = std::chrono::milliseconds(parsed);
  }
  if (ReadNonNegative(*section, "max_backoff_ms", "resilience.max_backoff_ms", parsed, report)) {
    out.max_backoff = std::chrono::milliseconds(parsed);
  }
  if (out.max_backoff < out.initial_backoff) {
    AddIssue(report, "resilience.max_backoff_ms", "must be >= resilience.initial_backoff_ms");
  }

  if (const JsonValue* multiplier = section->Find("backoff_multiplier"); multiplier != nullptr) {
    if (!multiplier->IsNumber() || !std::isfinite(multiplier->number_value) ||
        multiplier->number_value < 1.0) {
      AddIssue(report, "resilience.backoff_multiplier", "must be a number >= 1.0");
    } else {
      out.backoff_multiplier = multiplier->number_value;
    }
  }

  if (const JsonValue* jitter = section->Find("jitter_factor"); jitter != nullptr) {
    if (!jitter->IsNumber() || !std::isfinite(jitter->number_value) ||
        jitter->number_value < 0.0 || jitter->number_value > 1.0) {
      AddIssue(report, "resilience.jitter_factor", "must be a number in range [0,1]");
    } else {
      out.jitter_factor = jitter->number_value;
    }
  }

  // Non-positive threshold/timeout are accepted; the breaker substitutes its
  // defaults for them.
  if (const JsonValue* threshold = section->Find("failure_threshold"); threshold != nullptr) {
    if (!TryGetInteger(*threshold, parsed)) {
      AddIssue(report, "resilience.failure_threshold", "must be an integer");
    } else {
      out.failure_threshold = static_cast<int>(parsed);
    }
  }
  if (const JsonValue* reset = section->Find("reset_timeout_ms"); reset != nullptr) {
    if (!TryGetInteger(*reset, parsed)) {
      AddIssue(report, "resilience.reset_timeout_ms", "must be an integer (milliseconds)");
    } else {
      out.reset_timeout = std::chrono::milliseconds(parsed);
    }
  }
}

void LoadValidator(const JsonValue& root, content::ValidatorConfig& out, ConfigReport& report) {
  const JsonValue* section = RequireObject(root, "validator", report);
  if (section == nullptr) {
    return;
  }
  ReportUnknownKeys(*section, "validator",
                    {"min_title_length", "max_title_length", "min_body_length",
                     "required_sections", "forbidden_patterns", "sanitize_forbidden"},
                    report);

  std::int64_t parsed = 0;
  if (ReadNonNegative(*section, "min_title_length", "validator.min_title_length", parsed,
                      report)) {
    out.min_title_length = static_cast<std::size_t>(parsed);
  }
  if (ReadNonNegative(*section, "max_title_length", "validator.max_title_length", parsed,
                      report)) {
    out.max_title_length = static_cast<std::size_t>(parsed);
  }
  if (ReadNonNegative(*section, "min_body_length", "validator.min_body_length", parsed, report)) {
    out.min_body_length = static_cast<std::size_t>(parsed);
  }
  if (out.max_title_length < out.min_title_length) {
    AddIssue(report, "validator.max_title_length", "must be >= validator.min_title_length");
  }

  ReadStringArray(*section, "required_sections", "validator.required_sections", false,
                  out.required_sections, report);
  // Pattern syntax is checked by the validator itself, which skips bad ones.
  ReadStringArray(*section, "forbidden_patterns", "validator.forbidden_patterns", false,
                  out.forbidden_patterns, report);
  ReadBool(*section, "sanitize_forbidden", "validator.sanitize_forbidden",
           out.sanitize_forbidden, report);
}

void LoadOutput(const JsonValue& root, OutputConfig& out, ConfigReport& report) {
  const JsonValue* section = RequireObject(root, "output", report);
  if (section == nullptr) {
    return;
  }
  ReportUnknownKeys(*section, "output", {"dir"}, report);

  if (const JsonValue* dir = section->Find("dir"); dir != nullptr) {
    if (!dir->IsString() || dir->string_value.empty()) {
      AddIssue(report, "output.dir", "must be a non-empty string");
    } else {
      out.dir = dir->string_value;
    }
  }
}

void LoadSimBackend(const JsonValue& backend, backends::sim::SimBackendConfig& out,
                    ConfigReport& report) {
  const JsonValue* sim = backend.Find("sim");
  if (sim == nullptr) {
    return;
  }
  if (!sim->IsObject()) {
    AddIssue(report, "backend.sim", "must be an object");
    return;
  }
  ReportUnknownKeys(*sim, "backend.sim", {"fail_first_n", "failure_message", "latency_ms",
                                          "response"},
                    report);

  std::int64_t parsed = 0;
  if (ReadNonNegative(*sim, "fail_first_n", "backend.sim.fail_first_n", parsed, report)) {
    out.fail_first_n = static_cast<std::uint32_t>(parsed);
  }
  if (ReadNonNegative(*sim, "latency_ms", "backend.sim.latency_ms", parsed, report)) {
    out.latency = std::chrono::milliseconds(parsed);
  }
  if (const JsonValue* message = sim->Find("failure_message"); message != nullptr) {
    if (!message->IsString() || message->string_value.empty()) {
      AddIssue(report, "backend.sim.failure_message", "must be a non-empty string");
    } else {
      out.failure_message = message->string_value;
    }
  }
  if (const JsonValue* response = sim->Find("response"); response != nullptr) {
    if (!response->IsString()) {
      AddIssue(report, "backend.sim.response", "must be a string");
    } else {
      out.response = response->string_value;
    }
  }
}

void LoadBackend(const JsonValue& root, BackendConfig& out, ConfigReport& report) {
  const JsonValue* section = RequireObject(root, "backend", report);
  if (section == nullptr) {
    return;
  }
  ReportUnknownKeys(*section, "backend", {"type", "command", "sim"}, report);

  if (const JsonValue* type = section->Find("type"); type != nullptr) {
    if (!type->IsString() || !ParseBackendType(type->string_value, out.type)) {
      AddIssue(report, "backend.type", "must be one of: sim, command");
    }
  }
  if (const JsonValue* command = section->Find("command"); command != nullptr) {
    if (!command->IsString()) {
      AddIssue(report, "backend.command", "must be a string");
    } else {
      out.command = command->string_value;
    }
  }
  if (out.type == BackendType::kCommand && out.command.empty()) {
    AddIssue(report, "backend.command", "is required when backend.type is 'command'");
  }

  LoadSimBackend(*section, out.sim, report);
}

} // namespace

std::string_view ToString(const BackendType type) {
  switch (type) {
  case BackendType::kSim:
    return "sim";
  case BackendType::kCommand:
    return "command";
  }
  return "sim";
}

bool ParseBackendType(std::string_view raw, BackendType& type) {
  if (raw == "sim") {
    type = BackendType::kSim;
    return true;
  }
  if (raw == "command") {
    type = BackendType::kCommand;
    return true;
  }
  return false;
}

GuardConfig DefaultGuardConfig() {
  return GuardConfig{};
}

bool LoadGuardConfigText(std::string_view json_text, GuardConfig& config, ConfigReport& report,
                         std::string& error) {
  error.clear();
  report = ConfigReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be a JSON object");
    return true;
  }

  ReportUnknownKeys(root, "", {"resilience", "validator", "output", "backend"}, report);

  GuardConfig loaded = DefaultGuardConfig();
  LoadResilience(root, loaded.resilience, report);
  LoadValidator(root, loaded.validator, report);
  LoadOutput(root, loaded.output, report);
  LoadBackend(root, loaded.backend, report);

  report.valid = report.issues.empty();
  if (report.valid) {
    config = std::move(loaded);
  }
  return true;
}

bool LoadGuardConfigFile(const fs::path& config_path, GuardConfig& config, ConfigReport& report,
                         std::string& error) {
  std::string text;
  if (!core::ReadTextFile(config_path, text, error)) {
    return false;
  }
  return LoadGuardConfigText(text, config, report, error);
}

std::string FormatConfigIssues(const ConfigReport& report) {
  std::ostringstream out;
  for (const ConfigIssue& issue : report.issues) {
    out << issue.path << ": " << issue.message << '\n';
  }
  return out.str();
}

} // namespace docguard::config
