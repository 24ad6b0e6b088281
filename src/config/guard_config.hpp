#pragma once

#include "backends/sim/sim_generation_backend.hpp"
#include "content/content_validator.hpp"
#include "resilience/resilient_executor.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace docguard::config {

enum class BackendType {
  kSim,
  kCommand,
};

std::string_view ToString(BackendType type);
bool ParseBackendType(std::string_view raw, BackendType& type);

struct BackendConfig {
  BackendType type = BackendType::kSim;
  // Shell command for kCommand; receives the prompt on stdin.
  std::string command;
  backends::sim::SimBackendConfig sim;
};

struct OutputConfig {
  std::filesystem::path dir = "issues";
};

struct GuardConfig {
  resilience::ResilienceConfig resilience;
  content::ValidatorConfig validator;
  OutputConfig output;
  BackendConfig backend;
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ConfigIssue> issues;
};

GuardConfig DefaultGuardConfig();

// Parses and validates a JSON config document.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Returns false only for internal failures outside the validation flow.
// - Every key is optional; absent keys keep their defaults.
// - Unknown keys, wrong types and out-of-range values become `report.issues`.
// - `config` is assigned only when `report.valid` is true.
// - Parse errors are reported under path `$`.
bool LoadGuardConfigText(std::string_view json_text, GuardConfig& config, ConfigReport& report,
                         std::string& error);

// Reads and validates a config file. Returns false when the file cannot be
// read; otherwise behaves like LoadGuardConfigText.
bool LoadGuardConfigFile(const std::filesystem::path& config_path, GuardConfig& config,
                         ConfigReport& report, std::string& error);

// One `path: message` line per issue.
std::string FormatConfigIssues(const ConfigReport& report);

} // namespace docguard::config
