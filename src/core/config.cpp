#include "docu_mcp/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::core {
namespace {

constexpr const char* kConfigDirName = "docu-mcp";
constexpr const char* kConfigFileName = "config.json";

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return fallback;
}

Config config_from_json(const nlohmann::json& document, const std::string& source) {
  if (!document.is_object()) {
    throw DocumentError(ErrorKind::kPersistLoadFailed, "config root must be an object: " + source);
  }

  Config config{};

  const auto directories_it = document.find("directories");
  if (directories_it != document.end()) {
    if (!directories_it->is_array()) {
      throw DocumentError(ErrorKind::kPersistLoadFailed, "directories must be an array of strings: " + source);
    }
    for (const auto& entry : *directories_it) {
      if (!entry.is_string()) {
        throw DocumentError(ErrorKind::kPersistLoadFailed, "directories must be an array of strings: " + source);
      }
      auto directory = entry.get<std::string>();
      if (std::find(config.directories.begin(), config.directories.end(), directory) == config.directories.end()) {
        config.directories.push_back(std::move(directory));
      }
    }
  }

  const auto active_it = document.find("active_directory");
  if (active_it != document.end() && !active_it->is_null()) {
    if (!active_it->is_string()) {
      throw DocumentError(ErrorKind::kPersistLoadFailed, "active_directory must be a string or null: " + source);
    }
    config.active_directory = active_it->get<std::string>();
  }

  return config;
}

nlohmann::json config_to_json(const Config& config) {
  nlohmann::json active = nullptr;
  if (config.active_directory.has_value()) {
    active = *config.active_directory;
  }
  return nlohmann::json{{"directories", config.directories}, {"active_directory", active}};
}

}  // namespace

JsonFileConfigStore::JsonFileConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

Config JsonFileConfigStore::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) {
      throw DocumentError(ErrorKind::kPersistLoadFailed,
                          "unable to stat config file " + path_.string() + ": " + ec.message());
    }
    return Config{};
  }

  std::ifstream input(path_, std::ios::binary);
  if (!input.is_open()) {
    throw DocumentError(ErrorKind::kPersistLoadFailed, "unable to open config file: " + path_.string());
  }

  std::string content{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
  if (input.bad()) {
    throw DocumentError(ErrorKind::kPersistLoadFailed, "unable to read config file: " + path_.string());
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error&) {
    std::throw_with_nested(DocumentError(ErrorKind::kPersistLoadFailed, "failed to parse config file: " + path_.string()));
  }

  return config_from_json(document, path_.string());
}

void JsonFileConfigStore::save(const Config& config) {
  const auto parent = path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw DocumentError(ErrorKind::kPersistFailed,
                          "failed to create config directory " + parent.string() + ": " + ec.message());
    }
  }

  std::ofstream output(path_, std::ios::binary | std::ios::trunc);
  if (!output.is_open()) {
    throw DocumentError(ErrorKind::kPersistFailed, "unable to open config file for writing: " + path_.string());
  }

  output << config_to_json(config).dump(2) << '\n';
  output.flush();
  if (!output) {
    throw DocumentError(ErrorKind::kPersistFailed, "failed to write config file: " + path_.string());
  }
}

std::filesystem::path default_config_path() {
  if (const auto explicit_path = getenv_or("DOCU_MCP_CONFIG", ""); !explicit_path.empty()) {
    return explicit_path;
  }

  std::filesystem::path base;
  if (const auto xdg = getenv_or("XDG_CONFIG_HOME", ""); !xdg.empty()) {
    base = xdg;
  } else if (const auto home = getenv_or("HOME", ""); !home.empty()) {
    base = std::filesystem::path(home) / ".config";
  } else {
    throw std::runtime_error("unable to determine config directory: set DOCU_MCP_CONFIG or HOME");
  }

  return base / kConfigDirName / kConfigFileName;
}

bool parse_bool(const std::string& value) {
  constexpr const char* kBlank = " \t\r\n";
  const auto first = value.find_first_not_of(kBlank);
  if (first == std::string::npos) {
    return false;
  }

  std::string word = value.substr(first, value.find_last_not_of(kBlank) - first + 1);
  std::transform(word.begin(), word.end(), word.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  static constexpr const char* kTruthy[] = {"1", "true", "yes", "on"};
  return std::any_of(std::begin(kTruthy), std::end(kTruthy), [&word](const char* truthy) { return word == truthy; });
}

bool env_flag(const char* name, const bool fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return parse_bool(value);
  }
  return fallback;
}

}  // namespace docu_mcp::core
