#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace docu_mcp::core {

struct Config {
  // Canonical absolute paths, in the order they were first added.
  std::vector<std::string> directories{};
  std::optional<std::string> active_directory{};
};

class ConfigStore {
 public:
  virtual Config load() const = 0;
  virtual void save(const Config& config) = 0;
  virtual ~ConfigStore() = default;
};

class JsonFileConfigStore final : public ConfigStore {
 public:
  explicit JsonFileConfigStore(std::filesystem::path path);

  Config load() const override;
  void save(const Config& config) override;

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

// DOCU_MCP_CONFIG, then $XDG_CONFIG_HOME/docu-mcp and
// $HOME/.config/docu-mcp. Throws std::runtime_error when no location can be derived.
std::filesystem::path default_config_path();

bool parse_bool(const std::string& value);
bool env_flag(const char* name, bool fallback);

}  // namespace docu_mcp::core
