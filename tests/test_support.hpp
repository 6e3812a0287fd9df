#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <stdlib.h>

#include "docu_mcp/core/config.hpp"
#include "docu_mcp/core/errors.hpp"
#include "docu_mcp/extractors/extractor.hpp"

namespace docu_mcp::testing {

inline int fail(const char* name, const std::string& msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

class TempDir {
 public:
  TempDir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "docu-mcp-test-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = std::filesystem::canonical(pattern);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }

  std::filesystem::path write_file(const std::string& relative, const std::string& content) const {
    const auto target = path_ / relative;
    std::filesystem::create_directories(target.parent_path());
    std::ofstream output(target, std::ios::binary);
    output << content;
    return target;
  }

  std::filesystem::path make_dir(const std::string& relative) const {
    const auto target = path_ / relative;
    std::filesystem::create_directories(target);
    return target;
  }

 private:
  std::filesystem::path path_;
};

class MemoryConfigStore final : public core::ConfigStore {
 public:
  core::Config load() const override {
    ++loads;
    if (fail_load) {
      throw core::DocumentError(core::ErrorKind::kPersistLoadFailed, "failed to parse config file: memory");
    }
    return config;
  }

  void save(const core::Config& updated) override {
    ++saves;
    if (fail_save) {
      throw core::DocumentError(core::ErrorKind::kPersistFailed, "failed to write config file: memory");
    }
    config = updated;
  }

  core::Config config{};
  bool fail_load{false};
  bool fail_save{false};
  mutable int loads{0};
  int saves{0};
};

// Returns "<prefix><bytes>" and counts invocations.
class FakeExtractor final : public extractors::TextExtractor {
 public:
  explicit FakeExtractor(std::string prefix = "text:") : prefix_(std::move(prefix)) {}

  std::string extract(std::string_view bytes) const override {
    ++calls;
    if (fail) {
      throw std::runtime_error("corrupt document");
    }
    return prefix_ + std::string(bytes);
  }

  const char* name() const noexcept override { return "FakeExtractor"; }

  mutable int calls{0};
  bool fail{false};

 private:
  std::string prefix_;
};

template <typename Fn>
bool throws_kind(Fn&& fn, const core::ErrorKind kind) {
  try {
    fn();
  } catch (const core::DocumentError& ex) {
    return ex.kind() == kind;
  }
  return false;
}

}  // namespace docu_mcp::testing
