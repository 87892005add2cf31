#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "wasmir/ir/builder.hpp"

namespace wasmir::config {

struct IrConfig {
  // [ir] section
  bool verify_after_build = true;
  bool dump_after_build = false;

  // [log] section; one of spdlog's level names
  std::string log_level = "warn";

  // Directory where wasmir.toml was found
  std::filesystem::path root_dir;
};

// Search for wasmir.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse wasmir.toml. Every section and key is optional.
// Throws DiagnosticException on parse errors or ill-typed values
auto LoadConfig(const std::filesystem::path& config_path) -> IrConfig;

// Set spdlog's default logger level from config.log_level
void ApplyLogLevel(const IrConfig& config);

auto MakeBuilderOptions(const IrConfig& config) -> ir::BuilderOptions;

}  // namespace wasmir::config
