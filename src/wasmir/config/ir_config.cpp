#include "wasmir/config/ir_config.hpp"

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "wasmir/common/diagnostic.hpp"
#include "wasmir/ir/builder.hpp"

namespace wasmir::config {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void ThrowConfigError(std::string message) {
  throw DiagnosticException(
      Diagnostic::Error(DiagnosticKind::kInvalidConfig, 0, std::move(message)));
}

// Reads an optional boolean key; present but not a boolean is an error.
void ReadBool(
    const toml::node_view<toml::node>& section, const char* key,
    const fs::path& config_path, bool* out) {
  auto node = section[key];
  if (!node) {
    return;
  }
  auto value = node.value<bool>();
  if (!value) {
    ThrowConfigError(
        std::format(
            "{}: '{}' must be a boolean", config_path.string(), key));
  }
  *out = *value;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "wasmir.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> IrConfig {
  IrConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    ThrowConfigError(
        std::format("failed to parse {}: {}", config_path.string(), e.what()));
  }

  // [ir] section
  if (auto ir_section = tbl["ir"]) {
    ReadBool(
        ir_section, "verify_after_build", config_path,
        &config.verify_after_build);
    ReadBool(
        ir_section, "dump_after_build", config_path, &config.dump_after_build);
  }

  // [log] section
  if (auto log_section = tbl["log"]) {
    if (auto level_node = log_section["level"]) {
      auto level = level_node.value<std::string>();
      if (!level) {
        ThrowConfigError(
            std::format(
                "{}: 'log.level' must be a string", config_path.string()));
      }
      // from_str maps unknown names to off; only accept names it knows.
      if (spdlog::level::from_str(*level) == spdlog::level::off &&
          *level != "off") {
        ThrowConfigError(
            std::format(
                "{}: unknown log level '{}'", config_path.string(), *level));
      }
      config.log_level = *level;
    }
  }

  return config;
}

void ApplyLogLevel(const IrConfig& config) {
  spdlog::set_level(spdlog::level::from_str(config.log_level));
}

auto MakeBuilderOptions(const IrConfig& config) -> ir::BuilderOptions {
  return ir::BuilderOptions{
      .verify = config.verify_after_build,
      .dump = config.dump_after_build,
      .name = {}};
}

}  // namespace wasmir::config
