#include "wasmir/common/diagnostic.hpp"

#include <cstdio>
#include <format>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

namespace wasmir {

auto ToString(DiagnosticKind kind) -> std::string_view {
  switch (kind) {
    case DiagnosticKind::kUnknownLocal:
      return "unknown_local";
    case DiagnosticKind::kUnknownGlobal:
      return "unknown_global";
    case DiagnosticKind::kUnknownFunction:
      return "unknown_function";
    case DiagnosticKind::kUnknownTable:
      return "unknown_table";
    case DiagnosticKind::kUnknownMemory:
      return "unknown_memory";
    case DiagnosticKind::kUnknownType:
      return "unknown_type";
    case DiagnosticKind::kUnknownBranchDepth:
      return "unknown_branch_depth";
    case DiagnosticKind::kStackUnderflow:
      return "stack_underflow";
    case DiagnosticKind::kUnbalancedControl:
      return "unbalanced_control";
    case DiagnosticKind::kImmutableGlobal:
      return "immutable_global";
    case DiagnosticKind::kUnsupported:
      return "unsupported";
    case DiagnosticKind::kInvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  return std::format(
      "error[{}] @instr {}: {}", ToString(diag.kind), diag.instruction_index,
      diag.message);
}

void PrintDiagnostic(const Diagnostic& diag, bool colors, FILE* sink) {
  if (colors) {
    fmt::print(
        sink, "{} @instr {}: {}\n",
        fmt::styled(
            std::format("error[{}]", ToString(diag.kind)),
            fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
        diag.instruction_index, diag.message);
  } else {
    fmt::print(sink, "{}\n", FormatDiagnostic(diag));
  }
  std::fflush(sink);
}

}  // namespace wasmir
