#pragma once

#include <cstdint>
#include <cstdio>
#include <exception>
#include <expected>
#include <string>
#include <string_view>

namespace wasmir {

// Conditions detected while translating an instruction stream. These are
// input problems (reported by the decoder/validation side of the boundary),
// so they travel as values and abort the current function build.
enum class DiagnosticKind {
  kUnknownLocal,
  kUnknownGlobal,
  kUnknownFunction,
  kUnknownTable,
  kUnknownMemory,
  kUnknownType,
  kUnknownBranchDepth,
  kStackUnderflow,
  kUnbalancedControl,
  kImmutableGlobal,
  kUnsupported,
  // Raised while loading wasmir.toml, not by the builder.
  kInvalidConfig,
};

auto ToString(DiagnosticKind kind) -> std::string_view;

struct Diagnostic {
  DiagnosticKind kind;
  // Position of the offending instruction within the function body.
  uint32_t instruction_index = 0;
  std::string message;

  static auto Error(
      DiagnosticKind kind, uint32_t instruction_index, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .kind = kind,
        .instruction_index = instruction_index,
        .message = std::move(msg)};
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// "error[kind] @instr N: message"
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

void PrintDiagnostic(
    const Diagnostic& diag, bool colors = true, FILE* sink = stderr);

}  // namespace wasmir
