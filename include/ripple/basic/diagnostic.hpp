// ripple/basic/diagnostic.hpp - Diagnostic types for loading, analysis and validation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ripple/basic/source_manager.hpp"

namespace ripple
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

enum class LabelStyle {
  Primary,    // direct cause
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "E0101"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

/**
 * Diagnostic codes, one per failure class.
 */
namespace diag_code
{
inline constexpr const char * k_input_unreadable = "E0101";
inline constexpr const char * k_input_malformed = "E0102";
inline constexpr const char * k_collaborator = "E0201";
inline constexpr const char * k_contract_compliance = "E0301";
inline constexpr const char * k_impact_tolerance = "W0401";
inline constexpr const char * k_unknown_change_type = "W0402";
}  // namespace diag_code

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fills in a diagnostic and hands it to its bag when the builder goes out
 * of scope.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  /// Point at related context, rendered with '-' under the snippet
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Ordered collection of diagnostics produced by one load or analysis call.
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;

  /// Whether any diagnostic carries the given code
  [[nodiscard]] bool has_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace ripple
