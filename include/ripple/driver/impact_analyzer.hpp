// ripple/driver/impact_analyzer.hpp - Change impact analysis driver
//
// Single entry point for the analysis pipeline. Used by the CLI and by
// library callers that supply their own collaborators.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "ripple/basic/diagnostic.hpp"
#include "ripple/basic/source_manager.hpp"
#include "ripple/contracts/contract_validator.hpp"
#include "ripple/graph/dependency_graph.hpp"
#include "ripple/impact/change_spec.hpp"
#include "ripple/impact/impact_propagator.hpp"
#include "ripple/impact/impact_result.hpp"
#include "ripple/impact/risk_classifier.hpp"
#include "ripple/structure/code_structure_provider.hpp"

namespace ripple
{

// ============================================================================
// Analyzer Options
// ============================================================================

struct AnalyzerOptions
{
  PropagationOptions propagation;

  RiskThresholds thresholds;

  /// Absolute difference above which an expected impact is reported
  double expected_impact_tolerance = 0.2;

  /// Contract type every affected contract is validated as
  std::string contract_type = "interface";

  /// Add Info diagnostics about the graph and the diffusion run
  bool verbose = false;
};

// ============================================================================
// Outcomes
// ============================================================================

struct AnalysisOutcome
{
  /// Whether the call succeeded (no error diagnostics)
  bool success = false;

  /// Collected diagnostics (errors, warnings, verbose info)
  DiagnosticBag diagnostics;

  /// Documents read by this call, for printing diagnostics with context
  SourceRegistry sources;

  /// Loaded change specification (absent if loading failed)
  std::optional<ChangeSpecification> spec;

  /// Computed result; kept when contract validation fails
  std::optional<ImpactAnalysisResult> result;
};

struct ScoresOutcome
{
  bool success = false;
  DiagnosticBag diagnostics;
  SourceRegistry sources;
  ImpactScores scores;
};

// ============================================================================
// ChangeImpactAnalyzer
// ============================================================================

/**
 * Runs graph construction, impact diffusion, risk classification and
 * mitigation advice for a change, and optionally validates it.
 *
 * Each call reads a fresh component snapshot, builds its own graph and
 * returns the documents it read in its outcome, so one analyzer may be
 * shared between threads as long as its collaborators allow it.
 * Collaborator failures are reported as E0201 errors.
 */
class ChangeImpactAnalyzer
{
public:
  ChangeImpactAnalyzer(
    CodeStructureProvider & structure, ContractValidator & contracts, AnalyzerOptions options = {});

  /**
   * Load a change specification file and analyze it.
   */
  [[nodiscard]] AnalysisOutcome analyze_change_impact(
    const std::filesystem::path & spec_path) const;

  [[nodiscard]] AnalysisOutcome analyze_change_impact(const ChangeSpecification & spec) const;

  /**
   * Analyze, then validate every affected contract and compare expected
   * impacts against the computed scores.
   *
   * A contract that fails validation yields one E0301 error and the result
   * is kept. An expected impact further than the tolerance from the
   * computed score yields a W0401 warning and does not fail the call.
   */
  [[nodiscard]] AnalysisOutcome validate_change(const std::filesystem::path & spec_path) const;

  [[nodiscard]] AnalysisOutcome validate_change(const ChangeSpecification & spec) const;

  /**
   * Graph construction and diffusion only.
   */
  [[nodiscard]] ScoresOutcome calculate_impact_scores(
    const std::filesystem::path & spec_path) const;

  [[nodiscard]] ScoresOutcome calculate_impact_scores(const ChangeSpecification & spec) const;

  [[nodiscard]] const AnalyzerOptions & options() const noexcept { return options_; }

private:
  /// Read the component snapshot and build the graph; nullopt on collaborator failure
  std::optional<DependencyGraph> build_graph(DiagnosticBag & diags) const;

  std::optional<ImpactScores> compute_scores(
    const ChangeSpecification & spec, DiagnosticBag & diags) const;

  void run_analysis(const ChangeSpecification & spec, AnalysisOutcome & outcome) const;

  void check_contracts(const ChangeSpecification & spec, AnalysisOutcome & outcome) const;

  void check_expected_impact(const ChangeSpecification & spec, AnalysisOutcome & outcome) const;

  CodeStructureProvider & structure_;
  ContractValidator & contracts_;
  AnalyzerOptions options_;
};

}  // namespace ripple
