// ripple/driver/impact_analyzer.cpp - Change impact analysis driver implementation
//
#include "ripple/driver/impact_analyzer.hpp"

#include <fmt/core.h>

#include <cmath>
#include <exception>
#include <future>
#include <utility>
#include <vector>

#include "ripple/basic/errors.hpp"
#include "ripple/graph/cycle_finder.hpp"
#include "ripple/graph/graph_builder.hpp"
#include "ripple/impact/mitigation_advisor.hpp"
#include "ripple/project/change_spec_loader.hpp"

namespace ripple
{

namespace
{

void report_collaborator_failure(
  DiagnosticBag & diags, const std::string & what, const std::string & detail)
{
  diags.report_error(SourceRange{}, what + ": " + detail).with_code(diag_code::k_collaborator);
}

std::string join(const std::vector<std::string> & items, const char * separator)
{
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += items[i];
  }
  return out;
}

}  // namespace

ChangeImpactAnalyzer::ChangeImpactAnalyzer(
  CodeStructureProvider & structure, ContractValidator & contracts, AnalyzerOptions options)
: structure_(structure), contracts_(contracts), options_(std::move(options))
{
}

// ============================================================================
// Entry points
// ============================================================================

AnalysisOutcome ChangeImpactAnalyzer::analyze_change_impact(
  const std::filesystem::path & spec_path) const
{
  AnalysisOutcome outcome;
  outcome.spec = load_change_specification(spec_path, outcome.sources, outcome.diagnostics);
  if (!outcome.spec) {
    return outcome;
  }

  run_analysis(*outcome.spec, outcome);
  outcome.success = !outcome.diagnostics.has_errors();
  return outcome;
}

AnalysisOutcome ChangeImpactAnalyzer::analyze_change_impact(const ChangeSpecification & spec) const
{
  AnalysisOutcome outcome;
  outcome.spec = spec;

  run_analysis(spec, outcome);
  outcome.success = !outcome.diagnostics.has_errors();
  return outcome;
}

AnalysisOutcome ChangeImpactAnalyzer::validate_change(const std::filesystem::path & spec_path) const
{
  AnalysisOutcome outcome = analyze_change_impact(spec_path);
  if (!outcome.result) {
    return outcome;
  }

  check_contracts(*outcome.spec, outcome);
  if (outcome.diagnostics.has_code(diag_code::k_collaborator)) {
    outcome.success = false;
    return outcome;
  }

  check_expected_impact(*outcome.spec, outcome);
  outcome.success = !outcome.diagnostics.has_errors();
  return outcome;
}

AnalysisOutcome ChangeImpactAnalyzer::validate_change(const ChangeSpecification & spec) const
{
  AnalysisOutcome outcome = analyze_change_impact(spec);
  if (!outcome.result) {
    return outcome;
  }

  check_contracts(spec, outcome);
  if (outcome.diagnostics.has_code(diag_code::k_collaborator)) {
    outcome.success = false;
    return outcome;
  }

  check_expected_impact(spec, outcome);
  outcome.success = !outcome.diagnostics.has_errors();
  return outcome;
}

ScoresOutcome ChangeImpactAnalyzer::calculate_impact_scores(
  const std::filesystem::path & spec_path) const
{
  ScoresOutcome outcome;
  const auto spec = load_change_specification(spec_path, outcome.sources, outcome.diagnostics);
  if (!spec) {
    return outcome;
  }

  if (auto scores = compute_scores(*spec, outcome.diagnostics)) {
    outcome.scores = std::move(*scores);
  }
  outcome.success = !outcome.diagnostics.has_errors();
  return outcome;
}

ScoresOutcome ChangeImpactAnalyzer::calculate_impact_scores(const ChangeSpecification & spec) const
{
  ScoresOutcome outcome;
  if (auto scores = compute_scores(spec, outcome.diagnostics)) {
    outcome.scores = std::move(*scores);
  }
  outcome.success = !outcome.diagnostics.has_errors();
  return outcome;
}

// ============================================================================
// Pipeline
// ============================================================================

std::optional<DependencyGraph> ChangeImpactAnalyzer::build_graph(DiagnosticBag & diags) const
{
  std::vector<ComponentInfo> components;
  try {
    components = structure_.list_components();
  } catch (const CollaboratorError & e) {
    report_collaborator_failure(diags, e.collaborator() + " failed", e.what());
    return std::nullopt;
  } catch (const std::exception & e) {
    report_collaborator_failure(diags, "code structure provider failed", e.what());
    return std::nullopt;
  }

  DependencyGraph graph = GraphBuilder::build(components);

  if (options_.verbose) {
    diags.report_info(
      SourceRange{}, fmt::format(
                       "dependency graph: {} components, {} edges", graph.component_count(),
                       graph.edge_count()));

    for (const auto & cycle : CycleFinder::find_cycles(graph)) {
      diags.report_info(SourceRange{}, "circular dependency: " + cycle.describe(graph));
    }
  }

  return graph;
}

std::optional<ImpactScores> ChangeImpactAnalyzer::compute_scores(
  const ChangeSpecification & spec, DiagnosticBag & diags) const
{
  auto graph = build_graph(diags);
  if (!graph) {
    return std::nullopt;
  }

  const ImpactPropagator propagator(options_.propagation);
  const RankResult ranks = propagator.compute_ranks(*graph);

  if (options_.verbose && !graph->empty()) {
    diags.report_info(
      SourceRange{}, fmt::format(
                       "impact diffusion {} after {} iterations",
                       ranks.converged ? "converged" : "stopped without converging",
                       ranks.iterations));
  }

  return propagator.adjust(*graph, ranks, spec);
}

void ChangeImpactAnalyzer::run_analysis(
  const ChangeSpecification & spec, AnalysisOutcome & outcome) const
{
  auto scores = compute_scores(spec, outcome.diagnostics);
  if (!scores) {
    return;
  }

  const RiskClassifier classifier(options_.thresholds);

  ImpactAnalysisResult result;
  result.impact_scores = std::move(*scores);
  result.risk_areas = classifier.classify(result.impact_scores, spec);
  result.suggested_mitigations = MitigationAdvisor::advise(result.risk_areas);
  result.affected_components = classifier.group_by_tier(result.impact_scores, spec);

  outcome.result = std::move(result);
}

// ============================================================================
// Validation
// ============================================================================

void ChangeImpactAnalyzer::check_contracts(
  const ChangeSpecification & spec, AnalysisOutcome & outcome) const
{
  // Independent contracts are validated concurrently; results are reported
  // in affectedContracts order.
  std::vector<std::future<ContractVerdict>> pending;
  pending.reserve(spec.affected_contracts.size());
  for (const auto & name : spec.affected_contracts) {
    pending.push_back(std::async(std::launch::async, [this, &name]() {
      return contracts_.validate(name, options_.contract_type);
    }));
  }

  for (size_t i = 0; i < pending.size(); ++i) {
    const std::string & name = spec.affected_contracts[i];

    ContractVerdict verdict;
    try {
      verdict = pending[i].get();
    } catch (const CollaboratorError & e) {
      report_collaborator_failure(
        outcome.diagnostics, e.collaborator() + " failed for " + name, e.what());
      continue;
    } catch (const std::exception & e) {
      report_collaborator_failure(
        outcome.diagnostics, "contract validator failed for " + name, e.what());
      continue;
    }

    if (!verdict.is_valid) {
      outcome.diagnostics
        .report_error(
          SourceRange{}, fmt::format(
                           "Contract validation failed for {}: {}", name,
                           join(verdict.errors, ", ")))
        .with_code(diag_code::k_contract_compliance);
    }

    if (options_.verbose) {
      for (const auto & warning : verdict.warnings) {
        outcome.diagnostics.report_info(SourceRange{}, "contract " + name + ": " + warning);
      }
    }
  }
}

void ChangeImpactAnalyzer::check_expected_impact(
  const ChangeSpecification & spec, AnalysisOutcome & outcome) const
{
  const ImpactScores & scores = outcome.result->impact_scores;

  for (const auto & [component, expected] : spec.expected_impact) {
    const auto it = scores.find(component);
    if (it == scores.end()) {
      continue;
    }

    const double actual = it->second;
    if (std::abs(actual - expected) > options_.expected_impact_tolerance) {
      outcome.diagnostics
        .report_warning(
          SourceRange{}, fmt::format(
                           "Impact mismatch for {}: expected {:.2f}, actual {:.2f}", component,
                           expected, actual))
        .with_code(diag_code::k_impact_tolerance);
    }
  }
}

}  // namespace ripple
