// ripple - change impact analysis command line interface
//
// Usage:
//   ripple analyze  <change.yaml> [options]
//   ripple validate <change.yaml> [options]
//   ripple scores   <change.yaml> [options]
//   ripple init [project-name]
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "ripple/basic/diagnostic_printer.hpp"
#include "ripple/contracts/contract_validator.hpp"
#include "ripple/driver/impact_analyzer.hpp"
#include "ripple/output/result_writer.hpp"
#include "ripple/project/project_config.hpp"
#include "ripple/structure/component_manifest.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "ripple - change impact analysis v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  analyze <change.yaml>    Analyze the impact of a change\n"
            << "  validate <change.yaml>   Analyze, then check contracts and expected impact\n"
            << "  scores <change.yaml>     Print raw impact scores\n"
            << "  init [project-name]      Write a starter ripple.yaml\n\n"
            << "Options:\n"
            << "  -o, --output <file>      Write the result to a file instead of stdout\n"
            << "  -f, --format <fmt>       Output format: yaml (default) or json\n"
            << "  --config <ripple.yaml>   Project configuration (default: search upward)\n"
            << "  --components <file>      Component manifest (overrides structure.manifest)\n"
            << "  --contracts <dir>        Contract directory (overrides contracts.directory)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const ripple::DiagnosticBag & diagnostics, const ripple::SourceRegistry & sources)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  ripple::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string format;
  std::string config_path;
  std::string components_path;
  std::string contracts_dir;
  std::string usage_error;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  auto take_value = [&](int & i, const std::string & flag, std::string & out) {
    if (i + 1 < argc) {
      out = argv[++i];
    } else {
      args.usage_error = "missing value for " + flag;
    }
  };

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      take_value(i, arg, args.output_path);
    } else if (arg == "-f" || arg == "--format") {
      take_value(i, arg, args.format);
    } else if (arg == "--config") {
      take_value(i, arg, args.config_path);
    } else if (arg == "--components") {
      take_value(i, arg, args.components_path);
    } else if (arg == "--contracts") {
      take_value(i, arg, args.contracts_dir);
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.usage_error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Settings
// ============================================================================

/// Configuration merged from ripple.yaml and command line flags
struct Settings
{
  ripple::ProjectConfig config;
  fs::path manifest;
  fs::path contracts_dir;
  ripple::OutputFormat format = ripple::OutputFormat::Yaml;
};

std::optional<Settings> resolve_settings(const CommandArgs & args)
{
  Settings settings;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = ripple::find_project_config(fs::current_path());
  }

  if (config_path) {
    const auto config_result = ripple::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return std::nullopt;
    }
    settings.config = config_result.config;
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  }

  const ripple::ProjectConfig & config = settings.config;

  if (!args.components_path.empty()) {
    settings.manifest = fs::absolute(args.components_path);
  } else if (config.manifest) {
    settings.manifest = *config.manifest;
  } else {
    std::cerr << "error: no component manifest: pass --components or set structure.manifest in "
              << ripple::k_project_config_file_name << "\n";
    return std::nullopt;
  }

  if (!args.contracts_dir.empty()) {
    settings.contracts_dir = fs::absolute(args.contracts_dir);
  } else if (config.contracts_dir) {
    settings.contracts_dir = *config.contracts_dir;
  } else {
    settings.contracts_dir = fs::current_path() / "contracts";
  }

  settings.format = config.format;
  if (!args.format.empty()) {
    const auto format = ripple::parse_output_format(args.format);
    if (!format) {
      std::cerr << "error: invalid format '" << args.format << "' (must be 'yaml' or 'json')\n";
      return std::nullopt;
    }
    settings.format = *format;
  }

  return settings;
}

bool emit_output(const CommandArgs & args, const std::string & text)
{
  if (args.output_path.empty()) {
    std::cout << text;
    return true;
  }

  std::ofstream out(args.output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return false;
  }
  out << text;
  if (args.verbose) {
    std::cerr << "Wrote: " << args.output_path << "\n";
  }
  return true;
}

// ============================================================================
// Commands
// ============================================================================

/// Shared body of analyze / validate
int run_analysis_command(const CommandArgs & args, bool validate)
{
  if (args.input_file.empty()) {
    std::cerr << "error: change specification required\n";
    std::cerr << "usage: ripple " << args.command << " <change.yaml> [options]\n";
    return 1;
  }

  const auto settings = resolve_settings(args);
  if (!settings) {
    return 1;
  }

  ripple::ComponentManifestProvider structure(settings->manifest);
  ripple::FileContractValidator contracts(settings->contracts_dir);

  ripple::AnalyzerOptions options;
  options.propagation = settings->config.analysis;
  options.verbose = args.verbose;

  ripple::ChangeImpactAnalyzer analyzer(structure, contracts, options);

  const fs::path input_path = fs::absolute(args.input_file);
  const ripple::AnalysisOutcome outcome =
    validate ? analyzer.validate_change(input_path) : analyzer.analyze_change_impact(input_path);

  if (!outcome.diagnostics.empty()) {
    print_diagnostics(outcome.diagnostics, outcome.sources);
  }

  // A result that failed contract validation is still written out.
  if (outcome.result) {
    if (!emit_output(args, ripple::write_result(*outcome.result, settings->format))) {
      return 1;
    }
  }

  return outcome.success ? 0 : 1;
}

int cmd_analyze(const CommandArgs & args) { return run_analysis_command(args, false); }

int cmd_validate(const CommandArgs & args) { return run_analysis_command(args, true); }

int cmd_scores(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: change specification required\n";
    std::cerr << "usage: ripple scores <change.yaml> [options]\n";
    return 1;
  }

  const auto settings = resolve_settings(args);
  if (!settings) {
    return 1;
  }

  ripple::ComponentManifestProvider structure(settings->manifest);
  ripple::FileContractValidator contracts(settings->contracts_dir);

  ripple::AnalyzerOptions options;
  options.propagation = settings->config.analysis;
  options.verbose = args.verbose;

  ripple::ChangeImpactAnalyzer analyzer(structure, contracts, options);
  const ripple::ScoresOutcome outcome =
    analyzer.calculate_impact_scores(fs::absolute(args.input_file));

  if (!outcome.diagnostics.empty()) {
    print_diagnostics(outcome.diagnostics, outcome.sources);
  }

  if (!outcome.success) {
    return 1;
  }

  return emit_output(args, ripple::write_scores(outcome.scores, settings->format)) ? 0 : 1;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path project_dir = fs::current_path();
  const fs::path config_path = project_dir / ripple::k_project_config_file_name;

  if (fs::exists(config_path)) {
    std::cerr << "error: " << ripple::k_project_config_file_name
              << " already exists: " << config_path.string() << "\n";
    return 1;
  }

  const std::string name =
    args.input_file.empty() ? project_dir.filename().string() : args.input_file;

  try {
    std::ofstream config(config_path);
    if (!config.is_open()) {
      std::cerr << "error: failed to create " << config_path.string() << "\n";
      return 1;
    }
    config << ripple::default_project_config_text(name);
    config.close();

    const fs::path manifest_path = project_dir / ripple::k_component_manifest_file_name;
    if (!fs::exists(manifest_path)) {
      std::ofstream manifest(manifest_path);
      manifest << "# Components of the analysed system and what each depends on\n"
               << "components:\n"
               << "  - name: App\n"
               << "    dependencies: [Core]\n"
               << "  - name: Core\n";
    }

    fs::create_directories(project_dir / "contracts");

    std::cout << "Initialized ripple project '" << name << "' in " << project_dir.string()
              << "\n";
    std::cout << "\nNext steps:\n"
              << "  edit " << ripple::k_component_manifest_file_name << "\n"
              << "  ripple analyze change.yaml\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "analyze") {
    return cmd_analyze(args);
  }

  if (args.command == "validate") {
    return cmd_validate(args);
  }

  if (args.command == "scores") {
    return cmd_scores(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
