// ripple/contracts/contract_validator.cpp - File-backed contract validation
#include "ripple/contracts/contract_validator.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <fstream>
#include <sstream>
#include <system_error>
#include <variant>

#include "ripple/basic/errors.hpp"

namespace ripple
{

namespace
{

constexpr const char * k_collaborator_name = "contract validator";

}  // namespace

std::filesystem::path FileContractValidator::resolve(const std::string & contract_name) const
{
  namespace fs = std::filesystem;

  if (contract_name.empty()) {
    return {};
  }

  static constexpr std::array<const char *, 2> k_extensions = {".yaml", ".yml"};
  for (const char * ext : k_extensions) {
    fs::path candidate = directory_ / (contract_name + ext);
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}

ContractVerdict FileContractValidator::validate(
  const std::string & contract_name, std::string_view contract_type)
{
  const std::filesystem::path path = resolve(contract_name);
  if (path.empty()) {
    throw CollaboratorError(
      k_collaborator_name,
      "unknown contract '" + contract_name + "' (no " + contract_name + ".yaml in " +
        directory_.string() + ")");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw CollaboratorError(k_collaborator_name, "cannot open contract file " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  return validate_text(buffer.str(), contract_type, path.string());
}

ContractVerdict FileContractValidator::validate_text(
  const std::string & content, std::string_view contract_type, const std::string & origin)
{
  ContractVerdict verdict;

  const auto kind = parse_contract_kind(contract_type);
  if (!kind) {
    verdict.fail("Unknown contract type: " + std::string(contract_type));
    return verdict;
  }

  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (const YAML::Exception & e) {
    throw CollaboratorError(k_collaborator_name, origin + ": invalid YAML: " + e.what());
  }

  ContractParseResult parsed = parse_contract(root, *kind);
  for (auto & error : parsed.errors) {
    verdict.fail(std::move(error));
  }
  if (!parsed.document) {
    return verdict;
  }

  for (auto & error : check_contract_rules(*parsed.document)) {
    verdict.fail(std::move(error));
  }

  if (const auto * iface = std::get_if<InterfaceContract>(&*parsed.document)) {
    if (iface->inputs.empty() && iface->outputs.empty()) {
      verdict.warnings.emplace_back("Interface declares no inputs or outputs");
    }
  }

  return verdict;
}

}  // namespace ripple
