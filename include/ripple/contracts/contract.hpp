// ripple/contracts/contract.hpp - Typed contract documents
//
// Contract documents are parsed into one schema per contract kind. A
// document that does not fit the requested kind's shape is rejected while
// parsing, so rule checks only ever see typed fields.
//
#pragma once

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ripple
{

enum class ContractKind : uint8_t {
  Interface,
  Behavior,
  Resource,
};

[[nodiscard]] std::optional<ContractKind> parse_contract_kind(std::string_view text);
[[nodiscard]] std::string_view to_string(ContractKind kind) noexcept;

/// Field value as written; nullopt when the key is absent or null
using ContractField = std::optional<std::string>;

/// Entry of a list whose items need two fields (e.g. name + type)
struct ContractEntry
{
  ContractField first;
  ContractField second;
};

struct InterfaceContract
{
  ContractField name;
  ContractField version;
  std::vector<ContractEntry> inputs;   // name, type
  std::vector<ContractEntry> outputs;  // name, type
  std::vector<std::string> extension_points;
};

struct BehaviorContract
{
  ContractField name;
  ContractField version;
  std::vector<ContractEntry> operations;               // name, description
  std::vector<ContractEntry> concurrency_rules;        // type, description
  std::vector<ContractEntry> performance_constraints;  // metric, threshold
};

struct ResourceContract
{
  ContractField name;
  ContractField version;
  std::vector<ContractEntry> resource_requirements;  // type, specification
  std::vector<ContractEntry> access_patterns;        // type, description
  std::vector<ContractEntry> scaling_rules;          // trigger, action
};

using ContractDocument = std::variant<InterfaceContract, BehaviorContract, ResourceContract>;

struct ContractParseResult
{
  /// Parsed document; empty when the shape was rejected
  std::optional<ContractDocument> document;

  /// Shape errors, e.g. "Extension points must be a list"
  std::vector<std::string> errors;
};

/**
 * Parse a contract document as the given kind.
 */
[[nodiscard]] ContractParseResult parse_contract(const YAML::Node & root, ContractKind kind);

/**
 * Required-field rules for a parsed document. Empty when the document is valid.
 */
[[nodiscard]] std::vector<std::string> check_contract_rules(const ContractDocument & document);

}  // namespace ripple
