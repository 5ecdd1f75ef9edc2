// ripple/contracts/contract_validator.hpp - Contract compliance checks
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ripple/contracts/contract.hpp"

namespace ripple
{

struct ContractVerdict
{
  bool is_valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void fail(std::string message)
  {
    is_valid = false;
    errors.push_back(std::move(message));
  }
};

/**
 * Checks that a named contract is well-formed.
 *
 * validate() may be called from several threads at once. An unknown
 * contract is reported by throwing CollaboratorError; a contract that
 * exists but breaks its rules yields an invalid verdict.
 */
class ContractValidator
{
public:
  virtual ~ContractValidator() = default;

  /**
   * @param contract_name Contract identifier as listed in affectedContracts
   * @param contract_type "interface", "behavior" or "resource"
   */
  [[nodiscard]] virtual ContractVerdict validate(
    const std::string & contract_name, std::string_view contract_type) = 0;
};

/**
 * Validator over a directory of contract documents.
 *
 * A contract named "PayAPI" is read from "<dir>/PayAPI.yaml" (or ".yml").
 */
class FileContractValidator : public ContractValidator
{
public:
  explicit FileContractValidator(std::filesystem::path directory)
  : directory_(std::move(directory))
  {
  }

  [[nodiscard]] ContractVerdict validate(
    const std::string & contract_name, std::string_view contract_type) override;

  /**
   * Validate document text directly.
   *
   * @throws CollaboratorError if the text is not valid YAML
   */
  [[nodiscard]] static ContractVerdict validate_text(
    const std::string & content, std::string_view contract_type, const std::string & origin);

  /// Path of the contract document, or empty if none exists
  [[nodiscard]] std::filesystem::path resolve(const std::string & contract_name) const;

  [[nodiscard]] const std::filesystem::path & directory() const noexcept { return directory_; }

private:
  std::filesystem::path directory_;
};

}  // namespace ripple
