// ripple/test_support/fake_collaborators.hpp - Scripted collaborators for tests
//
// FakeStructureProvider and FakeContractValidator stand in for the
// manifest- and file-backed implementations so analyzer tests can control
// every answer, including failures.
//
#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ripple/basic/errors.hpp"
#include "ripple/contracts/contract_validator.hpp"
#include "ripple/structure/code_structure_provider.hpp"

namespace ripple::test_support
{

/**
 * Serves a fixed component list. Safe to call concurrently once configured.
 */
class FakeStructureProvider : public CodeStructureProvider
{
public:
  FakeStructureProvider() = default;
  explicit FakeStructureProvider(std::vector<ComponentInfo> components)
  : components_(std::move(components))
  {
  }

  [[nodiscard]] std::vector<ComponentInfo> list_components() override
  {
    ++calls_;
    if (failure_) {
      throw CollaboratorError("code structure provider", *failure_);
    }
    return components_;
  }

  /// Make every later call throw CollaboratorError with this message
  void fail_with(std::string message) { failure_ = std::move(message); }

  [[nodiscard]] int calls() const noexcept { return calls_.load(); }

private:
  std::vector<ComponentInfo> components_;
  std::optional<std::string> failure_;
  std::atomic<int> calls_{0};
};

/**
 * Contracts are valid unless scripted otherwise. Safe to call concurrently.
 */
class FakeContractValidator : public ContractValidator
{
public:
  [[nodiscard]] ContractVerdict validate(
    const std::string & contract_name, std::string_view contract_type) override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.emplace_back(contract_name, std::string(contract_type));

    if (unknown_.count(contract_name) != 0) {
      throw CollaboratorError("contract validator", "unknown contract '" + contract_name + "'");
    }
    const auto it = verdicts_.find(contract_name);
    if (it != verdicts_.end()) {
      return it->second;
    }
    return ContractVerdict{};
  }

  void set_invalid(const std::string & contract_name, std::vector<std::string> errors)
  {
    ContractVerdict verdict;
    for (auto & error : errors) {
      verdict.fail(std::move(error));
    }
    verdicts_[contract_name] = std::move(verdict);
  }

  void set_verdict(const std::string & contract_name, ContractVerdict verdict)
  {
    verdicts_[contract_name] = std::move(verdict);
  }

  /// validate() throws CollaboratorError for this contract
  void set_unknown(const std::string & contract_name) { unknown_[contract_name] = true; }

  /// (name, type) pairs seen so far, in call order
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> requests() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, ContractVerdict> verdicts_;
  std::map<std::string, bool> unknown_;
  std::vector<std::pair<std::string, std::string>> requests_;
};

}  // namespace ripple::test_support
