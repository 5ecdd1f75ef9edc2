// ripple/basic/errors.hpp - Exceptions thrown across the collaborator boundary
//
// The analysis pipeline itself reports through DiagnosticBag. Collaborators
// (code structure providers, contract validators) signal failure by throwing
// CollaboratorError, which the analyzer turns into an E0201 diagnostic.
//
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ripple
{

class CollaboratorError : public std::runtime_error
{
public:
  CollaboratorError(std::string collaborator, const std::string & message)
  : std::runtime_error(message), collaborator_(std::move(collaborator))
  {
  }

  /// Name of the failing collaborator, e.g. "component manifest"
  [[nodiscard]] const std::string & collaborator() const noexcept { return collaborator_; }

private:
  std::string collaborator_;
};

}  // namespace ripple
