// ripple/impact/change_spec.cpp - Change type mapping
#include "ripple/impact/change_spec.hpp"

#include <cctype>

namespace ripple
{

namespace
{

std::string to_lower(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace

ChangeType parse_change_type(std::string_view text)
{
  const std::string lowered = to_lower(text);
  if (lowered == "contract") {
    return ChangeType::Contract;
  }
  if (lowered == "implementation") {
    return ChangeType::Implementation;
  }
  if (lowered == "resource") {
    return ChangeType::Resource;
  }
  return ChangeType::Other;
}

bool is_known_change_type(std::string_view text)
{
  return parse_change_type(text) != ChangeType::Other || to_lower(text) == "other";
}

std::string_view to_string(ChangeType type) noexcept
{
  switch (type) {
    case ChangeType::Contract:
      return "contract";
    case ChangeType::Implementation:
      return "implementation";
    case ChangeType::Resource:
      return "resource";
    case ChangeType::Other:
      return "other";
  }
  return "other";
}

}  // namespace ripple
