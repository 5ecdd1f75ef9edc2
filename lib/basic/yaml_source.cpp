// ripple/basic/yaml_source.cpp - yaml-cpp documents tied to the SourceRegistry
#include "ripple/basic/yaml_source.hpp"

#include <fstream>
#include <sstream>

namespace ripple
{

namespace
{

SourceRange mark_range(FileId file, const YAML::Mark & mark, size_t length)
{
  if (!file.is_valid() || mark.is_null() || mark.pos < 0) {
    return {};
  }
  const auto start = static_cast<uint32_t>(mark.pos);
  const auto len = static_cast<uint32_t>(length == 0 ? 1 : length);
  return {file, start, start + len};
}

}  // namespace

std::optional<YamlDocument> load_yaml_file(
  const std::filesystem::path & path, SourceRegistry & sources, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    diags.report_error(SourceRange{}, "file not found: " + path.string())
      .with_code(diag_code::k_input_unreadable);
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    diags.report_error(SourceRange{}, "failed to open file: " + path.string())
      .with_code(diag_code::k_input_unreadable);
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    diags.report_error(SourceRange{}, "failed to read file: " + path.string())
      .with_code(diag_code::k_input_unreadable);
    return std::nullopt;
  }

  return parse_yaml(fs::absolute(path), buffer.str(), sources, diags);
}

std::optional<YamlDocument> parse_yaml(
  const std::filesystem::path & path, std::string content, SourceRegistry & sources,
  DiagnosticBag & diags)
{
  YamlDocument doc;
  doc.file_id = sources.add(path, std::move(content));

  const SourceDocument * file = sources.document(doc.file_id);
  if (file == nullptr) {
    diags.report_error(SourceRange{}, "too many source files registered: " + path.string())
      .with_code(diag_code::k_input_unreadable);
    return std::nullopt;
  }

  try {
    doc.root = YAML::Load(std::string(file->text()));
  } catch (const YAML::ParserException & e) {
    diags.report_error(mark_range(doc.file_id, e.mark, 1), "invalid YAML: " + e.msg)
      .with_code(diag_code::k_input_malformed);
    return std::nullopt;
  } catch (const YAML::Exception & e) {
    diags.report_error(SourceRange{}, "invalid YAML in " + path.string() + ": " + e.what())
      .with_code(diag_code::k_input_malformed);
    return std::nullopt;
  }

  return doc;
}

SourceRange yaml_range(FileId file, const YAML::Node & node)
{
  if (!node.IsDefined()) {
    return {};
  }
  const size_t length = node.IsScalar() ? node.Scalar().size() : 1;
  return mark_range(file, node.Mark(), length);
}

std::string yaml_location(const std::filesystem::path & path, const YAML::Node & node)
{
  if (!node.IsDefined() || node.Mark().is_null()) {
    return path.string();
  }
  const YAML::Mark mark = node.Mark();
  return path.string() + ":" + std::to_string(mark.line + 1) + ":" + std::to_string(mark.column + 1);
}

std::optional<double> yaml_number(const YAML::Node & node)
{
  if (!node.IsDefined() || !node.IsScalar()) {
    return std::nullopt;
  }
  double value = 0.0;
  if (!YAML::convert<double>::decode(node, value)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace ripple
