// ripple/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "ripple/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace ripple
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const FileId file_id = primary_range.file_id();

  print_severity_header(diag);

  if (file_id.is_valid()) {
    // Relative path for cleaner output
    const auto & abs_path = sources.path(file_id);
    std::error_code ec;
    auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
    const std::string filename = (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();

    const FullSourceRange primary_fr = sources.span(primary_range);
    if (primary_fr.is_valid()) {
      fmt::print(
        os_, "{} {}\n", gutter_arrow(),
        fmt::format("{}:{}:{}", filename, primary_fr.start_line, primary_fr.start_column));
    } else {
      fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
    }
    fmt::print(os_, "{}\n", gutter_pipe());
  }

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  for (const auto & d : diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
      case Severity::Info:
        os_ << rang::fg::cyan << "info";
        break;
    }
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  const char * severity_str = "error";
  switch (diag.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
    case Severity::Info:
      severity_str = "info";
      break;
  }
  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const SourceDocument * source = sources.document(label.range.file_id());
  if (source == nullptr) {
    return;
  }

  const FullSourceRange fr = sources.span(label.range);
  if (!fr.is_valid()) {
    return;
  }

  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceDocument & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.line(line_index);
  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  // tabs -> spaces
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t char_idx = 0; visual_col < start_col && char_idx < line.size(); ++char_idx) {
    if (line[char_idx] == '\t') {
      marker_prefix += "    ";
    } else {
      marker_prefix += ' ';
    }
    visual_col++;
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace ripple
