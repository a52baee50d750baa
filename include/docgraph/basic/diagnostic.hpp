// docgraph/basic/diagnostic.hpp - Diagnostic types for indexing and annotation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "docgraph/basic/source_manager.hpp"

namespace docgraph
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,    // direct location of the problem
  Secondary,  // related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/**
 * Well-known diagnostic codes.
 *
 * W0xx: structural gaps recovered by the builder
 * E0xx: input errors (unreadable files, bad configuration, cache I/O)
 * E1xx: annotation failures
 */
namespace diag_codes
{
inline constexpr const char * k_missing_name = "W001";
inline constexpr const char * k_syntax_error = "W002";
inline constexpr const char * k_duplicate_class = "W003";
inline constexpr const char * k_duplicate_method = "W004";
inline constexpr const char * k_duplicate_field = "W005";
inline constexpr const char * k_unreadable_file = "E001";
inline constexpr const char * k_config_error = "E002";
inline constexpr const char * k_cache_error = "E003";
inline constexpr const char * k_output_error = "E004";
inline constexpr const char * k_annotation_failed = "E101";
}  // namespace diag_codes

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "W001"
  std::string message;  // main message

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and commits it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  /// Starts a diagnostic whose primary label covers `range`.
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Error, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Warning, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Info, range, std::move(message), std::move(label_message));
  }

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  /// Appends every diagnostic of `other`, leaving it empty.
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) > 0; }

  [[nodiscard]] std::vector<Diagnostic> of_severity(Severity severity) const;
  [[nodiscard]] std::vector<Diagnostic> with_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

/// "2 errors, 1 warning"; empty when there are neither.
[[nodiscard]] std::string summarize(const DiagnosticBag & diags);

}  // namespace docgraph
