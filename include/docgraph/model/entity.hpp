// docgraph/model/entity.hpp - Files, classes, methods and fields of a Java project
//
// Ownership is strictly hierarchical: a File owns its top-level Classes, and a
// Class owns its Methods, Fields and nested Classes. Everything else (the
// symbol registry, dependency edges, annotation tasks) holds non-owning
// pointers that stay valid for the lifetime of the owning File.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "docgraph/basic/source_manager.hpp"

namespace docgraph
{

struct Method;

// ============================================================================
// Enumerations
// ============================================================================

enum class ClassKind : uint8_t {
  Class,
  Interface,
  Enum,
  Record,
};

enum class AnnotationStatus : uint8_t {
  Pending,  // not annotated in this run (or served from cache)
  Ok,
  Error,
};

/// Scope tier a call site was resolved in.
enum class ResolutionTier : uint8_t {
  Local,
  Import,
  Global,
};

[[nodiscard]] std::string_view to_string(ClassKind kind) noexcept;
[[nodiscard]] std::string_view to_string(AnnotationStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ResolutionTier tier) noexcept;

/// Source keyword for a kind ("class", "interface", "enum", "record").
[[nodiscard]] std::string_view keyword(ClassKind kind) noexcept;

// ============================================================================
// Call sites and dependency edges
// ============================================================================

/// Value used when a call site has no parenthesized argument list.
inline constexpr int k_unknown_argument_count = -1;

/**
 * Count the arguments of the first parenthesized list in a call-site text.
 *
 * Commas nested in parentheses, brackets, braces or generic angle brackets,
 * and commas inside string/char literals, are not separators.
 *
 *   "foo()"            -> 0
 *   "foo(a, g(b, c))"  -> 2
 *   "foo"              -> k_unknown_argument_count
 */
[[nodiscard]] int count_call_arguments(std::string_view text) noexcept;

struct CallSite
{
  std::string name;  // invoked identifier; "<init>" for this(...)
  std::string text;  // name followed by the argument list as written
  int argument_count = k_unknown_argument_count;
  uint32_t line = 0;
};

struct DependencyRef
{
  const Method * target = nullptr;
  ResolutionTier tier = ResolutionTier::Local;
  bool ambiguous = false;
};

// ============================================================================
// Entities
// ============================================================================

struct Field
{
  std::string id;
  std::string identifier;
  std::string signature;
  std::string type;
  uint32_t line = 0;
  SourceRange range;
};

struct Method
{
  std::string umid;
  std::string scoped_identifier;
  std::string class_ucid;
  std::string identifier;
  std::string return_type;

  std::vector<std::string> modifiers;
  std::vector<std::string> type_parameters;
  std::vector<std::string> parameters;       // verbatim, e.g. "final int x"
  std::vector<std::string> parameter_types;  // e.g. "int", "String..."
  std::vector<std::string> throws;
  bool is_variadic = false;

  std::string signature;
  std::string body;
  std::string body_hash;
  uint32_t line = 0;
  SourceRange range;

  std::vector<CallSite> calls;
  std::vector<DependencyRef> dependencies;
  std::vector<std::string> unresolved_dependencies;

  std::string description;
  int confidence = 0;

  [[nodiscard]] size_t arity() const noexcept { return parameters.size(); }
  [[nodiscard]] bool is_constructor() const noexcept
  {
    return identifier == "<init>";
  }

  /// Arity check used to narrow overloads. A variadic method accepts
  /// `arity - 1` or more arguments.
  [[nodiscard]] bool accepts_argument_count(int count) const noexcept;
};

struct Class
{
  std::string ucid;
  std::string identifier;
  ClassKind kind = ClassKind::Class;

  std::string signature;
  std::string body;
  std::string body_hash;
  uint32_t line = 0;
  SourceRange range;

  std::vector<std::string> modifiers;
  std::string superclass;
  std::vector<std::string> interfaces;
  std::vector<std::string> type_parameters;
  std::vector<std::string> record_components;
  std::vector<std::string> constants;  // enum constants, "NAME" or "NAME(args)"

  std::vector<std::unique_ptr<Method>> methods;
  std::vector<std::unique_ptr<Field>> fields;
  std::vector<std::unique_ptr<Class>> classes;

  // Annotation state
  std::string description;
  int confidence = 0;
  AnnotationStatus annotation_status = AnnotationStatus::Pending;
  std::string annotation_error;

  [[nodiscard]] const Field * find_field(std::string_view id) const noexcept;
  [[nodiscard]] const Class * find_class(std::string_view ucid) const noexcept;
};

struct Import
{
  std::string name;  // without "static" and without ".*"
  bool is_static = false;
  bool is_wildcard = false;
};

/// Import as written, e.g. "java.util.List", "static a.B.helper", "a.b.*".
[[nodiscard]] std::string import_text(const Import & imp);

struct File
{
  std::string ufid;
  FileId file_id = FileId::invalid();
  std::string package;
  std::vector<Import> imports;
  std::vector<std::unique_ptr<Class>> classes;

  [[nodiscard]] const Class * find_class(std::string_view ucid) const noexcept;
};

// ============================================================================
// Traversal
// ============================================================================

/// Depth-first pre-order visit of a class and all nested classes.
template <typename ClassT, typename Fn>
void for_each_class(ClassT & cls, Fn && fn)
{
  fn(cls);
  for (auto & nested : cls.classes) {
    for_each_class(*nested, fn);
  }
}

template <typename FileT, typename Fn>
void for_each_class_in_file(FileT & file, Fn && fn)
{
  for (auto & cls : file.classes) {
    for_each_class(*cls, fn);
  }
}

}  // namespace docgraph
