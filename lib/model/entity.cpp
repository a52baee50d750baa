// docgraph/model/entity.cpp - Entity helpers
#include "docgraph/model/entity.hpp"

#include <cctype>

namespace docgraph
{

std::string_view to_string(ClassKind kind) noexcept
{
  switch (kind) {
    case ClassKind::Class:
      return "class";
    case ClassKind::Interface:
      return "interface";
    case ClassKind::Enum:
      return "enum";
    case ClassKind::Record:
      return "record";
  }
  return "class";
}

std::string_view keyword(ClassKind kind) noexcept { return to_string(kind); }

std::string_view to_string(AnnotationStatus status) noexcept
{
  switch (status) {
    case AnnotationStatus::Pending:
      return "pending";
    case AnnotationStatus::Ok:
      return "ok";
    case AnnotationStatus::Error:
      return "error";
  }
  return "pending";
}

std::string_view to_string(ResolutionTier tier) noexcept
{
  switch (tier) {
    case ResolutionTier::Local:
      return "local";
    case ResolutionTier::Import:
      return "import";
    case ResolutionTier::Global:
      return "global";
  }
  return "local";
}

// ============================================================================
// count_call_arguments
// ============================================================================

namespace
{

bool is_ident_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

// '<' opens a type argument list only when glued to a name and followed by
// something that can start a type (`List<String>`, `Foo.<T>bar`, `Map<?, ?>`).
bool opens_type_arguments(std::string_view text, size_t pos)
{
  if (pos == 0) return false;
  const char prev = text[pos - 1];
  if (!is_ident_char(prev) && prev != '.') return false;

  size_t next = pos + 1;
  while (next < text.size() && text[next] == ' ') ++next;
  if (next >= text.size()) return false;
  const char c = text[next];
  return std::isupper(static_cast<unsigned char>(c)) != 0 || c == '?' || c == '>';
}

}  // namespace

int count_call_arguments(std::string_view text) noexcept
{
  const size_t open = text.find('(');
  if (open == std::string_view::npos) {
    return k_unknown_argument_count;
  }

  int depth = 0;  // (), [], {}
  int angle = 0;  // generic <...>
  int commas = 0;
  bool saw_content = false;
  char quote = 0;

  for (size_t i = open + 1; i < text.size(); ++i) {
    const char c = text[i];

    if (quote != 0) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }

    if (std::isspace(static_cast<unsigned char>(c)) == 0 && c != ')') {
      saw_content = true;
    }

    switch (c) {
      case '"':
      case '\'':
        quote = c;
        break;
      case '(':
      case '[':
      case '{':
        ++depth;
        break;
      case ')':
        if (depth == 0) {
          return saw_content ? commas + 1 : 0;
        }
        --depth;
        break;
      case ']':
      case '}':
        if (depth > 0) --depth;
        break;
      case '<':
        if (opens_type_arguments(text, i)) ++angle;
        break;
      case '>':
        if (angle > 0) --angle;
        break;
      case ',':
        if (depth == 0 && angle == 0) ++commas;
        break;
      default:
        break;
    }
  }

  // Unterminated list: count what was seen.
  return saw_content ? commas + 1 : 0;
}

// ============================================================================
// Method / Class / File
// ============================================================================

bool Method::accepts_argument_count(int count) const noexcept
{
  if (count < 0) {
    return false;
  }
  const auto n = static_cast<int>(arity());
  if (is_variadic) {
    return count >= n - 1;
  }
  return count == n;
}

const Field * Class::find_field(std::string_view id) const noexcept
{
  for (const auto & f : fields) {
    if (f->id == id) return f.get();
  }
  return nullptr;
}

const Class * Class::find_class(std::string_view target_ucid) const noexcept
{
  if (ucid == target_ucid) return this;
  for (const auto & nested : classes) {
    if (const Class * found = nested->find_class(target_ucid)) return found;
  }
  return nullptr;
}

std::string import_text(const Import & imp)
{
  std::string text = imp.is_static ? "static " : "";
  text += imp.name;
  if (imp.is_wildcard) {
    text += ".*";
  }
  return text;
}

const Class * File::find_class(std::string_view target_ucid) const noexcept
{
  for (const auto & cls : classes) {
    if (const Class * found = cls->find_class(target_ucid)) return found;
  }
  return nullptr;
}

}  // namespace docgraph
