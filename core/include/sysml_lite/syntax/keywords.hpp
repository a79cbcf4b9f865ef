#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace sysml_lite::syntax
{

// Reserved words of the supported SysML v2 subset (case-sensitive).
// Only a few of them select a dedicated grammar rule; the rest lex as
// KEYWORD and fall through to the generic element rule.
inline constexpr std::array<std::string_view, 33> k_keywords = {
  "package",   "part",       "attribute",   "port",      "connection", "interface", "block",
  "requirement", "constraint", "activity",  "state",     "transition", "use",       "case",
  "actor",     "subject",    "stakeholder", "concern",   "view",       "viewpoint", "rendering",
  "expose",    "import",     "private",     "protected", "public",     "abstract",  "readonly",
  "derived",   "end",        "redefines",   "specializes", "conjugates",
};

[[nodiscard]] inline bool is_keyword(std::string_view word) noexcept
{
  return std::find(k_keywords.begin(), k_keywords.end(), word) != k_keywords.end();
}

}  // namespace sysml_lite::syntax
