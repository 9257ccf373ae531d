// odx/basic/string_utils.hpp - Small ASCII string helpers
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace odx
{

[[nodiscard]] inline char ascii_lower(char c)
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] inline std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), ascii_lower);
  return out;
}

/// Case-insensitive equality (ASCII)
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(a[i]) != ascii_lower(b[i])) {
      return false;
    }
  }
  return true;
}

/// Case-insensitive substring test (ASCII)
[[nodiscard]] inline bool icontains(std::string_view haystack, std::string_view needle)
{
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

/// True for an empty string or one made only of whitespace
[[nodiscard]] inline bool is_blank(std::string_view s)
{
  return std::all_of(
    s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace odx
