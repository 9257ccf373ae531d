// odx/basic/error.cpp
#include "odx/basic/error.hpp"

#include <fmt/core.h>

#include <utility>

namespace odx
{

std::string_view to_string(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::IoError:
      return "IoError";
    case ErrorKind::FormatError:
      return "FormatError";
    case ErrorKind::SemanticError:
      return "SemanticError";
    case ErrorKind::SectionError:
      return "SectionError";
  }
  return "Unknown";
}

OdxError::OdxError(ErrorKind kind, const std::string & message)
: std::runtime_error(message), kind_(kind)
{
}

OdxError::OdxError(ErrorKind kind, const std::string & message, uint32_t line, uint32_t column)
: std::runtime_error(fmt::format("{} (line {}, column {})", message, line, column)),
  kind_(kind),
  line_(line),
  column_(column)
{
}

SectionError::SectionError(std::string orchestration, std::string section, const std::string & inner)
: OdxError(
    ErrorKind::SectionError,
    fmt::format("Error parsing {} in orchestration '{}': {}", section, orchestration, inner)),
  orchestration_(std::move(orchestration)),
  section_(std::move(section))
{
}

}  // namespace odx
