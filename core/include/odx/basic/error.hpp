// odx/basic/error.hpp - Exceptions raised while loading orchestration files
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace odx
{

enum class ErrorKind : uint8_t {
  IoError,        // file missing or unreadable
  FormatError,    // no XML declaration / sentinel, or malformed XML
  SemanticError,  // required name fields absent
  SectionError,   // a named sub-section failed while building
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

/**
 * Base error for everything that makes a single orchestration file unusable.
 *
 * Format errors raised by the XML parser carry the position reported by
 * tinyxml2 (line, column 0 when unknown).
 */
class OdxError : public std::runtime_error
{
public:
  OdxError(ErrorKind kind, const std::string & message);
  OdxError(ErrorKind kind, const std::string & message, uint32_t line, uint32_t column);

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] uint32_t line() const noexcept { return line_; }
  [[nodiscard]] uint32_t column() const noexcept { return column_; }

private:
  ErrorKind kind_;
  uint32_t line_ = 0;
  uint32_t column_ = 0;
};

/**
 * Raised when one of the orchestration sections (messages, port types, ports,
 * shapes, correlations) fails to build.
 */
class SectionError : public OdxError
{
public:
  SectionError(std::string orchestration, std::string section, const std::string & inner);

  [[nodiscard]] const std::string & orchestration() const noexcept { return orchestration_; }
  [[nodiscard]] const std::string & section() const noexcept { return section_; }

private:
  std::string orchestration_;
  std::string section_;
};

}  // namespace odx
