// odx/xml/source_extractor.cpp
#include "odx/xml/source_extractor.hpp"

#include <fmt/core.h>

#include <fstream>
#include <sstream>

#include "odx/basic/error.hpp"
#include "tinyxml2.h"

namespace odx
{

std::string read_source_file(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw OdxError(ErrorKind::IoError, "Orchestration file not found: " + path.string());
  }

  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw OdxError(
      ErrorKind::IoError, fmt::format("Failed to read orchestration file '{}'", path.string()));
  }

  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) {
    throw OdxError(
      ErrorKind::IoError, fmt::format("Failed to read orchestration file '{}'", path.string()));
  }
  return ss.str();
}

std::string extract_xml(std::string_view text, std::string_view source_name)
{
  const size_t xml_start = text.find(k_xml_declaration);
  if (xml_start == std::string_view::npos) {
    throw OdxError(
      ErrorKind::FormatError,
      fmt::format("Invalid ODX file '{}': Missing XML declaration", source_name));
  }

  const size_t xml_end = text.find(k_designer_data_sentinel, xml_start);
  if (xml_end == std::string_view::npos) {
    throw OdxError(
      ErrorKind::FormatError,
      fmt::format(
        "Invalid ODX file '{}': Missing '{}' sentinel. The file may be corrupted or incomplete",
        source_name, k_designer_data_sentinel));
  }

  return std::string(text.substr(xml_start, xml_end - xml_start));
}

std::unique_ptr<tinyxml2::XMLDocument> parse_xml_document(
  const std::string & xml, std::string_view source_name)
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  const tinyxml2::XMLError err = doc->Parse(xml.c_str(), xml.size());
  if (err != tinyxml2::XML_SUCCESS) {
    // tinyxml2 reports a line but no column
    const int line = doc->ErrorLineNum();
    throw OdxError(
      ErrorKind::FormatError,
      fmt::format("Failed to parse XML in orchestration file '{}': {}", source_name, doc->ErrorStr()),
      line > 0 ? static_cast<uint32_t>(line) : 0U, 0U);
  }
  if (doc->RootElement() == nullptr) {
    throw OdxError(
      ErrorKind::FormatError,
      fmt::format("Failed to parse XML in orchestration file '{}': no root element", source_name));
  }
  return doc;
}

}  // namespace odx
