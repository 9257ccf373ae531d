// odx/xml/source_extractor.hpp - Isolate the designer XML inside an .odx file
//
// An orchestration file stores the designer XML document followed by
// generated code. The document starts at the XML declaration and ends right
// before the `#endif` sentinel that opens the generated section.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace tinyxml2
{
class XMLDocument;
}

namespace odx
{

/// Marker that terminates the designer XML section
inline constexpr std::string_view k_designer_data_sentinel = "#endif";

/// XML declaration marker that starts the designer XML section
inline constexpr std::string_view k_xml_declaration = "<?xml";

/**
 * Read a whole source file.
 *
 * @throws OdxError (IoError) if the file is missing or cannot be read
 */
[[nodiscard]] std::string read_source_file(const std::filesystem::path & path);

/**
 * Return the embedded XML document (declaration included, sentinel excluded).
 *
 * @param text Raw file content
 * @param source_name File name used in error messages
 * @throws OdxError (FormatError) if the declaration or the sentinel is missing
 */
[[nodiscard]] std::string extract_xml(std::string_view text, std::string_view source_name);

/**
 * Parse an extracted XML fragment.
 *
 * @throws OdxError (FormatError) carrying the line reported by tinyxml2
 */
[[nodiscard]] std::unique_ptr<tinyxml2::XMLDocument> parse_xml_document(
  const std::string & xml, std::string_view source_name);

}  // namespace odx
