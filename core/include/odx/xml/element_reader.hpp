// odx/xml/element_reader.hpp - Path-style access to designer Element/Property XML
//
// The designer schema is generic: every construct is an `Element` with a
// `Type` attribute and an optional `OID`, carrying `Property` children
// (`Name`/`Value`) and nested `Element` children, all in the DesignerData
// namespace.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinyxml2
{
class XMLDocument;
class XMLElement;
}  // namespace tinyxml2

namespace odx
{

inline constexpr std::string_view k_designer_data_namespace =
  "http://schemas.microsoft.com/BizTalk/2003/DesignerData";

/**
 * One step of a relative element path.
 *
 * Path syntax: steps separated by '/', each step one of
 *   Type            element with that Type attribute
 *   A|B             element whose Type is A or B
 *   *               any element
 * optionally followed by a property predicate `[Prop=Value]`.
 *
 * @code
 *   "ServiceDeclaration/PortDeclaration"
 *   "MessageRef[Name=Request]"
 *   "Task|ListenBranch"
 * @endcode
 */
struct PathStep
{
  std::vector<std::string> types;  // empty = wildcard
  std::optional<std::string> property_name;
  std::string property_value;
};

/**
 * Parse a relative path into steps. An empty path yields no steps.
 *
 * @throws std::invalid_argument on an unterminated or malformed predicate
 */
[[nodiscard]] std::vector<PathStep> parse_element_path(std::string_view path);

class ElementReader
{
public:
  /**
   * Create a reader for a parsed document.
   *
   * The prefix bound to the DesignerData namespace is read from the root
   * element's xmlns declarations; documents that never bind it fall back to
   * the conventional `om` prefix.
   */
  explicit ElementReader(const tinyxml2::XMLDocument & doc);

  /// Create a reader for an explicit prefix ("" for the default namespace)
  explicit ElementReader(std::string prefix);

  [[nodiscard]] const std::string & prefix() const noexcept { return prefix_; }

  /// Root MetaModel element, or nullptr when the document has none
  [[nodiscard]] const tinyxml2::XMLElement * meta_model(const tinyxml2::XMLDocument & doc) const;

  /// All descendants of `from` matched by the relative `path`, in document order
  [[nodiscard]] std::vector<const tinyxml2::XMLElement *> select(
    const tinyxml2::XMLElement * from, std::string_view path) const;

  /// First match of `path`, or nullptr
  [[nodiscard]] const tinyxml2::XMLElement * select_first(
    const tinyxml2::XMLElement * from, std::string_view path) const;

  /**
   * Value of `property` on the first element matched by `path` that carries
   * it (empty path = `from` itself). Returns an empty string when nothing
   * matches.
   */
  [[nodiscard]] std::string eval(
    const tinyxml2::XMLElement * from, std::string_view path, std::string_view property) const;

  /// Shorthand for eval(element, "", name)
  [[nodiscard]] std::string property(
    const tinyxml2::XMLElement * element, std::string_view name) const;

  /// Direct `Element` children of `parent`, in document order
  [[nodiscard]] std::vector<const tinyxml2::XMLElement *> child_elements(
    const tinyxml2::XMLElement * parent) const;

  [[nodiscard]] bool is_element(const tinyxml2::XMLElement * node) const;

  [[nodiscard]] static std::string type_of(const tinyxml2::XMLElement * element);
  [[nodiscard]] static std::string oid_of(const tinyxml2::XMLElement * element);

private:
  [[nodiscard]] bool matches(const tinyxml2::XMLElement * element, const PathStep & step) const;
  [[nodiscard]] const char * find_property_value(
    const tinyxml2::XMLElement * element, std::string_view name) const;

  std::string prefix_;
  std::string element_tag_;
  std::string property_tag_;
  std::string meta_model_tag_;
};

}  // namespace odx
