// odx/test_support/odx_builders.hpp - helpers for unit tests
//
// These helpers assemble complete orchestration sources from small element
// snippets, so each test only spells out the shapes it is about.
//
#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "odx/basic/diagnostic.hpp"
#include "odx/model/orchestration.hpp"
#include "odx/parse/orchestration_loader.hpp"

namespace odx::test_support
{

inline std::string xml_escape(const std::string & s)
{
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

// ============================================================================
// El - designer Element builder
// ============================================================================

/**
 * Fluent builder for one `om:Element`.
 *
 * @code
 *   El("Receive").oid("r1").prop("Name", "ReceiveOrder").prop("Activate", "True")
 * @endcode
 */
class El
{
public:
  explicit El(std::string type) : type_(std::move(type)) {}

  El & oid(std::string value)
  {
    oid_ = std::move(value);
    return *this;
  }

  El & prop(std::string name, std::string value)
  {
    props_.emplace_back(std::move(name), std::move(value));
    return *this;
  }

  El & name(std::string value) { return prop("Name", std::move(value)); }

  El & child(const El & element)
  {
    children_.push_back(element.str());
    return *this;
  }

  El & children(const std::vector<El> & elements)
  {
    for (const auto & e : elements) child(e);
    return *this;
  }

  [[nodiscard]] std::string str() const
  {
    std::string out = "<om:Element Type=\"" + xml_escape(type_) + "\"";
    if (!oid_.empty()) {
      out += " OID=\"" + xml_escape(oid_) + "\"";
    }
    out += ">\n";
    for (const auto & [n, v] : props_) {
      out += "<om:Property Name=\"" + xml_escape(n) + "\" Value=\"" + xml_escape(v) + "\" />\n";
    }
    for (const auto & c : children_) {
      out += c;
    }
    out += "</om:Element>\n";
    return out;
  }

private:
  std::string type_;
  std::string oid_;
  std::vector<std::pair<std::string, std::string>> props_;
  std::vector<std::string> children_;
};

// ============================================================================
// OdxSource - whole-file wrapper
// ============================================================================

struct OdxSource
{
  std::string ns = "Contoso.Billing";
  std::string name = "ProcessInvoice";
  std::vector<El> module_items;   // PortType, ...
  std::vector<El> service_items;  // MessageDeclaration, PortDeclaration, VariableDeclaration
  std::vector<El> body;
  bool with_body = true;

  /// Full source text: preprocessor preamble, designer XML, sentinel, code
  [[nodiscard]] std::string text() const
  {
    std::string xml = "#if __DESIGNER_DATA\n#error Do not define __DESIGNER_DATA.\n";
    xml += "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    xml +=
      "<om:MetaModel MajorVersion=\"1\" MinorVersion=\"3\" "
      "xmlns:om=\"http://schemas.microsoft.com/BizTalk/2003/DesignerData\">\n";

    El service("ServiceDeclaration");
    service.oid("svc").name(name);
    service.children(service_items);
    if (with_body) {
      El body_el("ServiceBody");
      body_el.oid("body").children(body);
      service.child(body_el);
    }

    El module("Module");
    module.oid("mod");
    if (!ns.empty()) module.name(ns);
    module.children(module_items);
    module.child(service);

    xml += module.str();
    xml += "</om:MetaModel>\n#endif // __DESIGNER_DATA\n";
    xml += "[Microsoft.XLANGs.BaseTypes.BPELExportable(false)]\n";
    xml += "module " + ns + "\n{\n}\n";
    return xml;
  }
};

struct TestLoadUnit
{
  OrchestrationModel model;
  DiagnosticBag diags;
};

/// Load a source built from snippets; loader exceptions propagate
[[nodiscard]] inline TestLoadUnit load(const OdxSource & src, std::string_view source_name = "test.odx")
{
  TestLoadUnit out;
  out.model = load_orchestration_from_text(src.text(), source_name, &out.diags);
  return out;
}

/// Source with only a service body
[[nodiscard]] inline TestLoadUnit load_body(const std::vector<El> & body)
{
  OdxSource src;
  src.body = body;
  return load(src);
}

// ============================================================================
// Filesystem
// ============================================================================

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

inline void write_file(const std::filesystem::path & path, const std::string & content)
{
  std::filesystem::create_directories(path.parent_path());
  std::ofstream f(path, std::ios::binary);
  f << content;
}

}  // namespace odx::test_support
