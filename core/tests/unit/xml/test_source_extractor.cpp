// test_source_extractor.cpp - Unit tests for designer XML extraction
//
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "odx/basic/error.hpp"
#include "odx/test_support/odx_builders.hpp"
#include "odx/xml/source_extractor.hpp"
#include "tinyxml2.h"

namespace odx
{

TEST(SourceExtractorTest, CutsBetweenDeclarationAndSentinel)
{
  const std::string text =
    "#if __DESIGNER_DATA\n"
    "#error Do not define __DESIGNER_DATA.\n"
    "<?xml version=\"1.0\"?>\n"
    "<om:MetaModel xmlns:om=\"x\"></om:MetaModel>\n"
    "#endif // __DESIGNER_DATA\n"
    "module Foo {}\n";

  const std::string xml = extract_xml(text, "Foo.odx");
  EXPECT_EQ(xml.rfind("<?xml", 0), 0U);
  EXPECT_EQ(xml.find("#endif"), std::string::npos);
  EXPECT_NE(xml.find("</om:MetaModel>"), std::string::npos);
  EXPECT_EQ(xml.find("#error"), std::string::npos);
}

TEST(SourceExtractorTest, MissingDeclarationIsFormatError)
{
  try {
    (void)extract_xml("#endif\nmodule Foo {}", "Foo.odx");
    FAIL() << "expected OdxError";
  } catch (const OdxError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::FormatError);
    EXPECT_NE(std::string(e.what()).find("Missing XML declaration"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("Foo.odx"), std::string::npos);
  }
}

TEST(SourceExtractorTest, MissingSentinelIsFormatError)
{
  try {
    (void)extract_xml("<?xml version=\"1.0\"?><a/>", "Bar.odx");
    FAIL() << "expected OdxError";
  } catch (const OdxError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::FormatError);
    EXPECT_NE(std::string(e.what()).find("#endif"), std::string::npos);
  }
}

TEST(SourceExtractorTest, SentinelBeforeDeclarationDoesNotCount)
{
  EXPECT_THROW((void)extract_xml("#endif\n<?xml version=\"1.0\"?><a/>", "x.odx"), OdxError);
}

TEST(SourceExtractorTest, MalformedXmlCarriesLine)
{
  const std::string xml = "<?xml version=\"1.0\"?>\n<root>\n<child>\n</root>\n";
  try {
    (void)parse_xml_document(xml, "Broken.odx");
    FAIL() << "expected OdxError";
  } catch (const OdxError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::FormatError);
    EXPECT_GT(e.line(), 0U);
    EXPECT_NE(std::string(e.what()).find("Broken.odx"), std::string::npos);
  }
}

TEST(SourceExtractorTest, ParsesWellFormedDocument)
{
  const test_support::OdxSource src;
  const std::string xml = extract_xml(src.text(), "test.odx");
  const auto doc = parse_xml_document(xml, "test.odx");
  ASSERT_NE(doc, nullptr);
  ASSERT_NE(doc->RootElement(), nullptr);
  EXPECT_STREQ(doc->RootElement()->Name(), "om:MetaModel");
}

TEST(SourceExtractorTest, MissingFileIsIoError)
{
  const auto path = std::filesystem::temp_directory_path() / "odx_missing_dir" / "Nope.odx";
  try {
    (void)read_source_file(path);
    FAIL() << "expected OdxError";
  } catch (const OdxError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::IoError);
    EXPECT_NE(std::string(e.what()).find("Nope.odx"), std::string::npos);
  }
}

TEST(SourceExtractorTest, ReadsFileContent)
{
  const test_support::TempDir dir(std::filesystem::temp_directory_path() / "odx_extractor_test");
  const auto path = dir.path / "Orders.odx";
  test_support::write_file(path, "hello\r\nworld");
  EXPECT_EQ(read_source_file(path), "hello\r\nworld");
}

}  // namespace odx
