// test_diagnostic.cpp - Unit tests for DiagnosticBag, DiagnosticBuilder and DiagnosticPrinter
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <rang.hpp>

#include "odx/basic/diagnostic.hpp"
#include "odx/basic/diagnostic_printer.hpp"
#include "odx/basic/error.hpp"

namespace odx
{

TEST(DiagnosticBagTest, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_warning(12, "unknown shape type 'Foo'", "kept as a fallback node");
    builder.with_code("P001").with_source("Orders.odx");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "P001");
  EXPECT_EQ(d.source, "Orders.odx");
  EXPECT_EQ(d.primary_line(), 12U);
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "kept as a fallback node");
}

TEST(DiagnosticBagTest, SeverityFilters)
{
  DiagnosticBag bag;
  bag.report_error(1, "broken");
  bag.report_warning(2, "odd");
  bag.report_info(3, "fyi");

  EXPECT_EQ(bag.size(), 3U);
  ASSERT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.errors()[0].message, "broken");
  ASSERT_EQ(bag.warnings().size(), 1U);
  EXPECT_EQ(bag.warnings()[0].message, "odd");
}

TEST(DiagnosticBagTest, SecondaryLabelDoesNotBecomePrimary)
{
  DiagnosticBag bag;
  bag.report_error(5, "duplicate identifier").with_secondary_label(2, "first declared here");

  const Diagnostic & d = bag.all().front();
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.primary_line(), 5U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
}

TEST(DiagnosticPrinterTest, PlainOutputShowsElementLine)
{
  const std::string xml =
    "<?xml version=\"1.0\"?>\n"
    "<om:MetaModel>\n"
    "  <om:Element Type=\"Mystery\" OID=\"x\">\n"
    "</om:MetaModel>\n";

  DiagnosticBag bag;
  bag.report_warning(3, "unknown shape type 'Mystery'", "kept as a fallback node")
    .with_code("P001")
    .with_source("Orders.odx")
    .with_help("check the designer version");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, xml);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[P001]: unknown shape type 'Mystery'"), std::string::npos);
  EXPECT_NE(text.find("  --> Orders.odx:3"), std::string::npos);
  EXPECT_NE(text.find("    3 |   <om:Element Type=\"Mystery\" OID=\"x\">"), std::string::npos);
  EXPECT_NE(text.find("^ kept as a fallback node"), std::string::npos);
  EXPECT_NE(text.find("= help: check the designer version"), std::string::npos);
}

TEST(DiagnosticPrinterTest, SecondaryLabelUsesDashMarker)
{
  const std::string xml =
    "<?xml version=\"1.0\"?>\n"
    "<om:Element Type=\"Send\" OID=\"dup\">\n"
    "<om:Element Type=\"Send\" OID=\"dup\">\n";

  DiagnosticBag bag;
  bag.report_warning(3, "duplicate identifier 'dup'", "ignored for lookups")
    .with_code("P002")
    .with_secondary_label(2, "first registered here");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, xml);

  const std::string text = out.str();
  EXPECT_NE(text.find("^ ignored for lookups"), std::string::npos);
  EXPECT_NE(text.find("- first registered here"), std::string::npos);
  EXPECT_LT(text.find("    3 |"), text.find("    2 |"));
}

TEST(DiagnosticPrinterTest, PlainPrinterDoesNotDisableColorsGlobally)
{
  struct ForceColors
  {
    ForceColors() { rang::setControlMode(rang::control::Force); }
    ~ForceColors() { rang::setControlMode(rang::control::Auto); }
  } force;

  DiagnosticBag bag;
  bag.report_error(0, "file analysis failed").with_code("A001");

  std::ostringstream plain_out;
  DiagnosticPrinter plain(plain_out, false);
  std::ostringstream color_out;
  DiagnosticPrinter colored(color_out, true);
  plain.print_all(bag);
  colored.print_all(bag);

  EXPECT_EQ(plain_out.str().find('\033'), std::string::npos);
  EXPECT_NE(plain_out.str().find("error[A001]: file analysis failed"), std::string::npos);
  EXPECT_NE(color_out.str().find('\033'), std::string::npos);
}

TEST(DiagnosticPrinterTest, NoLocationPrintsNote)
{
  DiagnosticBag bag;
  bag.report_error(0, "file analysis failed", "missing sentinel").with_code("A001");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[A001]: file analysis failed"), std::string::npos);
  EXPECT_NE(text.find("  --> <unknown>\n"), std::string::npos);
  EXPECT_NE(text.find("= note: missing sentinel"), std::string::npos);
}

TEST(OdxErrorTest, SectionErrorNamesSectionAndOrchestration)
{
  const SectionError err("ProcessInvoice", "port types", "bad operation");
  EXPECT_EQ(err.kind(), ErrorKind::SectionError);
  EXPECT_EQ(err.section(), "port types");
  EXPECT_EQ(err.orchestration(), "ProcessInvoice");
  EXPECT_STREQ(
    err.what(), "Error parsing port types in orchestration 'ProcessInvoice': bad operation");
}

TEST(OdxErrorTest, PositionIsAppendedToMessage)
{
  const OdxError err(ErrorKind::FormatError, "bad xml", 7, 0);
  EXPECT_EQ(err.line(), 7U);
  EXPECT_STREQ(err.what(), "bad xml (line 7, column 0)");
  EXPECT_EQ(to_string(err.kind()), "FormatError");
}

}  // namespace odx
