#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "htmx_lsp/basic/diagnostic.hpp"
#include "htmx_lsp/basic/diagnostic_printer.hpp"
#include "htmx_lsp/basic/source_manager.hpp"

using htmx_lsp::DiagnosticBag;
using htmx_lsp::DiagnosticPrinter;
using htmx_lsp::SourceRegistry;

TEST(BasicDiagnosticPrinter, DuplicateTagWithContext)
{
  SourceRegistry sources;
  sources.set_document("file:///p/src/a.py", "# hx@users\n");
  sources.set_document("file:///p/src/b.py", "x = 1\n# hx@users\n");

  DiagnosticBag bag;
  bag.report_warning("file:///p/src/b.py", {{1, 2}, {1, 10}}, "This tag already exists.")
    .with_code("W0001")
    .with_secondary_label("file:///p/src/a.py", {{0, 2}, {0, 10}}, "first declared here");

  std::ostringstream out;
  DiagnosticPrinter printer(out, /*use_color=*/false);
  printer.print_all(bag, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[W0001]: This tag already exists."), std::string::npos) << text;
  EXPECT_NE(text.find("b.py:2:3"), std::string::npos) << text;
  EXPECT_NE(text.find("# hx@users"), std::string::npos) << text;
  EXPECT_NE(text.find("^^^^^^^^"), std::string::npos) << text;
  EXPECT_NE(text.find("first declared here"), std::string::npos) << text;
}

TEST(BasicDiagnosticBag, CountsBySeverity)
{
  DiagnosticBag bag;
  bag.report_warning("file:///a", {}, "w");
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_FALSE(bag.has_errors());

  bag.report_error("file:///b", {}, "e");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.size(), 2U);
  EXPECT_EQ(bag.for_uri("file:///a").size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
}
