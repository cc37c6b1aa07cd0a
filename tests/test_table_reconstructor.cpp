#include <catch2/catch.hpp>

#include "errors.hpp"
#include "table_reconstructor.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace {

Cell cell(int row, int col, const std::string& content, CellKind kind = CellKind::Body,
          int rowSpan = 1, int columnSpan = 1) {
  Cell c;
  c.rowIndex = row;
  c.columnIndex = col;
  c.rowSpan = rowSpan;
  c.columnSpan = columnSpan;
  c.kind = kind;
  c.content = content;
  return c;
}

Line line(const std::string& content, int offset) {
  return Line{content, {Span{offset, static_cast<int>(content.size())}}};
}

Table table(int rows, int cols, std::vector<Cell> cells) {
  Table t;
  t.rowCount = rows;
  t.columnCount = cols;
  t.cells = std::move(cells);
  t.boundingRegions = {BoundingRegion{1}};
  t.spans = {Span{100, 50}};
  return t;
}

// Lines at 10..40 precede the table at [100, 150]; lines at 160..190 follow it.
std::vector<Page> pageAroundTable() {
  Page page;
  page.pageNumber = 1;
  page.lines = {line("p1", 10), line("p2", 20), line("p3", 30), line("p4", 40),
                line("inside", 120),
                line("f1", 160), line("f2", 170), line("f3", 180), line("f4", 190)};
  return {page};
}

size_t lineCount(const std::string& s) {
  if (s.empty()) return 0;
  return static_cast<size_t>(std::count(s.begin(), s.end(), '\n')) + 1;
}

} // namespace

TEST_CASE("2x2 table without caption is rebuilt literally", "[table]") {
  Table t = table(2, 2, {cell(0, 0, "a"), cell(0, 1, "b"), cell(1, 0, "c"), cell(1, 1, "d")});
  TableReconstructionOptions options;
  options.mergeMultipleColumnHeaders = false;

  Document doc = reconstructTable(t, std::nullopt, options, {});

  REQUIRE(doc.contentType == ContentType::Table);
  const TableGrid& grid = doc.tableContent();
  REQUIRE(grid.headers == std::vector<std::string>{"a", "b"});
  REQUIRE(grid.rows.size() == 1);
  REQUIRE(grid.rows[0] == std::vector<std::string>{"c", "d"});
}

TEST_CASE("full-width first cell becomes the caption", "[table][caption]") {
  Table t = table(3, 2, {cell(0, 0, "Quarterly revenue", CellKind::Body, 1, 2),
                         cell(1, 0, "Q"), cell(1, 1, "EUR"),
                         cell(2, 0, "Q1"), cell(2, 1, "10")});

  Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, pageAroundTable());

  const TableGrid& grid = doc.tableContent();
  REQUIRE(1 + grid.rows.size() == 2);
  REQUIRE(grid.headers == std::vector<std::string>{"Q", "EUR"});
  REQUIRE(grid.rows[0] == std::vector<std::string>{"Q1", "10"});
  REQUIRE(*doc.meta.precedingContext == "p2\np3\np4\nQuarterly revenue");
}

TEST_CASE("cells spanning several rows and columns fill every position", "[table]") {
  Table t = table(3, 2, {cell(0, 0, "h1"), cell(0, 1, "h2"),
                         cell(1, 0, "tall", CellKind::Body, 2, 1),
                         cell(1, 1, "x"), cell(2, 1, "y")});
  t.cells.push_back(cell(0, 0, "wide", CellKind::Body, 1, 2));

  Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, {});

  const TableGrid& grid = doc.tableContent();
  REQUIRE(grid.headers == std::vector<std::string>{"wide", "wide"});
  REQUIRE(grid.rows[0] == std::vector<std::string>{"tall", "x"});
  REQUIRE(grid.rows[1] == std::vector<std::string>{"tall", "y"});
}

TEST_CASE("stacked column headers merge into the first row", "[table][headers]") {
  std::vector<Cell> cells = {cell(0, 0, "Name", CellKind::ColumnHeader), cell(0, 1, "Amount", CellKind::ColumnHeader),
                             cell(1, 0, "first", CellKind::ColumnHeader), cell(1, 1, "EUR", CellKind::ColumnHeader),
                             cell(2, 0, "Alice"), cell(2, 1, "5")};

  SECTION("merge enabled") {
    Document doc = reconstructTable(table(3, 2, cells), std::nullopt, TableReconstructionOptions{}, {});
    const TableGrid& grid = doc.tableContent();
    REQUIRE(grid.headers == std::vector<std::string>{"Name\nfirst", "Amount\nEUR"});
    REQUIRE(grid.rows.size() == 1);
    REQUIRE(grid.rows[0] == std::vector<std::string>{"Alice", "5"});
  }

  SECTION("merge disabled keeps both rows") {
    TableReconstructionOptions options;
    options.mergeMultipleColumnHeaders = false;
    Document doc = reconstructTable(table(3, 2, cells), std::nullopt, options, {});
    const TableGrid& grid = doc.tableContent();
    REQUIRE(grid.headers == std::vector<std::string>{"Name", "Amount"});
    REQUIRE(grid.rows.size() == 2);
    REQUIRE(grid.rows[0] == std::vector<std::string>{"first", "EUR"});
  }
}

TEST_CASE("header merge counts rows after the caption", "[table][headers][caption]") {
  Table t = table(4, 2, {cell(0, 0, "Caption", CellKind::Body, 1, 2),
                         cell(1, 0, "A", CellKind::ColumnHeader), cell(1, 1, "B", CellKind::ColumnHeader),
                         cell(2, 0, "a", CellKind::ColumnHeader), cell(2, 1, "b", CellKind::ColumnHeader),
                         cell(3, 0, "1"), cell(3, 1, "2")});

  Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, {});

  const TableGrid& grid = doc.tableContent();
  REQUIRE(grid.headers == std::vector<std::string>{"A\na", "B\nb"});
  REQUIRE(grid.rows.size() == 1);
  REQUIRE(grid.rows[0] == std::vector<std::string>{"1", "2"});
}

TEST_CASE("selection markers are stripped from cell values", "[table]") {
  Table t = table(2, 2, {cell(0, 0, "Agree"), cell(0, 1, "Note"),
                         cell(1, 0, ":selected:"), cell(1, 1, "x :unselected: y")});

  Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, {});

  REQUIRE(doc.tableContent().rows[0] == std::vector<std::string>{"", "x  y"});
  REQUIRE(stripSelectionMarks(":unselected::selected:done") == "done");
}

TEST_CASE("zero spans place nothing unless treated as one", "[table][span]") {
  Table t = table(2, 2, {cell(0, 0, "a"), cell(0, 1, "b"), cell(1, 0, "c", CellKind::Body, 0, 1),
                         cell(1, 1, "d", CellKind::Body, 1, 0)});

  SECTION("literal zero spans") {
    Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, {});
    REQUIRE(doc.tableContent().rows[0] == std::vector<std::string>{"", ""});
  }

  SECTION("zero spans as one") {
    TableReconstructionOptions options;
    options.zeroSpanAsOne = true;
    Document doc = reconstructTable(t, std::nullopt, options, {});
    REQUIRE(doc.tableContent().rows[0] == std::vector<std::string>{"c", "d"});
  }
}

TEST_CASE("cells outside the declared bounds are rejected", "[table][error]") {
  TableReconstructionOptions options;
  REQUIRE_THROWS_AS(reconstructTable(table(2, 2, {cell(2, 0, "x")}), std::nullopt, options, {}),
                    MalformedTableResult);
  REQUIRE_THROWS_AS(reconstructTable(table(2, 2, {cell(0, 0, "a"), cell(0, 1, "x", CellKind::Body, 1, 2)}), std::nullopt, options, {}),
                    MalformedTableResult);
  REQUIRE_THROWS_AS(reconstructTable(table(2, 2, {cell(1, 0, "x", CellKind::Body, 2, 1)}), std::nullopt, options, {}),
                    MalformedTableResult);
  REQUIRE_THROWS_AS(reconstructTable(table(0, 2, {}), std::nullopt, options, {}), MalformedTableResult);
  // A second header row beyond the grid cannot be merged away.
  REQUIRE_THROWS_AS(reconstructTable(table(2, 2, {cell(5, 0, "h", CellKind::ColumnHeader)}), std::nullopt, options, {}),
                    MalformedTableResult);
}

TEST_CASE("merged header cells must fit the declared rows", "[table][headers][error]") {
  TableReconstructionOptions options;

  SECTION("row span past the last row") {
    Table t = table(3, 2, {cell(0, 0, "A", CellKind::ColumnHeader), cell(0, 1, "B", CellKind::ColumnHeader),
                           cell(1, 0, "a", CellKind::ColumnHeader, 5, 1), cell(2, 0, "1")});
    REQUIRE_THROWS_AS(reconstructTable(t, std::nullopt, options, {}), MalformedTableResult);
  }

  SECTION("huge row span is rejected before expansion") {
    Table t = table(3, 2, {cell(0, 0, "A", CellKind::ColumnHeader),
                           cell(1, 0, "a", CellKind::ColumnHeader, std::numeric_limits<int>::max(), 1)});
    REQUIRE_THROWS_AS(reconstructTable(t, std::nullopt, options, {}), MalformedTableResult);
  }

  SECTION("header row that fits is merged once per spanned row") {
    Table t = table(3, 2, {cell(0, 0, "A", CellKind::ColumnHeader), cell(0, 1, "B", CellKind::ColumnHeader),
                           cell(1, 0, "a", CellKind::ColumnHeader, 2, 1)});
    TableReconstructionReport report;
    Document doc = reconstructTable(t, std::nullopt, options, {}, &report);
    REQUIRE(doc.tableContent().headers == std::vector<std::string>{"A\na\na", "B"});
    REQUIRE(report.mergedHeaderRows == std::vector<int>{1});
    REQUIRE_FALSE(report.captionFound);
  }
}

TEST_CASE("reconstruction reports the caption and merged rows", "[table][report]") {
  Table t = table(4, 2, {cell(0, 0, "Caption", CellKind::Body, 1, 2),
                         cell(1, 0, "A", CellKind::ColumnHeader), cell(1, 1, "B", CellKind::ColumnHeader),
                         cell(2, 0, "a", CellKind::ColumnHeader), cell(2, 1, "b", CellKind::ColumnHeader),
                         cell(3, 0, "1"), cell(3, 1, "2")});
  TableReconstructionReport report;

  reconstructTable(t, std::nullopt, TableReconstructionOptions{}, {}, &report);

  REQUIRE(report.captionFound);
  REQUIRE(report.mergedHeaderRows == std::vector<int>{2});
}

TEST_CASE("context lines come from around the table", "[table][context]") {
  Table t = table(2, 2, {cell(0, 0, "a"), cell(0, 1, "b"), cell(1, 0, "c"), cell(1, 1, "d")});
  std::vector<Page> pages = pageAroundTable();

  Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, pages);

  REQUIRE(*doc.meta.precedingContext == "p2\np3\np4");
  REQUIRE(*doc.meta.followingContext == "f1\nf2\nf3");
  REQUIRE(*doc.meta.page == 1);
}

TEST_CASE("context never exceeds the configured number of lines", "[table][context]") {
  Table t = table(1, 2, {cell(0, 0, "a")});
  std::vector<Page> pages = pageAroundTable();

  for (int n = 0; n <= 6; ++n) {
    TableReconstructionOptions options;
    options.precedingContextLen = n;
    options.followingContextLen = n;
    Document doc = reconstructTable(t, std::nullopt, options, pages);
    CHECK(lineCount(*doc.meta.precedingContext) == std::min<size_t>(n, 4));
    CHECK(lineCount(*doc.meta.followingContext) == std::min<size_t>(n, 4));
  }
}

TEST_CASE("following context of a multi-page table comes from its last page", "[table][context]") {
  Table t = table(1, 2, {cell(0, 0, "a")});
  t.boundingRegions = {BoundingRegion{1}, BoundingRegion{2}};

  Page second;
  second.pageNumber = 2;
  second.lines = {line("before end", 140), line("after", 300)};
  std::vector<Page> pages = pageAroundTable();
  pages.push_back(second);

  Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, pages);

  REQUIRE(*doc.meta.followingContext == "after");
  REQUIRE(*doc.meta.page == 1);
}

TEST_CASE("table end near the int limit does not overflow", "[table][context]") {
  const int top = std::numeric_limits<int>::max();
  Table t = table(1, 2, {cell(0, 0, "a")});
  t.spans = {Span{top - 10, 20}};

  Page page;
  page.pageNumber = 1;
  page.lines = {line("before", 5), line("last", top)};

  Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, {page});

  REQUIRE(*doc.meta.precedingContext == "before");
  REQUIRE(*doc.meta.followingContext == "");
}

TEST_CASE("missing regions, spans or pages give empty context", "[table][context]") {
  Table t = table(1, 2, {cell(0, 0, "a")});

  SECTION("no bounding regions") {
    t.boundingRegions.clear();
    Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, pageAroundTable());
    REQUIRE(doc.meta.precedingContext == std::string());
    REQUIRE(doc.meta.followingContext == std::string());
    REQUIRE_FALSE(doc.meta.page.has_value());
  }

  SECTION("no spans") {
    t.spans.clear();
    Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, pageAroundTable());
    REQUIRE(doc.meta.precedingContext == std::string());
    REQUIRE(doc.meta.followingContext == std::string());
    REQUIRE(*doc.meta.page == 1);
  }

  SECTION("page not in result") {
    t.boundingRegions = {BoundingRegion{7}};
    Document doc = reconstructTable(t, std::nullopt, TableReconstructionOptions{}, pageAroundTable());
    REQUIRE(doc.meta.precedingContext == std::string());
    REQUIRE(doc.meta.followingContext == std::string());
  }
}

TEST_CASE("base meta is copied and tagged", "[table][meta]") {
  DocumentMeta base;
  base.extra["source"] = "report.pdf";
  Table t = table(1, 2, {cell(0, 0, "a")});

  SECTION("page added") {
    Document doc = reconstructTable(t, base, TableReconstructionOptions{}, pageAroundTable());
    REQUIRE(doc.meta.extra["source"] == "report.pdf");
    REQUIRE(*doc.meta.page == 1);
    REQUIRE_FALSE(base.precedingContext.has_value());
    REQUIRE_FALSE(base.page.has_value());
  }

  SECTION("page number disabled") {
    TableReconstructionOptions options;
    options.addPageNumber = false;
    Document doc = reconstructTable(t, base, options, pageAroundTable());
    REQUIRE_FALSE(doc.meta.page.has_value());
    REQUIRE(doc.meta.precedingContext.has_value());
  }
}
