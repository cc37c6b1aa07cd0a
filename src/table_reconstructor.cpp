#include "table_reconstructor.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <set>
#include <string>

namespace {

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

void eraseAll(std::string& s, const std::string& token) {
  size_t pos;
  while ((pos = s.find(token)) != std::string::npos) s.erase(pos, token.size());
}

std::string joinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out += '\n';
    out += lines[i];
  }
  return out;
}

std::string cellLabel(const Cell& cell) {
  return "cell (" + std::to_string(cell.rowIndex) + ", " + std::to_string(cell.columnIndex) + ")";
}

int effectiveSpan(int span, bool zeroSpanAsOne) {
  if (zeroSpanAsOne && span == 0) return 1;
  return span;
}

struct RebuiltGrid {
  std::vector<std::vector<std::string>> rows;
  std::string caption;
  TableReconstructionReport report;
};

RebuiltGrid buildGrid(const Table& table, const TableReconstructionOptions& options) {
  if (table.rowCount <= 0 || table.columnCount <= 0) {
    throw MalformedTableResult("table declares " + std::to_string(table.rowCount) + "x" +
                               std::to_string(table.columnCount) + " cells");
  }

  RebuiltGrid out;
  auto& grid = out.rows;
  grid.assign(table.rowCount, std::vector<std::string>(table.columnCount));
  std::set<int> extraHeaderRows;
  int rowOffset = 0;

  for (size_t idx = 0; idx < table.cells.size(); ++idx) {
    const Cell& cell = table.cells[idx];
    std::string content = stripSelectionMarks(cell.content);

    // A leading cell spanning the whole width is the caption, not a grid row.
    if (idx == 0 && cell.columnSpan == table.columnCount) {
      out.caption = content;
      out.report.captionFound = true;
      rowOffset = 1;
      grid.erase(grid.begin());
      continue;
    }

    if (cell.rowIndex < 0 || cell.columnIndex < 0 || cell.rowSpan < 0 || cell.columnSpan < 0) {
      throw MalformedTableResult(cellLabel(cell) + " has negative coordinates or spans");
    }

    const int columnSpan = effectiveSpan(cell.columnSpan, options.zeroSpanAsOne);
    const int rowSpan = effectiveSpan(cell.rowSpan, options.zeroSpanAsOne);
    if (columnSpan == 0 || rowSpan == 0) continue;

    // Every row and column of the span must exist, merged header rows included.
    const long long firstRow = static_cast<long long>(cell.rowIndex) - rowOffset;
    const long long endRow = firstRow + rowSpan;
    const long long endColumn = static_cast<long long>(cell.columnIndex) + columnSpan;
    if (endColumn > table.columnCount) {
      throw MalformedTableResult(cellLabel(cell) + " exceeds column count " +
                                 std::to_string(table.columnCount));
    }
    if (firstRow < 0 || endRow > static_cast<long long>(grid.size())) {
      throw MalformedTableResult(cellLabel(cell) + " exceeds row count " +
                                 std::to_string(table.rowCount));
    }

    const bool extraHeader = options.mergeMultipleColumnHeaders &&
                             cell.kind == CellKind::ColumnHeader &&
                             cell.rowIndex > rowOffset;

    for (int c = 0; c < columnSpan; ++c) {
      const int col = cell.columnIndex + c;
      for (int r = 0; r < rowSpan; ++r) {
        if (extraHeader) {
          grid[0][col] += "\n" + content;
          extraHeaderRows.insert(cell.rowIndex - rowOffset);
        } else {
          grid[cell.rowIndex + r - rowOffset][col] = content;
        }
      }
    }
  }

  // Descending, so earlier erases keep the remaining indices valid.
  for (auto it = extraHeaderRows.rbegin(); it != extraHeaderRows.rend(); ++it) {
    grid.erase(grid.begin() + *it);
  }
  out.report.mergedHeaderRows.assign(extraHeaderRows.begin(), extraHeaderRows.end());
  for (int& row : out.report.mergedHeaderRows) row += rowOffset;
  return out;
}

std::string precedingContext(const Table& table, const std::vector<Page>& pages,
                             const std::string& caption, int maxLines) {
  std::vector<std::string> lines;
  const std::optional<int> pageNumber = table.firstPageNumber();
  const std::optional<Span> span = table.firstSpan();
  const Page* page = pageNumber ? findPage(pages, *pageNumber) : nullptr;
  if (page && span) {
    for (const auto& line : page->lines) {
      const std::optional<int> offset = line.offset();
      if (offset && *offset < span->offset) lines.push_back(line.content);
    }
  }
  const size_t keep = std::min(lines.size(), static_cast<size_t>(std::max(maxLines, 0)));
  lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(keep));
  return trim(joinLines(lines) + "\n" + caption);
}

std::string followingContext(const Table& table, const std::vector<Page>& pages, int maxLines) {
  std::vector<std::string> lines;
  const std::optional<int> pageNumber = table.boundingRegions.size() <= 1
                                          ? table.firstPageNumber()
                                          : table.lastPageNumber();
  const std::optional<Span> span = table.firstSpan();
  const Page* page = pageNumber ? findPage(pages, *pageNumber) : nullptr;
  if (page && span) {
    // Multi-page tables still end at the first span.
    const long long tableEnd = static_cast<long long>(span->offset) + span->length;
    for (const auto& line : page->lines) {
      if (static_cast<int>(lines.size()) >= maxLines) break;
      const std::optional<int> offset = line.offset();
      if (offset && *offset > tableEnd) lines.push_back(line.content);
    }
  }
  return joinLines(lines);
}

} // namespace

std::string stripSelectionMarks(const std::string& content) {
  std::string out = content;
  eraseAll(out, ":selected:");
  eraseAll(out, ":unselected:");
  return out;
}

Document reconstructTable(const Table& table,
                          const std::optional<DocumentMeta>& baseMeta,
                          const TableReconstructionOptions& options,
                          const std::vector<Page>& pages,
                          TableReconstructionReport* report) {
  RebuiltGrid rebuilt = buildGrid(table, options);
  if (report) *report = rebuilt.report;

  DocumentMeta meta = baseMeta.value_or(DocumentMeta{});
  meta.precedingContext = precedingContext(table, pages, rebuilt.caption, options.precedingContextLen);
  meta.followingContext = followingContext(table, pages, options.followingContextLen);
  if (options.addPageNumber) {
    if (std::optional<int> page = table.firstPageNumber()) meta.page = *page;
  }

  TableGrid grid;
  if (!rebuilt.rows.empty()) {
    grid.headers = rebuilt.rows.front();
    for (size_t r = 1; r < rebuilt.rows.size(); ++r) grid.rows.push_back(std::move(rebuilt.rows[r]));
  }

  Document doc;
  doc.content = std::move(grid);
  doc.contentType = ContentType::Table;
  doc.meta = std::move(meta);
  return doc;
}
