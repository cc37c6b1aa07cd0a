#pragma once

#include "analyze_result.hpp"
#include "document.hpp"

#include <optional>
#include <vector>

struct TableReconstructionOptions {
  int precedingContextLen = 3;
  int followingContextLen = 3;
  bool mergeMultipleColumnHeaders = true;
  bool addPageNumber = true;
  // A reported span of 0 normally places nothing; when set it places one cell.
  bool zeroSpanAsOne = false;
};

// What reconstruction did with the cell list, for diagnostics.
struct TableReconstructionReport {
  bool captionFound = false;
  // Source row indices of header rows merged into the first row.
  std::vector<int> mergedHeaderRows;
};

// Rebuilds a rectangular grid from the table's flat cell list, splitting off a
// caption cell and merging stacked column header rows into the first row.
// Context lines around the table are taken from `pages` and stored in the meta.
// Throws MalformedTableResult if a cell falls outside the declared bounds.
Document reconstructTable(const Table& table,
                          const std::optional<DocumentMeta>& baseMeta,
                          const TableReconstructionOptions& options,
                          const std::vector<Page>& pages,
                          TableReconstructionReport* report = nullptr);

// Removes ":selected:" / ":unselected:" checkbox markers.
std::string stripSelectionMarks(const std::string& content);
