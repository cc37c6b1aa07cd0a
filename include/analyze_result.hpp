#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Offset/length range into the document's linear text stream.
struct Span {
  int offset = 0;
  int length = 0;
};

enum class CellKind { Body, ColumnHeader, Other };

struct Cell {
  int rowIndex = 0;
  int columnIndex = 0;
  // 0 when the service reported no span.
  int rowSpan = 0;
  int columnSpan = 0;
  CellKind kind = CellKind::Body;
  std::string content;
};

struct BoundingRegion {
  int pageNumber = 0;
};

struct Table {
  int rowCount = 0;
  int columnCount = 0;
  std::vector<Cell> cells;
  std::vector<BoundingRegion> boundingRegions;
  std::vector<Span> spans;

  // Page of the first bounding region, if the table has one.
  std::optional<int> firstPageNumber() const;
  // Page of the last bounding region, if the table has one.
  std::optional<int> lastPageNumber() const;
  std::optional<Span> firstSpan() const;
};

struct Line {
  std::string content;
  std::vector<Span> spans;

  // Position of the line; empty for lines reported without spans.
  std::optional<int> offset() const;
};

struct Page {
  int pageNumber = 0;
  std::vector<Line> lines;
};

struct AnalyzeResult {
  std::vector<Page> pages;
  std::vector<Table> tables;
};

// Returns the page with the given number, or nullptr.
const Page* findPage(const std::vector<Page>& pages, int pageNumber);

// Builds the model from the service's snake_case JSON.
// Throws InvalidAnalyzeResult on missing fields or wrong types.
AnalyzeResult parseAnalyzeResult(const nlohmann::json& j);

// Reads and parses a saved analysis JSON file.
AnalyzeResult loadAnalyzeResult(const std::filesystem::path& path);

nlohmann::json analyzeResultToJson(const AnalyzeResult& result);

// Writes `raw` beside `sourcePath` with a .json suffix and returns the written path.
std::filesystem::path saveAnalyzeResultJson(const nlohmann::json& raw,
                                            const std::filesystem::path& sourcePath);
