#include "analyze_result.hpp"

#include "errors.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

using nlohmann::json;

namespace {

// Optional arrays may be absent or explicitly null in the service output.
const json* optionalArray(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  if (!it->is_array()) {
    throw InvalidAnalyzeResult(std::string("field '") + key + "' must be an array");
  }
  return &*it;
}

int optionalInt(const json& j, const char* key, int fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return fallback;
  return it->get<int>();
}

CellKind parseKind(const json& cell) {
  auto it = cell.find("kind");
  if (it == cell.end() || it->is_null()) return CellKind::Body;
  std::string kind = it->get<std::string>();
  if (kind == "columnHeader") return CellKind::ColumnHeader;
  if (kind == "content" || kind == "body") return CellKind::Body;
  return CellKind::Other;
}

const char* kindName(CellKind kind) {
  switch (kind) {
    case CellKind::ColumnHeader: return "columnHeader";
    case CellKind::Other: return "other";
    case CellKind::Body: break;
  }
  return "content";
}

// Offsets and lengths index the text stream, so they must fit a non-negative int.
int spanField(const json& span, const char* key) {
  const long long value = span.at(key).get<long long>();
  if (value < 0 || value > std::numeric_limits<int>::max()) {
    throw InvalidAnalyzeResult(std::string("span ") + key + " out of range: " + std::to_string(value));
  }
  return static_cast<int>(value);
}

std::vector<Span> parseSpans(const json& j) {
  std::vector<Span> spans;
  if (const json* arr = optionalArray(j, "spans")) {
    for (const auto& s : *arr) {
      spans.push_back(Span{spanField(s, "offset"), spanField(s, "length")});
    }
  }
  return spans;
}

json spansToJson(const std::vector<Span>& spans) {
  json arr = json::array();
  for (const auto& s : spans) arr.push_back({{"offset", s.offset}, {"length", s.length}});
  return arr;
}

Page parsePage(const json& j) {
  Page page;
  page.pageNumber = j.at("page_number").get<int>();
  if (const json* lines = optionalArray(j, "lines")) {
    for (const auto& l : *lines) {
      Line line;
      line.content = l.at("content").get<std::string>();
      line.spans = parseSpans(l);
      page.lines.push_back(std::move(line));
    }
  }
  return page;
}

Table parseTable(const json& j) {
  Table table;
  table.rowCount = j.at("row_count").get<int>();
  table.columnCount = j.at("column_count").get<int>();
  if (const json* cells = optionalArray(j, "cells")) {
    for (const auto& c : *cells) {
      Cell cell;
      cell.rowIndex = c.at("row_index").get<int>();
      cell.columnIndex = c.at("column_index").get<int>();
      cell.rowSpan = optionalInt(c, "row_span", 0);
      cell.columnSpan = optionalInt(c, "column_span", 0);
      cell.kind = parseKind(c);
      cell.content = c.at("content").get<std::string>();
      table.cells.push_back(std::move(cell));
    }
  }
  if (const json* regions = optionalArray(j, "bounding_regions")) {
    for (const auto& r : *regions) {
      table.boundingRegions.push_back(BoundingRegion{r.at("page_number").get<int>()});
    }
  }
  table.spans = parseSpans(j);
  return table;
}

} // namespace

std::optional<int> Table::firstPageNumber() const {
  if (boundingRegions.empty()) return std::nullopt;
  return boundingRegions.front().pageNumber;
}

std::optional<int> Table::lastPageNumber() const {
  if (boundingRegions.empty()) return std::nullopt;
  return boundingRegions.back().pageNumber;
}

std::optional<Span> Table::firstSpan() const {
  if (spans.empty()) return std::nullopt;
  return spans.front();
}

std::optional<int> Line::offset() const {
  if (spans.empty()) return std::nullopt;
  return spans.front().offset;
}

const Page* findPage(const std::vector<Page>& pages, int pageNumber) {
  for (const auto& page : pages) {
    if (page.pageNumber == pageNumber) return &page;
  }
  return nullptr;
}

AnalyzeResult parseAnalyzeResult(const json& j) {
  if (!j.is_object()) {
    throw InvalidAnalyzeResult("analyze result must be a JSON object");
  }
  AnalyzeResult result;
  try {
    if (const json* pages = optionalArray(j, "pages")) {
      for (const auto& p : *pages) result.pages.push_back(parsePage(p));
    }
    if (const json* tables = optionalArray(j, "tables")) {
      for (const auto& t : *tables) result.tables.push_back(parseTable(t));
    }
  } catch (const json::exception& ex) {
    throw InvalidAnalyzeResult(std::string("malformed analyze result: ") + ex.what());
  }
  return result;
}

AnalyzeResult loadAnalyzeResult(const std::filesystem::path& path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw InvalidAnalyzeResult("cannot open analyze result: " + path.string());
  }
  json j;
  try {
    j = json::parse(ifs);
  } catch (const json::parse_error& ex) {
    throw InvalidAnalyzeResult("invalid JSON in " + path.string() + ": " + ex.what());
  }
  return parseAnalyzeResult(j);
}

json analyzeResultToJson(const AnalyzeResult& result) {
  json pages = json::array();
  for (const auto& page : result.pages) {
    json lines = json::array();
    for (const auto& line : page.lines) {
      lines.push_back({{"content", line.content}, {"spans", spansToJson(line.spans)}});
    }
    pages.push_back({{"page_number", page.pageNumber}, {"lines", lines}});
  }

  json tables = json::array();
  for (const auto& table : result.tables) {
    json cells = json::array();
    for (const auto& cell : table.cells) {
      cells.push_back({
        {"row_index", cell.rowIndex},
        {"column_index", cell.columnIndex},
        {"row_span", cell.rowSpan},
        {"column_span", cell.columnSpan},
        {"kind", kindName(cell.kind)},
        {"content", cell.content},
      });
    }
    json regions = json::array();
    for (const auto& region : table.boundingRegions) {
      regions.push_back({{"page_number", region.pageNumber}});
    }
    tables.push_back({
      {"row_count", table.rowCount},
      {"column_count", table.columnCount},
      {"cells", cells},
      {"bounding_regions", regions},
      {"spans", spansToJson(table.spans)},
    });
  }

  return {{"pages", pages}, {"tables", tables}};
}

std::filesystem::path saveAnalyzeResultJson(const json& raw, const std::filesystem::path& sourcePath) {
  if (sourcePath.extension() == ".json") {
    throw std::invalid_argument("refusing to overwrite JSON source " + sourcePath.string());
  }
  std::filesystem::path out = sourcePath;
  out.replace_extension(".json");
  std::ofstream ofs(out);
  if (!ofs) {
    throw std::runtime_error("cannot write " + out.string());
  }
  ofs << raw.dump(2) << "\n";
  return out;
}
