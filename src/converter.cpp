#include "converter.hpp"

#include "text_reconstructor.hpp"

#include <spdlog/sinks/null_sink.h>

#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace {

std::string joinComma(const std::vector<std::string>& items) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    out += items[i];
  }
  return out;
}

void appendCells(std::string& text, const std::vector<std::string>& row) {
  for (const auto& cell : row) {
    text += ' ';
    text += cell;
  }
}

std::string joinRows(const std::vector<int>& rows) {
  std::string out;
  for (size_t i = 0; i < rows.size(); ++i) {
    if (i > 0) out += ", ";
    out += std::to_string(rows[i]);
  }
  return out;
}

void validateIdHashKeys(const std::vector<std::string>& keys) {
  if (keys.empty()) {
    throw std::invalid_argument("id_hash_keys must not be empty");
  }
  for (const auto& key : keys) {
    if (!isValidIdHashKey(key)) {
      throw std::invalid_argument("unknown id hash key '" + key + "'");
    }
  }
}

} // namespace

ConverterOptions parseConverterOptions(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("converter options must be a JSON object");
  }
  ConverterOptions options;
  try {
    auto& table = options.table;
    table.precedingContextLen = j.value("preceding_context_len", table.precedingContextLen);
    table.followingContextLen = j.value("following_context_len", table.followingContextLen);
    table.mergeMultipleColumnHeaders = j.value("merge_multiple_column_headers", table.mergeMultipleColumnHeaders);
    table.addPageNumber = j.value("add_page_number", table.addPageNumber);
    table.zeroSpanAsOne = j.value("zero_span_as_one", table.zeroSpanAsOne);
    options.saveJson = j.value("save_json", options.saveJson);

    auto langs = j.find("valid_languages");
    if (langs != j.end() && !langs->is_null()) {
      options.validLanguages = langs->get<std::vector<std::string>>();
    }
    auto keys = j.find("id_hash_keys");
    if (keys != j.end() && !keys->is_null()) {
      options.idHashKeys = keys->get<std::vector<std::string>>();
    }
  } catch (const json::type_error& ex) {
    throw std::invalid_argument(std::string("invalid converter option: ") + ex.what());
  }
  return options;
}

void validateConverterOptions(const ConverterOptions& options) {
  if (options.table.precedingContextLen < 0) {
    throw std::invalid_argument("preceding_context_len must be >= 0");
  }
  if (options.table.followingContextLen < 0) {
    throw std::invalid_argument("following_context_len must be >= 0");
  }
  validateIdHashKeys(options.idHashKeys);
}

LayoutConverter::LayoutConverter(ConverterOptions options,
                                 std::shared_ptr<spdlog::logger> logger,
                                 std::shared_ptr<const LanguageValidator> validator)
  : options_(std::move(options)), logger_(std::move(logger)), validator_(std::move(validator)) {
  validateConverterOptions(options_);
  if (!logger_) {
    logger_ = std::make_shared<spdlog::logger>("layoutdocs", std::make_shared<spdlog::sinks::null_sink_mt>());
  }
}

std::vector<Document> LayoutConverter::convert(const AnalyzeResult& result,
                                               const std::optional<DocumentMeta>& baseMeta,
                                               const std::string& sourceName,
                                               const std::optional<std::vector<std::string>>& validLanguages,
                                               const std::optional<std::vector<std::string>>& idHashKeys) const {
  const auto& hashKeys = idHashKeys ? *idHashKeys : options_.idHashKeys;
  validateIdHashKeys(hashKeys);

  std::vector<Document> docs;
  docs.reserve(result.tables.size() + 1);

  for (size_t i = 0; i < result.tables.size(); ++i) {
    const Table& table = result.tables[i];
    TableReconstructionReport report;
    Document doc = reconstructTable(table, baseMeta, options_.table, result.pages, &report);
    const TableGrid& grid = doc.tableContent();
    logger_->debug("{}: table {} ({}x{} declared) -> {} data rows, {} columns, caption: {}, merged header rows: [{}]",
                   sourceName, i, table.rowCount, table.columnCount,
                   grid.rows.size(), grid.headers.size(),
                   report.captionFound ? "yes" : "no", joinRows(report.mergedHeaderRows));
    docs.push_back(std::move(doc));
  }
  docs.push_back(reconstructText(result, baseMeta));

  for (auto& doc : docs) doc.id = computeDocumentId(doc, hashKeys);

  const auto& languages = validLanguages ? validLanguages : options_.validLanguages;
  if (languages && !languages->empty()) checkLanguage(docs, sourceName, *languages);

  return docs;
}

std::vector<Document> LayoutConverter::convertJsonFile(const std::filesystem::path& path,
                                                       const std::optional<DocumentMeta>& baseMeta,
                                                       const std::optional<std::vector<std::string>>& validLanguages,
                                                       const std::optional<std::vector<std::string>>& idHashKeys) const {
  return convert(loadAnalyzeResult(path), baseMeta, path.string(), validLanguages, idHashKeys);
}

std::vector<Document> LayoutConverter::convertAnalysis(const json& raw,
                                                       const std::filesystem::path& sourcePath,
                                                       const std::optional<DocumentMeta>& baseMeta,
                                                       const std::optional<std::vector<std::string>>& validLanguages,
                                                       const std::optional<std::vector<std::string>>& idHashKeys) const {
  if (options_.saveJson) {
    const std::filesystem::path written = saveAnalyzeResultJson(raw, sourcePath);
    logger_->info("Saved analysis of {} to {}", sourcePath.string(), written.string());
  }
  return convert(parseAnalyzeResult(raw), baseMeta, sourcePath.string(), validLanguages, idHashKeys);
}

void LayoutConverter::checkLanguage(const std::vector<Document>& docs, const std::string& sourceName,
                                    const std::vector<std::string>& languages) const {
  if (!validator_) {
    logger_->warn("{}: valid languages [{}] given but no language validator is configured",
                  sourceName, joinComma(languages));
    return;
  }

  // The text document is always last.
  std::string text = docs.back().textContent();
  for (size_t i = 0; i + 1 < docs.size(); ++i) {
    const TableGrid& grid = docs[i].tableContent();
    appendCells(text, grid.headers);
    for (const auto& row : grid.rows) appendCells(text, row);
  }

  if (!validator_->validate(text, languages)) {
    logger_->warn("The language for {} is not one of [{}]. The file may not have been decoded "
                  "in the correct text format.", sourceName, joinComma(languages));
  }
}
