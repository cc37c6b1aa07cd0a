#pragma once

#include "analyze_result.hpp"
#include "document.hpp"
#include "language_validator.hpp"
#include "table_reconstructor.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ConverterOptions {
  TableReconstructionOptions table;
  std::optional<std::vector<std::string>> validLanguages;
  std::vector<std::string> idHashKeys{"content"};
  // Write the raw analysis beside its source file in convertAnalysis.
  bool saveJson = false;
};

// Reads preceding_context_len, following_context_len, merge_multiple_column_headers,
// add_page_number, zero_span_as_one, valid_languages, id_hash_keys and save_json on top of
// the defaults. Other keys are ignored.
ConverterOptions parseConverterOptions(const nlohmann::json& j);

// Throws std::invalid_argument for negative context lengths or bad id hash keys.
void validateConverterOptions(const ConverterOptions& options);

// Turns one analysis result into table documents followed by a single text document.
class LayoutConverter {
public:
  explicit LayoutConverter(ConverterOptions options,
                           std::shared_ptr<spdlog::logger> logger = nullptr,
                           std::shared_ptr<const LanguageValidator> validator = nullptr);

  // `sourceName` is only used in log messages. `validLanguages` and
  // `idHashKeys` override the configured values for this call.
  std::vector<Document> convert(const AnalyzeResult& result,
                                const std::optional<DocumentMeta>& baseMeta = std::nullopt,
                                const std::string& sourceName = "<memory>",
                                const std::optional<std::vector<std::string>>& validLanguages = std::nullopt,
                                const std::optional<std::vector<std::string>>& idHashKeys = std::nullopt) const;

  std::vector<Document> convertJsonFile(const std::filesystem::path& path,
                                        const std::optional<DocumentMeta>& baseMeta = std::nullopt,
                                        const std::optional<std::vector<std::string>>& validLanguages = std::nullopt,
                                        const std::optional<std::vector<std::string>>& idHashKeys = std::nullopt) const;

  // Converts the raw analysis of `sourcePath`. With saveJson set, the raw JSON is
  // first written beside the source with a .json suffix.
  std::vector<Document> convertAnalysis(const nlohmann::json& raw,
                                        const std::filesystem::path& sourcePath,
                                        const std::optional<DocumentMeta>& baseMeta = std::nullopt,
                                        const std::optional<std::vector<std::string>>& validLanguages = std::nullopt,
                                        const std::optional<std::vector<std::string>>& idHashKeys = std::nullopt) const;

  const ConverterOptions& options() const { return options_; }

private:
  void checkLanguage(const std::vector<Document>& docs, const std::string& sourceName,
                     const std::vector<std::string>& languages) const;

  ConverterOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<const LanguageValidator> validator_;
};
