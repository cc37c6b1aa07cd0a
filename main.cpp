#include "converter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

nlohmann::json readJsonFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("cannot open " + path);
  return nlohmann::json::parse(ifs);
}

std::vector<std::string> splitComma(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find(',', start);
    if (end == std::string::npos) end = s.size();
    if (end > start) out.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

bool takeValue(const std::string& arg, const std::string& flag, std::string& value) {
  if (arg.rfind(flag, 0) != 0) return false;
  value = arg.substr(flag.size());
  return true;
}

void printUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " [--config=file] [--meta=file] [--preceding=N] [--following=N]\n"
            << "       [--no-merge-headers] [--no-page-number] [--zero-span-as-one] [--id-keys=a,b]\n"
            << "       [--source=file [--save-json]] [--verbose] <analyze_result.json>\n";
}

} // namespace

int main(int argc, char** argv)
{
  auto logger = spdlog::stderr_color_mt("layoutdocs");
  try {
    std::string inputPath;
    std::string configPath;
    std::string metaPath;
    std::string sourcePath;
    nlohmann::json overrides = nlohmann::json::object();
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      std::string value;
      if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg == "--no-merge-headers") {
        overrides["merge_multiple_column_headers"] = false;
      } else if (arg == "--no-page-number") {
        overrides["add_page_number"] = false;
      } else if (arg == "--save-json") {
        overrides["save_json"] = true;
      } else if (arg == "--zero-span-as-one") {
        overrides["zero_span_as_one"] = true;
      } else if (takeValue(arg, "--config=", value)) {
        configPath = value;
      } else if (takeValue(arg, "--source=", value)) {
        sourcePath = value;
      } else if (takeValue(arg, "--meta=", value)) {
        metaPath = value;
      } else if (takeValue(arg, "--preceding=", value)) {
        overrides["preceding_context_len"] = std::stoi(value);
      } else if (takeValue(arg, "--following=", value)) {
        overrides["following_context_len"] = std::stoi(value);
      } else if (takeValue(arg, "--id-keys=", value)) {
        overrides["id_hash_keys"] = splitComma(value);
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else if (inputPath.empty()) {
        inputPath = arg;
      }
    }

    if (inputPath.empty() || !std::filesystem::exists(inputPath)) {
      std::cerr << "Analyze result not found: " << inputPath << "\n";
      printUsage(argv[0]);
      return 2;
    }

    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    nlohmann::json config = configPath.empty() ? nlohmann::json::object() : readJsonFile(configPath);
    if (!config.is_object()) throw std::invalid_argument("config must be a JSON object");
    config.update(overrides);
    ConverterOptions options = parseConverterOptions(config);
    if (options.saveJson && sourcePath.empty()) {
      logger->warn("--save-json has no effect without --source");
    }

    std::optional<DocumentMeta> meta;
    if (!metaPath.empty()) meta = parseDocumentMeta(readJsonFile(metaPath));

    LayoutConverter converter(std::move(options), logger);
    // With a source file the analysis is attributed to it and may be saved beside it.
    std::vector<Document> docs = sourcePath.empty()
                                   ? converter.convertJsonFile(inputPath, meta)
                                   : converter.convertAnalysis(readJsonFile(inputPath), sourcePath, meta);

    nlohmann::json out = nlohmann::json::array();
    for (const auto& doc : docs) out.push_back(documentToJson(doc));
    std::cout << out.dump(2) << "\n";
    logger->info("Converted '{}' into {} document(s)", inputPath, docs.size());
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
