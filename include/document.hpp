#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

struct TableGrid {
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
};

enum class ContentType { Text, Table };

const char* contentTypeName(ContentType type);

// Reserved keys are typed; anything the caller supplies lives in `extra`.
struct DocumentMeta {
  std::optional<std::string> precedingContext;
  std::optional<std::string> followingContext;
  std::optional<int> page;
  nlohmann::json extra = nlohmann::json::object();
};

DocumentMeta parseDocumentMeta(const nlohmann::json& j);
nlohmann::json documentMetaToJson(const DocumentMeta& meta);

struct Document {
  std::variant<std::string, TableGrid> content;
  ContentType contentType = ContentType::Text;
  DocumentMeta meta;
  std::string id;

  // Throw ContentTypeMismatch when the content has the other shape.
  const std::string& textContent() const;
  const TableGrid& tableContent() const;
};

// Hex SHA-256 over the fields named in idHashKeys ("content", "content_type", "meta").
// Throws std::invalid_argument for an empty list or an unknown key.
std::string computeDocumentId(const Document& doc, const std::vector<std::string>& idHashKeys);

bool isValidIdHashKey(const std::string& key);

nlohmann::json documentToJson(const Document& doc);
