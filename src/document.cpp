#include "document.hpp"

#include "errors.hpp"

#include <openssl/evp.h>

#include <cstdio>
#include <stdexcept>

using nlohmann::json;

namespace {

json gridToJson(const TableGrid& grid) {
  json rows = json::array();
  if (!grid.headers.empty() || !grid.rows.empty()) rows.push_back(grid.headers);
  for (const auto& r : grid.rows) rows.push_back(r);
  return rows;
}

std::string serializeContent(const Document& doc) {
  if (doc.contentType == ContentType::Table) return gridToJson(doc.tableContent()).dump();
  return doc.textContent();
}

std::string sha256Hex(const std::string& input) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  std::string hex;
  hex.reserve(digestLen * 2);
  char buf[3];
  for (unsigned int i = 0; i < digestLen; ++i) {
    std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
    hex += buf;
  }
  return hex;
}

} // namespace

const char* contentTypeName(ContentType type) {
  return type == ContentType::Table ? "table" : "text";
}

const std::string& Document::textContent() const {
  if (const auto* text = std::get_if<std::string>(&content)) return *text;
  throw ContentTypeMismatch("document content is a table, expected text");
}

const TableGrid& Document::tableContent() const {
  if (const auto* grid = std::get_if<TableGrid>(&content)) return *grid;
  throw ContentTypeMismatch("document content is text, expected a table");
}

DocumentMeta parseDocumentMeta(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("document meta must be a JSON object");
  }
  DocumentMeta meta;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    if (key == "preceding_context" || key == "following_context") {
      if (!it->is_string()) throw std::invalid_argument("meta '" + key + "' must be a string");
      auto& field = key == "preceding_context" ? meta.precedingContext : meta.followingContext;
      field = it->get<std::string>();
    } else if (key == "page") {
      if (!it->is_number_integer()) throw std::invalid_argument("meta 'page' must be an integer");
      meta.page = it->get<int>();
    } else {
      meta.extra[key] = *it;
    }
  }
  return meta;
}

json documentMetaToJson(const DocumentMeta& meta) {
  json j = meta.extra.is_object() ? meta.extra : json::object();
  if (meta.precedingContext) j["preceding_context"] = *meta.precedingContext;
  if (meta.followingContext) j["following_context"] = *meta.followingContext;
  if (meta.page) j["page"] = *meta.page;
  return j;
}

bool isValidIdHashKey(const std::string& key) {
  return key == "content" || key == "content_type" || key == "meta";
}

std::string computeDocumentId(const Document& doc, const std::vector<std::string>& idHashKeys) {
  if (idHashKeys.empty()) {
    throw std::invalid_argument("id_hash_keys must not be empty");
  }
  std::string key;
  for (const auto& field : idHashKeys) {
    if (field == "content") {
      key += serializeContent(doc);
    } else if (field == "content_type") {
      key += contentTypeName(doc.contentType);
    } else if (field == "meta") {
      // json objects keep their keys sorted, so the dump is stable.
      key += documentMetaToJson(doc.meta).dump();
    } else {
      throw std::invalid_argument("unknown id hash key '" + field + "'");
    }
    key += '\x1e';
  }
  return sha256Hex(key);
}

json documentToJson(const Document& doc) {
  json content;
  if (doc.contentType == ContentType::Table) {
    const TableGrid& grid = doc.tableContent();
    content = {{"headers", grid.headers}, {"rows", grid.rows}};
  } else {
    content = doc.textContent();
  }
  return {
    {"id", doc.id},
    {"content_type", contentTypeName(doc.contentType)},
    {"content", content},
    {"meta", documentMetaToJson(doc.meta)},
  };
}
