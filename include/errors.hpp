#pragma once

#include <stdexcept>
#include <string>

// Cell coordinates or spans do not fit the table's declared row/column counts.
class MalformedTableResult : public std::runtime_error {
public:
  explicit MalformedTableResult(const std::string& what) : std::runtime_error(what) {}
};

// Grid content was requested from a text document, or text from a table.
class ContentTypeMismatch : public std::runtime_error {
public:
  explicit ContentTypeMismatch(const std::string& what) : std::runtime_error(what) {}
};

// The analysis JSON is unreadable or does not follow the expected schema.
class InvalidAnalyzeResult : public std::runtime_error {
public:
  explicit InvalidAnalyzeResult(const std::string& what) : std::runtime_error(what) {}
};
