#pragma once

#include <string>
#include <vector>

// Checks whether text is written in one of the given ISO 639-1 languages.
class LanguageValidator {
public:
  virtual ~LanguageValidator() = default;
  virtual bool validate(const std::string& text, const std::vector<std::string>& languages) const = 0;
};
