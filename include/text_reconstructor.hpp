#pragma once

#include "analyze_result.hpp"
#include "document.hpp"

#include <optional>

// Form feed appended after every page.
constexpr char kPageBreak = '\f';

// Concatenates every line that is not inside a table, one per row, with a page
// break after each page. A line is inside a table when its offset falls within
// the first span of a table starting on the same page.
Document reconstructText(const AnalyzeResult& result, const std::optional<DocumentMeta>& baseMeta);
