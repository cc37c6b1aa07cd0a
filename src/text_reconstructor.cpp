#include "text_reconstructor.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace {

std::map<int, std::vector<Span>> tableSpansByPage(const std::vector<Table>& tables) {
  std::map<int, std::vector<Span>> byPage;
  for (const auto& table : tables) {
    const std::optional<int> page = table.firstPageNumber();
    const std::optional<Span> span = table.firstSpan();
    if (!page || !span) continue;
    byPage[*page].push_back(*span);
  }
  return byPage;
}

bool insideAnySpan(int offset, const std::vector<Span>& spans) {
  return std::any_of(spans.begin(), spans.end(), [offset](const Span& s) {
    return s.offset <= offset && offset <= static_cast<long long>(s.offset) + s.length;
  });
}

} // namespace

Document reconstructText(const AnalyzeResult& result, const std::optional<DocumentMeta>& baseMeta) {
  const std::map<int, std::vector<Span>> spansByPage = tableSpansByPage(result.tables);
  static const std::vector<Span> kNoSpans;

  std::string text;
  for (const auto& page : result.pages) {
    auto it = spansByPage.find(page.pageNumber);
    const std::vector<Span>& tableSpans = it == spansByPage.end() ? kNoSpans : it->second;
    for (const auto& line : page.lines) {
      const std::optional<int> offset = line.offset();
      if (offset && insideAnySpan(*offset, tableSpans)) continue;
      text += line.content;
      text += '\n';
    }
    text += kPageBreak;
  }

  Document doc;
  doc.content = std::move(text);
  doc.contentType = ContentType::Text;
  doc.meta = baseMeta.value_or(DocumentMeta{});
  return doc;
}
