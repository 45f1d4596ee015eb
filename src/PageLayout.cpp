#include "PageLayout.hpp"
#include "LayoutErrors.hpp"

#include <unordered_set>

namespace layout {

std::vector<std::reference_wrapper<const TextLine>> Page::lines() const {
  std::vector<std::reference_wrapper<const TextLine>> result;
  for (const auto &region : regions) {
    for (const auto &line : region.lines) {
      result.emplace_back(line);
    }
  }
  return result;
}

std::vector<std::reference_wrapper<TextLine>> Page::lines() {
  std::vector<std::reference_wrapper<TextLine>> result;
  for (auto &region : regions) {
    for (auto &line : region.lines) {
      result.emplace_back(line);
    }
  }
  return result;
}

const TextLine *Page::findLine(const std::string &lineId) const {
  for (const auto &region : regions) {
    for (const auto &line : region.lines) {
      if (line.id == lineId) {
        return &line;
      }
    }
  }
  return nullptr;
}

void validateIdentifiers(const Page &page) {
  std::unordered_set<std::string> regionIds;
  std::unordered_set<std::string> lineIds;

  for (const auto &region : page.regions) {
    if (!regionIds.insert(region.id).second) {
      throw MalformedDocument("Duplicate region id \"" + region.id +
                              "\" in page " + page.id);
    }
    for (const auto &line : region.lines) {
      if (!lineIds.insert(line.id).second) {
        throw MalformedDocument("Duplicate line id \"" + line.id +
                                "\" in page " + page.id);
      }
    }
  }
}

} // namespace layout
