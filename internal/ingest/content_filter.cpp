#include "internal/ingest/content_filter.hpp"

#include <algorithm>
#include <cctype>

namespace epg::ingest {

namespace {

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

ContentFilter::ContentFilter(const std::vector<std::string>& keywords) {
  keywords_.reserve(keywords.size());
  for (const auto& keyword : keywords) {
    if (!keyword.empty()) {
      keywords_.push_back(ToLower(keyword));
    }
  }
}

bool ContentFilter::IsUnsafe(std::optional<std::string_view> text) const {
  if (!text || text->empty() || keywords_.empty()) {
    return false;
  }

  const std::string haystack = ToLower(*text);
  return std::any_of(keywords_.begin(), keywords_.end(),
                     [&](const std::string& keyword) { return haystack.find(keyword) != std::string::npos; });
}

bool ContentFilter::AnyUnsafe(std::initializer_list<std::optional<std::string_view>> texts) const {
  return std::any_of(texts.begin(), texts.end(), [this](const auto& text) { return IsUnsafe(text); });
}

} // namespace epg::ingest
