#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epg::ingest {

/*
  Content-safety denylist.

  A text is unsafe when any keyword occurs in it as a substring, compared
  case-insensitively (ASCII folding). Absent text is never unsafe.
*/
class ContentFilter {
 public:
  ContentFilter() = default;
  explicit ContentFilter(const std::vector<std::string>& keywords);

  bool IsUnsafe(std::optional<std::string_view> text) const;

  bool AnyUnsafe(std::initializer_list<std::optional<std::string_view>> texts) const;

  const std::vector<std::string>& Keywords() const {
    return keywords_;
  }

 private:
  std::vector<std::string> keywords_; // lower-cased, non-empty
};

} // namespace epg::ingest
