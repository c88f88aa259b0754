#include "internal/ingest/content_filter.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>

namespace {

using epg::ingest::ContentFilter;

ContentFilter DefaultFilter() {
  return ContentFilter({"Adult", "XXX", "Porn"});
}

void TestAbsentTextIsSafe() {
  const auto filter = DefaultFilter();
  assert(!filter.IsUnsafe(std::nullopt));
  assert(!filter.IsUnsafe(std::string_view()));
}

void TestMatchIsCaseInsensitiveSubstring() {
  const auto filter = DefaultFilter();
  assert(filter.IsUnsafe(std::string_view("ADULT SWIM")));
  assert(filter.IsUnsafe(std::string_view("late night xxx")));
  assert(filter.IsUnsafe(std::string_view("Pornography")));
  assert(!filter.IsUnsafe(std::string_view("Evening News")));
  assert(!filter.IsUnsafe(std::string_view("Adul t")));
}

void TestAnyUnsafeChecksEveryField() {
  const auto filter = DefaultFilter();
  assert(!filter.AnyUnsafe({std::string_view("Film"), std::nullopt, std::string_view("Drama")}));
  assert(filter.AnyUnsafe({std::string_view("Film"), std::nullopt, std::string_view("Adult")}));
  assert(filter.AnyUnsafe({std::nullopt, std::string_view("contains xXx here"), std::nullopt}));
}

void TestEmptyKeywordsAreIgnored() {
  const ContentFilter filter({"", "Shopping"});
  assert(filter.Keywords().size() == 1);
  assert(!filter.IsUnsafe(std::string_view("News")));
  assert(filter.IsUnsafe(std::string_view("home shopping hour")));
}

void TestEmptyFilterAcceptsEverything() {
  const ContentFilter filter;
  assert(!filter.IsUnsafe(std::string_view("Adult")));
}

} // namespace

int main() {
  TestAbsentTextIsSafe();
  TestMatchIsCaseInsensitiveSubstring();
  TestAnyUnsafeChecksEveryField();
  TestEmptyKeywordsAreIgnored();
  TestEmptyFilterAcceptsEverything();

  std::cout << "epg_guide_unit_content_filter: pass\n";
  return 0;
}
