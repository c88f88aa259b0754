#include "internal/xmltv/xmltv_time.hpp"

#include <chrono>

namespace epg::xmltv {

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Parses exactly `count` digits at `pos`.
std::optional<int> Digits(std::string_view text, std::size_t pos, std::size_t count) {
  if (pos + count > text.size()) return std::nullopt;
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!IsDigit(text[i])) return std::nullopt;
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && IsSpace(text.front())) text.remove_prefix(1);
  while (!text.empty() && IsSpace(text.back())) text.remove_suffix(1);
  return text;
}

} // namespace

std::optional<int64_t> ParseXmltvTime(std::string_view text) {
  using namespace std::chrono;

  text = Trim(text);
  if (text.size() < 14) return std::nullopt;

  const auto year   = Digits(text, 0, 4);
  const auto month  = Digits(text, 4, 2);
  const auto day    = Digits(text, 6, 2);
  const auto hour   = Digits(text, 8, 2);
  const auto minute = Digits(text, 10, 2);
  const auto second = Digits(text, 12, 2);
  if (!year || !month || !day || !hour || !minute || !second) return std::nullopt;
  if (*hour > 23 || *minute > 59 || *second > 60) return std::nullopt;

  const year_month_day ymd{std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
                           std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) return std::nullopt;

  int offset_minutes = 0;
  std::string_view rest = Trim(text.substr(14));
  if (!rest.empty()) {
    if (rest.size() != 5 || (rest[0] != '+' && rest[0] != '-')) return std::nullopt;
    const auto off_h = Digits(rest, 1, 2);
    const auto off_m = Digits(rest, 3, 2);
    if (!off_h || !off_m || *off_m > 59) return std::nullopt;
    offset_minutes = *off_h * 60 + *off_m;
    if (rest[0] == '-') offset_minutes = -offset_minutes;
  }

  const sys_seconds local = sys_days{ymd} + hours{*hour} + minutes{*minute} + seconds{*second};
  const sys_seconds utc   = local - minutes{offset_minutes};
  return duration_cast<milliseconds>(utc.time_since_epoch()).count();
}

} // namespace epg::xmltv
