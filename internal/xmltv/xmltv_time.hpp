#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace epg::xmltv {

/*
  XMLTV timestamp: "yyyyMMddHHmmss", optionally followed by whitespace and a
  "+HHMM" / "-HHMM" offset. No offset means UTC.

  Returns epoch milliseconds, or nullopt for anything malformed (short
  strings, non-digits, out of range calendar fields, bad offsets).
*/
std::optional<int64_t> ParseXmltvTime(std::string_view text);

} // namespace epg::xmltv
