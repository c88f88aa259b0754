#pragma once

#include <optional>
#include <string>

namespace epg::db::model {

/*
  Guide channel as announced by the feed.

  Replaced wholesale on every sync, never partially updated.
*/
struct ChannelRecord {
  std::string                channel_id; // feed-assigned, stable across syncs
  std::optional<std::string> display_name;
  std::optional<std::string> icon_url;
};

} // namespace epg::db::model
