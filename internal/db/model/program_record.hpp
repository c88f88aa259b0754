#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace epg::db::model {

/*
  One scheduled programme.

  Identity for upserts is (channel_id, start_time_ms). `id` is a surrogate
  assigned by the store and survives replacement of the same identity.
  end_time_ms > start_time_ms always holds for stored rows.
*/
struct ProgramRecord {
  uint64_t                   id = 0;
  std::string                channel_id;
  std::string                title;
  std::optional<std::string> description;
  int64_t                    start_time_ms = 0; // epoch ms
  int64_t                    end_time_ms   = 0; // epoch ms
  std::optional<std::string> category;
};

} // namespace epg::db::model
