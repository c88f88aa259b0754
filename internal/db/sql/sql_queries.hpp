#pragma once

namespace epg::db::sql {

/*
  Canonical SQL for the schedule store.

  Written in the SQLite dialect (UPSERT needs sqlite >= 3.24).
*/

static constexpr const char* UPSERT_CHANNEL =
    "INSERT INTO epg_channels(channel_id,display_name,icon_url)"
    " VALUES(?,?,?)"
    " ON CONFLICT(channel_id) DO UPDATE SET"
    " display_name=excluded.display_name,"
    " icon_url=excluded.icon_url;";

static constexpr const char* SELECT_CHANNEL =
    "SELECT channel_id,display_name,icon_url"
    " FROM epg_channels WHERE channel_id=?;";

static constexpr const char* SELECT_CHANNELS =
    "SELECT channel_id,display_name,icon_url"
    " FROM epg_channels ORDER BY channel_id;";

static constexpr const char* DELETE_ALL_CHANNELS =
    "DELETE FROM epg_channels;";

// programs

// (channel_id,start_time) is the identity; a replaced row keeps its id.
static constexpr const char* UPSERT_PROGRAM =
    "INSERT INTO epg_programs(channel_id,title,description,start_time,end_time,category)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(channel_id,start_time) DO UPDATE SET"
    " title=excluded.title,"
    " description=excluded.description,"
    " end_time=excluded.end_time,"
    " category=excluded.category;";

// Prefix; the caller appends "(?,?,...)" sized to the channel list.
static constexpr const char* SELECT_PROGRAMS_IN_WINDOW_PREFIX =
    "SELECT id,channel_id,title,description,start_time,end_time,category"
    " FROM epg_programs"
    " WHERE end_time > ? AND start_time < ?"
    " AND channel_id IN ";

static constexpr const char* SELECT_PROGRAMS_ORDER =
    " ORDER BY start_time ASC, channel_id ASC;";

static constexpr const char* DELETE_PROGRAMS_ENDING_BEFORE =
    "DELETE FROM epg_programs WHERE end_time < ?;";

static constexpr const char* DELETE_ALL_PROGRAMS =
    "DELETE FROM epg_programs;";

static constexpr const char* COUNT_CHANNELS =
    "SELECT COUNT(*) FROM epg_channels;";

static constexpr const char* COUNT_PROGRAMS =
    "SELECT COUNT(*) FROM epg_programs;";

} // namespace epg::db::sql
