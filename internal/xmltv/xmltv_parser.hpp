#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/feed/feed_stream.hpp"

namespace epg::xmltv {

class XmlPullReader;

struct ParsedChannel {
  std::string                id;
  std::optional<std::string> display_name;
  std::optional<std::string> icon_url;
};

struct ParsedProgramme {
  std::string                channel_id;
  std::string                title; // empty when the feed has no <title>
  std::optional<std::string> description;
  std::optional<std::string> category;
  int64_t                    start_time_ms = 0;
  int64_t                    end_time_ms   = 0;
};

// Elements dropped by the parser itself. Never fatal for a run.
struct ParseStats {
  uint64_t channels_seen       = 0;
  uint64_t programmes_seen     = 0;
  uint64_t channels_rejected   = 0; // missing id
  uint64_t programmes_rejected = 0; // missing channel, bad start/stop, stop <= start
};

class XmltvSink {
 public:
  virtual ~XmltvSink() = default;

  virtual void OnChannel(ParsedChannel channel)       = 0;
  virtual void OnProgramme(ParsedProgramme programme) = 0;
};

/*
  Streaming XMLTV reader.

  Walks the children of <tv> one element at a time and hands every well
  formed <channel> and <programme> to the sink as soon as it closes. Unknown
  elements, at any level, are skipped with their whole subtree. Malformed XML
  raises ParseError; stream failures propagate unchanged.
*/
class XmltvParser {
 public:
  explicit XmltvParser(feed::FeedStream& stream) : stream_(stream) {
  }

  ParseStats Parse(XmltvSink& sink);

 private:
  std::optional<ParsedChannel>   ReadChannel(XmlPullReader& reader);
  std::optional<ParsedProgramme> ReadProgramme(XmlPullReader& reader);

  feed::FeedStream& stream_;
};

} // namespace epg::xmltv
