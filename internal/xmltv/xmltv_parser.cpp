#include "internal/xmltv/xmltv_parser.hpp"

#include <string_view>
#include <utility>

#include "internal/xmltv/xml_pull_reader.hpp"
#include "internal/xmltv/xmltv_time.hpp"

namespace epg::xmltv {

namespace {

using Event = XmlPullReader::Event;

std::string Trimmed(std::string text) {
  const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  std::size_t begin = 0;
  while (begin < text.size() && is_space(text[begin])) ++begin;
  std::size_t end = text.size();
  while (end > begin && is_space(text[end - 1])) --end;
  return text.substr(begin, end - begin);
}

std::optional<std::string> NonEmpty(std::string text) {
  if (text.empty()) return std::nullopt;
  return text;
}

// Calls `child` for every direct child element of the element the reader is
// on, returning once its end tag has been consumed. `child` must leave the
// reader on the child's end tag (or on the child itself when empty).
template <typename ChildFn>
void ForEachChild(XmlPullReader& reader, ChildFn&& child) {
  if (reader.IsEmptyElement()) return;
  const int depth = reader.Depth();
  for (;;) {
    switch (reader.Next()) {
      case Event::kStartElement:
        child(reader.Name());
        break;
      case Event::kEndElement:
        if (reader.Depth() == depth) return;
        break;
      case Event::kEndDocument:
        throw ParseError("unexpected end of document");
      default:
        break;
    }
  }
}

} // namespace

ParseStats XmltvParser::Parse(XmltvSink& sink) {
  XmlPullReader reader(stream_);
  ParseStats    stats;

  Event event = reader.Next();
  while (event != Event::kStartElement && event != Event::kEndDocument) {
    event = reader.Next();
  }
  if (event == Event::kEndDocument) {
    throw ParseError("empty document");
  }
  if (reader.Name() != "tv") {
    throw ParseError("root element is <" + std::string(reader.Name()) + ">, expected <tv>");
  }

  ForEachChild(reader, [&](std::string_view name) {
    if (name == "channel") {
      ++stats.channels_seen;
      if (auto channel = ReadChannel(reader)) {
        sink.OnChannel(std::move(*channel));
      } else {
        ++stats.channels_rejected;
      }
    } else if (name == "programme") {
      ++stats.programmes_seen;
      if (auto programme = ReadProgramme(reader)) {
        sink.OnProgramme(std::move(*programme));
      } else {
        ++stats.programmes_rejected;
      }
    } else {
      reader.Skip();
    }
  });

  // trailing comments / processing instructions after </tv>
  while (reader.Next() != Event::kEndDocument) {
  }

  return stats;
}

std::optional<ParsedChannel> XmltvParser::ReadChannel(XmlPullReader& reader) {
  ParsedChannel channel;
  auto          id = reader.Attribute("id");

  ForEachChild(reader, [&](std::string_view name) {
    if (name == "display-name" && !channel.display_name) {
      channel.display_name = NonEmpty(Trimmed(reader.ReadText()));
    } else if (name == "icon" && !channel.icon_url) {
      channel.icon_url = NonEmpty(reader.Attribute("src").value_or(""));
      reader.Skip();
    } else {
      reader.Skip();
    }
  });

  if (!id || id->empty()) return std::nullopt;
  channel.id = std::move(*id);
  return channel;
}

std::optional<ParsedProgramme> XmltvParser::ReadProgramme(XmlPullReader& reader) {
  ParsedProgramme programme;
  auto            channel_id = reader.Attribute("channel");
  const auto      start      = ParseXmltvTime(reader.Attribute("start").value_or(""));
  const auto      stop       = ParseXmltvTime(reader.Attribute("stop").value_or(""));

  bool have_title = false;
  ForEachChild(reader, [&](std::string_view name) {
    if (name == "title" && !have_title) {
      programme.title = Trimmed(reader.ReadText());
      have_title      = true;
    } else if (name == "desc" && !programme.description) {
      programme.description = NonEmpty(Trimmed(reader.ReadText()));
    } else if (name == "category" && !programme.category) {
      programme.category = NonEmpty(Trimmed(reader.ReadText()));
    } else {
      reader.Skip();
    }
  });

  if (!channel_id || channel_id->empty()) return std::nullopt;
  if (!start || !stop || *stop <= *start) return std::nullopt;

  programme.channel_id    = std::move(*channel_id);
  programme.start_time_ms = *start;
  programme.end_time_ms   = *stop;
  return programme;
}

} // namespace epg::xmltv
