#include "internal/xmltv/xmltv_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/xmltv/xml_pull_reader.hpp"
#include "tests/unit/support/string_feed.hpp"

namespace {

using epg::testing::StringFeedStream;
using epg::xmltv::ParsedChannel;
using epg::xmltv::ParsedProgramme;
using epg::xmltv::ParseStats;
using epg::xmltv::XmltvParser;

class CollectingSink : public epg::xmltv::XmltvSink {
 public:
  void OnChannel(ParsedChannel channel) override {
    channels.push_back(std::move(channel));
  }

  void OnProgramme(ParsedProgramme programme) override {
    programmes.push_back(std::move(programme));
  }

  std::vector<ParsedChannel>   channels;
  std::vector<ParsedProgramme> programmes;
};

ParseStats ParseString(const std::string& xml, CollectingSink& sink) {
  StringFeedStream stream(xml, 31);
  XmltvParser      parser(stream);
  return parser.Parse(sink);
}

template <typename Exception>
bool ParseThrows(const std::string& xml) {
  CollectingSink sink;
  try {
    (void)ParseString(xml, sink);
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestChannelsAndProgrammes() {
  const std::string xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE tv SYSTEM "xmltv.dtd">
<tv generator-info-name="provider">
  <channel id="bbc1.uk">
    <display-name lang="en">BBC One</display-name>
    <display-name>BBC1</display-name>
    <icon src="http://img.example/bbc1.png"/>
    <icon src="http://img.example/other.png"/>
    <url>http://bbc.co.uk</url>
  </channel>
  <programme start="20240115100000 +0000" stop="20240115110000 +0000" channel="bbc1.uk">
    <title lang="en">  Morning News  </title>
    <title lang="fr">Nouvelles</title>
    <desc><![CDATA[Headlines & weather]]></desc>
    <credits><presenter>Someone</presenter></credits>
    <category>News</category>
    <category>Current affairs</category>
    <episode-num system="xmltv_ns">1.2.</episode-num>
  </programme>
</tv>)";

  CollectingSink sink;
  const auto     stats = ParseString(xml, sink);

  assert(stats.channels_seen == 1);
  assert(stats.programmes_seen == 1);
  assert(stats.channels_rejected == 0);
  assert(stats.programmes_rejected == 0);

  assert(sink.channels.size() == 1);
  assert(sink.channels[0].id == "bbc1.uk");
  assert(sink.channels[0].display_name == "BBC One");
  assert(sink.channels[0].icon_url == "http://img.example/bbc1.png");

  assert(sink.programmes.size() == 1);
  const auto& p = sink.programmes[0];
  assert(p.channel_id == "bbc1.uk");
  assert(p.title == "Morning News");
  assert(p.description == "Headlines & weather");
  assert(p.category == "News");
  assert(p.start_time_ms == 1705312800000);
  assert(p.end_time_ms == 1705316400000);
}

void TestUnknownTopLevelElementsAreSkipped() {
  const std::string xml = R"(<tv>
  <extension><channel id="nested"><display-name>Hidden</display-name></channel></extension>
  <channel id="a"><display-name>A</display-name></channel>
  <empty/>
</tv>)";

  CollectingSink sink;
  const auto     stats = ParseString(xml, sink);
  assert(stats.channels_seen == 1);
  assert(sink.channels.size() == 1);
  assert(sink.channels[0].id == "a");
}

void TestNamespacePrefixesAreIgnored() {
  const std::string xml = R"(<x:tv xmlns:x="urn:xmltv">
  <x:channel id="a"><x:display-name>A</x:display-name></x:channel>
</x:tv>)";

  CollectingSink sink;
  (void)ParseString(xml, sink);
  assert(sink.channels.size() == 1);
  assert(sink.channels[0].display_name == "A");
}

void TestMalformedRecordsAreDroppedNotFatal() {
  const std::string xml = R"(<tv>
  <channel><display-name>No id</display-name></channel>
  <channel id="ok"/>
  <programme start="20240115100000" stop="20240115110000"><title>No channel</title></programme>
  <programme channel="ok" start="garbage" stop="20240115110000"><title>Bad start</title></programme>
  <programme channel="ok" start="20240115100000"><title>No stop</title></programme>
  <programme channel="ok" start="20240115110000" stop="20240115100000"><title>Backwards</title></programme>
  <programme channel="ok" start="20240115110000" stop="20240115110000"><title>Zero</title></programme>
  <programme channel="ok" start="20240115100000" stop="20240115110000"/>
</tv>)";

  CollectingSink sink;
  const auto     stats = ParseString(xml, sink);
  assert(stats.channels_seen == 2);
  assert(stats.channels_rejected == 1);
  assert(stats.programmes_seen == 6);
  assert(stats.programmes_rejected == 5);

  assert(sink.channels.size() == 1);
  assert(!sink.channels[0].display_name.has_value());
  assert(sink.programmes.size() == 1);
  assert(sink.programmes[0].title.empty());
  assert(!sink.programmes[0].description.has_value());
}

void TestMalformedXmlIsParseError() {
  assert(ParseThrows<epg::xmltv::ParseError>("<tv><channel id=\"a\"></tv>"));
  assert(ParseThrows<epg::xmltv::ParseError>("<tv><channel id=\"a\">"));
  assert(ParseThrows<epg::xmltv::ParseError>("not xml at all"));
  assert(ParseThrows<epg::xmltv::ParseError>(""));
  assert(ParseThrows<epg::xmltv::ParseError>("<html><body>Service unavailable</body></html>"));
}

void TestStreamFailureIsNotAParseError() {
  std::string xml = "<tv>";
  for (int i = 0; i < 200; ++i) {
    xml += "<channel id=\"c" + std::to_string(i) + "\"><display-name>C</display-name></channel>";
  }
  xml += "</tv>";

  StringFeedStream stream(xml, 64, 1000);
  XmltvParser      parser(stream);
  CollectingSink   sink;

  bool unavailable = false;
  try {
    (void)parser.Parse(sink);
  } catch (const epg::util::Unavailable&) {
    unavailable = true;
  }
  assert(unavailable);
}

} // namespace

int main() {
  TestChannelsAndProgrammes();
  TestUnknownTopLevelElementsAreSkipped();
  TestNamespacePrefixesAreIgnored();
  TestMalformedRecordsAreDroppedNotFatal();
  TestMalformedXmlIsParseError();
  TestStreamFailureIsNotAParseError();

  std::cout << "epg_guide_unit_xmltv_parser: pass\n";
  return 0;
}
