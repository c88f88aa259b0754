#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <libxml/xmlreader.h>

#include "internal/feed/feed_stream.hpp"

namespace epg::xmltv {

// Malformed document. Terminal for the run that hit it.
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Pull-style XML reader on top of libxml2's xmlTextReader.

  Consumes a FeedStream incrementally; only the current node is held in
  memory. Element names are local names, so namespace prefixes are ignored.
  Errors raised by the stream itself (util::Unavailable) are rethrown
  unchanged from Next() so transport failures stay distinguishable from
  parse failures.
*/
class XmlPullReader {
 public:
  enum class Event { kStartElement, kEndElement, kText, kEndDocument, kOther };

  explicit XmlPullReader(feed::FeedStream& stream);
  ~XmlPullReader();

  XmlPullReader(const XmlPullReader&)            = delete;
  XmlPullReader& operator=(const XmlPullReader&) = delete;

  Event Next();

  Event Current() const {
    return event_;
  }

  // Local name of the current element (empty for non-element nodes).
  std::string_view Name() const;

  int Depth() const;

  // <icon src="..."/> style elements produce no kEndElement.
  bool IsEmptyElement() const;

  std::optional<std::string> Attribute(const char* name) const;

  // Text and CDATA content of the current element, including nested
  // elements. Leaves the reader on the element's end tag.
  std::string ReadText();

  // Advances past the current element and all of its descendants.
  void Skip();

  int LineNumber() const;

 private:
  static int XMLCALL  ReadCallback(void* context, char* buffer, int length);
  static int XMLCALL  CloseCallback(void* context);
  static void XMLCALL ErrorCallback(void* arg, const char* msg, xmlParserSeverities severity, xmlTextReaderLocatorPtr locator);

  void RequireStartElement(const char* operation) const;

  feed::FeedStream&  stream_;
  xmlTextReaderPtr   reader_ = nullptr;
  Event              event_  = Event::kOther;
  std::exception_ptr stream_error_;
  std::string        first_error_;
};

} // namespace epg::xmltv
