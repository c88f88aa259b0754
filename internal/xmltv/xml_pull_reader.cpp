#include "internal/xmltv/xml_pull_reader.hpp"

#include <libxml/parser.h>

namespace epg::xmltv {

namespace {

// No network access for DTDs and no entity substitution.
constexpr int kReaderOptions = XML_PARSE_NONET | XML_PARSE_HUGE | XML_PARSE_NOWARNING;

} // namespace

XmlPullReader::XmlPullReader(feed::FeedStream& stream) : stream_(stream) {
  reader_ = xmlReaderForIO(&XmlPullReader::ReadCallback, &XmlPullReader::CloseCallback, this, nullptr, nullptr, kReaderOptions);
  if (reader_ == nullptr) {
    throw ParseError("xmlReaderForIO failed");
  }
  xmlTextReaderSetErrorHandler(reader_, &XmlPullReader::ErrorCallback, this);
}

XmlPullReader::~XmlPullReader() {
  if (reader_) xmlFreeTextReader(reader_);
}

int XMLCALL XmlPullReader::ReadCallback(void* context, char* buffer, int length) {
  auto* self = static_cast<XmlPullReader*>(context);
  try {
    return static_cast<int>(self->stream_.Read(buffer, static_cast<std::size_t>(length)));
  } catch (...) {
    // C frames cannot carry exceptions; Next() rethrows it
    self->stream_error_ = std::current_exception();
    return -1;
  }
}

int XMLCALL XmlPullReader::CloseCallback(void*) {
  return 0;
}

void XMLCALL XmlPullReader::ErrorCallback(void* arg, const char* msg, xmlParserSeverities severity, xmlTextReaderLocatorPtr locator) {
  auto* self = static_cast<XmlPullReader*>(arg);
  if (severity == XML_PARSER_SEVERITY_WARNING || severity == XML_PARSER_SEVERITY_VALIDITY_WARNING) {
    return;
  }
  if (self->first_error_.empty() && msg != nullptr) {
    self->first_error_ = "line " + std::to_string(xmlTextReaderLocatorLineNumber(locator)) + ": " + msg;
    while (!self->first_error_.empty() && (self->first_error_.back() == '\n' || self->first_error_.back() == '\r')) {
      self->first_error_.pop_back();
    }
  }
}

XmlPullReader::Event XmlPullReader::Next() {
  const int rc = xmlTextReaderRead(reader_);
  if (rc <= 0 && stream_error_) {
    std::rethrow_exception(stream_error_);
  }
  if (rc == 0) {
    event_ = Event::kEndDocument;
    return event_;
  }
  if (rc < 0) {
    throw ParseError(first_error_.empty() ? "malformed XML" : first_error_);
  }

  switch (xmlTextReaderNodeType(reader_)) {
    case XML_READER_TYPE_ELEMENT:
      event_ = Event::kStartElement;
      break;
    case XML_READER_TYPE_END_ELEMENT:
      event_ = Event::kEndElement;
      break;
    case XML_READER_TYPE_TEXT:
    case XML_READER_TYPE_CDATA:
      event_ = Event::kText;
      break;
    default:
      event_ = Event::kOther;
      break;
  }
  return event_;
}

std::string_view XmlPullReader::Name() const {
  if (event_ != Event::kStartElement && event_ != Event::kEndElement) {
    return {};
  }
  const xmlChar* name = xmlTextReaderConstLocalName(reader_);
  return name ? std::string_view(reinterpret_cast<const char*>(name)) : std::string_view();
}

int XmlPullReader::Depth() const {
  return xmlTextReaderDepth(reader_);
}

bool XmlPullReader::IsEmptyElement() const {
  return event_ == Event::kStartElement && xmlTextReaderIsEmptyElement(reader_) == 1;
}

std::optional<std::string> XmlPullReader::Attribute(const char* name) const {
  xmlChar* value = xmlTextReaderGetAttribute(reader_, reinterpret_cast<const xmlChar*>(name));
  if (value == nullptr) {
    return std::nullopt;
  }
  std::string out(reinterpret_cast<const char*>(value));
  xmlFree(value);
  return out;
}

int XmlPullReader::LineNumber() const {
  return xmlTextReaderGetParserLineNumber(reader_);
}

void XmlPullReader::RequireStartElement(const char* operation) const {
  if (event_ != Event::kStartElement) {
    throw std::logic_error(std::string(operation) + " requires the reader to be on a start element");
  }
}

std::string XmlPullReader::ReadText() {
  RequireStartElement("ReadText");
  std::string text;
  if (IsEmptyElement()) {
    return text;
  }

  int depth = 1;
  while (depth != 0) {
    switch (Next()) {
      case Event::kText: {
        const xmlChar* value = xmlTextReaderConstValue(reader_);
        if (value) text.append(reinterpret_cast<const char*>(value));
        break;
      }
      case Event::kStartElement:
        if (!IsEmptyElement()) ++depth;
        break;
      case Event::kEndElement:
        --depth;
        break;
      case Event::kEndDocument:
        throw ParseError("unexpected end of document inside element");
      case Event::kOther:
        break;
    }
  }
  return text;
}

void XmlPullReader::Skip() {
  RequireStartElement("Skip");
  if (IsEmptyElement()) {
    return;
  }

  int depth = 1;
  while (depth != 0) {
    switch (Next()) {
      case Event::kStartElement:
        if (!IsEmptyElement()) ++depth;
        break;
      case Event::kEndElement:
        --depth;
        break;
      case Event::kEndDocument:
        throw ParseError("unexpected end of document inside element");
      default:
        break;
    }
  }
}

} // namespace epg::xmltv
