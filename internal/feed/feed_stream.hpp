#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <zlib.h>

namespace epg::feed {

/*
  Forward-only byte stream over a feed body.

  Read() returns the number of bytes copied, 0 at end of stream, and throws
  util::Unavailable on an I/O failure. Closing (destroying) the stream is the
  way to abandon a run.
*/
class FeedStream {
 public:
  virtual ~FeedStream() = default;

  virtual std::size_t Read(char* buffer, std::size_t length) = 0;
};

class FeedSource {
 public:
  virtual ~FeedSource() = default;

  // Throws util::Unavailable when the feed cannot be fetched.
  virtual std::unique_ptr<FeedStream> Open() = 0;

  // Cheap "network connected" check performed before a run is started.
  virtual bool ProbeConnectivity() {
    return true;
  }

  virtual std::string Describe() const = 0;
};

// Reads a local file; optionally removes it when closed (spool files).
class FileFeedStream final : public FeedStream {
 public:
  explicit FileFeedStream(std::filesystem::path path, bool remove_on_close = false);
  ~FileFeedStream() override;

  std::size_t Read(char* buffer, std::size_t length) override;

 private:
  std::filesystem::path path_;
  std::ifstream         in_;
  bool                  remove_on_close_;
};

/*
  Transparently inflates gzip bodies (.xml.gz feeds, or servers that send
  compressed files without Content-Encoding). Plain bodies pass through.
  Concatenated gzip members are decoded back to back.
*/
class DecodingFeedStream final : public FeedStream {
 public:
  explicit DecodingFeedStream(std::unique_ptr<FeedStream> inner);
  ~DecodingFeedStream() override;

  DecodingFeedStream(const DecodingFeedStream&)            = delete;
  DecodingFeedStream& operator=(const DecodingFeedStream&) = delete;

  std::size_t Read(char* buffer, std::size_t length) override;

  bool IsCompressed() const {
    return mode_ == Mode::kGzip;
  }

 private:
  enum class Mode { kUnknown, kPlain, kGzip };

  void        Detect();
  std::size_t ReadPlain(char* buffer, std::size_t length);
  std::size_t ReadGzip(char* buffer, std::size_t length);

  std::unique_ptr<FeedStream> inner_;
  Mode                        mode_ = Mode::kUnknown;
  std::vector<char>           in_buf_;
  std::size_t                 pending_offset_ = 0; // plain mode: unread bytes of the sniffed chunk
  std::size_t                 pending_size_   = 0;
  z_stream                    strm_{};
  bool                        zlib_ready_  = false;
  bool                        member_done_ = false;
  bool                        inner_eof_   = false;
};

} // namespace epg::feed
