#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/feed/feed_stream.hpp"

namespace epg::runtime::config {
class FeedConfig;
}

namespace epg::feed {

struct HttpFeedOptions {
  std::string               url;
  std::string               user_agent = "epg-guide/1.0";
  std::chrono::milliseconds connect_timeout{10000};
  std::filesystem::path     spool_dir; // temp directory when empty
};

/*
  Downloads the feed with libcurl into a spool file, then streams it back.

  The body never sits in memory as a whole. Any curl error or a non-2xx
  status raises util::Unavailable so the run is retried later. The read
  timeout is left to curl's defaults; only the connect timeout is bounded.
*/
class HttpFeedSource final : public FeedSource {
 public:
  explicit HttpFeedSource(HttpFeedOptions options);

  std::unique_ptr<FeedStream> Open() override;

  bool ProbeConnectivity() override;

  std::string Describe() const override {
    return options_.url;
  }

 private:
  std::filesystem::path NextSpoolPath();

  HttpFeedOptions options_;
};

class FileFeedSource final : public FeedSource {
 public:
  explicit FileFeedSource(std::filesystem::path path);

  std::unique_ptr<FeedStream> Open() override;

  std::string Describe() const override {
    return path_.string();
  }

 private:
  std::filesystem::path path_;
};

// http(s):// -> HttpFeedSource, file:// or a bare path -> FileFeedSource.
std::unique_ptr<FeedSource> MakeFeedSource(const epg::runtime::config::FeedConfig& config);

} // namespace epg::feed
