#include "internal/feed/feed_source.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <system_error>

#include <curl/curl.h>
#include <unistd.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace epg::feed {

namespace {

std::once_flag g_curl_init;

void EnsureCurlInitialized() {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
  void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct FileDeleter {
  void operator()(std::FILE* f) const noexcept { std::fclose(f); }
};

size_t WriteToFile(const void* data, size_t size, size_t count, void* userdata) {
  return std::fwrite(data, size, count, static_cast<std::FILE*>(userdata));
}

bool StartsWith(const std::string& value, const char* prefix) {
  return value.rfind(prefix, 0) == 0;
}

} // namespace

// ------------------------------------------------------------------
// HttpFeedSource
// ------------------------------------------------------------------

HttpFeedSource::HttpFeedSource(HttpFeedOptions options) : options_(std::move(options)) {
  EnsureCurlInitialized();
  if (options_.spool_dir.empty()) {
    options_.spool_dir = std::filesystem::temp_directory_path();
  }
}

std::filesystem::path HttpFeedSource::NextSpoolPath() {
  static std::atomic<uint64_t> counter{0};
  return options_.spool_dir /
         ("epg-feed-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + ".spool");
}

std::unique_ptr<FeedStream> HttpFeedSource::Open() {
  std::error_code ec;
  std::filesystem::create_directories(options_.spool_dir, ec);
  if (ec) {
    throw util::Unavailable("cannot create spool dir " + options_.spool_dir.string() + ": " + ec.message());
  }

  const auto spool_path = NextSpoolPath();
  long       response_code = 0;
  CURLcode   result        = CURLE_OK;
  {
    std::unique_ptr<std::FILE, FileDeleter> spool(std::fopen(spool_path.c_str(), "wb"));
    if (!spool) {
      throw util::Unavailable("cannot create spool file " + spool_path.string());
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
      throw util::Unavailable("curl_easy_init() failed");
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    result = curl_easy_setopt(curl.get(), CURLOPT_URL, options_.url.c_str());
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "identity, gzip, deflate");
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteToFile);
    if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(spool.get()));
    if (result == CURLE_OK) result = curl_easy_perform(curl.get());
    if (result == CURLE_OK) result = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);

    if (result != CURLE_OK) {
      spool.reset();
      std::filesystem::remove(spool_path, ec);
      const std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(result);
      throw util::Unavailable("feed download failed: " + detail);
    }

    if (std::fflush(spool.get()) != 0) {
      spool.reset();
      std::filesystem::remove(spool_path, ec);
      throw util::Unavailable("cannot write spool file " + spool_path.string());
    }
  }

  if (response_code < 200 || response_code > 299) {
    std::filesystem::remove(spool_path, ec);
    throw util::Unavailable("feed download failed: HTTP " + std::to_string(response_code));
  }

  EPG_LOG_DEBUG("feed downloaded", {observability::StringField("url", options_.url),
                                    observability::IntField("bytes", static_cast<int64_t>(std::filesystem::file_size(spool_path, ec)))});

  return std::make_unique<DecodingFeedStream>(std::make_unique<FileFeedStream>(spool_path, true));
}

bool HttpFeedSource::ProbeConnectivity() {
  CurlHandle curl(curl_easy_init());
  if (!curl) return false;

  CURLcode result = curl_easy_setopt(curl.get(), CURLOPT_URL, options_.url.c_str());
  if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 1L);
  if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (result == CURLE_OK) result = curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
  if (result == CURLE_OK) result = curl_easy_perform(curl.get());

  if (result != CURLE_OK) {
    EPG_LOG_DEBUG("feed host unreachable", {observability::StringField("url", options_.url),
                                            observability::StringField("error", curl_easy_strerror(result))});
    return false;
  }
  return true;
}

// ------------------------------------------------------------------
// FileFeedSource
// ------------------------------------------------------------------

FileFeedSource::FileFeedSource(std::filesystem::path path) : path_(std::move(path)) {
}

std::unique_ptr<FeedStream> FileFeedSource::Open() {
  return std::make_unique<DecodingFeedStream>(std::make_unique<FileFeedStream>(path_));
}

// ------------------------------------------------------------------
// Factory
// ------------------------------------------------------------------

std::unique_ptr<FeedSource> MakeFeedSource(const epg::runtime::config::FeedConfig& config) {
  const std::string& url = config.url();
  if (url.empty()) {
    throw std::invalid_argument("feed url is empty");
  }

  if (StartsWith(url, "http://") || StartsWith(url, "https://")) {
    HttpFeedOptions options;
    options.url = url;
    if (!config.user_agent().empty()) options.user_agent = config.user_agent();
    const auto timeout = util::FromProto(config.connect_timeout());
    if (timeout.count() > 0) options.connect_timeout = timeout;
    options.spool_dir = config.spool_dir();
    return std::make_unique<HttpFeedSource>(std::move(options));
  }

  if (StartsWith(url, "file://")) {
    return std::make_unique<FileFeedSource>(url.substr(7));
  }
  return std::make_unique<FileFeedSource>(url);
}

} // namespace epg::feed
