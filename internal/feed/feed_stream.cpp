#include "internal/feed/feed_stream.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace epg::feed {

namespace {

constexpr std::size_t kChunkSize = 16384;

} // namespace

// ------------------------------------------------------------------
// FileFeedStream
// ------------------------------------------------------------------

FileFeedStream::FileFeedStream(std::filesystem::path path, bool remove_on_close)
    : path_(std::move(path)), in_(path_, std::ios::binary), remove_on_close_(remove_on_close) {
  if (!in_.is_open()) {
    throw util::Unavailable("cannot open feed file " + path_.string());
  }
}

FileFeedStream::~FileFeedStream() {
  in_.close();
  if (remove_on_close_) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
      EPG_LOG_WARN("failed to remove spool file",
                   {observability::StringField("path", path_.string()), observability::StringField("error", ec.message())});
    }
  }
}

std::size_t FileFeedStream::Read(char* buffer, std::size_t length) {
  if (in_.eof()) return 0;
  in_.read(buffer, static_cast<std::streamsize>(length));
  if (in_.bad()) {
    throw util::Unavailable("read failed on " + path_.string());
  }
  return static_cast<std::size_t>(in_.gcount());
}

// ------------------------------------------------------------------
// DecodingFeedStream
// ------------------------------------------------------------------

DecodingFeedStream::DecodingFeedStream(std::unique_ptr<FeedStream> inner)
    : inner_(std::move(inner)), in_buf_(kChunkSize) {
}

DecodingFeedStream::~DecodingFeedStream() {
  if (zlib_ready_) inflateEnd(&strm_);
}

void DecodingFeedStream::Detect() {
  // a short first read is legal, keep reading until the magic can be decided
  std::size_t have = 0;
  while (have < 2) {
    const std::size_t n = inner_->Read(in_buf_.data() + have, in_buf_.size() - have);
    if (n == 0) {
      inner_eof_ = true;
      break;
    }
    have += n;
  }

  const bool is_gzip = have >= 2 && static_cast<unsigned char>(in_buf_[0]) == 0x1F && static_cast<unsigned char>(in_buf_[1]) == 0x8B;
  if (!is_gzip) {
    mode_           = Mode::kPlain;
    pending_offset_ = 0;
    pending_size_   = have;
    return;
  }

  strm_.zalloc = Z_NULL;
  strm_.zfree  = Z_NULL;
  strm_.opaque = Z_NULL;
  if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  zlib_ready_    = true;
  strm_.next_in  = reinterpret_cast<Bytef*>(in_buf_.data());
  strm_.avail_in = static_cast<uInt>(have);
  mode_          = Mode::kGzip;
}

std::size_t DecodingFeedStream::Read(char* buffer, std::size_t length) {
  if (length == 0) return 0;
  if (mode_ == Mode::kUnknown) Detect();
  return mode_ == Mode::kGzip ? ReadGzip(buffer, length) : ReadPlain(buffer, length);
}

std::size_t DecodingFeedStream::ReadPlain(char* buffer, std::size_t length) {
  if (pending_offset_ < pending_size_) {
    const std::size_t n = std::min(length, pending_size_ - pending_offset_);
    std::memcpy(buffer, in_buf_.data() + pending_offset_, n);
    pending_offset_ += n;
    return n;
  }
  if (inner_eof_) return 0;
  return inner_->Read(buffer, length);
}

std::size_t DecodingFeedStream::ReadGzip(char* buffer, std::size_t length) {
  strm_.next_out  = reinterpret_cast<Bytef*>(buffer);
  strm_.avail_out = static_cast<uInt>(length);

  while (strm_.avail_out == length) {
    if (strm_.avail_in == 0) {
      if (inner_eof_) {
        if (!member_done_) throw std::runtime_error("gzip feed is truncated");
        return 0;
      }
      const std::size_t n = inner_->Read(in_buf_.data(), in_buf_.size());
      if (n == 0) {
        inner_eof_ = true;
        continue;
      }
      strm_.next_in  = reinterpret_cast<Bytef*>(in_buf_.data());
      strm_.avail_in = static_cast<uInt>(n);
    }

    if (member_done_) {
      // another gzip member follows the previous one
      if (inflateReset(&strm_) != Z_OK) throw std::runtime_error("inflateReset failed");
      member_done_ = false;
    }

    const int ret = inflate(&strm_, Z_NO_FLUSH);
    if (ret == Z_STREAM_END) {
      member_done_ = true;
    } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
      throw std::runtime_error(std::string("gzip feed is corrupt: ") + (strm_.msg ? strm_.msg : "inflate failed"));
    }
  }

  return length - strm_.avail_out;
}

} // namespace epg::feed
