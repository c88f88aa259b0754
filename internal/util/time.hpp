#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"

namespace epg::util {

/*
  Time utilities — single place to control clock source later.

  Guide timestamps are signed milliseconds since the unix epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable wall clock returning epoch milliseconds.
using NowFn = std::function<int64_t()>;

constexpr int64_t kMillisPerHour = 60LL * 60 * 1000;
constexpr int64_t kMillisPerDay  = 24 * kMillisPerHour;

TimePoint Now();

int64_t NowMillis();

int64_t ToUnixMillis(TimePoint tp);

TimePoint FromUnixMillis(int64_t ms);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

} // namespace epg::util
