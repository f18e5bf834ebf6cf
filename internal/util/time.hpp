#pragma once

#include <chrono>
#include <cstdint>

#include <google/protobuf/timestamp.pb.h>

namespace localdisk::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

} // namespace localdisk::util
