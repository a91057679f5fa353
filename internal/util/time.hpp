#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace ito::util {

/*
  Time utilities: single place to control clock source and the
  audit timestamp format (ISO-8601 UTC, millisecond precision).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t ToUnixMillis(TimePoint tp);

// "2026-02-08T14:30:00.000Z"
std::string FormatIso8601Millis(TimePoint tp);

// Accepts any RFC 3339 timestamp. Returns nullopt if unparseable.
std::optional<TimePoint> ParseIso8601(const std::string& value);

} // namespace ito::util
