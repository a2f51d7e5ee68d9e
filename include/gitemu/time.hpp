#pragma once
#include "gitemu/config.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace gitemu::timeutil {

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// Build "Name <email> 1714412345 +0300"
auto make_signature(const Identity& identity, std::time_t when, int tz_minutes) -> std::string;

struct Signature {
  Identity who;
  std::time_t when = 0;
  int tz_minutes = 0;
};

// Inverse of make_signature; nullopt on malformed input.
auto parse_signature(std::string_view line) -> std::optional<Signature>;

// "Mon Oct 19 14:03:11 2026 +0200", wall time in the signature's own zone.
auto format_date(std::time_t when, int tz_minutes) -> std::string;

} // namespace gitemu::timeutil
