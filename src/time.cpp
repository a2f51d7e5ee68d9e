#include "gitemu/time.hpp"

#include <charconv>
#include <cstdio>
#include <iomanip>
#include <sstream>

// POSIX has timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }

namespace gitemu::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
  // Read both broken-down times as if they were UTC and subtract: local - UTC
  const std::time_t local_epoch = timegm_portable(&lt);
  const std::time_t utc_epoch = timegm_portable(&gt);
  const long diff = local_epoch - utc_epoch; // seconds
  return static_cast<int>(diff / 60);        // minutes
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, hh, mm);
  return std::string(buf);
}

std::string make_signature(const Identity &id, std::time_t when, int tz_minutes) {
  return id.name + " <" + id.email + "> " + std::to_string(static_cast<long long>(when)) + " " +
         tz_offset_string(tz_minutes);
}

std::optional<Signature> parse_signature(std::string_view line) {
  // Name <email> <epoch> <+HHMM>
  const auto lt = line.rfind('<');
  const auto gt = line.rfind('>');
  if (lt == std::string_view::npos || gt == std::string_view::npos || gt < lt) {
    return std::nullopt;
  }
  Signature sig;
  auto name = line.substr(0, lt);
  while (!name.empty() && name.back() == ' ')
    name.remove_suffix(1);
  sig.who.name = std::string(name);
  sig.who.email = std::string(line.substr(lt + 1, gt - lt - 1));

  auto rest = line.substr(gt + 1);
  while (!rest.empty() && rest.front() == ' ')
    rest.remove_prefix(1);
  const auto sp = rest.find(' ');
  if (sp == std::string_view::npos) {
    return std::nullopt;
  }
  long long when = 0;
  const auto epoch = rest.substr(0, sp);
  if (auto [p, ec] = std::from_chars(epoch.data(), epoch.data() + epoch.size(), when);
      ec != std::errc{} || p != epoch.data() + epoch.size()) {
    return std::nullopt;
  }
  const auto tz = rest.substr(sp + 1);
  if (tz.size() != 5 || (tz[0] != '+' && tz[0] != '-')) {
    return std::nullopt;
  }
  int hh = 0;
  int mm = 0;
  if (std::from_chars(tz.data() + 1, tz.data() + 3, hh).ec != std::errc{} ||
      std::from_chars(tz.data() + 3, tz.data() + 5, mm).ec != std::errc{}) {
    return std::nullopt;
  }
  sig.when = static_cast<std::time_t>(when);
  sig.tz_minutes = (tz[0] == '-' ? -1 : 1) * (hh * 60 + mm);
  return sig;
}

std::string format_date(std::time_t when, int tz_minutes) {
  const std::time_t shifted = when + static_cast<std::time_t>(tz_minutes) * 60;
  std::tm tm{};
  gmtime_r(&shifted, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%a %b %e %H:%M:%S %Y") << ' ' << tz_offset_string(tz_minutes);
  return os.str();
}

} // namespace gitemu::timeutil
