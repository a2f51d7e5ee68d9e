#include "gitemu/config.hpp"

#include "gitemu/consts.hpp"
#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"
#include "gitemu/util.hpp"

#include <sstream>
#include <string_view>

namespace gitemu {

namespace {

bool valid_key(std::string_view key) {
  if (key.empty())
    return false;
  for (const char c : key) {
    if (c == '=' || c == '#' || c == ' ' || c == '\t' || c == '\n' || c == '\r')
      return false;
  }
  return true;
}

} // namespace

auto Config::load(const std::filesystem::path &file) -> Config {
  Config out;
  if (!fs::exists(file))
    return out;

  const auto bytes = fs::read_file(file);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    const std::string sv = strutil::trim(line);
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto eq = sv.find('=');
    if (eq == std::string::npos)
      continue;
    std::string key = strutil::trim(std::string_view(sv).substr(0, eq));
    if (!valid_key(key))
      continue;
    out.values_.insert_or_assign(std::move(key),
                                 strutil::trim(std::string_view(sv).substr(eq + 1)));
  }
  return out;
}

void Config::save(const std::filesystem::path &file) const {
  std::ostringstream os;
  for (const auto &[key, value] : values_) {
    os << key << " = " << value << '\n';
  }
  fs::write_file_atomic(file, fs::as_bytes(os.str()));
}

std::optional<std::string> Config::get(std::string_view key) const {
  const auto it = values_.find(key);
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}

void Config::set(std::string_view key, std::string_view value) {
  if (!valid_key(key)) {
    throw Error(ErrorKind::InvalidConfigKey, "invalid config key: " + std::string(key),
                std::string(key));
  }
  if (value.find_first_of("\r\n") != std::string_view::npos) {
    throw Error(ErrorKind::InvalidConfigKey, "config value spans lines: " + std::string(key),
                std::string(key));
  }
  values_.insert_or_assign(std::string(key), strutil::trim(value));
}

bool Config::unset(std::string_view key) {
  const auto it = values_.find(key);
  if (it == values_.end())
    return false;
  values_.erase(it);
  return true;
}

Identity resolve_identity(const Config &config) {
  return Identity{
      .name = config.get(consts::kUserNameKey).value_or(std::string(consts::kDefaultUserName)),
      .email = config.get(consts::kUserEmailKey).value_or(std::string(consts::kDefaultUserEmail)),
  };
}

} // namespace gitemu
