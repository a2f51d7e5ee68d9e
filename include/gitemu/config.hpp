#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gitemu {

struct Identity {
  std::string name;
  std::string email;
};

// Flat key/value settings persisted as "key = value" lines in .gitemu/config.
// A Config is a plain value: load it once per command and pass it along.
class Config {
public:
  // Missing file yields an empty Config.
  static Config load(const std::filesystem::path& file);
  void save(const std::filesystem::path& file) const;

  [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
  // Throws InvalidConfigKey for keys with whitespace, '=', '#' or an empty
  // name, and for values spanning lines.
  void set(std::string_view key, std::string_view value);
  bool unset(std::string_view key);

  const std::map<std::string, std::string, std::less<>>& entries() const { return values_; }

private:
  std::map<std::string, std::string, std::less<>> values_;
};

// user.name / user.email, falling back to "User" / "user@example.com".
Identity resolve_identity(const Config& config);

} // namespace gitemu
