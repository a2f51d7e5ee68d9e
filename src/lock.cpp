#include "gitemu/lock.hpp"

#include <map>
#include <mutex>
#include <string>

namespace gitemu {

auto repository_mutex(const std::filesystem::path &root) -> std::shared_ptr<std::shared_mutex> {
  static std::mutex registry_guard;
  static std::map<std::string, std::weak_ptr<std::shared_mutex>> registry;

  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(std::filesystem::absolute(root, ec), ec);
  if (ec) {
    canonical = root.lexically_normal();
  }
  const std::string key = canonical.generic_string();

  const std::lock_guard<std::mutex> guard(registry_guard);
  std::erase_if(registry, [](const auto &item) { return item.second.expired(); });
  auto &slot = registry[key];
  if (auto existing = slot.lock()) {
    return existing;
  }
  auto created = std::make_shared<std::shared_mutex>();
  slot = created;
  return created;
}

} // namespace gitemu
