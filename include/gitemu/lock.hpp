#pragma once
#include <filesystem>
#include <memory>
#include <shared_mutex>

namespace gitemu {

// Process-wide mutex for the repository at `root` (keyed by its canonical
// path). Mutating operations lock it exclusively, readers shared. The entry
// lives as long as some handle holds the returned pointer.
auto repository_mutex(const std::filesystem::path& root) -> std::shared_ptr<std::shared_mutex>;

} // namespace gitemu
