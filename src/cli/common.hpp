#pragma once
#include "gitemu/error.hpp"
#include "gitemu/repo.hpp"

#include <string>
#include <string_view>

namespace gitemu::cli {

// User-facing text for an error kind.
std::string describe(const Error& e);

// Print `describe(e)` to stderr and return the exit code for the kind:
// 128 for storage corruption, 1 otherwise.
int report(std::string_view cmd, const Error& e);

// Repository containing the current directory (walks upward).
Repository open_repository();

// Convert a command-line path (relative to the current directory) to a
// repository-relative one.
std::string to_repo_path(const Repository& repo, std::string_view arg);

} // namespace gitemu::cli
