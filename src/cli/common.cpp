#include "cli/common.hpp"

#include <filesystem>
#include <iostream>

namespace gitemu::cli {

std::string describe(const Error &e) {
  const std::string &s = e.subject();
  switch (e.kind()) {
  case ErrorKind::NotARepository:
    return "fatal: not a gitemu repository (or any of the parent directories): .gitemu";
  case ErrorKind::AlreadyInitialized:
    return "gitemu repository already initialized in " + s;
  case ErrorKind::ObjectNotFound:
  case ErrorKind::CorruptObject:
    return std::string("fatal: repository corrupt: ") + e.what();
  case ErrorKind::NothingToCommit:
    return "nothing to commit, working tree clean";
  case ErrorKind::BranchExists:
    return "fatal: A branch named '" + s + "' already exists.";
  case ErrorKind::TagExists:
    return "fatal: tag '" + s + "' already exists";
  case ErrorKind::UnknownRef:
    return "error: pathspec '" + s + "' did not match any file(s) known to gitemu";
  case ErrorKind::InvalidRefName:
    return "fatal: '" + s + "' is not a valid ref name.";
  case ErrorKind::BranchCheckedOut:
    return "error: Cannot delete or rename branch '" + s + "' checked out";
  case ErrorKind::UncommittedChanges:
    return "error: Your local changes would be overwritten by checkout.\n"
           "Please commit your changes first.";
  case ErrorKind::PathNotFound:
    return "fatal: pathspec '" + s + "' did not match any files";
  case ErrorKind::DestinationExists:
    return "fatal: destination path '" + s + "' already exists";
  case ErrorKind::InvalidConfigKey:
    return "error: invalid key: " + s;
  case ErrorKind::Io:
    return std::string("fatal: ") + e.what();
  }
  return e.what();
}

int report(std::string_view cmd, const Error &e) {
  if (e.is_corruption() || e.kind() == ErrorKind::Io) {
    std::cerr << cmd << ": ";
  }
  std::cerr << describe(e) << "\n";
  return e.is_corruption() ? 128 : 1;
}

Repository open_repository() { return Repository::discover(std::filesystem::current_path()); }

std::string to_repo_path(const Repository &repo, std::string_view arg) {
  namespace fs = std::filesystem;
  const fs::path abs = (fs::current_path() / fs::path(arg)).lexically_normal();
  const fs::path root = fs::absolute(repo.root()).lexically_normal();
  const fs::path rel = abs.lexically_relative(root);
  if (rel.empty()) {
    return std::string(arg); // different root; let the core reject it
  }
  return rel.generic_string();
}

} // namespace gitemu::cli
