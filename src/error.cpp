#include "gitemu/error.hpp"

#include <utility>

namespace gitemu {

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::NotARepository:     return "not-a-repository";
  case ErrorKind::AlreadyInitialized: return "already-initialized";
  case ErrorKind::ObjectNotFound:     return "object-not-found";
  case ErrorKind::CorruptObject:      return "corrupt-object";
  case ErrorKind::NothingToCommit:    return "nothing-to-commit";
  case ErrorKind::BranchExists:       return "branch-exists";
  case ErrorKind::TagExists:          return "tag-exists";
  case ErrorKind::UnknownRef:         return "unknown-ref";
  case ErrorKind::InvalidRefName:     return "invalid-ref-name";
  case ErrorKind::BranchCheckedOut:   return "branch-checked-out";
  case ErrorKind::UncommittedChanges: return "uncommitted-changes";
  case ErrorKind::PathNotFound:       return "path-not-found";
  case ErrorKind::DestinationExists:  return "destination-exists";
  case ErrorKind::InvalidConfigKey:   return "invalid-config-key";
  case ErrorKind::Io:                 return "io";
  }
  return "unknown";
}

Error::Error(ErrorKind kind, const std::string& what, std::string subject)
    : std::runtime_error(what), kind_(kind), subject_(std::move(subject)) {}

} // namespace gitemu
