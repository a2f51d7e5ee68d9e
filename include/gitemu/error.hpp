#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitemu {

enum class ErrorKind : std::uint8_t {
  NotARepository,     // no .gitemu found upward from the start directory
  AlreadyInitialized, // init on an existing repository
  ObjectNotFound,     // digest referenced but missing from the store
  CorruptObject,      // object present but unreadable or hash mismatch
  NothingToCommit,    // commit with an empty index
  BranchExists,
  TagExists,
  UnknownRef,
  InvalidRefName,
  BranchCheckedOut,   // delete/rename of the branch HEAD points at
  UncommittedChanges, // checkout would discard staged or local work
  PathNotFound,       // add target missing on disk
  DestinationExists,  // import into an existing directory
  InvalidConfigKey,
  Io,
};

// Stable lowercase name of a kind ("object-not-found", ...).
auto to_string(ErrorKind kind) -> std::string_view;

// Every failure of a core operation is thrown as an Error. `subject` names the
// path, ref or digest involved so the command surface can phrase its message.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what, std::string subject = {});

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

  // Storage corruption, as opposed to an ordinary usage error.
  [[nodiscard]] bool is_corruption() const noexcept {
    return kind_ == ErrorKind::ObjectNotFound || kind_ == ErrorKind::CorruptObject;
  }

private:
  ErrorKind kind_;
  std::string subject_;
};

} // namespace gitemu
