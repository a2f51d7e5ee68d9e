#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitemu::consts {

// Directory and file names
inline constexpr std::string_view kGitDir        = ".gitemu";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kTagsDir       = "tags";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kIndexFile     = "index";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kDefaultBranch = "main";

// Object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile = 0100644; // regular file
inline constexpr std::uint32_t kModeTree = 0040000; // directory entry in tree

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen   = 32; // 32 bytes (SHA-256)
inline constexpr std::size_t kOidHexLen   = 64; // 64 hex chars (SHA-256)
inline constexpr std::size_t kShortHexLen = 7;  // abbreviated ids in CLI output

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .gitemu/objects

// ——— Ref name prefixes ———
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kHeadsRefPrefix  = "refs/heads/";
inline constexpr std::string_view kTagsRefPrefix   = "refs/tags/";
inline constexpr std::string_view kLockSuffix      = ".lock";

// ——— Commit header prefixes (used in parsing/formatting) ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Config keys and fallbacks ———
inline constexpr std::string_view kUserNameKey      = "user.name";
inline constexpr std::string_view kUserEmailKey     = "user.email";
inline constexpr std::string_view kFormatVersionKey = "core.repositoryformatversion";
inline constexpr std::string_view kDefaultUserName  = "User";
inline constexpr std::string_view kDefaultUserEmail = "user@example.com";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace gitemu::consts
