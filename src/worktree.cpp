#include "gitemu/worktree.hpp"

#include "gitemu/consts.hpp"
#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"
#include "gitemu/repo.hpp"
#include "gitemu/util.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace gfs = gitemu::fs;

namespace gitemu::worktree {

void enumerate_paths(const std::filesystem::path &root, std::set<std::string> &out_paths) {
  enumerate_paths(root, root, out_paths);
}

void enumerate_paths(const std::filesystem::path &root, const std::filesystem::path &dir,
                     std::set<std::string> &out_paths) {
  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(dir, ec);
  if (ec) {
    throw Error(ErrorKind::Io, "cannot scan " + dir.string() + ": " + ec.message(), dir.string());
  }
  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw Error(ErrorKind::Io, "cannot scan " + dir.string() + ": " + ec.message(),
                  dir.string());
    }
    const auto &p = it->path();
    if (p.filename() == consts::kGitDir && p.parent_path() == root) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file()) {
      continue;
    }
    out_paths.insert(std::filesystem::relative(p, root).generic_string());
  }
  if (ec) {
    throw Error(ErrorKind::Io, "cannot scan " + dir.string() + ": " + ec.message(), dir.string());
  }
}

std::string hash_working_file(const std::filesystem::path &root, const std::string &rel) {
  const auto p = root / rel;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    return {};
  }
  return compute_blob_hex_oid(gfs::read_file(p));
}

static void tree_to_map_impl(const Repository &repo, const std::string &tree_hex,
                             const std::string &prefix, PathOidMap &out) {
  for (auto &e : repo.read_tree(tree_hex)) {
    if (e.mode == consts::kModeTree)
      tree_to_map_impl(repo, to_hex(e.id), prefix + e.name + "/", out);
    else
      out[prefix + e.name] = to_hex(e.id);
  }
}

PathOidMap tree_to_map(const Repository &repo, const std::string &tree_hex) {
  PathOidMap m;
  tree_to_map_impl(repo, tree_hex, "", m);
  return m;
}

PathOidMap overlay(const PathOidMap &base, const PathOidMap &index) {
  PathOidMap out = base;
  for (const auto &[path, hex] : index) {
    // drop base entries beneath `path` (it is now a file)
    const std::string dir_prefix = path + "/";
    for (auto it = out.lower_bound(dir_prefix);
         it != out.end() && it->first.starts_with(dir_prefix);) {
      it = out.erase(it);
    }
    // drop base files sitting where `path` needs a directory
    for (auto slash = path.find('/'); slash != std::string::npos;
         slash = path.find('/', slash + 1)) {
      out.erase(path.substr(0, slash));
    }
    out[path] = hex;
  }
  return out;
}

std::string write_tree_from_map(const Repository &repo, const PathOidMap &flat) {
  const auto build = [&](const auto &self, const PathOidMap &group) -> std::string {
    std::map<std::string, PathOidMap> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto &[path, hex] : group) {
      const auto slash = path.find('/');
      if (slash == std::string::npos) {
        TreeEntry te{};
        te.mode = consts::kModeFile;
        te.name = path;
        if (!from_hex(hex, te.id)) {
          throw Error(ErrorKind::CorruptObject, "bad blob id for " + path, path);
        }
        tree_entries.push_back(std::move(te));
      } else {
        subdirs[path.substr(0, slash)][path.substr(slash + 1)] = hex;
      }
    }

    for (const auto &[dirname, child_entries] : subdirs) {
      TreeEntry te{};
      te.mode = consts::kModeTree;
      te.name = dirname;
      if (!from_hex(self(self, child_entries), te.id)) {
        throw Error(ErrorKind::CorruptObject, "bad subtree hex oid", dirname);
      }
      tree_entries.push_back(std::move(te));
    }

    return repo.write_tree(tree_entries);
  };

  return build(build, flat);
}

std::set<std::string> conflicting_paths(const std::filesystem::path &root, const PathOidMap &from,
                                        const PathOidMap &to) {
  std::set<std::string> out;
  const auto consider = [&](const std::string &path, const std::string &was,
                            const std::string &will) {
    if (was == will)
      return;
    const std::string on_disk = hash_working_file(root, path);
    if (!was.empty()) {
      // tracked: local edits (or a deletion we would resurrect over) are at risk
      if (on_disk.empty() ? !will.empty() : on_disk != was)
        out.insert(path);
    } else if (!on_disk.empty() && on_disk != will) {
      // untracked file where the target has one
      out.insert(path);
    }
  };

  for (const auto &[path, hex] : from) {
    const auto it = to.find(path);
    consider(path, hex, it == to.end() ? std::string{} : it->second);
  }
  for (const auto &[path, hex] : to) {
    if (!from.contains(path))
      consider(path, std::string{}, hex);
  }

  // Shape clashes: a path to be written needs every parent to be a directory
  // and itself to be free of untracked content.
  const auto removed = [&](const std::string &p) { return from.contains(p) && !to.contains(p); };
  for (const auto &[path, hex] : to) {
    if (const auto it = from.find(path); it != from.end() && it->second == hex)
      continue;
    std::error_code ec;
    for (auto slash = path.find('/'); slash != std::string::npos;
         slash = path.find('/', slash + 1)) {
      const std::string parent = path.substr(0, slash);
      const auto st = std::filesystem::symlink_status(root / parent, ec);
      if (std::filesystem::exists(st) && !std::filesystem::is_directory(st) && !removed(parent)) {
        out.insert(path);
        break;
      }
    }
    if (std::filesystem::is_directory(std::filesystem::symlink_status(root / path, ec))) {
      std::set<std::string> beneath;
      enumerate_paths(root, root / path, beneath);
      for (const auto &p : beneath) {
        if (!removed(p)) {
          out.insert(path);
          break;
        }
      }
    }
  }
  return out;
}

void switch_snapshot(const Repository &repo, const PathOidMap &from, const PathOidMap &to) {
  const auto &root = repo.root();
  for (const auto &[path, _] : from) {
    std::error_code ec;
    if (!to.contains(path) && std::filesystem::is_regular_file(root / path, ec))
      gfs::remove_and_prune(root / path, root);
  }
  for (const auto &[path, hex] : to) {
    // unchanged paths keep whatever the working copy holds
    if (const auto it = from.find(path); it != from.end() && it->second == hex)
      continue;
    // only empty directories can be left here; conflicting_paths vetted the rest
    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::symlink_status(root / path, ec))) {
      std::filesystem::remove_all(root / path, ec);
      if (ec) {
        throw Error(ErrorKind::Io, "cannot replace directory " + path + ": " + ec.message(), path);
      }
    }
    gfs::write_file_atomic(root / path, repo.read_blob(hex));
  }
}

} // namespace gitemu::worktree
