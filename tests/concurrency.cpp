#include "gitemu/error.hpp"
#include "gitemu/fs.hpp"
#include "gitemu/index.hpp"
#include "gitemu/lock.hpp"
#include "gitemu/object_store.hpp"
#include "gitemu/repo.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitemu_concurrency_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  constexpr int kThreads = 8;
  constexpr int kFilesPerThread = 5;

  try {
    const gitemu::Identity me{.name = "User", .email = "u@example.com"};
    gitemu::Repository{root}.init(me);

    for (int t = 0; t < kThreads; ++t) {
      for (int i = 0; i < kFilesPerThread; ++i) {
        const std::string name = "t" + std::to_string(t) + "/f" + std::to_string(i) + ".txt";
        write_file(root / name, name + "\n");
      }
    }

    // Concurrent add through separate handles on the same repository
    std::atomic<int> failures{0};
    {
      std::vector<std::thread> workers;
      for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
          try {
            const gitemu::Repository repo{root};
            for (int i = 0; i < kFilesPerThread; ++i) {
              (void)repo.add({"t" + std::to_string(t) + "/f" + std::to_string(i) + ".txt"});
            }
          } catch (const std::exception &e) {
            std::cerr << "worker " << t << ": " << e.what() << "\n";
            ++failures;
          }
        });
      }
      for (auto &w : workers)
        w.join();
    }
    if (failures != 0) {
      return 1;
    }

    gitemu::Repository repo{root};
    gitemu::Index idx{repo.git_dir()};
    idx.load();
    if (idx.entries().size() != kThreads * kFilesPerThread) {
      std::cerr << "lost index updates: " << idx.entries().size() << " entries\n";
      return 1;
    }

    // Readers run alongside a writer; each sees a consistent snapshot
    std::atomic<bool> done{false};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
      readers.emplace_back([&] {
        try {
          const gitemu::Repository view{root};
          while (!done) {
            const auto st = view.status();
            const auto history = view.log();
            const auto n = st.staged.size();
            if (history.size() > 2 || (n != 0 && n != 1 && n != kThreads * kFilesPerThread)) {
              std::cerr << "reader saw a half-applied update (" << n << " staged)\n";
              ++failures;
            }
          }
        } catch (const std::exception &e) {
          std::cerr << "reader: " << e.what() << "\n";
          ++failures;
        }
      });
    }
    const std::string c1 = repo.commit("many files", me);
    write_file(root / "last.txt", "last\n");
    (void)repo.add({"last.txt"});
    (void)repo.commit("one more", me);
    done = true;
    for (auto &r : readers)
      r.join();
    if (failures != 0) {
      return 1;
    }

    if (gitemu::worktree::tree_to_map(repo, repo.read_commit(c1).tree_hex).size() !=
        kThreads * kFilesPerThread) {
      std::cerr << "commit snapshot incomplete\n";
      return 1;
    }

    // Racing writers of the same object converge on one file
    const gitemu::ObjectStore store{repo.git_dir()};
    const std::string payload(1 << 16, 'z');
    std::vector<std::string> ids(kThreads);
    {
      std::vector<std::thread> writers;
      for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&, t] {
          try {
            ids[t] = store.put("blob", gitemu::fs::as_bytes(payload));
          } catch (const std::exception &e) {
            std::cerr << "writer: " << e.what() << "\n";
            ++failures;
          }
        });
      }
      for (auto &w : writers)
        w.join();
    }
    if (failures != 0) {
      return 1;
    }
    for (const auto &id : ids) {
      if (id != ids.front()) {
        std::cerr << "racing puts disagree on the id\n";
        return 1;
      }
    }
    const auto back = store.get(ids.front());
    if (back.data.size() != payload.size()) {
      std::cerr << "raced object unreadable\n";
      return 1;
    }
    for (const auto &entry : fs::recursive_directory_iterator(repo.objects_dir())) {
      if (entry.path().string().ends_with(".lock")) {
        std::cerr << "temp file left behind: " << entry.path() << "\n";
        return 1;
      }
    }

    // Handles on one root share a lock, also when spelled differently, and
    // stale entries for other roots are dropped as they expire
    {
      const auto held = gitemu::repository_mutex(root);
      for (int i = 0; i < 64; ++i) {
        (void)gitemu::repository_mutex(root / ("gone" + std::to_string(i)));
      }
      if (gitemu::repository_mutex(root / "t0" / "..") != held ||
          gitemu::repository_mutex(root / ("gone0")) == held) {
        std::cerr << "repository lock identity wrong\n";
        return 1;
      }
    }

    std::cout << "concurrency OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
