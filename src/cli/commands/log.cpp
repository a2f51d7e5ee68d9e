#include "cli/common.hpp"
#include "cli/registry.hpp"
#include "gitemu/repo.hpp"
#include "gitemu/time.hpp"
#include "gitemu/util.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

int cmd_log(int argc, char **argv) {
  bool oneline = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == "--oneline") {
      oneline = true;
    } else {
      return gitemu::cli::usage_error("log");
    }
  }

  try {
    const auto repo = gitemu::cli::open_repository();
    const auto entries = repo.log();
    if (entries.empty()) {
      std::cout << "No commits yet\n";
      return 0;
    }

    for (const auto &[id, info] : entries) {
      if (oneline) {
        std::cout << gitemu::short_hex(id) << " " << info.summary() << "\n";
        continue;
      }
      std::cout << "commit " << id << "\n";
      if (const auto sig = gitemu::timeutil::parse_signature(info.author)) {
        std::cout << "Author: " << sig->who.name << " <" << sig->who.email << ">\n";
        std::cout << "Date:   " << gitemu::timeutil::format_date(sig->when, sig->tz_minutes)
                  << "\n";
      } else if (!info.author.empty()) {
        std::cout << "Author: " << info.author << "\n";
      }
      std::cout << "\n";
      std::istringstream msg(info.message);
      std::string line;
      while (std::getline(msg, line)) {
        std::cout << "    " << line << "\n";
      }
      std::cout << "\n";
    }
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("log", e);
  } catch (const std::exception &e) {
    std::cerr << "log: " << e.what() << "\n";
    return 1;
  }
}
