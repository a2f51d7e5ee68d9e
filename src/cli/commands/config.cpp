#include "cli/common.hpp"
#include "cli/registry.hpp"
#include "gitemu/repo.hpp"

#include <iostream>
#include <string_view>

int cmd_config(int argc, char **argv) {
  try {
    const auto repo = gitemu::cli::open_repository();

    const std::string_view first = argc >= 2 ? argv[1] : "--list";
    if (first == "--unset") {
      if (argc != 3) {
        return gitemu::cli::usage_error("config");
      }
      if (!repo.unset_config(argv[2])) {
        std::cerr << "No value found for '" << argv[2] << "'\n";
        return 1;
      }
      return 0;
    }

    if (first == "--list" || first == "-l") {
      const auto config = repo.load_config();
      if (config.entries().empty()) {
        std::cout << "No configuration set\n";
      }
      for (const auto &[key, value] : config.entries()) {
        std::cout << key << "=" << value << "\n";
      }
      return 0;
    }

    if (argc == 2) {
      const auto value = repo.get_config(argv[1]);
      if (!value) {
        std::cerr << "No value found for '" << argv[1] << "'\n";
        return 1;
      }
      std::cout << *value << "\n";
      return 0;
    }

    if (argc != 3) {
      return gitemu::cli::usage_error("config");
    }
    repo.set_config(argv[1], argv[2]);
    return 0;
  } catch (const gitemu::Error &e) {
    return gitemu::cli::report("config", e);
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }
}
