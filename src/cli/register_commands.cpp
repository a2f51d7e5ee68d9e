#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_status(int, char **);
int cmd_checkout(int, char **);
int cmd_branch(int, char **);
int cmd_log(int, char **);
int cmd_tag(int, char **);
int cmd_config(int, char **);
int cmd_clone(int, char **);

namespace gitemu::cli {

void register_all_commands() {
  register_command({"init", ::cmd_init, "[<directory>]", "Create an empty repository"});
  register_command({"add", ::cmd_add, "<path>... | .", "Stage file contents for the next commit"});
  register_command({"commit", ::cmd_commit, "-m <message>", "Record the staged changes"});
  register_command({"status", ::cmd_status, "", "Show staged, unstaged and untracked paths"});
  register_command({"checkout", ::cmd_checkout, "<branch | commit-id>",
                    "Switch branches or detach HEAD at a commit"});
  register_command({"branch", ::cmd_branch, "[<name> | -d <name> | -m <old> <new>]",
                    "List, create, delete or rename branches"});
  register_command({"log", ::cmd_log, "[--oneline]", "Show commits reachable from HEAD"});
  register_command({"tag", ::cmd_tag, "[<name>]", "List tags or tag the HEAD commit"});
  register_command({"config", ::cmd_config, "[--list | <key> [<value>] | --unset <key>]",
                    "Get and set repository options"});
  register_command({"clone", ::cmd_clone, "<source-dir> [<dest>]",
                    "Import an unpacked directory as a new repository"});
}

} // namespace gitemu::cli
