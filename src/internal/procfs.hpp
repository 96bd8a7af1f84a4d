#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termctl::internal::procfs {

    struct process_entry {
        pid_t pid{};
        pid_t ppid{};
        std::string comm{};
        char state{};
    };

    // Parses the contents of /proc/<pid>/stat. comm may contain spaces and
    // parentheses, so the last ')' terminates it.
    std::optional<process_entry> parse_stat(pid_t pid, std::string_view stat);

    // NUL-separated argv as found in /proc/<pid>/cmdline
    std::vector<std::string> parse_cmdline(std::string_view raw);

    std::vector<process_entry> list_processes(const std::filesystem::path& root);

    std::optional<std::vector<std::string>> read_cmdline(const std::filesystem::path& root, pid_t pid);

    std::optional<std::filesystem::path> read_cwd(const std::filesystem::path& root, pid_t pid);

    // Breadth-first search below `ancestor` for a live process named `comm`
    std::optional<pid_t> find_descendant(const std::vector<process_entry>& table, pid_t ancestor, std::string_view comm);

}  // namespace termctl::internal::procfs
