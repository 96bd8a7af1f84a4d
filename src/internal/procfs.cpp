#include "procfs.hpp"

#include "termctl/utils.hpp"

#include <deque>
#include <fstream>
#include <iterator>
#include <system_error>

namespace termctl::internal::procfs {

    namespace detail {

        static std::optional<std::string> read_file(const std::filesystem::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                return std::nullopt;
            }
            return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        }

        static std::optional<pid_t> parse_pid(std::string_view text) {
            auto value = utils::parse_arithmetic<int>(text);
            if (!value || *value <= 0) {
                return std::nullopt;
            }
            return static_cast<pid_t>(*value);
        }

    }  // namespace detail

    std::optional<process_entry> parse_stat(pid_t pid, std::string_view stat) {
        auto open = stat.find('(');
        auto close = stat.rfind(')');
        if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
            return std::nullopt;
        }

        process_entry entry{};
        entry.pid = pid;
        entry.comm = std::string{stat.substr(open + 1, close - open - 1)};

        // "<state> <ppid> ..."
        auto rest = utils::trim(stat.substr(close + 1));
        auto fields = utils::split(rest, ' ');
        if (fields.size() < 2 || fields[0].size() != 1) {
            return std::nullopt;
        }
        entry.state = fields[0][0];

        auto ppid = utils::parse_arithmetic<int>(fields[1]);
        if (!ppid) {
            return std::nullopt;
        }
        entry.ppid = static_cast<pid_t>(*ppid);
        return entry;
    }

    std::vector<std::string> parse_cmdline(std::string_view raw) {
        return utils::split(raw, '\0');
    }

    std::vector<process_entry> list_processes(const std::filesystem::path& root) {
        std::vector<process_entry> entries{};

        std::error_code ec{};
        std::filesystem::directory_iterator it{root, ec};
        if (ec) {
            debug_log("cannot scan ", root.string(), ": ", ec.message());
            return entries;
        }

        for (const auto& dirent : it) {
            auto pid = detail::parse_pid(dirent.path().filename().string());
            if (!pid) {
                continue;
            }
            // processes may exit between listing and reading
            auto stat = detail::read_file(dirent.path() / "stat");
            if (!stat) {
                continue;
            }
            if (auto entry = parse_stat(*pid, *stat)) {
                entries.push_back(std::move(*entry));
            }
        }

        return entries;
    }

    std::optional<std::vector<std::string>> read_cmdline(const std::filesystem::path& root, pid_t pid) {
        auto raw = detail::read_file(root / std::to_string(pid) / "cmdline");
        if (!raw) {
            return std::nullopt;
        }
        auto args = parse_cmdline(*raw);
        if (args.empty()) {
            return std::nullopt;
        }
        return args;
    }

    std::optional<std::filesystem::path> read_cwd(const std::filesystem::path& root, pid_t pid) {
        std::error_code ec{};
        auto target = std::filesystem::read_symlink(root / std::to_string(pid) / "cwd", ec);
        if (ec) {
            return std::nullopt;
        }
        return target;
    }

    std::optional<pid_t> find_descendant(const std::vector<process_entry>& table, pid_t ancestor, std::string_view comm) {
        std::deque<pid_t> frontier{ancestor};
        while (!frontier.empty()) {
            auto parent = frontier.front();
            frontier.pop_front();

            for (const auto& entry : table) {
                if (entry.ppid != parent || entry.pid == parent) {
                    continue;
                }
                if (entry.comm == comm && entry.state != 'Z') {
                    return entry.pid;
                }
                frontier.push_back(entry.pid);
            }
        }
        return std::nullopt;
    }

}  // namespace termctl::internal::procfs
