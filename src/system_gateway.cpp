#include "termctl/system_gateway.hpp"

#include "internal/cmdline.hpp"
#include "internal/platform.hpp"
#include "internal/procfs.hpp"
#include "internal/subprocess.hpp"
#include "termctl/format.hpp"

#include <unistd.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace termctl::literals;

static_assert(termctl::internal::platform::is_linux, "system_gateway reads the Linux /proc filesystem");

namespace termctl {

    namespace detail {

        static std::string first_line(std::string_view text) {
            auto line = text.substr(0, text.find('\n'));
            return std::string{utils::trim(line)};
        }

        static std::string describe_failure(const internal::subprocess_result& result) {
            auto reason = first_line(result.stderr_output);
            if (reason.empty()) {
                reason = "exit code {}"_format(result.exit_code);
            }
            return reason;
        }

        // Removes the capture file on every exit path
        struct scoped_file {
            std::filesystem::path path;

            ~scoped_file() {
                std::error_code ec{};
                std::filesystem::remove(path, ec);
            }
        };

    }  // namespace detail

    std::optional<window_handle> parse_window_search(std::string_view output) {
        for (const auto& line : utils::split(output, '\n')) {
            if (auto id = utils::parse_arithmetic<window_handle>(utils::trim(line))) {
                return id;
            }
        }
        return std::nullopt;
    }

    system_gateway::system_gateway(startup_config cfg)
        : cfg_{std::move(cfg)}, proc_root_{internal::platform::proc_root} {}

    std::string system_gateway::run_helper(const std::vector<std::string>& args, std::string_view what) {
        debug_log("running ", utils::join_with_separator(args, " "));
        auto result = internal::run_subprocess(args, cfg_.helper_timeout_ms);
        if (result.timed_out) {
            throw std::runtime_error("{} timed out after {}ms"_format(what, cfg_.helper_timeout_ms));
        }
        if (result.exit_code != 0) {
            throw std::runtime_error("{} failed: {}"_format(what, detail::describe_failure(result)));
        }
        return std::move(result.stdout_output);
    }

    pid_t system_gateway::launch(const launch_request& request) {
        auto argv = internal::cmdline::build_launch_argv(cfg_.terminal_path.string(), request);
        log_verbose("launching {}", utils::join_with_separator(argv, " "));
        auto pid = internal::spawn_detached(argv);
        log_verbose("launched pid {} (class {})", pid, request.tag);
        return pid;
    }

    std::optional<window_handle> system_gateway::find_window(pid_t pid, std::string_view process_class) {
        auto result = internal::run_subprocess(
                {cfg_.xdotool_path.string(),
                 "search",
                 "--pid",
                 std::to_string(pid),
                 "--class",
                 std::string{process_class}},
                cfg_.helper_timeout_ms);
        if (result.timed_out) {
            throw std::runtime_error("window search timed out after {}ms"_format(cfg_.helper_timeout_ms));
        }
        // xdotool exits 1 when nothing matches
        if (result.exit_code != 0) {
            debug_log("no window for pid ", pid, " class ", process_class);
            return std::nullopt;
        }
        return parse_window_search(result.stdout_output);
    }

    std::vector<pid_t> system_gateway::list_pids(std::string_view process_name) {
        std::vector<pid_t> pids{};
        for (const auto& entry : internal::procfs::list_processes(proc_root_)) {
            if (entry.state == 'Z') {
                continue;
            }
            if (entry.comm == process_name) {
                pids.push_back(entry.pid);
            }
        }
        return pids;
    }

    std::optional<std::vector<std::string>> system_gateway::read_command_line(pid_t pid) {
        return internal::procfs::read_cmdline(proc_root_, pid);
    }

    std::optional<std::filesystem::path> system_gateway::read_working_directory(pid_t pid) {
        return internal::procfs::read_cwd(proc_root_, pid);
    }

    void system_gateway::send_keys(window_handle window, std::string_view keys) {
        run_helper(
                {cfg_.xdotool_path.string(), "key", "--window", std::to_string(window), std::string{keys}},
                "xdotool key");
    }

    std::string system_gateway::capture_text(window_handle window) {
        auto xdotool = cfg_.xdotool_path.string();
        auto target = std::to_string(window);

        run_helper({xdotool, "windowactivate", "--sync", target}, "xdotool windowactivate");
        // terminal select-all then copy; the terminal needs a moment between them
        run_helper({xdotool, "key", "--window", target, "ctrl+shift+a"}, "xdotool key");
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        run_helper({xdotool, "key", "--window", target, "ctrl+shift+c"}, "xdotool key");
        std::this_thread::sleep_for(std::chrono::milliseconds{100});

        return run_helper({cfg_.xclip_path.string(), "-o", "-selection", "clipboard"}, "xclip");
    }

    std::string system_gateway::capture_image(window_handle window) {
        std::error_code ec{};
        auto dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            dir = "/tmp";
        }
        detail::scoped_file shot{dir / "termctl-{}-{}.png"_format(::getpid(), utils::random_uuid())};

        run_helper({cfg_.import_path.string(), "-window", std::to_string(window), shot.path.string()}, "import");

        std::ifstream in{shot.path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("cannot read capture file {}"_format(shot.path.string()));
        }
        std::string png{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

        return "data:image/png;base64,{}"_format(utils::base64_encode(png));
    }

}  // namespace termctl
