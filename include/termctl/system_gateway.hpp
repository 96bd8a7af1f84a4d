#pragma once

#include "config.hpp"
#include "gateway.hpp"

namespace termctl {

    // Linux/X11 collaborators: /proc for the process table, fork/exec for
    // launching, xdotool/xclip/import for window work. Every helper runs with
    // startup_config::helper_timeout_ms as its wall-clock budget.
    class system_gateway final : public process_launcher,
                                 public window_resolver,
                                 public process_table_reader,
                                 public input_injector,
                                 public capture_service {
      public:
        explicit system_gateway(startup_config cfg);

        pid_t launch(const launch_request& request) override;

        std::optional<window_handle> find_window(pid_t pid, std::string_view process_class) override;

        std::vector<pid_t> list_pids(std::string_view process_name) override;
        std::optional<std::vector<std::string>> read_command_line(pid_t pid) override;
        std::optional<std::filesystem::path> read_working_directory(pid_t pid) override;

        void send_keys(window_handle window, std::string_view keys) override;

        std::string capture_text(window_handle window) override;
        std::string capture_image(window_handle window) override;

      private:
        startup_config cfg_;
        std::filesystem::path proc_root_;

        std::string run_helper(const std::vector<std::string>& args, std::string_view what);
    };

    // First line of `xdotool search` output that parses as a window id
    std::optional<window_handle> parse_window_search(std::string_view output);

}  // namespace termctl
