#pragma once

#include "instance.hpp"

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termctl {

    // Collaborators the core consumes. Implementations report failures by
    // throwing std::runtime_error with a human-readable diagnostic.

    class process_launcher {
      public:
        virtual ~process_launcher() = default;

        // Starts a terminal process and returns its pid.
        virtual pid_t launch(const launch_request& request) = 0;
    };

    class window_resolver {
      public:
        virtual ~window_resolver() = default;

        virtual std::optional<window_handle> find_window(pid_t pid, std::string_view process_class) = 0;
    };

    class process_table_reader {
      public:
        virtual ~process_table_reader() = default;

        // Live pids whose process name equals `process_name`
        virtual std::vector<pid_t> list_pids(std::string_view process_name) = 0;
        virtual std::optional<std::vector<std::string>> read_command_line(pid_t pid) = 0;
        virtual std::optional<std::filesystem::path> read_working_directory(pid_t pid) = 0;
    };

    class input_injector {
      public:
        virtual ~input_injector() = default;

        // `keys` uses xdotool key syntax, e.g. "ctrl+c", "Return"
        virtual void send_keys(window_handle window, std::string_view keys) = 0;
    };

    class capture_service {
      public:
        virtual ~capture_service() = default;

        virtual std::string capture_text(window_handle window) = 0;
        // PNG rendered as a data: URL
        virtual std::string capture_image(window_handle window) = 0;
    };

    struct editor_query {
        bool include_diagnostics{true};
        bool include_buffers{true};
        int context_lines{5};
    };

    class editor_inspector {
      public:
        virtual ~editor_inspector() = default;

        // `pid` is the terminal hosting the editor; result is rendered JSON
        virtual std::string inspect(pid_t pid, const editor_query& query) = 0;
    };

}  // namespace termctl
