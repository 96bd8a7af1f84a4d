#pragma once

#include "utils.hpp"

#include <filesystem>
#include <string>

namespace termctl {

    using namespace std::string_view_literals;

    /*
     * termctl Startup Config Options
     *
     * Terminal family
     * - terminal_path: Terminal emulator executable launched by spawn_instance.
     * - process_name: Exact process name (/proc/<pid>/comm) of managed terminals.
     * - window_class: X11 class used to find windows of discovered terminals.
     * - title_prefix: Prefix of default titles and of per-instance window classes.
     *
     * Timing
     * - spawn_settle_ms: Fixed wait between launching a terminal and looking up its window.
     * - helper_timeout_ms: Wall-clock budget for every external helper invocation.
     *
     * Helper tools
     * - xdotool_path: Window search and synthetic key input.
     * - xclip_path: Clipboard readback for text captures.
     * - import_path: ImageMagick window rasterizer for image captures.
     * - nvim_path: Neovim client used to query a running editor over its socket.
     * - lsof_path: Last-resort lookup of an editor's unix socket.
     *
     * Output
     * - quiet/verbose: Coarse verbosity knobs for stderr logs.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class capture_format { text, image };

    inline constexpr std::string_view to_string(capture_format format) {
        switch (format) {
            case capture_format::text:
                return "text"sv;
            case capture_format::image:
                return "image"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_capture_format(std::string_view text, capture_format& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = capture_format::text;
            return true;
        }
        if (utils::str_case_eq(text, "image"sv)) {
            out = capture_format::image;
            return true;
        }
        return false;
    }

    struct startup_config {
        std::filesystem::path terminal_path{"alacritty"};
        std::string process_name{"alacritty"};
        std::string window_class{"Alacritty"};
        std::string title_prefix{"alacritty-mcp-"};

        int spawn_settle_ms{500};
        int helper_timeout_ms{10'000};

        std::filesystem::path xdotool_path{"xdotool"};
        std::filesystem::path xclip_path{"xclip"};
        std::filesystem::path import_path{"import"};
        std::filesystem::path nvim_path{"nvim"};
        std::filesystem::path lsof_path{"lsof"};

        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

}  // namespace termctl
