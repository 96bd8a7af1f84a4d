#pragma once

#include "termctl/instance.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termctl::internal::cmdline {

    using namespace std::string_view_literals;

    namespace flag {
        inline constexpr auto title = "--title"sv;
        inline constexpr auto title_short = "-t"sv;
        inline constexpr auto command = "--command"sv;
        inline constexpr auto command_short = "-e"sv;
        inline constexpr auto window_class = "--class"sv;
        inline constexpr auto working_directory = "--working-directory"sv;
    }  // namespace flag

    struct launch_flags {
        std::optional<std::string> title{};
        std::optional<std::string> command{};
        std::optional<std::string> window_class{};
    };

    // Each recognised flag takes the single token after it; a trailing flag
    // with no value is ignored. Later occurrences win.
    inline launch_flags parse_launch_flags(const std::vector<std::string>& argv) {
        launch_flags flags{};

        size_t i = 0;
        while (i < argv.size()) {
            std::string_view token{argv[i]};

            std::optional<std::string>* slot = nullptr;
            if (token == flag::title || token == flag::title_short) {
                slot = &flags.title;
            }
            else if (token == flag::command || token == flag::command_short) {
                slot = &flags.command;
            }
            else if (token == flag::window_class) {
                slot = &flags.window_class;
            }

            if (slot != nullptr && i + 1U < argv.size()) {
                *slot = argv[i + 1U];
                i += 2U;
            }
            else {
                ++i;
            }
        }

        return flags;
    }

    // <terminal> --title T [--working-directory D] --class TAG [--command C args...]
    // The terminal treats everything after --command as the child's argv, so it goes last.
    inline std::vector<std::string> build_launch_argv(std::string_view terminal, const launch_request& request) {
        std::vector<std::string> argv{};
        argv.emplace_back(terminal);

        argv.emplace_back(flag::title);
        argv.push_back(request.title);

        if (request.working_directory) {
            argv.emplace_back(flag::working_directory);
            argv.push_back(*request.working_directory);
        }

        argv.emplace_back(flag::window_class);
        argv.push_back(request.tag);

        if (request.command) {
            argv.emplace_back(flag::command);
            argv.push_back(*request.command);
            argv.insert(argv.end(), request.args.begin(), request.args.end());
        }

        return argv;
    }

}  // namespace termctl::internal::cmdline
