#pragma once

#include <glaze/glaze.hpp>

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace termctl {

    using window_handle = std::uint64_t;

    // One terminal process tracked by the registry. `id` is minted by the
    // registry and is the only stable key; `pid` is immutable once assigned.
    struct managed_instance {
        std::string id{};
        pid_t pid{};
        std::optional<window_handle> window_id{};
        std::string title{};
        std::string command{};
        std::uint64_t created_at{};
        std::string window_class{};

        bool operator==(const managed_instance&) const = default;

        struct glaze {
            using T = managed_instance;
            static constexpr auto value = glz::object(
                    "id",
                    &T::id,
                    "pid",
                    &T::pid,
                    "window_id",
                    &T::window_id,
                    "title",
                    &T::title,
                    "command",
                    &T::command,
                    "created_at",
                    &T::created_at,
                    "window_class",
                    &T::window_class);
        };
    };

    // Arguments of spawn_instance
    struct spawn_spec {
        std::optional<std::string> command{};
        std::optional<std::vector<std::string>> args{};
        std::optional<std::string> working_directory{};
        std::optional<std::string> title{};
        struct glaze {
            using T = spawn_spec;
            static constexpr auto value = glz::object(
                    "command",
                    &T::command,
                    "args",
                    &T::args,
                    "working_directory",
                    &T::working_directory,
                    "title",
                    &T::title);
        };
    };

    // What the launcher is asked to start. `tag` is also the window class.
    struct launch_request {
        std::string title{};
        std::optional<std::string> working_directory{};
        std::optional<std::string> command{};
        std::vector<std::string> args{};
        std::string tag{};
    };

}  // namespace termctl
