#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace termctl::internal {

    struct subprocess_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};
    };

    // Runs `args` to completion, capturing both pipes; killed after timeout_ms.
    subprocess_result run_subprocess(const std::vector<std::string>& args, int timeout_ms);

    // Starts `args` in a new session, detached from this process (the child is
    // reparented to init, so no reaping is needed). Returns the pid of the
    // exec'd program. Throws std::runtime_error if fork or exec fails.
    pid_t spawn_detached(const std::vector<std::string>& args);

}  // namespace termctl::internal
