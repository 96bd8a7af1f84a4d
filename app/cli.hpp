#pragma once

#include "termctl/config.hpp"

#include <optional>

namespace termctl::cli {

    // Returns an exit status when startup should stop here (help, version,
    // print-config or an invalid option), nullopt to go on serving.
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

}  // namespace termctl::cli
