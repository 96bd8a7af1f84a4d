#include "termctl/mcp.hpp"

#include "termctl/neovim.hpp"
#include "termctl/registry.hpp"
#include "termctl/system_gateway.hpp"
#include "termctl/tools.hpp"

#include <csignal>
#include <iostream>
#include <string>

namespace termctl::mcp {

    namespace detail {

        static bool send(std::ostream& out, const std::string& json) {
            out << json << '\n';
            out.flush();
            return static_cast<bool>(out);
        }

    }  // namespace detail

    int serve(std::istream& in, std::ostream& out, session& server) {
        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim(line).empty()) {
                continue;
            }

            auto response = server.handle_line(line);
            if (!response) {
                continue;
            }
            if (!detail::send(out, *response)) {
                log_error("output stream closed");
                return 1;
            }
        }

        return 0;
    }

    int run_mcp_server(const startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        system_gateway gateway{cfg};
        neovim_inspector inspector{cfg};

        registry_options options{};
        options.process_name = cfg.process_name;
        options.window_class = cfg.window_class;
        options.title_prefix = cfg.title_prefix;
        options.settle_delay = std::chrono::milliseconds{cfg.spawn_settle_ms};

        registry instances{gateway, gateway, gateway, std::move(options)};
        tools::dispatcher dispatcher{instances, gateway, gateway, inspector};
        session server{dispatcher};

        log_info("serving MCP on stdio (terminal: {})", cfg.terminal_path.string());
        auto status = serve(std::cin, std::cout, server);
        log_verbose("input closed, {} instance(s) tracked", instances.size());
        return status;
    }

}  // namespace termctl::mcp
