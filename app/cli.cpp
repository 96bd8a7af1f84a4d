#include "cli.hpp"

#include "termctl/session.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace termctl::cli {

    namespace detail {

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "terminal=" << cfg.terminal_path.string() << '\n';
            os << "process_name=" << cfg.process_name << '\n';
            os << "window_class=" << cfg.window_class << '\n';
            os << "title_prefix=" << cfg.title_prefix << '\n';
            os << "spawn_settle_ms=" << cfg.spawn_settle_ms << '\n';
            os << "helper_timeout_ms=" << cfg.helper_timeout_ms << '\n';
            os << "xdotool=" << cfg.xdotool_path.string() << '\n';
            os << "xclip=" << cfg.xclip_path.string() << '\n';
            os << "import=" << cfg.import_path.string() << '\n';
            os << "nvim=" << cfg.nvim_path.string() << '\n';
            os << "lsof=" << cfg.lsof_path.string() << '\n';
            os << "log=" << (cfg.quiet ? "quiet" : cfg.verbose ? "verbose" : "normal") << '\n';
        }

        static bool require_non_empty(std::string_view option, std::string_view value) {
            if (utils::trim(value).empty()) {
                std::cerr << "invalid " << option << " value: must be non-empty\n";
                return false;
            }
            return true;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"termctl: MCP server managing Alacritty terminals over stdio"};

        bool show_version = false;
        std::string terminal_arg{cfg.terminal_path.string()};
        std::string xdotool_arg{cfg.xdotool_path.string()};
        std::string xclip_arg{cfg.xclip_path.string()};
        std::string import_arg{cfg.import_path.string()};
        std::string nvim_arg{cfg.nvim_path.string()};
        std::string lsof_arg{cfg.lsof_path.string()};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--terminal", terminal_arg, "Terminal emulator executable");
        app.add_option("--process-name", cfg.process_name, "Process name of managed terminals");
        app.add_option("--window-class", cfg.window_class, "Window class of discovered terminals");
        app.add_option("--title-prefix", cfg.title_prefix, "Prefix of default titles and window classes");
        app.add_option("--spawn-settle-ms", cfg.spawn_settle_ms, "Wait before looking up a new window (ms)");
        app.add_option("--helper-timeout-ms", cfg.helper_timeout_ms, "Timeout for helper tools (ms)");
        app.add_option("--xdotool", xdotool_arg, "xdotool executable path");
        app.add_option("--xclip", xclip_arg, "xclip executable path");
        app.add_option("--import", import_arg, "ImageMagick import executable path");
        app.add_option("--nvim", nvim_arg, "nvim executable path");
        app.add_option("--lsof", lsof_arg, "lsof executable path");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only log errors");
        app.add_flag("--verbose", cfg.verbose, "Log every request and helper invocation");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (cfg.spawn_settle_ms < 0) {
            std::cerr << "invalid --spawn-settle-ms value: " << cfg.spawn_settle_ms << " (expected >= 0)\n";
            return std::optional<int>{2};
        }
        if (cfg.helper_timeout_ms <= 0) {
            std::cerr << "invalid --helper-timeout-ms value: " << cfg.helper_timeout_ms << " (expected > 0)\n";
            return std::optional<int>{2};
        }
        if (!detail::require_non_empty("--terminal", terminal_arg) ||
            !detail::require_non_empty("--process-name", cfg.process_name) ||
            !detail::require_non_empty("--window-class", cfg.window_class) ||
            !detail::require_non_empty("--title-prefix", cfg.title_prefix)) {
            return std::optional<int>{2};
        }

        cfg.terminal_path = terminal_arg;
        cfg.xdotool_path = xdotool_arg;
        cfg.xclip_path = xclip_arg;
        cfg.import_path = import_arg;
        cfg.nvim_path = nvim_arg;
        cfg.lsof_path = lsof_arg;

        if (cfg.quiet) {
            set_log_level(log_level::quiet);
        }
        else if (cfg.verbose) {
            set_log_level(log_level::verbose);
        }

        if (show_version) {
            std::cout << mcp::server_name << ' ' << mcp::server_version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace termctl::cli
