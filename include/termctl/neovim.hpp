#pragma once

#include "config.hpp"
#include "gateway.hpp"

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termctl {

    namespace nvim {

        // Default server socket locations of an editor process, most likely first
        std::vector<std::filesystem::path> socket_candidates(pid_t pid, uid_t uid, std::string_view runtime_dir);

        // Lua expression gathering cursor, mode, buffers and diagnostics as one JSON string
        std::string context_script(const editor_query& query);

        // `script` wrapped for `nvim --remote-expr`
        std::string remote_expr(std::string_view script);

        // First nvim unix socket named in `lsof -U -Fn` output
        std::optional<std::filesystem::path> parse_lsof_sockets(std::string_view output);

    }  // namespace nvim

    // Reads editor state from the Neovim process running inside a terminal.
    // Falls back to process-level information when no server socket answers.
    class neovim_inspector final : public editor_inspector {
      public:
        explicit neovim_inspector(const startup_config& cfg);

        std::string inspect(pid_t pid, const editor_query& query) override;

      private:
        std::filesystem::path nvim_path_;
        std::filesystem::path lsof_path_;
        std::filesystem::path proc_root_;
        int timeout_ms_;

        std::optional<std::filesystem::path> find_socket(pid_t nvim_pid) const;
        std::optional<std::string> version() const;
        std::optional<std::string> config_path() const;
    };

}  // namespace termctl
