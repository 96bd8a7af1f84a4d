#pragma once

#include "tools.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace termctl::mcp {

    using namespace std::string_view_literals;

    inline constexpr auto protocol_version = "2024-11-05"sv;
    inline constexpr auto server_name = "termctl"sv;
    inline constexpr auto server_version = "0.1.0"sv;

    namespace method {
        inline constexpr auto initialize = "initialize"sv;
        inline constexpr auto tools_list = "tools/list"sv;
        inline constexpr auto tools_call = "tools/call"sv;
        inline constexpr auto notification_prefix = "notifications/"sv;
    }  // namespace method

    enum class session_state : uint8_t { uninitialized, ready };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::uninitialized:
                return "uninitialized"sv;
            case session_state::ready:
                return "ready"sv;
        }
        return "uninitialized"sv;
    }

    /*
     * Handshake-gated JSON-RPC session. Every entry point is a plain
     * request -> response transformation; nothing is pushed unprompted.
     *
     * The typed operations return the JSON text of a `result` member and throw
     * termctl::error on failure. handle_line() wraps them into complete
     * envelopes and never throws for request-level failures.
     */
    class session {
      public:
        explicit session(tools::dispatcher& dispatcher);

        // initialize: params must carry protocolVersion and clientInfo{name,version}
        std::string initialize(std::string_view params_json);
        // tools/list
        std::string list_tools() const;
        // tools/call: params {name, arguments?}
        std::string call_tool(std::string_view params_json);

        // One request line in, one response line out; nullopt for notifications.
        std::optional<std::string> handle_line(std::string_view line);

        session_state state() const { return state_; }

      private:
        tools::dispatcher& dispatcher_;
        session_state state_{session_state::uninitialized};
    };

}  // namespace termctl::mcp
