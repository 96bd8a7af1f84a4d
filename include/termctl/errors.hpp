#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace termctl {

    using namespace std::string_view_literals;

    /*
     * Failure taxonomy shared by every layer
     *
     * Transport / session
     * - parse_error: request line is not a decodable JSON-RPC envelope.
     * - unknown_method: method outside initialize, tools/list, tools/call.
     * - not_ready: tools/list or tools/call before a successful initialize.
     * - invalid_handshake: initialize params missing protocolVersion or clientInfo.
     *
     * Tool dispatch
     * - unknown_tool: tools/call names a tool outside the catalogue.
     * - invalid_arguments: arguments do not satisfy the tool's schema.
     * - tool_execution_failed: a collaborator failed; carries its diagnostic.
     *
     * Registry
     * - instance_not_found: id is not tracked; message embeds the id.
     * - window_not_found: no window is associated with the instance pid.
     * - launch_failed: the terminal process could not be started.
     */
    enum class error_kind : uint8_t {
        parse_error,
        unknown_method,
        not_ready,
        invalid_handshake,
        unknown_tool,
        invalid_arguments,
        instance_not_found,
        window_not_found,
        launch_failed,
        tool_execution_failed,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::parse_error:
                return "parse_error"sv;
            case error_kind::unknown_method:
                return "unknown_method"sv;
            case error_kind::not_ready:
                return "not_ready"sv;
            case error_kind::invalid_handshake:
                return "invalid_handshake"sv;
            case error_kind::unknown_tool:
                return "unknown_tool"sv;
            case error_kind::invalid_arguments:
                return "invalid_arguments"sv;
            case error_kind::instance_not_found:
                return "instance_not_found"sv;
            case error_kind::window_not_found:
                return "window_not_found"sv;
            case error_kind::launch_failed:
                return "launch_failed"sv;
            case error_kind::tool_execution_failed:
                return "tool_execution_failed"sv;
        }
        return "tool_execution_failed"sv;
    }

    namespace rpc_code {
        inline constexpr int parse_error = -32700;
        inline constexpr int method_not_found = -32601;
        inline constexpr int invalid_params = -32602;
        inline constexpr int internal_error = -32603;
        inline constexpr int not_initialized = -32002;
    }  // namespace rpc_code

    inline constexpr int to_rpc_code(error_kind kind) {
        switch (kind) {
            case error_kind::parse_error:
                return rpc_code::parse_error;
            case error_kind::unknown_method:
                return rpc_code::method_not_found;
            case error_kind::not_ready:
                return rpc_code::not_initialized;
            case error_kind::invalid_handshake:
            case error_kind::invalid_arguments:
                return rpc_code::invalid_params;
            case error_kind::unknown_tool:
            case error_kind::instance_not_found:
            case error_kind::window_not_found:
            case error_kind::launch_failed:
            case error_kind::tool_execution_failed:
                return rpc_code::internal_error;
        }
        return rpc_code::internal_error;
    }

    class error : public std::runtime_error {
      public:
        error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }
        int code() const noexcept { return to_rpc_code(kind_); }

      private:
        error_kind kind_;
    };

}  // namespace termctl
