#include "termctl/session.hpp"

#include "termctl/errors.hpp"
#include "termctl/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace termctl::literals;

namespace termctl::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::optional<std::string> name{};
            std::optional<std::string> version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::optional<std::string> protocolVersion{};
            std::optional<client_info> clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo,
                        "tools",
                        &T::tools);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::optional<std::string> name{};
            std::optional<glz::raw_json> arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content);
            };
        };

        // ── Helpers ─────────────────────────────────────────────────────

        static std::vector<tool_definition> tool_definitions() {
            std::vector<tool_definition> tools{};
            for (const auto& tool : tools::catalogue()) {
                tools.push_back(
                        tool_definition{
                                .name = tool.name,
                                .description = tool.description,
                                .inputSchema = glz::raw_json{tools::render_input_schema(tool)},
                        });
            }
            return tools;
        }

        template <typename T>
        static std::string write_result(const T& value) {
            std::string json{};
            auto ec = glz::write_json(value, json);
            if (ec) {
                throw std::runtime_error("failed to serialize result");
            }
            return json;
        }

        static void require_ready(session_state state) {
            if (state != session_state::ready) {
                throw error{error_kind::not_ready, "Server not initialized"};
            }
        }

        static bool is_blank(std::string_view text) {
            return utils::trim(text).empty();
        }

        static std::string make_response(const glz::rpc::id_t& id, std::string result_json) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.result = glz::raw_json{std::move(result_json)};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(const glz::rpc::id_t& id, int code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{static_cast<glz::rpc::error_e>(code), std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

    }  // namespace detail

    session::session(tools::dispatcher& dispatcher) : dispatcher_{dispatcher} {}

    std::string session::initialize(std::string_view params_json) {
        if (detail::is_blank(params_json)) {
            throw error{error_kind::invalid_handshake, "Invalid initialize params: missing params"};
        }

        detail::initialize_params params{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, params_json);
        if (ec) {
            throw error{error_kind::invalid_handshake, "Invalid initialize params: malformed params"};
        }
        if (!params.protocolVersion) {
            throw error{error_kind::invalid_handshake, "Invalid initialize params: missing protocolVersion"};
        }
        if (!params.clientInfo || !params.clientInfo->name || !params.clientInfo->version) {
            throw error{error_kind::invalid_handshake, "Invalid initialize params: missing clientInfo"};
        }

        log_verbose(
                "client {} {} (protocol {})",
                *params.clientInfo->name,
                *params.clientInfo->version,
                *params.protocolVersion);

        detail::initialize_result result{};
        result.protocolVersion = std::string{protocol_version};
        result.serverInfo = detail::server_info{.name = std::string{server_name}, .version = std::string{server_version}};
        result.tools = detail::tool_definitions();
        auto json = detail::write_result(result);

        state_ = session_state::ready;
        return json;
    }

    std::string session::list_tools() const {
        detail::require_ready(state_);

        detail::tools_list_result result{};
        result.tools = detail::tool_definitions();
        return detail::write_result(result);
    }

    std::string session::call_tool(std::string_view params_json) {
        detail::require_ready(state_);

        if (detail::is_blank(params_json)) {
            throw error{error_kind::invalid_arguments, "Missing call parameters"};
        }

        detail::tool_call_params params{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, params_json);
        if (ec) {
            throw error{error_kind::invalid_arguments, "Failed to parse tool call params"};
        }
        if (!params.name) {
            throw error{error_kind::invalid_arguments, "Missing tool name"};
        }

        std::string_view arguments{};
        if (params.arguments) {
            arguments = params.arguments->str;
        }

        detail::tool_call_result result{};
        result.content.push_back(detail::text_content{.text = dispatcher_.call(*params.name, arguments)});
        return detail::write_result(result);
    }

    std::optional<std::string> session::handle_line(std::string_view line) {
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, line);
        if (ec) {
            debug_log("undecodable request: ", glz::format_error(ec, line));
            return detail::make_error_response({}, rpc_code::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);
        std::string_view method_name{request.method};

        if (is_notification && method_name.starts_with(method::notification_prefix)) {
            debug_log("notification ", method_name);
            return std::nullopt;
        }

        log_verbose("<- {} ({})", method_name, state_);

        try {
            if (method_name == method::initialize) {
                return detail::make_response(request.id, initialize(request.params.str));
            }
            if (method_name == method::tools_list) {
                return detail::make_response(request.id, list_tools());
            }
            if (method_name == method::tools_call) {
                return detail::make_response(request.id, call_tool(request.params.str));
            }
            throw error{error_kind::unknown_method, "Method not found: {}"_format(method_name)};
        } catch (const error& e) {
            log_verbose("-> {} error: {}", e.kind(), e.what());
            return detail::make_error_response(request.id, e.code(), e.what());
        } catch (const std::exception& e) {
            log_error("{} failed: {}", method_name, e.what());
            return detail::make_error_response(request.id, rpc_code::internal_error, e.what());
        }
    }

}  // namespace termctl::mcp
