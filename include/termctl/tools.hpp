#pragma once

#include "gateway.hpp"
#include "registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termctl::tools {

    using namespace std::string_view_literals;

    namespace name {
        inline constexpr auto list_instances = "list_instances"sv;
        inline constexpr auto spawn_instance = "spawn_instance"sv;
        inline constexpr auto send_keys = "send_keys"sv;
        inline constexpr auto screenshot_instance = "screenshot_instance"sv;
        inline constexpr auto get_neovim_context = "get_neovim_context"sv;
    }  // namespace name

    enum class param_type : uint8_t { string, string_array, boolean, integer };

    // JSON Schema type keyword
    inline constexpr std::string_view to_string(param_type type) {
        switch (type) {
            case param_type::string:
                return "string"sv;
            case param_type::string_array:
                return "array"sv;
            case param_type::boolean:
                return "boolean"sv;
            case param_type::integer:
                return "integer"sv;
        }
        return "string"sv;
    }

    struct param_spec {
        std::string name{};
        param_type type{param_type::string};
        bool required{false};
        std::string description{};
        std::vector<std::string> allowed{};
        std::optional<int64_t> minimum{};
        std::optional<int64_t> maximum{};
        // literal JSON, e.g. "true" or "\"text\""
        std::optional<std::string> default_json{};
    };

    struct tool_spec {
        std::string name{};
        std::string description{};
        std::vector<param_spec> params{};

        const param_spec* find_param(std::string_view param_name) const;
    };

    const std::vector<tool_spec>& catalogue();
    const tool_spec* find_tool(std::string_view tool_name);

    // {"type":"object","properties":{...},"required":[...],"additionalProperties":false}
    std::string render_input_schema(const tool_spec& tool);

    // Throws termctl::error(invalid_arguments) naming the first offending field.
    // Empty or null input is treated as an empty object.
    void validate_arguments(const tool_spec& tool, std::string_view arguments_json);

    /*
     * Routes a named tool call to the registry and collaborators. Arguments are
     * validated against the catalogue before anything else runs; every result
     * is a single text payload.
     */
    class dispatcher {
      public:
        dispatcher(
                registry& instances,
                input_injector& injector,
                capture_service& capture,
                editor_inspector& inspector);

        std::string call(std::string_view tool_name, std::string_view arguments_json);

      private:
        std::string list_instances();
        std::string spawn_instance(std::string_view arguments_json);
        std::string send_keys(std::string_view arguments_json);
        std::string screenshot_instance(std::string_view arguments_json);
        std::string get_neovim_context(std::string_view arguments_json);

        registry& instances_;
        input_injector& injector_;
        capture_service& capture_;
        editor_inspector& inspector_;
    };

}  // namespace termctl::tools
