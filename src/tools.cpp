#include "termctl/tools.hpp"

#include "termctl/config.hpp"
#include "termctl/errors.hpp"
#include "termctl/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace termctl::literals;

namespace termctl::tools {

    namespace detail {

        // ── Schema rendering types ──────────────────────────────────────

        struct items_schema {
            std::string type{"string"};
            struct glaze {
                using T = items_schema;
                static constexpr auto value = glz::object(&T::type);
            };
        };

        struct property_schema {
            std::string type{};
            std::string description{};
            std::optional<std::vector<std::string>> allowed{};
            std::optional<items_schema> items{};
            std::optional<int64_t> minimum{};
            std::optional<int64_t> maximum{};
            std::optional<glz::raw_json> default_value{};
            struct glaze {
                using T = property_schema;
                static constexpr auto value = glz::object(
                        "type",
                        &T::type,
                        "description",
                        &T::description,
                        "enum",
                        &T::allowed,
                        "items",
                        &T::items,
                        "minimum",
                        &T::minimum,
                        "maximum",
                        &T::maximum,
                        "default",
                        &T::default_value);
            };
        };

        struct object_schema {
            std::string type{"object"};
            std::map<std::string, property_schema> properties{};
            std::vector<std::string> required{};
            bool additional_properties{false};
            struct glaze {
                using T = object_schema;
                static constexpr auto value = glz::object(
                        "type",
                        &T::type,
                        "properties",
                        &T::properties,
                        "required",
                        &T::required,
                        "additionalProperties",
                        &T::additional_properties);
            };
        };

        // ── Typed tool arguments (read after validation) ────────────────

        struct send_keys_args {
            std::string instance_id{};
            std::string keys{};
            struct glaze {
                using T = send_keys_args;
                static constexpr auto value = glz::object(&T::instance_id, &T::keys);
            };
        };

        struct screenshot_args {
            std::string instance_id{};
            std::optional<std::string> format{};
            struct glaze {
                using T = screenshot_args;
                static constexpr auto value = glz::object(&T::instance_id, &T::format);
            };
        };

        struct neovim_context_args {
            std::string instance_id{};
            std::optional<bool> include_diagnostics{};
            std::optional<bool> include_buffers{};
            // integral values were checked by validate_arguments
            std::optional<double> context_lines{};
            struct glaze {
                using T = neovim_context_args;
                static constexpr auto value = glz::object(
                        &T::instance_id, &T::include_diagnostics, &T::include_buffers, &T::context_lines);
            };
        };

        // ── Catalogue ───────────────────────────────────────────────────

        static param_spec instance_id_param(std::string description) {
            return param_spec{
                    .name = "instance_id",
                    .type = param_type::string,
                    .required = true,
                    .description = std::move(description)};
        }

        static std::vector<tool_spec> build_catalogue() {
            std::vector<tool_spec> tools{};

            tools.push_back(
                    tool_spec{
                            .name = std::string{name::list_instances},
                            .description = "List all running Alacritty terminal instances",
                            .params = {}});

            tools.push_back(
                    tool_spec{
                            .name = std::string{name::spawn_instance},
                            .description = "Spawn a new Alacritty terminal instance",
                            .params = {
                                    param_spec{
                                            .name = "command",
                                            .type = param_type::string,
                                            .description = "Command to run in the terminal"},
                                    param_spec{
                                            .name = "args",
                                            .type = param_type::string_array,
                                            .description = "Arguments for the command"},
                                    param_spec{
                                            .name = "working_directory",
                                            .type = param_type::string,
                                            .description = "Working directory for the terminal"},
                                    param_spec{
                                            .name = "title",
                                            .type = param_type::string,
                                            .description = "Title for the terminal window"},
                            }});

            tools.push_back(
                    tool_spec{
                            .name = std::string{name::send_keys},
                            .description = "Send key commands to an Alacritty instance",
                            .params = {
                                    instance_id_param("ID of the Alacritty instance"),
                                    param_spec{
                                            .name = "keys",
                                            .type = param_type::string,
                                            .required = true,
                                            .description =
                                                    "Keys to send (xdotool format, e.g., 'ctrl+c', 'Return', 'Hello')"},
                            }});

            tools.push_back(
                    tool_spec{
                            .name = std::string{name::screenshot_instance},
                            .description = "Take a screenshot of an Alacritty instance",
                            .params = {
                                    instance_id_param("ID of the Alacritty instance"),
                                    param_spec{
                                            .name = "format",
                                            .type = param_type::string,
                                            .description =
                                                    "Format of the screenshot: 'text' for terminal text content, "
                                                    "'image' for visual screenshot",
                                            .allowed = {"text", "image"},
                                            .default_json = R"("text")"},
                            }});

            tools.push_back(
                    tool_spec{
                            .name = std::string{name::get_neovim_context},
                            .description =
                                    "Extract comprehensive Neovim context including cursor position, diagnostics, "
                                    "open buffers, and LSP status",
                            .params = {
                                    instance_id_param("ID of the Alacritty instance running Neovim"),
                                    param_spec{
                                            .name = "include_diagnostics",
                                            .type = param_type::boolean,
                                            .description = "Include LSP diagnostics in the context",
                                            .default_json = "true"},
                                    param_spec{
                                            .name = "include_buffers",
                                            .type = param_type::boolean,
                                            .description = "Include list of open buffers",
                                            .default_json = "true"},
                                    param_spec{
                                            .name = "context_lines",
                                            .type = param_type::integer,
                                            .description = "Number of lines around cursor to include",
                                            .minimum = 0,
                                            .maximum = 50,
                                            .default_json = "5"},
                            }});

            return tools;
        }

        // ── Validation ──────────────────────────────────────────────────

        static error invalid(const tool_spec& tool, std::string_view reason) {
            return error{error_kind::invalid_arguments, "Invalid arguments for {}: {}"_format(tool.name, reason)};
        }

        static bool is_blank(std::string_view text) {
            return utils::trim(text).empty();
        }

        static void check_value(const tool_spec& tool, const param_spec& param, const glz::generic& value) {
            switch (param.type) {
                case param_type::string: {
                    if (!value.is_string()) {
                        throw invalid(tool, "field '{}' must be a string"_format(param.name));
                    }
                    if (!param.allowed.empty()) {
                        const auto& text = value.get_string();
                        if (std::ranges::find(param.allowed, text) == param.allowed.end()) {
                            throw invalid(
                                    tool,
                                    "field '{}' must be one of [{}], got '{}'"_format(
                                            param.name, utils::join_with_separator(param.allowed, ", "), text));
                        }
                    }
                    return;
                }
                case param_type::string_array: {
                    if (!value.is_array()) {
                        throw invalid(tool, "field '{}' must be an array of strings"_format(param.name));
                    }
                    for (const auto& item : value.get_array()) {
                        if (!item.is_string()) {
                            throw invalid(tool, "field '{}' must contain only strings"_format(param.name));
                        }
                    }
                    return;
                }
                case param_type::boolean: {
                    if (!value.is_boolean()) {
                        throw invalid(tool, "field '{}' must be a boolean"_format(param.name));
                    }
                    return;
                }
                case param_type::integer: {
                    if (!value.is_number()) {
                        throw invalid(tool, "field '{}' must be an integer"_format(param.name));
                    }
                    auto number = value.get_number();
                    if (std::trunc(number) != number) {
                        throw invalid(tool, "field '{}' must be an integer"_format(param.name));
                    }
                    if ((param.minimum && number < static_cast<double>(*param.minimum)) ||
                        (param.maximum && number > static_cast<double>(*param.maximum))) {
                        throw invalid(
                                tool,
                                "field '{}' must be between {} and {}"_format(
                                        param.name, param.minimum.value_or(0), param.maximum.value_or(0)));
                    }
                    return;
                }
            }
        }

        static void check_required(const tool_spec& tool, const glz::generic::object_t& fields) {
            for (const auto& param : tool.params) {
                if (!param.required) {
                    continue;
                }
                auto it = fields.find(param.name);
                if (it == fields.end() || it->second.is_null()) {
                    throw invalid(tool, "missing required field '{}'"_format(param.name));
                }
            }
        }

        template <typename T>
        static T read_arguments(const tool_spec& tool, std::string_view arguments_json) {
            T args{};
            if (is_blank(arguments_json) || utils::trim(arguments_json) == "null"sv) {
                return args;
            }
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, arguments_json);
            if (ec) {
                throw invalid(tool, "failed to parse arguments");
            }
            return args;
        }

        template <typename T>
        static std::string render_pretty(const T& value) {
            std::string json{};
            auto ec = glz::write<glz::opts{.prettify = true}>(value, json);
            if (ec) {
                throw std::runtime_error("failed to serialize result");
            }
            return json;
        }

    }  // namespace detail

    const param_spec* tool_spec::find_param(std::string_view param_name) const {
        auto it = std::ranges::find(params, param_name, &param_spec::name);
        return it == params.end() ? nullptr : &*it;
    }

    const std::vector<tool_spec>& catalogue() {
        static const std::vector<tool_spec> tools = detail::build_catalogue();
        return tools;
    }

    const tool_spec* find_tool(std::string_view tool_name) {
        const auto& tools = catalogue();
        auto it = std::ranges::find(tools, tool_name, &tool_spec::name);
        return it == tools.end() ? nullptr : &*it;
    }

    std::string render_input_schema(const tool_spec& tool) {
        detail::object_schema schema{};
        for (const auto& param : tool.params) {
            detail::property_schema property{};
            property.type = std::string{to_string(param.type)};
            property.description = param.description;
            if (!param.allowed.empty()) {
                property.allowed = param.allowed;
            }
            if (param.type == param_type::string_array) {
                property.items = detail::items_schema{};
            }
            property.minimum = param.minimum;
            property.maximum = param.maximum;
            if (param.default_json) {
                property.default_value = glz::raw_json{*param.default_json};
            }
            schema.properties.emplace(param.name, std::move(property));
            if (param.required) {
                schema.required.push_back(param.name);
            }
        }

        std::string json{};
        auto ec = glz::write_json(schema, json);
        if (ec) {
            throw std::runtime_error("failed to serialize input schema for {}"_format(tool.name));
        }
        return json;
    }

    void validate_arguments(const tool_spec& tool, std::string_view arguments_json) {
        if (detail::is_blank(arguments_json)) {
            arguments_json = "{}"sv;
        }

        glz::generic payload{};
        auto ec = glz::read_json(payload, arguments_json);
        if (ec) {
            throw detail::invalid(tool, "arguments are not valid JSON");
        }
        if (payload.is_null()) {
            detail::check_required(tool, glz::generic::object_t{});
            return;
        }
        if (!payload.is_object()) {
            throw detail::invalid(tool, "arguments must be an object");
        }

        const auto& fields = payload.get_object();
        for (const auto& [key, value] : fields) {
            const auto* param = tool.find_param(key);
            if (param == nullptr) {
                throw detail::invalid(tool, "unknown field '{}'"_format(key));
            }
            if (value.is_null()) {
                continue;
            }
            detail::check_value(tool, *param, value);
        }

        detail::check_required(tool, fields);
    }

    dispatcher::dispatcher(
            registry& instances, input_injector& injector, capture_service& capture, editor_inspector& inspector)
        : instances_{instances}, injector_{injector}, capture_{capture}, inspector_{inspector} {}

    std::string dispatcher::call(std::string_view tool_name, std::string_view arguments_json) {
        const auto* tool = find_tool(tool_name);
        if (tool == nullptr) {
            throw error{error_kind::unknown_tool, "Unknown tool: {}"_format(tool_name)};
        }

        validate_arguments(*tool, arguments_json);
        debug_log("dispatching ", tool->name);

        try {
            if (tool_name == name::list_instances) {
                return list_instances();
            }
            if (tool_name == name::spawn_instance) {
                return spawn_instance(arguments_json);
            }
            if (tool_name == name::send_keys) {
                return send_keys(arguments_json);
            }
            if (tool_name == name::screenshot_instance) {
                return screenshot_instance(arguments_json);
            }
            return get_neovim_context(arguments_json);
        } catch (const error&) {
            throw;
        } catch (const std::exception& e) {
            throw error{error_kind::tool_execution_failed, "{} failed: {}"_format(tool->name, e.what())};
        }
    }

    std::string dispatcher::list_instances() {
        auto instances = instances_.list();
        return "Found {} Alacritty instances:\n{}"_format(instances.size(), detail::render_pretty(instances));
    }

    std::string dispatcher::spawn_instance(std::string_view arguments_json) {
        auto spec = detail::read_arguments<spawn_spec>(*find_tool(name::spawn_instance), arguments_json);
        auto instance = instances_.create(spec);
        return "Spawned new Alacritty instance:\n{}"_format(detail::render_pretty(instance));
    }

    std::string dispatcher::send_keys(std::string_view arguments_json) {
        auto args = detail::read_arguments<detail::send_keys_args>(*find_tool(name::send_keys), arguments_json);
        auto window = instances_.resolve_window(args.instance_id);
        injector_.send_keys(window, args.keys);
        return "Sent keys '{}' to instance {}"_format(args.keys, args.instance_id);
    }

    std::string dispatcher::screenshot_instance(std::string_view arguments_json) {
        const auto& tool = *find_tool(name::screenshot_instance);
        auto args = detail::read_arguments<detail::screenshot_args>(tool, arguments_json);

        capture_format format = capture_format::text;
        if (args.format && !try_parse_capture_format(*args.format, format)) {
            throw detail::invalid(tool, "unsupported format '{}'"_format(*args.format));
        }

        auto window = instances_.resolve_window(args.instance_id);
        if (format == capture_format::image) {
            auto image = capture_.capture_image(window);
            return "Screenshot image from instance {} (base64): {}"_format(args.instance_id, image);
        }
        auto text = capture_.capture_text(window);
        return "Screenshot text from instance {}:\n{}"_format(args.instance_id, text);
    }

    std::string dispatcher::get_neovim_context(std::string_view arguments_json) {
        auto args = detail::read_arguments<detail::neovim_context_args>(
                *find_tool(name::get_neovim_context), arguments_json);

        auto instance = instances_.get(args.instance_id);

        editor_query query{};
        query.include_diagnostics = args.include_diagnostics.value_or(true);
        query.include_buffers = args.include_buffers.value_or(true);
        query.context_lines = static_cast<int>(args.context_lines.value_or(5));

        auto context = inspector_.inspect(instance.pid, query);
        return "Neovim context for instance {}:\n{}"_format(args.instance_id, context);
    }

}  // namespace termctl::tools
