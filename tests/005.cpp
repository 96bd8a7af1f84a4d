#include "utils.hpp"

namespace termctl::test {

    namespace detail {
        error expect_tool_error(tools::dispatcher& dispatcher, std::string_view tool, std::string_view arguments) {
            try {
                (void)dispatcher.call(tool, arguments);
            } catch (const error& e) {
                return e;
            }
            FAIL("expected tool call to fail");
            return error{error_kind::tool_execution_failed, ""};
        }

        bool contains(std::string_view haystack, std::string_view needle) {
            return haystack.find(needle) != std::string_view::npos;
        }
    }  // namespace detail

    TEST_CASE("005: catalogue lists the five tools in order", "[005][tools][catalogue]") {
        const auto& tools = tools::catalogue();
        REQUIRE(tools.size() == 5U);
        CHECK(tools[0].name == "list_instances");
        CHECK(tools[1].name == "spawn_instance");
        CHECK(tools[2].name == "send_keys");
        CHECK(tools[3].name == "screenshot_instance");
        CHECK(tools[4].name == "get_neovim_context");

        CHECK(tools::find_tool("send_keys") == &tools[2]);
        CHECK(tools::find_tool("kill_instance") == nullptr);
        CHECK(tools[2].find_param("keys") != nullptr);
        CHECK(tools[2].find_param("window") == nullptr);
    }

    TEST_CASE("005: input schemas render json schema objects", "[005][tools][catalogue]") {
        auto list_schema = tools::render_input_schema(*tools::find_tool("list_instances"));
        CHECK(detail::contains(list_schema, R"("type":"object")"));
        CHECK(detail::contains(list_schema, R"("additionalProperties":false)"));

        auto spawn_schema = tools::render_input_schema(*tools::find_tool("spawn_instance"));
        CHECK(detail::contains(spawn_schema, R"("items":{"type":"string"})"));
        CHECK(detail::contains(spawn_schema, R"("required":[])"));

        auto shot_schema = tools::render_input_schema(*tools::find_tool("screenshot_instance"));
        CHECK(detail::contains(shot_schema, R"("enum":["text","image"])"));
        CHECK(detail::contains(shot_schema, R"("default":"text")"));
        CHECK(detail::contains(shot_schema, R"("required":["instance_id"])"));

        auto nvim_schema = tools::render_input_schema(*tools::find_tool("get_neovim_context"));
        CHECK(detail::contains(nvim_schema, R"("minimum":0)"));
        CHECK(detail::contains(nvim_schema, R"("maximum":50)"));
        CHECK(detail::contains(nvim_schema, R"("type":"boolean")"));

        auto parsed = detail::parse(nvim_schema);
        CHECK(parsed.is_object());
    }

    TEST_CASE("005: argument validation names the offending field", "[005][tools][validate]") {
        const auto& send_keys = *tools::find_tool("send_keys");
        const auto& screenshot = *tools::find_tool("screenshot_instance");
        const auto& nvim = *tools::find_tool("get_neovim_context");
        const auto& spawn = *tools::find_tool("spawn_instance");

        auto reason = [](const tools::tool_spec& tool, std::string_view args) -> std::string {
            try {
                tools::validate_arguments(tool, args);
            } catch (const error& e) {
                CHECK(e.kind() == error_kind::invalid_arguments);
                return e.what();
            }
            return {};
        };

        CHECK(detail::contains(reason(send_keys, "{}"), "instance_id"));
        CHECK(detail::contains(reason(send_keys, R"({"instance_id":"a"})"), "keys"));
        CHECK(detail::contains(reason(send_keys, "null"), "instance_id"));
        CHECK(detail::contains(reason(send_keys, R"([1,2])"), "must be an object"));
        CHECK(detail::contains(reason(send_keys, R"({"instance_id":"a","keys":5})"), "'keys' must be a string"));
        CHECK(detail::contains(reason(send_keys, R"({"instance_id":"a","keys":"x","delay":1})"), "unknown field 'delay'"));
        CHECK(detail::contains(reason(screenshot, R"({"instance_id":"a","format":"gif"})"), "format"));
        CHECK(detail::contains(reason(nvim, R"({"instance_id":"a","context_lines":51})"), "context_lines"));
        CHECK(detail::contains(reason(nvim, R"({"instance_id":"a","context_lines":-1})"), "context_lines"));
        CHECK(detail::contains(reason(nvim, R"({"instance_id":"a","context_lines":2.5})"), "integer"));
        CHECK(detail::contains(reason(nvim, R"({"instance_id":"a","include_buffers":"yes"})"), "include_buffers"));
        CHECK(detail::contains(reason(spawn, R"({"args":["ok",3]})"), "args"));
        CHECK(detail::contains(reason(spawn, R"({"args":"ls"})"), "args"));

        CHECK(reason(send_keys, R"({"instance_id":"a","keys":"Return"})").empty());
        CHECK(reason(screenshot, R"({"instance_id":"a","format":null})").empty());
        CHECK(reason(nvim, R"({"instance_id":"a","context_lines":0,"include_diagnostics":false})").empty());
        CHECK(reason(spawn, "").empty());
        CHECK(reason(spawn, "null").empty());
        CHECK(reason(*tools::find_tool("list_instances"), "{}").empty());
    }

    TEST_CASE("005: unknown tool and unknown instance", "[005][tools][dispatch]") {
        test_env env{};

        auto unknown = detail::expect_tool_error(env.dispatcher, "kill_instance", "{}");
        CHECK(unknown.kind() == error_kind::unknown_tool);
        CHECK(std::string_view{unknown.what()} == "Unknown tool: kill_instance");

        auto missing = detail::expect_tool_error(
                env.dispatcher, "send_keys", R"({"instance_id":"does-not-exist","keys":"Return"})");
        CHECK(missing.kind() == error_kind::instance_not_found);
        CHECK(std::string_view{missing.what()} == "Instance not found: does-not-exist");
        CHECK(env.injector.sent.empty());

        auto invalid = detail::expect_tool_error(env.dispatcher, "send_keys", "{}");
        CHECK(invalid.kind() == error_kind::invalid_arguments);
    }

    TEST_CASE("005: list and spawn produce text payloads", "[005][tools][dispatch]") {
        test_env env{};

        auto empty = env.dispatcher.call("list_instances", "");
        CHECK(empty.starts_with("Found 0 Alacritty instances:\n"));

        auto spawned = env.dispatcher.call("spawn_instance", R"({"title":"t1","command":"bash"})");
        CHECK(spawned.starts_with("Spawned new Alacritty instance:\n"));
        CHECK(detail::contains(spawned, "\"t1\""));
        CHECK(detail::contains(spawned, "\"bash\""));
        CHECK(env.instances.size() == 1U);

        auto listed = env.dispatcher.call("list_instances", "{}");
        CHECK(listed.starts_with("Found 1 Alacritty instances:\n"));
        CHECK(detail::contains(listed, "\"t1\""));
    }

    TEST_CASE("005: spawn failure surfaces as launch_failed", "[005][tools][dispatch]") {
        test_env env{};
        env.launcher.failure = "alacritty: not found";

        auto failed = detail::expect_tool_error(env.dispatcher, "spawn_instance", "{}");
        CHECK(failed.kind() == error_kind::launch_failed);
        CHECK(failed.code() == -32603);
        CHECK(env.instances.size() == 0U);
    }

    TEST_CASE("005: send_keys and screenshots reach the window", "[005][tools][dispatch]") {
        test_env env{};
        env.windows.windows[4000] = 0x1200003;
        auto instance = env.instances.create(spawn_spec{});
        const auto& id = instance.id;

        auto sent = env.dispatcher.call("send_keys", R"({"instance_id":")" + id + R"(","keys":"ctrl+c"})");
        CHECK(sent == "Sent keys 'ctrl+c' to instance " + id);
        REQUIRE(env.injector.sent.size() == 1U);
        CHECK(env.injector.sent.front().first == 0x1200003U);
        CHECK(env.injector.sent.front().second == "ctrl+c");

        auto text = env.dispatcher.call("screenshot_instance", R"({"instance_id":")" + id + R"("})");
        CHECK(text == "Screenshot text from instance " + id + ":\n" + env.capture.text);

        auto image =
                env.dispatcher.call("screenshot_instance", R"({"instance_id":")" + id + R"(","format":"image"})");
        CHECK(image == "Screenshot image from instance " + id + " (base64): " + env.capture.image);
        CHECK(env.capture.captured == std::vector<window_handle>{0x1200003, 0x1200003});
    }

    TEST_CASE("005: collaborator failures are wrapped", "[005][tools][dispatch]") {
        test_env env{};
        auto instance = env.instances.create(spawn_spec{});
        auto args = R"({"instance_id":")" + instance.id + R"(","keys":"Return"})";

        auto no_window = detail::expect_tool_error(env.dispatcher, "send_keys", args);
        CHECK(no_window.kind() == error_kind::window_not_found);

        env.windows.windows[instance.pid] = 9;
        env.injector.failure = "xdotool key failed: BadWindow";
        auto failed = detail::expect_tool_error(env.dispatcher, "send_keys", args);
        CHECK(failed.kind() == error_kind::tool_execution_failed);
        CHECK(detail::contains(failed.what(), "send_keys failed: xdotool key failed: BadWindow"));
    }

    TEST_CASE("005: neovim context forwards query options", "[005][tools][dispatch]") {
        test_env env{};
        auto instance = env.instances.create(spawn_spec{.command = std::string{"nvim"}});

        auto defaults = env.dispatcher.call("get_neovim_context", R"({"instance_id":")" + instance.id + R"("})");
        CHECK(defaults.starts_with("Neovim context for instance " + instance.id + ":\n"));
        REQUIRE(env.inspector.queries.size() == 1U);
        CHECK(env.inspector.queries[0].first == instance.pid);
        CHECK(env.inspector.queries[0].second.include_diagnostics);
        CHECK(env.inspector.queries[0].second.include_buffers);
        CHECK(env.inspector.queries[0].second.context_lines == 5);

        (void)env.dispatcher.call(
                "get_neovim_context",
                R"({"instance_id":")" + instance.id +
                        R"(","include_diagnostics":false,"include_buffers":false,"context_lines":12})");
        REQUIRE(env.inspector.queries.size() == 2U);
        CHECK_FALSE(env.inspector.queries[1].second.include_diagnostics);
        CHECK_FALSE(env.inspector.queries[1].second.include_buffers);
        CHECK(env.inspector.queries[1].second.context_lines == 12);

        (void)env.dispatcher.call(
                "get_neovim_context", R"({"instance_id":")" + instance.id + R"(","context_lines":7.0})");
        REQUIRE(env.inspector.queries.size() == 3U);
        CHECK(env.inspector.queries[2].second.context_lines == 7);
    }

}  // namespace termctl::test
