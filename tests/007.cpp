#include "utils.hpp"

namespace termctl::test {

    namespace detail {
        std::vector<std::string> response_lines(const std::string& output) {
            std::vector<std::string> lines{};
            std::istringstream in{output};
            std::string line{};
            while (std::getline(in, line)) {
                lines.push_back(line);
            }
            return lines;
        }

        std::string find_instance_id(std::string_view text, std::string_view title) {
            auto title_pos = text.find("\"" + std::string{title} + "\"");
            REQUIRE(title_pos != std::string_view::npos);
            auto id_key = text.rfind("\"id\"", title_pos);
            REQUIRE(id_key != std::string_view::npos);
            auto open = text.find('"', text.find(':', id_key) + 1);
            auto close = text.find('"', open + 1);
            return std::string{text.substr(open + 1, close - open - 1)};
        }
    }  // namespace detail

    TEST_CASE("007: one response line per request", "[007][transport]") {
        test_env env{};
        std::istringstream in{
                detail::rpc_request(1, "initialize", detail::handshake_params) + "\n" +
                detail::rpc_request(2, "tools/list") + "\n"};
        std::ostringstream out{};

        CHECK(mcp::serve(in, out, env.server) == 0);

        auto lines = detail::response_lines(out.str());
        REQUIRE(lines.size() == 2U);
        CHECK(lines[0].find(R"("protocolVersion":"2024-11-05")") != std::string::npos);
        CHECK(lines[1].find(R"("tools")") != std::string::npos);
        CHECK(out.str().back() == '\n');
    }

    TEST_CASE("007: blank lines and notifications produce nothing", "[007][transport]") {
        test_env env{};
        std::istringstream in{
                "\n   \n\t\n" + detail::rpc_request(1, "initialize", detail::handshake_params) +
                "\n{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n\n"};
        std::ostringstream out{};

        CHECK(mcp::serve(in, out, env.server) == 0);
        CHECK(detail::response_lines(out.str()).size() == 1U);
    }

    TEST_CASE("007: malformed line is answered and the loop continues", "[007][transport]") {
        test_env env{};
        std::istringstream in{"this is not json\n" + detail::rpc_request(2, "tools/list") + "\n"};
        std::ostringstream out{};

        CHECK(mcp::serve(in, out, env.server) == 0);

        auto lines = detail::response_lines(out.str());
        REQUIRE(lines.size() == 2U);
        CHECK(detail::error_code(lines[0]) == -32700);
        CHECK(detail::parse(lines[0]).get_object().at("id").is_null());
        CHECK(detail::error_code(lines[1]) == -32002);
    }

    TEST_CASE("007: failed output stream ends the loop", "[007][transport]") {
        test_env env{};
        std::istringstream in{detail::rpc_request(1, "tools/list") + "\n" + detail::rpc_request(2, "tools/list") + "\n"};
        std::ostringstream out{};
        out.setstate(std::ios::badbit);

        CHECK(mcp::serve(in, out, env.server) == 1);
    }

    TEST_CASE("007: list spawn list scenario", "[007][transport][scenario]") {
        test_env env{};
        env.windows.windows[4000] = 0x4400003;

        std::istringstream in{
                detail::rpc_request(1, "initialize", detail::handshake_params) + "\n" +
                detail::tool_call(2, "list_instances") + "\n" +
                detail::tool_call(3, "spawn_instance", R"({"title":"t1"})") + "\n" +
                detail::tool_call(4, "list_instances") + "\n"};
        std::ostringstream out{};

        REQUIRE(mcp::serve(in, out, env.server) == 0);

        auto lines = detail::response_lines(out.str());
        REQUIRE(lines.size() == 4U);
        for (const auto& line : lines) {
            CHECK_FALSE(detail::error_code(line));
        }

        CHECK(detail::tool_text(lines[1]).starts_with("Found 0 Alacritty instances:"));

        auto spawned = detail::tool_text(lines[2]);
        CHECK(spawned.starts_with("Spawned new Alacritty instance:"));
        auto spawned_id = detail::find_instance_id(spawned, "t1");
        CHECK(spawned_id.size() == 36U);

        auto listed = detail::tool_text(lines[3]);
        CHECK(listed.starts_with("Found 1 Alacritty instances:"));
        CHECK(detail::find_instance_id(listed, "t1") == spawned_id);
        CHECK(listed.find(std::to_string(0x4400003)) != std::string::npos);
    }

    TEST_CASE("007: send_keys to unknown instance over the wire", "[007][transport][scenario]") {
        test_env env{};
        std::istringstream in{
                detail::rpc_request(1, "initialize", detail::handshake_params) + "\n" +
                detail::tool_call(2, "send_keys", R"({"instance_id":"does-not-exist","keys":"Return"})") + "\n" +
                detail::tool_call(3, "send_keys", "{}") + "\n"};
        std::ostringstream out{};

        REQUIRE(mcp::serve(in, out, env.server) == 0);

        auto lines = detail::response_lines(out.str());
        REQUIRE(lines.size() == 3U);
        CHECK(detail::error_code(lines[1]) == -32603);
        CHECK(lines[1].find("Instance not found: does-not-exist") != std::string::npos);
        CHECK(detail::error_code(lines[2]) == -32602);
    }

}  // namespace termctl::test
