#pragma once

#include "termctl/errors.hpp"
#include "termctl/gateway.hpp"
#include "termctl/mcp.hpp"
#include "termctl/registry.hpp"
#include "termctl/session.hpp"
#include "termctl/tools.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "internal/cmdline.hpp"

extern "C" {
#include <sys/types.h>
#include <unistd.h>
}

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace termctl::test {

    // In-memory process table; `processes` maps pid -> argv
    struct fake_process_table final : process_table_reader {
        std::map<pid_t, std::vector<std::string>> processes{};
        std::map<pid_t, std::filesystem::path> cwds{};
        std::set<pid_t> unreadable{};
        std::string last_name{};
        int list_calls{0};

        void add(pid_t pid, std::vector<std::string> argv = {"alacritty"}) { processes[pid] = std::move(argv); }

        void remove(pid_t pid) { processes.erase(pid); }

        std::vector<pid_t> list_pids(std::string_view process_name) override {
            ++list_calls;
            last_name = std::string{process_name};
            std::vector<pid_t> pids{};
            for (const auto& [pid, argv] : processes) {
                pids.push_back(pid);
            }
            return pids;
        }

        std::optional<std::vector<std::string>> read_command_line(pid_t pid) override {
            if (unreadable.contains(pid)) {
                return std::nullopt;
            }
            auto it = processes.find(pid);
            if (it == processes.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::filesystem::path> read_working_directory(pid_t pid) override {
            auto it = cwds.find(pid);
            if (it == cwds.end()) {
                return std::nullopt;
            }
            return it->second;
        }
    };

    // Launched terminals show up in the process table with the argv the
    // real launcher would exec.
    struct fake_launcher final : process_launcher {
        explicit fake_launcher(fake_process_table& table) : table_{table} {}

        pid_t next_pid{4000};
        std::vector<launch_request> requests{};
        std::optional<std::string> failure{};

        pid_t launch(const launch_request& request) override {
            requests.push_back(request);
            if (failure) {
                throw std::runtime_error(*failure);
            }
            auto pid = next_pid++;
            table_.add(pid, internal::cmdline::build_launch_argv("alacritty", request));
            return pid;
        }

      private:
        fake_process_table& table_;
    };

    struct fake_window_resolver final : window_resolver {
        std::map<pid_t, window_handle> windows{};
        std::vector<std::pair<pid_t, std::string>> lookups{};
        std::optional<std::string> failure{};

        std::optional<window_handle> find_window(pid_t pid, std::string_view process_class) override {
            lookups.emplace_back(pid, std::string{process_class});
            if (failure) {
                throw std::runtime_error(*failure);
            }
            auto it = windows.find(pid);
            if (it == windows.end()) {
                return std::nullopt;
            }
            return it->second;
        }
    };

    struct fake_injector final : input_injector {
        std::vector<std::pair<window_handle, std::string>> sent{};
        std::optional<std::string> failure{};

        void send_keys(window_handle window, std::string_view keys) override {
            if (failure) {
                throw std::runtime_error(*failure);
            }
            sent.emplace_back(window, std::string{keys});
        }
    };

    struct fake_capture final : capture_service {
        std::string text{"user@host:~$ ls\nREADME.md"};
        std::string image{"data:image/png;base64,iVBORw0KGgo="};
        std::vector<window_handle> captured{};

        std::string capture_text(window_handle window) override {
            captured.push_back(window);
            return text;
        }

        std::string capture_image(window_handle window) override {
            captured.push_back(window);
            return image;
        }
    };

    struct fake_inspector final : editor_inspector {
        std::vector<std::pair<pid_t, editor_query>> queries{};

        std::string inspect(pid_t pid, const editor_query& query) override {
            queries.emplace_back(pid, query);
            return R"({"instance_info":{"pid":)" + std::to_string(pid) + "}}";
        }
    };

    // Full in-process server stack over fakes; spawn does not wait for a window.
    struct test_env {
        fake_process_table table{};
        fake_launcher launcher{table};
        fake_window_resolver windows{};
        fake_injector injector{};
        fake_capture capture{};
        fake_inspector inspector{};
        registry instances{launcher, windows, table, registry_options{.settle_delay = std::chrono::milliseconds{0}}};
        tools::dispatcher dispatcher{instances, injector, capture, inspector};
        mcp::session server{dispatcher};

        test_env() = default;
        test_env(const test_env&) = delete;
        test_env& operator=(const test_env&) = delete;
    };

    namespace detail {

        inline std::string rpc_request(int id, std::string_view method, std::string_view params = {}) {
            std::string line = R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":")";
            line.append(method);
            line.push_back('"');
            if (!params.empty()) {
                line.append(R"(,"params":)");
                line.append(params);
            }
            line.push_back('}');
            return line;
        }

        inline constexpr std::string_view handshake_params =
                R"({"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"0.1"}})";

        inline std::string tool_call(int id, std::string_view tool, std::string_view arguments = "{}") {
            std::string params = R"({"name":")";
            params.append(tool);
            params.append(R"(","arguments":)");
            params.append(arguments);
            params.push_back('}');
            return rpc_request(id, "tools/call", params);
        }

        inline glz::generic parse(std::string_view json) {
            glz::generic value{};
            auto ec = glz::read_json(value, json);
            REQUIRE(!ec);
            return value;
        }

        // error.code of a response line, nullopt for success responses
        inline std::optional<int> error_code(std::string_view response) {
            auto value = parse(response);
            REQUIRE(value.is_object());
            const auto& fields = value.get_object();
            auto it = fields.find("error");
            if (it == fields.end() || it->second.is_null()) {
                return std::nullopt;
            }
            const auto& err = it->second.get_object();
            auto code = err.find("code");
            REQUIRE(code != err.end());
            return static_cast<int>(code->second.get_number());
        }

        // content[0].text of a tools/call response line
        inline std::string tool_text(std::string_view response) {
            auto value = parse(response);
            const auto& result = value.get_object().at("result").get_object();
            const auto& content = result.at("content").get_array();
            REQUIRE(content.size() == 1U);
            return content.front().get_object().at("text").get_string();
        }

        inline void handshake(mcp::session& server) {
            auto resp = server.handle_line(rpc_request(1, "initialize", handshake_params));
            REQUIRE(resp);
            REQUIRE_FALSE(error_code(*resp));
        }

        template <typename F>
        error_kind error_kind_of(F&& fn) {
            try {
                fn();
            } catch (const error& e) {
                return e.kind();
            }
            FAIL("expected termctl::error");
            return error_kind::tool_execution_failed;
        }

    }  // namespace detail

}  // namespace termctl::test
