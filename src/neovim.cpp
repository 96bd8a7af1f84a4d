#include "termctl/neovim.hpp"

#include "internal/platform.hpp"
#include "internal/procfs.hpp"
#include "internal/subprocess.hpp"
#include "termctl/format.hpp"

#include <glaze/glaze.hpp>

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <system_error>

using namespace termctl::literals;

namespace termctl {

    namespace detail {

        struct instance_info {
            pid_t pid{};
            std::optional<std::string> socket_path{};
            std::optional<std::string> version{};
            std::optional<std::string> config_path{};
            struct glaze {
                using T = instance_info;
                static constexpr auto value = glz::object(&T::pid, &T::socket_path, &T::version, &T::config_path);
            };
        };

        struct cursor_position {
            int line{};
            int column{};
            std::string line_content{};
            struct glaze {
                using T = cursor_position;
                static constexpr auto value = glz::object(&T::line, &T::column, &T::line_content);
            };
        };

        struct surrounding_context {
            std::vector<std::string> lines_before{};
            std::string current_line{};
            std::vector<std::string> lines_after{};
            std::optional<std::string> function_context{};
            std::optional<std::string> class_context{};
            struct glaze {
                using T = surrounding_context;
                static constexpr auto value = glz::object(
                        &T::lines_before, &T::current_line, &T::lines_after, &T::function_context, &T::class_context);
            };
        };

        struct current_buffer {
            std::string file_path{};
            std::optional<std::string> file_type{};
            bool is_modified{};
            int line_count{};
            std::string content_preview{};
            detail::surrounding_context surrounding_context{};
            struct glaze {
                using T = current_buffer;
                static constexpr auto value = glz::object(
                        &T::file_path,
                        &T::file_type,
                        &T::is_modified,
                        &T::line_count,
                        &T::content_preview,
                        &T::surrounding_context);
            };
        };

        struct buffer_info {
            std::string file_path{};
            bool is_modified{};
            bool is_current{};
            std::optional<std::string> file_type{};
            struct glaze {
                using T = buffer_info;
                static constexpr auto value = glz::object(&T::file_path, &T::is_modified, &T::is_current, &T::file_type);
            };
        };

        struct diagnostic {
            std::string file_path{};
            int line{};
            int column{};
            std::string severity{};
            std::string message{};
            std::optional<std::string> source{};
            std::optional<std::string> code{};
            struct glaze {
                using T = diagnostic;
                static constexpr auto value = glz::object(
                        &T::file_path, &T::line, &T::column, &T::severity, &T::message, &T::source, &T::code);
            };
        };

        struct diagnostic_counts {
            int errors{};
            int warnings{};
            int info{};
            int hints{};
            struct glaze {
                using T = diagnostic_counts;
                static constexpr auto value = glz::object(&T::errors, &T::warnings, &T::info, &T::hints);
            };
        };

        struct lsp_client {
            std::string name{};
            std::vector<std::string> file_types{};
            std::string status{};
            struct glaze {
                using T = lsp_client;
                static constexpr auto value = glz::object(&T::name, &T::file_types, &T::status);
            };
        };

        struct lsp_status {
            std::vector<lsp_client> active_clients{};
            diagnostic_counts diagnostics_count{};
            struct glaze {
                using T = lsp_status;
                static constexpr auto value = glz::object(&T::active_clients, &T::diagnostics_count);
            };
        };

        struct neovim_context {
            detail::instance_info instance_info{};
            std::optional<detail::current_buffer> current_buffer{};
            std::vector<diagnostic> diagnostics{};
            std::vector<buffer_info> open_buffers{};
            std::optional<detail::cursor_position> cursor_position{};
            std::optional<std::string> vim_mode{};
            std::optional<std::string> working_directory{};
            std::optional<detail::lsp_status> lsp_status{};
            struct glaze {
                using T = neovim_context;
                static constexpr auto value = glz::object(
                        &T::instance_info,
                        &T::current_buffer,
                        &T::diagnostics,
                        &T::open_buffers,
                        &T::cursor_position,
                        &T::vim_mode,
                        &T::working_directory,
                        &T::lsp_status);
            };
        };

        // Empty Lua tables encode as `{}`, so the script drops empty lists
        // and they come back as absent keys.
        static constexpr std::string_view context_body = R"lua(
local function list(t) if #t == 0 then return nil end return t end
local buf = vim.api.nvim_get_current_buf()
local cursor = vim.api.nvim_win_get_cursor(0)
local row = cursor[1]
local count = vim.api.nvim_buf_line_count(buf)
local first = math.max(1, row - ctx_lines)
local last = math.min(count, row + ctx_lines)
local before, after = {}, {}
for i, text in ipairs(vim.api.nvim_buf_get_lines(buf, first - 1, last, false)) do
  local nr = first + i - 1
  if nr < row then table.insert(before, text) elseif nr > row then table.insert(after, text) end
end
local current = vim.api.nvim_get_current_line()
local ft = vim.bo[buf].filetype
local function enclosing(kinds)
  local ok, node = pcall(vim.treesitter.get_node, {bufnr = buf})
  if not ok then return nil end
  while node do
    local t = node:type()
    for _, k in ipairs(kinds) do
      if t:find(k, 1, true) then
        local sr = node:start()
        local text = vim.api.nvim_buf_get_lines(buf, sr, sr + 1, false)[1]
        return text and vim.trim(text) or nil
      end
    end
    node = node:parent()
  end
  return nil
end
local function_kinds = {"function_definition", "function_declaration", "function_item", "method_definition", "method_declaration", "local_function", "arrow_function"}
local class_kinds = {"class_definition", "class_declaration", "class_specifier", "struct_specifier", "struct_item", "impl_item", "interface_declaration"}
local ctx = {
  vim_mode = vim.api.nvim_get_mode().mode,
  working_directory = vim.fn.getcwd(),
  cursor_position = {line = row, column = cursor[2] + 1, line_content = current},
  current_buffer = {
    file_path = vim.api.nvim_buf_get_name(buf),
    file_type = ft ~= "" and ft or nil,
    is_modified = vim.bo[buf].modified,
    line_count = count,
    content_preview = "Current line: " .. current,
    surrounding_context = {
      lines_before = list(before),
      current_line = current,
      lines_after = list(after),
      function_context = enclosing(function_kinds),
      class_context = enclosing(class_kinds),
    },
  },
}
if want_buffers then
  local bufs = {}
  for _, b in ipairs(vim.api.nvim_list_bufs()) do
    local name = vim.api.nvim_buf_get_name(b)
    if vim.api.nvim_buf_is_loaded(b) and name ~= "" then
      local bft = vim.bo[b].filetype
      table.insert(bufs, {file_path = name, is_modified = vim.bo[b].modified, is_current = b == buf, file_type = bft ~= "" and bft or nil})
    end
  end
  ctx.open_buffers = list(bufs)
end
if want_diagnostics then
  local names = {"error", "warning", "info", "hint"}
  local keys = {"errors", "warnings", "info", "hints"}
  local counts = {errors = 0, warnings = 0, info = 0, hints = 0}
  local diags = {}
  for _, d in ipairs(vim.diagnostic.get()) do
    local sev = d.severity or 4
    counts[keys[sev]] = counts[keys[sev]] + 1
    table.insert(diags, {
      file_path = vim.api.nvim_buf_get_name(d.bufnr),
      line = d.lnum + 1,
      column = d.col + 1,
      severity = names[sev],
      message = d.message,
      source = type(d.source) == "string" and d.source or nil,
      code = d.code ~= nil and tostring(d.code) or nil,
    })
  end
  ctx.diagnostics = list(diags)
  local clients = {}
  local get_clients = vim.lsp.get_clients or vim.lsp.get_active_clients
  for _, c in ipairs(get_clients()) do
    local stopped = false
    pcall(function() stopped = c:is_stopped() end)
    local status = stopped and "stopped" or (c.initialized == false and "starting" or "active")
    table.insert(clients, {name = c.name, file_types = list(c.config.filetypes or {}), status = status})
  end
  ctx.lsp_status = {active_clients = list(clients), diagnostics_count = counts}
end
return vim.json.encode(ctx)
)lua";

        static std::string render(const neovim_context& ctx) {
            std::string json{};
            auto ec = glz::write<glz::opts{.prettify = true}>(ctx, json);
            if (ec) {
                throw std::runtime_error("failed to serialize editor context");
            }
            return json;
        }

        static std::optional<pid_t> find_editor_pid(const std::filesystem::path& proc_root, pid_t terminal_pid) {
            auto table = internal::procfs::list_processes(proc_root);
            auto self = std::ranges::find(table, terminal_pid, &internal::procfs::process_entry::pid);
            if (self != table.end() && self->comm == "nvim") {
                return terminal_pid;
            }
            return internal::procfs::find_descendant(table, terminal_pid, "nvim");
        }

    }  // namespace detail

    namespace nvim {

        std::vector<std::filesystem::path> socket_candidates(pid_t pid, uid_t uid, std::string_view runtime_dir) {
            std::vector<std::filesystem::path> candidates{};
            auto leaf = "nvim.{}.0"_format(pid);

            if (!runtime_dir.empty()) {
                candidates.push_back(std::filesystem::path{runtime_dir} / leaf);
            }
            std::filesystem::path user_run{"/run/user/{}"_format(uid)};
            if (std::filesystem::path{runtime_dir} != user_run) {
                candidates.push_back(user_run / leaf);
            }
            candidates.push_back(std::filesystem::path{"/tmp"} / leaf);
            candidates.push_back(std::filesystem::path{"/tmp/nvim{}"_format(pid)} / "0");

            return candidates;
        }

        std::string context_script(const editor_query& query) {
            auto context_lines = std::clamp(query.context_lines, 0, 50);
            std::string script = "(function() local ctx_lines = {} local want_buffers = {} local want_diagnostics = {}"_format(
                    context_lines, query.include_buffers, query.include_diagnostics);
            script.append(detail::context_body);
            script.append(" end)()");
            std::ranges::replace(script, '\n', ' ');
            return script;
        }

        std::string remote_expr(std::string_view script) {
            // vimscript single-quoted string: the only escape is a doubled quote
            std::string expr{"luaeval('"};
            for (auto c : script) {
                if (c == '\'') {
                    expr.push_back('\'');
                }
                expr.push_back(c);
            }
            expr.append("')");
            return expr;
        }

        std::optional<std::filesystem::path> parse_lsof_sockets(std::string_view output) {
            // -Fn emits one `n<name>` line per descriptor; newer lsof appends ` type=STREAM ...`
            for (auto line : output | std::views::split('\n')) {
                std::string_view field{line.begin(), line.end()};
                if (!field.starts_with("n/")) {
                    continue;
                }
                field.remove_prefix(1);
                if (auto type = field.find(" type="); type != field.npos) {
                    field = field.substr(0, type);
                }
                std::filesystem::path path{utils::trim(field)};
                if (path.filename().string().starts_with("nvim") ||
                    path.parent_path().filename().string().starts_with("nvim")) {
                    return path;
                }
            }
            return std::nullopt;
        }

    }  // namespace nvim

    neovim_inspector::neovim_inspector(const startup_config& cfg)
        : nvim_path_{cfg.nvim_path},
          lsof_path_{cfg.lsof_path},
          proc_root_{internal::platform::proc_root},
          timeout_ms_{cfg.helper_timeout_ms} {}

    std::optional<std::filesystem::path> neovim_inspector::find_socket(pid_t nvim_pid) const {
        std::string runtime_dir{};
        if (const char* env = std::getenv("XDG_RUNTIME_DIR")) {
            runtime_dir = env;
        }

        auto candidates = nvim::socket_candidates(nvim_pid, ::getuid(), runtime_dir);
        std::error_code ec{};
        for (const auto& candidate : candidates) {
            if (std::filesystem::exists(candidate, ec)) {
                return candidate;
            }
        }

        // --listen with a non-default suffix still keeps the nvim.<pid>. prefix
        auto prefix = "nvim.{}."_format(nvim_pid);
        for (const auto& candidate : candidates) {
            auto dir = candidate.parent_path();
            std::filesystem::directory_iterator it{dir, ec};
            if (ec) {
                ec.clear();
                continue;
            }
            for (const auto& dirent : it) {
                if (dirent.path().filename().string().starts_with(prefix)) {
                    return dirent.path();
                }
            }
        }

        auto lsof = internal::run_subprocess(
                {lsof_path_.string(), "-p", std::to_string(nvim_pid), "-a", "-U", "-Fn"}, timeout_ms_);
        if (lsof.exit_code == 0) {
            return nvim::parse_lsof_sockets(lsof.stdout_output);
        }
        debug_log("lsof exited with ", lsof.exit_code, " for pid ", nvim_pid);

        return std::nullopt;
    }

    std::optional<std::string> neovim_inspector::version() const {
        auto result = internal::run_subprocess({nvim_path_.string(), "--version"}, timeout_ms_);
        if (result.exit_code != 0) {
            return std::nullopt;
        }
        auto first = utils::trim(std::string_view{result.stdout_output}.substr(0, result.stdout_output.find('\n')));
        if (first.empty()) {
            return std::nullopt;
        }
        return std::string{first};
    }

    std::optional<std::string> neovim_inspector::config_path() const {
        auto result = internal::run_subprocess(
                {nvim_path_.string(), "--headless", "-c", "echo stdpath('config')", "-c", "quit"}, timeout_ms_);
        if (result.exit_code != 0) {
            return std::nullopt;
        }
        // headless :echo lands on stderr
        for (const auto& stream : {result.stdout_output, result.stderr_output}) {
            for (const auto& line : utils::split(stream, '\n')) {
                if (auto path = utils::trim(line); !path.empty()) {
                    return std::string{path};
                }
            }
        }
        return std::nullopt;
    }

    std::string neovim_inspector::inspect(pid_t pid, const editor_query& query) {
        auto editor_pid = detail::find_editor_pid(proc_root_, pid);

        if (editor_pid) {
            if (auto socket = find_socket(*editor_pid)) {
                auto result = internal::run_subprocess(
                        {nvim_path_.string(),
                         "--server",
                         socket->string(),
                         "--remote-expr",
                         nvim::remote_expr(nvim::context_script(query))},
                        timeout_ms_);

                if (result.exit_code == 0) {
                    detail::neovim_context ctx{};
                    auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(ctx, result.stdout_output);
                    if (!ec) {
                        ctx.instance_info = detail::instance_info{
                                .pid = *editor_pid,
                                .socket_path = socket->string(),
                                .version = version(),
                                .config_path = config_path()};
                        return detail::render(ctx);
                    }
                    debug_log("unreadable editor reply: ", glz::format_error(ec, result.stdout_output));
                }
                else {
                    log_verbose("nvim --remote-expr failed for pid {}: {}", *editor_pid, utils::trim(result.stderr_output));
                }
            }
            else {
                log_verbose("no server socket for nvim pid {}", *editor_pid);
            }
        }

        detail::neovim_context basic{};
        basic.instance_info = detail::instance_info{
                .pid = editor_pid.value_or(pid), .version = version(), .config_path = config_path()};
        if (auto cwd = internal::procfs::read_cwd(proc_root_, editor_pid.value_or(pid))) {
            basic.working_directory = cwd->string();
        }
        return detail::render(basic);
    }

}  // namespace termctl
