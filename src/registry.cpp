#include "termctl/registry.hpp"

#include "termctl/errors.hpp"
#include "termctl/format.hpp"

#include "internal/cmdline.hpp"

#include <algorithm>
#include <chrono>
#include <ranges>
#include <thread>
#include <unordered_set>

using namespace termctl::literals;

namespace termctl {

    namespace detail {

        static constexpr auto default_command = "shell"sv;
        static constexpr size_t short_id_length = 8U;

        static std::uint64_t unix_now() {
            auto now = std::chrono::system_clock::now().time_since_epoch();
            return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
        }

        static std::string instance_not_found(std::string_view instance_id) {
            return "Instance not found: {}"_format(instance_id);
        }

    }  // namespace detail

    registry::registry(
            process_launcher& launcher,
            window_resolver& windows,
            process_table_reader& processes,
            registry_options options)
        : launcher_{launcher}, windows_{windows}, processes_{processes}, options_{std::move(options)} {}

    std::vector<managed_instance> registry::list() {
        reconcile();
        return instances_ | std::views::values | std::ranges::to<std::vector>();
    }

    managed_instance registry::create(const spawn_spec& spec) {
        auto id = issue_id();
        auto tag = options_.title_prefix + id;

        launch_request request{};
        request.title = spec.title.value_or(options_.title_prefix + id.substr(0, detail::short_id_length));
        request.working_directory = spec.working_directory;
        request.command = spec.command;
        if (spec.command && spec.args) {
            request.args = *spec.args;
        }
        request.tag = tag;

        pid_t pid{};
        try {
            pid = launcher_.launch(request);
        } catch (const error&) {
            throw;
        } catch (const std::exception& e) {
            throw error{error_kind::launch_failed, "Failed to launch terminal: {}"_format(e.what())};
        }

        managed_instance instance{};
        instance.id = id;
        instance.pid = pid;
        instance.title = request.title;
        instance.command = spec.command.value_or(std::string{detail::default_command});
        instance.created_at = detail::unix_now();
        instance.window_class = tag;

        // a recycled pid still tracked under an old id belongs to a process that already exited
        std::erase_if(instances_, [pid](const auto& entry) { return entry.second.pid == pid; });
        instances_.insert_or_assign(id, instance);
        log_verbose("spawned instance {} (pid {})", id, pid);

        if (options_.settle_delay.count() > 0) {
            std::this_thread::sleep_for(options_.settle_delay);
        }

        if (auto window = lookup_window(pid, tag)) {
            instances_.at(id).window_id = *window;
            instance.window_id = *window;
        }
        else {
            debug_log("no window yet for instance ", id);
        }

        return instance;
    }

    window_handle registry::resolve_window(std::string_view instance_id) {
        auto it = instances_.find(instance_id);
        if (it == instances_.end()) {
            throw error{error_kind::instance_not_found, detail::instance_not_found(instance_id)};
        }

        auto& instance = it->second;
        if (instance.window_id) {
            return *instance.window_id;
        }

        auto window = windows_.find_window(instance.pid, instance.window_class);
        if (!window) {
            throw error{
                    error_kind::window_not_found,
                    "Could not find window ID for PID {} (instance {})"_format(instance.pid, instance.id)};
        }

        instance.window_id = *window;
        return *window;
    }

    managed_instance registry::get(std::string_view instance_id) const {
        auto it = instances_.find(instance_id);
        if (it == instances_.end()) {
            throw error{error_kind::instance_not_found, detail::instance_not_found(instance_id)};
        }
        return it->second;
    }

    bool registry::contains(std::string_view instance_id) const {
        return instances_.find(instance_id) != instances_.end();
    }

    void registry::reconcile() {
        auto live = processes_.list_pids(options_.process_name);
        std::unordered_set<pid_t> live_set{live.begin(), live.end()};

        auto removed = std::erase_if(instances_, [&live_set](const auto& entry) {
            return !live_set.contains(entry.second.pid);
        });
        if (removed > 0U) {
            log_verbose("dropped {} exited instance(s)", removed);
        }

        std::unordered_set<pid_t> tracked{};
        for (const auto& [id, instance] : instances_) {
            tracked.insert(instance.pid);
        }

        for (auto pid : live) {
            if (tracked.contains(pid)) {
                continue;
            }
            auto instance = discover(pid);
            if (!instance) {
                continue;
            }
            tracked.insert(pid);
            log_verbose("discovered instance {} (pid {})", instance->id, pid);
            auto id = instance->id;
            instances_.emplace(std::move(id), std::move(*instance));
        }
    }

    std::optional<managed_instance> registry::discover(pid_t pid) {
        auto argv = processes_.read_command_line(pid);
        if (!argv) {
            debug_log("skipping pid ", pid, ": command line unavailable");
            return std::nullopt;
        }

        auto flags = internal::cmdline::parse_launch_flags(*argv);

        managed_instance instance{};
        instance.id = issue_id();
        instance.pid = pid;
        instance.title = flags.title.value_or("alacritty-{}"_format(pid));
        instance.command = flags.command.value_or(std::string{detail::default_command});
        instance.created_at = 0U;
        instance.window_class = flags.window_class.value_or(options_.window_class);
        instance.window_id = lookup_window(pid, instance.window_class);
        return instance;
    }

    std::optional<window_handle> registry::lookup_window(pid_t pid, std::string_view process_class) {
        try {
            return windows_.find_window(pid, process_class);
        } catch (const std::exception& e) {
            debug_log("window lookup for pid ", pid, " failed: ", e.what());
            return std::nullopt;
        }
    }

    std::string registry::issue_id() {
        for (;;) {
            auto id = utils::random_uuid();
            if (issued_ids_.insert(id).second) {
                return id;
            }
        }
    }

}  // namespace termctl
