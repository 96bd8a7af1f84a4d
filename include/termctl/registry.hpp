#pragma once

#include "gateway.hpp"
#include "instance.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace termctl {

    struct registry_options {
        std::string process_name{"alacritty"};
        std::string window_class{"Alacritty"};
        std::string title_prefix{"alacritty-mcp-"};
        std::chrono::milliseconds settle_delay{500};
    };

    /*
     * Owns the id -> instance map and keeps it in step with the OS process
     * table. Entries are added by create() or discovered by reconciliation and
     * are only ever removed by reconciliation, once their pid is gone.
     *
     * Not thread-safe; the protocol session is the only caller.
     */
    class registry {
      public:
        registry(
                process_launcher& launcher,
                window_resolver& windows,
                process_table_reader& processes,
                registry_options options = {});

        std::vector<managed_instance> list();
        managed_instance create(const spawn_spec& spec);
        window_handle resolve_window(std::string_view instance_id);
        managed_instance get(std::string_view instance_id) const;

        std::size_t size() const { return instances_.size(); }
        bool contains(std::string_view instance_id) const;

      private:
        void reconcile();
        std::optional<managed_instance> discover(pid_t pid);
        std::optional<window_handle> lookup_window(pid_t pid, std::string_view process_class);
        std::string issue_id();

        process_launcher& launcher_;
        window_resolver& windows_;
        process_table_reader& processes_;
        registry_options options_;

        std::map<std::string, managed_instance, std::less<>> instances_{};
        std::unordered_set<std::string> issued_ids_{};
    };

}  // namespace termctl
